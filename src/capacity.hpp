#pragma once

#include <cstddef>

#include <memory>
#include <concepts>
#include <algorithm>
#include <stdexcept>

namespace utext {

template <typename T> concept allo_t = requires(T alloc, size_t N)
{
	typename std::allocator_traits<T>::size_type;
	typename std::allocator_traits<T>::value_type;

	{ std::allocator_traits<T>::allocate(alloc, N) } -> std::same_as<char8_t*>;
};

//┌────────────────────────────────────────────────────────────┐
//│ growth policy of 'buffer'.                                 │
//│                                                            │
//│ an empty buffer owns nothing (capacity 0). when an append  │
//│ does not fit, storage is reallocated to                    │
//│                                                            │
//│             max(required, capacity * 2)                    │
//│                                                            │
//│ which keeps n appends at O(log n) reallocations and O(n)   │
//│ bytes copied in total.                                     │
//└────────────────────────────────────────────────────────────┘

class capacity
{
	// nothing to do...

public:

	static constexpr auto fits(size_t current, size_t required) noexcept -> bool
	{
		return required <= current;
	}

	// 'limit' is the allocator's max_size() minus the NULL-TERMINATOR.
	static constexpr auto grow(size_t current, size_t required, size_t limit) -> size_t
	{
		if (limit < required)
		{
			throw std::length_error {"utext::buffer would exceed max_size()"};
		}

		const size_t twice {current <= limit / 2 ? current * 2 : limit};

		return std::max(required, twice);
	}
};

} // namespace utext
