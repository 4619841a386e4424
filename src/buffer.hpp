#pragma once

#include <cstddef>
#include <cstdint>

#include <span>
#include <memory>
#include <ostream>
#include <utility>
#include <optional>
#include <algorithm>
#include <functional>

#include <spdlog/spdlog.h>

#include "view.hpp"
#include "error.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "scalar.hpp"
#include "capacity.hpp"

namespace utext {

//┌──────────────────────────────────────────────────────────────┐
//│ owned, growable UTF-8.                                       │
//│                                                              │
//│ bytes [0, size) are well-formed UTF-8 at all times, followed │
//│ by a NULL-TERMINATOR that capacity() does not count. every   │
//│ mutation either completes or, if allocation throws, leaves   │
//│ the previous content untouched.                              │
//│                                                              │
//│ one mutator at a time; views must not be read while the      │
//│ buffer they borrow from is being mutated. share a buffer     │
//│ across threads only after it is fully built, or guard it     │
//│ with a single-writer/multiple-reader lock.                   │
//└──────────────────────────────────────────────────────────────┘

template <allo_t A = std::allocator<char8_t>> class buffer
{
	typedef std::allocator_traits<A> allocator;

	//┌──────┬──────┬──────┬───────┐
	//│ head │ size │ room │ epoch │
	//└──────┴──────┴──────┴───────┘

	struct storage : A
	{
		char8_t* head {nullptr};
		size_t size {0};
		// capacity, excluding NULL-TERMINATOR.
		size_t room {0};

		#if UTEXT_CHECKED_BORROWS
		// bumped on every mutation; views compare against it.
		uint64_t epoch {0};
		#endif
	};

	storage store;

	// invalidates outstanding views.
	constexpr auto __touch__() noexcept -> void;

	constexpr auto __release__() noexcept -> void;

	// replaces bytes [start, until) with [src_0, src_N). 'src' may point into this buffer.
	constexpr auto __splice__(size_t start, size_t until, const char8_t* src_0, const char8_t* src_N) -> void;

	// moves the content into a fresh block of 'room' bytes.
	constexpr auto __realloc__(size_t room) -> void;

	constexpr auto __epoch__() const noexcept -> const uint64_t*;

public:

	constexpr buffer() noexcept = default;

	// copies; the buffer does not borrow from 'str'.
	constexpr explicit buffer(view str);

	constexpr buffer(const buffer& other);
	constexpr buffer(buffer&& other) noexcept;

	constexpr auto operator=(const buffer& other) -> buffer&;
	constexpr auto operator=(buffer&& other) noexcept -> buffer&;

	constexpr ~buffer() noexcept;

	// size 0, capacity at least 'n'.
	static constexpr auto with_capacity(size_t n) -> buffer;

	static constexpr auto from_bytes(std::span<const char8_t> bytes) -> result<buffer>;
	// the one lossy path; every ill-formed subpart becomes U+FFFD.
	static constexpr auto from_bytes_lossy(std::span<const char8_t> bytes) -> buffer;

	// returns the number of bytes, excluding NULL-TERMINATOR.
	constexpr auto size() const noexcept -> size_t;
	// returns the number of bytes it can hold without reallocation, excluding NULL-TERMINATOR.
	constexpr auto capacity() const noexcept -> size_t;
	constexpr auto empty() const noexcept -> bool;

	constexpr auto data() const noexcept -> const char8_t*;
	// always NULL-terminated, even when nothing has been allocated yet.
	constexpr auto c_str() const noexcept -> const char8_t*;

	// zero-copy; the borrow begins here.
	constexpr auto as_view() const noexcept -> view;
	constexpr operator view() const noexcept;

	constexpr auto push(scalar code) -> void;
	constexpr auto push(view str) -> void;

	// removes and returns the last scalar.
	constexpr auto pop() noexcept -> std::optional<scalar>;

	// every non-overlapping occurrence, left to right; an empty needle yields a plain copy.
	constexpr auto replace(view needle, view replacement) const -> buffer;

	// in-place; byte offsets must be scalar boundaries.
	constexpr auto replace_range(size_t start, size_t until, view with) -> result<void>;
	constexpr auto insert(size_t at, view with) -> result<void>;
	constexpr auto truncate(size_t at) -> result<void>;

	constexpr auto clear() noexcept -> void;
	constexpr auto reserve(size_t n) -> void;
	constexpr auto shrink_to_fit() -> void;

	// operators

	constexpr auto operator+=(scalar code) -> buffer& { this->push(code); return *this; }
	constexpr auto operator+=(view str) -> buffer& { this->push(str); return *this; }

	constexpr auto operator==(const buffer& rhs) const noexcept -> bool { return this->as_view() == rhs.as_view(); }
	constexpr auto operator==(view rhs) const noexcept -> bool { return this->as_view() == rhs; }

	template <size_t N>
	constexpr auto operator==(const char8_t (&rhs)[N]) const noexcept -> bool
	{
		return this->as_view() == rhs;
	}

	// iostream

	friend auto operator<<(std::ostream& os, const buffer& str) -> std::ostream&
	{
		return os << str.as_view();
	}
};

typedef buffer<> text;

#pragma region buffer::internal

template <allo_t A> constexpr auto buffer<A>::__touch__() noexcept -> void
{
	#if UTEXT_CHECKED_BORROWS
	++this->store.epoch;
	#endif
}

template <allo_t A> constexpr auto buffer<A>::__epoch__() const noexcept -> const uint64_t*
{
	#if UTEXT_CHECKED_BORROWS
	return &this->store.epoch;
	#else
	return nullptr;
	#endif
}

template <allo_t A> constexpr auto buffer<A>::__release__() noexcept -> void
{
	if (this->store.head)
	{
		allocator::deallocate
		(
			this->store,
			this->store.head,
			this->store.room + 1
		);
	}
	this->store.head = nullptr;
	this->store.size = 0;
	this->store.room = 0;
}

template <allo_t A> constexpr auto buffer<A>::__realloc__(size_t room) -> void
{
	char8_t* head {allocator::allocate(this->store, room + 1)};

	std::ranges::copy
	(
		this->store.head,
		this->store.head + this->store.size,
		head // dest
	);
	head[this->store.size] = u8'\0';

	if !consteval
	{
		spdlog::trace("utext: buffer reallocated {} -> {} bytes", this->store.room, room);
	}

	const auto size {this->store.size};

	this->__release__();
	this->__touch__();

	this->store.head = head;
	this->store.size = size;
	this->store.room = room;
}

template <allo_t A> constexpr auto buffer<A>::__splice__(size_t start, size_t until, const char8_t* src_0, const char8_t* src_N) -> void
{
	const size_t cut {until - start};
	const size_t add {static_cast<size_t>(src_N - src_0)};
	const size_t old_l {this->store.size};
	const size_t new_l {old_l - cut + add};

	// nothing to replace, nothing to write; no storage is touched.
	if (cut == 0 && add == 0)
	{
		return;
	}

	const bool alias
	{
		this->store.head != nullptr
		&&
		std::less_equal<> {}(this->store.head, src_0)
		&&
		std::less_equal<> {}(src_N, this->store.head + this->store.room)
	};

	if (this->store.head == nullptr || !capacity::fits(this->store.room, new_l) || alias)
	{
		//┌────────────┬─────────┬─────────────┐
		//│ [0, start) │   src   │ [until, N)  │ -> fresh block
		//└────────────┴─────────┴─────────────┘

		const size_t room
		{
			capacity::fits(this->store.room, new_l)
			?
			this->store.room
			:
			capacity::grow(this->store.room, new_l, allocator::max_size(this->store) - 1)
		};

		char8_t* head {allocator::allocate(this->store, room + 1)};
		char8_t* ptr {head};

		ptr = std::ranges::copy(this->store.head, this->store.head + start, ptr).out;
		ptr = std::ranges::copy(src_0, src_N, ptr).out;
		ptr = std::ranges::copy(this->store.head + until, this->store.head + old_l, ptr).out;

		*ptr = u8'\0';

		if !consteval
		{
			spdlog::trace("utext: buffer reallocated {} -> {} bytes", this->store.room, room);
		}

		// only now is the old block, and anything 'src' pointed into, released.
		this->__release__();

		this->store.head = head;
		this->store.size = new_l;
		this->store.room = room;
	}
	else
	{
		char8_t* head {this->store.head};

		if (add < cut)
		{
			std::copy(head + until, head + old_l, head + start + add);
		}
		else if (cut < add)
		{
			std::copy_backward(head + until, head + old_l, head + new_l);
		}
		//┌──────────┬───┬─────────────┐
		//│ [0, s)   │ * │ [until, N)  │
		//├──────────┼───┴───┬─────────┴───┐
		//│ [0, s)   │  src  │ [until, N)  │
		//└──────────┴───────┴─────────────┘
		std::ranges::copy(src_0, src_N, head + start);

		head[new_l] = u8'\0';

		this->store.size = new_l;
	}
	this->__touch__();
}

#pragma endregion buffer::internal
#pragma region buffer

template <allo_t A> constexpr buffer<A>::buffer(view str)
{
	str.__check__();

	if (!str.empty())
	{
		this->__splice__(0, 0, str.__head__, str.__tail__);
	}
}

template <allo_t A> constexpr buffer<A>::buffer(const buffer& other)
{
	if (!other.empty())
	{
		this->__splice__(0, 0, other.store.head, other.store.head + other.store.size);
	}
}

template <allo_t A> constexpr buffer<A>::buffer(buffer&& other) noexcept
{
	std::swap(this->store.head, other.store.head);
	std::swap(this->store.size, other.store.size);
	std::swap(this->store.room, other.store.room);

	other.__touch__();
}

template <allo_t A> constexpr auto buffer<A>::operator=(const buffer& other) -> buffer&
{
	if (this != &other)
	{
		buffer clone {other};

		std::swap(this->store.head, clone.store.head);
		std::swap(this->store.size, clone.store.size);
		std::swap(this->store.room, clone.store.room);

		this->__touch__();
	}
	return *this;
}

template <allo_t A> constexpr auto buffer<A>::operator=(buffer&& other) noexcept -> buffer&
{
	if (this != &other)
	{
		this->__release__();

		std::swap(this->store.head, other.store.head);
		std::swap(this->store.size, other.store.size);
		std::swap(this->store.room, other.store.room);

		this->__touch__();
		other.__touch__();
	}
	return *this;
}

template <allo_t A> constexpr buffer<A>::~buffer() noexcept
{
	this->__release__();
	this->__touch__();
}

template <allo_t A> constexpr auto buffer<A>::with_capacity(size_t n) -> buffer
{
	buffer out;

	out.reserve(n);

	return out;
}

template <allo_t A> constexpr auto buffer<A>::from_bytes(std::span<const char8_t> bytes) -> result<buffer>
{
	const auto str {view::from_bytes(bytes)};

	if (!str)
	{
		return std::unexpected(str.error());
	}
	return buffer {*str};
}

template <allo_t A> constexpr auto buffer<A>::from_bytes_lossy(std::span<const char8_t> bytes) -> buffer
{
	auto out {with_capacity(bytes.size())};

	for (size_t i {0}; i < bytes.size(); )
	{
		const auto [code, consumed] {codec::decode_lossy(bytes, i)};

		out.push(code);

		i += consumed;
	}
	return out;
}

template <allo_t A> constexpr auto buffer<A>::size() const noexcept -> size_t
{
	return this->store.size;
}

template <allo_t A> constexpr auto buffer<A>::capacity() const noexcept -> size_t
{
	return this->store.room;
}

template <allo_t A> constexpr auto buffer<A>::empty() const noexcept -> bool
{
	return this->store.size == 0;
}

template <allo_t A> constexpr auto buffer<A>::data() const noexcept -> const char8_t*
{
	return this->store.head;
}

template <allo_t A> constexpr auto buffer<A>::c_str() const noexcept -> const char8_t*
{
	return this->store.head ? this->store.head : u8"";
}

template <allo_t A> constexpr auto buffer<A>::as_view() const noexcept -> view
{
	return {this->store.head, this->store.head + this->store.size, this->__epoch__()};
}

template <allo_t A> constexpr buffer<A>::operator view() const noexcept
{
	return this->as_view();
}

template <allo_t A> constexpr auto buffer<A>::push(scalar code) -> void
{
	const auto out {codec::encode(code)};

	this->__splice__(this->store.size, this->store.size, out.begin(), out.end());
}

template <allo_t A> constexpr auto buffer<A>::push(view str) -> void
{
	str.__check__();

	if (!str.empty())
	{
		this->__splice__(this->store.size, this->store.size, str.__head__, str.__tail__);
	}
}

template <allo_t A> constexpr auto buffer<A>::pop() noexcept -> std::optional<scalar>
{
	if (this->empty())
	{
		return std::nullopt;
	}

	char8_t* tail {this->store.head + this->store.size};

	const auto size {codec::back(tail)};
	const auto code {codec::decode_ptr(tail + size, static_cast<int8_t>(-size))};

	this->store.size -= static_cast<size_t>(-size);
	this->store.head[this->store.size] = u8'\0';

	this->__touch__();

	return code;
}

template <allo_t A> constexpr auto buffer<A>::replace(view needle, view replacement) const -> buffer
{
	needle.__check__(); replacement.__check__();

	const view self {this->as_view()};

	if (needle.empty())
	{
		return buffer {*this};
	}

	auto out {with_capacity(this->size())};

	const char8_t* last {self.__head__};

	detail::__scan__(self.__head__, self.__tail__, needle.__head__, needle.__tail__,
		// on every distinct match found
		[&](const char8_t* head, const char8_t* tail)
		{
			out.push(self.__narrow__(last, head));
			out.push(replacement);

			last = tail; // update anchor!

			return true;
		}
	);
	out.push(self.__narrow__(last, self.__tail__));

	return out;
}

template <allo_t A> constexpr auto buffer<A>::replace_range(size_t start, size_t until, view with) -> result<void>
{
	with.__check__();

	const std::span<const char8_t> bytes {this->store.head, this->store.size};

	if (until < start || !codec::is_boundary(bytes, start))
	{
		return std::unexpected(error {errc::boundary_error, start});
	}
	if (!codec::is_boundary(bytes, until))
	{
		return std::unexpected(error {errc::boundary_error, until});
	}

	this->__splice__(start, until, with.__head__, with.__tail__);

	return {};
}

template <allo_t A> constexpr auto buffer<A>::insert(size_t at, view with) -> result<void>
{
	return this->replace_range(at, at, with);
}

template <allo_t A> constexpr auto buffer<A>::truncate(size_t at) -> result<void>
{
	return this->replace_range(at, this->store.size, view {});
}

template <allo_t A> constexpr auto buffer<A>::clear() noexcept -> void
{
	if (this->store.head)
	{
		this->store.head[0] = u8'\0';
	}
	this->store.size = 0;

	this->__touch__();
}

template <allo_t A> constexpr auto buffer<A>::reserve(size_t n) -> void
{
	if (!capacity::fits(this->store.room, n))
	{
		this->__realloc__(n);
	}
}

template <allo_t A> constexpr auto buffer<A>::shrink_to_fit() -> void
{
	if (this->store.size == 0)
	{
		this->__release__();
		this->__touch__();
	}
	else if (this->store.size < this->store.room)
	{
		this->__realloc__(this->store.size);
	}
}

#pragma endregion buffer
#pragma region concat

template <allo_t A> concat::operator buffer<A>() const
{
	auto out {buffer<A>::with_capacity(this->size())};

	for (const auto& str : this->data)
	{
		out.push(str);
	}
	return out;
}

#pragma endregion concat
#pragma region casing

// case maps every scalar into a new buffer; see scalar::to_upper.
template <allo_t A = std::allocator<char8_t>> auto to_upper(view str) -> buffer<A>
{
	auto out {buffer<A>::with_capacity(str.size())};

	for (const auto code : str)
	{
		for (const auto part : code.to_upper()) { out.push(part); }
	}
	return out;
}

// case maps every scalar into a new buffer; see scalar::to_lower.
template <allo_t A = std::allocator<char8_t>> auto to_lower(view str) -> buffer<A>
{
	auto out {buffer<A>::with_capacity(str.size())};

	for (const auto code : str)
	{
		for (const auto part : code.to_lower()) { out.push(part); }
	}
	return out;
}

#pragma endregion casing

} // namespace utext
