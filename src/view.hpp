#pragma once

#include <cstddef>
#include <cstdint>

#include <span>
#include <vector>
#include <ranges>
#include <utility>
#include <ostream>
#include <iterator>
#include <optional>
#include <algorithm>
#include <exception>

#include <spdlog/spdlog.h>

#include "error.hpp"
#include "codec.hpp"
#include "capacity.hpp"
#include "config.hpp"
#include "scalar.hpp"

namespace utext {

template <allo_t A> class buffer;

class view;
class concat;

namespace detail
{
	// calls 'fun(head, tail)' on every non-overlapping match, left to right, until it returns false.
	template <typename F>
	constexpr auto __scan__(const char8_t* lhs_0, const char8_t* lhs_N,
	                        const char8_t* rhs_0, const char8_t* rhs_N,
	                        const F& fun /* lambda E */) -> void;
}

//┌────────────────────────────────────────────────────────────────┐
//│ non-owning, immutable view of valid UTF-8.                     │
//│                                                                │
//│ a view never outlives the storage it points at, and the owner  │
//│ must not be mutated while the view is in use. views obtained   │
//│ from a 'buffer' remember the buffer's generation; when         │
//│ UTEXT_CHECKED_BORROWS is on, touching a view whose buffer has  │
//│ since been mutated is fatal. destroying the buffer while a     │
//│ view is alive is a precondition violation either way.          │
//└────────────────────────────────────────────────────────────────┘

class view
{
	template <allo_t A> friend class buffer;

	const char8_t* __head__ {nullptr};
	const char8_t* __tail__ {nullptr};

	#if UTEXT_CHECKED_BORROWS
	const uint64_t* __epoch__ {nullptr};
	/*&*/ uint64_t  __seen__ {0};
	#endif

	constexpr view
	(
		const char8_t* head,
		const char8_t* tail,
		const uint64_t* epoch
	)
	noexcept : __head__ {head},
	           __tail__ {tail}
	           #if UTEXT_CHECKED_BORROWS
	           ,
	           __epoch__ {epoch},
	           __seen__ {epoch ? *epoch : 0}
	           #endif
	{
		#if !UTEXT_CHECKED_BORROWS
		static_cast<void>(epoch);
		#endif
	}

	// same borrow, narrower range.
	constexpr auto __narrow__(const char8_t* head, const char8_t* tail) const noexcept -> view;

	// stale borrows are fatal.
	constexpr auto __check__() const noexcept -> void;

public:

	class cursor
	{
		const char8_t* ptr {nullptr};
		const char8_t* base {nullptr};

	public:

		typedef scalar value_type;
		typedef scalar reference;
		typedef void pointer;
		typedef ptrdiff_t difference_type;
		typedef std::input_iterator_tag iterator_category;
		typedef std::bidirectional_iterator_tag iterator_concept;

		constexpr cursor() noexcept = default;

		constexpr cursor
		(
			decltype(ptr) ptr,
			decltype(base) base
		)
		noexcept : ptr {ptr},
		           base {base}
		{
			// nothing to do...
		}

		constexpr auto operator*() const noexcept -> scalar;

		// byte offset from the start of the view; always a scalar boundary.
		constexpr auto offset() const noexcept -> size_t;

		constexpr auto operator++(   ) noexcept -> cursor&;
		constexpr auto operator++(int) noexcept -> cursor;

		constexpr auto operator--(   ) noexcept -> cursor&;
		constexpr auto operator--(int) noexcept -> cursor;

		constexpr auto operator==(const cursor& rhs) const noexcept -> bool;
	};

	constexpr view() noexcept = default;

	// literals only; ill-formed UTF-8 fails to compile.
	template <size_t N>
	consteval view(const char8_t (&str)[N]) : __head__ {&str[N - N]},
	                                          __tail__ {&str[N - 1]}
	{
		if (!codec::validate({this->__head__, this->__tail__})) throw "ill-formed UTF-8 literal";
	}

	// validates runtime bytes; the caller keeps them alive.
	static constexpr auto from_bytes(std::span<const char8_t> bytes) noexcept -> result<view>;

	// false once the buffer this view borrows from has been mutated.
	constexpr auto valid() const noexcept -> bool;

	// returns the number of bytes.
	constexpr auto size() const noexcept -> size_t;
	constexpr auto empty() const noexcept -> bool;
	constexpr auto data() const noexcept -> const char8_t*;

	// returns the number of scalars. O(n), scans every time.
	constexpr auto char_count() const noexcept -> size_t;

	// lazy, restartable; every call starts a fresh pass.
	constexpr auto chars() const noexcept -> std::ranges::subrange<cursor>;
	constexpr auto bytes() const noexcept -> std::span<const char8_t>;

	constexpr auto begin() const noexcept -> cursor;
	constexpr auto end() const noexcept -> cursor;

	// byte offsets; fails with errc::boundary_error on reversed, out of range or mid-scalar bounds.
	constexpr auto slice(size_t start, size_t until) const noexcept -> result<view>;

	constexpr auto contains(view value) const noexcept -> bool;
	constexpr auto starts_with(view value) const noexcept -> bool;
	constexpr auto ends_with(view value) const noexcept -> bool;

	// byte offset of the first occurrence.
	constexpr auto find(view value) const noexcept -> std::optional<size_t>;

	// returns a list of views, of which is a product of split aka division.
	constexpr auto split(view value) const -> std::vector<view>;
	// returns a list of views, of which is a product of search occurrence.
	constexpr auto match(view value) const -> std::vector<view>;

	constexpr auto trim() const noexcept -> view;
	constexpr auto trim_start() const noexcept -> view;
	constexpr auto trim_end() const noexcept -> view;

	constexpr auto operator==(const view& rhs) const noexcept -> bool;

	template <size_t N>
	constexpr auto operator==(const char8_t (&rhs)[N]) const noexcept -> bool
	{
		return this->operator==(view {&rhs[N - N], &rhs[N - 1], nullptr});
	}

	friend auto operator<<(std::ostream& os, const view& str) -> std::ostream&
	{
		str.__check__();

		return os.write(reinterpret_cast<const char*>(str.__head__), static_cast<std::streamsize>(str.size()));
	}
};

//┌──────────────────────────────────────────────┐
//│ lazy concatenation; 'a + b + c' records the  │
//│ operands and copies them once, on conversion │
//│ to a buffer.                                 │
//└──────────────────────────────────────────────┘

class concat
{
	std::vector<view> data;

public:

	concat
	(
		view lhs,
		view rhs
	)
	: data {lhs, rhs}
	{
		// nothing to do...
	}

	auto size() const noexcept -> size_t
	{
		size_t out {0};

		for (const auto& str : this->data) { out += str.size(); } return out;
	}

	// defined in buffer.hpp
	template <allo_t A>
	[[nodiscard]] operator buffer<A>() const;

	auto operator+(view rhs) & -> concat& { this->data.push_back(rhs); return *this; }
	auto operator+(view rhs) && -> concat&& { this->data.push_back(rhs); return std::move(*this); }

	auto operator+(const concat& rhs) && -> concat&&
	{
		this->data.insert(this->data.end(), rhs.data.begin(), rhs.data.end()); return std::move(*this);
	}

	friend auto operator+(view lhs, concat rhs) -> concat
	{
		rhs.data.insert(rhs.data.begin(), lhs); return rhs;
	}
};

inline auto operator+(view lhs, view rhs) -> concat
{
	return {lhs, rhs};
}

#pragma region detail

template <typename F>
constexpr auto detail::__scan__(const char8_t* lhs_0, const char8_t* lhs_N,
                                const char8_t* rhs_0, const char8_t* rhs_N,
                                const F& fun /* lambda E */) -> void
{
	const auto lhs_len {static_cast<size_t>(lhs_N - lhs_0)};
	const auto rhs_len {static_cast<size_t>(rhs_N - rhs_0)};

	if (lhs_len == 0) return;
	if (rhs_len == 0) return;

	if (lhs_len < rhs_len) return;

	std::vector<size_t> tbl (rhs_len, 0);

	// LPS build
	for (size_t i {1}, j {0}; i < rhs_len; ++i)
	{
		while (0 < j && rhs_0[i] != rhs_0[j])
		{
			j = tbl[j - 1];
		}

		if (rhs_0[i] == rhs_0[j])
		{
			++j;
		}
		tbl[i] = j;
	}

	// KMP search
	for (size_t i {0}, j {0}; i < lhs_len; ++i)
	{
		while (0 < j && lhs_0[i] != rhs_0[j])
		{
			j = tbl[j - 1];
		}

		if (lhs_0[i] == rhs_0[j])
		{
			++j;
		}

		if (j == rhs_len)
		{
			// both sides are valid UTF-8, so a byte match starts and ends on boundaries.
			if (!fun(&lhs_0[i + 1 - rhs_len], &lhs_0[i + 1]))
			{
				return;
			}
			j = 0; // reset; matches never overlap
		}
	}
}

#pragma endregion detail
#pragma region view

constexpr auto view::__narrow__(const char8_t* head, const char8_t* tail) const noexcept -> view
{
	view out {*this};

	out.__head__ = head;
	out.__tail__ = tail;

	return out;
}

constexpr auto view::__check__() const noexcept -> void
{
	#if UTEXT_CHECKED_BORROWS
	if (!this->valid()) [[unlikely]]
	{
		if !consteval
		{
			spdlog::critical("utext: view of {} bytes used after its buffer was mutated", this->__tail__ - this->__head__);
		}
		std::terminate();
	}
	#endif
}

constexpr auto view::from_bytes(std::span<const char8_t> bytes) noexcept -> result<view>
{
	if (const auto ok {codec::validate(bytes)}; !ok)
	{
		if !consteval
		{
			spdlog::debug("utext: rejected {} bytes, {} at {}", bytes.size(), what(ok.error().code), ok.error().offset);
		}
		return std::unexpected(ok.error());
	}
	return view {bytes.data(), bytes.data() + bytes.size(), nullptr};
}

constexpr auto view::valid() const noexcept -> bool
{
	#if UTEXT_CHECKED_BORROWS
	return this->__epoch__ == nullptr || *this->__epoch__ == this->__seen__;
	#else
	return true;
	#endif
}

constexpr auto view::size() const noexcept -> size_t
{
	return static_cast<size_t>(this->__tail__ - this->__head__);
}

constexpr auto view::empty() const noexcept -> bool
{
	return this->__head__ == this->__tail__;
}

constexpr auto view::data() const noexcept -> const char8_t*
{
	this->__check__(); return this->__head__;
}

constexpr auto view::char_count() const noexcept -> size_t
{
	this->__check__();

	size_t out {0};

	for (const char8_t* ptr {this->__head__}; ptr < this->__tail__; ++out, ptr += codec::next(ptr)) {}

	return out;
}

constexpr auto view::chars() const noexcept -> std::ranges::subrange<cursor>
{
	return {this->begin(), this->end()};
}

constexpr auto view::bytes() const noexcept -> std::span<const char8_t>
{
	this->__check__(); return {this->__head__, this->size()};
}

constexpr auto view::begin() const noexcept -> cursor
{
	this->__check__(); return {this->__head__, this->__head__};
}

constexpr auto view::end() const noexcept -> cursor
{
	this->__check__(); return {this->__tail__, this->__head__};
}

constexpr auto view::slice(size_t start, size_t until) const noexcept -> result<view>
{
	this->__check__();

	if (until < start)
	{
		return std::unexpected(error {errc::boundary_error, start});
	}
	if (!codec::is_boundary(this->bytes(), start))
	{
		return std::unexpected(error {errc::boundary_error, start});
	}
	if (!codec::is_boundary(this->bytes(), until))
	{
		return std::unexpected(error {errc::boundary_error, until});
	}
	return this->__narrow__(this->__head__ + start, this->__head__ + until);
}

constexpr auto view::contains(view value) const noexcept -> bool
{
	return this->find(value).has_value();
}

constexpr auto view::starts_with(view value) const noexcept -> bool
{
	this->__check__(); value.__check__();

	return value.size() <= this->size()
	       &&
	       std::ranges::equal(this->__head__, this->__head__ + value.size(), value.__head__, value.__tail__);
}

constexpr auto view::ends_with(view value) const noexcept -> bool
{
	this->__check__(); value.__check__();

	return value.size() <= this->size()
	       &&
	       std::ranges::equal(this->__tail__ - value.size(), this->__tail__, value.__head__, value.__tail__);
}

constexpr auto view::find(view value) const noexcept -> std::optional<size_t>
{
	this->__check__(); value.__check__();

	const auto hit {std::ranges::search(this->__head__, this->__tail__, value.__head__, value.__tail__)};

	if (hit.begin() == this->__tail__ && !value.empty())
	{
		return std::nullopt;
	}
	return static_cast<size_t>(hit.begin() - this->__head__);
}

constexpr auto view::split(view value) const -> std::vector<view>
{
	this->__check__(); value.__check__();

	std::vector<view> out;

	const char8_t* last {this->__head__};

	detail::__scan__(this->__head__, this->__tail__, value.__head__, value.__tail__,
		// on every distinct match found
		[&](const char8_t* head, const char8_t* tail)
		{
			out.push_back(this->__narrow__(last, head));

			last = tail; // update anchor!

			return true;
		}
	);

	if (last < this->__tail__ || out.empty())
	{
		out.push_back(this->__narrow__(last, this->__tail__));
	}
	return out;
}

constexpr auto view::match(view value) const -> std::vector<view>
{
	this->__check__(); value.__check__();

	std::vector<view> out;

	detail::__scan__(this->__head__, this->__tail__, value.__head__, value.__tail__,
		// on every distinct match found
		[&](const char8_t* head, const char8_t* tail)
		{
			out.push_back(this->__narrow__(head, tail));

			return true;
		}
	);
	return out;
}

constexpr auto view::trim() const noexcept -> view
{
	return this->trim_start().trim_end();
}

constexpr auto view::trim_start() const noexcept -> view
{
	this->__check__();

	const char8_t* head {this->__head__};

	for (; head < this->__tail__; )
	{
		const auto size {codec::next(head)};

		if (!codec::decode_ptr(head, size).is_whitespace())
		{
			break;
		}
		head += size;
	}
	return this->__narrow__(head, this->__tail__);
}

constexpr auto view::trim_end() const noexcept -> view
{
	this->__check__();

	const char8_t* tail {this->__tail__};

	for (; this->__head__ < tail; )
	{
		const auto size {codec::back(tail)};

		if (!codec::decode_ptr(tail + size, static_cast<int8_t>(-size)).is_whitespace())
		{
			break;
		}
		tail += size;
	}
	return this->__narrow__(this->__head__, tail);
}

constexpr auto view::operator==(const view& rhs) const noexcept -> bool
{
	this->__check__(); rhs.__check__();

	return std::ranges::equal(this->__head__, this->__tail__, rhs.__head__, rhs.__tail__);
}

#pragma endregion view
#pragma region view::cursor

constexpr auto view::cursor::operator*() const noexcept -> scalar
{
	return codec::decode_ptr(this->ptr, codec::next(this->ptr));
}

constexpr auto view::cursor::offset() const noexcept -> size_t
{
	return static_cast<size_t>(this->ptr - this->base);
}

constexpr auto view::cursor::operator++(   ) noexcept -> cursor&
{
	this->ptr += codec::next(this->ptr); return *this;
}

constexpr auto view::cursor::operator++(int) noexcept -> cursor
{
	const auto clone {*this}; operator++(); return clone;
}

constexpr auto view::cursor::operator--(   ) noexcept -> cursor&
{
	this->ptr += codec::back(this->ptr); return *this;
}

constexpr auto view::cursor::operator--(int) noexcept -> cursor
{
	const auto clone {*this}; operator--(); return clone;
}

constexpr auto view::cursor::operator==(const cursor& rhs) const noexcept -> bool
{
	return this->ptr == rhs.ptr;
}

#pragma endregion view::cursor

} // namespace utext
