#pragma once

#include <cstddef>
#include <cstdint>

#include <bit>
#include <array>
#include <compare>
#include <algorithm>

#include "error.hpp"
#include "unicode.hpp"

namespace utext {

class codec;
class casing;

// a single unicode scalar value; U+0000 ... U+D7FF or U+E000 ... U+10FFFF.
class scalar
{
	friend codec;

	char32_t code {0};

	struct unchecked_t { explicit unchecked_t() = default; };

	constexpr scalar
	(
		char32_t code,
		unchecked_t
	)
	noexcept : code {code}
	{
		// nothing to do...
	}

public:

	constexpr scalar() noexcept = default;

	// literals only; an invalid literal fails to compile.
	consteval scalar(char32_t code) : code {code}
	{
		if (!valid(code)) throw "surrogate or out of range scalar literal";
	}

	static constexpr auto valid(char32_t code) noexcept -> bool
	{
		return code < 0xD800 || (0xDFFF < code && code <= 0x10FFFF);
	}

	// fails with errc::invalid_codepoint on surrogates and values past U+10FFFF.
	static constexpr auto from(char32_t code) noexcept -> result<scalar>
	{
		if (!valid(code))
		{
			return std::unexpected(error {errc::invalid_codepoint, 0});
		}
		return scalar {code, unchecked_t {}};
	}

	constexpr auto value() const noexcept -> char32_t { return this->code; }

	// returns the number of UTF-8 code units; 1, 2, 3 or 4.
	constexpr auto encoded_length() const noexcept -> uint8_t
	{
		const auto N {std::bit_width
		(static_cast<uint32_t>(this->code))};

		//┌───────────────────────┐
		//│ U+000000 ... U+00007F │ -> 1 code unit
		//│ U+000080 ... U+0007FF │ -> 2 code unit
		//│ U+000800 ... U+00FFFF │ -> 3 code unit
		//│ U+010000 ... U+10FFFF │ -> 4 code unit
		//└───────────────────────┘

		return 1 + (8 <= N) + (12 <= N) + (17 <= N);
	}

	constexpr auto is_alphabetic() const noexcept -> bool { return detail::is_alphabetic(this->code); }
	constexpr auto is_numeric() const noexcept -> bool { return detail::is_numeric(this->code); }
	constexpr auto is_whitespace() const noexcept -> bool { return detail::is_white_space(this->code); }

	// simple 1:1 mapping, except for 'ß' which expands to "SS".
	constexpr auto to_upper() const noexcept -> casing;
	// simple 1:1 mapping.
	constexpr auto to_lower() const noexcept -> casing;

	constexpr auto operator==(const scalar& rhs) const noexcept -> bool = default;
	constexpr auto operator<=>(const scalar& rhs) const noexcept -> std::strong_ordering = default;
};

// result of a case mapping; one scalar in the common case, up to three.
class casing
{
	friend scalar;

	std::array<scalar, 3> data {};
	uint8_t count {0};

	constexpr casing() noexcept = default;

	constexpr auto push(scalar code) noexcept -> void { this->data[this->count++] = code; }

public:

	constexpr auto size() const noexcept -> size_t { return this->count; }

	constexpr auto begin() const noexcept -> const scalar* { return this->data.data(); }
	constexpr auto end() const noexcept -> const scalar* { return this->data.data() + this->count; }

	constexpr auto front() const noexcept -> scalar { return this->data[0]; }

	constexpr auto operator==(const casing& rhs) const noexcept -> bool
	{
		return this->count == rhs.count && std::equal(this->begin(), this->end(), rhs.begin());
	}
};

constexpr auto scalar::to_upper() const noexcept -> casing
{
	casing out;

	if (this->code == U'ß')
	{
		out.push(U'S');
		out.push(U'S');
		return out;
	}
	out.push(scalar {detail::simple_to_upper(this->code), unchecked_t {}});

	return out;
}

constexpr auto scalar::to_lower() const noexcept -> casing
{
	casing out;

	out.push(scalar {detail::simple_to_lower(this->code), unchecked_t {}});

	return out;
}

} // namespace utext
