#pragma once

#include <cstddef>
#include <cstdint>

#include <ostream>
#include <expected>
#include <string_view>

namespace utext {

enum class errc : uint8_t
{
	invalid_codepoint = 1, // surrogate or beyond U+10FFFF
	malformed_sequence,    // truncated, overlong or otherwise ill-formed UTF-8
	boundary_error,        // offset out of range or inside a multi-byte scalar
	parse_error,           // text is not a number of the requested type
};

struct error
{
	errc code;
	// byte offset of the fault, where one applies.
	size_t offset {0};

	constexpr auto operator==(const error& rhs) const noexcept -> bool = default;
	constexpr auto operator==(errc rhs) const noexcept -> bool { return this->code == rhs; }
};

constexpr auto what(errc code) noexcept -> std::string_view
{
	switch (code)
	{
		case errc::invalid_codepoint: return "invalid codepoint";
		case errc::malformed_sequence: return "malformed UTF-8 sequence";
		case errc::boundary_error: return "offset is not a scalar boundary";
		case errc::parse_error: return "not a number";
	}
	return "unknown error";
}

inline auto operator<<(std::ostream& os, errc code) -> std::ostream&
{
	return os << what(code);
}

inline auto operator<<(std::ostream& os, const error& err) -> std::ostream&
{
	return os << what(err.code) << " @ " << err.offset;
}

template <typename T> using result = std::expected<T, error>;

} // namespace utext
