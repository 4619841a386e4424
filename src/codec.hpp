#pragma once

#include <cstddef>
#include <cstdint>

#include <span>
#include <array>
#include <ostream>
#include <utility>

#include "error.hpp"
#include "scalar.hpp"

namespace utext {

struct decoded
{
	scalar code;
	uint8_t consumed;

	constexpr auto operator==(const decoded& rhs) const noexcept -> bool = default;
};

// 1 to 4 code units of a single encoded scalar.
struct encoded
{
	std::array<char8_t, 4> units {};
	uint8_t count {0};

	constexpr auto size() const noexcept -> size_t { return this->count; }

	constexpr auto begin() const noexcept -> const char8_t* { return this->units.data(); }
	constexpr auto end() const noexcept -> const char8_t* { return this->units.data() + this->count; }

	constexpr operator std::span<const char8_t>() const noexcept { return {this->begin(), this->end()}; }
};

class codec
{
	// nothing to do...

	// returns {expected sequence length, number of leading units that are well-formed}.
	static constexpr auto probe(std::span<const char8_t> bytes, size_t offset) noexcept -> std::pair<uint8_t, uint8_t>;

public:

	// sequence length read off a lead byte; only meaningful on validated storage.
	static constexpr auto next(const char8_t* data) noexcept -> int8_t;
	// negative distance to the previous lead byte; only meaningful on validated storage.
	static constexpr auto back(const char8_t* data) noexcept -> int8_t;

	static constexpr auto encode_ptr(scalar in, char8_t* out, int8_t size) noexcept -> void;
	static constexpr auto decode_ptr(const char8_t* in, int8_t size) noexcept -> scalar;

	// total; never fails for a valid scalar.
	static constexpr auto encode(scalar in) noexcept -> encoded;

	// decodes the scalar starting at 'offset', which must be a boundary.
	static constexpr auto decode_one(std::span<const char8_t> bytes, size_t offset) noexcept -> result<decoded>;

	// same as decode_one, but yields U+FFFD over the maximal ill-formed subpart.
	// at or past the end it yields U+FFFD with 'consumed' 0; loop on 'offset < size', not on 'consumed'.
	static constexpr auto decode_lossy(std::span<const char8_t> bytes, size_t offset) noexcept -> decoded;

	static constexpr auto is_boundary(std::span<const char8_t> bytes, size_t offset) noexcept -> bool;

	// the error points at the first ill-formed sequence.
	static constexpr auto validate(std::span<const char8_t> bytes) noexcept -> result<void>;
};

#pragma region codec

constexpr auto codec::probe(std::span<const char8_t> bytes, size_t offset) noexcept -> std::pair<uint8_t, uint8_t>
{
	const char8_t lead {bytes[offset]};

	uint8_t need {0};

	char8_t lo {0x80};
	char8_t hi {0xBF};

	//┌───────────┬─────────┬─────────┬─────────┬─────────┐
	//│ lead      │ 2nd     │ 3rd     │ 4th     │ scalars │
	//├───────────┼─────────┼─────────┼─────────┼─────────┤
	//│ 00 ... 7F │         │         │         │ ASCII   │
	//│ C2 ... DF │ 80...BF │         │         │ 2 units │
	//│ E0        │ A0...BF │ 80...BF │         │ 3 units │
	//│ E1 ... EC │ 80...BF │ 80...BF │         │ 3 units │
	//│ ED        │ 80...9F │ 80...BF │         │ 3 units │
	//│ EE ... EF │ 80...BF │ 80...BF │         │ 3 units │
	//│ F0        │ 90...BF │ 80...BF │ 80...BF │ 4 units │
	//│ F1 ... F3 │ 80...BF │ 80...BF │ 80...BF │ 4 units │
	//│ F4        │ 80...8F │ 80...BF │ 80...BF │ 4 units │
	//└───────────┴─────────┴─────────┴─────────┴─────────┘

	if (lead <= 0x7F)
	{
		return {1, 1};
	}
	else if (0xC2 <= lead && lead <= 0xDF)
	{
		need = 2;
	}
	else if (0xE0 <= lead && lead <= 0xEF)
	{
		need = 3;

		if (lead == 0xE0) lo = 0xA0; // overlong
		if (lead == 0xED) hi = 0x9F; // surrogate
	}
	else if (0xF0 <= lead && lead <= 0xF4)
	{
		need = 4;

		if (lead == 0xF0) lo = 0x90; // overlong
		if (lead == 0xF4) hi = 0x8F; // past U+10FFFF
	}
	else
	{
		// stray continuation, C0/C1 overlong or F5...FF
		return {1, 0};
	}

	uint8_t good {1};

	for (; good < need && offset + good < bytes.size(); ++good)
	{
		const char8_t unit {bytes[offset + good]};

		if (unit < lo || hi < unit)
		{
			break;
		}
		lo = 0x80;
		hi = 0xBF;
	}
	return {need, good};
}

constexpr auto codec::next(const char8_t* data) noexcept -> int8_t
{
	constexpr const int8_t TABLE[]
	{
		/*┌─────┬────────┬─────┬────────┐*/
		/*│ 0x0 │*/ 1, /*│ 0x1 │*/ 1, /*│*/
		/*│ 0x2 │*/ 1, /*│ 0x3 │*/ 1, /*│*/
		/*│ 0x4 │*/ 1, /*│ 0x5 │*/ 1, /*│*/
		/*│ 0x6 │*/ 1, /*│ 0x7 │*/ 1, /*│*/
		/*│ 0x8 │*/ 1, /*│ 0x9 │*/ 1, /*│*/
		/*│ 0xA │*/ 1, /*│ 0xB │*/ 1, /*│*/
		/*│ 0xC │*/ 2, /*│ 0xD │*/ 2, /*│*/
		/*│ 0xE │*/ 3, /*│ 0xF │*/ 4, /*│*/
		/*└─────┴────────┴─────┴────────┘*/
	};

	return TABLE[(data[0] >> 0x4) & 0x0F];
}

constexpr auto codec::back(const char8_t* data) noexcept -> int8_t
{
	int8_t i {-1};

	for (; (data[i] & 0xC0) == 0x80; --i) {}

	return i;
}

constexpr auto codec::encode_ptr(scalar in, char8_t* out, int8_t size) noexcept -> void
{
	const char32_t code {in.value()};

	switch (size)
	{
		case 1:
		{
			out[0] = static_cast<char8_t>(code);
			break;
		}
		case 2:
		{
			out[0] = static_cast<char8_t>(0xC0 | ((code >> 06) & 0x1F));
			out[1] = static_cast<char8_t>(0x80 | ((code >> 00) & 0x3F));
			break;
		}
		case 3:
		{
			out[0] = static_cast<char8_t>(0xE0 | ((code >> 12) & 0x0F));
			out[1] = static_cast<char8_t>(0x80 | ((code >> 06) & 0x3F));
			out[2] = static_cast<char8_t>(0x80 | ((code >> 00) & 0x3F));
			break;
		}
		case 4:
		{
			out[0] = static_cast<char8_t>(0xF0 | ((code >> 18) & 0x07));
			out[1] = static_cast<char8_t>(0x80 | ((code >> 12) & 0x3F));
			out[2] = static_cast<char8_t>(0x80 | ((code >> 06) & 0x3F));
			out[3] = static_cast<char8_t>(0x80 | ((code >> 00) & 0x3F));
			break;
		}
	}
}

constexpr auto codec::decode_ptr(const char8_t* in, int8_t size) noexcept -> scalar
{
	char32_t out {0};

	switch (size)
	{
		case 1:
		{
			out = static_cast<char32_t>(in[0]);
			break;
		}
		case 2:
		{
			out = ((in[0] & 0x1F) << 06)
			      |
			      ((in[1] & 0x3F) << 00);
			break;
		}
		case 3:
		{
			out = ((in[0] & 0x0F) << 12)
			      |
			      ((in[1] & 0x3F) << 06)
			      |
			      ((in[2] & 0x3F) << 00);
			break;
		}
		case 4:
		{
			out = ((in[0] & 0x07) << 18)
			      |
			      ((in[1] & 0x3F) << 12)
			      |
			      ((in[2] & 0x3F) << 06)
			      |
			      ((in[3] & 0x3F) << 00);
			break;
		}
	}
	return scalar {out, scalar::unchecked_t {}};
}

constexpr auto codec::encode(scalar in) noexcept -> encoded
{
	encoded out;

	out.count = in.encoded_length();

	encode_ptr(in, out.units.data(), static_cast<int8_t>(out.count));

	return out;
}

constexpr auto codec::decode_one(std::span<const char8_t> bytes, size_t offset) noexcept -> result<decoded>
{
	if (bytes.size() <= offset)
	{
		return std::unexpected(error {errc::malformed_sequence, offset});
	}

	const auto [need, good] {probe(bytes, offset)};

	if (need != good)
	{
		return std::unexpected(error {errc::malformed_sequence, offset});
	}
	return decoded {decode_ptr(&bytes[offset], static_cast<int8_t>(need)), need};
}

constexpr auto codec::decode_lossy(std::span<const char8_t> bytes, size_t offset) noexcept -> decoded
{
	if (bytes.size() <= offset)
	{
		return {U'\uFFFD', 0};
	}

	const auto [need, good] {probe(bytes, offset)};

	if (need != good)
	{
		return {U'\uFFFD', static_cast<uint8_t>(good == 0 ? 1 : good)};
	}
	return {decode_ptr(&bytes[offset], static_cast<int8_t>(need)), need};
}

constexpr auto codec::is_boundary(std::span<const char8_t> bytes, size_t offset) noexcept -> bool
{
	if (offset == 0 || offset == bytes.size()) return true;
	if (offset >= bytes.size()) return false;

	return (bytes[offset] & 0xC0) != 0x80;
}

constexpr auto codec::validate(std::span<const char8_t> bytes) noexcept -> result<void>
{
	for (size_t i {0}; i < bytes.size(); )
	{
		const auto [need, good] {probe(bytes, i)};

		if (need != good)
		{
			return std::unexpected(error {errc::malformed_sequence, i});
		}
		i += need;
	}
	return {};
}

#pragma endregion codec

inline auto operator<<(std::ostream& os, scalar code) -> std::ostream&
{
	const auto out {codec::encode(code)};

	return os.write(reinterpret_cast<const char*>(out.begin()), out.size());
}

} // namespace utext
