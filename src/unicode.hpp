#pragma once

#include <cstddef>
#include <cstdint>

#include <iterator>
#include <algorithm>

namespace utext::detail {

//┌──────────────────────────────────────────────────────────────┐
//│ property & case tables.                                      │
//│                                                              │
//│ every table is sorted by 'lo' and free of overlaps so that a │
//│ lookup is a single upper_bound followed by one range check.  │
//│                                                              │
//│ White_Space is exact. Alphabetic and Numeric cover the major │
//│ scripts at block granularity. case mapping is the simple 1:1 │
//│ mapping of the scripts listed in 'LOWER' / 'UPPER' only.     │
//└──────────────────────────────────────────────────────────────┘

struct block
{
	char32_t lo;
	char32_t hi;
};

// 'stride' 2 means only every other code point, starting at 'lo', is mapped.
struct fold
{
	char32_t lo;
	char32_t hi;
	int32_t delta;
	uint8_t stride;
};

inline constexpr const block WHITE_SPACE[]
{
	{0x0009, 0x000D}, {0x0020, 0x0020}, {0x0085, 0x0085}, {0x00A0, 0x00A0},
	{0x1680, 0x1680}, {0x2000, 0x200A}, {0x2028, 0x2029}, {0x202F, 0x202F},
	{0x205F, 0x205F}, {0x3000, 0x3000},
};

inline constexpr const block ALPHABETIC[]
{
	// latin
	{0x0041, 0x005A}, {0x0061, 0x007A}, {0x00AA, 0x00AA}, {0x00B5, 0x00B5},
	{0x00BA, 0x00BA}, {0x00C0, 0x00D6}, {0x00D8, 0x00F6}, {0x00F8, 0x02C1},
	{0x02C6, 0x02D1}, {0x02E0, 0x02E4}, {0x02EC, 0x02EC}, {0x02EE, 0x02EE},
	// greek, coptic, cyrillic, armenian
	{0x0345, 0x0345}, {0x0370, 0x0374}, {0x0376, 0x0377}, {0x037A, 0x037D},
	{0x037F, 0x037F}, {0x0386, 0x0386}, {0x0388, 0x038A}, {0x038C, 0x038C},
	{0x038E, 0x03A1}, {0x03A3, 0x03F5}, {0x03F7, 0x0481}, {0x048A, 0x052F},
	{0x0531, 0x0556}, {0x0559, 0x0559}, {0x0560, 0x0588},
	// hebrew, arabic
	{0x05B0, 0x05BD}, {0x05BF, 0x05BF}, {0x05C1, 0x05C2}, {0x05C4, 0x05C5},
	{0x05C7, 0x05C7}, {0x05D0, 0x05EA}, {0x05EF, 0x05F2}, {0x0610, 0x061A},
	{0x0620, 0x0657}, {0x0659, 0x065F}, {0x066E, 0x06D3}, {0x06D5, 0x06DC},
	{0x06E1, 0x06E8}, {0x06ED, 0x06EF}, {0x06FA, 0x06FC}, {0x06FF, 0x06FF},
	// devanagari, bengali
	{0x0900, 0x093B}, {0x093D, 0x094C}, {0x094E, 0x0950}, {0x0955, 0x0963},
	{0x0971, 0x0980}, {0x0981, 0x09E3}, {0x09F0, 0x09F1}, {0x09FC, 0x09FC},
	// thai, georgian, hangul jamo
	{0x0E01, 0x0E3A}, {0x0E40, 0x0E4D}, {0x10A0, 0x10FF}, {0x1100, 0x11FF},
	// mtavruli, latin extended additional, greek extended
	{0x1C90, 0x1CBA}, {0x1CBD, 0x1CBF}, {0x1E00, 0x1FBC}, {0x1FC2, 0x1FCC},
	{0x1FD0, 0x1FDB}, {0x1FE0, 0x1FEC}, {0x1FF2, 0x1FFC},
	// glagolitic, coptic, nuskhuri
	{0x2C00, 0x2CE4}, {0x2D00, 0x2D25},
	// kana, cjk, hangul
	{0x3041, 0x3096}, {0x309D, 0x309F}, {0x30A1, 0x30FA}, {0x30FC, 0x30FF},
	{0x3400, 0x4DBF}, {0x4E00, 0x9FFF}, {0xAC00, 0xD7A3},
	// fullwidth & halfwidth forms
	{0xFF21, 0xFF3A}, {0xFF41, 0xFF5A}, {0xFF66, 0xFFBE},
	// deseret, cjk extension B
	{0x10400, 0x1044F}, {0x20000, 0x2A6DF},
};

inline constexpr const block NUMERIC[]
{
	{0x0030, 0x0039}, {0x00B2, 0x00B3}, {0x00B9, 0x00B9}, {0x00BC, 0x00BE},
	{0x0660, 0x0669}, {0x06F0, 0x06F9}, {0x07C0, 0x07C9}, {0x0966, 0x096F},
	{0x09E6, 0x09EF}, {0x09F4, 0x09F9}, {0x0A66, 0x0A6F}, {0x0AE6, 0x0AEF},
	{0x0B66, 0x0B6F}, {0x0BE6, 0x0BF2}, {0x0C66, 0x0C6F}, {0x0CE6, 0x0CEF},
	{0x0D66, 0x0D78}, {0x0E50, 0x0E59}, {0x0ED0, 0x0ED9}, {0x0F20, 0x0F33},
	{0x1040, 0x1049}, {0x1369, 0x137C}, {0x16EE, 0x16F0}, {0x17E0, 0x17E9},
	{0x1810, 0x1819}, {0x2070, 0x2070}, {0x2074, 0x2079}, {0x2080, 0x2089},
	{0x2150, 0x2182}, {0x2185, 0x2189}, {0x2460, 0x249B}, {0x24EA, 0x24FF},
	{0x2776, 0x2793}, {0x3007, 0x3007}, {0x3021, 0x3029}, {0x3038, 0x303A},
	{0x3192, 0x3195}, {0x3220, 0x3229}, {0x3248, 0x324F}, {0x3251, 0x325F},
	{0x3280, 0x3289}, {0x32B1, 0x32BF}, {0xFF10, 0xFF19}, {0x1D7CE, 0x1D7FF},
};

// uppercase -> lowercase
inline constexpr const fold LOWER[]
{
	{0x00041, 0x0005A, +32, 1}, {0x000C0, 0x000D6, +32, 1}, {0x000D8, 0x000DE, +32, 1},
	{0x00100, 0x0012F, +1, 2}, {0x00130, 0x00130, -199, 1}, {0x00132, 0x00137, +1, 2},
	{0x00139, 0x00148, +1, 2}, {0x0014A, 0x00177, +1, 2}, {0x00178, 0x00178, -121, 1},
	{0x00179, 0x0017E, +1, 2},
	{0x00386, 0x00386, +38, 1}, {0x00388, 0x0038A, +37, 1}, {0x0038C, 0x0038C, +64, 1},
	{0x0038E, 0x0038F, +63, 1}, {0x00391, 0x003A1, +32, 1}, {0x003A3, 0x003AB, +32, 1},
	{0x00400, 0x0040F, +80, 1}, {0x00410, 0x0042F, +32, 1}, {0x00460, 0x00481, +1, 2},
	{0x0048A, 0x004BF, +1, 2}, {0x004D0, 0x0052F, +1, 2},
	{0x00531, 0x00556, +48, 1},
	{0x010A0, 0x010C5, +7264, 1},
	{0x01C90, 0x01CBA, -3008, 1}, {0x01CBD, 0x01CBF, -3008, 1},
	{0x01E00, 0x01E95, +1, 2}, {0x01E9E, 0x01E9E, -7615, 1}, {0x01EA0, 0x01EFF, +1, 2},
	{0x0FF21, 0x0FF3A, +32, 1},
	{0x10400, 0x10427, +40, 1},
};

// lowercase -> uppercase
inline constexpr const fold UPPER[]
{
	{0x00061, 0x0007A, -32, 1}, {0x000B5, 0x000B5, +743, 1}, {0x000E0, 0x000F6, -32, 1},
	{0x000F8, 0x000FE, -32, 1}, {0x000FF, 0x000FF, +121, 1}, {0x00101, 0x0012F, -1, 2},
	{0x00131, 0x00131, -232, 1}, {0x00133, 0x00137, -1, 2}, {0x0013A, 0x00148, -1, 2},
	{0x0014B, 0x00177, -1, 2}, {0x0017A, 0x0017E, -1, 2}, {0x0017F, 0x0017F, -300, 1},
	{0x003AC, 0x003AC, -38, 1}, {0x003AD, 0x003AF, -37, 1}, {0x003B1, 0x003C1, -32, 1},
	{0x003C2, 0x003C2, -31, 1}, {0x003C3, 0x003CB, -32, 1}, {0x003CC, 0x003CC, -64, 1},
	{0x003CD, 0x003CE, -63, 1},
	{0x00430, 0x0044F, -32, 1}, {0x00450, 0x0045F, -80, 1}, {0x00461, 0x00481, -1, 2},
	{0x0048B, 0x004BF, -1, 2}, {0x004D1, 0x0052F, -1, 2},
	{0x00561, 0x00586, -48, 1},
	{0x010D0, 0x010FA, +3008, 1}, {0x010FD, 0x010FF, +3008, 1},
	{0x01E01, 0x01E95, -1, 2}, {0x01EA1, 0x01EFF, -1, 2},
	{0x02D00, 0x02D25, -7264, 1},
	{0x0FF41, 0x0FF5A, -32, 1},
	{0x10428, 0x1044F, -40, 1},
};

template <size_t N>
constexpr auto __within__(const block (&table)[N], char32_t code) noexcept -> bool
{
	const auto* it {std::upper_bound(std::begin(table), std::end(table), code,
	                                 [](char32_t lhs, const block& rhs) { return lhs < rhs.lo; })};

	return it != std::begin(table) && code <= (it - 1)->hi;
}

template <size_t N>
constexpr auto __fold__(const fold (&table)[N], char32_t code) noexcept -> char32_t
{
	const auto* it {std::upper_bound(std::begin(table), std::end(table), code,
	                                 [](char32_t lhs, const fold& rhs) { return lhs < rhs.lo; })};

	if (it == std::begin(table)) return code;

	const fold& row {*(it - 1)};

	if (row.hi < code || (code - row.lo) % row.stride != 0)
	{
		return code;
	}
	return static_cast<char32_t>(static_cast<int32_t>(code) + row.delta);
}

constexpr auto is_white_space(char32_t code) noexcept -> bool { return __within__(WHITE_SPACE, code); }
constexpr auto is_alphabetic(char32_t code) noexcept -> bool { return __within__(ALPHABETIC, code); }
constexpr auto is_numeric(char32_t code) noexcept -> bool { return __within__(NUMERIC, code); }

constexpr auto simple_to_lower(char32_t code) noexcept -> char32_t { return __fold__(LOWER, code); }
constexpr auto simple_to_upper(char32_t code) noexcept -> char32_t { return __fold__(UPPER, code); }

// sanity checks; tables must stay sorted for upper_bound.
static_assert(std::ranges::is_sorted(WHITE_SPACE, {}, &block::lo));
static_assert(std::ranges::is_sorted(ALPHABETIC, {}, &block::lo));
static_assert(std::ranges::is_sorted(NUMERIC, {}, &block::lo));
static_assert(std::ranges::is_sorted(LOWER, {}, &fold::lo));
static_assert(std::ranges::is_sorted(UPPER, {}, &fold::lo));

} // namespace utext::detail
