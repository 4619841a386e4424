#include <span>
#include <vector>
#include <iterator>

#include <doctest/doctest.h>

#include "view.hpp"
#include "buffer.hpp"

using namespace utext;

TEST_CASE("[API] view")
{
	SUBCASE("from bytes")
	{
		const char8_t good[] {0x68, 0xC3, 0xA9};

		const auto yes {view::from_bytes(good)};

		REQUIRE(yes.has_value());
		CHECK(*yes == view {u8"hé"});
		CHECK(yes->data() == &good[0]);

		const char8_t bad[] {0x68, 0xC3};

		const auto no {view::from_bytes(bad)};

		REQUIRE_FALSE(no.has_value());
		CHECK(no.error().code == errc::malformed_sequence);
		CHECK(no.error().offset == 1);
	}

	SUBCASE("empty")
	{
		const view str;

		CHECK(str.empty());
		CHECK(str.size() == 0);
		CHECK(str.char_count() == 0);
		CHECK(str.begin() == str.end());
		CHECK(str == view {u8""});
	}

	SUBCASE("length")
	{
		CHECK(view {u8"abc"}.char_count() == 3);
		CHECK(view {u8"티라미수"}.size() == 12);
		CHECK(view {u8"티라미수"}.char_count() == 4);
		CHECK(view {u8"😀😀"}.char_count() == 2);
	}

	SUBCASE("iterate both ways")
	{
		const view str {u8"aé€😀"};

		std::vector<scalar> forward;
		std::vector<size_t> offsets;

		for (auto it {str.begin()}; it != str.end(); ++it)
		{
			forward.push_back(*it);
			offsets.push_back(it.offset());
		}

		REQUIRE(forward.size() == 4);
		CHECK(forward[0] == scalar {U'a'});
		CHECK(forward[1] == scalar {U'é'});
		CHECK(forward[2] == scalar {U'€'});
		CHECK(forward[3] == scalar {U'😀'});

		const std::vector<size_t> expected {0, 1, 3, 6};

		CHECK(offsets == expected);

		std::vector<scalar> reverse;

		for (auto it {str.end()}; it != str.begin(); )
		{
			reverse.push_back(*--it);
		}

		REQUIRE(reverse.size() == 4);
		CHECK(reverse[0] == scalar {U'😀'});
		CHECK(reverse[3] == scalar {U'a'});

		CHECK(std::ranges::distance(str.chars()) == 4);
	}

	SUBCASE("slice")
	{
		const view str {u8"티라미수"};

		const auto mid {str.slice(3, 9)};

		REQUIRE(mid.has_value());
		CHECK(*mid == view {u8"라미"});
		CHECK(mid->data() == str.data() + 3);

		const auto whole {str.slice(0, str.size())};

		REQUIRE(whole.has_value());
		CHECK(*whole == str);

		const auto none {str.slice(12, 12)};

		REQUIRE(none.has_value());
		CHECK(none->empty());

		CHECK(str.slice(1, 3).error().offset == 1);
		CHECK(str.slice(0, 4).error().offset == 4);
		CHECK(str.slice(0, 13).error().code == errc::boundary_error);
		CHECK(str.slice(6, 3).error().code == errc::boundary_error);
	}

	SUBCASE("search")
	{
		const view str {u8"티라미수☆치즈케잌☆말차라떼"};

		CHECK(str.contains(u8"치즈"));
		CHECK(str.contains(u8""));
		CHECK_FALSE(str.contains(u8"케이크"));

		CHECK(str.starts_with(u8"티라"));
		CHECK(str.starts_with(str));
		CHECK_FALSE(str.starts_with(u8"라"));

		CHECK(str.ends_with(u8"라떼"));
		CHECK_FALSE(str.ends_with(u8"라"));

		CHECK_FALSE(view {u8"ab"}.starts_with(u8"abc"));
		CHECK_FALSE(view {u8"ab"}.ends_with(u8"abc"));

		CHECK(str.find(u8"☆") == std::optional<size_t> {12});
		CHECK(str.find(u8"") == std::optional<size_t> {0});
		CHECK_FALSE(str.find(u8"x").has_value());
	}

	SUBCASE("split")
	{
		const view str {u8"티라미수☆치즈케잌☆말차라떼"};

		const auto out {str.split(u8"☆")};

		REQUIRE(out.size() == 3);
		CHECK(out[0] == view {u8"티라미수"});
		CHECK(out[1] == view {u8"치즈케잌"});
		CHECK(out[2] == view {u8"말차라떼"});

		const auto gap {view {u8"a,,b"}.split(u8",")};

		REQUIRE(gap.size() == 3);
		CHECK(gap[1].empty());

		// a trailing separator leaves no empty piece
		CHECK(view {u8"a,b,"}.split(u8",").size() == 2);

		const auto miss {str.split(u8"x")};

		REQUIRE(miss.size() == 1);
		CHECK(miss[0] == str);
	}

	SUBCASE("match")
	{
		const view str {u8"티라미수☆치즈케잌☆말차라떼"};

		const auto out {str.match(u8"☆")};

		REQUIRE(out.size() == 2);
		CHECK(out[0].data() == str.data() + 12);
		CHECK(out[1] == view {u8"☆"});

		// matches never overlap
		CHECK(view {u8"aaaa"}.match(u8"aa").size() == 2);
		CHECK(view {u8"aaa"}.match(u8"aa").size() == 1);
	}

	SUBCASE("trim")
	{
		CHECK(view {u8"\t\n abc \r\n"}.trim() == view {u8"abc"});
		CHECK(view {u8"  abc  "}.trim_start() == view {u8"abc  "});
		CHECK(view {u8"  abc  "}.trim_end() == view {u8"  abc"});
		// U+3000 and U+00A0 are white space too
		CHECK(view {u8"\u3000가\u00A0"}.trim() == view {u8"가"});
		CHECK(view {u8"   "}.trim().empty());
		CHECK(view {u8""}.trim().empty());

		for (const view str : {view {u8" a "}, view {u8"\u3000 b\t"}, view {u8"c"}, view {u8" "}})
		{
			CHECK(str.trim().trim() == str.trim());
			CHECK(str.trim_start().trim_start() == str.trim_start());
			CHECK(str.trim_end().trim_end() == str.trim_end());
		}
	}

	SUBCASE("concatenation")
	{
		const view a {u8"티라"};
		const view b {u8"미수"};
		const view c {u8"☆"};

		const text ab = a + b;

		CHECK(ab == view {u8"티라미수"});
		CHECK(ab.size() == a.size() + b.size());

		const text lhs = (a + b) + c;
		const text rhs = a + (b + c);

		CHECK(lhs == rhs);
		CHECK(lhs == view {u8"티라미수☆"});

		const text chain = a + b + c + a;

		CHECK(chain == view {u8"티라미수☆티라"});
	}
}
