#include <new>
#include <memory>
#include <utility>
#include <optional>
#include <stdexcept>

#include <doctest/doctest.h>

#include "buffer.hpp"

using namespace utext;

namespace
{
	// std::allocator that counts, and can be told to fail.
	template <typename T> struct counting : std::allocator<T>
	{
		static inline size_t allocations {0};
		static inline bool fail {false};

		constexpr counting() noexcept = default;

		template <typename U>
		constexpr counting(const counting<U>&) noexcept
		{
			// nothing to do...
		}

		auto allocate(size_t n) -> T*
		{
			if (fail)
			{
				throw std::bad_alloc {};
			}
			++allocations;

			return std::allocator<T>::allocate(n);
		}
	};
}

TEST_CASE("[API] buffer")
{
	SUBCASE("storage")
	{
		text str;

		CHECK(str.empty());
		CHECK(str.size() == 0);
		CHECK(str.capacity() == 0);
		CHECK(str.data() == nullptr);
		CHECK(str.c_str()[0] == 0);

		str.push(U'ह');

		CHECK(str.size() == 3);
		CHECK(str.capacity() == 3);

		str.push(U'a');

		CHECK(str.size() == 4);
		CHECK(str.capacity() == 6);
		CHECK(str.c_str()[str.size()] == 0);
	}

	SUBCASE("with capacity")
	{
		auto str {text::with_capacity(16)};

		CHECK(str.empty());
		CHECK(str.capacity() >= 16);

		const auto* before {str.data()};

		str.push(u8"Hello, world!");

		CHECK(str.data() == before);
		CHECK(str == view {u8"Hello, world!"});
	}

	SUBCASE("growth is amortized")
	{
		typedef buffer<counting<char8_t>> counted;

		counting<char8_t>::allocations = 0;

		counted str;

		size_t copied {0};

		for (size_t i {0}; i < 1000; ++i)
		{
			const auto room {str.capacity()};

			str.push(U'a');

			if (str.capacity() != room)
			{
				copied += str.size() - 1;
			}
		}

		CHECK(str.size() == 1000);
		// 1, 2, 4 ... 1024
		CHECK(counting<char8_t>::allocations == 11);
		CHECK(copied < 2 * str.size());
	}

	SUBCASE("failed allocation changes nothing")
	{
		typedef buffer<counting<char8_t>> counted;

		counted str {u8"abc"};

		const view before {str};

		counting<char8_t>::fail = true;

		CHECK_THROWS_AS(str.push(u8"defg"), std::bad_alloc);

		counting<char8_t>::fail = false;

		CHECK(str == view {u8"abc"});
		CHECK(before.valid());
	}

	SUBCASE("push")
	{
		text str {u8"티라"};

		str.push(u8"미수");
		str += U'☆';
		str += view {u8"!"};

		CHECK(str == view {u8"티라미수☆!"});
		CHECK(str.as_view().char_count() == 6);

		// appending itself
		text twice {u8"abc"};

		twice.push(twice);

		CHECK(twice == view {u8"abcabc"});

		const auto tail {twice.as_view().slice(3, 6)};

		REQUIRE(tail.has_value());

		twice.push(*tail);

		CHECK(twice == view {u8"abcabcabc"});
	}

	SUBCASE("pop")
	{
		text str {u8"h😀é"};

		auto out {str.pop()};

		REQUIRE(out.has_value());
		CHECK(*out == scalar {U'é'});
		CHECK(str == view {u8"h😀"});

		out = str.pop();

		REQUIRE(out.has_value());
		CHECK(*out == scalar {U'😀'});

		out = str.pop();

		REQUIRE(out.has_value());
		CHECK(*out == scalar {U'h'});

		CHECK(str.empty());
		CHECK_FALSE(str.pop().has_value());
	}

	SUBCASE("replace")
	{
		const text str {u8"I like C++. I use C++."};

		CHECK(str.replace(u8"C++", u8"Rust") == view {u8"I like Rust. I use Rust."});
		CHECK(str.replace(u8"C#", u8"Rust") == str);
		CHECK(str.replace(u8"", u8"Rust") == str);
		CHECK(str.replace(u8"C++", u8"") == view {u8"I like . I use ."});

		CHECK(text {u8"aaaa"}.replace(u8"aa", u8"b") == view {u8"bb"});
		CHECK(text {u8"aaa"}.replace(u8"aa", u8"b") == view {u8"ba"});
		CHECK(text {u8"☆☆☆"}.replace(u8"☆", u8"★") == view {u8"★★★"});
	}

	SUBCASE("replace range")
	{
		text str {u8"Hello world"};

		REQUIRE(str.replace_range(6, 11, u8"Rust").has_value());
		CHECK(str == view {u8"Hello Rust"});

		REQUIRE(str.replace_range(0, 5, u8"안녕").has_value());
		CHECK(str == view {u8"안녕 Rust"});

		const text before {str};

		// inside '안'
		const auto bad {str.replace_range(1, 3, u8"x")};

		REQUIRE_FALSE(bad.has_value());
		CHECK(bad.error().code == errc::boundary_error);
		CHECK(bad.error().offset == 1);
		CHECK(str == before);

		CHECK(str.replace_range(0, 99, u8"x").error().offset == 99);
		CHECK(str.replace_range(4, 2, u8"x").error().code == errc::boundary_error);
		CHECK(str == before);
	}

	SUBCASE("insert & truncate")
	{
		text str {u8"Hello"};

		REQUIRE(str.insert(5, u8", Rust").has_value());
		REQUIRE(str.insert(0, u8"¡").has_value());

		CHECK(str == view {u8"¡Hello, Rust"});

		CHECK(str.insert(1, u8"x").error().offset == 1);

		REQUIRE(str.truncate(7).has_value());
		CHECK(str == view {u8"¡Hello"});

		CHECK(str.truncate(1).error().code == errc::boundary_error);

		REQUIRE(str.truncate(0).has_value());
		CHECK(str.empty());
	}

	SUBCASE("edit without storage")
	{
		auto shrunk {text::with_capacity(8)};

		shrunk.push(u8"abc");
		shrunk.clear();
		shrunk.shrink_to_fit();

		text fresh;

		auto none {text::with_capacity(0)};

		for (text* str : {&fresh, &none, &shrunk})
		{
			REQUIRE(str->data() == nullptr);

			CHECK(str->truncate(0).has_value());
			CHECK(str->insert(0, u8"").has_value());
			CHECK(str->replace_range(0, 0, view {}).has_value());

			CHECK(str->empty());
			CHECK(str->capacity() == 0);
			CHECK(str->c_str()[0] == 0);

			CHECK(str->truncate(1).error().code == errc::boundary_error);

			REQUIRE(str->insert(0, u8"안녕").has_value());
			CHECK(*str == view {u8"안녕"});
			CHECK(str->c_str()[str->size()] == 0);
		}
	}

	SUBCASE("clear, reserve & shrink")
	{
		auto str {text::with_capacity(64)};

		str.push(u8"abc");
		str.shrink_to_fit();

		CHECK(str.capacity() == 3);
		CHECK(str == view {u8"abc"});

		str.reserve(2);

		CHECK(str.capacity() == 3);

		str.reserve(10);

		CHECK(str.capacity() == 10);
		CHECK(str == view {u8"abc"});

		str.clear();

		CHECK(str.empty());
		CHECK(str.capacity() == 10);
		CHECK(str.c_str()[0] == 0);

		str.shrink_to_fit();

		CHECK(str.capacity() == 0);
	}

	SUBCASE("copy & move")
	{
		text a {u8"티라미수"};
		text b {a};

		CHECK(b == a);
		CHECK(b.capacity() == b.size());
		CHECK(b.data() != a.data());

		b.push(U'☆');

		CHECK(a == view {u8"티라미수"});

		const text c {std::move(b)};

		CHECK(c == view {u8"티라미수☆"});
		CHECK(b.empty());
		CHECK(b.capacity() == 0);

		b = c;

		CHECK(b == c);

		a = std::move(b);

		CHECK(a == c);
	}

	SUBCASE("from bytes")
	{
		const char8_t good[] {0x68, 0xC3, 0xA9};

		const auto yes {text::from_bytes(good)};

		REQUIRE(yes.has_value());
		CHECK(*yes == view {u8"hé"});

		const char8_t bad[] {0x61, 0xFF, 0x62, 0xE2, 0x82};

		const auto no {text::from_bytes(bad)};

		REQUIRE_FALSE(no.has_value());
		CHECK(no.error().code == errc::malformed_sequence);
		CHECK(no.error().offset == 1);

		CHECK(text::from_bytes_lossy(bad) == view {u8"a\uFFFDb\uFFFD"});
	}

	SUBCASE("case conversion")
	{
		CHECK(to_upper(u8"straße") == view {u8"STRASSE"});
		CHECK(to_lower(u8"ΑΒΓ Ж") == view {u8"αβγ ж"});
		CHECK(to_upper(u8"티라미수 123") == view {u8"티라미수 123"});
	}
}

#if UTEXT_CHECKED_BORROWS

TEST_CASE("[API] borrows")
{
	SUBCASE("mutation invalidates views")
	{
		text str {u8"abc"};

		const view before {str};

		CHECK(before.valid());

		str.push(U'd');

		CHECK_FALSE(before.valid());

		const auto after {str.as_view()};

		CHECK(after.valid());
		CHECK(after == view {u8"abcd"});

		str.clear();

		CHECK_FALSE(after.valid());
	}

	SUBCASE("narrowed views share the borrow")
	{
		text str {u8"Rust is fun!"};

		const auto word {str.as_view().slice(0, 4)};
		const auto trim {view {str}.trim()};

		REQUIRE(word.has_value());
		CHECK(word->valid());
		CHECK(trim.valid());

		REQUIRE(str.truncate(4).has_value());

		CHECK_FALSE(word->valid());
		CHECK_FALSE(trim.valid());
	}

	SUBCASE("rejected edits keep views alive")
	{
		text str {u8"héllo"};

		const view before {str};

		CHECK_FALSE(str.replace_range(2, 3, u8"x").has_value());
		CHECK(before.valid());

		// edits that change nothing
		CHECK(str.truncate(str.size()).has_value());
		CHECK(str.insert(0, u8"").has_value());
		CHECK(before.valid());
	}

	SUBCASE("copies and literals are independent")
	{
		text a {u8"abc"};

		const view before {a};

		text b {a};

		b.push(U'd');

		CHECK(before.valid());

		const view literal {u8"abc"};

		a.clear();

		CHECK(literal.valid());
		CHECK_FALSE(before.valid());
	}

	SUBCASE("moving out invalidates views")
	{
		text a {u8"abc"};

		const view before {a};

		const text b {std::move(a)};

		CHECK_FALSE(before.valid());
		CHECK(b.as_view().valid());
	}
}

#endif
