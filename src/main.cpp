#define DOCTEST_CONFIG_IMPLEMENT

#include <cstdlib>

#include <doctest/doctest.h>

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>

#include "utext.hpp"

int main(int argc, char** argv)
{
	#ifdef _MSC_VER//############//;
	std::system("chcp 65001 > NUL");
	#endif//MSC_VER//############//;

	// e.g. SPDLOG_LEVEL=trace ./utext_test
	spdlog::cfg::load_env_levels();

	doctest::Context context;

	context.applyCommandLine(argc, argv);

	return context.run();
}

using namespace utext;

TEST_CASE("[API] walkthrough")
{
	SUBCASE("build a greeting")
	{
		text str {u8"Hello"};

		str.push(U',');
		str.push(u8" Rust!");

		CHECK(str == view {u8"Hello, Rust!"});
		CHECK(str.size() == 12);
	}

	SUBCASE("count scalars")
	{
		const view str {u8"नमस्ते"};

		CHECK(str.size() == 18);
		CHECK(str.char_count() == 6);

		const scalar expected[]
		{
			U'न', U'म', U'स', U'्', U'त', U'े',
		};

		size_t i {0};

		for (const auto code : str.chars())
		{
			REQUIRE(i < std::size(expected));
			CHECK(code == expected[i++]);
		}
		CHECK(i == 6);
	}

	SUBCASE("slice on boundaries")
	{
		const view str {u8"Rust is fun!"};

		const auto rust {str.slice(0, 4)};

		REQUIRE(rust.has_value());
		CHECK(*rust == view {u8"Rust"});

		const view accent {u8"héllo"};

		const auto bad {accent.slice(0, 2)};

		REQUIRE_FALSE(bad.has_value());
		CHECK(bad.error().code == errc::boundary_error);
		CHECK(bad.error().offset == 2);
	}

	SUBCASE("replace every match")
	{
		const text str {u8"I like C++. I use C++."};

		CHECK(str.replace(u8"C++", u8"Rust") == view {u8"I like Rust. I use Rust."});
		CHECK(str == view {u8"I like C++. I use C++."});
	}

	SUBCASE("trim without copying")
	{
		const view str {u8" Rust is awesome! "};

		const auto out {str.trim()};

		CHECK(out == view {u8"Rust is awesome!"});
		CHECK(out.data() == str.data() + 1);
	}

	SUBCASE("parse numbers")
	{
		const auto yes {parse<int>(u8"42")};

		REQUIRE(yes.has_value());
		CHECK(*yes == 42);

		const auto no {parse<int>(u8"abc")};

		REQUIRE_FALSE(no.has_value());
		CHECK(no.error().code == errc::parse_error);
	}
}
