#pragma once

#include <cstddef>

#include <span>
#include <memory>
#include <charconv>
#include <concepts>
#include <string_view>
#include <system_error>

#include <spdlog/spdlog.h>

#include "view.hpp"
#include "error.hpp"
#include "buffer.hpp"

namespace utext {

template <typename T> concept number_t = (std::integral<T> && !std::same_as<T, bool>)
                                         ||
                                         std::floating_point<T>;

// the whole view must be a number; a single leading '+' is accepted.
template <number_t N> auto parse(view str) noexcept -> result<N>
{
	const char* head {reinterpret_cast<const char*>(str.data())};
	const char* tail {head + str.size()};

	const char* from {head};

	if (from != tail && *from == '+')
	{
		// "+-1" is not a number
		if (++from != tail && *from == '-') from = tail;
	}

	N out {};

	const auto [ptr, ec] {std::from_chars(from, tail, out)};

	if (from == tail || ec != std::errc {} || ptr != tail)
	{
		spdlog::debug("utext: '{}' is not a number ({})",
		              std::string_view {head, tail},
		              ec == std::errc::result_out_of_range ? "out of range" : "malformed");

		return std::unexpected(error {errc::parse_error, static_cast<size_t>(ptr - head)});
	}
	return out;
}

// shortest round-trip representation, as std::to_chars writes it.
template <number_t N, allo_t A = std::allocator<char8_t>> auto to_text(N value) -> buffer<A>
{
	char out[128];

	const auto [ptr, ec] {std::to_chars(&out[0], &out[sizeof(out)], value)};

	if (ec != std::errc {})
	{
		throw std::system_error {std::make_error_code(ec), "utext::to_text"};
	}

	const std::span<const char8_t> bytes {reinterpret_cast<const char8_t*>(out), static_cast<size_t>(ptr - out)};

	return buffer<A> {view::from_bytes(bytes).value()};
}

} // namespace utext
