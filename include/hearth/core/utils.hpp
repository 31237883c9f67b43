#pragma once

#include <algorithm>
#include <cassert>
#include <cctype>
#include <chrono>
#include <concepts>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace hearth {

namespace type {
// Strong type aliases
using timestamp = std::chrono::sys_seconds;

enum class error_kind { generic, degenerate_capacities, unknown_entity, storage, internal };

// Error handling
struct error {
	std::string message;
	error_kind kind{error_kind::generic};

	error(std::string_view sv, error_kind k = error_kind::generic) : message(sv), kind(k) {}

	error() = default;
	error(const error &) = default;
	error(error &&) noexcept = default;
	error &operator=(const error &) = default;
	error &operator=(error &&) noexcept = default;

	[[nodiscard]] auto what() const -> std::string_view { return message; }
};

using ok_t = std::monostate;

} // namespace type

namespace util {

// Checked narrowing: asserts in debug if out of range, still returns casted value.
template <std::integral To, std::integral From>
[[nodiscard]] constexpr To narrow(From v)
{
	if (!std::in_range<To>(v)) {
		assert(!"narrow(): value out of range");
	}

	return static_cast<To>(v);
}

// ASCII lower-casing; names are compared case-insensitively everywhere.
[[nodiscard]] inline auto to_lower(std::string_view s) -> std::string
{
	std::string out(s);
	std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return out;
}

[[nodiscard]] inline auto iequals(std::string_view a, std::string_view b) -> bool
{
	return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) { return std::tolower(x) == std::tolower(y); });
}

[[nodiscard]] inline auto icontains(std::string_view haystack, std::string_view needle) -> bool
{
	return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

[[nodiscard]] inline auto trim(std::string_view s) -> std::string_view
{
	auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
	while (!s.empty() && is_space(s.front()))
		s.remove_prefix(1);
	while (!s.empty() && is_space(s.back()))
		s.remove_suffix(1);
	return s;
}

// "Han Wu, Imperial ,, Weiqing" -> {"Han Wu", "Imperial", "Weiqing"}
[[nodiscard]] inline auto split_names(std::string_view input, char sep = ',') -> std::vector<std::string>
{
	std::vector<std::string> out;
	while (true) {
		auto pos = input.find(sep);
		auto token = trim(input.substr(0, pos));
		if (!token.empty()) {
			out.emplace_back(token);
		}
		if (pos == std::string_view::npos) {
			break;
		}
		input.remove_prefix(pos + 1);
	}
	return out;
}

[[nodiscard]] inline auto join(const std::vector<std::string> &items, std::string_view sep) -> std::string
{
	std::string out;
	bool first = true;
	for (const auto &item : items) {
		if (!first)
			out += sep;
		out += item;
		first = false;
	}
	return out;
}

} // namespace util

} // namespace hearth
