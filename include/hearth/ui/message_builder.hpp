#pragma once

#include "hearth/core/constants.hpp"
#include <dpp/dpp.h>

#include <cstdint>
#include <format>
#include <string_view>

namespace hearth {

namespace util {
// Force the const conversion operator and silence -Wconversion noise.
[[nodiscard]] constexpr auto id_to_u64(const dpp::snowflake &id) noexcept -> std::uint64_t
{
	// the const qualifier in argument would make it picks operator uint64_t() const
	return static_cast<std::uint64_t>(id);
}

// Handy mention formatter.
[[nodiscard]] inline auto mention(const dpp::snowflake &id) -> std::string { return std::format("<@{}>", id_to_u64(id)); }
} // namespace util

namespace ui {

// for type safety
template <typename T>
concept Replyable = requires(T t, dpp::message m) { t.reply(m); };

class message_builder {
public:
	[[nodiscard]] static auto error(std::string_view msg) -> dpp::message
	{
		return dpp::message{std::format("{}{}", constants::text::err_prefix, msg)}.set_flags(dpp::m_ephemeral);
	}

	[[nodiscard]] static auto success(std::string_view msg) -> dpp::message { return dpp::message{std::format("{}{}", constants::text::ok_prefix, msg)}; }

	static auto reply_error(Replyable auto &event, std::string_view msg) -> void { event.reply(error(msg)); }

	static auto reply_success(Replyable auto &event, std::string_view msg) -> void { event.reply(success(msg)); }
};

} // namespace ui

} // namespace hearth
