#pragma once

#include "hearth/models/relationship_graph.hpp"
#include "hearth/services/house_optimizer.hpp"
#include <dpp/dpp.h>

#include <span>
#include <string>
#include <string_view>

namespace hearth::ui {

class embed_builder {
public:
	// Build help embed
	[[nodiscard]] static auto build_help(std::span<const int> capacities) -> dpp::embed;

	// Build stored-list embed
	[[nodiscard]] static auto build_roster(std::span<const std::string> characters) -> dpp::embed;

	// Grouped text block: one line per house, then the total.
	[[nodiscard]] static auto render_assignment(const solve_result &result) -> std::string;

	// Full /rela reply: result block plus unknown / dropped notes.
	[[nodiscard]] static auto build_result(const solve_result &result) -> dpp::message;

	// /hello reply mentioning the caller.
	[[nodiscard]] static auto build_greeting(const dpp::snowflake &user_id) -> std::string;

	// /channelinfo: channel name and whether the allow-list admits it.
	[[nodiscard]] static auto build_channel_info(std::string_view channel_name, bool allowed) -> dpp::embed;

	// Error text shown when nothing in the request matched.
	[[nodiscard]] static auto build_registry_hint(std::span<const std::string> unmatched, const relationship_graph &graph) -> std::string;
};

} // namespace hearth::ui
