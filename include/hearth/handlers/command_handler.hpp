#pragma once

#include "hearth/models/game_config.hpp"
#include "hearth/models/relationship_graph.hpp"
#include "hearth/services/roster_service.hpp"
#include <dpp/dpp.h>

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace hearth {

class command_handler {
public:
	explicit command_handler(std::shared_ptr<const game_config> config, std::shared_ptr<const relationship_graph> graph,
													 std::shared_ptr<roster_service> rosters);

	// Command dispatch
	auto on_slash(const dpp::slashcommand_t &ev) -> void;

	// Get command definitions for registration
	[[nodiscard]] static auto commands(dpp::snowflake bot_id) -> std::vector<dpp::slashcommand>;

	// Per-call solver seed: request hash mixed with the wall clock.
	[[nodiscard]] static auto make_seed(std::span<const std::string> names) -> std::uint64_t;

private:
	std::shared_ptr<const game_config> config_;
	std::shared_ptr<const relationship_graph> graph_;
	std::shared_ptr<roster_service> rosters_;

	[[nodiscard]] auto channel_allowed(const dpp::slashcommand_t &ev) const -> bool;

	// Command implementations
	auto cmd_help(const dpp::slashcommand_t &ev) -> void;
	auto cmd_ping(const dpp::slashcommand_t &ev) -> void;
	auto cmd_hello(const dpp::slashcommand_t &ev) -> void;
	auto cmd_channelinfo(const dpp::slashcommand_t &ev) -> void;
	auto cmd_rela(const dpp::slashcommand_t &ev) -> void;
	auto cmd_add(const dpp::slashcommand_t &ev) -> void;
	auto cmd_remove(const dpp::slashcommand_t &ev) -> void;
	auto cmd_clear(const dpp::slashcommand_t &ev) -> void;
	auto cmd_list(const dpp::slashcommand_t &ev) -> void;
	auto cmd_gen(const dpp::slashcommand_t &ev) -> void;
};

} // namespace hearth
