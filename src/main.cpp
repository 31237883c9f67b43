#include "hearth/core/constants.hpp"
#include "hearth/handlers/autocomplete_handler.hpp"
#include "hearth/handlers/command_handler.hpp"
#include "hearth/services/config_service.hpp"
#include "hearth/services/reset_schedule.hpp"
#include "hearth/services/roster_service.hpp"
#include "hearth/ui/message_builder.hpp"
#include <dpp/dpp.h>

#include <chrono>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <mutex>

using namespace hearth;

namespace {

auto now_seconds() -> type::timestamp { return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now()); }

} // namespace

int main(int argc, char **argv)
{
	const std::filesystem::path config_path = argc > 1 ? argv[1] : std::string(constants::files::config_file);

	// Read bot token
	auto token = config_service::load_token(std::string(constants::files::token_file));
	if (!token) {
		std::cerr << token.error().what() << "\n";
		return 1;
	}

	// Load configuration
	auto loaded = config_service{config_path}.load();
	if (!loaded) {
		std::cerr << "Config error: " << loaded.error().what() << "\n";
		return 1;
	}

	// Initialize services
	auto config = std::make_shared<const game_config>(std::move(*loaded));
	auto graph = std::make_shared<const relationship_graph>(relationship_graph::build(config->relationships));
	auto rosters = std::make_shared<roster_service>(config->data_dir);

	// Create handlers
	auto cmd_handler = std::make_shared<command_handler>(config, graph, rosters);
	auto ac_handler = std::make_shared<autocomplete_handler>(graph, rosters);

	// Create bot
	dpp::cluster bot(*token);
	bot.on_log(dpp::utility::cout_logger());

	// Wire events
	bot.on_slashcommand([&bot, cmd_handler](const dpp::slashcommand_t &ev) {
		try {
			cmd_handler->on_slash(ev);
		} catch (const std::exception &e) {
			bot.log(dpp::ll_error, std::format("/{} failed: {}", ev.command.get_command_name(), e.what()));
			ui::message_builder::reply_error(ev, constants::text::internal_failure);
		}
	});

	bot.on_autocomplete([&bot, ac_handler](const dpp::autocomplete_t &ev) {
		try {
			ac_handler->on_autocomplete(ev);
		} catch (const std::exception &e) {
			bot.log(dpp::ll_warning, std::format("autocomplete for /{} failed: {}", ev.name, e.what()));
		}
	});

	bot.on_ready([&bot, config, graph](const dpp::ready_t &) {
		if (dpp::run_once<struct register_commands>()) {
			auto cmds = command_handler::commands(bot.me.id);
			if (config->guild_id != 0) {
				// Clear global commands
				bot.global_bulk_command_create({});
				bot.guild_bulk_command_create(cmds, config->guild_id);
			}
			else {
				bot.global_bulk_command_create(cmds);
			}
		}

		bot.log(dpp::ll_info, std::format("{} connected; {} characters, {} relationships, capacities {}", bot.me.username, graph->size(), graph->edge_count(),
																			config->capacities.size()));
	});

	// Weekly roster reset, polled once a minute
	auto schedule = std::make_shared<reset_schedule>(config->reset, now_seconds());
	auto schedule_mutex = std::make_shared<std::mutex>();
	bot.log(dpp::ll_info, std::format("Next roster reset at {:%Y-%m-%d %H:%M} UTC", schedule->next()));

	bot.start_timer(
			[&bot, rosters, schedule, schedule_mutex](dpp::timer) {
				std::scoped_lock lock(*schedule_mutex);
				if (!schedule->due(now_seconds())) {
					return;
				}

				if (auto res = rosters->reset_all(); res) {
					bot.log(dpp::ll_info, std::format("Weekly reset cleared {} lists; next at {:%Y-%m-%d %H:%M} UTC", *res, schedule->next()));
				}
				else {
					bot.log(dpp::ll_error, std::format("Weekly reset failed: {}", res.error().what()));
				}
			},
			60);

	// Start bot
	bot.start(dpp::st_wait);

	return 0;
}
