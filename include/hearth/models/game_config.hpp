#pragma once

#include "hearth/core/constants.hpp"
#include "hearth/core/utils.hpp"
#include "hearth/models/assignment.hpp"
#include "hearth/models/relationship_graph.hpp"
#include "hearth/services/house_optimizer.hpp"
#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hearth {

// Weekly UTC slot for bulk-clearing stored lists.
struct reset_slot {
	int weekday{1}; // 0 = Sunday
	int hour{0};
};

class game_config {
public:
	capacity_list capacities;
	relationship_table relationships;
	std::vector<std::string> allowed_channels; // empty = every channel
	std::uint64_t guild_id{0};								 // 0 = register commands globally
	std::vector<std::vector<std::string>> seed_template;
	std::vector<strategy_weight> strategies{default_strategy_weights()};
	std::optional<int> trials;
	reset_slot reset{};
	std::filesystem::path data_dir{constants::files::default_data_dir};

	[[nodiscard]] auto optimizer(std::uint64_t seed) const -> optimizer_config
	{
		return {.capacities = capacities,
						.seed = seed,
						.trials = trials,
						.early_stop_cap = constants::solver::early_stop_cap,
						.early_stop_fraction = constants::solver::early_stop_fraction,
						.strategies = strategies,
						.seed_template = seed_template,
						.refine = {},
						.overflow = {}};
	}

	[[nodiscard]] auto channel_allowed(std::string_view channel_name) const -> bool
	{
		return allowed_channels.empty() || std::ranges::find(allowed_channels, channel_name) != allowed_channels.end();
	}

	// Throws nlohmann::json exceptions on malformed input.
	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> game_config
	{
		game_config cfg;
		cfg.capacities = j.at("house_capacities").get<capacity_list>();
		cfg.relationships = j.at("relationships").get<relationship_table>();
		cfg.allowed_channels = j.value("allowed_channels", std::vector<std::string>{});
		cfg.guild_id = j.value("guild_id", std::uint64_t{0});
		cfg.seed_template = j.value("seed_template", std::vector<std::vector<std::string>>{});

		if (j.contains("trials")) {
			cfg.trials = j.at("trials").get<int>();
		}

		if (j.contains("strategies")) {
			cfg.strategies.clear();
			for (const auto &[name, weight] : j.at("strategies").items()) {
				auto kind = strategy_from_string(name);
				if (!kind) {
					throw std::invalid_argument("unknown strategy: " + name);
				}
				cfg.strategies.push_back({*kind, weight.get<double>()});
			}
		}

		if (j.contains("reset")) {
			const auto &r = j.at("reset");
			cfg.reset.weekday = r.value("weekday", 1);
			cfg.reset.hour = r.value("hour", 0);
		}

		if (j.contains("data_dir")) {
			cfg.data_dir = j.at("data_dir").get<std::string>();
		}

		return cfg;
	}
};

// `{house_capacities, relationships, people_to_select}` as read by the batch solver.
struct batch_input {
	capacity_list capacities;
	relationship_table relationships;
	std::vector<std::string> people;

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> batch_input
	{
		return {.capacities = j.at("house_capacities").get<capacity_list>(),
						.relationships = j.at("relationships").get<relationship_table>(),
						.people = j.at("people_to_select").get<std::vector<std::string>>()};
	}
};

} // namespace hearth
