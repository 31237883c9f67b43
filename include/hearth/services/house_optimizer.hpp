#pragma once

#include "hearth/core/constants.hpp"
#include "hearth/core/utils.hpp"
#include "hearth/models/assignment.hpp"
#include "hearth/models/relationship_graph.hpp"
#include "hearth/services/construction_strategies.hpp"
#include "hearth/services/local_search_refiner.hpp"
#include "hearth/services/overflow_selector.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <vector>

namespace hearth {

struct strategy_weight {
	strategy kind{strategy::fill_first};
	double weight{1.0};
};

[[nodiscard]] auto default_strategy_weights() -> std::vector<strategy_weight>;

struct optimizer_config {
	capacity_list capacities;
	std::uint64_t seed{0};
	std::optional<int> trials; // unset = scaled to the candidate count
	int early_stop_cap{constants::solver::early_stop_cap};
	double early_stop_fraction{constants::solver::early_stop_fraction};
	std::vector<strategy_weight> strategies{default_strategy_weights()};
	std::vector<std::vector<std::string>> seed_template; // optional first-trial layout
	refine_options refine{};
	overflow_options overflow{};
};

struct solve_result {
	std::vector<std::vector<std::string>> houses;
	int score{};
	std::vector<std::string> unrecognized;
	std::vector<std::string> dropped; // trimmed by overflow selection
	int trials_run{};
	bool early_stopped{false};
	std::optional<strategy> best_strategy; // unset when the seed template won
};

/**
 * @class house_optimizer
 * @brief Multi-start driver: construction + refinement trials, best-so-far, early stop.
 *
 * A solve is a pure function of (capacities, graph, candidates, seed).
 */
class house_optimizer {
public:
	explicit house_optimizer(optimizer_config config) : config_(std::move(config)) {}

	[[nodiscard]] auto config() const -> const optimizer_config & { return config_; }

	[[nodiscard]] auto solve(const relationship_graph &graph, std::span<const std::string> candidates) const -> std::expected<solve_result, type::error>;

	[[nodiscard]] static auto default_trials(std::size_t candidate_count) -> int;
	[[nodiscard]] static auto early_stop_after(int trials, int cap, double fraction) -> int;

	struct trial_plan {
		int trials{};
		int early_stop_after{};
		std::span<const strategy_weight> strategies;
		refine_options refine{};
	};

	struct trial_outcome {
		assignment layout;
		int score{-1};
		std::optional<strategy> source;
		int trials_run{};
		bool early_stopped{false};
	};

	// Trials over a filtered candidate list that fits in total capacity.
	[[nodiscard]] static auto run_trials(const relationship_graph &graph, std::span<const entity_id> candidates, std::span<const int> capacities,
																			 const trial_plan &plan, construction_strategies::rng_type &rng, const assignment *seed_layout) -> trial_outcome;

private:
	optimizer_config config_;

	[[nodiscard]] auto template_layout(const relationship_graph &graph, std::span<const entity_id> candidates) const -> std::optional<assignment>;
};

// Builds the graph for this call only, then solves.
[[nodiscard]] auto solve_house_assignment(const relationship_table &relationships, std::span<const std::string> candidates, optimizer_config config)
		-> std::expected<solve_result, type::error>;

} // namespace hearth
