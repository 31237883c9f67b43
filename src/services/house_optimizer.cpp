#include "hearth/services/house_optimizer.hpp"

#include <algorithm>
#include <cmath>

namespace hearth {

auto default_strategy_weights() -> std::vector<strategy_weight>
{
	return {{strategy::fill_first, 1.0}, {strategy::balanced, 1.0}, {strategy::cluster_seed, 1.0}, {strategy::greedy_gain, 1.0}};
}

auto house_optimizer::default_trials(std::size_t candidate_count) -> int
{
	if (candidate_count <= 8)
		return 150; // small sets converge fast
	if (candidate_count <= 12)
		return 300;
	return 500;
}

auto house_optimizer::early_stop_after(int trials, int cap, double fraction) -> int
{
	const auto scaled = static_cast<int>(std::floor(static_cast<double>(trials) * fraction));
	return std::max(1, std::min(cap, scaled));
}

auto house_optimizer::run_trials(const relationship_graph &graph, std::span<const entity_id> candidates, std::span<const int> capacities,
																 const trial_plan &plan, construction_strategies::rng_type &rng, const assignment *seed_layout) -> trial_outcome
{
	trial_outcome best{.layout = assignment(capacities.size())};

	std::vector<strategy_weight> mix(plan.strategies.begin(), plan.strategies.end());
	std::erase_if(mix, [](const strategy_weight &w) { return !(w.weight > 0.0); });
	if (mix.empty()) {
		mix = default_strategy_weights();
	}

	std::vector<double> weights;
	weights.reserve(mix.size());
	for (const auto &w : mix)
		weights.push_back(w.weight);
	std::discrete_distribution<std::size_t> pick(weights.begin(), weights.end());

	int stale = 0;
	for (int t = 0; t < plan.trials; ++t) {
		assignment start;
		std::optional<strategy> source;

		if (t == 0 && seed_layout != nullptr) {
			start = *seed_layout;
		}
		else {
			source = mix[pick(rng)].kind;
			start = construction_strategies::build(*source, graph, candidates, capacities, rng);
		}

		auto refined = local_search_refiner::refine(graph, std::move(start), capacities, plan.refine);
		++best.trials_run;

		if (refined.score > best.score) {
			best.layout = std::move(refined.layout);
			best.score = refined.score;
			best.source = source;
			stale = 0;
		}
		else if (++stale >= plan.early_stop_after) {
			best.early_stopped = true;
			break;
		}
	}

	return best;
}

auto house_optimizer::template_layout(const relationship_graph &graph, std::span<const entity_id> candidates) const -> std::optional<assignment>
{
	if (config_.seed_template.empty()) {
		return std::nullopt;
	}

	const auto &caps = config_.capacities;
	assignment layout(caps.size());
	std::size_t placed = 0;

	for (std::size_t h = 0; h < std::min(caps.size(), config_.seed_template.size()); ++h) {
		for (const auto &name : config_.seed_template[h]) {
			auto id = graph.find(name);
			if (!id || std::ranges::find(candidates, *id) == candidates.end() || layout.contains(*id)) {
				continue;
			}
			if (std::cmp_greater_equal(layout.groups[h].size(), caps[h])) {
				break;
			}
			layout.groups[h].push_back(*id);
			++placed;
		}
	}

	if (placed == 0) {
		return std::nullopt;
	}

	std::vector<entity_id> pending;
	for (auto id : candidates) {
		if (!layout.contains(id))
			pending.push_back(id);
	}
	construction_strategies::complete_greedy(graph, layout, pending, caps);
	return layout;
}

auto house_optimizer::solve(const relationship_graph &graph, std::span<const std::string> candidates) const -> std::expected<solve_result, type::error>
{
	if (auto ok = validate_capacities(config_.capacities); !ok) {
		return std::unexpected(ok.error());
	}

	const auto &caps = config_.capacities;
	solve_result result;
	result.houses.resize(caps.size());

	// Resolve against the registry; repeats collapse onto the first occurrence.
	std::vector<entity_id> pool;
	for (const auto &name : candidates) {
		if (auto id = graph.find(name)) {
			if (std::ranges::find(pool, *id) == pool.end())
				pool.push_back(*id);
		}
		else {
			result.unrecognized.push_back(name);
		}
	}

	if (pool.empty()) {
		return result;
	}

	construction_strategies::rng_type rng{config_.seed};

	if (std::cmp_greater(pool.size(), total_capacity(caps))) {
		const trial_plan rescore_plan{
				.trials = std::max(1, config_.overflow.rescore_trials),
				.early_stop_after = early_stop_after(config_.overflow.rescore_trials, config_.early_stop_cap, config_.early_stop_fraction),
				.strategies = config_.strategies,
				.refine = config_.refine,
		};

		auto rescore = [&](std::span<const entity_id> subset) { return run_trials(graph, subset, caps, rescore_plan, rng, nullptr).score; };

		auto selection = overflow_selector::select(graph, pool, caps, config_.overflow, rescore);
		pool = std::move(selection.kept);
		for (auto id : selection.dropped)
			result.dropped.push_back(graph.name(id));
	}

	const int trials = std::max(1, config_.trials.value_or(default_trials(pool.size())));
	const trial_plan plan{
			.trials = trials,
			.early_stop_after = early_stop_after(trials, config_.early_stop_cap, config_.early_stop_fraction),
			.strategies = config_.strategies,
			.refine = config_.refine,
	};

	auto seeded = template_layout(graph, pool);
	auto outcome = run_trials(graph, pool, caps, plan, rng, seeded ? &*seeded : nullptr);

	result.houses = outcome.layout.names(graph);
	result.score = std::max(0, outcome.score);
	result.trials_run = outcome.trials_run;
	result.early_stopped = outcome.early_stopped;
	result.best_strategy = outcome.source;
	return result;
}

auto solve_house_assignment(const relationship_table &relationships, std::span<const std::string> candidates, optimizer_config config)
		-> std::expected<solve_result, type::error>
{
	if (auto ok = validate_capacities(config.capacities); !ok) {
		return std::unexpected(ok.error());
	}

	const auto graph = relationship_graph::build(relationships);
	return house_optimizer{std::move(config)}.solve(graph, candidates);
}

} // namespace hearth
