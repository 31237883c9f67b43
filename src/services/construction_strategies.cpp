#include "hearth/services/construction_strategies.hpp"

#include <algorithm>
#include <array>

namespace hearth {

namespace {

constexpr std::array strategy_names{
		std::pair{strategy::fill_first, std::string_view{"fill_first"}},
		std::pair{strategy::balanced, std::string_view{"balanced"}},
		std::pair{strategy::cluster_seed, std::string_view{"cluster_seed"}},
		std::pair{strategy::greedy_gain, std::string_view{"greedy_gain"}},
};

auto has_room(const assignment &a, std::span<const int> capacities, std::size_t house) -> bool
{
	return std::cmp_less(a.groups[house].size(), capacities[house]);
}

} // namespace

auto to_string(strategy s) -> std::string_view
{
	for (const auto &[value, name] : strategy_names) {
		if (value == s)
			return name;
	}
	return "unknown";
}

auto strategy_from_string(std::string_view name) -> std::optional<strategy>
{
	for (const auto &[value, text] : strategy_names) {
		if (util::iequals(text, name))
			return value;
	}
	return std::nullopt;
}

auto construction_strategies::build(strategy s, const relationship_graph &graph, std::span<const entity_id> candidates, std::span<const int> capacities,
																		rng_type &rng) -> assignment
{
	switch (s) {
	case strategy::fill_first:
		return fill_first(candidates, capacities, rng);
	case strategy::balanced:
		return balanced(candidates, capacities, rng);
	case strategy::cluster_seed:
		return cluster_seed(graph, candidates, capacities);
	case strategy::greedy_gain:
		return greedy_gain(graph, candidates, capacities, rng);
	}
	return fill_first(candidates, capacities, rng);
}

auto construction_strategies::fill_first(std::span<const entity_id> candidates, std::span<const int> capacities, rng_type &rng) -> assignment
{
	assignment out(capacities.size());
	std::vector<entity_id> order(candidates.begin(), candidates.end());
	std::ranges::shuffle(order, rng);

	std::size_t house = 0;
	for (auto id : order) {
		while (house < capacities.size() && !has_room(out, capacities, house)) {
			++house;
		}
		if (house == capacities.size()) {
			break; // every group is full
		}
		out.groups[house].push_back(id);
	}

	return out;
}

auto construction_strategies::balanced(std::span<const entity_id> candidates, std::span<const int> capacities, rng_type &rng) -> assignment
{
	assignment out(capacities.size());
	std::vector<entity_id> order(candidates.begin(), candidates.end());
	std::ranges::shuffle(order, rng);

	std::vector<std::size_t> tied;
	for (auto id : order) {
		tied.clear();
		std::size_t fewest = 0;

		for (std::size_t h = 0; h < capacities.size(); ++h) {
			if (!has_room(out, capacities, h)) {
				continue;
			}
			const auto count = out.groups[h].size();
			if (tied.empty() || count < fewest) {
				tied.assign(1, h);
				fewest = count;
			}
			else if (count == fewest) {
				tied.push_back(h);
			}
		}

		if (tied.empty()) {
			break;
		}

		std::uniform_int_distribution<std::size_t> pick(0, tied.size() - 1);
		out.groups[tied[pick(rng)]].push_back(id);
	}

	return out;
}

auto construction_strategies::cluster_seed(const relationship_graph &graph, std::span<const entity_id> candidates, std::span<const int> capacities)
		-> assignment
{
	assignment out(capacities.size());
	std::vector<entity_id> remaining(candidates.begin(), candidates.end());

	// Index of the remaining entity with the most edges into the remaining pool (first on ties).
	auto densest = [&]() -> std::size_t {
		std::size_t best = 0;
		int best_degree = -1;
		for (std::size_t i = 0; i < remaining.size(); ++i) {
			const int degree = graph.degree_within(remaining[i], remaining);
			if (degree > best_degree) {
				best_degree = degree;
				best = i;
			}
		}
		return best;
	};

	for (std::size_t house = 0; house < capacities.size(); ++house) {
		auto &group = out.groups[house];

		while (has_room(out, capacities, house) && !remaining.empty()) {
			std::size_t chosen = 0;
			int best_links = 0;

			for (std::size_t i = 0; i < remaining.size(); ++i) {
				const int links = graph.degree_within(remaining[i], group);
				if (links > best_links) {
					best_links = links;
					chosen = i;
				}
			}

			// Nothing links into this group (or it is empty): open a new cluster.
			if (best_links == 0) {
				chosen = densest();
			}

			group.push_back(remaining[chosen]);
			remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(chosen));
		}
	}

	return out;
}

auto construction_strategies::greedy_gain(const relationship_graph &graph, std::span<const entity_id> candidates, std::span<const int> capacities,
																					rng_type &rng) -> assignment
{
	assignment out(capacities.size());
	std::vector<entity_id> order(candidates.begin(), candidates.end());
	std::ranges::shuffle(order, rng);

	complete_greedy(graph, out, order, capacities);
	return out;
}

auto construction_strategies::complete_greedy(const relationship_graph &graph, assignment &partial, std::span<const entity_id> pending,
																							std::span<const int> capacities) -> void
{
	for (auto id : pending) {
		std::optional<std::size_t> best_house;
		int best_gain = 0;

		// Adding `id` to a group raises connections_within by its links into that group.
		for (std::size_t h = 0; h < capacities.size(); ++h) {
			if (!has_room(partial, capacities, h)) {
				continue;
			}
			const int gain = graph.degree_within(id, partial.groups[h]);
			if (gain > best_gain) {
				best_gain = gain;
				best_house = h;
			}
		}

		if (!best_house) {
			int most_space = 0;
			for (std::size_t h = 0; h < capacities.size(); ++h) {
				const int space = capacities[h] - util::narrow<int>(partial.groups[h].size());
				if (space > most_space) {
					most_space = space;
					best_house = h;
				}
			}
		}

		if (!best_house) {
			return; // no room left anywhere
		}

		partial.groups[*best_house].push_back(id);
	}
}

} // namespace hearth
