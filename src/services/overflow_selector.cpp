#include "hearth/models/assignment.hpp"
#include "hearth/services/construction_strategies.hpp"
#include "hearth/services/overflow_selector.hpp"

#include <algorithm>
#include <numeric>

namespace hearth {

namespace {

// Splits `candidates` by a removal mask, preserving input order.
auto split(std::span<const entity_id> candidates, const std::vector<bool> &removed) -> overflow_selection
{
	overflow_selection out;
	for (std::size_t i = 0; i < candidates.size(); ++i) {
		(removed[i] ? out.dropped : out.kept).push_back(candidates[i]);
	}
	return out;
}

} // namespace

auto overflow_selector::combination_count(std::size_t n, std::size_t k, std::size_t limit) -> std::size_t
{
	if (k > n) {
		return 0;
	}
	k = std::min(k, n - k);

	std::size_t result = 1;
	for (std::size_t i = 1; i <= k; ++i) {
		// result * (n - k + i) / i stays integral at every step
		result = result * (n - k + i) / i;
		if (result > limit) {
			return limit + 1;
		}
	}
	return result;
}

auto overflow_selector::select(const relationship_graph &graph, std::span<const entity_id> candidates, std::span<const int> capacities,
															 const overflow_options &options, const scorer &rescore) -> overflow_selection
{
	const auto keep = static_cast<std::size_t>(std::max<std::int64_t>(0, total_capacity(capacities)));
	if (candidates.size() <= keep) {
		return {.kept = {candidates.begin(), candidates.end()}, .dropped = {}, .screened = false};
	}

	const auto excess = candidates.size() - keep;
	const bool small_excess = std::cmp_less_equal(excess, options.small_excess_threshold);

	if (small_excess && combination_count(candidates.size(), excess, options.max_screened_combinations) <= options.max_screened_combinations) {
		return by_combinations(graph, candidates, capacities, keep, options, rescore);
	}

	return by_priority(graph, candidates, keep);
}

auto overflow_selector::by_priority(const relationship_graph &graph, std::span<const entity_id> candidates, std::size_t keep) -> overflow_selection
{
	// degree + 0.5 * bonus, doubled to stay integral
	std::vector<int> priority(candidates.size());
	for (std::size_t i = 0; i < candidates.size(); ++i) {
		priority[i] = 2 * graph.degree_within(candidates[i], candidates) + graph.cluster_bonus(candidates[i], candidates);
	}

	std::vector<std::size_t> order(candidates.size());
	std::iota(order.begin(), order.end(), std::size_t{0});
	std::ranges::stable_sort(order, std::greater{}, [&](std::size_t i) { return priority[i]; });

	std::vector<bool> removed(candidates.size(), true);
	for (std::size_t r = 0; r < std::min(keep, order.size()); ++r) {
		removed[order[r]] = false;
	}

	return split(candidates, removed);
}

auto overflow_selector::by_combinations(const relationship_graph &graph, std::span<const entity_id> candidates, std::span<const int> capacities,
																				std::size_t keep, const overflow_options &options, const scorer &rescore) -> overflow_selection
{
	const auto n = candidates.size();
	const auto k = n - keep;

	struct screened {
		int quick_score;
		std::vector<std::size_t> removed;
	};
	std::vector<screened> pool;

	// Phase 1: quick screening of every removal combination, lexicographic by position.
	std::vector<std::size_t> combo(k);
	std::iota(combo.begin(), combo.end(), std::size_t{0});
	std::vector<entity_id> subset;
	subset.reserve(keep);

	while (true) {
		subset.clear();
		for (std::size_t i = 0, c = 0; i < n; ++i) {
			if (c < k && combo[c] == i) {
				++c;
				continue;
			}
			subset.push_back(candidates[i]);
		}

		auto quick = construction_strategies::cluster_seed(graph, subset, capacities);
		pool.push_back({.quick_score = quick.score(graph), .removed = combo});

		// next combination
		std::size_t pos = k;
		while (pos > 0 && combo[pos - 1] == n - k + pos - 1) {
			--pos;
		}
		if (pos == 0) {
			break;
		}
		++combo[pos - 1];
		for (std::size_t j = pos; j < k; ++j) {
			combo[j] = combo[j - 1] + 1;
		}
	}

	std::ranges::stable_sort(pool, std::greater{}, &screened::quick_score);
	pool.resize(std::min(pool.size(), std::max<std::size_t>(options.top_k, 1)));

	// Phase 2: full construction + refinement on the short list.
	int best_score = -1;
	std::vector<bool> best_removed;

	for (const auto &entry : pool) {
		std::vector<bool> removed(n, false);
		for (auto idx : entry.removed) {
			removed[idx] = true;
		}

		subset.clear();
		for (std::size_t i = 0; i < n; ++i) {
			if (!removed[i])
				subset.push_back(candidates[i]);
		}

		const int score = rescore ? rescore(subset) : entry.quick_score;
		if (score > best_score) {
			best_score = score;
			best_removed = std::move(removed);
		}
	}

	auto out = split(candidates, best_removed);
	out.screened = true;
	return out;
}

} // namespace hearth
