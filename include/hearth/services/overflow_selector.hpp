#pragma once

#include "hearth/core/constants.hpp"
#include "hearth/models/relationship_graph.hpp"

#include <functional>
#include <span>
#include <vector>

namespace hearth {

struct overflow_options {
	int small_excess_threshold{constants::solver::small_excess_threshold};
	std::size_t top_k{constants::solver::overflow_top_k};
	int rescore_trials{constants::solver::overflow_rescore_trials};
	std::size_t max_screened_combinations{constants::solver::max_screened_combinations};
};

struct overflow_selection {
	std::vector<entity_id> kept;		// input order
	std::vector<entity_id> dropped; // input order
	bool screened{false};						// true when chosen by combination screening
};

/**
 * @class overflow_selector
 * @brief Trims a candidate list that exceeds total capacity.
 *
 * Small excess: every removal combination is quick-scored with cluster seeding, the best
 * `top_k` are re-scored by the supplied full scorer and the best of those wins.
 * Large excess (or too many combinations): keep the entities with the highest
 * degree + 0.5 * cluster bonus, ties by input order.
 */
class overflow_selector {
public:
	// Full construction + refinement score of a subset.
	using scorer = std::function<int(std::span<const entity_id>)>;

	[[nodiscard]] static auto select(const relationship_graph &graph, std::span<const entity_id> candidates, std::span<const int> capacities,
																	 const overflow_options &options, const scorer &rescore) -> overflow_selection;

	[[nodiscard]] static auto by_priority(const relationship_graph &graph, std::span<const entity_id> candidates, std::size_t keep) -> overflow_selection;

	[[nodiscard]] static auto by_combinations(const relationship_graph &graph, std::span<const entity_id> candidates, std::span<const int> capacities,
																						std::size_t keep, const overflow_options &options, const scorer &rescore) -> overflow_selection;

	// n choose k, saturating at `limit` + 1.
	[[nodiscard]] static auto combination_count(std::size_t n, std::size_t k, std::size_t limit) -> std::size_t;
};

} // namespace hearth
