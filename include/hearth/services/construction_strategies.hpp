#pragma once

#include "hearth/models/assignment.hpp"
#include "hearth/models/relationship_graph.hpp"

#include <optional>
#include <random>
#include <span>
#include <string_view>

namespace hearth {

enum class strategy { fill_first, balanced, cluster_seed, greedy_gain };

[[nodiscard]] auto to_string(strategy s) -> std::string_view;
[[nodiscard]] auto strategy_from_string(std::string_view name) -> std::optional<strategy>;

/**
 * @class construction_strategies
 * @brief Procedures producing an initial full assignment of a candidate list.
 *
 * Every strategy respects capacities and places every candidate while room remains.
 * Randomized strategies draw only from the generator they are handed.
 */
class construction_strategies {
public:
	using rng_type = std::mt19937_64;

	[[nodiscard]] static auto build(strategy s, const relationship_graph &graph, std::span<const entity_id> candidates, std::span<const int> capacities,
																	rng_type &rng) -> assignment;

	// Shuffle, then pack group 0 full, then group 1, ...
	[[nodiscard]] static auto fill_first(std::span<const entity_id> candidates, std::span<const int> capacities, rng_type &rng) -> assignment;

	// Shuffle, then always place into the emptiest open group (random among ties).
	[[nodiscard]] static auto balanced(std::span<const entity_id> candidates, std::span<const int> capacities, rng_type &rng) -> assignment;

	// Deterministic: grow each group around the most connected remaining entity.
	[[nodiscard]] static auto cluster_seed(const relationship_graph &graph, std::span<const entity_id> candidates, std::span<const int> capacities) -> assignment;

	// Shuffle, then place each entity where it adds the most connections.
	[[nodiscard]] static auto greedy_gain(const relationship_graph &graph, std::span<const entity_id> candidates, std::span<const int> capacities,
																				rng_type &rng) -> assignment;

	// Greedy-gain placement of `pending`, in order, into a partially filled assignment.
	static auto complete_greedy(const relationship_graph &graph, assignment &partial, std::span<const entity_id> pending, std::span<const int> capacities)
			-> void;
};

} // namespace hearth
