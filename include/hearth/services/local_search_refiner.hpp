#pragma once

#include "hearth/core/constants.hpp"
#include "hearth/models/assignment.hpp"
#include "hearth/models/relationship_graph.hpp"

#include <span>

namespace hearth {

struct refine_options {
	int max_passes{constants::solver::max_refine_passes};
};

struct refine_result {
	assignment layout;
	int score{};
	int passes{}; // passes that applied a move
};

/**
 * @class local_search_refiner
 * @brief Best-improvement hill climbing over swaps and single moves.
 *
 * Each pass scans every swap between two groups and every move into a group with spare
 * capacity, then applies only the single best strictly improving one. The returned score
 * is never below the score of the input assignment.
 */
class local_search_refiner {
public:
	[[nodiscard]] static auto refine(const relationship_graph &graph, assignment start, std::span<const int> capacities, refine_options options)
			-> refine_result;

	[[nodiscard]] static auto refine(const relationship_graph &graph, assignment start, std::span<const int> capacities) -> refine_result
	{
		return refine(graph, std::move(start), capacities, refine_options{});
	}

private:
	enum class move_kind { none, swap, move };

	struct candidate_move {
		move_kind kind{move_kind::none};
		std::size_t from{};
		std::size_t to{};
		std::size_t from_pos{};
		std::size_t to_pos{}; // swap only
		int gain{};
	};

	[[nodiscard]] static auto best_move(const relationship_graph &graph, const assignment &current, std::span<const int> capacities) -> candidate_move;
	static auto apply(assignment &current, const candidate_move &mv) -> void;
};

} // namespace hearth
