#include "hearth/services/local_search_refiner.hpp"

#include <utility>

namespace hearth {

auto local_search_refiner::refine(const relationship_graph &graph, assignment start, std::span<const int> capacities, refine_options options)
		-> refine_result
{
	refine_result out{.layout = std::move(start), .score = 0, .passes = 0};
	out.score = out.layout.score(graph);

	while (out.passes < options.max_passes) {
		auto mv = best_move(graph, out.layout, capacities);
		if (mv.kind == move_kind::none) {
			break;
		}

		apply(out.layout, mv);
		out.score += mv.gain;
		++out.passes;
	}

	return out;
}

auto local_search_refiner::best_move(const relationship_graph &graph, const assignment &current, std::span<const int> capacities) -> candidate_move
{
	const auto houses = current.groups.size();

	// links[h][p][k]: edges from member p of group h into group k (self excluded).
	std::vector<std::vector<std::vector<int>>> links(houses);
	for (std::size_t h = 0; h < houses; ++h) {
		links[h].resize(current.groups[h].size());
		for (std::size_t p = 0; p < current.groups[h].size(); ++p) {
			auto &row = links[h][p];
			row.resize(houses);
			for (std::size_t k = 0; k < houses; ++k) {
				row[k] = graph.degree_within(current.groups[h][p], current.groups[k]);
			}
		}
	}

	candidate_move best{};

	// Swaps keep both group sizes, so capacity always holds.
	for (std::size_t i = 0; i < houses; ++i) {
		for (std::size_t j = i + 1; j < houses; ++j) {
			for (std::size_t p = 0; p < current.groups[i].size(); ++p) {
				for (std::size_t q = 0; q < current.groups[j].size(); ++q) {
					const auto a = current.groups[i][p];
					const auto b = current.groups[j][q];
					const int shared = graph.adjacent(a, b) ? 1 : 0;

					const int gain = (links[i][p][j] - shared - links[i][p][i]) + (links[j][q][i] - shared - links[j][q][j]);
					if (gain > best.gain) {
						best = {.kind = move_kind::swap, .from = i, .to = j, .from_pos = p, .to_pos = q, .gain = gain};
					}
				}
			}
		}
	}

	for (std::size_t i = 0; i < houses; ++i) {
		for (std::size_t j = 0; j < houses; ++j) {
			if (i == j || std::cmp_greater_equal(current.groups[j].size(), capacities[j])) {
				continue;
			}
			for (std::size_t p = 0; p < current.groups[i].size(); ++p) {
				const int gain = links[i][p][j] - links[i][p][i];
				if (gain > best.gain) {
					best = {.kind = move_kind::move, .from = i, .to = j, .from_pos = p, .to_pos = 0, .gain = gain};
				}
			}
		}
	}

	return best;
}

auto local_search_refiner::apply(assignment &current, const candidate_move &mv) -> void
{
	auto &from = current.groups[mv.from];
	auto &to = current.groups[mv.to];

	if (mv.kind == move_kind::swap) {
		std::swap(from[mv.from_pos], to[mv.to_pos]);
		return;
	}

	to.push_back(from[mv.from_pos]);
	from.erase(from.begin() + static_cast<std::ptrdiff_t>(mv.from_pos));
}

} // namespace hearth
