#include "hearth/services/construction_strategies.hpp"
#include "hearth/services/local_search_refiner.hpp"

#include <catch2/catch.hpp>

using namespace hearth;

namespace {

auto random_graph(int count, std::uint64_t seed) -> relationship_graph
{
	std::mt19937_64 rng{seed};
	std::bernoulli_distribution link(0.35);

	relationship_table table;
	for (int i = 0; i < count; ++i) {
		auto &row = table["p" + std::to_string(i)];
		for (int j = i + 1; j < count; ++j) {
			if (link(rng))
				row.push_back("p" + std::to_string(j));
		}
	}
	return relationship_graph::build(table);
}

// True when no single swap or move into spare room improves the score.
auto is_local_optimum(const relationship_graph &graph, const assignment &layout, std::span<const int> caps) -> bool
{
	const int base = layout.score(graph);

	for (std::size_t p = 0; p < layout.group_count(); ++p) {
		for (std::size_t i = 0; i < layout.groups[p].size(); ++i) {
			for (std::size_t q = 0; q < layout.group_count(); ++q) {
				if (p == q)
					continue;

				for (std::size_t j = 0; j < layout.groups[q].size(); ++j) {
					auto swapped = layout;
					std::swap(swapped.groups[p][i], swapped.groups[q][j]);
					if (swapped.score(graph) > base)
						return false;
				}

				if (std::cmp_less(layout.groups[q].size(), caps[q])) {
					auto moved = layout;
					moved.groups[q].push_back(moved.groups[p][i]);
					moved.groups[p].erase(moved.groups[p].begin() + static_cast<std::ptrdiff_t>(i));
					if (moved.score(graph) > base)
						return false;
				}
			}
		}
	}
	return true;
}

} // namespace

TEST_CASE("a swap that joins two pairs is found")
{
	const relationship_table table{{"A", {"B"}}, {"C", {"D"}}};
	auto graph = relationship_graph::build(table);
	const capacity_list caps{2, 2};

	assignment start(2);
	start.groups[0] = {*graph.find("A"), *graph.find("C")};
	start.groups[1] = {*graph.find("B"), *graph.find("D")};
	REQUIRE(start.score(graph) == 0);

	auto result = local_search_refiner::refine(graph, start, caps);
	CHECK(result.score == 2);
	CHECK(result.layout.score(graph) == 2);
	CHECK(result.passes == 1);
}

TEST_CASE("a move into spare capacity is found")
{
	auto graph = relationship_graph::build({{"A", {"B"}}});
	const capacity_list caps{2, 2};

	assignment start(2);
	start.groups[0] = {*graph.find("A")};
	start.groups[1] = {*graph.find("B")};

	auto result = local_search_refiner::refine(graph, start, caps);
	CHECK(result.score == 1);
	CHECK(result.layout.is_valid(caps, std::vector<entity_id>{0, 1}));
}

TEST_CASE("refinement never lowers the score and ends at a local optimum")
{
	const capacity_list caps{3, 3, 2};

	for (std::uint64_t seed = 1; seed <= 8; ++seed) {
		auto graph = random_graph(8, seed);
		std::vector<entity_id> ids(graph.size());
		for (std::size_t i = 0; i < ids.size(); ++i)
			ids[i] = static_cast<entity_id>(i);

		construction_strategies::rng_type rng{seed};
		auto start = construction_strategies::fill_first(ids, caps, rng);
		const int before = start.score(graph);

		auto result = local_search_refiner::refine(graph, start, caps);

		CAPTURE(seed);
		CHECK(result.score >= before);
		CHECK(result.score == result.layout.score(graph));
		CHECK(result.layout.is_valid(caps, ids));
		CHECK(result.layout.member_count() == ids.size());
		CHECK(is_local_optimum(graph, result.layout, caps));
	}
}

TEST_CASE("pass limit bounds the work")
{
	const relationship_table table{{"A", {"B"}}, {"C", {"D"}}};
	auto graph = relationship_graph::build(table);
	const capacity_list caps{2, 2};

	assignment start(2);
	start.groups[0] = {*graph.find("A"), *graph.find("C")};
	start.groups[1] = {*graph.find("B"), *graph.find("D")};

	auto result = local_search_refiner::refine(graph, start, caps, refine_options{.max_passes = 0});
	CHECK(result.score == 0);
	CHECK(result.passes == 0);
	CHECK(result.layout.groups == start.groups);
}
