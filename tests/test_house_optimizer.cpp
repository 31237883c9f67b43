#include "hearth/services/house_optimizer.hpp"

#include <catch2/catch.hpp>

#include <functional>
#include <limits>

using namespace hearth;

namespace {

auto config_for(capacity_list caps, std::uint64_t seed = 42) -> optimizer_config
{
	optimizer_config cfg;
	cfg.capacities = std::move(caps);
	cfg.seed = seed;
	return cfg;
}

// Exhaustive optimum: every entity either goes into a group with room or, when
// the pool exceeds total capacity, may be left out.
auto brute_force(const relationship_graph &graph, const std::vector<entity_id> &ids, const capacity_list &caps) -> int
{
	const auto cap_total = static_cast<std::size_t>(total_capacity(caps));
	const auto must_place = std::min(ids.size(), cap_total);

	assignment layout(caps.size());
	int best = 0;

	std::function<void(std::size_t)> place = [&](std::size_t i) {
		if (i == ids.size()) {
			if (layout.member_count() == must_place)
				best = std::max(best, layout.score(graph));
			return;
		}
		for (std::size_t h = 0; h < caps.size(); ++h) {
			if (std::cmp_less(layout.groups[h].size(), caps[h])) {
				layout.groups[h].push_back(ids[i]);
				place(i + 1);
				layout.groups[h].pop_back();
			}
		}
		if (ids.size() > cap_total)
			place(i + 1);
	};

	place(0);
	return best;
}

auto placed(const solve_result &r) -> std::size_t
{
	std::size_t n = 0;
	for (const auto &h : r.houses)
		n += h.size();
	return n;
}

} // namespace

TEST_CASE("path of four in pairs scores two")
{
	const relationship_table table{{"X", {"Y", "Z"}}, {"Y", {"X", "W"}}};
	const std::vector<std::string> people{"X", "Y", "Z", "W"};

	auto result = solve_house_assignment(table, people, config_for({2, 2, 2}));
	REQUIRE(result);
	CHECK(result->score == 2);
	CHECK(result->houses.size() == 3);
	CHECK(placed(*result) == 4);
	CHECK(result->unrecognized.empty());
	CHECK(result->dropped.empty());

	auto graph = relationship_graph::build(table);
	CHECK(brute_force(graph, graph.resolve(people), {2, 2, 2}) == 2);
}

TEST_CASE("two triangles end up whole")
{
	const relationship_table table{
			{"A", {"B", "C"}},
			{"B", {"C"}},
			{"D", {"E", "F"}},
			{"E", {"F"}},
			{"G", {"H"}},
			{"I", {}},
	};
	const std::vector<std::string> people{"A", "D", "G", "B", "E", "H", "C", "F", "I"};

	auto result = solve_house_assignment(table, people, config_for({3, 3, 3}));
	REQUIRE(result);
	CHECK(result->score >= 6);
	CHECK(result->score == 7);
	CHECK(placed(*result) == 9);

	auto graph = relationship_graph::build(table);
	int recomputed = 0;
	for (const auto &house : result->houses) {
		CHECK(house.size() <= 3);
		recomputed += graph.connections_within(house);
	}
	CHECK(recomputed == result->score);
}

TEST_CASE("unknown candidates are reported and skipped")
{
	const relationship_table table{{"A", {"B"}}};
	const std::vector<std::string> people{"A", "Ghost", "b"};

	auto result = solve_house_assignment(table, people, config_for({2, 2}));
	REQUIRE(result);
	CHECK(result->unrecognized == std::vector<std::string>{"Ghost"});
	CHECK(result->score == 1);
	CHECK(placed(*result) == 2);

	// Output uses the registry spelling.
	bool found = false;
	for (const auto &house : result->houses)
		found = found || std::ranges::find(house, "B") != house.end();
	CHECK(found);
}

TEST_CASE("no valid candidates gives empty houses")
{
	const relationship_table table{{"A", {"B"}}};

	auto result = solve_house_assignment(table, std::vector<std::string>{"nobody"}, config_for({2, 3, 1}));
	REQUIRE(result);
	CHECK(result->houses == std::vector<std::vector<std::string>>(3));
	CHECK(result->score == 0);
	CHECK(result->trials_run == 0);

	auto empty = solve_house_assignment(table, std::vector<std::string>{}, config_for({2}));
	REQUIRE(empty);
	CHECK(empty->houses.size() == 1);
	CHECK(empty->unrecognized.empty());
}

TEST_CASE("degenerate capacities are rejected")
{
	const relationship_table table{{"A", {"B"}}};
	const std::vector<std::string> people{"A", "B"};

	auto none = solve_house_assignment(table, people, config_for({}));
	REQUIRE_FALSE(none);
	CHECK(none.error().kind == type::error_kind::degenerate_capacities);

	auto zero = solve_house_assignment(table, people, config_for({2, 0}));
	REQUIRE_FALSE(zero);
	CHECK(zero.error().kind == type::error_kind::degenerate_capacities);
}

TEST_CASE("repeated candidates are placed once")
{
	const relationship_table table{{"A", {"B"}}};
	const std::vector<std::string> people{"A", "a", " A ", "B"};

	auto result = solve_house_assignment(table, people, config_for({3}));
	REQUIRE(result);
	CHECK(placed(*result) == 2);
	CHECK(result->score == 1);
	CHECK(result->unrecognized.empty());
}

TEST_CASE("same seed gives the same layout")
{
	const relationship_table table{
			{"A", {"B", "C", "E"}},
			{"B", {"D"}},
			{"C", {"F", "G"}},
			{"E", {"H"}},
			{"G", {"H", "A"}},
	};
	const std::vector<std::string> people{"A", "B", "C", "D", "E", "F", "G", "H"};

	auto first = solve_house_assignment(table, people, config_for({3, 3, 2}, 7));
	auto second = solve_house_assignment(table, people, config_for({3, 3, 2}, 7));
	REQUIRE(first);
	REQUIRE(second);
	CHECK(first->houses == second->houses);
	CHECK(first->score == second->score);
	CHECK(first->trials_run == second->trials_run);
}

TEST_CASE("small instances reach the exhaustive optimum")
{
	const capacity_list caps{3, 2, 2};

	for (std::uint64_t seed = 1; seed <= 5; ++seed) {
		std::mt19937_64 gen{seed * 31};
		std::bernoulli_distribution link(0.4);

		relationship_table table;
		std::vector<std::string> people;
		for (int i = 0; i < 7; ++i) {
			const auto name = "c" + std::to_string(i);
			people.push_back(name);
			auto &row = table[name];
			for (int j = i + 1; j < 7; ++j) {
				if (link(gen))
					row.push_back("c" + std::to_string(j));
			}
		}

		auto graph = relationship_graph::build(table);
		auto result = house_optimizer{config_for(caps, seed)}.solve(graph, people);
		REQUIRE(result);

		CAPTURE(seed);
		CHECK(result->score == brute_force(graph, graph.resolve(people), caps));
	}
}

TEST_CASE("overflow trims exactly the excess")
{
	const relationship_table table{
			{"A", {"B"}},
			{"C", {"D"}},
			{"E", {}},
	};
	const std::vector<std::string> people{"A", "B", "E", "C", "D"};

	auto result = solve_house_assignment(table, people, config_for({2, 2}));
	REQUIRE(result);
	CHECK(placed(*result) == 4);
	CHECK(result->dropped == std::vector<std::string>{"E"});
	CHECK(result->score == 2);
}

TEST_CASE("large overflow keeps total capacity")
{
	relationship_table table;
	std::vector<std::string> people;
	for (int i = 0; i < 12; ++i) {
		const auto name = "m" + std::to_string(i);
		people.push_back(name);
		table[name] = {"m" + std::to_string((i + 1) % 12)};
	}

	auto result = solve_house_assignment(table, people, config_for({2, 3}));
	REQUIRE(result);
	CHECK(placed(*result) == 5);
	CHECK(result->dropped.size() == 7);
}

TEST_CASE("a seed template is tried first")
{
	const relationship_table table{
			{"A", {"B", "C"}},
			{"B", {"C"}},
			{"D", {"E", "F"}},
			{"E", {"F"}},
	};
	const std::vector<std::string> people{"A", "B", "C", "D", "E", "F"};

	auto cfg = config_for({3, 3});
	cfg.trials = 1;
	cfg.seed_template = {{"D", "E", "F"}, {"A", "B", "C"}};

	auto result = solve_house_assignment(table, people, std::move(cfg));
	REQUIRE(result);
	CHECK(result->trials_run == 1);
	CHECK(result->score == 6);
	CHECK_FALSE(result->best_strategy);
	CHECK(result->houses == std::vector<std::vector<std::string>>{{"D", "E", "F"}, {"A", "B", "C"}});
}

TEST_CASE("a partial template is completed greedily")
{
	const relationship_table table{{"A", {"B"}}, {"C", {"D"}}};
	const std::vector<std::string> people{"A", "B", "C", "D"};

	auto cfg = config_for({2, 2});
	cfg.trials = 1;
	cfg.seed_template = {{"A", "unknown"}};

	auto result = solve_house_assignment(table, people, std::move(cfg));
	REQUIRE(result);
	CHECK(result->score == 2);
	CHECK(result->houses[0] == std::vector<std::string>{"A", "B"});
}

TEST_CASE("trials stop early once nothing improves")
{
	relationship_table table;
	std::vector<std::string> people;
	for (int i = 0; i < 6; ++i) {
		people.push_back("s" + std::to_string(i));
		table[people.back()] = {};
	}

	auto cfg = config_for({3, 3});
	cfg.trials = 200;

	auto result = solve_house_assignment(table, people, std::move(cfg));
	REQUIRE(result);
	CHECK(result->score == 0);
	CHECK(result->early_stopped);
	CHECK(result->trials_run == 1 + house_optimizer::early_stop_after(200, 50, 0.25));
	CHECK(placed(*result) == 6);
}

TEST_CASE("trial budget scales with the candidate count")
{
	CHECK(house_optimizer::default_trials(1) == 150);
	CHECK(house_optimizer::default_trials(8) == 150);
	CHECK(house_optimizer::default_trials(12) == 300);
	CHECK(house_optimizer::default_trials(13) == 500);

	CHECK(house_optimizer::early_stop_after(150, 50, 0.25) == 37);
	CHECK(house_optimizer::early_stop_after(500, 50, 0.25) == 50);
	CHECK(house_optimizer::early_stop_after(2, 50, 0.25) == 1);
}

TEST_CASE("a single strategy mix is honoured")
{
	const relationship_table table{{"A", {"B"}}, {"C", {"D"}}};
	const std::vector<std::string> people{"A", "B", "C", "D"};

	auto cfg = config_for({2, 2});
	cfg.strategies = {{strategy::cluster_seed, 1.0}, {strategy::fill_first, 0.0}};

	auto result = solve_house_assignment(table, people, std::move(cfg));
	REQUIRE(result);
	CHECK(result->best_strategy == strategy::cluster_seed);
	CHECK(result->score == 2);
}

TEST_CASE("huge capacities keep every candidate")
{
	constexpr int huge = std::numeric_limits<int>::max();
	const relationship_table table{{"A", {"B"}}, {"C", {"D"}}, {"E", {}}};
	const std::vector<std::string> people{"A", "B", "C", "D", "E"};

	CHECK(total_capacity(capacity_list{huge, huge}) == 2 * static_cast<std::int64_t>(huge));

	auto result = solve_house_assignment(table, people, config_for({huge, huge}));
	REQUIRE(result);
	CHECK(result->dropped.empty());
	CHECK(placed(*result) == 5);
	CHECK(result->score == 2);
}
