#pragma once

#include "hearth/core/constants.hpp"
#include "hearth/core/utils.hpp"
#include "hearth/models/relationship_graph.hpp"

#include <algorithm>
#include <cstdint>
#include <numeric>
#include <span>
#include <vector>

namespace hearth {

using capacity_list = std::vector<int>;

// One group per capacity slot; members are registry ids.
class assignment {
public:
	std::vector<std::vector<entity_id>> groups;

	assignment() = default;
	explicit assignment(std::size_t group_count) : groups(group_count) {}

	[[nodiscard]] auto group_count() const noexcept -> std::size_t { return groups.size(); }

	[[nodiscard]] auto member_count() const -> std::size_t
	{
		std::size_t total = 0;
		for (const auto &g : groups)
			total += g.size();
		return total;
	}

	[[nodiscard]] auto contains(entity_id id) const -> bool
	{
		return std::ranges::any_of(groups, [id](const auto &g) { return std::ranges::find(g, id) != g.end(); });
	}

	// Always recomputed; never cached across mutations.
	[[nodiscard]] auto score(const relationship_graph &graph) const -> int
	{
		int total = 0;
		for (const auto &g : groups)
			total += graph.connections_within(g);
		return total;
	}

	[[nodiscard]] auto names(const relationship_graph &graph) const -> std::vector<std::vector<std::string>>
	{
		std::vector<std::vector<std::string>> out(groups.size());
		for (std::size_t i = 0; i < groups.size(); ++i) {
			for (auto id : groups[i])
				out[i].push_back(graph.name(id));
		}
		return out;
	}

	// Capacity, uniqueness and membership invariants.
	[[nodiscard]] auto is_valid(std::span<const int> capacities, std::span<const entity_id> candidates) const -> bool
	{
		if (groups.size() != capacities.size()) {
			return false;
		}

		std::vector<entity_id> seen;
		for (std::size_t i = 0; i < groups.size(); ++i) {
			if (std::cmp_greater(groups[i].size(), capacities[i])) {
				return false;
			}
			for (auto id : groups[i]) {
				if (std::ranges::find(candidates, id) == candidates.end() || std::ranges::find(seen, id) != seen.end()) {
					return false;
				}
				seen.push_back(id);
			}
		}
		return true;
	}
};

// Summed in 64 bits: any list of positive ints fits.
[[nodiscard]] inline auto total_capacity(std::span<const int> capacities) -> std::int64_t
{
	return std::accumulate(capacities.begin(), capacities.end(), std::int64_t{0});
}

[[nodiscard]] inline auto validate_capacities(std::span<const int> capacities) -> std::expected<type::ok_t, type::error>
{
	if (capacities.empty() || std::ranges::any_of(capacities, [](int c) { return c <= 0; })) {
		return std::unexpected(type::error{constants::text::capacities_invalid, type::error_kind::degenerate_capacities});
	}
	return type::ok_t{};
}

} // namespace hearth
