#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hearth {

// Dense index into the graph registry.
using entity_id = int;

// Directed declarations as they appear in the configuration: person -> related people.
using relationship_table = std::map<std::string, std::vector<std::string>>;

/**
 * @class relationship_graph
 * @brief Undirected, loop-free connection graph over a case-insensitive name registry.
 *
 * Built once from a relationship table and read-only afterwards. Every declared edge
 * (a -> b) is stored in both directions; repeated declarations collapse into one edge.
 * The first spelling of a name met in table order is its canonical form.
 *
 * `adjacent` reads a dense size() x size() byte matrix, so memory grows with the square
 * of the registry (about 1 MB at 1000 names). Registries are hand-written game data,
 * well below that.
 */
class relationship_graph {
public:
	relationship_graph() = default;

	[[nodiscard]] static auto build(const relationship_table &relationships) -> relationship_graph;

	// Registry
	[[nodiscard]] auto find(std::string_view name) const -> std::optional<entity_id>;
	[[nodiscard]] auto canonical(std::string_view name) const -> std::optional<std::string>;
	[[nodiscard]] auto name(entity_id id) const -> const std::string & { return names_.at(static_cast<std::size_t>(id)); }
	[[nodiscard]] auto names() const -> std::vector<std::string>; // sorted, for listings and autocomplete
	[[nodiscard]] auto size() const noexcept -> std::size_t { return names_.size(); }
	[[nodiscard]] auto edge_count() const noexcept -> std::size_t { return edges_; }

	// Adjacency
	[[nodiscard]] auto adjacent(entity_id a, entity_id b) const noexcept -> bool
	{
		return matrix_[static_cast<std::size_t>(a) * names_.size() + static_cast<std::size_t>(b)] != 0;
	}
	[[nodiscard]] auto neighbors(entity_id id) const -> std::span<const entity_id> { return adjacency_.at(static_cast<std::size_t>(id)); }
	[[nodiscard]] auto neighbors(std::string_view name) const -> std::set<std::string>;

	// Pool queries; groups and pools never contain an id twice.
	[[nodiscard]] auto connections_within(std::span<const entity_id> group) const -> int;
	[[nodiscard]] auto degree_within(entity_id id, std::span<const entity_id> pool) const -> int;
	[[nodiscard]] auto cluster_bonus(entity_id id, std::span<const entity_id> pool) const -> int;

	// Name-based forms; unknown names contribute nothing.
	[[nodiscard]] auto connections_within(std::span<const std::string> group) const -> int;
	[[nodiscard]] auto degree_within(std::string_view name, std::span<const std::string> pool) const -> int;
	[[nodiscard]] auto cluster_bonus(std::string_view name, std::span<const std::string> pool) const -> int;

	// Resolves names to ids, dropping unknown ones and repeats.
	[[nodiscard]] auto resolve(std::span<const std::string> names) const -> std::vector<entity_id>;

private:
	std::vector<std::string> names_;
	std::unordered_map<std::string, entity_id> index_; // lower-cased name -> id
	std::vector<std::vector<entity_id>> adjacency_;
	std::vector<std::uint8_t> matrix_; // row-major size() x size()
	std::size_t edges_{0};

	auto intern(std::string_view name) -> entity_id;
};

} // namespace hearth
