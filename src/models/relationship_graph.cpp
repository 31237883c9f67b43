#include "hearth/core/utils.hpp"
#include "hearth/models/relationship_graph.hpp"

#include <algorithm>
#include <utility>

namespace hearth {

auto relationship_graph::intern(std::string_view name) -> entity_id
{
	auto key = util::to_lower(name);
	if (auto it = index_.find(key); it != index_.end()) {
		return it->second;
	}

	auto id = util::narrow<entity_id>(names_.size());
	names_.emplace_back(name);
	index_.emplace(std::move(key), id);
	return id;
}

auto relationship_graph::build(const relationship_table &relationships) -> relationship_graph
{
	relationship_graph g;
	std::set<std::pair<entity_id, entity_id>> edges;

	for (const auto &[person, connections] : relationships) {
		if (util::trim(person).empty()) {
			continue;
		}
		const auto a = g.intern(person);

		for (const auto &conn : connections) {
			if (util::trim(conn).empty()) {
				continue;
			}
			const auto b = g.intern(conn);
			if (a == b) {
				continue; // no self loops
			}
			edges.emplace(std::min(a, b), std::max(a, b));
		}
	}

	const auto n = g.names_.size();
	g.adjacency_.assign(n, {});
	g.matrix_.assign(n * n, 0);

	for (const auto &[a, b] : edges) {
		g.adjacency_[static_cast<std::size_t>(a)].push_back(b);
		g.adjacency_[static_cast<std::size_t>(b)].push_back(a);
		g.matrix_[static_cast<std::size_t>(a) * n + static_cast<std::size_t>(b)] = 1;
		g.matrix_[static_cast<std::size_t>(b) * n + static_cast<std::size_t>(a)] = 1;
	}

	for (auto &adj : g.adjacency_) {
		std::ranges::sort(adj);
	}

	g.edges_ = edges.size();
	return g;
}

auto relationship_graph::find(std::string_view name) const -> std::optional<entity_id>
{
	auto it = index_.find(util::to_lower(util::trim(name)));
	if (it == index_.end()) {
		return std::nullopt;
	}
	return it->second;
}

auto relationship_graph::canonical(std::string_view name) const -> std::optional<std::string>
{
	if (auto id = find(name)) {
		return names_[static_cast<std::size_t>(*id)];
	}
	return std::nullopt;
}

auto relationship_graph::names() const -> std::vector<std::string>
{
	auto out = names_;
	std::ranges::sort(out);
	return out;
}

auto relationship_graph::neighbors(std::string_view name) const -> std::set<std::string>
{
	std::set<std::string> out;
	if (auto id = find(name)) {
		for (auto n : neighbors(*id)) {
			out.insert(names_[static_cast<std::size_t>(n)]);
		}
	}
	return out;
}

auto relationship_graph::connections_within(std::span<const entity_id> group) const -> int
{
	int count = 0;
	for (std::size_t i = 0; i < group.size(); ++i) {
		for (std::size_t j = i + 1; j < group.size(); ++j) {
			if (adjacent(group[i], group[j])) {
				++count;
			}
		}
	}
	return count;
}

auto relationship_graph::degree_within(entity_id id, std::span<const entity_id> pool) const -> int
{
	int count = 0;
	for (auto other : pool) {
		if (other != id && adjacent(id, other)) {
			++count;
		}
	}
	return count;
}

auto relationship_graph::cluster_bonus(entity_id id, std::span<const entity_id> pool) const -> int
{
	std::vector<entity_id> linked;
	for (auto other : pool) {
		if (other != id && adjacent(id, other)) {
			linked.push_back(other);
		}
	}
	return connections_within(linked);
}

auto relationship_graph::resolve(std::span<const std::string> names) const -> std::vector<entity_id>
{
	std::vector<entity_id> out;
	out.reserve(names.size());
	for (const auto &n : names) {
		auto id = find(n);
		if (id && std::ranges::find(out, *id) == out.end()) {
			out.push_back(*id);
		}
	}
	return out;
}

auto relationship_graph::connections_within(std::span<const std::string> group) const -> int
{
	auto ids = resolve(group);
	return connections_within(ids);
}

auto relationship_graph::degree_within(std::string_view name, std::span<const std::string> pool) const -> int
{
	auto id = find(name);
	if (!id) {
		return 0;
	}
	auto ids = resolve(pool);
	return degree_within(*id, ids);
}

auto relationship_graph::cluster_bonus(std::string_view name, std::span<const std::string> pool) const -> int
{
	auto id = find(name);
	if (!id) {
		return 0;
	}
	auto ids = resolve(pool);
	return cluster_bonus(*id, ids);
}

} // namespace hearth
