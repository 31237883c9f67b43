#pragma once

#include "hearth/core/utils.hpp"
#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace hearth {

// A user's stored candidate list.
class roster {
public:
	std::vector<std::string> characters;
	type::timestamp last_updated{};

	[[nodiscard]] auto to_json() const -> nlohmann::json
	{
		return {{"characters", characters}, {"last_updated", std::chrono::duration_cast<std::chrono::seconds>(last_updated.time_since_epoch()).count()}};
	}

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> roster
	{
		roster r;
		r.characters = j.value("characters", std::vector<std::string>{});
		if (auto it = j.find("last_updated"); it != j.end() && it->is_number_integer()) {
			r.last_updated = type::timestamp{std::chrono::seconds{it->get<std::int64_t>()}};
		}
		return r;
	}

	[[nodiscard]] auto find(std::string_view name) const -> std::vector<std::string>::const_iterator
	{
		return std::ranges::find_if(characters, [name](const std::string &c) { return util::iequals(c, name); });
	}

	[[nodiscard]] auto size() const -> std::size_t { return characters.size(); }

	[[nodiscard]] auto empty() const -> bool { return characters.empty(); }
};

} // namespace hearth
