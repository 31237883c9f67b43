#pragma once

#include "hearth/models/relationship_graph.hpp"
#include "hearth/services/roster_service.hpp"
#include <dpp/dpp.h>

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hearth {

class autocomplete_handler {
public:
	explicit autocomplete_handler(std::shared_ptr<const relationship_graph> graph, std::shared_ptr<roster_service> rosters);

	auto on_autocomplete(const dpp::autocomplete_t &ev) -> void;

	// Registry names containing `typed`, minus `exclude`; capped at the Discord limit.
	[[nodiscard]] static auto filter(std::span<const std::string> pool, std::string_view typed, std::span<const std::string> exclude = {})
			-> std::vector<std::string>;

	// "Han Wu, Imp" -> {"Han Wu, ", "Imp"}: the settled prefix and the token being typed.
	[[nodiscard]] static auto split_last_token(std::string_view input) -> std::pair<std::string, std::string>;

private:
	std::shared_ptr<const relationship_graph> graph_;
	std::shared_ptr<roster_service> rosters_;

	auto suggest_rela(const dpp::autocomplete_t &ev, std::string_view typed) -> std::vector<dpp::command_option_choice>;
	auto suggest_add(const dpp::autocomplete_t &ev, std::string_view typed) -> std::vector<dpp::command_option_choice>;
	auto suggest_remove(const dpp::autocomplete_t &ev, std::string_view typed) -> std::vector<dpp::command_option_choice>;
};

} // namespace hearth
