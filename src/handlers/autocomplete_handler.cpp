#include "hearth/core/constants.hpp"
#include "hearth/handlers/autocomplete_handler.hpp"
#include "hearth/ui/message_builder.hpp"

#include <algorithm>
#include <format>

namespace hearth {

namespace {

// Discord rejects choice names/values longer than this.
constexpr std::size_t max_choice_length = 100;

} // namespace

autocomplete_handler::autocomplete_handler(std::shared_ptr<const relationship_graph> graph, std::shared_ptr<roster_service> rosters)
		: graph_(std::move(graph)), rosters_(std::move(rosters))
{
}

auto autocomplete_handler::filter(std::span<const std::string> pool, std::string_view typed, std::span<const std::string> exclude)
		-> std::vector<std::string>
{
	std::vector<std::string> out;
	const auto needle = util::trim(typed);

	for (const auto &name : pool) {
		if (out.size() == constants::limits::max_autocomplete_choices) {
			break;
		}
		if (std::ranges::any_of(exclude, [&](const std::string &e) { return util::iequals(e, name); })) {
			continue;
		}
		if (needle.empty() || util::icontains(name, needle)) {
			out.push_back(name);
		}
	}
	return out;
}

auto autocomplete_handler::split_last_token(std::string_view input) -> std::pair<std::string, std::string>
{
	const auto comma = input.rfind(',');
	if (comma == std::string_view::npos) {
		return {std::string{}, std::string(util::trim(input))};
	}

	auto head = std::string(util::trim(input.substr(0, comma)));
	head += ", ";
	return {head, std::string(util::trim(input.substr(comma + 1)))};
}

auto autocomplete_handler::on_autocomplete(const dpp::autocomplete_t &ev) -> void
{
	std::string typed;
	for (const auto &opt : ev.options) {
		if (opt.focused && std::holds_alternative<std::string>(opt.value)) {
			typed = std::get<std::string>(opt.value);
			break;
		}
	}

	std::vector<dpp::command_option_choice> choices;
	if (ev.name == "rela") {
		choices = suggest_rela(ev, typed);
	}
	else if (ev.name == "add") {
		choices = suggest_add(ev, typed);
	}
	else if (ev.name == "remove") {
		choices = suggest_remove(ev, typed);
	}

	dpp::interaction_response response(dpp::ir_autocomplete_reply);
	for (auto &c : choices) {
		response.add_autocomplete_choice(c);
	}
	ev.owner->interaction_response_create(ev.command.id, ev.command.token, response);
}

auto autocomplete_handler::suggest_rela(const dpp::autocomplete_t &, std::string_view typed) -> std::vector<dpp::command_option_choice>
{
	auto [head, token] = split_last_token(typed);

	// Names already in the list are not offered again.
	auto already = util::split_names(head);
	auto names = filter(graph_->names(), token, already);

	std::vector<dpp::command_option_choice> out;
	for (const auto &n : names) {
		auto value = head + n;
		if (value.size() > max_choice_length) {
			continue;
		}
		out.emplace_back(value, value);
	}
	return out;
}

auto autocomplete_handler::suggest_add(const dpp::autocomplete_t &ev, std::string_view typed) -> std::vector<dpp::command_option_choice>
{
	auto stored = rosters_->get_list(util::id_to_u64(ev.command.usr.id));
	if (!stored) {
		ev.owner->log(dpp::ll_warning, std::format("autocomplete /add: {}", stored.error().what()));
		return {};
	}
	auto names = filter(graph_->names(), typed, *stored);

	std::vector<dpp::command_option_choice> out;
	for (const auto &n : names) {
		out.emplace_back(n, n);
	}
	return out;
}

auto autocomplete_handler::suggest_remove(const dpp::autocomplete_t &ev, std::string_view typed) -> std::vector<dpp::command_option_choice>
{
	auto stored = rosters_->get_list(util::id_to_u64(ev.command.usr.id));
	if (!stored) {
		ev.owner->log(dpp::ll_warning, std::format("autocomplete /remove: {}", stored.error().what()));
		return {};
	}
	auto names = filter(*stored, typed);

	std::vector<dpp::command_option_choice> out;
	for (const auto &n : names) {
		out.emplace_back(n, n);
	}
	return out;
}

} // namespace hearth
