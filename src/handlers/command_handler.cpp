#include "hearth/core/constants.hpp"
#include "hearth/handlers/command_handler.hpp"
#include "hearth/services/house_optimizer.hpp"
#include "hearth/ui/embed_builder.hpp"
#include "hearth/ui/message_builder.hpp"

#include <algorithm>
#include <chrono>
#include <format>

namespace hearth {

command_handler::command_handler(std::shared_ptr<const game_config> config, std::shared_ptr<const relationship_graph> graph,
																 std::shared_ptr<roster_service> rosters)
		: config_(std::move(config)), graph_(std::move(graph)), rosters_(std::move(rosters))
{
}

auto command_handler::on_slash(const dpp::slashcommand_t &ev) -> void
{
	auto name = ev.command.get_command_name();

	// Diagnostic for the allow-list itself, so it works in any channel.
	if (name == "channelinfo")
		return cmd_channelinfo(ev);

	if (!channel_allowed(ev)) {
		return ui::message_builder::reply_error(ev, constants::text::channel_not_allowed);
	}

	if (name == "hello")
		return cmd_hello(ev);
	if (name == "help")
		return cmd_help(ev);
	if (name == "ping")
		return cmd_ping(ev);
	if (name == "rela")
		return cmd_rela(ev);
	if (name == "add")
		return cmd_add(ev);
	if (name == "remove")
		return cmd_remove(ev);
	if (name == "clear")
		return cmd_clear(ev);
	if (name == "list" || name == "check")
		return cmd_list(ev);
	if (name == "gen")
		return cmd_gen(ev);

	return ui::message_builder::reply_error(ev, constants::text::unknown_command);
}

auto command_handler::commands(dpp::snowflake bot_id) -> std::vector<dpp::slashcommand>
{
	std::vector<dpp::slashcommand> cmds;

	cmds.emplace_back("help", "Hướng dẫn sử dụng bot", bot_id);

	cmds.emplace_back("ping", "Check bot latency", bot_id);

	cmds.emplace_back("hello", "Get a greeting from the bot", bot_id);

	cmds.emplace_back("channelinfo", "Get current channel information (Admin only)", bot_id).set_default_permissions(dpp::p_administrator);

	cmds.emplace_back("rela", "Assign characters to houses optimally", bot_id)
			.add_option(dpp::command_option(dpp::co_string, "characters", "Các character, cách nhau bởi dấu phẩy", true).set_auto_complete(true));

	cmds.emplace_back("add", "Thêm character vào danh sách cá nhân của bạn", bot_id)
			.add_option(dpp::command_option(dpp::co_string, "character", "Tên character muốn thêm", true).set_auto_complete(true));

	cmds.emplace_back("remove", "Xóa character khỏi danh sách cá nhân của bạn", bot_id)
			.add_option(dpp::command_option(dpp::co_string, "character", "Tên character muốn xóa", true).set_auto_complete(true));

	cmds.emplace_back("clear", "Xóa toàn bộ danh sách character cá nhân của bạn", bot_id);

	cmds.emplace_back("list", "Xem danh sách character cá nhân của bạn", bot_id);

	cmds.emplace_back("check", "Kiểm tra danh sách character cá nhân của bạn", bot_id);

	cmds.emplace_back("gen", "Tạo lệnh /rela từ danh sách character cá nhân của bạn", bot_id);

	return cmds;
}

auto command_handler::make_seed(std::span<const std::string> names) -> std::uint64_t
{
	std::uint64_t h = 1469598103934665603ull; // FNV offset
	for (const auto &n : names) {
		for (unsigned char c : util::to_lower(n)) {
			h ^= c;
			h *= 1099511628211ull;
		}
	}

	auto t = static_cast<std::uint64_t>(std::chrono::system_clock::now().time_since_epoch().count());
	// xorshift/murmur-ish mix
	t ^= t >> 33;
	t *= 0xff51afd7ed558ccdULL;
	t ^= t >> 33;
	t *= 0xc4ceb9fe1a85ec53ULL;
	t ^= t >> 33;
	return h ^ t;
}

auto command_handler::channel_allowed(const dpp::slashcommand_t &ev) const -> bool
{
	if (config_->allowed_channels.empty()) {
		return true;
	}
	return config_->channel_allowed(ev.command.get_channel().name);
}

auto command_handler::cmd_help(const dpp::slashcommand_t &ev) -> void
{
	auto embed = ui::embed_builder::build_help(config_->capacities);
	ev.reply(dpp::message().add_embed(embed));
}

auto command_handler::cmd_ping(const dpp::slashcommand_t &ev) -> void
{
	const auto latency = static_cast<int>(ev.owner->rest_ping * 1000.0);
	ev.reply(std::format("🏓 Pong! Latency: {}ms", latency));
}

auto command_handler::cmd_hello(const dpp::slashcommand_t &ev) -> void { ev.reply(ui::embed_builder::build_greeting(ev.command.usr.id)); }

auto command_handler::cmd_channelinfo(const dpp::slashcommand_t &ev) -> void
{
	if (!ev.command.get_resolved_permission(ev.command.usr.id).can(dpp::p_administrator)) {
		return ui::message_builder::reply_error(ev, constants::text::admin_only);
	}

	auto embed = ui::embed_builder::build_channel_info(ev.command.get_channel().name, channel_allowed(ev));
	ev.reply(dpp::message().add_embed(embed).set_flags(dpp::m_ephemeral));
}

auto command_handler::cmd_rela(const dpp::slashcommand_t &ev) -> void
{
	auto input = std::get<std::string>(ev.get_parameter("characters"));
	auto names = util::split_names(input);

	if (names.empty()) {
		return ui::message_builder::reply_error(ev, constants::text::no_characters);
	}

	const auto seed = make_seed(names);
	house_optimizer optimizer{config_->optimizer(seed)};

	auto res = optimizer.solve(*graph_, names);
	if (!res) {
		ev.owner->log(dpp::ll_error, std::format("/rela failed: {}", res.error().what()));
		return ui::message_builder::reply_error(ev, constants::text::solve_failed);
	}

	// Nothing matched: report the unknown names rather than an empty layout.
	if (res->unrecognized.size() == names.size()) {
		return ui::message_builder::reply_error(ev, ui::embed_builder::build_registry_hint(res->unrecognized, *graph_));
	}

	ev.owner->log(dpp::ll_debug, std::format("/rela seed={} trials={} early_stop={} strategy={} score={} unknown={} dropped={}", seed, res->trials_run,
																					 res->early_stopped, res->best_strategy ? to_string(*res->best_strategy) : "template", res->score,
																					 res->unrecognized.size(), res->dropped.size()));

	ev.reply(ui::embed_builder::build_result(*res));
}

auto command_handler::cmd_add(const dpp::slashcommand_t &ev) -> void
{
	auto name = std::get<std::string>(ev.get_parameter("character"));

	auto res = rosters_->add_name(util::id_to_u64(ev.command.usr.id), name, *graph_);
	if (!res) {
		if (res.error().kind == type::error_kind::storage) {
			ev.owner->log(dpp::ll_error, std::format("/add storage failure: {}", res.error().what()));
		}
		return ui::message_builder::reply_error(ev, res.error().what());
	}

	return ui::message_builder::reply_success(ev, *res);
}

auto command_handler::cmd_remove(const dpp::slashcommand_t &ev) -> void
{
	auto name = std::get<std::string>(ev.get_parameter("character"));

	auto res = rosters_->remove_name(util::id_to_u64(ev.command.usr.id), name);
	if (!res) {
		if (res.error().kind == type::error_kind::storage) {
			ev.owner->log(dpp::ll_error, std::format("/remove storage failure: {}", res.error().what()));
		}
		return ui::message_builder::reply_error(ev, res.error().what());
	}

	return ui::message_builder::reply_success(ev, *res);
}

auto command_handler::cmd_clear(const dpp::slashcommand_t &ev) -> void
{
	auto res = rosters_->clear(util::id_to_u64(ev.command.usr.id));
	if (!res) {
		if (res.error().kind == type::error_kind::storage) {
			ev.owner->log(dpp::ll_error, std::format("/clear storage failure: {}", res.error().what()));
		}
		return ui::message_builder::reply_error(ev, res.error().what());
	}

	return ui::message_builder::reply_success(ev, *res);
}

auto command_handler::cmd_list(const dpp::slashcommand_t &ev) -> void
{
	auto characters = rosters_->get_list(util::id_to_u64(ev.command.usr.id));
	if (!characters) {
		ev.owner->log(dpp::ll_error, std::format("/list storage failure: {}", characters.error().what()));
		return ui::message_builder::reply_error(ev, characters.error().what());
	}

	if (characters->empty()) {
		return ev.reply(std::format("{}Danh sách của bạn đang trống.", constants::text::list_prefix));
	}

	auto embed = ui::embed_builder::build_roster(*characters);
	return ev.reply(dpp::message().add_embed(embed));
}

auto command_handler::cmd_gen(const dpp::slashcommand_t &ev) -> void
{
	const auto uid = util::id_to_u64(ev.command.usr.id);

	auto characters = rosters_->get_list(uid);
	if (!characters) {
		ev.owner->log(dpp::ll_error, std::format("/gen storage failure: {}", characters.error().what()));
		return ui::message_builder::reply_error(ev, characters.error().what());
	}

	auto res = rosters_->rela_command(uid);
	if (!res) {
		return ui::message_builder::reply_error(ev, res.error().what());
	}

	dpp::message msg{std::format("**🎮 Copy lệnh này:**\n```{}```", *res)};
	msg.add_embed(ui::embed_builder::build_roster(*characters));
	return ev.reply(msg);
}

} // namespace hearth
