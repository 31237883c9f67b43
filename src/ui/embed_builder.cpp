#include "hearth/core/constants.hpp"
#include "hearth/ui/embed_builder.hpp"
#include "hearth/ui/message_builder.hpp"

#include <algorithm>
#include <format>

namespace hearth::ui {

auto embed_builder::build_help(std::span<const int> capacities) -> dpp::embed
{
	dpp::embed e;
	e.set_title("Hướng dẫn / Help");

	std::string houses;
	for (std::size_t i = 0; i < capacities.size(); ++i) {
		houses += std::format("{}Nhà {}: {} phòng", i == 0 ? "" : " · ", i + 1, capacities[i]);
	}

	e.add_field("Xếp nhà",
							"• `/rela <characters>` xếp các character (cách nhau bởi dấu phẩy) vào nhà sao cho tổng relationships lớn nhất\n"
							"• Nếu số character vượt quá số phòng, bot sẽ tự chọn nhóm có nhiều liên kết nhất",
							false);

	e.add_field("Danh sách cá nhân",
							"• `/add <character>` thêm character\n"
							"• `/remove <character>` xóa character\n"
							"• `/list` xem danh sách\n"
							"• `/gen` tạo sẵn lệnh `/rela` từ danh sách\n"
							"• `/clear` xóa toàn bộ danh sách (danh sách cũng được reset hàng tuần)",
							false);

	e.add_field("Sức chứa", houses.empty() ? std::string("-") : houses, false);

	return e;
}

auto embed_builder::build_roster(std::span<const std::string> characters) -> dpp::embed
{
	dpp::embed e;
	e.set_title(std::format("{}Danh sách characters của bạn", constants::text::list_prefix));

	e.set_description(std::format("**Tổng số:** {}\n\n{}", characters.size(), util::join(std::vector<std::string>(characters.begin(), characters.end()), ", ")));
	return e;
}

auto embed_builder::render_assignment(const solve_result &result) -> std::string
{
	std::string out;
	for (const auto &house : result.houses) {
		if (house.empty()) {
			out += std::format("{}\n", constants::text::empty_house);
			continue;
		}

		out += util::join(house, ", ") + "\n";
	}

	out += std::format("Tổng relationships = {}", result.score);
	return out;
}

auto embed_builder::build_result(const solve_result &result) -> dpp::message
{
	std::string content = std::format("{}\n```\n{}\n```", constants::text::result_title, render_assignment(result));

	if (!result.unrecognized.empty()) {
		content += std::format("\n{}Không tìm thấy: {}", constants::text::err_prefix, util::join(result.unrecognized, ", "));
	}

	if (!result.dropped.empty()) {
		content += std::format("\n⚠️ Vượt quá sức chứa, đã loại {} character: {}", result.dropped.size(), util::join(result.dropped, ", "));
	}

	return dpp::message{content};
}

auto embed_builder::build_greeting(const dpp::snowflake &user_id) -> std::string
{
	return std::format(constants::text::greeting, util::mention(user_id));
}

auto embed_builder::build_channel_info(std::string_view channel_name, bool allowed) -> dpp::embed
{
	dpp::embed e;
	e.set_title("Channel Information");
	e.set_color(0x00ff00);
	e.add_field("Channel Name", std::string(channel_name), false);
	e.add_field("Is Allowed", allowed ? "✅ Yes" : "❌ No", false);
	return e;
}

auto embed_builder::build_registry_hint(std::span<const std::string> unmatched, const relationship_graph &graph) -> std::string
{
	const auto all = graph.names();
	std::vector<std::string> preview(all.begin(), all.begin() + static_cast<std::ptrdiff_t>(std::min(all.size(), constants::limits::registry_preview)));

	return std::format("Invalid characters: {}\nValid characters: {}...", util::join(std::vector<std::string>(unmatched.begin(), unmatched.end()), ", "), util::join(preview, ", "));
}

} // namespace hearth::ui
