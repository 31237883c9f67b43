#pragma once

#include <cstddef>
#include <string_view>

namespace hearth::constants {

// UI Text
namespace text {
inline constexpr std::string_view unknown_command = "Lệnh không tồn tại";
inline constexpr std::string_view channel_not_allowed = "This command can only be used in specific channels.";
inline constexpr std::string_view admin_only = "This command is for administrators only.";
inline constexpr std::string_view greeting = "👋 Hello {}! Welcome to Dream & Lethe Bot!";
inline constexpr std::string_view no_characters = "Vui lòng nhập ít nhất một character.\nVí dụ: `/rela Han Wu, Imperial, Weiqing`";
inline constexpr std::string_view capacities_invalid = "Số phòng của mỗi nhà phải lớn hơn 0";
inline constexpr std::string_view internal_failure = "Có lỗi xảy ra khi xử lý lệnh!";
inline constexpr std::string_view solve_failed = "Có lỗi xảy ra khi xử lý phân bổ nhà!";
inline constexpr std::string_view save_failed = "Lỗi khi lưu dữ liệu!";
inline constexpr std::string_view list_unreadable = "Không đọc được danh sách đã lưu, hãy dùng `/clear` để tạo lại";
inline constexpr std::string_view delete_failed = "Lỗi khi xóa dữ liệu!";
inline constexpr std::string_view list_empty = "Danh sách của bạn đang trống!";
inline constexpr std::string_view list_empty_hint = "Danh sách của bạn đang trống! Hãy dùng `/add` để thêm characters.";
inline constexpr std::string_view nothing_to_clear = "Bạn chưa có dữ liệu nào để xóa!";
inline constexpr std::string_view cleared = "Đã xóa toàn bộ dữ liệu của bạn!";
inline constexpr std::string_view empty_house = "(trống)";
inline constexpr std::string_view result_title = "🏠 **Cách xếp mèo:**";

inline constexpr std::string_view ok_prefix = "✅ ";
inline constexpr std::string_view err_prefix = "❌ ";
inline constexpr std::string_view list_prefix = "📋 ";
} // namespace text

// File paths
namespace files {
inline constexpr std::string_view config_file = "game_config.json";
inline constexpr std::string_view token_file = ".bot_token";
inline constexpr std::string_view default_data_dir = "user_data";
inline constexpr std::string_view roster_prefix = "user_";
inline constexpr std::string_view roster_suffix = ".json";
} // namespace files

// Limits
namespace limits {
inline constexpr std::size_t max_autocomplete_choices = 25;
inline constexpr std::size_t registry_preview = 10;
} // namespace limits

// Optimizer defaults
namespace solver {
inline constexpr int small_excess_threshold = 4;
inline constexpr std::size_t overflow_top_k = 20;
inline constexpr int overflow_rescore_trials = 24;
inline constexpr std::size_t max_screened_combinations = 50'000;
inline constexpr int max_refine_passes = 50;
inline constexpr int early_stop_cap = 50;
inline constexpr double early_stop_fraction = 0.25;
} // namespace solver

} // namespace hearth::constants
