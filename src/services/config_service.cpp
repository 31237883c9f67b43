#include "hearth/services/config_service.hpp"
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>

namespace hearth {

auto config_service::load() const -> std::expected<game_config, type::error>
{
	if (!std::filesystem::exists(config_path_)) {
		return std::unexpected(type::error{"Không tìm thấy file cấu hình: " + config_path_.string(), type::error_kind::storage});
	}

	try { // The try block is for nlohmann::json
		std::ifstream file(config_path_);
		nlohmann::json j;
		file >> j;

		auto cfg = game_config::from_json(j);
		if (auto ok = validate(cfg); !ok) {
			return std::unexpected(ok.error());
		}
		return cfg;
	} catch (const std::exception &e) {
		return std::unexpected(type::error{std::string("Không thể tải cấu hình: ") + e.what(), type::error_kind::storage});
	}
}

auto config_service::validate(const game_config &cfg) -> std::expected<type::ok_t, type::error>
{
	if (auto ok = validate_capacities(cfg.capacities); !ok) {
		return ok;
	}

	if (cfg.relationships.empty()) {
		return std::unexpected(type::error{"Cấu hình không có relationships", type::error_kind::storage});
	}

	if (cfg.reset.weekday < 0 || cfg.reset.weekday > 6 || cfg.reset.hour < 0 || cfg.reset.hour > 23) {
		return std::unexpected(type::error{"Lịch reset không hợp lệ (weekday 0-6, hour 0-23)", type::error_kind::storage});
	}

	if (std::ranges::any_of(cfg.strategies, [](const strategy_weight &w) { return w.weight < 0.0; })) {
		return std::unexpected(type::error{"Trọng số strategy phải >= 0", type::error_kind::storage});
	}

	if (cfg.trials && *cfg.trials < 1) {
		return std::unexpected(type::error{"trials phải lớn hơn 0", type::error_kind::storage});
	}

	return type::ok_t{};
}

auto config_service::load_token(const std::filesystem::path &token_path) -> std::expected<std::string, type::error>
{
	std::string token;
	if (std::ifstream(token_path) >> token) {
		return token;
	}

	if (const char *env = std::getenv("DISCORD_TOKEN"); env != nullptr && *env != '\0') {
		return std::string(env);
	}

	return std::unexpected(type::error{"Tải " + token_path.string() + " thất bại và DISCORD_TOKEN chưa được đặt", type::error_kind::storage});
}

auto config_service::load_batch(const std::filesystem::path &input_path) -> std::expected<batch_input, type::error>
{
	try { // The try block is for nlohmann::json
		std::ifstream file(input_path);
		if (!file) {
			return std::unexpected(type::error{"Không mở được file: " + input_path.string(), type::error_kind::storage});
		}

		nlohmann::json j;
		file >> j;
		return batch_input::from_json(j);
	} catch (const std::exception &e) {
		return std::unexpected(type::error{std::string("Lỗi khi xử lý file: ") + e.what(), type::error_kind::storage});
	}
}

} // namespace hearth
