#pragma once

#include "hearth/core/utils.hpp"
#include "hearth/models/game_config.hpp"

#include <filesystem>
#include <string>

namespace hearth {

class config_service {
public:
	explicit config_service(std::filesystem::path config_path = std::string(constants::files::config_file)) : config_path_{std::move(config_path)} {}

	[[nodiscard]] auto load() const -> std::expected<game_config, type::error>;

	// Token from the token file, falling back to the DISCORD_TOKEN environment variable.
	[[nodiscard]] static auto load_token(const std::filesystem::path &token_path) -> std::expected<std::string, type::error>;

	[[nodiscard]] static auto load_batch(const std::filesystem::path &input_path) -> std::expected<batch_input, type::error>;

	// Structural checks beyond JSON shape.
	[[nodiscard]] static auto validate(const game_config &cfg) -> std::expected<type::ok_t, type::error>;

private:
	std::filesystem::path config_path_;
};

} // namespace hearth
