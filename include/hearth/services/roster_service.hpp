#pragma once

#include "hearth/core/constants.hpp"
#include "hearth/core/utils.hpp"
#include "hearth/models/relationship_graph.hpp"
#include "hearth/models/roster.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace hearth {

/**
 * @class roster_service
 * @brief Per-user candidate lists, one JSON file per user.
 *
 * Mutating operations return the user-facing message: the value on success, the error
 * on failure. A list file that no longer parses is reported as a storage error and never
 * overwritten; `clear` removes it. Independent of the optimizer.
 */
class roster_service {
public:
	explicit roster_service(std::filesystem::path data_dir = std::string(constants::files::default_data_dir));

	// Fails with a storage error when the stored file cannot be parsed; the file is left untouched.
	[[nodiscard]] auto get_list(std::uint64_t user_id) const -> std::expected<std::vector<std::string>, type::error>;
	[[nodiscard]] auto add_name(std::uint64_t user_id, std::string_view name, const relationship_graph &registry) -> std::expected<std::string, type::error>;
	[[nodiscard]] auto remove_name(std::uint64_t user_id, std::string_view name) -> std::expected<std::string, type::error>;
	[[nodiscard]] auto clear(std::uint64_t user_id) -> std::expected<std::string, type::error>;

	// Weekly cleanup; returns how many lists were removed.
	[[nodiscard]] auto reset_all() -> std::expected<int, type::error>;
	[[nodiscard]] auto total_users() const -> std::size_t;

	// "/rela characters: a, b, c" for the stored list.
	[[nodiscard]] auto rela_command(std::uint64_t user_id) const -> std::expected<std::string, type::error>;

private:
	std::filesystem::path data_dir_;
	mutable std::mutex mutex_;

	[[nodiscard]] auto user_path(std::uint64_t user_id) const -> std::filesystem::path;
	[[nodiscard]] auto load(std::uint64_t user_id) const -> std::expected<roster, type::error>;
	[[nodiscard]] auto save(std::uint64_t user_id, const roster &r) const -> std::expected<type::ok_t, type::error>;
	[[nodiscard]] static auto is_roster_file(const std::filesystem::path &p) -> bool;
};

} // namespace hearth
