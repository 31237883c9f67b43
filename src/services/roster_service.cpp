#include "hearth/services/roster_service.hpp"
#include <nlohmann/json.hpp>

#include <fstream>
#include <system_error>

namespace hearth {

namespace {

auto quoted(std::string_view name) -> std::string { return "'" + std::string(name) + "'"; }

auto now_seconds() -> type::timestamp { return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now()); }

} // namespace

roster_service::roster_service(std::filesystem::path data_dir) : data_dir_(std::move(data_dir))
{
	std::error_code ec;
	std::filesystem::create_directories(data_dir_, ec); // a failure surfaces on the first save
}

auto roster_service::user_path(std::uint64_t user_id) const -> std::filesystem::path
{
	return data_dir_ / (std::string(constants::files::roster_prefix) + std::to_string(user_id) + std::string(constants::files::roster_suffix));
}

auto roster_service::is_roster_file(const std::filesystem::path &p) -> bool
{
	const auto name = p.filename().string();
	return name.starts_with(constants::files::roster_prefix) && name.ends_with(constants::files::roster_suffix);
}

auto roster_service::load(std::uint64_t user_id) const -> std::expected<roster, type::error>
{
	const auto path = user_path(user_id);
	if (!std::filesystem::exists(path)) {
		return roster{};
	}

	try { // The try block is for nlohmann::json
		std::ifstream file(path);
		nlohmann::json j;
		file >> j;
		return roster::from_json(j);
	} catch (const nlohmann::json::exception &e) {
		return std::unexpected(type::error{std::string(constants::text::list_unreadable) + " (" + path.filename().string() + ": " + e.what() + ")",
																			 type::error_kind::storage});
	}
}

auto roster_service::save(std::uint64_t user_id, const roster &r) const -> std::expected<type::ok_t, type::error>
{
	try { // The try block is for nlohmann::json
		std::ofstream file(user_path(user_id));
		if (!file) {
			return std::unexpected(type::error{constants::text::save_failed, type::error_kind::storage});
		}
		file << r.to_json().dump(2);
		return type::ok_t{};
	} catch (const std::exception &e) {
		return std::unexpected(type::error{std::string(constants::text::save_failed) + " " + e.what(), type::error_kind::storage});
	}
}

auto roster_service::get_list(std::uint64_t user_id) const -> std::expected<std::vector<std::string>, type::error>
{
	std::scoped_lock lock(mutex_);
	auto r = load(user_id);
	if (!r) {
		return std::unexpected(r.error());
	}
	return std::move(r->characters);
}

auto roster_service::add_name(std::uint64_t user_id, std::string_view name, const relationship_graph &registry) -> std::expected<std::string, type::error>
{
	auto canonical = registry.canonical(name);
	if (!canonical) {
		return std::unexpected(type::error{"Character " + hearth::quoted(util::trim(name)) + " không tồn tại!", type::error_kind::unknown_entity});
	}

	std::scoped_lock lock(mutex_);
	auto loaded = load(user_id);
	if (!loaded) {
		return std::unexpected(loaded.error());
	}
	auto &r = *loaded;

	if (r.find(*canonical) != r.characters.end()) {
		return std::unexpected(type::error{"Character " + hearth::quoted(*canonical) + " đã có trong danh sách!"});
	}

	r.characters.push_back(*canonical);
	r.last_updated = now_seconds();

	if (auto res = save(user_id, r); !res) {
		return std::unexpected(res.error());
	}

	return "Đã thêm " + hearth::quoted(*canonical) + " vào danh sách! (Tổng: " + std::to_string(r.size()) + ")";
}

auto roster_service::remove_name(std::uint64_t user_id, std::string_view name) -> std::expected<std::string, type::error>
{
	std::scoped_lock lock(mutex_);
	auto loaded = load(user_id);
	if (!loaded) {
		return std::unexpected(loaded.error());
	}
	auto &r = *loaded;

	if (r.empty()) {
		return std::unexpected(type::error{constants::text::list_empty});
	}

	auto it = r.find(util::trim(name));
	if (it == r.characters.end()) {
		return std::unexpected(type::error{"Character " + hearth::quoted(util::trim(name)) + " không có trong danh sách của bạn!"});
	}

	const auto removed = *it;
	r.characters.erase(it);
	r.last_updated = now_seconds();

	if (auto res = save(user_id, r); !res) {
		return std::unexpected(res.error());
	}

	return "Đã xóa " + hearth::quoted(removed) + " khỏi danh sách! (Còn lại: " + std::to_string(r.size()) + ")";
}

auto roster_service::clear(std::uint64_t user_id) -> std::expected<std::string, type::error>
{
	std::scoped_lock lock(mutex_);
	const auto path = user_path(user_id);

	if (!std::filesystem::exists(path)) {
		return std::unexpected(type::error{constants::text::nothing_to_clear});
	}

	std::error_code ec;
	if (!std::filesystem::remove(path, ec) || ec) {
		return std::unexpected(type::error{constants::text::delete_failed, type::error_kind::storage});
	}

	return std::string(constants::text::cleared);
}

auto roster_service::reset_all() -> std::expected<int, type::error>
{
	std::scoped_lock lock(mutex_);
	int removed = 0;

	std::error_code ec;
	std::filesystem::directory_iterator it(data_dir_, ec);
	if (ec) {
		return std::unexpected(type::error{"Không đọc được thư mục " + data_dir_.string() + ": " + ec.message(), type::error_kind::storage});
	}

	std::vector<std::filesystem::path> files;
	for (const auto &entry : it) {
		if (entry.is_regular_file() && is_roster_file(entry.path()))
			files.push_back(entry.path());
	}

	for (const auto &path : files) {
		if (!std::filesystem::remove(path, ec)) {
			return std::unexpected(type::error{"Không xóa được " + path.string() + ": " + ec.message(), type::error_kind::storage});
		}
		++removed;
	}

	return removed;
}

auto roster_service::total_users() const -> std::size_t
{
	std::scoped_lock lock(mutex_);
	std::error_code ec;
	std::size_t count = 0;

	for (const auto &entry : std::filesystem::directory_iterator(data_dir_, ec)) {
		if (entry.is_regular_file() && is_roster_file(entry.path()))
			++count;
	}
	return count;
}

auto roster_service::rela_command(std::uint64_t user_id) const -> std::expected<std::string, type::error>
{
	auto characters = get_list(user_id);
	if (!characters) {
		return std::unexpected(characters.error());
	}
	if (characters->empty()) {
		return std::unexpected(type::error{constants::text::list_empty_hint});
	}
	return "/rela characters: " + util::join(*characters, ", ");
}

} // namespace hearth
