#include "hearth/services/roster_service.hpp"

#include <catch2/catch.hpp>

#include <fstream>
#include <random>

using namespace hearth;

namespace {

// Fresh directory under the system temp dir, removed on scope exit.
struct temp_dir {
	std::filesystem::path path;

	temp_dir()
	{
		std::random_device rd;
		path = std::filesystem::temp_directory_path() / ("hearth_roster_" + std::to_string(rd()) + std::to_string(rd()));
		std::filesystem::create_directories(path);
	}

	~temp_dir()
	{
		std::error_code ec;
		std::filesystem::remove_all(path, ec);
	}
};

auto registry() -> relationship_graph
{
	return relationship_graph::build({{"Han Wu", {"Weiqing", "Qubing"}}, {"Imperial", {"Jingke"}}});
}

constexpr std::uint64_t alice = 1001;
constexpr std::uint64_t bob = 2002;

} // namespace

TEST_CASE("adding names stores the registry spelling")
{
	temp_dir dir;
	roster_service rosters(dir.path);
	const auto graph = registry();

	auto added = rosters.add_name(alice, "  han wu ", graph);
	REQUIRE(added);
	CHECK(*added == "Đã thêm 'Han Wu' vào danh sách! (Tổng: 1)");
	CHECK(rosters.get_list(alice).value() == std::vector<std::string>{"Han Wu"});
	CHECK(std::filesystem::exists(dir.path / "user_1001.json"));

	auto again = rosters.add_name(alice, "HAN WU", graph);
	REQUIRE_FALSE(again);
	CHECK(again.error().what() == "Character 'Han Wu' đã có trong danh sách!");

	auto unknown = rosters.add_name(alice, "Nobody", graph);
	REQUIRE_FALSE(unknown);
	CHECK(unknown.error().kind == type::error_kind::unknown_entity);

	CHECK(rosters.get_list(bob).value().empty());
}

TEST_CASE("removing names")
{
	temp_dir dir;
	roster_service rosters(dir.path);
	const auto graph = registry();

	auto empty = rosters.remove_name(alice, "Han Wu");
	REQUIRE_FALSE(empty);
	CHECK(empty.error().what() == constants::text::list_empty);

	REQUIRE(rosters.add_name(alice, "Han Wu", graph));
	REQUIRE(rosters.add_name(alice, "Weiqing", graph));

	auto missing = rosters.remove_name(alice, "Imperial");
	REQUIRE_FALSE(missing);

	auto removed = rosters.remove_name(alice, "weiqing");
	REQUIRE(removed);
	CHECK(*removed == "Đã xóa 'Weiqing' khỏi danh sách! (Còn lại: 1)");
	CHECK(rosters.get_list(alice).value() == std::vector<std::string>{"Han Wu"});
}

TEST_CASE("clearing a list")
{
	temp_dir dir;
	roster_service rosters(dir.path);
	const auto graph = registry();

	auto nothing = rosters.clear(alice);
	REQUIRE_FALSE(nothing);
	CHECK(nothing.error().what() == constants::text::nothing_to_clear);

	REQUIRE(rosters.add_name(alice, "Imperial", graph));
	auto cleared = rosters.clear(alice);
	REQUIRE(cleared);
	CHECK(*cleared == constants::text::cleared);
	CHECK(rosters.get_list(alice).value().empty());
}

TEST_CASE("reset removes only stored lists")
{
	temp_dir dir;
	roster_service rosters(dir.path);
	const auto graph = registry();

	REQUIRE(rosters.add_name(alice, "Imperial", graph));
	REQUIRE(rosters.add_name(bob, "Jingke", graph));
	std::ofstream(dir.path / "notes.txt") << "keep me";

	CHECK(rosters.total_users() == 2);

	auto reset = rosters.reset_all();
	REQUIRE(reset);
	CHECK(*reset == 2);
	CHECK(rosters.total_users() == 0);
	CHECK(std::filesystem::exists(dir.path / "notes.txt"));

	auto again = rosters.reset_all();
	REQUIRE(again);
	CHECK(*again == 0);
}

TEST_CASE("rela command from the stored list")
{
	temp_dir dir;
	roster_service rosters(dir.path);
	const auto graph = registry();

	auto none = rosters.rela_command(alice);
	REQUIRE_FALSE(none);
	CHECK(none.error().what() == constants::text::list_empty_hint);

	REQUIRE(rosters.add_name(alice, "Han Wu", graph));
	REQUIRE(rosters.add_name(alice, "Qubing", graph));

	auto cmd = rosters.rela_command(alice);
	REQUIRE(cmd);
	CHECK(*cmd == "/rela characters: Han Wu, Qubing");
}

TEST_CASE("unreadable list files are reported, not overwritten")
{
	temp_dir dir;
	roster_service rosters(dir.path);
	const auto file = dir.path / "user_1001.json";
	std::ofstream(file) << "{ not json";

	auto list = rosters.get_list(alice);
	REQUIRE_FALSE(list);
	CHECK(list.error().kind == type::error_kind::storage);

	auto added = rosters.add_name(alice, "Imperial", registry());
	REQUIRE_FALSE(added);
	CHECK(added.error().kind == type::error_kind::storage);

	CHECK_FALSE(rosters.remove_name(alice, "Imperial"));
	CHECK_FALSE(rosters.rela_command(alice));

	std::string content;
	std::getline(std::ifstream(file), content);
	CHECK(content == "{ not json");

	// Clearing is the way out.
	REQUIRE(rosters.clear(alice));
	REQUIRE(rosters.add_name(alice, "Imperial", registry()));
	CHECK(rosters.get_list(alice).value() == std::vector<std::string>{"Imperial"});
}

TEST_CASE("roster json keeps the update time")
{
	roster r;
	r.characters = {"A", "B"};
	r.last_updated = type::timestamp{std::chrono::seconds{1'700'000'000}};

	auto back = roster::from_json(r.to_json());
	CHECK(back.characters == r.characters);
	CHECK(back.last_updated == r.last_updated);
	CHECK(back.find("b") != back.characters.end());
}
