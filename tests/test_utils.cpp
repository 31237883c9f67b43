#include "hearth/core/utils.hpp"

#include <catch2/catch.hpp>

using namespace hearth;

TEST_CASE("split_names trims and skips empty tokens")
{
	auto names = util::split_names("Han Wu, Imperial ,, Weiqing ,");
	REQUIRE(names.size() == 3);
	CHECK(names[0] == "Han Wu");
	CHECK(names[1] == "Imperial");
	CHECK(names[2] == "Weiqing");

	CHECK(util::split_names("").empty());
	CHECK(util::split_names(" , ,").empty());
}

TEST_CASE("case-insensitive comparisons")
{
	CHECK(util::iequals("Han Wu", "han wu"));
	CHECK_FALSE(util::iequals("Han Wu", "Han"));
	CHECK(util::icontains("Zhuge Liang", "LIANG"));
	CHECK(util::icontains("anything", ""));
	CHECK(util::trim("  a b \t") == "a b");
	CHECK(util::join({"a", "b", "c"}, ", ") == "a, b, c");
	CHECK(util::join({}, ", ").empty());
}
