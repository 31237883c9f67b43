#include "hearth/services/reset_schedule.hpp"

#include <catch2/catch.hpp>

using namespace hearth;
using namespace std::chrono;

namespace {

// 2024-01-01 was a Monday.
auto at(year_month_day day, int hour, int minute = 0) -> type::timestamp
{
	return time_point_cast<seconds>(sys_days{day} + hours{hour} + minutes{minute});
}

} // namespace

TEST_CASE("next slot is strictly in the future")
{
	const reset_slot monday_midnight{.weekday = 1, .hour = 0};

	CHECK(reset_schedule::next_after(at(2023y / December / 31, 12), monday_midnight) == at(2024y / January / 1, 0));
	CHECK(reset_schedule::next_after(at(2024y / January / 1, 0), monday_midnight) == at(2024y / January / 8, 0));
	CHECK(reset_schedule::next_after(at(2024y / January / 1, 0, 1), monday_midnight) == at(2024y / January / 8, 0));
	CHECK(reset_schedule::next_after(at(2024y / January / 3, 9), monday_midnight) == at(2024y / January / 8, 0));
}

TEST_CASE("later the same day")
{
	const reset_slot wednesday_evening{.weekday = 3, .hour = 20};

	CHECK(reset_schedule::next_after(at(2024y / January / 3, 8), wednesday_evening) == at(2024y / January / 3, 20));
	CHECK(reset_schedule::next_after(at(2024y / January / 3, 21), wednesday_evening) == at(2024y / January / 10, 20));

	const reset_slot sunday{.weekday = 0, .hour = 5};
	CHECK(reset_schedule::next_after(at(2024y / January / 1, 0), sunday) == at(2024y / January / 7, 5));
}

TEST_CASE("due fires once per slot")
{
	reset_schedule schedule({.weekday = 1, .hour = 0}, at(2024y / January / 5, 10));
	CHECK(schedule.next() == at(2024y / January / 8, 0));

	CHECK_FALSE(schedule.due(at(2024y / January / 7, 23, 59)));
	CHECK(schedule.due(at(2024y / January / 8, 0)));
	CHECK(schedule.next() == at(2024y / January / 15, 0));
	CHECK_FALSE(schedule.due(at(2024y / January / 8, 0, 1)));

	// A missed slot fires on the next poll.
	CHECK(schedule.due(at(2024y / January / 20, 3)));
	CHECK(schedule.next() == at(2024y / January / 22, 0));
}
