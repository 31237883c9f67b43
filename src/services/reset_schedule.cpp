#include "hearth/services/reset_schedule.hpp"

namespace hearth {

auto reset_schedule::next_after(type::timestamp now, reset_slot slot) -> type::timestamp
{
	using namespace std::chrono;

	const auto today = floor<days>(now);
	const weekday current{today};
	const weekday target{static_cast<unsigned>(slot.weekday)};

	auto candidate = time_point_cast<seconds>(today + days{(target - current).count()} + hours{slot.hour});
	if (candidate <= now) {
		candidate += weeks{1};
	}
	return candidate;
}

auto reset_schedule::due(type::timestamp now) -> bool
{
	if (now < next_) {
		return false;
	}

	next_ = next_after(now, slot_);
	return true;
}

} // namespace hearth
