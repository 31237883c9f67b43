#pragma once

#include "hearth/core/utils.hpp"
#include "hearth/models/game_config.hpp"

#include <chrono>

namespace hearth {

// Weekly trigger for the roster bulk-clear; polled by a timer.
class reset_schedule {
public:
	reset_schedule(reset_slot slot, type::timestamp now) : slot_{slot}, next_{next_after(now, slot)} {}

	// First weekday/hour slot (UTC) strictly after `now`.
	[[nodiscard]] static auto next_after(type::timestamp now, reset_slot slot) -> type::timestamp;

	// True once per slot when `now` has reached it; then arms the following slot.
	[[nodiscard]] auto due(type::timestamp now) -> bool;

	[[nodiscard]] auto next() const noexcept -> type::timestamp { return next_; }

private:
	reset_slot slot_;
	type::timestamp next_;
};

} // namespace hearth
