#pragma once
#include <chrono>

// Deadline for a bounded serial read (confirm bytes). The read loop asks for
// the time left before each poll() and stops once the deadline passed.
class SW_Timer_C {

public:
	using clock_t = std::chrono::steady_clock;
	using dur_t = clock_t::duration;
	using timepoint_t = clock_t::time_point;

	// confirmation read budget if caller omits argument
	static constexpr auto DEFAULT = std::chrono::milliseconds{ 1000 };

	void start_timer(dur_t timer_dur = DEFAULT) {
		until = clock_t::now() + timer_dur;
		timer_started = true;
	}

	// ms left before expiry, clamped at 0 (0ms if not started)
	std::chrono::milliseconds remaining_ms() const {
		if (timer_started == false) {
			return std::chrono::milliseconds{ 0 };
		}
		const auto now = clock_t::now();
		if (now >= until) {
			return std::chrono::milliseconds{ 0 };
		}
		// round up so a sub-millisecond remainder still waits instead of polling with 0
		return std::chrono::ceil<std::chrono::milliseconds>(until - now);
	}

	bool check_timer_expired() const {
		return timer_started == true && clock_t::now() >= until;
	}

private:
	bool timer_started = false;
	timepoint_t until{};

};
