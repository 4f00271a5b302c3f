/*
==============================================================================
	File: PeriodicTask.hpp
	Desc: Fixed-rate worker thread (replacement for a fixedRate timer object).
	- start() launches the worker; tick fn runs once per period.
	- stop() is synchronous: it wakes the worker, waits for the in-flight
	  tick to finish and joins. When stop() returns, no tick is running and
	  none will run until the next start().
	- stop() is safe to call when already stopped.

	NOTE: the tick fn must not call stop() on its own task (it would join itself);
	this case is detected and only flags the worker to exit.
==============================================================================
*/

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

class PeriodicTask_C {
public:
	using tick_fn_T = std::function<void()>;

	PeriodicTask_C(std::string name, std::chrono::milliseconds period, tick_fn_T tick);
	~PeriodicTask_C(); // RAII: stop + join

	// one worker per task: forbid copying and moving
	PeriodicTask_C(const PeriodicTask_C&) = delete;
	PeriodicTask_C& operator=(const PeriodicTask_C&) = delete;
	PeriodicTask_C(PeriodicTask_C&&) = delete;
	PeriodicTask_C& operator=(PeriodicTask_C&&) = delete;

	bool start(); // false if already running
	void stop();  // stop-and-join
	bool is_running() const { return running_.load(std::memory_order_acquire); }
	std::size_t get_tick_count() const { return tickCount_.load(std::memory_order_acquire); }
	std::chrono::milliseconds get_period() const { return period_; }

private:
	void run(); // worker body

	const std::string name_;
	const std::chrono::milliseconds period_;
	tick_fn_T tick_;

	std::atomic<bool> running_{false};
	std::atomic<std::size_t> tickCount_{0};

	// stop request + wakeup for the sleep between ticks
	std::mutex mtx_;
	std::condition_variable cv_;
	bool stopRequested_ = false;

	std::thread worker_;
};
