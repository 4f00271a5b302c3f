/*
MODULE RELAY CONTROLLER
- two states: Idle, Relaying(slot). Only one module may relay at a time: the relay
  shares one poll timer and one status line on the state machine
- start(name): resolve slot -> claim relay -> {'J', slot, 1} -> start poller
- stop(): idempotent. stop-and-join poller, {'J', i, 0} for EVERY slot (converges
  even after an inconsistent prior state), drain stale bytes, clear all flags
- poller: every 100ms reads what is buffered and forwards it to the sink.
  It takes the protocol client's turn for each read, so it never overlaps a command.
*/

#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include "ProtocolClient.h"
#include "IRelaySink.h"
#include "../shared/StateStore.hpp"
#include "../utils/PeriodicTask.hpp"

class ModuleRelayController_C {
public:
	ModuleRelayController_C(ProtocolClient_C& client, StateStore_s& status, IRelaySink_S& sink,
	                        ms_T pollPeriod = ms_T{100});
	~ModuleRelayController_C();

	ModuleRelayController_C(const ModuleRelayController_C&) = delete;
	ModuleRelayController_C& operator=(const ModuleRelayController_C&) = delete;

	BpodError_E start(const std::string& moduleName);
	BpodError_E start_slot(std::size_t slot);
	void stop();

	bool is_relaying() const { return status_.active_relay_slot() >= 0; }
	bool is_polling() const { return poller_->is_running(); }
	std::size_t get_bytes_relayed() const { return bytesRelayed_.load(std::memory_order_acquire); }

	// one poll tick (the poller calls this; public for deterministic tests)
	void poll_once();

private:
	ProtocolClient_C& client_;
	StateStore_s& status_;
	IRelaySink_S& sink_;
	std::atomic<std::size_t> bytesRelayed_{0};
	std::unique_ptr<PeriodicTask_C> poller_;
	std::mutex ctl_mtx_; // serializes start()/stop()
};
