/*
==============================================================================
	File: AnalogStreamer.h
	Desc: Drains Flex I/O analog samples from the dedicated analog serial port
	while a session is live (2+ hardware, firmware >= 23).

	Record layout on the analog port (little-endian):
	  [uint16 trialNumber][uint16 value] x nAnalogInputChannels
	Only whole records are decoded; a partial tail waits for the next tick.
	A change of the analog-input count drops the partial tail (it was framed
	for the old record size).

	- Owns its own port, so command/confirm traffic on the main port is never
	  delayed by analog throughput.
	- Each tick reads only what is already buffered (never blocks past the tick).
	- Decoded samples get a monotonic index (StateStore g_n_analog_samples),
	  are appended to the session's sample buffer and handed to the sink.

	NOTE: the analog port is owned by the poller thread while running; the
	sample buffer is mutex protected for readers on other threads.
==============================================================================
*/

#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>
#include "IAnalogSink.h"
#include "../transport/ITransport.h"
#include "../device/HardwareConfig.h"
#include "../shared/StateStore.hpp"
#include "../utils/PeriodicTask.hpp"

class AnalogStreamingController_C {
public:
	// analogPort may be null: hardware without a dedicated analog port never streams
	AnalogStreamingController_C(ITransport_S* analogPort, StateStore_s& status,
	                            const HardwareConfigManager_C& hwConfig, IAnalogSink_S& sink,
	                            ms_T pollPeriod = ms_T{100});
	~AnalogStreamingController_C();

	AnalogStreamingController_C(const AnalogStreamingController_C&) = delete;
	AnalogStreamingController_C& operator=(const AnalogStreamingController_C&) = delete;

	bool is_supported() const { return analogPort_ != nullptr && analogPort_->is_open(); }
	// false if unsupported, the session is not live, or already running
	bool start();
	void stop(); // stop-and-join
	bool is_running() const { return poller_->is_running(); }

	// one poll tick; returns number of samples decoded (public for deterministic tests)
	std::size_t poll_once();

	std::size_t get_sample_count() const;
	std::vector<AnalogSample_S> snapshot_samples() const;
	void clear_samples(); // new session

	// bytes per record for a given number of analog input channels
	static std::size_t record_size(std::size_t nAnalogInputs) { return 2 + 2 * nAnalogInputs; }

private:
	ITransport_S* analogPort_;
	StateStore_s& status_;
	const HardwareConfigManager_C& hwConfig_;
	IAnalogSink_S& sink_;
	std::unique_ptr<PeriodicTask_C> poller_;

	std::mutex rx_mtx_;   // pending bytes (poll_once may be called from a test thread)
	bytes_T pending_;
	std::size_t pendingInputs_ = 0; // analog-input count pending_ was framed for

	mutable std::mutex samples_mtx_;
	std::vector<AnalogSample_S> samples_; // append-only for the session
};
