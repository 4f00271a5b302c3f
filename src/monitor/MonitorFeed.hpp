/*
MONITOR FEED
- the console side of the relay and analog streams (what the console's serial
  terminal and analog viewer would consume)
- relay pollers PUSH module bytes here; the monitor server PULLS them on GET /relay
- analog batches are only counted + the latest sample kept (session storage is external)
- written from poller threads, read from the HTTP thread: everything is mutex guarded
*/
#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include "../device/IRelaySink.h"
#include "../acq/IAnalogSink.h"

struct RelayChunk_S {
    std::size_t slot = 0;
    std::string moduleName;
    bytes_T bytes;
}; // RelayChunk_S

class MonitorFeed_C : public IRelaySink_S, public IAnalogSink_S {
public:
    explicit MonitorFeed_C(std::size_t maxPendingBytes = 65536) : maxPendingBytes_(maxPendingBytes) {}

    void on_module_bytes(std::size_t slot, const std::string& moduleName, const bytes_T& bytes) override;
    void on_analog_samples(const std::vector<AnalogSample_S>& batch) override;

    // everything relayed since the last call (oldest first)
    std::vector<RelayChunk_S> take_relay_chunks();
    std::size_t get_pending_relay_bytes() const;
    std::size_t get_dropped_relay_bytes() const;

    uint64_t get_analog_sample_count() const;
    bool get_latest_analog_sample(AnalogSample_S& out) const;

private:
    const std::size_t maxPendingBytes_; // nobody polling -> oldest chunks dropped

    mutable std::mutex mtx_;
    std::vector<RelayChunk_S> relayChunks_;
    std::size_t pendingBytes_ = 0;
    std::size_t droppedBytes_ = 0;

    uint64_t analogSamples_ = 0;
    bool hasAnalog_ = false;
    AnalogSample_S latestAnalog_{};
}; // MonitorFeed_C
