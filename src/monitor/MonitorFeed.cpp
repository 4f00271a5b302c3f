#include "MonitorFeed.hpp"
#include "../utils/Logger.hpp"

void MonitorFeed_C::on_module_bytes(std::size_t slot, const std::string& moduleName, const bytes_T& bytes) {
    if (bytes.empty()) return;
    std::lock_guard<std::mutex> lock(mtx_);
    relayChunks_.push_back(RelayChunk_S{ slot, moduleName, bytes });
    pendingBytes_ += bytes.size();

    // bounded: drop oldest until under the cap (always keep the newest chunk)
    std::size_t dropped = 0;
    while (pendingBytes_ > maxPendingBytes_ && relayChunks_.size() > 1) {
        dropped += relayChunks_.front().bytes.size();
        pendingBytes_ -= relayChunks_.front().bytes.size();
        relayChunks_.erase(relayChunks_.begin());
    }
    if (dropped > 0) {
        droppedBytes_ += dropped;
        LOG_DBG("monitor: relay backlog full, dropped " << dropped << " bytes");
    }
}

void MonitorFeed_C::on_analog_samples(const std::vector<AnalogSample_S>& batch) {
    if (batch.empty()) return;
    std::lock_guard<std::mutex> lock(mtx_);
    analogSamples_ += batch.size();
    latestAnalog_ = batch.back();
    hasAnalog_ = true;
}

std::vector<RelayChunk_S> MonitorFeed_C::take_relay_chunks() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<RelayChunk_S> out;
    out.swap(relayChunks_);
    pendingBytes_ = 0;
    return out;
}

std::size_t MonitorFeed_C::get_pending_relay_bytes() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return pendingBytes_;
}

std::size_t MonitorFeed_C::get_dropped_relay_bytes() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return droppedBytes_;
}

uint64_t MonitorFeed_C::get_analog_sample_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return analogSamples_;
}

bool MonitorFeed_C::get_latest_analog_sample(AnalogSample_S& out) const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!hasAnalog_) return false;
    out = latestAnalog_;
    return true;
}
