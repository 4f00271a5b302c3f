#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "../src/transport/ITransport.h"
#include "../src/device/IRelaySink.h"
#include "../src/acq/IAnalogSink.h"
#include "../src/utils/Logger.hpp"

/* SELF TEST HELPERS
- EXPECT_* log the failing expression + line and count the failure; the test keeps going
- main() returns selftest::summary(): 0 if everything passed
- ScriptedTransport_C: mocked device link. Records every written byte and serves
  reply bytes, either queued up front or produced automatically per opcode
*/

namespace selftest {

inline int g_failures = 0;
inline int g_checks = 0;

inline int summary(const char* name) {
    if (g_failures == 0) {
        LOG_ALWAYS(name << ": all " << g_checks << " checks passed");
        return 0;
    }
    LOG_ERR(name << ": " << g_failures << "/" << g_checks << " checks FAILED");
    return 1;
}

} // namespace selftest

#define EXPECT_TRUE(cond) do { \
    selftest::g_checks++; \
    if (!(cond)) { \
        selftest::g_failures++; \
        LOG_ERR("FAILED line " << __LINE__ << ": " << #cond); \
    } \
} while (0)

#define EXPECT_EQ(a, b) do { \
    selftest::g_checks++; \
    const auto expect_a_ = (a); \
    const auto expect_b_ = (b); \
    if (!(expect_a_ == expect_b_)) { \
        selftest::g_failures++; \
        LOG_ERR("FAILED line " << __LINE__ << ": " << #a << " == " << #b); \
    } \
} while (0)

class ScriptedTransport_C : public ITransport_S {
public:
    bool is_open() const override { return open_; }
    using ITransport_S::write;

    bool write(const uint8_t* data, std::size_t len) override {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!open_ || failWrites_) return false;
        written_.insert(written_.end(), data, data + len);
        frames_.emplace_back(data, data + len);
        if (len > 0) {
            auto it = autoReplies_.find(data[0]);
            if (it != autoReplies_.end()) {
                rx_.insert(rx_.end(), it->second.begin(), it->second.end());
            }
        }
        return true;
    }

    // never sleeps: returns what is queued (a short read models a timeout)
    std::size_t read(uint8_t* dest, std::size_t len, ms_T timeout) override {
        (void)timeout;
        std::lock_guard<std::mutex> lock(mtx_);
        std::size_t n = 0;
        while (n < len && !rx_.empty()) {
            dest[n++] = rx_.front();
            rx_.pop_front();
        }
        return n;
    }

    std::size_t bytes_available() override {
        std::lock_guard<std::mutex> lock(mtx_);
        return rx_.size();
    }

    void close() override { open_ = false; }
    std::string describe() const override { return "scripted"; }

    // ---- scripting ----
    void queue_rx(const bytes_T& bytes) {
        std::lock_guard<std::mutex> lock(mtx_);
        rx_.insert(rx_.end(), bytes.begin(), bytes.end());
    }
    void set_auto_reply(uint8_t opcode, const bytes_T& reply) {
        std::lock_guard<std::mutex> lock(mtx_);
        autoReplies_[opcode] = reply;
    }
    void clear_auto_reply(uint8_t opcode) {
        std::lock_guard<std::mutex> lock(mtx_);
        autoReplies_.erase(opcode);
    }
    // every stateful opcode answered with the confirm byte, as the firmware does
    void confirm_all() {
        for (uint8_t op : { uint8_t(Opcode_SetFlexIO), uint8_t(Opcode_SetFlexSamplingRate),
                            uint8_t(Opcode_SetStatusLED), uint8_t(Opcode_ResetSessionClock) }) {
            set_auto_reply(op, bytes_T{ CONFIRM_OK });
        }
    }
    void set_fail_writes(bool fail) {
        std::lock_guard<std::mutex> lock(mtx_);
        failWrites_ = fail;
    }

    bytes_T written() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return written_;
    }
    std::vector<bytes_T> frames() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return frames_;
    }
    void clear_written() {
        std::lock_guard<std::mutex> lock(mtx_);
        written_.clear();
        frames_.clear();
    }

private:
    mutable std::mutex mtx_;
    bool open_ = true;
    bool failWrites_ = false;
    bytes_T written_;
    std::vector<bytes_T> frames_;
    std::deque<uint8_t> rx_;
    std::map<uint8_t, bytes_T> autoReplies_;
};

// records what the relay poller forwards
struct RecordingRelaySink_S : IRelaySink_S {
    std::mutex mtx;
    std::vector<std::pair<std::string, bytes_T>> received;

    void on_module_bytes(std::size_t slot, const std::string& moduleName, const bytes_T& bytes) override {
        (void)slot;
        std::lock_guard<std::mutex> lock(mtx);
        received.emplace_back(moduleName, bytes);
    }
    std::size_t count() {
        std::lock_guard<std::mutex> lock(mtx);
        return received.size();
    }
};

struct RecordingAnalogSink_S : IAnalogSink_S {
    std::mutex mtx;
    std::vector<AnalogSample_S> samples;
    std::size_t batches = 0;

    void on_analog_samples(const std::vector<AnalogSample_S>& batch) override {
        std::lock_guard<std::mutex> lock(mtx);
        samples.insert(samples.end(), batch.begin(), batch.end());
        batches++;
    }
};
