#include "EmulatedTransport.h"
#include <algorithm>
#include <cmath>
#include <numbers>
#include <thread>
#include <utility>
#include "../utils/Logger.hpp"
#include "../utils/WireCodec.h"

static constexpr double kTwoPi = std::numbers::pi * 2.0;
// cap per call so a long gap between polls does not produce a huge burst
static constexpr uint64_t kMaxRecordsPerGeneration = 1000;

EmulatedStateMachine_C::EmulatedStateMachine_C(const HardwareDescription_S& hw)
    : hw_(hw),
      flexTypes_(hw.nFlexIO, FlexType_DigitalIn),
      cyclesPerSample_(hw.cycleFrequency / 1000), // 1kHz power-on default
      relayEnabled_(hw.nUartChannels, false),
      analogAnchor_(clock_T::now()) {
}

std::size_t EmulatedStateMachine_C::frame_length(uint8_t opcode) const {
    switch (opcode) {
        case Opcode_ModuleRelay:         return 3;
        case Opcode_SetFlexIO:           return 1 + hw_.nFlexIO;
        case Opcode_SetFlexSamplingRate: return 5;
        case Opcode_SetStatusLED:        return 2;
        case Opcode_ResetSessionClock:   return 1;
        default:                         return 0;
    }
}

void EmulatedStateMachine_C::receive(const uint8_t* data, std::size_t len) {
    std::lock_guard<std::mutex> lock(mtx_);
    rxPending_.insert(rxPending_.end(), data, data + len);

    std::size_t pos = 0;
    while (pos < rxPending_.size()) {
        const std::size_t flen = frame_length(rxPending_[pos]);
        if (flen == 0) {
            LOG_WARN("emulator: unknown opcode 0x" << WireCodec_S::to_hex(&rxPending_[pos], 1) << ", dropped");
            pos++;
            continue;
        }
        if (rxPending_.size() - pos < flen) {
            break; // wait for the rest of the frame
        }
        handle_frame_locked(&rxPending_[pos]);
        pos += flen;
    }
    rxPending_.erase(rxPending_.begin(), rxPending_.begin() + static_cast<std::ptrdiff_t>(pos));
}

void EmulatedStateMachine_C::reply_locked(uint8_t byte) {
    if (!muted_) {
        cmdOut_.push_back(byte);
    }
}

void EmulatedStateMachine_C::handle_frame_locked(const uint8_t* frame) {
    framesReceived_++;
    switch (frame[0]) {
        case Opcode_ModuleRelay: {
            // no reply; the host only sees module bytes afterwards
            const std::size_t slot = frame[1];
            if (slot < relayEnabled_.size()) {
                relayEnabled_[slot] = (frame[2] != 0);
            }
            break;
        }
        case Opcode_SetFlexIO: {
            bool valid = true;
            for (std::size_t i = 0; i < hw_.nFlexIO; i++) {
                valid = valid && is_valid_flex_type(frame[1 + i]);
            }
            if (valid) {
                flexTypes_.assign(frame + 1, frame + 1 + hw_.nFlexIO);
                restart_analog_clock_locked();
            }
            reply_locked(valid ? CONFIRM_OK : 0);
            break;
        }
        case Opcode_SetFlexSamplingRate: {
            const uint32_t cycles = WireCodec_S::read_u32(frame + 1);
            const bool valid = cycles >= FLEX_MIN_CYCLES_PER_SAMPLE && cycles <= hw_.cycleFrequency;
            if (valid) {
                cyclesPerSample_ = cycles;
                restart_analog_clock_locked();
            }
            reply_locked(valid ? CONFIRM_OK : 0);
            break;
        }
        case Opcode_SetStatusLED: {
            const bool valid = frame[1] <= 1 && hw_.identity.firmwareVersion >= STATUS_LED_MIN_FIRMWARE;
            if (valid) {
                statusLed_ = frame[1];
            }
            reply_locked(valid ? CONFIRM_OK : 0);
            break;
        }
        case Opcode_ResetSessionClock:
            clockResets_++;
            reply_locked(CONFIRM_OK);
            break;
        default:
            break;
    }
}

std::size_t EmulatedStateMachine_C::read_command(uint8_t* dest, std::size_t len) {
    std::lock_guard<std::mutex> lock(mtx_);
    const std::size_t n = std::min(len, cmdOut_.size());
    std::copy_n(cmdOut_.begin(), n, dest);
    cmdOut_.erase(cmdOut_.begin(), cmdOut_.begin() + static_cast<std::ptrdiff_t>(n));
    return n;
}

std::size_t EmulatedStateMachine_C::command_bytes_available() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return cmdOut_.size();
}

std::size_t EmulatedStateMachine_C::read_analog(uint8_t* dest, std::size_t len) {
    std::lock_guard<std::mutex> lock(mtx_);
    generate_analog_locked();
    const std::size_t n = std::min(len, analogOut_.size());
    std::copy_n(analogOut_.begin(), n, dest);
    analogOut_.erase(analogOut_.begin(), analogOut_.begin() + static_cast<std::ptrdiff_t>(n));
    return n;
}

std::size_t EmulatedStateMachine_C::analog_bytes_available() {
    std::lock_guard<std::mutex> lock(mtx_);
    generate_analog_locked();
    return analogOut_.size();
}

bool EmulatedStateMachine_C::queue_module_bytes(std::size_t slot, const bytes_T& bytes) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (slot >= relayEnabled_.size() || !relayEnabled_[slot]) {
        return false;
    }
    cmdOut_.insert(cmdOut_.end(), bytes.begin(), bytes.end());
    return true;
}

bool EmulatedStateMachine_C::queue_analog_record(uint16_t trialNumber, const std::vector<uint16_t>& values) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (values.size() != analog_input_count_locked()) {
        return false;
    }
    push_record_locked(trialNumber, values);
    return true;
}

void EmulatedStateMachine_C::set_analog_autogen(bool enabled) {
    std::lock_guard<std::mutex> lock(mtx_);
    autogen_ = enabled;
    restart_analog_clock_locked();
}

void EmulatedStateMachine_C::set_trial_number(uint16_t trialNumber) {
    std::lock_guard<std::mutex> lock(mtx_);
    trialNumber_ = trialNumber;
}

void EmulatedStateMachine_C::set_muted(bool muted) {
    std::lock_guard<std::mutex> lock(mtx_);
    muted_ = muted;
}

std::size_t EmulatedStateMachine_C::analog_input_count_locked() const {
    return static_cast<std::size_t>(std::count(flexTypes_.begin(), flexTypes_.end(),
                                               static_cast<uint8_t>(FlexType_AnalogIn)));
}

void EmulatedStateMachine_C::push_record_locked(uint16_t trialNumber, const std::vector<uint16_t>& values) {
    bytes_T rec;
    WireCodec_S::append_u16(rec, trialNumber);
    for (uint16_t v : values) {
        WireCodec_S::append_u16(rec, v);
    }
    analogOut_.insert(analogOut_.end(), rec.begin(), rec.end());
}

void EmulatedStateMachine_C::restart_analog_clock_locked() {
    analogAnchor_ = clock_T::now();
    analogProduced_ = 0;
}

void EmulatedStateMachine_C::generate_analog_locked() {
    const std::size_t nInputs = analog_input_count_locked();
    if (!autogen_ || nInputs == 0 || cyclesPerSample_ == 0) {
        return;
    }
    const double rateHz = static_cast<double>(hw_.cycleFrequency) / cyclesPerSample_;
    const double elapsed_s = std::chrono::duration<double>(clock_T::now() - analogAnchor_).count();
    const uint64_t due = static_cast<uint64_t>(elapsed_s * rateHz);
    if (due <= analogProduced_) {
        return;
    }
    uint64_t n = due - analogProduced_;
    if (n > kMaxRecordsPerGeneration) {
        // drop the backlog; keep the stream rate going forward
        analogProduced_ = due - kMaxRecordsPerGeneration;
        n = kMaxRecordsPerGeneration;
    }

    std::vector<uint16_t> values(nInputs);
    for (uint64_t i = 0; i < n; i++) {
        const double t = static_cast<double>(analogProduced_ + i) / rateHz;
        for (std::size_t c = 0; c < nInputs; c++) {
            // 12-bit ADC range, 1Hz + channel-dependent phase
            const double phase = kTwoPi * t + kTwoPi * static_cast<double>(c) / static_cast<double>(nInputs);
            values[c] = static_cast<uint16_t>(2048.0 + 1800.0 * std::sin(phase));
        }
        push_record_locked(trialNumber_, values);
    }
    analogProduced_ += n;
}

std::vector<uint8_t> EmulatedStateMachine_C::get_flex_types() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return flexTypes_;
}

uint32_t EmulatedStateMachine_C::get_cycles_per_sample() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return cyclesPerSample_;
}

int EmulatedStateMachine_C::get_status_led() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return statusLed_;
}

uint32_t EmulatedStateMachine_C::get_clock_resets() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return clockResets_;
}

bool EmulatedStateMachine_C::is_relay_enabled(std::size_t slot) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return slot < relayEnabled_.size() && relayEnabled_[slot];
}

std::size_t EmulatedStateMachine_C::get_frames_received() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return framesReceived_;
}

// ---------------------------------------------------------------------------

EmulatedTransport_C::EmulatedTransport_C(std::shared_ptr<EmulatedStateMachine_C> device, Channel_E channel)
    : device_(std::move(device)), channel_(channel) {
}

bool EmulatedTransport_C::write(const uint8_t* data, std::size_t len) {
    if (!is_open()) {
        return false;
    }
    if (channel_ == Channel_E::Analog) {
        return false; // analog port is read-only
    }
    device_->receive(data, len);
    return true;
}

std::size_t EmulatedTransport_C::read_once(uint8_t* dest, std::size_t len) {
    return (channel_ == Channel_E::Command) ? device_->read_command(dest, len)
                                            : device_->read_analog(dest, len);
}

std::size_t EmulatedTransport_C::read(uint8_t* dest, std::size_t len, ms_T timeout) {
    if (!is_open()) {
        return 0;
    }
    const time_point_T deadline = clock_T::now() + timeout;
    std::size_t got = read_once(dest, len);
    while (got < len && is_open() && clock_T::now() < deadline) {
        std::this_thread::sleep_for(ms_T{1});
        got += read_once(dest + got, len - got);
    }
    return got;
}

std::size_t EmulatedTransport_C::bytes_available() {
    if (!is_open()) {
        return 0;
    }
    return (channel_ == Channel_E::Command) ? device_->command_bytes_available()
                                            : device_->analog_bytes_available();
}

std::string EmulatedTransport_C::describe() const {
    return (channel_ == Channel_E::Command) ? "emulator" : "emulator (analog)";
}
