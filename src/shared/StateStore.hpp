#pragma once
#include "../utils/Types.h"
#include "../device/HardwareDescription.h"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
/* STATESTORE
--> A single source of truth for the device layer, the session controller and the monitor:
    1) operational flags that gate which operations are legal (live, inStateMatrix, beingUsed, ...)
    2) session bookkeeping (current state, last event, protocol/subject names)
    3) the channel name tables (rebuilt atomically on Flex reconfiguration)
    4) the module table (one slot per UART channel, at most one relaying)
--> Constructed once at connection and passed by reference to each component. Never persisted.
*/

struct StateStore_s {

    // ----------------- operational flags -----------------
    std::atomic<bool> g_live{false};                  // session running
    std::atomic<bool> g_pause{false};
    std::atomic<bool> g_in_state_matrix{false};       // a trial is executing on the device
    std::atomic<bool> g_being_used{false};            // a protocol owns the device
    std::atomic<bool> g_new_state_machine_sent{false};
    std::atomic<bool> g_session_start_flag{false};
    std::atomic<bool> g_analog_viewer{false};
    std::atomic<bool> g_live_timestamps{false};       // timestamps streamed per event vs after the trial
    std::atomic<bool> g_desynchronized{false};        // a confirm failed; needs reconnect
    std::atomic<uint64_t> g_n_analog_samples{0};

    // ----------------- session bookkeeping -----------------
    std::atomic<double> g_last_timestamp{0.0};
    std::atomic<int> g_current_state_code{0};
    std::atomic<int> g_last_state_code{0};
    std::atomic<int> g_last_event{0};
    std::atomic<int> g_current_panel{0};

    struct sessionInfo_s {
        // strings must be mutex-protected (proceed 1 at a time)
        mutable std::mutex mtx_;
        std::string currentStateName = "";
        std::string lastStateName = "";
        std::string currentProtocolName = "";
        std::string currentSubjectName = "";
        std::string serialPortName = "";

        std::string get_current_protocol_name() const {
            std::lock_guard<std::mutex> lock(mtx_);
            return currentProtocolName;
        }
        std::string get_current_subject_name() const {
            std::lock_guard<std::mutex> lock(mtx_);
            return currentSubjectName;
        }
        std::string get_serial_port_name() const {
            std::lock_guard<std::mutex> lock(mtx_);
            return serialPortName;
        }
        std::string get_current_state_name() const {
            std::lock_guard<std::mutex> lock(mtx_);
            return currentStateName;
        }
        void set_serial_port_name(const std::string& name) {
            std::lock_guard<std::mutex> lock(mtx_);
            serialPortName = name;
        }
        void set_protocol(const std::string& protocol, const std::string& subject) {
            std::lock_guard<std::mutex> lock(mtx_);
            currentProtocolName = protocol;
            currentSubjectName = subject;
        }
        // shifts current -> last
        void set_current_state_name(const std::string& name) {
            std::lock_guard<std::mutex> lock(mtx_);
            lastStateName = currentStateName;
            currentStateName = name;
        }
    };
    sessionInfo_s sessionInfo{};

    // ----------------- gating -----------------
    // Flex I/O / sampling rate may only change between trials
    bool can_reconfigure() const {
        return !g_in_state_matrix.load(std::memory_order_acquire);
    }
    // default module panels may only grab the relay when no protocol owns the device
    bool can_auto_relay() const {
        return !g_being_used.load(std::memory_order_acquire);
    }

    // ----------------- channel layout -----------------
    // Initial tables; sizes are fixed for the lifetime of the connection
    void init_layout(const HardwareDescription_S& hw, ChannelLayout_S layout) {
        std::lock_guard<std::mutex> lock(layout_mtx_);
        layout_ = std::move(layout);
        eventFlexPos_ = hw.eventFlexPos;
        inputFlexPos_ = hw.inputFlexPos;
        outputFlexPos_ = hw.outputFlexPos;
    }

    ChannelLayout_S snapshot_layout() const {
        std::lock_guard<std::mutex> lock(layout_mtx_);
        return layout_;
    }

    // Swap in a whole Flex region under one lock (readers see old or new, never a mix).
    // false (and nothing written) if the region does not fit the declared tables.
    bool replace_flex_region(const FlexRegion_S& region) {
        std::lock_guard<std::mutex> lock(layout_mtx_);
        if (eventFlexPos_ + region.eventNames.size() > layout_.eventNames.size() ||
            inputFlexPos_ + region.inputChannelNames.size() > layout_.inputChannelNames.size() ||
            outputFlexPos_ + region.outputChannelNames.size() > layout_.outputChannelNames.size()) {
            return false;
        }
        std::copy(region.eventNames.begin(), region.eventNames.end(), layout_.eventNames.begin() + eventFlexPos_);
        std::copy(region.inputChannelNames.begin(), region.inputChannelNames.end(), layout_.inputChannelNames.begin() + inputFlexPos_);
        std::copy(region.outputChannelNames.begin(), region.outputChannelNames.end(), layout_.outputChannelNames.begin() + outputFlexPos_);
        return true;
    }

    // ----------------- module table -----------------
    void init_modules(std::size_t nUartChannels) {
        std::lock_guard<std::mutex> lock(modules_mtx_);
        modules_.assign(nUartChannels, ModuleSlot_S{});
        for (std::size_t i = 0; i < nUartChannels; i++) {
            modules_[i].name = "Serial" + std::to_string(i + 1);
        }
    }

    // filled in by the module discovery (outside the device layer) or the emulator
    bool set_module(std::size_t slot, const std::string& name, bool connected, uint32_t firmwareVersion, const std::string& usbPort) {
        std::lock_guard<std::mutex> lock(modules_mtx_);
        if (slot >= modules_.size()) return false;
        modules_[slot].name = name;
        modules_[slot].connected = connected;
        modules_[slot].firmwareVersion = firmwareVersion;
        modules_[slot].usbPort = usbPort;
        return true;
    }

    std::vector<ModuleSlot_S> snapshot_modules() const {
        std::lock_guard<std::mutex> lock(modules_mtx_);
        return modules_;
    }

    std::size_t module_count() const {
        std::lock_guard<std::mutex> lock(modules_mtx_);
        return modules_.size();
    }

    // -1 if no slot carries that name
    int find_module(const std::string& name) const {
        std::lock_guard<std::mutex> lock(modules_mtx_);
        for (std::size_t i = 0; i < modules_.size(); i++) {
            if (modules_[i].name == name) return static_cast<int>(i);
        }
        return -1;
    }

    // -1 if nothing is relaying
    int active_relay_slot() const {
        std::lock_guard<std::mutex> lock(modules_mtx_);
        for (std::size_t i = 0; i < modules_.size(); i++) {
            if (modules_[i].relayActive) return static_cast<int>(i);
        }
        return -1;
    }

    // Marks one slot active only if no slot is active (check + set under one lock)
    bool try_claim_relay(std::size_t slot) {
        std::lock_guard<std::mutex> lock(modules_mtx_);
        if (slot >= modules_.size()) return false;
        for (const auto& m : modules_) {
            if (m.relayActive) return false;
        }
        modules_[slot].relayActive = true;
        return true;
    }

    void clear_relay_flags() {
        std::lock_guard<std::mutex> lock(modules_mtx_);
        for (auto& m : modules_) m.relayActive = false;
    }

private:
    mutable std::mutex layout_mtx_;
    ChannelLayout_S layout_;
    std::size_t eventFlexPos_ = 0;
    std::size_t inputFlexPos_ = 0;
    std::size_t outputFlexPos_ = 0;

    mutable std::mutex modules_mtx_;
    std::vector<ModuleSlot_S> modules_;
};
