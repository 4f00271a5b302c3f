#pragma once
#include <chrono>
#include <cstdlib>
#include <string>
#include <string_view>
#include "Types.h"
#include "Logger.hpp"

/* RUNTIME CONFIG
--> compile-time defaults, optionally overridden by env vars at startup:
    BPOD_PORT          command serial port (e.g. /dev/ttyACM0); empty = no device
    BPOD_ANALOG_PORT   analog serial port (2+ hardware, firmware >= 23)
    BPOD_EMULATOR      set and not "0" -> force emulator mode
    BPOD_MONITOR_PORT  monitor HTTP port
    BPOD_TIMEOUT_MS    confirmation read timeout
    BPOD_MACHINE_TYPE  1 = 0.5, 2 = 0.7+, 3 = 2.X, 4 = 2+
    BPOD_FIRMWARE      firmware major version
*/

struct RuntimeConfig_S {
    std::string serialPort = "";
    std::string analogPort = "";
    int baudRate = 115200; // ignored by USB CDC firmware, kept for FTDI based 0.5 boards

    ms_T confirmTimeout{1000};
    ms_T relayPollPeriod{100};
    ms_T analogPollPeriod{100};

    int monitorPort = 7777;

    bool forceEmulator = false;
    // device profile (used for the real device and the emulator alike)
    MachineType_E machineType = MachineType_TwoPlus;
    uint32_t firmwareVersion = 23;
}; // RuntimeConfig_S

namespace bpodlink {
namespace config {

inline bool env_flag(const char* name) {
    const char* v = std::getenv(name);
    return v && *v && std::string_view(v) != "0";
}

inline bool env_string(const char* name, std::string& out) {
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') return false;
    out = v;
    return true;
}

inline bool env_int(const char* name, int& out) {
    std::string s;
    if (!env_string(name, s)) return false;
    char* end = nullptr;
    const long val = std::strtol(s.c_str(), &end, 10);
    if (end == s.c_str() || *end != '\0' || val <= 0) {
        LOG_WARN("config: ignoring " << name << "=" << s << " (expected positive integer)");
        return false;
    }
    out = static_cast<int>(val);
    return true;
}

// defaults + env overrides
inline RuntimeConfig_S load_from_env() {
    RuntimeConfig_S cfg{};
    env_string("BPOD_PORT", cfg.serialPort);
    env_string("BPOD_ANALOG_PORT", cfg.analogPort);
    cfg.forceEmulator = env_flag("BPOD_EMULATOR");

    int val = 0;
    if (env_int("BPOD_MONITOR_PORT", val)) cfg.monitorPort = val;
    if (env_int("BPOD_TIMEOUT_MS", val)) cfg.confirmTimeout = ms_T{val};
    if (env_int("BPOD_MACHINE_TYPE", val)) {
        if (val >= MachineType_HalfPointFive && val <= MachineType_TwoPlus) {
            cfg.machineType = static_cast<MachineType_E>(val);
        } else {
            LOG_WARN("config: ignoring BPOD_MACHINE_TYPE=" << val << " (expected 1..4)");
        }
    }
    if (env_int("BPOD_FIRMWARE", val)) cfg.firmwareVersion = static_cast<uint32_t>(val);
    return cfg;
}

} // namespace config
} // namespace bpodlink
