#include "StatusJson.hpp"
#include <sstream>
#include "../device/BpodSystem.h"
#include "../utils/JsonUtils.hpp"

namespace StatusJson {

static const char* b(bool v) { return v ? "true" : "false"; }

std::string state(BpodSystem_C& sys) {
    StateStore_s& st = sys.status();
    const HardwareDescription_S& hw = sys.hardware();
    const FlexConfig_S flex = sys.hw_config().get_flex_config();

    std::ostringstream oss;
    oss << "{"
        << "\"machine_type\":"     << static_cast<int>(hw.identity.machineType)                          << ","
        << "\"machine_name\":"     << JSON::quote(machine_type_str(hw.identity.machineType))            << ","
        << "\"firmware\":"         << hw.identity.firmwareVersion                                        << ","
        << "\"emulator\":"         << b(sys.emulator_mode())                                             << ","
        << "\"port\":"             << JSON::quote(st.sessionInfo.get_serial_port_name())                 << ","
        << "\"live\":"             << b(st.g_live.load(std::memory_order_acquire))                       << ","
        << "\"pause\":"            << b(st.g_pause.load(std::memory_order_acquire))                      << ","
        << "\"in_state_matrix\":"  << b(st.g_in_state_matrix.load(std::memory_order_acquire))            << ","
        << "\"being_used\":"       << b(st.g_being_used.load(std::memory_order_acquire))                 << ","
        << "\"desynchronized\":"   << b(st.g_desynchronized.load(std::memory_order_acquire))             << ","
        << "\"n_analog_samples\":" << st.g_n_analog_samples.load(std::memory_order_acquire)              << ","
        << "\"current_panel\":"    << st.g_current_panel.load(std::memory_order_acquire)                 << ","
        << "\"current_state\":"    << JSON::quote(st.sessionInfo.get_current_state_name())               << ","
        << "\"protocol\":"         << JSON::quote(st.sessionInfo.get_current_protocol_name())            << ","
        << "\"subject\":"          << JSON::quote(st.sessionInfo.get_current_subject_name())             << ","
        << "\"flex_types\":"       << JSON::byte_array(flex.channelTypes)                                << ","
        << "\"sampling_rate_hz\":" << flex.samplingRateHz                                                << ","
        << "\"relay_slot\":"       << st.active_relay_slot()
        << "}";
    return oss.str();
}

std::string layout(BpodSystem_C& sys) {
    const ChannelLayout_S l = sys.status().snapshot_layout();
    std::ostringstream oss;
    oss << "{"
        << "\"events\":"  << JSON::string_array(l.eventNames)         << ","
        << "\"inputs\":"  << JSON::string_array(l.inputChannelNames)  << ","
        << "\"outputs\":" << JSON::string_array(l.outputChannelNames)
        << "}";
    return oss.str();
}

std::string modules(BpodSystem_C& sys) {
    const std::vector<ModuleSlot_S> mods = sys.status().snapshot_modules();
    std::ostringstream oss;
    oss << "{\"modules\":[";
    for (std::size_t i = 0; i < mods.size(); i++) {
        if (i) oss << ",";
        oss << "{"
            << "\"slot\":"         << i                              << ","
            << "\"name\":"         << JSON::quote(mods[i].name)      << ","
            << "\"connected\":"    << b(mods[i].connected)           << ","
            << "\"relay_active\":" << b(mods[i].relayActive)         << ","
            << "\"firmware\":"     << mods[i].firmwareVersion        << ","
            << "\"usb_port\":"     << JSON::quote(mods[i].usbPort)
            << "}";
    }
    oss << "]}";
    return oss.str();
}

std::string relay_chunks(const std::vector<RelayChunk_S>& chunks, std::size_t dropped) {
    std::ostringstream oss;
    oss << "{\"chunks\":[";
    for (std::size_t i = 0; i < chunks.size(); i++) {
        if (i) oss << ",";
        oss << "{"
            << "\"slot\":"   << chunks[i].slot                       << ","
            << "\"module\":" << JSON::quote(chunks[i].moduleName)    << ","
            << "\"bytes\":"  << JSON::byte_array(chunks[i].bytes)
            << "}";
    }
    oss << "],\"dropped\":" << dropped << "}";
    return oss.str();
}

std::string result(BpodError_E err) {
    std::ostringstream oss;
    oss << "{\"ok\":" << b(err == BpodError_None) << ",\"error\":" << JSON::quote(bpod_error_str(err)) << "}";
    return oss.str();
}

} // namespace StatusJson
