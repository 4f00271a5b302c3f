#include "HardwareDescription.h"
#include <algorithm>

namespace bpodlink {
namespace hw {

HardwareDescription_S make_default_hardware(MachineType_E machineType, uint32_t firmwareVersion) {
    HardwareDescription_S hw{};
    hw.identity.machineType = machineType;
    hw.identity.firmwareVersion = firmwareVersion;
    hw.cycleFrequency = 10000;

    switch (machineType) {
        case MachineType_HalfPointFive:
            hw.nUartChannels = 2; hw.nPorts = 8; hw.nBnc = 2; hw.nWire = 4; hw.nFlexIO = 0;
            hw.maxStates = 128;
            break;
        case MachineType_ZeroSeven:
            hw.nUartChannels = 3; hw.nPorts = 8; hw.nBnc = 2; hw.nWire = 4; hw.nFlexIO = 0;
            break;
        case MachineType_TwoX:
            hw.nUartChannels = 5; hw.nPorts = 4; hw.nBnc = 2; hw.nWire = 2; hw.nFlexIO = 0;
            break;
        case MachineType_TwoPlus:
        default:
            hw.nUartChannels = 5; hw.nPorts = 4; hw.nBnc = 2; hw.nWire = 0; hw.nFlexIO = 4;
            break;
    }

    // events
    hw.eventFlexPos = hw.nUartChannels * hw.nEventsPerSerialChannel
                    + 2 * hw.nPorts + 2 * hw.nBnc + 2 * hw.nWire;
    hw.nEvents = hw.eventFlexPos + 2 * hw.nFlexIO
               + 2 * hw.nGlobalTimers + hw.nGlobalCounters + hw.nConditions + 1; // +1 Tup

    // inputs
    hw.inputFlexPos = hw.nUartChannels + 1 + hw.nPorts + hw.nBnc + hw.nWire; // +1 USB
    hw.nInputChannels = hw.inputFlexPos + hw.nFlexIO;

    // outputs
    hw.outputFlexPos = hw.nUartChannels + 1; // +1 SoftCode
    hw.nOutputChannels = hw.outputFlexPos + hw.nFlexIO
                       + 2 * hw.nPorts + hw.nBnc + hw.nWire + 3;
    return hw;
}

ChannelLayout_S build_channel_layout(const HardwareDescription_S& hw) {
    ChannelLayout_S layout;
    layout.eventNames.reserve(hw.nEvents);
    layout.inputChannelNames.reserve(hw.nInputChannels);
    layout.outputChannelNames.reserve(hw.nOutputChannels);

    const std::vector<uint8_t> defaultFlex(hw.nFlexIO, FlexType_DigitalIn);
    const FlexRegion_S flex = build_flex_region(defaultFlex);

    // ---- events ----
    auto& ev = layout.eventNames;
    for (std::size_t k = 1; k <= hw.nUartChannels; k++) {
        for (std::size_t e = 1; e <= hw.nEventsPerSerialChannel; e++) {
            ev.push_back("Serial" + std::to_string(k) + "_" + std::to_string(e));
        }
    }
    for (std::size_t i = 1; i <= hw.nPorts; i++) {
        ev.push_back("Port" + std::to_string(i) + "In");
        ev.push_back("Port" + std::to_string(i) + "Out");
    }
    for (std::size_t i = 1; i <= hw.nBnc; i++) {
        ev.push_back("BNC" + std::to_string(i) + "High");
        ev.push_back("BNC" + std::to_string(i) + "Low");
    }
    for (std::size_t i = 1; i <= hw.nWire; i++) {
        ev.push_back("Wire" + std::to_string(i) + "High");
        ev.push_back("Wire" + std::to_string(i) + "Low");
    }
    ev.insert(ev.end(), flex.eventNames.begin(), flex.eventNames.end());
    for (std::size_t i = 1; i <= hw.nGlobalTimers; i++) {
        ev.push_back("GlobalTimer" + std::to_string(i) + "_Start");
    }
    for (std::size_t i = 1; i <= hw.nGlobalTimers; i++) {
        ev.push_back("GlobalTimer" + std::to_string(i) + "_End");
    }
    for (std::size_t i = 1; i <= hw.nGlobalCounters; i++) {
        ev.push_back("GlobalCounter" + std::to_string(i) + "_End");
    }
    for (std::size_t i = 1; i <= hw.nConditions; i++) {
        ev.push_back("Condition" + std::to_string(i));
    }
    ev.push_back("Tup");

    // ---- inputs ----
    auto& in = layout.inputChannelNames;
    for (std::size_t k = 1; k <= hw.nUartChannels; k++) in.push_back("Serial" + std::to_string(k));
    in.push_back("USB1");
    for (std::size_t i = 1; i <= hw.nPorts; i++) in.push_back("Port" + std::to_string(i));
    for (std::size_t i = 1; i <= hw.nBnc; i++) in.push_back("BNC" + std::to_string(i));
    for (std::size_t i = 1; i <= hw.nWire; i++) in.push_back("Wire" + std::to_string(i));
    in.insert(in.end(), flex.inputChannelNames.begin(), flex.inputChannelNames.end());

    // ---- outputs ----
    auto& out = layout.outputChannelNames;
    for (std::size_t k = 1; k <= hw.nUartChannels; k++) out.push_back("Serial" + std::to_string(k));
    out.push_back("SoftCode");
    out.insert(out.end(), flex.outputChannelNames.begin(), flex.outputChannelNames.end());
    for (std::size_t i = 1; i <= hw.nPorts; i++) out.push_back("Valve" + std::to_string(i));
    for (std::size_t i = 1; i <= hw.nPorts; i++) out.push_back("PWM" + std::to_string(i));
    for (std::size_t i = 1; i <= hw.nBnc; i++) out.push_back("BNC" + std::to_string(i));
    for (std::size_t i = 1; i <= hw.nWire; i++) out.push_back("Wire" + std::to_string(i));
    out.push_back("GlobalTimerTrig");
    out.push_back("GlobalTimerCancel");
    out.push_back("GlobalCounterReset");

    return layout;
}

FlexRegion_S build_flex_region(const std::vector<uint8_t>& channelTypes) {
    FlexRegion_S region;
    region.eventNames.reserve(2 * channelTypes.size());
    region.inputChannelNames.reserve(channelTypes.size());
    region.outputChannelNames.reserve(channelTypes.size());

    for (std::size_t i = 0; i < channelTypes.size(); i++) {
        const std::string base = "Flex" + std::to_string(i + 1);
        switch (channelTypes[i]) {
            case FlexType_DigitalIn:
                region.inputChannelNames.push_back(base);
                region.outputChannelNames.push_back(EMPTY_CHANNEL_NAME);
                region.eventNames.push_back(base + "High");
                region.eventNames.push_back(base + "Low");
                break;
            case FlexType_DigitalOut:
                region.inputChannelNames.push_back(EMPTY_CHANNEL_NAME);
                region.outputChannelNames.push_back(base + "DO");
                region.eventNames.push_back(EMPTY_CHANNEL_NAME);
                region.eventNames.push_back(EMPTY_CHANNEL_NAME);
                break;
            case FlexType_AnalogIn:
                region.inputChannelNames.push_back(base);
                region.outputChannelNames.push_back(EMPTY_CHANNEL_NAME);
                region.eventNames.push_back(base + "Trig1");
                region.eventNames.push_back(base + "Trig2");
                break;
            case FlexType_AnalogOut:
                region.inputChannelNames.push_back(EMPTY_CHANNEL_NAME);
                region.outputChannelNames.push_back(base + "AO");
                region.eventNames.push_back(EMPTY_CHANNEL_NAME);
                region.eventNames.push_back(EMPTY_CHANNEL_NAME);
                break;
            default:
                region.inputChannelNames.push_back(EMPTY_CHANNEL_NAME);
                region.outputChannelNames.push_back(EMPTY_CHANNEL_NAME);
                region.eventNames.push_back(EMPTY_CHANNEL_NAME);
                region.eventNames.push_back(EMPTY_CHANNEL_NAME);
                break;
        }
    }
    return region;
}

std::size_t count_analog_inputs(const std::vector<uint8_t>& channelTypes) {
    return static_cast<std::size_t>(std::count(channelTypes.begin(), channelTypes.end(),
                                               static_cast<uint8_t>(FlexType_AnalogIn)));
}

} // namespace hw
} // namespace bpodlink
