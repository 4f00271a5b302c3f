/*
==============================================================================
	File: HardwareDescription.h
	Desc: Fixed constants describing the connected state machine (channel
	counts, table offsets, cycle frequency) and the channel name tables
	derived from them.

	Table layout (0-based positions):
	  events:  [Serial k events][Port In/Out][BNC High/Low][Wire High/Low]
	           [Flex: 2 per channel][GlobalTimer start/end][GlobalCounter][Condition][Tup]
	  inputs:  [Serial k][USB][Port i][BNC i][Wire i][Flex i]
	  outputs: [Serial k][SoftCode][Flex i][Valve i][PWM i][BNC i][Wire i][GlobalTimerTrig][GlobalTimerCancel][GlobalCounterReset]
==============================================================================
*/

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "../utils/Types.h"

struct HardwareDescription_S {
	DeviceIdentity_S identity{};
	uint32_t cycleFrequency = 10000;  // state machine refresh rate (Hz)

	// channel counts
	std::size_t nUartChannels = 0;
	std::size_t nPorts = 0;
	std::size_t nBnc = 0;
	std::size_t nWire = 0;
	std::size_t nFlexIO = 0;
	std::size_t nEventsPerSerialChannel = 15;
	std::size_t nGlobalTimers = 5;
	std::size_t nGlobalCounters = 5;
	std::size_t nConditions = 5;
	std::size_t maxStates = 256;

	// declared start of each table's Flex region
	std::size_t eventFlexPos = 0;
	std::size_t inputFlexPos = 0;
	std::size_t outputFlexPos = 0;

	// declared table sizes
	std::size_t nEvents = 0;
	std::size_t nInputChannels = 0;
	std::size_t nOutputChannels = 0;

	bool has_flex_io() const { return nFlexIO > 0; }
	bool has_status_led() const { return identity.firmwareVersion >= STATUS_LED_MIN_FIRMWARE; }
	// dedicated analog USB serial port (2+ with firmware >= 23)
	bool has_analog_port() const {
		return identity.machineType == MachineType_TwoPlus && identity.firmwareVersion >= ANALOG_PORT_MIN_FIRMWARE;
	}
}; // HardwareDescription_S

// Channel name tables, indexed by hardware position
struct ChannelLayout_S {
	std::vector<std::string> eventNames;
	std::vector<std::string> inputChannelNames;
	std::vector<std::string> outputChannelNames;
}; // ChannelLayout_S

// Replacement content for the Flex part of each table
struct FlexRegion_S {
	std::vector<std::string> eventNames;         // 2 per channel
	std::vector<std::string> inputChannelNames;  // 1 per channel
	std::vector<std::string> outputChannelNames; // 1 per channel
}; // FlexRegion_S

namespace bpodlink {
namespace hw {

// Stock profile per machine type; fills counts, offsets and table sizes
HardwareDescription_S make_default_hardware(MachineType_E machineType, uint32_t firmwareVersion);

// Initial tables, Flex channels default to digital input
ChannelLayout_S build_channel_layout(const HardwareDescription_S& hw);

// Names for the Flex part of each table given one type code per channel.
// Caller validates the codes; an unknown code yields placeholders.
FlexRegion_S build_flex_region(const std::vector<uint8_t>& channelTypes);

// Number of channels configured as analog input
std::size_t count_analog_inputs(const std::vector<uint8_t>& channelTypes);

} // namespace hw
} // namespace bpodlink
