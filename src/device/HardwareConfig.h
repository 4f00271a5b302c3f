/*
HARDWARE CONFIGURATION MANAGER
- owns the Flex I/O configuration (channel types + analog sampling rate)
- validates every request locally before anything is written to the port:
    LengthMismatch / InvalidType / Busy (trial running) / RateOutOfRange
- on confirm, swaps the Flex part of the channel tables in the StateStore in one step;
  on protocol failure neither the tables nor the stored config change
- also carries the small confirmed device commands: status LED, session clock reset
*/

#pragma once
#include <cstdint>
#include <mutex>
#include <vector>
#include "ProtocolClient.h"
#include "HardwareDescription.h"
#include "../shared/StateStore.hpp"

struct FlexConfig_S {
	std::vector<uint8_t> channelTypes;  // one FlexChannelType_E code per Flex channel
	uint32_t samplingRateHz = 1000;
}; // FlexConfig_S

class HardwareConfigManager_C {
public:
	HardwareConfigManager_C(ProtocolClient_C& client, StateStore_s& status, const HardwareDescription_S& hw);

	BpodError_E set_flex_io(const std::vector<uint8_t>& channelTypes);
	BpodError_E set_flex_io_analog_sampling_rate(uint32_t hz);
	BpodError_E set_status_led(int state); // 0 = disabled, 1 = enabled (firmware >= 23)
	BpodError_E reset_session_clock();

	FlexConfig_S get_flex_config() const;
	std::size_t get_analog_input_count() const;
	uint32_t get_session_clock_resets() const;
	const HardwareDescription_S& get_hardware() const { return hw_; }

	// cycles-per-sample for a rate (rounded to nearest), 0 if outside [10, cycleFrequency] cycles
	static uint32_t cycles_per_sample(uint32_t cycleFrequency, uint32_t hz);

private:
	ProtocolClient_C& client_;
	StateStore_s& status_;
	const HardwareDescription_S hw_;

	mutable std::mutex cfg_mtx_;
	FlexConfig_S flexConfig_;
	uint32_t sessionClockResets_ = 0;
};
