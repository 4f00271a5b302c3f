/*
==============================================================================
	File: Types.h
	Desc: Common type definitions between modules.
	This header is used by:
  - Transport layer: serial device port, analog port and the emulator.
  - Device layer: protocol client, hardware configuration, module relay.
  - Acquisition: analog streaming controller.

==============================================================================
*/

#pragma once
#include <cstdint>
#include <vector>
#include <array>
#include <cstddef>
#include <string>
#include <chrono>

// _T for type
// Use steady clock for time measurements (monotonic, not affected by system clock changes)
using clock_T = std::chrono::steady_clock;
using ms_T = std::chrono::milliseconds;
using time_point_T = std::chrono::time_point<clock_T>;
using bytes_T = std::vector<uint8_t>;

/* START CONFIGS */

// WIRE PROTOCOL
inline constexpr uint8_t CONFIRM_OK = 1;                 // sentinel returned by the state machine after a stateful command
inline constexpr std::size_t CONFIRM_LEN = 1;            // every confirmed command answers with exactly one byte

// FEATURE GATES (firmware versions)
inline constexpr uint32_t STATUS_LED_MIN_FIRMWARE = 23;
inline constexpr uint32_t ANALOG_PORT_MIN_FIRMWARE = 23; // dedicated analog USB serial port on 2+ hardware

// FLEX I/O ANALOG SAMPLING
inline constexpr uint32_t FLEX_MIN_CYCLES_PER_SAMPLE = 10; // 10 cycles @ 10kHz = 1kHz max rate

// CHANNEL TABLES
inline constexpr const char* EMPTY_CHANNEL_NAME = "---"; // placeholder for a slot with no meaning in the current config

/* END CONFIGS */

/* START ENUMS */

// Single byte opcodes understood by the state machine firmware
enum Opcode_E : uint8_t {
	Opcode_ModuleRelay = 'J',           // {'J', moduleIndex, 1|0}
	Opcode_SetFlexIO = 'Q',             // {'Q', type0 ... typeN-1} -> confirm
	Opcode_SetFlexSamplingRate = '^',   // {'^', uint32 cyclesPerSample} -> confirm
	Opcode_SetStatusLED = ':',          // {':', 0|1} -> confirm
	Opcode_ResetSessionClock = '*',     // {'*'} -> confirm
}; // Opcode_E

enum MachineType_E {
	MachineType_HalfPointFive = 1, // Bpod 0.5
	MachineType_ZeroSeven = 2,     // Bpod 0.7+
	MachineType_TwoX = 3,          // state machine r2.X
	MachineType_TwoPlus = 4,       // state machine 2+ (Flex I/O, analog port)
}; // MachineType_E

// Wire codes for Flex I/O channel types (must not be renumbered)
enum FlexChannelType_E : uint8_t {
	FlexType_DigitalIn = 0,
	FlexType_DigitalOut = 1,
	FlexType_AnalogIn = 2,
	FlexType_AnalogOut = 3,
}; // FlexChannelType_E

// One status code for every operation in the device layer.
// None = success; everything else names why the operation was refused or aborted.
enum BpodError_E {
	BpodError_None,
	// protocol: the device may be in an unknown state after these
	BpodError_Unconfirmed,
	BpodError_Timeout,
	BpodError_TransportClosed,
	// configuration preconditions (never reach the wire)
	BpodError_LengthMismatch,
	BpodError_InvalidType,
	BpodError_Busy,
	BpodError_RateOutOfRange,
	// module relay
	BpodError_AlreadyActive,
	BpodError_UnknownModule,
	// misc
	BpodError_Unsupported,
	BpodError_InvalidArgument,
}; // BpodError_E

/* END ENUMS */

/* START HELPERS */

inline const char* bpod_error_str(BpodError_E err) {
	switch (err) {
		case BpodError_None:            return "ok";
		case BpodError_Unconfirmed:     return "unconfirmed";
		case BpodError_Timeout:         return "timeout";
		case BpodError_TransportClosed: return "transport_closed";
		case BpodError_LengthMismatch:  return "length_mismatch";
		case BpodError_InvalidType:     return "invalid_type";
		case BpodError_Busy:            return "busy";
		case BpodError_RateOutOfRange:  return "rate_out_of_range";
		case BpodError_AlreadyActive:   return "already_active";
		case BpodError_UnknownModule:   return "unknown_module";
		case BpodError_Unsupported:     return "unsupported";
		case BpodError_InvalidArgument: return "invalid_argument";
		default:                        return "unknown";
	}
}

inline const char* machine_type_str(MachineType_E type) {
	switch (type) {
		case MachineType_HalfPointFive: return "Bpod 0.5";
		case MachineType_ZeroSeven:     return "Bpod 0.7+";
		case MachineType_TwoX:          return "Bpod 2.X";
		case MachineType_TwoPlus:       return "Bpod 2+";
		default:                        return "unknown";
	}
}

inline bool is_valid_flex_type(uint8_t code) {
	return code <= FlexType_AnalogOut;
}

/* END HELPERS */

/* START STRUCTS */

// Immutable after connection
struct DeviceIdentity_S {
	MachineType_E machineType = MachineType_TwoPlus;
	uint32_t firmwareVersion = 0;
}; // DeviceIdentity_S

/*
* AnalogSample_S: one decoded record from the analog serial port.
* values[] holds one reading per Flex channel configured as analog input, in channel order.
*/
struct AnalogSample_S {
	uint64_t sampleIndex = 0;      // monotonic across the session (nAnalogSamples at time of decode)
	uint16_t trialNumber = 0;
	double hostTime_ms = 0.0;      // ms since logger start when the tick decoded it
	std::vector<uint16_t> values{};
}; // AnalogSample_S

// One UART-attached module slot
struct ModuleSlot_S {
	std::string name;              // e.g. "AnalogIn1", or "Serial3" when nothing is attached
	bool connected = false;
	bool relayActive = false;
	uint32_t firmwareVersion = 0;
	std::string usbPort;           // paired USB serial port, empty if none
}; // ModuleSlot_S

/* END STRUCTS */
