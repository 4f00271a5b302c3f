/*
==============================================================================
	File: WireCodec.h
	Desc: Byte packing helpers for the state machine's serial protocol.
	*Multi-byte integers are little-endian on the wire (ARM/AVR firmware).
==============================================================================
*/

#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>
#include "Types.h"

struct WireCodec_S {

	// opcode byte followed by payload, as written to the port
	static bytes_T encode_command(uint8_t opcode, const bytes_T& payload);

	static void append_u16(bytes_T& out, uint16_t value);
	static void append_u32(bytes_T& out, uint32_t value);
	static uint16_t read_u16(const uint8_t* src);
	static uint32_t read_u32(const uint8_t* src);

	// {'J', moduleIndex, 1|0}
	static bytes_T encode_module_relay(uint8_t moduleIndex, bool enable);
	// {'Q', type0, type1, ...}
	static bytes_T encode_flex_config(const std::vector<uint8_t>& channelTypes);
	// inverse of encode_flex_config; false if frame is not a 'Q' frame of nChannels types
	static bool decode_flex_config(const bytes_T& frame, std::size_t nChannels, std::vector<uint8_t>& outTypes);
	// {'^', uint32 cyclesPerSample}
	static bytes_T encode_sampling_rate(uint32_t cyclesPerSample);

	// hex dump for debug logs ("4A 00 01")
	static std::string to_hex(const uint8_t* data, std::size_t len);

}; // WireCodec_S
