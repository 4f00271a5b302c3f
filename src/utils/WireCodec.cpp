#include "WireCodec.h"
#include <iomanip>
#include <sstream>

bytes_T WireCodec_S::encode_command(uint8_t opcode, const bytes_T& payload) {
	bytes_T frame;
	frame.reserve(1 + payload.size());
	frame.push_back(opcode);
	frame.insert(frame.end(), payload.begin(), payload.end());
	return frame;
}

void WireCodec_S::append_u16(bytes_T& out, uint16_t value) {
	out.push_back(static_cast<uint8_t>(value & 0xFF));
	out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void WireCodec_S::append_u32(bytes_T& out, uint32_t value) {
	for (int byteIdx = 0; byteIdx < 4; byteIdx++) {
		out.push_back(static_cast<uint8_t>((value >> (8 * byteIdx)) & 0xFF));
	}
}

uint16_t WireCodec_S::read_u16(const uint8_t* src) {
	return static_cast<uint16_t>(src[0] | (src[1] << 8));
}

uint32_t WireCodec_S::read_u32(const uint8_t* src) {
	uint32_t value = 0;
	for (int byteIdx = 3; byteIdx >= 0; byteIdx--) {
		value = (value << 8) | src[byteIdx];
	}
	return value;
}

bytes_T WireCodec_S::encode_module_relay(uint8_t moduleIndex, bool enable) {
	return encode_command(Opcode_ModuleRelay, bytes_T{ moduleIndex, static_cast<uint8_t>(enable ? 1 : 0) });
}

bytes_T WireCodec_S::encode_flex_config(const std::vector<uint8_t>& channelTypes) {
	return encode_command(Opcode_SetFlexIO, channelTypes);
}

bool WireCodec_S::decode_flex_config(const bytes_T& frame, std::size_t nChannels, std::vector<uint8_t>& outTypes) {
	if (frame.size() != nChannels + 1 || frame[0] != Opcode_SetFlexIO) {
		return false;
	}
	outTypes.assign(frame.begin() + 1, frame.end());
	return true;
}

bytes_T WireCodec_S::encode_sampling_rate(uint32_t cyclesPerSample) {
	bytes_T payload;
	append_u32(payload, cyclesPerSample);
	return encode_command(Opcode_SetFlexSamplingRate, payload);
}

std::string WireCodec_S::to_hex(const uint8_t* data, std::size_t len) {
	std::ostringstream oss;
	oss << std::hex << std::uppercase << std::setfill('0');
	for (std::size_t i = 0; i < len; i++) {
		if (i > 0) oss << ' ';
		oss << std::setw(2) << static_cast<int>(data[i]);
	}
	return oss.str();
}
