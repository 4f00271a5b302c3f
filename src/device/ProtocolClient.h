/*
==============================================================================
	File: ProtocolClient.h
	Desc: Request/reply discipline for the command channel.
	- send(): opcode + payload, no reply expected (e.g. relay on/off)
	- send_and_confirm(): opcode + payload, then block for exactly N bytes and
	  require the confirm sentinel (1). Wrong byte -> Unconfirmed, missing
	  byte(s) -> Timeout. Never retried: a resend after a desync could apply
	  the command twice.
	- Strictly synchronous: one command in flight at a time. Every access to
	  the transport (commands, relay poll reads, drains) takes the same "turn"
	  mutex, so the relay poller and a command can never interleave.
==============================================================================
*/

#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include "../transport/ITransport.h"
#include "../utils/Types.h"

struct StateStore_s;

class ProtocolClient_C {
public:
	// status may be null (tests); when set, a failed confirm raises g_desynchronized
	ProtocolClient_C(ITransport_S& transport, ms_T confirmTimeout, StateStore_s* status = nullptr);

	ProtocolClient_C(const ProtocolClient_C&) = delete;
	ProtocolClient_C& operator=(const ProtocolClient_C&) = delete;

	BpodError_E send(uint8_t opcode, const bytes_T& payload = {});
	// confirmOut receives the (last) confirm byte read, when non-null
	BpodError_E send_and_confirm(uint8_t opcode, const bytes_T& payload = {},
	                             std::size_t nConfirmBytes = CONFIRM_LEN, uint8_t* confirmOut = nullptr);

	// same, for a frame already built by WireCodec_S (opcode first)
	BpodError_E send_frame(const bytes_T& frame);
	BpodError_E send_frame_and_confirm(const bytes_T& frame, std::size_t nConfirmBytes = CONFIRM_LEN,
	                                   uint8_t* confirmOut = nullptr);

	// Non-blocking: appends whatever is buffered right now. Returns bytes read.
	std::size_t read_available(bytes_T& dest);
	// Discards the receive buffer. Returns bytes discarded.
	std::size_t drain();

	bool is_open() const { return transport_.is_open(); }
	std::string describe() const { return transport_.describe(); }
	ms_T get_confirm_timeout() const { return confirmTimeout_; }

private:
	ITransport_S& transport_;
	const ms_T confirmTimeout_;
	StateStore_s* status_;
	std::mutex turn_; // single owner of the transport at any time

	BpodError_E write_frame_locked(const bytes_T& frame);
	void mark_desync(uint8_t opcode, BpodError_E err);
};
