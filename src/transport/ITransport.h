/*
==============================================================================
	File: ITransport.h
	Desc: Abstract byte-stream interface to the state machine (or its analog
	port). Implementations: the real serial device (SerialTransport_C) and the
	software emulator (EmulatedTransport_C). Selected once at startup; every
	caller depends only on this interface.
	Note: implementations are not internally locked. The protocol client
	serializes all access to the command channel.
==============================================================================
*/

#pragma once
#include <cstddef>   // std::size_t
#include <cstdint>   // uint8_t
#include <stdexcept>
#include <string>
#include "../utils/Types.h"

// Hard failure of the host side (port missing, termios refused, ...)
struct transport_error : std::runtime_error {
	using std::runtime_error::runtime_error;
};

struct ITransport_S {
	virtual ~ITransport_S() = default; // virtual destructor for proper cleanup of derived classes

	virtual bool is_open() const = 0;
	// writes all len bytes; false if the channel is closed or the write failed
	virtual bool write(const uint8_t* data, std::size_t len) = 0;
	// blocks until len bytes arrived or timeout elapsed; returns bytes actually read
	virtual std::size_t read(uint8_t* dest, std::size_t len, ms_T timeout) = 0;
	// bytes that can be read right now without blocking
	virtual std::size_t bytes_available() = 0;
	virtual void close() = 0;
	// port name for logs / status ("/dev/ttyACM0", "emulator")
	virtual std::string describe() const = 0;

	bool write(const bytes_T& bytes) { return write(bytes.data(), bytes.size()); }
}; // ITransport_S
