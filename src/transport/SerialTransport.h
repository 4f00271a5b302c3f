/*
Serial device transport (real hardware)
- opens the state machine's USB serial port in raw 8N1 mode via termios
- reads are bounded with poll(); never blocks past the caller's timeout
- one instance owns one fd; closed on destruction (RAII)
*/

#pragma once
#include "ITransport.h"
#include <string>

class SerialTransport_C : public ITransport_S {
public:
	// throws transport_error if the port cannot be opened/configured
	SerialTransport_C(std::string portName, int baudRate);
	~SerialTransport_C() override;

	// one instance only: forbid copying and moving
	SerialTransport_C(const SerialTransport_C&)            = delete;
	SerialTransport_C& operator=(const SerialTransport_C&) = delete;
	SerialTransport_C(SerialTransport_C&&)                 = delete;
	SerialTransport_C& operator=(SerialTransport_C&&)      = delete;

	using ITransport_S::write;
	bool is_open() const override { return fd_ >= 0; }
	bool write(const uint8_t* data, std::size_t len) override;
	std::size_t read(uint8_t* dest, std::size_t len, ms_T timeout) override;
	std::size_t bytes_available() override;
	void close() override;
	std::string describe() const override { return portName_; }

private:
	std::string portName_;
	int fd_ = -1;

	void configure_port(int baudRate); // raw mode, 8N1, no flow control
};
