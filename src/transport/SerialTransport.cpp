#include "SerialTransport.h"
#include "../utils/Logger.hpp"
#include "../utils/SWTimer.hpp"
#include <cerrno>
#include <cstring>
#include <sstream>
#include <string>
#include <utility>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace {
	// false for a rate termios has no constant for
	bool to_speed(int baudRate, speed_t& out) {
		switch (baudRate) {
			case 9600:    out = B9600;   return true;
			case 19200:   out = B19200;  return true;
			case 38400:   out = B38400;  return true;
			case 57600:   out = B57600;  return true;
			case 115200:  out = B115200; return true;
			case 230400:  out = B230400; return true;
			case 460800:  out = B460800; return true;
			case 921600:  out = B921600; return true;
			default:      return false;
		}
	}

	std::string errno_str(const char* where, const std::string& port) {
		std::ostringstream oss;
		oss << where << " failed on " << port << " -> " << std::strerror(errno);
		return oss.str();
	}
}

SerialTransport_C::SerialTransport_C(std::string portName, int baudRate) : portName_(std::move(portName)) {
	logger::tlabel = "Serial";
	fd_ = ::open(portName_.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC);
	if (fd_ < 0) {
		throw transport_error(errno_str("open()", portName_));
	}
	try {
		configure_port(baudRate);
	}
	catch (const transport_error&) {
		::close(fd_);
		fd_ = -1;
		throw;
	}
	LOG_ALWAYS("Opened " << portName_ << " @ " << baudRate << " baud");
}

// Destructor (RAII: close if still open)
SerialTransport_C::~SerialTransport_C() {
	close();
}

void SerialTransport_C::configure_port(int baudRate) {
	speed_t speed = B115200;
	if (!to_speed(baudRate, speed)) {
		throw transport_error("unsupported baud rate " + std::to_string(baudRate) + " for " + portName_);
	}
	termios tty{};
	if (::tcgetattr(fd_, &tty) != 0) {
		throw transport_error(errno_str("tcgetattr()", portName_));
	}
	::cfmakeraw(&tty);
	tty.c_cflag |= (CLOCAL | CREAD);
	tty.c_cflag &= ~CSTOPB;   // 1 stop bit
	tty.c_cflag &= ~CRTSCTS;  // no hw flow control
	// non-blocking reads at the driver level; timeouts are handled with poll()
	tty.c_cc[VMIN] = 0;
	tty.c_cc[VTIME] = 0;
	::cfsetispeed(&tty, speed);
	::cfsetospeed(&tty, speed);
	if (::tcsetattr(fd_, TCSANOW, &tty) != 0) {
		throw transport_error(errno_str("tcsetattr()", portName_));
	}
	// discard anything the device sent before we were listening
	::tcflush(fd_, TCIOFLUSH);
}

bool SerialTransport_C::write(const uint8_t* data, std::size_t len) {
	if (fd_ < 0) return false;
	std::size_t sent = 0;
	while (sent < len) {
		const ssize_t n = ::write(fd_, data + sent, len - sent);
		if (n < 0) {
			if (errno == EINTR || errno == EAGAIN) continue;
			LOG_ERR(errno_str("write()", portName_));
			return false;
		}
		sent += static_cast<std::size_t>(n);
	}
	return true;
}

std::size_t SerialTransport_C::read(uint8_t* dest, std::size_t len, ms_T timeout) {
	if (fd_ < 0 || len == 0) return 0;
	std::size_t got = 0;
	SW_Timer_C deadline;
	deadline.start_timer(timeout);

	while (got < len) {
		pollfd pfd{ fd_, POLLIN, 0 };
		const int waitMs = static_cast<int>(deadline.remaining_ms().count());
		const int rc = ::poll(&pfd, 1, waitMs);
		if (rc < 0) {
			if (errno == EINTR) continue;
			LOG_ERR(errno_str("poll()", portName_));
			break;
		}
		if (rc == 0) {
			break; // timed out
		}
		if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
			LOG_ERR("Port " << portName_ << " reported hangup/error");
			break;
		}
		const ssize_t n = ::read(fd_, dest + got, len - got);
		if (n < 0) {
			if (errno == EINTR || errno == EAGAIN) continue;
			LOG_ERR(errno_str("read()", portName_));
			break;
		}
		got += static_cast<std::size_t>(n);
		if (deadline.check_timer_expired()) break;
	}
	return got;
}

std::size_t SerialTransport_C::bytes_available() {
	if (fd_ < 0) return 0;
	int n = 0;
	if (::ioctl(fd_, FIONREAD, &n) != 0) {
		LOG_WARN(errno_str("ioctl(FIONREAD)", portName_));
		return 0;
	}
	return n > 0 ? static_cast<std::size_t>(n) : 0;
}

void SerialTransport_C::close() {
	if (fd_ >= 0) {
		::close(fd_);
		fd_ = -1;
		LOG_ALWAYS("Closed " << portName_);
	}
}
