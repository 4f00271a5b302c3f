#include "SelfTestUtils.hpp"
#include <cstdlib>
#include <string>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include "../src/transport/SerialTransport.h"
#include "../src/device/BpodSystem.h"
#include "../src/monitor/MonitorFeed.hpp"

/* TEST COMPONENTS:
- SerialTransport_C on the slave side of a pseudo terminal (stands in for the USB serial port)
- bytes both ways, bytes_available, bounded read timeout
- unsupported baud rate / missing device -> transport_error
- BpodSystem_C falls back to the emulator when the port refuses to open
*/

struct Pty_S {
    int master = -1;
    std::string slavePath;

    Pty_S() {
        master = ::posix_openpt(O_RDWR | O_NOCTTY);
        if (master < 0 || ::grantpt(master) != 0 || ::unlockpt(master) != 0) {
            LOG_ERR("could not create a pseudo terminal");
            return;
        }
        const char* name = ::ptsname(master);
        if (name != nullptr) slavePath = name;
    }
    ~Pty_S() {
        if (master >= 0) ::close(master);
    }
    bool ok() const { return master >= 0 && !slavePath.empty(); }

    // bytes the transport wrote, waiting up to timeoutMs
    bytes_T read_master(std::size_t len, int timeoutMs) {
        bytes_T out;
        while (out.size() < len) {
            pollfd pfd{ master, POLLIN, 0 };
            if (::poll(&pfd, 1, timeoutMs) <= 0) break;
            uint8_t buf[64];
            const ssize_t n = ::read(master, buf, sizeof(buf));
            if (n <= 0) break;
            out.insert(out.end(), buf, buf + n);
        }
        return out;
    }
};

static void test_bytes_both_ways() {
    Pty_S pty;
    EXPECT_TRUE(pty.ok());
    if (!pty.ok()) return;

    SerialTransport_C port(pty.slavePath, 115200);
    EXPECT_TRUE(port.is_open());
    EXPECT_EQ(port.describe(), pty.slavePath);

    // device -> host
    const uint8_t reply[] = { CONFIRM_OK, 0x42 };
    EXPECT_EQ(::write(pty.master, reply, sizeof(reply)), static_cast<ssize_t>(sizeof(reply)));
    uint8_t got[2] = { 0, 0 };
    EXPECT_EQ(port.read(got, 2, ms_T{500}), std::size_t{2});
    EXPECT_EQ(got[0], CONFIRM_OK);
    EXPECT_EQ(got[1], 0x42);

    // nothing pending: the read gives up at the deadline
    EXPECT_EQ(port.bytes_available(), std::size_t{0});
    EXPECT_EQ(port.read(got, 1, ms_T{20}), std::size_t{0});

    // host -> device, raw (no newline translation)
    EXPECT_TRUE(port.write(bytes_T{ 'J', 0, 1, '\n' }));
    EXPECT_EQ(pty.read_master(4, 500), (bytes_T{ 'J', 0, 1, '\n' }));

    port.close();
    EXPECT_TRUE(!port.is_open());
    EXPECT_TRUE(!port.write(bytes_T{ '*' }));
    EXPECT_EQ(port.read(got, 1, ms_T{5}), std::size_t{0});
    port.close(); // idempotent
}

static void test_open_failures() {
    Pty_S pty;
    EXPECT_TRUE(pty.ok());
    if (!pty.ok()) return;

    bool threw = false;
    try {
        SerialTransport_C port(pty.slavePath, 12345);
    } catch (const transport_error& e) {
        threw = std::string(e.what()).find("12345") != std::string::npos;
    }
    EXPECT_TRUE(threw);

    threw = false;
    try {
        SerialTransport_C port("/nonexistent/bpod-port", 115200);
    } catch (const transport_error&) {
        threw = true;
    }
    EXPECT_TRUE(threw);

    // the runtime treats a port it cannot configure as "no device"
    RuntimeConfig_S cfg{};
    cfg.serialPort = pty.slavePath;
    cfg.baudRate = 12345;
    MonitorFeed_C feed;
    BpodSystem_C bpod(cfg, feed, feed);
    EXPECT_TRUE(bpod.emulator_mode());
}

int main() {
    logger::tlabel = "SerialTransportSelfTest";
    test_bytes_both_ways();
    test_open_failures();
    return selftest::summary("SerialTransportSelfTest");
}
