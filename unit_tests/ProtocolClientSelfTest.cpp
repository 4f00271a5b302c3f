#include "SelfTestUtils.hpp"
#include "../src/device/ProtocolClient.h"
#include "../src/shared/StateStore.hpp"
#include "../src/utils/WireCodec.h"

/* TEST COMPONENTS:
- ProtocolClient_C over a scripted transport
- confirm sentinel accepted, wrong byte -> Unconfirmed, missing byte -> Timeout
- failures raise the desync flag and are never retried (exactly one frame written)
- closed transport / failed write -> TransportClosed, nothing read
- read_available / drain
- wire codec frames ('J', 'Q', '^' little-endian)
*/

static void test_confirm_ok() {
    ScriptedTransport_C port;
    StateStore_s status;
    ProtocolClient_C client(port, ms_T{50}, &status);

    port.set_auto_reply(Opcode_ResetSessionClock, bytes_T{ CONFIRM_OK });
    uint8_t confirm = 0;
    EXPECT_EQ(client.send_and_confirm(Opcode_ResetSessionClock, {}, CONFIRM_LEN, &confirm), BpodError_None);
    EXPECT_EQ(confirm, CONFIRM_OK);
    EXPECT_EQ(port.written(), (bytes_T{ '*' }));
    EXPECT_TRUE(!status.g_desynchronized.load());
}

static void test_wrong_confirm_is_unconfirmed() {
    ScriptedTransport_C port;
    StateStore_s status;
    ProtocolClient_C client(port, ms_T{50}, &status);

    port.set_auto_reply(Opcode_SetStatusLED, bytes_T{ 0 });
    uint8_t confirm = 0xFF;
    EXPECT_EQ(client.send_and_confirm(Opcode_SetStatusLED, bytes_T{ 1 }, CONFIRM_LEN, &confirm), BpodError_Unconfirmed);
    EXPECT_EQ(confirm, 0);
    EXPECT_TRUE(status.g_desynchronized.load());
    // never retried
    EXPECT_EQ(port.frames().size(), std::size_t{1});
}

static void test_missing_confirm_is_timeout() {
    ScriptedTransport_C port;
    StateStore_s status;
    ProtocolClient_C client(port, ms_T{20}, &status);

    EXPECT_EQ(client.send_and_confirm(Opcode_SetFlexIO, bytes_T{ 0, 0, 0, 0 }), BpodError_Timeout);
    EXPECT_TRUE(status.g_desynchronized.load());
    EXPECT_EQ(port.frames().size(), std::size_t{1});

    // multi-byte confirm: short read is still a timeout
    ScriptedTransport_C port2;
    ProtocolClient_C client2(port2, ms_T{20});
    port2.set_auto_reply(Opcode_ResetSessionClock, bytes_T{ CONFIRM_OK });
    EXPECT_EQ(client2.send_and_confirm(Opcode_ResetSessionClock, {}, 2), BpodError_Timeout);
}

static void test_closed_transport() {
    ScriptedTransport_C port;
    ProtocolClient_C client(port, ms_T{20});
    port.close();
    EXPECT_EQ(client.send(Opcode_ModuleRelay, bytes_T{ 0, 1 }), BpodError_TransportClosed);
    EXPECT_EQ(client.send_and_confirm(Opcode_ResetSessionClock), BpodError_TransportClosed);
    EXPECT_TRUE(port.written().empty());

    ScriptedTransport_C failing;
    ProtocolClient_C client2(failing, ms_T{20});
    failing.set_fail_writes(true);
    EXPECT_EQ(client2.send(Opcode_ModuleRelay, bytes_T{ 0, 1 }), BpodError_TransportClosed);
}

static void test_send_has_no_read() {
    ScriptedTransport_C port;
    ProtocolClient_C client(port, ms_T{20});
    port.queue_rx(bytes_T{ 7, 8 });
    EXPECT_EQ(client.send(Opcode_ModuleRelay, bytes_T{ 2, 1 }), BpodError_None);
    EXPECT_EQ(port.written(), (bytes_T{ 'J', 2, 1 }));
    EXPECT_EQ(port.bytes_available(), std::size_t{2}); // untouched
}

static void test_read_available_and_drain() {
    ScriptedTransport_C port;
    ProtocolClient_C client(port, ms_T{20});

    bytes_T buf{ 0xAA };
    EXPECT_EQ(client.read_available(buf), std::size_t{0});
    port.queue_rx(bytes_T{ 1, 2, 3 });
    EXPECT_EQ(client.read_available(buf), std::size_t{3});
    EXPECT_EQ(buf, (bytes_T{ 0xAA, 1, 2, 3 }));

    port.queue_rx(bytes_T{ 9, 9, 9, 9, 9 });
    EXPECT_EQ(client.drain(), std::size_t{5});
    EXPECT_EQ(port.bytes_available(), std::size_t{0});
    EXPECT_EQ(client.drain(), std::size_t{0});
}

static void test_wire_codec() {
    EXPECT_EQ(WireCodec_S::encode_module_relay(3, true), (bytes_T{ 'J', 3, 1 }));
    EXPECT_EQ(WireCodec_S::encode_module_relay(0, false), (bytes_T{ 'J', 0, 0 }));
    EXPECT_EQ(WireCodec_S::encode_flex_config({ 0, 1, 2, 3 }), (bytes_T{ 'Q', 0, 1, 2, 3 }));
    // 10 cycles/sample = 1kHz, little-endian uint32
    EXPECT_EQ(WireCodec_S::encode_sampling_rate(10), (bytes_T{ '^', 10, 0, 0, 0 }));
    EXPECT_EQ(WireCodec_S::encode_sampling_rate(0x01020304u), (bytes_T{ '^', 4, 3, 2, 1 }));

    const bytes_T frame = WireCodec_S::encode_sampling_rate(10000);
    EXPECT_EQ(WireCodec_S::read_u32(frame.data() + 1), 10000u);

    std::vector<uint8_t> types;
    EXPECT_TRUE(WireCodec_S::decode_flex_config(bytes_T{ 'Q', 2, 2, 0, 1 }, 4, types));
    EXPECT_EQ(types, (std::vector<uint8_t>{ 2, 2, 0, 1 }));
    EXPECT_TRUE(!WireCodec_S::decode_flex_config(bytes_T{ 'Q', 2, 2 }, 4, types));
    EXPECT_TRUE(!WireCodec_S::decode_flex_config(bytes_T{ 'J', 2, 2, 0, 1 }, 4, types));

    EXPECT_EQ(WireCodec_S::to_hex(frame.data(), 2), std::string("5E 10"));
}

int main() {
    logger::tlabel = "ProtocolClientSelfTest";
    test_confirm_ok();
    test_wrong_confirm_is_unconfirmed();
    test_missing_confirm_is_timeout();
    test_closed_transport();
    test_send_has_no_read();
    test_read_available_and_drain();
    test_wire_codec();
    return selftest::summary("ProtocolClientSelfTest");
}
