#include "SelfTestUtils.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "../src/device/BpodSystem.h"
#include "../src/monitor/MonitorFeed.hpp"
#include "../src/monitor/StatusJson.hpp"

/* TEST COMPONENTS:
- BpodSystem_C in emulator mode vs device mode over a scripted transport that
  answers every confirmed command with the confirm byte
- every public operation returns the same result for identical inputs, with the
  same status side effects (channel tables, relay flags, panel)
- emulator device model: decoded frames, module bytes only on the relayed slot,
  queued + synthetic analog records
- mode selection: forced, no port, port that cannot be opened
- StatusJson snapshots
- config commands from one thread while another keeps restarting the relay:
  module bytes never land in a confirm read
*/

static RuntimeConfig_S test_config() {
    RuntimeConfig_S cfg{};
    cfg.machineType = MachineType_TwoPlus;
    cfg.firmwareVersion = 23;
    cfg.confirmTimeout = ms_T{50};
    // long periods: only explicit poll_once() calls tick in these tests
    cfg.relayPollPeriod = ms_T{60000};
    cfg.analogPollPeriod = ms_T{60000};
    return cfg;
}

struct Pair_S {
    MonitorFeed_C emuFeed;
    MonitorFeed_C devFeed;
    ScriptedTransport_C* devPort = nullptr;
    ScriptedTransport_C* devAnalog = nullptr;
    std::unique_ptr<BpodSystem_C> emu;
    std::unique_ptr<BpodSystem_C> dev;

    Pair_S() {
        RuntimeConfig_S cfg = test_config();
        cfg.forceEmulator = true;
        emu = std::make_unique<BpodSystem_C>(cfg, emuFeed, emuFeed);

        auto port = std::make_unique<ScriptedTransport_C>();
        auto analog = std::make_unique<ScriptedTransport_C>();
        devPort = port.get();
        devAnalog = analog.get();
        devPort->confirm_all();
        dev = std::make_unique<BpodSystem_C>(test_config(), std::move(port), std::move(analog), devFeed, devFeed);
    }

    template <typename Fn>
    bool same(Fn fn) {
        const BpodError_E a = fn(*emu);
        const BpodError_E b = fn(*dev);
        if (a != b) {
            LOG_ERR("parity mismatch: emulator=" << bpod_error_str(a) << " device=" << bpod_error_str(b));
        }
        return a == b;
    }

    bool same_layout() {
        const ChannelLayout_S a = emu->status().snapshot_layout();
        const ChannelLayout_S b = dev->status().snapshot_layout();
        return a.eventNames == b.eventNames && a.inputChannelNames == b.inputChannelNames
            && a.outputChannelNames == b.outputChannelNames;
    }
};

static void test_mode_selection() {
    MonitorFeed_C feed;
    RuntimeConfig_S cfg = test_config();

    cfg.forceEmulator = true;
    cfg.serialPort = "/dev/ttyACM0";
    BpodSystem_C forced(cfg, feed, feed);
    EXPECT_TRUE(forced.emulator_mode());
    EXPECT_TRUE(forced.emulated_device() != nullptr);
    EXPECT_TRUE(forced.analog().is_supported());
    EXPECT_EQ(forced.status().sessionInfo.get_serial_port_name(), std::string("emulator"));

    cfg.forceEmulator = false;
    cfg.serialPort = "";
    BpodSystem_C noPort(cfg, feed, feed);
    EXPECT_TRUE(noPort.emulator_mode());

    cfg.serialPort = "/nonexistent/bpod-port";
    BpodSystem_C missing(cfg, feed, feed);
    EXPECT_TRUE(missing.emulator_mode());

    // no analog port before firmware 23
    cfg.firmwareVersion = 22;
    BpodSystem_C old(cfg, feed, feed);
    EXPECT_TRUE(!old.analog().is_supported());

    Pair_S p;
    EXPECT_TRUE(!p.dev->emulator_mode());
    EXPECT_TRUE(p.dev->emulated_device() == nullptr);
}

static void test_config_parity() {
    Pair_S p;
    using V = std::vector<uint8_t>;

    EXPECT_TRUE(p.same([](BpodSystem_C& s) { return s.set_flex_io(V{ 0, 1, 2, 3 }); }));
    EXPECT_TRUE(p.same_layout());
    EXPECT_EQ(p.emu->emulated_device()->get_flex_types(), (V{ 0, 1, 2, 3 }));
    EXPECT_TRUE(p.same([](BpodSystem_C& s) { return s.set_flex_io(V{ 0, 1, 2 }); }));
    EXPECT_TRUE(p.same([](BpodSystem_C& s) { return s.set_flex_io(V{ 0, 9, 0, 0 }); }));

    p.emu->set_state_machine_running(true);
    p.dev->set_state_machine_running(true);
    EXPECT_TRUE(p.same([](BpodSystem_C& s) { return s.set_flex_io(V{ 2, 2, 2, 2 }); }));
    EXPECT_EQ(p.emu->set_flex_io(V{ 2, 2, 2, 2 }), BpodError_Busy);
    p.emu->set_state_machine_running(false);
    p.dev->set_state_machine_running(false);
    EXPECT_TRUE(p.same_layout());

    EXPECT_TRUE(p.same([](BpodSystem_C& s) { return s.set_flex_io_analog_sampling_rate(1000); }));
    EXPECT_EQ(p.emu->emulated_device()->get_cycles_per_sample(), 10u);
    EXPECT_TRUE(p.same([](BpodSystem_C& s) { return s.set_flex_io_analog_sampling_rate(250); }));
    EXPECT_EQ(p.emu->emulated_device()->get_cycles_per_sample(), 40u);
    EXPECT_TRUE(p.same([](BpodSystem_C& s) { return s.set_flex_io_analog_sampling_rate(0); }));
    EXPECT_TRUE(p.same([](BpodSystem_C& s) { return s.set_flex_io_analog_sampling_rate(2000); }));
    EXPECT_EQ(p.emu->hw_config().get_flex_config().samplingRateHz, 250u);
    EXPECT_EQ(p.dev->hw_config().get_flex_config().samplingRateHz, 250u);

    EXPECT_TRUE(p.same([](BpodSystem_C& s) { return s.set_status_led(0); }));
    EXPECT_EQ(p.emu->emulated_device()->get_status_led(), 0);
    EXPECT_TRUE(p.same([](BpodSystem_C& s) { return s.set_status_led(3); }));

    EXPECT_TRUE(p.same([](BpodSystem_C& s) { return s.reset_session_clock(); }));
    EXPECT_EQ(p.emu->emulated_device()->get_clock_resets(), 1u);
    EXPECT_EQ(p.emu->hw_config().get_session_clock_resets(), p.dev->hw_config().get_session_clock_resets());

    EXPECT_TRUE(!p.emu->status().g_desynchronized.load());
    EXPECT_TRUE(!p.dev->status().g_desynchronized.load());
}

static void test_relay_parity() {
    Pair_S p;
    for (BpodSystem_C* s : { p.emu.get(), p.dev.get() }) {
        EXPECT_TRUE(s->register_module(2, "AnalogIn1", 3, "/dev/ttyACM3"));
        EXPECT_TRUE(!s->register_module(7, "TooFar"));
    }

    EXPECT_TRUE(p.same([](BpodSystem_C& s) { return s.start_module_relay("AnalogIn1"); }));
    EXPECT_TRUE(p.same([](BpodSystem_C& s) { return s.start_module_relay("Serial1"); }));
    EXPECT_EQ(p.emu->start_module_relay("Serial1"), BpodError_AlreadyActive);
    EXPECT_EQ(p.emu->status().active_relay_slot(), p.dev->status().active_relay_slot());
    EXPECT_TRUE(p.emu->emulated_device()->is_relay_enabled(2));

    // module traffic reaches the feed on the relayed slot only
    EmulatedStateMachine_C* device = p.emu->emulated_device();
    EXPECT_TRUE(device->queue_module_bytes(2, bytes_T{ 'O', 'K' }));
    EXPECT_TRUE(!device->queue_module_bytes(0, bytes_T{ 'X' }));
    p.devPort->queue_rx(bytes_T{ 'O', 'K' });
    p.emu->relay().poll_once();
    p.dev->relay().poll_once();
    const auto emuChunks = p.emuFeed.take_relay_chunks();
    const auto devChunks = p.devFeed.take_relay_chunks();
    EXPECT_EQ(emuChunks.size(), std::size_t{1});
    EXPECT_EQ(devChunks.size(), std::size_t{1});
    if (emuChunks.size() == 1 && devChunks.size() == 1) {
        EXPECT_EQ(emuChunks[0].bytes, devChunks[0].bytes);
        EXPECT_EQ(emuChunks[0].moduleName, std::string("AnalogIn1"));
    }

    // a config command stops the relay first
    EXPECT_TRUE(p.same([](BpodSystem_C& s) { return s.reset_session_clock(); }));
    EXPECT_TRUE(!p.emu->relay().is_relaying());
    EXPECT_TRUE(!p.dev->relay().is_relaying());
    EXPECT_TRUE(!device->is_relay_enabled(2));

    EXPECT_TRUE(p.same([](BpodSystem_C& s) { return s.start_module_relay("NoSuchModule"); }));
    p.emu->stop_module_relay();
    p.dev->stop_module_relay();
    p.emu->stop_module_relay();
    EXPECT_EQ(p.emu->status().active_relay_slot(), -1);
    EXPECT_EQ(p.dev->status().active_relay_slot(), -1);
}

static void test_config_commands_vs_relay_thread() {
    RuntimeConfig_S cfg = test_config();
    cfg.forceEmulator = true;
    MonitorFeed_C feed;
    BpodSystem_C bpod(cfg, feed, feed);
    EXPECT_TRUE(bpod.register_module(0, "ValveModule1", 1));
    EmulatedStateMachine_C* device = bpod.emulated_device();

    std::atomic<bool> done{false};
    std::atomic<int> relayStarts{0};
    std::thread console([&]() {
        logger::tlabel = "console";
        while (!done.load()) {
            if (bpod.start_module_relay("ValveModule1") == BpodError_None) {
                relayStarts++;
            }
            // the module answers right away (0xEE is never a confirm byte)
            device->queue_module_bytes(0, bytes_T{ 0xEE, 0xEE });
            std::this_thread::yield();
        }
    });

    for (int i = 0; i < 200 && relayStarts.load() == 0; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
    int failures = 0;
    for (int i = 0; i < 300; i++) {
        if (bpod.set_status_led(i % 2) != BpodError_None) failures++;
        if (bpod.reset_session_clock() != BpodError_None) failures++;
    }
    done.store(true);
    console.join();

    EXPECT_EQ(failures, 0);
    EXPECT_TRUE(!bpod.status().g_desynchronized.load());
    EXPECT_TRUE(relayStarts.load() > 0);
    EXPECT_EQ(device->get_clock_resets(), 300u);
}

static void test_panel_parity() {
    Pair_S p;
    for (BpodSystem_C* s : { p.emu.get(), p.dev.get() }) {
        EXPECT_TRUE(s->set_default_panel(1, true));
        EXPECT_TRUE(!s->set_default_panel(9, true));
    }

    EXPECT_TRUE(p.same([](BpodSystem_C& s) { return s.select_panel(0); }));
    EXPECT_EQ(p.emu->status().active_relay_slot(), -1);
    EXPECT_TRUE(p.same([](BpodSystem_C& s) { return s.select_panel(99); }));
    EXPECT_TRUE(p.same([](BpodSystem_C& s) { return s.select_panel(-1); }));

    // panel 2 = slot 1, a default panel -> auto relay
    EXPECT_TRUE(p.same([](BpodSystem_C& s) { return s.select_panel(2); }));
    EXPECT_EQ(p.emu->status().active_relay_slot(), 1);
    EXPECT_EQ(p.dev->status().active_relay_slot(), 1);
    EXPECT_EQ(p.emu->status().g_current_panel.load(), 2);

    // non-default panel: relay stopped, nothing started
    EXPECT_TRUE(p.same([](BpodSystem_C& s) { return s.select_panel(1); }));
    EXPECT_EQ(p.emu->status().active_relay_slot(), -1);
    EXPECT_EQ(p.dev->status().active_relay_slot(), -1);

    // a protocol owns the device: default panel does not relay
    p.emu->set_being_used(true);
    p.dev->set_being_used(true);
    EXPECT_TRUE(p.same([](BpodSystem_C& s) { return s.select_panel(2); }));
    EXPECT_EQ(p.emu->status().active_relay_slot(), -1);
    EXPECT_EQ(p.dev->status().active_relay_slot(), -1);
}

static void test_emulated_analog() {
    Pair_S p;
    EmulatedStateMachine_C* device = p.emu->emulated_device();
    device->set_analog_autogen(false);

    EXPECT_EQ(p.emu->set_flex_io({ 2, 2, 0, 1 }), BpodError_None);
    EXPECT_TRUE(!device->queue_analog_record(1, { 5 })); // wrong channel count
    EXPECT_TRUE(device->queue_analog_record(1, { 5, 6 }));
    device->set_trial_number(7);
    EXPECT_EQ(p.emu->analog().poll_once(), std::size_t{1});
    const auto samples = p.emu->analog().snapshot_samples();
    EXPECT_EQ(samples.size(), std::size_t{1});
    EXPECT_EQ(samples[0].values, (std::vector<uint16_t>{ 5, 6 }));
    EXPECT_EQ(p.emuFeed.get_analog_sample_count(), 1u);

    // synthetic stream at 1kHz
    EXPECT_EQ(p.emu->set_flex_io_analog_sampling_rate(1000), BpodError_None);
    device->set_analog_autogen(true);
    std::this_thread::sleep_for(std::chrono::milliseconds{30});
    EXPECT_TRUE(p.emu->analog().poll_once() >= 10);
    AnalogSample_S latest;
    EXPECT_TRUE(p.emuFeed.get_latest_analog_sample(latest));
    EXPECT_EQ(latest.trialNumber, 7);
    EXPECT_EQ(latest.values.size(), std::size_t{2});
    EXPECT_TRUE(latest.values[0] <= 4095);

    // live session gating
    EXPECT_TRUE(p.emu->set_session_live(true));
    EXPECT_TRUE(p.emu->analog().is_running());
    EXPECT_EQ(p.emu->analog().get_sample_count(), std::size_t{0}); // new session
    EXPECT_TRUE(p.emu->set_session_live(false));
    EXPECT_TRUE(!p.emu->analog().is_running());
}

static void test_status_json() {
    Pair_S p;
    EXPECT_EQ(p.emu->set_flex_io({ 0, 1, 2, 3 }), BpodError_None);
    EXPECT_TRUE(p.emu->register_module(0, "Valve\"Driver"));

    const std::string state = StatusJson::state(*p.emu);
    EXPECT_TRUE(state.find("\"emulator\":true") != std::string::npos);
    EXPECT_TRUE(state.find("\"flex_types\":[0,1,2,3]") != std::string::npos);
    EXPECT_TRUE(state.find("\"relay_slot\":-1") != std::string::npos);

    const std::string layout = StatusJson::layout(*p.emu);
    EXPECT_TRUE(layout.find("\"Flex2DO\"") != std::string::npos);
    EXPECT_TRUE(layout.find("\"Flex3Trig1\"") != std::string::npos);

    const std::string modules = StatusJson::modules(*p.emu);
    EXPECT_TRUE(modules.find("\"Valve\\\"Driver\"") != std::string::npos);

    std::vector<RelayChunk_S> chunks{ RelayChunk_S{ 2, "AnalogIn1", bytes_T{ 1, 255 } } };
    EXPECT_EQ(StatusJson::relay_chunks(chunks, 0),
              std::string("{\"chunks\":[{\"slot\":2,\"module\":\"AnalogIn1\",\"bytes\":[1,255]}],\"dropped\":0}"));
    EXPECT_EQ(StatusJson::result(BpodError_AlreadyActive), std::string("{\"ok\":false,\"error\":\"already_active\"}"));
}

static void test_shutdown() {
    Pair_S p;
    EXPECT_EQ(p.dev->start_module_relay("Serial1"), BpodError_None);
    p.dev->shutdown();
    EXPECT_TRUE(!p.dev->relay().is_polling());
    EXPECT_TRUE(!p.devPort->is_open());
    EXPECT_TRUE(!p.devAnalog->is_open());
    p.dev->shutdown(); // idempotent
    // commands after shutdown fail cleanly
    EXPECT_EQ(p.dev->reset_session_clock(), BpodError_TransportClosed);
}

int main() {
    logger::tlabel = "EmulatorParitySelfTest";
    test_mode_selection();
    test_config_parity();
    test_relay_parity();
    test_config_commands_vs_relay_thread();
    test_panel_parity();
    test_emulated_analog();
    test_status_json();
    test_shutdown();
    return selftest::summary("EmulatorParitySelfTest");
}
