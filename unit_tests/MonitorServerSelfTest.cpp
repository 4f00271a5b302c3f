#include "SelfTestUtils.hpp"
#include <chrono>
#include <string>
#include <thread>
#include <httplib.h>
#include "../src/device/BpodSystem.h"
#include "../src/monitor/MonitorFeed.hpp"
#include "../src/monitor/MonitorServer.hpp"

/* TEST COMPONENTS:
- monitor server on an emulator-backed runtime, driven with httplib::Client
- GET /state, /layout, /modules
- POST /relay start/stop, module bytes come back on GET /relay
- POST /panel, bad requests (content type, missing field, unknown panel)
*/

static constexpr int kTestPort = 17777;

int main() {
    logger::tlabel = "MonitorServerSelfTest";

    RuntimeConfig_S cfg{};
    cfg.forceEmulator = true;
    cfg.confirmTimeout = ms_T{50};
    cfg.relayPollPeriod = ms_T{10};

    MonitorFeed_C feed;
    BpodSystem_C bpod(cfg, feed, feed);
    bpod.register_module(1, "ValveModule1", 2);

    MonitorServer_C server(bpod, feed, kTestPort);
    EXPECT_TRUE(server.http_start_server());
    std::thread http([&server]() { server.http_listen_for_poll_requests(); });
    for (int i = 0; i < 200 && !server.get_is_running(); i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
    std::this_thread::sleep_for(std::chrono::milliseconds{50});

    httplib::Client cli("127.0.0.1", kTestPort);

    auto state = cli.Get("/state");
    EXPECT_TRUE(state && state->status == 200);
    if (state) {
        EXPECT_TRUE(state->body.find("\"emulator\":true") != std::string::npos);
        EXPECT_TRUE(state->body.find("\"relay_slot\":-1") != std::string::npos);
    }

    auto layout = cli.Get("/layout");
    EXPECT_TRUE(layout && layout->status == 200 && layout->body.find("\"Flex1High\"") != std::string::npos);

    auto modules = cli.Get("/modules");
    EXPECT_TRUE(modules && modules->body.find("\"ValveModule1\"") != std::string::npos);

    // relay round trip through the emulated module
    auto start = cli.Post("/relay", "{\"action\":\"start\",\"module\":\"ValveModule1\"}", "application/json");
    EXPECT_TRUE(start && start->status == 200);
    EXPECT_TRUE(bpod.emulated_device()->queue_module_bytes(1, bytes_T{ 'o', 'k' }));
    for (int i = 0; i < 100 && feed.get_pending_relay_bytes() < 2; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    auto relay = cli.Get("/relay");
    EXPECT_TRUE(relay && relay->body == "{\"chunks\":[{\"slot\":1,\"module\":\"ValveModule1\",\"bytes\":[111,107]}],\"dropped\":0}");

    auto again = cli.Post("/relay", "{\"action\":\"start\",\"module\":\"ValveModule1\"}", "application/json");
    EXPECT_TRUE(again && again->status == 409 && again->body.find("already_active") != std::string::npos);

    auto stop = cli.Post("/relay", "{\"action\":\"stop\"}", "application/json");
    EXPECT_TRUE(stop && stop->status == 200);
    EXPECT_EQ(bpod.status().active_relay_slot(), -1);

    // panels
    auto panel = cli.Post("/panel", "{\"panel\":2}", "application/json");
    EXPECT_TRUE(panel && panel->status == 200);
    EXPECT_EQ(bpod.status().g_current_panel.load(), 2);
    auto badPanel = cli.Post("/panel", "{\"panel\":42}", "application/json");
    EXPECT_TRUE(badPanel && badPanel->status == 409);

    // malformed requests
    auto noType = cli.Post("/panel", "{\"panel\":1}", "text/plain");
    EXPECT_TRUE(noType && noType->status == 415);
    auto noField = cli.Post("/relay", "{\"module\":\"ValveModule1\"}", "application/json");
    EXPECT_TRUE(noField && noField->status == 400);

    server.http_close_server();
    http.join();
    EXPECT_TRUE(!server.get_is_running());
    bpod.shutdown();
    return selftest::summary("MonitorServerSelfTest");
}
