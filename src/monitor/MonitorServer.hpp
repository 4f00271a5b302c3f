/*
MONITOR SERVER
- httplib::Server bound to 127.0.0.1; the console-facing adapter of the runtime
- blocks inside listen(), hence runs on its own thread (see main)
- GET  /state    runtime status + device identity
- GET  /layout   event / input / output channel tables
- GET  /modules  module table
- GET  /relay    module bytes relayed since the last GET /relay
- POST /relay    {"action":"start","module":"<name>"} | {"action":"stop"}
- POST /panel    {"panel":N}  (0 = state machine panel, k = module slot k-1)
- no rendering: it only reads the StateStore / feed and forwards commands to BpodSystem_C
*/
#pragma once
#include <atomic>
#include <memory>
#include <string_view>
#include <httplib.h>
#include "MonitorFeed.hpp"
#include "../device/BpodSystem.h"

class MonitorServer_C {
public: // API
    MonitorServer_C(BpodSystem_C& system, MonitorFeed_C& feed, int port = 7777);
    ~MonitorServer_C();
    bool http_start_server();              // constructs httplib::Server + routes
    bool http_listen_for_poll_requests();  // blocking .listen()
    bool http_close_server();              // makes .listen() return
    bool get_is_running() const { return is_running_.load(std::memory_order_acquire); }
private:
    BpodSystem_C& system_;
    MonitorFeed_C& feed_;
    std::unique_ptr<httplib::Server> liveServer_;
    int port_;
    std::atomic<bool> is_running_{false};
    // Handlers
    void handle_get_state(const httplib::Request& req, httplib::Response& res);
    void handle_get_layout(const httplib::Request& req, httplib::Response& res);
    void handle_get_modules(const httplib::Request& req, httplib::Response& res);
    void handle_get_relay(const httplib::Request& req, httplib::Response& res);
    void handle_post_relay(const httplib::Request& req, httplib::Response& res);
    void handle_post_panel(const httplib::Request& req, httplib::Response& res);
    void handle_options_and_set(const httplib::Request& req, httplib::Response& res); // CORS preflight
    void write_json(httplib::Response& res, std::string_view json_body, int status = 200) const;
}; // MonitorServer_C
