// httplib::Request = everything that comes from the console client
// httplib::Response = everything the server writes back
// data exchanges are in json format

#include "MonitorServer.hpp"
#include <string>
#include "StatusJson.hpp"
#include "../utils/JsonUtils.hpp"
#include "../utils/Logger.hpp"

MonitorServer_C::MonitorServer_C(BpodSystem_C& system, MonitorFeed_C& feed, int port)
    : system_(system), feed_(feed), port_(port) {
}

MonitorServer_C::~MonitorServer_C() {
    if (liveServer_) {
        liveServer_->stop();
    }
}

// ============= Helpers ============
static inline void set_cors_headers(httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
}

static inline bool is_json_request(const httplib::Request& req) {
    auto it = req.headers.find("Content-Type");
    return it != req.headers.end() && it->second.find("application/json") != std::string::npos;
}

// Writes JSON string into httplib::Response body with CORS headers
void MonitorServer_C::write_json(httplib::Response& res, std::string_view json_body, int status) const {
    set_cors_headers(res);
    res.set_content(std::string(json_body), "application/json");
    res.status = status;
}

void MonitorServer_C::handle_options_and_set(const httplib::Request& req, httplib::Response& res) {
    (void)req;
    set_cors_headers(res);
    res.status = 200;
}

// ============== Handlers ==================

void MonitorServer_C::handle_get_state(const httplib::Request& req, httplib::Response& res) {
    (void)req;
    write_json(res, StatusJson::state(system_));
}

void MonitorServer_C::handle_get_layout(const httplib::Request& req, httplib::Response& res) {
    (void)req;
    write_json(res, StatusJson::layout(system_));
}

void MonitorServer_C::handle_get_modules(const httplib::Request& req, httplib::Response& res) {
    (void)req;
    write_json(res, StatusJson::modules(system_));
}

void MonitorServer_C::handle_get_relay(const httplib::Request& req, httplib::Response& res) {
    (void)req;
    const auto chunks = feed_.take_relay_chunks();
    write_json(res, StatusJson::relay_chunks(chunks, feed_.get_dropped_relay_bytes()));
}

void MonitorServer_C::handle_post_relay(const httplib::Request& req, httplib::Response& res) {
    if (!is_json_request(req)) {
        write_json(res, "{\"error\":\"content_type\"}", 415);
        return;
    }
    std::string action;
    if (!JSON::extract_json_string(req.body, "action", action)) {
        JSON::json_extract_fail("POST /relay", "action");
        write_json(res, "{\"error\":\"missing_action\"}", 400);
        return;
    }

    if (action == "stop") {
        system_.stop_module_relay();
        write_json(res, StatusJson::result(BpodError_None));
    } else if (action == "start") {
        std::string module;
        if (!JSON::extract_json_string(req.body, "module", module)) {
            JSON::json_extract_fail("POST /relay", "module");
            write_json(res, "{\"error\":\"missing_module\"}", 400);
            return;
        }
        const BpodError_E err = system_.start_module_relay(module);
        write_json(res, StatusJson::result(err), err == BpodError_None ? 200 : 409);
    } else {
        write_json(res, "{\"error\":\"unknown_action\"}", 400);
    }
}

void MonitorServer_C::handle_post_panel(const httplib::Request& req, httplib::Response& res) {
    if (!is_json_request(req)) {
        write_json(res, "{\"error\":\"content_type\"}", 415);
        return;
    }
    int panel = 0;
    if (!JSON::extract_json_int(req.body, "panel", panel)) {
        JSON::json_extract_fail("POST /panel", "panel");
        write_json(res, "{\"error\":\"missing_panel\"}", 400);
        return;
    }
    const BpodError_E err = system_.select_panel(panel);
    write_json(res, StatusJson::result(err), err == BpodError_None ? 200 : 409);
}

// ===================== Lifecycle ==========================
bool MonitorServer_C::http_start_server() {
    logger::tlabel = "Monitor Server";
    if (is_running_.load() || liveServer_) return false;

    liveServer_ = std::make_unique<httplib::Server>();

    liveServer_->Get("/state",
        [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_get_state(rq, rs); });
    liveServer_->Get("/layout",
        [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_get_layout(rq, rs); });
    liveServer_->Get("/modules",
        [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_get_modules(rq, rs); });
    liveServer_->Get("/relay",
        [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_get_relay(rq, rs); });
    liveServer_->Post("/relay",
        [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_post_relay(rq, rs); });
    liveServer_->Post("/panel",
        [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_post_panel(rq, rs); });

    // CORS preflight for POSTs
    liveServer_->Options("/relay",
        [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_options_and_set(rq, rs); });
    liveServer_->Options("/panel",
        [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_options_and_set(rq, rs); });

    LOG_ALWAYS("Monitor server routes registered");
    return true;
}

bool MonitorServer_C::http_listen_for_poll_requests() {
    logger::tlabel = "Monitor Server";
    if (!liveServer_) {
        LOG_ERR("Monitor server not initialized; cannot start listening");
        return false;
    }
    is_running_.store(true, std::memory_order_release);
    LOG_ALWAYS("Monitor listening on 127.0.0.1:" << port_);

    // blocking until http_close_server()
    const bool ok = liveServer_->listen("127.0.0.1", port_);
    is_running_.store(false, std::memory_order_release);

    if (!ok) {
        LOG_ERR("Monitor listen failed on port " << port_);
    } else {
        LOG_ALWAYS("Monitor listen stopped");
    }
    return ok;
}

bool MonitorServer_C::http_close_server() {
    logger::tlabel = "Monitor Server";
    if (!liveServer_) return false;
    liveServer_->stop(); // breaks .listen()
    LOG_ALWAYS("Monitor server closed");
    return true;
}
