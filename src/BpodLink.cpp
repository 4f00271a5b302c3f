#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <functional>
#include <thread>
#include "utils/Logger.hpp"
#include "utils/RuntimeConfig.hpp"
#include "device/BpodSystem.h"
#include "monitor/MonitorFeed.hpp"
#include "monitor/MonitorServer.hpp"

// Global "please stop" flag set by Ctrl+C (SIGINT) to shut down cleanly
static std::atomic<bool> g_stop{false};

void handle_sigint(int) {
    g_stop.store(true, std::memory_order_relaxed);
}

void http_thread_fn(MonitorServer_C& server) {
    logger::tlabel = "Monitor Server";
    try {
        if (!server.http_listen_for_poll_requests()) {
            g_stop.store(true, std::memory_order_relaxed);
        }
    }
    catch (const std::exception& e) {
        LOG_ERR("monitor: FATAL unhandled exception: " << e.what());
        g_stop.store(true, std::memory_order_relaxed);
    }
}

int main() {
    logger::init();
    logger::tlabel = "main";
    LOG_ALWAYS("start (VERBOSE=" << logger::verbose() << ")");

    const RuntimeConfig_S cfg = bpodlink::config::load_from_env();

    MonitorFeed_C feed;
    BpodSystem_C bpod(cfg, feed, feed);

    MonitorServer_C server(bpod, feed, cfg.monitorPort);
    if (!server.http_start_server()) {
        LOG_ERR("could not start monitor server");
        return 1;
    }

    // interrupt caused by SIGINT -> 'handle_sigint' acts like ISR (callback handle)
    std::signal(SIGINT, handle_sigint);
    std::signal(SIGTERM, handle_sigint);

    std::thread http(http_thread_fn, std::ref(server));

    // Poll the atomic flag g_stop; keep sleep tiny so Ctrl-C feels instant
    while (!g_stop.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(std::chrono::milliseconds{30});
    }

    // on shutdown: stop serving first so no request races the teardown
    server.http_close_server();
    http.join();
    bpod.shutdown();
    return 0;
}
