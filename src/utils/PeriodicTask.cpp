#include "PeriodicTask.hpp"
#include "Logger.hpp"
#include <exception>
#include <utility>

PeriodicTask_C::PeriodicTask_C(std::string name, std::chrono::milliseconds period, tick_fn_T tick)
    : name_(std::move(name)), period_(period), tick_(std::move(tick)) {
}

PeriodicTask_C::~PeriodicTask_C() {
    stop();
}

bool PeriodicTask_C::start() {
    if (running_.load(std::memory_order_acquire)) {
        return false;
    }
    // previous worker may have exited on its own (tick threw) -> reap it first
    if (worker_.joinable()) {
        worker_.join();
    }
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stopRequested_ = false;
    }
    running_.store(true, std::memory_order_release);
    worker_ = std::thread(&PeriodicTask_C::run, this);
    LOG_DBG("task '" << name_ << "' started (period " << period_.count() << " ms)");
    return true;
}

void PeriodicTask_C::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stopRequested_ = true;
    }
    cv_.notify_all();

    if (!worker_.joinable()) {
        running_.store(false, std::memory_order_release);
        return;
    }
    if (worker_.get_id() == std::this_thread::get_id()) {
        // called from inside tick: worker exits after this tick returns
        return;
    }
    worker_.join();
    running_.store(false, std::memory_order_release);
    LOG_DBG("task '" << name_ << "' stopped after " << tickCount_.load() << " ticks");
}

void PeriodicTask_C::run() {
    logger::tlabel = name_.c_str();
    auto nextTick = std::chrono::steady_clock::now() + period_;

    while (true) {
        {
            std::unique_lock<std::mutex> lock(mtx_);
            // sleep until next tick unless a stop is requested
            if (cv_.wait_until(lock, nextTick, [this] { return stopRequested_; })) {
                break;
            }
        }

        try {
            tick_();
        }
        catch (const std::exception& e) {
            LOG_ERR("task '" << name_ << "' tick threw: " << e.what() << "; stopping task");
            break;
        }
        tickCount_.fetch_add(1, std::memory_order_acq_rel);

        // fixed rate: if a tick overran, skip the missed slots instead of bursting
        nextTick += period_;
        const auto now = std::chrono::steady_clock::now();
        if (nextTick < now) {
            nextTick = now + period_;
        }
    }
    running_.store(false, std::memory_order_release);
}
