#include "ModuleRelay.h"
#include "../utils/Logger.hpp"
#include "../utils/WireCodec.h"

ModuleRelayController_C::ModuleRelayController_C(ProtocolClient_C& client, StateStore_s& status, IRelaySink_S& sink,
                                                 ms_T pollPeriod)
    : client_(client), status_(status), sink_(sink) {
    poller_ = std::make_unique<PeriodicTask_C>("Relay Poller", pollPeriod, [this]() { this->poll_once(); });
}

// Destructor (RAII: poller joined before the references it uses go away)
ModuleRelayController_C::~ModuleRelayController_C() {
    poller_->stop();
}

BpodError_E ModuleRelayController_C::start(const std::string& moduleName) {
    const int slot = status_.find_module(moduleName);
    if (slot < 0) {
        logger::tlabel = "Module Relay";
        LOG_WARN("relay: no module named '" << moduleName << "'");
        return BpodError_UnknownModule;
    }
    return start_slot(static_cast<std::size_t>(slot));
}

BpodError_E ModuleRelayController_C::start_slot(std::size_t slot) {
    logger::tlabel = "Module Relay";
    std::lock_guard<std::mutex> lock(ctl_mtx_);

    if (slot >= status_.module_count()) {
        return BpodError_UnknownModule;
    }
    // check-and-set under the StateStore's module lock
    if (!status_.try_claim_relay(slot)) {
        LOG_WARN("relay: you must stop the active module relay before starting another one (active slot "
                 << status_.active_relay_slot() << ")");
        return BpodError_AlreadyActive;
    }

    const BpodError_E err = client_.send_frame(WireCodec_S::encode_module_relay(static_cast<uint8_t>(slot), true));
    if (err != BpodError_None) {
        status_.clear_relay_flags();
        LOG_ERR("relay: could not enable relay for slot " << slot << " (" << bpod_error_str(err) << ")");
        return err;
    }

    poller_->start();
    LOG_ALWAYS("relay: started for slot " << slot);
    return BpodError_None;
}

void ModuleRelayController_C::stop() {
    logger::tlabel = "Module Relay";
    std::lock_guard<std::mutex> lock(ctl_mtx_);

    // 1) poller first: no tick may read after this returns
    poller_->stop();

    // 2) relay off on every slot, not just the active one
    const std::size_t nSlots = status_.module_count();
    for (std::size_t i = 0; i < nSlots; i++) {
        const BpodError_E err = client_.send_frame(WireCodec_S::encode_module_relay(static_cast<uint8_t>(i), false));
        if (err != BpodError_None) {
            LOG_ERR("relay: relay-off for slot " << i << " failed (" << bpod_error_str(err) << ")");
        }
    }

    // 3) stale module bytes must not reach the next command's confirm read
    const std::size_t trashed = client_.drain();
    if (trashed > 0) {
        LOG_DBG("relay: discarded " << trashed << " bytes after stop");
    }

    // 4) flags
    status_.clear_relay_flags();
}

void ModuleRelayController_C::poll_once() {
    const int slot = status_.active_relay_slot();
    if (slot < 0) {
        return;
    }
    bytes_T bytes;
    if (client_.read_available(bytes) == 0) {
        return;
    }
    bytesRelayed_.fetch_add(bytes.size(), std::memory_order_acq_rel);

    std::string name;
    const auto modules = status_.snapshot_modules();
    if (static_cast<std::size_t>(slot) < modules.size()) {
        name = modules[slot].name;
    }
    LOG_DBG("relay rx (" << name << ") [" << WireCodec_S::to_hex(bytes.data(), bytes.size()) << "]");
    sink_.on_module_bytes(static_cast<std::size_t>(slot), name, bytes);
}
