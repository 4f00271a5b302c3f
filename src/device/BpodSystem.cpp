#include "BpodSystem.h"
#include "../transport/SerialTransport.h"
#include "../utils/Logger.hpp"
#include <utility>

BpodSystem_C::BpodSystem_C(const RuntimeConfig_S& cfg, IRelaySink_S& relaySink, IAnalogSink_S& analogSink)
    : cfg_(cfg), hw_(bpodlink::hw::make_default_hardware(cfg.machineType, cfg.firmwareVersion)) {
    open_transports();
    wire_components(relaySink, analogSink);
}

BpodSystem_C::BpodSystem_C(const RuntimeConfig_S& cfg, std::unique_ptr<ITransport_S> commandPort,
                           std::unique_ptr<ITransport_S> analogPort, IRelaySink_S& relaySink,
                           IAnalogSink_S& analogSink)
    : cfg_(cfg), hw_(bpodlink::hw::make_default_hardware(cfg.machineType, cfg.firmwareVersion)),
      commandPort_(std::move(commandPort)), analogPort_(std::move(analogPort)) {
    if (!commandPort_) {
        throw transport_error("BpodSystem: no command transport");
    }
    wire_components(relaySink, analogSink);
}

BpodSystem_C::~BpodSystem_C() {
    shutdown();
}

void BpodSystem_C::open_emulator() {
    emulatorMode_ = true;
    emulated_ = std::make_shared<EmulatedStateMachine_C>(hw_);
    commandPort_ = std::make_unique<EmulatedTransport_C>(emulated_, EmulatedTransport_C::Channel_E::Command);
    if (hw_.has_analog_port()) {
        analogPort_ = std::make_unique<EmulatedTransport_C>(emulated_, EmulatedTransport_C::Channel_E::Analog);
    }
}

void BpodSystem_C::open_transports() {
    logger::tlabel = "Bpod System";
    if (cfg_.forceEmulator) {
        LOG_ALWAYS("emulator mode forced by configuration");
        open_emulator();
        return;
    }
    if (cfg_.serialPort.empty()) {
        LOG_WARN("no serial port configured; starting in emulator mode");
        open_emulator();
        return;
    }

    try {
        commandPort_ = std::make_unique<SerialTransport_C>(cfg_.serialPort, cfg_.baudRate);
    } catch (const transport_error& e) {
        LOG_WARN("device not detected (" << e.what() << "); starting in emulator mode");
        open_emulator();
        return;
    }

    if (hw_.has_analog_port()) {
        if (cfg_.analogPort.empty()) {
            LOG_WARN("no analog port configured; Flex I/O analog streaming disabled");
        } else {
            try {
                analogPort_ = std::make_unique<SerialTransport_C>(cfg_.analogPort, cfg_.baudRate);
            } catch (const transport_error& e) {
                LOG_ERR("could not open analog port (" << e.what() << "); Flex I/O analog streaming disabled");
            }
        }
    }
}

void BpodSystem_C::wire_components(IRelaySink_S& relaySink, IAnalogSink_S& analogSink) {
    status_.init_layout(hw_, bpodlink::hw::build_channel_layout(hw_));
    status_.init_modules(hw_.nUartChannels);
    status_.sessionInfo.set_serial_port_name(commandPort_->describe());
    defaultPanels_.assign(hw_.nUartChannels, false);

    client_ = std::make_unique<ProtocolClient_C>(*commandPort_, cfg_.confirmTimeout, &status_);
    hwConfig_ = std::make_unique<HardwareConfigManager_C>(*client_, status_, hw_);
    relay_ = std::make_unique<ModuleRelayController_C>(*client_, status_, relaySink, cfg_.relayPollPeriod);
    analog_ = std::make_unique<AnalogStreamingController_C>(analogPort_.get(), status_, *hwConfig_, analogSink,
                                                            cfg_.analogPollPeriod);

    LOG_ALWAYS("connected: " << machine_type_str(hw_.identity.machineType) << " firmware v"
               << hw_.identity.firmwareVersion << " on " << commandPort_->describe()
               << (emulatorMode_ ? " [EMULATOR]" : "")
               << " | flex=" << hw_.nFlexIO << " uart=" << hw_.nUartChannels
               << " analogPort=" << (analog_->is_supported() ? analogPort_->describe() : std::string("none")));
}

void BpodSystem_C::stop_relay_if_active() {
    if (relay_->is_relaying() || relay_->is_polling()) {
        LOG_DBG("stopping module relay before device command");
        relay_->stop();
    }
}

BpodError_E BpodSystem_C::set_flex_io(const std::vector<uint8_t>& channelTypes) {
    std::lock_guard<std::mutex> lock(cmd_mtx_);
    stop_relay_if_active();
    return hwConfig_->set_flex_io(channelTypes);
}

BpodError_E BpodSystem_C::set_flex_io_analog_sampling_rate(uint32_t hz) {
    std::lock_guard<std::mutex> lock(cmd_mtx_);
    stop_relay_if_active();
    return hwConfig_->set_flex_io_analog_sampling_rate(hz);
}

BpodError_E BpodSystem_C::set_status_led(int state) {
    std::lock_guard<std::mutex> lock(cmd_mtx_);
    stop_relay_if_active();
    return hwConfig_->set_status_led(state);
}

BpodError_E BpodSystem_C::reset_session_clock() {
    std::lock_guard<std::mutex> lock(cmd_mtx_);
    stop_relay_if_active();
    return hwConfig_->reset_session_clock();
}

bool BpodSystem_C::register_module(std::size_t slot, const std::string& name, uint32_t firmwareVersion,
                                   const std::string& usbPort) {
    const bool ok = status_.set_module(slot, name, true, firmwareVersion, usbPort);
    if (!ok) {
        logger::tlabel = "Bpod System";
        LOG_WARN("register_module: slot " << slot << " out of range (" << status_.module_count() << " UART channels)");
    }
    return ok;
}

BpodError_E BpodSystem_C::start_module_relay(const std::string& moduleName) {
    std::lock_guard<std::mutex> lock(cmd_mtx_);
    return relay_->start(moduleName);
}

void BpodSystem_C::stop_module_relay() {
    std::lock_guard<std::mutex> lock(cmd_mtx_);
    relay_->stop();
}

bool BpodSystem_C::set_default_panel(std::size_t slot, bool isDefault) {
    std::lock_guard<std::mutex> lock(panel_mtx_);
    if (slot >= defaultPanels_.size()) {
        return false;
    }
    defaultPanels_[slot] = isDefault;
    return true;
}

BpodError_E BpodSystem_C::select_panel(int panel) {
    logger::tlabel = "Bpod System";
    std::lock_guard<std::mutex> cmdLock(cmd_mtx_);
    std::lock_guard<std::mutex> lock(panel_mtx_);
    if (panel < 0 || static_cast<std::size_t>(panel) > defaultPanels_.size()) {
        LOG_WARN("select_panel: no panel " << panel);
        return BpodError_InvalidArgument;
    }

    relay_->stop();
    status_.g_current_panel.store(panel, std::memory_order_release);
    if (panel == 0) {
        return BpodError_None; // state machine panel never relays
    }

    const std::size_t slot = static_cast<std::size_t>(panel - 1);
    if (!defaultPanels_[slot]) {
        return BpodError_None;
    }
    if (!status_.can_auto_relay()) {
        LOG_DBG("select_panel: device in use by a protocol, not relaying slot " << slot);
        return BpodError_None;
    }
    return relay_->start_slot(slot);
}

bool BpodSystem_C::set_session_live(bool live) {
    status_.g_live.store(live, std::memory_order_release);
    if (!live) {
        analog_->stop();
        return true;
    }
    if (!analog_->is_supported()) {
        return false;
    }
    analog_->clear_samples();
    return analog_->start();
}

void BpodSystem_C::set_state_machine_running(bool running) {
    status_.g_in_state_matrix.store(running, std::memory_order_release);
}

void BpodSystem_C::set_being_used(bool used) {
    status_.g_being_used.store(used, std::memory_order_release);
}

void BpodSystem_C::shutdown() {
    if (shutDown_) {
        return;
    }
    shutDown_ = true;
    logger::tlabel = "Bpod System";
    LOG_ALWAYS("shutting down...");

    std::lock_guard<std::mutex> lock(cmd_mtx_);
    if (relay_) relay_->stop();
    if (analog_) analog_->stop();
    if (analogPort_) analogPort_->close();
    if (commandPort_) commandPort_->close();
    LOG_ALWAYS("shutdown complete");
}
