/*
==============================================================================
	File: BpodSystem.h
	Desc: Composition root of the host runtime. Decides the mode once
	(real device vs emulator), opens the transports, builds the shared
	StateStore and wires every component to it:

	  transport(s) -> ProtocolClient_C -> HardwareConfigManager_C
	                                   -> ModuleRelayController_C -> relay sink
	  analog transport -> AnalogStreamingController_C -> analog sink

	Console-facing entry points (config commands, relay, panel switch,
	session flags) go through here so the relay is stopped before any
	command that needs a clean confirmation stream.

	Shutdown order (destructor or shutdown()): relay + analog pollers
	stopped and joined, then the analog port, then the command port.
==============================================================================
*/

#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "HardwareDescription.h"
#include "ProtocolClient.h"
#include "HardwareConfig.h"
#include "ModuleRelay.h"
#include "IRelaySink.h"
#include "../acq/AnalogStreamer.h"
#include "../acq/IAnalogSink.h"
#include "../shared/StateStore.hpp"
#include "../transport/ITransport.h"
#include "../transport/EmulatedTransport.h"
#include "../utils/RuntimeConfig.hpp"

class BpodSystem_C {
public:
	// Opens the configured serial port(s); falls back to the emulator when forced,
	// when no port is configured, or when the port cannot be opened.
	BpodSystem_C(const RuntimeConfig_S& cfg, IRelaySink_S& relaySink, IAnalogSink_S& analogSink);
	// Device mode over caller-provided transports (analogPort may be null)
	BpodSystem_C(const RuntimeConfig_S& cfg, std::unique_ptr<ITransport_S> commandPort,
	             std::unique_ptr<ITransport_S> analogPort, IRelaySink_S& relaySink, IAnalogSink_S& analogSink);
	~BpodSystem_C();

	BpodSystem_C(const BpodSystem_C&) = delete;
	BpodSystem_C& operator=(const BpodSystem_C&) = delete;

	bool emulator_mode() const { return emulatorMode_; }
	// null in device mode
	EmulatedStateMachine_C* emulated_device() { return emulated_.get(); }

	StateStore_s& status() { return status_; }
	const HardwareDescription_S& hardware() const { return hw_; }
	ProtocolClient_C& client() { return *client_; }
	HardwareConfigManager_C& hw_config() { return *hwConfig_; }
	ModuleRelayController_C& relay() { return *relay_; }
	AnalogStreamingController_C& analog() { return *analog_; }

	// ---- hardware configuration (relay stopped first) ----
	BpodError_E set_flex_io(const std::vector<uint8_t>& channelTypes);
	BpodError_E set_flex_io_analog_sampling_rate(uint32_t hz);
	BpodError_E set_status_led(int state);
	BpodError_E reset_session_clock();

	// ---- modules ----
	// module discovery is external; this records what it found
	bool register_module(std::size_t slot, const std::string& name, uint32_t firmwareVersion = 0,
	                     const std::string& usbPort = "");
	BpodError_E start_module_relay(const std::string& moduleName);
	void stop_module_relay();
	// a default panel auto-starts its module's relay when selected
	bool set_default_panel(std::size_t slot, bool isDefault);
	// 0 = state machine panel, k >= 1 = module slot k-1
	BpodError_E select_panel(int panel);

	// ---- session flags (driven by the external session/trial controller) ----
	bool set_session_live(bool live);     // starts/stops the analog stream
	void set_state_machine_running(bool running);
	void set_being_used(bool used);

	// idempotent
	void shutdown();

private:
	RuntimeConfig_S cfg_;
	HardwareDescription_S hw_;
	bool emulatorMode_ = false;

	// transports declared before the components that reference them
	std::shared_ptr<EmulatedStateMachine_C> emulated_;
	std::unique_ptr<ITransport_S> commandPort_;
	std::unique_ptr<ITransport_S> analogPort_;

	StateStore_s status_;
	std::unique_ptr<ProtocolClient_C> client_;
	std::unique_ptr<HardwareConfigManager_C> hwConfig_;
	std::unique_ptr<ModuleRelayController_C> relay_;
	std::unique_ptr<AnalogStreamingController_C> analog_;

	// held across "stop relay + confirmed command" and every relay start/stop from
	// the console, so a relay cannot come back on before the confirm read
	std::mutex cmd_mtx_;
	std::mutex panel_mtx_;
	std::vector<bool> defaultPanels_;
	bool shutDown_ = false;

	void open_transports();
	void open_emulator();
	void wire_components(IRelaySink_S& relaySink, IAnalogSink_S& analogSink);
	void stop_relay_if_active();
};
