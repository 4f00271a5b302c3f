/*
==============================================================================
	File: EmulatedTransport.h
	Desc: Software stand-in for the state machine, used when no device is
	attached (or BPOD_EMULATOR is set). Sits below the protocol client, so
	every layer above it runs the exact same code in both modes.

	EmulatedStateMachine_C models the device side:
	  - parses command frames written by the host ('J', 'Q', '^', ':', '*')
	  - answers confirmed commands with the confirm byte (1), or 0 if the
	    frame carries a value the firmware would reject
	  - tracks Flex types, cycles-per-sample, LED, per-slot relay state
	  - module bytes injected with queue_module_bytes() reach the host only
	    while the relay for that slot is enabled (as on hardware)
	  - analog records: synthetic waveforms for each analog-input Flex channel,
	    produced at the configured rate from elapsed time (or queued by tests)

	EmulatedTransport_C exposes one channel of the model (command or analog)
	through ITransport_S.

	NOTE: the model is shared by both channels (two poller threads); it is
	internally locked.
==============================================================================
*/

#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "ITransport.h"
#include "../device/HardwareDescription.h"

class EmulatedStateMachine_C {
public:
	explicit EmulatedStateMachine_C(const HardwareDescription_S& hw);

	EmulatedStateMachine_C(const EmulatedStateMachine_C&) = delete;
	EmulatedStateMachine_C& operator=(const EmulatedStateMachine_C&) = delete;

	// host -> device (command channel)
	void receive(const uint8_t* data, std::size_t len);
	// device -> host (command channel)
	std::size_t read_command(uint8_t* dest, std::size_t len);
	std::size_t command_bytes_available() const;

	// device -> host (analog channel)
	std::size_t read_analog(uint8_t* dest, std::size_t len);
	std::size_t analog_bytes_available();

	// a module on UART slot `slot` emits bytes; false if dropped (relay off for that slot)
	bool queue_module_bytes(std::size_t slot, const bytes_T& bytes);
	// one analog record on the analog port; values.size() must match the analog-input count
	bool queue_analog_record(uint16_t trialNumber, const std::vector<uint16_t>& values);
	// time based synthetic analog stream (on by default)
	void set_analog_autogen(bool enabled);
	void set_trial_number(uint16_t trialNumber);
	// fault injection: a muted device swallows commands without answering
	void set_muted(bool muted);

	// device state, for status and tests
	std::vector<uint8_t> get_flex_types() const;
	uint32_t get_cycles_per_sample() const;
	int get_status_led() const;
	uint32_t get_clock_resets() const;
	bool is_relay_enabled(std::size_t slot) const;
	std::size_t get_frames_received() const;
	const HardwareDescription_S& get_hardware() const { return hw_; }

private:
	const HardwareDescription_S hw_;
	mutable std::mutex mtx_;

	bytes_T rxPending_;             // partial frame from the host
	std::deque<uint8_t> cmdOut_;    // confirms + relayed module bytes
	std::deque<uint8_t> analogOut_;

	std::vector<uint8_t> flexTypes_;
	uint32_t cyclesPerSample_;
	int statusLed_ = 1;
	uint32_t clockResets_ = 0;
	std::vector<bool> relayEnabled_;
	std::size_t framesReceived_ = 0;
	bool muted_ = false;

	bool autogen_ = true;
	uint16_t trialNumber_ = 0;
	time_point_T analogAnchor_;
	uint64_t analogProduced_ = 0;   // records since analogAnchor_

	// frame length (opcode included) or 0 if the opcode is unknown
	std::size_t frame_length(uint8_t opcode) const;
	void handle_frame_locked(const uint8_t* frame);
	void reply_locked(uint8_t byte);
	void push_record_locked(uint16_t trialNumber, const std::vector<uint16_t>& values);
	void generate_analog_locked();
	void restart_analog_clock_locked();
	std::size_t analog_input_count_locked() const;
};

class EmulatedTransport_C : public ITransport_S {
public:
	enum class Channel_E { Command, Analog };

	EmulatedTransport_C(std::shared_ptr<EmulatedStateMachine_C> device, Channel_E channel);

	bool is_open() const override { return open_.load(std::memory_order_acquire); }
	using ITransport_S::write;
	bool write(const uint8_t* data, std::size_t len) override;
	std::size_t read(uint8_t* dest, std::size_t len, ms_T timeout) override;
	std::size_t bytes_available() override;
	void close() override { open_.store(false, std::memory_order_release); }
	std::string describe() const override;

	EmulatedStateMachine_C& device() { return *device_; }

private:
	std::shared_ptr<EmulatedStateMachine_C> device_;
	const Channel_E channel_;
	std::atomic<bool> open_{true};

	std::size_t read_once(uint8_t* dest, std::size_t len);
};
