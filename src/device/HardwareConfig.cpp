#include "HardwareConfig.h"
#include "../utils/Logger.hpp"
#include "../utils/WireCodec.h"

HardwareConfigManager_C::HardwareConfigManager_C(ProtocolClient_C& client, StateStore_s& status, const HardwareDescription_S& hw)
    : client_(client), status_(status), hw_(hw) {
    // power-on default of the firmware: all Flex channels digital in, 1kHz analog rate
    flexConfig_.channelTypes.assign(hw_.nFlexIO, FlexType_DigitalIn);
    flexConfig_.samplingRateHz = hw_.cycleFrequency / FLEX_MIN_CYCLES_PER_SAMPLE;
}

uint32_t HardwareConfigManager_C::cycles_per_sample(uint32_t cycleFrequency, uint32_t hz) {
    if (hz == 0) {
        return 0;
    }
    // range check on the exact quotient, then round to nearest for the uint32 on the wire
    const uint64_t cf = cycleFrequency;
    if (cf < uint64_t{FLEX_MIN_CYCLES_PER_SAMPLE} * hz) {
        return 0; // more than cycleFrequency / 10 Hz
    }
    return static_cast<uint32_t>((cf + hz / 2) / hz);
}

BpodError_E HardwareConfigManager_C::set_flex_io(const std::vector<uint8_t>& channelTypes) {
    logger::tlabel = "HW Config";
    // 1) local preconditions, nothing touches the wire on failure
    if (!hw_.has_flex_io()) {
        LOG_WARN("setFlexIO: " << machine_type_str(hw_.identity.machineType) << " has no Flex I/O channels");
        return BpodError_Unsupported;
    }
    if (channelTypes.size() != hw_.nFlexIO) {
        LOG_WARN("setFlexIO: the channelTypes vector must specify one type for each of the "
                 << hw_.nFlexIO << " FlexIO channels (got " << channelTypes.size() << ")");
        return BpodError_LengthMismatch;
    }
    for (uint8_t code : channelTypes) {
        if (!is_valid_flex_type(code)) {
            LOG_WARN("setFlexIO: invalid channel type " << static_cast<int>(code)
                     << ". Valid channel types are: 0 = DI, 1 = DO, 2 = ADC, 3 = DAC");
            return BpodError_InvalidType;
        }
    }
    if (!status_.can_reconfigure()) {
        LOG_WARN("setFlexIO: FlexIO channels cannot be reconfigured while the state machine is running");
        return BpodError_Busy;
    }

    // 2) names are built before the command so the swap after confirm cannot fail halfway
    const FlexRegion_S region = bpodlink::hw::build_flex_region(channelTypes);

    // 3) command + confirm
    const BpodError_E err = client_.send_frame_and_confirm(WireCodec_S::encode_flex_config(channelTypes));
    if (err != BpodError_None) {
        LOG_ERR("setFlexIO: error configuring FlexIO channels (" << bpod_error_str(err) << ")");
        return err;
    }

    // 4) publish
    if (!status_.replace_flex_region(region)) {
        // region sizes are derived from hw_.nFlexIO, so this means the tables were never initialized
        LOG_ERR("setFlexIO: channel tables do not match the hardware description");
        return BpodError_LengthMismatch;
    }
    {
        std::lock_guard<std::mutex> lock(cfg_mtx_);
        flexConfig_.channelTypes = channelTypes;
    }
    LOG_ALWAYS("FlexIO configured: " << WireCodec_S::to_hex(channelTypes.data(), channelTypes.size()));
    return BpodError_None;
}

BpodError_E HardwareConfigManager_C::set_flex_io_analog_sampling_rate(uint32_t hz) {
    logger::tlabel = "HW Config";
    if (!hw_.has_flex_io()) {
        return BpodError_Unsupported;
    }
    const uint32_t nCyclesPerSample = cycles_per_sample(hw_.cycleFrequency, hz);
    if (nCyclesPerSample == 0) {
        LOG_WARN("setFlexIO_AnalogInputSF: rate " << hz << " Hz rejected. Rate must be in range [1, "
                 << hw_.cycleFrequency / FLEX_MIN_CYCLES_PER_SAMPLE << "]");
        return BpodError_RateOutOfRange;
    }
    const BpodError_E err = client_.send_frame_and_confirm(WireCodec_S::encode_sampling_rate(nCyclesPerSample));
    if (err != BpodError_None) {
        LOG_ERR("setFlexIO_AnalogInputSF: error configuring sampling rate (" << bpod_error_str(err) << ")");
        return err;
    }
    {
        std::lock_guard<std::mutex> lock(cfg_mtx_);
        flexConfig_.samplingRateHz = hz;
    }
    LOG_ALWAYS("FlexIO analog sampling rate = " << hz << " Hz (" << nCyclesPerSample << " cycles/sample)");
    return BpodError_None;
}

BpodError_E HardwareConfigManager_C::set_status_led(int state) {
    logger::tlabel = "HW Config";
    if (!hw_.has_status_led()) {
        LOG_WARN("status LED enable/disable requires firmware v" << STATUS_LED_MIN_FIRMWARE << "+");
        return BpodError_Unsupported;
    }
    if (state != 0 && state != 1) {
        LOG_WARN("LED status must be 0 (disabled) or 1 (enabled), got " << state);
        return BpodError_InvalidArgument;
    }
    const BpodError_E err = client_.send_and_confirm(Opcode_SetStatusLED, bytes_T{ static_cast<uint8_t>(state) });
    if (err != BpodError_None) {
        LOG_ERR("status LED: " << bpod_error_str(err));
    }
    return err;
}

BpodError_E HardwareConfigManager_C::reset_session_clock() {
    logger::tlabel = "HW Config";
    const BpodError_E err = client_.send_and_confirm(Opcode_ResetSessionClock);
    if (err != BpodError_None) {
        LOG_ERR("confirm not returned after resetting session clock (" << bpod_error_str(err) << ")");
        return err;
    }
    std::lock_guard<std::mutex> lock(cfg_mtx_);
    sessionClockResets_++;
    return BpodError_None;
}

FlexConfig_S HardwareConfigManager_C::get_flex_config() const {
    std::lock_guard<std::mutex> lock(cfg_mtx_);
    return flexConfig_;
}

std::size_t HardwareConfigManager_C::get_analog_input_count() const {
    std::lock_guard<std::mutex> lock(cfg_mtx_);
    return bpodlink::hw::count_analog_inputs(flexConfig_.channelTypes);
}

uint32_t HardwareConfigManager_C::get_session_clock_resets() const {
    std::lock_guard<std::mutex> lock(cfg_mtx_);
    return sessionClockResets_;
}
