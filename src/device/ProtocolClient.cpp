#include "ProtocolClient.h"
#include "../shared/StateStore.hpp"
#include "../utils/Logger.hpp"
#include "../utils/WireCodec.h"

ProtocolClient_C::ProtocolClient_C(ITransport_S& transport, ms_T confirmTimeout, StateStore_s* status)
    : transport_(transport), confirmTimeout_(confirmTimeout), status_(status) {
}

BpodError_E ProtocolClient_C::write_frame_locked(const bytes_T& frame) {
    const char op = frame.empty() ? '?' : static_cast<char>(frame[0]);
    if (!transport_.is_open()) {
        LOG_ERR("cmd '" << op << "': transport " << transport_.describe() << " is closed");
        return BpodError_TransportClosed;
    }
    LOG_DBG("tx [" << WireCodec_S::to_hex(frame.data(), frame.size()) << "]");
    if (!transport_.write(frame)) {
        LOG_ERR("cmd '" << op << "': write failed on " << transport_.describe());
        return BpodError_TransportClosed;
    }
    return BpodError_None;
}

BpodError_E ProtocolClient_C::send(uint8_t opcode, const bytes_T& payload) {
    return send_frame(WireCodec_S::encode_command(opcode, payload));
}

BpodError_E ProtocolClient_C::send_and_confirm(uint8_t opcode, const bytes_T& payload,
                                               std::size_t nConfirmBytes, uint8_t* confirmOut) {
    return send_frame_and_confirm(WireCodec_S::encode_command(opcode, payload), nConfirmBytes, confirmOut);
}

BpodError_E ProtocolClient_C::send_frame(const bytes_T& frame) {
    std::lock_guard<std::mutex> lock(turn_);
    return write_frame_locked(frame);
}

BpodError_E ProtocolClient_C::send_frame_and_confirm(const bytes_T& frame, std::size_t nConfirmBytes,
                                                     uint8_t* confirmOut) {
    std::lock_guard<std::mutex> lock(turn_);
    const uint8_t opcode = frame.empty() ? 0 : frame[0];

    BpodError_E err = write_frame_locked(frame);
    if (err != BpodError_None) {
        return err;
    }

    // confirmation read is strictly ordered after the write, still holding the turn
    bytes_T reply(nConfirmBytes, 0);
    const std::size_t got = transport_.read(reply.data(), nConfirmBytes, confirmTimeout_);
    if (got < nConfirmBytes) {
        LOG_ERR("cmd '" << static_cast<char>(opcode) << "': got " << got << "/" << nConfirmBytes
                << " confirm bytes within " << confirmTimeout_.count() << " ms");
        mark_desync(opcode, BpodError_Timeout);
        return BpodError_Timeout;
    }
    LOG_DBG("rx [" << WireCodec_S::to_hex(reply.data(), reply.size()) << "]");

    const uint8_t confirm = reply.back();
    if (confirmOut != nullptr) {
        *confirmOut = confirm;
    }
    for (uint8_t b : reply) {
        if (b != CONFIRM_OK) {
            LOG_ERR("cmd '" << static_cast<char>(opcode) << "': confirm code not returned (got "
                    << static_cast<int>(b) << ")");
            mark_desync(opcode, BpodError_Unconfirmed);
            return BpodError_Unconfirmed;
        }
    }
    return BpodError_None;
}

std::size_t ProtocolClient_C::read_available(bytes_T& dest) {
    std::lock_guard<std::mutex> lock(turn_);
    const std::size_t n = transport_.bytes_available();
    if (n == 0) return 0;
    const std::size_t oldSize = dest.size();
    dest.resize(oldSize + n);
    const std::size_t got = transport_.read(dest.data() + oldSize, n, ms_T{0});
    dest.resize(oldSize + got);
    return got;
}

std::size_t ProtocolClient_C::drain() {
    std::lock_guard<std::mutex> lock(turn_);
    std::size_t total = 0;
    bytes_T trash;
    // keep draining until the port reports empty (bytes may trickle in); bounded rounds
    constexpr int kMaxDrainRounds = 64;
    int rounds = 0;
    for (std::size_t n = transport_.bytes_available(); n > 0 && rounds < kMaxDrainRounds;
         n = transport_.bytes_available(), rounds++) {
        trash.resize(n);
        const std::size_t got = transport_.read(trash.data(), n, ms_T{0});
        total += got;
        if (got == 0) break;
    }
    if (total > 0) {
        LOG_DBG("drained " << total << " stale bytes");
    }
    return total;
}

void ProtocolClient_C::mark_desync(uint8_t opcode, BpodError_E err) {
    if (status_ != nullptr) {
        status_->g_desynchronized.store(true, std::memory_order_release);
    }
    LOG_ERR("command channel may be desynchronized after '" << static_cast<char>(opcode) << "' ("
            << bpod_error_str(err) << "); reconnect or power-cycle the state machine");
}
