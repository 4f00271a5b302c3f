#include "AnalogStreamer.h"
#include "../utils/Logger.hpp"
#include "../utils/WireCodec.h"
#include <utility>

AnalogStreamingController_C::AnalogStreamingController_C(ITransport_S* analogPort, StateStore_s& status,
                                                         const HardwareConfigManager_C& hwConfig, IAnalogSink_S& sink,
                                                         ms_T pollPeriod)
    : analogPort_(analogPort), status_(status), hwConfig_(hwConfig), sink_(sink),
      pendingInputs_(hwConfig.get_analog_input_count()) {
    poller_ = std::make_unique<PeriodicTask_C>("Analog Poller", pollPeriod, [this]() { this->poll_once(); });
}

AnalogStreamingController_C::~AnalogStreamingController_C() {
    poller_->stop();
}

bool AnalogStreamingController_C::start() {
    logger::tlabel = "Analog Stream";
    if (!is_supported()) {
        LOG_DBG("analog: no analog port, streaming disabled");
        return false;
    }
    if (!status_.g_live.load(std::memory_order_acquire)) {
        LOG_WARN("analog: refusing to stream outside a live session");
        return false;
    }
    if (!poller_->start()) {
        return false;
    }
    LOG_ALWAYS("analog: streaming from " << analogPort_->describe() << " ("
               << hwConfig_.get_analog_input_count() << " analog inputs)");
    return true;
}

void AnalogStreamingController_C::stop() {
    poller_->stop();
    std::lock_guard<std::mutex> lock(rx_mtx_);
    pending_.clear(); // partial record from the previous session is meaningless
}

std::size_t AnalogStreamingController_C::poll_once() {
    if (!is_supported()) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(rx_mtx_);

    const std::size_t nInputs = hwConfig_.get_analog_input_count();
    if (nInputs != pendingInputs_) {
        if (!pending_.empty()) {
            LOG_WARN("analog: analog inputs changed " << pendingInputs_ << " -> " << nInputs
                     << ", dropping " << pending_.size() << " bytes of a partial record");
            pending_.clear();
        }
        pendingInputs_ = nInputs;
    }

    const std::size_t avail = analogPort_->bytes_available();
    if (avail > 0) {
        const std::size_t old = pending_.size();
        pending_.resize(old + avail);
        const std::size_t got = analogPort_->read(pending_.data() + old, avail, ms_T{0});
        pending_.resize(old + got);
    }

    if (nInputs == 0) {
        // no analog channel configured: nothing on the port can be framed
        if (!pending_.empty()) {
            LOG_DBG("analog: discarding " << pending_.size() << " bytes (no analog inputs configured)");
            pending_.clear();
        }
        return 0;
    }

    const std::size_t recSize = record_size(nInputs);
    const std::size_t nRecords = pending_.size() / recSize;
    if (nRecords == 0) {
        return 0;
    }

    const double now = static_cast<double>(logger::ms_since_start());
    std::vector<AnalogSample_S> batch;
    batch.reserve(nRecords);
    for (std::size_t r = 0; r < nRecords; r++) {
        const uint8_t* rec = pending_.data() + r * recSize;
        AnalogSample_S s;
        s.sampleIndex = status_.g_n_analog_samples.fetch_add(1, std::memory_order_acq_rel);
        s.trialNumber = WireCodec_S::read_u16(rec);
        s.hostTime_ms = now;
        s.values.reserve(nInputs);
        for (std::size_t c = 0; c < nInputs; c++) {
            s.values.push_back(WireCodec_S::read_u16(rec + 2 + 2 * c));
        }
        batch.push_back(std::move(s));
    }
    // keep the partial tail for the next tick
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(nRecords * recSize));

    {
        std::lock_guard<std::mutex> slock(samples_mtx_);
        samples_.insert(samples_.end(), batch.begin(), batch.end());
    }
    sink_.on_analog_samples(batch);
    return nRecords;
}

std::size_t AnalogStreamingController_C::get_sample_count() const {
    std::lock_guard<std::mutex> lock(samples_mtx_);
    return samples_.size();
}

std::vector<AnalogSample_S> AnalogStreamingController_C::snapshot_samples() const {
    std::lock_guard<std::mutex> lock(samples_mtx_);
    return samples_;
}

void AnalogStreamingController_C::clear_samples() {
    {
        std::lock_guard<std::mutex> lock(samples_mtx_);
        samples_.clear();
    }
    status_.g_n_analog_samples.store(0, std::memory_order_release);
}
