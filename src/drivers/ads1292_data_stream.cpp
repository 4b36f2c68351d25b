/**
 * @file ads1292_data_stream.cpp
 * @brief Continuous (RDATAC) data stream implementation
 */

#include "ads1292_data_stream.h"
#include "ads129x_log.h"

namespace ADS129x {

DataStream::DataStream(ADS1292&& handle)
    : device(std::move(handle)), currentState(State::Active), stats() {
    ADS129X_LOG_DEBUG("ADS1292Stream", "Opened (%u-byte frames)",
                      static_cast<unsigned>(device.settings.frame.frameBytes()));
}

DataStream::~DataStream() {
    if (currentState == State::Active) {
        Error err = stop();
        if (err != Error::None) {
            ADS129X_LOG_ERROR("ADS1292Stream", "SDATAC failed on drop: %s (%d)",
                              errorToString(err), device.busStatus);
        }
    }
}

DataStream::DataStream(DataStream&& other) noexcept
    : device(std::move(other.device)), currentState(other.currentState), stats(other.stats) {
    other.currentState = State::Closed;
}

DataStream& DataStream::operator=(DataStream&& other) noexcept {
    if (this != &other) {
        if (currentState == State::Active) {
            Error err = stop();
            if (err != Error::None) {
                ADS129X_LOG_ERROR("ADS1292Stream", "SDATAC failed on replace: %s (%d)",
                                  errorToString(err), device.busStatus);
            }
        }
        device = std::move(other.device);
        currentState = other.currentState;
        stats = other.stats;
        other.currentState = State::Closed;
    }
    return *this;
}

Error DataStream::next(Sample& out) {
    if (currentState != State::Active) {
        return Error::StreamClosed;
    }

    Error err = device.readFrame(out);
    if (err == Error::Transport) {
        stats.transportErrors++;
        return err;
    }
    if (err != Error::None) {
        return err;
    }

    stats.framesRead++;
    if (!out.status.isSynchronized()) {
        stats.desyncFrames++;
        ADS129X_LOG_DEBUG("ADS1292Stream", "Frame %lu out of sync (status 0x%06lX)",
                          static_cast<unsigned long>(stats.framesRead),
                          static_cast<unsigned long>(out.status.raw));
    }
    return Error::None;
}

Error DataStream::close(ADS1292& handle) {
    if (currentState != State::Active) {
        ADS129X_LOG_WARN("ADS1292Stream", "close() on a closed stream ignored");
        return Error::StreamClosed;
    }

    Error err = stop();

    // Hand the device back regardless of how SDATAC went
    handle = std::move(device);

    if (err != Error::None) {
        ADS129X_LOG_ERROR("ADS1292Stream", "SDATAC failed on close: %s (%d)",
                          errorToString(err), handle.busStatus);
    } else {
        ADS129X_LOG_DEBUG("ADS1292Stream", "Closed after %lu frames",
                          static_cast<unsigned long>(stats.framesRead));
    }
    return err;
}

Error DataStream::stop() {
    // Closed before the send so no path can issue a second SDATAC
    currentState = State::Closed;

    Error err = device.cmd(Command::SDATAC);
    if (err == Error::None) {
        device.bus->delayMicros(device.settings.commandSettleUs);
    }
    return err;
}

} // namespace ADS129x
