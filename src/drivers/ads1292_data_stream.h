/**
 * @file ads1292_data_stream.h
 * @brief Continuous (RDATAC) data stream over an ADS1292 handle
 *
 * State machine:
 *
 *   ADS1292 --intoDataStream()--> Active --next()--> Active
 *                                   |
 *                                   +--close() / destructor--> Closed
 *
 * Entering sends RDATAC; leaving sends SDATAC exactly once, on whichever path
 * ends the stream (explicit close, going out of scope, early return). A closed
 * stream is inert: next() returns Error::StreamClosed without touching the bus.
 *
 * The stream owns the handle for its whole life and exposes no register or
 * command API, so the chip cannot be reconfigured while it is streaming.
 *
 * DRDY is not visible to the stream. Call next() only after DRDY has gone low
 * since the previous read, otherwise the frame is stale or partially updated.
 */

#ifndef ADS1292_DATA_STREAM_H
#define ADS1292_DATA_STREAM_H

#include <Arduino.h>
#include "ads1292.h"

namespace ADS129x {

class DataStream {
public:
    enum class State : uint8_t {
        Active,
        Closed
    };

    /**
     * @brief Stream counters
     */
    struct Statistics {
        uint32_t framesRead;       ///< Frames transferred and decoded
        uint32_t transportErrors;  ///< Failed frame exchanges
        uint32_t desyncFrames;     ///< Frames without the 1100 status prefix
    };

    /** @brief Closed stream, owns nothing */
    DataStream() = default;

    /**
     * @brief Sends SDATAC if the stream is still active
     *
     * A failure here can only be logged; use close() to see it.
     */
    ~DataStream();

    DataStream(DataStream&& other) noexcept;

    /** @brief Closes this stream first if it is active */
    DataStream& operator=(DataStream&& other) noexcept;

    DataStream(const DataStream&) = delete;
    DataStream& operator=(const DataStream&) = delete;

    State state() const { return currentState; }
    bool isActive() const { return currentState == State::Active; }

    /**
     * @brief Pull one frame
     *
     * Exactly one frame-sized exchange, no command byte.
     *
     * @param out Receives the decoded sample
     * @return Error::None, Error::Transport or Error::StreamClosed
     */
    Error next(Sample& out);

    /**
     * @brief Leave continuous mode and hand the handle back
     *
     * Sends SDATAC once. The handle is moved into device even if SDATAC
     * fails, with the failure returned alongside it. Calling close() on a
     * closed stream sends nothing, leaves device untouched and returns
     * Error::StreamClosed.
     *
     * @param device Receives the handle (any handle it held is released)
     */
    Error close(ADS1292& device);

    Statistics getStatistics() const { return stats; }
    const FrameLayout& frameLayout() const { return device.driverConfig().frame; }

private:
    friend class ADS1292;

    explicit DataStream(ADS1292&& handle);

    /** @brief SDATAC + settle; marks the stream closed */
    Error stop();

    ADS1292 device;
    State currentState = State::Closed;
    Statistics stats = {};
};

} // namespace ADS129x

#endif // ADS1292_DATA_STREAM_H
