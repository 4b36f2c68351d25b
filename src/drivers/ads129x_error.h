/**
 * @file ads129x_error.h
 * @brief Status codes returned by the ADS129x driver
 *
 * Every fallible driver call returns an Error. Nothing is retried inside the
 * driver; the caller decides what to do with a failure.
 */

#ifndef ADS129X_ERROR_H
#define ADS129X_ERROR_H

#include <Arduino.h>

namespace ADS129x {

/** @brief Driver status codes */
enum class Error : uint8_t {
    None = 0,               // Success
    Transport,              // SPI exchange failed (see lastTransportStatus())
    InvalidRegisterValue,   // Value violates the register's writable bits
    ReadOnlyRegister,       // Write attempted on a factory/read-only register
    FrameLengthMismatch,    // Buffer length does not match the frame layout
    StreamClosed,           // Operation on a closed data stream
    Init,                   // Power-up handshake failed (bad ID)
    NotInitialized          // Handle owns no transport (default or moved-from)
};

/**
 * @brief Get error as human-readable string
 */
const char* errorToString(Error error);

} // namespace ADS129x

#endif // ADS129X_ERROR_H
