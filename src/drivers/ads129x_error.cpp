/**
 * @file ads129x_error.cpp
 * @brief Error code names
 */

#include "ads129x_error.h"

namespace ADS129x {

const char* errorToString(Error error) {
    switch (error) {
        case Error::None:                 return "None";
        case Error::Transport:            return "Transport";
        case Error::InvalidRegisterValue: return "InvalidRegisterValue";
        case Error::ReadOnlyRegister:     return "ReadOnlyRegister";
        case Error::FrameLengthMismatch:  return "FrameLengthMismatch";
        case Error::StreamClosed:         return "StreamClosed";
        case Error::Init:                 return "Init";
        case Error::NotInitialized:       return "NotInitialized";
    }
    return "Unknown";
}

} // namespace ADS129x
