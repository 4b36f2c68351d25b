/**
 * @file ads129x_codec.cpp
 * @brief ADS129x command and register transaction encoding
 */

#include "ads129x_codec.h"
#include "ads129x_log.h"
#include <cstring>

namespace ADS129x {

namespace {
    Error transfer(SpiTransport& bus, const uint8_t* tx, uint8_t* rx, size_t len, int* busStatus) {
        int status = bus.exchange(tx, rx, len);
        if (status != 0) {
            if (busStatus) {
                *busStatus = status;
            }
            return Error::Transport;
        }
        return Error::None;
    }

    /**
     * @brief Check that [start, start + count) stays inside the register map
     */
    bool isValidSpan(Register start, uint8_t count) {
        return count >= 1 &&
               static_cast<size_t>(registerAddress(start)) + count <= REGISTER_COUNT;
    }

    Error checkWritable(Register reg, uint8_t value) {
        if (registerRule(reg).readOnly) {
            ADS129X_LOG_ERROR("ADS1292", "%s is read-only", registerName(reg));
            return Error::ReadOnlyRegister;
        }
        if (!isValidRegisterValue(reg, value)) {
            ADS129X_LOG_ERROR("ADS1292", "0x%02X is not a valid %s value", value, registerName(reg));
            return Error::InvalidRegisterValue;
        }
        return Error::None;
    }
}

void encodeRegisterHeader(uint8_t opcode, Register start, uint8_t count, uint8_t header[2]) {
    header[0] = opcode | (registerAddress(start) & Opcode::ADDR_MASK);
    header[1] = count - 1;  // Number of registers minus one
}

Error sendCommand(SpiTransport& bus, Command cmd, int* busStatus) {
    uint8_t tx[1] = {commandByte(cmd)};
    uint8_t rx[1] = {0};
    return transfer(bus, tx, rx, 1, busStatus);
}

Error readRegister(SpiTransport& bus, Register reg, uint8_t& value, int* busStatus) {
    return readRegisters(bus, reg, 1, &value, busStatus);
}

Error writeRegister(SpiTransport& bus, Register reg, uint8_t value, int* busStatus) {
    return writeRegisters(bus, reg, &value, 1, busStatus);
}

Error readRegisters(SpiTransport& bus, Register start, uint8_t count, uint8_t* values, int* busStatus) {
    if (!isValidSpan(start, count)) {
        ADS129X_LOG_ERROR("ADS1292", "RREG span %s+%u outside register map", registerName(start), count);
        return Error::InvalidRegisterValue;
    }

    uint8_t tx[MAX_REGISTER_TRANSACTION] = {0};
    uint8_t rx[MAX_REGISTER_TRANSACTION] = {0};
    size_t len = 2 + count;

    encodeRegisterHeader(Opcode::RREG, start, count, tx);

    Error err = transfer(bus, tx, rx, len, busStatus);
    if (err != Error::None) {
        return err;
    }

    memcpy(values, rx + 2, count);
    return Error::None;
}

Error writeRegisters(SpiTransport& bus, Register start, const uint8_t* values, uint8_t count, int* busStatus) {
    if (!isValidSpan(start, count)) {
        ADS129X_LOG_ERROR("ADS1292", "WREG span %s+%u outside register map", registerName(start), count);
        return Error::InvalidRegisterValue;
    }

    // Validate the whole burst before anything is sent
    for (uint8_t i = 0; i < count; i++) {
        Register reg = static_cast<Register>(registerAddress(start) + i);
        Error err = checkWritable(reg, values[i]);
        if (err != Error::None) {
            return err;
        }
    }

    uint8_t tx[MAX_REGISTER_TRANSACTION] = {0};
    uint8_t rx[MAX_REGISTER_TRANSACTION] = {0};
    size_t len = 2 + count;

    encodeRegisterHeader(Opcode::WREG, start, count, tx);
    memcpy(tx + 2, values, count);

    return transfer(bus, tx, rx, len, busStatus);
}

Error readFrame(SpiTransport& bus, const FrameLayout& layout, Sample& out, int* busStatus) {
    size_t len = layout.frameBytes();
    if (!layout.isSupported() || len > MAX_FRAME_BYTES) {
        return Error::FrameLengthMismatch;
    }

    uint8_t tx[MAX_FRAME_BYTES] = {0};
    uint8_t rx[MAX_FRAME_BYTES] = {0};

    Error err = transfer(bus, tx, rx, len, busStatus);
    if (err != Error::None) {
        return err;
    }
    return decodeFrame(rx, len, layout, out);
}

} // namespace ADS129x
