/**
 * @file ads129x_codec.h
 * @brief ADS129x command and register transaction encoding
 *
 * Transaction formats:
 *   Command:  [CMD]
 *   RREG:     [0x20 | addr][n - 1][0x00 x n]   -> data clocked in from byte 2
 *   WREG:     [0x40 | addr][n - 1][data x n]
 *   Frame:    [0x00 x frameBytes]               -> status word + channel data
 *
 * Stateless: every function works on the transport it is handed. The optional
 * busStatus pointer receives the transport's own status code on failure.
 */

#ifndef ADS129X_CODEC_H
#define ADS129X_CODEC_H

#include <Arduino.h>
#include "ads129x_error.h"
#include "ads129x_registers.h"
#include "ads1292_data.h"
#include "spi_transport.h"

namespace ADS129x {

/** @brief Largest register transaction: header + whole register map */
constexpr size_t MAX_REGISTER_TRANSACTION = 2 + REGISTER_COUNT;

/**
 * @brief Build a register transaction header
 *
 * @param opcode Opcode::RREG or Opcode::WREG
 * @param start  First register
 * @param count  Number of registers (>= 1)
 * @param header Receives the 2 header bytes
 */
void encodeRegisterHeader(uint8_t opcode, Register start, uint8_t count, uint8_t header[2]);

/**
 * @brief Send a single command byte
 */
Error sendCommand(SpiTransport& bus, Command cmd, int* busStatus = nullptr);

/**
 * @brief Read one register
 */
Error readRegister(SpiTransport& bus, Register reg, uint8_t& value, int* busStatus = nullptr);

/**
 * @brief Write one register
 *
 * Values that violate the register's writable bits are rejected, not masked;
 * nothing is sent in that case.
 *
 * @return Error::ReadOnlyRegister, Error::InvalidRegisterValue or the bus result
 */
Error writeRegister(SpiTransport& bus, Register reg, uint8_t value, int* busStatus = nullptr);

/**
 * @brief Read count consecutive registers starting at start
 * @return Error::InvalidRegisterValue if the span leaves the register map
 */
Error readRegisters(SpiTransport& bus, Register start, uint8_t count, uint8_t* values,
                    int* busStatus = nullptr);

/**
 * @brief Write count consecutive registers starting at start
 *
 * Every value is validated before any byte goes out.
 */
Error writeRegisters(SpiTransport& bus, Register start, const uint8_t* values, uint8_t count,
                     int* busStatus = nullptr);

/**
 * @brief Clock one data frame out of the chip and decode it
 *
 * Sends no command byte: in RDATAC mode the chip shifts the latest conversion
 * out on its own, and after RDATA it shifts out the requested one.
 */
Error readFrame(SpiTransport& bus, const FrameLayout& layout, Sample& out, int* busStatus = nullptr);

} // namespace ADS129x

#endif // ADS129X_CODEC_H
