/**
 * @file ads129x_registers.h
 * @brief ADS1292 command set, register map and typed register views
 *
 * Byte values follow the ADS1291/ADS1292/ADS1292R datasheet:
 *   Commands:  Table 13
 *   Registers: Table 14
 *
 * The wire tables are exhaustive switches over closed enums, so adding an
 * enumerator without a byte value is a compiler warning (-Wswitch), and the
 * distinctness of every encoding is checked at compile time below.
 */

#ifndef ADS129X_REGISTERS_H
#define ADS129X_REGISTERS_H

#include <Arduino.h>

namespace ADS129x {

// ============================================================================
// Commands
// ============================================================================

/**
 * @brief SPI commands (one byte each)
 */
enum class Command : uint8_t {
    WAKEUP,     ///< Wake-up from standby mode
    STANDBY,    ///< Enter standby mode
    RESET,      ///< Reset the device
    START,      ///< Start or restart (synchronize) conversions
    STOP,       ///< Stop conversion
    OFFSETCAL,  ///< Channel offset calibration
    RDATAC,     ///< Enable Read Data Continuous mode (default at power-up); RREG is ignored
    SDATAC,     ///< Stop Read Data Continuous mode
    RDATA,      ///< Read data by command
};

constexpr uint8_t commandByte(Command cmd) {
    switch (cmd) {
        case Command::WAKEUP:    return 0x02;
        case Command::STANDBY:   return 0x04;
        case Command::RESET:     return 0x06;
        case Command::START:     return 0x08;
        case Command::STOP:      return 0x0A;
        case Command::OFFSETCAL: return 0x1A;
        case Command::RDATAC:    return 0x10;
        case Command::SDATAC:    return 0x11;
        case Command::RDATA:     return 0x12;
    }
    return 0x00;
}

/** @brief All commands, in declaration order */
constexpr Command ALL_COMMANDS[] = {
    Command::WAKEUP, Command::STANDBY, Command::RESET, Command::START,
    Command::STOP, Command::OFFSETCAL, Command::RDATAC, Command::SDATAC,
    Command::RDATA,
};
constexpr size_t COMMAND_COUNT = sizeof(ALL_COMMANDS) / sizeof(ALL_COMMANDS[0]);

/**
 * @brief Register access opcodes
 *
 * OR'ed with the register address in the first byte of a transaction; the
 * second byte is the number of registers minus one.
 */
namespace Opcode {
    constexpr uint8_t RREG      = 0x20;  ///< Read registers starting at an address
    constexpr uint8_t WREG      = 0x40;  ///< Write registers starting at an address
    constexpr uint8_t ADDR_MASK = 0x1F;
}

// ============================================================================
// Registers
// ============================================================================

/**
 * @brief Register addresses
 */
enum class Register : uint8_t {
    ID        = 0x00,  ///< ID control (factory-programmed, read-only)
    CONFIG1   = 0x01,  ///< Configuration 1 (single-shot, oversampling ratio)
    CONFIG2   = 0x02,  ///< Configuration 2 (reference, test signal, LOFF comparators)
    LOFF      = 0x03,  ///< Lead-off control
    CH1SET    = 0x04,  ///< Channel 1 settings
    CH2SET    = 0x05,  ///< Channel 2 settings
    RLD_SENS  = 0x06,  ///< Right leg drive sense selection
    LOFF_SENS = 0x07,  ///< Lead-off sense selection
    LOFF_STAT = 0x08,  ///< Lead-off status
    RESP1     = 0x09,  ///< Respiration control 1
    RESP2     = 0x0A,  ///< Respiration control 2
    GPIO      = 0x0B,  ///< General-purpose I/O
};

constexpr uint8_t registerAddress(Register reg) {
    return static_cast<uint8_t>(reg);
}

constexpr Register ALL_REGISTERS[] = {
    Register::ID, Register::CONFIG1, Register::CONFIG2, Register::LOFF,
    Register::CH1SET, Register::CH2SET, Register::RLD_SENS, Register::LOFF_SENS,
    Register::LOFF_STAT, Register::RESP1, Register::RESP2, Register::GPIO,
};
constexpr size_t REGISTER_COUNT = sizeof(ALL_REGISTERS) / sizeof(ALL_REGISTERS[0]);

/**
 * @brief Write rules for one register
 *
 * A value is accepted if every bit outside writableMask equals the
 * corresponding bit of fixedBits (datasheet "must be set to 0/1" bits).
 */
struct RegisterRule {
    bool readOnly;
    uint8_t writableMask;
    uint8_t fixedBits;
};

constexpr RegisterRule registerRule(Register reg) {
    switch (reg) {
        case Register::ID:        return {true,  0x00, 0x00};
        case Register::CONFIG1:   return {false, 0x87, 0x00};
        case Register::CONFIG2:   return {false, 0x7B, 0x80};
        case Register::LOFF:      return {false, 0xED, 0x10};
        case Register::CH1SET:    return {false, 0xFF, 0x00};
        case Register::CH2SET:    return {false, 0xFF, 0x00};
        case Register::RLD_SENS:  return {false, 0xFF, 0x00};
        case Register::LOFF_SENS: return {false, 0x3F, 0x00};
        case Register::LOFF_STAT: return {false, 0x40, 0x00};  // Only CLK_DIV is writable
        case Register::RESP1:     return {false, 0xFD, 0x02};
        case Register::RESP2:     return {false, 0x87, 0x00};
        case Register::GPIO:      return {false, 0x0F, 0x00};
    }
    return {true, 0x00, 0x00};
}

constexpr bool isValidRegisterValue(Register reg, uint8_t value) {
    return !registerRule(reg).readOnly &&
           (value & ~registerRule(reg).writableMask & 0xFF) == registerRule(reg).fixedBits;
}

namespace detail {
    constexpr bool commandBytesDistinct() {
        for (size_t i = 0; i < COMMAND_COUNT; i++) {
            for (size_t j = i + 1; j < COMMAND_COUNT; j++) {
                if (commandByte(ALL_COMMANDS[i]) == commandByte(ALL_COMMANDS[j])) {
                    return false;
                }
            }
            // Must not collide with the register opcode space
            if ((commandByte(ALL_COMMANDS[i]) & 0xE0) == Opcode::RREG ||
                (commandByte(ALL_COMMANDS[i]) & 0xE0) == Opcode::WREG) {
                return false;
            }
        }
        return true;
    }

    constexpr bool registerAddressesDistinct() {
        for (size_t i = 0; i < REGISTER_COUNT; i++) {
            if (registerAddress(ALL_REGISTERS[i]) > Opcode::ADDR_MASK) {
                return false;
            }
            for (size_t j = i + 1; j < REGISTER_COUNT; j++) {
                if (registerAddress(ALL_REGISTERS[i]) == registerAddress(ALL_REGISTERS[j])) {
                    return false;
                }
            }
        }
        return true;
    }
}

static_assert(detail::commandBytesDistinct(), "Command bytes must be unique");
static_assert(detail::registerAddressesDistinct(), "Register addresses must be unique");

// ============================================================================
// Field Enumerations
// ============================================================================

/** @brief Oversampling ratio / output data rate (CONFIG1[2:0]) */
enum class SampleRate : uint8_t {
    SPS_125  = 0b000,
    SPS_250  = 0b001,
    SPS_500  = 0b010,  ///< Power-up default
    SPS_1000 = 0b011,
    SPS_2000 = 0b100,
    SPS_4000 = 0b101,
    SPS_8000 = 0b110,
    Unknown  = 0b111,
};

/** @brief PGA gain (CHnSET[6:4]) */
enum class Gain : uint8_t {
    X6  = 0b000,  ///< Power-up default
    X1  = 0b001,
    X2  = 0b010,
    X3  = 0b011,
    X4  = 0b100,
    X8  = 0b101,
    X12 = 0b110,
    Unknown = 0b111,
};

/** @brief Channel input selection (CHnSET[3:0]) */
enum class InputSelection : uint8_t {
    NormalElectrode   = 0b0000,  ///< Normal electrode input (default)
    Shorted           = 0b0001,  ///< Input shorted, for offset measurements
    RldMeasure        = 0b0010,
    Mvdd              = 0b0011,  ///< Supply measurement
    TemperatureSensor = 0b0100,
    TestSignal        = 0b0101,
    RldDrp            = 0b0110,  ///< Positive input connected to RLDIN
    RldDrm            = 0b0111,  ///< Negative input connected to RLDIN
    RldDrpm           = 0b1000,  ///< Both inputs connected to RLDIN
    Channel3          = 0b1001,  ///< Route IN3P/IN3N to channel 1 inputs
    Unknown           = 0b1111,
};

/** @brief Lead-off current magnitude (LOFF[3:2]) */
enum class LeadOffCurrent : uint8_t {
    NA_6  = 0b00,
    NA_22 = 0b01,
    UA_6  = 0b10,
    UA_22 = 0b11,
};

/** @brief PGA chop frequency (RLD_SENS[7:6]) */
enum class ChopFrequency : uint8_t {
    FmodDiv16 = 0b00,
    Unknown   = 0b01,  ///< Reserved encoding
    FmodDiv2  = 0b10,
    FmodDiv4  = 0b11,
};

// ============================================================================
// Typed Register Views
// ============================================================================

/** @brief CONFIG1 */
struct Config1 {
    bool singleShot = false;               ///< Single-shot instead of continuous conversion
    SampleRate rate = SampleRate::SPS_500;

    uint8_t toByte() const;
    static Config1 fromByte(uint8_t value);
};

/** @brief CONFIG2 */
struct Config2 {
    bool leadOffComparators = false;  ///< PDB_LOFF_COMP: comparators powered up
    bool referenceBuffer = false;     ///< PDB_REFBUF: internal reference buffer powered up
    bool vref4V = false;              ///< 4.033V reference, otherwise 2.42V
    bool clockOutput = false;         ///< Internal oscillator routed to CLK pin
    bool testSignal = false;          ///< Internal test signal on
    bool testFreq1Hz = false;         ///< 1Hz square wave, otherwise DC

    uint8_t toByte() const;
    static Config2 fromByte(uint8_t value);
};

/** @brief LOFF */
struct LeadOffControl {
    uint8_t comparatorThreshold = 0;            ///< COMP_TH[2:0], 95% .. 70%
    LeadOffCurrent current = LeadOffCurrent::NA_6;
    bool acLeadOff = false;                     ///< AC lead-off, otherwise DC

    uint8_t toByte() const;
    static LeadOffControl fromByte(uint8_t value);
};

/** @brief LOFF_SENS */
struct LeadOffSense {
    bool flip2 = false;   ///< Invert lead-off current direction, channel 2
    bool flip1 = false;   ///< Invert lead-off current direction, channel 1
    bool loff2n = false;
    bool loff2p = false;
    bool loff1n = false;
    bool loff1p = false;

    uint8_t toByte() const;
    static LeadOffSense fromByte(uint8_t value);
};

/** @brief CH1SET / CH2SET */
struct ChannelSettings {
    bool powerDown = false;
    Gain gain = Gain::X6;
    InputSelection mux = InputSelection::NormalElectrode;

    uint8_t toByte() const;
    static ChannelSettings fromByte(uint8_t value);
};

/** @brief RLD_SENS */
struct RldSense {
    ChopFrequency chop = ChopFrequency::FmodDiv16;
    bool rldBuffer = false;        ///< PDB_RLD: RLD buffer powered up
    bool rldLeadOffSense = false;
    bool rld2n = false;
    bool rld2p = false;
    bool rld1n = false;
    bool rld1p = false;

    uint8_t toByte() const;
    static RldSense fromByte(uint8_t value);
};

/** @brief RESP2 */
struct Resp2 {
    bool calibration = false;     ///< CALIB_ON: offset calibration enabled
    bool respFreq64kHz = false;   ///< Must be set on the ADS1291 and ADS1292
    bool rldRefInternal = false;  ///< RLDREF = (AVDD - AVSS) / 2, otherwise fed externally

    uint8_t toByte() const;
    static Resp2 fromByte(uint8_t value);
};

// ============================================================================
// Conversion Helpers
// ============================================================================

/**
 * @brief Get gain multiplier
 * @return 1..12, or 0 for Gain::Unknown
 */
uint8_t gainToMultiplier(Gain gain);

/**
 * @brief Get output data rate in samples per second
 * @return 125..8000, or 0 for SampleRate::Unknown
 */
uint32_t rateToHz(SampleRate rate);

const char* registerName(Register reg);
const char* commandName(Command cmd);

} // namespace ADS129x

#endif // ADS129X_REGISTERS_H
