/**
 * @file ads1292.cpp
 * @brief ADS1292 driver implementation
 */

#include "ads1292.h"
#include "ads1292_data_stream.h"
#include "ads129x_codec.h"
#include "ads129x_log.h"

namespace ADS129x {

namespace {
    constexpr uint8_t ID_FIXED_BIT = 0x10;  // ID[4] always reads 1
    constexpr uint8_t ID_DEV_MASK  = 0x03;
}

ADS1292::ADS1292(std::unique_ptr<SpiTransport> transport, const DriverConfig& config)
    : bus(std::move(transport)), settings(config) {}

// ============================================================================
// Initialization
// ============================================================================

Error ADS1292::init(std::unique_ptr<SpiTransport> transport, ADS1292& out, const DriverConfig& config) {
    if (!transport) {
        ADS129X_LOG_ERROR("ADS1292", "No transport");
        return Error::NotInitialized;
    }

    ADS1292 ads(std::move(transport), config);
    Error err;

    if (config.resetOnInit) {
        err = ads.cmd(Command::RESET);
        if (err != Error::None) {
            ADS129X_LOG_ERROR("ADS1292", "RESET failed (%d)", ads.busStatus);
            return err;
        }
        ads.bus->delayMicros(config.resetSettleUs);
    }

    // The chip starts in RDATAC, where RREG is ignored
    err = ads.cmd(Command::SDATAC);
    if (err != Error::None) {
        ADS129X_LOG_ERROR("ADS1292", "SDATAC failed (%d)", ads.busStatus);
        return err;
    }
    ads.bus->delayMicros(config.commandSettleUs);

    uint8_t id = 0;
    err = ads.readRegister(Register::ID, id);
    if (err != Error::None) {
        ADS129X_LOG_ERROR("ADS1292", "ID read failed (%d)", ads.busStatus);
        return err;
    }
    if ((id & ID_FIXED_BIT) != ID_FIXED_BIT) {
        ADS129X_LOG_ERROR("ADS1292", "Bad ID 0x%02X - check wiring and power", id);
        return Error::Init;
    }
    ads.chipId = id;

    Serial.printf("[ADS1292] Initialized: ID 0x%02X (%s), %u-byte frames\n",
                  id, ads.variantName(), static_cast<unsigned>(config.frame.frameBytes()));

    out = std::move(ads);
    return Error::None;
}

const char* ADS1292::variantName() const {
    if (!isValid()) {
        return "none";
    }
    switch (chipId & ID_DEV_MASK) {
        case 0b00: return "ADS1191";
        case 0b01: return "ADS1192";
        case 0b10: return "ADS1291";
        default:   return "ADS1292/ADS1292R";
    }
}

// ============================================================================
// Commands and Registers
// ============================================================================

Error ADS1292::cmd(Command command) {
    if (!isValid()) {
        return Error::NotInitialized;
    }
    ADS129X_LOG_DEBUG("ADS1292", "CMD %s", commandName(command));
    return sendCommand(*bus, command, &busStatus);
}

Error ADS1292::wait(uint32_t us) {
    if (!isValid()) {
        return Error::NotInitialized;
    }
    bus->delayMicros(us);
    return Error::None;
}

Error ADS1292::readRegister(Register reg, uint8_t& value) {
    if (!isValid()) {
        return Error::NotInitialized;
    }
    return ADS129x::readRegister(*bus, reg, value, &busStatus);
}

Error ADS1292::writeRegister(Register reg, uint8_t value) {
    if (!isValid()) {
        return Error::NotInitialized;
    }
    ADS129X_LOG_DEBUG("ADS1292", "WREG %s = 0x%02X", registerName(reg), value);
    return ADS129x::writeRegister(*bus, reg, value, &busStatus);
}

Error ADS1292::readRegisters(Register start, uint8_t count, uint8_t* values) {
    if (!isValid()) {
        return Error::NotInitialized;
    }
    return ADS129x::readRegisters(*bus, start, count, values, &busStatus);
}

Error ADS1292::writeRegisters(Register start, const uint8_t* values, uint8_t count) {
    if (!isValid()) {
        return Error::NotInitialized;
    }
    return ADS129x::writeRegisters(*bus, start, values, count, &busStatus);
}

// ============================================================================
// Typed Register Access
// ============================================================================

Error ADS1292::readConfig1(Config1& value) {
    uint8_t raw = 0;
    Error err = readRegister(Register::CONFIG1, raw);
    if (err == Error::None) {
        value = Config1::fromByte(raw);
    }
    return err;
}

Error ADS1292::writeConfig1(const Config1& value) {
    return writeRegister(Register::CONFIG1, value.toByte());
}

Error ADS1292::readConfig2(Config2& value) {
    uint8_t raw = 0;
    Error err = readRegister(Register::CONFIG2, raw);
    if (err == Error::None) {
        value = Config2::fromByte(raw);
    }
    return err;
}

Error ADS1292::writeConfig2(const Config2& value) {
    return writeRegister(Register::CONFIG2, value.toByte());
}

Error ADS1292::readLeadOffControl(LeadOffControl& value) {
    uint8_t raw = 0;
    Error err = readRegister(Register::LOFF, raw);
    if (err == Error::None) {
        value = LeadOffControl::fromByte(raw);
    }
    return err;
}

Error ADS1292::writeLeadOffControl(const LeadOffControl& value) {
    return writeRegister(Register::LOFF, value.toByte());
}

Error ADS1292::readLeadOffSense(LeadOffSense& value) {
    uint8_t raw = 0;
    Error err = readRegister(Register::LOFF_SENS, raw);
    if (err == Error::None) {
        value = LeadOffSense::fromByte(raw);
    }
    return err;
}

Error ADS1292::writeLeadOffSense(const LeadOffSense& value) {
    return writeRegister(Register::LOFF_SENS, value.toByte());
}

Error ADS1292::channelRegister(uint8_t channel, Register& reg) const {
    switch (channel) {
        case 1: reg = Register::CH1SET; return Error::None;
        case 2: reg = Register::CH2SET; return Error::None;
        default:
            ADS129X_LOG_ERROR("ADS1292", "No channel %u", channel);
            return Error::InvalidRegisterValue;
    }
}

Error ADS1292::readChannelSettings(uint8_t channel, ChannelSettings& value) {
    Register reg;
    Error err = channelRegister(channel, reg);
    if (err != Error::None) {
        return err;
    }

    uint8_t raw = 0;
    err = readRegister(reg, raw);
    if (err == Error::None) {
        value = ChannelSettings::fromByte(raw);
    }
    return err;
}

Error ADS1292::writeChannelSettings(uint8_t channel, const ChannelSettings& value) {
    Register reg;
    Error err = channelRegister(channel, reg);
    if (err != Error::None) {
        return err;
    }
    return writeRegister(reg, value.toByte());
}

Error ADS1292::readRldSense(RldSense& value) {
    uint8_t raw = 0;
    Error err = readRegister(Register::RLD_SENS, raw);
    if (err == Error::None) {
        value = RldSense::fromByte(raw);
    }
    return err;
}

Error ADS1292::writeRldSense(const RldSense& value) {
    return writeRegister(Register::RLD_SENS, value.toByte());
}

Error ADS1292::readResp2(Resp2& value) {
    uint8_t raw = 0;
    Error err = readRegister(Register::RESP2, raw);
    if (err == Error::None) {
        value = Resp2::fromByte(raw);
    }
    return err;
}

Error ADS1292::writeResp2(const Resp2& value) {
    return writeRegister(Register::RESP2, value.toByte());
}

Error ADS1292::readLeadOffStatus(LeadOffStatus& value) {
    uint8_t raw = 0;
    Error err = readRegister(Register::LOFF_STAT, raw);
    if (err == Error::None) {
        value.bits = raw & 0x5F;  // CLK_DIV + status bits
    }
    return err;
}

Error ADS1292::readGpio(GpioStatus& value) {
    uint8_t raw = 0;
    Error err = readRegister(Register::GPIO, raw);
    if (err == Error::None) {
        value.bits = raw & 0x0F;
    }
    return err;
}

// ============================================================================
// Data
// ============================================================================

Error ADS1292::readData(Sample& out) {
    Error err = cmd(Command::RDATA);
    if (err != Error::None) {
        return err;
    }
    return readFrame(out);
}

Error ADS1292::readFrame(Sample& out) {
    if (!isValid()) {
        return Error::NotInitialized;
    }
    return ADS129x::readFrame(*bus, settings.frame, out, &busStatus);
}

Error ADS1292::intoDataStream(DataStream& stream) && {
    if (!isValid()) {
        return Error::NotInitialized;
    }

    Error err = cmd(Command::RDATAC);
    if (err != Error::None) {
        // Nothing was moved; the caller still holds the handle
        ADS129X_LOG_ERROR("ADS1292", "RDATAC failed (%d), stream not opened", busStatus);
        return err;
    }
    bus->delayMicros(settings.streamSettleUs);

    stream = DataStream(std::move(*this));
    return Error::None;
}

std::unique_ptr<SpiTransport> ADS1292::release() {
    chipId = 0;
    return std::move(bus);
}

} // namespace ADS129x
