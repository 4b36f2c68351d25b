/**
 * @file ads129x_registers.cpp
 * @brief Bit packing for the typed ADS1292 register views
 */

#include "ads129x_registers.h"

namespace ADS129x {

namespace {
    inline bool bit(uint8_t value, uint8_t n) {
        return (value >> n) & 0x01;
    }

    inline uint8_t flag(bool set, uint8_t n) {
        return set ? static_cast<uint8_t>(1u << n) : 0;
    }
}

// ============================================================================
// CONFIG1
// ============================================================================

uint8_t Config1::toByte() const {
    return flag(singleShot, 7) | (static_cast<uint8_t>(rate) & 0x07);
}

Config1 Config1::fromByte(uint8_t value) {
    Config1 c;
    c.singleShot = bit(value, 7);
    c.rate = static_cast<SampleRate>(value & 0x07);
    return c;
}

// ============================================================================
// CONFIG2
// ============================================================================

uint8_t Config2::toByte() const {
    return 0x80  // Bit 7 must be written 1
         | flag(leadOffComparators, 6)
         | flag(referenceBuffer, 5)
         | flag(vref4V, 4)
         | flag(clockOutput, 3)
         | flag(testSignal, 1)
         | flag(testFreq1Hz, 0);
}

Config2 Config2::fromByte(uint8_t value) {
    Config2 c;
    c.leadOffComparators = bit(value, 6);
    c.referenceBuffer = bit(value, 5);
    c.vref4V = bit(value, 4);
    c.clockOutput = bit(value, 3);
    c.testSignal = bit(value, 1);
    c.testFreq1Hz = bit(value, 0);
    return c;
}

// ============================================================================
// LOFF
// ============================================================================

uint8_t LeadOffControl::toByte() const {
    return ((comparatorThreshold & 0x07) << 5)
         | 0x10  // Bit 4 must be written 1
         | ((static_cast<uint8_t>(current) & 0x03) << 2)
         | flag(acLeadOff, 0);
}

LeadOffControl LeadOffControl::fromByte(uint8_t value) {
    LeadOffControl c;
    c.comparatorThreshold = (value >> 5) & 0x07;
    c.current = static_cast<LeadOffCurrent>((value >> 2) & 0x03);
    c.acLeadOff = bit(value, 0);
    return c;
}

// ============================================================================
// LOFF_SENS
// ============================================================================

uint8_t LeadOffSense::toByte() const {
    return flag(flip2, 5) | flag(flip1, 4)
         | flag(loff2n, 3) | flag(loff2p, 2)
         | flag(loff1n, 1) | flag(loff1p, 0);
}

LeadOffSense LeadOffSense::fromByte(uint8_t value) {
    LeadOffSense s;
    s.flip2 = bit(value, 5);
    s.flip1 = bit(value, 4);
    s.loff2n = bit(value, 3);
    s.loff2p = bit(value, 2);
    s.loff1n = bit(value, 1);
    s.loff1p = bit(value, 0);
    return s;
}

// ============================================================================
// CHnSET
// ============================================================================

uint8_t ChannelSettings::toByte() const {
    return flag(powerDown, 7)
         | ((static_cast<uint8_t>(gain) & 0x07) << 4)
         | (static_cast<uint8_t>(mux) & 0x0F);
}

ChannelSettings ChannelSettings::fromByte(uint8_t value) {
    ChannelSettings s;
    s.powerDown = bit(value, 7);
    s.gain = static_cast<Gain>((value >> 4) & 0x07);

    uint8_t mux = value & 0x0F;
    s.mux = mux <= static_cast<uint8_t>(InputSelection::Channel3)
        ? static_cast<InputSelection>(mux)
        : InputSelection::Unknown;
    return s;
}

// ============================================================================
// RLD_SENS
// ============================================================================

uint8_t RldSense::toByte() const {
    return ((static_cast<uint8_t>(chop) & 0x03) << 6)
         | flag(rldBuffer, 5)
         | flag(rldLeadOffSense, 4)
         | flag(rld2n, 3) | flag(rld2p, 2)
         | flag(rld1n, 1) | flag(rld1p, 0);
}

RldSense RldSense::fromByte(uint8_t value) {
    RldSense s;
    s.chop = static_cast<ChopFrequency>((value >> 6) & 0x03);
    s.rldBuffer = bit(value, 5);
    s.rldLeadOffSense = bit(value, 4);
    s.rld2n = bit(value, 3);
    s.rld2p = bit(value, 2);
    s.rld1n = bit(value, 1);
    s.rld1p = bit(value, 0);
    return s;
}

// ============================================================================
// RESP2
// ============================================================================

uint8_t Resp2::toByte() const {
    return flag(calibration, 7) | flag(respFreq64kHz, 2) | flag(rldRefInternal, 1);
}

Resp2 Resp2::fromByte(uint8_t value) {
    Resp2 r;
    r.calibration = bit(value, 7);
    r.respFreq64kHz = bit(value, 2);
    r.rldRefInternal = bit(value, 1);
    return r;
}

// ============================================================================
// Conversion Helpers
// ============================================================================

uint8_t gainToMultiplier(Gain gain) {
    switch (gain) {
        case Gain::X6:  return 6;
        case Gain::X1:  return 1;
        case Gain::X2:  return 2;
        case Gain::X3:  return 3;
        case Gain::X4:  return 4;
        case Gain::X8:  return 8;
        case Gain::X12: return 12;
        case Gain::Unknown: break;
    }
    return 0;
}

uint32_t rateToHz(SampleRate rate) {
    static const uint32_t rates[] = {125, 250, 500, 1000, 2000, 4000, 8000};

    uint8_t idx = static_cast<uint8_t>(rate);
    if (idx < sizeof(rates) / sizeof(rates[0])) {
        return rates[idx];
    }
    return 0;
}

const char* registerName(Register reg) {
    switch (reg) {
        case Register::ID:        return "ID";
        case Register::CONFIG1:   return "CONFIG1";
        case Register::CONFIG2:   return "CONFIG2";
        case Register::LOFF:      return "LOFF";
        case Register::CH1SET:    return "CH1SET";
        case Register::CH2SET:    return "CH2SET";
        case Register::RLD_SENS:  return "RLD_SENS";
        case Register::LOFF_SENS: return "LOFF_SENS";
        case Register::LOFF_STAT: return "LOFF_STAT";
        case Register::RESP1:     return "RESP1";
        case Register::RESP2:     return "RESP2";
        case Register::GPIO:      return "GPIO";
    }
    return "?";
}

const char* commandName(Command cmd) {
    switch (cmd) {
        case Command::WAKEUP:    return "WAKEUP";
        case Command::STANDBY:   return "STANDBY";
        case Command::RESET:     return "RESET";
        case Command::START:     return "START";
        case Command::STOP:      return "STOP";
        case Command::OFFSETCAL: return "OFFSETCAL";
        case Command::RDATAC:    return "RDATAC";
        case Command::SDATAC:    return "SDATAC";
        case Command::RDATA:     return "RDATA";
    }
    return "?";
}

} // namespace ADS129x
