/**
 * @file ads1292_data.cpp
 * @brief ADS1292 data frame decoding
 */

#include "ads1292_data.h"
#include <cstdio>

namespace ADS129x {

namespace {
    constexpr uint32_t SYNC_MASK    = 0xF00000;
    constexpr uint32_t SYNC_PATTERN = 0xC00000;

    uint32_t readBigEndian(const uint8_t* data, uint8_t bytes) {
        uint32_t value = 0;
        for (uint8_t i = 0; i < bytes; i++) {
            value = (value << 8) | data[i];
        }
        return value;
    }
}

// ============================================================================
// Status Word
// ============================================================================

uint32_t StatusWord::word24() const {
    if (bytes < 3) {
        return (raw << (8 * (3 - bytes))) & 0xFFFFFF;
    }
    return (raw >> (8 * (bytes - 3))) & 0xFFFFFF;
}

bool StatusWord::isSynchronized() const {
    return (word24() & SYNC_MASK) == SYNC_PATTERN;
}

LeadOffStatus StatusWord::leadOff() const {
    // Bits [19:15]
    LeadOffStatus status;
    status.bits = (word24() >> 15) & 0x1F;
    return status;
}

GpioStatus StatusWord::gpio() const {
    // Bits [14:13]
    GpioStatus status;
    status.bits = (word24() >> 13) & 0x03;
    return status;
}

// ============================================================================
// Decoding
// ============================================================================

int32_t decodeSigned(const uint8_t* data, uint8_t bytes) {
    uint32_t raw = readBigEndian(data, bytes);

    // Sign extension: if the top transmitted bit is set, fill the bits above it
    if (bytes < 4) {
        uint32_t signBit = 1UL << (8 * bytes - 1);
        if (raw & signBit) {
            raw |= ~((signBit << 1) - 1);
        }
    }
    return static_cast<int32_t>(raw);
}

Error decodeFrame(const uint8_t* raw, size_t length, const FrameLayout& layout, Sample& out) {
    if (!layout.isSupported() || length != layout.frameBytes()) {
        return Error::FrameLengthMismatch;
    }

    Sample sample;
    sample.status.raw = readBigEndian(raw, layout.statusBytes);
    sample.status.bytes = layout.statusBytes;
    sample.channelCount = layout.channelCount;

    const uint8_t* field = raw + layout.statusBytes;
    for (uint8_t ch = 0; ch < layout.channelCount; ch++) {
        sample.channels[ch] = decodeSigned(field, layout.sampleBytes);
        field += layout.sampleBytes;
    }

    out = sample;
    return Error::None;
}

// ============================================================================
// Conversion Helpers
// ============================================================================

float rawToMicrovolts(int32_t raw, float vrefMillivolts, uint8_t gain) {
    if (gain == 0) {
        return 0.0f;
    }
    float fullScaleUv = (vrefMillivolts * 1000.0f) / gain;
    return (raw / 8388607.0f) * fullScaleUv;
}

float temperatureCelsius(float microvolts) {
    return (microvolts - 145300.0f) / 490.0f + 25.0f;
}

int formatSample(const Sample& sample, char* buf, size_t len) {
    LeadOffStatus loff = sample.status.leadOff();
    GpioStatus gpio = sample.status.gpio();

    int written = snprintf(buf, len,
                           "status=0x%06lX%s loff=[rld:%d in2n:%d in2p:%d in1n:%d in1p:%d] gpio=[d2:%d d1:%d]",
                           static_cast<unsigned long>(sample.status.raw),
                           sample.status.isSynchronized() ? "" : " (desync)",
                           loff.rldOff(), loff.in2nOff(), loff.in2pOff(),
                           loff.in1nOff(), loff.in1pOff(),
                           gpio.gpiod2(), gpio.gpiod1());

    for (uint8_t ch = 0; ch < sample.channelCount && written >= 0; ch++) {
        size_t used = static_cast<size_t>(written);
        if (used >= len) {
            break;
        }
        int n = snprintf(buf + used, len - used, " ch%u=%ld",
                         static_cast<unsigned>(ch + 1),
                         static_cast<long>(sample.channels[ch]));
        if (n < 0) {
            return n;
        }
        written += n;
    }
    return written;
}

} // namespace ADS129x
