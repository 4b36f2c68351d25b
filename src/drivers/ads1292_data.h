/**
 * @file ads1292_data.h
 * @brief ADS1292 data frame layout and decoding
 *
 * One frame (RDATA or RDATAC) is 72 bits on the ADS1292:
 *
 *   | status (24) | CH1 (24) | CH2 (24) |
 *
 * Status word: 1100 | LOFF_STAT[4:0] | GPIO[1:0] | 13 x 0
 * Channel data: two's complement, MSB first.
 *
 * The decoder also accepts other layouts (status width, channel count and
 * sample width are parameters) for sibling parts.
 */

#ifndef ADS1292_DATA_H
#define ADS1292_DATA_H

#include <Arduino.h>
#include "ads129x_error.h"

namespace ADS129x {

// ============================================================================
// Frame Layout
// ============================================================================

constexpr uint8_t MAX_CHANNELS = 8;
constexpr uint8_t MAX_FIELD_BYTES = 4;
constexpr size_t MAX_FRAME_BYTES = MAX_FIELD_BYTES + MAX_CHANNELS * MAX_FIELD_BYTES;

/**
 * @brief Byte layout of one data frame
 */
struct FrameLayout {
    uint8_t statusBytes;   ///< Width of the leading status word
    uint8_t channelCount;  ///< Number of channel fields
    uint8_t sampleBytes;   ///< Width of each channel field

    constexpr size_t frameBytes() const {
        return statusBytes + static_cast<size_t>(channelCount) * sampleBytes;
    }

    constexpr bool isSupported() const {
        return statusBytes <= MAX_FIELD_BYTES &&
               channelCount >= 1 && channelCount <= MAX_CHANNELS &&
               sampleBytes >= 1 && sampleBytes <= MAX_FIELD_BYTES;
    }
};

/** @brief ADS1292 / ADS1292R frame: 24-bit status + 2 x 24-bit channels */
constexpr FrameLayout ADS1292_FRAME = {3, 2, 3};

static_assert(ADS1292_FRAME.frameBytes() == 9, "ADS1292 frame is 72 bits");
static_assert(ADS1292_FRAME.isSupported(), "ADS1292 frame must be decodable");

// ============================================================================
// Status Views
// ============================================================================

/**
 * @brief Lead-off flags
 *
 * Bits [4:0] come from either the frame status word or the LOFF_STAT
 * register; bit 6 (CLK_DIV) is only present in the register.
 */
struct LeadOffStatus {
    uint8_t bits = 0;

    bool clkDiv() const  { return bits & 0x40; }  ///< Clock divider selection
    bool rldOff() const  { return bits & 0x10; }  ///< RLD lead-off
    bool in2nOff() const { return bits & 0x08; }  ///< Channel 2 negative electrode off
    bool in2pOff() const { return bits & 0x04; }  ///< Channel 2 positive electrode off
    bool in1nOff() const { return bits & 0x02; }  ///< Channel 1 negative electrode off
    bool in1pOff() const { return bits & 0x01; }  ///< Channel 1 positive electrode off

    bool anyOff() const  { return bits & 0x1F; }
};

/**
 * @brief GPIO control/data bits
 *
 * The GPIO register carries control [3:2] and data [1:0]; the frame status
 * word only carries the data bits.
 */
struct GpioStatus {
    uint8_t bits = 0;

    bool gpioc2() const { return bits & 0x08; }  ///< GPIO2 is an input
    bool gpioc1() const { return bits & 0x04; }  ///< GPIO1 is an input
    bool gpiod2() const { return bits & 0x02; }
    bool gpiod1() const { return bits & 0x01; }
};

/**
 * @brief Frame status word
 */
struct StatusWord {
    uint32_t raw = 0;   ///< Big-endian value of the status bytes
    uint8_t bytes = 0;  ///< Width of raw in bytes

    /** @brief Word aligned to the 24-bit ADS1292 layout */
    uint32_t word24() const;

    /**
     * @brief Check the 1100 sync prefix
     *
     * A frame read out of step with the chip's shift register shows up here
     * first, since channel data has no fixed pattern.
     */
    bool isSynchronized() const;

    LeadOffStatus leadOff() const;
    GpioStatus gpio() const;
};

// ============================================================================
// Decoded Sample
// ============================================================================

/**
 * @brief One decoded frame
 */
struct Sample {
    StatusWord status;
    uint8_t channelCount = 0;
    int32_t channels[MAX_CHANNELS] = {};  ///< Sign-extended, channels[0] is CH1
};

// ============================================================================
// Decoding
// ============================================================================

/**
 * @brief Sign-extend a big-endian two's complement field
 *
 * @param data  First (most significant) byte of the field
 * @param bytes Field width, 1..4
 */
int32_t decodeSigned(const uint8_t* data, uint8_t bytes);

/**
 * @brief Decode a raw frame
 *
 * @param raw    Frame bytes as clocked in
 * @param length Number of bytes in raw, must equal layout.frameBytes()
 * @param layout Frame layout
 * @param out    Receives the decoded sample
 * @return Error::None, or Error::FrameLengthMismatch for a wrong length or unsupported layout
 */
Error decodeFrame(const uint8_t* raw, size_t length, const FrameLayout& layout, Sample& out);

// ============================================================================
// Conversion Helpers
// ============================================================================

/**
 * @brief Convert a channel code to microvolts at the ADC input
 *
 * Full scale is +/-VREF/gain over 2^23 - 1 codes.
 *
 * @param raw             Sign-extended channel value
 * @param vrefMillivolts  Reference (2420 or 4033 on the internal reference)
 * @param gain            PGA multiplier (see gainToMultiplier)
 */
float rawToMicrovolts(int32_t raw, float vrefMillivolts, uint8_t gain);

/**
 * @brief Temperature from a TemperatureSensor-muxed channel
 *
 * 145300 uV at 25 C, 490 uV/C.
 */
float temperatureCelsius(float microvolts);

/**
 * @brief Render a sample for the console
 * @return Number of characters written (excluding terminator), as snprintf
 */
int formatSample(const Sample& sample, char* buf, size_t len);

} // namespace ADS129x

#endif // ADS1292_DATA_H
