/**
 * @file ads1292.h
 * @brief ADS1292 2-channel 24-bit ECG analog front end driver
 *
 * Register-level and single-shot access to the ADS1292 over an exclusively
 * owned SpiTransport. Continuous conversion (RDATAC) is only reachable by
 * turning the handle into a DataStream:
 *
 *   ADS129x::ADS1292 ads;
 *   ADS129x::ADS1292::init(std::move(transport), ads);
 *   ads.writeRegister(ADS129x::Register::CH1SET, 0x60);
 *   ads.cmd(ADS129x::Command::START);
 *
 *   ADS129x::DataStream stream;
 *   std::move(ads).intoDataStream(stream);   // ads is empty from here on
 *   while (...) { wait for DRDY; stream.next(sample); }
 *   stream.close(ads);                       // SDATAC, ads is back
 *
 * Timing (defaults from a 500kHz timer, 2us per tick):
 *   After SDATAC on init:       80us
 *   After RDATAC, before first: 400us
 */

#ifndef ADS1292_H
#define ADS1292_H

#include <Arduino.h>
#include <memory>
#include "ads129x_error.h"
#include "ads129x_registers.h"
#include "ads1292_data.h"
#include "spi_transport.h"

namespace ADS129x {

class DataStream;

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Driver timing and frame configuration
 *
 * Settle times differ between variants and clock setups; override them here
 * rather than sleeping around driver calls.
 */
struct DriverConfig {
    bool resetOnInit = false;        ///< Send RESET before the SDATAC/ID handshake
    uint32_t resetSettleUs = 80;     ///< Wait after RESET (>= 18 tCLK)
    uint32_t commandSettleUs = 80;   ///< Wait after SDATAC
    uint32_t streamSettleUs = 400;   ///< Wait after RDATAC before the first frame
    FrameLayout frame = ADS1292_FRAME;
};

// ============================================================================
// Device Handle
// ============================================================================

class ADS1292 {
public:
    /** @brief Empty handle; every operation returns Error::NotInitialized */
    ADS1292() = default;

    ADS1292(ADS1292&&) = default;
    ADS1292& operator=(ADS1292&&) = default;
    ADS1292(const ADS1292&) = delete;
    ADS1292& operator=(const ADS1292&) = delete;

    /**
     * @brief Take ownership of a transport and bring the chip to a known state
     *
     * Sequence: [RESET + wait] -> SDATAC (the chip powers up in RDATAC) ->
     * wait -> read ID and require bit 4 set.
     *
     * @param transport Bus to own; released if the handshake fails
     * @param out       Receives the ready handle on success
     * @param config    Timing and frame configuration
     * @return Error::None, Error::Transport or Error::Init
     */
    static Error init(std::unique_ptr<SpiTransport> transport, ADS1292& out,
                      const DriverConfig& config = DriverConfig());

    bool isValid() const { return bus != nullptr; }

    /** @brief ID register value read during init */
    uint8_t deviceId() const { return chipId; }

    /** @brief Part name decoded from the ID register */
    const char* variantName() const;

    const DriverConfig& driverConfig() const { return settings; }

    /** @brief Backend status code of the last failed exchange */
    int lastTransportStatus() const { return busStatus; }

    // ------------------------------------------------------------------------
    // Commands and registers
    // ------------------------------------------------------------------------

    Error cmd(Command command);

    /** @brief Busy-wait on the owned transport, for spacing command sequences */
    Error wait(uint32_t us);

    Error readRegister(Register reg, uint8_t& value);

    /**
     * @brief Write one register
     *
     * Out-of-range values are rejected with Error::InvalidRegisterValue,
     * never silently masked.
     */
    Error writeRegister(Register reg, uint8_t value);

    Error readRegisters(Register start, uint8_t count, uint8_t* values);
    Error writeRegisters(Register start, const uint8_t* values, uint8_t count);

    Error readConfig1(Config1& value);
    Error writeConfig1(const Config1& value);
    Error readConfig2(Config2& value);
    Error writeConfig2(const Config2& value);
    Error readLeadOffControl(LeadOffControl& value);
    Error writeLeadOffControl(const LeadOffControl& value);
    Error readLeadOffSense(LeadOffSense& value);
    Error writeLeadOffSense(const LeadOffSense& value);

    /**
     * @param channel 1 or 2
     */
    Error readChannelSettings(uint8_t channel, ChannelSettings& value);
    Error writeChannelSettings(uint8_t channel, const ChannelSettings& value);

    Error readRldSense(RldSense& value);
    Error writeRldSense(const RldSense& value);
    Error readResp2(Resp2& value);
    Error writeResp2(const Resp2& value);
    Error readLeadOffStatus(LeadOffStatus& value);
    Error readGpio(GpioStatus& value);

    // ------------------------------------------------------------------------
    // Data
    // ------------------------------------------------------------------------

    /**
     * @brief Single-shot read: RDATA command, then one frame
     *
     * Call after DRDY goes low with conversions started (START).
     */
    Error readData(Sample& out);

    /**
     * @brief Enter continuous mode and move this handle into a DataStream
     *
     * Sends RDATAC and waits streamSettleUs. On success the handle is moved
     * into stream and this object is left empty. On failure nothing is moved:
     * the handle is still usable and the error is returned.
     *
     * Only callable on an rvalue: std::move(ads).intoDataStream(stream).
     */
    Error intoDataStream(DataStream& stream) &&;

    /**
     * @brief Give up the transport, leaving this handle empty
     */
    std::unique_ptr<SpiTransport> release();

private:
    friend class DataStream;

    ADS1292(std::unique_ptr<SpiTransport> transport, const DriverConfig& config);

    /** @brief Clock out one frame without a command (RDATAC) */
    Error readFrame(Sample& out);

    Error channelRegister(uint8_t channel, Register& reg) const;

    std::unique_ptr<SpiTransport> bus;
    DriverConfig settings;
    uint8_t chipId = 0;
    int busStatus = 0;
};

} // namespace ADS129x

#endif // ADS1292_H
