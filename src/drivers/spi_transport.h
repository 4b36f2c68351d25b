/**
 * @file spi_transport.h
 * @brief Blocking SPI exchange + delay capability consumed by the ADS129x driver
 *
 * Implementations own the bus device and assert/release chip select around
 * every exchange. Exactly one ADS1292 handle or DataStream owns a transport
 * at any time.
 */

#ifndef SPI_TRANSPORT_H
#define SPI_TRANSPORT_H

#include <Arduino.h>

namespace ADS129x {

class SpiTransport {
public:
    virtual ~SpiTransport() = default;

    /**
     * @brief Full-duplex exchange of len bytes with chip select asserted
     *
     * @param tx  Bytes clocked out (MOSI)
     * @param rx  Receives the bytes clocked in (MISO), same length as tx
     * @param len Number of bytes
     * @return 0 on success, otherwise a backend status code (esp_err_t on ESP32)
     */
    virtual int exchange(const uint8_t* tx, uint8_t* rx, size_t len) = 0;

    /**
     * @brief Busy-wait
     */
    virtual void delayMicros(uint32_t us) = 0;
};

} // namespace ADS129x

#endif // SPI_TRANSPORT_H
