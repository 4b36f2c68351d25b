/**
 * @file esp_spi_transport.h
 * @brief ESP-IDF spi_master backend for SpiTransport
 *
 * Chip select is driven manually so the ADS1292 gets the CS lead/trail time
 * it needs around each command (tSCCS >= 4 tCLK, command decode = 4 tCLK).
 * The SPI peripheral itself runs in mode 1 (CPOL=0, CPHA=1), MSB first.
 */

#ifndef ESP_SPI_TRANSPORT_H
#define ESP_SPI_TRANSPORT_H

#include <Arduino.h>
#include "driver/spi_master.h"
#include "driver/gpio.h"
#include "spi_transport.h"

namespace ADS129x {

class EspSpiTransport : public SpiTransport {
public:
    /**
     * @brief Bus configuration
     */
    struct Config {
        spi_host_device_t host = SPI2_HOST;
        gpio_num_t pinMiso = GPIO_NUM_NC;
        gpio_num_t pinMosi = GPIO_NUM_NC;
        gpio_num_t pinSck = GPIO_NUM_NC;
        gpio_num_t pinCs = GPIO_NUM_NC;
        int clockHz = 1000000;      ///< ADS1292 tolerates up to ~4MHz with a 512kHz CLK
        uint32_t csLeadUs = 40;     ///< CS low -> first SCLK
        uint32_t csTrailUs = 40;    ///< Last SCLK -> CS high
        uint32_t csIdleUs = 20;     ///< CS high -> next transaction
        bool initBus = true;        ///< Call spi_bus_initialize (false if the bus is shared)
    };

    EspSpiTransport() = default;
    ~EspSpiTransport() override;

    EspSpiTransport(const EspSpiTransport&) = delete;
    EspSpiTransport& operator=(const EspSpiTransport&) = delete;

    /**
     * @brief Initialize the SPI bus and attach the device
     * @return ESP_OK or the failing spi_master/gpio status
     */
    esp_err_t begin(const Config& config);

    /**
     * @brief Detach the device and free the bus (if this object initialized it)
     */
    void end();

    bool isReady() const { return device != nullptr; }

    int exchange(const uint8_t* tx, uint8_t* rx, size_t len) override;
    void delayMicros(uint32_t us) override;

private:
    Config config;
    spi_device_handle_t device = nullptr;
    bool ownsBus = false;
};

} // namespace ADS129x

#endif // ESP_SPI_TRANSPORT_H
