/**
 * @file esp_spi_transport.cpp
 * @brief ESP-IDF spi_master backend for SpiTransport
 */

#include "esp_spi_transport.h"
#include "ads129x_log.h"
#include <esp_err.h>

namespace ADS129x {

EspSpiTransport::~EspSpiTransport() {
    end();
}

esp_err_t EspSpiTransport::begin(const Config& cfg) {
    if (device != nullptr) {
        ADS129X_LOG_WARN("ADS1292Spi", "Already initialized");
        return ESP_OK;
    }
    config = cfg;

    // Manual chip select, idle HIGH
    gpio_config_t csConfig = {};
    csConfig.pin_bit_mask = 1ULL << config.pinCs;
    csConfig.mode = GPIO_MODE_OUTPUT;
    csConfig.pull_up_en = GPIO_PULLUP_DISABLE;
    csConfig.pull_down_en = GPIO_PULLDOWN_DISABLE;
    csConfig.intr_type = GPIO_INTR_DISABLE;
    esp_err_t err = gpio_config(&csConfig);
    if (err != ESP_OK) {
        ADS129X_LOG_ERROR("ADS1292Spi", "CS pin config failed: %s", esp_err_to_name(err));
        return err;
    }
    gpio_set_level(config.pinCs, 1);

    if (config.initBus) {
        spi_bus_config_t busConfig = {};
        busConfig.miso_io_num = config.pinMiso;
        busConfig.mosi_io_num = config.pinMosi;
        busConfig.sclk_io_num = config.pinSck;
        busConfig.quadwp_io_num = -1;
        busConfig.quadhd_io_num = -1;
        busConfig.max_transfer_sz = 32;
        busConfig.flags = SPICOMMON_BUSFLAG_MASTER;

        err = spi_bus_initialize(config.host, &busConfig, SPI_DMA_CH_AUTO);
        if (err != ESP_OK) {
            ADS129X_LOG_ERROR("ADS1292Spi", "SPI bus init failed: %s", esp_err_to_name(err));
            return err;
        }
        ownsBus = true;
    }

    spi_device_interface_config_t devConfig = {};
    devConfig.clock_speed_hz = config.clockHz;
    devConfig.mode = 1;           // CPOL=0, CPHA=1
    devConfig.spics_io_num = -1;  // CS driven by exchange()
    devConfig.queue_size = 1;

    err = spi_bus_add_device(config.host, &devConfig, &device);
    if (err != ESP_OK) {
        ADS129X_LOG_ERROR("ADS1292Spi", "SPI device add failed: %s", esp_err_to_name(err));
        device = nullptr;
        if (ownsBus) {
            spi_bus_free(config.host);
            ownsBus = false;
        }
        return err;
    }

    Serial.printf("[ADS1292Spi] SPI ready: host %d, %d Hz, mode 1\n",
                  static_cast<int>(config.host), config.clockHz);
    return ESP_OK;
}

void EspSpiTransport::end() {
    if (device != nullptr) {
        spi_bus_remove_device(device);
        device = nullptr;
    }
    if (ownsBus) {
        spi_bus_free(config.host);
        ownsBus = false;
    }
}

int EspSpiTransport::exchange(const uint8_t* tx, uint8_t* rx, size_t len) {
    if (device == nullptr) {
        return ESP_ERR_INVALID_STATE;
    }
    if (len == 0) {
        return ESP_OK;
    }

    spi_transaction_t trans = {};
    trans.length = len * 8;
    trans.tx_buffer = tx;
    trans.rx_buffer = rx;

    gpio_set_level(config.pinCs, 0);
    delayMicroseconds(config.csLeadUs);

    esp_err_t err = spi_device_polling_transmit(device, &trans);

    delayMicroseconds(config.csTrailUs);
    gpio_set_level(config.pinCs, 1);
    delayMicroseconds(config.csIdleUs);

    // CS is released before the failure is reported
    if (err != ESP_OK) {
        ADS129X_LOG_ERROR("ADS1292Spi", "Transfer of %u bytes failed: %s",
                          static_cast<unsigned>(len), esp_err_to_name(err));
    }
    return err;
}

void EspSpiTransport::delayMicros(uint32_t us) {
    delayMicroseconds(us);
}

} // namespace ADS129x
