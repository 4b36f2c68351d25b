/**
 * @file main.cpp
 * @brief ESP32-S3 ADS1292 ECG Front End - Main Entry Point
 *
 * Brings up the ADS1292 over SPI, configures both channels for ECG and
 * streams frames to the console in RDATAC mode:
 * - DRDY falling edge flags a new frame
 * - loop() pulls it through the DataStream and prints every Nth sample
 * - STREAM button toggles between streaming and register access
 *
 * While stopped, the handle is back in register mode and the current
 * configuration is dumped once.
 */

#include <Arduino.h>
#include <memory>
#include "pins.h"
#include "drivers/ads1292.h"
#include "drivers/ads1292_data_stream.h"
#include "drivers/esp_spi_transport.h"

using namespace ADS129x;

namespace {
    ADS1292 ads;
    DataStream stream;
    bool ready = false;

    volatile bool drdyFlag = false;
    volatile uint32_t drdyCount = 0;

    // Button state for debouncing
    bool lastButtonState = false;
    uint32_t lastButtonChangeMs = 0;
    bool buttonPressed = false;

    const uint32_t PRINT_EVERY = 50;      // Samples between console lines
    const uint32_t POWER_ON_RESET_MS = 500;  // tPOR = 2^18 tCLK at 512kHz
    const float VREF_MV = 2420.0f;
    uint32_t samplesSincePrint = 0;
}

void IRAM_ATTR onDrdy() {
    drdyFlag = true;
    drdyCount++;
}

/**
 * @brief Program registers for 2-channel ECG at 500 SPS
 */
Error configureAfe() {
    Error err;

    Config1 config1;
    config1.rate = SampleRate::SPS_500;
    err = ads.writeConfig1(config1);
    if (err != Error::None) return err;

    Config2 config2;
    config2.leadOffComparators = true;
    config2.referenceBuffer = true;
    err = ads.writeConfig2(config2);
    if (err != Error::None) return err;

    // Reference buffer needs time to settle before conversions
    err = ads.wait(10000);
    if (err != Error::None) return err;

    LeadOffControl loff;
    loff.current = LeadOffCurrent::NA_6;
    err = ads.writeLeadOffControl(loff);
    if (err != Error::None) return err;

    ChannelSettings channel;
    channel.gain = Gain::X6;
    channel.mux = InputSelection::NormalElectrode;
    err = ads.writeChannelSettings(1, channel);
    if (err != Error::None) return err;
    err = ads.writeChannelSettings(2, channel);
    if (err != Error::None) return err;

    RldSense rld;
    rld.chop = ChopFrequency::FmodDiv16;
    rld.rldBuffer = true;
    rld.rld2n = true;
    rld.rld2p = true;
    err = ads.writeRldSense(rld);
    if (err != Error::None) return err;

    LeadOffSense sense;
    sense.loff2n = true;
    sense.loff2p = true;
    sense.loff1n = true;
    sense.loff1p = true;
    err = ads.writeLeadOffSense(sense);
    if (err != Error::None) return err;

    Resp2 resp2;
    resp2.respFreq64kHz = true;
    resp2.rldRefInternal = true;
    return ads.writeResp2(resp2);
}

void dumpRegisters() {
    uint8_t values[REGISTER_COUNT] = {0};
    Error err = ads.readRegisters(Register::ID, REGISTER_COUNT, values);
    if (err != Error::None) {
        Serial.printf("[Main] Register dump failed: %s\n", errorToString(err));
        return;
    }

    for (size_t i = 0; i < REGISTER_COUNT; i++) {
        Serial.printf("[Main]   %-9s = 0x%02X\n", registerName(ALL_REGISTERS[i]), values[i]);
    }
}

bool startStreaming() {
    Error err = ads.cmd(Command::START);
    if (err != Error::None) {
        Serial.printf("[Main] START failed: %s\n", errorToString(err));
        return false;
    }

    err = std::move(ads).intoDataStream(stream);
    if (err != Error::None) {
        Serial.printf("[Main] Could not enter RDATAC: %s\n", errorToString(err));
        err = ads.cmd(Command::STOP);
        if (err != Error::None) {
            Serial.printf("[Main] STOP failed: %s\n", errorToString(err));
        }
        return false;
    }

    drdyFlag = false;
    samplesSincePrint = 0;
    Serial.println("[Main] Streaming");
    return true;
}

void stopStreaming() {
    Error err = stream.close(ads);
    if (err != Error::None) {
        Serial.printf("[Main] SDATAC failed: %s\n", errorToString(err));
    }

    DataStream::Statistics stats = stream.getStatistics();
    Serial.printf("[Main] Stopped: %lu frames, %lu bus errors, %lu out of sync, %lu DRDY\n",
                  static_cast<unsigned long>(stats.framesRead),
                  static_cast<unsigned long>(stats.transportErrors),
                  static_cast<unsigned long>(stats.desyncFrames),
                  static_cast<unsigned long>(drdyCount));

    if (ads.isValid()) {
        err = ads.cmd(Command::STOP);
        if (err != Error::None) {
            Serial.printf("[Main] STOP failed: %s\n", errorToString(err));
        }
        dumpRegisters();
    }
}

void handleStream() {
    if (!drdyFlag) {
        return;
    }
    drdyFlag = false;

    Sample sample;
    Error err = stream.next(sample);
    if (err != Error::None) {
        Serial.printf("[Main] Frame read failed: %s\n", errorToString(err));
        return;
    }

    if (++samplesSincePrint < PRINT_EVERY) {
        return;
    }
    samplesSincePrint = 0;

    char line[192];
    formatSample(sample, line, sizeof(line));
    Serial.printf("[Main] %s  (%.1f uV, %.1f uV)\n", line,
                  rawToMicrovolts(sample.channels[0], VREF_MV, 6),
                  rawToMicrovolts(sample.channels[1], VREF_MV, 6));
}

/**
 * @brief Handle button input with debouncing
 *
 * Each press toggles between streaming and register mode.
 */
void handleButtonPress() {
    bool currentState = (digitalRead(PIN_STREAM_BUTTON) == HIGH);
    uint32_t now = millis();

    // Debounce
    if (currentState != lastButtonState) {
        lastButtonChangeMs = now;
        lastButtonState = currentState;
    }

    if ((now - lastButtonChangeMs) < BUTTON_DEBOUNCE_MS) {
        return;
    }

    if (currentState && !buttonPressed) {
        buttonPressed = true;
        if (stream.isActive()) {
            stopStreaming();
        } else if (ads.isValid()) {
            startStreaming();
        }
    } else if (!currentState && buttonPressed) {
        buttonPressed = false;
    }
}

void setup() {
    Serial.begin(115200);
    while (!Serial && millis() < 3000); // Wait for USB CDC

    Serial.println();
    Serial.println("=====================================");
    Serial.println("  ADS1292 ECG Front End v1.0");
    Serial.println("  ESP32-S3 Platform");
    Serial.println("=====================================");
    Serial.println();

    pinMode(PIN_STREAM_BUTTON, INPUT);

    // START held low: conversions are controlled by the START command
    pinMode(PIN_AFE_START, OUTPUT);
    digitalWrite(PIN_AFE_START, LOW);

    pinMode(PIN_AFE_PWDN, OUTPUT);
    digitalWrite(PIN_AFE_PWDN, HIGH);
    delay(POWER_ON_RESET_MS);

    pinMode(PIN_AFE_DRDY, INPUT_PULLUP);

    std::unique_ptr<EspSpiTransport> transport(new EspSpiTransport());
    EspSpiTransport::Config busConfig;
    busConfig.pinMiso = PIN_AFE_MISO;
    busConfig.pinMosi = PIN_AFE_MOSI;
    busConfig.pinSck = PIN_AFE_SCK;
    busConfig.pinCs = PIN_AFE_CS;
    busConfig.clockHz = AFE_SPI_CLOCK_HZ;

    esp_err_t ret = transport->begin(busConfig);
    if (ret != ESP_OK) {
        Serial.printf("[Main] SPI init failed: %s\n", esp_err_to_name(ret));
        return;
    }

    DriverConfig driverConfig;
    driverConfig.resetOnInit = true;

    Error err = ADS1292::init(std::move(transport), ads, driverConfig);
    if (err != Error::None) {
        Serial.printf("[Main] ADS1292 init failed: %s\n", errorToString(err));
        return;
    }

    err = configureAfe();
    if (err != Error::None) {
        Serial.printf("[Main] ADS1292 configuration failed: %s\n", errorToString(err));
        return;
    }
    dumpRegisters();

    attachInterrupt(digitalPinToInterrupt(PIN_AFE_DRDY), onDrdy, FALLING);
    ready = true;
    startStreaming();

    Serial.println();
    Serial.println("[Main] Setup complete");
    Serial.println("[Main] Press STREAM to toggle streaming");
    Serial.println();
}

void loop() {
    if (!ready) {
        delay(1000);
        return;
    }

    handleButtonPress();

    if (stream.isActive()) {
        handleStream();
    } else {
        delay(10);
    }
}
