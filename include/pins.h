/**
 * @file pins.h
 * @brief GPIO pin definitions for the ESP32-S3 ADS1292 ECG front end board
 * @details This file centralizes all GPIO pin assignments for the system.
 *          All pin numbers should be defined here and referenced via these
 *          constants throughout the codebase. Do NOT hardcode pin numbers.
 */

#pragma once
#include <Arduino.h>
#include "driver/gpio.h"

// ============================================================================
// BUTTONS
// ============================================================================

/**
 * @brief STREAM button pin
 * @details Button has external pulldown to GND; button connects to 3.3V when pressed.
 *          Active HIGH logic (HIGH = pressed, LOW = not pressed).
 */
static const gpio_num_t PIN_STREAM_BUTTON = GPIO_NUM_2;   // IO2

/** @brief Button debounce time in milliseconds */
static const uint32_t BUTTON_DEBOUNCE_MS = 50;

// ============================================================================
// ADS1292 (2-channel 24-bit ECG analog front end)
// ============================================================================

/** @brief AFE SPI Master In Slave Out (DOUT) - data from ADS1292 to ESP32 */
static const gpio_num_t PIN_AFE_MISO  = GPIO_NUM_12;

/** @brief AFE SPI Master Out Slave In (DIN) - data from ESP32 to ADS1292 */
static const gpio_num_t PIN_AFE_MOSI  = GPIO_NUM_13;

/** @brief AFE START pin - tie LOW to control conversions with the START command */
static const gpio_num_t PIN_AFE_START = GPIO_NUM_14;

/** @brief AFE power-down / reset pin (PWDN/RESET) - Active LOW */
static const gpio_num_t PIN_AFE_PWDN  = GPIO_NUM_15;

/** @brief AFE data ready pin (DRDY) - Active LOW (LOW = new frame) */
static const gpio_num_t PIN_AFE_DRDY  = GPIO_NUM_16;

/** @brief AFE chip select pin (CS) - Active LOW, driven by software */
static const gpio_num_t PIN_AFE_CS    = GPIO_NUM_17;

/** @brief AFE SPI clock pin (SCLK) */
static const gpio_num_t PIN_AFE_SCK   = GPIO_NUM_18;

/** @brief AFE SPI clock rate in Hz */
static const int AFE_SPI_CLOCK_HZ = 1000000;

// ============================================================================
// USB (native full-speed USB)
// ============================================================================

/** @brief USB data minus (DM) pin */
static const gpio_num_t PIN_USB_DM   = GPIO_NUM_19;

/** @brief USB data plus (DP) pin */
static const gpio_num_t PIN_USB_DP   = GPIO_NUM_20;
