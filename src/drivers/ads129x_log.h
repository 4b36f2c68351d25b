/**
 * @file ads129x_log.h
 * @brief Console logging macros for the ADS129x driver
 *
 * Errors and warnings always print. Debug output (per-frame paths included)
 * is compiled out unless ADS129X_DEBUG is set to 1.
 */

#ifndef ADS129X_LOG_H
#define ADS129X_LOG_H

#include <Arduino.h>

#ifndef ADS129X_DEBUG
#define ADS129X_DEBUG 0
#endif

#define ADS129X_LOG_DEBUG(tag, fmt, ...) \
    do { if (ADS129X_DEBUG) Serial.printf("[" tag "] " fmt "\n", ##__VA_ARGS__); } while (0)
#define ADS129X_LOG_WARN(tag, fmt, ...)  Serial.printf("[" tag "] WARNING: " fmt "\n", ##__VA_ARGS__)
#define ADS129X_LOG_ERROR(tag, fmt, ...) Serial.printf("[" tag "] ERROR: " fmt "\n", ##__VA_ARGS__)

#endif // ADS129X_LOG_H
