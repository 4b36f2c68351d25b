/**
 * @file test_helpers.h
 * @brief Shared assertions for the ADS129x native tests
 */

#ifndef TEST_HELPERS_H
#define TEST_HELPERS_H

#include <unity.h>
#include "drivers/ads129x_error.h"

/** @brief Compare driver errors by name so failures read "Expected 'None' Was 'Transport'" */
#define TEST_ASSERT_ERROR(expected, actual) \
    TEST_ASSERT_EQUAL_STRING(ADS129x::errorToString(expected), ADS129x::errorToString(actual))

#define TEST_ASSERT_OK(actual) TEST_ASSERT_ERROR(ADS129x::Error::None, actual)

#endif // TEST_HELPERS_H
