/**
 * @file test_registers_codec.cpp
 * @brief Unit tests for the ADS129x command/register encoding
 *
 * Tests:
 * - Command and register wire bytes against the datasheet tables
 * - RREG/WREG transaction framing
 * - Register write validation (reject, never mask)
 * - Write/read round trip against the simulated register file
 * - Typed register views
 */

#include <unity.h>
#include "test_helpers.h"
#include "mock_spi_transport.h"
#include "drivers/ads129x_codec.h"

using namespace ADS129x;

static std::shared_ptr<MockBus::BusLog> busLog;
static MockBus::MockSpiTransport* bus;

void setUp() {
    busLog = std::make_shared<MockBus::BusLog>();
    bus = new MockBus::MockSpiTransport(busLog);
}

void tearDown() {
    delete bus;
    bus = nullptr;
    busLog.reset();
}

// ============================================================================
// Wire Tables
// ============================================================================

void test_command_bytes_match_datasheet() {
    TEST_ASSERT_EQUAL_HEX8(0x02, commandByte(Command::WAKEUP));
    TEST_ASSERT_EQUAL_HEX8(0x04, commandByte(Command::STANDBY));
    TEST_ASSERT_EQUAL_HEX8(0x06, commandByte(Command::RESET));
    TEST_ASSERT_EQUAL_HEX8(0x08, commandByte(Command::START));
    TEST_ASSERT_EQUAL_HEX8(0x0A, commandByte(Command::STOP));
    TEST_ASSERT_EQUAL_HEX8(0x1A, commandByte(Command::OFFSETCAL));
    TEST_ASSERT_EQUAL_HEX8(0x10, commandByte(Command::RDATAC));
    TEST_ASSERT_EQUAL_HEX8(0x11, commandByte(Command::SDATAC));
    TEST_ASSERT_EQUAL_HEX8(0x12, commandByte(Command::RDATA));
}

void test_command_bytes_are_distinct() {
    TEST_ASSERT_EQUAL(9, COMMAND_COUNT);
    for (size_t i = 0; i < COMMAND_COUNT; i++) {
        for (size_t j = 0; j < COMMAND_COUNT; j++) {
            if (i != j) {
                TEST_ASSERT_NOT_EQUAL(commandByte(ALL_COMMANDS[i]), commandByte(ALL_COMMANDS[j]));
            }
        }
    }
}

void test_register_addresses_are_distinct_and_contiguous() {
    TEST_ASSERT_EQUAL(12, REGISTER_COUNT);
    for (size_t i = 0; i < REGISTER_COUNT; i++) {
        // The map is 0x00..0x0B with no holes, which burst access relies on
        TEST_ASSERT_EQUAL_HEX8(i, registerAddress(ALL_REGISTERS[i]));
    }
}

// ============================================================================
// Transaction Framing
// ============================================================================

void test_send_command_is_single_byte() {
    TEST_ASSERT_OK(sendCommand(*bus, Command::START));

    TEST_ASSERT_EQUAL(1, busLog->exchanges.size());
    TEST_ASSERT_EQUAL(1, busLog->exchanges[0].size());
    TEST_ASSERT_EQUAL_HEX8(0x08, busLog->exchanges[0][0]);
}

void test_register_header_format() {
    uint8_t header[2] = {0, 0};

    encodeRegisterHeader(Opcode::RREG, Register::LOFF, 1, header);
    TEST_ASSERT_EQUAL_HEX8(0x23, header[0]);
    TEST_ASSERT_EQUAL_HEX8(0x00, header[1]);

    encodeRegisterHeader(Opcode::WREG, Register::CH1SET, 2, header);
    TEST_ASSERT_EQUAL_HEX8(0x44, header[0]);
    TEST_ASSERT_EQUAL_HEX8(0x01, header[1]);
}

void test_write_register_frame() {
    TEST_ASSERT_OK(writeRegister(*bus, Register::CONFIG1, 0x01));

    TEST_ASSERT_EQUAL(1, busLog->exchanges.size());
    const uint8_t expected[] = {0x41, 0x00, 0x01};
    TEST_ASSERT_EQUAL(3, busLog->exchanges[0].size());
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, busLog->exchanges[0].data(), 3);
}

void test_read_register_frame() {
    busLog->registers[registerAddress(Register::CH2SET)] = 0x65;

    uint8_t value = 0;
    TEST_ASSERT_OK(readRegister(*bus, Register::CH2SET, value));

    const uint8_t expected[] = {0x25, 0x00, 0x00};
    TEST_ASSERT_EQUAL(3, busLog->exchanges[0].size());
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, busLog->exchanges[0].data(), 3);
    TEST_ASSERT_EQUAL_HEX8(0x65, value);
}

void test_burst_read() {
    uint8_t values[3] = {0};
    TEST_ASSERT_OK(readRegisters(*bus, Register::CONFIG1, 3, values));

    TEST_ASSERT_EQUAL(5, busLog->exchanges[0].size());
    TEST_ASSERT_EQUAL_HEX8(0x21, busLog->exchanges[0][0]);
    TEST_ASSERT_EQUAL_HEX8(0x02, busLog->exchanges[0][1]);

    TEST_ASSERT_EQUAL_HEX8(0x02, values[0]);  // CONFIG1 reset value
    TEST_ASSERT_EQUAL_HEX8(0x80, values[1]);  // CONFIG2
    TEST_ASSERT_EQUAL_HEX8(0x10, values[2]);  // LOFF
}

void test_burst_write() {
    const uint8_t values[2] = {0x60, 0x81};
    TEST_ASSERT_OK(writeRegisters(*bus, Register::CH1SET, values, 2));

    const uint8_t expected[] = {0x44, 0x01, 0x60, 0x81};
    TEST_ASSERT_EQUAL(4, busLog->exchanges[0].size());
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, busLog->exchanges[0].data(), 4);
    TEST_ASSERT_EQUAL_HEX8(0x60, busLog->registers[registerAddress(Register::CH1SET)]);
    TEST_ASSERT_EQUAL_HEX8(0x81, busLog->registers[registerAddress(Register::CH2SET)]);
}

void test_burst_outside_register_map_rejected() {
    uint8_t values[4] = {0};

    TEST_ASSERT_ERROR(Error::InvalidRegisterValue, readRegisters(*bus, Register::RESP2, 3, values));
    TEST_ASSERT_ERROR(Error::InvalidRegisterValue, readRegisters(*bus, Register::ID, 0, values));
    TEST_ASSERT_EQUAL(0, busLog->exchanges.size());
}

// ============================================================================
// Validation
// ============================================================================

void test_invalid_value_rejected_without_bus_traffic() {
    // CONFIG1[6:3] must be 0
    TEST_ASSERT_ERROR(Error::InvalidRegisterValue, writeRegister(*bus, Register::CONFIG1, 0x08));
    // CONFIG2[7] must be 1
    TEST_ASSERT_ERROR(Error::InvalidRegisterValue, writeRegister(*bus, Register::CONFIG2, 0x00));
    // GPIO[7:4] must be 0
    TEST_ASSERT_ERROR(Error::InvalidRegisterValue, writeRegister(*bus, Register::GPIO, 0x1C));

    TEST_ASSERT_EQUAL(0, busLog->exchanges.size());
}

void test_read_only_register_rejected() {
    TEST_ASSERT_ERROR(Error::ReadOnlyRegister, writeRegister(*bus, Register::ID, 0x53));
    TEST_ASSERT_EQUAL(0, busLog->exchanges.size());
}

void test_burst_write_validates_before_sending() {
    // LOFF value breaks LOFF[4] = 1
    const uint8_t values[3] = {0x02, 0x80, 0x00};
    TEST_ASSERT_ERROR(Error::InvalidRegisterValue, writeRegisters(*bus, Register::CONFIG1, values, 3));

    TEST_ASSERT_EQUAL(0, busLog->exchanges.size());
}

void test_register_round_trip_for_every_valid_value() {
    for (size_t r = 0; r < REGISTER_COUNT; r++) {
        Register reg = ALL_REGISTERS[r];
        if (registerRule(reg).readOnly) {
            continue;
        }

        unsigned validCount = 0;
        for (unsigned v = 0; v <= 0xFF; v++) {
            uint8_t value = static_cast<uint8_t>(v);
            size_t before = busLog->exchanges.size();

            if (!isValidRegisterValue(reg, value)) {
                TEST_ASSERT_ERROR(Error::InvalidRegisterValue, writeRegister(*bus, reg, value));
                TEST_ASSERT_EQUAL(before, busLog->exchanges.size());
                continue;
            }

            validCount++;
            uint8_t readBack = 0;
            TEST_ASSERT_OK(writeRegister(*bus, reg, value));
            TEST_ASSERT_OK(readRegister(*bus, reg, readBack));
            TEST_ASSERT_EQUAL_HEX8(value, readBack);
        }
        TEST_ASSERT_GREATER_THAN(0, validCount);
    }
}

void test_transport_failure_reported() {
    busLog->failExchangeIndex = 0;
    busLog->failStatus = 0x107;  // ESP_ERR_TIMEOUT

    int status = 0;
    uint8_t value = 0xAA;
    TEST_ASSERT_ERROR(Error::Transport, readRegister(*bus, Register::CONFIG1, value, &status));
    TEST_ASSERT_EQUAL(0x107, status);
    TEST_ASSERT_EQUAL_HEX8(0xAA, value);  // Untouched on failure
}

// ============================================================================
// Typed Register Views
// ============================================================================

void test_config1_view() {
    Config1 c;
    c.singleShot = true;
    c.rate = SampleRate::SPS_1000;
    TEST_ASSERT_EQUAL_HEX8(0x83, c.toByte());

    Config1 back = Config1::fromByte(0x83);
    TEST_ASSERT_TRUE(back.singleShot);
    TEST_ASSERT_TRUE(back.rate == SampleRate::SPS_1000);
    TEST_ASSERT_EQUAL(1000, rateToHz(back.rate));
}

void test_config2_sets_mandatory_bit() {
    Config2 c;
    TEST_ASSERT_EQUAL_HEX8(0x80, c.toByte());

    c.referenceBuffer = true;
    c.testSignal = true;
    TEST_ASSERT_EQUAL_HEX8(0xA2, c.toByte());
    TEST_ASSERT_TRUE(isValidRegisterValue(Register::CONFIG2, c.toByte()));
}

void test_lead_off_control_sets_mandatory_bit() {
    LeadOffControl c;
    c.comparatorThreshold = 0b011;
    c.current = LeadOffCurrent::UA_6;
    c.acLeadOff = true;
    TEST_ASSERT_EQUAL_HEX8(0x79, c.toByte());
    TEST_ASSERT_TRUE(isValidRegisterValue(Register::LOFF, c.toByte()));

    LeadOffControl back = LeadOffControl::fromByte(0x79);
    TEST_ASSERT_EQUAL(3, back.comparatorThreshold);
    TEST_ASSERT_TRUE(back.current == LeadOffCurrent::UA_6);
    TEST_ASSERT_TRUE(back.acLeadOff);
}

void test_channel_settings_view() {
    ChannelSettings s;
    s.gain = Gain::X12;
    s.mux = InputSelection::TemperatureSensor;
    TEST_ASSERT_EQUAL_HEX8(0x64, s.toByte());

    ChannelSettings back = ChannelSettings::fromByte(0xE5);
    TEST_ASSERT_TRUE(back.powerDown);
    TEST_ASSERT_TRUE(back.gain == Gain::X12);
    TEST_ASSERT_TRUE(back.mux == InputSelection::TestSignal);
    TEST_ASSERT_EQUAL(12, gainToMultiplier(back.gain));

    TEST_ASSERT_TRUE(ChannelSettings::fromByte(0x0C).mux == InputSelection::Unknown);
}

void test_rld_sense_and_resp2_views() {
    RldSense rld;
    rld.chop = ChopFrequency::FmodDiv4;
    rld.rldBuffer = true;
    rld.rld1p = true;
    rld.rld1n = true;
    TEST_ASSERT_EQUAL_HEX8(0xE3, rld.toByte());

    Resp2 resp;
    resp.calibration = true;
    resp.respFreq64kHz = true;
    resp.rldRefInternal = true;
    TEST_ASSERT_EQUAL_HEX8(0x86, resp.toByte());
    TEST_ASSERT_TRUE(isValidRegisterValue(Register::RESP2, resp.toByte()));
}

void test_lead_off_sense_view() {
    LeadOffSense s = LeadOffSense::fromByte(0x3F);
    TEST_ASSERT_TRUE(s.flip2 && s.flip1 && s.loff2n && s.loff2p && s.loff1n && s.loff1p);
    TEST_ASSERT_EQUAL_HEX8(0x3F, s.toByte());
}

// ============================================================================
// Test Runner
// ============================================================================

int main(int argc, char** argv) {
    UNITY_BEGIN();

    // Wire tables
    RUN_TEST(test_command_bytes_match_datasheet);
    RUN_TEST(test_command_bytes_are_distinct);
    RUN_TEST(test_register_addresses_are_distinct_and_contiguous);

    // Transaction framing
    RUN_TEST(test_send_command_is_single_byte);
    RUN_TEST(test_register_header_format);
    RUN_TEST(test_write_register_frame);
    RUN_TEST(test_read_register_frame);
    RUN_TEST(test_burst_read);
    RUN_TEST(test_burst_write);
    RUN_TEST(test_burst_outside_register_map_rejected);

    // Validation
    RUN_TEST(test_invalid_value_rejected_without_bus_traffic);
    RUN_TEST(test_read_only_register_rejected);
    RUN_TEST(test_burst_write_validates_before_sending);
    RUN_TEST(test_register_round_trip_for_every_valid_value);
    RUN_TEST(test_transport_failure_reported);

    // Typed views
    RUN_TEST(test_config1_view);
    RUN_TEST(test_config2_sets_mandatory_bit);
    RUN_TEST(test_lead_off_control_sets_mandatory_bit);
    RUN_TEST(test_channel_settings_view);
    RUN_TEST(test_rld_sense_and_resp2_views);
    RUN_TEST(test_lead_off_sense_view);

    return UNITY_END();
}
