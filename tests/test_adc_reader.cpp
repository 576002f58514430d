// tests/test_adc_reader.cpp
#include "adc_reader.hpp"
#include "protocol.hpp"
#include <gtest/gtest.h>

TEST(Mcp3008Reader, EncodesSingleEndedChannelSelect) {
    auto ch0 = Mcp3008Reader::encode_request(0);
    EXPECT_EQ(ch0[0], 0x01);
    EXPECT_EQ(ch0[1], 0x80);
    EXPECT_EQ(ch0[2], 0x00);

    auto ch5 = Mcp3008Reader::encode_request(5);
    EXPECT_EQ(ch5[1], 0xD0);

    auto ch7 = Mcp3008Reader::encode_request(7);
    EXPECT_EQ(ch7[1], 0xF0);
}

TEST(Mcp3008Reader, DecodesTenBitCode) {
    EXPECT_EQ(Mcp3008Reader::decode_response({0x00, 0x03, 0xFF}), 1023);
    EXPECT_EQ(Mcp3008Reader::decode_response({0x00, 0x00, 0x00}), 0);
    EXPECT_EQ(Mcp3008Reader::decode_response({0x00, 0x02, 0x00}), 512);
}

TEST(Mcp3008Reader, IgnoresUpperBitsOfMiddleByte) {
    EXPECT_EQ(Mcp3008Reader::decode_response({0xFF, 0xFE, 0x10}), (2 << 8) | 0x10);
}

TEST(Mcp3008Reader, OutOfRangeChannelIsFault) {
    Mcp3008Reader reader(0, 0, 500000);
    EXPECT_EQ(reader.read(-1), ADC_FAULT);
    EXPECT_EQ(reader.read(8), ADC_FAULT);
}

TEST(Mcp3008Reader, UnopenedDeviceReadsAsFault) {
    Mcp3008Reader reader(0, 0, 500000);
    EXPECT_FALSE(reader.is_open());
    EXPECT_EQ(reader.read(0), ADC_FAULT);
}

TEST(Mcp3008Reader, OpenFailsForMissingDevice) {
    Mcp3008Reader reader(97, 3, 500000);
    EXPECT_EQ(reader.device_path(), "/dev/spidev97.3");
    EXPECT_FALSE(reader.open());
    EXPECT_FALSE(reader.is_open());

    reader.close();
    reader.close();
    EXPECT_FALSE(reader.is_open());
}
