// tests/test_payload_builder.cpp
#include "payload_builder.hpp"
#include <gtest/gtest.h>

namespace {

std::chrono::system_clock::time_point at_millis(long long ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

PowerReading reading(double power, double current, double pf) {
    return {power, current, 120.0, pf, 40};
}

}  // namespace

TEST(PayloadBuilder, TimestampIsUtcWithMillisecondsAndZulu) {
    EXPECT_EQ(PayloadBuilder::format_timestamp(at_millis(1700000000123LL)), "2023-11-14T22:13:20.123Z");
    EXPECT_EQ(PayloadBuilder::format_timestamp(at_millis(1700000000005LL)), "2023-11-14T22:13:20.005Z");
    EXPECT_EQ(PayloadBuilder::format_timestamp(at_millis(0)), "1970-01-01T00:00:00.000Z");
}

TEST(PayloadBuilder, RoundingIsIdempotent) {
    const double values[] = {0.1, 1.23456, 120.04, 2.675, -3.14159, 1000000.05, 0.0005};
    for (int decimals : {1, 3}) {
        for (double v : values) {
            double once = PayloadBuilder::round_to(v, decimals);
            EXPECT_EQ(PayloadBuilder::round_to(once, decimals), once) << v << " @ " << decimals;
        }
    }
}

TEST(PayloadBuilder, RoundsToFixedPrecision) {
    EXPECT_DOUBLE_EQ(PayloadBuilder::round_to(120.04, 1), 120.0);
    EXPECT_DOUBLE_EQ(PayloadBuilder::round_to(45.06, 1), 45.1);
    EXPECT_DOUBLE_EQ(PayloadBuilder::round_to(1.20049, 3), 1.2);
    EXPECT_DOUBLE_EQ(PayloadBuilder::round_to(0.4006, 3), 0.401);
}

TEST(PayloadBuilder, AbsentChannelsAreZeroFilled) {
    PayloadBuilder builder({"powermon_test", "Garage", "America/Chicago"}, 120.0);

    ChannelReadings readings;
    readings[0] = reading(120.04, 1.2004, 0.9);
    readings[1] = reading(45.0, 0.4, 0.9);
    readings[2] = reading(0.0, 0.0, 0.0);

    TelemetryPayload payload = builder.build(readings, at_millis(1700000000123LL));
    json j = payload;

    const json& cts = j["readings"]["cts"];
    ASSERT_EQ(cts.size(), 6u);

    EXPECT_DOUBLE_EQ(cts["ct_1"]["real_power_w"].get<double>(), 120.0);
    EXPECT_DOUBLE_EQ(cts["ct_1"]["amps"].get<double>(), 1.2);
    EXPECT_DOUBLE_EQ(cts["ct_1"]["pf"].get<double>(), 0.9);
    EXPECT_DOUBLE_EQ(cts["ct_2"]["real_power_w"].get<double>(), 45.0);
    EXPECT_DOUBLE_EQ(cts["ct_2"]["amps"].get<double>(), 0.4);

    for (const char* slot : {"ct_3", "ct_4", "ct_5", "ct_6"}) {
        EXPECT_DOUBLE_EQ(cts[slot]["real_power_w"].get<double>(), 0.0) << slot;
        EXPECT_DOUBLE_EQ(cts[slot]["amps"].get<double>(), 0.0) << slot;
        EXPECT_DOUBLE_EQ(cts[slot]["pf"].get<double>(), 0.0) << slot;
    }
}

TEST(PayloadBuilder, SerializesMetadata) {
    PayloadBuilder builder({"powermon_abc", "Kitchen", "America/New_York"}, 239.96);
    json j = builder.build(ChannelReadings{}, at_millis(1700000000123LL));

    EXPECT_EQ(j["device_id"].get<std::string>(), "powermon_abc");
    EXPECT_EQ(j["location"].get<std::string>(), "Kitchen");
    EXPECT_EQ(j["timezone"].get<std::string>(), "America/New_York");
    EXPECT_EQ(j["timestamp"].get<std::string>(), "2023-11-14T22:13:20.123Z");
    EXPECT_DOUBLE_EQ(j["readings"]["voltage_rms"].get<double>(), 240.0);
}

TEST(PayloadBuilder, OmitsTimezoneWhenUnset) {
    PayloadBuilder builder({"powermon_abc", "Kitchen", ""}, 120.0);
    json j = builder.build(ChannelReadings{}, at_millis(0));

    EXPECT_FALSE(j.contains("timezone"));
    EXPECT_TRUE(j.contains("location"));
}

TEST(PayloadBuilder, DumpedBodyParsesBack) {
    PayloadBuilder builder({"powermon_abc", "Kitchen", ""}, 120.0);
    ChannelReadings readings;
    readings[3] = reading(300.0, 2.778, 0.9);

    json j = builder.build(readings, at_millis(0));
    json parsed = json::parse(j.dump());
    EXPECT_DOUBLE_EQ(parsed["readings"]["cts"]["ct_4"]["amps"].get<double>(), 2.778);
}
