#include "vigil/errors.h"
#include "vigil/stream/reading_parser.h"
#include <gtest/gtest.h>

using vigil::FeedConfig;
using vigil::ValidationError;
using vigil::stream::ReadingParser;

TEST(ReadingParserTest, ParsesCanonicalRecord) {
    ReadingParser parser;
    auto reading = parser.parse(std::string(
        R"({"monitor_id": "m1", "device_id": "d7", "timestamp": 1700000000000, "values": {"temp": 71.5, "flow": 3}})"));

    EXPECT_EQ(reading.monitor_id, "m1");
    EXPECT_EQ(reading.device_id, "d7");
    EXPECT_EQ(reading.timestamp, 1700000000000LL);
    EXPECT_DOUBLE_EQ(reading.values.at("temp"), 71.5);
    EXPECT_DOUBLE_EQ(reading.values.at("flow"), 3.0);
    EXPECT_FALSE(reading.has_label());
}

TEST(ReadingParserTest, AcceptsUpstreamFieldNames) {
    ReadingParser parser;
    auto reading = parser.parse(std::string(
        R"({"MONITORID": 42, "TIMESTAMP": "1000", "PROCESS_PARAMETER": {"P1": "12.5 "}, "is_anomaly": true})"));

    EXPECT_EQ(reading.monitor_id, "42");
    EXPECT_EQ(reading.timestamp, 1000);
    EXPECT_DOUBLE_EQ(reading.values.at("P1"), 12.5);
    EXPECT_EQ(reading.label, 1);
}

TEST(ReadingParserTest, CleansNumericValues) {
    EXPECT_DOUBLE_EQ(ReadingParser::clean_numeric(nlohmann::json(3.5)).value(), 3.5);
    EXPECT_DOUBLE_EQ(ReadingParser::clean_numeric(nlohmann::json("-2e3")).value(), -2000.0);
    EXPECT_FALSE(ReadingParser::clean_numeric(nlohmann::json("12abc")).has_value());
    EXPECT_FALSE(ReadingParser::clean_numeric(nlohmann::json("")).has_value());
    EXPECT_FALSE(ReadingParser::clean_numeric(nlohmann::json("nan")).has_value());
    EXPECT_FALSE(ReadingParser::clean_numeric(nlohmann::json::array()).has_value());
}

TEST(ReadingParserTest, RejectsMalformedRecords) {
    ReadingParser parser;
    EXPECT_THROW(parser.parse(std::string("{")), ValidationError);
    EXPECT_THROW(parser.parse(std::string("[1, 2]")), ValidationError);
    EXPECT_THROW(parser.parse(std::string(R"({"timestamp": 1, "values": {"a": 1}})")), ValidationError);
    EXPECT_THROW(parser.parse(std::string(R"({"monitor_id": "m1", "values": {"a": 1}})")), ValidationError);
    EXPECT_THROW(parser.parse(std::string(R"({"monitor_id": "m1", "timestamp": 1.5, "values": {"a": 1}})")),
                 ValidationError);
    EXPECT_THROW(parser.parse(std::string(R"({"monitor_id": "m1", "timestamp": 1, "values": {}})")),
                 ValidationError);
}

TEST(ReadingParserTest, UnparsableSensorValueNamesTheSensor) {
    ReadingParser parser;
    try {
        parser.parse(std::string(R"({"monitor_id": "m1", "timestamp": 1, "values": {"temp": "hot"}})"));
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.field(), "temp");
    }
}

TEST(ReadingParserTest, SensorFilterDropsUnlistedSensors) {
    FeedConfig feed;
    feed.sensors = {"temp"};
    ReadingParser parser(feed);

    auto reading = parser.parse(std::string(
        R"({"monitor_id": "m1", "timestamp": 1, "values": {"temp": 1, "noise": "garbage"}})"));
    EXPECT_EQ(reading.values.size(), 1u);
    EXPECT_EQ(reading.values.count("temp"), 1u);

    EXPECT_THROW(parser.parse(std::string(R"({"monitor_id": "m1", "timestamp": 1, "values": {"noise": 1}})")),
                 ValidationError);
}
