#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>
#include "core/errors.hpp"
#include "data/bar_table.hpp"
#include "test_helpers.hpp"

namespace {

class BarTableTest : public ::testing::Test {
protected:
    std::string path_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = ::testing::TempDir() + "kumo_" + info->name() + ".csv";
    }
    void TearDown() override { std::remove(path_.c_str()); }

    void write(const std::string& text) {
        std::ofstream f(path_);
        f << text;
    }
};

} // namespace

TEST_F(BarTableTest, LoadsAnyColumnOrder) {
    write("Close,Open,High,Low,Date,Volume\n"
          "101,100,102,99,2024-01-02,1500\n"
          "103,101,104,100,2024-01-03,\n");
    const auto bars = data::load_bars_csv(path_);
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(bars[0].open_time_ms, 1'704'153'600'000LL);
    EXPECT_EQ(bars[1].open_time_ms - bars[0].open_time_ms, testutil::kDayMs);
    EXPECT_DOUBLE_EQ(bars[0].open, 100.0);
    EXPECT_DOUBLE_EQ(bars[0].high, 102.0);
    EXPECT_DOUBLE_EQ(bars[0].low, 99.0);
    EXPECT_DOUBLE_EQ(bars[0].close, 101.0);
    ASSERT_TRUE(bars[0].volume.has_value());
    EXPECT_DOUBLE_EQ(*bars[0].volume, 1500.0);
    EXPECT_FALSE(bars[1].volume.has_value());
}

TEST_F(BarTableTest, CrlfAndBlankLines) {
    write("time,open,high,low,close\r\n1700000000000,1,2,0.5,1.5\r\n\r\n1700000060000,1.5,2,1,1.8\r\n");
    const auto bars = data::load_bars_csv(path_);
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_DOUBLE_EQ(bars[1].close, 1.8);
}

TEST_F(BarTableTest, MissingColumnIsSchemaError) {
    write("time,open,high,close\n1700000000000,1,2,1.5\n");
    EXPECT_THROW(data::load_bars_csv(path_), core::SchemaError);
}

TEST_F(BarTableTest, NonNumberIsSchemaError) {
    write("time,open,high,low,close\n1700000000000,1,2,abc,1.5\n");
    EXPECT_THROW(data::load_bars_csv(path_), core::SchemaError);
}

TEST_F(BarTableTest, NonIncreasingTimeIsSchemaError) {
    write("time,open,high,low,close\n"
          "1700000000000,1,2,0.5,1.5\n"
          "1700000000000,1,2,0.5,1.5\n");
    EXPECT_THROW(data::load_bars_csv(path_), core::SchemaError);
}

TEST_F(BarTableTest, HighBelowLowIsSchemaError) {
    write("time,open,high,low,close\n1700000000000,1,0.5,2,1.5\n");
    EXPECT_THROW(data::load_bars_csv(path_), core::SchemaError);
}

TEST_F(BarTableTest, MissingFileIsSchemaError) {
    EXPECT_THROW(data::load_bars_csv(path_ + ".nope"), core::SchemaError);
}

TEST(TimestampTest, SecondsMillisAndDates) {
    EXPECT_EQ(data::parse_timestamp_ms("1700000000"), 1'700'000'000'000LL);
    EXPECT_EQ(data::parse_timestamp_ms("1700000000000"), 1'700'000'000'000LL);
    EXPECT_EQ(data::parse_timestamp_ms("1970-01-01"), 0);
    EXPECT_EQ(data::parse_timestamp_ms("2024-01-02 00:00:00"), 1'704'153'600'000LL);
    EXPECT_EQ(data::parse_timestamp_ms("2024-01-02T01:02:03"), 1'704'153'600'000LL + 3'723'000LL);
    EXPECT_THROW(data::parse_timestamp_ms(""), core::SchemaError);
    EXPECT_THROW(data::parse_timestamp_ms("2024-13-01"), core::SchemaError);
    EXPECT_THROW(data::parse_timestamp_ms("12abc"), core::SchemaError);
}
