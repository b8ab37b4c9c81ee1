#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "source/source_options.hpp"

using namespace geosplit;

TEST(SourceOptionsTest, Defaults) {
    source::SourceOptions options = source::parseSourceOptions(nlohmann::json::object());
    EXPECT_FALSE(options.skip_reproject);
    EXPECT_FALSE(options.in_epsg.has_value());
    EXPECT_TRUE(options.in_proj.empty());
    EXPECT_EQ(options.out_epsg, 4326);
    EXPECT_EQ(options.band_number, 1);
    EXPECT_FALSE(options.include_nodata);
    EXPECT_FALSE(options.page_size.has_value());
    EXPECT_EQ(options.max_retries, 5);
    EXPECT_EQ(options.initial_backoff_ms, 500);
    EXPECT_TRUE(options.crsSpec().deriveFromFile());
}

TEST(SourceOptionsTest, ParsesTypedAndStringValues) {
    nlohmann::json options_json = {
        {"skip_reproject", "true"},
        {"in_epsg", 32633},
        {"out_epsg", "3857"},
        {"band_number", 2},
        {"include_nodata", true},
        {"layer_name", "roads"},
        {"gdb_name", "city"},
        {"page_size", "250"},
        {"max_retries", 0},
        {"initial_backoff_ms", "10"}
    };

    source::SourceOptions options = source::parseSourceOptions(options_json);
    EXPECT_TRUE(options.skip_reproject);
    EXPECT_EQ(options.in_epsg.value(), 32633);
    EXPECT_EQ(options.out_epsg, 3857);
    EXPECT_EQ(options.band_number, 2);
    EXPECT_TRUE(options.include_nodata);
    EXPECT_EQ(options.layer_name, "roads");
    EXPECT_EQ(options.gdb_name, "city");
    EXPECT_EQ(options.page_size.value(), 250);
    EXPECT_EQ(options.retryPolicy().max_retries, 0);
    EXPECT_EQ(options.retryPolicy().initial_backoff_ms, 10);
    EXPECT_EQ(options.crsSpec().epsg.value(), 32633);
}

TEST(SourceOptionsTest, RejectsUnknownAndInvalidValues) {
    EXPECT_THROW(source::parseSourceOptions({{"band", 1}}), core::ConfigurationError);
    EXPECT_THROW(source::parseSourceOptions({{"band_number", 0}}), core::ConfigurationError);
    EXPECT_THROW(source::parseSourceOptions({{"out_epsg", "abc"}}), core::ConfigurationError);
    EXPECT_THROW(source::parseSourceOptions({{"include_nodata", "maybe"}}), core::ConfigurationError);
    EXPECT_THROW(source::parseSourceOptions({{"layer_name", 5}}), core::ConfigurationError);
    EXPECT_THROW(source::parseSourceOptions(nlohmann::json::array()), core::ConfigurationError);
}

TEST(SourceOptionsTest, RetryBackoffGrowsExponentially) {
    io::RetryPolicy policy;
    policy.initial_backoff_ms = 100;
    policy.max_backoff_ms = 1000;
    EXPECT_EQ(policy.backoffMs(1), 100);
    EXPECT_EQ(policy.backoffMs(2), 200);
    EXPECT_EQ(policy.backoffMs(3), 400);
    EXPECT_EQ(policy.backoffMs(10), 1000);
}
