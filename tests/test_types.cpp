/**
 * @file test_types.cpp
 * @brief Unit tests for enum names and time helpers
 */

#include <catch2/catch.hpp>

#include "model/types.hpp"

#include <stdexcept>

using namespace prospect;
using Catch::Matchers::WithinAbs;

TEST_CASE("Enum names", "[Types][Enums]")
{
    SECTION("Hyphenated names round trip")
    {
        REQUIRE(parse_strategy(to_string(Strategy::PAIRS_TRADE)) == Strategy::PAIRS_TRADE);
        REQUIRE(parse_asset_type(to_string(AssetType::REAL_ESTATE)) == AssetType::REAL_ESTATE);
        REQUIRE(parse_time_horizon(to_string(TimeHorizon::VERY_LONG)) == TimeHorizon::VERY_LONG);
        REQUIRE(parse_risk_level(to_string(RiskLevel::VERY_LOW)) == RiskLevel::VERY_LOW);
        REQUIRE(parse_sentiment(to_string(Sentiment::VERY_NEGATIVE)) == Sentiment::VERY_NEGATIVE);
        REQUIRE(parse_sentiment_trend(to_string(SentimentTrend::DETERIORATING)) == SentimentTrend::DETERIORATING);
        REQUIRE(parse_outcome_case(to_string(OutcomeCase::WORST)) == OutcomeCase::WORST);
    }

    SECTION("Underscores and upper case are accepted")
    {
        REQUIRE(parse_strategy("PAIRS_TRADE") == Strategy::PAIRS_TRADE);
        REQUIRE(parse_asset_type("Mutual_Fund") == AssetType::MUTUAL_FUND);
        REQUIRE(to_string(AssetType::MUTUAL_FUND) == "mutual-fund");
    }

    SECTION("Unknown names are rejected")
    {
        REQUIRE_THROWS_AS(parse_strategy("yolo"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_time_horizon("forever"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_outcome_case("likely"), std::invalid_argument);
    }
}

TEST_CASE("Timestamps", "[Types][Time]")
{
    SECTION("Date-only and full forms parse as UTC")
    {
        REQUIRE(format_timestamp(parse_timestamp("2024-03-15")) == "2024-03-15T00:00:00Z");
        REQUIRE(format_timestamp(parse_timestamp("2024-03-15T13:45:10Z")) == "2024-03-15T13:45:10Z");
    }

    SECTION("Malformed text is rejected")
    {
        REQUIRE_THROWS_AS(parse_timestamp("15/03/2024"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_timestamp(""), std::invalid_argument);
    }

    SECTION("Day arithmetic")
    {
        Timestamp start = parse_timestamp("2024-02-28");
        REQUIRE(format_timestamp(add_days(start, 2.0)) == "2024-03-01T00:00:00Z");
        REQUIRE_THAT(days_between(start, parse_timestamp("2024-03-01T12:00:00Z")), WithinAbs(2.5, 1e-9));
        REQUIRE_THAT(days_between(parse_timestamp("2024-03-01"), start), WithinAbs(-2.0, 1e-9));
    }
}
