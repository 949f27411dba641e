/**
 * @file test_idea_loader.cpp
 * @brief Unit tests for IdeaLoader
 */

#include <catch2/catch.hpp>

#include "data/idea_loader.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace prospect;
using namespace prospect::data;
using Catch::Matchers::WithinAbs;

namespace
{
    const char *kIdeaJson = R"({
        "id": "idea-7",
        "title": "Grid storage build-out",
        "timeHorizon": "long",
        "riskLevel": "high",
        "strategy": "growth",
        "confidenceScore": 0.65,
        "investments": [
            {
                "id": "inv-1",
                "name": "Volt Storage",
                "ticker": "VLT",
                "sector": "Utilities",
                "type": "stock",
                "currentPrice": 42.5,
                "historicalPerformance": [
                    {"date": "2024-01-02", "open": 40, "high": 41, "low": 39, "close": 40.5, "adjustedClose": 40.0, "volume": 250000},
                    {"date": "2024-01-03", "open": 40.5, "high": 42, "low": 40, "close": 41.8, "volume": 310000}
                ],
                "fundamentals": {"peRatio": 18.0, "profitMargin": 0.12},
                "technicalIndicators": {"relativeStrengthIndex": 55, "movingAverages": {"ma50": 41, "ma200": 38}},
                "sentimentAnalysis": {
                    "overallSentiment": "positive",
                    "sentimentTrend": "improving",
                    "analystRecommendations": {"buy": 6, "hold": 3, "sell": 1}
                },
                "riskMetrics": {"volatility": 0.32, "beta": 1.1, "correlations": {"inv-2": 0.4}}
            },
            {"id": "inv-2", "type": "etf"}
        ],
        "potentialOutcomes": [
            {"scenario": "expected", "returnEstimate": 0.12, "probability": 0.6, "timeToRealization": 540,
             "catalysts": ["Capacity auctions"], "keyRisks": ["Rate hikes"]},
            {"scenario": "best", "returnEstimate": 0.35, "probability": 0.2, "timeToRealization": 400},
            {"scenario": "worst", "returnEstimate": -0.25, "probability": 0.2, "timeToRealization": 700}
        ],
        "supportingData": [
            {"source": "Bloomberg", "timestamp": "2024-06-01T09:30:00Z", "reliability": 0.9}
        ]
    })";
}

TEST_CASE("Idea from JSON", "[IdeaLoader]")
{
    auto idea = IdeaLoader::idea_from_json(nlohmann::json::parse(kIdeaJson));

    REQUIRE(idea.id == "idea-7");
    REQUIRE(idea.time_horizon == TimeHorizon::LONG);
    REQUIRE(idea.risk_level == RiskLevel::HIGH);
    REQUIRE(idea.strategy == Strategy::GROWTH);
    REQUIRE_THAT(idea.confidence_score, WithinAbs(0.65, 1e-12));
    REQUIRE(idea.investments.size() == 2);

    SECTION("Full investment")
    {
        const auto &inv = idea.investments[0];
        REQUIRE(inv.sector == "Utilities");
        REQUIRE_THAT(inv.current_price, WithinAbs(42.5, 1e-12));
        REQUIRE(inv.historical_performance.size() == 2);
        REQUIRE_THAT(inv.historical_performance[0].adjusted_close, WithinAbs(40.0, 1e-12));
        // Missing adjustedClose falls back to close
        REQUIRE_THAT(inv.historical_performance[1].adjusted_close, WithinAbs(41.8, 1e-12));

        REQUIRE(inv.fundamentals.has_value());
        REQUIRE_THAT(*inv.fundamentals->pe_ratio, WithinAbs(18.0, 1e-12));
        REQUIRE_FALSE(inv.fundamentals->debt_to_equity.has_value());

        REQUIRE(inv.technical_indicators->moving_averages.has_value());
        REQUIRE_THAT(inv.technical_indicators->moving_averages->ma200, WithinAbs(38.0, 1e-12));
        REQUIRE_FALSE(inv.technical_indicators->macd_line.has_value());

        REQUIRE(inv.sentiment_analysis->overall_sentiment == Sentiment::POSITIVE);
        REQUIRE(inv.sentiment_analysis->analyst_recommendations->buy == 6);

        REQUIRE_THAT(*inv.risk_metrics->beta, WithinAbs(1.1, 1e-12));
        REQUIRE_THAT(inv.risk_metrics->correlations.at("inv-2"), WithinAbs(0.4, 1e-12));
    }

    SECTION("Sparse investment keeps defaults")
    {
        const auto &inv = idea.investments[1];
        REQUIRE(inv.type == AssetType::ETF);
        REQUIRE(inv.name == "inv-2");
        REQUIRE(inv.sector.empty());
        REQUIRE_FALSE(inv.risk_metrics.has_value());
        REQUIRE(inv.historical_performance.empty());
    }

    SECTION("Outcomes and supporting data")
    {
        REQUIRE(idea.potential_outcomes.size() == 3);
        REQUIRE(idea.potential_outcomes[0].catalysts == std::vector<std::string>{"Capacity auctions"});
        REQUIRE(idea.potential_outcomes[2].scenario == OutcomeCase::WORST);
        REQUIRE(idea.potential_outcomes[1].key_risks.empty());

        REQUIRE(idea.supporting_data.size() == 1);
        REQUIRE(format_timestamp(idea.supporting_data[0].timestamp) == "2024-06-01T09:30:00Z");
    }
}

TEST_CASE("Invalid idea documents", "[IdeaLoader]")
{
    REQUIRE_THROWS_AS(IdeaLoader::idea_from_json(nlohmann::json::array()), std::invalid_argument);
    REQUIRE_THROWS_AS(IdeaLoader::idea_from_json({{"strategy", "moonshot"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(IdeaLoader::outcome_from_json({{"scenario", "likely"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(IdeaLoader::price_bar_from_json({{"date", "yesterday"}}), std::invalid_argument);
}

TEST_CASE("Idea from file", "[IdeaLoader][File]")
{
    auto path = std::filesystem::temp_directory_path() / "prospect_idea_test.json";
    {
        std::ofstream out(path);
        out << R"({"idea": )" << kIdeaJson << "}";
    }

    auto idea = IdeaLoader::load_idea(path.string());
    REQUIRE(idea.title == "Grid storage build-out");
    REQUIRE(idea.investments.size() == 2);
    std::filesystem::remove(path);

    SECTION("Missing and malformed files")
    {
        REQUIRE_THROWS_AS(IdeaLoader::load_idea("/nonexistent/idea.json"), std::runtime_error);

        auto broken = std::filesystem::temp_directory_path() / "prospect_broken_idea.json";
        {
            std::ofstream out(broken);
            out << "{ not json";
        }
        REQUIRE_THROWS_AS(IdeaLoader::load_json(broken.string()), std::runtime_error);
        std::filesystem::remove(broken);
    }
}
