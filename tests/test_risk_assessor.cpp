/**
 * @file test_risk_assessor.cpp
 * @brief Unit tests for RiskAssessor
 */

#include <catch2/catch.hpp>

#include "idea_builders.hpp"
#include "risk/risk_assessor.hpp"

#include <numeric>

using namespace prospect;
using namespace prospect::risk;
using namespace prospect::testing;
using Catch::Matchers::WithinAbs;

TEST_CASE("Risk level bands are upper-inclusive", "[RiskAssessor][Level]")
{
    REQUIRE(RiskAssessor::determine_risk_level(0.0) == RiskLevel::VERY_LOW);
    REQUIRE(RiskAssessor::determine_risk_level(20.0) == RiskLevel::VERY_LOW);
    REQUIRE(RiskAssessor::determine_risk_level(20.0001) == RiskLevel::LOW);
    REQUIRE(RiskAssessor::determine_risk_level(40.0) == RiskLevel::LOW);
    REQUIRE(RiskAssessor::determine_risk_level(60.0) == RiskLevel::MODERATE);
    REQUIRE(RiskAssessor::determine_risk_level(80.0) == RiskLevel::HIGH);
    REQUIRE(RiskAssessor::determine_risk_level(80.0001) == RiskLevel::VERY_HIGH);
}

TEST_CASE("Risk score", "[RiskAssessor][Score]")
{
    RiskAssessor assessor;

    SECTION("Mean of volatility, concentration, horizon and strategy")
    {
        auto idea = make_idea({make_investment("A", "Tech", AssetType::STOCK, 0.2)});
        // (20 + 20 + 10 + 10) / 4
        REQUIRE_THAT(assessor.risk_score(idea), WithinAbs(15.0, 1e-12));
        REQUIRE(assessor.assess_risk(idea, fixed_now()).overall_risk_level == RiskLevel::VERY_LOW);
    }

    SECTION("Volatility contribution is capped at 40")
    {
        auto idea = make_idea({make_investment("A", "Tech", AssetType::STOCK, 0.9)},
                              Strategy::COMPLEX, TimeHorizon::INTRADAY);
        // (40 + 20 + 30 + 25) / 4
        REQUIRE_THAT(assessor.risk_score(idea), WithinAbs(28.75, 1e-12));
    }

    SECTION("Lookup tables")
    {
        REQUIRE(RiskAssessor::time_horizon_risk(TimeHorizon::VERY_LONG) == 2.0);
        REQUIRE(RiskAssessor::strategy_risk(Strategy::PAIRS_TRADE) == 15.0);
        REQUIRE(RiskAssessor::strategy_risk(Strategy::SHORT) == 25.0);
        REQUIRE(RiskAssessor::strategy_risk(Strategy::INCOME) == 5.0);
    }
}

TEST_CASE("RiskAssessor: Empty portfolio", "[RiskAssessor][Edge]")
{
    auto assessment = RiskAssessor().assess_risk(make_idea({}), fixed_now());

    REQUIRE(assessment.risk_factors.size() == 1);
    const auto &factor = assessment.risk_factors.front();
    REQUIRE(factor.type == RiskFactorType::OPERATIONAL);
    REQUIRE(factor.severity == Severity::HIGH);
    REQUIRE(factor.probability == 1.0);
    REQUIRE(factor.impact == 100.0);
    REQUIRE(factor.description == "No investments in portfolio");
    REQUIRE(factor.time_horizon == RiskTimeframe::IMMEDIATE);

    REQUIRE(assessment.risk_mitigation.size() == 1);
    REQUIRE(assessment.risk_mitigation.front().strategy == "Monitor closely and maintain stop-loss levels");

    REQUIRE(assessment.concentration_risk.single_position_risk == 1.0);
    REQUIRE(assessment.market_risk.beta == 1.0);
    REQUIRE(assessment.liquidity_risk.average_daily_volume == 0.0);
    REQUIRE(assessment.liquidity_risk.level == RiskTier::LOW);
    REQUIRE_FALSE(assessment.credit_risk.has_value());
    REQUIRE(assessment.stress_test_results.size() == 2);
}

TEST_CASE("Risk factors", "[RiskAssessor][Factors]")
{
    RiskAssessor assessor;

    SECTION("Nothing fired yields one general market factor")
    {
        auto inv = make_investment("A", "Tech");
        inv.historical_performance = linear_bars(100.0, 110.0, 40, 500000.0);
        auto factors = assessor.identify_risk_factors(make_idea({inv}));

        REQUIRE(factors.size() == 1);
        REQUIRE(factors[0].type == RiskFactorType::MARKET);
        REQUIRE(factors[0].severity == Severity::LOW);
        REQUIRE(factors[0].description == "General market risk exposure");
    }

    SECTION("High beta")
    {
        auto factors = assessor.identify_risk_factors(
            make_idea({make_investment("A", "Tech", AssetType::STOCK, 0.2, 1.5)}));

        REQUIRE(factors.size() == 1);
        REQUIRE(factors[0].description == "High market sensitivity (Beta: 1.50)");
        REQUIRE_THAT(factors[0].impact, WithinAbs(10.0, 1e-12));
        REQUIRE(factors[0].time_horizon == RiskTimeframe::SHORT_TERM);
    }

    SECTION("Thin volume, sector concentration and momentum fire in order")
    {
        auto a = make_investment("A", "Tech");
        a.historical_performance = linear_bars(10.0, 11.0, 5, 50000.0);
        auto b = make_investment("B", "Tech");
        auto c = make_investment("C", "Tech");

        auto factors = assessor.identify_risk_factors(make_idea({a, b, c}, Strategy::MOMENTUM));

        REQUIRE(factors.size() == 3);
        REQUIRE(factors[0].type == RiskFactorType::LIQUIDITY);
        REQUIRE(factors[0].description == "1 assets with potential liquidity constraints");
        REQUIRE(factors[1].severity == Severity::HIGH);
        REQUIRE(factors[1].description == "High sector concentration risk");
        REQUIRE(factors[2].description == "Momentum strategy vulnerable to trend reversals");

        auto mitigations = RiskAssessor::generate_mitigations(factors);
        REQUIRE(mitigations.size() == 3);
        REQUIRE(mitigations[0].implementation == Implementation::IMMEDIATE);
        REQUIRE_THAT(mitigations[0].effectiveness, WithinAbs(0.8, 1e-12));
        REQUIRE(mitigations[1].implementation == Implementation::GRADUAL);
        REQUIRE_THAT(mitigations[1].cost, WithinAbs(0.02, 1e-12));
    }
}

TEST_CASE("Stress tests and scenarios", "[RiskAssessor][Stress]")
{
    std::vector<Investment> investments = {make_investment("A", "Tech"), make_investment("B", "Energy"),
                                           make_investment("C", "Tech"), make_investment("D")};

    auto results = RiskAssessor::stress_tests(investments);
    REQUIRE(results.size() == 4);
    REQUIRE(results[0].scenario == "Market Crash (-30%)");
    REQUIRE(results[1].scenario == "Interest Rate Shock (+200bp)");
    REQUIRE(results[2].scenario == "Tech Sector Decline (-20%)");
    REQUIRE(results[3].scenario == "Energy Sector Decline (-20%)");
    REQUIRE(results[3].time_to_recovery == 270);

    auto scenarios = RiskAssessor::scenario_analysis();
    REQUIRE(scenarios.size() == 5);
    double total = std::accumulate(scenarios.begin(), scenarios.end(), 0.0,
                                   [](double sum, const ScenarioRisk &s)
                                   { return sum + s.probability; });
    REQUIRE_THAT(total, WithinAbs(1.0, 1e-12));
    for (const auto &s : scenarios)
    {
        REQUIRE(s.key_triggers.size() == 3);
    }
}

TEST_CASE("Correlation risks", "[RiskAssessor][Correlation]")
{
    auto a = make_investment("A");
    a.risk_metrics->correlations["B"] = 0.85;
    a.risk_metrics->correlations["C"] = -0.75;
    auto b = make_investment("B");
    auto c = make_investment("C");

    auto risks = RiskAssessor().correlation_risks({a, b, c});

    REQUIRE(risks.size() == 2);
    REQUIRE(risks[0].asset_pair == "Name A - Name B");
    REQUIRE(risks[0].risk_level == RiskTier::HIGH);
    REQUIRE(risks[0].description == "High correlation (0.85) reduces diversification benefits");
    REQUIRE(risks[1].asset_pair == "Name A - Name C");
    REQUIRE(risks[1].risk_level == RiskTier::MEDIUM);
    REQUIRE_THAT(risks[1].correlation, WithinAbs(-0.75, 1e-12));
}

TEST_CASE("Liquidity risk", "[RiskAssessor][Liquidity]")
{
    RiskAssessor assessor;

    SECTION("Thin trailing volume is high liquidity risk")
    {
        auto thin = make_investment("A");
        thin.historical_performance = linear_bars(10.0, 10.0, 30, 50000.0);

        auto risk = assessor.assess_liquidity_risk({thin});
        REQUIRE(risk.level == RiskTier::HIGH);
        REQUIRE_THAT(risk.average_daily_volume, WithinAbs(50000.0, 1e-6));
        REQUIRE_THAT(risk.market_impact_cost, WithinAbs(0.02, 1e-12));
        REQUIRE(risk.time_to_liquidate == 5);
    }

    SECTION("Short history is still divided by the full window")
    {
        auto short_history = make_investment("A");
        short_history.historical_performance = linear_bars(10.0, 10.0, 10, 1.0e6);

        auto risk = assessor.assess_liquidity_risk({short_history});
        REQUIRE_THAT(risk.average_daily_volume, WithinAbs(1.0e7 / 30.0, 1e-6));
        REQUIRE(risk.level == RiskTier::LOW);
        REQUIRE(risk.time_to_liquidate == 1);
    }

    SECTION("One thin name out of four is medium")
    {
        auto thin = make_investment("A");
        thin.historical_performance = linear_bars(10.0, 10.0, 30, 1000.0);
        std::vector<Investment> investments = {thin, make_investment("B"), make_investment("C"),
                                               make_investment("D")};
        for (std::size_t i = 1; i < investments.size(); ++i)
        {
            investments[i].historical_performance = linear_bars(10.0, 10.0, 30, 1.0e6);
        }

        auto risk = assessor.assess_liquidity_risk(investments);
        REQUIRE(risk.level == RiskTier::MEDIUM);
        REQUIRE(risk.time_to_liquidate == 2);
    }
}

TEST_CASE("Concentration, market, credit and operational risk", "[RiskAssessor][Specific]")
{
    SECTION("Concentration")
    {
        std::vector<Investment> same = {make_investment("A", "Tech"), make_investment("B", "Tech"),
                                        make_investment("C", "Tech"), make_investment("D", "Tech")};
        auto risk = RiskAssessor::assess_concentration_risk(same);
        REQUIRE_THAT(risk.sector_concentration, WithinAbs(0.75, 1e-12));
        REQUIRE_THAT(risk.asset_class_concentration, WithinAbs(0.75, 1e-12));
        REQUIRE_THAT(risk.single_position_risk, WithinAbs(0.25, 1e-12));
        REQUIRE(risk.geographic_concentration == 0.5);
        REQUIRE(risk.level == RiskTier::HIGH);

        std::vector<Investment> spread = {
            make_investment("A", "Tech", AssetType::STOCK), make_investment("B", "Energy", AssetType::BOND),
            make_investment("C", "Health", AssetType::ETF), make_investment("D", "Utilities", AssetType::COMMODITY),
            make_investment("E", "Finance", AssetType::REAL_ESTATE)};
        REQUIRE(RiskAssessor::assess_concentration_risk(spread).level == RiskTier::LOW);
    }

    SECTION("Single bond with beta 1.5")
    {
        auto assessment = RiskAssessor().assess_risk(
            make_idea({make_investment("BND", "Fixed Income", AssetType::BOND, 0.05, 1.5)}), fixed_now());

        REQUIRE_THAT(assessment.market_risk.beta, WithinAbs(1.5, 1e-12));
        REQUIRE_THAT(assessment.market_risk.market_sensitivity, WithinAbs(1.5, 1e-12));
        REQUIRE(assessment.credit_risk.has_value());
        REQUIRE(assessment.credit_risk->credit_rating == "BBB");
        REQUIRE_THAT(assessment.credit_risk->recovery_rate, WithinAbs(0.6, 1e-12));
    }

    SECTION("No bonds means no credit block")
    {
        auto assessment = RiskAssessor().assess_risk(make_idea({make_investment("A")}), fixed_now());
        REQUIRE_FALSE(assessment.credit_risk.has_value());
        REQUIRE_FALSE(assessment.to_json().contains("creditRisk"));
    }

    SECTION("Missing beta counts as 1, explicit zero is kept")
    {
        std::vector<Investment> investments = {make_investment("A"),
                                               make_investment("B", "", AssetType::STOCK, 0.2, 0.0)};
        REQUIRE_THAT(RiskAssessor::assess_market_risk(investments).beta, WithinAbs(0.5, 1e-12));
    }

    SECTION("Operational")
    {
        auto complex = RiskAssessor::assess_operational_risk(make_idea({}, Strategy::COMPLEX), fixed_now());
        REQUIRE(complex.level == RiskTier::HIGH);
        REQUIRE_THAT(complex.process_risk, WithinAbs(0.8, 1e-12));
        REQUIRE_THAT(complex.data_quality, WithinAbs(0.3, 1e-12));

        auto simple = RiskAssessor::assess_operational_risk(make_idea({}, Strategy::BUY), fixed_now());
        REQUIRE(simple.level == RiskTier::LOW);
        REQUIRE_THAT(simple.external_event_risk, WithinAbs(0.15, 1e-12));
    }
}

TEST_CASE("Risk assessment JSON", "[RiskAssessor][Json]")
{
    auto assessment = RiskAssessor().assess_risk(
        make_idea({make_investment("A", "Tech", AssetType::BOND, 0.3, 1.4)}, Strategy::PAIRS_TRADE), fixed_now());
    auto j = assessment.to_json();

    REQUIRE(j["riskFactors"].size() == assessment.risk_factors.size());
    REQUIRE(j["riskMitigation"].size() == assessment.risk_factors.size());
    REQUIRE(j["scenarioAnalysis"][3]["riskLevel"] == "very-high");
    REQUIRE(j["creditRisk"]["creditRating"] == "BBB");
    REQUIRE(j["riskFactors"][0]["timeHorizon"] == "short-term");
    REQUIRE_FALSE(assessment.summary().empty());
}
