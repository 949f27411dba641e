/**
 * @file test_supporting_analysis.cpp
 * @brief Integration tests for SupportingAnalysisService
 */

#include <catch2/catch.hpp>

#include "analytics/metrics_calculator.hpp"
#include "analytics/supporting_analysis.hpp"
#include "idea_builders.hpp"
#include "outcome/outcome_modeler.hpp"
#include "risk/risk_assessor.hpp"

#include <stdexcept>

using namespace prospect;
using namespace prospect::analytics;
using namespace prospect::testing;
using Catch::Matchers::WithinAbs;

namespace
{
    InvestmentIdea sample_idea()
    {
        auto a = make_investment("A", "Technology", AssetType::STOCK, 0.30, 1.3);
        a.historical_performance = linear_bars(100.0, 120.0, 120, 400000.0);
        auto b = make_investment("B", "Financials", AssetType::BOND, 0.08, 0.4);
        b.historical_performance = linear_bars(50.0, 51.0, 120, 80000.0);
        b.risk_metrics->correlations["A"] = 0.2;

        auto idea = make_idea({a, b}, Strategy::GROWTH, TimeHorizon::LONG);
        idea.potential_outcomes = {make_outcome(OutcomeCase::EXPECTED, 0.10, 0.6, 300.0),
                                   make_outcome(OutcomeCase::BEST, 0.30, 0.2, 200.0),
                                   make_outcome(OutcomeCase::WORST, -0.20, 0.2, 400.0)};
        idea.supporting_data = {{"Reuters", parse_timestamp("2024-06-20"), 0.8}};
        return idea;
    }

    config::EngineAssumptions seeded()
    {
        config::EngineAssumptions assumptions;
        assumptions.monte_carlo_iterations = 3000;
        assumptions.random_seed = 2024;
        return assumptions;
    }
}

TEST_CASE("Combined analysis matches the individual engines", "[SupportingAnalysis]")
{
    auto idea = sample_idea();
    SupportingAnalysisService service(seeded());
    auto analysis = service.analyze(idea, fixed_now());

    auto metrics = MetricsCalculator(seeded()).calculate_key_metrics(idea, fixed_now());
    auto risk = risk::RiskAssessor(seeded()).assess_risk(idea, fixed_now());
    auto outcomes = outcome::OutcomeModeler(seeded()).model_expected_outcomes(idea, fixed_now());

    REQUIRE(analysis.key_metrics.expected_return == metrics.expected_return);
    REQUIRE(analysis.key_metrics.sharpe_ratio == metrics.sharpe_ratio);
    REQUIRE(analysis.key_metrics.data_quality == metrics.data_quality);

    REQUIRE(analysis.risk_assessment.risk_score == risk.risk_score);
    REQUIRE(analysis.risk_assessment.overall_risk_level == risk.overall_risk_level);
    REQUIRE(analysis.risk_assessment.risk_factors.size() == risk.risk_factors.size());
    REQUIRE(analysis.risk_assessment.credit_risk.has_value());

    REQUIRE(analysis.expected_outcomes.monte_carlo_results.mean_return ==
            outcomes.monte_carlo_results.mean_return);
    REQUIRE(analysis.expected_outcomes.monte_carlo_results.percentiles ==
            outcomes.monte_carlo_results.percentiles);
    REQUIRE(analysis.expected_outcomes.time_series_projection.size() == 365);
    REQUIRE_THAT(analysis.expected_outcomes.probability_weighted_return, WithinAbs(0.6 * 0.10 + 0.2 * 0.30 - 0.2 * 0.20, 1e-12));
}

TEST_CASE("Combined analysis output", "[SupportingAnalysis][Output]")
{
    SupportingAnalysisService service(seeded());
    auto analysis = service.analyze(sample_idea(), fixed_now());

    auto j = analysis.to_json();
    REQUIRE(j.contains("keyMetrics"));
    REQUIRE(j.contains("riskAssessment"));
    REQUIRE(j.contains("expectedOutcomes"));
    REQUIRE(j["riskAssessment"].contains("creditRisk"));
    REQUIRE(j["expectedOutcomes"]["monteCarloResults"]["iterations"] == 3000);

    auto text = analysis.summary();
    REQUIRE_FALSE(text.empty());
    REQUIRE_NOTHROW(SupportingAnalysisService::print_summary(analysis));
}

TEST_CASE("Invalid assumptions are rejected up front", "[SupportingAnalysis]")
{
    config::EngineAssumptions assumptions;
    assumptions.trading_days_per_year = 0;
    REQUIRE_THROWS_AS(SupportingAnalysisService(assumptions), std::invalid_argument);
}

TEST_CASE("Empty idea analyzes without throwing", "[SupportingAnalysis][Edge]")
{
    SupportingAnalysisService service(seeded());
    auto analysis = service.analyze(make_idea({}), fixed_now());

    REQUIRE(analysis.key_metrics.expected_return == 0.0);
    REQUIRE_FALSE(analysis.risk_assessment.credit_risk.has_value());
    REQUIRE(analysis.expected_outcomes.monte_carlo_results.standard_deviation == 0.0);
}
