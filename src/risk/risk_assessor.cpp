/**
 * @file risk_assessor.cpp
 * @brief Implementation of RiskAssessor.
 */

#include "risk/risk_assessor.hpp"
#include "analytics/portfolio_statistics.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace prospect
{
    namespace risk
    {

        namespace
        {

            std::string format_fixed(double value, int precision)
            {
                std::ostringstream oss;
                oss << std::fixed << std::setprecision(precision) << value;
                return oss.str();
            }

            bool has_thin_bar(const Investment &inv, double threshold)
            {
                return std::any_of(inv.historical_performance.begin(), inv.historical_performance.end(),
                                   [threshold](const PriceBar &bar)
                                   { return bar.volume < threshold; });
            }

            RiskFactor make_factor(RiskFactorType type, Severity severity, double probability,
                                   double impact, std::string description, RiskTimeframe timeframe)
            {
                RiskFactor factor;
                factor.type = type;
                factor.severity = severity;
                factor.probability = probability;
                factor.impact = impact;
                factor.description = std::move(description);
                factor.time_horizon = timeframe;
                return factor;
            }

        } // anonymous namespace

        RiskAssessor::RiskAssessor(config::EngineAssumptions assumptions)
            : assumptions_(std::move(assumptions))
        {
            assumptions_.validate();
        }

        RiskAssessment RiskAssessor::assess_risk(const InvestmentIdea &idea, Timestamp as_of) const
        {
            const auto &investments = idea.investments;
            RiskAssessment assessment;

            assessment.risk_score = risk_score(idea);
            assessment.overall_risk_level = determine_risk_level(assessment.risk_score);

            assessment.risk_factors = identify_risk_factors(idea);
            assessment.risk_mitigation = generate_mitigations(assessment.risk_factors);
            assessment.stress_test_results = stress_tests(investments);
            assessment.scenario_analysis = scenario_analysis();
            assessment.correlation_risks = correlation_risks(investments);

            assessment.liquidity_risk = assess_liquidity_risk(investments);
            assessment.concentration_risk = assess_concentration_risk(investments);
            assessment.market_risk = assess_market_risk(investments);
            assessment.credit_risk = assess_credit_risk(investments);
            assessment.operational_risk = assess_operational_risk(idea, as_of);

            return assessment;
        }

        // ===================================================================
        // Risk score
        // ===================================================================

        RiskLevel RiskAssessor::determine_risk_level(double risk_score)
        {
            if (risk_score <= 20.0)
                return RiskLevel::VERY_LOW;
            if (risk_score <= 40.0)
                return RiskLevel::LOW;
            if (risk_score <= 60.0)
                return RiskLevel::MODERATE;
            if (risk_score <= 80.0)
                return RiskLevel::HIGH;
            return RiskLevel::VERY_HIGH;
        }

        double RiskAssessor::risk_score(const InvestmentIdea &idea) const
        {
            double volatility_component = std::min(analytics::average_volatility(idea.investments) * 100.0, 40.0);
            double concentration_component = analytics::concentration_hhi(idea.investments) * 20.0;

            return (volatility_component + concentration_component +
                    time_horizon_risk(idea.time_horizon) + strategy_risk(idea.strategy)) /
                   4.0;
        }

        double RiskAssessor::time_horizon_risk(TimeHorizon horizon)
        {
            switch (horizon)
            {
            case TimeHorizon::INTRADAY:
                return 30.0;
            case TimeHorizon::SHORT:
                return 20.0;
            case TimeHorizon::MEDIUM:
                return 10.0;
            case TimeHorizon::LONG:
                return 5.0;
            case TimeHorizon::VERY_LONG:
                return 2.0;
            }
            return 15.0;
        }

        double RiskAssessor::strategy_risk(Strategy strategy)
        {
            switch (strategy)
            {
            case Strategy::BUY:
                return 10.0;
            case Strategy::HOLD:
                return 5.0;
            case Strategy::SELL:
                return 15.0;
            case Strategy::SHORT:
                return 25.0;
            case Strategy::LONG:
                return 10.0;
            case Strategy::HEDGE:
                return 8.0;
            case Strategy::ARBITRAGE:
                return 12.0;
            case Strategy::PAIRS_TRADE:
                return 15.0;
            case Strategy::MOMENTUM:
                return 20.0;
            case Strategy::VALUE:
                return 8.0;
            case Strategy::GROWTH:
                return 12.0;
            case Strategy::INCOME:
                return 5.0;
            case Strategy::COMPLEX:
                return 25.0;
            }
            return 15.0;
        }

        // ===================================================================
        // Risk factors and mitigations
        // ===================================================================

        std::vector<RiskFactor> RiskAssessor::identify_risk_factors(const InvestmentIdea &idea) const
        {
            const auto &investments = idea.investments;
            std::vector<RiskFactor> factors;

            if (investments.empty())
            {
                factors.push_back(make_factor(RiskFactorType::OPERATIONAL, Severity::HIGH, 1.0, 100.0,
                                              "No investments in portfolio", RiskTimeframe::IMMEDIATE));
                return factors;
            }

            double avg_beta = analytics::average_beta(investments);
            if (avg_beta > 1.2)
            {
                factors.push_back(make_factor(RiskFactorType::MARKET, Severity::MEDIUM, 0.3, (avg_beta - 1.0) * 20.0,
                                              "High market sensitivity (Beta: " + format_fixed(avg_beta, 2) + ")",
                                              RiskTimeframe::SHORT_TERM));
            }

            auto illiquid = std::count_if(investments.begin(), investments.end(), [this](const Investment &inv)
                                          { return has_thin_bar(inv, assumptions_.liquidity_volume_threshold); });
            if (illiquid > 0)
            {
                factors.push_back(make_factor(RiskFactorType::LIQUIDITY, Severity::MEDIUM, 0.4, 15.0,
                                              std::to_string(illiquid) + " assets with potential liquidity constraints",
                                              RiskTimeframe::IMMEDIATE));
            }

            if (analytics::distinct_sectors(investments).size() <= 2 && investments.size() > 2)
            {
                factors.push_back(make_factor(RiskFactorType::MARKET, Severity::HIGH, 0.5, 25.0,
                                              "High sector concentration risk", RiskTimeframe::MEDIUM_TERM));
            }

            if (idea.strategy == Strategy::MOMENTUM)
            {
                factors.push_back(make_factor(RiskFactorType::MARKET, Severity::MEDIUM, 0.6, 20.0,
                                              "Momentum strategy vulnerable to trend reversals",
                                              RiskTimeframe::SHORT_TERM));
            }

            // Every assessment carries at least one factor so a mitigation is produced
            if (factors.empty())
            {
                factors.push_back(make_factor(RiskFactorType::MARKET, Severity::LOW, 0.2, 5.0,
                                              "General market risk exposure", RiskTimeframe::MEDIUM_TERM));
            }

            return factors;
        }

        std::vector<RiskMitigation> RiskAssessor::generate_mitigations(const std::vector<RiskFactor> &factors)
        {
            std::vector<RiskMitigation> mitigations;
            mitigations.reserve(factors.size());

            for (const auto &factor : factors)
            {
                RiskMitigation m;
                m.risk_type = factor.type;

                switch (factor.type)
                {
                case RiskFactorType::MARKET:
                    m.strategy = "Consider hedging with market-neutral positions or defensive assets";
                    m.effectiveness = 0.7;
                    m.cost = 0.02;
                    m.implementation = Implementation::GRADUAL;
                    break;
                case RiskFactorType::LIQUIDITY:
                    m.strategy = "Maintain cash reserves and stagger position sizes";
                    m.effectiveness = 0.8;
                    m.cost = 0.01;
                    m.implementation = Implementation::IMMEDIATE;
                    break;
                case RiskFactorType::CREDIT:
                    m.strategy = "Diversify across credit ratings and monitor credit spreads";
                    m.effectiveness = 0.6;
                    m.cost = 0.015;
                    m.implementation = Implementation::GRADUAL;
                    break;
                default:
                    m.strategy = "Monitor closely and maintain stop-loss levels";
                    m.effectiveness = 0.5;
                    m.cost = 0.005;
                    m.implementation = Implementation::IMMEDIATE;
                    break;
                }

                mitigations.push_back(m);
            }

            return mitigations;
        }

        // ===================================================================
        // Stress tests and scenarios
        // ===================================================================

        std::vector<StressTestResult> RiskAssessor::stress_tests(const std::vector<Investment> &investments)
        {
            std::vector<StressTestResult> results = {
                {"Market Crash (-30%)", 0.05, 0.25, 365, "Broad market decline of 30% over 3 months"},
                {"Interest Rate Shock (+200bp)", 0.15, 0.12, 180,
                 "Rapid increase in interest rates by 2 percentage points"}};

            for (const auto &sector : analytics::distinct_sectors(investments))
            {
                results.push_back({sector + " Sector Decline (-20%)", 0.1, 0.15, 270,
                                   "Sector-specific decline in " + sector});
            }

            return results;
        }

        std::vector<ScenarioRisk> RiskAssessor::scenario_analysis()
        {
            return {
                {MarketScenario::BULL, 0.3, RiskLevel::LOW, 0.15,
                 {"Economic growth", "Low interest rates", "Positive earnings"}},
                {MarketScenario::BEAR, 0.2, RiskLevel::HIGH, -0.25,
                 {"Recession", "High inflation", "Geopolitical tensions"}},
                {MarketScenario::SIDEWAYS, 0.4, RiskLevel::MODERATE, 0.02,
                 {"Mixed economic signals", "Uncertainty", "Range-bound markets"}},
                {MarketScenario::CRISIS, 0.05, RiskLevel::VERY_HIGH, -0.40,
                 {"Financial crisis", "Black swan event", "System failure"}},
                {MarketScenario::RECOVERY, 0.05, RiskLevel::MODERATE, 0.25,
                 {"Post-crisis recovery", "Policy support", "Pent-up demand"}}};
        }

        // ===================================================================
        // Specific risks
        // ===================================================================

        std::vector<CorrelationRisk> RiskAssessor::correlation_risks(const std::vector<Investment> &investments) const
        {
            std::vector<CorrelationRisk> risks;
            Eigen::MatrixXd corr = analytics::correlation_matrix(investments, assumptions_.default_correlation);

            for (std::size_t i = 0; i < investments.size(); ++i)
            {
                for (std::size_t j = i + 1; j < investments.size(); ++j)
                {
                    double c = corr(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j));
                    if (std::abs(c) <= 0.7)
                    {
                        continue;
                    }

                    CorrelationRisk risk;
                    risk.asset_pair = investments[i].name + " - " + investments[j].name;
                    risk.correlation = c;
                    risk.risk_level = std::abs(c) > 0.8 ? RiskTier::HIGH : RiskTier::MEDIUM;
                    risk.description = "High correlation (" + format_fixed(c, 2) +
                                       ") reduces diversification benefits";
                    risks.push_back(risk);
                }
            }

            return risks;
        }

        LiquidityRisk RiskAssessor::assess_liquidity_risk(const std::vector<Investment> &investments) const
        {
            LiquidityRisk risk;
            risk.bid_ask_spread = 0.01;

            double total_volume = 0.0;
            std::size_t low_volume_count = 0;
            for (const auto &inv : investments)
            {
                double volume = analytics::trailing_average_volume(inv, assumptions_.liquidity_window);
                total_volume += volume;
                if (volume < assumptions_.liquidity_volume_threshold)
                {
                    ++low_volume_count;
                }
            }

            risk.average_daily_volume = investments.empty()
                                            ? 0.0
                                            : total_volume / static_cast<double>(investments.size());

            if (static_cast<double>(low_volume_count) > static_cast<double>(investments.size()) * 0.3)
            {
                risk.level = RiskTier::HIGH;
                risk.market_impact_cost = 0.02;
                risk.time_to_liquidate = 5;
            }
            else if (low_volume_count > 0)
            {
                risk.level = RiskTier::MEDIUM;
                risk.market_impact_cost = 0.01;
                risk.time_to_liquidate = 2;
            }
            else
            {
                risk.level = RiskTier::LOW;
                risk.market_impact_cost = 0.005;
                risk.time_to_liquidate = 1;
            }

            return risk;
        }

        ConcentrationRisk RiskAssessor::assess_concentration_risk(const std::vector<Investment> &investments)
        {
            ConcentrationRisk risk;

            double n = static_cast<double>(std::max<std::size_t>(investments.size(), 1));
            risk.sector_concentration = 1.0 - static_cast<double>(analytics::distinct_sectors(investments).size()) / n;
            risk.asset_class_concentration = 1.0 - static_cast<double>(analytics::distinct_asset_types(investments)) / n;
            risk.single_position_risk = investments.empty() ? 1.0 : 1.0 / static_cast<double>(investments.size());
            risk.geographic_concentration = 0.5;

            if (risk.sector_concentration > 0.7 || risk.asset_class_concentration > 0.7 ||
                risk.single_position_risk > 0.3)
            {
                risk.level = RiskTier::HIGH;
            }
            else if (risk.sector_concentration > 0.5 || risk.asset_class_concentration > 0.5 ||
                     risk.single_position_risk > 0.2)
            {
                risk.level = RiskTier::MEDIUM;
            }
            else
            {
                risk.level = RiskTier::LOW;
            }

            return risk;
        }

        MarketRisk RiskAssessor::assess_market_risk(const std::vector<Investment> &investments)
        {
            MarketRisk risk;
            risk.beta = analytics::average_beta(investments);
            risk.market_sensitivity = risk.beta;
            risk.sector_sensitivity = 0.7;
            risk.interest_rate_sensitivity = 0.3;
            risk.currency_exposure = 0.1;
            return risk;
        }

        std::optional<CreditRisk> RiskAssessor::assess_credit_risk(const std::vector<Investment> &investments)
        {
            bool holds_bond = std::any_of(investments.begin(), investments.end(), [](const Investment &inv)
                                          { return inv.type == AssetType::BOND; });
            if (!holds_bond)
            {
                return std::nullopt;
            }

            CreditRisk risk;
            risk.credit_rating = "BBB";
            risk.default_probability = 0.02;
            risk.recovery_rate = 0.6;
            risk.credit_spread = 0.015;
            return risk;
        }

        OperationalRisk RiskAssessor::assess_operational_risk(const InvestmentIdea &idea, Timestamp as_of)
        {
            OperationalRisk risk;

            double complexity = idea.strategy == Strategy::COMPLEX ? 0.8 : 0.3;
            if (complexity > 0.6)
                risk.level = RiskTier::HIGH;
            else if (complexity > 0.3)
                risk.level = RiskTier::MEDIUM;
            else
                risk.level = RiskTier::LOW;

            risk.key_person_risk = 0.2;
            risk.system_risk = 0.1;
            risk.process_risk = complexity;
            risk.external_event_risk = 0.15;
            risk.data_quality = analytics::data_quality_score(idea.supporting_data, as_of) / 100.0;

            return risk;
        }

    } // namespace risk
} // namespace prospect
