/**
 * @file risk_assessment.cpp
 * @brief String conversions, serialization and reporting for RiskAssessment.
 */

#include "risk/risk_assessment.hpp"

#include <iomanip>
#include <sstream>

namespace prospect
{
    namespace risk
    {

        std::string to_string(RiskFactorType type)
        {
            switch (type)
            {
            case RiskFactorType::MARKET:
                return "market";
            case RiskFactorType::CREDIT:
                return "credit";
            case RiskFactorType::LIQUIDITY:
                return "liquidity";
            case RiskFactorType::OPERATIONAL:
                return "operational";
            case RiskFactorType::REGULATORY:
                return "regulatory";
            case RiskFactorType::GEOPOLITICAL:
                return "geopolitical";
            case RiskFactorType::CURRENCY:
                return "currency";
            case RiskFactorType::INTEREST_RATE:
                return "interest-rate";
            }
            return "market";
        }

        std::string to_string(Severity severity)
        {
            switch (severity)
            {
            case Severity::LOW:
                return "low";
            case Severity::MEDIUM:
                return "medium";
            case Severity::HIGH:
                return "high";
            case Severity::CRITICAL:
                return "critical";
            }
            return "low";
        }

        std::string to_string(RiskTimeframe timeframe)
        {
            switch (timeframe)
            {
            case RiskTimeframe::IMMEDIATE:
                return "immediate";
            case RiskTimeframe::SHORT_TERM:
                return "short-term";
            case RiskTimeframe::MEDIUM_TERM:
                return "medium-term";
            case RiskTimeframe::LONG_TERM:
                return "long-term";
            }
            return "medium-term";
        }

        std::string to_string(Implementation implementation)
        {
            switch (implementation)
            {
            case Implementation::IMMEDIATE:
                return "immediate";
            case Implementation::GRADUAL:
                return "gradual";
            case Implementation::CONDITIONAL:
                return "conditional";
            }
            return "immediate";
        }

        std::string to_string(MarketScenario scenario)
        {
            switch (scenario)
            {
            case MarketScenario::BULL:
                return "bull";
            case MarketScenario::BEAR:
                return "bear";
            case MarketScenario::SIDEWAYS:
                return "sideways";
            case MarketScenario::CRISIS:
                return "crisis";
            case MarketScenario::RECOVERY:
                return "recovery";
            }
            return "sideways";
        }

        std::string to_string(RiskTier tier)
        {
            switch (tier)
            {
            case RiskTier::LOW:
                return "low";
            case RiskTier::MEDIUM:
                return "medium";
            case RiskTier::HIGH:
                return "high";
            }
            return "low";
        }

        // ===================================================================
        // JSON
        // ===================================================================

        nlohmann::json RiskAssessment::to_json() const
        {
            nlohmann::json j;

            j["overallRiskLevel"] = prospect::to_string(overall_risk_level);
            j["riskScore"] = risk_score;

            j["riskFactors"] = nlohmann::json::array();
            for (const auto &f : risk_factors)
            {
                j["riskFactors"].push_back({{"type", to_string(f.type)},
                                            {"severity", to_string(f.severity)},
                                            {"probability", f.probability},
                                            {"impact", f.impact},
                                            {"description", f.description},
                                            {"timeHorizon", to_string(f.time_horizon)}});
            }

            j["riskMitigation"] = nlohmann::json::array();
            for (const auto &m : risk_mitigation)
            {
                j["riskMitigation"].push_back({{"riskType", to_string(m.risk_type)},
                                               {"strategy", m.strategy},
                                               {"effectiveness", m.effectiveness},
                                               {"cost", m.cost},
                                               {"implementation", to_string(m.implementation)}});
            }

            j["stressTestResults"] = nlohmann::json::array();
            for (const auto &s : stress_test_results)
            {
                j["stressTestResults"].push_back({{"scenario", s.scenario},
                                                  {"probability", s.probability},
                                                  {"expectedLoss", s.expected_loss},
                                                  {"timeToRecovery", s.time_to_recovery},
                                                  {"description", s.description}});
            }

            j["scenarioAnalysis"] = nlohmann::json::array();
            for (const auto &s : scenario_analysis)
            {
                j["scenarioAnalysis"].push_back({{"scenario", to_string(s.scenario)},
                                                 {"probability", s.probability},
                                                 {"riskLevel", prospect::to_string(s.risk_level)},
                                                 {"expectedImpact", s.expected_impact},
                                                 {"keyTriggers", s.key_triggers}});
            }

            j["correlationRisks"] = nlohmann::json::array();
            for (const auto &c : correlation_risks)
            {
                j["correlationRisks"].push_back({{"assetPair", c.asset_pair},
                                                 {"correlation", c.correlation},
                                                 {"riskLevel", to_string(c.risk_level)},
                                                 {"description", c.description}});
            }

            j["liquidityRisk"] = {{"level", to_string(liquidity_risk.level)},
                                  {"averageDailyVolume", liquidity_risk.average_daily_volume},
                                  {"bidAskSpread", liquidity_risk.bid_ask_spread},
                                  {"marketImpactCost", liquidity_risk.market_impact_cost},
                                  {"timeToLiquidate", liquidity_risk.time_to_liquidate}};

            j["concentrationRisk"] = {{"level", to_string(concentration_risk.level)},
                                      {"sectorConcentration", concentration_risk.sector_concentration},
                                      {"geographicConcentration", concentration_risk.geographic_concentration},
                                      {"assetClassConcentration", concentration_risk.asset_class_concentration},
                                      {"singlePositionRisk", concentration_risk.single_position_risk}};

            j["marketRisk"] = {{"beta", market_risk.beta},
                               {"marketSensitivity", market_risk.market_sensitivity},
                               {"sectorSensitivity", market_risk.sector_sensitivity},
                               {"interestRateSensitivity", market_risk.interest_rate_sensitivity},
                               {"currencyExposure", market_risk.currency_exposure}};

            if (credit_risk)
            {
                j["creditRisk"] = {{"creditRating", credit_risk->credit_rating},
                                   {"defaultProbability", credit_risk->default_probability},
                                   {"recoveryRate", credit_risk->recovery_rate},
                                   {"creditSpread", credit_risk->credit_spread}};
            }

            j["operationalRisk"] = {{"level", to_string(operational_risk.level)},
                                    {"keyPersonRisk", operational_risk.key_person_risk},
                                    {"systemRisk", operational_risk.system_risk},
                                    {"processRisk", operational_risk.process_risk},
                                    {"externalEventRisk", operational_risk.external_event_risk},
                                    {"dataQuality", operational_risk.data_quality}};

            return j;
        }

        // ===================================================================
        // Summary
        // ===================================================================

        std::string RiskAssessment::summary() const
        {
            std::ostringstream oss;
            oss << std::fixed;

            oss << "Risk Assessment\n";
            oss << "===============\n";
            oss << "\n";
            oss << "  Overall Risk:        " << prospect::to_string(overall_risk_level)
                << " (score " << std::setprecision(1) << risk_score << ")\n";
            oss << "\n";

            oss << "Risk Factors:\n";
            for (std::size_t i = 0; i < risk_factors.size(); ++i)
            {
                const auto &f = risk_factors[i];
                oss << "  [" << std::setw(8) << to_string(f.severity) << "] "
                    << std::left << std::setw(12) << to_string(f.type) << std::right
                    << f.description << "\n";
                if (i < risk_mitigation.size())
                {
                    oss << "             -> " << risk_mitigation[i].strategy << "\n";
                }
            }
            oss << "\n";

            oss << "Stress Tests:\n";
            for (const auto &s : stress_test_results)
            {
                oss << "  " << std::left << std::setw(40) << s.scenario << std::right
                    << " loss " << std::setprecision(1) << s.expected_loss * 100.0 << "%"
                    << ", recovery " << s.time_to_recovery << " days\n";
            }
            oss << "\n";

            oss << "Specific Risks:\n";
            oss << "  Liquidity:           " << to_string(liquidity_risk.level) << "\n";
            oss << "  Concentration:       " << to_string(concentration_risk.level) << "\n";
            oss << "  Market Beta:         " << std::setprecision(2) << market_risk.beta << "\n";
            oss << "  Credit:              "
                << (credit_risk ? credit_risk->credit_rating : std::string("n/a")) << "\n";
            oss << "  Operational:         " << to_string(operational_risk.level) << "\n";
            oss << "  Correlated Pairs:    " << correlation_risks.size() << "\n";

            return oss.str();
        }

    } // namespace risk
} // namespace prospect
