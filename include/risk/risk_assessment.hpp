/**
 * @file risk_assessment.hpp
 * @brief Structured risk taxonomy produced by RiskAssessor.
 */

#ifndef PROSPECT_RISK_RISK_ASSESSMENT_HPP
#define PROSPECT_RISK_RISK_ASSESSMENT_HPP

#include "model/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace prospect
{
    namespace risk
    {

        /**
         * @enum RiskFactorType
         * @brief Category of an identified risk factor.
         */
        enum class RiskFactorType
        {
            MARKET,
            CREDIT,
            LIQUIDITY,
            OPERATIONAL,
            REGULATORY,
            GEOPOLITICAL,
            CURRENCY,
            INTEREST_RATE
        };

        /**
         * @enum Severity
         * @brief Severity of a risk factor.
         */
        enum class Severity
        {
            LOW,
            MEDIUM,
            HIGH,
            CRITICAL
        };

        /**
         * @enum RiskTimeframe
         * @brief When a risk factor is expected to materialize.
         */
        enum class RiskTimeframe
        {
            IMMEDIATE,
            SHORT_TERM,
            MEDIUM_TERM,
            LONG_TERM
        };

        /**
         * @enum Implementation
         * @brief How a mitigation is put in place.
         */
        enum class Implementation
        {
            IMMEDIATE,
            GRADUAL,
            CONDITIONAL
        };

        /**
         * @enum MarketScenario
         * @brief Broad market regime used by scenario analysis.
         */
        enum class MarketScenario
        {
            BULL,
            BEAR,
            SIDEWAYS,
            CRISIS,
            RECOVERY
        };

        /**
         * @enum RiskTier
         * @brief Three-step level used by the specific risk blocks.
         */
        enum class RiskTier
        {
            LOW,
            MEDIUM,
            HIGH
        };

        std::string to_string(RiskFactorType type);
        std::string to_string(Severity severity);
        std::string to_string(RiskTimeframe timeframe);
        std::string to_string(Implementation implementation);
        std::string to_string(MarketScenario scenario);
        std::string to_string(RiskTier tier);

        struct RiskFactor
        {
            RiskFactorType type = RiskFactorType::MARKET;
            Severity severity = Severity::LOW;
            double probability = 0.0; ///< In [0, 1]
            double impact = 0.0;      ///< Potential loss in percent
            std::string description;
            RiskTimeframe time_horizon = RiskTimeframe::MEDIUM_TERM;
        };

        struct RiskMitigation
        {
            RiskFactorType risk_type = RiskFactorType::MARKET;
            std::string strategy;
            double effectiveness = 0.0; ///< In [0, 1]
            double cost = 0.0;          ///< Fraction of the position
            Implementation implementation = Implementation::IMMEDIATE;
        };

        struct StressTestResult
        {
            std::string scenario;
            double probability = 0.0;
            double expected_loss = 0.0;
            int time_to_recovery = 0; ///< Days
            std::string description;
        };

        struct ScenarioRisk
        {
            MarketScenario scenario = MarketScenario::SIDEWAYS;
            double probability = 0.0;
            RiskLevel risk_level = RiskLevel::MODERATE;
            double expected_impact = 0.0;
            std::vector<std::string> key_triggers;
        };

        struct CorrelationRisk
        {
            std::string asset_pair; ///< "{name1} - {name2}"
            double correlation = 0.0;
            RiskTier risk_level = RiskTier::MEDIUM;
            std::string description;
        };

        struct LiquidityRisk
        {
            RiskTier level = RiskTier::LOW;
            double average_daily_volume = 0.0;
            double bid_ask_spread = 0.0;
            double market_impact_cost = 0.0;
            int time_to_liquidate = 0; ///< Days
        };

        struct ConcentrationRisk
        {
            RiskTier level = RiskTier::LOW;
            double sector_concentration = 0.0;
            double geographic_concentration = 0.0;
            double asset_class_concentration = 0.0;
            double single_position_risk = 0.0;
        };

        struct MarketRisk
        {
            double beta = 1.0;
            double market_sensitivity = 1.0;
            double sector_sensitivity = 0.0;
            double interest_rate_sensitivity = 0.0;
            double currency_exposure = 0.0;
        };

        struct CreditRisk
        {
            std::string credit_rating;
            double default_probability = 0.0;
            double recovery_rate = 0.0;
            double credit_spread = 0.0;
        };

        struct OperationalRisk
        {
            RiskTier level = RiskTier::LOW;
            double key_person_risk = 0.0;
            double system_risk = 0.0;
            double process_risk = 0.0;
            double external_event_risk = 0.0;
            double data_quality = 0.0; ///< Data quality score scaled to [0, 1]
        };

        /**
         * @struct RiskAssessment
         * @brief Output of RiskAssessor.
         *
         * risk_mitigation has exactly one entry per risk factor, in the same order.
         */
        struct RiskAssessment
        {
            RiskLevel overall_risk_level = RiskLevel::MODERATE;
            double risk_score = 0.0; ///< In [0, 100]
            std::vector<RiskFactor> risk_factors;
            std::vector<RiskMitigation> risk_mitigation;
            std::vector<StressTestResult> stress_test_results;
            std::vector<ScenarioRisk> scenario_analysis;
            std::vector<CorrelationRisk> correlation_risks;
            LiquidityRisk liquidity_risk;
            ConcentrationRisk concentration_risk;
            MarketRisk market_risk;
            std::optional<CreditRisk> credit_risk; ///< Present only when a bond is held
            OperationalRisk operational_risk;

            /**
             * @brief Convert to JSON (camelCase keys, hyphenated enum names).
             */
            nlohmann::json to_json() const;

            /**
             * @brief Multi-line human-readable report.
             */
            std::string summary() const;
        };

    } // namespace risk
} // namespace prospect

#endif // PROSPECT_RISK_RISK_ASSESSMENT_HPP
