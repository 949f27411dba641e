/**
 * @file risk_assessor.hpp
 * @brief Multi-factor risk assessment of an investment idea.
 *
 * Combines volatility, concentration, horizon and strategy into a 0-100 risk
 * score, identifies discrete risk factors with one mitigation each, and fills
 * the stress test, scenario, correlation, liquidity, concentration, market,
 * credit and operational blocks of RiskAssessment.
 *
 * Thread safety: Instances are immutable after construction. All public
 * methods are const and safe to call concurrently.
 */

#ifndef PROSPECT_RISK_RISK_ASSESSOR_HPP
#define PROSPECT_RISK_RISK_ASSESSOR_HPP

#include "config/engine_assumptions.hpp"
#include "model/investment_idea.hpp"
#include "risk/risk_assessment.hpp"

#include <chrono>
#include <optional>
#include <vector>

namespace prospect
{
    namespace risk
    {

        /**
         * @class RiskAssessor
         * @brief Builds a RiskAssessment for an idea.
         */
        class RiskAssessor
        {
        public:
            /**
             * @brief Construct with the given market assumptions.
             * @throws std::invalid_argument If the assumptions fail validation.
             */
            explicit RiskAssessor(config::EngineAssumptions assumptions = {});

            /**
             * @brief Run the full assessment.
             * @param idea Idea to assess.
             * @param as_of Analysis time used for the data quality component.
             */
            RiskAssessment assess_risk(const InvestmentIdea &idea,
                                       Timestamp as_of = std::chrono::system_clock::now()) const;

            /**
             * @brief Map a 0-100 risk score to a risk level.
             *
             * Bands are upper-inclusive: <=20 very-low, <=40 low, <=60 moderate,
             * <=80 high, otherwise very-high.
             */
            static RiskLevel determine_risk_level(double risk_score);

            /**
             * @brief Mean of the volatility, concentration, horizon and strategy components.
             */
            double risk_score(const InvestmentIdea &idea) const;

            static double time_horizon_risk(TimeHorizon horizon);
            static double strategy_risk(Strategy strategy);

            // ---------------------------------------------------------------
            // Assessment blocks
            // ---------------------------------------------------------------

            std::vector<RiskFactor> identify_risk_factors(const InvestmentIdea &idea) const;
            static std::vector<RiskMitigation> generate_mitigations(const std::vector<RiskFactor> &factors);
            static std::vector<StressTestResult> stress_tests(const std::vector<Investment> &investments);
            static std::vector<ScenarioRisk> scenario_analysis();
            std::vector<CorrelationRisk> correlation_risks(const std::vector<Investment> &investments) const;
            LiquidityRisk assess_liquidity_risk(const std::vector<Investment> &investments) const;
            static ConcentrationRisk assess_concentration_risk(const std::vector<Investment> &investments);
            static MarketRisk assess_market_risk(const std::vector<Investment> &investments);
            static std::optional<CreditRisk> assess_credit_risk(const std::vector<Investment> &investments);
            static OperationalRisk assess_operational_risk(const InvestmentIdea &idea, Timestamp as_of);

            const config::EngineAssumptions &assumptions() const { return assumptions_; }

        private:
            config::EngineAssumptions assumptions_;
        };

    } // namespace risk
} // namespace prospect

#endif // PROSPECT_RISK_RISK_ASSESSOR_HPP
