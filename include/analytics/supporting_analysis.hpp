/**
 * @file supporting_analysis.hpp
 * @brief Runs metrics, risk and outcome engines together on one idea.
 */

#ifndef PROSPECT_ANALYTICS_SUPPORTING_ANALYSIS_HPP
#define PROSPECT_ANALYTICS_SUPPORTING_ANALYSIS_HPP

#include "analytics/key_metrics.hpp"
#include "config/engine_assumptions.hpp"
#include "model/investment_idea.hpp"
#include "outcome/outcome_model.hpp"
#include "risk/risk_assessment.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace prospect
{
    namespace analytics
    {

        /**
         * @struct SupportingAnalysis
         * @brief Combined output of the three engines.
         */
        struct SupportingAnalysis
        {
            KeyMetrics key_metrics;
            risk::RiskAssessment risk_assessment;
            outcome::ExpectedOutcomeModel expected_outcomes;

            nlohmann::json to_json() const;
            std::string summary() const;
        };

        /**
         * @class SupportingAnalysisService
         * @brief Concurrent front end over MetricsCalculator, RiskAssessor and OutcomeModeler.
         *
         * Each engine runs in its own std::async task on the same immutable
         * idea. The outcome task draws from a generator seeded with
         * random_seed when configured, so results are reproducible. An
         * exception thrown by any engine is rethrown from analyze().
         */
        class SupportingAnalysisService
        {
        public:
            /**
             * @throws std::invalid_argument If the assumptions fail validation.
             */
            explicit SupportingAnalysisService(config::EngineAssumptions assumptions = {});

            SupportingAnalysis analyze(const InvestmentIdea &idea,
                                       Timestamp as_of = std::chrono::system_clock::now()) const;

            /**
             * @brief Print the combined summary to std::cout.
             */
            static void print_summary(const SupportingAnalysis &analysis);

            const config::EngineAssumptions &assumptions() const { return assumptions_; }

        private:
            config::EngineAssumptions assumptions_;
        };

    } // namespace analytics
} // namespace prospect

#endif // PROSPECT_ANALYTICS_SUPPORTING_ANALYSIS_HPP
