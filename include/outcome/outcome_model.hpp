/**
 * @file outcome_model.hpp
 * @brief Result types of OutcomeModeler.
 */

#ifndef PROSPECT_OUTCOME_OUTCOME_MODEL_HPP
#define PROSPECT_OUTCOME_OUTCOME_MODEL_HPP

#include "model/types.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace prospect
{
    namespace outcome
    {

        /**
         * @enum MilestoneType
         * @brief Kind of dated checkpoint inside a scenario.
         */
        enum class MilestoneType
        {
            CATALYST,
            RISK_EVENT,
            DECISION_POINT,
            MARKET_EVENT
        };

        std::string to_string(MilestoneType type);

        struct Milestone
        {
            Timestamp date;
            std::string description;
            double probability = 0.0;
            double impact = 0.0; ///< Return impact as a fraction
            MilestoneType type = MilestoneType::DECISION_POINT;
        };

        /**
         * @struct OutcomeScenario
         * @brief One of the base, bull and bear cases.
         */
        struct OutcomeScenario
        {
            double probability = 0.0;
            double expected_return = 0.0;
            double time_to_realization = 0.0; ///< Days
            std::vector<std::string> key_assumptions;
            std::vector<std::string> catalysts;
            std::vector<std::string> risks;
            std::vector<Milestone> milestones;
        };

        struct ConfidenceInterval
        {
            double level = 0.95;
            double lower_bound = 0.0;
            double upper_bound = 0.0;
            double standard_error = 0.0;
        };

        struct SensitivityVariable
        {
            std::string name;
            double base_value = 0.0;
            double impact = 0.0; ///< Change in outcome per unit change of the variable
            double elasticity = 0.0;
            double range_min = 0.0;
            double range_max = 0.0;
        };

        struct SensitivityAnalysis
        {
            std::vector<SensitivityVariable> variables;
            Eigen::Matrix3d correlation_matrix = Eigen::Matrix3d::Identity(); ///< Ordered as variables
            std::vector<std::string> key_drivers;
        };

        /**
         * @struct MonteCarloResults
         * @brief Summary statistics of simulated annual returns.
         *
         * percentiles is keyed by the integer percentile (1, 5, ..., 99).
         */
        struct MonteCarloResults
        {
            int iterations = 0;
            double mean_return = 0.0;
            double standard_deviation = 0.0;
            std::map<int, double> percentiles;
            double probability_of_loss = 0.0;
            double probability_of_target = 0.0;
            double expected_shortfall = 0.0; ///< Mean of samples at or below the 5th percentile
        };

        struct ConfidenceBands
        {
            double upper95 = 0.0;
            double upper68 = 0.0;
            double lower68 = 0.0;
            double lower95 = 0.0;
        };

        struct TimeSeriesProjection
        {
            Timestamp date;
            double expected_value = 0.0;
            ConfidenceBands confidence_bands;
            double cumulative_return = 0.0;
        };

        /**
         * @struct ExpectedOutcomeModel
         * @brief Output of OutcomeModeler.
         */
        struct ExpectedOutcomeModel
        {
            OutcomeScenario base_case;
            OutcomeScenario bull_case;
            OutcomeScenario bear_case;
            double probability_weighted_return = 0.0;
            ConfidenceInterval confidence_interval;
            SensitivityAnalysis sensitivity_analysis;
            MonteCarloResults monte_carlo_results;
            std::vector<TimeSeriesProjection> time_series_projection;

            /**
             * @brief Convert to JSON (camelCase keys, ISO-8601 dates).
             */
            nlohmann::json to_json() const;

            /**
             * @brief Multi-line human-readable report.
             */
            std::string summary() const;
        };

        nlohmann::json to_json(const MonteCarloResults &results);

    } // namespace outcome
} // namespace prospect

#endif // PROSPECT_OUTCOME_OUTCOME_MODEL_HPP
