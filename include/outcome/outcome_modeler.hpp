/**
 * @file outcome_modeler.hpp
 * @brief Scenario, Monte Carlo and projection model of an idea's outcome.
 *
 * Builds base/bull/bear scenarios from the idea's analyst outcomes (with fixed
 * fallbacks), a probability-weighted return, a 95% confidence interval, a
 * fixed sensitivity table, a Monte Carlo simulation and a daily projection
 * with 68% and 95% bands.
 *
 * Usage:
 * @code
 *   prospect::outcome::OutcomeModeler modeler;
 *   std::mt19937_64 rng(7);
 *   auto model = modeler.model_expected_outcomes(idea, rng);
 * @endcode
 *
 * Thread safety: Instances are immutable after construction. Concurrent calls
 * are safe as long as each uses its own generator.
 */

#ifndef PROSPECT_OUTCOME_OUTCOME_MODELER_HPP
#define PROSPECT_OUTCOME_OUTCOME_MODELER_HPP

#include "config/engine_assumptions.hpp"
#include "model/investment_idea.hpp"
#include "outcome/monte_carlo.hpp"
#include "outcome/outcome_model.hpp"

#include <chrono>
#include <random>
#include <vector>

namespace prospect
{
    namespace outcome
    {

        /**
         * @enum ScenarioCase
         * @brief Which of the three modelled cases a scenario or milestone belongs to.
         */
        enum class ScenarioCase
        {
            BASE,
            BULL,
            BEAR
        };

        class OutcomeModeler
        {
        public:
            /**
             * @throws std::invalid_argument If the assumptions fail validation.
             */
            explicit OutcomeModeler(config::EngineAssumptions assumptions = {});

            /**
             * @brief Build the full outcome model.
             * @param idea Idea to model.
             * @param rng Generator consumed by the Monte Carlo simulation.
             * @param as_of Base date of milestones and projections.
             */
            ExpectedOutcomeModel model_expected_outcomes(
                const InvestmentIdea &idea,
                std::mt19937_64 &rng,
                Timestamp as_of = std::chrono::system_clock::now()) const;

            /**
             * @brief Same as above with an internal generator seeded from
             *        random_seed, or from std::random_device when unset.
             */
            ExpectedOutcomeModel model_expected_outcomes(
                const InvestmentIdea &idea,
                Timestamp as_of = std::chrono::system_clock::now()) const;

            OutcomeScenario build_scenario(const InvestmentIdea &idea, ScenarioCase which, Timestamp as_of) const;

            /**
             * @brief Quarterly review milestones plus one mid-horizon market event.
             */
            static std::vector<Milestone> generate_milestones(const InvestmentIdea &idea,
                                                              ScenarioCase which,
                                                              Timestamp as_of);

            ConfidenceInterval confidence_interval(const std::vector<Investment> &investments) const;

            static SensitivityAnalysis sensitivity_analysis();

            MonteCarloResults run_monte_carlo(const InvestmentIdea &idea, std::mt19937_64 &rng) const;

            /**
             * @brief Daily projection driven by Monte Carlo mean and deviation.
             * @return min(holding period, 365) steps starting one day after @p as_of.
             */
            std::vector<TimeSeriesProjection> project(const InvestmentIdea &idea,
                                                      const MonteCarloResults &monte_carlo,
                                                      Timestamp as_of) const;

            const config::EngineAssumptions &assumptions() const { return assumptions_; }

        private:
            config::EngineAssumptions assumptions_;
        };

    } // namespace outcome
} // namespace prospect

#endif // PROSPECT_OUTCOME_OUTCOME_MODELER_HPP
