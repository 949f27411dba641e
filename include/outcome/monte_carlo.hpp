/**
 * @file monte_carlo.hpp
 * @brief Single-period Monte Carlo simulation of annual returns.
 */

#ifndef PROSPECT_OUTCOME_MONTE_CARLO_HPP
#define PROSPECT_OUTCOME_MONTE_CARLO_HPP

#include "outcome/outcome_model.hpp"

#include <random>

namespace prospect
{
    namespace outcome
    {

        /**
         * @class MonteCarloSimulator
         * @brief Draws normal returns with the Box-Muller transform and summarizes them.
         *
         * Each sample consumes two uniforms from the injected generator, in
         * order, so results are reproducible for a given seed.
         *
         * Usage:
         * @code
         *   std::mt19937_64 rng(42);
         *   MonteCarloSimulator simulator(10000, 0.10);
         *   auto results = simulator.run(0.10, 0.20, rng);
         * @endcode
         */
        class MonteCarloSimulator
        {
        public:
            /**
             * @param iterations Number of samples (0 yields all-zero results).
             * @param target_return Threshold for probability_of_target.
             * @throws std::invalid_argument If iterations is negative.
             */
            explicit MonteCarloSimulator(int iterations = 10000, double target_return = 0.10);

            /**
             * @brief Simulate and summarize.
             * @param mean Expected annual return.
             * @param volatility Annual volatility (0 gives a degenerate distribution).
             * @param rng Generator supplying uniforms.
             */
            MonteCarloResults run(double mean, double volatility, std::mt19937_64 &rng) const;

            /**
             * @brief Standard normal deviate from two uniforms.
             * @param u1 Uniform in (0, 1].
             * @param u2 Uniform in [0, 1).
             */
            static double box_muller(double u1, double u2);

            int iterations() const { return iterations_; }
            double target_return() const { return target_return_; }

        private:
            int iterations_;
            double target_return_;
        };

    } // namespace outcome
} // namespace prospect

#endif // PROSPECT_OUTCOME_MONTE_CARLO_HPP
