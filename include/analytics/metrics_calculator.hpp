/**
 * @file metrics_calculator.hpp
 * @brief Computes KeyMetrics for an investment idea.
 *
 * The portfolio is equal-weighted and every ratio uses the single-factor
 * approximations configured in EngineAssumptions (e.g. downside deviation
 * as a fixed fraction of volatility). All calculations are total: empty
 * portfolios and missing optional data yield neutral values.
 *
 * Usage:
 * @code
 *   prospect::analytics::MetricsCalculator calculator;
 *   auto metrics = calculator.calculate_key_metrics(idea);
 *   std::cout << metrics.summary();
 * @endcode
 *
 * Thread safety: Instances are immutable after construction. All public
 * methods are const and safe to call concurrently.
 */

#ifndef PROSPECT_ANALYTICS_METRICS_CALCULATOR_HPP
#define PROSPECT_ANALYTICS_METRICS_CALCULATOR_HPP

#include "analytics/key_metrics.hpp"
#include "config/engine_assumptions.hpp"
#include "model/investment_idea.hpp"

#include <chrono>
#include <vector>

namespace prospect
{
    namespace analytics
    {

        /**
         * @class MetricsCalculator
         * @brief Scalar return, risk and quality metrics of an idea.
         */
        class MetricsCalculator
        {
        public:
            /**
             * @brief Construct with the given market assumptions.
             * @throws std::invalid_argument If the assumptions fail validation.
             */
            explicit MetricsCalculator(config::EngineAssumptions assumptions = {});

            /**
             * @brief Compute all key metrics.
             * @param idea Idea to analyse.
             * @param as_of Analysis time used for data recency.
             */
            KeyMetrics calculate_key_metrics(
                const InvestmentIdea &idea,
                Timestamp as_of = std::chrono::system_clock::now()) const;

            // ---------------------------------------------------------------
            // Individual metrics
            // ---------------------------------------------------------------

            /**
             * @brief Standard-normal quantile for a tail probability.
             *
             * Only 0.01, 0.05 and 0.10 are tabulated; any other level maps
             * to -1.645.
             */
            static double z_score(double confidence_level);

            double sharpe_ratio(double expected_return, double volatility) const;

            /**
             * @brief Largest running-peak drawdown over any investment's bars.
             * @return Positive fraction, 0 when no series has 2 or more bars.
             */
            static double max_drawdown(const std::vector<Investment> &investments);

            /**
             * @brief Parametric VaR: historical return + z * volatility.
             */
            double value_at_risk(const std::vector<Investment> &investments,
                                 double confidence_level) const;

            static double diversification_ratio(const std::vector<Investment> &investments);

            /**
             * @brief Mean absolute pairwise correlation, 0 for fewer than 2 positions.
             */
            double correlation_score(const std::vector<Investment> &investments) const;

            static double fundamental_score(const std::vector<Investment> &investments);
            static double technical_score(const std::vector<Investment> &investments);
            static double sentiment_score(const std::vector<Investment> &investments);

            double information_ratio(const std::vector<Investment> &investments) const;
            static double calmar_ratio(double expected_return, double max_drawdown);
            double sortino_ratio(const std::vector<Investment> &investments,
                                 double target_return = 0.0) const;

            /**
             * @brief Days for the expected return to cover transaction costs.
             * @return +infinity when expected_return <= 0.
             */
            double time_to_breakeven(double expected_return) const;

            static double market_condition_suitability(const InvestmentIdea &idea);

            const config::EngineAssumptions &assumptions() const { return assumptions_; }

        private:
            config::EngineAssumptions assumptions_;
        };

    } // namespace analytics
} // namespace prospect

#endif // PROSPECT_ANALYTICS_METRICS_CALCULATOR_HPP
