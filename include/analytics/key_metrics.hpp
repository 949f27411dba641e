/**
 * @file key_metrics.hpp
 * @brief Scalar risk/return metrics of an investment idea.
 */

#ifndef PROSPECT_ANALYTICS_KEY_METRICS_HPP
#define PROSPECT_ANALYTICS_KEY_METRICS_HPP

#include <nlohmann/json.hpp>

#include <string>

namespace prospect
{
    namespace analytics
    {

        /**
         * @struct KeyMetrics
         * @brief Output of MetricsCalculator.
         *
         * Returns, volatilities and drawdowns are fractions (0.15 = 15%).
         * Scores are in [0, 100]. time_to_breakeven is +infinity when the
         * expected return is not positive; every other field is finite.
         */
        struct KeyMetrics
        {
            // Return and risk
            double expected_return = 0.0;
            double volatility = 0.0;
            double sharpe_ratio = 0.0;
            double max_drawdown = 0.0; ///< Positive fraction
            double value_at_risk = 0.0; ///< 95% parametric VaR (a return, usually negative)

            // Portfolio construction
            double diversification_ratio = 0.0;
            double correlation_score = 0.0;
            double concentration_risk = 1.0; ///< Equal-weight HHI

            // Quality scores
            double fundamental_score = 50.0;
            double technical_score = 50.0;
            double sentiment_score = 50.0;

            // Risk-adjusted
            double information_ratio = 0.0;
            double calmar_ratio = 0.0;
            double sortino_ratio = 0.0;

            // Time
            double time_to_breakeven = 0.0; ///< Days
            int optimal_holding_period = 0; ///< Days

            // Confidence
            double data_quality = 30.0;
            double model_confidence = 0.0;
            double market_condition_suitability = 50.0;

            /**
             * @brief Convert to JSON (camelCase keys). An infinite
             *        time_to_breakeven is written as null.
             */
            nlohmann::json to_json() const;

            /**
             * @brief Multi-line human-readable report.
             */
            std::string summary() const;
        };

    } // namespace analytics
} // namespace prospect

#endif // PROSPECT_ANALYTICS_KEY_METRICS_HPP
