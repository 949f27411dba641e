/**
 * @file portfolio_statistics.hpp
 * @brief Low-level equal-weight statistics over a list of investments.
 *
 * These helpers are shared by MetricsCalculator, RiskAssessor and
 * OutcomeModeler. All functions are total: empty inputs and missing optional
 * fields produce documented neutral values, never NaN.
 */

#ifndef PROSPECT_ANALYTICS_PORTFOLIO_STATISTICS_HPP
#define PROSPECT_ANALYTICS_PORTFOLIO_STATISTICS_HPP

#include "model/investment.hpp"
#include "model/investment_idea.hpp"

#include <Eigen/Dense>

#include <string>
#include <vector>

namespace prospect
{
    namespace analytics
    {

        // ---------------------------------------------------------------
        // Returns
        // ---------------------------------------------------------------

        /**
         * @brief Annualized return implied by the first and last adjusted close.
         * @param investment Position with its bar history.
         * @param trading_days_per_year Annualization base (252).
         * @return (last/first)^(trading_days/periods) - 1, where periods is the bar
         *         count. 0 for fewer than 2 bars or a non-positive first close.
         */
        double annualized_historical_return(const Investment &investment,
                                            int trading_days_per_year = 252);

        /**
         * @brief Equal-weighted mean of annualized_historical_return().
         * @return 0 for an empty portfolio.
         */
        double average_historical_return(const std::vector<Investment> &investments,
                                         int trading_days_per_year = 252);

        /**
         * @brief Sum of return_estimate * probability over all outcomes.
         */
        double probability_weighted_return(const std::vector<Outcome> &outcomes);

        /**
         * @brief Expected return of an idea.
         *
         * Probability-weighted outcome return when outcomes exist, otherwise
         * the portfolio-average historical return.
         */
        double expected_return(const InvestmentIdea &idea, int trading_days_per_year = 252);

        // ---------------------------------------------------------------
        // Risk statistics
        // ---------------------------------------------------------------

        /**
         * @brief Equal-weighted mean of upstream volatility (missing => 0).
         * @return 0 for an empty portfolio.
         */
        double average_volatility(const std::vector<Investment> &investments);

        /**
         * @brief Equal-weighted mean of upstream beta (missing => 1).
         * @return 1 for an empty portfolio.
         */
        double average_beta(const std::vector<Investment> &investments);

        /**
         * @brief Herfindahl-Hirschman index under equal weights.
         * @return 1/n, or 1 for an empty portfolio.
         */
        double concentration_hhi(const std::vector<Investment> &investments);

        /**
         * @brief Pairwise correlation matrix.
         *
         * Entry (i, j) for i < j is investment i's estimate for investment j's
         * id, or @p default_correlation when i has no estimate. The matrix is
         * mirrored into the lower triangle and has a unit diagonal.
         */
        Eigen::MatrixXd correlation_matrix(const std::vector<Investment> &investments,
                                           double default_correlation = 0.5);

        // ---------------------------------------------------------------
        // Composition
        // ---------------------------------------------------------------

        /**
         * @brief Distinct non-empty sectors in first-seen order.
         */
        std::vector<std::string> distinct_sectors(const std::vector<Investment> &investments);

        /**
         * @brief Number of distinct asset types.
         */
        std::size_t distinct_asset_types(const std::vector<Investment> &investments);

        /**
         * @brief Trailing average volume.
         * @param window Number of trailing bars summed.
         * @return Sum of the last @p window volumes divided by @p window (a shorter
         *         history is still divided by the full window).
         */
        double trailing_average_volume(const Investment &investment, int window = 30);

        // ---------------------------------------------------------------
        // Idea-level lookups
        // ---------------------------------------------------------------

        /**
         * @brief Holding period implied by a time horizon, in days.
         */
        int holding_period_days(TimeHorizon horizon);

        /**
         * @brief Recency weight of a data point of the given age.
         */
        double recency_score(Timestamp timestamp, Timestamp as_of);

        /**
         * @brief Source quality from a case-insensitive substring match.
         * @return 0.9 for tier-one sources, 0.7 for tier-two, 0.5 otherwise.
         */
        double source_quality(const std::string &source);

        /**
         * @brief Average data quality score in [0, 100].
         * @return 30 when there is no supporting data.
         */
        double data_quality_score(const std::vector<DataPoint> &supporting_data, Timestamp as_of);

    } // namespace analytics
} // namespace prospect

#endif // PROSPECT_ANALYTICS_PORTFOLIO_STATISTICS_HPP
