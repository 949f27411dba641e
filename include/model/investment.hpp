/**
 * @file investment.hpp
 * @brief A single tradable position and its optional research blocks.
 *
 * Investments are produced upstream (market data and research collaborators)
 * and treated as read-only by the analytics engines. Optional blocks are
 * std::optional; a missing block makes the engines fall back to a neutral
 * default rather than skip the investment.
 */

#ifndef PROSPECT_MODEL_INVESTMENT_HPP
#define PROSPECT_MODEL_INVESTMENT_HPP

#include "model/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace prospect
{

    /**
     * @struct PriceBar
     * @brief One bar of historical performance.
     */
    struct PriceBar
    {
        Timestamp date;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        double adjusted_close = 0.0; ///< Split/dividend adjusted close used by all return math
        double volume = 0.0;         ///< Traded volume (shares)
    };

    /**
     * @struct Fundamentals
     * @brief Subset of fundamental ratios used for scoring.
     */
    struct Fundamentals
    {
        std::optional<double> pe_ratio;
        std::optional<double> profit_margin;
        std::optional<double> return_on_equity;
        std::optional<double> debt_to_equity;
    };

    /**
     * @struct MovingAverages
     * @brief Simple moving averages of the closing price.
     */
    struct MovingAverages
    {
        double ma50 = 0.0;
        double ma200 = 0.0;
    };

    /**
     * @struct TechnicalIndicators
     * @brief Technical signals used for scoring.
     */
    struct TechnicalIndicators
    {
        std::optional<double> relative_strength_index;
        std::optional<MovingAverages> moving_averages;
        std::optional<double> macd_line;
        std::optional<double> macd_signal;
    };

    /**
     * @struct AnalystRecommendations
     * @brief Counts of sell-side recommendations.
     */
    struct AnalystRecommendations
    {
        int buy = 0;
        int hold = 0;
        int sell = 0;
    };

    /**
     * @struct SentimentAnalysis
     * @brief News and analyst sentiment summary.
     */
    struct SentimentAnalysis
    {
        Sentiment overall_sentiment = Sentiment::NEUTRAL;
        SentimentTrend sentiment_trend = SentimentTrend::STABLE;
        std::optional<AnalystRecommendations> analyst_recommendations;
    };

    /**
     * @struct InvestmentRiskMetrics
     * @brief Upstream-estimated risk statistics of one investment.
     */
    struct InvestmentRiskMetrics
    {
        double volatility = 0.0;                   ///< Annualized volatility
        std::optional<double> beta;                ///< Market beta (engines assume 1.0 when absent)
        std::map<std::string, double> correlations; ///< Other investment id -> pairwise correlation
    };

    /**
     * @struct Investment
     * @brief One position of an investment idea.
     */
    struct Investment
    {
        std::string id;
        std::string name;
        std::string ticker;
        std::string sector; ///< Empty when the sector is not known
        AssetType type = AssetType::STOCK;
        double current_price = 0.0;
        std::vector<PriceBar> historical_performance; ///< Ordered oldest to newest

        std::optional<Fundamentals> fundamentals;
        std::optional<TechnicalIndicators> technical_indicators;
        std::optional<SentimentAnalysis> sentiment_analysis;
        std::optional<InvestmentRiskMetrics> risk_metrics;
    };

} // namespace prospect

#endif // PROSPECT_MODEL_INVESTMENT_HPP
