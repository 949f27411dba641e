/**
 * @file types.hpp
 * @brief Enumerations and time helpers shared by the input model.
 *
 * Every enumeration here has a canonical lowercase, hyphenated string form
 * (e.g. "very-long", "pairs-trade") which is the form used in JSON inputs
 * and outputs. Conversions in both directions live next to the enums so that
 * the analytics code can switch over enum values exhaustively.
 */

#ifndef PROSPECT_MODEL_TYPES_HPP
#define PROSPECT_MODEL_TYPES_HPP

#include <chrono>
#include <string>

namespace prospect
{

    /// Wall-clock instant used for bar dates, data point timestamps and projections.
    using Timestamp = std::chrono::system_clock::time_point;

    /**
     * @enum AssetType
     * @brief Kind of tradable instrument.
     */
    enum class AssetType
    {
        STOCK,
        BOND,
        ETF,
        MUTUAL_FUND,
        COMMODITY,
        CRYPTOCURRENCY,
        REAL_ESTATE,
        OTHER
    };

    /**
     * @enum TimeHorizon
     * @brief Intended holding horizon of an investment idea.
     */
    enum class TimeHorizon
    {
        INTRADAY,
        SHORT,
        MEDIUM,
        LONG,
        VERY_LONG
    };

    /**
     * @enum RiskLevel
     * @brief Five-step qualitative risk scale.
     */
    enum class RiskLevel
    {
        VERY_LOW,
        LOW,
        MODERATE,
        HIGH,
        VERY_HIGH
    };

    /**
     * @enum Strategy
     * @brief Trading strategy an idea follows.
     */
    enum class Strategy
    {
        BUY,
        HOLD,
        SELL,
        SHORT,
        LONG,
        HEDGE,
        ARBITRAGE,
        PAIRS_TRADE,
        MOMENTUM,
        VALUE,
        GROWTH,
        INCOME,
        COMPLEX
    };

    /**
     * @enum OutcomeCase
     * @brief Tag of an analyst-supplied potential outcome.
     */
    enum class OutcomeCase
    {
        EXPECTED,
        BEST,
        WORST
    };

    /**
     * @enum Sentiment
     * @brief Categorical overall sentiment.
     */
    enum class Sentiment
    {
        VERY_POSITIVE,
        POSITIVE,
        NEUTRAL,
        NEGATIVE,
        VERY_NEGATIVE
    };

    /**
     * @enum SentimentTrend
     * @brief Direction in which sentiment is moving.
     */
    enum class SentimentTrend
    {
        IMPROVING,
        STABLE,
        DETERIORATING
    };

    // ---------------------------------------------------------------
    // String conversion
    // ---------------------------------------------------------------

    std::string to_string(AssetType type);
    std::string to_string(TimeHorizon horizon);
    std::string to_string(RiskLevel level);
    std::string to_string(Strategy strategy);
    std::string to_string(OutcomeCase outcome_case);
    std::string to_string(Sentiment sentiment);
    std::string to_string(SentimentTrend trend);

    /**
     * @brief Parse enumerations from their canonical string form.
     * @throws std::invalid_argument If the name is not recognized.
     *
     * Matching is case-insensitive; underscores are accepted in place of hyphens.
     */
    AssetType parse_asset_type(const std::string &name);
    TimeHorizon parse_time_horizon(const std::string &name);
    RiskLevel parse_risk_level(const std::string &name);
    Strategy parse_strategy(const std::string &name);
    OutcomeCase parse_outcome_case(const std::string &name);
    Sentiment parse_sentiment(const std::string &name);
    SentimentTrend parse_sentiment_trend(const std::string &name);

    // ---------------------------------------------------------------
    // Time helpers
    // ---------------------------------------------------------------

    /**
     * @brief Parse an ISO-8601 UTC timestamp.
     * @param text "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM:SS" with an optional trailing 'Z'.
     * @return Parsed instant.
     * @throws std::invalid_argument If the text does not match either format.
     */
    Timestamp parse_timestamp(const std::string &text);

    /**
     * @brief Format an instant as "YYYY-MM-DDTHH:MM:SSZ" (UTC).
     */
    std::string format_timestamp(Timestamp ts);

    /**
     * @brief Shift an instant by a (possibly fractional) number of days.
     */
    Timestamp add_days(Timestamp ts, double days);

    /**
     * @brief Age of @p ts relative to @p as_of, in fractional days.
     */
    double days_between(Timestamp ts, Timestamp as_of);

} // namespace prospect

#endif // PROSPECT_MODEL_TYPES_HPP
