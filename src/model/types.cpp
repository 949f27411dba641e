/**
 * @file types.cpp
 * @brief Enum/string conversions and UTC time helpers.
 */

#include "model/types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace prospect
{

    namespace
    {

        /**
         * @brief Lowercase and map '_' to '-' so "PAIRS_TRADE" matches "pairs-trade".
         */
        std::string normalize_name(const std::string &name)
        {
            std::string normalized = name;
            std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c)
                           { return c == '_' ? '-' : static_cast<char>(std::tolower(c)); });
            return normalized;
        }

        [[noreturn]] void throw_unknown(const std::string &what, const std::string &name,
                                        const std::string &valid)
        {
            throw std::invalid_argument(
                "Unknown " + what + ": '" + name + "'. Valid options: " + valid);
        }

    } // anonymous namespace

    // ===================================================================
    // to_string
    // ===================================================================

    std::string to_string(AssetType type)
    {
        switch (type)
        {
        case AssetType::STOCK:
            return "stock";
        case AssetType::BOND:
            return "bond";
        case AssetType::ETF:
            return "etf";
        case AssetType::MUTUAL_FUND:
            return "mutual-fund";
        case AssetType::COMMODITY:
            return "commodity";
        case AssetType::CRYPTOCURRENCY:
            return "cryptocurrency";
        case AssetType::REAL_ESTATE:
            return "real-estate";
        case AssetType::OTHER:
            return "other";
        }
        return "other";
    }

    std::string to_string(TimeHorizon horizon)
    {
        switch (horizon)
        {
        case TimeHorizon::INTRADAY:
            return "intraday";
        case TimeHorizon::SHORT:
            return "short";
        case TimeHorizon::MEDIUM:
            return "medium";
        case TimeHorizon::LONG:
            return "long";
        case TimeHorizon::VERY_LONG:
            return "very-long";
        }
        return "medium";
    }

    std::string to_string(RiskLevel level)
    {
        switch (level)
        {
        case RiskLevel::VERY_LOW:
            return "very-low";
        case RiskLevel::LOW:
            return "low";
        case RiskLevel::MODERATE:
            return "moderate";
        case RiskLevel::HIGH:
            return "high";
        case RiskLevel::VERY_HIGH:
            return "very-high";
        }
        return "moderate";
    }

    std::string to_string(Strategy strategy)
    {
        switch (strategy)
        {
        case Strategy::BUY:
            return "buy";
        case Strategy::HOLD:
            return "hold";
        case Strategy::SELL:
            return "sell";
        case Strategy::SHORT:
            return "short";
        case Strategy::LONG:
            return "long";
        case Strategy::HEDGE:
            return "hedge";
        case Strategy::ARBITRAGE:
            return "arbitrage";
        case Strategy::PAIRS_TRADE:
            return "pairs-trade";
        case Strategy::MOMENTUM:
            return "momentum";
        case Strategy::VALUE:
            return "value";
        case Strategy::GROWTH:
            return "growth";
        case Strategy::INCOME:
            return "income";
        case Strategy::COMPLEX:
            return "complex";
        }
        return "buy";
    }

    std::string to_string(OutcomeCase outcome_case)
    {
        switch (outcome_case)
        {
        case OutcomeCase::EXPECTED:
            return "expected";
        case OutcomeCase::BEST:
            return "best";
        case OutcomeCase::WORST:
            return "worst";
        }
        return "expected";
    }

    std::string to_string(Sentiment sentiment)
    {
        switch (sentiment)
        {
        case Sentiment::VERY_POSITIVE:
            return "very-positive";
        case Sentiment::POSITIVE:
            return "positive";
        case Sentiment::NEUTRAL:
            return "neutral";
        case Sentiment::NEGATIVE:
            return "negative";
        case Sentiment::VERY_NEGATIVE:
            return "very-negative";
        }
        return "neutral";
    }

    std::string to_string(SentimentTrend trend)
    {
        switch (trend)
        {
        case SentimentTrend::IMPROVING:
            return "improving";
        case SentimentTrend::STABLE:
            return "stable";
        case SentimentTrend::DETERIORATING:
            return "deteriorating";
        }
        return "stable";
    }

    // ===================================================================
    // parse_*
    // ===================================================================

    AssetType parse_asset_type(const std::string &name)
    {
        const std::string n = normalize_name(name);
        if (n == "stock")
            return AssetType::STOCK;
        if (n == "bond")
            return AssetType::BOND;
        if (n == "etf")
            return AssetType::ETF;
        if (n == "mutual-fund")
            return AssetType::MUTUAL_FUND;
        if (n == "commodity")
            return AssetType::COMMODITY;
        if (n == "cryptocurrency")
            return AssetType::CRYPTOCURRENCY;
        if (n == "real-estate")
            return AssetType::REAL_ESTATE;
        if (n == "other")
            return AssetType::OTHER;
        throw_unknown("asset type", name,
                      "stock, bond, etf, mutual-fund, commodity, cryptocurrency, real-estate, other");
    }

    TimeHorizon parse_time_horizon(const std::string &name)
    {
        const std::string n = normalize_name(name);
        if (n == "intraday")
            return TimeHorizon::INTRADAY;
        if (n == "short")
            return TimeHorizon::SHORT;
        if (n == "medium")
            return TimeHorizon::MEDIUM;
        if (n == "long")
            return TimeHorizon::LONG;
        if (n == "very-long")
            return TimeHorizon::VERY_LONG;
        throw_unknown("time horizon", name, "intraday, short, medium, long, very-long");
    }

    RiskLevel parse_risk_level(const std::string &name)
    {
        const std::string n = normalize_name(name);
        if (n == "very-low")
            return RiskLevel::VERY_LOW;
        if (n == "low")
            return RiskLevel::LOW;
        if (n == "moderate")
            return RiskLevel::MODERATE;
        if (n == "high")
            return RiskLevel::HIGH;
        if (n == "very-high")
            return RiskLevel::VERY_HIGH;
        throw_unknown("risk level", name, "very-low, low, moderate, high, very-high");
    }

    Strategy parse_strategy(const std::string &name)
    {
        const std::string n = normalize_name(name);
        if (n == "buy")
            return Strategy::BUY;
        if (n == "hold")
            return Strategy::HOLD;
        if (n == "sell")
            return Strategy::SELL;
        if (n == "short")
            return Strategy::SHORT;
        if (n == "long")
            return Strategy::LONG;
        if (n == "hedge")
            return Strategy::HEDGE;
        if (n == "arbitrage")
            return Strategy::ARBITRAGE;
        if (n == "pairs-trade")
            return Strategy::PAIRS_TRADE;
        if (n == "momentum")
            return Strategy::MOMENTUM;
        if (n == "value")
            return Strategy::VALUE;
        if (n == "growth")
            return Strategy::GROWTH;
        if (n == "income")
            return Strategy::INCOME;
        if (n == "complex")
            return Strategy::COMPLEX;
        throw_unknown("strategy", name,
                      "buy, hold, sell, short, long, hedge, arbitrage, pairs-trade, momentum, value, growth, income, complex");
    }

    OutcomeCase parse_outcome_case(const std::string &name)
    {
        const std::string n = normalize_name(name);
        if (n == "expected")
            return OutcomeCase::EXPECTED;
        if (n == "best")
            return OutcomeCase::BEST;
        if (n == "worst")
            return OutcomeCase::WORST;
        throw_unknown("outcome scenario", name, "expected, best, worst");
    }

    Sentiment parse_sentiment(const std::string &name)
    {
        const std::string n = normalize_name(name);
        if (n == "very-positive")
            return Sentiment::VERY_POSITIVE;
        if (n == "positive")
            return Sentiment::POSITIVE;
        if (n == "neutral")
            return Sentiment::NEUTRAL;
        if (n == "negative")
            return Sentiment::NEGATIVE;
        if (n == "very-negative")
            return Sentiment::VERY_NEGATIVE;
        throw_unknown("sentiment", name, "very-positive, positive, neutral, negative, very-negative");
    }

    SentimentTrend parse_sentiment_trend(const std::string &name)
    {
        const std::string n = normalize_name(name);
        if (n == "improving")
            return SentimentTrend::IMPROVING;
        if (n == "stable")
            return SentimentTrend::STABLE;
        if (n == "deteriorating")
            return SentimentTrend::DETERIORATING;
        throw_unknown("sentiment trend", name, "improving, stable, deteriorating");
    }

    // ===================================================================
    // Time helpers
    // ===================================================================

    Timestamp parse_timestamp(const std::string &text)
    {
        std::tm tm = {};
        std::istringstream ss(text);

        if (text.size() == 10)
        {
            ss >> std::get_time(&tm, "%Y-%m-%d");
        }
        else
        {
            ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        }

        if (ss.fail())
        {
            throw std::invalid_argument(
                "Expected ISO-8601 timestamp (YYYY-MM-DD or YYYY-MM-DDTHH:MM:SSZ), got: '" + text + "'");
        }

        // Fractional seconds and the trailing 'Z' are ignored; all inputs are UTC.
        std::time_t t = timegm(&tm);
        return std::chrono::system_clock::from_time_t(t);
    }

    std::string format_timestamp(Timestamp ts)
    {
        std::time_t t = std::chrono::system_clock::to_time_t(ts);
        std::tm tm = {};
        gmtime_r(&t, &tm);

        char buffer[21];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
        return std::string(buffer);
    }

    Timestamp add_days(Timestamp ts, double days)
    {
        auto offset = std::chrono::duration<double, std::ratio<86400>>(days);
        return ts + std::chrono::duration_cast<std::chrono::system_clock::duration>(offset);
    }

    double days_between(Timestamp ts, Timestamp as_of)
    {
        std::chrono::duration<double, std::ratio<86400>> age = as_of - ts;
        return age.count();
    }

} // namespace prospect
