/**
 * @file metrics_calculator.cpp
 * @brief Implementation of MetricsCalculator.
 */

#include "analytics/metrics_calculator.hpp"
#include "analytics/portfolio_statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace prospect
{
    namespace analytics
    {

        namespace
        {

            double clip_score(double score)
            {
                return std::max(0.0, std::min(100.0, score));
            }

            double score_fundamentals(const Fundamentals &f)
            {
                double score = 50.0;

                if (f.pe_ratio && *f.pe_ratio > 0.0)
                {
                    if (*f.pe_ratio < 15.0)
                        score += 10.0;
                    else if (*f.pe_ratio < 25.0)
                        score += 5.0;
                    else if (*f.pe_ratio > 40.0)
                        score -= 10.0;
                }

                if (f.profit_margin && *f.profit_margin > 0.0)
                {
                    if (*f.profit_margin > 0.15)
                        score += 10.0;
                    else if (*f.profit_margin > 0.10)
                        score += 5.0;
                }

                if (f.return_on_equity && *f.return_on_equity > 0.0)
                {
                    if (*f.return_on_equity > 0.15)
                        score += 10.0;
                    else if (*f.return_on_equity > 0.10)
                        score += 5.0;
                }

                if (f.debt_to_equity)
                {
                    if (*f.debt_to_equity < 0.3)
                        score += 5.0;
                    else if (*f.debt_to_equity > 1.0)
                        score -= 10.0;
                }

                return clip_score(score);
            }

            double score_technicals(const TechnicalIndicators &t, double current_price)
            {
                double score = 50.0;

                // An RSI of exactly 30 or 70 falls in no bucket
                if (t.relative_strength_index && *t.relative_strength_index != 0.0)
                {
                    double rsi = *t.relative_strength_index;
                    if (rsi > 30.0 && rsi < 70.0)
                        score += 10.0;
                    else if (rsi < 30.0)
                        score += 15.0;
                    else if (rsi > 70.0)
                        score -= 10.0;
                }

                if (t.moving_averages && current_price != 0.0)
                {
                    double ma50 = t.moving_averages->ma50;
                    double ma200 = t.moving_averages->ma200;
                    if (current_price > ma50 && ma50 > ma200)
                        score += 15.0;
                    else if (current_price < ma50 && ma50 < ma200)
                        score -= 10.0;
                }

                if (t.macd_line && t.macd_signal && *t.macd_line != 0.0 && *t.macd_signal != 0.0)
                {
                    score += (*t.macd_line > *t.macd_signal) ? 5.0 : -5.0;
                }

                return clip_score(score);
            }

            double sentiment_points(Sentiment sentiment)
            {
                switch (sentiment)
                {
                case Sentiment::VERY_POSITIVE:
                    return 20.0;
                case Sentiment::POSITIVE:
                    return 10.0;
                case Sentiment::NEUTRAL:
                    return 0.0;
                case Sentiment::NEGATIVE:
                    return -10.0;
                case Sentiment::VERY_NEGATIVE:
                    return -20.0;
                }
                return 0.0;
            }

            double trend_points(SentimentTrend trend)
            {
                switch (trend)
                {
                case SentimentTrend::IMPROVING:
                    return 10.0;
                case SentimentTrend::STABLE:
                    return 0.0;
                case SentimentTrend::DETERIORATING:
                    return -10.0;
                }
                return 0.0;
            }

            double score_sentiment(const SentimentAnalysis &s)
            {
                double score = 50.0 + sentiment_points(s.overall_sentiment) + trend_points(s.sentiment_trend);

                if (s.analyst_recommendations)
                {
                    const auto &r = *s.analyst_recommendations;
                    int total = r.buy + r.hold + r.sell;
                    if (total > 0)
                    {
                        double buy_ratio = static_cast<double>(r.buy) / static_cast<double>(total);
                        score += (buy_ratio - 0.5) * 20.0;
                    }
                }

                return clip_score(score);
            }

        } // anonymous namespace

        MetricsCalculator::MetricsCalculator(config::EngineAssumptions assumptions)
            : assumptions_(std::move(assumptions))
        {
            assumptions_.validate();
        }

        KeyMetrics MetricsCalculator::calculate_key_metrics(const InvestmentIdea &idea, Timestamp as_of) const
        {
            const auto &investments = idea.investments;
            KeyMetrics m;

            m.expected_return = expected_return(idea, assumptions_.trading_days_per_year);
            m.volatility = average_volatility(investments);
            m.sharpe_ratio = sharpe_ratio(m.expected_return, m.volatility);
            m.max_drawdown = max_drawdown(investments);
            m.value_at_risk = value_at_risk(investments, assumptions_.var_confidence_level);

            m.diversification_ratio = diversification_ratio(investments);
            m.correlation_score = correlation_score(investments);
            m.concentration_risk = concentration_hhi(investments);

            m.fundamental_score = fundamental_score(investments);
            m.technical_score = technical_score(investments);
            m.sentiment_score = sentiment_score(investments);

            m.information_ratio = information_ratio(investments);
            m.calmar_ratio = calmar_ratio(m.expected_return, m.max_drawdown);
            m.sortino_ratio = sortino_ratio(investments);

            m.time_to_breakeven = time_to_breakeven(m.expected_return);
            m.optimal_holding_period = holding_period_days(idea.time_horizon);

            m.data_quality = data_quality_score(idea.supporting_data, as_of);
            m.model_confidence = idea.confidence_score;
            m.market_condition_suitability = market_condition_suitability(idea);

            return m;
        }

        // ===================================================================
        // Return and risk
        // ===================================================================

        double MetricsCalculator::z_score(double confidence_level)
        {
            // Tabulated levels only; compared with a tolerance so 0.1 matches 0.10
            if (std::abs(confidence_level - 0.01) < 1e-12)
                return -2.326;
            if (std::abs(confidence_level - 0.05) < 1e-12)
                return -1.645;
            if (std::abs(confidence_level - 0.10) < 1e-12)
                return -1.282;
            return -1.645;
        }

        double MetricsCalculator::sharpe_ratio(double expected_return, double volatility) const
        {
            if (volatility == 0.0)
            {
                return 0.0;
            }
            return (expected_return - assumptions_.risk_free_rate) / volatility;
        }

        double MetricsCalculator::max_drawdown(const std::vector<Investment> &investments)
        {
            double max_dd = 0.0;

            for (const auto &inv : investments)
            {
                const auto &bars = inv.historical_performance;
                if (bars.size() < 2)
                {
                    continue;
                }

                double peak = bars.front().adjusted_close;
                for (std::size_t i = 1; i < bars.size(); ++i)
                {
                    double price = bars[i].adjusted_close;
                    if (price > peak)
                    {
                        peak = price;
                    }
                    else if (peak > 0.0)
                    {
                        max_dd = std::max(max_dd, (peak - price) / peak);
                    }
                }
            }

            return max_dd;
        }

        double MetricsCalculator::value_at_risk(const std::vector<Investment> &investments,
                                                double confidence_level) const
        {
            double historical = average_historical_return(investments, assumptions_.trading_days_per_year);
            return historical + z_score(confidence_level) * average_volatility(investments);
        }

        // ===================================================================
        // Portfolio construction
        // ===================================================================

        double MetricsCalculator::diversification_ratio(const std::vector<Investment> &investments)
        {
            if (investments.size() <= 1)
            {
                return 0.0;
            }

            double n = static_cast<double>(investments.size());
            double sector_diversification = static_cast<double>(distinct_sectors(investments).size()) / n;
            double type_diversification = static_cast<double>(distinct_asset_types(investments)) / n;
            return (sector_diversification + type_diversification) / 2.0;
        }

        double MetricsCalculator::correlation_score(const std::vector<Investment> &investments) const
        {
            const std::size_t n = investments.size();
            if (n <= 1)
            {
                return 0.0;
            }

            Eigen::MatrixXd corr = correlation_matrix(investments, assumptions_.default_correlation);

            // Mean over the strict upper triangle
            double total = 0.0;
            for (Eigen::Index i = 0; i < corr.rows(); ++i)
            {
                total += corr.row(i).tail(corr.cols() - i - 1).cwiseAbs().sum();
            }
            double pairs = static_cast<double>(n * (n - 1) / 2);
            return total / pairs;
        }

        // ===================================================================
        // Quality scores
        // ===================================================================

        double MetricsCalculator::fundamental_score(const std::vector<Investment> &investments)
        {
            double total = 0.0;
            int count = 0;
            for (const auto &inv : investments)
            {
                if (!inv.fundamentals)
                {
                    continue;
                }
                total += score_fundamentals(*inv.fundamentals);
                ++count;
            }
            return count > 0 ? total / count : 50.0;
        }

        double MetricsCalculator::technical_score(const std::vector<Investment> &investments)
        {
            double total = 0.0;
            int count = 0;
            for (const auto &inv : investments)
            {
                if (!inv.technical_indicators)
                {
                    continue;
                }
                total += score_technicals(*inv.technical_indicators, inv.current_price);
                ++count;
            }
            return count > 0 ? total / count : 50.0;
        }

        double MetricsCalculator::sentiment_score(const std::vector<Investment> &investments)
        {
            double total = 0.0;
            int count = 0;
            for (const auto &inv : investments)
            {
                if (!inv.sentiment_analysis)
                {
                    continue;
                }
                total += score_sentiment(*inv.sentiment_analysis);
                ++count;
            }
            return count > 0 ? total / count : 50.0;
        }

        // ===================================================================
        // Risk-adjusted
        // ===================================================================

        double MetricsCalculator::information_ratio(const std::vector<Investment> &investments) const
        {
            double tracking_error = average_volatility(investments) * assumptions_.tracking_error_factor;
            if (tracking_error == 0.0)
            {
                return 0.0;
            }

            double active = average_historical_return(investments, assumptions_.trading_days_per_year);
            return (active - assumptions_.benchmark_return) / tracking_error;
        }

        double MetricsCalculator::calmar_ratio(double expected_return, double max_drawdown)
        {
            if (max_drawdown == 0.0)
            {
                return 0.0;
            }
            return expected_return / max_drawdown;
        }

        double MetricsCalculator::sortino_ratio(const std::vector<Investment> &investments,
                                                double target_return) const
        {
            double downside = average_volatility(investments) * assumptions_.downside_deviation_factor;
            if (downside == 0.0)
            {
                return 0.0;
            }

            double historical = average_historical_return(investments, assumptions_.trading_days_per_year);
            return (historical - target_return) / downside;
        }

        // ===================================================================
        // Time and suitability
        // ===================================================================

        double MetricsCalculator::time_to_breakeven(double expected_return) const
        {
            if (expected_return <= 0.0)
            {
                return std::numeric_limits<double>::infinity();
            }
            return (assumptions_.transaction_cost / expected_return) * 365.0;
        }

        double MetricsCalculator::market_condition_suitability(const InvestmentIdea &idea)
        {
            double score = 50.0;

            switch (idea.strategy)
            {
            case Strategy::GROWTH:
                score += 10.0;
                break;
            case Strategy::VALUE:
                score += 5.0;
                break;
            case Strategy::MOMENTUM:
                score -= 5.0;
                break;
            default:
                break;
            }

            if (idea.risk_level == RiskLevel::HIGH || idea.risk_level == RiskLevel::VERY_HIGH)
            {
                score -= 10.0;
            }

            return clip_score(score);
        }

    } // namespace analytics
} // namespace prospect
