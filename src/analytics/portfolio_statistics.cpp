/**
 * @file portfolio_statistics.cpp
 * @brief Implementation of the shared equal-weight statistics.
 */

#include "analytics/portfolio_statistics.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <numeric>
#include <set>

namespace prospect
{
    namespace analytics
    {

        double annualized_historical_return(const Investment &investment, int trading_days_per_year)
        {
            const auto &bars = investment.historical_performance;
            if (bars.size() < 2)
            {
                return 0.0;
            }

            double first_price = bars.front().adjusted_close;
            double last_price = bars.back().adjusted_close;
            if (first_price <= 0.0)
            {
                return 0.0;
            }

            double periods = static_cast<double>(bars.size());
            double annualized = std::pow(last_price / first_price,
                                         static_cast<double>(trading_days_per_year) / periods) -
                                1.0;
            return std::isfinite(annualized) ? annualized : 0.0;
        }

        double average_historical_return(const std::vector<Investment> &investments,
                                         int trading_days_per_year)
        {
            if (investments.empty())
            {
                return 0.0;
            }

            double sum = 0.0;
            for (const auto &inv : investments)
            {
                sum += annualized_historical_return(inv, trading_days_per_year);
            }
            return sum / static_cast<double>(investments.size());
        }

        double probability_weighted_return(const std::vector<Outcome> &outcomes)
        {
            return std::accumulate(outcomes.begin(), outcomes.end(), 0.0,
                                   [](double sum, const Outcome &o)
                                   { return sum + o.return_estimate * o.probability; });
        }

        double expected_return(const InvestmentIdea &idea, int trading_days_per_year)
        {
            if (idea.potential_outcomes.empty())
            {
                return average_historical_return(idea.investments, trading_days_per_year);
            }
            return probability_weighted_return(idea.potential_outcomes);
        }

        double average_volatility(const std::vector<Investment> &investments)
        {
            if (investments.empty())
            {
                return 0.0;
            }

            double total = 0.0;
            for (const auto &inv : investments)
            {
                total += inv.risk_metrics ? inv.risk_metrics->volatility : 0.0;
            }
            return total / static_cast<double>(investments.size());
        }

        double average_beta(const std::vector<Investment> &investments)
        {
            if (investments.empty())
            {
                return 1.0;
            }

            double total = 0.0;
            for (const auto &inv : investments)
            {
                total += (inv.risk_metrics && inv.risk_metrics->beta) ? *inv.risk_metrics->beta : 1.0;
            }
            return total / static_cast<double>(investments.size());
        }

        double concentration_hhi(const std::vector<Investment> &investments)
        {
            if (investments.empty())
            {
                return 1.0;
            }

            // Equal weights: sum of (1/n)^2 over n positions
            const double weight = 1.0 / static_cast<double>(investments.size());
            double hhi = 0.0;
            for (std::size_t i = 0; i < investments.size(); ++i)
            {
                hhi += weight * weight;
            }
            return hhi;
        }

        Eigen::MatrixXd correlation_matrix(const std::vector<Investment> &investments,
                                           double default_correlation)
        {
            const int n = static_cast<int>(investments.size());
            Eigen::MatrixXd correlation = Eigen::MatrixXd::Identity(n, n);

            for (int i = 0; i < n; ++i)
            {
                for (int j = i + 1; j < n; ++j)
                {
                    double value = default_correlation;
                    const auto &metrics = investments[i].risk_metrics;
                    if (metrics)
                    {
                        auto it = metrics->correlations.find(investments[j].id);
                        if (it != metrics->correlations.end())
                        {
                            value = it->second;
                        }
                    }
                    correlation(i, j) = value;
                    correlation(j, i) = value;
                }
            }

            return correlation;
        }

        std::vector<std::string> distinct_sectors(const std::vector<Investment> &investments)
        {
            std::vector<std::string> sectors;
            for (const auto &inv : investments)
            {
                if (inv.sector.empty())
                {
                    continue;
                }
                if (std::find(sectors.begin(), sectors.end(), inv.sector) == sectors.end())
                {
                    sectors.push_back(inv.sector);
                }
            }
            return sectors;
        }

        std::size_t distinct_asset_types(const std::vector<Investment> &investments)
        {
            std::set<AssetType> types;
            for (const auto &inv : investments)
            {
                types.insert(inv.type);
            }
            return types.size();
        }

        double trailing_average_volume(const Investment &investment, int window)
        {
            if (window <= 0)
            {
                return 0.0;
            }

            const auto &bars = investment.historical_performance;
            std::size_t start = bars.size() > static_cast<std::size_t>(window)
                                    ? bars.size() - static_cast<std::size_t>(window)
                                    : 0;

            double total = 0.0;
            for (std::size_t i = start; i < bars.size(); ++i)
            {
                total += bars[i].volume;
            }
            return total / static_cast<double>(window);
        }

        int holding_period_days(TimeHorizon horizon)
        {
            switch (horizon)
            {
            case TimeHorizon::INTRADAY:
                return 1;
            case TimeHorizon::SHORT:
                return 90;
            case TimeHorizon::MEDIUM:
                return 365;
            case TimeHorizon::LONG:
                return 1095;
            case TimeHorizon::VERY_LONG:
                return 1825;
            }
            return 365;
        }

        double recency_score(Timestamp timestamp, Timestamp as_of)
        {
            double age_in_days = days_between(timestamp, as_of);

            if (age_in_days <= 1.0)
                return 1.0;
            if (age_in_days <= 7.0)
                return 0.9;
            if (age_in_days <= 30.0)
                return 0.7;
            if (age_in_days <= 90.0)
                return 0.5;
            if (age_in_days <= 365.0)
                return 0.3;
            return 0.1;
        }

        double source_quality(const std::string &source)
        {
            static const std::array<const char *, 5> high_quality = {
                "bloomberg", "reuters", "sec", "fed", "treasury"};
            static const std::array<const char *, 4> medium_quality = {
                "yahoo", "google", "marketwatch", "cnbc"};

            std::string lower = source;
            std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c)
                           { return std::tolower(c); });

            auto matches = [&lower](const char *name)
            { return lower.find(name) != std::string::npos; };

            if (std::any_of(high_quality.begin(), high_quality.end(), matches))
            {
                return 0.9;
            }
            if (std::any_of(medium_quality.begin(), medium_quality.end(), matches))
            {
                return 0.7;
            }
            return 0.5;
        }

        double data_quality_score(const std::vector<DataPoint> &supporting_data, Timestamp as_of)
        {
            if (supporting_data.empty())
            {
                return 30.0;
            }

            double quality_score = 0.0;
            for (const auto &point : supporting_data)
            {
                double recency = recency_score(point.timestamp, as_of);
                double quality = source_quality(point.source);
                quality_score += (point.reliability * 0.4 + recency * 0.3 + quality * 0.3) * 100.0;
            }
            return quality_score / static_cast<double>(supporting_data.size());
        }

    } // namespace analytics
} // namespace prospect
