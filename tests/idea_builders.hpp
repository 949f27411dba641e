/**
 * @file idea_builders.hpp
 * @brief Small constructors for test ideas and investments.
 */

#ifndef PROSPECT_TESTS_IDEA_BUILDERS_HPP
#define PROSPECT_TESTS_IDEA_BUILDERS_HPP

#include "model/investment_idea.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace prospect
{
    namespace testing
    {

        /// Fixed analysis time so recency buckets are deterministic.
        inline Timestamp fixed_now()
        {
            return parse_timestamp("2024-06-30T00:00:00Z");
        }

        /// Bars interpolating linearly from first to last adjusted close.
        inline std::vector<PriceBar> linear_bars(double first, double last, int count, double volume = 1.0e6)
        {
            std::vector<PriceBar> bars;
            Timestamp start = parse_timestamp("2023-01-02");
            for (int i = 0; i < count; ++i)
            {
                double t = count > 1 ? static_cast<double>(i) / (count - 1) : 0.0;
                double price = first + (last - first) * t;

                PriceBar bar;
                bar.date = add_days(start, i);
                bar.open = price;
                bar.high = price;
                bar.low = price;
                bar.close = price;
                bar.adjusted_close = price;
                bar.volume = volume;
                bars.push_back(bar);
            }
            return bars;
        }

        inline Investment make_investment(const std::string &id,
                                          const std::string &sector = "",
                                          AssetType type = AssetType::STOCK,
                                          double volatility = 0.2,
                                          std::optional<double> beta = std::nullopt)
        {
            Investment inv;
            inv.id = id;
            inv.name = "Name " + id;
            inv.ticker = id;
            inv.sector = sector;
            inv.type = type;
            inv.current_price = 100.0;

            InvestmentRiskMetrics metrics;
            metrics.volatility = volatility;
            metrics.beta = beta;
            inv.risk_metrics = metrics;
            return inv;
        }

        inline Outcome make_outcome(OutcomeCase scenario, double return_estimate, double probability,
                                    double time_to_realization = 180.0)
        {
            Outcome o;
            o.scenario = scenario;
            o.return_estimate = return_estimate;
            o.probability = probability;
            o.time_to_realization = time_to_realization;
            o.description = to_string(scenario) + " case";
            return o;
        }

        inline InvestmentIdea make_idea(std::vector<Investment> investments,
                                        Strategy strategy = Strategy::BUY,
                                        TimeHorizon horizon = TimeHorizon::MEDIUM)
        {
            InvestmentIdea idea;
            idea.id = "idea-test";
            idea.title = "Test idea";
            idea.investments = std::move(investments);
            idea.strategy = strategy;
            idea.time_horizon = horizon;
            idea.confidence_score = 0.75;
            return idea;
        }

    } // namespace testing
} // namespace prospect

#endif // PROSPECT_TESTS_IDEA_BUILDERS_HPP
