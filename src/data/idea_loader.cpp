/**
 * @file idea_loader.cpp
 * @brief Implementation of IdeaLoader
 */

#include "data/idea_loader.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace prospect
{
    namespace data
    {

        nlohmann::json IdeaLoader::load_json(const std::string &filepath)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open JSON file: " + filepath);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
            }

            file.close();
            return j;
        }

        InvestmentIdea IdeaLoader::load_idea(const std::string &filepath)
        {
            auto j = load_json(filepath);

            if (j.contains("idea"))
            {
                return idea_from_json(j["idea"]);
            }
            return idea_from_json(j);
        }

        std::optional<double> IdeaLoader::optional_number(const nlohmann::json &j, const char *key)
        {
            if (!j.contains(key) || j[key].is_null())
            {
                return std::nullopt;
            }
            return j[key].get<double>();
        }

        // =============================================
        // Investments
        // =============================================

        PriceBar IdeaLoader::price_bar_from_json(const nlohmann::json &j)
        {
            PriceBar bar;
            bar.date = parse_timestamp(j.at("date").get<std::string>());
            bar.open = j.value("open", 0.0);
            bar.high = j.value("high", 0.0);
            bar.low = j.value("low", 0.0);
            bar.close = j.value("close", 0.0);
            // Feeds without adjustment data carry only the raw close
            bar.adjusted_close = j.value("adjustedClose", bar.close);
            bar.volume = j.value("volume", 0.0);
            return bar;
        }

        Investment IdeaLoader::investment_from_json(const nlohmann::json &j)
        {
            Investment inv;
            inv.id = j.at("id").get<std::string>();
            inv.name = j.value("name", inv.id);
            inv.ticker = j.value("ticker", "");
            if (j.contains("sector") && !j["sector"].is_null())
            {
                inv.sector = j["sector"].get<std::string>();
            }
            inv.type = parse_asset_type(j.value("type", "stock"));
            inv.current_price = j.value("currentPrice", 0.0);

            if (j.contains("historicalPerformance"))
            {
                for (const auto &bar : j["historicalPerformance"])
                {
                    inv.historical_performance.push_back(price_bar_from_json(bar));
                }
            }

            if (j.contains("fundamentals") && j["fundamentals"].is_object())
            {
                const auto &f = j["fundamentals"];
                Fundamentals fundamentals;
                fundamentals.pe_ratio = optional_number(f, "peRatio");
                fundamentals.profit_margin = optional_number(f, "profitMargin");
                fundamentals.return_on_equity = optional_number(f, "returnOnEquity");
                fundamentals.debt_to_equity = optional_number(f, "debtToEquity");
                inv.fundamentals = fundamentals;
            }

            if (j.contains("technicalIndicators") && j["technicalIndicators"].is_object())
            {
                const auto &t = j["technicalIndicators"];
                TechnicalIndicators indicators;
                indicators.relative_strength_index = optional_number(t, "relativeStrengthIndex");
                if (t.contains("movingAverages") && t["movingAverages"].is_object())
                {
                    MovingAverages ma;
                    ma.ma50 = t["movingAverages"].value("ma50", 0.0);
                    ma.ma200 = t["movingAverages"].value("ma200", 0.0);
                    indicators.moving_averages = ma;
                }
                indicators.macd_line = optional_number(t, "macdLine");
                indicators.macd_signal = optional_number(t, "macdSignal");
                inv.technical_indicators = indicators;
            }

            if (j.contains("sentimentAnalysis") && j["sentimentAnalysis"].is_object())
            {
                const auto &s = j["sentimentAnalysis"];
                SentimentAnalysis sentiment;
                sentiment.overall_sentiment = parse_sentiment(s.value("overallSentiment", "neutral"));
                sentiment.sentiment_trend = parse_sentiment_trend(s.value("sentimentTrend", "stable"));
                if (s.contains("analystRecommendations") && s["analystRecommendations"].is_object())
                {
                    const auto &r = s["analystRecommendations"];
                    AnalystRecommendations recommendations;
                    recommendations.buy = r.value("buy", 0);
                    recommendations.hold = r.value("hold", 0);
                    recommendations.sell = r.value("sell", 0);
                    sentiment.analyst_recommendations = recommendations;
                }
                inv.sentiment_analysis = sentiment;
            }

            if (j.contains("riskMetrics") && j["riskMetrics"].is_object())
            {
                const auto &r = j["riskMetrics"];
                InvestmentRiskMetrics metrics;
                metrics.volatility = r.value("volatility", 0.0);
                metrics.beta = optional_number(r, "beta");
                if (r.contains("correlations") && r["correlations"].is_object())
                {
                    for (const auto &item : r["correlations"].items())
                    {
                        metrics.correlations[item.key()] = item.value().get<double>();
                    }
                }
                inv.risk_metrics = metrics;
            }

            return inv;
        }

        // =============================================
        // Ideas
        // =============================================

        Outcome IdeaLoader::outcome_from_json(const nlohmann::json &j)
        {
            Outcome outcome;
            outcome.scenario = parse_outcome_case(j.at("scenario").get<std::string>());
            outcome.return_estimate = j.value("returnEstimate", 0.0);
            outcome.probability = j.value("probability", 0.0);
            outcome.time_to_realization = j.value("timeToRealization", 0.0);
            outcome.description = j.value("description", "");
            outcome.catalysts = j.value("catalysts", std::vector<std::string>{});
            outcome.key_risks = j.value("keyRisks", std::vector<std::string>{});
            return outcome;
        }

        InvestmentIdea IdeaLoader::idea_from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw std::invalid_argument("Investment idea must be a JSON object");
            }

            InvestmentIdea idea;
            idea.id = j.value("id", "");
            idea.title = j.value("title", "");
            idea.time_horizon = parse_time_horizon(j.value("timeHorizon", "medium"));
            idea.risk_level = parse_risk_level(j.value("riskLevel", "moderate"));
            idea.strategy = parse_strategy(j.value("strategy", "buy"));
            idea.confidence_score = j.value("confidenceScore", 0.0);

            if (j.contains("investments"))
            {
                for (const auto &inv : j["investments"])
                {
                    idea.investments.push_back(investment_from_json(inv));
                }
            }

            if (j.contains("potentialOutcomes"))
            {
                double total_probability = 0.0;
                for (const auto &o : j["potentialOutcomes"])
                {
                    idea.potential_outcomes.push_back(outcome_from_json(o));
                    total_probability += idea.potential_outcomes.back().probability;
                }

                if (!idea.potential_outcomes.empty() && std::abs(total_probability - 1.0) > 1e-6)
                {
                    std::cerr << "Warning: Outcome probabilities for idea '" << idea.id
                              << "' sum to " << total_probability << ", not 1" << std::endl;
                }
            }

            if (j.contains("supportingData"))
            {
                for (const auto &d : j["supportingData"])
                {
                    DataPoint point;
                    point.source = d.value("source", "");
                    point.timestamp = parse_timestamp(d.at("timestamp").get<std::string>());
                    point.reliability = d.value("reliability", 0.5);
                    idea.supporting_data.push_back(point);
                }
            }

            return idea;
        }

    } // namespace data
} // namespace prospect
