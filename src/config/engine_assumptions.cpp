/**
 * @file engine_assumptions.cpp
 * @brief Implementation of EngineAssumptions parsing and validation.
 */

#include "config/engine_assumptions.hpp"
#include "data/idea_loader.hpp"

#include <iostream>
#include <set>
#include <stdexcept>

namespace prospect
{
    namespace config
    {

        void EngineAssumptions::validate() const
        {
            if (trading_days_per_year <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'trading_days_per_year', got: " + std::to_string(trading_days_per_year));
            }
            if (monte_carlo_iterations < 0)
            {
                throw std::invalid_argument(
                    "Expected non-negative value for parameter 'monte_carlo_iterations', got: " + std::to_string(monte_carlo_iterations));
            }
            if (liquidity_window <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'liquidity_window', got: " + std::to_string(liquidity_window));
            }
            if (liquidity_volume_threshold < 0.0)
            {
                throw std::invalid_argument(
                    "Expected non-negative value for parameter 'liquidity_volume_threshold', got: " + std::to_string(liquidity_volume_threshold));
            }
            if (default_correlation < -1.0 || default_correlation > 1.0)
            {
                throw std::invalid_argument(
                    "Parameter 'default_correlation' must be in [-1, 1], got: " + std::to_string(default_correlation));
            }
            if (var_confidence_level <= 0.0 || var_confidence_level >= 1.0)
            {
                throw std::invalid_argument(
                    "Parameter 'var_confidence_level' must be in (0, 1), got: " + std::to_string(var_confidence_level));
            }
            if (tracking_error_factor < 0.0 || downside_deviation_factor < 0.0)
            {
                throw std::invalid_argument("Volatility approximation factors must be non-negative");
            }
        }

        EngineAssumptions EngineAssumptions::from_json(const nlohmann::json &doc)
        {
            static const std::set<std::string> known_keys = {
                "risk_free_rate", "benchmark_return", "transaction_cost",
                "trading_days_per_year", "monte_carlo_iterations", "target_return",
                "var_confidence_level", "liquidity_volume_threshold", "liquidity_window",
                "default_correlation", "tracking_error_factor", "downside_deviation_factor",
                "random_seed"};

            if (!doc.is_object())
            {
                throw std::invalid_argument("Assumptions configuration must be a JSON object");
            }

            for (const auto &item : doc.items())
            {
                if (known_keys.count(item.key()) == 0)
                {
                    std::cerr << "Warning: Unknown assumption key ignored: " << item.key() << std::endl;
                }
            }

            EngineAssumptions config;

            config.risk_free_rate = doc.value("risk_free_rate", config.risk_free_rate);
            config.benchmark_return = doc.value("benchmark_return", config.benchmark_return);
            config.transaction_cost = doc.value("transaction_cost", config.transaction_cost);
            config.trading_days_per_year = doc.value("trading_days_per_year", config.trading_days_per_year);
            config.monte_carlo_iterations = doc.value("monte_carlo_iterations", config.monte_carlo_iterations);
            config.target_return = doc.value("target_return", config.target_return);
            config.var_confidence_level = doc.value("var_confidence_level", config.var_confidence_level);
            config.liquidity_volume_threshold = doc.value("liquidity_volume_threshold", config.liquidity_volume_threshold);
            config.liquidity_window = doc.value("liquidity_window", config.liquidity_window);
            config.default_correlation = doc.value("default_correlation", config.default_correlation);
            config.tracking_error_factor = doc.value("tracking_error_factor", config.tracking_error_factor);
            config.downside_deviation_factor = doc.value("downside_deviation_factor", config.downside_deviation_factor);

            if (doc.contains("random_seed") && !doc["random_seed"].is_null())
            {
                config.random_seed = doc["random_seed"].get<std::uint64_t>();
            }

            config.validate();
            return config;
        }

        EngineAssumptions EngineAssumptions::load_from_file(const std::string &config_path)
        {
            auto j = data::IdeaLoader::load_json(config_path);

            if (j.contains("assumptions"))
            {
                return from_json(j["assumptions"]);
            }
            return from_json(j);
        }

        nlohmann::json EngineAssumptions::to_json() const
        {
            nlohmann::json j{
                {"risk_free_rate", risk_free_rate},
                {"benchmark_return", benchmark_return},
                {"transaction_cost", transaction_cost},
                {"trading_days_per_year", trading_days_per_year},
                {"monte_carlo_iterations", monte_carlo_iterations},
                {"target_return", target_return},
                {"var_confidence_level", var_confidence_level},
                {"liquidity_volume_threshold", liquidity_volume_threshold},
                {"liquidity_window", liquidity_window},
                {"default_correlation", default_correlation},
                {"tracking_error_factor", tracking_error_factor},
                {"downside_deviation_factor", downside_deviation_factor}};

            if (random_seed)
            {
                j["random_seed"] = *random_seed;
            }
            else
            {
                j["random_seed"] = nullptr;
            }
            return j;
        }

    } // namespace config
} // namespace prospect
