/**
 * @file engine_assumptions.hpp
 * @brief Tunable market assumptions shared by all analytics engines.
 *
 * Every constant that enters the metric, risk and outcome formulas lives
 * here rather than as a literal in the formulas, so tests and callers can
 * override them.
 *
 * Example configuration:
 * @code{.json}
 * {
 *   "assumptions": {
 *     "risk_free_rate": 0.02,
 *     "benchmark_return": 0.08,
 *     "monte_carlo_iterations": 10000,
 *     "random_seed": 42
 *   }
 * }
 * @endcode
 */

#ifndef PROSPECT_CONFIG_ENGINE_ASSUMPTIONS_HPP
#define PROSPECT_CONFIG_ENGINE_ASSUMPTIONS_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace prospect
{
    namespace config
    {

        /**
         * @struct EngineAssumptions
         * @brief Fixed-rate assumptions and thresholds used by the engines.
         *
         * Unused fields are ignored by engines that do not need them.
         */
        struct EngineAssumptions
        {
            /// Annualized risk-free rate used by the Sharpe ratio.
            double risk_free_rate = 0.02;

            /// Annualized benchmark return used by the information ratio.
            double benchmark_return = 0.08;

            /// Round-trip transaction cost as a fraction, used by time-to-breakeven.
            double transaction_cost = 0.01;

            /// Trading days per year for annualization.
            int trading_days_per_year = 252;

            /// Number of Monte Carlo samples.
            int monte_carlo_iterations = 10000;

            /// Return threshold for Monte Carlo probability-of-target.
            double target_return = 0.10;

            /// Tail probability used for the reported Value at Risk.
            double var_confidence_level = 0.05;

            /// Average daily volume below which a position is considered illiquid.
            double liquidity_volume_threshold = 100000.0;

            /// Number of trailing bars averaged for liquidity classification.
            int liquidity_window = 30;

            /// Correlation assumed for a pair with no upstream estimate.
            double default_correlation = 0.5;

            /// Tracking error approximated as this fraction of volatility.
            double tracking_error_factor = 0.5;

            /// Downside deviation approximated as this fraction of volatility.
            double downside_deviation_factor = 0.7;

            /**
             * @brief Seed for the Monte Carlo generator.
             *
             * When unset, engines that create their own generator seed it
             * from std::random_device.
             */
            std::optional<std::uint64_t> random_seed;

            /**
             * @brief Check value ranges.
             * @throws std::invalid_argument If any value is out of range.
             */
            void validate() const;

            /**
             * @brief Create assumptions from JSON.
             * @param j JSON object; missing keys keep their defaults.
             * @return Validated assumptions.
             * @throws std::invalid_argument If a value is out of range.
             * @throws nlohmann::json::exception If a value has the wrong type.
             *
             * Unknown keys are reported on std::cerr and otherwise ignored.
             */
            static EngineAssumptions from_json(const nlohmann::json &j);

            /**
             * @brief Load assumptions from a JSON file.
             * @param config_path Path to a JSON document. Values are read from its
             *        "assumptions" object when present, else from the root object.
             * @throws std::runtime_error If the file cannot be read or parsed.
             */
            static EngineAssumptions load_from_file(const std::string &config_path);

            /**
             * @brief Convert assumptions to JSON.
             */
            nlohmann::json to_json() const;
        };

    } // namespace config
} // namespace prospect

#endif // PROSPECT_CONFIG_ENGINE_ASSUMPTIONS_HPP
