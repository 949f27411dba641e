/**
 * @file idea_loader.hpp
 * @brief JSON loading of investment ideas
 *
 * Ideas arrive from upstream collaborators as JSON documents with camelCase
 * keys, e.g.
 * @code{.json}
 * {
 *   "id": "idea-1",
 *   "title": "Semis rebound",
 *   "timeHorizon": "medium",
 *   "riskLevel": "moderate",
 *   "strategy": "growth",
 *   "confidenceScore": 0.7,
 *   "investments": [ { "id": "inv-1", "name": "Acme", "type": "stock", ... } ],
 *   "potentialOutcomes": [ { "scenario": "expected", "returnEstimate": 0.1, ... } ],
 *   "supportingData": [ { "source": "Reuters", "timestamp": "2024-01-02", "reliability": 0.9 } ]
 * }
 * @endcode
 */

#ifndef PROSPECT_DATA_IDEA_LOADER_HPP
#define PROSPECT_DATA_IDEA_LOADER_HPP

#include "model/investment.hpp"
#include "model/investment_idea.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace prospect
{
    namespace data
    {

        /**
         * @class IdeaLoader
         * @brief Static helpers to read ideas and configuration documents.
         */
        class IdeaLoader
        {
        public:
            /**
             * @brief Load and parse a JSON file.
             * @param filepath Path to JSON file
             * @return Parsed document
             * @throws std::runtime_error If the file cannot be opened or parsed
             */
            static nlohmann::json load_json(const std::string &filepath);

            /**
             * @brief Load an investment idea from a JSON file.
             * @throws std::runtime_error If the file cannot be opened or parsed
             * @throws std::invalid_argument If an enum name or timestamp is invalid
             */
            static InvestmentIdea load_idea(const std::string &filepath);

            /**
             * @brief Build an investment idea from a JSON object.
             *
             * Missing optional keys keep the struct defaults. A warning is
             * written to std::cerr when outcome probabilities do not sum to 1.
             *
             * @throws std::invalid_argument If an enum name or timestamp is invalid
             * @throws nlohmann::json::exception If a value has the wrong type
             */
            static InvestmentIdea idea_from_json(const nlohmann::json &j);

            /**
             * @brief Build one investment from a JSON object.
             */
            static Investment investment_from_json(const nlohmann::json &j);

            /**
             * @brief Build one price bar from a JSON object.
             */
            static PriceBar price_bar_from_json(const nlohmann::json &j);

            /**
             * @brief Build one analyst outcome from a JSON object.
             */
            static Outcome outcome_from_json(const nlohmann::json &j);

        private:
            static std::optional<double> optional_number(const nlohmann::json &j, const char *key);
        };

    } // namespace data
} // namespace prospect

#endif // PROSPECT_DATA_IDEA_LOADER_HPP
