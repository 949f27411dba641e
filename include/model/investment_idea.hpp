/**
 * @file investment_idea.hpp
 * @brief The unit of analysis: a basket of investments plus narrative metadata.
 */

#ifndef PROSPECT_MODEL_INVESTMENT_IDEA_HPP
#define PROSPECT_MODEL_INVESTMENT_IDEA_HPP

#include "model/investment.hpp"
#include "model/types.hpp"

#include <string>
#include <vector>

namespace prospect
{

    /**
     * @struct Outcome
     * @brief Analyst estimate of one potential outcome.
     */
    struct Outcome
    {
        OutcomeCase scenario = OutcomeCase::EXPECTED;
        double return_estimate = 0.0;
        double probability = 0.0;
        double time_to_realization = 0.0; ///< Days
        std::string description;
        std::vector<std::string> catalysts;
        std::vector<std::string> key_risks;
    };

    /**
     * @struct DataPoint
     * @brief Provenance of one piece of supporting evidence.
     */
    struct DataPoint
    {
        std::string source;
        Timestamp timestamp;
        double reliability = 0.5; ///< In [0, 1]
    };

    /**
     * @struct InvestmentIdea
     * @brief Candidate idea handed to the analytics engines.
     *
     * The portfolio is implicitly equal-weighted: there is no position size.
     */
    struct InvestmentIdea
    {
        std::string id;
        std::string title;
        std::vector<Investment> investments;
        std::vector<Outcome> potential_outcomes;
        TimeHorizon time_horizon = TimeHorizon::MEDIUM;
        RiskLevel risk_level = RiskLevel::MODERATE;
        Strategy strategy = Strategy::BUY;
        double confidence_score = 0.0;
        std::vector<DataPoint> supporting_data;
    };

} // namespace prospect

#endif // PROSPECT_MODEL_INVESTMENT_IDEA_HPP
