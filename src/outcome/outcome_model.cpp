/**
 * @file outcome_model.cpp
 * @brief Serialization and reporting for ExpectedOutcomeModel.
 */

#include "outcome/outcome_model.hpp"

#include <iomanip>
#include <sstream>

namespace prospect
{
    namespace outcome
    {

        std::string to_string(MilestoneType type)
        {
            switch (type)
            {
            case MilestoneType::CATALYST:
                return "catalyst";
            case MilestoneType::RISK_EVENT:
                return "risk-event";
            case MilestoneType::DECISION_POINT:
                return "decision-point";
            case MilestoneType::MARKET_EVENT:
                return "market-event";
            }
            return "decision-point";
        }

        namespace
        {

            nlohmann::json scenario_to_json(const OutcomeScenario &s)
            {
                nlohmann::json j;
                j["probability"] = s.probability;
                j["expectedReturn"] = s.expected_return;
                j["timeToRealization"] = s.time_to_realization;
                j["keyAssumptions"] = s.key_assumptions;
                j["catalysts"] = s.catalysts;
                j["risks"] = s.risks;

                j["milestones"] = nlohmann::json::array();
                for (const auto &m : s.milestones)
                {
                    j["milestones"].push_back({{"date", format_timestamp(m.date)},
                                               {"description", m.description},
                                               {"probability", m.probability},
                                               {"impact", m.impact},
                                               {"type", to_string(m.type)}});
                }
                return j;
            }

            void print_scenario(std::ostringstream &oss, const char *label, const OutcomeScenario &s)
            {
                oss << "  " << std::left << std::setw(6) << label << std::right
                    << " p=" << std::setprecision(2) << s.probability
                    << "  return " << std::setw(7) << std::setprecision(2) << s.expected_return * 100.0 << "%"
                    << "  in " << std::setprecision(0) << s.time_to_realization << " days"
                    << "  (" << s.milestones.size() << " milestones)\n";
            }

        } // anonymous namespace

        nlohmann::json to_json(const MonteCarloResults &results)
        {
            nlohmann::json j;
            j["iterations"] = results.iterations;
            j["meanReturn"] = results.mean_return;
            j["standardDeviation"] = results.standard_deviation;

            nlohmann::json percentiles = nlohmann::json::object();
            for (const auto &entry : results.percentiles)
            {
                percentiles[std::to_string(entry.first)] = entry.second;
            }
            j["percentiles"] = percentiles;

            j["probabilityOfLoss"] = results.probability_of_loss;
            j["probabilityOfTarget"] = results.probability_of_target;
            j["expectedShortfall"] = results.expected_shortfall;
            return j;
        }

        nlohmann::json ExpectedOutcomeModel::to_json() const
        {
            nlohmann::json j;

            j["baseCase"] = scenario_to_json(base_case);
            j["bullCase"] = scenario_to_json(bull_case);
            j["bearCase"] = scenario_to_json(bear_case);
            j["probabilityWeightedReturn"] = probability_weighted_return;

            j["confidenceInterval"] = {{"level", confidence_interval.level},
                                       {"lowerBound", confidence_interval.lower_bound},
                                       {"upperBound", confidence_interval.upper_bound},
                                       {"standardError", confidence_interval.standard_error}};

            nlohmann::json variables = nlohmann::json::array();
            for (const auto &v : sensitivity_analysis.variables)
            {
                variables.push_back({{"name", v.name},
                                     {"baseValue", v.base_value},
                                     {"impact", v.impact},
                                     {"elasticity", v.elasticity},
                                     {"range", {{"min", v.range_min}, {"max", v.range_max}}}});
            }

            const auto &corr = sensitivity_analysis.correlation_matrix;
            nlohmann::json matrix = nlohmann::json::array();
            for (int r = 0; r < corr.rows(); ++r)
            {
                std::vector<double> row(corr.cols());
                for (int c = 0; c < corr.cols(); ++c)
                {
                    row[c] = corr(r, c);
                }
                matrix.push_back(row);
            }

            j["sensitivityAnalysis"] = {{"variables", variables},
                                        {"correlationMatrix", matrix},
                                        {"keyDrivers", sensitivity_analysis.key_drivers}};

            j["monteCarloResults"] = outcome::to_json(monte_carlo_results);

            j["timeSeriesProjection"] = nlohmann::json::array();
            for (const auto &p : time_series_projection)
            {
                j["timeSeriesProjection"].push_back(
                    {{"date", format_timestamp(p.date)},
                     {"expectedValue", p.expected_value},
                     {"confidenceBands", {{"upper95", p.confidence_bands.upper95},
                                          {"upper68", p.confidence_bands.upper68},
                                          {"lower68", p.confidence_bands.lower68},
                                          {"lower95", p.confidence_bands.lower95}}},
                     {"cumulativeReturn", p.cumulative_return}});
            }

            return j;
        }

        std::string ExpectedOutcomeModel::summary() const
        {
            std::ostringstream oss;
            oss << std::fixed;

            oss << "Expected Outcomes\n";
            oss << "=================\n";
            oss << "\n";

            oss << "Scenarios:\n";
            print_scenario(oss, "Base", base_case);
            print_scenario(oss, "Bull", bull_case);
            print_scenario(oss, "Bear", bear_case);
            oss << "  Weighted Return:     " << std::setprecision(2) << probability_weighted_return * 100.0 << "%\n";
            oss << "  95% CI:              [" << std::setprecision(2) << confidence_interval.lower_bound * 100.0
                << "%, " << confidence_interval.upper_bound * 100.0 << "%]\n";
            oss << "\n";

            const auto &mc = monte_carlo_results;
            oss << "Monte Carlo (" << mc.iterations << " samples):\n";
            oss << "  Mean Return:         " << std::setprecision(2) << mc.mean_return * 100.0 << "%\n";
            oss << "  Std Deviation:       " << std::setprecision(2) << mc.standard_deviation * 100.0 << "%\n";
            oss << "  P(loss):             " << std::setprecision(2) << mc.probability_of_loss * 100.0 << "%\n";
            oss << "  P(target):           " << std::setprecision(2) << mc.probability_of_target * 100.0 << "%\n";
            oss << "  Expected Shortfall:  " << std::setprecision(2) << mc.expected_shortfall * 100.0 << "%\n";
            for (const auto &entry : mc.percentiles)
            {
                oss << "    p" << std::left << std::setw(3) << entry.first << std::right
                    << std::setw(10) << std::setprecision(2) << entry.second * 100.0 << "%\n";
            }
            oss << "\n";

            oss << "Projection:            " << time_series_projection.size() << " daily steps";
            if (!time_series_projection.empty())
            {
                const auto &last = time_series_projection.back();
                oss << ", final " << std::setprecision(2) << last.expected_value * 100.0 << "% ["
                    << last.confidence_bands.lower95 * 100.0 << "%, "
                    << last.confidence_bands.upper95 * 100.0 << "%]";
            }
            oss << "\n";

            return oss.str();
        }

    } // namespace outcome
} // namespace prospect
