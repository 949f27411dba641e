/**
 * @file key_metrics.cpp
 * @brief Serialization and reporting for KeyMetrics.
 */

#include "analytics/key_metrics.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace prospect
{
    namespace analytics
    {

        nlohmann::json KeyMetrics::to_json() const
        {
            nlohmann::json j;

            j["expectedReturn"] = expected_return;
            j["volatility"] = volatility;
            j["sharpeRatio"] = sharpe_ratio;
            j["maxDrawdown"] = max_drawdown;
            j["valueAtRisk"] = value_at_risk;

            j["diversificationRatio"] = diversification_ratio;
            j["correlationScore"] = correlation_score;
            j["concentrationRisk"] = concentration_risk;

            j["fundamentalScore"] = fundamental_score;
            j["technicalScore"] = technical_score;
            j["sentimentScore"] = sentiment_score;

            j["informationRatio"] = information_ratio;
            j["calmarRatio"] = calmar_ratio;
            j["sortinoRatio"] = sortino_ratio;

            if (std::isfinite(time_to_breakeven))
            {
                j["timeToBreakeven"] = time_to_breakeven;
            }
            else
            {
                j["timeToBreakeven"] = nullptr;
            }
            j["optimalHoldingPeriod"] = optimal_holding_period;

            j["dataQuality"] = data_quality;
            j["modelConfidence"] = model_confidence;
            j["marketConditionSuitability"] = market_condition_suitability;

            return j;
        }

        std::string KeyMetrics::summary() const
        {
            std::ostringstream oss;
            oss << std::fixed;

            oss << "Key Metrics\n";
            oss << "===========\n";
            oss << "\n";

            oss << "Return / Risk:\n";
            oss << "  Expected Return:     " << std::setprecision(2) << expected_return * 100.0 << "%\n";
            oss << "  Volatility:          " << std::setprecision(2) << volatility * 100.0 << "%\n";
            oss << "  Max Drawdown:        " << std::setprecision(2) << max_drawdown * 100.0 << "%\n";
            oss << "  VaR (95%):           " << std::setprecision(2) << value_at_risk * 100.0 << "%\n";
            oss << "\n";

            oss << "Risk-Adjusted:\n";
            oss << "  Sharpe Ratio:        " << std::setprecision(4) << sharpe_ratio << "\n";
            oss << "  Sortino Ratio:       " << std::setprecision(4) << sortino_ratio << "\n";
            oss << "  Calmar Ratio:        " << std::setprecision(4) << calmar_ratio << "\n";
            oss << "  Information Ratio:   " << std::setprecision(4) << information_ratio << "\n";
            oss << "\n";

            oss << "Portfolio Construction:\n";
            oss << "  Diversification:     " << std::setprecision(4) << diversification_ratio << "\n";
            oss << "  Correlation Score:   " << std::setprecision(4) << correlation_score << "\n";
            oss << "  Concentration (HHI): " << std::setprecision(4) << concentration_risk << "\n";
            oss << "\n";

            oss << "Scores (0-100):\n";
            oss << "  Fundamental:         " << std::setprecision(1) << fundamental_score << "\n";
            oss << "  Technical:           " << std::setprecision(1) << technical_score << "\n";
            oss << "  Sentiment:           " << std::setprecision(1) << sentiment_score << "\n";
            oss << "  Data Quality:        " << std::setprecision(1) << data_quality << "\n";
            oss << "  Market Suitability:  " << std::setprecision(1) << market_condition_suitability << "\n";
            oss << "  Model Confidence:    " << std::setprecision(2) << model_confidence << "\n";
            oss << "\n";

            oss << "Timing:\n";
            oss << "  Time to Breakeven:   ";
            if (std::isfinite(time_to_breakeven))
            {
                oss << std::setprecision(1) << time_to_breakeven << " days\n";
            }
            else
            {
                oss << "never\n";
            }
            oss << "  Holding Period:      " << optimal_holding_period << " days\n";

            return oss.str();
        }

    } // namespace analytics
} // namespace prospect
