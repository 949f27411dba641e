/**
 * @file supporting_analysis.cpp
 * @brief Implementation of SupportingAnalysisService.
 */

#include "analytics/supporting_analysis.hpp"
#include "analytics/metrics_calculator.hpp"
#include "outcome/outcome_modeler.hpp"
#include "risk/risk_assessor.hpp"

#include <future>
#include <iostream>
#include <utility>

namespace prospect
{
    namespace analytics
    {

        nlohmann::json SupportingAnalysis::to_json() const
        {
            nlohmann::json j;
            j["keyMetrics"] = key_metrics.to_json();
            j["riskAssessment"] = risk_assessment.to_json();
            j["expectedOutcomes"] = expected_outcomes.to_json();
            return j;
        }

        std::string SupportingAnalysis::summary() const
        {
            return key_metrics.summary() + "\n" + risk_assessment.summary() + "\n" + expected_outcomes.summary();
        }

        SupportingAnalysisService::SupportingAnalysisService(config::EngineAssumptions assumptions)
            : assumptions_(std::move(assumptions))
        {
            assumptions_.validate();
        }

        SupportingAnalysis SupportingAnalysisService::analyze(const InvestmentIdea &idea, Timestamp as_of) const
        {
            // Engines are built up front so invalid assumptions throw here, not inside a task
            const MetricsCalculator calculator(assumptions_);
            const risk::RiskAssessor assessor(assumptions_);
            const outcome::OutcomeModeler modeler(assumptions_);

            auto metrics_future = std::async(std::launch::async, [&]()
                                             { return calculator.calculate_key_metrics(idea, as_of); });

            auto risk_future = std::async(std::launch::async, [&]()
                                          { return assessor.assess_risk(idea, as_of); });

            auto outcome_future = std::async(std::launch::async, [&]()
                                             { return modeler.model_expected_outcomes(idea, as_of); });

            SupportingAnalysis analysis;
            analysis.key_metrics = metrics_future.get();
            analysis.risk_assessment = risk_future.get();
            analysis.expected_outcomes = outcome_future.get();
            return analysis;
        }

        void SupportingAnalysisService::print_summary(const SupportingAnalysis &analysis)
        {
            std::cout << analysis.summary() << std::endl;
        }

    } // namespace analytics
} // namespace prospect
