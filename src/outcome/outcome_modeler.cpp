/**
 * @file outcome_modeler.cpp
 * @brief Implementation of OutcomeModeler.
 */

#include "outcome/outcome_modeler.hpp"
#include "analytics/portfolio_statistics.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <utility>

namespace prospect
{
    namespace outcome
    {

        namespace
        {

            const Outcome *find_outcome(const InvestmentIdea &idea, OutcomeCase which)
            {
                auto it = std::find_if(idea.potential_outcomes.begin(), idea.potential_outcomes.end(),
                                       [which](const Outcome &o)
                                       { return o.scenario == which; });
                return it == idea.potential_outcomes.end() ? nullptr : &*it;
            }

            double pick(ScenarioCase which, double base, double bull, double bear)
            {
                switch (which)
                {
                case ScenarioCase::BASE:
                    return base;
                case ScenarioCase::BULL:
                    return bull;
                case ScenarioCase::BEAR:
                    return bear;
                }
                return base;
            }

        } // anonymous namespace

        OutcomeModeler::OutcomeModeler(config::EngineAssumptions assumptions)
            : assumptions_(std::move(assumptions))
        {
            assumptions_.validate();
        }

        ExpectedOutcomeModel OutcomeModeler::model_expected_outcomes(const InvestmentIdea &idea, Timestamp as_of) const
        {
            std::mt19937_64 rng(assumptions_.random_seed ? *assumptions_.random_seed
                                                         : static_cast<std::uint64_t>(std::random_device{}()));
            return model_expected_outcomes(idea, rng, as_of);
        }

        ExpectedOutcomeModel OutcomeModeler::model_expected_outcomes(const InvestmentIdea &idea,
                                                                     std::mt19937_64 &rng,
                                                                     Timestamp as_of) const
        {
            ExpectedOutcomeModel model;

            model.base_case = build_scenario(idea, ScenarioCase::BASE, as_of);
            model.bull_case = build_scenario(idea, ScenarioCase::BULL, as_of);
            model.bear_case = build_scenario(idea, ScenarioCase::BEAR, as_of);

            model.probability_weighted_return =
                model.base_case.expected_return * model.base_case.probability +
                model.bull_case.expected_return * model.bull_case.probability +
                model.bear_case.expected_return * model.bear_case.probability;

            model.confidence_interval = confidence_interval(idea.investments);
            model.sensitivity_analysis = sensitivity_analysis();
            model.monte_carlo_results = run_monte_carlo(idea, rng);
            model.time_series_projection = project(idea, model.monte_carlo_results, as_of);

            return model;
        }

        // ===================================================================
        // Scenarios
        // ===================================================================

        OutcomeScenario OutcomeModeler::build_scenario(const InvestmentIdea &idea, ScenarioCase which,
                                                       Timestamp as_of) const
        {
            OutcomeScenario scenario;
            const double holding = static_cast<double>(analytics::holding_period_days(idea.time_horizon));

            const Outcome *source = nullptr;
            switch (which)
            {
            case ScenarioCase::BASE:
                source = find_outcome(idea, OutcomeCase::EXPECTED);
                scenario.probability = 0.6;
                scenario.expected_return = source ? source->return_estimate : 0.08;
                scenario.time_to_realization = source ? source->time_to_realization : holding;
                scenario.key_assumptions = {"Market conditions remain stable",
                                            "Company fundamentals improve as expected",
                                            "No major external shocks"};
                scenario.catalysts = source ? source->catalysts
                                            : std::vector<std::string>{"Earnings growth", "Market expansion"};
                scenario.risks = source ? source->key_risks
                                        : std::vector<std::string>{"Market volatility", "Execution risk"};
                break;

            case ScenarioCase::BULL:
                source = find_outcome(idea, OutcomeCase::BEST);
                scenario.probability = 0.2;
                scenario.expected_return = source ? source->return_estimate : 0.20;
                scenario.time_to_realization = (source ? source->time_to_realization : holding) * 0.8;
                scenario.key_assumptions = {"Favorable market conditions",
                                            "Strong execution of business plan",
                                            "Positive regulatory environment"};
                scenario.catalysts = source ? source->catalysts
                                            : std::vector<std::string>{"Strong earnings beat", "Market leadership",
                                                                       "Strategic partnerships"};
                scenario.risks = {"Overvaluation", "Market correction"};
                break;

            case ScenarioCase::BEAR:
                source = find_outcome(idea, OutcomeCase::WORST);
                scenario.probability = 0.2;
                scenario.expected_return = source ? source->return_estimate : -0.15;
                scenario.time_to_realization = (source ? source->time_to_realization : holding) * 1.5;
                scenario.key_assumptions = {"Adverse market conditions",
                                            "Execution challenges",
                                            "Regulatory headwinds"};
                scenario.catalysts = {"Earnings miss", "Competitive pressure", "Economic downturn"};
                scenario.risks = source ? source->key_risks
                                        : std::vector<std::string>{"Significant losses", "Liquidity issues"};
                break;
            }

            scenario.milestones = generate_milestones(idea, which, as_of);
            return scenario;
        }

        std::vector<Milestone> OutcomeModeler::generate_milestones(const InvestmentIdea &idea,
                                                                   ScenarioCase which,
                                                                   Timestamp as_of)
        {
            std::vector<Milestone> milestones;
            const int holding = analytics::holding_period_days(idea.time_horizon);
            const int quarters = static_cast<int>(std::ceil(holding / 90.0));

            for (int i = 1; i <= quarters; ++i)
            {
                Milestone review;
                review.date = add_days(as_of, 90.0 * i);
                review.description = "Q" + std::to_string(i) + " Performance Review";
                review.probability = pick(which, 0.6, 0.8, 0.4);
                review.impact = pick(which, 0.02, 0.05, -0.03);
                review.type = MilestoneType::DECISION_POINT;
                milestones.push_back(review);
            }

            // Whole days only: a 365-day horizon puts the event on day 182
            Milestone event;
            event.date = add_days(as_of, static_cast<double>(holding / 2));
            event.description = "Major Market Event";
            event.probability = 0.3;
            event.impact = pick(which, -0.05, 0.10, -0.15);
            event.type = MilestoneType::MARKET_EVENT;
            milestones.push_back(event);

            return milestones;
        }

        // ===================================================================
        // Statistics
        // ===================================================================

        ConfidenceInterval OutcomeModeler::confidence_interval(const std::vector<Investment> &investments) const
        {
            const double z = 1.96;
            double center = analytics::average_historical_return(investments, assumptions_.trading_days_per_year);
            double volatility = analytics::average_volatility(investments);

            ConfidenceInterval interval;
            interval.level = 0.95;
            interval.standard_error = volatility / std::sqrt(static_cast<double>(assumptions_.trading_days_per_year));
            interval.lower_bound = center - z * interval.standard_error;
            interval.upper_bound = center + z * interval.standard_error;
            return interval;
        }

        SensitivityAnalysis OutcomeModeler::sensitivity_analysis()
        {
            SensitivityAnalysis analysis;
            analysis.variables = {
                {"Market Return", 0.08, 1.2, 1.5, -0.30, 0.30},
                {"Interest Rates", 0.05, -0.8, -1.2, 0.01, 0.10},
                {"Volatility", 0.20, -0.3, -0.5, 0.10, 0.50}};

            analysis.correlation_matrix << 1.0, -0.3, 0.6,
                -0.3, 1.0, -0.2,
                0.6, -0.2, 1.0;

            analysis.key_drivers = {"Market Return", "Interest Rates"};
            return analysis;
        }

        MonteCarloResults OutcomeModeler::run_monte_carlo(const InvestmentIdea &idea, std::mt19937_64 &rng) const
        {
            MonteCarloSimulator simulator(assumptions_.monte_carlo_iterations, assumptions_.target_return);
            double mean = analytics::expected_return(idea, assumptions_.trading_days_per_year);
            double volatility = analytics::average_volatility(idea.investments);
            return simulator.run(mean, volatility, rng);
        }

        // ===================================================================
        // Projection
        // ===================================================================

        std::vector<TimeSeriesProjection> OutcomeModeler::project(const InvestmentIdea &idea,
                                                                  const MonteCarloResults &monte_carlo,
                                                                  Timestamp as_of) const
        {
            const int steps = std::min(analytics::holding_period_days(idea.time_horizon), 365);
            const double days_per_year = static_cast<double>(assumptions_.trading_days_per_year);
            const double daily_return = monte_carlo.mean_return / days_per_year;
            const double daily_volatility = monte_carlo.standard_deviation / std::sqrt(days_per_year);

            std::vector<TimeSeriesProjection> projections;
            projections.reserve(static_cast<std::size_t>(steps));

            double cumulative = 0.0;
            for (int i = 1; i <= steps; ++i)
            {
                TimeSeriesProjection point;
                point.date = add_days(as_of, static_cast<double>(i));
                point.expected_value = daily_return * i;

                double spread = daily_volatility * std::sqrt(static_cast<double>(i));
                point.confidence_bands.upper95 = point.expected_value + 1.96 * spread;
                point.confidence_bands.upper68 = point.expected_value + 1.0 * spread;
                point.confidence_bands.lower68 = point.expected_value - 1.0 * spread;
                point.confidence_bands.lower95 = point.expected_value - 1.96 * spread;

                // Additive accumulation of the daily mean
                cumulative += daily_return;
                point.cumulative_return = cumulative;

                projections.push_back(point);
            }

            return projections;
        }

    } // namespace outcome
} // namespace prospect
