/**
 * @file monte_carlo.cpp
 * @brief Implementation of MonteCarloSimulator.
 */

#include "outcome/monte_carlo.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>
#include <string>

namespace prospect
{
    namespace outcome
    {

        namespace
        {
            constexpr double kPi = 3.14159265358979323846;
            constexpr std::array<int, 9> kPercentiles = {1, 5, 10, 25, 50, 75, 90, 95, 99};
        } // anonymous namespace

        MonteCarloSimulator::MonteCarloSimulator(int iterations, double target_return)
            : iterations_(iterations), target_return_(target_return)
        {
            if (iterations < 0)
            {
                throw std::invalid_argument(
                    "Expected non-negative value for parameter 'iterations', got: " + std::to_string(iterations));
            }
        }

        double MonteCarloSimulator::box_muller(double u1, double u2)
        {
            return std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * kPi * u2);
        }

        MonteCarloResults MonteCarloSimulator::run(double mean, double volatility, std::mt19937_64 &rng) const
        {
            MonteCarloResults results;
            results.iterations = iterations_;

            if (iterations_ == 0)
            {
                for (int p : kPercentiles)
                {
                    results.percentiles[p] = 0.0;
                }
                return results;
            }

            std::uniform_real_distribution<double> uniform(0.0, 1.0);
            const Eigen::Index n = iterations_;

            Eigen::VectorXd samples(n);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                // 1 - [0,1) keeps log() away from zero
                double u1 = 1.0 - uniform(rng);
                double u2 = uniform(rng);
                samples(i) = mean + volatility * box_muller(u1, u2);
            }

            std::sort(samples.data(), samples.data() + n);

            results.mean_return = samples.mean();
            results.standard_deviation =
                std::sqrt((samples.array() - results.mean_return).square().sum() / static_cast<double>(n));

            for (int p : kPercentiles)
            {
                auto index = static_cast<Eigen::Index>(std::floor(static_cast<double>(n) * p / 100.0));
                results.percentiles[p] = samples(std::min(index, n - 1));
            }

            results.probability_of_loss =
                static_cast<double>((samples.array() < 0.0).count()) / static_cast<double>(n);
            results.probability_of_target =
                static_cast<double>((samples.array() >= target_return_).count()) / static_cast<double>(n);

            // Samples are sorted, so the tail is a prefix
            const double var5 = results.percentiles[5];
            double tail_sum = 0.0;
            Eigen::Index tail_count = 0;
            while (tail_count < n && samples(tail_count) <= var5)
            {
                tail_sum += samples(tail_count);
                ++tail_count;
            }
            results.expected_shortfall = tail_count > 0 ? tail_sum / static_cast<double>(tail_count) : var5;

            return results;
        }

    } // namespace outcome
} // namespace prospect
