#ifndef CONVERGENCE_MONITOR_H
#define CONVERGENCE_MONITOR_H

#include <cstdint>
#include <vector>

enum class ConvergenceMetric : std::uint8_t {
    PopulationVariance = 0,  // variance of x across tasks
    PayoffGap = 1            // best payoff minus worst payoff among occupied tasks
};

struct ConvergenceSettings {
    bool enabled = false;
    ConvergenceMetric metric = ConvergenceMetric::PayoffGap;
    double threshold = 1.0;
    double holdDuration = 100.0;  // metric must stay below threshold this long
};

/**
 * Detects when the allocation has settled.
 *
 * Fed once per resource tick. Reports convergence once the metric has been
 * strictly below the threshold continuously for holdDuration. Used to end
 * experiments early; the dynamics do not depend on it.
 */
class ConvergenceMonitor {
public:
    void configure(const ConvergenceSettings& settings);
    void reset();

    // Returns true once the hold condition is satisfied
    bool update(double time, const std::vector<double>& x, const std::vector<double>& payoffs);

    bool converged() const { return converged_; }
    double convergedAt() const { return converged_at_; }
    const ConvergenceSettings& settings() const { return settings_; }

    static double populationVariance(const std::vector<double>& x);
    static double payoffGap(const std::vector<double>& x, const std::vector<double>& payoffs);

private:
    ConvergenceSettings settings_{};
    bool below_ = false;
    bool converged_ = false;
    double below_since_ = 0.0;
    double converged_at_ = -1.0;
};

#endif
