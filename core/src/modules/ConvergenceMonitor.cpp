#include "modules/ConvergenceMonitor.h"
#include "utils/Validation.h"

#include <algorithm>
#include <limits>
#include <stdexcept>

void ConvergenceMonitor::configure(const ConvergenceSettings& settings) {
    if (settings.enabled) {
        validation::requirePositive(settings.threshold, "convergence threshold");
        validation::requireFinite(settings.holdDuration, "convergence holdDuration");
        if (settings.holdDuration < 0.0) {
            throw std::invalid_argument("convergence holdDuration must be >= 0");
        }
    }
    settings_ = settings;
    reset();
}

void ConvergenceMonitor::reset() {
    below_ = false;
    converged_ = false;
    below_since_ = 0.0;
    converged_at_ = -1.0;
}

bool ConvergenceMonitor::update(double time, const std::vector<double>& x,
                                const std::vector<double>& payoffs) {
    if (!settings_.enabled || converged_) {
        return converged_;
    }

    const double value = settings_.metric == ConvergenceMetric::PopulationVariance
                      ? populationVariance(x)
                      : payoffGap(x, payoffs);

    if (value < settings_.threshold) {
        if (!below_) {
            below_ = true;
            below_since_ = time;
        }
        if (time - below_since_ >= settings_.holdDuration) {
            converged_ = true;
            converged_at_ = time;
        }
    } else {
        below_ = false;
    }
    return converged_;
}

double ConvergenceMonitor::populationVariance(const std::vector<double>& x) {
    if (x.empty()) return 0.0;
    double mean = 0.0;
    for (double v : x) mean += v;
    mean /= static_cast<double>(x.size());
    double sq = 0.0;
    for (double v : x) {
        const double d = v - mean;
        sq += d * d;
    }
    return sq / static_cast<double>(x.size());
}

double ConvergenceMonitor::payoffGap(const std::vector<double>& x, const std::vector<double>& payoffs) {
    // Nash condition: no task pays more than the worst occupied one
    double best = -std::numeric_limits<double>::infinity();
    double worstOccupied = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < payoffs.size(); ++i) {
        best = std::max(best, payoffs[i]);
        if (i < x.size() && x[i] > 0.0) {
            worstOccupied = std::min(worstOccupied, payoffs[i]);
        }
    }
    if (payoffs.empty() || worstOccupied == std::numeric_limits<double>::infinity()) {
        return 0.0;
    }
    return std::max(0.0, best - worstOccupied);
}
