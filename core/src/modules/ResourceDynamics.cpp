#include "modules/ResourceDynamics.h"
#include "utils/Validation.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

void ResourceDynamics::configure(const std::vector<TaskParams>& params, double integrationStep,
                                 bool clampAtZero) {
    validation::requirePositive(integrationStep, "integrationStep");
    for (std::size_t i = 0; i < params.size(); ++i) {
        const auto& p = params[i];
        const std::string tag = "task " + std::to_string(i);
        if (!(p.R > 0.0) || !std::isfinite(p.R)) {
            throw std::invalid_argument(tag + ": R must be > 0");
        }
        if (!(p.alpha > 0.0) || !std::isfinite(p.alpha)) {
            throw std::invalid_argument(tag + ": alpha must be > 0");
        }
        if (!std::isfinite(p.beta)) {
            throw std::invalid_argument(tag + ": beta must be finite");
        }
        if (!std::isfinite(p.w)) {
            throw std::invalid_argument(tag + ": growth rate must be finite");
        }
    }
    params_ = params;
    integration_step_ = integrationStep;
    clamp_at_zero_ = clampAtZero;
}

double ResourceDynamics::consumption(std::uint32_t task, double q, double x) const {
    // x^beta is defined as 0 for an empty task, whatever the sign of beta
    if (x <= 0.0) {
        return 0.0;
    }
    const auto& p = params_[task];
    return p.R * std::tanh(0.5 * p.alpha * q) * std::pow(x, p.beta);
}

double ResourceDynamics::derivative(std::uint32_t task, double q, double x) const {
    return -consumption(task, q, x) + params_[task].w;
}

double ResourceDynamics::rk4Step(std::uint32_t task, double q, double x, double h) const {
    const double k1 = derivative(task, q, x);
    const double k2 = derivative(task, q + 0.5 * h * k1, x);
    const double k3 = derivative(task, q + 0.5 * h * k2, x);
    const double k4 = derivative(task, q + h * k3, x);
    return q + (h / 6.0) * (k1 + 2.0 * k2 + 2.0 * k3 + k4);
}

void ResourceDynamics::integrate(std::vector<double>& q, const std::vector<double>& x, double dt) const {
    validation::requireSize(q.size(), params_.size(), "resource vector");
    validation::requireSize(x.size(), params_.size(), "population vector");
    if (dt <= 0.0) {
        return;
    }

    const auto substeps = static_cast<std::uint64_t>(
        std::max(1.0, std::ceil(dt / integration_step_ - 1e-9)));
    const double h = dt / static_cast<double>(substeps);

    // Commit only once every task integrated cleanly
    std::vector<double> next(q);
    for (std::uint32_t i = 0; i < numTasks(); ++i) {
        double qi = next[i];
        for (std::uint64_t s = 0; s < substeps; ++s) {
            qi = rk4Step(i, qi, x[i], h);
            validation::checkFinite(qi, "resource integration");
            if (clamp_at_zero_) {
                qi = std::max(qi, 0.0);
            }
        }
        next[i] = qi;
    }
    q.swap(next);
}

std::optional<double> ResourceDynamics::equilibriumLevel(std::uint32_t task, double x) const {
    if (x <= 0.0) {
        return std::nullopt;
    }
    const auto& p = params_[task];
    const double cap = p.R * std::pow(x, p.beta);
    const double ratio = p.w / cap;
    if (!std::isfinite(ratio) || ratio <= -1.0 || ratio >= 1.0) {
        return std::nullopt;
    }
    return 2.0 / p.alpha * std::atanh(ratio);
}

void ResourceDynamics::setGrowthRate(std::uint32_t task, double w) {
    if (task >= params_.size()) {
        throw std::out_of_range("task index " + std::to_string(task) + " out of range");
    }
    validation::requireFinite(w, "growth rate");
    params_[task].w = w;
}

std::vector<double> ResourceDynamics::growthRates() const {
    std::vector<double> w(params_.size());
    for (std::size_t i = 0; i < params_.size(); ++i) {
        w[i] = params_[i].w;
    }
    return w;
}
