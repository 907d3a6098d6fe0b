#include "modules/RevisionProtocol.h"
#include "utils/Validation.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace {
    constexpr double kStayTolerance = 1e-12;
}

void RevisionProtocol::configure(double rho) {
    validation::requirePositive(rho, "rho");
    rho_ = rho;
}

std::vector<double> RevisionProtocol::probabilities(std::uint32_t current,
                                                    const std::vector<double>& payoffs) const {
    if (current >= payoffs.size()) {
        throw std::out_of_range("current task " + std::to_string(current) + " out of range");
    }
    std::vector<double> probs(payoffs.size(), 0.0);
    const double base = payoffs[current];
    double switchTotal = 0.0;
    for (std::uint32_t j = 0; j < payoffs.size(); ++j) {
        if (j == current) continue;
        probs[j] = rho_ * std::max(payoffs[j] - base, 0.0);
        switchTotal += probs[j];
    }
    validation::checkFinite(switchTotal, "switch probabilities");

    double stay = 1.0 - switchTotal;
    if (stay < 0.0) {
        if (stay < -kStayTolerance) {
            throw std::runtime_error("negative stay probability " + std::to_string(stay) +
                                     " at task " + std::to_string(current) +
                                     ": rho too large for the payoff range");
        }
        stay = 0.0;
    }
    probs[current] = stay;
    return probs;
}

RevisionDecision RevisionProtocol::sample(std::uint32_t current, const std::vector<double>& payoffs,
                                          std::mt19937_64& rng) const {
    const auto probs = probabilities(current, payoffs);
    std::uniform_real_distribution<double> uni(0.0, 1.0);
    const double u = uni(rng);

    RevisionDecision decision;
    decision.from = current;
    decision.to = current;

    double cumulative = 0.0;
    for (std::uint32_t j = 0; j < probs.size(); ++j) {
        if (j == current) continue;
        cumulative += probs[j];
        if (u < cumulative) {
            decision.to = j;
            decision.switched = true;
            break;
        }
    }
    return decision;
}

void RevisionProtocol::validateBound(double rho, std::uint32_t numTasks, double maxPayoffGap) {
    if (maxPayoffGap <= 0.0 || numTasks < 2) {
        return;
    }
    const double worst = rho * static_cast<double>(numTasks - 1) * maxPayoffGap;
    if (worst > 1.0) {
        throw std::invalid_argument("rho * (M - 1) * maxPayoffGap = " + std::to_string(worst) +
                                    " > 1: stay probability could become negative");
    }
}
