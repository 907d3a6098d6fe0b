#ifndef REVISION_PROTOCOL_H
#define REVISION_PROTOCOL_H

#include <cstdint>
#include <random>
#include <vector>

struct RevisionDecision {
    std::uint32_t from = 0;
    std::uint32_t to = 0;
    bool switched = false;
};

/**
 * Pairwise proportional imitation
 *
 *   P(i -> j) = rho * [p_j - p_i]_+      for j != i
 *   P(stay)   = 1 - rho * sum_j [p_j - p_i]_+
 *
 * rho must keep P(stay) >= 0. A negative stay probability is reported as an
 * error and never renormalised away.
 */
class RevisionProtocol {
public:
    void configure(double rho);

    // Entry `current` holds P(stay); all other entries hold P(current -> j).
    // Throws std::runtime_error when P(stay) < 0.
    std::vector<double> probabilities(std::uint32_t current, const std::vector<double>& payoffs) const;

    // One uniform draw over the categorical distribution above.
    RevisionDecision sample(std::uint32_t current, const std::vector<double>& payoffs,
                            std::mt19937_64& rng) const;

    // Init-time check: rho * (M - 1) * maxPayoffGap must not exceed 1
    static void validateBound(double rho, std::uint32_t numTasks, double maxPayoffGap);

    double rho() const { return rho_; }

private:
    double rho_ = 1.0 / 600.0;
};

#endif
