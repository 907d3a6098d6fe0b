#ifndef PAYOFF_MECHANISM_H
#define PAYOFF_MECHANISM_H

#include <cstdint>
#include <vector>

class ResourceDynamics;

/**
 * Task attractiveness signal
 *
 *   p_i = q_i + nu * (-F_i(gamma*, x_i) + w_i)
 *
 * nu = 0 gives the purely reactive payoff (current resource level).
 * nu > 0 adds a model-based correction evaluated at the fixed reference
 * level gamma*. Evaluated fresh at every revision event.
 */
class PayoffMechanism {
public:
    void configure(double nu, double referenceLevel);

    double payoff(const ResourceDynamics& dynamics, std::uint32_t task,
                  const std::vector<double>& q, const std::vector<double>& x) const;

    std::vector<double> payoffs(const ResourceDynamics& dynamics,
                                const std::vector<double>& q,
                                const std::vector<double>& x) const;

    double nu() const { return nu_; }
    double referenceLevel() const { return reference_level_; }

private:
    double nu_ = 0.0;
    double reference_level_ = 0.0;
};

#endif
