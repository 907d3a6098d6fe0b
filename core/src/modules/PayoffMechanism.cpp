#include "modules/PayoffMechanism.h"
#include "modules/ResourceDynamics.h"
#include "utils/Validation.h"

#include <stdexcept>

void PayoffMechanism::configure(double nu, double referenceLevel) {
    validation::requireFinite(nu, "nu");
    if (nu < 0.0) {
        throw std::invalid_argument("nu must be >= 0 (got " + std::to_string(nu) + ")");
    }
    validation::requireFinite(referenceLevel, "referenceLevel");
    nu_ = nu;
    reference_level_ = referenceLevel;
}

double PayoffMechanism::payoff(const ResourceDynamics& dynamics, std::uint32_t task,
                               const std::vector<double>& q, const std::vector<double>& x) const {
    if (nu_ == 0.0) {
        return q[task];
    }
    const double predicted = -dynamics.consumption(task, reference_level_, x[task]) +
                             dynamics.growthRate(task);
    const double p = q[task] + nu_ * predicted;
    validation::checkFinite(p, "payoff");
    return p;
}

std::vector<double> PayoffMechanism::payoffs(const ResourceDynamics& dynamics,
                                             const std::vector<double>& q,
                                             const std::vector<double>& x) const {
    std::vector<double> p(q.size());
    for (std::uint32_t i = 0; i < q.size(); ++i) {
        p[i] = payoff(dynamics, i, q, x);
    }
    return p;
}
