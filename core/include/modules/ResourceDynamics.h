#ifndef RESOURCE_DYNAMICS_H
#define RESOURCE_DYNAMICS_H

#include <cstdint>
#include <optional>
#include <vector>

// Per-task consumption shape and growth rate
struct TaskParams {
    double R = 3.44;       // saturation consumption rate
    double alpha = 0.036;  // steepness of the consumption curve
    double beta = 0.91;    // population exponent
    double w = 0.5;        // resource growth rate
};

/**
 * Resource level dynamics per task
 *
 *   dq_i/dt = -F_i(q_i, x_i) + w_i
 *   F_i(q, x) = R_i * tanh(alpha_i * q / 2) * x^beta_i
 *
 * tanh(a q / 2) is the ratio (e^{aq} - 1) / (e^{aq} + 1) written in a form
 * that cannot overflow. Consumption grows with q, saturates at R_i x^beta_i
 * and vanishes when no agent serves the task.
 *
 * Tasks are decoupled given x, so each q_i is advanced by its own scalar
 * RK4 over uniform sub-steps no longer than the configured integration step.
 */
class ResourceDynamics {
public:
    void configure(const std::vector<TaskParams>& params, double integrationStep,
                   bool clampAtZero = false);

    double consumption(std::uint32_t task, double q, double x) const;
    double derivative(std::uint32_t task, double q, double x) const;

    // Advance q in place over dt with x held constant.
    // Throws std::runtime_error if any value becomes non-finite; q is then untouched.
    void integrate(std::vector<double>& q, const std::vector<double>& x, double dt) const;

    // Level q* at which consumption balances growth for population share x.
    // Empty when the balance is unreachable (x == 0 or |w| >= R x^beta).
    std::optional<double> equilibriumLevel(std::uint32_t task, double x) const;

    void setGrowthRate(std::uint32_t task, double w);
    double growthRate(std::uint32_t task) const { return params_[task].w; }
    std::vector<double> growthRates() const;

    const std::vector<TaskParams>& params() const { return params_; }
    std::uint32_t numTasks() const { return static_cast<std::uint32_t>(params_.size()); }
    double integrationStep() const { return integration_step_; }

private:
    std::vector<TaskParams> params_;
    double integration_step_ = 0.05;
    bool clamp_at_zero_ = false;

    double rk4Step(std::uint32_t task, double q, double x, double h) const;
};

#endif
