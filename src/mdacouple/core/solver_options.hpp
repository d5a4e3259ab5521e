/**
 * @file core/solver_options.hpp
 * @brief Typed configuration for the coupled nonlinear and linear solvers
 *
 * Options are plain structs with defaults. Each solver copies its options at
 * construction and validates them at the start of every solve, so a
 * configuration never changes while a solve is running.
 */

#ifndef MDACOUPLE_CORE_SOLVER_OPTIONS_HPP
#define MDACOUPLE_CORE_SOLVER_OPTIONS_HPP

#include "mdacouple/core/residual_block.hpp"
#include <string>
#include <vector>

namespace mdacouple
{

/**
 * @struct AitkenOptions
 * @brief Aitken dynamic relaxation parameters
 */
struct AitkenOptions
{
    bool enabled = true;

    /// theta_0, in (0, 1].
    double initialFactor = 0.5;
    double minFactor = 0.1;
    double maxFactor = 1.5;

    void validate(const std::string& owner) const;
};

/**
 * @struct FixedPointOptions
 * @brief Nonlinear block Gauss-Seidel configuration
 */
struct FixedPointOptions
{
    double absTol = 1.0e-10;
    double relTol = 1.0e-10;
    int maxIter = 100;
    int printLevel = 0;
    AitkenOptions aitken;

    /// Sweep order by block name; empty means graph insertion order.
    std::vector<std::string> blockOrder;

    void validate() const;
};

/**
 * @struct LinearSolverOptions
 * @brief Linear block Gauss-Seidel configuration (forward and adjoint)
 */
struct LinearSolverOptions
{
    double absTol = 1.0e-12;
    double relTol = 1.0e-12;
    int maxIter = 100;
    int printLevel = 0;
    AitkenOptions aitken;

    void validate() const;
};

/**
 * @struct BalanceBounds
 * @brief Optional lower/upper bounds on the balance unknowns
 *
 * Either both arrays are empty (no bounds) or both have one entry per
 * balance unknown.
 */
struct BalanceBounds
{
    std::vector<double> lower;
    std::vector<double> upper;

    bool empty() const { return lower.empty() && upper.empty(); }

    void validate(int balanceSize) const;
};

/**
 * @struct TrimSolverOptions
 * @brief Schur-partitioned Newton solver configuration
 *
 * Owns the configuration of the inner analysis solvers by value; the trim
 * solver constructs its inner solvers from these copies.
 */
struct TrimSolverOptions
{
    double absTol = 1.0e-10;
    double relTol = 1.0e-10;
    int maxIter = 60;
    int maxSubSolves = 600;
    int printLevel = 0;

    /// Partition labels: {analysis label, balance label}.
    std::vector<std::string> groupNames = {"analysis", "balance"};

    /// Forward builds the Schur complement column-wise, Transpose row-wise.
    LinearMode schurMode = LinearMode::Transpose;

    /// Relative pivot tolerance used when factoring the reduced system.
    double singularTol = 1.0e-14;

    BalanceBounds bounds;

    FixedPointOptions analysisSolver;
    LinearSolverOptions analysisLinearSolver;

    void validate() const;
};

} // namespace mdacouple

#endif // MDACOUPLE_CORE_SOLVER_OPTIONS_HPP
