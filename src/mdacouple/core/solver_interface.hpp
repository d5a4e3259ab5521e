/**
 * @file core/solver_interface.hpp
 * @brief Abstract base class for the coupled solvers of the mdacouple library
 */

#ifndef MDACOUPLE_CORE_SOLVER_INTERFACE_HPP
#define MDACOUPLE_CORE_SOLVER_INTERFACE_HPP

#include "mdacouple/core/residual_block.hpp"
#include "mfem.hpp"

namespace mdacouple
{

/**
 * @struct SolveReport
 * @brief Outcome of one nonlinear solve
 */
struct SolveReport
{
    bool converged = false;
    int iterations = 0;         // Gauss-Seidel sweeps or Newton updates
    int subSolves = 0;          // analysis sweeps charged to the sub-solve budget
    double analysisNorm = 0.0;
    double balanceNorm = 0.0;
    double solveTimeMs = 0.0;
};

class CoupledSolverInterface
{
public:
    virtual ~CoupledSolverInterface() = default;

    /**
     * @brief Drive the residuals of the graph to zero
     *
     * Outputs are reset to their declared defaults first, so repeated solves
     * with the same inputs give the same result.
     */
    virtual SolveReport solve() = 0;

    /**
     * @brief Linearize every block at the current state
     */
    virtual void linearize() = 0;

    /**
     * @brief Solve J x = rhs (Forward) or J^T x = rhs (Transpose)
     *
     * Both vectors use the state layout. Requires a prior linearize().
     */
    virtual void solveLinear(const mfem::Vector& rhs,
                             mfem::Vector& solution,
                             LinearMode mode) = 0;
};

} // namespace mdacouple

#endif // MDACOUPLE_CORE_SOLVER_INTERFACE_HPP
