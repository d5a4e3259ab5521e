/**
 * @file solvers/solver_nonlinear_gauss_seidel.hpp
 * @brief Nonlinear block Gauss-Seidel fixed-point solver with Aitken relaxation
 */

#ifndef MDACOUPLE_SOLVERS_SOLVER_NONLINEAR_GAUSS_SEIDEL_HPP
#define MDACOUPLE_SOLVERS_SOLVER_NONLINEAR_GAUSS_SEIDEL_HPP

#include "mdacouple/core/coupling_graph.hpp"
#include "mdacouple/core/solver_interface.hpp"
#include "mdacouple/core/solver_options.hpp"
#include "mdacouple/solvers/solver_block_gauss_seidel.hpp"
#include "mfem.hpp"
#include <vector>

namespace mdacouple
{

/**
 * @struct SweepBudget
 * @brief Sweep allowance shared by all fixed-point solves of one outer solve
 */
struct SweepBudget
{
    int used = 0;
    int limit = 0;
};

/**
 * @class NonlinearBlockGaussSeidel
 * @brief Iterates a partition of the coupling graph to a converged state
 *
 * One sweep visits the blocks in order, pulls their inputs from the current
 * state and applies each block's analysis shortcut in place. Blocks without a
 * shortcut are held implicit. After the sweep the increment over the partition
 * is relaxed with Aitken's factor. The solve stops when the partition residual
 * satisfies |R| <= absTol or |R| <= relTol * |R_0|, where R_0 is the residual
 * at the state the solve started from; at least one sweep is always done.
 *
 * All per-solve state (previous increment, Aitken factor, sweep count) lives
 * inside converge(), so repeated solves do not interact.
 */
class NonlinearBlockGaussSeidel : public CoupledSolverInterface
{
public:
    /**
     * @brief Solver over every block of the graph
     */
    NonlinearBlockGaussSeidel(CouplingGraph& graph,
                              const FixedPointOptions& options,
                              const LinearSolverOptions& linearOptions = LinearSolverOptions());

    /**
     * @brief Solver over a partition of the graph
     * @param blocks Block indices in default sweep order
     */
    NonlinearBlockGaussSeidel(CouplingGraph& graph,
                              const std::vector<int>& blocks,
                              const FixedPointOptions& options,
                              const LinearSolverOptions& linearOptions = LinearSolverOptions());

    ~NonlinearBlockGaussSeidel() override = default;

    /**
     * @brief Reset the partition outputs and iterate to convergence
     * @throws CouplingDivergedError when maxIter sweeps do not converge
     */
    SolveReport solve() override;

    /**
     * @brief Iterate from the current state without resetting it
     * @param budget Shared sweep budget checked before every sweep, or nullptr
     * @throws SubSolveBudgetExceeded when the budget is exhausted
     */
    SolveReport converge(SweepBudget* budget = nullptr);

    void linearize() override;

    /**
     * @brief Solve the linear system of the partition with linear block Gauss-Seidel
     *
     * Only the partition's entries of rhs are used and set in solution.
     */
    void solveLinear(const mfem::Vector& rhs,
                     mfem::Vector& solution,
                     LinearMode mode) override;

    /**
     * @brief Block indices in the order they are swept
     * @throws ConfigurationError when FixedPointOptions::blockOrder is malformed
     */
    std::vector<int> getSweepOrder() const;

    const std::vector<int>& getBlocks() const { return blocks_; }

    const FixedPointOptions& getOptions() const { return options_; }

private:
    double residualNorm(int iteration);

    CouplingGraph& graph_;
    std::vector<int> blocks_;
    FixedPointOptions options_;
    LinearSolverOptions linearOptions_;

    mfem::Vector residual_;
    mfem::Vector compact_;
};

} // namespace mdacouple

#endif // MDACOUPLE_SOLVERS_SOLVER_NONLINEAR_GAUSS_SEIDEL_HPP
