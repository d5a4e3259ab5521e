/**
 * @file solvers/solver_schur_newton.hpp
 * @brief Schur-partitioned Newton solver for trimmed coupled analyses
 */

#ifndef MDACOUPLE_SOLVERS_SOLVER_SCHUR_NEWTON_HPP
#define MDACOUPLE_SOLVERS_SOLVER_SCHUR_NEWTON_HPP

#include "mdacouple/core/coupling_graph.hpp"
#include "mdacouple/core/solver_interface.hpp"
#include "mdacouple/core/solver_options.hpp"
#include "mdacouple/solvers/graph_jacobian_operator.hpp"
#include "mdacouple/solvers/schur_complement.hpp"
#include "mdacouple/solvers/solver_block_gauss_seidel.hpp"
#include "mdacouple/solvers/solver_nonlinear_gauss_seidel.hpp"
#include "mfem.hpp"
#include <memory>
#include <vector>

namespace mdacouple
{

/**
 * @class SchurNewtonSolver
 * @brief Newton iteration on the balance unknowns with the analysis eliminated
 *
 * The graph is split by partition label into the analysis blocks A and the
 * balance blocks B. Every outer iteration converges A with nonlinear block
 * Gauss-Seidel for the current balance values, evaluates both residuals and,
 * unless both partitions meet tolerance, updates the balance unknowns with
 *
 *   S db = -R_B,    S = J_BB - J_BA J_AA^-1 J_AB
 *
 * where J_AA^-1 is applied by linear block Gauss-Seidel. The updated balance
 * values are projected onto the configured bounds.
 *
 * The analysis sweeps of all inner solves are charged to one budget of
 * maxSubSolves sweeps. The tolerance of each partition is checked against
 * absTol or relTol times that partition's residual at the start of the solve.
 */
class SchurNewtonSolver : public CoupledSolverInterface
{
public:
    /**
     * @param graph Finalized graph containing both partitions
     * @param options Outer options; the inner solvers are built from the copies they hold
     */
    SchurNewtonSolver(CouplingGraph& graph, const TrimSolverOptions& options);

    ~SchurNewtonSolver() override = default;

    /**
     * @brief Reset outputs and solve the coupled system with its balance equations
     * @throws ConfigurationError before any evaluation when the setup is invalid
     * @throws SubSolveBudgetExceeded, CouplingDivergedError, MaxIterExceeded,
     *         NumericalDomainError, SingularSystemError
     */
    SolveReport solve() override;

    /**
     * @brief Linearize all blocks; the reduced system is rebuilt on next use
     */
    void linearize() override;

    /**
     * @brief Solve the full linear system through the Schur complement
     *
     * Transpose: mu = J_AA^-T s_A, S^T l_B = s_B - J_AB^T mu, l_A = mu - Z l_B.
     * Forward:   nu = J_AA^-1 r_A, S x_B = r_B - J_BA nu,   x_A = nu - W x_B.
     */
    void solveLinear(const mfem::Vector& rhs,
                     mfem::Vector& solution,
                     LinearMode mode) override;

    const std::vector<int>& getAnalysisBlocks() const { return analysisBlocks_; }
    const std::vector<int>& getBalanceBlocks() const { return balanceBlocks_; }

    const TrimSolverOptions& getOptions() const { return options_; }

    /**
     * @brief Reduced system of the last linearization (assembled on demand)
     */
    const ReducedSchurSystem& getReducedSystem();

private:
    /**
     * @brief Resolve the partitions and check labels and bounds against the graph
     */
    void validateSetup();

    /**
     * @brief Build the inner solvers and Jacobian operators once
     */
    void setupSolvers();

    void projectOntoBounds(mfem::Vector& balance) const;

    void residualNorms(int iteration, double& analysisNorm, double& balanceNorm);

    CouplingGraph& graph_;
    TrimSolverOptions options_;
    std::vector<int> analysisBlocks_;
    std::vector<int> balanceBlocks_;

    std::unique_ptr<NonlinearBlockGaussSeidel> analysisSolver_;
    std::unique_ptr<LinearBlockGaussSeidel> analysisLinearSolver_;
    std::unique_ptr<GraphJacobianOperator> jAB_;
    std::unique_ptr<GraphJacobianOperator> jBA_;
    std::unique_ptr<GraphJacobianOperator> jBB_;
    std::unique_ptr<SchurComplementOperator> schur_;
    std::unique_ptr<ReducedSchurSystem> reduced_;

    mfem::Vector residual_;
    mfem::Vector analysisResidual_;
    mfem::Vector balanceResidual_;
};

} // namespace mdacouple

#endif // MDACOUPLE_SOLVERS_SOLVER_SCHUR_NEWTON_HPP
