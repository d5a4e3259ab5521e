/**
 * @file solvers/solver_block_gauss_seidel.hpp
 * @brief Linear block Gauss-Seidel solver for a partition of a coupling graph
 */

#ifndef MDACOUPLE_SOLVERS_SOLVER_BLOCK_GAUSS_SEIDEL_HPP
#define MDACOUPLE_SOLVERS_SOLVER_BLOCK_GAUSS_SEIDEL_HPP

#include "mdacouple/core/coupling_graph.hpp"
#include "mdacouple/core/solver_options.hpp"
#include "mfem.hpp"
#include <vector>

namespace mdacouple
{

/**
 * @class LinearBlockGaussSeidel
 * @brief Solves J_PP x = b (Mult) or J_PP^T x = b (MultTranspose) on a partition P
 *
 * Each block's diagonal Jacobian is inverted by the block itself through
 * solveLinear; off-diagonal coupling is applied with applyLinear. Forward
 * sweeps visit the blocks in order, transposed sweeps in reverse order. Aitken
 * relaxation acts on the linear increment of every sweep.
 *
 * Vectors are compact partition vectors. The blocks must be linearized.
 * Throws CouplingDivergedError when maxIter sweeps do not reach tolerance.
 */
class LinearBlockGaussSeidel : public mfem::Solver
{
public:
    LinearBlockGaussSeidel(CouplingGraph& graph,
                           const std::vector<int>& blocks,
                           const LinearSolverOptions& options);

    ~LinearBlockGaussSeidel() override = default;

    void Mult(const mfem::Vector& b, mfem::Vector& x) const override;

    void MultTranspose(const mfem::Vector& b, mfem::Vector& x) const override;

    /**
     * @brief Rebind to the diagonal partition of a GraphJacobianOperator
     */
    void SetOperator(const mfem::Operator& op) override;

    const std::vector<int>& getBlocks() const { return blocks_; }

    int getNumIterations() const { return numIterations_; }

    double getFinalNorm() const { return finalNorm_; }

private:
    void sliceOf(int block, const mfem::Vector& full, mfem::Vector& slice) const;
    void storeSlice(int block, const mfem::Vector& slice, mfem::Vector& full) const;

    /**
     * @brief coupling += scatter of (dR_block/dI)^T lambda onto source outputs
     */
    void addCouplingTranspose(int block, const mfem::Vector& lambda,
                              mfem::Vector& coupling) const;

    /**
     * @return true when converged; throws once maxIter sweeps are used up
     */
    bool checkConvergence(const char* direction, int iteration,
                          double norm, double norm0) const;

    CouplingGraph& graph_;
    std::vector<int> blocks_;
    LinearSolverOptions options_;

    mutable int numIterations_;
    mutable double finalNorm_;

    mutable mfem::Vector xFull_;
    mutable mfem::Vector rhsFull_;
    mutable mfem::Vector coupling_;
    mutable mfem::Vector residualFull_;
    mutable mfem::Vector xOld_;
    mutable mfem::Vector delta_;
    mutable mfem::Vector residual_;
    mutable mfem::Vector dInputs_;
    mutable mfem::Vector dOutputs_;
    mutable mfem::Vector dResidual_;
    mutable mfem::Vector rhs_;
    mutable mfem::Vector slice_;
    mutable mfem::Vector seed_;
};

} // namespace mdacouple

#endif // MDACOUPLE_SOLVERS_SOLVER_BLOCK_GAUSS_SEIDEL_HPP
