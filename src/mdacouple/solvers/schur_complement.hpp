/**
 * @file solvers/schur_complement.hpp
 * @brief Schur complement of the analysis partition and its dense reduced system
 *
 * With the graph Jacobian split into the analysis partition A and the balance
 * partition B,
 *
 *   J = [ J_AA  J_AB ]      S = J_BB - J_BA J_AA^-1 J_AB
 *       [ J_BA  J_BB ]
 *
 * S acts on the (small) balance space. J_AA^-1 is applied by an iterative
 * solver on A and is never formed.
 */

#ifndef MDACOUPLE_SOLVERS_SCHUR_COMPLEMENT_HPP
#define MDACOUPLE_SOLVERS_SCHUR_COMPLEMENT_HPP

#include "mdacouple/core/residual_block.hpp"
#include "mdacouple/solvers/graph_jacobian_operator.hpp"
#include "mfem.hpp"

namespace mdacouple
{

/**
 * @class SchurComplementOperator
 * @brief Matrix-free S = J_BB - J_BA * AAinv * J_AB on the balance space
 */
class SchurComplementOperator : public mfem::Operator
{
public:
    /**
     * @param jAB Coupling of the analysis rows to the balance columns
     * @param jBA Coupling of the balance rows to the analysis columns
     * @param jBB Balance diagonal block
     * @param aaInverse Solver for J_AA (Mult) and J_AA^T (MultTranspose)
     */
    SchurComplementOperator(const GraphJacobianOperator& jAB,
                            const GraphJacobianOperator& jBA,
                            const GraphJacobianOperator& jBB,
                            mfem::Solver& aaInverse);

    /// y = S x
    void Mult(const mfem::Vector& x, mfem::Vector& y) const override;

    /// y = S^T x
    void MultTranspose(const mfem::Vector& x, mfem::Vector& y) const override;

    /**
     * @brief y = S x, also returning w = J_AA^-1 J_AB x
     */
    void multPropagate(const mfem::Vector& x, mfem::Vector& y, mfem::Vector& w) const;

    /**
     * @brief y = S^T x, also returning z = J_AA^-T J_BA^T x
     */
    void multTransposePropagate(const mfem::Vector& x, mfem::Vector& y,
                                mfem::Vector& z) const;

    int getAnalysisSize() const { return jAB_.Height(); }

private:
    const GraphJacobianOperator& jAB_;
    const GraphJacobianOperator& jBA_;
    const GraphJacobianOperator& jBB_;
    mfem::Solver& aaInverse_;

    mutable mfem::Vector analysisTmp_;
    mutable mfem::Vector propagated_;
    mutable mfem::Vector balanceTmp_;
};

/**
 * @class ReducedSchurSystem
 * @brief Dense, LU-factored Schur complement with cached propagation vectors
 *
 * Forward mode builds S column by column, caching W = J_AA^-1 J_AB (one
 * analysis solve per balance unknown). Reverse mode builds S row by row through
 * transposed analysis solves, caching Z = J_AA^-T J_BA^T. Either cache lets a
 * coupled linear solution be propagated into the analysis partition without
 * another analysis solve.
 */
class ReducedSchurSystem
{
public:
    /**
     * @param schur Matrix-free Schur complement
     * @param mode Forward (column-wise) or Transpose (row-wise) construction
     * @param singularTol Pivot tolerance relative to the largest entry of S
     */
    ReducedSchurSystem(const SchurComplementOperator& schur,
                       LinearMode mode,
                       double singularTol);

    ReducedSchurSystem(const ReducedSchurSystem&) = delete;
    ReducedSchurSystem& operator=(const ReducedSchurSystem&) = delete;

    /**
     * @brief Form and factor S at the current linearization
     * @throws SingularSystemError when S is singular or not finite
     */
    void assemble();

    bool isAssembled() const { return assembled_; }

    /**
     * @brief Mark the factorization stale after a relinearization
     */
    void invalidate() { assembled_ = false; }

    /// x = S^-1 rhs
    void solve(const mfem::Vector& rhs, mfem::Vector& x) const;

    /// x = S^-T rhs
    void solveTranspose(const mfem::Vector& rhs, mfem::Vector& x) const;

    LinearMode getMode() const { return mode_; }

    const mfem::DenseMatrix& getMatrix() const { return matrix_; }

    /**
     * @brief Columns W_j = J_AA^-1 J_AB e_j (forward mode) or
     *        Z_i = J_AA^-T J_BA^T e_i (reverse mode)
     */
    const mfem::DenseMatrix& getPropagation() const { return propagation_; }

private:
    void requireAssembled(const char* caller) const;

    const SchurComplementOperator& schur_;
    LinearMode mode_;
    double singularTol_;

    mfem::DenseMatrix matrix_;
    mfem::DenseMatrix propagation_;
    mfem::DenseMatrix factors_;
    mfem::DenseMatrix factorsTranspose_;
    mfem::Array<int> pivots_;
    mfem::Array<int> pivotsTranspose_;
    mfem::LUFactors lu_;
    mfem::LUFactors luTranspose_;
    bool assembled_;
};

} // namespace mdacouple

#endif // MDACOUPLE_SOLVERS_SCHUR_COMPLEMENT_HPP
