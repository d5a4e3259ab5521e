/**
 * @file solvers/schur_complement.cpp
 * @brief Implementation of the Schur complement operator and reduced system
 */

#include "mdacouple/solvers/schur_complement.hpp"
#include "mdacouple/core/errors.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace mdacouple
{

SchurComplementOperator::SchurComplementOperator(const GraphJacobianOperator& jAB,
                                                 const GraphJacobianOperator& jBA,
                                                 const GraphJacobianOperator& jBB,
                                                 mfem::Solver& aaInverse)
    : mfem::Operator(jBB.Height()),
      jAB_(jAB),
      jBA_(jBA),
      jBB_(jBB),
      aaInverse_(aaInverse)
{
    if (jBB.Height() != jBB.Width() ||
        jAB.Height() != aaInverse.Height() ||
        jAB.Width() != jBB.Width() ||
        jBA.Height() != jBB.Height() ||
        jBA.Width() != jAB.Height())
    {
        throw std::invalid_argument("SchurComplementOperator: dimension mismatch between "
                                    "the Jacobian blocks and the analysis solver");
    }
}

void SchurComplementOperator::multPropagate(const mfem::Vector& x,
                                            mfem::Vector& y,
                                            mfem::Vector& w) const
{
    // w = J_AA^-1 J_AB x
    jAB_.Mult(x, analysisTmp_);
    aaInverse_.Mult(analysisTmp_, w);

    // y = J_BB x - J_BA w
    jBB_.Mult(x, y);
    jBA_.Mult(w, balanceTmp_);
    y -= balanceTmp_;
}

void SchurComplementOperator::multTransposePropagate(const mfem::Vector& x,
                                                     mfem::Vector& y,
                                                     mfem::Vector& z) const
{
    // z = J_AA^-T J_BA^T x
    jBA_.MultTranspose(x, analysisTmp_);
    aaInverse_.MultTranspose(analysisTmp_, z);

    // y = J_BB^T x - J_AB^T z
    jBB_.MultTranspose(x, y);
    jAB_.MultTranspose(z, balanceTmp_);
    y -= balanceTmp_;
}

void SchurComplementOperator::Mult(const mfem::Vector& x, mfem::Vector& y) const
{
    multPropagate(x, y, propagated_);
}

void SchurComplementOperator::MultTranspose(const mfem::Vector& x, mfem::Vector& y) const
{
    multTransposePropagate(x, y, propagated_);
}

// ======================================================================

ReducedSchurSystem::ReducedSchurSystem(const SchurComplementOperator& schur,
                                       LinearMode mode,
                                       double singularTol)
    : schur_(schur),
      mode_(mode),
      singularTol_(singularTol),
      assembled_(false)
{
}

void ReducedSchurSystem::assemble()
{
    assembled_ = false;
    const int n = schur_.Height();
    const int nA = schur_.getAnalysisSize();

    matrix_.SetSize(n);
    propagation_.SetSize(nA, n);

    mfem::Vector unit(n), image, propagated;
    for (int j = 0; j < n; ++j)
    {
        unit = 0.0;
        unit(j) = 1.0;
        if (mode_ == LinearMode::Forward)
        {
            schur_.multPropagate(unit, image, propagated);
            matrix_.SetCol(j, image);
        }
        else
        {
            schur_.multTransposePropagate(unit, image, propagated);
            matrix_.SetRow(j, image);
        }
        propagation_.SetCol(j, propagated);
    }

    for (int i = 0; i < n; ++i)
    {
        for (int j = 0; j < n; ++j)
        {
            if (!std::isfinite(matrix_(i, j)))
            {
                throw SingularSystemError("Schur complement has non-finite entries");
            }
        }
    }

    const double tol = singularTol_ * matrix_.MaxMaxNorm();

    factors_ = matrix_;
    pivots_.SetSize(n);
    lu_.data = factors_.Data();
    lu_.ipiv = pivots_.GetData();
    if (!lu_.Factor(n, tol))
    {
        std::ostringstream os;
        os << "Schur complement of size " << n << " is singular (pivot tolerance " << tol
           << ")";
        throw SingularSystemError(os.str());
    }

    factorsTranspose_.Transpose(matrix_);
    pivotsTranspose_.SetSize(n);
    luTranspose_.data = factorsTranspose_.Data();
    luTranspose_.ipiv = pivotsTranspose_.GetData();
    if (!luTranspose_.Factor(n, tol))
    {
        throw SingularSystemError("transposed Schur complement is singular");
    }

    assembled_ = true;
}

void ReducedSchurSystem::requireAssembled(const char* caller) const
{
    if (!assembled_)
    {
        throw std::runtime_error(std::string("ReducedSchurSystem::") + caller +
                                 " called before assemble()");
    }
}

void ReducedSchurSystem::solve(const mfem::Vector& rhs, mfem::Vector& x) const
{
    requireAssembled("solve()");
    x = rhs;
    lu_.Solve(matrix_.Height(), 1, x.GetData());
}

void ReducedSchurSystem::solveTranspose(const mfem::Vector& rhs, mfem::Vector& x) const
{
    requireAssembled("solveTranspose()");
    x = rhs;
    luTranspose_.Solve(matrix_.Height(), 1, x.GetData());
}

} // namespace mdacouple
