/**
 * @file solvers/solver_block_gauss_seidel.cpp
 * @brief Implementation of the linear block Gauss-Seidel solver
 */

#include "mdacouple/solvers/solver_block_gauss_seidel.hpp"
#include "mdacouple/core/errors.hpp"
#include "mdacouple/solvers/aitken_relaxation.hpp"
#include "mdacouple/solvers/graph_jacobian_operator.hpp"
#include <iostream>
#include <stdexcept>

namespace mdacouple
{

LinearBlockGaussSeidel::LinearBlockGaussSeidel(CouplingGraph& graph,
                                               const std::vector<int>& blocks,
                                               const LinearSolverOptions& options)
    : mfem::Solver(graph.getPartitionSize(blocks)),
      graph_(graph),
      blocks_(blocks),
      options_(options),
      numIterations_(0),
      finalNorm_(0.0)
{
    if (blocks_.empty())
    {
        throw std::invalid_argument("LinearBlockGaussSeidel: empty partition");
    }
}

void LinearBlockGaussSeidel::SetOperator(const mfem::Operator& op)
{
    const auto* jacobian = dynamic_cast<const GraphJacobianOperator*>(&op);
    if (!jacobian)
    {
        throw std::invalid_argument("LinearBlockGaussSeidel::SetOperator: Operator must be "
                                    "a GraphJacobianOperator");
    }
    if (&jacobian->getGraph() != &graph_ ||
        jacobian->getRowBlocks() != jacobian->getColBlocks())
    {
        throw std::invalid_argument("LinearBlockGaussSeidel::SetOperator: expected a diagonal "
                                    "partition of the same graph");
    }
    blocks_ = jacobian->getRowBlocks();
    height = width = op.Height();
}

void LinearBlockGaussSeidel::sliceOf(int block, const mfem::Vector& full,
                                     mfem::Vector& slice) const
{
    const mfem::Array<int>& offsets = graph_.getStateOffsets();
    slice.SetSize(offsets[block + 1] - offsets[block]);
    for (int i = 0; i < slice.Size(); ++i)
    {
        slice(i) = full(offsets[block] + i);
    }
}

void LinearBlockGaussSeidel::storeSlice(int block, const mfem::Vector& slice,
                                        mfem::Vector& full) const
{
    const mfem::Array<int>& offsets = graph_.getStateOffsets();
    for (int i = 0; i < slice.Size(); ++i)
    {
        full(offsets[block] + i) = slice(i);
    }
}

void LinearBlockGaussSeidel::addCouplingTranspose(int block,
                                                  const mfem::Vector& lambda,
                                                  mfem::Vector& coupling) const
{
    ResidualBlock& blk = graph_.getBlock(block);
    dInputs_.SetSize(blk.getInputSize());
    dInputs_ = 0.0;
    dOutputs_.SetSize(blk.getOutputSize());
    dOutputs_ = 0.0;
    seed_ = lambda;
    blk.applyLinear(dInputs_, dOutputs_, seed_, LinearMode::Transpose);
    graph_.scatterInputsTranspose(block, dInputs_, coupling, nullptr);
}

bool LinearBlockGaussSeidel::checkConvergence(const char* direction,
                                              int iteration,
                                              double norm,
                                              double norm0) const
{
    numIterations_ = iteration;
    finalNorm_ = norm;

    if (options_.printLevel > 1 && graph_.isRoot())
    {
        std::cout << "  LNBGS " << direction << " iteration " << iteration
                  << ", residual norm = " << norm
                  << ", relative = " << norm / norm0 << std::endl;
    }

    if (norm <= options_.absTol || norm <= options_.relTol * norm0)
    {
        if (options_.printLevel > 0 && graph_.isRoot())
        {
            std::cout << "LNBGS " << direction << " converged in " << iteration
                      << " iterations, final norm = " << norm << std::endl;
        }
        return true;
    }
    if (iteration >= options_.maxIter)
    {
        if (options_.printLevel > 0 && graph_.isRoot())
        {
            std::cout << "LNBGS " << direction << ": Maximum iterations reached. Final norm: "
                      << norm << std::endl;
        }
        throw CouplingDivergedError("LinearBlockGaussSeidel", iteration, norm);
    }
    return false;
}

void LinearBlockGaussSeidel::Mult(const mfem::Vector& b, mfem::Vector& x) const
{
    options_.validate();
    if (b.Size() != height)
    {
        throw std::invalid_argument("LinearBlockGaussSeidel::Mult: size mismatch");
    }

    x.SetSize(height);
    x = 0.0;
    numIterations_ = 0;
    finalNorm_ = graph_.norm(blocks_, b);
    if (finalNorm_ == 0.0)
    {
        return;
    }
    const double norm0 = finalNorm_;

    const int stateSize = graph_.getStateSize();
    xFull_.SetSize(stateSize);
    xFull_ = 0.0;
    rhsFull_.SetSize(stateSize);
    rhsFull_ = 0.0;
    graph_.insertPartition(blocks_, b, rhsFull_);

    AitkenRelaxation aitken(options_.aitken, graph_, blocks_);

    for (int iter = 1; ; ++iter)
    {
        xOld_ = x;
        for (int block : blocks_)
        {
            // rhs_b = b_b - dR_b/dI * x_I, then x_b = (dR_b/dO)^-1 rhs_b
            ResidualBlock& blk = graph_.getBlock(block);
            graph_.gatherInputs(block, xFull_, nullptr, dInputs_);
            dOutputs_.SetSize(blk.getOutputSize());
            dOutputs_ = 0.0;
            dResidual_.SetSize(blk.getOutputSize());
            blk.applyLinear(dInputs_, dOutputs_, dResidual_, LinearMode::Forward);

            sliceOf(block, rhsFull_, rhs_);
            rhs_ -= dResidual_;
            slice_.SetSize(blk.getOutputSize());
            blk.solveLinear(slice_, rhs_, LinearMode::Forward);
            storeSlice(block, slice_, xFull_);
        }
        graph_.extractPartition(blocks_, xFull_, x);

        delta_.SetSize(x.Size());
        subtract(x, xOld_, delta_);
        const double theta = aitken.computeFactor(delta_);
        if (theta != 1.0)
        {
            AitkenRelaxation::relax(xOld_, delta_, theta, x);
            graph_.insertPartition(blocks_, x, xFull_);
        }
        graph_.barrier();

        residualFull_.SetSize(stateSize);
        residualFull_ = 0.0;
        graph_.applyJacobian(blocks_, xFull_, nullptr, residualFull_);
        graph_.extractPartition(blocks_, residualFull_, residual_);
        subtract(b, residual_, residual_);

        if (checkConvergence("fwd", iter, graph_.norm(blocks_, residual_), norm0))
        {
            return;
        }
    }
}

void LinearBlockGaussSeidel::MultTranspose(const mfem::Vector& b, mfem::Vector& x) const
{
    options_.validate();
    if (b.Size() != height)
    {
        throw std::invalid_argument("LinearBlockGaussSeidel::MultTranspose: size mismatch");
    }

    x.SetSize(height);
    x = 0.0;
    numIterations_ = 0;
    finalNorm_ = graph_.norm(blocks_, b);
    if (finalNorm_ == 0.0)
    {
        return;
    }
    const double norm0 = finalNorm_;

    const int stateSize = graph_.getStateSize();
    xFull_.SetSize(stateSize);
    xFull_ = 0.0;
    coupling_.SetSize(stateSize);
    coupling_ = 0.0;
    rhsFull_.SetSize(stateSize);
    rhsFull_ = 0.0;
    graph_.insertPartition(blocks_, b, rhsFull_);

    AitkenRelaxation aitken(options_.aitken, graph_, blocks_);

    for (int iter = 1; ; ++iter)
    {
        xOld_ = x;
        for (auto it = blocks_.rbegin(); it != blocks_.rend(); ++it)
        {
            // (dR_b/dO)^T x_b = b_b - sum_c (dR_c/dI_b)^T x_c
            const int block = *it;
            ResidualBlock& blk = graph_.getBlock(block);
            sliceOf(block, rhsFull_, rhs_);
            sliceOf(block, coupling_, slice_);
            rhs_ -= slice_;

            sliceOf(block, xFull_, slice_);
            dResidual_.SetSize(blk.getOutputSize());
            blk.solveLinear(rhs_, dResidual_, LinearMode::Transpose);

            subtract(dResidual_, slice_, slice_);
            addCouplingTranspose(block, slice_, coupling_);
            storeSlice(block, dResidual_, xFull_);
        }
        graph_.extractPartition(blocks_, xFull_, x);

        delta_.SetSize(x.Size());
        subtract(x, xOld_, delta_);
        const double theta = aitken.computeFactor(delta_);
        if (theta != 1.0)
        {
            AitkenRelaxation::relax(xOld_, delta_, theta, x);
            graph_.insertPartition(blocks_, x, xFull_);
            coupling_ = 0.0;
            for (int block : blocks_)
            {
                sliceOf(block, xFull_, slice_);
                addCouplingTranspose(block, slice_, coupling_);
            }
        }
        graph_.barrier();

        residualFull_.SetSize(stateSize);
        residualFull_ = 0.0;
        graph_.applyJacobianTranspose(blocks_, xFull_, residualFull_, nullptr);
        graph_.extractPartition(blocks_, residualFull_, residual_);
        subtract(b, residual_, residual_);

        if (checkConvergence("rev", iter, graph_.norm(blocks_, residual_), norm0))
        {
            return;
        }
    }
}

} // namespace mdacouple
