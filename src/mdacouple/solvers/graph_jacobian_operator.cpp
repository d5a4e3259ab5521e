/**
 * @file solvers/graph_jacobian_operator.cpp
 * @brief Implementation of the matrix-free graph Jacobian
 */

#include "mdacouple/solvers/graph_jacobian_operator.hpp"

namespace mdacouple
{

GraphJacobianOperator::GraphJacobianOperator(CouplingGraph& graph,
                                             const std::vector<int>& rowBlocks,
                                             const std::vector<int>& colBlocks)
    : mfem::Operator(graph.getPartitionSize(rowBlocks), graph.getPartitionSize(colBlocks)),
      graph_(graph),
      rowBlocks_(rowBlocks),
      colBlocks_(colBlocks)
{
}

void GraphJacobianOperator::Mult(const mfem::Vector& x, mfem::Vector& y) const
{
    inFull_.SetSize(graph_.getStateSize());
    inFull_ = 0.0;
    graph_.insertPartition(colBlocks_, x, inFull_);

    outFull_.SetSize(graph_.getStateSize());
    outFull_ = 0.0;
    graph_.applyJacobian(rowBlocks_, inFull_, nullptr, outFull_);
    graph_.extractPartition(rowBlocks_, outFull_, y);
}

void GraphJacobianOperator::MultTranspose(const mfem::Vector& x, mfem::Vector& y) const
{
    inFull_.SetSize(graph_.getStateSize());
    inFull_ = 0.0;
    graph_.insertPartition(rowBlocks_, x, inFull_);

    outFull_.SetSize(graph_.getStateSize());
    outFull_ = 0.0;
    graph_.applyJacobianTranspose(rowBlocks_, inFull_, outFull_, nullptr);
    graph_.extractPartition(colBlocks_, outFull_, y);
}

} // namespace mdacouple
