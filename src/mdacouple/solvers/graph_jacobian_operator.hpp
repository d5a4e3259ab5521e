/**
 * @file solvers/graph_jacobian_operator.hpp
 * @brief Matrix-free Jacobian block of a coupling graph as an mfem::Operator
 */

#ifndef MDACOUPLE_SOLVERS_GRAPH_JACOBIAN_OPERATOR_HPP
#define MDACOUPLE_SOLVERS_GRAPH_JACOBIAN_OPERATOR_HPP

#include "mdacouple/core/coupling_graph.hpp"
#include "mfem.hpp"
#include <vector>

namespace mdacouple
{

/**
 * @class GraphJacobianOperator
 * @brief J_rows,cols = dR_rows / dx_cols at the last linearized state
 *
 * Operands are compact partition vectors: Mult takes the column partition and
 * returns the row partition, MultTranspose goes the other way. The action is
 * assembled from the blocks' applyLinear on every call; no matrix is stored.
 */
class GraphJacobianOperator : public mfem::Operator
{
public:
    GraphJacobianOperator(CouplingGraph& graph,
                          const std::vector<int>& rowBlocks,
                          const std::vector<int>& colBlocks);

    void Mult(const mfem::Vector& x, mfem::Vector& y) const override;

    void MultTranspose(const mfem::Vector& x, mfem::Vector& y) const override;

    CouplingGraph& getGraph() const { return graph_; }
    const std::vector<int>& getRowBlocks() const { return rowBlocks_; }
    const std::vector<int>& getColBlocks() const { return colBlocks_; }

private:
    CouplingGraph& graph_;
    std::vector<int> rowBlocks_;
    std::vector<int> colBlocks_;
    mutable mfem::Vector inFull_;
    mutable mfem::Vector outFull_;
};

} // namespace mdacouple

#endif // MDACOUPLE_SOLVERS_GRAPH_JACOBIAN_OPERATOR_HPP
