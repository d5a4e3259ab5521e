/**
 * @file blocks/balance_block.hpp
 * @brief Balance equation R = lhs - rhs driving a balance unknown
 */

#ifndef MDACOUPLE_BLOCKS_BALANCE_BLOCK_HPP
#define MDACOUPLE_BLOCKS_BALANCE_BLOCK_HPP

#include "mdacouple/core/residual_block.hpp"
#include "mfem.hpp"
#include <string>

namespace mdacouple
{

/**
 * @class BalanceBlock
 * @brief Implicit block whose output is the unknown that makes lhs equal rhs
 *
 * Typical use is a trim condition: the output is the angle of attack, lhs the
 * computed lift coefficient and rhs its target. The residual does not depend
 * on the output, so the block has no analysis shortcut and no local inverse;
 * it is meant for the balance partition of a SchurNewtonSolver, which updates
 * the output through the Schur complement.
 */
class BalanceBlock : public ResidualBlock
{
public:
    /**
     * @param name Block name
     * @param outputName Name of the balance unknown
     * @param lhsName Input compared against rhs
     * @param rhsName Target input
     * @param size Length of the output and both inputs
     * @param initialValue Default value of the balance unknown
     */
    BalanceBlock(const std::string& name,
                 const std::string& outputName,
                 const std::string& lhsName,
                 const std::string& rhsName,
                 int size = 1,
                 double initialValue = 0.0);

    ~BalanceBlock() override = default;

    void evaluateResidual(const mfem::Vector& inputs,
                          const mfem::Vector& outputs,
                          mfem::Vector& residual) override;

    void applyLinear(mfem::Vector& dInputs,
                     mfem::Vector& dOutputs,
                     mfem::Vector& dResidual,
                     LinearMode mode) override;

    /**
     * @throws SingularSystemError always; dR/dO vanishes for a balance equation
     */
    void solveLinear(mfem::Vector& dOutputs,
                     mfem::Vector& dResidual,
                     LinearMode mode) override;

private:
    int size_;
};

} // namespace mdacouple

#endif // MDACOUPLE_BLOCKS_BALANCE_BLOCK_HPP
