/**
 * @file blocks/balance_block.cpp
 * @brief Implementation of the balance equation block
 */

#include "mdacouple/blocks/balance_block.hpp"
#include "mdacouple/core/errors.hpp"

namespace mdacouple
{

BalanceBlock::BalanceBlock(const std::string& name,
                           const std::string& outputName,
                           const std::string& lhsName,
                           const std::string& rhsName,
                           int size,
                           double initialValue)
    : ResidualBlock(name),
      size_(size)
{
    addInput(lhsName, size);
    addInput(rhsName, size);
    addOutput(outputName, size, initialValue);
}

void BalanceBlock::evaluateResidual(const mfem::Vector& inputs,
                                    const mfem::Vector& outputs,
                                    mfem::Vector& residual)
{
    residual.SetSize(size_);
    for (int i = 0; i < size_; ++i)
    {
        residual(i) = inputs(i) - inputs(size_ + i);
    }
}

void BalanceBlock::applyLinear(mfem::Vector& dInputs,
                               mfem::Vector& dOutputs,
                               mfem::Vector& dResidual,
                               LinearMode mode)
{
    if (mode == LinearMode::Forward)
    {
        for (int i = 0; i < size_; ++i)
        {
            dResidual(i) = dInputs(i) - dInputs(size_ + i);
        }
    }
    else
    {
        for (int i = 0; i < size_; ++i)
        {
            dInputs(i) += dResidual(i);
            dInputs(size_ + i) -= dResidual(i);
        }
    }
}

void BalanceBlock::solveLinear(mfem::Vector& dOutputs,
                               mfem::Vector& dResidual,
                               LinearMode mode)
{
    throw SingularSystemError("BalanceBlock '" + getName() +
                              "': residual does not depend on its output");
}

} // namespace mdacouple
