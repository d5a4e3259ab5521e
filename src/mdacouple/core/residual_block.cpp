/**
 * @file core/residual_block.cpp
 * @brief Variable bookkeeping for ResidualBlock and the ExplicitBlock base
 */

#include "mdacouple/core/residual_block.hpp"
#include "mdacouple/core/errors.hpp"
#include <stdexcept>

namespace mdacouple
{

ResidualBlock::ResidualBlock(const std::string& name)
    : name_(name)
{
    if (name_.empty())
    {
        throw std::invalid_argument("ResidualBlock: block name must not be empty");
    }
}

int ResidualBlock::getInputSize() const
{
    int size = 0;
    for (const auto& var : inputs_)
    {
        size += var.size;
    }
    return size;
}

int ResidualBlock::getOutputSize() const
{
    int size = 0;
    for (const auto& var : outputs_)
    {
        size += var.size;
    }
    return size;
}

int ResidualBlock::findInput(const std::string& name) const
{
    for (std::size_t i = 0; i < inputs_.size(); ++i)
    {
        if (inputs_[i].name == name)
        {
            return static_cast<int>(i);
        }
    }
    return -1;
}

int ResidualBlock::findOutput(const std::string& name) const
{
    for (std::size_t i = 0; i < outputs_.size(); ++i)
    {
        if (outputs_[i].name == name)
        {
            return static_cast<int>(i);
        }
    }
    return -1;
}

int ResidualBlock::getInputOffset(int index) const
{
    return inputOffsets_.at(index);
}

int ResidualBlock::getOutputOffset(int index) const
{
    return outputOffsets_.at(index);
}

void ResidualBlock::solveResidual(const mfem::Vector& inputs, mfem::Vector& outputs)
{
    throw std::logic_error("ResidualBlock '" + name_ +
                           "' does not provide an analysis shortcut");
}

void ResidualBlock::linearize(const mfem::Vector& inputs, const mfem::Vector& outputs)
{
}

void ResidualBlock::addInput(const std::string& name,
                             int size,
                             double defaultValue,
                             bool distributed)
{
    if (size <= 0)
    {
        throw ConfigurationError("block '" + name_ + "': input '" + name +
                                 "' must have positive size");
    }
    if (findInput(name) >= 0)
    {
        throw ConfigurationError("block '" + name_ + "': input '" + name +
                                 "' declared twice");
    }
    inputOffsets_.push_back(getInputSize());
    inputs_.push_back(VariableInfo{name, size, defaultValue, distributed});
}

void ResidualBlock::addOutput(const std::string& name,
                              int size,
                              double defaultValue,
                              bool distributed)
{
    if (size <= 0)
    {
        throw ConfigurationError("block '" + name_ + "': output '" + name +
                                 "' must have positive size");
    }
    if (findOutput(name) >= 0)
    {
        throw ConfigurationError("block '" + name_ + "': output '" + name +
                                 "' declared twice");
    }
    outputOffsets_.push_back(getOutputSize());
    outputs_.push_back(VariableInfo{name, size, defaultValue, distributed});
}

// ======================================================================

ExplicitBlock::ExplicitBlock(const std::string& name)
    : ResidualBlock(name)
{
}

void ExplicitBlock::evaluateResidual(const mfem::Vector& inputs,
                                     const mfem::Vector& outputs,
                                     mfem::Vector& residual)
{
    work_.SetSize(outputs.Size());
    compute(inputs, work_);
    residual.SetSize(outputs.Size());
    subtract(outputs, work_, residual);
}

void ExplicitBlock::solveResidual(const mfem::Vector& inputs, mfem::Vector& outputs)
{
    compute(inputs, outputs);
}

void ExplicitBlock::linearize(const mfem::Vector& inputs, const mfem::Vector& outputs)
{
    linearInputs_ = inputs;
}

void ExplicitBlock::applyLinear(mfem::Vector& dInputs,
                                mfem::Vector& dOutputs,
                                mfem::Vector& dResidual,
                                LinearMode mode)
{
    if (mode == LinearMode::Forward)
    {
        // dR = dO - df/dI dI
        work_.SetSize(dOutputs.Size());
        computeJacobianProduct(dInputs, work_);
        subtract(dOutputs, work_, dResidual);
    }
    else
    {
        dOutputs += dResidual;
        work_.SetSize(dInputs.Size());
        computeJacobianTransposeProduct(dResidual, work_);
        dInputs.Add(-1.0, work_);
    }
}

void ExplicitBlock::solveLinear(mfem::Vector& dOutputs,
                                mfem::Vector& dResidual,
                                LinearMode mode)
{
    if (mode == LinearMode::Forward)
    {
        dOutputs = dResidual;
    }
    else
    {
        dResidual = dOutputs;
    }
}

} // namespace mdacouple
