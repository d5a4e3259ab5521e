/**
 * @file core/residual_block.hpp
 * @brief Abstract interface for residual blocks in the coupling framework
 *
 * A residual block owns a slice of the global state (its outputs) and the
 * residual equations R(inputs, outputs) = 0 that implicitly define it. Blocks
 * never reference each other: all coupling flows through CouplingGraph edges.
 */

#ifndef MDACOUPLE_CORE_RESIDUAL_BLOCK_HPP
#define MDACOUPLE_CORE_RESIDUAL_BLOCK_HPP

#include "mfem.hpp"
#include <string>
#include <vector>

namespace mdacouple
{

/**
 * @brief Direction of a Jacobian action
 */
enum class LinearMode
{
    Forward,    // J * v
    Transpose   // J^T * v
};

/**
 * @struct VariableInfo
 * @brief Declaration of a named block input or output
 */
struct VariableInfo
{
    std::string name;
    int size = 1;
    double defaultValue = 0.0;
    bool distributed = false;   // sharded across ranks rather than replicated
};

/**
 * @class ResidualBlock
 * @brief Pure abstract base class for a coupled discipline block
 *
 * Inputs and outputs are passed as flat vectors laid out in declaration order.
 * The residual vector has the same layout as the outputs.
 */
class ResidualBlock
{
public:
    explicit ResidualBlock(const std::string& name);

    virtual ~ResidualBlock() = default;

    const std::string& getName() const { return name_; }

    const std::vector<VariableInfo>& getInputs() const { return inputs_; }
    const std::vector<VariableInfo>& getOutputs() const { return outputs_; }

    /**
     * @brief Total length of the flat input vector
     */
    int getInputSize() const;

    /**
     * @brief Total length of the flat output (and residual) vector
     */
    int getOutputSize() const;

    /**
     * @brief Index of an input by name, -1 if not declared
     */
    int findInput(const std::string& name) const;

    /**
     * @brief Index of an output by name, -1 if not declared
     */
    int findOutput(const std::string& name) const;

    int getInputOffset(int index) const;
    int getOutputOffset(int index) const;

    /**
     * @brief Evaluate R(inputs, outputs)
     *
     * Must be free of side effects beyond internal caching. Implementations throw
     * NumericalDomainError when the inputs leave the block's valid domain.
     */
    virtual void evaluateResidual(const mfem::Vector& inputs,
                                  const mfem::Vector& outputs,
                                  mfem::Vector& residual) = 0;

    /**
     * @brief Whether solveResidual() is available as an analysis shortcut
     *
     * Blocks without a shortcut are held implicit by the fixed-point solver.
     */
    virtual bool providesSolve() const { return false; }

    /**
     * @brief Drive R(inputs, outputs) to zero for the given inputs
     * @param inputs Current input values
     * @param outputs Input: current guess, output: converged outputs
     */
    virtual void solveResidual(const mfem::Vector& inputs, mfem::Vector& outputs);

    /**
     * @brief Cache the point at which applyLinear/solveLinear are evaluated
     */
    virtual void linearize(const mfem::Vector& inputs, const mfem::Vector& outputs);

    /**
     * @brief Local Jacobian action
     *
     * Forward:   dResidual = dR/dI * dInputs + dR/dO * dOutputs (overwrites)
     * Transpose: dInputs += (dR/dI)^T dResidual, dOutputs += (dR/dO)^T dResidual
     */
    virtual void applyLinear(mfem::Vector& dInputs,
                             mfem::Vector& dOutputs,
                             mfem::Vector& dResidual,
                             LinearMode mode) = 0;

    /**
     * @brief Local inverse Jacobian action with respect to the outputs
     *
     * Forward:   dOutputs  = (dR/dO)^-1 dResidual
     * Transpose: dResidual = (dR/dO)^-T dOutputs
     */
    virtual void solveLinear(mfem::Vector& dOutputs,
                             mfem::Vector& dResidual,
                             LinearMode mode) = 0;

protected:
    void addInput(const std::string& name,
                  int size = 1,
                  double defaultValue = 0.0,
                  bool distributed = false);

    void addOutput(const std::string& name,
                   int size = 1,
                   double defaultValue = 0.0,
                   bool distributed = false);

private:
    std::string name_;
    std::vector<VariableInfo> inputs_;
    std::vector<VariableInfo> outputs_;
    std::vector<int> inputOffsets_;
    std::vector<int> outputOffsets_;
};

/**
 * @class ExplicitBlock
 * @brief Block whose outputs are an explicit function O = f(I)
 *
 * The residual is R = O - f(I), so dR/dO is the identity and the analysis
 * shortcut is a single evaluation of f. Derived classes supply f and the
 * Jacobian products of f at the linearized inputs.
 */
class ExplicitBlock : public ResidualBlock
{
public:
    explicit ExplicitBlock(const std::string& name);

    ~ExplicitBlock() override = default;

    void evaluateResidual(const mfem::Vector& inputs,
                          const mfem::Vector& outputs,
                          mfem::Vector& residual) override;

    bool providesSolve() const override { return true; }

    void solveResidual(const mfem::Vector& inputs, mfem::Vector& outputs) override;

    void linearize(const mfem::Vector& inputs, const mfem::Vector& outputs) override;

    void applyLinear(mfem::Vector& dInputs,
                     mfem::Vector& dOutputs,
                     mfem::Vector& dResidual,
                     LinearMode mode) override;

    void solveLinear(mfem::Vector& dOutputs,
                     mfem::Vector& dResidual,
                     LinearMode mode) override;

protected:
    /**
     * @brief outputs = f(inputs)
     */
    virtual void compute(const mfem::Vector& inputs, mfem::Vector& outputs) = 0;

    /**
     * @brief dOutputs = df/dI * dInputs at linearizedInputs()
     */
    virtual void computeJacobianProduct(const mfem::Vector& dInputs,
                                        mfem::Vector& dOutputs) = 0;

    /**
     * @brief dInputs = (df/dI)^T * dOutputs at linearizedInputs()
     */
    virtual void computeJacobianTransposeProduct(const mfem::Vector& dOutputs,
                                                 mfem::Vector& dInputs) = 0;

    const mfem::Vector& linearizedInputs() const { return linearInputs_; }

private:
    mfem::Vector linearInputs_;
    mfem::Vector work_;
};

} // namespace mdacouple

#endif // MDACOUPLE_CORE_RESIDUAL_BLOCK_HPP
