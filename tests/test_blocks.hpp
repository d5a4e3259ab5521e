/**
 * @file test_blocks.hpp
 * @brief Small analytic residual blocks shared by the unit tests
 *
 * - LinearBlock:  out = sum_i c_i * in_i + offset
 * - ScaledBlock:  implicit k * out - in = 0, optionally without a shortcut
 * - LiftBlock:    CL = 2 pi sin(alpha + theta)
 * - TwistBlock:   theta = K q CL / (1 + 0.1 CL^2)
 * - SqrtBlock:    out = sqrt(in), rejects negative arguments
 *
 * and the graphs built from them: the linear pair, the aeroelastic panel
 * (optionally trimmed) and the affine trim.
 */

#ifndef MDACOUPLE_TESTS_TEST_BLOCKS_HPP
#define MDACOUPLE_TESTS_TEST_BLOCKS_HPP

#include "mdacouple/blocks/balance_block.hpp"
#include "mdacouple/core/coupling_graph.hpp"
#include "mdacouple/core/errors.hpp"
#include "mdacouple/core/residual_block.hpp"
#include "mfem.hpp"
#include <cmath>
#include <memory>
#include <string>
#include <vector>

namespace testblocks
{

constexpr double TWO_PI = 6.283185307179586;
constexpr double TWIST_STIFFNESS = 0.05;
constexpr double TWIST_NONLINEARITY = 0.1;
constexpr double AFFINE_TWIST_LIFT = 0.5;
constexpr double AFFINE_TWIST_GAIN = 0.2;

/**
 * @class LinearBlock
 * @brief Explicit affine map of scalar inputs onto one scalar output
 */
class LinearBlock : public mdacouple::ExplicitBlock
{
public:
    LinearBlock(const std::string& name,
                const std::string& output,
                const std::vector<std::string>& inputs,
                const std::vector<double>& coefficients,
                double offset = 0.0)
        : mdacouple::ExplicitBlock(name),
          coefficients_(coefficients),
          offset_(offset),
          computeCount_(0)
    {
        for (const auto& input : inputs)
        {
            addInput(input);
        }
        addOutput(output);
    }

    int getComputeCount() const { return computeCount_; }

protected:
    void compute(const mfem::Vector& inputs, mfem::Vector& outputs) override
    {
        ++computeCount_;
        outputs.SetSize(1);
        outputs(0) = offset_;
        for (int i = 0; i < inputs.Size(); ++i)
        {
            outputs(0) += coefficients_[i] * inputs(i);
        }
    }

    void computeJacobianProduct(const mfem::Vector& dInputs, mfem::Vector& dOutputs) override
    {
        dOutputs.SetSize(1);
        dOutputs(0) = 0.0;
        for (int i = 0; i < dInputs.Size(); ++i)
        {
            dOutputs(0) += coefficients_[i] * dInputs(i);
        }
    }

    void computeJacobianTransposeProduct(const mfem::Vector& dOutputs,
                                         mfem::Vector& dInputs) override
    {
        for (int i = 0; i < dInputs.Size(); ++i)
        {
            dInputs(i) = coefficients_[i] * dOutputs(0);
        }
    }

private:
    std::vector<double> coefficients_;
    double offset_;
    int computeCount_;
};

/**
 * @class ScaledBlock
 * @brief Implicit scalar block R = k * out - in
 */
class ScaledBlock : public mdacouple::ResidualBlock
{
public:
    ScaledBlock(const std::string& name, double stiffness, bool shortcut = true,
                double initialValue = 0.0)
        : mdacouple::ResidualBlock(name),
          stiffness_(stiffness),
          shortcut_(shortcut),
          evaluateCount_(0)
    {
        addInput("in");
        addOutput("out", 1, initialValue);
    }

    int getEvaluateCount() const { return evaluateCount_; }

    void evaluateResidual(const mfem::Vector& inputs,
                          const mfem::Vector& outputs,
                          mfem::Vector& residual) override
    {
        ++evaluateCount_;
        residual.SetSize(1);
        residual(0) = stiffness_ * outputs(0) - inputs(0);
    }

    bool providesSolve() const override { return shortcut_; }

    void solveResidual(const mfem::Vector& inputs, mfem::Vector& outputs) override
    {
        outputs(0) = inputs(0) / stiffness_;
    }

    void applyLinear(mfem::Vector& dInputs,
                     mfem::Vector& dOutputs,
                     mfem::Vector& dResidual,
                     mdacouple::LinearMode mode) override
    {
        if (mode == mdacouple::LinearMode::Forward)
        {
            dResidual(0) = stiffness_ * dOutputs(0) - dInputs(0);
        }
        else
        {
            dOutputs(0) += stiffness_ * dResidual(0);
            dInputs(0) -= dResidual(0);
        }
    }

    void solveLinear(mfem::Vector& dOutputs,
                     mfem::Vector& dResidual,
                     mdacouple::LinearMode mode) override
    {
        if (mode == mdacouple::LinearMode::Forward)
        {
            dOutputs(0) = dResidual(0) / stiffness_;
        }
        else
        {
            dResidual(0) = dOutputs(0) / stiffness_;
        }
    }

private:
    double stiffness_;
    bool shortcut_;
    int evaluateCount_;
};

/**
 * @class LiftBlock
 * @brief Thin-airfoil lift of a twisted panel
 */
class LiftBlock : public mdacouple::ExplicitBlock
{
public:
    explicit LiftBlock(const std::string& name)
        : mdacouple::ExplicitBlock(name)
    {
        addInput("alpha");
        addInput("theta");
        addOutput("CL");
    }

protected:
    void compute(const mfem::Vector& inputs, mfem::Vector& outputs) override
    {
        outputs(0) = TWO_PI * std::sin(inputs(0) + inputs(1));
    }

    void computeJacobianProduct(const mfem::Vector& dInputs, mfem::Vector& dOutputs) override
    {
        const double slope = slopeAt(linearizedInputs());
        dOutputs(0) = slope * (dInputs(0) + dInputs(1));
    }

    void computeJacobianTransposeProduct(const mfem::Vector& dOutputs,
                                         mfem::Vector& dInputs) override
    {
        const double slope = slopeAt(linearizedInputs());
        dInputs(0) = slope * dOutputs(0);
        dInputs(1) = slope * dOutputs(0);
    }

private:
    static double slopeAt(const mfem::Vector& inputs)
    {
        return TWO_PI * std::cos(inputs(0) + inputs(1));
    }
};

/**
 * @class TwistBlock
 * @brief Elastic twist of the panel under aerodynamic moment
 */
class TwistBlock : public mdacouple::ExplicitBlock
{
public:
    TwistBlock(const std::string& name, double stiffness = TWIST_STIFFNESS)
        : mdacouple::ExplicitBlock(name),
          stiffness_(stiffness)
    {
        addInput("q");
        addInput("CL");
        addOutput("theta");
    }

protected:
    void compute(const mfem::Vector& inputs, mfem::Vector& outputs) override
    {
        const double cl = inputs(1);
        outputs(0) = stiffness_ * inputs(0) * cl / (1.0 + TWIST_NONLINEARITY * cl * cl);
    }

    void computeJacobianProduct(const mfem::Vector& dInputs, mfem::Vector& dOutputs) override
    {
        double dq = 0.0, dcl = 0.0;
        partials(dq, dcl);
        dOutputs(0) = dq * dInputs(0) + dcl * dInputs(1);
    }

    void computeJacobianTransposeProduct(const mfem::Vector& dOutputs,
                                         mfem::Vector& dInputs) override
    {
        double dq = 0.0, dcl = 0.0;
        partials(dq, dcl);
        dInputs(0) = dq * dOutputs(0);
        dInputs(1) = dcl * dOutputs(0);
    }

private:
    void partials(double& dq, double& dcl) const
    {
        const double q = linearizedInputs()(0);
        const double cl = linearizedInputs()(1);
        const double den = 1.0 + TWIST_NONLINEARITY * cl * cl;
        dq = stiffness_ * cl / den;
        dcl = stiffness_ * q * (1.0 - TWIST_NONLINEARITY * cl * cl) / (den * den);
    }

    double stiffness_;
};

/**
 * @class SqrtBlock
 * @brief out = sqrt(in); negative input leaves the valid domain
 */
class SqrtBlock : public mdacouple::ExplicitBlock
{
public:
    explicit SqrtBlock(const std::string& name)
        : mdacouple::ExplicitBlock(name)
    {
        addInput("in", 1, 1.0);
        addOutput("out", 1, 1.0);
    }

protected:
    void compute(const mfem::Vector& inputs, mfem::Vector& outputs) override
    {
        if (inputs(0) < 0.0)
        {
            throw mdacouple::NumericalDomainError(getName(), -1, "negative argument");
        }
        outputs(0) = std::sqrt(inputs(0));
    }

    void computeJacobianProduct(const mfem::Vector& dInputs, mfem::Vector& dOutputs) override
    {
        dOutputs(0) = 0.5 / std::sqrt(linearizedInputs()(0)) * dInputs(0);
    }

    void computeJacobianTransposeProduct(const mfem::Vector& dOutputs,
                                         mfem::Vector& dInputs) override
    {
        dInputs(0) = 0.5 / std::sqrt(linearizedInputs()(0)) * dOutputs(0);
    }
};

/**
 * @brief Two-way coupled pair x1 = a x2 + b, x2 = c x1 + d
 */
inline std::unique_ptr<mdacouple::CouplingGraph> makeLinearPair(double a, double b,
                                                                 double c, double d)
{
    auto graph = std::make_unique<mdacouple::CouplingGraph>();
    graph->addBlock(std::make_unique<LinearBlock>("first", "x1",
                                                  std::vector<std::string>{"x2"},
                                                  std::vector<double>{a}, b));
    graph->addBlock(std::make_unique<LinearBlock>("second", "x2",
                                                  std::vector<std::string>{"x1"},
                                                  std::vector<double>{c}, d));
    graph->connect("second.x2", "first.x2");
    graph->connect("first.x1", "second.x1");
    return graph;
}

/**
 * @brief Aeroelastic panel (lift, twist) with an optional trim balance on alpha
 *
 * Design variables: "q" (dynamic pressure), "target" (target CL, with balance)
 * or "alpha" (without balance).
 */
inline std::unique_ptr<mdacouple::CouplingGraph> makePanelGraph(bool trimmed,
                                                                double q = 2.0,
                                                                double targetOrAlpha = 0.5)
{
    auto graph = std::make_unique<mdacouple::CouplingGraph>();
    graph->addBlock(std::make_unique<LiftBlock>("aero"));
    graph->addBlock(std::make_unique<TwistBlock>("struct"));
    graph->connect("struct.theta", "aero.theta");
    graph->connect("aero.CL", "struct.CL");
    graph->addDesignVariable("q", 1, q);
    graph->connect("q", "struct.q");

    if (trimmed)
    {
        graph->addBlock(std::make_unique<mdacouple::BalanceBlock>("balance", "alpha", "CL",
                                                                  "target"),
                        "balance");
        graph->connect("balance.alpha", "aero.alpha");
        graph->connect("aero.CL", "balance.CL");
        graph->addDesignVariable("target", 1, targetOrAlpha);
        graph->connect("target", "balance.target");
    }
    else
    {
        graph->addDesignVariable("alpha", 1, targetOrAlpha);
        graph->connect("alpha", "aero.alpha");
    }
    graph->finalize();
    return graph;
}

/**
 * @brief Affine trim CL = a0 alpha + a1 theta, theta = k CL, balance CL = target
 *
 * With the analysis eliminated the balance Jacobian is a0 / (1 - a1 k).
 * @param aeroOut Receives the lift block, for counting evaluations
 * @param aeroGroup Partition label of the lift block
 */
inline std::unique_ptr<mdacouple::CouplingGraph> makeAffineTrim(
    double liftSlope = TWO_PI,
    double target = 0.5,
    LinearBlock** aeroOut = nullptr,
    const std::string& aeroGroup = "analysis")
{
    auto graph = std::make_unique<mdacouple::CouplingGraph>();
    auto aero = std::make_unique<LinearBlock>("aero", "CL",
                                              std::vector<std::string>{"alpha", "theta"},
                                              std::vector<double>{liftSlope, AFFINE_TWIST_LIFT});
    if (aeroOut)
    {
        *aeroOut = aero.get();
    }
    graph->addBlock(std::move(aero), aeroGroup);
    graph->addBlock(std::make_unique<LinearBlock>("struct", "theta",
                                                  std::vector<std::string>{"CL"},
                                                  std::vector<double>{AFFINE_TWIST_GAIN}));
    graph->addBlock(std::make_unique<mdacouple::BalanceBlock>("balance", "alpha", "CL",
                                                              "target"),
                    "balance");
    graph->addDesignVariable("target", 1, target);
    graph->connect("balance.alpha", "aero.alpha");
    graph->connect("struct.theta", "aero.theta");
    graph->connect("aero.CL", "struct.CL");
    graph->connect("aero.CL", "balance.CL");
    graph->connect("target", "balance.target");
    graph->finalize();
    return graph;
}

/**
 * @brief Closed-form trim angle of the panel for a given target lift
 */
inline double exactTrimAlpha(double q, double target, double stiffness = TWIST_STIFFNESS)
{
    const double theta = stiffness * q * target / (1.0 + TWIST_NONLINEARITY * target * target);
    return std::asin(target / TWO_PI) - theta;
}

} // namespace testblocks

#endif // MDACOUPLE_TESTS_TEST_BLOCKS_HPP
