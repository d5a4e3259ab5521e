/**
 * @file test_residual_block.cpp
 * @brief Tests for the residual block contract, ExplicitBlock and BalanceBlock
 */

#include <gtest/gtest.h>
#include <mfem.hpp>
#include "mdacouple/blocks/balance_block.hpp"
#include "mdacouple/core/errors.hpp"
#include "test_blocks.hpp"

#ifdef MFEM_USE_MPI
#include <mpi.h>
#endif

using namespace mdacouple;

namespace
{

class DeclaringBlock : public ExplicitBlock
{
public:
    DeclaringBlock() : ExplicitBlock("declaring")
    {
        addInput("a", 2);
        addInput("b", 3, 1.0);
        addOutput("u", 1);
        addOutput("v", 4, -2.0, true);
    }

    void declareInput(const std::string& name, int size) { addInput(name, size); }
    void declareOutput(const std::string& name, int size) { addOutput(name, size); }

protected:
    void compute(const mfem::Vector&, mfem::Vector& outputs) override { outputs = 0.0; }
    void computeJacobianProduct(const mfem::Vector&, mfem::Vector& dOutputs) override
    {
        dOutputs = 0.0;
    }
    void computeJacobianTransposeProduct(const mfem::Vector&, mfem::Vector& dInputs) override
    {
        dInputs = 0.0;
    }
};

} // namespace

TEST(ResidualBlockTest, VariableLayout)
{
    DeclaringBlock block;
    EXPECT_EQ(block.getInputSize(), 5);
    EXPECT_EQ(block.getOutputSize(), 5);
    EXPECT_EQ(block.findInput("b"), 1);
    EXPECT_EQ(block.findInput("c"), -1);
    EXPECT_EQ(block.findOutput("v"), 1);
    EXPECT_EQ(block.getInputOffset(1), 2);
    EXPECT_EQ(block.getOutputOffset(1), 1);
    EXPECT_TRUE(block.getOutputs()[1].distributed);
    EXPECT_DOUBLE_EQ(block.getOutputs()[1].defaultValue, -2.0);
}

TEST(ResidualBlockTest, RejectsBadDeclarations)
{
    DeclaringBlock block;
    EXPECT_THROW(block.declareInput("a", 1), ConfigurationError);
    EXPECT_THROW(block.declareOutput("u", 1), ConfigurationError);
    EXPECT_THROW(block.declareInput("c", 0), ConfigurationError);
    EXPECT_THROW(testblocks::LiftBlock(""), std::invalid_argument);
}

TEST(ExplicitBlockTest, ResidualAndShortcut)
{
    testblocks::LinearBlock block("sum", "y", {"a", "b"}, {2.0, -1.0}, 0.5);
    ASSERT_TRUE(block.providesSolve());

    mfem::Vector inputs(2), outputs(1), residual;
    inputs(0) = 3.0;
    inputs(1) = 1.0;
    outputs(0) = 1.0;

    block.evaluateResidual(inputs, outputs, residual);
    EXPECT_DOUBLE_EQ(residual(0), 1.0 - 5.5);

    block.solveResidual(inputs, outputs);
    EXPECT_DOUBLE_EQ(outputs(0), 5.5);
    block.evaluateResidual(inputs, outputs, residual);
    EXPECT_DOUBLE_EQ(residual(0), 0.0);
}

TEST(ExplicitBlockTest, LinearActionsAreTransposes)
{
    testblocks::LiftBlock block("aero");
    mfem::Vector inputs(2), outputs(1);
    inputs(0) = 0.1;
    inputs(1) = 0.02;
    outputs = 0.0;
    block.linearize(inputs, outputs);

    mfem::Vector dInputs(2), dOutputs(1), dResidual(1);
    dInputs(0) = 0.3;
    dInputs(1) = -0.7;
    dOutputs(0) = 1.1;
    block.applyLinear(dInputs, dOutputs, dResidual, LinearMode::Forward);
    const double slope = testblocks::TWO_PI * std::cos(0.12);
    EXPECT_NEAR(dResidual(0), 1.1 - slope * (0.3 - 0.7), 1e-14);

    // <w, J [dI; dO]> == <J^T w, [dI; dO]>
    mfem::Vector w(1), tInputs(2), tOutputs(1);
    w(0) = 0.9;
    tInputs = 0.0;
    tOutputs = 0.0;
    block.applyLinear(tInputs, tOutputs, w, LinearMode::Transpose);
    EXPECT_NEAR(w(0) * dResidual(0),
                tInputs * dInputs + tOutputs * dOutputs, 1e-14);

    mfem::Vector x(1), r(1);
    r(0) = 4.0;
    block.solveLinear(x, r, LinearMode::Forward);
    EXPECT_DOUBLE_EQ(x(0), 4.0);
}

TEST(BalanceBlockTest, ResidualIsDifference)
{
    BalanceBlock block("trim", "alpha", "CL", "target", 2, 0.1);
    EXPECT_FALSE(block.providesSolve());
    EXPECT_DOUBLE_EQ(block.getOutputs()[0].defaultValue, 0.1);

    mfem::Vector inputs(4), outputs(2), residual;
    inputs(0) = 0.6;
    inputs(1) = 0.2;
    inputs(2) = 0.5;
    inputs(3) = 0.5;
    outputs = 0.0;
    block.evaluateResidual(inputs, outputs, residual);
    EXPECT_NEAR(residual(0), 0.1, 1e-15);
    EXPECT_NEAR(residual(1), -0.3, 1e-15);

    mfem::Vector dInputs(4), dOutputs(2), dResidual(2);
    dResidual = 1.0;
    dInputs = 0.0;
    dOutputs = 0.0;
    block.applyLinear(dInputs, dOutputs, dResidual, LinearMode::Transpose);
    EXPECT_DOUBLE_EQ(dInputs(0), 1.0);
    EXPECT_DOUBLE_EQ(dInputs(3), -1.0);
    EXPECT_DOUBLE_EQ(dOutputs.Norml2(), 0.0);

    EXPECT_THROW(block.solveLinear(dOutputs, dResidual, LinearMode::Forward),
                 SingularSystemError);
}

int main(int argc, char** argv)
{
#ifdef MFEM_USE_MPI
    MPI_Init(&argc, &argv);
#endif

    ::testing::InitGoogleTest(&argc, argv);
    int result = RUN_ALL_TESTS();

#ifdef MFEM_USE_MPI
    MPI_Finalize();
#endif

    return result;
}
