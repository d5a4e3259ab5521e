/**
 * @file test_coupling_graph.cpp
 * @brief Tests for graph wiring, state bookkeeping and Jacobian actions
 */

#include <gtest/gtest.h>
#include <mfem.hpp>
#include "mdacouple/core/coupling_graph.hpp"
#include "mdacouple/core/errors.hpp"
#include "test_blocks.hpp"

#ifdef MFEM_USE_MPI
#include <mpi.h>
#endif

using namespace mdacouple;
using testblocks::LinearBlock;
using testblocks::ScaledBlock;

namespace
{

std::unique_ptr<LinearBlock> makeLinear(const std::string& name,
                                        const std::string& output,
                                        const std::string& input,
                                        double coefficient = 1.0)
{
    return std::make_unique<LinearBlock>(name, output, std::vector<std::string>{input},
                                         std::vector<double>{coefficient});
}

} // namespace

TEST(CouplingGraphTest, OpenInputsBecomeDesignVariables)
{
    CouplingGraph graph;
    graph.addBlock(makeLinear("first", "y", "x", 2.0));
    graph.finalize();

    ASSERT_TRUE(graph.hasDesignVariable("first.x"));
    EXPECT_EQ(graph.getDesignSize(), 1);
    EXPECT_EQ(graph.getStateSize(), 1);

    graph.setDesignValue("first.x", 3.0);
    ASSERT_TRUE(graph.solveBlock(0));
    EXPECT_DOUBLE_EQ(graph.getScalarOutput("first.y"), 6.0);
}

TEST(CouplingGraphTest, StateOffsetsFollowBlockOrder)
{
    CouplingGraph graph;
    graph.addBlock(std::make_unique<BalanceBlock>("wide", "u", "lhs", "rhs", 3));
    graph.addBlock(makeLinear("narrow", "y", "x"));
    graph.finalize();

    const mfem::Array<int>& offsets = graph.getStateOffsets();
    ASSERT_EQ(offsets.Size(), 3);
    EXPECT_EQ(offsets[0], 0);
    EXPECT_EQ(offsets[1], 3);
    EXPECT_EQ(offsets[2], 4);

    const VariableSlot slot = graph.findOutput("narrow.y");
    EXPECT_EQ(slot.offset, 3);
    EXPECT_EQ(slot.size, 1);
}

TEST(CouplingGraphTest, RejectsDuplicateBlockAndEmptyLabel)
{
    CouplingGraph graph;
    graph.addBlock(makeLinear("first", "y", "x"));
    EXPECT_THROW(graph.addBlock(makeLinear("first", "z", "x")), ConfigurationError);
    EXPECT_THROW(graph.addBlock(makeLinear("second", "z", "x"), ""), ConfigurationError);
}

TEST(CouplingGraphTest, RejectsDoubleConnection)
{
    CouplingGraph graph;
    graph.addBlock(makeLinear("first", "y", "x"));
    graph.addDesignVariable("a");
    graph.addDesignVariable("b");
    graph.connect("a", "first.x");
    EXPECT_THROW(graph.connect("b", "first.x"), ConfigurationError);
}

TEST(CouplingGraphTest, UnknownEndpointsFailAtFinalize)
{
    {
        CouplingGraph graph;
        graph.addBlock(makeLinear("first", "y", "x"));
        graph.connect("missing.y", "first.x");
        EXPECT_THROW(graph.finalize(), ConfigurationError);
    }
    {
        CouplingGraph graph;
        graph.addBlock(makeLinear("first", "y", "x"));
        graph.addBlock(makeLinear("second", "z", "y"));
        graph.connect("first.nothing", "second.y");
        EXPECT_THROW(graph.finalize(), ConfigurationError);
    }
    {
        CouplingGraph graph;
        graph.addBlock(makeLinear("first", "y", "x"));
        graph.addBlock(makeLinear("second", "z", "y"));
        graph.connect("first.y", "second.nothing");
        EXPECT_THROW(graph.finalize(), ConfigurationError);
    }
}

TEST(CouplingGraphTest, RejectsSelfConnection)
{
    CouplingGraph graph;
    graph.addBlock(makeLinear("first", "y", "x"));
    graph.connect("first.y", "first.x");
    EXPECT_THROW(graph.finalize(), ConfigurationError);
}

TEST(CouplingGraphTest, SizeMismatchAndSourceIndices)
{
    {
        CouplingGraph graph;
        graph.addBlock(std::make_unique<BalanceBlock>("wide", "u", "lhs", "rhs", 2));
        graph.addBlock(makeLinear("narrow", "y", "x"));
        graph.connect("wide.u", "narrow.x");
        EXPECT_THROW(graph.finalize(), ConfigurationError);
    }
    {
        CouplingGraph graph;
        graph.addBlock(std::make_unique<BalanceBlock>("wide", "u", "lhs", "rhs", 2));
        graph.addBlock(makeLinear("narrow", "y", "x"));
        graph.connect("wide.u", "narrow.x", {2});
        EXPECT_THROW(graph.finalize(), ConfigurationError);
    }
    {
        CouplingGraph graph;
        graph.addBlock(std::make_unique<BalanceBlock>("wide", "u", "lhs", "rhs", 2));
        graph.addBlock(makeLinear("narrow", "y", "x", 10.0));
        graph.connect("wide.u", "narrow.x", {1});
        graph.finalize();

        graph.getState()(1) = 0.25;
        ASSERT_TRUE(graph.solveBlock(graph.findBlock("narrow")));
        EXPECT_DOUBLE_EQ(graph.getScalarOutput("narrow.y"), 2.5);
    }
}

TEST(CouplingGraphTest, ResetRestoresDeclaredDefaults)
{
    constexpr double initialValue = 1.5;

    CouplingGraph graph;
    graph.addBlock(std::make_unique<ScaledBlock>("held", 2.0, true, initialValue));
    graph.addBlock(makeLinear("next", "y", "out"), "other");
    graph.connect("held.out", "next.out");
    graph.finalize();

    EXPECT_DOUBLE_EQ(graph.getScalarOutput("held.out"), initialValue);
    graph.getState() = 7.0;

    graph.resetOutputs(graph.getBlocksInGroup("analysis"));
    EXPECT_DOUBLE_EQ(graph.getScalarOutput("held.out"), initialValue);
    EXPECT_DOUBLE_EQ(graph.getScalarOutput("next.y"), 7.0);

    graph.resetOutputs();
    EXPECT_DOUBLE_EQ(graph.getScalarOutput("next.y"), 0.0);
}

TEST(CouplingGraphTest, PartitionsAndGroupNames)
{
    auto graph = testblocks::makePanelGraph(true);

    const std::vector<std::string> groups = graph->getGroupNames();
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0], "analysis");
    EXPECT_EQ(groups[1], "balance");

    const std::vector<int> balance = graph->getBlocksInGroup("balance");
    ASSERT_EQ(balance.size(), 1u);
    EXPECT_EQ(graph->getPartitionSize(balance), 1);

    mfem::Vector compact(1);
    compact(0) = 0.125;
    graph->insertPartition(balance, compact, graph->getState());
    EXPECT_DOUBLE_EQ(graph->getScalarOutput("balance.alpha"), 0.125);

    mfem::Vector back;
    graph->extractPartition(balance, graph->getState(), back);
    ASSERT_EQ(back.Size(), 1);
    EXPECT_DOUBLE_EQ(back(0), 0.125);
}

TEST(CouplingGraphTest, DomainErrorCarriesIteration)
{
    CouplingGraph graph;
    graph.addBlock(std::make_unique<testblocks::SqrtBlock>("root"));
    graph.addDesignVariable("x", 1, -4.0);
    graph.connect("x", "root.in");
    graph.finalize();

    mfem::Vector residual;
    try
    {
        graph.evaluateResiduals(graph.getAllBlocks(), residual, 3);
        FAIL() << "expected NumericalDomainError";
    }
    catch (const NumericalDomainError& err)
    {
        EXPECT_EQ(err.blockName(), "root");
        EXPECT_EQ(err.iteration(), 3);
    }

    try
    {
        graph.solveBlock(0);
        FAIL() << "expected NumericalDomainError";
    }
    catch (const NumericalDomainError& err)
    {
        EXPECT_EQ(err.iteration(), -1);
    }
}

/**
 * @brief <v, J u + J_p p> must equal <J^T v, u> + <J_p^T v, p>
 */
TEST(CouplingGraphTest, JacobianTransposeIsAdjoint)
{
    auto graph = testblocks::makePanelGraph(true, 3.0, 0.4);
    mfem::Vector& state = graph->getState();
    for (int i = 0; i < state.Size(); ++i)
    {
        state(i) = 0.1 * (i + 1);
    }
    const std::vector<int> blocks = graph->getAllBlocks();
    graph->linearize(blocks);

    const int n = graph->getStateSize();
    const int m = graph->getDesignSize();
    mfem::Vector u(n), p(m), v(n);
    u.Randomize(1);
    p.Randomize(2);
    v.Randomize(3);

    mfem::Vector ju;
    graph->applyJacobian(blocks, u, &p, ju);
    const double lhs = v * ju;

    mfem::Vector dState(n), dDesign(m);
    dState = 0.0;
    dDesign = 0.0;
    graph->applyJacobianTranspose(blocks, v, dState, &dDesign);
    const double rhs = (dState * u) + (dDesign * p);

    EXPECT_NEAR(lhs, rhs, 1e-12 * (1.0 + std::abs(lhs)));
}

TEST(CouplingGraphTest, InnerProductOfReplicatedEntries)
{
    auto graph = testblocks::makePanelGraph(false);
    const std::vector<int> blocks = graph->getAllBlocks();

    mfem::Vector u(graph->getPartitionSize(blocks));
    u = 2.0;
    EXPECT_DOUBLE_EQ(graph->innerProduct(blocks, u, u), 4.0 * u.Size());
    EXPECT_DOUBLE_EQ(graph->norm(blocks, u), 2.0 * std::sqrt(static_cast<double>(u.Size())));
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
