/**
 * @file test_solver_block_gauss_seidel.cpp
 * @brief Tests for the linear block Gauss-Seidel solver
 *
 * The coupled pair x1 = a x2 + b, x2 = c x1 + d has the constant Jacobian
 *   J = [ 1  -a ]
 *       [ -c  1 ]
 * so forward and transposed solves can be checked against closed forms.
 */

#include <gtest/gtest.h>
#include <mfem.hpp>
#include "mdacouple/core/errors.hpp"
#include "mdacouple/solvers/graph_jacobian_operator.hpp"
#include "mdacouple/solvers/solver_block_gauss_seidel.hpp"
#include "test_blocks.hpp"

#ifdef MFEM_USE_MPI
#include <mpi.h>
#endif

using namespace mdacouple;

namespace
{

constexpr double A = 0.5;
constexpr double C = 0.8;

std::unique_ptr<CouplingGraph> makeLinearizedPair(double a, double c)
{
    auto graph = testblocks::makeLinearPair(a, 1.0, c, 2.0);
    graph->finalize();
    graph->linearize(graph->getAllBlocks());
    return graph;
}

} // namespace

TEST(LinearBlockGaussSeidelTest, ForwardSolveMatchesClosedForm)
{
    auto graph = makeLinearizedPair(A, C);
    const std::vector<int> blocks = graph->getAllBlocks();
    LinearBlockGaussSeidel solver(*graph, blocks, LinearSolverOptions());

    mfem::Vector b(2), x;
    b(0) = 1.0;
    b(1) = 2.0;
    solver.Mult(b, x);

    // x1 - a x2 = 1, -c x1 + x2 = 2
    const double det = 1.0 - A * C;
    EXPECT_NEAR(x(0), (1.0 + A * 2.0) / det, 1e-10);
    EXPECT_NEAR(x(1), (2.0 + C * 1.0) / det, 1e-10);
    EXPECT_GT(solver.getNumIterations(), 0);
    EXPECT_LE(solver.getFinalNorm(), 1e-12 * b.Norml2());
}

TEST(LinearBlockGaussSeidelTest, TransposeSolveMatchesClosedForm)
{
    auto graph = makeLinearizedPair(A, C);
    const std::vector<int> blocks = graph->getAllBlocks();
    LinearBlockGaussSeidel solver(*graph, blocks, LinearSolverOptions());

    mfem::Vector b(2), x;
    b(0) = 1.0;
    b(1) = 2.0;
    solver.MultTranspose(b, x);

    // x1 - c x2 = 1, -a x1 + x2 = 2
    const double det = 1.0 - A * C;
    EXPECT_NEAR(x(0), (1.0 + C * 2.0) / det, 1e-10);
    EXPECT_NEAR(x(1), (2.0 + A * 1.0) / det, 1e-10);
}

TEST(LinearBlockGaussSeidelTest, ResidualAgainstJacobianOperator)
{
    auto graph = testblocks::makePanelGraph(false, 2.0, 0.05);
    const std::vector<int> blocks = graph->getAllBlocks();
    mfem::Vector& state = graph->getState();
    state(0) = 0.4;
    state(1) = 0.03;
    graph->linearize(blocks);

    GraphJacobianOperator jacobian(*graph, blocks, blocks);
    LinearBlockGaussSeidel solver(*graph, blocks, LinearSolverOptions());
    solver.SetOperator(jacobian);

    mfem::Vector b(2), x, r(2);
    b(0) = 0.7;
    b(1) = -0.2;

    solver.Mult(b, x);
    jacobian.Mult(x, r);
    r -= b;
    EXPECT_LT(r.Norml2(), 1e-10);

    solver.MultTranspose(b, x);
    jacobian.MultTranspose(x, r);
    r -= b;
    EXPECT_LT(r.Norml2(), 1e-10);
}

TEST(LinearBlockGaussSeidelTest, ZeroRightHandSideReturnsImmediately)
{
    auto graph = makeLinearizedPair(A, C);
    LinearBlockGaussSeidel solver(*graph, graph->getAllBlocks(), LinearSolverOptions());

    mfem::Vector b(2), x;
    b = 0.0;
    solver.Mult(b, x);
    EXPECT_EQ(solver.getNumIterations(), 0);
    EXPECT_DOUBLE_EQ(x.Norml2(), 0.0);
}

TEST(LinearBlockGaussSeidelTest, DivergentCouplingThrows)
{
    auto graph = makeLinearizedPair(2.0, 2.0);
    LinearSolverOptions options;
    options.aitken.enabled = false;
    options.maxIter = 8;
    LinearBlockGaussSeidel solver(*graph, graph->getAllBlocks(), options);

    mfem::Vector b(2), x;
    b = 1.0;
    EXPECT_THROW(solver.Mult(b, x), CouplingDivergedError);
    EXPECT_THROW(solver.MultTranspose(b, x), CouplingDivergedError);
}

TEST(LinearBlockGaussSeidelTest, SetOperatorRequiresDiagonalPartition)
{
    auto graph = makeLinearizedPair(A, C);
    const std::vector<int> first = {0};
    const std::vector<int> second = {1};
    LinearBlockGaussSeidel solver(*graph, first, LinearSolverOptions());

    GraphJacobianOperator offDiagonal(*graph, first, second);
    EXPECT_THROW(solver.SetOperator(offDiagonal), std::invalid_argument);

    mfem::DenseMatrix dense(1);
    EXPECT_THROW(solver.SetOperator(dense), std::invalid_argument);

    GraphJacobianOperator diagonal(*graph, second, second);
    solver.SetOperator(diagonal);
    EXPECT_EQ(solver.getBlocks(), second);
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
