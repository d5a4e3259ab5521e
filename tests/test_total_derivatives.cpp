/**
 * @file test_total_derivatives.cpp
 * @brief Adjoint and forward total derivatives of converged coupled problems
 *
 * Totals are compared against central finite differences of the converged
 * outputs and, for the trimmed panel, against the closed form
 *   d(alpha)/d(q) = -K t / (1 + 0.1 t^2)
 */

#include <gtest/gtest.h>
#include <mfem.hpp>
#include "mdacouple/core/coupled_problem.hpp"
#include "mdacouple/core/errors.hpp"
#include "test_blocks.hpp"

#ifdef MFEM_USE_MPI
#include <mpi.h>
#endif

using namespace mdacouple;

namespace
{

constexpr double FD_STEP = 1e-6;
constexpr double Q = 2.0;
constexpr double TARGET = 0.5;

TrimSolverOptions accurateOptions()
{
    TrimSolverOptions options;
    options.absTol = 1e-13;
    options.relTol = 1e-13;
    options.analysisSolver.absTol = 1e-14;
    options.analysisSolver.relTol = 1e-14;
    options.analysisSolver.maxIter = 300;
    options.analysisLinearSolver.absTol = 1e-14;
    options.analysisLinearSolver.relTol = 1e-14;
    options.analysisLinearSolver.maxIter = 300;
    return options;
}

/**
 * @brief Central difference of a scalar output, leaving the input at its base value
 */
double centralDifference(CoupledProblem& problem,
                         const std::string& of,
                         const std::string& wrt,
                         double base)
{
    problem.setInput(wrt, base + FD_STEP);
    problem.solve();
    const double plus = problem.getOutput(of);

    problem.setInput(wrt, base - FD_STEP);
    problem.solve();
    const double minus = problem.getOutput(of);

    problem.setInput(wrt, base);
    problem.solve();
    return (plus - minus) / (2.0 * FD_STEP);
}

double scalarTotal(CoupledProblem& problem,
                   const std::string& of,
                   const std::string& wrt,
                   LinearMode mode)
{
    mfem::DenseMatrix jacobian;
    problem.totalDerivative(of, wrt, jacobian, mode);
    EXPECT_EQ(jacobian.Height(), 1);
    EXPECT_EQ(jacobian.Width(), 1);
    return jacobian(0, 0);
}

void expectMatchesDifference(double total, double fd)
{
    EXPECT_NEAR(total, fd, 1e-5 * std::abs(fd) + 1e-6);
}

} // namespace

TEST(TotalDerivativesTest, TrimAngleWithRespectToDynamicPressure)
{
    const double expected = -testblocks::TWIST_STIFFNESS * TARGET /
                            (1.0 + testblocks::TWIST_NONLINEARITY * TARGET * TARGET);

    for (LinearMode schurMode : {LinearMode::Transpose, LinearMode::Forward})
    {
        TrimSolverOptions options = accurateOptions();
        options.schurMode = schurMode;
        CoupledProblem problem(testblocks::makePanelGraph(true, Q, TARGET), options);
        ASSERT_TRUE(problem.hasBalance());
        problem.solve();

        const double adjoint = scalarTotal(problem, "balance.alpha", "q", LinearMode::Transpose);
        const double direct = scalarTotal(problem, "balance.alpha", "q", LinearMode::Forward);
        EXPECT_NEAR(adjoint, expected, 1e-9);
        EXPECT_NEAR(direct, expected, 1e-9);

        const double fd = centralDifference(problem, "balance.alpha", "q", Q);
        expectMatchesDifference(adjoint, fd);
    }
}

TEST(TotalDerivativesTest, TrimOutputsWithRespectToTarget)
{
    CoupledProblem problem(testblocks::makePanelGraph(true, Q, TARGET), accurateOptions());
    problem.solve();

    for (const std::string of : {"balance.alpha", "struct.theta", "aero.CL"})
    {
        const double adjoint = scalarTotal(problem, of, "target", LinearMode::Transpose);
        const double direct = scalarTotal(problem, of, "target", LinearMode::Forward);
        EXPECT_NEAR(adjoint, direct, 1e-9 * (1.0 + std::abs(direct))) << of;

        const double fd = centralDifference(problem, of, "target", TARGET);
        expectMatchesDifference(adjoint, fd);
    }

    // The trimmed lift follows its target exactly
    EXPECT_NEAR(scalarTotal(problem, "aero.CL", "target", LinearMode::Transpose), 1.0, 1e-9);
}

TEST(TotalDerivativesTest, FixedPointCouplingWithoutBalance)
{
    constexpr double alpha = 0.05;

    CoupledProblem problem(testblocks::makePanelGraph(false, Q, alpha), accurateOptions());
    ASSERT_FALSE(problem.hasBalance());
    problem.solve();

    const double dAlphaAdjoint = scalarTotal(problem, "aero.CL", "alpha", LinearMode::Transpose);
    const double dAlphaDirect = scalarTotal(problem, "aero.CL", "alpha", LinearMode::Forward);
    const double dQ = scalarTotal(problem, "aero.CL", "q", LinearMode::Transpose);
    EXPECT_NEAR(dAlphaAdjoint, dAlphaDirect, 1e-9 * std::abs(dAlphaDirect));

    expectMatchesDifference(dAlphaAdjoint, centralDifference(problem, "aero.CL", "alpha", alpha));
    expectMatchesDifference(dQ, centralDifference(problem, "aero.CL", "q", Q));
}

TEST(TotalDerivativesTest, AffineTrimHasExactTotals)
{
    CoupledProblem problem(testblocks::makeAffineTrim(), accurateOptions());
    problem.solve();

    // alpha* = target (1 - a1 k) / a0
    const double expected = (1.0 - testblocks::AFFINE_TWIST_LIFT *
                                   testblocks::AFFINE_TWIST_GAIN) / testblocks::TWO_PI;
    EXPECT_NEAR(scalarTotal(problem, "balance.alpha", "target", LinearMode::Transpose),
                expected, 1e-12);
    EXPECT_NEAR(scalarTotal(problem, "balance.alpha", "target", LinearMode::Forward),
                expected, 1e-12);
}

TEST(TotalDerivativesTest, SingularReducedSystemLeavesStateIntact)
{
    // Lift does not depend on alpha; a zero target is already balanced
    CoupledProblem problem(testblocks::makeAffineTrim(0.0, 0.0), accurateOptions());
    const SolveReport report = problem.solve();
    ASSERT_TRUE(report.converged);
    EXPECT_EQ(report.iterations, 0);

    const mfem::Vector before(problem.getGraph().getState());
    mfem::DenseMatrix jacobian;
    EXPECT_THROW(problem.totalDerivative("balance.alpha", "target", jacobian),
                 SingularSystemError);

    const mfem::Vector& after = problem.getGraph().getState();
    ASSERT_EQ(after.Size(), before.Size());
    for (int i = 0; i < before.Size(); ++i)
    {
        EXPECT_EQ(after(i), before(i));
    }
    EXPECT_DOUBLE_EQ(problem.getOutput("aero.CL"), 0.0);
}

TEST(TotalDerivativesTest, RequiresConvergedState)
{
    CoupledProblem problem(testblocks::makePanelGraph(true), accurateOptions());
    mfem::DenseMatrix jacobian;
    EXPECT_THROW(problem.totalDerivative("balance.alpha", "q", jacobian), std::runtime_error);

    problem.solve();
    EXPECT_THROW(problem.totalDerivative("balance.nothing", "q", jacobian), ConfigurationError);
    EXPECT_THROW(problem.totalDerivative("balance.alpha", "nothing", jacobian),
                 ConfigurationError);

    problem.setInput("q", 2.5);
    EXPECT_THROW(problem.totalDerivative("balance.alpha", "q", jacobian), std::runtime_error);
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
