/**
 * @file test_solver_options.cpp
 * @brief Validation of solver option structs
 */

#include <gtest/gtest.h>
#include "mdacouple/core/errors.hpp"
#include "mdacouple/core/solver_options.hpp"
#include <cmath>

#ifdef MFEM_USE_MPI
#include <mpi.h>
#endif

using namespace mdacouple;

TEST(SolverOptionsTest, DefaultsAreValid)
{
    EXPECT_NO_THROW(FixedPointOptions().validate());
    EXPECT_NO_THROW(LinearSolverOptions().validate());
    EXPECT_NO_THROW(TrimSolverOptions().validate());

    const TrimSolverOptions options;
    ASSERT_EQ(options.groupNames.size(), 2u);
    EXPECT_EQ(options.groupNames[0], "analysis");
    EXPECT_EQ(options.groupNames[1], "balance");
    EXPECT_EQ(options.schurMode, LinearMode::Transpose);
    EXPECT_TRUE(options.bounds.empty());
    EXPECT_DOUBLE_EQ(options.analysisSolver.aitken.minFactor, 0.1);
    EXPECT_DOUBLE_EQ(options.analysisSolver.aitken.maxFactor, 1.5);
}

TEST(SolverOptionsTest, RejectsBadTolerancesAndLimits)
{
    FixedPointOptions fixedPoint;
    fixedPoint.absTol = -1.0;
    EXPECT_THROW(fixedPoint.validate(), ConfigurationError);

    LinearSolverOptions linear;
    linear.maxIter = 0;
    EXPECT_THROW(linear.validate(), ConfigurationError);

    TrimSolverOptions trim;
    trim.maxSubSolves = 0;
    EXPECT_THROW(trim.validate(), ConfigurationError);

    trim = TrimSolverOptions();
    trim.singularTol = -1e-3;
    EXPECT_THROW(trim.validate(), ConfigurationError);

    trim = TrimSolverOptions();
    trim.analysisLinearSolver.relTol = -1.0;
    EXPECT_THROW(trim.validate(), ConfigurationError);
}

TEST(SolverOptionsTest, RejectsBadAitkenRange)
{
    AitkenOptions aitken;
    aitken.minFactor = 2.0;
    aitken.maxFactor = 1.0;
    EXPECT_THROW(aitken.validate("test"), ConfigurationError);

    aitken.enabled = false;
    EXPECT_NO_THROW(aitken.validate("test"));

    aitken = AitkenOptions();
    aitken.initialFactor = 0.0;
    EXPECT_THROW(aitken.validate("test"), ConfigurationError);

    aitken.initialFactor = -0.5;
    EXPECT_THROW(aitken.validate("test"), ConfigurationError);

    aitken.initialFactor = 1.2;
    EXPECT_THROW(aitken.validate("test"), ConfigurationError);

    aitken.initialFactor = std::nan("");
    EXPECT_THROW(aitken.validate("test"), ConfigurationError);

    aitken.initialFactor = 1.0;
    EXPECT_NO_THROW(aitken.validate("test"));

    aitken.minFactor = -0.1;
    EXPECT_THROW(aitken.validate("test"), ConfigurationError);
}

TEST(SolverOptionsTest, RejectsBadPartitionLabels)
{
    TrimSolverOptions options;
    options.groupNames = {"analysis"};
    EXPECT_THROW(options.validate(), ConfigurationError);

    options.groupNames = {"analysis", "analysis"};
    EXPECT_THROW(options.validate(), ConfigurationError);

    options.groupNames = {"", "balance"};
    EXPECT_THROW(options.validate(), ConfigurationError);
}

TEST(SolverOptionsTest, RejectsDuplicateBlockOrder)
{
    FixedPointOptions options;
    options.blockOrder = {"aero", "struct", "aero"};
    EXPECT_THROW(options.validate(), ConfigurationError);
}

TEST(SolverOptionsTest, BoundsMatchBalanceSize)
{
    BalanceBounds bounds;
    EXPECT_NO_THROW(bounds.validate(3));

    bounds.lower = {-1.0, -1.0};
    bounds.upper = {1.0, 1.0};
    EXPECT_NO_THROW(bounds.validate(2));
    EXPECT_THROW(bounds.validate(1), ConfigurationError);

    bounds.lower = {-1.0};
    bounds.upper = {1.0, 1.0};
    EXPECT_THROW(bounds.validate(2), ConfigurationError);

    bounds.lower = {0.5, -1.0};
    bounds.upper = {0.0, 1.0};
    EXPECT_THROW(bounds.validate(2), ConfigurationError);
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
