#include "mfem.hpp"
#include "mdacouple/blocks/balance_block.hpp"
#include "mdacouple/core/coupled_problem.hpp"
#include "mdacouple/core/errors.hpp"
#include "mdacouple/core/trimmed_analysis.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>

/**
 * Example: Trimmed Aerostructural Panel
 *
 * A flexible lifting panel is trimmed to a target lift coefficient. Three
 * disciplines take part in the coupled iteration:
 * 1. aero:   CL = a0 sin(alpha + theta)
 * 2. ldxfer: torque = q c^2 e CL (load transfer to the elastic axis)
 * 3. struct: (GJ / b) (theta + beta theta^3) = torque (stiffening torsion spring)
 *
 * The structural mesh block sets the span b = AR c before the coupled loop,
 * and the post-coupling blocks compute the induced drag and the panel mass:
 *   CD   = CD0 + CL^2 / (pi AR)
 *   mass = m'' b c
 *
 * TRIM PROCEDURE:
 * ---------------
 * The balance block R = CL - CL_target drives alpha. The Schur-Newton solver
 * converges the aero/ldxfer/struct loop with Aitken-relaxed block Gauss-Seidel
 * for every alpha, then updates alpha with the reduced (Schur complement)
 * Jacobian d(CL)/d(alpha) of the coupled system.
 *
 * The adjoint totals of alpha, CD and mass with respect to q, the target and
 * the chord are compared against the forward totals and central differences.
 */

using namespace mfem;
using namespace mdacouple;

namespace
{

constexpr double LIFT_SLOPE = 6.283185307179586;   // 2 pi [1/rad]
constexpr double ECCENTRICITY = 0.25;                // elastic axis offset / chord
constexpr double TORSION_STIFFNESS = 40.0;           // GJ
constexpr double STIFFENING = 2.0;                   // beta [1/rad^2]
constexpr double PARASITE_DRAG = 0.01;               // CD0
constexpr double AREAL_MASS = 2.5;                   // m''
constexpr int SPRING_NEWTON_ITERS = 50;
constexpr double SPRING_NEWTON_TOL = 1.0e-14;

/// CL = a0 sin(alpha + theta)
class LiftBlock : public ExplicitBlock
{
public:
    explicit LiftBlock(const std::string& name) : ExplicitBlock(name)
    {
        addInput("alpha");
        addInput("theta");
        addOutput("CL");
    }

protected:
    void compute(const Vector& inputs, Vector& outputs) override
    {
        outputs(0) = LIFT_SLOPE * std::sin(inputs(0) + inputs(1));
    }

    void computeJacobianProduct(const Vector& dInputs, Vector& dOutputs) override
    {
        dOutputs(0) = slope() * (dInputs(0) + dInputs(1));
    }

    void computeJacobianTransposeProduct(const Vector& dOutputs, Vector& dInputs) override
    {
        dInputs(0) = slope() * dOutputs(0);
        dInputs(1) = slope() * dOutputs(0);
    }

private:
    double slope() const
    {
        const Vector& x = linearizedInputs();
        return LIFT_SLOPE * std::cos(x(0) + x(1));
    }
};

/// torque = q c^2 e CL
class LoadTransferBlock : public ExplicitBlock
{
public:
    explicit LoadTransferBlock(const std::string& name) : ExplicitBlock(name)
    {
        addInput("CL");
        addInput("q", 1, 2.0);
        addInput("chord", 1, 1.0);
        addOutput("torque");
    }

protected:
    void compute(const Vector& inputs, Vector& outputs) override
    {
        outputs(0) = inputs(1) * inputs(2) * inputs(2) * ECCENTRICITY * inputs(0);
    }

    void computeJacobianProduct(const Vector& dInputs, Vector& dOutputs) override
    {
        const Vector& x = linearizedInputs();
        const double c2 = x(2) * x(2);
        dOutputs(0) = ECCENTRICITY * (x(1) * c2 * dInputs(0) +
                                      x(0) * c2 * dInputs(1) +
                                      2.0 * x(0) * x(1) * x(2) * dInputs(2));
    }

    void computeJacobianTransposeProduct(const Vector& dOutputs, Vector& dInputs) override
    {
        const Vector& x = linearizedInputs();
        const double c2 = x(2) * x(2);
        dInputs(0) = ECCENTRICITY * x(1) * c2 * dOutputs(0);
        dInputs(1) = ECCENTRICITY * x(0) * c2 * dOutputs(0);
        dInputs(2) = ECCENTRICITY * 2.0 * x(0) * x(1) * x(2) * dOutputs(0);
    }
};

/**
 * @brief Stiffening torsion spring R = (GJ / b)(theta + beta theta^3) - torque
 *
 * Implicit block; its analysis shortcut is a local Newton solve on theta.
 */
class TorsionSpringBlock : public ResidualBlock
{
public:
    explicit TorsionSpringBlock(const std::string& name)
        : ResidualBlock(name), inputs_(2), outputs_(1)
    {
        addInput("torque");
        addInput("span", 1, 1.0);
        addOutput("theta");
    }

    void evaluateResidual(const Vector& inputs,
                          const Vector& outputs,
                          Vector& residual) override
    {
        checkSpan(inputs(1));
        residual.SetSize(1);
        residual(0) = stiffness(inputs(1)) * twist(outputs(0)) - inputs(0);
    }

    bool providesSolve() const override { return true; }

    void solveResidual(const Vector& inputs, Vector& outputs) override
    {
        checkSpan(inputs(1));
        const double k = stiffness(inputs(1));
        double theta = outputs(0);
        for (int it = 0; it < SPRING_NEWTON_ITERS; ++it)
        {
            const double r = k * twist(theta) - inputs(0);
            const double step = r / (k * twistSlope(theta));
            theta -= step;
            if (std::abs(step) <= SPRING_NEWTON_TOL * (1.0 + std::abs(theta)))
            {
                outputs(0) = theta;
                return;
            }
        }
        throw NumericalDomainError(getName(), -1, "torsion spring Newton did not converge");
    }

    void linearize(const Vector& inputs, const Vector& outputs) override
    {
        inputs_ = inputs;
        outputs_ = outputs;
    }

    void applyLinear(Vector& dInputs,
                     Vector& dOutputs,
                     Vector& dResidual,
                     LinearMode mode) override
    {
        const double span = inputs_(1);
        const double dTheta = stiffness(span) * twistSlope(outputs_(0));
        const double dSpan = -TORSION_STIFFNESS / (span * span) * twist(outputs_(0));

        if (mode == LinearMode::Forward)
        {
            dResidual(0) = dTheta * dOutputs(0) - dInputs(0) + dSpan * dInputs(1);
        }
        else
        {
            dOutputs(0) += dTheta * dResidual(0);
            dInputs(0) -= dResidual(0);
            dInputs(1) += dSpan * dResidual(0);
        }
    }

    void solveLinear(Vector& dOutputs, Vector& dResidual, LinearMode mode) override
    {
        const double dTheta = stiffness(inputs_(1)) * twistSlope(outputs_(0));
        if (mode == LinearMode::Forward)
        {
            dOutputs(0) = dResidual(0) / dTheta;
        }
        else
        {
            dResidual(0) = dOutputs(0) / dTheta;
        }
    }

private:
    static double stiffness(double span) { return TORSION_STIFFNESS / span; }
    static double twist(double theta) { return theta + STIFFENING * theta * theta * theta; }
    static double twistSlope(double theta) { return 1.0 + 3.0 * STIFFENING * theta * theta; }

    void checkSpan(double span) const
    {
        if (span <= 0.0)
        {
            throw NumericalDomainError(getName(), -1, "non-positive span");
        }
    }

    Vector inputs_;
    Vector outputs_;
};

/// CD = CD0 + CL^2 / (pi AR)
class DragBlock : public ExplicitBlock
{
public:
    explicit DragBlock(const std::string& name) : ExplicitBlock(name)
    {
        addInput("CL");
        addInput("aspect_ratio", 1, 8.0);
        addOutput("CD");
    }

protected:
    void compute(const Vector& inputs, Vector& outputs) override
    {
        outputs(0) = PARASITE_DRAG + inputs(0) * inputs(0) / (M_PI * inputs(1));
    }

    void computeJacobianProduct(const Vector& dInputs, Vector& dOutputs) override
    {
        const Vector& x = linearizedInputs();
        dOutputs(0) = 2.0 * x(0) / (M_PI * x(1)) * dInputs(0) -
                      x(0) * x(0) / (M_PI * x(1) * x(1)) * dInputs(1);
    }

    void computeJacobianTransposeProduct(const Vector& dOutputs, Vector& dInputs) override
    {
        const Vector& x = linearizedInputs();
        dInputs(0) = 2.0 * x(0) / (M_PI * x(1)) * dOutputs(0);
        dInputs(1) = -x(0) * x(0) / (M_PI * x(1) * x(1)) * dOutputs(0);
    }
};

/// Product of two scalar inputs scaled by a constant
class ProductBlock : public ExplicitBlock
{
public:
    ProductBlock(const std::string& name,
                 const std::string& output,
                 const std::string& a,
                 const std::string& b,
                 double scale)
        : ExplicitBlock(name), scale_(scale)
    {
        addInput(a, 1, 1.0);
        addInput(b, 1, 1.0);
        addOutput(output);
    }

protected:
    void compute(const Vector& inputs, Vector& outputs) override
    {
        outputs(0) = scale_ * inputs(0) * inputs(1);
    }

    void computeJacobianProduct(const Vector& dInputs, Vector& dOutputs) override
    {
        const Vector& x = linearizedInputs();
        dOutputs(0) = scale_ * (x(1) * dInputs(0) + x(0) * dInputs(1));
    }

    void computeJacobianTransposeProduct(const Vector& dOutputs, Vector& dInputs) override
    {
        const Vector& x = linearizedInputs();
        dInputs(0) = scale_ * x(1) * dOutputs(0);
        dInputs(1) = scale_ * x(0) * dOutputs(0);
    }

private:
    double scale_;
};

class AeroBuilder : public DisciplineBuilder
{
public:
    AeroBuilder() : DisciplineBuilder("aero") {}

    std::unique_ptr<ResidualBlock> createCouplingBlock(const std::string& blockName) override
    {
        return std::make_unique<LiftBlock>(blockName);
    }

    std::unique_ptr<ResidualBlock> createPostCouplingBlock(const std::string& blockName) override
    {
        return std::make_unique<DragBlock>(blockName);
    }
};

class LoadTransferBuilder : public DisciplineBuilder
{
public:
    LoadTransferBuilder() : DisciplineBuilder("ldxfer") {}

    std::unique_ptr<ResidualBlock> createCouplingBlock(const std::string& blockName) override
    {
        return std::make_unique<LoadTransferBlock>(blockName);
    }
};

class StructBuilder : public DisciplineBuilder
{
public:
    StructBuilder() : DisciplineBuilder("struct") {}

    std::unique_ptr<ResidualBlock> createMeshBlock(const std::string& blockName) override
    {
        return std::make_unique<ProductBlock>(blockName, "span", "chord", "aspect_ratio", 1.0);
    }

    std::unique_ptr<ResidualBlock> createCouplingBlock(const std::string& blockName) override
    {
        return std::make_unique<TorsionSpringBlock>(blockName);
    }

    std::unique_ptr<ResidualBlock> createPostCouplingBlock(const std::string& blockName) override
    {
        return std::make_unique<ProductBlock>(blockName, "mass", "span", "chord", AREAL_MASS);
    }
};

class TrimBuilder : public DisciplineBuilder
{
public:
    TrimBuilder() : DisciplineBuilder("trim") {}

    std::unique_ptr<ResidualBlock> createCouplingBlock(const std::string& blockName) override
    {
        return std::make_unique<BalanceBlock>(blockName, "alpha", "CL", "target");
    }
};

double centralDifference(CoupledProblem& problem,
                         const std::string& of,
                         const std::string& wrt,
                         double base,
                         double step)
{
    problem.setInput(wrt, base + step);
    problem.solve();
    const double plus = problem.getOutput(of);

    problem.setInput(wrt, base - step);
    problem.solve();
    const double minus = problem.getOutput(of);

    problem.setInput(wrt, base);
    problem.solve();
    return (plus - minus) / (2.0 * step);
}

double scalarTotal(CoupledProblem& problem,
                   const std::string& of,
                   const std::string& wrt,
                   LinearMode mode)
{
    DenseMatrix jacobian;
    problem.totalDerivative(of, wrt, jacobian, mode);
    return jacobian(0, 0);
}

} // namespace

int main(int argc, char* argv[])
{
#ifdef MFEM_USE_MPI
    MPI_Session mpi(argc, argv);
    const int myRank = mpi.WorldRank();
#else
    const int myRank = 0;
#endif

    // ============================================================
    // STEP 1: PROBLEM SETUP
    // ============================================================
    double dynamicPressure = 2.0;
    double targetLift = 0.5;
    double chord = 1.0;
    double aspectRatio = 8.0;
    double fdStep = 1.0e-6;
    int printLevel = 0;
    bool forwardSchur = false;

    OptionsParser args(argc, argv);
    args.AddOption(&dynamicPressure, "-q", "--dynamic-pressure",
                   "Non-dimensional dynamic pressure.");
    args.AddOption(&targetLift, "-t", "--target",
                   "Target lift coefficient.");
    args.AddOption(&chord, "-c", "--chord",
                   "Panel chord.");
    args.AddOption(&aspectRatio, "-ar", "--aspect-ratio",
                   "Panel aspect ratio (span / chord).");
    args.AddOption(&fdStep, "-fd", "--fd-step",
                   "Central difference step for the derivative check.");
    args.AddOption(&printLevel, "-pl", "--print-level",
                   "Solver print level (0 silent, 1 summary, 2 per iteration).");
    args.AddOption(&forwardSchur, "-fs", "--forward-schur", "-rs", "--reverse-schur",
                   "Build the Schur complement column-wise instead of row-wise.");
    args.Parse();
    if (!args.Good())
    {
        if (myRank == 0)
        {
            args.PrintUsage(std::cout);
        }
        return 1;
    }
    if (myRank == 0)
    {
        args.PrintOptions(std::cout);
    }

    TrimmedAnalysisOptions analysisOptions;
    analysisOptions.balanceInputs = {"CL"};
    analysisOptions.balanceOutputs = {"alpha"};

    TrimmedAnalysis analysis(analysisOptions);
    analysis.addDiscipline(std::make_unique<AeroBuilder>());
    analysis.addDiscipline(std::make_unique<LoadTransferBuilder>());
    analysis.addDiscipline(std::make_unique<StructBuilder>());
    analysis.setBalanceBuilder(std::make_unique<TrimBuilder>());

    TrimSolverOptions solverOptions;
    solverOptions.absTol = 1.0e-12;
    solverOptions.relTol = 1.0e-12;
    solverOptions.printLevel = printLevel;
    solverOptions.schurMode = forwardSchur ? LinearMode::Forward : LinearMode::Transpose;
    solverOptions.analysisSolver.absTol = 1.0e-13;
    solverOptions.analysisSolver.relTol = 1.0e-13;
    solverOptions.analysisSolver.maxIter = 200;
    solverOptions.analysisLinearSolver.absTol = 1.0e-14;
    solverOptions.analysisLinearSolver.relTol = 1.0e-13;
    solverOptions.analysisLinearSolver.maxIter = 200;

    // ============================================================
    // STEP 2: GRAPH ASSEMBLY
    // ============================================================
    auto graph = std::make_unique<CouplingGraph>();
    analysis.addScenario(*graph, "cruise");

    CoupledProblem problem(std::move(graph), solverOptions);
    problem.setInput("cruise.q", dynamicPressure);
    problem.setInput("cruise.target", targetLift);
    problem.setInput("cruise.chord", chord);
    problem.setInput("cruise.aspect_ratio", aspectRatio);

    if (myRank == 0)
    {
        std::cout << "\n========================================" << std::endl;
        std::cout << "  Trimmed Aerostructural Panel" << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "Blocks:" << std::endl;
        const CouplingGraph& g = problem.getGraph();
        for (int b = 0; b < g.getNumBlocks(); ++b)
        {
            std::cout << "  " << std::left << std::setw(24) << g.getBlock(b).getName()
                      << g.getGroup(b) << std::endl;
        }
        std::cout << "========================================\n" << std::endl;
    }

    // ============================================================
    // STEP 3: TRIM SOLVE
    // ============================================================
    SolveReport report;
    try
    {
        report = problem.solve();
    }
    catch (const std::runtime_error& e)
    {
        if (myRank == 0)
        {
            std::cerr << "Trim failed: " << e.what() << std::endl;
        }
        return 2;
    }

    const std::string alphaPath = "cruise.balance.alpha";
    const std::string dragPath = TrimmedAnalysis::findScenarioOutput(problem.getGraph(), "cruise", "CD");
    const std::string massPath = TrimmedAnalysis::findScenarioOutput(problem.getGraph(), "cruise", "mass");
    const std::string twistPath = TrimmedAnalysis::findScenarioOutput(problem.getGraph(), "cruise", "theta");

    if (myRank == 0)
    {
        std::cout << std::scientific << std::setprecision(6);
        std::cout << "Newton updates:     " << report.iterations << std::endl;
        std::cout << "Analysis sweeps:    " << report.subSolves << std::endl;
        std::cout << "Balance residual:   " << report.balanceNorm << std::endl;
        std::cout << "Solve time:         " << std::fixed << std::setprecision(3)
                  << report.solveTimeMs << " ms" << std::endl;
        std::cout << std::setprecision(8);
        std::cout << "alpha [rad]:        " << problem.getOutput(alphaPath) << std::endl;
        std::cout << "theta [rad]:        " << problem.getOutput(twistPath) << std::endl;
        std::cout << "CL:                 " << problem.getOutput("cruise.aero_coupling.CL") << std::endl;
        std::cout << "CD:                 " << problem.getOutput(dragPath) << std::endl;
        std::cout << "mass:               " << problem.getOutput(massPath) << std::endl;
    }

    // ============================================================
    // STEP 4: TOTAL DERIVATIVES
    // ============================================================
    struct DerivativeCase
    {
        std::string of;
        std::string wrt;
        double base;
    };
    const DerivativeCase cases[] = {
        {alphaPath, "cruise.q", dynamicPressure},
        {alphaPath, "cruise.target", targetLift},
        {alphaPath, "cruise.chord", chord},
        {dragPath, "cruise.target", targetLift},
        {dragPath, "cruise.aspect_ratio", aspectRatio},
        {massPath, "cruise.chord", chord},
    };

    if (myRank == 0)
    {
        std::cout << "\n" << std::left << std::setw(28) << "d(of)/d(wrt)"
                  << std::right << std::setw(16) << "adjoint"
                  << std::setw(16) << "forward"
                  << std::setw(16) << "central FD"
                  << std::setw(12) << "rel. err" << std::endl;
        std::cout << std::string(88, '-') << std::endl;
    }

    bool allMatch = true;
    for (const auto& c : cases)
    {
        const double adjoint = scalarTotal(problem, c.of, c.wrt, LinearMode::Transpose);
        const double forward = scalarTotal(problem, c.of, c.wrt, LinearMode::Forward);
        const double fd = centralDifference(problem, c.of, c.wrt, c.base, fdStep);
        const double relErr = std::abs(adjoint - fd) / std::max(std::abs(fd), 1.0e-8);
        allMatch = allMatch && relErr < 1.0e-4;

        if (myRank == 0)
        {
            const std::string label = c.of.substr(c.of.rfind('.') + 1) + " / " +
                                      c.wrt.substr(c.wrt.rfind('.') + 1);
            std::cout << std::left << std::setw(28) << label << std::right
                      << std::scientific << std::setprecision(6)
                      << std::setw(16) << adjoint
                      << std::setw(16) << forward
                      << std::setw(16) << fd
                      << std::setw(12) << std::setprecision(2) << relErr << std::endl;
        }
    }

    if (myRank == 0)
    {
        std::cout << "========================================" << std::endl;
        std::cout << (allMatch ? "Totals agree with finite differences"
                               : "WARNING: totals disagree with finite differences")
                  << std::endl;
        std::cout << "========================================" << std::endl;
    }

    return allMatch ? 0 : 1;
}
