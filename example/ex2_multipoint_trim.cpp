#include "mfem.hpp"
#include "mdacouple/blocks/balance_block.hpp"
#include "mdacouple/core/coupled_problem.hpp"
#include "mdacouple/core/errors.hpp"
#include "mdacouple/core/trimmed_analysis.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>

/**
 * Example: Multipoint Trim with Shared Design Vectors
 *
 * Two flight points (cruise and a 2.5 g maneuver) of the same flexible panel
 * are trimmed in a single coupling graph. Both scenarios read their geometry
 * and flight condition from two shared design vectors:
 *
 *   wing   = [chord, aspect_ratio]
 *   flight = [q_cruise, CL_cruise, q_maneuver, CL_maneuver]
 *
 * Each scenario input is fed from one entry of a shared vector through
 * srcIndices, so one adjoint solve per output yields the derivative with
 * respect to the whole vector at once.
 *
 * Discipline models:
 *   aero:   CL    = a0 sin(alpha + theta),   post: L = q b c CL
 *   struct: b     = AR c (mesh),              coupling: theta = q c^2 e b CL / GJ,
 *           post: mass = m'' b c
 */

using namespace mfem;
using namespace mdacouple;

namespace
{

constexpr double LIFT_SLOPE = 6.283185307179586;
constexpr double TWIST_COMPLIANCE = 0.25 / 60.0;   // e / GJ
constexpr double AREAL_MASS = 2.5;

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
        const Vector& x = linearizedInputs();
        dOutputs(0) = LIFT_SLOPE * std::cos(x(0) + x(1)) * (dInputs(0) + dInputs(1));
    }

    void computeJacobianTransposeProduct(const Vector& dOutputs, Vector& dInputs) override
    {
        const Vector& x = linearizedInputs();
        dInputs = LIFT_SLOPE * std::cos(x(0) + x(1)) * dOutputs(0);
    }
};

/**
 * @brief out = scale * prod_i in_i^p_i with integer exponents p_i >= 1
 */
class MonomialBlock : public ExplicitBlock
{
public:
    MonomialBlock(const std::string& name,
                  const std::string& output,
                  const std::vector<std::string>& inputs,
                  const std::vector<int>& powers,
                  double scale)
        : ExplicitBlock(name), powers_(powers), scale_(scale)
    {
        for (const auto& input : inputs)
        {
            addInput(input, 1, 1.0);
        }
        addOutput(output);
    }

protected:
    void compute(const Vector& inputs, Vector& outputs) override
    {
        outputs(0) = product(inputs, -1);
    }

    void computeJacobianProduct(const Vector& dInputs, Vector& dOutputs) override
    {
        dOutputs(0) = 0.0;
        for (int i = 0; i < dInputs.Size(); ++i)
        {
            dOutputs(0) += product(linearizedInputs(), i) * dInputs(i);
        }
    }

    void computeJacobianTransposeProduct(const Vector& dOutputs, Vector& dInputs) override
    {
        for (int i = 0; i < dInputs.Size(); ++i)
        {
            dInputs(i) = product(linearizedInputs(), i) * dOutputs(0);
        }
    }

private:
    /// Value (skip < 0) or partial derivative with respect to input skip
    double product(const Vector& x, int skip) const
    {
        double value = scale_;
        for (int i = 0; i < x.Size(); ++i)
        {
            const int p = (i == skip) ? powers_[i] - 1 : powers_[i];
            value *= std::pow(x(i), p);
            if (i == skip)
            {
                value *= powers_[i];
            }
        }
        return value;
    }

    std::vector<int> powers_;
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
        return std::make_unique<MonomialBlock>(
            blockName, "lift", std::vector<std::string>{"q", "span", "chord", "CL"},
            std::vector<int>{1, 1, 1, 1}, 1.0);
    }
};

class StructBuilder : public DisciplineBuilder
{
public:
    StructBuilder() : DisciplineBuilder("struct") {}

    std::unique_ptr<ResidualBlock> createMeshBlock(const std::string& blockName) override
    {
        return std::make_unique<MonomialBlock>(
            blockName, "span", std::vector<std::string>{"chord", "aspect_ratio"},
            std::vector<int>{1, 1}, 1.0);
    }

    std::unique_ptr<ResidualBlock> createCouplingBlock(const std::string& blockName) override
    {
        return std::make_unique<MonomialBlock>(
            blockName, "theta", std::vector<std::string>{"q", "chord", "span", "CL"},
            std::vector<int>{1, 2, 1, 1}, TWIST_COMPLIANCE);
    }

    std::unique_ptr<ResidualBlock> createPostCouplingBlock(const std::string& blockName) override
    {
        return std::make_unique<MonomialBlock>(
            blockName, "mass", std::vector<std::string>{"span", "chord"},
            std::vector<int>{1, 1}, AREAL_MASS);
    }
};

class TrimBuilder : public DisciplineBuilder
{
public:
    TrimBuilder() : DisciplineBuilder("trim") {}

    std::unique_ptr<ResidualBlock> createCouplingBlock(const std::string& blockName) override
    {
        return std::make_unique<BalanceBlock>(blockName, "alpha", "CL", "target", 1, 0.05);
    }
};

void printRow(const std::string& label, const DenseMatrix& jacobian)
{
    std::cout << "  " << std::left << std::setw(34) << label << std::right;
    for (int j = 0; j < jacobian.Width(); ++j)
    {
        std::cout << std::setw(16) << jacobian(0, j);
    }
    std::cout << std::endl;
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
    double chord = 1.0;
    double aspectRatio = 8.0;
    double cruisePressure = 1.5;
    double cruiseLift = 0.4;
    double loadFactor = 2.5;
    int printLevel = 1;

    OptionsParser args(argc, argv);
    args.AddOption(&chord, "-c", "--chord", "Panel chord.");
    args.AddOption(&aspectRatio, "-ar", "--aspect-ratio", "Panel aspect ratio.");
    args.AddOption(&cruisePressure, "-q", "--dynamic-pressure",
                   "Dynamic pressure at both flight points.");
    args.AddOption(&cruiseLift, "-t", "--target", "Cruise lift coefficient.");
    args.AddOption(&loadFactor, "-n", "--load-factor", "Maneuver load factor.");
    args.AddOption(&printLevel, "-pl", "--print-level", "Solver print level.");
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

    // ============================================================
    // STEP 2: SHARED DESIGN VECTORS AND SCENARIOS
    // ============================================================
    auto graph = std::make_unique<CouplingGraph>();
    graph->addDesignVariable("wing", 2);
    graph->addDesignVariable("flight", 4);

    TrimmedAnalysisOptions analysisOptions;
    analysisOptions.preCouplingOrder.clear();
    analysisOptions.postCouplingOrder = {"aero", "struct"};
    analysisOptions.balanceInputs = {"CL"};
    analysisOptions.balanceOutputs = {"alpha"};

    TrimmedAnalysis analysis(analysisOptions);
    analysis.addDiscipline(std::make_unique<AeroBuilder>());
    analysis.addDiscipline(std::make_unique<StructBuilder>());
    analysis.setBalanceBuilder(std::make_unique<TrimBuilder>());

    const std::vector<std::string> scenarios = {"cruise", "maneuver"};
    for (std::size_t s = 0; s < scenarios.size(); ++s)
    {
        const int offset = 2 * static_cast<int>(s);
        analysis.connectInput(scenarios[s], "chord", "wing", {0});
        analysis.connectInput(scenarios[s], "aspect_ratio", "wing", {1});
        analysis.connectInput(scenarios[s], "q", "flight", {offset});
        analysis.connectInput(scenarios[s], "target", "flight", {offset + 1});
        analysis.addScenario(*graph, scenarios[s]);
    }

    TrimSolverOptions solverOptions;
    solverOptions.printLevel = printLevel;
    solverOptions.absTol = 1.0e-12;
    solverOptions.relTol = 1.0e-12;
    solverOptions.analysisSolver.absTol = 1.0e-13;
    solverOptions.analysisSolver.relTol = 1.0e-13;
    solverOptions.analysisSolver.maxIter = 200;
    solverOptions.analysisLinearSolver.maxIter = 200;

    CoupledProblem problem(std::move(graph), solverOptions);

    Vector wing(2);
    wing(0) = chord;
    wing(1) = aspectRatio;
    Vector flight(4);
    flight(0) = cruisePressure;
    flight(1) = cruiseLift;
    flight(2) = cruisePressure;
    flight(3) = loadFactor * cruiseLift;
    problem.setInput("wing", wing);
    problem.setInput("flight", flight);

    if (myRank == 0)
    {
        std::cout << "\n========================================" << std::endl;
        std::cout << "  Multipoint Trim" << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "Blocks:          " << problem.getGraph().getNumBlocks() << std::endl;
        std::cout << "State size:      " << problem.getGraph().getStateSize() << std::endl;
        std::cout << "Balance blocks:  "
                  << problem.getGraph().getBlocksInGroup(solverOptions.groupNames[1]).size()
                  << std::endl;
        std::cout << "========================================\n" << std::endl;
    }

    // ============================================================
    // STEP 3: SOLVE BOTH FLIGHT POINTS
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
            std::cerr << "Multipoint trim failed: " << e.what() << std::endl;
        }
        return 2;
    }

    if (myRank == 0)
    {
        std::cout << "\nNewton updates: " << report.iterations
                  << ", analysis sweeps: " << report.subSolves << std::endl;
        std::cout << std::left << std::setw(12) << "scenario" << std::right
                  << std::setw(14) << "alpha" << std::setw(14) << "theta"
                  << std::setw(14) << "CL" << std::setw(14) << "lift" << std::endl;
        std::cout << std::string(68, '-') << std::endl;
        std::cout << std::fixed << std::setprecision(6);
        for (const auto& s : scenarios)
        {
            std::cout << std::left << std::setw(12) << s << std::right
                      << std::setw(14) << problem.getOutput(TrimmedAnalysis::balanceBlockName(s) + ".alpha")
                      << std::setw(14) << problem.getOutput(s + ".struct_coupling.theta")
                      << std::setw(14) << problem.getOutput(s + ".aero_coupling.CL")
                      << std::setw(14) << problem.getOutput(s + ".aero_post.lift") << std::endl;
        }
    }

    // ============================================================
    // STEP 4: TOTALS WITH RESPECT TO THE SHARED VECTORS
    // ============================================================
    if (myRank == 0)
    {
        std::cout << "\nd(of)/d(wing) = [d/d chord, d/d aspect_ratio]" << std::endl;
        std::cout << std::scientific << std::setprecision(6);
    }

    DenseMatrix jacobian;
    for (const auto& s : scenarios)
    {
        const std::string alphaPath = TrimmedAnalysis::balanceBlockName(s) + ".alpha";
        problem.totalDerivative(alphaPath, "wing", jacobian);
        if (myRank == 0)
        {
            printRow(alphaPath, jacobian);
        }
    }

    problem.totalDerivative("maneuver.struct_post.mass", "wing", jacobian);
    if (myRank == 0)
    {
        printRow("maneuver.struct_post.mass", jacobian);
        std::cout << "\nd(maneuver alpha)/d(flight)" << std::endl;
    }

    problem.totalDerivative("maneuver.balance.alpha", "flight", jacobian, LinearMode::Forward);
    if (myRank == 0)
    {
        printRow("maneuver.balance.alpha", jacobian);
        std::cout << "========================================" << std::endl;
    }

    return 0;
}
