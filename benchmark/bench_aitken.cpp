/**
 * @file bench_aitken.cpp
 * @brief Gauss-Seidel sweep counts with and without Aitken relaxation
 *
 * Two explicit disciplines form the affine loop
 *   x1 = g x2 + 1,   x2 = x1 + 1
 * whose Gauss-Seidel iteration matrix has the single eigenvalue g. Plain
 * block Gauss-Seidel converges only for |g| < 1; the Aitken factor also
 * recovers oscillatory loops with g < -1.
 *
 * Usage:
 *   ./bench_aitken --max-iter 200 --tol 1e-10
 */

#include "mdacouple/core/coupling_graph.hpp"
#include "mdacouple/core/errors.hpp"
#include "mdacouple/solvers/solver_nonlinear_gauss_seidel.hpp"
#include "mfem.hpp"
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>

using namespace mfem;
using namespace mdacouple;

// Constants
constexpr int DEFAULT_MAX_ITER = 200;
constexpr double DEFAULT_TOL = 1.0e-10;
constexpr int REPEATS = 20;
constexpr double LOOP_GAINS[] = {-3.0, -2.0, -1.5, -0.99, -0.9, -0.5,
                                 0.5, 0.9, 0.99, 1.5};

/// out = gain * in + 1
class AffineBlock : public ExplicitBlock
{
public:
    AffineBlock(const std::string& name,
                const std::string& input,
                const std::string& output,
                double gain)
        : ExplicitBlock(name), gain_(gain)
    {
        addInput(input);
        addOutput(output);
    }

protected:
    void compute(const Vector& inputs, Vector& outputs) override
    {
        outputs(0) = gain_ * inputs(0) + 1.0;
    }

    void computeJacobianProduct(const Vector& dInputs, Vector& dOutputs) override
    {
        dOutputs(0) = gain_ * dInputs(0);
    }

    void computeJacobianTransposeProduct(const Vector& dOutputs, Vector& dInputs) override
    {
        dInputs(0) = gain_ * dOutputs(0);
    }

private:
    double gain_;
};

struct BenchmarkConfig
{
    int maxIter;
    double tol;
    bool printHelp;

    BenchmarkConfig()
        : maxIter(DEFAULT_MAX_ITER),
          tol(DEFAULT_TOL),
          printHelp(false) {}
};

struct RunResult
{
    bool converged;
    int sweeps;
    double timeMs;
};

void printUsage(const char* progName)
{
    std::cout << "Usage: " << progName << " [OPTIONS]\n"
              << "\nOptions:\n"
              << "  --max-iter <n>   Gauss-Seidel sweep limit (default: "
              << DEFAULT_MAX_ITER << ")\n"
              << "  --tol <value>    Absolute and relative tolerance (default: "
              << DEFAULT_TOL << ")\n"
              << "  --help           Print this message\n"
              << std::endl;
}

bool parseArgs(int argc, char* argv[], BenchmarkConfig& config)
{
    for (int i = 1; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "--max-iter") == 0 && i + 1 < argc)
        {
            config.maxIter = std::atoi(argv[++i]);
        }
        else if (std::strcmp(argv[i], "--tol") == 0 && i + 1 < argc)
        {
            config.tol = std::atof(argv[++i]);
        }
        else if (std::strcmp(argv[i], "--help") == 0)
        {
            config.printHelp = true;
            return true;
        }
        else
        {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            return false;
        }
    }

    if (config.maxIter < 1)
    {
        std::cerr << "Error: max-iter must be positive" << std::endl;
        return false;
    }
    if (config.tol <= 0.0)
    {
        std::cerr << "Error: tol must be positive" << std::endl;
        return false;
    }
    return true;
}

RunResult runLoop(double gain, bool relaxed, const BenchmarkConfig& config)
{
    CouplingGraph graph;
    graph.addBlock(std::make_unique<AffineBlock>("first", "x2", "x1", gain));
    graph.addBlock(std::make_unique<AffineBlock>("second", "x1", "x2", 1.0));
    graph.connect("second.x2", "first.x2");
    graph.connect("first.x1", "second.x1");
    graph.finalize();

    FixedPointOptions options;
    options.absTol = config.tol;
    options.relTol = config.tol;
    options.maxIter = config.maxIter;
    options.aitken.enabled = relaxed;

    NonlinearBlockGaussSeidel solver(graph, options);

    RunResult result = {true, 0, 0.0};
    auto start = std::chrono::high_resolution_clock::now();
    for (int r = 0; r < REPEATS; ++r)
    {
        try
        {
            result.sweeps = solver.solve().iterations;
        }
        catch (const CouplingDivergedError&)
        {
            result.converged = false;
            result.sweeps = config.maxIter;
            break;
        }
    }
    auto end = std::chrono::high_resolution_clock::now();
    result.timeMs = std::chrono::duration<double, std::milli>(end - start).count() / REPEATS;
    return result;
}

void printCell(const RunResult& result)
{
    if (result.converged)
    {
        std::cout << std::setw(10) << result.sweeps << " | "
                  << std::setw(10) << std::fixed << std::setprecision(4) << result.timeMs;
    }
    else
    {
        std::cout << std::setw(10) << "diverged" << " | " << std::setw(10) << "-";
    }
}

int main(int argc, char* argv[])
{
#ifdef MFEM_USE_MPI
    MPI_Session mpi(argc, argv);
    int myid = mpi.WorldRank();
#else
    int myid = 0;
#endif

    BenchmarkConfig config;
    if (!parseArgs(argc, argv, config))
    {
        if (myid == 0)
        {
            printUsage(argv[0]);
        }
        return EXIT_FAILURE;
    }
    if (config.printHelp)
    {
        if (myid == 0)
        {
            printUsage(argv[0]);
        }
        return EXIT_SUCCESS;
    }

    if (myid == 0)
    {
        std::cout << "\n========================================" << std::endl;
        std::cout << "Aitken Relaxation Benchmark" << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "Max sweeps: " << config.maxIter << std::endl;
        std::cout << "Tolerance:  " << config.tol << std::endl;
        std::cout << "Repeats:    " << REPEATS << std::endl;
        std::cout << "========================================\n" << std::endl;

        std::cout << std::setw(8) << "gain" << " | "
                  << std::setw(10) << "plain" << " | "
                  << std::setw(10) << "plain (ms)" << " | "
                  << std::setw(10) << "aitken" << " | "
                  << std::setw(10) << "aitken(ms)" << std::endl;
        std::cout << std::string(62, '-') << std::endl;
    }

    for (double gain : LOOP_GAINS)
    {
        const RunResult plain = runLoop(gain, false, config);
        const RunResult aitken = runLoop(gain, true, config);

        if (myid == 0)
        {
            std::cout << std::setw(8) << std::fixed << std::setprecision(2) << gain << " | ";
            printCell(plain);
            std::cout << " | ";
            printCell(aitken);
            std::cout << std::endl;
        }
    }

    if (myid == 0)
    {
        std::cout << "========================================" << std::endl;
    }

    return EXIT_SUCCESS;
}
