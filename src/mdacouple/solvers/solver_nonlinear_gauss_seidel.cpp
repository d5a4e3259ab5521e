/**
 * @file solvers/solver_nonlinear_gauss_seidel.cpp
 * @brief Implementation of the nonlinear block Gauss-Seidel solver
 */

#include "mdacouple/solvers/solver_nonlinear_gauss_seidel.hpp"
#include "mdacouple/core/errors.hpp"
#include "mdacouple/solvers/aitken_relaxation.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace mdacouple
{

NonlinearBlockGaussSeidel::NonlinearBlockGaussSeidel(CouplingGraph& graph,
                                                     const FixedPointOptions& options,
                                                     const LinearSolverOptions& linearOptions)
    : NonlinearBlockGaussSeidel(graph, graph.getAllBlocks(), options, linearOptions)
{
}

NonlinearBlockGaussSeidel::NonlinearBlockGaussSeidel(CouplingGraph& graph,
                                                     const std::vector<int>& blocks,
                                                     const FixedPointOptions& options,
                                                     const LinearSolverOptions& linearOptions)
    : graph_(graph),
      blocks_(blocks),
      options_(options),
      linearOptions_(linearOptions)
{
    if (!graph_.isFinalized())
    {
        throw std::runtime_error("NonlinearBlockGaussSeidel: graph must be finalized");
    }
    if (blocks_.empty())
    {
        throw ConfigurationError("NonlinearBlockGaussSeidel: empty partition");
    }
}

std::vector<int> NonlinearBlockGaussSeidel::getSweepOrder() const
{
    if (options_.blockOrder.empty())
    {
        return blocks_;
    }
    if (options_.blockOrder.size() != blocks_.size())
    {
        throw ConfigurationError("FixedPointOptions: blockOrder must list every block of "
                                 "the partition exactly once");
    }

    std::vector<int> order;
    for (const auto& name : options_.blockOrder)
    {
        const int index = graph_.findBlock(name);
        if (index < 0 || std::find(blocks_.begin(), blocks_.end(), index) == blocks_.end())
        {
            throw ConfigurationError("FixedPointOptions: block '" + name +
                                     "' in blockOrder is not part of the partition");
        }
        order.push_back(index);
    }
    return order;
}

double NonlinearBlockGaussSeidel::residualNorm(int iteration)
{
    residual_.SetSize(graph_.getStateSize());
    residual_ = 0.0;
    graph_.evaluateResiduals(blocks_, residual_, iteration);
    graph_.extractPartition(blocks_, residual_, compact_);
    return graph_.norm(blocks_, compact_);
}

SolveReport NonlinearBlockGaussSeidel::solve()
{
    options_.validate();
    graph_.resetOutputs(blocks_);
    return converge(nullptr);
}

SolveReport NonlinearBlockGaussSeidel::converge(SweepBudget* budget)
{
    options_.validate();
    const std::vector<int> order = getSweepOrder();
    const bool verbose = graph_.isRoot();
    const auto start = std::chrono::high_resolution_clock::now();

    SolveReport report;
    const double initialNorm = residualNorm(0);
    const double norm0 = (initialNorm > 0.0) ? initialNorm : 1.0;

    if (options_.printLevel > 0 && verbose)
    {
        std::cout << "NLBGS: Initial residual norm = " << initialNorm << std::endl;
    }

    AitkenRelaxation aitken(options_.aitken, graph_, blocks_);
    mfem::Vector xOld, x, delta;

    for (int iter = 0; ; )
    {
        if (budget && budget->used >= budget->limit)
        {
            throw SubSolveBudgetExceeded(budget->used, budget->limit);
        }

        const int sweep = iter + 1;
        graph_.extractPartition(blocks_, graph_.getState(), xOld);
        for (int block : order)
        {
            graph_.solveBlock(block, sweep);
        }
        iter = sweep;
        if (budget)
        {
            ++budget->used;
        }

        graph_.extractPartition(blocks_, graph_.getState(), x);
        delta.SetSize(x.Size());
        subtract(x, xOld, delta);
        const double theta = aitken.computeFactor(delta);
        if (theta != 1.0)
        {
            AitkenRelaxation::relax(xOld, delta, theta, x);
            graph_.insertPartition(blocks_, x, graph_.getState());
        }
        graph_.barrier();

        const double norm = residualNorm(sweep);
        report.iterations = sweep;
        report.subSolves = sweep;
        report.analysisNorm = norm;

        if (options_.printLevel > 1 && verbose)
        {
            std::cout << "  NLBGS iteration " << sweep
                      << ", residual norm = " << norm
                      << ", relative = " << norm / norm0
                      << ", aitken = " << theta << std::endl;
        }

        if (norm <= options_.absTol || norm <= options_.relTol * norm0)
        {
            report.converged = true;
            report.solveTimeMs = std::chrono::duration<double, std::milli>(
                std::chrono::high_resolution_clock::now() - start).count();
            if (options_.printLevel > 0 && verbose)
            {
                std::cout << "NLBGS converged in " << sweep
                          << " iterations, final norm = " << norm << std::endl;
            }
            return report;
        }

        if (iter >= options_.maxIter)
        {
            if (options_.printLevel > 0 && verbose)
            {
                std::cout << "NLBGS: Maximum iterations reached. Final norm: "
                          << norm << std::endl;
            }
            throw CouplingDivergedError("NonlinearBlockGaussSeidel", iter, norm);
        }
    }
}

void NonlinearBlockGaussSeidel::linearize()
{
    graph_.linearize(blocks_);
}

void NonlinearBlockGaussSeidel::solveLinear(const mfem::Vector& rhs,
                                            mfem::Vector& solution,
                                            LinearMode mode)
{
    LinearBlockGaussSeidel linearSolver(graph_, blocks_, linearOptions_);

    mfem::Vector rhsCompact, solutionCompact;
    graph_.extractPartition(blocks_, rhs, rhsCompact);
    if (mode == LinearMode::Forward)
    {
        linearSolver.Mult(rhsCompact, solutionCompact);
    }
    else
    {
        linearSolver.MultTranspose(rhsCompact, solutionCompact);
    }

    solution.SetSize(graph_.getStateSize());
    solution = 0.0;
    graph_.insertPartition(blocks_, solutionCompact, solution);
}

} // namespace mdacouple
