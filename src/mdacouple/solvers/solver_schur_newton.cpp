/**
 * @file solvers/solver_schur_newton.cpp
 * @brief Implementation of the Schur-partitioned Newton solver
 */

#include "mdacouple/solvers/solver_schur_newton.hpp"
#include "mdacouple/core/errors.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace mdacouple
{

SchurNewtonSolver::SchurNewtonSolver(CouplingGraph& graph, const TrimSolverOptions& options)
    : graph_(graph),
      options_(options)
{
    if (!graph_.isFinalized())
    {
        throw std::runtime_error("SchurNewtonSolver: graph must be finalized");
    }
}

void SchurNewtonSolver::validateSetup()
{
    options_.validate();

    const std::string& analysisLabel = options_.groupNames[0];
    const std::string& balanceLabel = options_.groupNames[1];
    for (const auto& label : graph_.getGroupNames())
    {
        if (label != analysisLabel && label != balanceLabel)
        {
            throw ConfigurationError("SchurNewtonSolver: unknown partition label '" + label +
                                     "', expected '" + analysisLabel + "' or '" +
                                     balanceLabel + "'");
        }
    }

    analysisBlocks_ = graph_.getBlocksInGroup(analysisLabel);
    balanceBlocks_ = graph_.getBlocksInGroup(balanceLabel);
    if (analysisBlocks_.empty())
    {
        throw ConfigurationError("SchurNewtonSolver: no block carries the analysis label '" +
                                 analysisLabel + "'");
    }
    if (balanceBlocks_.empty())
    {
        throw ConfigurationError("SchurNewtonSolver: no block carries the balance label '" +
                                 balanceLabel + "'");
    }

    options_.bounds.validate(graph_.getPartitionSize(balanceBlocks_));
}

void SchurNewtonSolver::setupSolvers()
{
    if (reduced_)
    {
        return;
    }
    analysisSolver_ = std::make_unique<NonlinearBlockGaussSeidel>(
        graph_, analysisBlocks_, options_.analysisSolver, options_.analysisLinearSolver);
    analysisLinearSolver_ = std::make_unique<LinearBlockGaussSeidel>(
        graph_, analysisBlocks_, options_.analysisLinearSolver);

    jAB_ = std::make_unique<GraphJacobianOperator>(graph_, analysisBlocks_, balanceBlocks_);
    jBA_ = std::make_unique<GraphJacobianOperator>(graph_, balanceBlocks_, analysisBlocks_);
    jBB_ = std::make_unique<GraphJacobianOperator>(graph_, balanceBlocks_, balanceBlocks_);
    schur_ = std::make_unique<SchurComplementOperator>(*jAB_, *jBA_, *jBB_,
                                                       *analysisLinearSolver_);
    reduced_ = std::make_unique<ReducedSchurSystem>(*schur_, options_.schurMode,
                                                    options_.singularTol);
}

void SchurNewtonSolver::projectOntoBounds(mfem::Vector& balance) const
{
    if (options_.bounds.empty())
    {
        return;
    }
    for (int i = 0; i < balance.Size(); ++i)
    {
        balance(i) = std::min(options_.bounds.upper[i],
                              std::max(options_.bounds.lower[i], balance(i)));
    }
}

void SchurNewtonSolver::residualNorms(int iteration, double& analysisNorm, double& balanceNorm)
{
    residual_.SetSize(graph_.getStateSize());
    residual_ = 0.0;
    graph_.evaluateResiduals(graph_.getAllBlocks(), residual_, iteration);

    graph_.extractPartition(analysisBlocks_, residual_, analysisResidual_);
    graph_.extractPartition(balanceBlocks_, residual_, balanceResidual_);
    analysisNorm = graph_.norm(analysisBlocks_, analysisResidual_);
    balanceNorm = graph_.norm(balanceBlocks_, balanceResidual_);
}

SolveReport SchurNewtonSolver::solve()
{
    const auto start = std::chrono::high_resolution_clock::now();
    const bool verbose = (options_.printLevel > 0) && graph_.isRoot();

    // Everything that can be rejected is rejected before the first evaluation
    validateSetup();
    setupSolvers();
    analysisSolver_->getSweepOrder();

    graph_.resetOutputs();
    reduced_->invalidate();

    mfem::Vector balance;
    graph_.extractPartition(balanceBlocks_, graph_.getState(), balance);
    projectOntoBounds(balance);
    graph_.insertPartition(balanceBlocks_, balance, graph_.getState());

    SweepBudget budget;
    budget.limit = options_.maxSubSolves;

    double analysisNorm0 = 0.0;
    double balanceNorm0 = 0.0;
    residualNorms(0, analysisNorm0, balanceNorm0);
    if (verbose)
    {
        std::cout << "Schur-Newton: Initial residual norms |R_A| = " << analysisNorm0
                  << ", |R_B| = " << balanceNorm0 << std::endl;
    }
    if (analysisNorm0 == 0.0)
    {
        analysisNorm0 = 1.0;
    }
    if (balanceNorm0 == 0.0)
    {
        balanceNorm0 = 1.0;
    }

    SolveReport report;
    mfem::Vector rhs, step;

    for (int updates = 0; ; )
    {
        double analysisNorm = 0.0;
        double balanceNorm = 0.0;
        try
        {
            analysisSolver_->converge(&budget);
        }
        catch (const CouplingDivergedError& err)
        {
            // Report the balance residual of the state the analysis stopped at
            residualNorms(updates, analysisNorm, balanceNorm);
            if (verbose)
            {
                std::cout << "Schur-Newton: analysis diverged at iteration " << updates
                          << ". |R_A| = " << analysisNorm << ", |R_B| = " << balanceNorm
                          << std::endl;
            }
            throw CouplingDivergedError("NonlinearBlockGaussSeidel", err.iterations(),
                                        analysisNorm, balanceNorm);
        }

        residualNorms(updates, analysisNorm, balanceNorm);

        report.iterations = updates;
        report.subSolves = budget.used;
        report.analysisNorm = analysisNorm;
        report.balanceNorm = balanceNorm;

        if (options_.printLevel > 1 && graph_.isRoot())
        {
            std::cout << "  Schur-Newton iteration " << updates
                      << ", |R_A| = " << analysisNorm
                      << ", |R_B| = " << balanceNorm
                      << ", sweeps used = " << budget.used << std::endl;
        }

        const bool analysisConverged = analysisNorm <= options_.absTol ||
                                       analysisNorm <= options_.relTol * analysisNorm0;
        const bool balanceConverged = balanceNorm <= options_.absTol ||
                                      balanceNorm <= options_.relTol * balanceNorm0;
        if (analysisConverged && balanceConverged)
        {
            report.converged = true;
            report.solveTimeMs = std::chrono::duration<double, std::milli>(
                std::chrono::high_resolution_clock::now() - start).count();
            if (verbose)
            {
                std::cout << "Schur-Newton converged in " << updates << " iterations ("
                          << budget.used << " analysis sweeps), |R_B| = " << balanceNorm
                          << std::endl;
            }
            return report;
        }

        if (updates >= options_.maxIter)
        {
            if (verbose)
            {
                std::cout << "Schur-Newton: Maximum iterations reached. |R_A| = "
                          << analysisNorm << ", |R_B| = " << balanceNorm << std::endl;
            }
            throw MaxIterExceeded("SchurNewtonSolver", updates, analysisNorm, balanceNorm);
        }

        // Newton step on the balance unknowns: S db = -R_B
        graph_.linearize(graph_.getAllBlocks());
        reduced_->assemble();
        rhs = balanceResidual_;
        rhs.Neg();
        reduced_->solve(rhs, step);

        graph_.extractPartition(balanceBlocks_, graph_.getState(), balance);
        balance += step;
        projectOntoBounds(balance);
        graph_.insertPartition(balanceBlocks_, balance, graph_.getState());
        reduced_->invalidate();
        ++updates;
    }
}

void SchurNewtonSolver::linearize()
{
    validateSetup();
    setupSolvers();
    graph_.linearize(graph_.getAllBlocks());
    reduced_->invalidate();
}

const ReducedSchurSystem& SchurNewtonSolver::getReducedSystem()
{
    if (!reduced_)
    {
        throw std::runtime_error("SchurNewtonSolver::getReducedSystem() called before "
                                 "linearize()");
    }
    if (!reduced_->isAssembled())
    {
        reduced_->assemble();
    }
    return *reduced_;
}

void SchurNewtonSolver::solveLinear(const mfem::Vector& rhs,
                                    mfem::Vector& solution,
                                    LinearMode mode)
{
    const ReducedSchurSystem& reduced = getReducedSystem();
    const bool cached = (reduced.getMode() == mode);

    mfem::Vector rhsA, rhsB, xA, xB, tmpA, tmpB, first;
    graph_.extractPartition(analysisBlocks_, rhs, rhsA);
    graph_.extractPartition(balanceBlocks_, rhs, rhsB);

    if (mode == LinearMode::Transpose)
    {
        analysisLinearSolver_->MultTranspose(rhsA, first);
        jAB_->MultTranspose(first, tmpB);
        rhsB -= tmpB;
        reduced.solveTranspose(rhsB, xB);

        if (cached)
        {
            xA = first;
            reduced.getPropagation().AddMult_a(-1.0, xB, xA);
        }
        else
        {
            jBA_->MultTranspose(xB, tmpA);
            rhsA -= tmpA;
            analysisLinearSolver_->MultTranspose(rhsA, xA);
        }
    }
    else
    {
        analysisLinearSolver_->Mult(rhsA, first);
        jBA_->Mult(first, tmpB);
        rhsB -= tmpB;
        reduced.solve(rhsB, xB);

        if (cached)
        {
            xA = first;
            reduced.getPropagation().AddMult_a(-1.0, xB, xA);
        }
        else
        {
            jAB_->Mult(xB, tmpA);
            rhsA -= tmpA;
            analysisLinearSolver_->Mult(rhsA, xA);
        }
    }

    solution.SetSize(graph_.getStateSize());
    solution = 0.0;
    graph_.insertPartition(analysisBlocks_, xA, solution);
    graph_.insertPartition(balanceBlocks_, xB, solution);
}

} // namespace mdacouple
