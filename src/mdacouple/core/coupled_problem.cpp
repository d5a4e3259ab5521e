/**
 * @file core/coupled_problem.cpp
 * @brief Implementation of CoupledProblem orchestrator
 */

#include "mdacouple/core/coupled_problem.hpp"
#include "mdacouple/core/errors.hpp"
#include "mdacouple/solvers/solver_nonlinear_gauss_seidel.hpp"
#include "mdacouple/solvers/solver_schur_newton.hpp"
#include <stdexcept>

namespace mdacouple
{

CoupledProblem::CoupledProblem(std::unique_ptr<CouplingGraph> graph,
                               const TrimSolverOptions& options)
    : graph_(std::move(graph)),
      options_(options),
      hasBalance_(false),
      solved_(false),
      linearized_(false)
{
    if (!graph_)
    {
        throw std::invalid_argument("CoupledProblem: null pointer argument");
    }
    if (!graph_->isFinalized())
    {
        graph_->finalize();
    }

    options_.validate();
    hasBalance_ = !graph_->getBlocksInGroup(options_.groupNames[1]).empty();
    if (hasBalance_)
    {
        solver_ = std::make_unique<SchurNewtonSolver>(*graph_, options_);
    }
    else
    {
        // No balance unknowns, so any configured bound is mismatched
        options_.bounds.validate(0);
        solver_ = std::make_unique<NonlinearBlockGaussSeidel>(*graph_,
                                                              options_.analysisSolver,
                                                              options_.analysisLinearSolver);
    }
}

void CoupledProblem::setInput(const std::string& name, const mfem::Vector& value)
{
    graph_->setDesignValue(name, value);
    solved_ = false;
    linearized_ = false;
}

void CoupledProblem::setInput(const std::string& name, double value)
{
    graph_->setDesignValue(name, value);
    solved_ = false;
    linearized_ = false;
}

SolveReport CoupledProblem::solve()
{
    solved_ = false;
    linearized_ = false;

    if (!hasBalance_)
    {
        for (const auto& label : graph_->getGroupNames())
        {
            if (label != options_.groupNames[0])
            {
                throw ConfigurationError("CoupledProblem: unknown partition label '" + label +
                                         "'");
            }
        }
    }

    report_ = solver_->solve();
    solved_ = true;
    return report_;
}

void CoupledProblem::requireSolved(const char* caller) const
{
    if (!solved_)
    {
        throw std::runtime_error(std::string("CoupledProblem::") + caller +
                                 " called before solve()");
    }
}

void CoupledProblem::getOutput(const std::string& path, mfem::Vector& value) const
{
    requireSolved("getOutput()");
    graph_->getOutputValue(path, value);
}

double CoupledProblem::getOutput(const std::string& path) const
{
    requireSolved("getOutput()");
    return graph_->getScalarOutput(path);
}

void CoupledProblem::totalDerivative(const std::string& of,
                                     const std::string& wrt,
                                     mfem::DenseMatrix& jacobian,
                                     LinearMode mode)
{
    requireSolved("totalDerivative()");
    const VariableSlot output = graph_->findOutput(of);
    const VariableSlot input = graph_->findDesignVariable(wrt);

    if (!linearized_)
    {
        solver_->linearize();
        linearized_ = true;
    }

    const int stateSize = graph_->getStateSize();
    const std::vector<int> allBlocks = graph_->getAllBlocks();
    jacobian.SetSize(output.size, input.size);

    mfem::Vector seed(stateSize), solution, dState(stateSize), dDesign(graph_->getDesignSize());

    if (mode == LinearMode::Transpose)
    {
        // d(of)/d(wrt) = -lambda^T dR/d(wrt),  J^T lambda = e_of
        for (int i = 0; i < output.size; ++i)
        {
            seed = 0.0;
            seed(output.offset + i) = 1.0;
            solver_->solveLinear(seed, solution, LinearMode::Transpose);

            dState = 0.0;
            dDesign = 0.0;
            graph_->applyJacobianTranspose(allBlocks, solution, dState, &dDesign);
            for (int j = 0; j < input.size; ++j)
            {
                jacobian(i, j) = -dDesign(input.offset + j);
            }
        }
    }
    else
    {
        // J dx = -dR/d(wrt) e_j
        dState = 0.0;
        for (int j = 0; j < input.size; ++j)
        {
            dDesign = 0.0;
            dDesign(input.offset + j) = 1.0;
            seed = 0.0;
            graph_->applyJacobian(allBlocks, dState, &dDesign, seed);
            seed.Neg();
            solver_->solveLinear(seed, solution, LinearMode::Forward);
            for (int i = 0; i < output.size; ++i)
            {
                jacobian(i, j) = solution(output.offset + i);
            }
        }
    }
}

} // namespace mdacouple
