/**
 * @file core/coupled_problem.hpp
 * @brief Top-level coupled problem: solve, read outputs, query total derivatives
 */

#ifndef MDACOUPLE_CORE_COUPLED_PROBLEM_HPP
#define MDACOUPLE_CORE_COUPLED_PROBLEM_HPP

#include "mdacouple/core/coupling_graph.hpp"
#include "mdacouple/core/solver_interface.hpp"
#include "mdacouple/core/solver_options.hpp"
#include "mfem.hpp"
#include <memory>
#include <string>

namespace mdacouple
{

/**
 * @class CoupledProblem
 * @brief Owns a coupling graph and the solver that converges it
 *
 * A SchurNewtonSolver is used when some block carries the balance label of
 * the options, otherwise a NonlinearBlockGaussSeidel over all blocks. Total
 * derivatives are computed at the last converged state; the blocks are
 * relinearized there on the first derivative request after a solve.
 */
class CoupledProblem
{
public:
    /**
     * @param graph Coupling graph, finalized here if it is not yet
     * @param options Solver configuration
     */
    explicit CoupledProblem(std::unique_ptr<CouplingGraph> graph,
                            const TrimSolverOptions& options = TrimSolverOptions());

    ~CoupledProblem() = default;

    CoupledProblem(const CoupledProblem&) = delete;
    CoupledProblem& operator=(const CoupledProblem&) = delete;

    /**
     * @brief Set a design variable; invalidates the last solution
     */
    void setInput(const std::string& name, const mfem::Vector& value);
    void setInput(const std::string& name, double value);

    /**
     * @brief Solve the coupled system for the current inputs
     */
    SolveReport solve();

    void getOutput(const std::string& path, mfem::Vector& value) const;
    double getOutput(const std::string& path) const;

    /**
     * @brief d(of)/d(wrt) at the converged state
     * @param of Output path "block.output"
     * @param wrt Design variable name
     * @param jacobian Result of size |of| x |wrt|
     * @param mode Transpose solves one adjoint system per entry of of,
     *             Forward one linear system per entry of wrt
     * @throws SingularSystemError when the reduced system cannot be factored;
     *         the converged state is left untouched
     */
    void totalDerivative(const std::string& of,
                         const std::string& wrt,
                         mfem::DenseMatrix& jacobian,
                         LinearMode mode = LinearMode::Transpose);

    bool hasBalance() const { return hasBalance_; }

    CouplingGraph& getGraph() { return *graph_; }
    const CouplingGraph& getGraph() const { return *graph_; }
    CoupledSolverInterface& getSolver() { return *solver_; }

    const SolveReport& getLastReport() const { return report_; }

private:
    void requireSolved(const char* caller) const;

    std::unique_ptr<CouplingGraph> graph_;
    std::unique_ptr<CoupledSolverInterface> solver_;
    TrimSolverOptions options_;
    SolveReport report_;

    bool hasBalance_;
    bool solved_;
    bool linearized_;
};

} // namespace mdacouple

#endif // MDACOUPLE_CORE_COUPLED_PROBLEM_HPP
