/**
 * @file solvers/aitken_relaxation.hpp
 * @brief Aitken dynamic relaxation for block Gauss-Seidel sweeps
 *
 * The factor follows
 *   theta_k = -theta_{k-1} * (dx_{k-1} . (dx_k - dx_{k-1})) / |dx_k - dx_{k-1}|^2
 * clipped to [minFactor, maxFactor]. The first update of a solve is applied
 * unrelaxed and only records the increment; the configured initial factor seeds
 * the recurrence. A vanishing or non-finite denominator reverts to the
 * unrelaxed update and restarts the recurrence from the initial factor.
 */

#ifndef MDACOUPLE_SOLVERS_AITKEN_RELAXATION_HPP
#define MDACOUPLE_SOLVERS_AITKEN_RELAXATION_HPP

#include "mdacouple/core/coupling_graph.hpp"
#include "mdacouple/core/solver_options.hpp"
#include "mfem.hpp"
#include <vector>

namespace mdacouple
{

/**
 * @class AitkenRelaxation
 * @brief Per-solve relaxation state over one partition of the graph
 *
 * Instances are created inside a solve and discarded with it.
 */
class AitkenRelaxation
{
public:
    /**
     * @param options Relaxation parameters
     * @param graph Graph providing the partition inner product
     * @param blocks Blocks whose compact partition vectors are relaxed
     */
    AitkenRelaxation(const AitkenOptions& options,
                     const CouplingGraph& graph,
                     const std::vector<int>& blocks);

    /**
     * @brief Register the latest un-relaxed increment and return the factor to apply
     * @param delta Increment of the partition over the last sweep
     */
    double computeFactor(const mfem::Vector& delta);

    /**
     * @brief x = xOld + theta * delta
     */
    static void relax(const mfem::Vector& xOld,
                      const mfem::Vector& delta,
                      double theta,
                      mfem::Vector& x);

    double getFactor() const { return theta_; }

private:
    AitkenOptions options_;
    const CouplingGraph& graph_;
    std::vector<int> blocks_;

    mfem::Vector previousDelta_;
    mfem::Vector deltaChange_;
    double theta_;
    bool hasPrevious_;
};

} // namespace mdacouple

#endif // MDACOUPLE_SOLVERS_AITKEN_RELAXATION_HPP
