/**
 * @file solvers/aitken_relaxation.cpp
 * @brief Implementation of Aitken dynamic relaxation
 */

#include "mdacouple/solvers/aitken_relaxation.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace mdacouple
{

AitkenRelaxation::AitkenRelaxation(const AitkenOptions& options,
                                   const CouplingGraph& graph,
                                   const std::vector<int>& blocks)
    : options_(options),
      graph_(graph),
      blocks_(blocks),
      theta_(options.initialFactor),
      hasPrevious_(false)
{
}

double AitkenRelaxation::computeFactor(const mfem::Vector& delta)
{
    if (!options_.enabled)
    {
        return 1.0;
    }

    if (!hasPrevious_)
    {
        previousDelta_ = delta;
        hasPrevious_ = true;
        return 1.0;
    }

    deltaChange_.SetSize(delta.Size());
    subtract(delta, previousDelta_, deltaChange_);
    const double denominator = graph_.innerProduct(blocks_, deltaChange_, deltaChange_);
    const double numerator = graph_.innerProduct(blocks_, previousDelta_, deltaChange_);
    previousDelta_ = delta;

    const double tiny = std::numeric_limits<double>::min();
    // Degenerate update: apply it unrelaxed and restart the recurrence from theta_0
    if (!std::isfinite(denominator) || !std::isfinite(numerator) || denominator <= tiny)
    {
        theta_ = options_.initialFactor;
        return 1.0;
    }

    const double theta = -theta_ * numerator / denominator;
    if (!std::isfinite(theta))
    {
        theta_ = options_.initialFactor;
        return 1.0;
    }
    theta_ = std::max(options_.minFactor, std::min(options_.maxFactor, theta));
    return theta_;
}

void AitkenRelaxation::relax(const mfem::Vector& xOld,
                             const mfem::Vector& delta,
                             double theta,
                             mfem::Vector& x)
{
    x.SetSize(xOld.Size());
    add(xOld, theta, delta, x);
}

} // namespace mdacouple
