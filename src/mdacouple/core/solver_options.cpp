/**
 * @file core/solver_options.cpp
 * @brief Validation of solver option structs
 */

#include "mdacouple/core/solver_options.hpp"
#include "mdacouple/core/errors.hpp"
#include <cmath>
#include <set>
#include <sstream>

namespace mdacouple
{

namespace
{

void checkTolerances(const std::string& owner, double absTol, double relTol, int maxIter)
{
    if (!(absTol >= 0.0) || !(relTol >= 0.0))
    {
        throw ConfigurationError(owner + ": tolerances must be non-negative");
    }
    if (maxIter < 1)
    {
        throw ConfigurationError(owner + ": maxIter must be at least 1");
    }
}

} // namespace

void AitkenOptions::validate(const std::string& owner) const
{
    if (!enabled)
    {
        return;
    }
    if (!(minFactor <= maxFactor))
    {
        throw ConfigurationError(owner + ": Aitken factor range is empty");
    }
    if (!(minFactor > 0.0))
    {
        throw ConfigurationError(owner + ": Aitken minimum factor must be positive");
    }
    if (!(initialFactor > 0.0 && initialFactor <= 1.0))
    {
        throw ConfigurationError(owner + ": Aitken initial factor must lie in (0, 1]");
    }
}

void FixedPointOptions::validate() const
{
    checkTolerances("FixedPointOptions", absTol, relTol, maxIter);
    aitken.validate("FixedPointOptions");

    std::set<std::string> seen;
    for (const auto& name : blockOrder)
    {
        if (!seen.insert(name).second)
        {
            throw ConfigurationError("FixedPointOptions: block '" + name +
                                     "' appears twice in blockOrder");
        }
    }
}

void LinearSolverOptions::validate() const
{
    checkTolerances("LinearSolverOptions", absTol, relTol, maxIter);
    aitken.validate("LinearSolverOptions");
}

void BalanceBounds::validate(int balanceSize) const
{
    if (empty())
    {
        return;
    }
    if (static_cast<int>(lower.size()) != balanceSize ||
        static_cast<int>(upper.size()) != balanceSize)
    {
        std::ostringstream os;
        os << "BalanceBounds: expected " << balanceSize << " lower and upper entries, got "
           << lower.size() << " and " << upper.size();
        throw ConfigurationError(os.str());
    }
    for (int i = 0; i < balanceSize; ++i)
    {
        if (!(lower[i] <= upper[i]))
        {
            std::ostringstream os;
            os << "BalanceBounds: lower bound exceeds upper bound at entry " << i;
            throw ConfigurationError(os.str());
        }
    }
}

void TrimSolverOptions::validate() const
{
    checkTolerances("TrimSolverOptions", absTol, relTol, maxIter);
    if (maxSubSolves < 1)
    {
        throw ConfigurationError("TrimSolverOptions: maxSubSolves must be at least 1");
    }
    if (groupNames.size() != 2)
    {
        throw ConfigurationError("TrimSolverOptions: groupNames must name exactly the "
                                 "analysis and balance partitions");
    }
    if (groupNames[0].empty() || groupNames[1].empty() || groupNames[0] == groupNames[1])
    {
        throw ConfigurationError("TrimSolverOptions: partition labels must be distinct "
                                 "and non-empty");
    }
    if (!(singularTol >= 0.0))
    {
        throw ConfigurationError("TrimSolverOptions: singularTol must be non-negative");
    }
    analysisSolver.validate();
    analysisLinearSolver.validate();
}

} // namespace mdacouple
