/**
 * @file core/errors.cpp
 * @brief Message formatting for the solver exception types
 */

#include "mdacouple/core/errors.hpp"
#include <sstream>

namespace mdacouple
{

namespace
{

std::string formatDomainMessage(const std::string& blockName,
                                int iteration,
                                const std::string& detail)
{
    std::ostringstream os;
    os << "NumericalDomainError in block '" << blockName << "'";
    if (iteration >= 0)
    {
        os << " at iteration " << iteration;
    }
    os << ": " << detail;
    return os.str();
}

std::string formatMaxIterMessage(const std::string& solverName,
                                 int iterations,
                                 double analysisNorm,
                                 double balanceNorm)
{
    std::ostringstream os;
    os << solverName << ": no convergence after " << iterations
       << " iterations (analysis residual = " << analysisNorm
       << ", balance residual = " << balanceNorm << ")";
    return os.str();
}

std::string formatBudgetMessage(int used, int limit)
{
    std::ostringstream os;
    os << "SubSolveBudgetExceeded: " << used << " inner sweeps requested, budget is "
       << limit;
    return os.str();
}

} // namespace

ConfigurationError::ConfigurationError(const std::string& message)
    : std::invalid_argument("ConfigurationError: " + message)
{
}

NumericalDomainError::NumericalDomainError(const std::string& blockName,
                                           int iteration,
                                           const std::string& detail)
    : std::runtime_error(formatDomainMessage(blockName, iteration, detail)),
      blockName_(blockName),
      iteration_(iteration),
      detail_(detail)
{
}

MaxIterExceeded::MaxIterExceeded(const std::string& solverName,
                                 int iterations,
                                 double analysisNorm,
                                 double balanceNorm,
                                 const std::string& prefix)
    : std::runtime_error(prefix + formatMaxIterMessage(solverName, iterations,
                                                       analysisNorm, balanceNorm)),
      iterations_(iterations),
      analysisNorm_(analysisNorm),
      balanceNorm_(balanceNorm)
{
}

CouplingDivergedError::CouplingDivergedError(const std::string& solverName,
                                             int iterations,
                                             double analysisNorm,
                                             double balanceNorm)
    : MaxIterExceeded(solverName, iterations, analysisNorm, balanceNorm,
                      "CouplingDivergedError: ")
{
}

SubSolveBudgetExceeded::SubSolveBudgetExceeded(int used, int limit)
    : std::runtime_error(formatBudgetMessage(used, limit)),
      used_(used),
      limit_(limit)
{
}

SingularSystemError::SingularSystemError(const std::string& message)
    : std::runtime_error("SingularSystemError: " + message)
{
}

} // namespace mdacouple
