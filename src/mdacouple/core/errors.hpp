/**
 * @file core/errors.hpp
 * @brief Exception types raised by the coupled solver layers
 *
 * Every error is local to one solve instance. Configuration problems derive from
 * std::invalid_argument and are raised before any residual evaluation; numerical
 * and convergence failures derive from std::runtime_error and carry diagnostics.
 */

#ifndef MDACOUPLE_CORE_ERRORS_HPP
#define MDACOUPLE_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace mdacouple
{

/**
 * @class ConfigurationError
 * @brief Invalid partition label, coupling order, wiring or bound dimension
 */
class ConfigurationError : public std::invalid_argument
{
public:
    explicit ConfigurationError(const std::string& message);
};

/**
 * @class NumericalDomainError
 * @brief A block evaluation produced or received a non-physical numeric state
 *
 * The iteration index is -1 when the failure was raised outside of an
 * iterative solve (e.g. a plain residual evaluation).
 */
class NumericalDomainError : public std::runtime_error
{
public:
    NumericalDomainError(const std::string& blockName,
                         int iteration,
                         const std::string& detail);

    const std::string& blockName() const { return blockName_; }
    int iteration() const { return iteration_; }
    const std::string& detail() const { return detail_; }

private:
    std::string blockName_;
    int iteration_;
    std::string detail_;
};

/**
 * @class MaxIterExceeded
 * @brief An iterative layer exhausted its iteration cap without meeting tolerance
 *
 * Carries the last residual norms of the analysis and balance partitions so a
 * caller can penalize the design point instead of aborting the optimization.
 */
class MaxIterExceeded : public std::runtime_error
{
public:
    /**
     * @param prefix Prepended to the formatted message (e.g. the error kind)
     */
    MaxIterExceeded(const std::string& solverName,
                    int iterations,
                    double analysisNorm,
                    double balanceNorm,
                    const std::string& prefix = "");

    int iterations() const { return iterations_; }
    double analysisNorm() const { return analysisNorm_; }
    double balanceNorm() const { return balanceNorm_; }

private:
    int iterations_;
    double analysisNorm_;
    double balanceNorm_;
};

/**
 * @class CouplingDivergedError
 * @brief The block Gauss-Seidel iteration did not converge within its cap
 */
class CouplingDivergedError : public MaxIterExceeded
{
public:
    CouplingDivergedError(const std::string& solverName,
                          int iterations,
                          double analysisNorm,
                          double balanceNorm = 0.0);
};

/**
 * @class SubSolveBudgetExceeded
 * @brief The global inner-sweep budget of an outer solve was exhausted
 */
class SubSolveBudgetExceeded : public std::runtime_error
{
public:
    SubSolveBudgetExceeded(int used, int limit);

    int used() const { return used_; }
    int limit() const { return limit_; }

private:
    int used_;
    int limit_;
};

/**
 * @class SingularSystemError
 * @brief The reduced (Schur complement) system could not be factored
 */
class SingularSystemError : public std::runtime_error
{
public:
    explicit SingularSystemError(const std::string& message);
};

} // namespace mdacouple

#endif // MDACOUPLE_CORE_ERRORS_HPP
