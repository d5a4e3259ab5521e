/**
 * @file core/discipline_builder.hpp
 * @brief Abstract factory for the residual blocks of one discipline
 */

#ifndef MDACOUPLE_CORE_DISCIPLINE_BUILDER_HPP
#define MDACOUPLE_CORE_DISCIPLINE_BUILDER_HPP

#include "mdacouple/core/residual_block.hpp"
#include <memory>
#include <string>

namespace mdacouple
{

/**
 * @class DisciplineBuilder
 * @brief Creates the blocks a discipline contributes to each scenario
 *
 * Every factory receives the name the created block must carry. Only the
 * coupling block is mandatory; the other factories return nullptr when the
 * discipline has nothing to contribute at that stage.
 */
class DisciplineBuilder
{
public:
    explicit DisciplineBuilder(const std::string& name) : name_(name) {}

    virtual ~DisciplineBuilder() = default;

    const std::string& getName() const { return name_; }

    /**
     * @brief Block producing mesh coordinates (runs once before everything else)
     */
    virtual std::unique_ptr<ResidualBlock> createMeshBlock(const std::string& blockName)
    {
        return nullptr;
    }

    virtual std::unique_ptr<ResidualBlock> createPreCouplingBlock(const std::string& blockName)
    {
        return nullptr;
    }

    /**
     * @brief Block taking part in the coupled (Gauss-Seidel) iteration
     */
    virtual std::unique_ptr<ResidualBlock> createCouplingBlock(const std::string& blockName) = 0;

    /**
     * @brief Post-processing block producing scalar outputs (mass, margins, ...)
     */
    virtual std::unique_ptr<ResidualBlock> createPostCouplingBlock(const std::string& blockName)
    {
        return nullptr;
    }

private:
    std::string name_;
};

} // namespace mdacouple

#endif // MDACOUPLE_CORE_DISCIPLINE_BUILDER_HPP
