/**
 * @file core/trimmed_analysis.cpp
 * @brief Implementation of the trimmed scenario assembly
 */

#include "mdacouple/core/trimmed_analysis.hpp"
#include "mdacouple/core/errors.hpp"
#include <algorithm>
#include <set>
#include <sstream>
#include <stdexcept>

namespace mdacouple
{

TrimmedAnalysis::TrimmedAnalysis(const TrimmedAnalysisOptions& options)
    : options_(options)
{
}

void TrimmedAnalysis::addDiscipline(std::unique_ptr<DisciplineBuilder> builder)
{
    if (!builder)
    {
        throw std::invalid_argument("TrimmedAnalysis::addDiscipline: null builder");
    }
    for (const auto& existing : disciplines_)
    {
        if (existing->getName() == builder->getName())
        {
            throw ConfigurationError("TrimmedAnalysis: discipline '" + builder->getName() +
                                     "' registered twice");
        }
    }
    disciplines_.push_back(std::move(builder));
}

void TrimmedAnalysis::setBalanceBuilder(std::unique_ptr<DisciplineBuilder> builder)
{
    balanceBuilder_ = std::move(builder);
}

void TrimmedAnalysis::connectInput(const std::string& scenario,
                                   const std::string& input,
                                   const std::string& source,
                                   const std::vector<int>& srcIndices)
{
    Connection connection;
    connection.source = source;
    connection.srcIndices = srcIndices;
    connections_[std::make_pair(scenario, input)] = connection;
}

const DisciplineBuilder& TrimmedAnalysis::findDiscipline(const std::string& name) const
{
    for (const auto& builder : disciplines_)
    {
        if (builder->getName() == name)
        {
            return *builder;
        }
    }
    throw ConfigurationError("TrimmedAnalysis: unknown discipline '" + name + "'");
}

void TrimmedAnalysis::checkStageOrder(const std::vector<std::string>& order,
                                      const char* label) const
{
    if (order.size() > disciplines_.size())
    {
        std::ostringstream os;
        os << "TrimmedAnalysis: specified too many items in the " << label
           << " order list, len=" << order.size();
        throw ConfigurationError(os.str());
    }

    std::set<std::string> seen;
    for (const auto& name : order)
    {
        bool known = false;
        for (const auto& builder : disciplines_)
        {
            known = known || (builder->getName() == name);
        }
        if (!known)
        {
            std::ostringstream os;
            os << "TrimmedAnalysis: unknown " << label << " order option '" << name
               << "', valid options are [";
            for (std::size_t i = 0; i < disciplines_.size(); ++i)
            {
                os << (i ? ", " : "") << "\"" << disciplines_[i]->getName() << "\"";
            }
            os << "]";
            throw ConfigurationError(os.str());
        }
        if (!seen.insert(name).second)
        {
            throw ConfigurationError(std::string("TrimmedAnalysis: '") + name +
                                     "' appears twice in the " + label + " order list");
        }
    }
}

std::vector<std::string> TrimmedAnalysis::effectiveAnalysisInputs() const
{
    return options_.analysisInputs.empty() ? options_.balanceOutputs : options_.analysisInputs;
}

std::vector<std::string> TrimmedAnalysis::effectiveAnalysisOutputs() const
{
    return options_.analysisOutputs.empty() ? options_.balanceInputs : options_.analysisOutputs;
}

void TrimmedAnalysis::validate() const
{
    if (disciplines_.empty())
    {
        throw ConfigurationError("TrimmedAnalysis: no discipline registered");
    }
    if (options_.analysisGroup.empty() || options_.balanceGroup.empty() ||
        options_.analysisGroup == options_.balanceGroup)
    {
        throw ConfigurationError("TrimmedAnalysis: partition labels must be distinct and "
                                 "non-empty");
    }

    checkStageOrder(options_.preCouplingOrder, "pre coupling");
    checkStageOrder(options_.postCouplingOrder, "post coupling");
    if (!options_.couplingOrder.empty())
    {
        checkStageOrder(options_.couplingOrder, "coupling");
        if (options_.couplingOrder.size() != disciplines_.size())
        {
            throw ConfigurationError("TrimmedAnalysis: the coupling order must list every "
                                     "discipline");
        }
    }

    if (effectiveAnalysisInputs().size() != options_.balanceOutputs.size())
    {
        throw ConfigurationError("TrimmedAnalysis: analysisInputs and balanceOutputs differ "
                                 "in length");
    }
    if (effectiveAnalysisOutputs().size() != options_.balanceInputs.size())
    {
        throw ConfigurationError("TrimmedAnalysis: analysisOutputs and balanceInputs differ "
                                 "in length");
    }
    if (!balanceBuilder_ && (!options_.balanceInputs.empty() || !options_.balanceOutputs.empty()))
    {
        throw ConfigurationError("TrimmedAnalysis: balance variables given without a "
                                 "balance builder");
    }
}

std::string TrimmedAnalysis::balanceBlockName(const std::string& scenario)
{
    return scenario + ".balance";
}

std::string TrimmedAnalysis::findScenarioOutput(const CouplingGraph& graph,
                                                const std::string& scenario,
                                                const std::string& output)
{
    const std::string prefix = scenario + ".";
    std::string path;
    int matches = 0;
    for (int b = 0; b < graph.getNumBlocks(); ++b)
    {
        const ResidualBlock& block = graph.getBlock(b);
        if (block.getName().compare(0, prefix.size(), prefix) != 0)
        {
            continue;
        }
        if (block.findOutput(output) >= 0)
        {
            path = block.getName() + "." + output;
            ++matches;
        }
    }
    if (matches != 1)
    {
        std::ostringstream os;
        os << "TrimmedAnalysis: scenario '" << scenario << "' has " << matches
           << " outputs named '" << output << "'";
        throw ConfigurationError(os.str());
    }
    return path;
}

void TrimmedAnalysis::addStageBlock(CouplingGraph& graph,
                                    std::unique_ptr<ResidualBlock> block,
                                    const std::string& expectedName,
                                    std::vector<int>& analysisBlocks) const
{
    if (!block)
    {
        return;
    }
    if (block->getName() != expectedName)
    {
        throw ConfigurationError("TrimmedAnalysis: builder returned block '" +
                                 block->getName() + "', expected '" + expectedName + "'");
    }
    analysisBlocks.push_back(graph.addBlock(std::move(block), options_.analysisGroup));
}

void TrimmedAnalysis::wireInput(CouplingGraph& graph,
                                const std::string& scenario,
                                int block,
                                const VariableInfo& input,
                                const std::vector<int>& analysisBlocks) const
{
    const std::string target = graph.getBlock(block).getName() + "." + input.name;
    if (graph.hasConnection(target))
    {
        return;
    }

    auto explicitSource = connections_.find(std::make_pair(scenario, input.name));
    if (explicitSource != connections_.end())
    {
        graph.connect(explicitSource->second.source, target, explicitSource->second.srcIndices);
        return;
    }

    if (balanceBuilder_ && graph.getGroup(block) == options_.analysisGroup)
    {
        const std::vector<std::string> analysisInputs = effectiveAnalysisInputs();
        auto it = std::find(analysisInputs.begin(), analysisInputs.end(), input.name);
        if (it != analysisInputs.end())
        {
            const std::size_t k = static_cast<std::size_t>(it - analysisInputs.begin());
            graph.connect(balanceBlockName(scenario) + "." + options_.balanceOutputs[k], target);
            return;
        }
    }

    std::string promoted;
    int matches = 0;
    for (int other : analysisBlocks)
    {
        if (other != block && graph.getBlock(other).findOutput(input.name) >= 0)
        {
            promoted = graph.getBlock(other).getName() + "." + input.name;
            ++matches;
        }
    }
    if (matches > 1)
    {
        throw ConfigurationError("TrimmedAnalysis: input '" + target +
                                 "' matches several outputs in scenario '" + scenario + "'");
    }
    if (matches == 1)
    {
        graph.connect(promoted, target);
        return;
    }

    const std::string designName = scenario + "." + input.name;
    if (!graph.hasDesignVariable(designName))
    {
        graph.addDesignVariable(designName, input.size, input.defaultValue);
    }
    graph.connect(designName, target);
}

void TrimmedAnalysis::addScenario(CouplingGraph& graph, const std::string& scenario) const
{
    validate();
    if (graph.isFinalized())
    {
        throw std::runtime_error("TrimmedAnalysis::addScenario() called on a finalized graph");
    }
    if (scenario.empty() || scenario.find('.') != std::string::npos)
    {
        throw ConfigurationError("TrimmedAnalysis: invalid scenario name '" + scenario + "'");
    }

    std::vector<int> analysisBlocks;
    const std::string prefix = scenario + ".";

    for (const auto& builder : disciplines_)
    {
        const std::string name = prefix + builder->getName() + "_mesh";
        addStageBlock(graph, builder->createMeshBlock(name), name, analysisBlocks);
    }
    for (const auto& discipline : options_.preCouplingOrder)
    {
        const std::string name = prefix + discipline + "_pre";
        addStageBlock(graph, findDiscipline(discipline).createPreCouplingBlock(name), name,
                      analysisBlocks);
    }

    std::vector<std::string> couplingOrder = options_.couplingOrder;
    if (couplingOrder.empty())
    {
        for (const auto& builder : disciplines_)
        {
            couplingOrder.push_back(builder->getName());
        }
    }
    for (const auto& discipline : couplingOrder)
    {
        const std::string name = prefix + discipline + "_coupling";
        std::unique_ptr<ResidualBlock> block = findDiscipline(discipline).createCouplingBlock(name);
        if (!block)
        {
            throw ConfigurationError("TrimmedAnalysis: discipline '" + discipline +
                                     "' did not create a coupling block");
        }
        addStageBlock(graph, std::move(block), name, analysisBlocks);
    }

    for (const auto& discipline : options_.postCouplingOrder)
    {
        const std::string name = prefix + discipline + "_post";
        addStageBlock(graph, findDiscipline(discipline).createPostCouplingBlock(name), name,
                      analysisBlocks);
    }

    int balance = -1;
    if (balanceBuilder_)
    {
        const std::string name = balanceBlockName(scenario);
        std::unique_ptr<ResidualBlock> block = balanceBuilder_->createCouplingBlock(name);
        if (!block || block->getName() != name)
        {
            throw ConfigurationError("TrimmedAnalysis: balance builder must create block '" +
                                     name + "'");
        }
        for (const auto& output : options_.balanceOutputs)
        {
            if (block->findOutput(output) < 0)
            {
                throw ConfigurationError("TrimmedAnalysis: balance block has no output '" +
                                         output + "'");
            }
        }
        for (const auto& input : options_.balanceInputs)
        {
            if (block->findInput(input) < 0)
            {
                throw ConfigurationError("TrimmedAnalysis: balance block has no input '" +
                                         input + "'");
            }
        }
        balance = graph.addBlock(std::move(block), options_.balanceGroup);
    }

    for (int block : analysisBlocks)
    {
        for (const auto& input : graph.getBlock(block).getInputs())
        {
            wireInput(graph, scenario, block, input, analysisBlocks);
        }
    }

    if (balance >= 0)
    {
        const std::vector<std::string> analysisOutputs = effectiveAnalysisOutputs();
        for (std::size_t k = 0; k < options_.balanceInputs.size(); ++k)
        {
            std::string source;
            int matches = 0;
            for (int block : analysisBlocks)
            {
                if (graph.getBlock(block).findOutput(analysisOutputs[k]) >= 0)
                {
                    source = graph.getBlock(block).getName() + "." + analysisOutputs[k];
                    ++matches;
                }
            }
            if (matches != 1)
            {
                std::ostringstream os;
                os << "TrimmedAnalysis: balance input '" << options_.balanceInputs[k]
                   << "' needs exactly one analysis output '" << analysisOutputs[k]
                   << "' in scenario '" << scenario << "', found " << matches;
                throw ConfigurationError(os.str());
            }
            graph.connect(source, balanceBlockName(scenario) + "." + options_.balanceInputs[k]);
        }

        for (const auto& input : graph.getBlock(balance).getInputs())
        {
            wireInput(graph, scenario, balance, input, analysisBlocks);
        }
    }
}

} // namespace mdacouple
