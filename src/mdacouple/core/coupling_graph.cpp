/**
 * @file core/coupling_graph.cpp
 * @brief Implementation of the coupling graph
 */

#include "mdacouple/core/coupling_graph.hpp"
#include "mdacouple/core/errors.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace mdacouple
{

namespace
{

bool splitPath(const std::string& path, std::string& blockName, std::string& varName)
{
    const std::size_t dot = path.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == path.size())
    {
        return false;
    }
    blockName = path.substr(0, dot);
    varName = path.substr(dot + 1);
    return true;
}

bool allFinite(const mfem::Vector& v)
{
    for (int i = 0; i < v.Size(); ++i)
    {
        if (!std::isfinite(v(i)))
        {
            return false;
        }
    }
    return true;
}

} // namespace

#ifdef MFEM_USE_MPI
CouplingGraph::CouplingGraph(MPI_Comm comm)
    : finalized_(false),
      rank_(0),
      comm_(comm)
{
    MPI_Comm_rank(comm_, &rank_);
}
#else
CouplingGraph::CouplingGraph()
    : finalized_(false),
      rank_(0)
{
}
#endif

int CouplingGraph::addBlock(std::unique_ptr<ResidualBlock> block, const std::string& group)
{
    if (finalized_)
    {
        throw std::runtime_error("CouplingGraph::addBlock() called after finalize()");
    }
    if (!block)
    {
        throw std::invalid_argument("CouplingGraph::addBlock: null block");
    }
    if (group.empty())
    {
        throw ConfigurationError("block '" + block->getName() + "' has an empty partition label");
    }
    if (findBlock(block->getName()) >= 0)
    {
        throw ConfigurationError("duplicate block name '" + block->getName() + "'");
    }
    if (block->getOutputSize() == 0)
    {
        throw ConfigurationError("block '" + block->getName() + "' declares no outputs");
    }
    blocks_.push_back(std::move(block));
    groups_.push_back(group);
    return static_cast<int>(blocks_.size()) - 1;
}

void CouplingGraph::addDesignVariable(const std::string& name, int size, double value)
{
    if (finalized_)
    {
        throw std::runtime_error("CouplingGraph::addDesignVariable() called after finalize()");
    }
    if (name.empty() || size <= 0)
    {
        throw ConfigurationError("design variable needs a name and a positive size");
    }
    if (designIndex_.count(name))
    {
        throw ConfigurationError("duplicate design variable '" + name + "'");
    }
    DesignVariable var;
    var.name = name;
    var.size = size;
    var.value = value;
    designIndex_[name] = static_cast<int>(designVariables_.size());
    designVariables_.push_back(var);
}

void CouplingGraph::connect(const std::string& source,
                            const std::string& target,
                            const std::vector<int>& srcIndices)
{
    if (finalized_)
    {
        throw std::runtime_error("CouplingGraph::connect() called after finalize()");
    }
    if (hasConnection(target))
    {
        throw ConfigurationError("input '" + target + "' is connected more than once");
    }
    Edge edge;
    edge.source = source;
    edge.target = target;
    edge.srcIndices = srcIndices;
    edges_.push_back(edge);
}

bool CouplingGraph::hasConnection(const std::string& target) const
{
    for (const auto& edge : edges_)
    {
        if (edge.target == target)
        {
            return true;
        }
    }
    return false;
}

void CouplingGraph::resolveEdge(Edge& edge, std::vector<std::vector<bool>>& connected)
{
    std::string dstBlockName, dstVarName;
    if (!splitPath(edge.target, dstBlockName, dstVarName))
    {
        throw ConfigurationError("malformed target path '" + edge.target + "'");
    }
    const int dstBlock = findBlock(dstBlockName);
    if (dstBlock < 0)
    {
        throw ConfigurationError("unknown target block in '" + edge.target + "'");
    }
    const ResidualBlock& dst = *blocks_[dstBlock];
    const int dstVar = dst.findInput(dstVarName);
    if (dstVar < 0)
    {
        throw ConfigurationError("block '" + dstBlockName + "' has no input '" +
                                 dstVarName + "'");
    }
    if (connected[dstBlock][dstVar])
    {
        throw ConfigurationError("input '" + edge.target + "' is connected more than once");
    }
    connected[dstBlock][dstVar] = true;

    const int dstSize = dst.getInputs()[dstVar].size;
    edge.dstBlock = dstBlock;
    edge.dstOffset = dst.getInputOffset(dstVar);

    int srcOffset = 0;
    int srcSize = 0;
    auto design = designIndex_.find(edge.source);
    if (design != designIndex_.end())
    {
        const DesignVariable& var = designVariables_[design->second];
        edge.fromDesign = true;
        srcOffset = var.offset;
        srcSize = var.size;
    }
    else
    {
        std::string srcBlockName, srcVarName;
        if (!splitPath(edge.source, srcBlockName, srcVarName))
        {
            throw ConfigurationError("unknown source '" + edge.source + "'");
        }
        const int srcBlock = findBlock(srcBlockName);
        if (srcBlock < 0)
        {
            throw ConfigurationError("unknown source block in '" + edge.source + "'");
        }
        if (srcBlock == dstBlock)
        {
            throw ConfigurationError("block '" + srcBlockName +
                                     "' cannot feed its own input '" + dstVarName + "'");
        }
        const ResidualBlock& src = *blocks_[srcBlock];
        const int srcVar = src.findOutput(srcVarName);
        if (srcVar < 0)
        {
            throw ConfigurationError("block '" + srcBlockName + "' has no output '" +
                                     srcVarName + "'");
        }
        edge.fromDesign = false;
        srcOffset = stateOffsets_[srcBlock] + src.getOutputOffset(srcVar);
        srcSize = src.getOutputs()[srcVar].size;
    }

    edge.srcMap.clear();
    if (edge.srcIndices.empty())
    {
        if (srcSize != dstSize)
        {
            std::ostringstream os;
            os << "size mismatch connecting '" << edge.source << "' (" << srcSize
               << ") to '" << edge.target << "' (" << dstSize << ")";
            throw ConfigurationError(os.str());
        }
        for (int i = 0; i < srcSize; ++i)
        {
            edge.srcMap.push_back(srcOffset + i);
        }
    }
    else
    {
        if (static_cast<int>(edge.srcIndices.size()) != dstSize)
        {
            std::ostringstream os;
            os << "'" << edge.target << "' expects " << dstSize << " source indices, got "
               << edge.srcIndices.size();
            throw ConfigurationError(os.str());
        }
        for (int index : edge.srcIndices)
        {
            if (index < 0 || index >= srcSize)
            {
                std::ostringstream os;
                os << "source index " << index << " out of range for '" << edge.source
                   << "' of size " << srcSize;
                throw ConfigurationError(os.str());
            }
            edge.srcMap.push_back(srcOffset + index);
        }
    }
}

void CouplingGraph::finalize()
{
    if (finalized_)
    {
        throw std::runtime_error("CouplingGraph::finalize() called twice");
    }
    if (blocks_.empty())
    {
        throw ConfigurationError("coupling graph has no blocks");
    }

    const int numBlocks = getNumBlocks();
    stateOffsets_.SetSize(numBlocks + 1);
    stateOffsets_[0] = 0;
    for (int b = 0; b < numBlocks; ++b)
    {
        stateOffsets_[b + 1] = stateOffsets_[b] + blocks_[b]->getOutputSize();
    }

    std::vector<std::vector<bool>> connected(numBlocks);
    for (int b = 0; b < numBlocks; ++b)
    {
        connected[b].assign(blocks_[b]->getInputs().size(), false);
    }

    // Every unconnected input becomes an automatic design variable "block.input"
    for (int b = 0; b < numBlocks; ++b)
    {
        const auto& inputs = blocks_[b]->getInputs();
        for (const auto& var : inputs)
        {
            const std::string path = blocks_[b]->getName() + "." + var.name;
            if (hasConnection(path))
            {
                continue;
            }
            if (!designIndex_.count(path))
            {
                addDesignVariable(path, var.size, var.defaultValue);
            }
            connect(path, path);
        }
    }

    int designOffset = 0;
    for (auto& var : designVariables_)
    {
        var.offset = designOffset;
        designOffset += var.size;
    }

    blockEdges_.assign(numBlocks, std::vector<int>());
    for (std::size_t e = 0; e < edges_.size(); ++e)
    {
        resolveEdge(edges_[e], connected);
        blockEdges_[edges_[e].dstBlock].push_back(static_cast<int>(e));
    }

    state_.SetSize(stateOffsets_[numBlocks]);
    design_.SetSize(designOffset);
    for (const auto& var : designVariables_)
    {
        for (int i = 0; i < var.size; ++i)
        {
            design_(var.offset + i) = var.value;
        }
    }

    inputBuffers_.resize(numBlocks);
    for (int b = 0; b < numBlocks; ++b)
    {
        inputBuffers_[b].SetSize(blocks_[b]->getInputSize());
        inputBuffers_[b] = 0.0;
    }

    finalized_ = true;
    resetOutputs();
}

int CouplingGraph::findBlock(const std::string& name) const
{
    for (std::size_t b = 0; b < blocks_.size(); ++b)
    {
        if (blocks_[b]->getName() == name)
        {
            return static_cast<int>(b);
        }
    }
    return -1;
}

std::vector<int> CouplingGraph::getBlocksInGroup(const std::string& group) const
{
    std::vector<int> result;
    for (std::size_t b = 0; b < groups_.size(); ++b)
    {
        if (groups_[b] == group)
        {
            result.push_back(static_cast<int>(b));
        }
    }
    return result;
}

std::vector<int> CouplingGraph::getAllBlocks() const
{
    std::vector<int> result(blocks_.size());
    for (std::size_t b = 0; b < blocks_.size(); ++b)
    {
        result[b] = static_cast<int>(b);
    }
    return result;
}

std::vector<std::string> CouplingGraph::getGroupNames() const
{
    std::vector<std::string> names;
    for (const auto& group : groups_)
    {
        bool seen = false;
        for (const auto& name : names)
        {
            seen = seen || (name == group);
        }
        if (!seen)
        {
            names.push_back(group);
        }
    }
    return names;
}

bool CouplingGraph::hasDesignVariable(const std::string& name) const
{
    return designIndex_.count(name) > 0;
}

std::vector<std::string> CouplingGraph::getDesignVariableNames() const
{
    std::vector<std::string> names;
    for (const auto& var : designVariables_)
    {
        names.push_back(var.name);
    }
    return names;
}

void CouplingGraph::requireFinalized(const char* caller) const
{
    if (!finalized_)
    {
        throw std::runtime_error(std::string("CouplingGraph::") + caller +
                                 " called before finalize()");
    }
}

VariableSlot CouplingGraph::findOutput(const std::string& path) const
{
    requireFinalized("findOutput()");
    std::string blockName, varName;
    if (!splitPath(path, blockName, varName))
    {
        throw ConfigurationError("malformed output path '" + path + "'");
    }
    const int b = findBlock(blockName);
    if (b < 0)
    {
        throw ConfigurationError("unknown block in output path '" + path + "'");
    }
    const int var = blocks_[b]->findOutput(varName);
    if (var < 0)
    {
        throw ConfigurationError("block '" + blockName + "' has no output '" + varName + "'");
    }
    VariableSlot slot;
    slot.offset = stateOffsets_[b] + blocks_[b]->getOutputOffset(var);
    slot.size = blocks_[b]->getOutputs()[var].size;
    return slot;
}

VariableSlot CouplingGraph::findDesignVariable(const std::string& name) const
{
    requireFinalized("findDesignVariable()");
    auto it = designIndex_.find(name);
    if (it == designIndex_.end())
    {
        throw ConfigurationError("unknown design variable '" + name + "'");
    }
    VariableSlot slot;
    slot.offset = designVariables_[it->second].offset;
    slot.size = designVariables_[it->second].size;
    return slot;
}

void CouplingGraph::setDesignValue(const std::string& name, const mfem::Vector& value)
{
    const VariableSlot slot = findDesignVariable(name);
    if (value.Size() != slot.size)
    {
        throw ConfigurationError("value for design variable '" + name + "' has wrong size");
    }
    design_.SetVector(value, slot.offset);
}

void CouplingGraph::setDesignValue(const std::string& name, double value)
{
    const VariableSlot slot = findDesignVariable(name);
    for (int i = 0; i < slot.size; ++i)
    {
        design_(slot.offset + i) = value;
    }
}

void CouplingGraph::getOutputValue(const std::string& path, mfem::Vector& value) const
{
    const VariableSlot slot = findOutput(path);
    value.SetSize(slot.size);
    for (int i = 0; i < slot.size; ++i)
    {
        value(i) = state_(slot.offset + i);
    }
}

double CouplingGraph::getScalarOutput(const std::string& path) const
{
    const VariableSlot slot = findOutput(path);
    if (slot.size != 1)
    {
        throw std::invalid_argument("CouplingGraph::getScalarOutput: '" + path +
                                    "' is not a scalar");
    }
    return state_(slot.offset);
}

void CouplingGraph::resetOutputs()
{
    resetOutputs(getAllBlocks());
}

void CouplingGraph::resetOutputs(const std::vector<int>& blocks)
{
    requireFinalized("resetOutputs()");
    for (int b : blocks)
    {
        const ResidualBlock& block = *blocks_.at(b);
        const auto& outputs = block.getOutputs();
        for (std::size_t var = 0; var < outputs.size(); ++var)
        {
            const int offset = stateOffsets_[b] + block.getOutputOffset(static_cast<int>(var));
            for (int i = 0; i < outputs[var].size; ++i)
            {
                state_(offset + i) = outputs[var].defaultValue;
            }
        }
    }
}

void CouplingGraph::gatherInputs(int block,
                                 const mfem::Vector& state,
                                 const mfem::Vector* design,
                                 mfem::Vector& inputs) const
{
    inputs.SetSize(blocks_[block]->getInputSize());
    for (int e : blockEdges_[block])
    {
        const Edge& edge = edges_[e];
        const int n = static_cast<int>(edge.srcMap.size());
        if (edge.fromDesign)
        {
            for (int i = 0; i < n; ++i)
            {
                inputs(edge.dstOffset + i) = design ? (*design)(edge.srcMap[i]) : 0.0;
            }
        }
        else
        {
            for (int i = 0; i < n; ++i)
            {
                inputs(edge.dstOffset + i) = state(edge.srcMap[i]);
            }
        }
    }
}

void CouplingGraph::scatterInputsTranspose(int block,
                                           const mfem::Vector& dInputs,
                                           mfem::Vector& dState,
                                           mfem::Vector* dDesign) const
{
    for (int e : blockEdges_[block])
    {
        const Edge& edge = edges_[e];
        const int n = static_cast<int>(edge.srcMap.size());
        if (edge.fromDesign)
        {
            if (!dDesign)
            {
                continue;
            }
            for (int i = 0; i < n; ++i)
            {
                (*dDesign)(edge.srcMap[i]) += dInputs(edge.dstOffset + i);
            }
        }
        else
        {
            for (int i = 0; i < n; ++i)
            {
                dState(edge.srcMap[i]) += dInputs(edge.dstOffset + i);
            }
        }
    }
}

void CouplingGraph::viewOutputs(int block, mfem::Vector& view)
{
    view.MakeRef(state_, stateOffsets_[block], blocks_[block]->getOutputSize());
}

void CouplingGraph::evaluateResidual(int block, mfem::Vector& residual, int iteration)
{
    requireFinalized("evaluateResidual()");
    ResidualBlock& blk = *blocks_[block];
    mfem::Vector& inputs = inputBuffers_[block];
    gatherInputs(block, state_, &design_, inputs);

    mfem::Vector outputs;
    viewOutputs(block, outputs);
    mfem::Vector blockResidual;
    blockResidual.MakeRef(residual, stateOffsets_[block], blk.getOutputSize());

    try
    {
        blk.evaluateResidual(inputs, outputs, blockResidual);
    }
    catch (const NumericalDomainError& err)
    {
        if (err.iteration() >= 0 || iteration < 0)
        {
            throw;
        }
        throw NumericalDomainError(err.blockName(), iteration, err.detail());
    }
    if (!allFinite(blockResidual))
    {
        throw NumericalDomainError(blk.getName(), iteration, "non-finite residual");
    }
}

void CouplingGraph::evaluateResiduals(const std::vector<int>& blocks,
                                      mfem::Vector& residual,
                                      int iteration)
{
    if (residual.Size() != state_.Size())
    {
        residual.SetSize(state_.Size());
        residual = 0.0;
    }
    for (int b : blocks)
    {
        evaluateResidual(b, residual, iteration);
    }
}

bool CouplingGraph::solveBlock(int block, int iteration)
{
    requireFinalized("solveBlock()");
    ResidualBlock& blk = *blocks_[block];
    if (!blk.providesSolve())
    {
        return false;
    }
    mfem::Vector& inputs = inputBuffers_[block];
    gatherInputs(block, state_, &design_, inputs);
    if (!allFinite(inputs))
    {
        throw NumericalDomainError(blk.getName(), iteration, "non-finite inputs");
    }

    mfem::Vector outputs;
    viewOutputs(block, outputs);
    try
    {
        blk.solveResidual(inputs, outputs);
    }
    catch (const NumericalDomainError& err)
    {
        if (err.iteration() >= 0 || iteration < 0)
        {
            throw;
        }
        throw NumericalDomainError(err.blockName(), iteration, err.detail());
    }
    if (!allFinite(outputs))
    {
        throw NumericalDomainError(blk.getName(), iteration, "non-finite outputs");
    }
    return true;
}

void CouplingGraph::linearize(const std::vector<int>& blocks)
{
    requireFinalized("linearize()");
    for (int b : blocks)
    {
        mfem::Vector& inputs = inputBuffers_[b];
        gatherInputs(b, state_, &design_, inputs);
        mfem::Vector outputs;
        viewOutputs(b, outputs);
        blocks_[b]->linearize(inputs, outputs);
    }
}

void CouplingGraph::applyJacobian(const std::vector<int>& rowBlocks,
                                  const mfem::Vector& dState,
                                  const mfem::Vector* dDesign,
                                  mfem::Vector& dResidual)
{
    requireFinalized("applyJacobian()");
    if (dResidual.Size() != state_.Size())
    {
        dResidual.SetSize(state_.Size());
        dResidual = 0.0;
    }
    for (int b : rowBlocks)
    {
        ResidualBlock& blk = *blocks_[b];
        const int outSize = blk.getOutputSize();

        gatherInputs(b, dState, dDesign, dInputs_);
        dOutputs_.SetSize(outSize);
        for (int i = 0; i < outSize; ++i)
        {
            dOutputs_(i) = dState(stateOffsets_[b] + i);
        }
        mfem::Vector blockResidual;
        blockResidual.MakeRef(dResidual, stateOffsets_[b], outSize);
        blk.applyLinear(dInputs_, dOutputs_, blockResidual, LinearMode::Forward);
    }
}

void CouplingGraph::applyJacobianTranspose(const std::vector<int>& rowBlocks,
                                           const mfem::Vector& dResidual,
                                           mfem::Vector& dState,
                                           mfem::Vector* dDesign)
{
    requireFinalized("applyJacobianTranspose()");
    for (int b : rowBlocks)
    {
        ResidualBlock& blk = *blocks_[b];
        const int outSize = blk.getOutputSize();

        dResidual_.SetSize(outSize);
        for (int i = 0; i < outSize; ++i)
        {
            dResidual_(i) = dResidual(stateOffsets_[b] + i);
        }
        dInputs_.SetSize(blk.getInputSize());
        dInputs_ = 0.0;
        dOutputs_.SetSize(outSize);
        dOutputs_ = 0.0;
        blk.applyLinear(dInputs_, dOutputs_, dResidual_, LinearMode::Transpose);

        for (int i = 0; i < outSize; ++i)
        {
            dState(stateOffsets_[b] + i) += dOutputs_(i);
        }
        scatterInputsTranspose(b, dInputs_, dState, dDesign);
    }
}

int CouplingGraph::getPartitionSize(const std::vector<int>& blocks) const
{
    int size = 0;
    for (int b : blocks)
    {
        size += blocks_[b]->getOutputSize();
    }
    return size;
}

void CouplingGraph::extractPartition(const std::vector<int>& blocks,
                                     const mfem::Vector& full,
                                     mfem::Vector& compact) const
{
    compact.SetSize(getPartitionSize(blocks));
    int pos = 0;
    for (int b : blocks)
    {
        for (int i = stateOffsets_[b]; i < stateOffsets_[b + 1]; ++i)
        {
            compact(pos++) = full(i);
        }
    }
}

void CouplingGraph::insertPartition(const std::vector<int>& blocks,
                                    const mfem::Vector& compact,
                                    mfem::Vector& full) const
{
    int pos = 0;
    for (int b : blocks)
    {
        for (int i = stateOffsets_[b]; i < stateOffsets_[b + 1]; ++i)
        {
            full(i) = compact(pos++);
        }
    }
}

double CouplingGraph::innerProduct(const std::vector<int>& blocks,
                                   const mfem::Vector& u,
                                   const mfem::Vector& v) const
{
    double distributedSum = 0.0;
    double replicatedSum = 0.0;
    int pos = 0;
    for (int b : blocks)
    {
        for (const auto& var : blocks_[b]->getOutputs())
        {
            double sum = 0.0;
            for (int i = 0; i < var.size; ++i, ++pos)
            {
                sum += u(pos) * v(pos);
            }
            if (var.distributed)
            {
                distributedSum += sum;
            }
            else
            {
                replicatedSum += sum;
            }
        }
    }
#ifdef MFEM_USE_MPI
    double globalSum = 0.0;
    MPI_Allreduce(&distributedSum, &globalSum, 1, MPI_DOUBLE, MPI_SUM, comm_);
    distributedSum = globalSum;
#endif
    return distributedSum + replicatedSum;
}

double CouplingGraph::norm(const std::vector<int>& blocks, const mfem::Vector& v) const
{
    return std::sqrt(innerProduct(blocks, v, v));
}

void CouplingGraph::barrier() const
{
#ifdef MFEM_USE_MPI
    MPI_Barrier(comm_);
#endif
}

} // namespace mdacouple
