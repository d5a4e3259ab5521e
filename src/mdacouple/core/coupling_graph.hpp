/**
 * @file core/coupling_graph.hpp
 * @brief Directed graph of residual blocks connected by named variable edges
 *
 * The graph owns the blocks, the State Vector (all block outputs concatenated
 * in block order) and the design vector (graph-level independent inputs).
 * Edges are recorded by name and resolved once in finalize() into integer
 * index maps, so wiring mistakes surface as ConfigurationError before any
 * residual evaluation.
 */

#ifndef MDACOUPLE_CORE_COUPLING_GRAPH_HPP
#define MDACOUPLE_CORE_COUPLING_GRAPH_HPP

#include "mdacouple/core/residual_block.hpp"
#include "mfem.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mdacouple
{

/**
 * @struct VariableSlot
 * @brief Location of a variable inside the state or design vector
 */
struct VariableSlot
{
    int offset = 0;
    int size = 0;
};

/**
 * @class CouplingGraph
 * @brief Blocks, partition labels, edges and the shared state of one scenario
 *
 * Variable paths are written "block.variable"; the block name is everything
 * before the last dot. Design variables are addressed by their plain name.
 */
class CouplingGraph
{
public:
#ifdef MFEM_USE_MPI
    /**
     * @brief Constructor for parallel execution
     * @param comm Communicator shared by all blocks of this graph
     */
    explicit CouplingGraph(MPI_Comm comm = MPI_COMM_WORLD);
#else
    CouplingGraph();
#endif

    ~CouplingGraph() = default;

    CouplingGraph(const CouplingGraph&) = delete;
    CouplingGraph& operator=(const CouplingGraph&) = delete;

    // ------------------------------------------------------------------
    // Construction (before finalize)
    // ------------------------------------------------------------------

    /**
     * @brief Add a block to the graph
     * @param block Block to take ownership of
     * @param group Partition label (e.g. "analysis" or "balance")
     * @return Index of the block
     */
    int addBlock(std::unique_ptr<ResidualBlock> block,
                 const std::string& group = "analysis");

    /**
     * @brief Declare a graph-level independent input
     */
    void addDesignVariable(const std::string& name, int size = 1, double value = 0.0);

    /**
     * @brief Record an edge from a block output or design variable to a block input
     * @param source "block.output" or a design variable name
     * @param target "block.input"
     * @param srcIndices Optional selection of source entries (size of the target)
     */
    void connect(const std::string& source,
                 const std::string& target,
                 const std::vector<int>& srcIndices = std::vector<int>());

    /**
     * @brief Whether an edge into the given input has already been recorded
     */
    bool hasConnection(const std::string& target) const;

    /**
     * @brief Resolve edges, create automatic design variables and allocate state
     * @throws ConfigurationError on any wiring mistake
     */
    void finalize();

    bool isFinalized() const { return finalized_; }

    // ------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------

    int getNumBlocks() const { return static_cast<int>(blocks_.size()); }
    ResidualBlock& getBlock(int index) { return *blocks_.at(index); }
    const ResidualBlock& getBlock(int index) const { return *blocks_.at(index); }
    const std::string& getGroup(int index) const { return groups_.at(index); }

    /**
     * @brief Index of a block by name, -1 if absent
     */
    int findBlock(const std::string& name) const;

    std::vector<int> getBlocksInGroup(const std::string& group) const;
    std::vector<int> getAllBlocks() const;

    /**
     * @brief Distinct partition labels in order of first use
     */
    std::vector<std::string> getGroupNames() const;

    bool hasDesignVariable(const std::string& name) const;
    std::vector<std::string> getDesignVariableNames() const;

    // ------------------------------------------------------------------
    // State access (after finalize)
    // ------------------------------------------------------------------

    mfem::Vector& getState() { return state_; }
    const mfem::Vector& getState() const { return state_; }
    mfem::Vector& getDesign() { return design_; }
    const mfem::Vector& getDesign() const { return design_; }

    int getStateSize() const { return state_.Size(); }
    int getDesignSize() const { return design_.Size(); }

    /**
     * @brief Block offsets into the state vector, size getNumBlocks()+1
     */
    const mfem::Array<int>& getStateOffsets() const { return stateOffsets_; }

    VariableSlot findOutput(const std::string& path) const;
    VariableSlot findDesignVariable(const std::string& name) const;

    void setDesignValue(const std::string& name, const mfem::Vector& value);
    void setDesignValue(const std::string& name, double value);
    void getOutputValue(const std::string& path, mfem::Vector& value) const;
    double getScalarOutput(const std::string& path) const;

    /**
     * @brief Restore every output to its declared default value
     */
    void resetOutputs();

    /**
     * @brief Restore the outputs of the listed blocks only
     */
    void resetOutputs(const std::vector<int>& blocks);

    // ------------------------------------------------------------------
    // Edge transfer
    // ------------------------------------------------------------------

    /**
     * @brief Pull a block's inputs along its incoming edges
     * @param design Design values, or nullptr to treat them as zero
     */
    void gatherInputs(int block,
                      const mfem::Vector& state,
                      const mfem::Vector* design,
                      mfem::Vector& inputs) const;

    /**
     * @brief Transpose of gatherInputs: accumulate input seeds onto their sources
     * @param dDesign Design accumulator, or nullptr to drop design contributions
     */
    void scatterInputsTranspose(int block,
                                const mfem::Vector& dInputs,
                                mfem::Vector& dState,
                                mfem::Vector* dDesign) const;

    // ------------------------------------------------------------------
    // Block evaluation at the current state
    // ------------------------------------------------------------------

    /**
     * @brief Residual of one block, written into its slice of a state-layout vector
     * @param iteration Iteration index reported with a NumericalDomainError
     */
    void evaluateResidual(int block, mfem::Vector& residual, int iteration = -1);

    void evaluateResiduals(const std::vector<int>& blocks,
                           mfem::Vector& residual,
                           int iteration = -1);

    /**
     * @brief Apply a block's analysis shortcut in place
     * @return false when the block is held implicit (no shortcut)
     */
    bool solveBlock(int block, int iteration = -1);

    /**
     * @brief Linearize the given blocks at the current state
     */
    void linearize(const std::vector<int>& blocks);

    // ------------------------------------------------------------------
    // Jacobian actions (state-layout vectors)
    // ------------------------------------------------------------------

    /**
     * @brief dResidual[rows] = dR_rows/dx * dState + dR_rows/dp * dDesign
     */
    void applyJacobian(const std::vector<int>& rowBlocks,
                       const mfem::Vector& dState,
                       const mfem::Vector* dDesign,
                       mfem::Vector& dResidual);

    /**
     * @brief dState += (dR_rows/dx)^T dResidual[rows], dDesign += (dR_rows/dp)^T ...
     */
    void applyJacobianTranspose(const std::vector<int>& rowBlocks,
                                const mfem::Vector& dResidual,
                                mfem::Vector& dState,
                                mfem::Vector* dDesign);

    // ------------------------------------------------------------------
    // Partitions (compact vectors hold the listed blocks' slices in order)
    // ------------------------------------------------------------------

    int getPartitionSize(const std::vector<int>& blocks) const;

    void extractPartition(const std::vector<int>& blocks,
                          const mfem::Vector& full,
                          mfem::Vector& compact) const;

    void insertPartition(const std::vector<int>& blocks,
                         const mfem::Vector& compact,
                         mfem::Vector& full) const;

    /**
     * @brief Global inner product of two compact partition vectors
     *
     * Distributed entries are reduced across ranks, replicated entries are
     * counted once.
     */
    double innerProduct(const std::vector<int>& blocks,
                        const mfem::Vector& u,
                        const mfem::Vector& v) const;

    double norm(const std::vector<int>& blocks, const mfem::Vector& v) const;

    // ------------------------------------------------------------------
    // Parallel helpers
    // ------------------------------------------------------------------

    int getRank() const { return rank_; }
    bool isRoot() const { return rank_ == 0; }

    /**
     * @brief Synchronize all ranks at the end of a sweep
     */
    void barrier() const;

#ifdef MFEM_USE_MPI
    MPI_Comm getComm() const { return comm_; }
#endif

private:
    struct Edge
    {
        std::string source;
        std::string target;
        std::vector<int> srcIndices;

        bool fromDesign = false;
        int dstBlock = -1;
        int dstOffset = 0;
        std::vector<int> srcMap;
    };

    struct DesignVariable
    {
        std::string name;
        int size = 1;
        double value = 0.0;
        int offset = 0;
    };

    void requireFinalized(const char* caller) const;
    void resolveEdge(Edge& edge, std::vector<std::vector<bool>>& connected);
    void viewOutputs(int block, mfem::Vector& view);

    std::vector<std::unique_ptr<ResidualBlock>> blocks_;
    std::vector<std::string> groups_;
    std::vector<Edge> edges_;
    std::vector<std::vector<int>> blockEdges_;
    std::vector<DesignVariable> designVariables_;
    std::map<std::string, int> designIndex_;

    mfem::Array<int> stateOffsets_;
    mfem::Vector state_;
    mfem::Vector design_;

    std::vector<mfem::Vector> inputBuffers_;
    mfem::Vector dInputs_;
    mfem::Vector dOutputs_;
    mfem::Vector dResidual_;

    bool finalized_;
    int rank_;
#ifdef MFEM_USE_MPI
    MPI_Comm comm_;
#endif
};

} // namespace mdacouple

#endif // MDACOUPLE_CORE_COUPLING_GRAPH_HPP
