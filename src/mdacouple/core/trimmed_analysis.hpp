/**
 * @file core/trimmed_analysis.hpp
 * @brief Assembly of trimmed coupled scenarios from discipline builders
 */

#ifndef MDACOUPLE_CORE_TRIMMED_ANALYSIS_HPP
#define MDACOUPLE_CORE_TRIMMED_ANALYSIS_HPP

#include "mdacouple/core/coupling_graph.hpp"
#include "mdacouple/core/discipline_builder.hpp"
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mdacouple
{

/**
 * @struct TrimmedAnalysisOptions
 * @brief Stage orders and balance wiring of a trimmed scenario
 */
struct TrimmedAnalysisOptions
{
    std::vector<std::string> preCouplingOrder = {"aero", "struct", "ldxfer"};

    /// Empty means discipline registration order.
    std::vector<std::string> couplingOrder;

    std::vector<std::string> postCouplingOrder = {"ldxfer", "aero", "struct"};

    /// Balance block inputs fed by analysis outputs (e.g. "C_L").
    std::vector<std::string> balanceInputs;

    /// Balance block outputs fed back to analysis inputs (e.g. "aoa").
    std::vector<std::string> balanceOutputs;

    /// Analysis inputs receiving balanceOutputs; empty means the same names.
    std::vector<std::string> analysisInputs;

    /// Analysis outputs sent to balanceInputs; empty means the same names.
    std::vector<std::string> analysisOutputs;

    std::string analysisGroup = "analysis";
    std::string balanceGroup = "balance";
};

/**
 * @class TrimmedAnalysis
 * @brief Builds the blocks and edges of trimmed scenarios into a CouplingGraph
 *
 * A scenario named S contributes, in this order, the mesh blocks of every
 * discipline, the pre-coupling blocks in preCouplingOrder, the coupling blocks
 * in couplingOrder and the post-coupling blocks in postCouplingOrder, all in
 * the analysis partition, followed by the balance block "S.balance" in the
 * balance partition. Discipline blocks are named "S.<discipline>_<stage>".
 *
 * Every analysis input is wired from, in order of precedence: an explicit
 * connectInput() for the scenario, the matching balance output, the unique
 * output of the same name among the scenario's other analysis blocks, or
 * otherwise a scenario design variable "S.<input>".
 */
class TrimmedAnalysis
{
public:
    explicit TrimmedAnalysis(const TrimmedAnalysisOptions& options = TrimmedAnalysisOptions());

    ~TrimmedAnalysis() = default;

    /**
     * @brief Register a discipline; its name is the key used by the stage orders
     */
    void addDiscipline(std::unique_ptr<DisciplineBuilder> builder);

    /**
     * @brief Builder whose coupling block is the balance block of every scenario
     */
    void setBalanceBuilder(std::unique_ptr<DisciplineBuilder> builder);

    /**
     * @brief Feed a scenario input from an existing source instead of promotion
     * @param scenario Scenario name
     * @param input Input variable name (applies to every block declaring it)
     * @param source "block.output" or design variable name
     * @param srcIndices Optional selection of source entries
     */
    void connectInput(const std::string& scenario,
                      const std::string& input,
                      const std::string& source,
                      const std::vector<int>& srcIndices = std::vector<int>());

    /**
     * @brief Validate the stage orders and balance wiring lists
     * @throws ConfigurationError
     */
    void validate() const;

    /**
     * @brief Add one scenario to an unfinalized graph
     * @throws ConfigurationError on an invalid order or an unresolved connection
     */
    void addScenario(CouplingGraph& graph, const std::string& scenario) const;

    /**
     * @brief Path "block.output" of the unique scenario block declaring an output
     */
    static std::string findScenarioOutput(const CouplingGraph& graph,
                                          const std::string& scenario,
                                          const std::string& output);

    static std::string balanceBlockName(const std::string& scenario);

    const TrimmedAnalysisOptions& getOptions() const { return options_; }

private:
    struct Connection
    {
        std::string source;
        std::vector<int> srcIndices;
    };

    const DisciplineBuilder& findDiscipline(const std::string& name) const;
    void checkStageOrder(const std::vector<std::string>& order, const char* label) const;
    std::vector<std::string> effectiveAnalysisInputs() const;
    std::vector<std::string> effectiveAnalysisOutputs() const;

    void addStageBlock(CouplingGraph& graph,
                       std::unique_ptr<ResidualBlock> block,
                       const std::string& expectedName,
                       std::vector<int>& analysisBlocks) const;

    void wireInput(CouplingGraph& graph,
                   const std::string& scenario,
                   int block,
                   const VariableInfo& input,
                   const std::vector<int>& analysisBlocks) const;

    TrimmedAnalysisOptions options_;
    std::vector<std::unique_ptr<DisciplineBuilder>> disciplines_;
    std::unique_ptr<DisciplineBuilder> balanceBuilder_;
    std::map<std::pair<std::string, std::string>, Connection> connections_;
};

} // namespace mdacouple

#endif // MDACOUPLE_CORE_TRIMMED_ANALYSIS_HPP
