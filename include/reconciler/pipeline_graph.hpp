// EN: Immutable dependency graph of a pipeline's tasks, rebuilt on every reconcile pass
// FR: Graphe de dépendances immuable des tâches d'un pipeline, reconstruit à chaque passe

#pragma once

#include "api/pipeline_types.hpp"

#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace PRR::Reconciler {

// EN: Edges come from runAfter, "from" input resources and task result references.
// FR: Les arêtes viennent de runAfter, des ressources d'entrée "from" et des références de résultats.
class PipelineGraph {
public:
    // EN: Build and check the graph. Unknown predecessors raise a FailedValidation
    // EN: TerminalReconcileError, a cycle raises GraphCycleError.
    // FR: Construit et vérifie le graphe. Un prédécesseur inconnu lève une TerminalReconcileError
    // FR: FailedValidation, un cycle lève GraphCycleError.
    static PipelineGraph build(const Api::PipelineSpec& spec);

    // EN: Node names in declaration order.
    // FR: Noms des nœuds dans l'ordre de déclaration.
    const std::vector<std::string>& getNodeNames() const { return order_; }

    bool contains(const std::string& node) const { return predecessors_.count(node) > 0; }
    size_t size() const { return order_.size(); }

    const std::set<std::string>& getPredecessors(const std::string& node) const;
    const std::set<std::string>& getSuccessors(const std::string& node) const;

    std::vector<std::string> getRoots() const;

    // EN: Nodes not in `completed` whose predecessors are all in `completed`, in declaration order.
    // FR: Nœuds hors de `completed` dont tous les prédécesseurs sont dans `completed`, dans l'ordre de déclaration.
    std::vector<std::string> getSchedulable(const std::set<std::string>& completed) const;

    // EN: Every node reachable from `node`, excluding itself.
    // FR: Tous les nœuds atteignables depuis `node`, lui-même exclu.
    std::set<std::string> getDescendants(const std::string& node) const;

    // EN: Groups of nodes that can run together, level by level.
    // FR: Groupes de nœuds pouvant s'exécuter ensemble, niveau par niveau.
    std::vector<std::vector<std::string>> getExecutionLevels() const;

private:
    PipelineGraph() = default;

    void addEdge(const std::string& from, const std::string& to);
    void checkForCycles() const;
    bool detectCycleDFS(const std::string& node, std::unordered_map<std::string, int>& colors,
                        std::vector<std::string>& path) const;

    std::vector<std::string> order_;
    std::map<std::string, std::set<std::string>> predecessors_;
    std::map<std::string, std::set<std::string>> successors_;
};

} // namespace PRR::Reconciler
