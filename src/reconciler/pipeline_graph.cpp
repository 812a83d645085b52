// EN: Pipeline graph construction, cycle detection and readiness queries
// FR: Construction du graphe de pipeline, détection de cycles et requêtes de disponibilité

#include "reconciler/pipeline_graph.hpp"
#include "reconciler/reconcile_errors.hpp"
#include "reconciler/substitution.hpp"

#include <algorithm>

namespace PRR::Reconciler {

namespace {

std::vector<ResultReference> resultReferencesOf(const Api::PipelineTask& task) {
    std::vector<ResultReference> references;
    auto collect = [&references](const std::vector<Api::Param>& params) {
        for (const auto& param : params) {
            for (const auto& reference : Substitution::extractResultReferences(param.value)) {
                references.push_back(reference);
            }
        }
    };
    collect(task.params);
    for (const auto& condition : task.conditions) {
        collect(condition.params);
    }
    return references;
}

} // namespace

PipelineGraph PipelineGraph::build(const Api::PipelineSpec& spec) {
    PipelineGraph graph;
    for (const auto& task : spec.tasks) {
        if (graph.predecessors_.count(task.name) > 0) {
            throw TerminalReconcileError(Reasons::FAILED_VALIDATION,
                                         "pipeline task name \"" + task.name + "\" is used more than once");
        }
        graph.order_.push_back(task.name);
        graph.predecessors_[task.name];
        graph.successors_[task.name];
    }

    auto requireNode = [&graph](const std::string& task, const std::string& dependency, const std::string& via) {
        if (!graph.contains(dependency)) {
            throw TerminalReconcileError(Reasons::FAILED_VALIDATION,
                                         "pipeline task \"" + task + "\" depends on unknown task \"" +
                                         dependency + "\" via " + via);
        }
    };

    for (const auto& task : spec.tasks) {
        for (const auto& dependency : task.run_after) {
            requireNode(task.name, dependency, "runAfter");
            graph.addEdge(dependency, task.name);
        }
        for (const auto& input : task.input_resources) {
            for (const auto& dependency : input.from) {
                requireNode(task.name, dependency, "from");
                graph.addEdge(dependency, task.name);
            }
        }
        for (const auto& condition : task.conditions) {
            for (const auto& input : condition.resources) {
                for (const auto& dependency : input.from) {
                    requireNode(task.name, dependency, "from");
                    graph.addEdge(dependency, task.name);
                }
            }
        }
        for (const auto& reference : resultReferencesOf(task)) {
            requireNode(task.name, reference.task, "result reference");
            graph.addEdge(reference.task, task.name);
        }
    }

    graph.checkForCycles();
    return graph;
}

void PipelineGraph::addEdge(const std::string& from, const std::string& to) {
    predecessors_[to].insert(from);
    successors_[from].insert(to);
}

const std::set<std::string>& PipelineGraph::getPredecessors(const std::string& node) const {
    auto it = predecessors_.find(node);
    if (it == predecessors_.end()) {
        throw std::out_of_range("unknown pipeline task: " + node);
    }
    return it->second;
}

const std::set<std::string>& PipelineGraph::getSuccessors(const std::string& node) const {
    auto it = successors_.find(node);
    if (it == successors_.end()) {
        throw std::out_of_range("unknown pipeline task: " + node);
    }
    return it->second;
}

std::vector<std::string> PipelineGraph::getRoots() const {
    std::vector<std::string> roots;
    for (const auto& node : order_) {
        if (predecessors_.at(node).empty()) {
            roots.push_back(node);
        }
    }
    return roots;
}

std::vector<std::string> PipelineGraph::getSchedulable(const std::set<std::string>& completed) const {
    std::vector<std::string> schedulable;
    for (const auto& node : order_) {
        if (completed.count(node) > 0) {
            continue;
        }
        const auto& preds = predecessors_.at(node);
        bool ready = std::all_of(preds.begin(), preds.end(),
                                 [&completed](const std::string& p) { return completed.count(p) > 0; });
        if (ready) {
            schedulable.push_back(node);
        }
    }
    return schedulable;
}

std::set<std::string> PipelineGraph::getDescendants(const std::string& node) const {
    std::set<std::string> descendants;
    std::vector<std::string> stack(getSuccessors(node).begin(), getSuccessors(node).end());
    while (!stack.empty()) {
        std::string current = stack.back();
        stack.pop_back();
        if (!descendants.insert(current).second) {
            continue;
        }
        for (const auto& next : successors_.at(current)) {
            stack.push_back(next);
        }
    }
    return descendants;
}

std::vector<std::vector<std::string>> PipelineGraph::getExecutionLevels() const {
    std::vector<std::vector<std::string>> levels;
    std::set<std::string> placed;
    while (placed.size() < order_.size()) {
        std::vector<std::string> level = getSchedulable(placed);
        if (level.empty()) {
            break;
        }
        placed.insert(level.begin(), level.end());
        levels.push_back(std::move(level));
    }
    return levels;
}

// EN: DFS with colors (0=white, 1=gray, 2=black); a gray successor closes a cycle.
// FR: DFS avec couleurs (0=blanc, 1=gris, 2=noir) ; un successeur gris ferme un cycle.
void PipelineGraph::checkForCycles() const {
    std::unordered_map<std::string, int> colors;
    for (const auto& node : order_) {
        if (colors[node] != 0) {
            continue;
        }
        std::vector<std::string> path;
        if (detectCycleDFS(node, colors, path)) {
            std::string description;
            for (size_t i = 0; i < path.size(); ++i) {
                description += (i > 0 ? " -> " : "") + path[i];
            }
            throw GraphCycleError("cycle detected in pipeline tasks: " + description, path);
        }
    }
}

bool PipelineGraph::detectCycleDFS(const std::string& node, std::unordered_map<std::string, int>& colors,
                                   std::vector<std::string>& path) const {
    colors[node] = 1;
    path.push_back(node);

    for (const auto& next : successors_.at(node)) {
        int color = colors[next];
        if (color == 1) {
            auto start = std::find(path.begin(), path.end(), next);
            path.erase(path.begin(), start);
            path.push_back(next);
            return true;
        }
        if (color == 0 && detectCycleDFS(next, colors, path)) {
            return true;
        }
    }

    colors[node] = 2;
    path.pop_back();
    return false;
}

} // namespace PRR::Reconciler
