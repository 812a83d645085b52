// EN: Run scheduler - decides which tasks start, retries failed ones and cancels in-flight work
// FR: Ordonnanceur de run - décide quelles tâches démarrent, relance les échecs et annule le travail en cours

#pragma once

#include "api/pipeline_types.hpp"
#include "reconciler/binding_resolver.hpp"
#include "reconciler/pipeline_graph.hpp"
#include "reconciler/reconciler_config.hpp"
#include "reconciler/workspace_linker.hpp"
#include "store/object_store.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace PRR::Reconciler {

// EN: What one scheduling step changed in the cluster.
// FR: Ce qu'une étape d'ordonnancement a changé dans le cluster.
struct ScheduleResult {
    std::vector<std::string> created_task_runs;
    std::vector<std::string> created_condition_checks;
    std::vector<std::string> retried_task_runs;

    bool empty() const {
        return created_task_runs.empty() && created_condition_checks.empty() && retried_task_runs.empty();
    }
};

class RunScheduler {
public:
    RunScheduler(Store::IObjectStore& store, WorkspaceLinker& linker, const ReconcilerConfig& config);

    // EN: Timeout for a new task-run: the time left in the run (1s once the deadline passed),
    // EN: replaced by the task's own timeout when that is smaller or the run has none.
    // FR: Timeout d'un nouveau task-run : le temps restant du run (1s une fois l'échéance passée),
    // FR: remplacé par le timeout propre à la tâche s'il est plus petit ou si le run n'en a pas.
    static Api::Duration computeTaskRunTimeout(const Api::PipelineRun& run, const Api::PipelineTask& task,
                                               Api::Timestamp now, Api::Duration default_timeout);

    static Api::Duration effectiveRunTimeout(const Api::PipelineRun& run, Api::Duration default_timeout);
    static bool isTimedOut(const Api::PipelineRun& run, Api::Timestamp now, Api::Duration default_timeout);

    // EN: Failed for good: False and either cancelled or out of retries.
    // FR: Échoué définitivement : False et soit annulé soit sans retry restant.
    static bool isFailure(const ResolvedNode& node);
    static bool hasFailedConditionCheck(const ResolvedNode& node);

    // EN: Nodes with a failed condition check, plus everything downstream of them.
    // FR: Nœuds avec un condition check échoué, plus tout ce qui en dépend.
    static std::set<std::string> skippedNodes(const ResolvedPipeline& pipeline, const PipelineGraph& graph);

    // EN: Patch every unfinished child of the run. Returns the names whose patch failed.
    // FR: Patche chaque enfant non terminé du run. Retourne les noms dont le patch a échoué.
    std::vector<std::string> cancelInFlight(const std::map<std::string, Api::TaskRun>& children);

    // EN: Retry failed task-runs with budget left, then start every ready node unless a node has failed.
    // EN: The run's task-run map records whatever is created.
    // FR: Relance les task-runs échoués ayant du budget, puis démarre chaque nœud prêt sauf si un nœud a
    // FR: échoué. La table des task-runs du run enregistre tout ce qui est créé.
    ScheduleResult schedule(Api::PipelineRun& run, ResolvedPipeline& pipeline, const PipelineGraph& graph,
                            const Api::PipelineSpec& spec, Api::Timestamp now);

private:
    bool retryIfAllowed(ResolvedNode& node);
    // EN: Claims are ensured at most once per pass, right before the first child is created.
    // FR: Les claims sont assurés au plus une fois par passe, juste avant la création du premier enfant.
    void prepareStorage(const Api::PipelineRun& run, const ResolvedPipeline& pipeline,
                        const Api::PipelineSpec& spec, bool& prepared);

    Api::TaskRun buildTaskRun(const Api::PipelineRun& run, const ResolvedNode& node, Api::Timestamp now) const;
    Api::TaskRun buildConditionCheck(const Api::PipelineRun& run, const ResolvedNode& node,
                                     const ConditionCheckPlan& plan, Api::Timestamp now) const;
    Api::ObjectMeta childMetadata(const Api::PipelineRun& run, const ResolvedNode& node, const std::string& name) const;
    std::string serviceAccountFor(const Api::PipelineRun& run, const std::string& task_name) const;

    // EN: Create, or adopt an existing object of the same name that belongs to this run.
    // FR: Crée, ou adopte un objet existant du même nom appartenant à ce run.
    Api::TaskRun createOrAdopt(const Api::TaskRun& task_run);

    Store::IObjectStore& store_;
    WorkspaceLinker& linker_;
    const ReconcilerConfig& config_;
};

} // namespace PRR::Reconciler
