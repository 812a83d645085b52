// EN: Status aggregation - orphan recovery, child status refresh and the overall run condition
// FR: Agrégation de statut - récupération des orphelins, rafraîchissement des enfants et condition globale

#pragma once

#include "api/pipeline_types.hpp"
#include "reconciler/binding_resolver.hpp"
#include "reconciler/name_generator.hpp"
#include "reconciler/pipeline_graph.hpp"

#include <map>
#include <string>
#include <vector>

namespace PRR::Reconciler {

inline constexpr const char* MESSAGE_RUNNING = "Not all Tasks in the Pipeline have finished executing";
inline constexpr const char* MESSAGE_ALL_COMPLETED = "All Tasks have completed executing";

class StatusAggregator {
public:
    explicit StatusAggregator(detail::INameGenerator& names);

    // EN: Add labelled children missing from the run's task-run map. Regular task-runs go under their
    // EN: own name; condition checks join the entry of their pipeline task, or a freshly named one.
    // EN: Returns the number of children recovered.
    // FR: Ajoute les enfants labellisés absents de la table des task-runs. Les task-runs normaux vont
    // FR: sous leur propre nom ; les condition checks rejoignent l'entrée de leur tâche, ou une entrée
    // FR: nouvellement nommée. Retourne le nombre d'enfants récupérés.
    size_t recoverOrphans(Api::PipelineRun& run, const std::map<std::string, Api::TaskRun>& children) const;

    // EN: Copy the live status of every known child into the map.
    // FR: Copie le statut vivant de chaque enfant connu dans la table.
    static void refreshStatuses(Api::PipelineRun& run, const std::map<std::string, Api::TaskRun>& children);

    // EN: Fold the pass's resolved nodes back into the status and recompute the Succeeded condition,
    // EN: pipeline results and completion time.
    // FR: Replie les nœuds résolus de la passe dans le statut et recalcule la condition Succeeded,
    // FR: les résultats du pipeline et l'heure de fin.
    void updateRunStatus(Api::PipelineRun& run, const ResolvedPipeline& pipeline, const PipelineGraph& graph,
                         const Api::PipelineSpec& spec, Api::Timestamp now) const;

    static std::vector<Api::PipelineRunResult> evaluateResults(const Api::PipelineSpec& spec,
                                                               const ResolvedPipeline& pipeline);

    // EN: Set the Succeeded condition; the transition time only moves when the state changes.
    // FR: Pose la condition Succeeded ; l'heure de transition ne bouge que si l'état change.
    static void setCondition(Api::PipelineRun& run, Api::ConditionStatus status, const std::string& reason,
                             const std::string& message, Api::Timestamp now);

    // EN: Mark the run terminal; completion time is written only the first time.
    // FR: Marque le run terminal ; l'heure de fin n'est écrite que la première fois.
    static void markCompleted(Api::PipelineRun& run, Api::ConditionStatus status, const std::string& reason,
                              const std::string& message, Api::Timestamp now);

    static std::string conditionCheckFailedMessage(const std::string& task_run_name, const std::string& run_name);

private:
    detail::INameGenerator& names_;
};

} // namespace PRR::Reconciler
