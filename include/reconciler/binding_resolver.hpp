// EN: Binding resolution - turns a pipeline and its run into concrete per-task plans
// FR: Résolution des liaisons - transforme un pipeline et son run en plans concrets par tâche

#pragma once

#include "api/pipeline_types.hpp"
#include "reconciler/name_generator.hpp"
#include "store/object_store.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace PRR::Reconciler {

// EN: Plan for one condition reference of a pipeline task.
// FR: Plan pour une référence de condition d'une tâche de pipeline.
struct ConditionCheckPlan {
    std::string register_name;                       // EN: <condition>-<index> / FR: <condition>-<index>
    Api::Condition condition;
    std::vector<Api::Param> params;
    std::vector<Api::TaskResourceBinding> resources;
    std::string check_name;                          // EN: Task-run name of the check / FR: Nom du task-run du check
    std::optional<Api::TaskRun> check_run;           // EN: Live object, once created / FR: Objet vivant, une fois créé

    bool isDone() const { return check_run && check_run->isDone(); }
    bool isSuccessful() const { return check_run && check_run->isSuccessful(); }
};

// EN: Everything needed to start or observe one pipeline task. Rebuilt every pass.
// FR: Tout ce qu'il faut pour démarrer ou observer une tâche de pipeline. Reconstruit à chaque passe.
struct ResolvedNode {
    Api::PipelineTask task;                          // EN: Pipeline params already substituted / FR: Paramètres du pipeline déjà substitués
    Api::TaskSpec task_spec;
    std::optional<Api::TaskRef> task_ref;            // EN: Unset for an inline spec / FR: Absent pour une spec en ligne
    std::vector<Api::TaskResourceBinding> input_resources;
    std::vector<Api::TaskResourceBinding> output_resources;
    std::vector<ConditionCheckPlan> condition_checks;
    std::string task_run_name;
    std::optional<Api::TaskRun> task_run;

    const std::string& name() const { return task.name; }
};

struct ResolvedPipeline {
    std::vector<ResolvedNode> nodes;                 // EN: Declaration order / FR: Ordre de déclaration

    ResolvedNode* find(const std::string& name);
    const ResolvedNode* find(const std::string& name) const;
};

class BindingResolver {
public:
    BindingResolver(const Store::IObjectStore& store, detail::INameGenerator& names);

    // EN: Structural checks of a pipeline spec (FailedValidation).
    // FR: Vérifications structurelles d'une spec de pipeline (FailedValidation).
    static void validatePipelineSpec(const Api::PipelineSpec& spec);

    // EN: Check the run's bindings against the pipeline declarations, then fetch definitions and build one plan per
    // EN: task. Definition problems raise TerminalReconcileError; store outages propagate as StoreError.
    // FR: Vérifie les liaisons du run contre les déclarations du pipeline, puis récupère les définitions et construit un plan
    // FR: par tâche. Les problèmes de définition lèvent TerminalReconcileError ; les pannes du store
    // FR: remontent en StoreError.
    ResolvedPipeline resolve(const Api::PipelineRun& run, const Api::PipelineSpec& spec,
                             const std::map<std::string, Api::TaskRun>& live_task_runs) const;

    // EN: Substitute $(tasks.<t>.results.<r>) in the node. Returns false while a referenced task is
    // EN: unfinished; a finished producer without the result is an InvalidTaskResultReference.
    // FR: Substitue $(tasks.<t>.results.<r>) dans le nœud. Retourne false tant qu'une tâche référencée
    // FR: n'est pas finie ; un producteur fini sans le résultat est une InvalidTaskResultReference.
    static bool applyTaskResults(ResolvedNode& node, const ResolvedPipeline& pipeline);

private:
    static void checkResourceBindings(const Api::PipelineRun& run, const Api::PipelineSpec& spec);
    static void checkParameterTypes(const Api::PipelineRun& run, const Api::PipelineSpec& spec);
    static void checkRequiredParameters(const Api::PipelineRun& run, const Api::PipelineSpec& spec);
    static void checkWorkspaceBindings(const Api::PipelineRun& run, const Api::PipelineSpec& spec);
    static void checkTaskRequirements(const ResolvedNode& node);

    void checkBoundResources(const Api::PipelineRun& run) const;
    void resolveTaskReference(const Api::PipelineRun& run, ResolvedNode& node) const;
    ConditionCheckPlan resolveCondition(const Api::PipelineRun& run, const Api::PipelineTaskCondition& condition,
                                        size_t index) const;

    const Store::IObjectStore& store_;
    detail::INameGenerator& names_;
};

} // namespace PRR::Reconciler
