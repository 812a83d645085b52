// EN: Control-plane object model for the PipelineRun reconciler - pipelines, tasks, runs and their status
// FR: Modèle d'objets du plan de contrôle pour le réconciliateur PipelineRun - pipelines, tâches, runs et leur statut

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace PRR::Api {

using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// ---------------------------------------------------------------------------
// EN: Well-known label keys, API identity and status values
// FR: Clés de labels connues, identité d'API et valeurs de statut
// ---------------------------------------------------------------------------
namespace Labels {
    inline constexpr const char* PIPELINE = "tekton.dev/pipeline";
    inline constexpr const char* PIPELINE_RUN = "tekton.dev/pipelineRun";
    inline constexpr const char* PIPELINE_TASK = "tekton.dev/pipelineTask";
    inline constexpr const char* CONDITION_CHECK = "tekton.dev/conditionCheck";
    inline constexpr const char* CONDITION_NAME = "tekton.dev/conditionName";
    inline constexpr const char* CONDITION_REGISTER_NAME = "tekton.dev/conditionRegisterName";
}

inline constexpr const char* API_VERSION = "tekton.dev/v1beta1";
inline constexpr const char* PIPELINE_RUN_KIND = "PipelineRun";
inline constexpr const char* SUCCEEDED_CONDITION = "Succeeded";
inline constexpr const char* TASK_RUN_SPEC_STATUS_CANCELLED = "TaskRunCancelled";
inline constexpr const char* TASK_RUN_REASON_CANCELLED = "TaskRunCancelled";

// ---------------------------------------------------------------------------
// EN: Metadata
// FR: Métadonnées
// ---------------------------------------------------------------------------

struct OwnerReference {
    std::string api_version;
    std::string kind;
    std::string name;
    bool controller = false;
    bool block_owner_deletion = false;

    bool operator==(const OwnerReference& other) const {
        return api_version == other.api_version && kind == other.kind && name == other.name &&
               controller == other.controller && block_owner_deletion == other.block_owner_deletion;
    }
};

struct ObjectMeta {
    std::string name;
    std::string namespace_name;
    std::map<std::string, std::string> labels;
    std::map<std::string, std::string> annotations;
    std::vector<OwnerReference> owner_references;
    uint64_t resource_version = 0;                      // EN: Set by the store / FR: Défini par le store
};

// EN: Tri-state status of a condition.
// FR: Statut tri-état d'une condition.
enum class ConditionStatus {
    UNKNOWN,
    TRUE,
    FALSE
};

// EN: The "Succeeded" condition carried by runs and task-runs.
// FR: La condition "Succeeded" portée par les runs et task-runs.
struct StatusCondition {
    std::string type = SUCCEEDED_CONDITION;
    ConditionStatus status = ConditionStatus::UNKNOWN;
    std::string reason;
    std::string message;
    std::optional<Timestamp> last_transition_time;

    bool isTrue() const { return status == ConditionStatus::TRUE; }
    bool isFalse() const { return status == ConditionStatus::FALSE; }
    bool isUnknown() const { return status == ConditionStatus::UNKNOWN; }

    // EN: Equality ignores the transition time.
    // FR: L'égalité ignore l'heure de transition.
    bool sameState(const StatusCondition& other) const {
        return type == other.type && status == other.status &&
               reason == other.reason && message == other.message;
    }
};

// ---------------------------------------------------------------------------
// EN: Parameters
// FR: Paramètres
// ---------------------------------------------------------------------------

enum class ParamType {
    STRING,
    ARRAY
};

// EN: A parameter value, either a string or an array of strings.
// FR: Une valeur de paramètre, soit une chaîne soit un tableau de chaînes.
struct ParamValue {
    ParamType type = ParamType::STRING;
    std::string string_val;
    std::vector<std::string> array_val;

    ParamValue() = default;
    ParamValue(const std::string& s) : type(ParamType::STRING), string_val(s) {}
    ParamValue(const char* s) : type(ParamType::STRING), string_val(s) {}
    ParamValue(const std::vector<std::string>& a) : type(ParamType::ARRAY), array_val(a) {}

    bool operator==(const ParamValue& other) const {
        return type == other.type && string_val == other.string_val && array_val == other.array_val;
    }
};

struct Param {
    std::string name;
    ParamValue value;
};

struct ParamSpec {
    std::string name;
    ParamType type = ParamType::STRING;
    std::string description;
    std::optional<ParamValue> default_value;
};

// ---------------------------------------------------------------------------
// EN: Tasks and conditions
// FR: Tâches et conditions
// ---------------------------------------------------------------------------

struct Step {
    std::string name;
    std::string image;
    std::vector<std::string> command;
    std::vector<std::string> args;
    std::string script;
};

struct TaskResourceDeclaration {
    std::string name;
    std::string type;
    bool optional = false;
};

struct TaskResultDeclaration {
    std::string name;
    std::string description;
};

struct WorkspaceDeclaration {
    std::string name;
    std::string mount_path;
    bool read_only = false;
};

struct TaskSpec {
    std::string description;
    std::vector<ParamSpec> params;
    std::vector<TaskResourceDeclaration> input_resources;
    std::vector<TaskResourceDeclaration> output_resources;
    std::vector<TaskResultDeclaration> results;
    std::vector<WorkspaceDeclaration> workspaces;
    std::vector<Step> steps;
};

// EN: Task or ClusterTask object; the store keeps them in separate scopes.
// FR: Objet Task ou ClusterTask ; le store les garde dans des portées séparées.
struct Task {
    ObjectMeta metadata;
    TaskSpec spec;

    nlohmann::json toJson() const;
    static Task fromJson(const nlohmann::json& json);
};

struct ConditionSpec {
    std::string description;
    std::vector<ParamSpec> params;
    std::vector<TaskResourceDeclaration> resources;
    Step check;
};

// EN: Gating definition evaluated before a pipeline task runs.
// FR: Définition de garde évaluée avant l'exécution d'une tâche de pipeline.
struct Condition {
    ObjectMeta metadata;
    ConditionSpec spec;

    nlohmann::json toJson() const;
    static Condition fromJson(const nlohmann::json& json);
};

// ---------------------------------------------------------------------------
// EN: Pipeline resources
// FR: Ressources de pipeline
// ---------------------------------------------------------------------------

struct ResourceParam {
    std::string name;
    std::string value;
};

struct PipelineResourceSpec {
    std::string type;
    std::vector<ResourceParam> params;
};

struct PipelineResource {
    ObjectMeta metadata;
    PipelineResourceSpec spec;

    nlohmann::json toJson() const;
    static PipelineResource fromJson(const nlohmann::json& json);
};

// ---------------------------------------------------------------------------
// EN: Pipelines
// FR: Pipelines
// ---------------------------------------------------------------------------

// EN: Task reference variants: namespaced name, cluster-scoped name, or inline spec.
// FR: Variantes de référence de tâche : nom dans le namespace, nom cluster, ou spec en ligne.
struct NamespacedTaskRef {
    std::string name;
};

struct ClusterTaskRef {
    std::string name;
};

using TaskReference = std::variant<NamespacedTaskRef, ClusterTaskRef, TaskSpec>;

struct PipelineTaskInputResource {
    std::string name;                 // EN: Task-side resource name / FR: Nom de ressource côté tâche
    std::string resource;             // EN: Pipeline-declared resource / FR: Ressource déclarée par le pipeline
    std::vector<std::string> from;    // EN: Upstream pipeline tasks / FR: Tâches de pipeline amont
};

struct PipelineTaskOutputResource {
    std::string name;
    std::string resource;
};

struct WorkspacePipelineTaskBinding {
    std::string name;                 // EN: Task workspace name / FR: Nom du workspace de la tâche
    std::string workspace;            // EN: Pipeline workspace name / FR: Nom du workspace du pipeline
    std::string sub_path;
};

struct PipelineTaskCondition {
    std::string condition_ref;
    std::vector<Param> params;
    std::vector<PipelineTaskInputResource> resources;
};

// EN: One node of the pipeline graph.
// FR: Un nœud du graphe de pipeline.
struct PipelineTask {
    std::string name;
    TaskReference task_ref = NamespacedTaskRef{};
    std::vector<Param> params;
    std::vector<PipelineTaskInputResource> input_resources;
    std::vector<PipelineTaskOutputResource> output_resources;
    std::vector<WorkspacePipelineTaskBinding> workspaces;
    std::vector<PipelineTaskCondition> conditions;
    std::vector<std::string> run_after;
    std::optional<Duration> timeout;
    int retries = 0;
};

struct PipelineDeclaredResource {
    std::string name;
    std::string type;
    bool optional = false;
};

struct PipelineWorkspaceDeclaration {
    std::string name;
    std::string description;
    bool optional = false;
};

struct PipelineResult {
    std::string name;
    std::string description;
    std::string value;                // EN: Expression like $(tasks.a.results.x) / FR: Expression comme $(tasks.a.results.x)
};

struct PipelineSpec {
    std::string description;
    std::vector<ParamSpec> params;
    std::vector<PipelineDeclaredResource> resources;
    std::vector<PipelineWorkspaceDeclaration> workspaces;
    std::vector<PipelineTask> tasks;
    std::vector<PipelineResult> results;
};

struct Pipeline {
    ObjectMeta metadata;
    PipelineSpec spec;

    nlohmann::json toJson() const;
    static Pipeline fromJson(const nlohmann::json& json);
};

// ---------------------------------------------------------------------------
// EN: Volumes and workspaces
// FR: Volumes et workspaces
// ---------------------------------------------------------------------------

struct PersistentVolumeClaimSpec {
    std::vector<std::string> access_modes;
    std::string storage;
};

struct PersistentVolumeClaim {
    ObjectMeta metadata;
    PersistentVolumeClaimSpec spec;

    nlohmann::json toJson() const;
    static PersistentVolumeClaim fromJson(const nlohmann::json& json);
};

// EN: Binding of a workspace to storage; exactly one source should be set.
// FR: Liaison d'un workspace à un stockage ; une seule source devrait être définie.
struct WorkspaceBinding {
    std::string name;
    std::string sub_path;
    std::optional<std::string> persistent_volume_claim;     // EN: Claim name / FR: Nom du claim
    std::optional<PersistentVolumeClaim> volume_claim_template;
    bool empty_dir = false;
};

// ---------------------------------------------------------------------------
// EN: Pipeline runs
// FR: Exécutions de pipeline
// ---------------------------------------------------------------------------

struct PipelineResourceBinding {
    std::string name;
    std::optional<std::string> resource_ref;
    std::optional<PipelineResourceSpec> resource_spec;
};

struct TaskServiceAccountName {
    std::string task_name;
    std::string service_account_name;
};

struct PipelineRunSpec {
    std::optional<std::string> pipeline_ref;
    std::optional<PipelineSpec> pipeline_spec;
    std::vector<Param> params;
    std::vector<PipelineResourceBinding> resources;
    std::vector<WorkspaceBinding> workspaces;
    std::string service_account_name;
    std::vector<TaskServiceAccountName> service_account_names;
    std::optional<Duration> timeout;                         // EN: 0 means no timeout / FR: 0 signifie sans timeout
    bool cancelled = false;
};

struct TaskRunResult {
    std::string name;
    std::string value;

    bool operator==(const TaskRunResult& other) const {
        return name == other.name && value == other.value;
    }
};

// EN: Observed status of a task-run (and of a condition check, which is a task-run too).
// FR: Statut observé d'un task-run (et d'un condition check, qui est aussi un task-run).
struct TaskRunStatus {
    std::optional<StatusCondition> condition;
    std::optional<Timestamp> start_time;
    std::optional<Timestamp> completion_time;
    std::string pod_name;
    std::vector<TaskRunResult> results;
    std::vector<TaskRunStatus> retries_status;
};

struct PipelineRunConditionCheckStatus {
    std::string condition_name;                              // EN: Register name <cond>-<index> / FR: Nom d'enregistrement <cond>-<index>
    std::optional<TaskRunStatus> status;
};

struct PipelineRunTaskRunStatus {
    std::string pipeline_task_name;
    std::optional<TaskRunStatus> status;
    std::map<std::string, PipelineRunConditionCheckStatus> condition_checks;
};

struct PipelineRunResult {
    std::string name;
    std::string value;
};

struct PipelineRunStatus {
    std::optional<StatusCondition> condition;
    std::optional<Timestamp> start_time;
    std::optional<Timestamp> completion_time;
    std::map<std::string, PipelineRunTaskRunStatus> task_runs;
    std::vector<PipelineRunResult> pipeline_results;
    std::optional<PipelineSpec> pipeline_spec;
};

struct PipelineRun {
    ObjectMeta metadata;
    PipelineRunSpec spec;
    PipelineRunStatus status;

    // EN: True once the Succeeded condition is True or False.
    // FR: Vrai dès que la condition Succeeded est True ou False.
    bool isDone() const;

    nlohmann::json toJson() const;
    static PipelineRun fromJson(const nlohmann::json& json);
};

// ---------------------------------------------------------------------------
// EN: Task runs
// FR: Exécutions de tâche
// ---------------------------------------------------------------------------

enum class TaskKind {
    NAMESPACED,
    CLUSTER
};

struct TaskRef {
    std::string name;
    TaskKind kind = TaskKind::NAMESPACED;
};

struct TaskResourceBinding {
    std::string name;
    std::optional<std::string> resource_ref;
    std::optional<PipelineResourceSpec> resource_spec;
    std::vector<std::string> paths;
};

struct TaskRunSpec {
    std::optional<TaskRef> task_ref;
    std::optional<TaskSpec> task_spec;
    std::vector<Param> params;
    std::vector<TaskResourceBinding> input_resources;
    std::vector<TaskResourceBinding> output_resources;
    std::string service_account_name;
    std::optional<Duration> timeout;
    std::vector<WorkspaceBinding> workspaces;
    std::string status;                                      // EN: "TaskRunCancelled" once cancelled / FR: "TaskRunCancelled" une fois annulé
};

struct TaskRun {
    ObjectMeta metadata;
    TaskRunSpec spec;
    TaskRunStatus status;

    bool isDone() const;
    bool isSuccessful() const;
    bool isCancelled() const;

    nlohmann::json toJson() const;
    static TaskRun fromJson(const nlohmann::json& json);
};

} // namespace PRR::Api
