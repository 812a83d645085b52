// EN: JSON encoding of the control-plane object model (camelCase field names, RFC3339 times)
// FR: Encodage JSON du modèle d'objets du plan de contrôle (champs camelCase, temps RFC3339)

#include "api/pipeline_types.hpp"
#include "api/api_utils.hpp"

#include <stdexcept>

namespace PRR::Api {

using nlohmann::json;

NLOHMANN_JSON_SERIALIZE_ENUM(ConditionStatus, {
    {ConditionStatus::UNKNOWN, "Unknown"},
    {ConditionStatus::TRUE, "True"},
    {ConditionStatus::FALSE, "False"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ParamType, {
    {ParamType::STRING, "string"},
    {ParamType::ARRAY, "array"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(TaskKind, {
    {TaskKind::NAMESPACED, "Task"},
    {TaskKind::CLUSTER, "ClusterTask"},
})

namespace {

template<typename T>
void putIfNotEmpty(json& j, const char* key, const T& value) {
    if (!value.empty()) {
        j[key] = value;
    }
}

template<typename T>
void putOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

template<typename T>
void getIfPresent(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        it->get_to(out);
    }
}

template<typename T>
void getOptional(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

void putTime(json& j, const char* key, const std::optional<Timestamp>& tp) {
    if (tp) {
        j[key] = ApiUtils::formatTimestamp(*tp);
    }
}

void getTime(const json& j, const char* key, std::optional<Timestamp>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    out = ApiUtils::parseTimestamp(it->get<std::string>());
    if (!out) {
        throw std::invalid_argument(std::string("invalid timestamp in field ") + key);
    }
}

void putDuration(json& j, const char* key, const std::optional<Duration>& d) {
    if (d) {
        j[key] = ApiUtils::formatDuration(*d);
    }
}

void getDuration(const json& j, const char* key, std::optional<Duration>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    out = ApiUtils::parseDuration(it->get<std::string>());
    if (!out) {
        throw std::invalid_argument(std::string("invalid duration in field ") + key);
    }
}

// EN: YAML snapshots may carry unquoted numbers where strings are expected.
// FR: Les instantanés YAML peuvent contenir des nombres non quotés là où des chaînes sont attendues.
std::string scalarToString(const json& j) {
    if (j.is_string()) {
        return j.get<std::string>();
    }
    if (j.is_number() || j.is_boolean()) {
        return j.dump();
    }
    throw std::invalid_argument("expected a string value");
}

} // namespace

// ---------------------------------------------------------------------------
// EN: Metadata
// FR: Métadonnées
// ---------------------------------------------------------------------------

void to_json(json& j, const OwnerReference& ref) {
    j = json{{"apiVersion", ref.api_version}, {"kind", ref.kind}, {"name", ref.name}};
    if (ref.controller) j["controller"] = true;
    if (ref.block_owner_deletion) j["blockOwnerDeletion"] = true;
}

void from_json(const json& j, OwnerReference& ref) {
    getIfPresent(j, "apiVersion", ref.api_version);
    getIfPresent(j, "kind", ref.kind);
    getIfPresent(j, "name", ref.name);
    getIfPresent(j, "controller", ref.controller);
    getIfPresent(j, "blockOwnerDeletion", ref.block_owner_deletion);
}

void to_json(json& j, const ObjectMeta& meta) {
    j = json{{"name", meta.name}};
    putIfNotEmpty(j, "namespace", meta.namespace_name);
    putIfNotEmpty(j, "labels", meta.labels);
    putIfNotEmpty(j, "annotations", meta.annotations);
    putIfNotEmpty(j, "ownerReferences", meta.owner_references);
    if (meta.resource_version != 0) {
        j["resourceVersion"] = std::to_string(meta.resource_version);
    }
}

void from_json(const json& j, ObjectMeta& meta) {
    getIfPresent(j, "name", meta.name);
    getIfPresent(j, "namespace", meta.namespace_name);
    getIfPresent(j, "labels", meta.labels);
    getIfPresent(j, "annotations", meta.annotations);
    getIfPresent(j, "ownerReferences", meta.owner_references);
    auto it = j.find("resourceVersion");
    if (it != j.end() && !it->is_null()) {
        meta.resource_version = std::stoull(scalarToString(*it));
    }
}

void to_json(json& j, const StatusCondition& c) {
    j = json{{"type", c.type}, {"status", c.status}};
    putIfNotEmpty(j, "reason", c.reason);
    putIfNotEmpty(j, "message", c.message);
    putTime(j, "lastTransitionTime", c.last_transition_time);
}

void from_json(const json& j, StatusCondition& c) {
    getIfPresent(j, "type", c.type);
    getIfPresent(j, "status", c.status);
    getIfPresent(j, "reason", c.reason);
    getIfPresent(j, "message", c.message);
    getTime(j, "lastTransitionTime", c.last_transition_time);
}

// ---------------------------------------------------------------------------
// EN: Parameters
// FR: Paramètres
// ---------------------------------------------------------------------------

void to_json(json& j, const ParamValue& v) {
    if (v.type == ParamType::ARRAY) {
        j = v.array_val;
    } else {
        j = v.string_val;
    }
}

void from_json(const json& j, ParamValue& v) {
    if (j.is_array()) {
        v.type = ParamType::ARRAY;
        v.array_val.clear();
        for (const auto& item : j) {
            v.array_val.push_back(scalarToString(item));
        }
    } else {
        v.type = ParamType::STRING;
        v.string_val = scalarToString(j);
    }
}

void to_json(json& j, const Param& p) {
    j = json{{"name", p.name}, {"value", p.value}};
}

void from_json(const json& j, Param& p) {
    getIfPresent(j, "name", p.name);
    getIfPresent(j, "value", p.value);
}

void to_json(json& j, const ParamSpec& p) {
    j = json{{"name", p.name}, {"type", p.type}};
    putIfNotEmpty(j, "description", p.description);
    putOptional(j, "default", p.default_value);
}

void from_json(const json& j, ParamSpec& p) {
    getIfPresent(j, "name", p.name);
    getIfPresent(j, "type", p.type);
    getIfPresent(j, "description", p.description);
    getOptional(j, "default", p.default_value);
}

// ---------------------------------------------------------------------------
// EN: Tasks and conditions
// FR: Tâches et conditions
// ---------------------------------------------------------------------------

void to_json(json& j, const Step& s) {
    j = json::object();
    putIfNotEmpty(j, "name", s.name);
    putIfNotEmpty(j, "image", s.image);
    putIfNotEmpty(j, "command", s.command);
    putIfNotEmpty(j, "args", s.args);
    putIfNotEmpty(j, "script", s.script);
}

void from_json(const json& j, Step& s) {
    getIfPresent(j, "name", s.name);
    getIfPresent(j, "image", s.image);
    getIfPresent(j, "command", s.command);
    getIfPresent(j, "args", s.args);
    getIfPresent(j, "script", s.script);
}

void to_json(json& j, const TaskResourceDeclaration& r) {
    j = json{{"name", r.name}, {"type", r.type}};
    if (r.optional) j["optional"] = true;
}

void from_json(const json& j, TaskResourceDeclaration& r) {
    getIfPresent(j, "name", r.name);
    getIfPresent(j, "type", r.type);
    getIfPresent(j, "optional", r.optional);
}

void to_json(json& j, const TaskResultDeclaration& r) {
    j = json{{"name", r.name}};
    putIfNotEmpty(j, "description", r.description);
}

void from_json(const json& j, TaskResultDeclaration& r) {
    getIfPresent(j, "name", r.name);
    getIfPresent(j, "description", r.description);
}

void to_json(json& j, const WorkspaceDeclaration& w) {
    j = json{{"name", w.name}};
    putIfNotEmpty(j, "mountPath", w.mount_path);
    if (w.read_only) j["readOnly"] = true;
}

void from_json(const json& j, WorkspaceDeclaration& w) {
    getIfPresent(j, "name", w.name);
    getIfPresent(j, "mountPath", w.mount_path);
    getIfPresent(j, "readOnly", w.read_only);
}

void to_json(json& j, const TaskSpec& spec) {
    j = json::object();
    putIfNotEmpty(j, "description", spec.description);
    putIfNotEmpty(j, "params", spec.params);
    if (!spec.input_resources.empty() || !spec.output_resources.empty()) {
        json resources = json::object();
        putIfNotEmpty(resources, "inputs", spec.input_resources);
        putIfNotEmpty(resources, "outputs", spec.output_resources);
        j["resources"] = resources;
    }
    putIfNotEmpty(j, "results", spec.results);
    putIfNotEmpty(j, "workspaces", spec.workspaces);
    putIfNotEmpty(j, "steps", spec.steps);
}

void from_json(const json& j, TaskSpec& spec) {
    getIfPresent(j, "description", spec.description);
    getIfPresent(j, "params", spec.params);
    auto resources = j.find("resources");
    if (resources != j.end() && resources->is_object()) {
        getIfPresent(*resources, "inputs", spec.input_resources);
        getIfPresent(*resources, "outputs", spec.output_resources);
    }
    getIfPresent(j, "results", spec.results);
    getIfPresent(j, "workspaces", spec.workspaces);
    getIfPresent(j, "steps", spec.steps);
}

void to_json(json& j, const ConditionSpec& spec) {
    j = json{{"check", spec.check}};
    putIfNotEmpty(j, "description", spec.description);
    putIfNotEmpty(j, "params", spec.params);
    putIfNotEmpty(j, "resources", spec.resources);
}

void from_json(const json& j, ConditionSpec& spec) {
    getIfPresent(j, "description", spec.description);
    getIfPresent(j, "params", spec.params);
    getIfPresent(j, "resources", spec.resources);
    getIfPresent(j, "check", spec.check);
}

// ---------------------------------------------------------------------------
// EN: Resources
// FR: Ressources
// ---------------------------------------------------------------------------

void to_json(json& j, const ResourceParam& p) {
    j = json{{"name", p.name}, {"value", p.value}};
}

void from_json(const json& j, ResourceParam& p) {
    getIfPresent(j, "name", p.name);
    auto it = j.find("value");
    if (it != j.end() && !it->is_null()) {
        p.value = scalarToString(*it);
    }
}

void to_json(json& j, const PipelineResourceSpec& spec) {
    j = json{{"type", spec.type}};
    putIfNotEmpty(j, "params", spec.params);
}

void from_json(const json& j, PipelineResourceSpec& spec) {
    getIfPresent(j, "type", spec.type);
    getIfPresent(j, "params", spec.params);
}

// ---------------------------------------------------------------------------
// EN: Pipelines
// FR: Pipelines
// ---------------------------------------------------------------------------

void to_json(json& j, const PipelineTaskInputResource& r) {
    j = json{{"name", r.name}, {"resource", r.resource}};
    putIfNotEmpty(j, "from", r.from);
}

void from_json(const json& j, PipelineTaskInputResource& r) {
    getIfPresent(j, "name", r.name);
    getIfPresent(j, "resource", r.resource);
    getIfPresent(j, "from", r.from);
}

void to_json(json& j, const PipelineTaskOutputResource& r) {
    j = json{{"name", r.name}, {"resource", r.resource}};
}

void from_json(const json& j, PipelineTaskOutputResource& r) {
    getIfPresent(j, "name", r.name);
    getIfPresent(j, "resource", r.resource);
}

void to_json(json& j, const WorkspacePipelineTaskBinding& w) {
    j = json{{"name", w.name}, {"workspace", w.workspace}};
    putIfNotEmpty(j, "subPath", w.sub_path);
}

void from_json(const json& j, WorkspacePipelineTaskBinding& w) {
    getIfPresent(j, "name", w.name);
    getIfPresent(j, "workspace", w.workspace);
    getIfPresent(j, "subPath", w.sub_path);
}

void to_json(json& j, const PipelineTaskCondition& c) {
    j = json{{"conditionRef", c.condition_ref}};
    putIfNotEmpty(j, "params", c.params);
    putIfNotEmpty(j, "resources", c.resources);
}

void from_json(const json& j, PipelineTaskCondition& c) {
    getIfPresent(j, "conditionRef", c.condition_ref);
    getIfPresent(j, "params", c.params);
    getIfPresent(j, "resources", c.resources);
}

void to_json(json& j, const PipelineTask& t) {
    j = json{{"name", t.name}};
    std::visit([&j](const auto& ref) {
        using T = std::decay_t<decltype(ref)>;
        if constexpr (std::is_same_v<T, NamespacedTaskRef>) {
            j["taskRef"] = json{{"name", ref.name}};
        } else if constexpr (std::is_same_v<T, ClusterTaskRef>) {
            j["taskRef"] = json{{"name", ref.name}, {"kind", TaskKind::CLUSTER}};
        } else {
            j["taskSpec"] = ref;
        }
    }, t.task_ref);
    putIfNotEmpty(j, "params", t.params);
    if (!t.input_resources.empty() || !t.output_resources.empty()) {
        json resources = json::object();
        putIfNotEmpty(resources, "inputs", t.input_resources);
        putIfNotEmpty(resources, "outputs", t.output_resources);
        j["resources"] = resources;
    }
    putIfNotEmpty(j, "workspaces", t.workspaces);
    putIfNotEmpty(j, "conditions", t.conditions);
    putIfNotEmpty(j, "runAfter", t.run_after);
    putDuration(j, "timeout", t.timeout);
    if (t.retries != 0) j["retries"] = t.retries;
}

void from_json(const json& j, PipelineTask& t) {
    getIfPresent(j, "name", t.name);

    auto spec = j.find("taskSpec");
    auto ref = j.find("taskRef");
    if (spec != j.end() && !spec->is_null()) {
        t.task_ref = spec->get<TaskSpec>();
    } else if (ref != j.end() && !ref->is_null()) {
        std::string name = ref->value("name", "");
        TaskKind kind = TaskKind::NAMESPACED;
        getIfPresent(*ref, "kind", kind);
        if (kind == TaskKind::CLUSTER) {
            t.task_ref = ClusterTaskRef{name};
        } else {
            t.task_ref = NamespacedTaskRef{name};
        }
    }

    getIfPresent(j, "params", t.params);
    auto resources = j.find("resources");
    if (resources != j.end() && resources->is_object()) {
        getIfPresent(*resources, "inputs", t.input_resources);
        getIfPresent(*resources, "outputs", t.output_resources);
    }
    getIfPresent(j, "workspaces", t.workspaces);
    getIfPresent(j, "conditions", t.conditions);
    getIfPresent(j, "runAfter", t.run_after);
    getDuration(j, "timeout", t.timeout);
    getIfPresent(j, "retries", t.retries);
}

void to_json(json& j, const PipelineDeclaredResource& r) {
    j = json{{"name", r.name}, {"type", r.type}};
    if (r.optional) j["optional"] = true;
}

void from_json(const json& j, PipelineDeclaredResource& r) {
    getIfPresent(j, "name", r.name);
    getIfPresent(j, "type", r.type);
    getIfPresent(j, "optional", r.optional);
}

void to_json(json& j, const PipelineWorkspaceDeclaration& w) {
    j = json{{"name", w.name}};
    putIfNotEmpty(j, "description", w.description);
    if (w.optional) j["optional"] = true;
}

void from_json(const json& j, PipelineWorkspaceDeclaration& w) {
    getIfPresent(j, "name", w.name);
    getIfPresent(j, "description", w.description);
    getIfPresent(j, "optional", w.optional);
}

void to_json(json& j, const PipelineResult& r) {
    j = json{{"name", r.name}, {"value", r.value}};
    putIfNotEmpty(j, "description", r.description);
}

void from_json(const json& j, PipelineResult& r) {
    getIfPresent(j, "name", r.name);
    getIfPresent(j, "description", r.description);
    getIfPresent(j, "value", r.value);
}

void to_json(json& j, const PipelineSpec& spec) {
    j = json{{"tasks", spec.tasks}};
    putIfNotEmpty(j, "description", spec.description);
    putIfNotEmpty(j, "params", spec.params);
    putIfNotEmpty(j, "resources", spec.resources);
    putIfNotEmpty(j, "workspaces", spec.workspaces);
    putIfNotEmpty(j, "results", spec.results);
}

void from_json(const json& j, PipelineSpec& spec) {
    getIfPresent(j, "description", spec.description);
    getIfPresent(j, "params", spec.params);
    getIfPresent(j, "resources", spec.resources);
    getIfPresent(j, "workspaces", spec.workspaces);
    getIfPresent(j, "tasks", spec.tasks);
    getIfPresent(j, "results", spec.results);
}

// ---------------------------------------------------------------------------
// EN: Volumes and workspaces
// FR: Volumes et workspaces
// ---------------------------------------------------------------------------

void to_json(json& j, const PersistentVolumeClaimSpec& spec) {
    j = json::object();
    putIfNotEmpty(j, "accessModes", spec.access_modes);
    if (!spec.storage.empty()) {
        j["resources"] = json{{"requests", json{{"storage", spec.storage}}}};
    }
}

void from_json(const json& j, PersistentVolumeClaimSpec& spec) {
    getIfPresent(j, "accessModes", spec.access_modes);
    auto resources = j.find("resources");
    if (resources != j.end() && resources->is_object()) {
        auto requests = resources->find("requests");
        if (requests != resources->end() && requests->is_object()) {
            auto storage = requests->find("storage");
            if (storage != requests->end()) {
                spec.storage = scalarToString(*storage);
            }
        }
    }
}

void to_json(json& j, const PersistentVolumeClaim& pvc) {
    j = json{{"metadata", pvc.metadata}, {"spec", pvc.spec}};
}

void from_json(const json& j, PersistentVolumeClaim& pvc) {
    getIfPresent(j, "metadata", pvc.metadata);
    getIfPresent(j, "spec", pvc.spec);
}

void to_json(json& j, const WorkspaceBinding& w) {
    j = json{{"name", w.name}};
    putIfNotEmpty(j, "subPath", w.sub_path);
    if (w.persistent_volume_claim) {
        j["persistentVolumeClaim"] = json{{"claimName", *w.persistent_volume_claim}};
    }
    putOptional(j, "volumeClaimTemplate", w.volume_claim_template);
    if (w.empty_dir) {
        j["emptyDir"] = json::object();
    }
}

void from_json(const json& j, WorkspaceBinding& w) {
    getIfPresent(j, "name", w.name);
    getIfPresent(j, "subPath", w.sub_path);
    auto pvc = j.find("persistentVolumeClaim");
    if (pvc != j.end() && pvc->is_object()) {
        w.persistent_volume_claim = pvc->value("claimName", "");
    }
    getOptional(j, "volumeClaimTemplate", w.volume_claim_template);
    w.empty_dir = j.contains("emptyDir");
}

// ---------------------------------------------------------------------------
// EN: Pipeline runs
// FR: Exécutions de pipeline
// ---------------------------------------------------------------------------

void to_json(json& j, const PipelineResourceBinding& b) {
    j = json{{"name", b.name}};
    if (b.resource_ref) {
        j["resourceRef"] = json{{"name", *b.resource_ref}};
    }
    putOptional(j, "resourceSpec", b.resource_spec);
}

void from_json(const json& j, PipelineResourceBinding& b) {
    getIfPresent(j, "name", b.name);
    auto ref = j.find("resourceRef");
    if (ref != j.end() && ref->is_object()) {
        b.resource_ref = ref->value("name", "");
    }
    getOptional(j, "resourceSpec", b.resource_spec);
}

void to_json(json& j, const TaskServiceAccountName& s) {
    j = json{{"taskName", s.task_name}, {"serviceAccountName", s.service_account_name}};
}

void from_json(const json& j, TaskServiceAccountName& s) {
    getIfPresent(j, "taskName", s.task_name);
    getIfPresent(j, "serviceAccountName", s.service_account_name);
}

void to_json(json& j, const PipelineRunSpec& spec) {
    j = json::object();
    if (spec.pipeline_ref) {
        j["pipelineRef"] = json{{"name", *spec.pipeline_ref}};
    }
    putOptional(j, "pipelineSpec", spec.pipeline_spec);
    putIfNotEmpty(j, "params", spec.params);
    putIfNotEmpty(j, "resources", spec.resources);
    putIfNotEmpty(j, "workspaces", spec.workspaces);
    putIfNotEmpty(j, "serviceAccountName", spec.service_account_name);
    putIfNotEmpty(j, "serviceAccountNames", spec.service_account_names);
    putDuration(j, "timeout", spec.timeout);
    if (spec.cancelled) {
        j["status"] = "PipelineRunCancelled";
    }
}

void from_json(const json& j, PipelineRunSpec& spec) {
    auto ref = j.find("pipelineRef");
    if (ref != j.end() && ref->is_object()) {
        spec.pipeline_ref = ref->value("name", "");
    }
    getOptional(j, "pipelineSpec", spec.pipeline_spec);
    getIfPresent(j, "params", spec.params);
    getIfPresent(j, "resources", spec.resources);
    getIfPresent(j, "workspaces", spec.workspaces);
    getIfPresent(j, "serviceAccountName", spec.service_account_name);
    getIfPresent(j, "serviceAccountNames", spec.service_account_names);
    getDuration(j, "timeout", spec.timeout);
    spec.cancelled = j.value("status", "") == "PipelineRunCancelled";
}

void to_json(json& j, const TaskRunResult& r) {
    j = json{{"name", r.name}, {"value", r.value}};
}

void from_json(const json& j, TaskRunResult& r) {
    getIfPresent(j, "name", r.name);
    auto it = j.find("value");
    if (it != j.end() && !it->is_null()) {
        r.value = scalarToString(*it);
    }
}

void to_json(json& j, const TaskRunStatus& s) {
    j = json::object();
    if (s.condition) {
        j["conditions"] = json::array({*s.condition});
    }
    putTime(j, "startTime", s.start_time);
    putTime(j, "completionTime", s.completion_time);
    putIfNotEmpty(j, "podName", s.pod_name);
    putIfNotEmpty(j, "taskResults", s.results);
    putIfNotEmpty(j, "retriesStatus", s.retries_status);
}

void from_json(const json& j, TaskRunStatus& s) {
    auto conditions = j.find("conditions");
    if (conditions != j.end() && conditions->is_array()) {
        for (const auto& c : *conditions) {
            if (c.value("type", SUCCEEDED_CONDITION) == SUCCEEDED_CONDITION) {
                s.condition = c.get<StatusCondition>();
            }
        }
    }
    getTime(j, "startTime", s.start_time);
    getTime(j, "completionTime", s.completion_time);
    getIfPresent(j, "podName", s.pod_name);
    getIfPresent(j, "taskResults", s.results);
    getIfPresent(j, "retriesStatus", s.retries_status);
}

void to_json(json& j, const PipelineRunConditionCheckStatus& s) {
    j = json{{"conditionName", s.condition_name}};
    putOptional(j, "status", s.status);
}

void from_json(const json& j, PipelineRunConditionCheckStatus& s) {
    getIfPresent(j, "conditionName", s.condition_name);
    getOptional(j, "status", s.status);
}

void to_json(json& j, const PipelineRunTaskRunStatus& s) {
    j = json{{"pipelineTaskName", s.pipeline_task_name}};
    putOptional(j, "status", s.status);
    putIfNotEmpty(j, "conditionChecks", s.condition_checks);
}

void from_json(const json& j, PipelineRunTaskRunStatus& s) {
    getIfPresent(j, "pipelineTaskName", s.pipeline_task_name);
    getOptional(j, "status", s.status);
    getIfPresent(j, "conditionChecks", s.condition_checks);
}

void to_json(json& j, const PipelineRunResult& r) {
    j = json{{"name", r.name}, {"value", r.value}};
}

void from_json(const json& j, PipelineRunResult& r) {
    getIfPresent(j, "name", r.name);
    getIfPresent(j, "value", r.value);
}

void to_json(json& j, const PipelineRunStatus& s) {
    j = json::object();
    if (s.condition) {
        j["conditions"] = json::array({*s.condition});
    }
    putTime(j, "startTime", s.start_time);
    putTime(j, "completionTime", s.completion_time);
    putIfNotEmpty(j, "taskRuns", s.task_runs);
    putIfNotEmpty(j, "pipelineResults", s.pipeline_results);
    putOptional(j, "pipelineSpec", s.pipeline_spec);
}

void from_json(const json& j, PipelineRunStatus& s) {
    auto conditions = j.find("conditions");
    if (conditions != j.end() && conditions->is_array()) {
        for (const auto& c : *conditions) {
            if (c.value("type", SUCCEEDED_CONDITION) == SUCCEEDED_CONDITION) {
                s.condition = c.get<StatusCondition>();
            }
        }
    }
    getTime(j, "startTime", s.start_time);
    getTime(j, "completionTime", s.completion_time);
    getIfPresent(j, "taskRuns", s.task_runs);
    getIfPresent(j, "pipelineResults", s.pipeline_results);
    getOptional(j, "pipelineSpec", s.pipeline_spec);
}

// ---------------------------------------------------------------------------
// EN: Task runs
// FR: Exécutions de tâche
// ---------------------------------------------------------------------------

void to_json(json& j, const TaskResourceBinding& b) {
    j = json{{"name", b.name}};
    if (b.resource_ref) {
        j["resourceRef"] = json{{"name", *b.resource_ref}};
    }
    putOptional(j, "resourceSpec", b.resource_spec);
    putIfNotEmpty(j, "paths", b.paths);
}

void from_json(const json& j, TaskResourceBinding& b) {
    getIfPresent(j, "name", b.name);
    auto ref = j.find("resourceRef");
    if (ref != j.end() && ref->is_object()) {
        b.resource_ref = ref->value("name", "");
    }
    getOptional(j, "resourceSpec", b.resource_spec);
    getIfPresent(j, "paths", b.paths);
}

void to_json(json& j, const TaskRunSpec& spec) {
    j = json::object();
    if (spec.task_ref) {
        j["taskRef"] = json{{"name", spec.task_ref->name}, {"kind", spec.task_ref->kind}};
    }
    putOptional(j, "taskSpec", spec.task_spec);
    putIfNotEmpty(j, "params", spec.params);
    if (!spec.input_resources.empty() || !spec.output_resources.empty()) {
        json resources = json::object();
        putIfNotEmpty(resources, "inputs", spec.input_resources);
        putIfNotEmpty(resources, "outputs", spec.output_resources);
        j["resources"] = resources;
    }
    putIfNotEmpty(j, "serviceAccountName", spec.service_account_name);
    putDuration(j, "timeout", spec.timeout);
    putIfNotEmpty(j, "workspaces", spec.workspaces);
    putIfNotEmpty(j, "status", spec.status);
}

void from_json(const json& j, TaskRunSpec& spec) {
    auto ref = j.find("taskRef");
    if (ref != j.end() && ref->is_object()) {
        TaskRef task_ref;
        task_ref.name = ref->value("name", "");
        getIfPresent(*ref, "kind", task_ref.kind);
        spec.task_ref = task_ref;
    }
    getOptional(j, "taskSpec", spec.task_spec);
    getIfPresent(j, "params", spec.params);
    auto resources = j.find("resources");
    if (resources != j.end() && resources->is_object()) {
        getIfPresent(*resources, "inputs", spec.input_resources);
        getIfPresent(*resources, "outputs", spec.output_resources);
    }
    getIfPresent(j, "serviceAccountName", spec.service_account_name);
    getDuration(j, "timeout", spec.timeout);
    getIfPresent(j, "workspaces", spec.workspaces);
    getIfPresent(j, "status", spec.status);
}

// ---------------------------------------------------------------------------
// EN: Top-level objects
// FR: Objets de premier niveau
// ---------------------------------------------------------------------------

namespace {

template<typename Object>
json objectToJson(const char* kind, const Object& object) {
    return json{{"apiVersion", API_VERSION}, {"kind", kind},
                {"metadata", object.metadata}, {"spec", object.spec}};
}

template<typename Object>
Object objectFromJson(const json& j) {
    Object object;
    getIfPresent(j, "metadata", object.metadata);
    getIfPresent(j, "spec", object.spec);
    return object;
}

} // namespace

json Task::toJson() const { return objectToJson("Task", *this); }
Task Task::fromJson(const json& j) { return objectFromJson<Task>(j); }

json Condition::toJson() const { return objectToJson("Condition", *this); }
Condition Condition::fromJson(const json& j) { return objectFromJson<Condition>(j); }

json PipelineResource::toJson() const { return objectToJson("PipelineResource", *this); }
PipelineResource PipelineResource::fromJson(const json& j) { return objectFromJson<PipelineResource>(j); }

json Pipeline::toJson() const { return objectToJson("Pipeline", *this); }
Pipeline Pipeline::fromJson(const json& j) { return objectFromJson<Pipeline>(j); }

json PersistentVolumeClaim::toJson() const {
    json j = *this;
    j["apiVersion"] = "v1";
    j["kind"] = "PersistentVolumeClaim";
    return j;
}

PersistentVolumeClaim PersistentVolumeClaim::fromJson(const json& j) {
    return j.get<PersistentVolumeClaim>();
}

bool PipelineRun::isDone() const {
    return status.condition && !status.condition->isUnknown();
}

json PipelineRun::toJson() const {
    json j = objectToJson(PIPELINE_RUN_KIND, *this);
    j["status"] = status;
    return j;
}

PipelineRun PipelineRun::fromJson(const json& j) {
    PipelineRun run = objectFromJson<PipelineRun>(j);
    getIfPresent(j, "status", run.status);
    return run;
}

bool TaskRun::isDone() const {
    return status.condition && !status.condition->isUnknown();
}

bool TaskRun::isSuccessful() const {
    return status.condition && status.condition->isTrue();
}

// EN: Cancelled once the cancel patch landed, or once the engine reported it.
// FR: Annulé dès que le patch d'annulation est posé, ou dès que le moteur l'a signalé.
bool TaskRun::isCancelled() const {
    if (spec.status == TASK_RUN_SPEC_STATUS_CANCELLED) {
        return true;
    }
    return status.condition && status.condition->isFalse() &&
           status.condition->reason == TASK_RUN_REASON_CANCELLED;
}

json TaskRun::toJson() const {
    json j = objectToJson("TaskRun", *this);
    j["status"] = status;
    return j;
}

TaskRun TaskRun::fromJson(const json& j) {
    TaskRun run = objectFromJson<TaskRun>(j);
    getIfPresent(j, "status", run.status);
    return run;
}

} // namespace PRR::Api
