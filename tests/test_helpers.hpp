// EN: Shared builders and doubles for the reconciler tests
// FR: Constructeurs et doublures partagés par les tests du réconciliateur

#pragma once

#include <gmock/gmock.h>

#include "api/api_utils.hpp"
#include "api/pipeline_types.hpp"
#include "reconciler/name_generator.hpp"
#include "store/in_memory_object_store.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace PRR::Testing {

inline constexpr const char* NS = "foo";

// EN: Deterministic names: "<base>-00001", "<base>-00002", ... (the counter is shared by all bases).
// FR: Noms déterministes : "<base>-00001", "<base>-00002", ... (le compteur est commun à toutes les bases).
class SequentialNameGenerator : public Reconciler::detail::INameGenerator {
public:
    std::string generate(const std::string& base) override {
        std::string counter = std::to_string(++count_);
        counter.insert(0, Reconciler::RANDOM_SUFFIX_LENGTH - counter.size(), '0');
        return Reconciler::RandomNameGenerator::restrictBase(base) + "-" + counter;
    }

    int calls() const { return count_; }

private:
    int count_ = 0;
};

class MockNameGenerator : public Reconciler::detail::INameGenerator {
public:
    MOCK_METHOD(std::string, generate, (const std::string& base), (override));
};

inline Api::Timestamp fixedTime() {
    return *Api::ApiUtils::parseTimestamp("2026-03-01T10:00:00Z");
}

inline Api::ParamSpec stringParam(const std::string& name, std::optional<std::string> default_value = std::nullopt) {
    Api::ParamSpec spec;
    spec.name = name;
    spec.type = Api::ParamType::STRING;
    if (default_value) {
        spec.default_value = Api::ParamValue(*default_value);
    }
    return spec;
}

inline Api::Task makeTask(const std::string& name, std::vector<Api::ParamSpec> params = {},
                          std::vector<std::string> results = {}) {
    Api::Task task;
    task.metadata.name = name;
    task.metadata.namespace_name = NS;
    task.spec.params = std::move(params);
    for (const auto& result : results) {
        task.spec.results.push_back(Api::TaskResultDeclaration{result, ""});
    }
    Api::Step step;
    step.name = "main";
    step.image = "busybox";
    step.script = "echo " + name;
    task.spec.steps.push_back(step);
    return task;
}

inline Api::PipelineTask pipelineTask(const std::string& name, const std::string& task_name,
                                      std::vector<std::string> run_after = {}) {
    Api::PipelineTask task;
    task.name = name;
    task.task_ref = Api::NamespacedTaskRef{task_name};
    task.run_after = std::move(run_after);
    return task;
}

inline Api::Pipeline makePipeline(const std::string& name, std::vector<Api::PipelineTask> tasks) {
    Api::Pipeline pipeline;
    pipeline.metadata.name = name;
    pipeline.metadata.namespace_name = NS;
    pipeline.spec.tasks = std::move(tasks);
    return pipeline;
}

inline Api::PipelineRun makeRun(const std::string& name, const std::string& pipeline_name) {
    Api::PipelineRun run;
    run.metadata.name = name;
    run.metadata.namespace_name = NS;
    run.spec.pipeline_ref = pipeline_name;
    return run;
}

inline Api::Condition makeCondition(const std::string& name, std::vector<Api::ParamSpec> params = {}) {
    Api::Condition condition;
    condition.metadata.name = name;
    condition.metadata.namespace_name = NS;
    condition.spec.params = std::move(params);
    condition.spec.check.name = "check";
    condition.spec.check.image = "alpine";
    condition.spec.check.args = {"test", "-n", "$(params.path)"};
    return condition;
}

inline Api::StatusCondition condition(Api::ConditionStatus status, const std::string& reason = "",
                                      const std::string& message = "") {
    Api::StatusCondition result;
    result.status = status;
    result.reason = reason;
    result.message = message;
    result.last_transition_time = fixedTime();
    return result;
}

// EN: Play the task-execution engine: finish a task-run with the given outcome and results.
// FR: Joue le moteur d'exécution : termine un task-run avec le résultat et les sorties donnés.
inline Api::TaskRun finishTaskRun(Store::InMemoryObjectStore& store, const std::string& name, bool succeeded,
                                  std::vector<Api::TaskRunResult> results = {}) {
    Api::TaskRun task_run = store.getTaskRun(NS, name);
    task_run.status.condition = condition(succeeded ? Api::ConditionStatus::TRUE : Api::ConditionStatus::FALSE,
                                          succeeded ? "Succeeded" : "Failed");
    task_run.status.start_time = fixedTime();
    task_run.status.completion_time = fixedTime();
    task_run.status.pod_name = name + "-pod";
    task_run.status.results = std::move(results);
    return store.updateTaskRunStatus(task_run);
}

inline Api::TaskRun startTaskRun(Store::InMemoryObjectStore& store, const std::string& name) {
    Api::TaskRun task_run = store.getTaskRun(NS, name);
    task_run.status.condition = condition(Api::ConditionStatus::UNKNOWN, "Running");
    task_run.status.start_time = fixedTime();
    return store.updateTaskRunStatus(task_run);
}

// EN: Task-runs owned by a run, keyed by their pipeline task label.
// FR: Task-runs appartenant à un run, indexés par leur label de tâche de pipeline.
inline std::map<std::string, Api::TaskRun> childrenByPipelineTask(const Store::InMemoryObjectStore& store,
                                                                  const std::string& run_name,
                                                                  bool condition_checks = false) {
    std::map<std::string, Api::TaskRun> result;
    for (const auto& child : store.listTaskRuns(NS, {{Api::Labels::PIPELINE_RUN, run_name}})) {
        bool is_check = child.metadata.labels.count(Api::Labels::CONDITION_CHECK) > 0;
        if (is_check == condition_checks) {
            result[child.metadata.labels.at(Api::Labels::PIPELINE_TASK)] = child;
        }
    }
    return result;
}

inline size_t countActions(const std::vector<Store::StoreAction>& actions, const std::string& verb,
                           Store::ObjectKind kind) {
    size_t count = 0;
    for (const auto& action : actions) {
        if (action.verb == verb && action.kind == kind) {
            ++count;
        }
    }
    return count;
}

} // namespace PRR::Testing
