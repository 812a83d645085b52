// EN: Controller example - drive a three-stage PipelineRun to completion with a simulated task executor
// FR: Exemple de contrôleur - mène un PipelineRun à trois étapes jusqu'au bout avec un exécuteur simulé

#include "api/api_utils.hpp"
#include "infrastructure/logging/logger.hpp"
#include "reconciler/controller.hpp"
#include "reconciler/pipeline_run_reconciler.hpp"
#include "reconciler/reconciler_config.hpp"
#include "store/in_memory_object_store.hpp"

#include <chrono>
#include <iostream>

using namespace PRR;
using namespace std::chrono_literals;

namespace {

constexpr const char* NAMESPACE = "ci";

Api::Task echoTask(const std::string& name, std::vector<std::string> results = {}) {
    Api::Task task;
    task.metadata.name = name;
    task.metadata.namespace_name = NAMESPACE;
    Api::ParamSpec revision;
    revision.name = "revision";
    revision.type = Api::ParamType::STRING;
    revision.default_value = Api::ParamValue("main");
    task.spec.params.push_back(revision);
    for (const auto& result : results) {
        task.spec.results.push_back({result, ""});
    }
    Api::Step step;
    step.name = "run";
    step.image = "alpine";
    step.script = "echo " + name + " $(params.revision)";
    task.spec.steps.push_back(step);
    return task;
}

Api::PipelineTask stage(const std::string& name, const std::string& task, std::vector<std::string> after = {}) {
    Api::PipelineTask pipeline_task;
    pipeline_task.name = name;
    pipeline_task.task_ref = Api::NamespacedTaskRef{task};
    pipeline_task.run_after = std::move(after);
    return pipeline_task;
}

// EN: Plays the execution engine: every task-run still pending succeeds, publishing a commit result.
// FR: Joue le moteur d'exécution : chaque task-run encore en attente réussit et publie un résultat commit.
size_t completePendingTaskRuns(Store::InMemoryObjectStore& store) {
    size_t completed = 0;
    for (auto task_run : store.listTaskRuns(NAMESPACE, {})) {
        if (task_run.isDone()) {
            continue;
        }
        Api::StatusCondition condition;
        condition.status = Api::ConditionStatus::TRUE;
        condition.reason = "Succeeded";
        condition.last_transition_time = std::chrono::system_clock::now();
        task_run.status.condition = condition;
        task_run.status.start_time = std::chrono::system_clock::now();
        task_run.status.completion_time = std::chrono::system_clock::now();
        task_run.status.pod_name = task_run.metadata.name + "-pod";
        task_run.status.results = {{"commit", "4f2a9c1"}};
        try {
            store.updateTaskRunStatus(task_run);
            ++completed;
        } catch (const Store::ConflictError& e) {
            LOG_WARN("executor", std::string("Will retry ") + task_run.metadata.name + ": " + e.what());
        }
    }
    return completed;
}

} // namespace

int main() {
    auto& logger = Logger::getInstance();
    logger.setLogLevel(LogLevel::INFO);
    logger.addGlobalMetadata("example", "controller");

    Store::InMemoryObjectStore store;
    store.seed(echoTask("clone", {"commit"}));
    store.seed(echoTask("build"));

    Api::Pipeline pipeline;
    pipeline.metadata.name = "release";
    pipeline.metadata.namespace_name = NAMESPACE;
    Api::PipelineTask build = stage("build", "build");
    build.params.push_back({"revision", Api::ParamValue("$(tasks.clone.results.commit)")});
    pipeline.spec.tasks = {stage("clone", "clone"), build, stage("package", "build", {"build"})};
    pipeline.spec.results.push_back({"commit", "Revision that was built", "$(tasks.clone.results.commit)"});
    store.seed(pipeline);

    Api::PipelineRun run;
    run.metadata.name = "release-run";
    run.metadata.namespace_name = NAMESPACE;
    run.spec.pipeline_ref = "release";
    store.seed(run);

    Reconciler::ReconcilerConfig config;
    config.workers = 2;
    Reconciler::PipelineRunReconciler reconciler(store, config);
    Reconciler::Controller controller(store, reconciler, config);
    controller.start();
    controller.enqueue(Api::ApiUtils::objectKey(NAMESPACE, "release-run"));

    for (int round = 0; round < 10; ++round) {
        if (!controller.waitForIdle(5s)) {
            LOG_ERROR("example", "Controller did not settle");
            break;
        }
        if (store.getPipelineRun(NAMESPACE, "release-run").isDone()) {
            break;
        }
        size_t completed = completePendingTaskRuns(store);
        LOG_INFO("example", "Round " + std::to_string(round) + ": completed " + std::to_string(completed) +
                 " task-runs");
    }
    controller.stop();

    Api::PipelineRun done = store.getPipelineRun(NAMESPACE, "release-run");
    std::cout << done.toJson()["status"].dump(2) << std::endl;

    auto stats = controller.getStats();
    std::cout << "reconciles=" << stats.reconciles << " successes=" << stats.successes
              << " retries=" << stats.retries << std::endl;

    logger.flush();
    return done.isDone() && done.status.condition->isTrue() ? 0 : 1;
}
