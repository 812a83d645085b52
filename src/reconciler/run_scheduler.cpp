// EN: Run scheduler implementation
// FR: Implémentation de l'ordonnanceur de run

#include "reconciler/run_scheduler.hpp"
#include "infrastructure/logging/logger.hpp"
#include "reconciler/substitution.hpp"

#include <algorithm>

namespace PRR::Reconciler {

RunScheduler::RunScheduler(Store::IObjectStore& store, WorkspaceLinker& linker, const ReconcilerConfig& config)
    : store_(store), linker_(linker), config_(config) {}

// ---------------------------------------------------------------------------
// EN: Timeouts
// FR: Timeouts
// ---------------------------------------------------------------------------

Api::Duration RunScheduler::effectiveRunTimeout(const Api::PipelineRun& run, Api::Duration default_timeout) {
    return run.spec.timeout ? *run.spec.timeout : default_timeout;
}

bool RunScheduler::isTimedOut(const Api::PipelineRun& run, Api::Timestamp now, Api::Duration default_timeout) {
    Api::Duration timeout = effectiveRunTimeout(run, default_timeout);
    if (timeout.count() <= 0 || !run.status.start_time) {
        return false;
    }
    return now - *run.status.start_time >= timeout;
}

Api::Duration RunScheduler::computeTaskRunTimeout(const Api::PipelineRun& run, const Api::PipelineTask& task,
                                                  Api::Timestamp now, Api::Duration default_timeout) {
    Api::Duration base = effectiveRunTimeout(run, default_timeout);
    if (base.count() <= 0) {
        return task.timeout ? *task.timeout : Api::Duration{0};
    }

    Api::Timestamp start = run.status.start_time ? *run.status.start_time : now;
    Api::Timestamp deadline = start + base;
    if (deadline <= now) {
        return std::chrono::seconds(1);
    }

    auto remaining = std::chrono::duration_cast<Api::Duration>(deadline - now);
    if (task.timeout && task.timeout->count() > 0 && *task.timeout < remaining) {
        return *task.timeout;
    }
    return remaining;
}

// ---------------------------------------------------------------------------
// EN: Node classification
// FR: Classification des nœuds
// ---------------------------------------------------------------------------

bool RunScheduler::isFailure(const ResolvedNode& node) {
    if (!node.task_run || !node.task_run->status.condition || !node.task_run->status.condition->isFalse()) {
        return false;
    }
    return node.task_run->isCancelled() ||
           node.task_run->status.retries_status.size() >= static_cast<size_t>(std::max(node.task.retries, 0));
}

bool RunScheduler::hasFailedConditionCheck(const ResolvedNode& node) {
    return std::any_of(node.condition_checks.begin(), node.condition_checks.end(),
                       [](const ConditionCheckPlan& plan) { return plan.isDone() && !plan.isSuccessful(); });
}

std::set<std::string> RunScheduler::skippedNodes(const ResolvedPipeline& pipeline, const PipelineGraph& graph) {
    std::set<std::string> skipped;
    for (const auto& node : pipeline.nodes) {
        if (hasFailedConditionCheck(node)) {
            skipped.insert(node.name());
            auto descendants = graph.getDescendants(node.name());
            skipped.insert(descendants.begin(), descendants.end());
        }
    }
    return skipped;
}

// ---------------------------------------------------------------------------
// EN: Cancellation
// FR: Annulation
// ---------------------------------------------------------------------------

std::vector<std::string> RunScheduler::cancelInFlight(const std::map<std::string, Api::TaskRun>& children) {
    std::vector<std::string> failed;
    for (const auto& [name, child] : children) {
        if (child.isDone() || child.spec.status == Api::TASK_RUN_SPEC_STATUS_CANCELLED) {
            continue;
        }
        try {
            store_.cancelTaskRun(child.metadata.namespace_name, name);
            LOG_INFO("scheduler", "Cancelled TaskRun " + name);
        } catch (const Store::StoreError& e) {
            LOG_WARN("scheduler", "Failed to cancel TaskRun " + name + ": " + e.what());
            failed.push_back(name);
        }
    }
    return failed;
}

// ---------------------------------------------------------------------------
// EN: Scheduling
// FR: Ordonnancement
// ---------------------------------------------------------------------------

bool RunScheduler::retryIfAllowed(ResolvedNode& node) {
    if (!node.task_run || !node.task_run->status.condition || !node.task_run->status.condition->isFalse()) {
        return false;
    }
    if (node.task_run->isCancelled()) {
        return false;
    }
    if (node.task_run->status.retries_status.size() >= static_cast<size_t>(std::max(node.task.retries, 0))) {
        return false;
    }

    Api::TaskRun task_run = *node.task_run;
    Api::TaskRunStatus previous = task_run.status;
    previous.retries_status.clear();
    task_run.status.retries_status.push_back(previous);
    task_run.status.condition = Api::StatusCondition{};
    task_run.status.start_time.reset();
    task_run.status.completion_time.reset();
    task_run.status.pod_name.clear();

    node.task_run = store_.updateTaskRunStatus(task_run);
    LOG_INFO("scheduler", "Retrying TaskRun " + node.task_run_name + " (attempt " +
             std::to_string(node.task_run->status.retries_status.size()) + " of " +
             std::to_string(node.task.retries) + ")");
    return true;
}

void RunScheduler::prepareStorage(const Api::PipelineRun& run, const ResolvedPipeline& pipeline,
                                  const Api::PipelineSpec& spec, bool& prepared) {
    if (prepared) {
        return;
    }
    prepared = true;

    bool any_child = std::any_of(pipeline.nodes.begin(), pipeline.nodes.end(), [](const ResolvedNode& node) {
        return node.task_run || std::any_of(node.condition_checks.begin(), node.condition_checks.end(),
                                            [](const ConditionCheckPlan& plan) { return plan.check_run.has_value(); });
    });
    if (!any_child && WorkspaceLinker::needsResourceClaim(spec)) {
        linker_.ensureResourceClaim(run);
    }
    linker_.ensureWorkspaceClaims(run, spec);
}

ScheduleResult RunScheduler::schedule(Api::PipelineRun& run, ResolvedPipeline& pipeline, const PipelineGraph& graph,
                                      const Api::PipelineSpec& spec, Api::Timestamp now) {
    ScheduleResult result;
    bool storage_prepared = false;

    for (auto& node : pipeline.nodes) {
        if (retryIfAllowed(node)) {
            result.retried_task_runs.push_back(node.task_run_name);
        }
    }

    auto failed = std::find_if(pipeline.nodes.begin(), pipeline.nodes.end(),
                               [](const ResolvedNode& node) { return isFailure(node); });
    if (failed != pipeline.nodes.end()) {
        LOG_DEBUG("scheduler", "Not starting new tasks: " + failed->task_run_name + " has failed");
        return result;
    }

    std::set<std::string> successful;
    for (const auto& node : pipeline.nodes) {
        if (node.task_run && node.task_run->isSuccessful()) {
            successful.insert(node.name());
        }
    }
    const std::set<std::string> skipped = skippedNodes(pipeline, graph);

    for (const auto& name : graph.getSchedulable(successful)) {
        ResolvedNode* node = pipeline.find(name);
        if (!node || skipped.count(name) > 0 || node->task_run) {
            continue;
        }
        if (!BindingResolver::applyTaskResults(*node, pipeline)) {
            continue;
        }

        auto& entry = run.status.task_runs[node->task_run_name];
        entry.pipeline_task_name = node->name();

        bool checks_passed = true;
        for (auto& plan : node->condition_checks) {
            if (!plan.check_run) {
                prepareStorage(run, pipeline, spec, storage_prepared);
                plan.check_run = createOrAdopt(buildConditionCheck(run, *node, plan, now));
                entry.condition_checks[plan.check_name] =
                    Api::PipelineRunConditionCheckStatus{plan.register_name, plan.check_run->status};
                result.created_condition_checks.push_back(plan.check_name);
            }
            if (!plan.isSuccessful()) {
                checks_passed = false;
            }
        }
        if (!checks_passed) {
            continue;
        }

        prepareStorage(run, pipeline, spec, storage_prepared);
        node->task_run = createOrAdopt(buildTaskRun(run, *node, now));
        entry.status = node->task_run->status;
        result.created_task_runs.push_back(node->task_run_name);
    }

    return result;
}

// ---------------------------------------------------------------------------
// EN: Child object construction
// FR: Construction des objets enfants
// ---------------------------------------------------------------------------

std::string RunScheduler::serviceAccountFor(const Api::PipelineRun& run, const std::string& task_name) const {
    for (const auto& entry : run.spec.service_account_names) {
        if (entry.task_name == task_name && !entry.service_account_name.empty()) {
            return entry.service_account_name;
        }
    }
    if (!run.spec.service_account_name.empty()) {
        return run.spec.service_account_name;
    }
    return config_.default_service_account;
}

Api::ObjectMeta RunScheduler::childMetadata(const Api::PipelineRun& run, const ResolvedNode& node,
                                            const std::string& name) const {
    Api::ObjectMeta metadata;
    metadata.name = name;
    metadata.namespace_name = run.metadata.namespace_name;
    metadata.labels = run.metadata.labels;
    auto pipeline_label = run.metadata.labels.find(Api::Labels::PIPELINE);
    metadata.labels[Api::Labels::PIPELINE] =
        pipeline_label != run.metadata.labels.end() ? pipeline_label->second : run.metadata.name;
    metadata.labels[Api::Labels::PIPELINE_RUN] = run.metadata.name;
    metadata.labels[Api::Labels::PIPELINE_TASK] = node.name();
    metadata.annotations = run.metadata.annotations;
    metadata.owner_references.push_back(
        Api::OwnerReference{Api::API_VERSION, Api::PIPELINE_RUN_KIND, run.metadata.name, true, true});
    return metadata;
}

Api::TaskRun RunScheduler::buildTaskRun(const Api::PipelineRun& run, const ResolvedNode& node,
                                        Api::Timestamp now) const {
    Api::TaskRun task_run;
    task_run.metadata = childMetadata(run, node, node.task_run_name);

    if (node.task_ref) {
        task_run.spec.task_ref = node.task_ref;
    } else {
        task_run.spec.task_spec = node.task_spec;
    }
    task_run.spec.params = node.task.params;
    task_run.spec.input_resources = node.input_resources;
    task_run.spec.output_resources = node.output_resources;
    task_run.spec.service_account_name = serviceAccountFor(run, node.name());
    task_run.spec.timeout = computeTaskRunTimeout(run, node.task, now, config_.default_timeout);
    task_run.spec.workspaces = linker_.workspacesFor(run, node.task);
    return task_run;
}

Api::TaskRun RunScheduler::buildConditionCheck(const Api::PipelineRun& run, const ResolvedNode& node,
                                               const ConditionCheckPlan& plan, Api::Timestamp now) const {
    const Api::Condition& condition = plan.condition;

    Api::TaskRun check;
    check.metadata = childMetadata(run, node, plan.check_name);
    for (const auto& [key, value] : condition.metadata.labels) {
        check.metadata.labels[key] = value;
    }
    for (const auto& [key, value] : condition.metadata.annotations) {
        check.metadata.annotations[key] = value;
    }
    check.metadata.labels[Api::Labels::CONDITION_CHECK] = plan.check_name;
    check.metadata.labels[Api::Labels::CONDITION_NAME] = condition.metadata.name;
    check.metadata.labels[Api::Labels::CONDITION_REGISTER_NAME] = plan.register_name;

    Api::TaskSpec spec;
    spec.params = condition.spec.params;
    spec.input_resources = condition.spec.resources;
    Api::Step step = Substitution::applyToStep(condition.spec.check,
                                               Substitution::paramReplacements(condition.spec.params, plan.params));
    step.name = "condition-check-" + condition.metadata.name;
    spec.steps.push_back(std::move(step));

    check.spec.task_spec = std::move(spec);
    check.spec.params = plan.params;
    check.spec.input_resources = plan.resources;
    check.spec.service_account_name = serviceAccountFor(run, node.name());
    check.spec.timeout = computeTaskRunTimeout(run, node.task, now, config_.default_timeout);
    return check;
}

Api::TaskRun RunScheduler::createOrAdopt(const Api::TaskRun& task_run) {
    try {
        Api::TaskRun created = store_.createTaskRun(task_run);
        LOG_INFO("scheduler", "Created TaskRun " + created.metadata.name);
        return created;
    } catch (const Store::AlreadyExistsError&) {
        Api::TaskRun existing = store_.getTaskRun(task_run.metadata.namespace_name, task_run.metadata.name);
        auto owner = existing.metadata.labels.find(Api::Labels::PIPELINE_RUN);
        auto expected = task_run.metadata.labels.find(Api::Labels::PIPELINE_RUN);
        if (owner == existing.metadata.labels.end() || owner->second != expected->second) {
            throw;
        }
        LOG_INFO("scheduler", "Adopted existing TaskRun " + existing.metadata.name);
        return existing;
    }
}

} // namespace PRR::Reconciler
