// EN: Status aggregation implementation
// FR: Implémentation de l'agrégation de statut

#include "reconciler/status_aggregator.hpp"
#include "infrastructure/logging/logger.hpp"
#include "reconciler/reconcile_errors.hpp"
#include "reconciler/run_scheduler.hpp"
#include "reconciler/substitution.hpp"

#include <algorithm>

namespace PRR::Reconciler {

StatusAggregator::StatusAggregator(detail::INameGenerator& names) : names_(names) {}

std::string StatusAggregator::conditionCheckFailedMessage(const std::string& task_run_name,
                                                          const std::string& run_name) {
    return "ConditionChecks failed for Task " + task_run_name + " in PipelineRun " + run_name;
}

// ---------------------------------------------------------------------------
// EN: Orphan recovery and refresh
// FR: Récupération des orphelins et rafraîchissement
// ---------------------------------------------------------------------------

size_t StatusAggregator::recoverOrphans(Api::PipelineRun& run,
                                        const std::map<std::string, Api::TaskRun>& children) const {
    auto& task_runs = run.status.task_runs;
    size_t recovered = 0;

    auto labelOf = [](const Api::TaskRun& child, const char* key) -> std::string {
        auto it = child.metadata.labels.find(key);
        return it != child.metadata.labels.end() ? it->second : std::string();
    };

    // EN: Regular task-runs first, so condition checks can find their parent entry.
    // FR: Les task-runs normaux d'abord, pour que les condition checks trouvent leur entrée parente.
    for (const auto& [name, child] : children) {
        const std::string pipeline_task = labelOf(child, Api::Labels::PIPELINE_TASK);
        if (pipeline_task.empty() || child.metadata.labels.count(Api::Labels::CONDITION_CHECK) > 0) {
            continue;
        }
        if (task_runs.count(name) == 0) {
            task_runs[name] = Api::PipelineRunTaskRunStatus{pipeline_task, child.status, {}};
            ++recovered;
            LOG_INFO("aggregator", "Recovered orphaned TaskRun " + name + " for " + run.metadata.name);
        }
    }

    for (const auto& [name, child] : children) {
        const std::string pipeline_task = labelOf(child, Api::Labels::PIPELINE_TASK);
        if (pipeline_task.empty() || child.metadata.labels.count(Api::Labels::CONDITION_CHECK) == 0) {
            continue;
        }

        auto parent = std::find_if(task_runs.begin(), task_runs.end(), [&pipeline_task](const auto& entry) {
            return entry.second.pipeline_task_name == pipeline_task;
        });
        if (parent == task_runs.end()) {
            std::string parent_name = names_.generate(run.metadata.name + "-" + pipeline_task);
            parent = task_runs.emplace(parent_name, Api::PipelineRunTaskRunStatus{pipeline_task, std::nullopt, {}}).first;
        }

        auto& checks = parent->second.condition_checks;
        if (checks.count(name) == 0) {
            checks[name] = Api::PipelineRunConditionCheckStatus{
                labelOf(child, Api::Labels::CONDITION_REGISTER_NAME), child.status};
            ++recovered;
            LOG_INFO("aggregator", "Recovered orphaned condition check " + name + " for " + run.metadata.name);
        }
    }

    return recovered;
}

void StatusAggregator::refreshStatuses(Api::PipelineRun& run, const std::map<std::string, Api::TaskRun>& children) {
    for (auto& [name, entry] : run.status.task_runs) {
        auto live = children.find(name);
        if (live != children.end()) {
            entry.status = live->second.status;
        }
        for (auto& [check_name, check] : entry.condition_checks) {
            auto live_check = children.find(check_name);
            if (live_check != children.end()) {
                check.status = live_check->second.status;
            }
        }
    }
}

// ---------------------------------------------------------------------------
// EN: Overall condition
// FR: Condition globale
// ---------------------------------------------------------------------------

void StatusAggregator::setCondition(Api::PipelineRun& run, Api::ConditionStatus status, const std::string& reason,
                                    const std::string& message, Api::Timestamp now) {
    Api::StatusCondition condition;
    condition.status = status;
    condition.reason = reason;
    condition.message = message;
    if (run.status.condition && run.status.condition->sameState(condition)) {
        return;
    }
    condition.last_transition_time = now;
    run.status.condition = condition;
}

void StatusAggregator::markCompleted(Api::PipelineRun& run, Api::ConditionStatus status, const std::string& reason,
                                     const std::string& message, Api::Timestamp now) {
    setCondition(run, status, reason, message, now);
    if (!run.status.completion_time) {
        run.status.completion_time = now;
    }
}

std::vector<Api::PipelineRunResult> StatusAggregator::evaluateResults(const Api::PipelineSpec& spec,
                                                                      const ResolvedPipeline& pipeline) {
    std::vector<Api::PipelineRunResult> results;
    for (const auto& declared : spec.results) {
        Replacements replacements;
        bool resolvable = true;
        for (const auto& reference : Substitution::extractResultReferences(declared.value)) {
            const ResolvedNode* producer = pipeline.find(reference.task);
            if (!producer || !producer->task_run || !producer->task_run->isSuccessful()) {
                resolvable = false;
                break;
            }
            const auto& produced = producer->task_run->status.results;
            auto it = std::find_if(produced.begin(), produced.end(),
                                   [&reference](const Api::TaskRunResult& r) { return r.name == reference.result; });
            if (it == produced.end()) {
                resolvable = false;
                break;
            }
            replacements.strings[reference.key()] = it->value;
        }
        if (!resolvable) {
            LOG_DEBUG("aggregator", "Omitting pipeline result " + declared.name + ": unresolved reference");
            continue;
        }
        results.push_back(Api::PipelineRunResult{
            declared.name, Substitution::applyStringReplacements(declared.value, replacements.strings)});
    }
    return results;
}

void StatusAggregator::updateRunStatus(Api::PipelineRun& run, const ResolvedPipeline& pipeline,
                                       const PipelineGraph& graph, const Api::PipelineSpec& spec,
                                       Api::Timestamp now) const {
    for (const auto& node : pipeline.nodes) {
        bool has_child = node.task_run.has_value() ||
                         std::any_of(node.condition_checks.begin(), node.condition_checks.end(),
                                     [](const ConditionCheckPlan& plan) { return plan.check_run.has_value(); });
        if (!has_child) {
            continue;
        }

        auto& entry = run.status.task_runs[node.task_run_name];
        entry.pipeline_task_name = node.name();
        if (node.task_run) {
            entry.status = node.task_run->status;
        }
        for (const auto& plan : node.condition_checks) {
            if (plan.check_run) {
                entry.condition_checks[plan.check_name] =
                    Api::PipelineRunConditionCheckStatus{plan.register_name, plan.check_run->status};
            }
        }

        if (RunScheduler::hasFailedConditionCheck(node)) {
            Api::StatusCondition failed;
            failed.status = Api::ConditionStatus::FALSE;
            failed.reason = Reasons::CONDITION_CHECK_FAILED;
            failed.message = conditionCheckFailedMessage(node.task_run_name, run.metadata.name);
            if (entry.status && entry.status->condition && entry.status->condition->sameState(failed)) {
                continue;
            }
            failed.last_transition_time = now;
            Api::TaskRunStatus status;
            status.condition = failed;
            entry.status = status;
        }
    }

    auto failed = std::find_if(pipeline.nodes.begin(), pipeline.nodes.end(),
                               [](const ResolvedNode& node) { return RunScheduler::isFailure(node); });
    if (failed != pipeline.nodes.end()) {
        markCompleted(run, Api::ConditionStatus::FALSE, Reasons::FAILED,
                      "TaskRun " + failed->task_run_name + " has failed", now);
        return;
    }

    const std::set<std::string> skipped = RunScheduler::skippedNodes(pipeline, graph);
    size_t succeeded = 0;
    for (const auto& node : pipeline.nodes) {
        if (skipped.count(node.name()) == 0 && node.task_run && node.task_run->isSuccessful()) {
            ++succeeded;
        }
    }

    if (succeeded + skipped.size() == pipeline.nodes.size()) {
        run.status.pipeline_results = evaluateResults(spec, pipeline);
        std::string message = skipped.empty()
            ? std::string(MESSAGE_ALL_COMPLETED)
            : "Tasks Completed: " + std::to_string(succeeded) + ", Skipped: " + std::to_string(skipped.size());
        markCompleted(run, Api::ConditionStatus::TRUE, Reasons::SUCCEEDED, message, now);
        return;
    }

    setCondition(run, Api::ConditionStatus::UNKNOWN, Reasons::RUNNING, MESSAGE_RUNNING, now);
}

} // namespace PRR::Reconciler
