// EN: PipelineRun reconciler implementation
// FR: Implémentation du réconciliateur PipelineRun

#include "reconciler/pipeline_run_reconciler.hpp"
#include "api/api_utils.hpp"
#include "infrastructure/logging/logger.hpp"
#include "reconciler/reconcile_errors.hpp"

#include <sstream>

namespace PRR::Reconciler {

PipelineRunReconciler::PipelineRunReconciler(Store::IObjectStore& store, ReconcilerConfig config,
                                             std::shared_ptr<detail::INameGenerator> names, Clock clock)
    : store_(store),
      config_(std::move(config)),
      names_(std::move(names)),
      clock_(std::move(clock)),
      resolver_(store, *names_),
      linker_(store, config_),
      scheduler_(store, linker_, config_),
      aggregator_(*names_) {}

ReconcileResult PipelineRunReconciler::reconcile(const std::string& key) {
    ScopedCorrelationId correlation(Logger::getInstance().generateCorrelationId());
    return reconcileKey(key);
}

ReconcileResult PipelineRunReconciler::reconcileKey(const std::string& key) {
    const std::unordered_map<std::string, std::string> meta = {{"key", key}};

    auto parts = Api::ApiUtils::splitObjectKey(key);
    if (!parts) {
        LOG_WARN_META("reconciler", "Ignoring malformed key", meta);
        return ReconcileResult::success();
    }

    Api::PipelineRun run;
    try {
        run = store_.getPipelineRun(parts->first, parts->second);
    } catch (const Store::NotFoundError&) {
        LOG_DEBUG_META("reconciler", "PipelineRun no longer exists", meta);
        return ReconcileResult::success();
    } catch (const Store::StoreError& e) {
        LOG_WARN_META("reconciler", std::string("Failed to read PipelineRun: ") + e.what(), meta);
        return ReconcileResult::retry(e.what());
    }

    const nlohmann::json original = run.toJson();
    const Api::Timestamp now = clock_();
    std::optional<std::string> failure;

    try {
        reconcileRun(run, now);
    } catch (const TerminalReconcileError& e) {
        LOG_WARN_META("reconciler", std::string(e.getReason()) + ": " + e.what(), meta);
        StatusAggregator::markCompleted(run, Api::ConditionStatus::FALSE, e.getReason(), e.what(), now);
    } catch (const Store::ConflictError& e) {
        LOG_INFO_META("reconciler", std::string("Conflict, will retry: ") + e.what(), meta);
        return ReconcileResult::retry(e.what());
    } catch (const ReconcileError& e) {
        failure = e.what();
    } catch (const Store::StoreError& e) {
        failure = e.what();
    } catch (const std::exception& e) {
        LOG_ERROR_META("reconciler", std::string("Unexpected error: ") + e.what(), meta);
        failure = e.what();
    }

    if (auto write_error = persist(run, original)) {
        return ReconcileResult::retry(failure ? *failure : *write_error);
    }
    if (failure) {
        LOG_WARN_META("reconciler", "Pass failed, will retry: " + *failure, meta);
        return ReconcileResult::retry(*failure);
    }

    if (run.isDone()) {
        return ReconcileResult::success();
    }
    return ReconcileResult::success(config_.resync_period);
}

// ---------------------------------------------------------------------------
// EN: One pass over a run
// FR: Une passe sur un run
// ---------------------------------------------------------------------------

void PipelineRunReconciler::reconcileRun(Api::PipelineRun& run, Api::Timestamp now) {
    if (!run.status.start_time) {
        run.status.start_time = now;
    }
    if (!run.status.condition) {
        StatusAggregator::setCondition(run, Api::ConditionStatus::UNKNOWN, Reasons::STARTED, "", now);
    }

    const auto children = listChildren(run);
    aggregator_.recoverOrphans(run, children);
    StatusAggregator::refreshStatuses(run, children);

    if (run.isDone()) {
        LOG_DEBUG("reconciler", "PipelineRun " + run.metadata.name + " is already done");
        return;
    }

    if (run.spec.cancelled) {
        cancelRun(run, children, now);
        return;
    }

    if (RunScheduler::isTimedOut(run, now, config_.default_timeout)) {
        timeoutRun(run, children, now);
        return;
    }

    const Api::PipelineSpec spec = resolvePipelineSpec(run);
    BindingResolver::validatePipelineSpec(spec);
    const PipelineGraph graph = PipelineGraph::build(spec);

    ResolvedPipeline pipeline = resolver_.resolve(run, spec, children);
    if (WorkspaceLinker::needsResourceClaim(spec)) {
        WorkspaceLinker::assignResourcePaths(pipeline);
    }

    ScheduleResult scheduled = scheduler_.schedule(run, pipeline, graph, spec, now);
    aggregator_.updateRunStatus(run, pipeline, graph, spec, now);

    if (!scheduled.empty()) {
        LOG_INFO("reconciler", "PipelineRun " + run.metadata.name + ": created " +
                               std::to_string(scheduled.created_task_runs.size()) + " TaskRun(s), " +
                               std::to_string(scheduled.created_condition_checks.size()) +
                               " condition check(s), retried " +
                               std::to_string(scheduled.retried_task_runs.size()));
    }
}

Api::PipelineSpec PipelineRunReconciler::resolvePipelineSpec(Api::PipelineRun& run) const {
    Api::PipelineSpec spec;
    std::string pipeline_name;

    if (run.spec.pipeline_spec) {
        spec = *run.spec.pipeline_spec;
        pipeline_name = run.metadata.name;
    } else if (run.spec.pipeline_ref && !run.spec.pipeline_ref->empty()) {
        try {
            Api::Pipeline pipeline = store_.getPipeline(run.metadata.namespace_name, *run.spec.pipeline_ref);
            spec = pipeline.spec;
            pipeline_name = pipeline.metadata.name;

            // EN: Pipeline labels and annotations propagate to the run, then to its children.
            // FR: Les labels et annotations du pipeline se propagent au run, puis à ses enfants.
            for (const auto& [key, value] : pipeline.metadata.labels) {
                run.metadata.labels[key] = value;
            }
            for (const auto& [key, value] : pipeline.metadata.annotations) {
                run.metadata.annotations[key] = value;
            }
        } catch (const Store::NotFoundError& e) {
            throw TerminalReconcileError(Reasons::COULDNT_GET_PIPELINE,
                                         "Error retrieving pipeline for pipelinerun " +
                                         Api::ApiUtils::objectKey(run.metadata.namespace_name, run.metadata.name) +
                                         ": " + e.what());
        }
    } else {
        throw TerminalReconcileError(Reasons::COULDNT_GET_PIPELINE,
                                     "PipelineRun " + run.metadata.name + " has neither pipelineRef nor pipelineSpec");
    }

    run.metadata.labels[Api::Labels::PIPELINE] = pipeline_name;
    if (!run.status.pipeline_spec) {
        run.status.pipeline_spec = spec;
    }
    return spec;
}

std::map<std::string, Api::TaskRun> PipelineRunReconciler::listChildren(const Api::PipelineRun& run) const {
    std::map<std::string, Api::TaskRun> children;
    for (auto& child : store_.listTaskRuns(run.metadata.namespace_name,
                                           {{Api::Labels::PIPELINE_RUN, run.metadata.name}})) {
        std::string name = child.metadata.name;
        children.emplace(std::move(name), std::move(child));
    }

    // EN: Recorded names are fetched directly; their labels may have been edited since.
    // FR: Les noms enregistrés sont lus directement ; leurs labels ont pu être modifiés depuis.
    auto fetchRecorded = [this, &run, &children](const std::string& name) {
        if (children.count(name) > 0) {
            return;
        }
        try {
            children.emplace(name, store_.getTaskRun(run.metadata.namespace_name, name));
        } catch (const Store::NotFoundError&) {
            LOG_DEBUG("reconciler", "Recorded TaskRun " + name + " does not exist yet");
        }
    };
    for (const auto& [name, entry] : run.status.task_runs) {
        fetchRecorded(name);
        for (const auto& check : entry.condition_checks) {
            fetchRecorded(check.first);
        }
    }
    return children;
}

// ---------------------------------------------------------------------------
// EN: Cancellation and timeout
// FR: Annulation et timeout
// ---------------------------------------------------------------------------

namespace {

std::string joinNames(const std::vector<std::string>& names) {
    std::ostringstream out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << names[i];
    }
    return out.str();
}

} // namespace

void PipelineRunReconciler::cancelRun(Api::PipelineRun& run, const std::map<std::string, Api::TaskRun>& children,
                                      Api::Timestamp now) {
    const auto failed = scheduler_.cancelInFlight(children);
    if (!failed.empty()) {
        std::string message = "PipelineRun \"" + run.metadata.name +
                              "\" was cancelled but had errors trying to cancel TaskRuns: " + joinNames(failed);
        StatusAggregator::setCondition(run, Api::ConditionStatus::UNKNOWN, Reasons::COULDNT_CANCEL, message, now);
        throw ReconcileError(message);
    }

    LOG_INFO("reconciler", "PipelineRun " + run.metadata.name + " cancelled");
    StatusAggregator::markCompleted(run, Api::ConditionStatus::FALSE, Reasons::CANCELLED,
                                    "PipelineRun \"" + run.metadata.name + "\" was cancelled", now);
}

void PipelineRunReconciler::timeoutRun(Api::PipelineRun& run, const std::map<std::string, Api::TaskRun>& children,
                                       Api::Timestamp now) {
    const auto failed = scheduler_.cancelInFlight(children);
    const std::string timeout =
        Api::ApiUtils::formatDuration(RunScheduler::effectiveRunTimeout(run, config_.default_timeout));
    if (!failed.empty()) {
        std::string message = "PipelineRun \"" + run.metadata.name + "\" timed out after " + timeout +
                              " but had errors trying to cancel TaskRuns: " + joinNames(failed);
        StatusAggregator::setCondition(run, Api::ConditionStatus::UNKNOWN, Reasons::COULDNT_CANCEL, message, now);
        throw ReconcileError(message);
    }

    LOG_INFO("reconciler", "PipelineRun " + run.metadata.name + " timed out after " + timeout);
    StatusAggregator::markCompleted(run, Api::ConditionStatus::FALSE, Reasons::TIMED_OUT,
                                    "PipelineRun \"" + run.metadata.name + "\" failed to finish within \"" +
                                    timeout + "\"", now);
}

std::optional<std::string> PipelineRunReconciler::persist(const Api::PipelineRun& run,
                                                          const nlohmann::json& original) {
    if (run.toJson() == original) {
        return std::nullopt;
    }
    try {
        store_.updatePipelineRun(run);
        return std::nullopt;
    } catch (const Store::StoreError& e) {
        LOG_WARN("reconciler", "Failed to update PipelineRun " + run.metadata.name + ": " + e.what());
        return std::string(e.what());
    }
}

} // namespace PRR::Reconciler
