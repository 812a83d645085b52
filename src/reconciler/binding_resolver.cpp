// EN: Binding resolution implementation
// FR: Implémentation de la résolution des liaisons

#include "reconciler/binding_resolver.hpp"
#include "api/api_utils.hpp"
#include "infrastructure/logging/logger.hpp"
#include "reconciler/reconcile_errors.hpp"
#include "reconciler/substitution.hpp"

#include <algorithm>
#include <set>

namespace PRR::Reconciler {

namespace {

std::string joinNames(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        joined += (joined.empty() ? "" : ", ") + name;
    }
    return "[" + joined + "]";
}

template<typename Items>
bool hasNamed(const Items& items, const std::string& name) {
    return std::any_of(items.begin(), items.end(), [&name](const auto& item) { return item.name == name; });
}

Api::TaskResourceBinding toTaskBinding(const std::string& task_resource_name,
                                       const Api::PipelineResourceBinding& bound) {
    Api::TaskResourceBinding binding;
    binding.name = task_resource_name;
    binding.resource_ref = bound.resource_ref;
    binding.resource_spec = bound.resource_spec;
    return binding;
}

std::map<std::string, Api::PipelineResourceBinding> bindingsByName(const Api::PipelineRun& run) {
    std::map<std::string, Api::PipelineResourceBinding> result;
    for (const auto& binding : run.spec.resources) {
        result[binding.name] = binding;
    }
    return result;
}

} // namespace

ResolvedNode* ResolvedPipeline::find(const std::string& name) {
    for (auto& node : nodes) {
        if (node.name() == name) {
            return &node;
        }
    }
    return nullptr;
}

const ResolvedNode* ResolvedPipeline::find(const std::string& name) const {
    for (const auto& node : nodes) {
        if (node.name() == name) {
            return &node;
        }
    }
    return nullptr;
}

BindingResolver::BindingResolver(const Store::IObjectStore& store, detail::INameGenerator& names)
    : store_(store), names_(names) {}

// ---------------------------------------------------------------------------
// EN: Pipeline validation
// FR: Validation du pipeline
// ---------------------------------------------------------------------------

void BindingResolver::validatePipelineSpec(const Api::PipelineSpec& spec) {
    auto fail = [](const std::string& message) {
        throw TerminalReconcileError(Reasons::FAILED_VALIDATION, message);
    };

    if (spec.tasks.empty()) {
        fail("pipeline must declare at least one task");
    }

    std::set<std::string> task_names;
    for (const auto& task : spec.tasks) {
        if (!Api::ApiUtils::isValidDnsLabel(task.name)) {
            fail("invalid pipeline task name \"" + task.name + "\": must be a lowercase DNS label");
        }
        if (!task_names.insert(task.name).second) {
            fail("pipeline task name \"" + task.name + "\" is used more than once");
        }
    }

    std::set<std::string> resource_names;
    for (const auto& resource : spec.resources) {
        if (!resource_names.insert(resource.name).second) {
            fail("pipeline resource \"" + resource.name + "\" is declared more than once");
        }
    }
    std::set<std::string> workspace_names;
    for (const auto& workspace : spec.workspaces) {
        if (!workspace_names.insert(workspace.name).second) {
            fail("pipeline workspace \"" + workspace.name + "\" is declared more than once");
        }
    }

    auto checkInputs = [&](const Api::PipelineTask& task, const std::vector<Api::PipelineTaskInputResource>& inputs) {
        for (const auto& input : inputs) {
            if (resource_names.count(input.resource) == 0) {
                fail("pipeline task \"" + task.name + "\" uses undeclared resource \"" + input.resource + "\"");
            }
            for (const auto& from : input.from) {
                if (task_names.count(from) == 0) {
                    fail("pipeline task \"" + task.name + "\" takes resource \"" + input.name +
                         "\" from unknown task \"" + from + "\"");
                }
            }
        }
    };

    for (const auto& task : spec.tasks) {
        for (const auto& dependency : task.run_after) {
            if (task_names.count(dependency) == 0) {
                fail("pipeline task \"" + task.name + "\" runs after unknown task \"" + dependency + "\"");
            }
        }
        checkInputs(task, task.input_resources);
        for (const auto& output : task.output_resources) {
            if (resource_names.count(output.resource) == 0) {
                fail("pipeline task \"" + task.name + "\" uses undeclared resource \"" + output.resource + "\"");
            }
        }
        for (const auto& workspace : task.workspaces) {
            if (workspace_names.count(workspace.workspace) == 0) {
                fail("pipeline task \"" + task.name + "\" uses undeclared workspace \"" + workspace.workspace + "\"");
            }
        }
        for (const auto& condition : task.conditions) {
            if (condition.condition_ref.empty()) {
                fail("pipeline task \"" + task.name + "\" has a condition without conditionRef");
            }
            checkInputs(task, condition.resources);
        }
        for (const auto& param : task.params) {
            for (const auto& reference : Substitution::extractResultReferences(param.value)) {
                if (task_names.count(reference.task) == 0) {
                    fail("pipeline task \"" + task.name + "\" references result of unknown task \"" +
                         reference.task + "\"");
                }
            }
        }
    }
}

// ---------------------------------------------------------------------------
// EN: Run binding checks, in the order their reasons take precedence
// FR: Vérifications des liaisons du run, dans l'ordre de priorité des raisons
// ---------------------------------------------------------------------------

void BindingResolver::checkResourceBindings(const Api::PipelineRun& run, const Api::PipelineSpec& spec) {
    std::vector<std::string> missing;
    for (const auto& declared : spec.resources) {
        if (!declared.optional && !hasNamed(run.spec.resources, declared.name)) {
            missing.push_back(declared.name);
        }
    }
    if (!missing.empty()) {
        throw TerminalReconcileError(Reasons::INVALID_BINDINGS,
                                     "PipelineRun " + run.metadata.name + " is missing resource bindings " +
                                     joinNames(missing) + " declared by its pipeline");
    }

    std::vector<std::string> extra;
    for (const auto& binding : run.spec.resources) {
        if (!hasNamed(spec.resources, binding.name)) {
            extra.push_back(binding.name);
        }
        if (!binding.resource_ref && !binding.resource_spec) {
            throw TerminalReconcileError(Reasons::INVALID_BINDINGS,
                                         "resource binding \"" + binding.name +
                                         "\" needs either resourceRef or resourceSpec");
        }
    }
    if (!extra.empty()) {
        throw TerminalReconcileError(Reasons::INVALID_BINDINGS,
                                     "PipelineRun " + run.metadata.name + " binds resources " +
                                     joinNames(extra) + " that its pipeline does not declare");
    }
}

void BindingResolver::checkParameterTypes(const Api::PipelineRun& run, const Api::PipelineSpec& spec) {
    std::vector<std::string> mismatched;
    for (const auto& param : run.spec.params) {
        auto declared = std::find_if(spec.params.begin(), spec.params.end(),
                                     [&param](const Api::ParamSpec& p) { return p.name == param.name; });
        if (declared != spec.params.end() && declared->type != param.value.type) {
            mismatched.push_back(param.name);
        }
    }
    if (!mismatched.empty()) {
        throw TerminalReconcileError(Reasons::PARAMETER_TYPE_MISMATCH,
                                     "PipelineRun " + run.metadata.name +
                                     " parameters have mismatching types with its pipeline: " +
                                     joinNames(mismatched));
    }
}

void BindingResolver::checkRequiredParameters(const Api::PipelineRun& run, const Api::PipelineSpec& spec) {
    std::vector<std::string> missing;
    for (const auto& declared : spec.params) {
        if (!declared.default_value && !hasNamed(run.spec.params, declared.name)) {
            missing.push_back(declared.name);
        }
    }
    if (!missing.empty()) {
        throw TerminalReconcileError(Reasons::FAILED_VALIDATION,
                                     "PipelineRun " + run.metadata.name + " is missing parameters " +
                                     joinNames(missing));
    }
}

void BindingResolver::checkWorkspaceBindings(const Api::PipelineRun& run, const Api::PipelineSpec& spec) {
    for (const auto& binding : run.spec.workspaces) {
        int sources = (binding.persistent_volume_claim ? 1 : 0) + (binding.volume_claim_template ? 1 : 0) +
                      (binding.empty_dir ? 1 : 0);
        if (sources != 1) {
            throw TerminalReconcileError(Reasons::INVALID_WORKSPACE_BINDINGS,
                                         "workspace binding \"" + binding.name +
                                         "\" must name exactly one volume source");
        }
    }
    for (const auto& declared : spec.workspaces) {
        if (!declared.optional && !hasNamed(run.spec.workspaces, declared.name)) {
            throw TerminalReconcileError(Reasons::INVALID_WORKSPACE_BINDINGS,
                                         "pipeline requires workspace \"" + declared.name +
                                         "\" to be provided by the PipelineRun");
        }
    }
}

void BindingResolver::checkBoundResources(const Api::PipelineRun& run) const {
    for (const auto& binding : run.spec.resources) {
        if (!binding.resource_ref) {
            continue;
        }
        try {
            store_.getPipelineResource(run.metadata.namespace_name, *binding.resource_ref);
        } catch (const Store::NotFoundError& e) {
            throw TerminalReconcileError(Reasons::COULDNT_GET_RESOURCE,
                                         "PipelineRun " + run.metadata.name + " can't be run because it binds " +
                                         "resource \"" + *binding.resource_ref + "\" which doesn't exist: " + e.what());
        }
    }
}

// ---------------------------------------------------------------------------
// EN: Per-task resolution
// FR: Résolution par tâche
// ---------------------------------------------------------------------------

void BindingResolver::resolveTaskReference(const Api::PipelineRun& run, ResolvedNode& node) const {
    const std::string& ns = run.metadata.namespace_name;
    std::visit([&](const auto& reference) {
        using T = std::decay_t<decltype(reference)>;
        try {
            if constexpr (std::is_same_v<T, Api::NamespacedTaskRef>) {
                node.task_spec = store_.getTask(ns, reference.name).spec;
                node.task_ref = Api::TaskRef{reference.name, Api::TaskKind::NAMESPACED};
            } else if constexpr (std::is_same_v<T, Api::ClusterTaskRef>) {
                node.task_spec = store_.getClusterTask(reference.name).spec;
                node.task_ref = Api::TaskRef{reference.name, Api::TaskKind::CLUSTER};
            } else {
                node.task_spec = reference;
            }
        } catch (const Store::NotFoundError& e) {
            throw TerminalReconcileError(Reasons::COULDNT_GET_TASK,
                                         "Pipeline task \"" + node.name() + "\" of PipelineRun " +
                                         run.metadata.name + " can't be resolved: " + e.what());
        }
    }, node.task.task_ref);
}

ConditionCheckPlan BindingResolver::resolveCondition(const Api::PipelineRun& run,
                                                     const Api::PipelineTaskCondition& condition,
                                                     size_t index) const {
    ConditionCheckPlan plan;
    plan.register_name = condition.condition_ref + "-" + std::to_string(index);
    try {
        plan.condition = store_.getCondition(run.metadata.namespace_name, condition.condition_ref);
    } catch (const Store::NotFoundError& e) {
        throw TerminalReconcileError(Reasons::COULDNT_GET_CONDITION,
                                     "PipelineRun " + run.metadata.name + " can't get condition \"" +
                                     condition.condition_ref + "\": " + e.what());
    }
    plan.params = condition.params;
    return plan;
}

void BindingResolver::checkTaskRequirements(const ResolvedNode& node) {
    auto fail = [&node](const std::string& what) {
        throw TerminalReconcileError(Reasons::FAILED_VALIDATION,
                                     "pipeline task \"" + node.name() + "\" " + what);
    };

    for (const auto& declared : node.task_spec.params) {
        if (!declared.default_value && !hasNamed(node.task.params, declared.name)) {
            fail("does not provide parameter \"" + declared.name + "\" required by its task");
        }
    }
    for (const auto& declared : node.task_spec.input_resources) {
        if (!declared.optional && !hasNamed(node.input_resources, declared.name)) {
            fail("does not provide input resource \"" + declared.name + "\" required by its task");
        }
    }
    for (const auto& declared : node.task_spec.output_resources) {
        if (!declared.optional && !hasNamed(node.output_resources, declared.name)) {
            fail("does not provide output resource \"" + declared.name + "\" required by its task");
        }
    }
    for (const auto& plan : node.condition_checks) {
        for (const auto& declared : plan.condition.spec.params) {
            if (!declared.default_value && !hasNamed(plan.params, declared.name)) {
                fail("does not provide parameter \"" + declared.name + "\" required by condition \"" +
                     plan.condition.metadata.name + "\"");
            }
        }
    }
}

ResolvedPipeline BindingResolver::resolve(const Api::PipelineRun& run, const Api::PipelineSpec& spec,
                                          const std::map<std::string, Api::TaskRun>& live_task_runs) const {
    checkResourceBindings(run, spec);
    checkParameterTypes(run, spec);
    checkRequiredParameters(run, spec);
    checkWorkspaceBindings(run, spec);
    checkBoundResources(run);

    const Replacements replacements = Substitution::paramReplacements(spec.params, run.spec.params);
    const auto bound = bindingsByName(run);

    auto bindInputs = [&bound](const std::vector<Api::PipelineTaskInputResource>& inputs) {
        std::vector<Api::TaskResourceBinding> result;
        for (const auto& input : inputs) {
            auto it = bound.find(input.resource);
            if (it != bound.end()) {
                result.push_back(toTaskBinding(input.name, it->second));
            }
        }
        return result;
    };

    ResolvedPipeline pipeline;
    for (const auto& pipeline_task : spec.tasks) {
        ResolvedNode node;
        node.task = pipeline_task;
        node.task.params = Substitution::applyToParams(pipeline_task.params, replacements);

        resolveTaskReference(run, node);

        node.input_resources = bindInputs(pipeline_task.input_resources);
        for (const auto& output : pipeline_task.output_resources) {
            auto it = bound.find(output.resource);
            if (it != bound.end()) {
                node.output_resources.push_back(toTaskBinding(output.name, it->second));
            }
        }

        for (size_t i = 0; i < pipeline_task.conditions.size(); ++i) {
            const auto& condition = pipeline_task.conditions[i];
            ConditionCheckPlan plan = resolveCondition(run, condition, i);
            plan.params = Substitution::applyToParams(condition.params, replacements);
            plan.resources = bindInputs(condition.resources);
            node.condition_checks.push_back(std::move(plan));
        }

        checkTaskRequirements(node);

        // EN: Names recorded in the status map always win over fresh ones.
        // FR: Les noms enregistrés dans la table de statut priment toujours sur les nouveaux.
        const Api::PipelineRunTaskRunStatus* entry = nullptr;
        for (const auto& [name, status] : run.status.task_runs) {
            if (status.pipeline_task_name == node.name()) {
                node.task_run_name = name;
                entry = &status;
                break;
            }
        }
        if (node.task_run_name.empty()) {
            node.task_run_name = names_.generate(run.metadata.name + "-" + node.name());
        }
        auto live = live_task_runs.find(node.task_run_name);
        if (live != live_task_runs.end()) {
            node.task_run = live->second;
        }

        for (auto& plan : node.condition_checks) {
            if (entry) {
                for (const auto& [check_name, check_status] : entry->condition_checks) {
                    if (check_status.condition_name == plan.register_name) {
                        plan.check_name = check_name;
                        break;
                    }
                }
            }
            if (plan.check_name.empty()) {
                plan.check_name = names_.generate(node.task_run_name + "-" + plan.register_name);
            }
            auto check = live_task_runs.find(plan.check_name);
            if (check != live_task_runs.end()) {
                plan.check_run = check->second;
            }
        }

        pipeline.nodes.push_back(std::move(node));
    }

    LOG_DEBUG("resolver", "Resolved " + std::to_string(pipeline.nodes.size()) + " pipeline tasks for " +
              run.metadata.name);
    return pipeline;
}

bool BindingResolver::applyTaskResults(ResolvedNode& node, const ResolvedPipeline& pipeline) {
    std::vector<ResultReference> references;
    auto collect = [&references](const std::vector<Api::Param>& params) {
        for (const auto& param : params) {
            for (const auto& reference : Substitution::extractResultReferences(param.value)) {
                references.push_back(reference);
            }
        }
    };
    collect(node.task.params);
    for (const auto& plan : node.condition_checks) {
        collect(plan.params);
    }
    if (references.empty()) {
        return true;
    }

    Replacements replacements;
    for (const auto& reference : references) {
        const ResolvedNode* producer = pipeline.find(reference.task);
        if (!producer || !producer->task_run || !producer->task_run->isSuccessful()) {
            return false;
        }
        const auto& results = producer->task_run->status.results;
        auto it = std::find_if(results.begin(), results.end(),
                               [&reference](const Api::TaskRunResult& r) { return r.name == reference.result; });
        if (it == results.end()) {
            throw TerminalReconcileError(Reasons::INVALID_TASK_RESULT_REFERENCE,
                                         "Could not find result with name " + reference.result +
                                         " for task " + reference.task);
        }
        replacements.strings[reference.key()] = it->value;
    }

    node.task.params = Substitution::applyToParams(node.task.params, replacements);
    for (auto& plan : node.condition_checks) {
        plan.params = Substitution::applyToParams(plan.params, replacements);
    }
    return true;
}

} // namespace PRR::Reconciler
