// EN: Workspace and resource storage linking implementation
// FR: Implémentation de la liaison du stockage des workspaces et ressources

#include "reconciler/workspace_linker.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>

namespace PRR::Reconciler {

WorkspaceLinker::WorkspaceLinker(Store::IObjectStore& store, const ReconcilerConfig& config)
    : store_(store), config_(config) {}

std::string WorkspaceLinker::resourceClaimName(const std::string& run_name) {
    return run_name + "-pvc";
}

std::string WorkspaceLinker::templateClaimName(const Api::WorkspaceBinding& binding, const std::string& run_name) {
    std::string claim_name = "pvc";
    if (binding.volume_claim_template && !binding.volume_claim_template->metadata.name.empty()) {
        claim_name = binding.volume_claim_template->metadata.name;
    }
    return claim_name + "-" + binding.name + "-" + run_name;
}

namespace {

bool anyFrom(const std::vector<Api::PipelineTaskInputResource>& inputs) {
    return std::any_of(inputs.begin(), inputs.end(),
                       [](const Api::PipelineTaskInputResource& input) { return !input.from.empty(); });
}

// EN: Replace the paths of each bound input with the "from" locations of its declaration.
// FR: Remplace les chemins de chaque entrée liée par les emplacements "from" de sa déclaration.
void assignInputPaths(std::vector<Api::TaskResourceBinding>& bound,
                      const std::vector<Api::PipelineTaskInputResource>& declared) {
    for (auto& input : bound) {
        auto it = std::find_if(declared.begin(), declared.end(),
                               [&input](const Api::PipelineTaskInputResource& r) { return r.name == input.name; });
        if (it == declared.end()) {
            continue;
        }
        input.paths.clear();
        for (const auto& from : it->from) {
            input.paths.push_back("/pvc/" + from + "/" + input.name);
        }
    }
}

} // namespace

bool WorkspaceLinker::needsResourceClaim(const Api::PipelineSpec& spec) {
    return std::any_of(spec.tasks.begin(), spec.tasks.end(), [](const Api::PipelineTask& task) {
        return anyFrom(task.input_resources) ||
               std::any_of(task.conditions.begin(), task.conditions.end(),
                           [](const Api::PipelineTaskCondition& c) { return anyFrom(c.resources); });
    });
}

std::string WorkspaceLinker::joinSubPaths(const std::string& run_sub_path, const std::string& task_sub_path) {
    if (run_sub_path.empty()) {
        return task_sub_path;
    }
    if (task_sub_path.empty()) {
        return run_sub_path;
    }
    return run_sub_path + "/" + task_sub_path;
}

void WorkspaceLinker::assignResourcePaths(ResolvedPipeline& pipeline) {
    for (auto& node : pipeline.nodes) {
        for (auto& output : node.output_resources) {
            output.paths = {"/pvc/" + node.name() + "/" + output.name};
        }
        assignInputPaths(node.input_resources, node.task.input_resources);
        // EN: Plans follow the order of task.conditions.
        // FR: Les plans suivent l'ordre de task.conditions.
        for (size_t i = 0; i < node.condition_checks.size() && i < node.task.conditions.size(); ++i) {
            assignInputPaths(node.condition_checks[i].resources, node.task.conditions[i].resources);
        }
    }
}

Api::OwnerReference WorkspaceLinker::ownerReferenceTo(const Api::PipelineRun& run) {
    return Api::OwnerReference{Api::API_VERSION, Api::PIPELINE_RUN_KIND, run.metadata.name, true, true};
}

bool WorkspaceLinker::ensureClaim(const Api::PersistentVolumeClaim& claim) {
    bool exists = true;
    try {
        store_.getPersistentVolumeClaim(claim.metadata.namespace_name, claim.metadata.name);
    } catch (const Store::NotFoundError&) {
        exists = false;
    }
    if (exists) {
        return false;
    }

    try {
        store_.createPersistentVolumeClaim(claim);
    } catch (const Store::AlreadyExistsError&) {
        return false;
    }
    LOG_INFO("linker", "Created PersistentVolumeClaim " + claim.metadata.name);
    return true;
}

bool WorkspaceLinker::ensureResourceClaim(const Api::PipelineRun& run) {
    Api::PersistentVolumeClaim claim;
    claim.metadata.name = resourceClaimName(run.metadata.name);
    claim.metadata.namespace_name = run.metadata.namespace_name;
    claim.metadata.owner_references.push_back(ownerReferenceTo(run));
    claim.spec.access_modes = {config_.pvc_access_mode};
    claim.spec.storage = config_.pvc_storage_size;
    return ensureClaim(claim);
}

bool WorkspaceLinker::isWorkspaceUsed(const Api::PipelineSpec& spec, const std::string& workspace) {
    return std::any_of(spec.tasks.begin(), spec.tasks.end(), [&workspace](const Api::PipelineTask& task) {
        return std::any_of(task.workspaces.begin(), task.workspaces.end(),
                           [&workspace](const Api::WorkspacePipelineTaskBinding& w) { return w.workspace == workspace; });
    });
}

size_t WorkspaceLinker::ensureWorkspaceClaims(const Api::PipelineRun& run, const Api::PipelineSpec& spec) {
    size_t created = 0;
    for (const auto& binding : run.spec.workspaces) {
        if (!binding.volume_claim_template) {
            continue;
        }
        if (!isWorkspaceUsed(spec, binding.name)) {
            LOG_DEBUG("linker", "Workspace " + binding.name + " is not used by any task, no claim created");
            continue;
        }
        Api::PersistentVolumeClaim claim = *binding.volume_claim_template;
        claim.metadata.name = templateClaimName(binding, run.metadata.name);
        claim.metadata.namespace_name = run.metadata.namespace_name;
        claim.metadata.resource_version = 0;
        claim.metadata.owner_references = {ownerReferenceTo(run)};
        if (ensureClaim(claim)) {
            ++created;
        }
    }
    return created;
}

std::vector<Api::WorkspaceBinding> WorkspaceLinker::workspacesFor(const Api::PipelineRun& run,
                                                                  const Api::PipelineTask& task) const {
    std::vector<Api::WorkspaceBinding> result;
    for (const auto& task_workspace : task.workspaces) {
        auto bound = std::find_if(run.spec.workspaces.begin(), run.spec.workspaces.end(),
                                  [&task_workspace](const Api::WorkspaceBinding& b) {
                                      return b.name == task_workspace.workspace;
                                  });
        if (bound == run.spec.workspaces.end()) {
            // EN: Optional pipeline workspace left unbound.
            // FR: Workspace optionnel du pipeline laissé non lié.
            continue;
        }

        Api::WorkspaceBinding binding;
        binding.name = task_workspace.name;
        binding.sub_path = joinSubPaths(bound->sub_path, task_workspace.sub_path);
        if (bound->volume_claim_template) {
            binding.persistent_volume_claim = templateClaimName(*bound, run.metadata.name);
        } else {
            binding.persistent_volume_claim = bound->persistent_volume_claim;
            binding.empty_dir = bound->empty_dir;
        }
        result.push_back(std::move(binding));
    }
    return result;
}

} // namespace PRR::Reconciler
