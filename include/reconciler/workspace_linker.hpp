// EN: Shared storage linking - resource-passing volume claim and workspace claim templates
// FR: Liaison du stockage partagé - claim de volume pour le passage de ressources et modèles de claims de workspace

#pragma once

#include "api/pipeline_types.hpp"
#include "reconciler/binding_resolver.hpp"
#include "reconciler/reconciler_config.hpp"
#include "store/object_store.hpp"

#include <string>
#include <vector>

namespace PRR::Reconciler {

class WorkspaceLinker {
public:
    WorkspaceLinker(Store::IObjectStore& store, const ReconcilerConfig& config);

    // EN: "<run>-pvc", the claim through which "from" resources travel between tasks.
    // FR: "<run>-pvc", le claim par lequel les ressources "from" circulent entre tâches.
    static std::string resourceClaimName(const std::string& run_name);

    // EN: "<template name>-<workspace>-<run>" for a volumeClaimTemplate binding.
    // FR: "<nom du modèle>-<workspace>-<run>" pour une liaison volumeClaimTemplate.
    static std::string templateClaimName(const Api::WorkspaceBinding& binding, const std::string& run_name);

    // EN: True when some task or condition input uses "from", so the resource claim is needed.
    // FR: Vrai quand une entrée de tâche ou de condition utilise "from", donc le claim de ressources est nécessaire.
    static bool needsResourceClaim(const Api::PipelineSpec& spec);

    // EN: Join sub-paths with "/", omitting empty segments.
    // FR: Joint les sous-chemins avec "/", en omettant les segments vides.
    static std::string joinSubPaths(const std::string& run_sub_path, const std::string& task_sub_path);

    // EN: Set /pvc/<task>/<output> on outputs and /pvc/<from task>/<input> on "from" inputs,
    //     condition check inputs included.
    // FR: Pose /pvc/<tâche>/<sortie> sur les sorties et /pvc/<tâche from>/<entrée> sur les entrées "from",
    //     entrées des condition checks comprises.
    static void assignResourcePaths(ResolvedPipeline& pipeline);

    // EN: Create the resource claim when absent. Returns true if this call created it.
    // FR: Crée le claim de ressources s'il est absent. Retourne true si cet appel l'a créé.
    bool ensureResourceClaim(const Api::PipelineRun& run);

    // EN: True when some pipeline task binds the named pipeline workspace.
    // FR: Vrai quand une tâche du pipeline lie le workspace nommé.
    static bool isWorkspaceUsed(const Api::PipelineSpec& spec, const std::string& workspace);

    // EN: Create one claim per volumeClaimTemplate binding that a task uses, when absent.
    //     Returns the number created.
    // FR: Crée un claim par liaison volumeClaimTemplate utilisée par une tâche, s'il est absent.
    //     Retourne le nombre créé.
    size_t ensureWorkspaceClaims(const Api::PipelineRun& run, const Api::PipelineSpec& spec);

    // EN: Task-run workspace bindings for one pipeline task; templates become persistentVolumeClaim.
    // FR: Liaisons de workspace du task-run pour une tâche ; les modèles deviennent persistentVolumeClaim.
    std::vector<Api::WorkspaceBinding> workspacesFor(const Api::PipelineRun& run,
                                                     const Api::PipelineTask& task) const;

private:
    bool ensureClaim(const Api::PersistentVolumeClaim& claim);
    static Api::OwnerReference ownerReferenceTo(const Api::PipelineRun& run);

    Store::IObjectStore& store_;
    const ReconcilerConfig& config_;
};

} // namespace PRR::Reconciler
