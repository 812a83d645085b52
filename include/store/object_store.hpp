// EN: Control-plane store interface - typed access to pipelines, runs and their children
// FR: Interface du store du plan de contrôle - accès typé aux pipelines, runs et à leurs enfants

#pragma once

#include "api/pipeline_types.hpp"

#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace PRR::Store {

// EN: Base class for every store failure; anything not more specific is transient.
// FR: Classe de base de tous les échecs du store ; tout ce qui n'est pas plus précis est transitoire.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

class NotFoundError : public StoreError {
public:
    explicit NotFoundError(const std::string& message) : StoreError(message) {}
};

class AlreadyExistsError : public StoreError {
public:
    explicit AlreadyExistsError(const std::string& message) : StoreError(message) {}
};

// EN: Raised when a write carries a resource version that is no longer current.
// FR: Levée quand une écriture porte une version de ressource qui n'est plus courante.
class ConflictError : public StoreError {
public:
    explicit ConflictError(const std::string& message) : StoreError(message) {}
};

enum class ObjectKind {
    PIPELINE,
    PIPELINE_RUN,
    TASK,
    CLUSTER_TASK,
    CONDITION,
    PIPELINE_RESOURCE,
    TASK_RUN,
    PERSISTENT_VOLUME_CLAIM
};

std::string kindToString(ObjectKind kind);

enum class EventType {
    ADDED,
    MODIFIED
};

// EN: Change notification emitted after a successful write.
// FR: Notification de changement émise après une écriture réussie.
struct StoreEvent {
    EventType type = EventType::ADDED;
    ObjectKind kind = ObjectKind::PIPELINE_RUN;
    std::string namespace_name;
    std::string name;
    std::map<std::string, std::string> labels;
};

using EventHandler = std::function<void(const StoreEvent&)>;

// EN: Equality-based label selector; every entry must match.
// FR: Sélecteur de labels par égalité ; chaque entrée doit correspondre.
using LabelSelector = std::map<std::string, std::string>;

// EN: Typed store used by the reconciler. Getters throw NotFoundError, writes throw
// EN: AlreadyExistsError or ConflictError, and any other failure is a StoreError.
// FR: Store typé utilisé par le réconciliateur. Les getters lèvent NotFoundError, les écritures
// FR: lèvent AlreadyExistsError ou ConflictError, et tout autre échec est une StoreError.
class IObjectStore {
public:
    virtual ~IObjectStore() = default;

    virtual Api::Pipeline getPipeline(const std::string& ns, const std::string& name) const = 0;
    virtual Api::Task getTask(const std::string& ns, const std::string& name) const = 0;
    virtual Api::Task getClusterTask(const std::string& name) const = 0;
    virtual Api::Condition getCondition(const std::string& ns, const std::string& name) const = 0;
    virtual Api::PipelineResource getPipelineResource(const std::string& ns, const std::string& name) const = 0;

    virtual Api::PipelineRun getPipelineRun(const std::string& ns, const std::string& name) const = 0;
    virtual std::vector<Api::PipelineRun> listPipelineRuns(const std::string& ns) const = 0;
    // EN: Full-object update (labels, annotations and status); the version must match.
    // FR: Mise à jour de l'objet complet (labels, annotations et statut) ; la version doit correspondre.
    virtual Api::PipelineRun updatePipelineRun(const Api::PipelineRun& run) = 0;

    virtual Api::TaskRun getTaskRun(const std::string& ns, const std::string& name) const = 0;
    virtual std::vector<Api::TaskRun> listTaskRuns(const std::string& ns, const LabelSelector& selector) const = 0;
    virtual Api::TaskRun createTaskRun(const Api::TaskRun& task_run) = 0;
    // EN: Status subresource update; the version must match.
    // FR: Mise à jour de la sous-ressource statut ; la version doit correspondre.
    virtual Api::TaskRun updateTaskRunStatus(const Api::TaskRun& task_run) = 0;
    // EN: Patch spec.status to "TaskRunCancelled" without a version check.
    // FR: Patch de spec.status à "TaskRunCancelled" sans vérification de version.
    virtual Api::TaskRun cancelTaskRun(const std::string& ns, const std::string& name) = 0;

    virtual Api::PersistentVolumeClaim getPersistentVolumeClaim(const std::string& ns, const std::string& name) const = 0;
    virtual Api::PersistentVolumeClaim createPersistentVolumeClaim(const Api::PersistentVolumeClaim& claim) = 0;

    // EN: Register a change handler; the returned id removes it again.
    // FR: Enregistre un handler de changement ; l'id retourné permet de le retirer.
    virtual size_t addEventHandler(EventHandler handler) = 0;
    virtual void removeEventHandler(size_t handler_id) = 0;
};

} // namespace PRR::Store
