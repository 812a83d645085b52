// EN: In-memory implementation of the control-plane store with an action log and failure injection
// FR: Implémentation en mémoire du store du plan de contrôle avec journal d'actions et injection d'échecs

#pragma once

#include "store/object_store.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace PRR::Store {

// EN: One mutating call recorded by the store ("create", "update", "patch").
// FR: Un appel mutateur enregistré par le store ("create", "update", "patch").
struct StoreAction {
    std::string verb;
    ObjectKind kind = ObjectKind::PIPELINE_RUN;
    std::string namespace_name;
    std::string name;
    std::string subresource;                    // EN: "status" for status updates / FR: "status" pour les mises à jour de statut
};

// EN: Hook run before a matching write; throwing from it fails the call.
// FR: Hook exécuté avant une écriture correspondante ; lever une exception fait échouer l'appel.
using Reactor = std::function<void(const StoreAction&)>;

class InMemoryObjectStore : public IObjectStore {
public:
    InMemoryObjectStore() = default;
    ~InMemoryObjectStore() override = default;

    InMemoryObjectStore(const InMemoryObjectStore&) = delete;
    InMemoryObjectStore& operator=(const InMemoryObjectStore&) = delete;

    // EN: Seeding bypasses reactors, the action log and events.
    // FR: L'amorçage contourne les reactors, le journal d'actions et les événements.
    void seed(const Api::Pipeline& pipeline);
    void seed(const Api::Task& task);
    void seedClusterTask(const Api::Task& task);
    void seed(const Api::Condition& condition);
    void seed(const Api::PipelineResource& resource);
    void seed(const Api::PipelineRun& run);
    void seed(const Api::TaskRun& task_run);
    void seed(const Api::PersistentVolumeClaim& claim);

    // EN: Load a snapshot: a JSON array (or {"items": [...]}) of objects tagged by "kind".
    // FR: Charge un instantané : un tableau JSON (ou {"items": [...]}) d'objets marqués par "kind".
    size_t loadSnapshot(const nlohmann::json& snapshot);
    nlohmann::json toSnapshot() const;

    void addReactor(const std::string& verb, ObjectKind kind, Reactor reactor);
    void clearReactors();

    std::vector<StoreAction> getActions() const;
    void clearActions();

    Api::Pipeline getPipeline(const std::string& ns, const std::string& name) const override;
    Api::Task getTask(const std::string& ns, const std::string& name) const override;
    Api::Task getClusterTask(const std::string& name) const override;
    Api::Condition getCondition(const std::string& ns, const std::string& name) const override;
    Api::PipelineResource getPipelineResource(const std::string& ns, const std::string& name) const override;

    Api::PipelineRun getPipelineRun(const std::string& ns, const std::string& name) const override;
    std::vector<Api::PipelineRun> listPipelineRuns(const std::string& ns) const override;
    Api::PipelineRun updatePipelineRun(const Api::PipelineRun& run) override;

    Api::TaskRun getTaskRun(const std::string& ns, const std::string& name) const override;
    std::vector<Api::TaskRun> listTaskRuns(const std::string& ns, const LabelSelector& selector) const override;
    Api::TaskRun createTaskRun(const Api::TaskRun& task_run) override;
    Api::TaskRun updateTaskRunStatus(const Api::TaskRun& task_run) override;
    Api::TaskRun cancelTaskRun(const std::string& ns, const std::string& name) override;

    Api::PersistentVolumeClaim getPersistentVolumeClaim(const std::string& ns, const std::string& name) const override;
    Api::PersistentVolumeClaim createPersistentVolumeClaim(const Api::PersistentVolumeClaim& claim) override;

    size_t addEventHandler(EventHandler handler) override;
    void removeEventHandler(size_t handler_id) override;

private:
    // EN: Record the action and run matching reactors. Called with mutex_ held.
    // FR: Enregistre l'action et exécute les reactors correspondants. Appelé avec mutex_ verrouillé.
    void recordAction(const StoreAction& action);
    void notify(const StoreEvent& event);

    uint64_t nextVersion() { return ++version_counter_; }

    mutable std::mutex mutex_;
    uint64_t version_counter_ = 0;

    std::map<std::string, Api::Pipeline> pipelines_;
    std::map<std::string, Api::Task> tasks_;
    std::map<std::string, Api::Task> cluster_tasks_;
    std::map<std::string, Api::Condition> conditions_;
    std::map<std::string, Api::PipelineResource> resources_;
    std::map<std::string, Api::PipelineRun> pipeline_runs_;
    std::map<std::string, Api::TaskRun> task_runs_;
    std::map<std::string, Api::PersistentVolumeClaim> claims_;

    std::vector<StoreAction> actions_;
    std::vector<std::pair<std::pair<std::string, ObjectKind>, Reactor>> reactors_;

    mutable std::mutex handlers_mutex_;
    std::map<size_t, EventHandler> handlers_;
    size_t next_handler_id_ = 1;
};

} // namespace PRR::Store
