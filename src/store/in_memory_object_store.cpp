// EN: In-memory object store implementation
// FR: Implémentation du store d'objets en mémoire

#include "store/in_memory_object_store.hpp"
#include "api/api_utils.hpp"
#include "infrastructure/logging/logger.hpp"

namespace PRR::Store {

std::string kindToString(ObjectKind kind) {
    switch (kind) {
        case ObjectKind::PIPELINE:                return "Pipeline";
        case ObjectKind::PIPELINE_RUN:            return "PipelineRun";
        case ObjectKind::TASK:                    return "Task";
        case ObjectKind::CLUSTER_TASK:            return "ClusterTask";
        case ObjectKind::CONDITION:               return "Condition";
        case ObjectKind::PIPELINE_RESOURCE:       return "PipelineResource";
        case ObjectKind::TASK_RUN:                return "TaskRun";
        case ObjectKind::PERSISTENT_VOLUME_CLAIM: return "PersistentVolumeClaim";
    }
    return "Unknown";
}

namespace {

template<typename Object>
Object lookup(const std::map<std::string, Object>& objects, ObjectKind kind,
              const std::string& ns, const std::string& name) {
    auto it = objects.find(Api::ApiUtils::objectKey(ns, name));
    if (it == objects.end()) {
        throw NotFoundError(kindToString(kind) + " \"" + ns + "/" + name + "\" not found");
    }
    return it->second;
}

template<typename Object>
void seedInto(std::map<std::string, Object>& objects, Object object, uint64_t version) {
    object.metadata.resource_version = version;
    std::string key = Api::ApiUtils::objectKey(object.metadata.namespace_name, object.metadata.name);
    objects[key] = std::move(object);
}

bool matchesSelector(const Api::ObjectMeta& metadata, const LabelSelector& selector) {
    for (const auto& [key, value] : selector) {
        auto it = metadata.labels.find(key);
        if (it == metadata.labels.end() || it->second != value) {
            return false;
        }
    }
    return true;
}

} // namespace

// ---------------------------------------------------------------------------
// EN: Seeding and snapshots
// FR: Amorçage et instantanés
// ---------------------------------------------------------------------------

void InMemoryObjectStore::seed(const Api::Pipeline& pipeline) {
    std::lock_guard<std::mutex> lock(mutex_);
    seedInto(pipelines_, pipeline, nextVersion());
}

void InMemoryObjectStore::seed(const Api::Task& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    seedInto(tasks_, task, nextVersion());
}

void InMemoryObjectStore::seedClusterTask(const Api::Task& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    Api::Task cluster_task = task;
    cluster_task.metadata.namespace_name.clear();
    seedInto(cluster_tasks_, cluster_task, nextVersion());
}

void InMemoryObjectStore::seed(const Api::Condition& condition) {
    std::lock_guard<std::mutex> lock(mutex_);
    seedInto(conditions_, condition, nextVersion());
}

void InMemoryObjectStore::seed(const Api::PipelineResource& resource) {
    std::lock_guard<std::mutex> lock(mutex_);
    seedInto(resources_, resource, nextVersion());
}

void InMemoryObjectStore::seed(const Api::PipelineRun& run) {
    std::lock_guard<std::mutex> lock(mutex_);
    seedInto(pipeline_runs_, run, nextVersion());
}

void InMemoryObjectStore::seed(const Api::TaskRun& task_run) {
    std::lock_guard<std::mutex> lock(mutex_);
    seedInto(task_runs_, task_run, nextVersion());
}

void InMemoryObjectStore::seed(const Api::PersistentVolumeClaim& claim) {
    std::lock_guard<std::mutex> lock(mutex_);
    seedInto(claims_, claim, nextVersion());
}

size_t InMemoryObjectStore::loadSnapshot(const nlohmann::json& snapshot) {
    const nlohmann::json& items = snapshot.is_object() && snapshot.contains("items") ? snapshot["items"] : snapshot;
    if (!items.is_array()) {
        throw std::invalid_argument("snapshot must be an array of objects or an object with \"items\"");
    }

    size_t loaded = 0;
    for (const auto& item : items) {
        const std::string kind = item.value("kind", "");
        if (kind == "Pipeline") {
            seed(Api::Pipeline::fromJson(item));
        } else if (kind == "Task") {
            seed(Api::Task::fromJson(item));
        } else if (kind == "ClusterTask") {
            seedClusterTask(Api::Task::fromJson(item));
        } else if (kind == "Condition") {
            seed(Api::Condition::fromJson(item));
        } else if (kind == "PipelineResource") {
            seed(Api::PipelineResource::fromJson(item));
        } else if (kind == "PipelineRun") {
            seed(Api::PipelineRun::fromJson(item));
        } else if (kind == "TaskRun") {
            seed(Api::TaskRun::fromJson(item));
        } else if (kind == "PersistentVolumeClaim") {
            seed(Api::PersistentVolumeClaim::fromJson(item));
        } else {
            LOG_WARN("store", "Skipping snapshot item with unsupported kind '" + kind + "'");
            continue;
        }
        ++loaded;
    }
    return loaded;
}

nlohmann::json InMemoryObjectStore::toSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json items = nlohmann::json::array();
    for (const auto& [key, run] : pipeline_runs_) items.push_back(run.toJson());
    for (const auto& [key, task_run] : task_runs_) items.push_back(task_run.toJson());
    for (const auto& [key, claim] : claims_) items.push_back(claim.toJson());
    return nlohmann::json{{"items", items}};
}

// ---------------------------------------------------------------------------
// EN: Reactors and action log
// FR: Reactors et journal d'actions
// ---------------------------------------------------------------------------

void InMemoryObjectStore::addReactor(const std::string& verb, ObjectKind kind, Reactor reactor) {
    std::lock_guard<std::mutex> lock(mutex_);
    reactors_.emplace_back(std::make_pair(verb, kind), std::move(reactor));
}

void InMemoryObjectStore::clearReactors() {
    std::lock_guard<std::mutex> lock(mutex_);
    reactors_.clear();
}

std::vector<StoreAction> InMemoryObjectStore::getActions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return actions_;
}

void InMemoryObjectStore::clearActions() {
    std::lock_guard<std::mutex> lock(mutex_);
    actions_.clear();
}

void InMemoryObjectStore::recordAction(const StoreAction& action) {
    actions_.push_back(action);
    for (const auto& [match, reactor] : reactors_) {
        if (match.first == action.verb && match.second == action.kind) {
            reactor(action);
        }
    }
}

// ---------------------------------------------------------------------------
// EN: Reads
// FR: Lectures
// ---------------------------------------------------------------------------

Api::Pipeline InMemoryObjectStore::getPipeline(const std::string& ns, const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(pipelines_, ObjectKind::PIPELINE, ns, name);
}

Api::Task InMemoryObjectStore::getTask(const std::string& ns, const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(tasks_, ObjectKind::TASK, ns, name);
}

Api::Task InMemoryObjectStore::getClusterTask(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(cluster_tasks_, ObjectKind::CLUSTER_TASK, "", name);
}

Api::Condition InMemoryObjectStore::getCondition(const std::string& ns, const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(conditions_, ObjectKind::CONDITION, ns, name);
}

Api::PipelineResource InMemoryObjectStore::getPipelineResource(const std::string& ns, const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(resources_, ObjectKind::PIPELINE_RESOURCE, ns, name);
}

Api::PipelineRun InMemoryObjectStore::getPipelineRun(const std::string& ns, const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(pipeline_runs_, ObjectKind::PIPELINE_RUN, ns, name);
}

std::vector<Api::PipelineRun> InMemoryObjectStore::listPipelineRuns(const std::string& ns) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Api::PipelineRun> result;
    for (const auto& [key, run] : pipeline_runs_) {
        if (run.metadata.namespace_name == ns) {
            result.push_back(run);
        }
    }
    return result;
}

Api::TaskRun InMemoryObjectStore::getTaskRun(const std::string& ns, const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(task_runs_, ObjectKind::TASK_RUN, ns, name);
}

std::vector<Api::TaskRun> InMemoryObjectStore::listTaskRuns(const std::string& ns, const LabelSelector& selector) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Api::TaskRun> result;
    for (const auto& [key, task_run] : task_runs_) {
        if (task_run.metadata.namespace_name == ns && matchesSelector(task_run.metadata, selector)) {
            result.push_back(task_run);
        }
    }
    return result;
}

Api::PersistentVolumeClaim InMemoryObjectStore::getPersistentVolumeClaim(const std::string& ns, const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(claims_, ObjectKind::PERSISTENT_VOLUME_CLAIM, ns, name);
}

// ---------------------------------------------------------------------------
// EN: Writes
// FR: Écritures
// ---------------------------------------------------------------------------

Api::PipelineRun InMemoryObjectStore::updatePipelineRun(const Api::PipelineRun& run) {
    StoreEvent event;
    Api::PipelineRun stored;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        recordAction({"update", ObjectKind::PIPELINE_RUN, run.metadata.namespace_name, run.metadata.name, ""});

        std::string key = Api::ApiUtils::objectKey(run.metadata.namespace_name, run.metadata.name);
        auto it = pipeline_runs_.find(key);
        if (it == pipeline_runs_.end()) {
            throw NotFoundError("PipelineRun \"" + key + "\" not found");
        }
        if (it->second.metadata.resource_version != run.metadata.resource_version) {
            throw ConflictError("PipelineRun \"" + key + "\" was modified (version " +
                                std::to_string(run.metadata.resource_version) + " is stale)");
        }

        stored = run;
        stored.metadata.resource_version = nextVersion();
        it->second = stored;
        event = {EventType::MODIFIED, ObjectKind::PIPELINE_RUN, stored.metadata.namespace_name,
                 stored.metadata.name, stored.metadata.labels};
    }
    notify(event);
    return stored;
}

Api::TaskRun InMemoryObjectStore::createTaskRun(const Api::TaskRun& task_run) {
    StoreEvent event;
    Api::TaskRun stored;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        recordAction({"create", ObjectKind::TASK_RUN, task_run.metadata.namespace_name, task_run.metadata.name, ""});

        std::string key = Api::ApiUtils::objectKey(task_run.metadata.namespace_name, task_run.metadata.name);
        if (task_runs_.count(key) > 0) {
            throw AlreadyExistsError("TaskRun \"" + key + "\" already exists");
        }

        stored = task_run;
        stored.metadata.resource_version = nextVersion();
        task_runs_[key] = stored;
        event = {EventType::ADDED, ObjectKind::TASK_RUN, stored.metadata.namespace_name,
                 stored.metadata.name, stored.metadata.labels};
    }
    notify(event);
    return stored;
}

Api::TaskRun InMemoryObjectStore::updateTaskRunStatus(const Api::TaskRun& task_run) {
    StoreEvent event;
    Api::TaskRun stored;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        recordAction({"update", ObjectKind::TASK_RUN, task_run.metadata.namespace_name, task_run.metadata.name, "status"});

        std::string key = Api::ApiUtils::objectKey(task_run.metadata.namespace_name, task_run.metadata.name);
        auto it = task_runs_.find(key);
        if (it == task_runs_.end()) {
            throw NotFoundError("TaskRun \"" + key + "\" not found");
        }
        if (it->second.metadata.resource_version != task_run.metadata.resource_version) {
            throw ConflictError("TaskRun \"" + key + "\" was modified (version " +
                                std::to_string(task_run.metadata.resource_version) + " is stale)");
        }

        it->second.status = task_run.status;
        it->second.metadata.resource_version = nextVersion();
        stored = it->second;
        event = {EventType::MODIFIED, ObjectKind::TASK_RUN, stored.metadata.namespace_name,
                 stored.metadata.name, stored.metadata.labels};
    }
    notify(event);
    return stored;
}

Api::TaskRun InMemoryObjectStore::cancelTaskRun(const std::string& ns, const std::string& name) {
    StoreEvent event;
    Api::TaskRun stored;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        recordAction({"patch", ObjectKind::TASK_RUN, ns, name, ""});

        std::string key = Api::ApiUtils::objectKey(ns, name);
        auto it = task_runs_.find(key);
        if (it == task_runs_.end()) {
            throw NotFoundError("TaskRun \"" + key + "\" not found");
        }

        it->second.spec.status = Api::TASK_RUN_SPEC_STATUS_CANCELLED;
        it->second.metadata.resource_version = nextVersion();
        stored = it->second;
        event = {EventType::MODIFIED, ObjectKind::TASK_RUN, ns, name, stored.metadata.labels};
    }
    notify(event);
    return stored;
}

Api::PersistentVolumeClaim InMemoryObjectStore::createPersistentVolumeClaim(const Api::PersistentVolumeClaim& claim) {
    StoreEvent event;
    Api::PersistentVolumeClaim stored;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        recordAction({"create", ObjectKind::PERSISTENT_VOLUME_CLAIM, claim.metadata.namespace_name, claim.metadata.name, ""});

        std::string key = Api::ApiUtils::objectKey(claim.metadata.namespace_name, claim.metadata.name);
        if (claims_.count(key) > 0) {
            throw AlreadyExistsError("PersistentVolumeClaim \"" + key + "\" already exists");
        }

        stored = claim;
        stored.metadata.resource_version = nextVersion();
        claims_[key] = stored;
        event = {EventType::ADDED, ObjectKind::PERSISTENT_VOLUME_CLAIM, stored.metadata.namespace_name,
                 stored.metadata.name, stored.metadata.labels};
    }
    notify(event);
    return stored;
}

// ---------------------------------------------------------------------------
// EN: Events
// FR: Événements
// ---------------------------------------------------------------------------

size_t InMemoryObjectStore::addEventHandler(EventHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    size_t id = next_handler_id_++;
    handlers_[id] = std::move(handler);
    return id;
}

void InMemoryObjectStore::removeEventHandler(size_t handler_id) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_.erase(handler_id);
}

void InMemoryObjectStore::notify(const StoreEvent& event) {
    std::vector<EventHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        for (const auto& [id, handler] : handlers_) {
            handlers.push_back(handler);
        }
    }
    for (const auto& handler : handlers) {
        handler(event);
    }
}

} // namespace PRR::Store
