// EN: Controller implementation
// FR: Implémentation du contrôleur

#include "reconciler/controller.hpp"
#include "api/api_utils.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <unordered_map>

namespace PRR::Reconciler {

Controller::Controller(Store::IObjectStore& store, detail::IKeyReconciler& reconciler,
                       const ReconcilerConfig& config)
    : store_(store), reconciler_(reconciler), config_(config) {}

Controller::~Controller() {
    stop();
}

void Controller::start() {
    ThreadPoolConfig pool_config;
    pool_config.threads = std::max<size_t>(config_.workers, 1);
    pool_config.max_queue_size = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return;
        }
        running_ = true;
        pool_ = std::make_unique<ThreadPool>(pool_config);
        dispatcher_ = std::thread(&Controller::dispatchLoop, this);
    }

    // EN: Registered outside the lock; the store may already be delivering events.
    // FR: Enregistré hors du verrou ; le store peut déjà livrer des événements.
    handler_id_ = store_.addEventHandler([this](const Store::StoreEvent& event) { onEvent(event); });

    LOG_INFO("controller", "Controller started with " + std::to_string(pool_config.threads) + " workers");
}

void Controller::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }

    if (handler_id_) {
        store_.removeEventHandler(*handler_id_);
        handler_id_.reset();
    }

    wake_condition_.notify_all();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
    if (pool_) {
        pool_->shutdown();
    }
    idle_condition_.notify_all();

    LOG_INFO("controller", "Controller stopped");
}

bool Controller::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

// ---------------------------------------------------------------------------
// EN: Queueing
// FR: Mise en file
// ---------------------------------------------------------------------------

void Controller::pushReadyLocked(const std::string& key) {
    if (processing_.count(key) > 0) {
        dirty_.insert(key);
        return;
    }
    if (queued_.insert(key).second) {
        ready_.push_back(key);
    }
}

void Controller::pushDelayedLocked(const std::string& key, std::chrono::steady_clock::time_point when) {
    auto it = deadlines_.find(key);
    if (it != deadlines_.end()) {
        if (it->second <= when) {
            return;
        }
        delayed_.erase(std::make_pair(it->second, key));
        it->second = when;
    } else {
        deadlines_.emplace(key, when);
    }
    delayed_.emplace(when, key);
}

void Controller::enqueue(const std::string& key) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pushReadyLocked(key);
    }
    wake_condition_.notify_one();
}

void Controller::enqueueAfter(const std::string& key, std::chrono::milliseconds delay) {
    if (delay.count() <= 0) {
        enqueue(key);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pushDelayedLocked(key, std::chrono::steady_clock::now() + delay);
    }
    wake_condition_.notify_one();
}

void Controller::onEvent(const Store::StoreEvent& event) {
    switch (event.kind) {
        case Store::ObjectKind::PIPELINE_RUN:
            enqueue(Api::ApiUtils::objectKey(event.namespace_name, event.name));
            break;
        case Store::ObjectKind::TASK_RUN: {
            auto owner = event.labels.find(Api::Labels::PIPELINE_RUN);
            if (owner != event.labels.end() && !owner->second.empty()) {
                enqueue(Api::ApiUtils::objectKey(event.namespace_name, owner->second));
            }
            break;
        }
        default:
            break;
    }
}

// ---------------------------------------------------------------------------
// EN: Dispatch and processing
// FR: Dispatch et traitement
// ---------------------------------------------------------------------------

void Controller::dispatchLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        auto now = std::chrono::steady_clock::now();
        while (!delayed_.empty() && delayed_.begin()->first <= now) {
            std::string key = delayed_.begin()->second;
            delayed_.erase(delayed_.begin());
            deadlines_.erase(key);
            pushReadyLocked(key);
        }

        while (!ready_.empty()) {
            std::string key = ready_.front();
            ready_.pop_front();
            queued_.erase(key);
            processing_.insert(key);
            pool_->submitNamed("reconcile " + key, TaskPriority::NORMAL, [this, key] { process(key); });
        }

        if (delayed_.empty()) {
            wake_condition_.wait(lock, [this] { return !running_ || !ready_.empty() || !delayed_.empty(); });
        } else {
            wake_condition_.wait_until(lock, delayed_.begin()->first);
        }
    }
}

void Controller::process(const std::string& key) {
    const std::unordered_map<std::string, std::string> meta = {{"key", key}};
    ReconcileResult result;
    try {
        result = reconciler_.reconcile(key);
    } catch (const std::exception& e) {
        LOG_ERROR_META("controller", std::string("Reconciler threw: ") + e.what(), meta);
        result = ReconcileResult::retry(e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.reconciles;

        if (result.isSuccess()) {
            ++stats_.successes;
            retries_.erase(key);
            if (result.requeue_after) {
                ++stats_.requeues;
                pushDelayedLocked(key, std::chrono::steady_clock::now() + *result.requeue_after);
            }
        } else {
            ++stats_.retries;
            auto it = retries_.find(key);
            if (it == retries_.end()) {
                it = retries_.emplace(key, RetryContext(key, config_.toRetryConfig())).first;
            }
            auto delay = it->second.recordAttempt(result.message);
            LOG_WARN_META("controller", "Requeue after " + ErrorRecoveryUtils::formatDelay(delay) + ": " +
                                        result.message, meta);
            pushDelayedLocked(key, std::chrono::steady_clock::now() + delay);
        }

        processing_.erase(key);
        if (dirty_.erase(key) > 0) {
            pushReadyLocked(key);
        }
    }

    wake_condition_.notify_one();
    idle_condition_.notify_all();
}

bool Controller::isIdleLocked(std::chrono::steady_clock::time_point now) const {
    bool due = !delayed_.empty() && delayed_.begin()->first <= now;
    return ready_.empty() && processing_.empty() && dirty_.empty() && !due;
}

bool Controller::waitForIdle(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(mutex_);
    while (!isIdleLocked(std::chrono::steady_clock::now())) {
        if (!running_) {
            return false;
        }
        // EN: Short slices so a delayed key falling due is noticed.
        // FR: Tranches courtes pour remarquer une clé différée devenue échue.
        auto slice = std::min(deadline, std::chrono::steady_clock::now() + std::chrono::milliseconds(10));
        idle_condition_.wait_until(lock, slice);
        if (std::chrono::steady_clock::now() >= deadline) {
            return isIdleLocked(std::chrono::steady_clock::now());
        }
    }
    return true;
}

ControllerStats Controller::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ControllerStats stats = stats_;
    stats.pending = ready_.size() + delayed_.size();
    return stats;
}

} // namespace PRR::Reconciler
