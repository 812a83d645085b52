// EN: Controller - work queue that feeds run keys to the reconciler on a worker pool
// FR: Contrôleur - file de travail qui fournit les clés de run au réconciliateur sur un pool de workers

#pragma once

#include "infrastructure/system/error_recovery.hpp"
#include "infrastructure/threading/thread_pool.hpp"
#include "reconciler/pipeline_run_reconciler.hpp"
#include "reconciler/reconciler_config.hpp"
#include "store/object_store.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>

namespace PRR::Reconciler {

struct ControllerStats {
    size_t reconciles = 0;
    size_t successes = 0;
    size_t retries = 0;            // EN: Passes that ended in RETRYABLE_ERROR / FR: Passes terminées en RETRYABLE_ERROR
    size_t requeues = 0;           // EN: Successful passes that asked to come back / FR: Passes réussies demandant un retour
    size_t pending = 0;            // EN: Keys ready or delayed / FR: Clés prêtes ou différées
};

// EN: A key is never reconciled by two workers at once. A key enqueued while it is being processed
// EN: is marked dirty and runs again right after. Retryable errors back off per key.
// FR: Une clé n'est jamais réconciliée par deux workers à la fois. Une clé mise en file pendant son
// FR: traitement est marquée sale et repasse juste après. Les erreurs récupérables reculent par clé.
class Controller {
public:
    Controller(Store::IObjectStore& store, detail::IKeyReconciler& reconciler, const ReconcilerConfig& config);
    ~Controller();

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    // EN: Subscribe to store events and start the dispatcher and workers.
    // FR: S'abonne aux événements du store et démarre le dispatcher et les workers.
    void start();

    // EN: Unsubscribe, stop dispatching and let in-flight passes finish. Idempotent.
    // FR: Se désabonne, arrête le dispatch et laisse finir les passes en cours. Idempotent.
    void stop();

    void enqueue(const std::string& key);
    void enqueueAfter(const std::string& key, std::chrono::milliseconds delay);

    // EN: Block until nothing is ready, due or processing. Delayed keys not yet due do not count.
    // FR: Bloque jusqu'à ce que rien ne soit prêt, échu ou en traitement. Les clés différées non échues ne comptent pas.
    bool waitForIdle(std::chrono::milliseconds timeout);

    bool isRunning() const;
    ControllerStats getStats() const;

private:
    void onEvent(const Store::StoreEvent& event);
    void dispatchLoop();
    void process(const std::string& key);

    void pushReadyLocked(const std::string& key);
    void pushDelayedLocked(const std::string& key, std::chrono::steady_clock::time_point when);
    bool isIdleLocked(std::chrono::steady_clock::time_point now) const;

    Store::IObjectStore& store_;
    detail::IKeyReconciler& reconciler_;
    ReconcilerConfig config_;

    std::unique_ptr<ThreadPool> pool_;
    std::thread dispatcher_;
    std::optional<size_t> handler_id_;

    mutable std::mutex mutex_;
    std::condition_variable wake_condition_;
    std::condition_variable idle_condition_;
    bool running_ = false;

    std::deque<std::string> ready_;
    std::set<std::string> queued_;
    std::set<std::string> processing_;
    std::set<std::string> dirty_;
    // EN: One deadline per key, the earliest wins; delayed_ orders them by time.
    // FR: Une échéance par clé, la plus proche l'emporte ; delayed_ les trie par date.
    std::map<std::string, std::chrono::steady_clock::time_point> deadlines_;
    std::set<std::pair<std::chrono::steady_clock::time_point, std::string>> delayed_;
    std::map<std::string, RetryContext> retries_;

    ControllerStats stats_;
};

} // namespace PRR::Reconciler
