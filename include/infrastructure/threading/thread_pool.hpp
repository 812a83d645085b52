// EN: Fixed-size worker pool with a priority queue, used to run reconcile passes for distinct runs
// FR: Pool de workers de taille fixe avec queue prioritaire, utilisé pour exécuter les passes de réconciliation

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace PRR {

// EN: Task priority levels for the thread pool queue.
// FR: Niveaux de priorité des tâches pour la queue du pool de threads.
enum class TaskPriority {
    LOW = 0,
    NORMAL = 1,
    HIGH = 2,
    URGENT = 3
};

// EN: Thread pool statistics for monitoring.
// FR: Statistiques du pool de threads pour le monitoring.
struct ThreadPoolStats {
    size_t total_threads = 0;
    size_t active_threads = 0;
    size_t queued_tasks = 0;
    size_t completed_tasks = 0;
    size_t failed_tasks = 0;
    size_t peak_queue_size = 0;
};

// EN: Configuration for thread pool behavior and limits.
// FR: Configuration pour le comportement et les limites du pool de threads.
struct ThreadPoolConfig {
    size_t threads = 4;            // EN: Number of workers / FR: Nombre de workers
    size_t max_queue_size = 1000;  // EN: 0 means unbounded / FR: 0 signifie illimitée
};

namespace detail {
    // EN: Internal task wrapper with priority and FIFO order inside one priority.
    // FR: Wrapper interne de tâche avec priorité et ordre FIFO au sein d'une priorité.
    struct Task {
        std::function<void()> function;
        TaskPriority priority = TaskPriority::NORMAL;
        uint64_t sequence = 0;
        std::string name;

        bool operator<(const Task& other) const {
            if (priority != other.priority) {
                return static_cast<int>(priority) < static_cast<int>(other.priority);
            }
            return sequence > other.sequence;
        }
    };
}

// EN: Thread pool with priority queue; exceptions from tasks are delivered through their futures.
// FR: Pool de threads avec queue prioritaire ; les exceptions des tâches passent par leurs futures.
class ThreadPool {
public:
    explicit ThreadPool(const ThreadPoolConfig& config = ThreadPoolConfig{});
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    // EN: Submit a named task with priority for better debugging.
    // FR: Soumet une tâche nommée avec priorité pour un meilleur débogage.
    template<typename F, typename... Args>
    auto submitNamed(const std::string& name, TaskPriority priority, F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    // EN: Wait for all currently queued tasks to complete.
    // FR: Attend que toutes les tâches actuellement en queue se terminent.
    void waitForAll();

    // EN: Drain the queue and join all workers. Idempotent.
    // FR: Vide la queue et joint tous les workers. Idempotent.
    void shutdown();

    bool isShutdown() const { return shutdown_requested_.load(); }

    ThreadPoolStats getStats() const;

private:
    void workerLoop();
    void enqueue(detail::Task task);

    ThreadPoolConfig config_;
    std::vector<std::thread> workers_;

    std::priority_queue<detail::Task> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_condition_;
    std::condition_variable idle_condition_;
    uint64_t next_sequence_ = 0;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<size_t> active_threads_{0};
    std::atomic<size_t> completed_tasks_{0};
    std::atomic<size_t> failed_tasks_{0};
    size_t peak_queue_size_ = 0;
};

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    return submitNamed("", TaskPriority::NORMAL, std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ThreadPool::submitNamed(const std::string& name, TaskPriority priority, F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );
    std::future<return_type> result = task->get_future();

    detail::Task wrapper;
    wrapper.function = [task]() { (*task)(); };
    wrapper.priority = priority;
    wrapper.name = name;
    enqueue(std::move(wrapper));

    return result;
}

} // namespace PRR
