// EN: Implementation of the ThreadPool class.
// FR: Implémentation de la classe ThreadPool.

#include "infrastructure/threading/thread_pool.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>

namespace PRR {

ThreadPool::ThreadPool(const ThreadPoolConfig& config) : config_(config) {
    if (config_.threads == 0) {
        throw std::invalid_argument("ThreadPool needs at least one thread");
    }

    workers_.reserve(config_.threads);
    for (size_t i = 0; i < config_.threads; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, this);
    }

    LOG_DEBUG("threadpool", "Thread pool started with " + std::to_string(config_.threads) + " threads");
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::enqueue(detail::Task task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);

        if (shutdown_requested_) {
            throw std::runtime_error("ThreadPool is shutting down, cannot accept new tasks");
        }
        if (config_.max_queue_size > 0 && task_queue_.size() >= config_.max_queue_size) {
            throw std::runtime_error("Task queue is full, cannot accept new tasks");
        }

        task.sequence = next_sequence_++;
        task_queue_.push(std::move(task));
        peak_queue_size_ = std::max(peak_queue_size_, task_queue_.size());
    }
    queue_condition_.notify_one();
}

void ThreadPool::waitForAll() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_condition_.wait(lock, [this] {
        return task_queue_.empty() && active_threads_.load() == 0;
    });
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.exchange(true)) {
            return;
        }
    }

    queue_condition_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    LOG_DEBUG("threadpool", "Thread pool shutdown completed - Processed " +
              std::to_string(completed_tasks_.load()) + " tasks");
}

ThreadPoolStats ThreadPool::getStats() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);

    ThreadPoolStats stats;
    stats.total_threads = workers_.size();
    stats.active_threads = active_threads_.load();
    stats.queued_tasks = task_queue_.size();
    stats.completed_tasks = completed_tasks_.load();
    stats.failed_tasks = failed_tasks_.load();
    stats.peak_queue_size = peak_queue_size_;
    return stats;
}

// EN: Worker loop. Remaining tasks are drained before a worker exits on shutdown.
// FR: Boucle worker. Les tâches restantes sont vidées avant qu'un worker sorte à l'arrêt.
void ThreadPool::workerLoop() {
    while (true) {
        detail::Task task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_condition_.wait(lock, [this] {
                return !task_queue_.empty() || shutdown_requested_.load();
            });

            if (task_queue_.empty()) {
                break;
            }

            task = task_queue_.top();
            task_queue_.pop();
            active_threads_++;
        }

        try {
            task.function();
            completed_tasks_++;
        } catch (const std::exception& e) {
            failed_tasks_++;
            LOG_ERROR("threadpool", "Task " + task.name + " failed: " + std::string(e.what()));
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_threads_--;
        }
        idle_condition_.notify_all();
    }
}

} // namespace PRR
