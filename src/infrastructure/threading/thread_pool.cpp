// EN: Implementation of the ThreadPool class.
// FR: Implémentation de la classe ThreadPool.

#include "infrastructure/threading/thread_pool.hpp"
#include "infrastructure/logging/logger.hpp"

namespace CSVS {

size_t ThreadPoolConfig::effectiveThreadCount() const {
    if (thread_count > 0) {
        return thread_count;
    }
    size_t hardware = std::thread::hardware_concurrency();
    return hardware > 0 ? hardware : 1;
}

ThreadPool::ThreadPool(const ThreadPoolConfig& config)
    : config_(config), start_time_(std::chrono::system_clock::now()) {

    size_t count = config_.effectiveThreadCount();

    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        workers_.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            workers_.emplace_back(&ThreadPool::workerLoop, this);
        }
    }

    LOG_DEBUG("threadpool", "Thread pool started with " + std::to_string(count) + " threads");
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::waitForAll() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_condition_.wait(lock, [this] {
        return task_queue_.empty() && active_threads_.load() == 0;
    });
}

void ThreadPool::shutdown() {
    if (shutdown_requested_.exchange(true)) {
        return; // EN: Already shutting down. FR: Déjà en cours d'arrêt.
    }

    // EN: Taking the queue lock orders the flag with workers about to wait. Workers drain the queue before leaving.
    // FR: Prendre le verrou de queue ordonne le flag avec les workers sur le point d'attendre. Les workers vident la queue avant de sortir.
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
    }
    queue_condition_.notify_all();

    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
    }

    LOG_DEBUG("threadpool", "Thread pool shutdown completed - Processed " +
              std::to_string(completed_tasks_.load()) + " tasks");
}

size_t ThreadPool::size() const {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    return workers_.size();
}

ThreadPoolStats ThreadPool::getStats() const {
    ThreadPoolStats current_stats;
    current_stats.created_at = start_time_;
    current_stats.total_threads = size();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        current_stats.queued_tasks = task_queue_.size();
    }

    current_stats.active_threads = active_threads_.load();
    current_stats.idle_threads = current_stats.total_threads > current_stats.active_threads
        ? current_stats.total_threads - current_stats.active_threads : 0;
    current_stats.completed_tasks = completed_tasks_.load();
    current_stats.failed_tasks = failed_tasks_.load();
    current_stats.peak_queue_size = peak_queue_size_.load();

    auto now = std::chrono::system_clock::now();
    current_stats.total_runtime = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time_);

    return current_stats;
}

// EN: Worker thread function. Leaves only once shutdown is requested and the queue is empty.
// FR: Fonction du thread worker. Ne sort qu'une fois l'arrêt demandé et la queue vide.
void ThreadPool::workerLoop() {
    while (true) {
        detail::PoolTask task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_condition_.wait(lock, [this] {
                return !task_queue_.empty() || shutdown_requested_.load();
            });

            if (task_queue_.empty()) {
                break;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
            active_threads_++;
        }

        // EN: packaged_task stores task exceptions in the future; anything escaping here is a wrapper failure.
        // FR: packaged_task stocke les exceptions dans le future ; ce qui s'échappe ici est un échec du wrapper.
        try {
            task.function();
            completed_tasks_++;
        } catch (const std::exception& e) {
            failed_tasks_++;
            LOG_ERROR("threadpool", "Task '" + task.name + "' failed: " + std::string(e.what()));
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_threads_--;
        }
        idle_condition_.notify_all();
    }
}

} // namespace CSVS
