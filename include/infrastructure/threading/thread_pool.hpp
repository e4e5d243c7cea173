// EN: Fixed-size worker pool used to decode CSV lines concurrently.
// FR: Pool de workers de taille fixe utilisé pour décoder les lignes CSV en parallèle.

#pragma once

#include <atomic>
#include <chrono>
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

namespace CSVS {

// EN: Thread pool statistics for monitoring.
// FR: Statistiques du pool de threads pour le monitoring.
struct ThreadPoolStats {
    size_t total_threads = 0;
    size_t active_threads = 0;
    size_t idle_threads = 0;
    size_t queued_tasks = 0;
    size_t completed_tasks = 0;
    size_t failed_tasks = 0;
    size_t peak_queue_size = 0;
    std::chrono::system_clock::time_point created_at;
    std::chrono::milliseconds total_runtime{0};
};

// EN: Configuration for thread pool size and limits.
// FR: Configuration pour la taille et les limites du pool de threads.
struct ThreadPoolConfig {
    // EN: Number of worker threads (0 = hardware concurrency).
    // FR: Nombre de threads workers (0 = concurrence matérielle).
    size_t thread_count = 0;

    // EN: Maximum number of queued tasks before submit() throws (0 = unbounded).
    // FR: Nombre maximum de tâches en queue avant que submit() lève une exception (0 = illimité).
    size_t max_queue_size = 0;

    // EN: Resolve thread_count against the machine.
    // FR: Résout thread_count selon la machine.
    size_t effectiveThreadCount() const;
};

namespace detail {
    // EN: Internal task wrapper with a name for diagnostics.
    // FR: Wrapper interne de tâche avec un nom pour le diagnostic.
    struct PoolTask {
        std::function<void()> function;
        std::string name;

        PoolTask() = default;
        PoolTask(std::function<void()> f, std::string n)
            : function(std::move(f)), name(std::move(n)) {}
    };
}

// EN: FIFO thread pool. Exceptions thrown by a task are delivered through its future.
// FR: Pool de threads FIFO. Les exceptions levées par une tâche sont transmises par son future.
class ThreadPool {
public:
    explicit ThreadPool(const ThreadPoolConfig& config = ThreadPoolConfig{});

    // EN: Destructor - waits for all tasks to complete and stops all threads.
    // FR: Destructeur - attend que toutes les tâches se terminent et arrête tous les threads.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    // EN: Submit a task and return a future for its result.
    // FR: Soumet une tâche et retourne un future pour son résultat.
    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    // EN: Submit a named task for better debugging.
    // FR: Soumet une tâche nommée pour un meilleur débogage.
    template<typename F, typename... Args>
    auto submitNamed(const std::string& name, F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    // EN: Wait for all currently queued tasks to complete.
    // FR: Attend que toutes les tâches actuellement en queue se terminent.
    void waitForAll();

    // EN: Shutdown the thread pool gracefully (idempotent).
    // FR: Arrête le pool de threads de manière gracieuse (idempotent).
    void shutdown();

    bool isShutdown() const { return shutdown_requested_.load(); }
    size_t size() const;

    ThreadPoolStats getStats() const;
    const ThreadPoolConfig& getConfig() const { return config_; }

private:
    void workerLoop();

    ThreadPoolConfig config_;

    std::vector<std::thread> workers_;
    mutable std::mutex threads_mutex_;

    std::queue<detail::PoolTask> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_condition_;
    std::condition_variable idle_condition_;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<size_t> active_threads_{0};
    std::atomic<size_t> completed_tasks_{0};
    std::atomic<size_t> failed_tasks_{0};
    std::atomic<size_t> peak_queue_size_{0};

    std::chrono::system_clock::time_point start_time_;
};

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    return submitNamed("", std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ThreadPool::submitNamed(const std::string& name, F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        if (shutdown_requested_) {
            throw std::runtime_error("ThreadPool is shutting down, cannot accept new tasks");
        }

        if (config_.max_queue_size > 0 && task_queue_.size() >= config_.max_queue_size) {
            throw std::runtime_error("Task queue is full, cannot accept new tasks");
        }

        task_queue_.emplace([task]() { (*task)(); }, name);

        // EN: Update peak queue size.
        // FR: Met à jour la taille maximale de la queue.
        size_t current_size = task_queue_.size();
        size_t current_peak = peak_queue_size_.load();
        while (current_size > current_peak &&
               !peak_queue_size_.compare_exchange_weak(current_peak, current_size)) {
        }
    }

    queue_condition_.notify_one();
    return result;
}

} // namespace CSVS
