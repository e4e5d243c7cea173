// EN: Tests for the fixed-size worker pool
// FR: Tests du pool de workers de taille fixe

#include "infrastructure/threading/thread_pool.hpp"
#include "infrastructure/logging/logger.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

void testBasicTaskSubmission() {
    std::cout << "=== Test Basic Task Submission ===" << std::endl;

    CSVS::ThreadPoolConfig config;
    config.thread_count = 3;
    CSVS::ThreadPool pool(config);
    assert(pool.size() == 3);

    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([&counter]() { counter++; }));
    }
    for (auto& future : futures) {
        future.get();
    }

    assert(counter == 100);

    std::cout << "✓ Basic task submission test passed" << std::endl;
}

void testReturnValuesAndArguments() {
    std::cout << "\n=== Test Return Values ===" << std::endl;

    CSVS::ThreadPool pool;

    auto future_sum = pool.submit([](int a, int b) { return a + b; }, 40, 2);
    auto future_string = pool.submitNamed("greeting", []() -> std::string {
        return "Hello from thread pool";
    });

    assert(future_sum.get() == 42);
    assert(future_string.get() == "Hello from thread pool");

    std::cout << "✓ Return values test passed" << std::endl;
}

void testExceptionsReachTheFuture() {
    std::cout << "\n=== Test Exception Handling ===" << std::endl;

    CSVS::ThreadPool pool;

    auto future = pool.submit([]() {
        throw std::runtime_error("Test exception");
    });

    bool exception_caught = false;
    try {
        future.get();
    } catch (const std::runtime_error& e) {
        exception_caught = true;
        assert(std::string(e.what()) == "Test exception");
    }
    assert(exception_caught);

    // EN: The pool keeps working after a failing task.
    // FR: Le pool continue de fonctionner après une tâche en échec.
    assert(pool.submit([]() { return 7; }).get() == 7);

    std::cout << "✓ Exception handling test passed" << std::endl;
}

void testWaitForAll() {
    std::cout << "\n=== Test Wait For All ===" << std::endl;

    CSVS::ThreadPoolConfig config;
    config.thread_count = 2;
    CSVS::ThreadPool pool(config);

    std::atomic<int> completed{0};
    for (int i = 0; i < 10; ++i) {
        pool.submit([&completed]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            completed++;
        });
    }

    pool.waitForAll();
    assert(completed == 10);

    auto stats = pool.getStats();
    assert(stats.completed_tasks == 10);
    assert(stats.queued_tasks == 0);
    assert(stats.active_threads == 0);
    assert(stats.total_threads == 2);
    assert(stats.peak_queue_size >= 1);

    std::cout << "✓ Wait for all test passed" << std::endl;
}

void testQueueLimits() {
    std::cout << "\n=== Test Queue Limits ===" << std::endl;

    CSVS::ThreadPoolConfig config;
    config.thread_count = 1;
    config.max_queue_size = 2;
    CSVS::ThreadPool pool(config);

    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    std::atomic<bool> started{false};

    auto blocker = pool.submit([opened, &started]() {
        started = true;
        opened.wait();
    });
    while (!started) {
        std::this_thread::yield();
    }

    auto queued_one = pool.submit([]() {});
    auto queued_two = pool.submit([]() {});

    bool rejected = false;
    try {
        pool.submit([]() {});
    } catch (const std::runtime_error&) {
        rejected = true;
    }
    assert(rejected);

    gate.set_value();
    blocker.get();
    queued_one.get();
    queued_two.get();

    std::cout << "✓ Queue limits test passed" << std::endl;
}

void testShutdown() {
    std::cout << "\n=== Test Shutdown ===" << std::endl;

    CSVS::ThreadPool pool;
    std::atomic<int> counter{0};
    for (int i = 0; i < 20; ++i) {
        pool.submit([&counter]() { counter++; });
    }

    pool.shutdown();
    assert(pool.isShutdown());
    assert(counter == 20);
    assert(pool.size() == 0);

    bool rejected = false;
    try {
        pool.submit([]() {});
    } catch (const std::runtime_error&) {
        rejected = true;
    }
    assert(rejected);

    pool.shutdown();

    std::cout << "✓ Shutdown test passed" << std::endl;
}

int main() {
    std::cout << "Running Thread Pool Tests...\n" << std::endl;

    CSVS::Logger::getInstance().setLogLevel(CSVS::LogLevel::ERROR);

    try {
        testBasicTaskSubmission();
        testReturnValuesAndArguments();
        testExceptionsReachTheFuture();
        testWaitForAll();
        testQueueLimits();
        testShutdown();

        std::cout << "\nAll Thread Pool tests passed successfully!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
