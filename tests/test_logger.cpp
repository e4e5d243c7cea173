// EN: Tests for the NDJSON logger
// FR: Tests du logger NDJSON

#include "infrastructure/logging/logger.hpp"
#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <thread>
#include <vector>

void testLogLevels() {
    std::cout << "=== Test Log Levels ===" << std::endl;

    auto& logger = CSVS::Logger::getInstance();
    std::string log_file = "/tmp/csvs_level_test.log";
    std::remove(log_file.c_str());
    logger.setOutputFile(log_file);
    logger.setLogLevel(CSVS::LogLevel::WARN);

    LOG_DEBUG("level_test", "This debug should NOT appear");
    LOG_INFO("level_test", "This info should NOT appear");
    LOG_WARN("level_test", "This warning SHOULD appear");
    LOG_ERROR("level_test", "This error SHOULD appear");
    logger.flush();

    std::ifstream file(log_file);
    std::string line;
    int line_count = 0;
    while (std::getline(file, line)) {
        line_count++;
        assert(line.find("SHOULD appear") != std::string::npos);
    }
    file.close();
    assert(line_count == 2);

    logger.setLogLevel(CSVS::LogLevel::DEBUG);
    logger.resetOutput();
    std::remove(log_file.c_str());

    std::cout << "✓ Log levels test passed" << std::endl;
}

void testCorrelationId() {
    std::cout << "\n=== Test Correlation ID ===" << std::endl;

    auto& logger = CSVS::Logger::getInstance();

    std::string correlation_id = logger.generateCorrelationId();
    std::cout << "Generated correlation ID: " << correlation_id << std::endl;

    assert(correlation_id.length() == 36);
    assert(correlation_id[8] == '-' && correlation_id[13] == '-');
    assert(correlation_id != logger.generateCorrelationId());

    std::cout << "✓ Correlation ID test passed" << std::endl;
}

void testNDJSONFormat() {
    std::cout << "\n=== Test NDJSON Format ===" << std::endl;

    auto& logger = CSVS::Logger::getInstance();
    std::string log_file = "/tmp/csvs_ndjson_test.log";

    std::remove(log_file.c_str());
    logger.setOutputFile(log_file);
    logger.setCorrelationId("test-correlation-id");
    logger.addGlobalMetadata("component", "serializer");

    std::unordered_map<std::string, std::string> metadata = {
        {"records", "42"},
        {"level", "overridden?"}
    };

    LOG_INFO_META("ndjson_test", "Header \"RowNumber,Id\"\nmismatch", metadata);
    logger.flush();

    std::ifstream file(log_file);
    std::string json_line;
    std::getline(file, json_line);
    std::string extra_line;
    bool single_line = !std::getline(file, extra_line);
    file.close();

    assert(single_line);
    assert(json_line.find("\"timestamp\":") != std::string::npos);
    assert(json_line.find("\"level\":\"INFO\"") != std::string::npos);
    assert(json_line.find("\"message\":\"Header \\\"RowNumber,Id\\\"\\nmismatch\"") != std::string::npos);
    assert(json_line.find("\"module\":\"ndjson_test\"") != std::string::npos);
    assert(json_line.find("\"correlation_id\":\"test-correlation-id\"") != std::string::npos);
    assert(json_line.find("\"records\":\"42\"") != std::string::npos);
    assert(json_line.find("\"component\":\"serializer\"") != std::string::npos);
    assert(json_line.find("overridden?") == std::string::npos);
    assert(json_line.find("\"thread_id\":") != std::string::npos);

    logger.setCorrelationId("");
    logger.clearGlobalMetadata();
    logger.resetOutput();
    std::remove(log_file.c_str());

    std::cout << "✓ NDJSON format test passed" << std::endl;
}

void testTimestampFormat() {
    std::cout << "\n=== Test Timestamp Format ===" << std::endl;

    CSVS::Logger::LogEntry entry;
    entry.timestamp = std::chrono::system_clock::time_point{} + std::chrono::milliseconds(1500);
    entry.level = CSVS::LogLevel::ERROR;
    entry.message = "epoch";
    entry.module = "time_test";
    entry.thread_id = "1";

    std::string json_line = CSVS::Logger::formatAsNDJSON(entry);
    assert(json_line.find("\"timestamp\":\"1970-01-01T00:00:01.500Z\"") != std::string::npos);
    assert(json_line.find("\"level\":\"ERROR\"") != std::string::npos);
    assert(json_line.find("correlation_id") == std::string::npos);

    std::cout << "✓ Timestamp format test passed" << std::endl;
}

void testThreadSafety() {
    std::cout << "\n=== Test Thread Safety ===" << std::endl;

    auto& logger = CSVS::Logger::getInstance();
    std::string log_file = "/tmp/csvs_thread_test.log";
    std::remove(log_file.c_str());
    logger.setOutputFile(log_file);

    const int num_threads = 8;
    const int messages_per_thread = 50;
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([t, messages_per_thread]() {
            for (int i = 0; i < messages_per_thread; ++i) {
                LOG_INFO("thread_test", "Thread " + std::to_string(t) + " message " + std::to_string(i));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    logger.flush();

    std::ifstream file(log_file);
    std::string line;
    int total_lines = 0;
    while (std::getline(file, line)) {
        total_lines++;
        assert(line.find("\"module\":\"thread_test\"") != std::string::npos);
    }
    file.close();

    assert(total_lines == num_threads * messages_per_thread);

    logger.resetOutput();
    std::remove(log_file.c_str());

    std::cout << "✓ Thread safety test passed" << std::endl;
}

int main() {
    std::cout << "Running Logger Tests...\n" << std::endl;

    try {
        testLogLevels();
        testCorrelationId();
        testNDJSONFormat();
        testTimestampFormat();
        testThreadSafety();

        std::cout << "\nAll Logger tests passed successfully!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
