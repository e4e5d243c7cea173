// EN: Tests for the YAML configuration manager
// FR: Tests du gestionnaire de configuration YAML

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>

const std::string TEST_YAML = R"(
serializer:
  separator: ";"
  use_line_numbers: false
  worker_threads: 4
  row_number_title: "Line"
  expected_header: "${CSVS_TEST_HEADER}"
  newline_replacement: "|"

logging:
  level: info
  file: /var/log/csvs.log

input:
  keywords:
    - invoice
    - refund
  sample_rate: 0.25
)";

void testBasicConfigOperations() {
    std::cout << "=== Test Basic Config Operations ===" << std::endl;

    auto& config = CSVS::ConfigManager::getInstance();
    config.reset();

    config.set("serializer", "separator", CSVS::ConfigValue(";"));
    config.set("serializer", "worker_threads", CSVS::ConfigValue(8));
    CONFIG_SET("verbose", true);

    assert(config.has("serializer", "separator"));
    assert(config.has("verbose"));
    assert(!config.has("serializer", "missing"));

    assert(config.get("serializer", "separator").as<std::string>() == ";");
    assert(CONFIG_GET_SECTION("serializer", "worker_threads").as<int>() == 8);
    assert(CONFIG_GET("verbose").as<bool>());

    config.remove("serializer", "worker_threads");
    assert(!config.has("serializer", "worker_threads"));
    assert(!config.get("serializer", "worker_threads").isValid());

    std::cout << "✓ Basic config operations test passed" << std::endl;
}

void testConfigValue() {
    std::cout << "\n=== Test ConfigValue ===" << std::endl;

    CSVS::ConfigValue bool_val(true);
    CSVS::ConfigValue int_val(42);
    CSVS::ConfigValue double_val(2.5);
    CSVS::ConfigValue string_val("hello");
    CSVS::ConfigValue array_val(std::vector<std::string>{"a", "b", "c"});
    CSVS::ConfigValue copied(int_val);

    assert(bool_val.as<bool>());
    assert(int_val.as<int>() == 42);
    assert(copied.as<int>() == 42);
    assert(double_val.as<double>() == 2.5);
    assert(string_val.as<std::string>() == "hello");
    assert(array_val.as<std::vector<std::string>>().size() == 3);

    assert(int_val.tryAs<int>().has_value());
    assert(!int_val.tryAs<std::string>().has_value());
    assert(int_val.asOrDefault<std::string>("default") == "default");

    bool mismatch_thrown = false;
    try {
        int_val.as<bool>();
    } catch (const std::runtime_error&) {
        mismatch_thrown = true;
    }
    assert(mismatch_thrown);

    assert(bool_val.toString() == "true");
    assert(int_val.toString() == "42");
    assert(array_val.toString() == "[a, b, c]");
    assert(CSVS::ConfigValue().toString() == "<empty>");

    std::cout << "✓ ConfigValue test passed" << std::endl;
}

void testYamlLoading() {
    std::cout << "\n=== Test YAML Loading ===" << std::endl;

    setenv("CSVS_TEST_HEADER", "RowNumber,Id,Name", 1);

    auto& config = CSVS::ConfigManager::getInstance();
    config.reset();
    assert(config.loadFromString(TEST_YAML));

    assert(config.get("serializer", "separator").as<std::string>() == ";");
    assert(config.get("serializer", "use_line_numbers").as<bool>() == false);
    assert(config.get("serializer", "worker_threads").as<int>() == 4);
    assert(config.get("serializer", "row_number_title").as<std::string>() == "Line");
    assert(config.get("serializer", "expected_header").as<std::string>() == "RowNumber,Id,Name");
    assert(config.get("serializer", "newline_replacement").as<std::string>() == "|");
    assert(config.get("input", "sample_rate").as<double>() == 0.25);

    auto keywords = config.get("input", "keywords").as<std::vector<std::string>>();
    assert(keywords.size() == 2);
    assert(keywords[0] == "invoice");

    auto names = config.getSectionNames();
    assert(names.size() == 3);
    assert(names[0] == "input");

    assert(!config.loadFromString("serializer: [unclosed"));

    unsetenv("CSVS_TEST_HEADER");

    std::cout << "✓ YAML loading test passed" << std::endl;
}

void testFileOperations() {
    std::cout << "\n=== Test File Operations ===" << std::endl;

    auto& config = CSVS::ConfigManager::getInstance();
    config.reset();

    std::string test_file = "/tmp/csvs_config_test.yaml";
    std::string saved_file = "/tmp/csvs_config_saved.yaml";

    {
        std::ofstream file(test_file);
        file << TEST_YAML;
    }

    assert(config.loadFromFile(test_file));
    assert(config.get("logging", "file").as<std::string>() == "/var/log/csvs.log");

    config.set("serializer", "force_sequential", CSVS::ConfigValue(true));
    assert(config.saveToFile(saved_file));

    config.reset();
    assert(config.loadFromFile(saved_file));
    assert(config.get("serializer", "force_sequential").as<bool>());
    assert(config.get("serializer", "separator").as<std::string>() == ";");
    assert(config.get("serializer", "worker_threads").as<int>() == 4);
    assert(config.get("input", "keywords").as<std::vector<std::string>>().size() == 2);

    assert(!config.loadFromFile("/tmp/csvs_config_does_not_exist.yaml"));

    std::remove(test_file.c_str());
    std::remove(saved_file.c_str());

    std::cout << "✓ File operations test passed" << std::endl;
}

void testEnvironmentOverrides() {
    std::cout << "\n=== Test Environment Overrides ===" << std::endl;

    auto& config = CSVS::ConfigManager::getInstance();
    config.reset();
    config.set("serializer", "separator", CSVS::ConfigValue(","));

    setenv("CSVS_SEPARATOR", "1", 1);
    setenv("CSVS_FORCE_SEQUENTIAL", "true", 1);
    setenv("CSVS_WORKER_THREADS", "6", 1);

    config.loadEnvironmentOverrides();

    assert(config.get("serializer", "separator").as<std::string>() == "1");
    assert(config.get("serializer", "force_sequential").as<bool>());
    assert(config.get("serializer", "worker_threads").as<int>() == 6);
    assert(!config.has("serializer", "use_eof_literal"));

    unsetenv("CSVS_SEPARATOR");
    unsetenv("CSVS_FORCE_SEQUENTIAL");
    unsetenv("CSVS_WORKER_THREADS");

    std::cout << "✓ Environment overrides test passed" << std::endl;
}

void testSections() {
    std::cout << "\n=== Test Config Sections ===" << std::endl;

    CSVS::ConfigSection defaults;
    defaults.set("separator", CSVS::ConfigValue(","));
    defaults.set("use_line_numbers", CSVS::ConfigValue(true));

    CSVS::ConfigSection overrides;
    overrides.set("separator", CSVS::ConfigValue(";"));

    CSVS::ConfigSection merged = defaults;
    merged.merge(overrides);
    assert(merged.get("separator").as<std::string>() == ";");
    assert(merged.size() == 2);

    CSVS::ConfigSection kept = defaults;
    kept.merge(overrides, false);
    assert(kept.get("separator").as<std::string>() == ",");

    auto& config = CSVS::ConfigManager::getInstance();
    config.reset();
    config.setSection("serializer", merged);
    assert(config.getSection("serializer").keys() == (std::vector<std::string>{"separator", "use_line_numbers"}));
    assert(config.getSection("absent").empty());

    std::string dump = config.dump();
    assert(dump.find("[serializer]") != std::string::npos);
    assert(dump.find("separator = ;") != std::string::npos);

    std::cout << "✓ Config sections test passed" << std::endl;
}

int main() {
    std::cout << "Running Config Manager Tests...\n" << std::endl;

    CSVS::Logger::getInstance().setLogLevel(CSVS::LogLevel::ERROR);

    try {
        testBasicConfigOperations();
        testConfigValue();
        testYamlLoading();
        testFileOperations();
        testEnvironmentOverrides();
        testSections();

        CSVS::ConfigManager::getInstance().reset();
        std::cout << "\nAll Config Manager tests passed successfully!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
