#include "csv/csv_serializer.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include <filesystem>
#include <iostream>

struct Invoice {
    int number{0};
    std::string customer;
    double total{0};
    bool paid{false};
    std::chrono::year_month_day issued{};
    std::string internal_note;
};

namespace CSVS {
namespace CSV {

template<>
struct RecordMapping<Invoice> {
    static void describe(RecordSchema<Invoice>& schema) {
        schema.name("Invoice");
        schema.field("Number", &Invoice::number).column("Invoice #", 1);
        schema.field("Customer", &Invoice::customer).column("Customer Name", 2);
        schema.field("Issued", &Invoice::issued).column("Issued", 3);
        schema.field("Total", &Invoice::total).column("Total", 4);
        schema.field("Paid", &Invoice::paid).column("Paid", 5);
        schema.field("InternalNote", &Invoice::internal_note).ignore();
    }
};

} // namespace CSV
} // namespace CSVS

int main(int argc, char* argv[]) {
    auto& logger = CSVS::Logger::getInstance();
    auto& config = CSVS::ConfigManager::getInstance();

    logger.setLogLevel(CSVS::LogLevel::INFO);
    logger.setCorrelationId(logger.generateCorrelationId());

    LOG_INFO("serializer_example", "CSV Serializer Example");

    // Serializer settings, optionally overridden by a YAML file and CSVS_* environment variables
    const std::string yaml_config = R"(
serializer:
  separator: ","
  use_eof_literal: true
  use_line_numbers: true
  worker_threads: 0
  compression: auto
)";

    bool loaded = argc > 1 ? config.loadFromFile(argv[1]) : config.loadFromString(yaml_config);
    if (!loaded) {
        LOG_ERROR("serializer_example", "Failed to load configuration");
        return 1;
    }
    config.loadEnvironmentOverrides();

    try {
        CSVS::CSV::SerializerOptions options = CSVS::CSV::SerializerOptions::fromConfig();
        CSVS::CSV::CsvSerializer<Invoice> serializer(options);

        std::vector<Invoice> invoices = {
            {1001, "Acme, Inc.", 1250.5, true, std::chrono::year{2024} / 3 / 1, "priority"},
            {1002, "Globex\nEurope", 89.99, false, std::chrono::year{2024} / 3 / 4, ""},
            {1003, "Initech", 410.0, true, std::chrono::year{2024} / 3 / 9, ""}
        };

        std::filesystem::path output = std::filesystem::temp_directory_path() / "csvs_invoices.csv.gz";
        serializer.serialize(output.string(), invoices);
        LOG_INFO("serializer_example", "Wrote " + std::to_string(invoices.size()) + " invoices to " + output.string());

        std::cout << serializer.typeHeader() << std::endl;
        std::cout << "Header check: " << (serializer.checkFileHeader(output.string()) ? "ok" : "mismatch") << std::endl;

        std::vector<Invoice> selected = serializer.deserialize(output.string(), {"acme", "initech"});
        for (const auto& invoice : selected) {
            std::cout << invoice.number << " " << invoice.customer << " " << invoice.total << std::endl;
        }

        std::cout << serializer.getStatistics().generateReport();
        std::filesystem::remove(output);

    } catch (const std::exception& e) {
        LOG_ERROR("serializer_example", std::string("Example failed: ") + e.what());
        return 1;
    }

    LOG_INFO("serializer_example", "Example completed");
    return 0;
}
