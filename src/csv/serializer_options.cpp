// EN: Implementation of SerializerOptions validation and configuration loading
// FR: Implémentation de la validation de SerializerOptions et du chargement de configuration

#include "csv/serializer_options.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include <stdexcept>

namespace CSVS {
namespace CSV {

namespace {

bool readBool(const ConfigValue& value, const std::string& key) {
    if (auto flag = value.tryAs<bool>()) {
        return *flag;
    }
    throw std::invalid_argument("serializer." + key + " must be a boolean, got '" + value.toString() + "'");
}

std::string readString(const ConfigValue& value, const std::string& key) {
    if (auto text = value.tryAs<std::string>()) {
        return *text;
    }
    if (value.tryAs<std::vector<std::string>>()) {
        throw std::invalid_argument("serializer." + key + " must be a scalar");
    }
    return value.toString();
}

} // namespace

void SerializerOptions::validate() const {
    if (separator == '\n' || separator == '\r') {
        throw std::invalid_argument("separator cannot be a line break");
    }
    if (newline_replacement.empty() || separator_replacement.empty()) {
        throw std::invalid_argument("replacement tokens cannot be empty");
    }
    if (newline_replacement == separator_replacement) {
        throw std::invalid_argument("newline and separator replacement tokens must differ");
    }
    if (newline_replacement.find(separator) != std::string::npos ||
        separator_replacement.find(separator) != std::string::npos) {
        throw std::invalid_argument("replacement tokens cannot contain the separator");
    }
    if (row_number_title.empty() || row_number_title.find(separator) != std::string::npos) {
        throw std::invalid_argument("row_number_title must be non-empty and free of the separator");
    }
}

bool SerializerOptions::isValid() const {
    try {
        validate();
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

SerializerOptions SerializerOptions::fromConfig(const ConfigSection& section) {
    SerializerOptions options;

    for (const std::string& key : section.keys()) {
        ConfigValue value = section.get(key);

        if (key == "skip_empty_lines") {
            options.skip_empty_lines = readBool(value, key);
        } else if (key == "ignore_reference_fields") {
            options.ignore_reference_fields = readBool(value, key);
        } else if (key == "newline_replacement") {
            options.newline_replacement = readString(value, key);
        } else if (key == "separator_replacement") {
            options.separator_replacement = readString(value, key);
        } else if (key == "row_number_title") {
            options.row_number_title = readString(value, key);
        } else if (key == "separator") {
            std::string text = readString(value, key);
            if (text.size() != 1) {
                throw std::invalid_argument("serializer.separator must be a single character, got '" + text + "'");
            }
            options.separator = text[0];
        } else if (key == "use_eof_literal") {
            options.use_eof_literal = readBool(value, key);
        } else if (key == "use_line_numbers") {
            options.use_line_numbers = readBool(value, key);
        } else if (key == "expected_header") {
            options.expected_header = readString(value, key);
        } else if (key == "file_header") {
            options.file_header = readString(value, key);
        } else if (key == "force_sequential") {
            options.force_sequential = readBool(value, key);
        } else if (key == "worker_threads") {
            auto count = value.tryAs<int>();
            if (!count || *count < 0) {
                throw std::invalid_argument("serializer.worker_threads must be a non-negative integer");
            }
            options.worker_threads = static_cast<size_t>(*count);
        } else if (key == "compression") {
            options.compression = compressionTypeFromString(readString(value, key));
        } else {
            LOG_WARN("serializer_options", "Ignoring unknown configuration key: " + key);
        }
    }

    options.validate();
    return options;
}

SerializerOptions SerializerOptions::fromConfig(const std::string& section_name) {
    return fromConfig(ConfigManager::getInstance().getSection(section_name));
}

} // namespace CSV
} // namespace CSVS
