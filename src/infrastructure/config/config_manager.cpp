// EN: Implementation of the ConfigManager class. Provides YAML configuration parsing and environment overrides.
// FR: Implémentation de la classe ConfigManager. Fournit le parsing de configuration YAML et les surcharges d'environnement.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

namespace CSVS {

std::string ConfigValue::toString() const {
    if (!value_) {
        return "<empty>";
    }

    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::string result = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) result += ", ";
                result += v[i];
            }
            result += "]";
            return result;
        }
    }, *value_);
}

// ConfigSection implementation
void ConfigSection::set(const std::string& key, const ConfigValue& value) {
    values_[key] = value;
}

ConfigValue ConfigSection::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return ConfigValue();
    }
    return it->second;
}

bool ConfigSection::has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

void ConfigSection::remove(const std::string& key) {
    values_.erase(key);
}

// EN: Keys are returned sorted so dumps and saved files are stable.
// FR: Les clés sont retournées triées pour que les dumps et fichiers sauvegardés soient stables.
std::vector<std::string> ConfigSection::keys() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

void ConfigSection::merge(const ConfigSection& other, bool overwrite) {
    for (const auto& [key, value] : other.values_) {
        if (overwrite || !has(key)) {
            set(key, value);
        }
    }
}

// ConfigManager implementation
ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        if (!std::filesystem::exists(filename)) {
            LOG_ERROR("config", "Configuration file not found: " + filename);
            return false;
        }

        YAML::Node yaml = YAML::LoadFile(filename);
        loadDocument(yaml);

        LOG_INFO("config", "Configuration loaded from: " + filename);
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        loadDocument(yaml);

        LOG_INFO("config", "Configuration loaded from string");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration from string: " + std::string(e.what()));
        return false;
    }
}

// EN: Top-level maps become sections; a top-level scalar becomes the "value" key of its own section.
// FR: Les maps de premier niveau deviennent des sections ; un scalaire de premier niveau devient la clé "value" de sa section.
void ConfigManager::loadDocument(const YAML::Node& yaml) {
    std::unordered_map<std::string, ConfigSection> loaded;

    if (yaml.IsMap()) {
        for (const auto& section : yaml) {
            std::string section_name = section.first.as<std::string>();
            ConfigSection config_section;

            if (section.second.IsMap()) {
                for (const auto& item : section.second) {
                    config_section.set(item.first.as<std::string>(), parseYamlValue(item.second));
                }
            } else {
                config_section.set("value", parseYamlValue(section.second));
            }

            loaded[section_name] = config_section;
        }
    } else if (!yaml.IsNull()) {
        throw std::runtime_error("configuration root must be a map");
    }

    sections_ = std::move(loaded);
}

ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) const {
    if (node.IsSequence()) {
        std::vector<std::string> array_value;
        for (const auto& item : node) {
            array_value.push_back(expandVariables(item.as<std::string>()));
        }
        return ConfigValue(array_value);
    }

    if (node.IsNull()) {
        return ConfigValue(std::string());
    }

    // EN: Quoted scalars stay strings, "," must not become a number and "true" may be a literal title.
    // FR: Les scalaires entre guillemets restent des chaînes, "," ne doit pas devenir un nombre et "true" peut être un titre littéral.
    if (node.Tag() == "!") {
        return ConfigValue(expandVariables(node.as<std::string>()));
    }

    return parseScalar(node.as<std::string>());
}

ConfigValue ConfigManager::parseScalar(const std::string& text) const {
    if (text == "true" || text == "false") {
        return ConfigValue(text == "true");
    }

    if (!text.empty() && text.find_first_not_of("+-0123456789") == std::string::npos) {
        try {
            size_t consumed = 0;
            int int_val = std::stoi(text, &consumed);
            if (consumed == text.size()) {
                return ConfigValue(int_val);
            }
        } catch (const std::exception&) {
            // EN: Out of range or malformed, fall through to string.
            // FR: Hors limites ou malformé, retombe sur chaîne.
        }
    }

    if (!text.empty() && text.find_first_not_of("+-0123456789.eE") == std::string::npos &&
        text.find_first_of("0123456789") != std::string::npos) {
        try {
            size_t consumed = 0;
            double double_val = std::stod(text, &consumed);
            if (consumed == text.size()) {
                return ConfigValue(double_val);
            }
        } catch (const std::exception&) {
        }
    }

    return ConfigValue(expandVariables(text));
}

bool ConfigManager::saveToFile(const std::string& filename) const {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        YAML::Emitter emitter;
        emitter << YAML::BeginMap;

        std::vector<std::string> names;
        for (const auto& [section_name, _] : sections_) {
            names.push_back(section_name);
        }
        std::sort(names.begin(), names.end());

        for (const auto& section_name : names) {
            const ConfigSection& section = sections_.at(section_name);
            emitter << YAML::Key << section_name;
            emitter << YAML::Value << YAML::BeginMap;

            for (const std::string& key : section.keys()) {
                ConfigValue value = section.get(key);
                emitter << YAML::Key << key;
                emitter << YAML::Value;

                if (auto bool_val = value.tryAs<bool>()) {
                    emitter << *bool_val;
                } else if (auto int_val = value.tryAs<int>()) {
                    emitter << *int_val;
                } else if (auto double_val = value.tryAs<double>()) {
                    emitter << *double_val;
                } else if (auto str_val = value.tryAs<std::string>()) {
                    emitter << YAML::DoubleQuoted << *str_val;
                } else if (auto array_val = value.tryAs<std::vector<std::string>>()) {
                    emitter << YAML::BeginSeq;
                    for (const auto& item : *array_val) {
                        emitter << item;
                    }
                    emitter << YAML::EndSeq;
                }
            }

            emitter << YAML::EndMap;
        }

        emitter << YAML::EndMap;

        std::ofstream file(filename);
        if (!file.is_open()) {
            LOG_ERROR("config", "Cannot open configuration file for writing: " + filename);
            return false;
        }
        file << emitter.c_str();

        LOG_INFO("config", "Configuration saved to: " + filename);
        return file.good();

    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to save configuration: " + std::string(e.what()));
        return false;
    }
}

void ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    // EN: Environment variable suffix mapped to its key in the "serializer" section.
    // FR: Suffixe de variable d'environnement associé à sa clé dans la section "serializer".
    static const std::vector<std::pair<std::string, std::string>> overrides = {
        {"SEPARATOR", "separator"},
        {"FORCE_SEQUENTIAL", "force_sequential"},
        {"WORKER_THREADS", "worker_threads"},
        {"USE_LINE_NUMBERS", "use_line_numbers"},
        {"USE_EOF_LITERAL", "use_eof_literal"},
        {"COMPRESSION", "compression"}
    };

    LOG_INFO("config", "Loading environment overrides with prefix: " + prefix);

    for (const auto& [suffix, key] : overrides) {
        const char* env_value = std::getenv((prefix + suffix).c_str());
        if (env_value == nullptr) {
            continue;
        }

        ConfigValue value = key == "separator" ? ConfigValue(std::string(env_value))
                                               : parseScalar(env_value);
        set("serializer", key, value);
        LOG_INFO("config", "Environment override applied: serializer." + key);
    }
}

ConfigValue ConfigManager::get(const std::string& key) const {
    return get("default", key);
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        return section_it->second.get(key);
    }

    return ConfigValue();
}

void ConfigManager::set(const std::string& key, const ConfigValue& value) {
    set("default", key, value);
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section].set(key, value);
}

bool ConfigManager::has(const std::string& key) const {
    return has("default", key);
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        return section_it->second.has(key);
    }

    return false;
}

void ConfigManager::remove(const std::string& key) {
    remove("default", key);
}

void ConfigManager::remove(const std::string& section, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        section_it->second.remove(key);
    }
}

ConfigSection ConfigManager::getSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sections_.find(section);
    if (it == sections_.end()) {
        return ConfigSection();
    }
    return it->second;
}

void ConfigManager::setSection(const std::string& section, const ConfigSection& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section] = config;
}

std::vector<std::string> ConfigManager::getSectionNames() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    for (const auto& [name, _] : sections_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
}

std::string ConfigManager::dump() const {
    std::vector<std::string> names = getSectionNames();

    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;
    for (const auto& section_name : names) {
        const ConfigSection& section = sections_.at(section_name);
        oss << "[" << section_name << "]\n";
        for (const std::string& key : section.keys()) {
            oss << "  " << key << " = " << section.get(key).toString() << "\n";
        }
        oss << "\n";
    }
    return oss.str();
}

std::string ConfigManager::expandVariables(const std::string& value) const {
    std::string result = value;
    std::regex var_regex(R"(\$\{([^}]+)\})");
    std::smatch match;

    while (std::regex_search(result, match, var_regex)) {
        const char* var_value = std::getenv(match[1].str().c_str());
        if (var_value == nullptr) {
            // EN: Leave variable as-is if not found.
            // FR: Laisse la variable telle quelle si introuvable.
            break;
        }
        result.replace(match.position(), match.length(), var_value);
    }

    return result;
}

} // namespace CSVS
