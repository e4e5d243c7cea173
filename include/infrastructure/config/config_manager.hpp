// EN: YAML configuration manager holding typed values grouped in sections.
// FR: Gestionnaire de configuration YAML contenant des valeurs typées regroupées en sections.

#pragma once

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

// Forward declaration
namespace YAML { class Node; }

namespace CSVS {

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T, typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, ConfigValue>>>
    ConfigValue(const T& value) : value_(value) {}

    ConfigValue(const char* value) : value_(std::string(value)) {}

    // EN: Get value as specific type (throws if empty or type mismatch).
    // FR: Obtient la valeur comme type spécifique (lance exception si vide ou type incorrect).
    template<typename T>
    T as() const;

    // EN: Try to get value as specific type (returns nullopt if type mismatch).
    // FR: Tente d'obtenir la valeur comme type spécifique (retourne nullopt si type incorrect).
    template<typename T>
    std::optional<T> tryAs() const;

    template<typename T>
    T asOrDefault(const T& default_value) const;

    bool isValid() const { return value_.has_value(); }

    std::string toString() const;

private:
    std::optional<ValueType> value_;
};

// EN: Configuration section containing key-value pairs.
// FR: Section de configuration contenant des paires clé-valeur.
class ConfigSection {
public:
    ConfigSection() = default;

    void set(const std::string& key, const ConfigValue& value);
    ConfigValue get(const std::string& key) const;
    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys() const;

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    // EN: Merge another section into this one.
    // FR: Fusionne une autre section dans celle-ci.
    void merge(const ConfigSection& other, bool overwrite = true);

private:
    std::unordered_map<std::string, ConfigValue> values_;
};

// EN: Configuration manager singleton with YAML parsing and environment overrides.
// FR: Singleton gestionnaire de configuration avec parsing YAML et surcharges d'environnement.
class ConfigManager {
public:
    static ConfigManager& getInstance();

    // EN: Load configuration from YAML file. Returns false and logs on failure.
    // FR: Charge la configuration depuis un fichier YAML. Retourne false et journalise en cas d'échec.
    bool loadFromFile(const std::string& filename);

    // EN: Load configuration from YAML string.
    // FR: Charge la configuration depuis une chaîne YAML.
    bool loadFromString(const std::string& yaml_content);

    // EN: Save current configuration to YAML file.
    // FR: Sauvegarde la configuration actuelle vers un fichier YAML.
    bool saveToFile(const std::string& filename) const;

    // EN: Apply environment variable overrides onto the "serializer" section (e.g. CSVS_SEPARATOR).
    // FR: Applique les surcharges de variables d'environnement sur la section "serializer" (ex. CSVS_SEPARATOR).
    void loadEnvironmentOverrides(const std::string& prefix = "CSVS_");

    ConfigValue get(const std::string& key) const;
    ConfigValue get(const std::string& section, const std::string& key) const;

    void set(const std::string& key, const ConfigValue& value);
    void set(const std::string& section, const std::string& key, const ConfigValue& value);

    bool has(const std::string& key) const;
    bool has(const std::string& section, const std::string& key) const;

    void remove(const std::string& key);
    void remove(const std::string& section, const std::string& key);

    ConfigSection getSection(const std::string& section) const;
    void setSection(const std::string& section, const ConfigSection& config);
    std::vector<std::string> getSectionNames() const;

    // EN: Reset all configuration data.
    // FR: Remet à zéro toutes les données de configuration.
    void reset();

    // EN: Dump current configuration as string for debugging.
    // FR: Vide la configuration actuelle en chaîne pour débogage.
    std::string dump() const;

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // EN: Replace the sections with the content of a parsed YAML document.
    // FR: Remplace les sections par le contenu d'un document YAML analysé.
    void loadDocument(const YAML::Node& yaml);

    // EN: Expand ${VAR} environment references in configuration strings.
    // FR: Étend les références d'environnement ${VAR} dans les chaînes de configuration.
    std::string expandVariables(const std::string& value) const;

    ConfigValue parseYamlValue(const YAML::Node& node) const;
    ConfigValue parseScalar(const std::string& text) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
};

template<typename T>
T ConfigValue::as() const {
    if (!value_) {
        throw std::runtime_error("ConfigValue is empty");
    }
    const T* typed = std::get_if<T>(&*value_);
    if (typed == nullptr) {
        throw std::runtime_error("ConfigValue type mismatch");
    }
    return *typed;
}

template<typename T>
std::optional<T> ConfigValue::tryAs() const {
    if (!value_) {
        return std::nullopt;
    }
    const T* typed = std::get_if<T>(&*value_);
    if (typed == nullptr) {
        return std::nullopt;
    }
    return *typed;
}

template<typename T>
T ConfigValue::asOrDefault(const T& default_value) const {
    auto result = tryAs<T>();
    return result ? *result : default_value;
}

#define CONFIG_GET(key) CSVS::ConfigManager::getInstance().get(key)
#define CONFIG_GET_SECTION(section, key) CSVS::ConfigManager::getInstance().get(section, key)
#define CONFIG_SET(key, value) CSVS::ConfigManager::getInstance().set(key, CSVS::ConfigValue(value))
#define CONFIG_SET_SECTION(section, key, value) CSVS::ConfigManager::getInstance().set(section, key, CSVS::ConfigValue(value))

} // namespace CSVS
