// EN: Configuration manager for the PipelineRun reconciler - YAML sections, typed values, validation
// FR: Gestionnaire de configuration du réconciliateur PipelineRun - sections YAML, valeurs typées, validation

#pragma once

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

// Forward declaration
namespace YAML { class Node; }

namespace PRR {

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T>
    ConfigValue(const T& value) : value_(ValueType(value)) {}

    ConfigValue(const char* value) : value_(ValueType(std::string(value))) {}

    // EN: Get value as specific type (throws if empty or type mismatch).
    // FR: Obtient la valeur comme type spécifique (lance exception si vide ou type incorrect).
    template<typename T>
    T as() const {
        if (!value_) {
            throw std::runtime_error("ConfigValue is empty");
        }
        if (const T* typed = std::get_if<T>(&*value_)) {
            return *typed;
        }
        throw std::runtime_error("ConfigValue type mismatch");
    }

    // EN: Try to get value as specific type (returns nullopt if type mismatch).
    // FR: Tente d'obtenir la valeur comme type spécifique (retourne nullopt si type incorrect).
    template<typename T>
    std::optional<T> tryAs() const {
        if (!value_) {
            return std::nullopt;
        }
        if (const T* typed = std::get_if<T>(&*value_)) {
            return *typed;
        }
        return std::nullopt;
    }

    template<typename T>
    T asOrDefault(const T& default_value) const {
        auto result = tryAs<T>();
        return result ? *result : default_value;
    }

    // EN: Numeric view of int or double values.
    // FR: Vue numérique des valeurs int ou double.
    std::optional<double> asNumber() const;

    bool isValid() const { return value_.has_value(); }

    std::string toString() const;

private:
    std::optional<ValueType> value_;
};

// EN: Configuration section containing key-value pairs.
// FR: Section de configuration contenant des paires clé-valeur.
class ConfigSection {
public:
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

// EN: Main configuration manager with YAML parsing, environment overrides and validation.
// FR: Gestionnaire de configuration principal avec parsing YAML, surcharges d'environnement et validation.
class ConfigManager {
public:
    // EN: Validation rule for a "section.key" configuration value.
    // FR: Règle de validation pour une valeur de configuration "section.clé".
    struct ValidationRule {
        std::string key;
        std::string type; // "bool", "int", "double", "string", "array"
        bool required = false;
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };

    static ConfigManager& getInstance();

    // EN: Load configuration from YAML file (replaces current sections).
    // FR: Charge la configuration depuis un fichier YAML (remplace les sections actuelles).
    bool loadFromFile(const std::string& filename);

    // EN: Load configuration from YAML string (replaces current sections).
    // FR: Charge la configuration depuis une chaîne YAML (remplace les sections actuelles).
    bool loadFromString(const std::string& yaml_content);

    bool saveToFile(const std::string& filename) const;

    // EN: Apply environment overrides: PRR_<SECTION>_<KEY> overrides section.key for every ruled key.
    // FR: Applique les surcharges d'environnement : PRR_<SECTION>_<CLE> surcharge section.clé pour chaque clé réglementée.
    size_t loadEnvironmentOverrides(const std::string& prefix = "PRR_");

    void addValidationRules(const std::vector<ValidationRule>& rules);

    // EN: Validate current configuration against rules.
    // FR: Valide la configuration actuelle contre les règles.
    bool validate(std::vector<std::string>& errors) const;

    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& section, const std::string& key) const;
    void remove(const std::string& section, const std::string& key);

    ConfigSection getSection(const std::string& section) const;
    std::vector<std::string> getSectionNames() const;

    // EN: Reset all configuration data and rules.
    // FR: Remet à zéro toutes les données et règles de configuration.
    void reset();

    std::string dump() const;

private:
    ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    void loadNode(const YAML::Node& root);

    ConfigValue getUnlocked(const std::string& section, const std::string& key) const;

    bool validateValue(const std::string& key, const ConfigValue& value,
                       const ValidationRule& rule, std::string& error) const;

    // EN: Expand ${VAR} references from the environment.
    // FR: Étend les références ${VAR} depuis l'environnement.
    static std::string expandVariables(const std::string& value);

    static ConfigValue parseYamlValue(const YAML::Node& node);

    // EN: Parse a raw environment string according to the rule type.
    // FR: Parse une chaîne d'environnement brute selon le type de la règle.
    static std::optional<ConfigValue> parseTyped(const std::string& raw, const std::string& type);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
    std::vector<ValidationRule> validation_rules_;
};

#define CONFIG_GET_SECTION(section, key) PRR::ConfigManager::getInstance().get(section, key)
#define CONFIG_SET_SECTION(section, key, value) PRR::ConfigManager::getInstance().set(section, key, PRR::ConfigValue(value))

} // namespace PRR
