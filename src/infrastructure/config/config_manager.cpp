// EN: Implementation of the ConfigManager class. YAML parsing, environment overrides and validation.
// FR: Implémentation de la classe ConfigManager. Parsing YAML, surcharges d'environnement et validation.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

namespace PRR {

std::optional<double> ConfigValue::asNumber() const {
    if (auto int_val = tryAs<int>()) {
        return static_cast<double>(*int_val);
    }
    return tryAs<double>();
}

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
    return it != values_.end() ? it->second : ConfigValue();
}

bool ConfigSection::has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

void ConfigSection::remove(const std::string& key) {
    values_.erase(key);
}

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
    if (!std::filesystem::exists(filename)) {
        LOG_ERROR("config", "Configuration file not found: " + filename);
        return false;
    }

    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        std::lock_guard<std::mutex> lock(mutex_);
        loadNode(yaml);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", "Failed to load configuration: " + std::string(e.what()));
        return false;
    }

    LOG_INFO("config", "Configuration loaded from: " + filename);
    return true;
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        std::lock_guard<std::mutex> lock(mutex_);
        loadNode(yaml);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", "Failed to load configuration from string: " + std::string(e.what()));
        return false;
    }

    LOG_DEBUG("config", "Configuration loaded from string");
    return true;
}

// EN: Each top-level map becomes a section; a top-level scalar lands in section "<name>" under key "value".
// FR: Chaque map de premier niveau devient une section ; un scalaire de premier niveau va dans "<nom>" sous la clé "value".
void ConfigManager::loadNode(const YAML::Node& root) {
    sections_.clear();
    if (!root.IsMap()) {
        return;
    }

    for (const auto& section : root) {
        std::string section_name = section.first.as<std::string>();
        ConfigSection config_section;

        if (section.second.IsMap()) {
            for (const auto& item : section.second) {
                config_section.set(item.first.as<std::string>(), parseYamlValue(item.second));
            }
        } else if (!section.second.IsNull()) {
            config_section.set("value", parseYamlValue(section.second));
        }

        sections_[section_name] = config_section;
    }
}

ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) {
    if (node.IsSequence()) {
        std::vector<std::string> array_value;
        for (const auto& item : node) {
            array_value.push_back(expandVariables(item.as<std::string>()));
        }
        return ConfigValue(array_value);
    }

    if (!node.IsScalar()) {
        return ConfigValue();
    }

    const std::string str_val = node.as<std::string>();
    if (str_val == "true" || str_val == "false") {
        return ConfigValue(str_val == "true");
    }

    // EN: Quoted scalars stay strings.
    // FR: Les scalaires entre guillemets restent des chaînes.
    if (node.Tag() != "!") {
        if (str_val.find('.') == std::string::npos) {
            try {
                return ConfigValue(node.as<int>());
            } catch (const YAML::BadConversion&) {
                // EN: Not an int, continue. / FR: Pas un int, on continue.
            }
        }
        try {
            return ConfigValue(node.as<double>());
        } catch (const YAML::BadConversion&) {
            // EN: Not a double, treat as string. / FR: Pas un double, traité comme chaîne.
        }
    }

    return ConfigValue(expandVariables(str_val));
}

bool ConfigManager::saveToFile(const std::string& filename) const {
    YAML::Emitter emitter;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        emitter << YAML::BeginMap;

        for (const auto& [section_name, section] : sections_) {
            emitter << YAML::Key << section_name;
            emitter << YAML::Value << YAML::BeginMap;

            for (const std::string& key : section.keys()) {
                ConfigValue value = section.get(key);
                emitter << YAML::Key << key << YAML::Value;

                if (auto bool_val = value.tryAs<bool>()) {
                    emitter << *bool_val;
                } else if (auto int_val = value.tryAs<int>()) {
                    emitter << *int_val;
                } else if (auto double_val = value.tryAs<double>()) {
                    emitter << *double_val;
                } else if (auto array_val = value.tryAs<std::vector<std::string>>()) {
                    emitter << YAML::BeginSeq;
                    for (const auto& item : *array_val) {
                        emitter << item;
                    }
                    emitter << YAML::EndSeq;
                } else {
                    emitter << value.toString();
                }
            }

            emitter << YAML::EndMap;
        }

        emitter << YAML::EndMap;
    }

    std::ofstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR("config", "Failed to save configuration: cannot open " + filename);
        return false;
    }
    file << emitter.c_str();
    LOG_INFO("config", "Configuration saved to: " + filename);
    return true;
}

size_t ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t applied = 0;

    for (const auto& rule : validation_rules_) {
        size_t dot_pos = rule.key.find('.');
        if (dot_pos == std::string::npos) {
            continue;
        }
        std::string section_name = rule.key.substr(0, dot_pos);
        std::string key_name = rule.key.substr(dot_pos + 1);

        // EN: reconciler.default_timeout_minutes -> PRR_RECONCILER_DEFAULT_TIMEOUT_MINUTES
        // FR: reconciler.default_timeout_minutes -> PRR_RECONCILER_DEFAULT_TIMEOUT_MINUTES
        std::string env_name = prefix + section_name + "_" + key_name;
        std::transform(env_name.begin(), env_name.end(), env_name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

        const char* env_value = std::getenv(env_name.c_str());
        if (!env_value) {
            continue;
        }

        auto parsed = parseTyped(env_value, rule.type);
        if (!parsed) {
            LOG_WARN("config", "Ignoring environment override " + env_name + ": not a valid " + rule.type);
            continue;
        }
        sections_[section_name].set(key_name, *parsed);
        ++applied;
        LOG_INFO("config", "Environment override applied: " + rule.key);
    }

    return applied;
}

std::optional<ConfigValue> ConfigManager::parseTyped(const std::string& raw, const std::string& type) {
    if (type == "bool") {
        if (raw == "true" || raw == "1") return ConfigValue(true);
        if (raw == "false" || raw == "0") return ConfigValue(false);
        return std::nullopt;
    }
    if (type == "int" || type == "double") {
        char* end = nullptr;
        if (type == "int") {
            long value = std::strtol(raw.c_str(), &end, 10);
            if (end == raw.c_str() || *end != '\0') return std::nullopt;
            return ConfigValue(static_cast<int>(value));
        }
        double value = std::strtod(raw.c_str(), &end);
        if (end == raw.c_str() || *end != '\0') return std::nullopt;
        return ConfigValue(value);
    }
    if (type == "array") {
        std::vector<std::string> items;
        std::stringstream ss(raw);
        std::string item;
        while (std::getline(ss, item, ',')) {
            if (!item.empty()) items.push_back(item);
        }
        return ConfigValue(items);
    }
    return ConfigValue(raw);
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& rule : rules) {
        auto existing = std::find_if(validation_rules_.begin(), validation_rules_.end(),
                                     [&rule](const ValidationRule& r) { return r.key == rule.key; });
        if (existing != validation_rules_.end()) {
            *existing = rule;
        } else {
            validation_rules_.push_back(rule);
        }
    }
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    errors.clear();

    for (const auto& rule : validation_rules_) {
        size_t dot_pos = rule.key.find('.');
        std::string section_name = (dot_pos != std::string::npos) ?
            rule.key.substr(0, dot_pos) : "default";
        std::string key_name = (dot_pos != std::string::npos) ?
            rule.key.substr(dot_pos + 1) : rule.key;

        ConfigValue value = getUnlocked(section_name, key_name);
        if (!value.isValid()) {
            if (rule.required) {
                errors.push_back("Required configuration missing: " + rule.key);
            }
            continue;
        }

        std::string error;
        if (!validateValue(rule.key, value, rule, error)) {
            errors.push_back(error);
        }
    }

    return errors.empty();
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return getUnlocked(section, key);
}

ConfigValue ConfigManager::getUnlocked(const std::string& section, const std::string& key) const {
    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        return section_it->second.get(key);
    }
    return ConfigValue();
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section].set(key, value);
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto section_it = sections_.find(section);
    return section_it != sections_.end() && section_it->second.has(key);
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
    return it != sections_.end() ? it->second : ConfigSection();
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
    validation_rules_.clear();
}

std::string ConfigManager::dump() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    for (const auto& [name, _] : sections_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());

    std::ostringstream oss;
    for (const auto& section_name : names) {
        const auto& section = sections_.at(section_name);
        oss << "[" << section_name << "]\n";
        for (const std::string& key : section.keys()) {
            oss << "  " << key << " = " << section.get(key).toString() << "\n";
        }
        oss << "\n";
    }
    return oss.str();
}

bool ConfigManager::validateValue(const std::string& key, const ConfigValue& value,
                                  const ValidationRule& rule, std::string& error) const {
    if (rule.type == "bool" && !value.tryAs<bool>()) {
        error = "Configuration " + key + " must be a boolean";
        return false;
    } else if (rule.type == "int" && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be an integer";
        return false;
    } else if (rule.type == "double" && !value.asNumber()) {
        error = "Configuration " + key + " must be a number";
        return false;
    } else if (rule.type == "string" && !value.tryAs<std::string>()) {
        error = "Configuration " + key + " must be a string";
        return false;
    } else if (rule.type == "array" && !value.tryAs<std::vector<std::string>>()) {
        error = "Configuration " + key + " must be an array";
        return false;
    }

    if ((rule.type == "int" || rule.type == "double") && (rule.min_value || rule.max_value)) {
        double numeric_value = value.asNumber().value_or(0.0);
        if (rule.min_value && numeric_value < *rule.min_value) {
            error = "Configuration " + key + " must be >= " + std::to_string(*rule.min_value);
            return false;
        }
        if (rule.max_value && numeric_value > *rule.max_value) {
            error = "Configuration " + key + " must be <= " + std::to_string(*rule.max_value);
            return false;
        }
    }

    if (!rule.allowed_values.empty()) {
        std::string str_value = value.toString();
        if (std::find(rule.allowed_values.begin(), rule.allowed_values.end(), str_value) ==
            rule.allowed_values.end()) {
            error = "Configuration " + key + " must be one of: ";
            for (size_t i = 0; i < rule.allowed_values.size(); ++i) {
                if (i > 0) error += ", ";
                error += rule.allowed_values[i];
            }
            return false;
        }
    }

    return true;
}

std::string ConfigManager::expandVariables(const std::string& value) {
    static const std::regex var_regex(R"(\$\{([^}]+)\})");
    std::string result;
    auto begin = std::sregex_iterator(value.begin(), value.end(), var_regex);
    auto end = std::sregex_iterator();
    size_t last = 0;

    for (auto it = begin; it != end; ++it) {
        const auto& match = *it;
        result += value.substr(last, static_cast<size_t>(match.position()) - last);
        const char* env_value = std::getenv(match[1].str().c_str());
        // EN: Unknown variables are left as-is.
        // FR: Les variables inconnues sont laissées telles quelles.
        result += env_value ? std::string(env_value) : match.str();
        last = static_cast<size_t>(match.position() + match.length());
    }
    result += value.substr(last);
    return result;
}

} // namespace PRR
