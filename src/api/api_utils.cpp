// EN: API helper implementations - time formats, durations, names and the YAML to JSON bridge
// FR: Implémentations des utilitaires d'API - formats de temps, durées, noms et pont YAML vers JSON

#include "api/api_utils.hpp"

#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace PRR::Api {

namespace ApiUtils {

std::string formatTimestamp(const Timestamp& tp) {
    std::time_t time = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::optional<Timestamp> parseTimestamp(const std::string& text) {
    std::tm utc{};
    std::istringstream iss(text);
    iss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(timegm(&utc));
}

std::string formatDuration(Duration duration) {
    long long total_ms = duration.count();
    if (total_ms == 0) {
        return "0s";
    }

    std::ostringstream oss;
    if (total_ms < 0) {
        oss << "-";
        total_ms = -total_ms;
    }
    if (total_ms < 1000) {
        oss << total_ms << "ms";
        return oss.str();
    }

    long long hours = total_ms / 3600000;
    long long minutes = (total_ms % 3600000) / 60000;
    long long millis = total_ms % 60000;

    if (hours > 0) {
        oss << hours << "h" << minutes << "m";
    } else if (minutes > 0) {
        oss << minutes << "m";
    }
    if (millis % 1000 == 0) {
        oss << millis / 1000 << "s";
    } else {
        std::ostringstream secs;
        secs << std::fixed << std::setprecision(3) << (millis / 1000.0);
        std::string s = secs.str();
        while (!s.empty() && s.back() == '0') s.pop_back();
        oss << s << "s";
    }
    return oss.str();
}

// EN: Accepts sequences like "1h30m", "45s", "1.5s", "250ms"; a bare "0" is zero.
// FR: Accepte des séquences comme "1h30m", "45s", "1.5s", "250ms" ; un "0" seul vaut zéro.
std::optional<Duration> parseDuration(const std::string& text) {
    if (text == "0") {
        return Duration{0};
    }
    if (text.empty()) {
        return std::nullopt;
    }

    double total_ms = 0.0;
    size_t pos = 0;
    bool negative = false;
    if (text[0] == '-') {
        negative = true;
        pos = 1;
    }

    while (pos < text.size()) {
        size_t start = pos;
        while (pos < text.size() && (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.')) {
            ++pos;
        }
        if (start == pos) {
            return std::nullopt;
        }
        const std::string number = text.substr(start, pos - start);
        char* end = nullptr;
        double value = std::strtod(number.c_str(), &end);
        if (end == number.c_str() || *end != '\0') {
            return std::nullopt;
        }

        size_t unit_start = pos;
        while (pos < text.size() && std::isalpha(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        std::string unit = text.substr(unit_start, pos - unit_start);

        if (unit == "h") total_ms += value * 3600000.0;
        else if (unit == "m") total_ms += value * 60000.0;
        else if (unit == "s") total_ms += value * 1000.0;
        else if (unit == "ms") total_ms += value;
        else return std::nullopt;
    }

    auto ms = static_cast<long long>(std::llround(total_ms));
    return Duration{negative ? -ms : ms};
}

bool isValidDnsLabel(const std::string& name) {
    if (name.empty() || name.size() > 63) {
        return false;
    }
    auto alnum = [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
    };
    if (!alnum(name.front()) || !alnum(name.back())) {
        return false;
    }
    for (char c : name) {
        if (!alnum(c) && c != '-') {
            return false;
        }
    }
    return true;
}

std::string objectKey(const std::string& namespace_name, const std::string& name) {
    return namespace_name + "/" + name;
}

std::optional<std::pair<std::string, std::string>> splitObjectKey(const std::string& key) {
    size_t slash = key.find('/');
    if (slash == std::string::npos || key.find('/', slash + 1) != std::string::npos) {
        return std::nullopt;
    }
    std::string ns = key.substr(0, slash);
    std::string name = key.substr(slash + 1);
    if (ns.empty() || name.empty()) {
        return std::nullopt;
    }
    return std::make_pair(ns, name);
}

std::string conditionStatusToString(ConditionStatus status) {
    switch (status) {
        case ConditionStatus::TRUE:    return "True";
        case ConditionStatus::FALSE:   return "False";
        case ConditionStatus::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

nlohmann::json yamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(yamlToJson(item));
            }
            return array;
        }
        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& item : node) {
                object[item.first.as<std::string>()] = yamlToJson(item.second);
            }
            return object;
        }
        case YAML::NodeType::Scalar:
            break;
    }

    const std::string scalar = node.Scalar();
    // EN: Quoted scalars stay strings; plain ones are typed like YAML 1.2 core schema.
    // FR: Les scalaires entre guillemets restent des chaînes ; les autres sont typés selon le schéma YAML 1.2.
    if (node.Tag() == "!") {
        return scalar;
    }
    if (scalar == "true" || scalar == "false") {
        return scalar == "true";
    }
    if (scalar == "null" || scalar == "~") {
        return nullptr;
    }
    const char first = scalar.empty() ? '\0' : scalar.front();
    if (std::isdigit(static_cast<unsigned char>(first)) || first == '-' || first == '+' || first == '.') {
        char* end = nullptr;
        long long integer = std::strtoll(scalar.c_str(), &end, 10);
        if (*end == '\0') {
            return integer;
        }
        double number = std::strtod(scalar.c_str(), &end);
        if (*end == '\0') {
            return number;
        }
    }
    return scalar;
}

nlohmann::json loadDocument(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("File not found: " + path);
    }

    std::string extension = std::filesystem::path(path).extension().string();
    if (extension == ".yaml" || extension == ".yml") {
        return yamlToJson(YAML::LoadFile(path));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    return nlohmann::json::parse(file);
}

} // namespace ApiUtils

} // namespace PRR::Api
