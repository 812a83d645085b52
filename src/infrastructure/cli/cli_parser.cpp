// EN: Command-line parser implementation
// FR: Implémentation de l'analyseur de ligne de commande

#include "infrastructure/cli/cli_parser.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace PRR::CLI {

std::optional<std::string> CliParseResult::get(const std::string& name) const {
    auto it = values.find(name);
    if (it == values.end()) {
        return std::nullopt;
    }
    return it->second;
}

CliParser::CliParser(std::string program_name, std::string version)
    : program_name_(std::move(program_name)), version_(std::move(version)) {}

void CliParser::addOption(const CliOptionDefinition& option) {
    auto existing = std::find_if(options_.begin(), options_.end(), [&option](const CliOptionDefinition& o) {
        return o.long_name == option.long_name;
    });
    if (existing != options_.end()) {
        *existing = option;
    } else {
        options_.push_back(option);
    }
}

void CliParser::addOptions(const std::vector<CliOptionDefinition>& options) {
    for (const auto& option : options) {
        addOption(option);
    }
}

const CliOptionDefinition* CliParser::findLong(const std::string& name) const {
    for (const auto& option : options_) {
        if (option.long_name == name) {
            return &option;
        }
    }
    return nullptr;
}

const CliOptionDefinition* CliParser::findShort(char name) const {
    for (const auto& option : options_) {
        if (option.short_name && *option.short_name == name) {
            return &option;
        }
    }
    return nullptr;
}

CliParseResult CliParser::parse(int argc, char* argv[]) const {
    std::vector<std::string> arguments;
    for (int i = 1; i < argc; ++i) { // EN: Skip program name / FR: Ignorer le nom du programme
        arguments.emplace_back(argv[i]);
    }
    return parse(arguments);
}

CliParseResult CliParser::parse(const std::vector<std::string>& arguments) const {
    CliParseResult result;

    for (size_t i = 0; i < arguments.size(); ++i) {
        const std::string& arg = arguments[i];

        if (arg == "--help" || arg == "-h") {
            result.status = CliParseStatus::HELP_REQUESTED;
            return result;
        }
        if (arg == "--version" || arg == "-v") {
            result.status = CliParseStatus::VERSION_REQUESTED;
            return result;
        }

        const CliOptionDefinition* option = nullptr;
        std::optional<std::string> inline_value;

        if (arg.rfind("--", 0) == 0 && arg.size() > 2) {
            std::string name = arg.substr(2);
            auto eq = name.find('=');
            if (eq != std::string::npos) {
                inline_value = name.substr(eq + 1);
                name = name.substr(0, eq);
            }
            option = findLong(name);
        } else if (arg.size() == 2 && arg[0] == '-') {
            option = findShort(arg[1]);
        }

        if (!option) {
            result.status = CliParseStatus::INVALID_OPTION;
            result.errors.push_back("Unknown option: " + arg);
            return result;
        }

        std::string raw;
        if (option->type == CliOptionType::BOOLEAN) {
            raw = inline_value ? *inline_value : "true";
        } else if (inline_value) {
            raw = *inline_value;
        } else if (i + 1 < arguments.size()) {
            raw = arguments[++i];
        } else {
            result.status = CliParseStatus::MISSING_VALUE;
            result.errors.push_back("Missing value for --" + option->long_name);
            return result;
        }

        auto value = CliParserUtils::parseCliValue(raw, option->type);
        if (!value) {
            result.status = CliParseStatus::INVALID_VALUE;
            result.errors.push_back("Invalid value for --" + option->long_name + ": " + raw);
            return result;
        }

        result.values[option->long_name] = raw;
        if (!option->config_path.empty()) {
            result.overrides[option->config_path] = *value;
        }
    }

    for (const auto& option : options_) {
        if (option.default_value && result.values.count(option.long_name) == 0) {
            result.values[option.long_name] = *option.default_value;
        }
    }

    return result;
}

size_t CliParser::applyOverrides(const CliParseResult& result, ConfigManager& config) {
    size_t applied = 0;
    for (const auto& [path, value] : result.overrides) {
        auto dot = path.find('.');
        if (dot == std::string::npos) {
            LOG_WARN("cli", "Ignoring override without section: " + path);
            continue;
        }
        config.set(path.substr(0, dot), path.substr(dot + 1), value);
        ++applied;
        LOG_DEBUG("cli", "Command-line override applied: " + path);
    }
    return applied;
}

std::string CliParser::generateHelpText() const {
    std::ostringstream out;
    out << "Usage: " << program_name_ << " [OPTIONS]\n\nOptions:\n";
    auto line = [&out](const std::string& flags, const std::string& description) {
        out << "  " << std::left << std::setw(28) << flags << description << "\n";
    };
    for (const auto& option : options_) {
        std::string flags = option.short_name ? std::string("-") + *option.short_name + ", " : "    ";
        flags += "--" + option.long_name;
        if (option.type != CliOptionType::BOOLEAN) {
            flags += option.type == CliOptionType::INTEGER ? " N" : " VALUE";
        }
        std::string description = option.description;
        if (option.default_value) {
            description += " (default: " + *option.default_value + ")";
        }
        line(flags, description);
    }
    line("-h, --help", "Show this help");
    line("-v, --version", "Show version information");
    return out.str();
}

std::string CliParser::generateVersionText() const {
    return program_name_ + " " + version_;
}

namespace CliParserUtils {

std::string cliParseStatusToString(CliParseStatus status) {
    switch (status) {
        case CliParseStatus::SUCCESS: return "SUCCESS";
        case CliParseStatus::HELP_REQUESTED: return "HELP_REQUESTED";
        case CliParseStatus::VERSION_REQUESTED: return "VERSION_REQUESTED";
        case CliParseStatus::INVALID_OPTION: return "INVALID_OPTION";
        case CliParseStatus::MISSING_VALUE: return "MISSING_VALUE";
        case CliParseStatus::INVALID_VALUE: return "INVALID_VALUE";
        default: return "UNKNOWN";
    }
}

std::optional<ConfigValue> parseCliValue(const std::string& raw, CliOptionType type) {
    switch (type) {
        case CliOptionType::BOOLEAN:
            if (raw == "true" || raw == "1") return ConfigValue(true);
            if (raw == "false" || raw == "0") return ConfigValue(false);
            return std::nullopt;
        case CliOptionType::INTEGER: {
            if (raw.empty()) return std::nullopt;
            char* end = nullptr;
            long value = std::strtol(raw.c_str(), &end, 10);
            if (*end != '\0') return std::nullopt;
            return ConfigValue(static_cast<int>(value));
        }
        case CliOptionType::STRING:
            return ConfigValue(raw);
    }
    return std::nullopt;
}

} // namespace CliParserUtils

} // namespace PRR::CLI
