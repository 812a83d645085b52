// EN: Command-line parser for prrctl - typed options, some of them mapped onto configuration keys
// FR: Analyseur de ligne de commande pour prrctl - options typées, certaines liées à des clés de configuration

#pragma once

#include "infrastructure/config/config_manager.hpp"

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace PRR::CLI {

enum class CliOptionType {
    BOOLEAN,        // EN: Flag without value / FR: Drapeau sans valeur
    INTEGER,        // EN: Integer value / FR: Valeur entière
    STRING          // EN: String value / FR: Valeur chaîne
};

enum class CliParseStatus {
    SUCCESS,
    HELP_REQUESTED,
    VERSION_REQUESTED,
    INVALID_OPTION,
    MISSING_VALUE,
    INVALID_VALUE
};

struct CliOptionDefinition {
    std::string long_name;                          // EN: Without the leading dashes / FR: Sans les tirets initiaux
    std::optional<char> short_name;
    CliOptionType type = CliOptionType::STRING;
    std::string description;
    std::string config_path;                        // EN: "section.key" to override, or empty / FR: "section.clé" à surcharger, ou vide
    std::optional<std::string> default_value;
};

struct CliParseResult {
    CliParseStatus status = CliParseStatus::SUCCESS;
    std::map<std::string, std::string> values;      // EN: long_name -> raw value ("true" for flags) / FR: long_name -> valeur brute
    std::vector<std::string> errors;
    std::unordered_map<std::string, ConfigValue> overrides;

    bool has(const std::string& name) const { return values.count(name) > 0; }
    std::optional<std::string> get(const std::string& name) const;
};

class CliParser {
public:
    CliParser(std::string program_name, std::string version);

    void addOption(const CliOptionDefinition& option);
    void addOptions(const std::vector<CliOptionDefinition>& options);

    // EN: Accepts "--name value", "--name=value", "-n value" and bare flags. "--help" and
    // EN: "--version" are always known.
    // FR: Accepte "--nom valeur", "--nom=valeur", "-n valeur" et les drapeaux seuls. "--help" et
    // FR: "--version" sont toujours connus.
    CliParseResult parse(int argc, char* argv[]) const;
    CliParseResult parse(const std::vector<std::string>& arguments) const;

    // EN: Write every override into the configuration manager. Returns how many were applied.
    // FR: Écrit chaque surcharge dans le gestionnaire de configuration. Retourne le nombre appliqué.
    static size_t applyOverrides(const CliParseResult& result, ConfigManager& config);

    std::string generateHelpText() const;
    std::string generateVersionText() const;

private:
    const CliOptionDefinition* findLong(const std::string& name) const;
    const CliOptionDefinition* findShort(char name) const;

    std::string program_name_;
    std::string version_;
    std::vector<CliOptionDefinition> options_;
};

namespace CliParserUtils {

    std::string cliParseStatusToString(CliParseStatus status);

    // EN: Convert a raw value to the option's type; nullopt if it does not parse.
    // FR: Convertit une valeur brute au type de l'option ; nullopt si elle ne se parse pas.
    std::optional<ConfigValue> parseCliValue(const std::string& raw, CliOptionType type);

} // namespace CliParserUtils

} // namespace PRR::CLI
