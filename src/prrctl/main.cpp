// EN: prrctl - load a cluster snapshot, reconcile PipelineRuns against it and print the result
// FR: prrctl - charge un instantané de cluster, y réconcilie des PipelineRuns et affiche le résultat

#include "api/api_utils.hpp"
#include "infrastructure/cli/cli_parser.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "reconciler/pipeline_graph.hpp"
#include "reconciler/pipeline_run_reconciler.hpp"
#include "reconciler/reconcile_errors.hpp"
#include "reconciler/reconciler_config.hpp"
#include "store/in_memory_object_store.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr const char* PRRCTL_VERSION = "1.0.0";

using namespace PRR;

std::vector<CLI::CliOptionDefinition> prrctlOptions() {
    return {
        {"config", 'c', CLI::CliOptionType::STRING, "YAML configuration file", "", std::nullopt},
        {"state", 's', CLI::CliOptionType::STRING, "Cluster snapshot (JSON or YAML)", "", std::nullopt},
        {"key", 'k', CLI::CliOptionType::STRING, "PipelineRun to reconcile as namespace/name (default: all)", "",
         std::nullopt},
        {"passes", 'p', CLI::CliOptionType::INTEGER, "Reconcile passes per run", "", std::string("1")},
        {"output", 'o', CLI::CliOptionType::STRING, "Write the resulting snapshot here instead of stdout", "",
         std::nullopt},
        {"graph", 'g', CLI::CliOptionType::BOOLEAN, "Print the execution levels of each run's pipeline", "",
         std::nullopt},
        {"log-level", std::nullopt, CLI::CliOptionType::STRING, "Minimum log level", "logging.level", std::nullopt},
        {"default-timeout", std::nullopt, CLI::CliOptionType::INTEGER, "Default run timeout in minutes",
         "reconciler.default_timeout_minutes", std::nullopt},
    };
}

// EN: Keys of every PipelineRun in the snapshot, in document order.
// FR: Clés de chaque PipelineRun de l'instantané, dans l'ordre du document.
std::vector<std::string> pipelineRunKeys(const nlohmann::json& snapshot) {
    const nlohmann::json& items = snapshot.is_array() ? snapshot : snapshot.value("items", nlohmann::json::array());
    std::vector<std::string> keys;
    for (const auto& item : items) {
        if (item.value("kind", "") != Api::PIPELINE_RUN_KIND || !item.contains("metadata")) {
            continue;
        }
        const auto& metadata = item["metadata"];
        keys.push_back(Api::ApiUtils::objectKey(metadata.value("namespace", "default"), metadata.value("name", "")));
    }
    return keys;
}

void printGraph(const Store::IObjectStore& store, const std::string& key, std::ostream& out) {
    auto parts = Api::ApiUtils::splitObjectKey(key);
    if (!parts) {
        return;
    }
    Api::PipelineRun run = store.getPipelineRun(parts->first, parts->second);
    Api::PipelineSpec spec;
    if (run.status.pipeline_spec) {
        spec = *run.status.pipeline_spec;
    } else if (run.spec.pipeline_spec) {
        spec = *run.spec.pipeline_spec;
    } else if (run.spec.pipeline_ref) {
        spec = store.getPipeline(run.metadata.namespace_name, *run.spec.pipeline_ref).spec;
    }

    auto graph = Reconciler::PipelineGraph::build(spec);
    out << key << ":\n";
    size_t level_index = 0;
    for (const auto& level : graph.getExecutionLevels()) {
        out << "  level " << level_index++ << ":";
        for (const auto& node : level) {
            out << " " << node;
        }
        out << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::CliParser parser("prrctl", PRRCTL_VERSION);
    parser.addOptions(prrctlOptions());

    CLI::CliParseResult args = parser.parse(argc, argv);
    switch (args.status) {
        case CLI::CliParseStatus::HELP_REQUESTED:
            std::cout << parser.generateHelpText();
            std::cout << "\nLogs go to stdout only with --output or logging.file; otherwise they are silenced.\n";
            return 0;
        case CLI::CliParseStatus::VERSION_REQUESTED:
            std::cout << parser.generateVersionText() << std::endl;
            return 0;
        case CLI::CliParseStatus::SUCCESS:
            break;
        default:
            for (const auto& error : args.errors) {
                std::cerr << "prrctl: " << error << std::endl;
            }
            std::cerr << parser.generateHelpText();
            return 2;
    }

    auto state_path = args.get("state");
    if (!state_path) {
        std::cerr << "prrctl: --state is required" << std::endl;
        return 2;
    }

    auto& config_manager = ConfigManager::getInstance();
    config_manager.addValidationRules(Reconciler::ReconcilerConfig::validationRules());
    if (auto config_path = args.get("config")) {
        if (!config_manager.loadFromFile(*config_path)) {
            std::cerr << "prrctl: cannot load configuration " << *config_path << std::endl;
            return 1;
        }
    }
    config_manager.loadEnvironmentOverrides("PRR_");
    CLI::CliParser::applyOverrides(args, config_manager);

    std::vector<std::string> config_errors;
    if (!config_manager.validate(config_errors)) {
        for (const auto& error : config_errors) {
            std::cerr << "prrctl: " << error << std::endl;
        }
        return 1;
    }

    Reconciler::ReconcilerConfig config = Reconciler::ReconcilerConfig::fromConfigManager(config_manager);
    auto& logger = Logger::getInstance();
    logger.setLogLevel(Logger::parseLevel(config.log_level));
    if (config.log_file) {
        if (!logger.setOutputFile(*config.log_file)) {
            return 1;
        }
    } else if (!args.has("output")) {
        logger.setConsoleOutput(false);
    }

    Store::InMemoryObjectStore store;
    nlohmann::json snapshot;
    try {
        snapshot = Api::ApiUtils::loadDocument(*state_path);
        size_t loaded = store.loadSnapshot(snapshot);
        LOG_INFO("prrctl", "Loaded " + std::to_string(loaded) + " objects from " + *state_path);
    } catch (const std::exception& e) {
        std::cerr << "prrctl: cannot load state " << *state_path << ": " << e.what() << std::endl;
        return 1;
    }

    std::vector<std::string> keys;
    if (auto key = args.get("key")) {
        keys.push_back(*key);
    } else {
        keys = pipelineRunKeys(snapshot);
    }

    if (args.has("graph")) {
        for (const auto& key : keys) {
            try {
                printGraph(store, key, std::cerr);
            } catch (const std::exception& e) {
                std::cerr << key << ": " << e.what() << std::endl;
            }
        }
    }

    const int passes = std::max(1, std::stoi(args.get("passes").value_or("1")));
    Reconciler::PipelineRunReconciler reconciler(store, config);

    int exit_code = 0;
    for (int pass = 0; pass < passes; ++pass) {
        for (const auto& key : keys) {
            Reconciler::ReconcileResult result = reconciler.reconcile(key);
            if (!result.isSuccess()) {
                std::cerr << "prrctl: " << key << " pass " << pass + 1 << ": " << result.message << std::endl;
                exit_code = 3;
            }
        }
    }

    const std::string rendered = store.toSnapshot().dump(2);
    if (auto output = args.get("output")) {
        std::ofstream file(*output);
        if (!file) {
            std::cerr << "prrctl: cannot write " << *output << std::endl;
            return 1;
        }
        file << rendered << '\n';
    } else {
        std::cout << rendered << std::endl;
    }

    logger.flush();
    return exit_code;
}
