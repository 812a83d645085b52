// EN: Immutable reconciler and controller settings, read once from the ConfigManager
// FR: Paramètres immuables du réconciliateur et du contrôleur, lus une fois depuis le ConfigManager

#pragma once

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/system/error_recovery.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace PRR::Reconciler {

struct ReconcilerConfig {
    std::chrono::milliseconds default_timeout{std::chrono::minutes(60)};
    std::chrono::milliseconds resync_period{std::chrono::seconds(30)};
    std::string default_service_account = "default";
    std::string pvc_storage_size = "5Gi";
    std::string pvc_access_mode = "ReadWriteOnce";

    size_t workers = 4;
    std::chrono::milliseconds retry_initial_delay{100};
    std::chrono::milliseconds retry_max_delay{30000};
    double retry_backoff_multiplier = 2.0;

    std::string log_level = "info";
    std::optional<std::string> log_file;

    // EN: Build from the "reconciler", "controller" and "logging" sections; missing keys keep defaults.
    // FR: Construit depuis les sections "reconciler", "controller" et "logging" ; les clés absentes gardent leur défaut.
    static ReconcilerConfig fromConfigManager(const ConfigManager& config = ConfigManager::getInstance());

    // EN: Rules for every key above, so validation and PRR_* environment overrides know them.
    // FR: Règles pour chaque clé ci-dessus, pour que la validation et les surcharges PRR_* les connaissent.
    static std::vector<ConfigManager::ValidationRule> validationRules();

    RetryConfig toRetryConfig() const;
};

} // namespace PRR::Reconciler
