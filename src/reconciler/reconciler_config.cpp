// EN: ReconcilerConfig loading from the configuration manager
// FR: Chargement de ReconcilerConfig depuis le gestionnaire de configuration

#include "reconciler/reconciler_config.hpp"

#include <cmath>

namespace PRR::Reconciler {

namespace {

std::optional<double> numberAt(const ConfigManager& config, const std::string& section, const std::string& key) {
    return config.get(section, key).asNumber();
}

std::optional<std::string> stringAt(const ConfigManager& config, const std::string& section, const std::string& key) {
    return config.get(section, key).tryAs<std::string>();
}

} // namespace

ReconcilerConfig ReconcilerConfig::fromConfigManager(const ConfigManager& config) {
    ReconcilerConfig result;

    if (auto minutes = numberAt(config, "reconciler", "default_timeout_minutes")) {
        result.default_timeout = std::chrono::milliseconds(static_cast<long long>(std::llround(*minutes * 60000.0)));
    }
    if (auto seconds = numberAt(config, "reconciler", "resync_period_seconds")) {
        result.resync_period = std::chrono::milliseconds(static_cast<long long>(std::llround(*seconds * 1000.0)));
    }
    if (auto account = stringAt(config, "reconciler", "default_service_account")) {
        result.default_service_account = *account;
    }
    if (auto size = stringAt(config, "reconciler", "pvc_storage_size")) {
        result.pvc_storage_size = *size;
    }
    if (auto mode = stringAt(config, "reconciler", "pvc_access_mode")) {
        result.pvc_access_mode = *mode;
    }

    if (auto workers = numberAt(config, "controller", "workers")) {
        result.workers = static_cast<size_t>(*workers);
    }
    if (auto initial = numberAt(config, "controller", "retry_initial_delay_ms")) {
        result.retry_initial_delay = std::chrono::milliseconds(static_cast<long long>(*initial));
    }
    if (auto max_delay = numberAt(config, "controller", "retry_max_delay_ms")) {
        result.retry_max_delay = std::chrono::milliseconds(static_cast<long long>(*max_delay));
    }
    if (auto multiplier = numberAt(config, "controller", "retry_backoff_multiplier")) {
        result.retry_backoff_multiplier = *multiplier;
    }

    if (auto level = stringAt(config, "logging", "level")) {
        result.log_level = *level;
    }
    if (auto file = stringAt(config, "logging", "file")) {
        if (!file->empty()) {
            result.log_file = *file;
        }
    }

    return result;
}

std::vector<ConfigManager::ValidationRule> ReconcilerConfig::validationRules() {
    using Rule = ConfigManager::ValidationRule;
    return {
        Rule{"reconciler.default_timeout_minutes", "int", false, 0.0, std::nullopt, {},
             "Run timeout applied when a PipelineRun sets none (0 disables it)"},
        Rule{"reconciler.resync_period_seconds", "int", false, 1.0, std::nullopt, {},
             "Requeue interval for runs that are not finished"},
        Rule{"reconciler.default_service_account", "string", false, std::nullopt, std::nullopt, {},
             "Service account used when the run names none"},
        Rule{"reconciler.pvc_storage_size", "string", false, std::nullopt, std::nullopt, {},
             "Storage request of the resource-sharing volume claim"},
        Rule{"reconciler.pvc_access_mode", "string", false, std::nullopt, std::nullopt,
             {"ReadWriteOnce", "ReadWriteMany", "ReadOnlyMany"},
             "Access mode of the resource-sharing volume claim"},
        Rule{"controller.workers", "int", false, 1.0, 64.0, {}, "Concurrent reconcile workers"},
        Rule{"controller.retry_initial_delay_ms", "int", false, 1.0, std::nullopt, {}, "First retry delay"},
        Rule{"controller.retry_max_delay_ms", "int", false, 1.0, std::nullopt, {}, "Retry delay cap"},
        Rule{"controller.retry_backoff_multiplier", "double", false, 1.0, std::nullopt, {}, "Retry delay growth"},
        Rule{"logging.level", "string", false, std::nullopt, std::nullopt,
             {"debug", "info", "warn", "error"}, "Minimum log level"},
        Rule{"logging.file", "string", false, std::nullopt, std::nullopt, {}, "NDJSON log file"},
    };
}

RetryConfig ReconcilerConfig::toRetryConfig() const {
    return ErrorRecoveryUtils::createRequeueRetryConfig(retry_initial_delay, retry_max_delay,
                                                        retry_backoff_multiplier);
}

} // namespace PRR::Reconciler
