// EN: Error Recovery for the PipelineRun reconciler - exponential backoff with jitter for requeued work
// FR: Récupération d'erreur pour le réconciliateur PipelineRun - backoff exponentiel avec jitter pour le travail remis en file

#pragma once

#include <chrono>
#include <random>
#include <string>
#include <vector>

namespace PRR {

// EN: Retry configuration for exponential backoff.
// FR: Configuration de retry pour le backoff exponentiel.
struct RetryConfig {
    size_t max_attempts = 0;                                   // EN: 0 means retry forever / FR: 0 signifie réessayer indéfiniment
    std::chrono::milliseconds initial_delay{100};              // EN: First delay / FR: Premier délai
    std::chrono::milliseconds max_delay{30000};                // EN: Delay cap / FR: Plafond du délai
    double backoff_multiplier = 2.0;                           // EN: Growth factor / FR: Facteur de croissance
    double jitter_factor = 0.1;                                // EN: Jitter as fraction of delay / FR: Jitter en fraction du délai
    bool enable_jitter = true;
};

// EN: Information about one failed attempt.
// FR: Informations sur une tentative échouée.
struct RetryAttempt {
    size_t attempt_number = 0;
    std::chrono::system_clock::time_point timestamp;
    std::chrono::milliseconds delay{0};
    std::string error_message;
};

// EN: Per-operation retry state. Not thread-safe; owned by one caller at a time.
// FR: État de retry par opération. Non thread-safe ; détenu par un seul appelant à la fois.
class RetryContext {
public:
    RetryContext(const std::string& operation_name, const RetryConfig& config);

    // EN: Record a failed attempt and return the delay to wait before the next one.
    // FR: Enregistre une tentative échouée et retourne le délai avant la suivante.
    std::chrono::milliseconds recordAttempt(const std::string& error_message);

    // EN: Check if another attempt is allowed.
    // FR: Vérifie si une autre tentative est permise.
    bool canRetry() const;

    // EN: Delay for the next attempt given the attempts recorded so far.
    // FR: Délai pour la prochaine tentative selon les tentatives déjà enregistrées.
    std::chrono::milliseconds getNextDelay() const;

    void reset();

    size_t getCurrentAttempt() const { return current_attempt_; }
    const std::vector<RetryAttempt>& getAttempts() const { return attempts_; }
    const std::string& getOperationName() const { return operation_name_; }

private:
    std::chrono::milliseconds calculateDelayWithJitter(std::chrono::milliseconds base_delay) const;

    RetryConfig config_;
    std::string operation_name_;
    size_t current_attempt_ = 0;
    std::vector<RetryAttempt> attempts_;
    mutable std::mt19937 jitter_generator_;
};

// EN: Utility functions for common retry configurations.
// FR: Fonctions utilitaires pour les configurations de retry courantes.
namespace ErrorRecoveryUtils {

    // EN: Backoff used when a reconcile pass reports a retryable error.
    // FR: Backoff utilisé quand une passe de réconciliation signale une erreur récupérable.
    RetryConfig createRequeueRetryConfig(std::chrono::milliseconds initial_delay,
                                         std::chrono::milliseconds max_delay,
                                         double multiplier);

    // EN: Format a delay for log lines ("250ms", "3.5s").
    // FR: Formate un délai pour les lignes de log ("250ms", "3.5s").
    std::string formatDelay(std::chrono::milliseconds delay);

} // namespace ErrorRecoveryUtils

} // namespace PRR
