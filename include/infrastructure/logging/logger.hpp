// EN: Structured logger for the PipelineRun reconciler - NDJSON lines with correlation IDs
// FR: Logger structuré pour le réconciliateur PipelineRun - lignes NDJSON avec IDs de corrélation

#pragma once

#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace PRR {

// EN: Log levels enumeration.
// FR: Énumération des niveaux de log.
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// EN: Thread-safe singleton logger with NDJSON output and correlation IDs.
// FR: Logger singleton thread-safe avec sortie NDJSON et IDs de corrélation.
class Logger {
public:
    // EN: Structure representing a log entry.
    // FR: Structure représentant une entrée de log.
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level;
        std::string message;
        std::string correlation_id;
        std::string module;
        std::string thread_id;
        std::unordered_map<std::string, std::string> metadata;
    };

    // EN: Get the singleton instance.
    // FR: Obtient l'instance singleton.
    static Logger& getInstance();

    // EN: Set the minimum log level.
    // FR: Définit le niveau de log minimum.
    void setLogLevel(LogLevel level);

    // EN: Set output file for logging (disables console output).
    // FR: Définit le fichier de sortie (désactive la sortie console).
    bool setOutputFile(const std::string& filename);

    // EN: Enable or disable console output.
    // FR: Active ou désactive la sortie console.
    void setConsoleOutput(bool enabled);

    // EN: Set correlation ID for log entries emitted by the calling thread.
    // FR: Définit l'ID de corrélation pour les entrées émises par le thread appelant.
    void setCorrelationId(const std::string& correlation_id);
    void clearCorrelationId();
    std::string getCorrelationId() const;

    // EN: Add global metadata that will be included in all log entries.
    // FR: Ajoute des métadonnées globales incluses dans toutes les entrées.
    void addGlobalMetadata(const std::string& key, const std::string& value);

    void log(LogLevel level, const std::string& module, const std::string& message);
    void log(LogLevel level, const std::string& module, const std::string& message,
             const std::unordered_map<std::string, std::string>& metadata);

    void debug(const std::string& module, const std::string& message);
    void info(const std::string& module, const std::string& message);
    void warn(const std::string& module, const std::string& message);
    void error(const std::string& module, const std::string& message);

    void debug(const std::string& module, const std::string& message,
               const std::unordered_map<std::string, std::string>& metadata);
    void info(const std::string& module, const std::string& message,
              const std::unordered_map<std::string, std::string>& metadata);
    void warn(const std::string& module, const std::string& message,
              const std::unordered_map<std::string, std::string>& metadata);
    void error(const std::string& module, const std::string& message,
               const std::unordered_map<std::string, std::string>& metadata);

    // EN: Flush all pending log entries to output.
    // FR: Vide toutes les entrées en attente vers la sortie.
    void flush();

    // EN: Generate a new correlation ID (UUID-like format).
    // FR: Génère un nouvel ID de corrélation (format UUID).
    std::string generateCorrelationId();

    // EN: Parse a level name ("debug", "INFO", ...). Unknown names map to INFO.
    // FR: Parse un nom de niveau ("debug", "INFO", ...). Les noms inconnus donnent INFO.
    static LogLevel parseLevel(const std::string& name);

    // EN: Format log entry as one NDJSON line.
    // FR: Formate l'entrée de log en une ligne NDJSON.
    static std::string formatAsNDJSON(const LogEntry& entry);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void writeEntry(const LogEntry& entry);

    static std::string levelToString(LogLevel level);
    static std::string timestampToISO8601(const std::chrono::system_clock::time_point& tp);
    static std::string getThreadId();

    LogLevel current_level_ = LogLevel::INFO;
    std::unordered_map<std::string, std::string> global_metadata_;
    std::unique_ptr<std::ofstream> log_file_;
    mutable std::mutex mutex_;
    bool console_output_ = true;
};

// EN: Tags every line the current thread logs while in scope; the previous ID comes back on exit.
// FR: Marque chaque ligne loggée par le thread courant dans la portée ; l'ID précédent revient à la sortie.
class ScopedCorrelationId {
public:
    explicit ScopedCorrelationId(const std::string& correlation_id);
    ~ScopedCorrelationId();

    ScopedCorrelationId(const ScopedCorrelationId&) = delete;
    ScopedCorrelationId& operator=(const ScopedCorrelationId&) = delete;

private:
    std::string previous_;
};

#define LOG_DEBUG(module, message) PRR::Logger::getInstance().debug(module, message)
#define LOG_INFO(module, message) PRR::Logger::getInstance().info(module, message)
#define LOG_WARN(module, message) PRR::Logger::getInstance().warn(module, message)
#define LOG_ERROR(module, message) PRR::Logger::getInstance().error(module, message)

#define LOG_DEBUG_META(module, message, metadata) PRR::Logger::getInstance().debug(module, message, metadata)
#define LOG_INFO_META(module, message, metadata) PRR::Logger::getInstance().info(module, message, metadata)
#define LOG_WARN_META(module, message, metadata) PRR::Logger::getInstance().warn(module, message, metadata)
#define LOG_ERROR_META(module, message, metadata) PRR::Logger::getInstance().error(module, message, metadata)

} // namespace PRR
