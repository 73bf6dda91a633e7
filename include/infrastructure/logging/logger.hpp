// EN: Thread-safe NDJSON logger shared by the validation engine and the fpctl front-end.
// FR: Logger NDJSON thread-safe partagé par le moteur de validation et le front-end fpctl.

#pragma once

#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>

namespace FP {

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
    LogLevel getLogLevel() const;

    // EN: Set output file for logging (disables console output).
    // FR: Définit le fichier de sortie (désactive la sortie console).
    void setOutputFile(const std::string& filename);

    // EN: Enable or disable the console sink (stderr).
    // FR: Active ou désactive la sortie console (stderr).
    void setConsoleOutput(bool enabled);

    // EN: Set correlation ID for all subsequent log entries.
    // FR: Définit l'ID de corrélation pour toutes les entrées suivantes.
    void setCorrelationId(const std::string& correlation_id);

    // EN: Add global metadata that will be included in all log entries.
    // FR: Ajoute des métadonnées globales incluses dans toutes les entrées.
    void addGlobalMetadata(const std::string& key, const std::string& value);
    void clearGlobalMetadata();

    // EN: Log a message with specified level.
    // FR: Enregistre un message avec le niveau spécifié.
    void log(LogLevel level, const std::string& module, const std::string& message);
    void log(LogLevel level, const std::string& module, const std::string& message,
             const std::unordered_map<std::string, std::string>& metadata);

    // EN: Log convenience methods for different levels.
    // FR: Méthodes de log pratiques pour différents niveaux.
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

    // EN: Format a log entry as a single NDJSON line (exposed for tests).
    // FR: Formate une entrée de log en une ligne NDJSON (exposé pour les tests).
    std::string formatAsNDJSON(const LogEntry& entry) const;

    // EN: Parse a level name ("debug", "info", "warn", "error"); nullopt when unknown.
    // FR: Analyse un nom de niveau ("debug", "info", "warn", "error") ; nullopt si inconnu.
    static std::optional<LogLevel> levelFromString(const std::string& name);
    static std::string levelToString(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // EN: Write a log entry to the configured output.
    // FR: Écrit une entrée de log vers la sortie configurée.
    void writeEntry(const LogEntry& entry);

    // EN: Convert timestamp to ISO8601 format.
    // FR: Convertit le timestamp au format ISO8601.
    static std::string timestampToISO8601(const std::chrono::system_clock::time_point& tp);

    // EN: Get current thread ID as string.
    // FR: Obtient l'ID du thread courant en chaîne.
    static std::string getThreadId();

    LogLevel current_level_ = LogLevel::INFO;
    std::string correlation_id_;
    std::unordered_map<std::string, std::string> global_metadata_;
    std::unique_ptr<std::ofstream> log_file_;
    mutable std::mutex mutex_;
    bool console_output_ = true;

    friend class ScopedLogContext;
};

// EN: Tags every entry logged during one validation run with a correlation ID and run metadata.
//     The previous correlation ID and global metadata are restored on destruction.
// FR: Marque chaque entrée émise pendant une validation avec un ID de corrélation et des métadonnées.
//     L'ID de corrélation et les métadonnées globales précédents sont restaurés à la destruction.
class ScopedLogContext {
public:
    ScopedLogContext(const std::string& correlation_id,
                     const std::unordered_map<std::string, std::string>& metadata);
    ~ScopedLogContext();

    ScopedLogContext(const ScopedLogContext&) = delete;
    ScopedLogContext& operator=(const ScopedLogContext&) = delete;

    const std::string& correlationId() const { return correlation_id_; }

private:
    std::string correlation_id_;
    std::string previous_correlation_id_;
    std::unordered_map<std::string, std::string> previous_metadata_;
};

#define LOG_DEBUG(module, message) FP::Logger::getInstance().debug(module, message)
#define LOG_INFO(module, message) FP::Logger::getInstance().info(module, message)
#define LOG_WARN(module, message) FP::Logger::getInstance().warn(module, message)
#define LOG_ERROR(module, message) FP::Logger::getInstance().error(module, message)

#define LOG_DEBUG_META(module, message, metadata) FP::Logger::getInstance().debug(module, message, metadata)
#define LOG_INFO_META(module, message, metadata) FP::Logger::getInstance().info(module, message, metadata)
#define LOG_WARN_META(module, message, metadata) FP::Logger::getInstance().warn(module, message, metadata)
#define LOG_ERROR_META(module, message, metadata) FP::Logger::getInstance().error(module, message, metadata)

} // namespace FP
