// EN: Audit logger for daoctl - one formatted line per event, sent to console, per-run file and a memory ring
// FR: Logger d'audit pour daoctl - une ligne formatée par événement, envoyée vers console, fichier par exécution et anneau mémoire

#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <fstream>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace DAO {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// EN: TEXT is "[local time] LEVEL [module] [cve] message k=v"; NDJSON is one JSON object per line.
// FR: TEXT donne "[heure locale] NIVEAU [module] [cve] message k=v" ; NDJSON un objet JSON par ligne.
enum class LogFormat {
    TEXT = 0,
    NDJSON = 1
};

// EN: Process-wide logger. Every call is serialised; a failing sink is dropped and never reaches the caller.
// FR: Logger global au processus. Chaque appel est sérialisé ; une sortie défaillante est abandonnée sans atteindre l'appelant.
class Logger {
public:
    using Metadata = std::unordered_map<std::string, std::string>;

    static Logger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    void setFormat(LogFormat format);
    void setConsoleOutput(bool enabled);

    // EN: Append to `filename` in addition to the console. Any previous file is closed first.
    // FR: Ajoute à `filename` en plus de la console. Un fichier précédent est d'abord fermé.
    bool setOutputFile(const std::string& filename);
    void closeOutputFile();
    std::string getOutputFile() const;

    // EN: The CVE context stamped on every line until changed.
    // FR: Le contexte CVE apposé sur chaque ligne jusqu'à modification.
    void setCorrelationId(const std::string& correlation_id);
    std::string getCorrelationId() const;

    // EN: Fields added to every entry; an entry's own metadata wins on key clashes.
    // FR: Champs ajoutés à chaque entrée ; les métadonnées propres à l'entrée l'emportent en cas de conflit.
    void addGlobalMetadata(const std::string& key, const std::string& value);
    void clearGlobalMetadata();

    void log(LogLevel level, const std::string& module, const std::string& message,
             const Metadata& metadata = {});

    void debug(const std::string& module, const std::string& message, const Metadata& metadata = {});
    void info(const std::string& module, const std::string& message, const Metadata& metadata = {});
    void warn(const std::string& module, const std::string& message, const Metadata& metadata = {});
    void error(const std::string& module, const std::string& message, const Metadata& metadata = {});

    // EN: The memory ring keeps the last `capacity` lines; 0 disables it.
    // FR: L'anneau mémoire garde les `capacity` dernières lignes ; 0 le désactive.
    void setRecentCapacity(size_t capacity);
    std::vector<std::string> getRecentLines() const;
    void clearRecentLines();

    // EN: Back to INFO, TEXT, console on, no file, no correlation id, empty ring of 256.
    // FR: Retour à INFO, TEXT, console active, sans fichier, sans ID de corrélation, anneau vide de 256.
    void reset();

    static std::string levelToString(LogLevel level);

    // EN: Case-insensitive; "warning" is accepted for WARN. Unknown names throw std::invalid_argument.
    // FR: Insensible à la casse ; "warning" est accepté pour WARN. Les noms inconnus lèvent std::invalid_argument.
    static LogLevel levelFromString(const std::string& value);
    static LogFormat formatFromString(const std::string& value);

private:
    struct Record {
        std::chrono::system_clock::time_point when;
        LogLevel level;
        std::string module;
        std::string message;
        std::string cve;
        Metadata fields;
    };

    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string render(const Record& record) const;
    void emit(const std::string& line);
    void dropFile();

    LogLevel threshold_ = LogLevel::INFO;
    LogFormat format_ = LogFormat::TEXT;
    bool console_ = true;
    std::string cve_;
    Metadata global_fields_;

    std::ofstream file_;
    std::string file_path_;

    std::deque<std::string> ring_;
    size_t ring_capacity_ = 256;

    mutable std::mutex mutex_;
};

#define LOG_DEBUG(module, message) DAO::Logger::getInstance().debug(module, message)
#define LOG_INFO(module, message) DAO::Logger::getInstance().info(module, message)
#define LOG_WARN(module, message) DAO::Logger::getInstance().warn(module, message)
#define LOG_ERROR(module, message) DAO::Logger::getInstance().error(module, message)

#define LOG_DEBUG_META(module, message, metadata) DAO::Logger::getInstance().debug(module, message, metadata)
#define LOG_INFO_META(module, message, metadata) DAO::Logger::getInstance().info(module, message, metadata)
#define LOG_WARN_META(module, message, metadata) DAO::Logger::getInstance().warn(module, message, metadata)
#define LOG_ERROR_META(module, message, metadata) DAO::Logger::getInstance().error(module, message, metadata)

} // namespace DAO
