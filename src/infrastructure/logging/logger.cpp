// EN: Logger implementation. Entries are rendered once then written to each enabled sink.
// FR: Implémentation du Logger. Les entrées sont rendues une fois puis écrites vers chaque sortie active.

#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace DAO {

namespace {

std::string localStamp(std::chrono::system_clock::time_point when) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    std::tm parts{};
    localtime_r(&seconds, &parts);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &parts);
    return buffer;
}

// EN: UTC with millisecond precision, e.g. 2024-07-01T12:00:00.042Z
// FR: UTC à la milliseconde, par ex. 2024-07-01T12:00:00.042Z
std::string utcStamp(std::chrono::system_clock::time_point when) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() % 1000;
    std::tm parts{};
    gmtime_r(&seconds, &parts);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &parts);
    std::ostringstream out;
    out << buffer << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return out.str();
}

} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

LogLevel Logger::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_;
}

void Logger::setFormat(LogFormat format) {
    std::lock_guard<std::mutex> lock(mutex_);
    format_ = format;
}

void Logger::setConsoleOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_ = enabled;
}

bool Logger::setOutputFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    dropFile();
    file_.open(filename, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        file_.clear();
        std::cerr << "daoctl: cannot open log file " << filename << std::endl;
        return false;
    }
    file_path_ = filename;
    return true;
}

void Logger::closeOutputFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    dropFile();
}

std::string Logger::getOutputFile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_path_;
}

void Logger::dropFile() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
    file_.clear();
    file_path_.clear();
}

void Logger::setCorrelationId(const std::string& correlation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    cve_ = correlation_id;
}

std::string Logger::getCorrelationId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cve_;
}

void Logger::addGlobalMetadata(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    global_fields_[key] = value;
}

void Logger::clearGlobalMetadata() {
    std::lock_guard<std::mutex> lock(mutex_);
    global_fields_.clear();
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message,
                 const Metadata& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < threshold_) {
        return;
    }

    Record record{std::chrono::system_clock::now(), level, module, message, cve_, metadata};
    // EN: insert() keeps the entry's value when the key already exists
    // FR: insert() conserve la valeur de l'entrée quand la clé existe déjà
    record.fields.insert(global_fields_.begin(), global_fields_.end());

    emit(render(record));
}

void Logger::debug(const std::string& module, const std::string& message, const Metadata& metadata) {
    log(LogLevel::DEBUG, module, message, metadata);
}

void Logger::info(const std::string& module, const std::string& message, const Metadata& metadata) {
    log(LogLevel::INFO, module, message, metadata);
}

void Logger::warn(const std::string& module, const std::string& message, const Metadata& metadata) {
    log(LogLevel::WARN, module, message, metadata);
}

void Logger::error(const std::string& module, const std::string& message, const Metadata& metadata) {
    log(LogLevel::ERROR, module, message, metadata);
}

std::string Logger::render(const Record& record) const {
    if (format_ == LogFormat::NDJSON) {
        nlohmann::json object = {
            {"timestamp", utcStamp(record.when)},
            {"level", levelToString(record.level)},
            {"module", record.module},
            {"message", record.message},
        };
        if (!record.cve.empty()) {
            object["cve"] = record.cve;
        }
        for (const auto& [key, value] : record.fields) {
            object.emplace(key, value);
        }
        // EN: Invalid UTF-8 in a message becomes U+FFFD instead of throwing
        // FR: L'UTF-8 invalide d'un message devient U+FFFD au lieu de lever une exception
        return object.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    std::ostringstream line;
    line << '[' << localStamp(record.when) << "] "
         << std::left << std::setw(5) << levelToString(record.level)
         << " [" << record.module << "] ";
    if (!record.cve.empty()) {
        line << '[' << record.cve << "] ";
    }
    line << record.message;
    const std::map<std::string, std::string> ordered(record.fields.begin(), record.fields.end());
    for (const auto& [key, value] : ordered) {
        line << ' ' << key << '=' << value;
    }
    return line.str();
}

void Logger::emit(const std::string& line) {
    if (file_.is_open()) {
        file_ << line << '\n' << std::flush;
        if (file_.fail()) {
            std::cerr << "daoctl: log file " << file_path_ << " is no longer writable" << std::endl;
            dropFile();
        }
    }

    if (console_) {
        std::cout << line << std::endl;
    }

    if (ring_capacity_ == 0) {
        return;
    }
    ring_.push_back(line);
    if (ring_.size() > ring_capacity_) {
        ring_.pop_front();
    }
}

void Logger::setRecentCapacity(size_t capacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    ring_capacity_ = capacity;
    if (ring_.size() > capacity) {
        ring_.erase(ring_.begin(), ring_.begin() + static_cast<std::ptrdiff_t>(ring_.size() - capacity));
    }
}

std::vector<std::string> Logger::getRecentLines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(ring_.begin(), ring_.end());
}

void Logger::clearRecentLines() {
    std::lock_guard<std::mutex> lock(mutex_);
    ring_.clear();
}

void Logger::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    dropFile();
    threshold_ = LogLevel::INFO;
    format_ = LogFormat::TEXT;
    console_ = true;
    cve_.clear();
    global_fields_.clear();
    ring_.clear();
    ring_capacity_ = 256;
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel Logger::levelFromString(const std::string& value) {
    static const std::map<std::string, LogLevel> names = {
        {"debug", LogLevel::DEBUG},
        {"info", LogLevel::INFO},
        {"warn", LogLevel::WARN},
        {"warning", LogLevel::WARN},
        {"error", LogLevel::ERROR},
    };
    std::string key(value.size(), '\0');
    std::transform(value.begin(), value.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto found = names.find(key);
    if (found == names.end()) {
        throw std::invalid_argument("Unknown log level: " + value);
    }
    return found->second;
}

LogFormat Logger::formatFromString(const std::string& value) {
    if (value == "text") {
        return LogFormat::TEXT;
    }
    if (value == "ndjson") {
        return LogFormat::NDJSON;
    }
    throw std::invalid_argument("Unknown log format: " + value);
}

} // namespace DAO
