// EN: Implementation of ActionReport
// FR: Implémentation de ActionReport

#include "orchestrator/action_report.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace DAO {
namespace Orchestrator {

namespace {
constexpr const char* kRule = "==================================================";
}

ActionReport::ActionReport(std::string title)
    : title_(std::move(title)) {
}

void ActionReport::addHeader(const std::string& key, const std::string& value) {
    headers_.emplace_back(key, value);
}

ActionReport::Section& ActionReport::addSection(const std::string& title) {
    sections_.push_back({title, {}});
    return sections_.back();
}

void ActionReport::addLine(const std::string& line) {
    if (sections_.empty()) {
        addSection("DETAILS");
    }
    sections_.back().lines.push_back(line);
}

std::vector<std::string> ActionReport::sectionTitles() const {
    std::vector<std::string> titles;
    titles.reserve(sections_.size());
    for (const auto& section : sections_) {
        titles.push_back(section.title);
    }
    return titles;
}

const ActionReport::Section* ActionReport::findSection(const std::string& title) const {
    for (const auto& section : sections_) {
        if (section.title == title) {
            return &section;
        }
    }
    return nullptr;
}

std::string ActionReport::render() const {
    std::ostringstream oss;
    oss << kRule << '\n' << title_ << '\n' << kRule << '\n';
    for (const auto& [key, value] : headers_) {
        oss << key << ": " << value << '\n';
    }
    for (const auto& section : sections_) {
        oss << '\n' << "=== " << section.title << " ===" << '\n';
        for (const auto& line : section.lines) {
            oss << line << '\n';
        }
    }
    return oss.str();
}

// EN: "wx" mode fails if the file already exists, which keeps reports immutable.
// FR: Le mode "wx" échoue si le fichier existe déjà, ce qui garde les rapports immuables.
bool ActionReport::writeTo(const std::string& path, std::string& error) const {
    std::FILE* file = std::fopen(path.c_str(), "wx");
    if (!file) {
        error = "Cannot create report " + path + ": " + std::strerror(errno);
        return false;
    }

    const std::string content = render();
    const size_t written = std::fwrite(content.data(), 1, content.size(), file);
    const bool closed = std::fclose(file) == 0;
    if (written != content.size() || !closed) {
        error = "Cannot write report " + path;
        return false;
    }
    return true;
}

std::string ActionReport::currentDate() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_tm{};
    localtime_r(&now, &local_tm);
    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S %Z");
    return oss.str();
}

} // namespace Orchestrator
} // namespace DAO
