// EN: Action report - plain text artifact with a key/value header and titled sections
// FR: Rapport d'action - artefact texte avec un en-tête clé/valeur et des sections titrées

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace DAO {
namespace Orchestrator {

class ActionReport {
public:
    struct Section {
        std::string title;
        std::vector<std::string> lines;
    };

    explicit ActionReport(std::string title);

    void addHeader(const std::string& key, const std::string& value);

    // EN: Start a new section; following addLine() calls go into it.
    // FR: Ouvre une nouvelle section ; les appels addLine() suivants y sont ajoutés.
    Section& addSection(const std::string& title);
    void addLine(const std::string& line);

    const std::string& title() const { return title_; }
    const std::vector<std::pair<std::string, std::string>>& headers() const { return headers_; }
    const std::vector<Section>& sections() const { return sections_; }
    std::vector<std::string> sectionTitles() const;
    const Section* findSection(const std::string& title) const;

    std::string render() const;

    // EN: Write to a new file. Refuses to overwrite an existing one.
    // FR: Écrit dans un nouveau fichier. Refuse d'écraser un fichier existant.
    bool writeTo(const std::string& path, std::string& error) const;

    // EN: Local time as "YYYY-mm-dd HH:MM:SS TZ", for report headers.
    // FR: Heure locale "YYYY-mm-dd HH:MM:SS TZ", pour les en-têtes de rapport.
    static std::string currentDate();

private:
    std::string title_;
    std::vector<std::pair<std::string, std::string>> headers_;
    std::vector<Section> sections_;
};

} // namespace Orchestrator
} // namespace DAO
