// EN: daoctl argument parsing - a table of options, each bound to a configuration path
// FR: Analyse des arguments de daoctl - une table d'options, chacune liée à un chemin de configuration

#pragma once

#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "infrastructure/config/config_manager.hpp"

namespace DAO {
namespace CLI {

enum class CliOptionType {
    BOOLEAN,
    INTEGER,
    STRING
};

enum class CliParseStatus {
    SUCCESS,
    HELP_REQUESTED,
    VERSION_REQUESTED,
    INVALID_OPTION,     // EN: Unknown option / FR: Option inconnue
    MISSING_VALUE,
    INVALID_VALUE       // EN: Type, range or choice check failed / FR: Échec du contrôle de type, plage ou choix
};

// EN: One option. Paths starting with '_' are internal and never reach the configuration.
// FR: Une option. Les chemins commençant par '_' sont internes et n'atteignent jamais la configuration.
struct CliOptionDefinition {
    std::string long_name;
    std::optional<char> short_name;
    CliOptionType type = CliOptionType::BOOLEAN;
    std::string description;
    std::string config_path;
    std::string shown_default;
    std::string category = "General";
    bool hidden = false;
    std::optional<int> min_value;
    std::optional<int> max_value;
    std::set<std::string> choices;
    bool flag_sets_false = false;   // EN: "--no-x" style flags / FR: Drapeaux du type "--no-x"
};

struct CliOptionValue {
    std::string option_name;
    std::string config_path;
    std::string raw_value;
    ConfigValue config_value;
};

struct CliParseResult {
    CliParseStatus status = CliParseStatus::SUCCESS;
    std::vector<std::string> positional_arguments;
    std::vector<CliOptionValue> parsed_options;
    std::unordered_map<std::string, ConfigValue> overrides;
    std::vector<std::string> errors;
    std::string help_text;
    std::string version_text;

    bool ok() const { return status == CliParseStatus::SUCCESS; }
    bool has(const std::string& config_path) const { return overrides.count(config_path) > 0; }
};

class CommandLineParser {
public:
    explicit CommandLineParser(std::string program_name = "daoctl");

    // EN: Throws std::invalid_argument when the long or short name is empty or already taken.
    // FR: Lance std::invalid_argument si le nom long ou court est vide ou déjà pris.
    void addOption(const CliOptionDefinition& option);

    // EN: The daoctl table, with --help and --version.
    // FR: La table de daoctl, avec --help et --version.
    void addStandardOptions();

    void addCommand(const std::string& usage, const std::string& description);

    // EN: Options may come before or after the command; "--" ends option parsing.
    // EN: Parsing continues past errors so every problem is reported, the first one sets the status.
    // FR: Les options peuvent précéder ou suivre la commande ; "--" termine l'analyse des options.
    // FR: L'analyse continue après une erreur pour tout signaler, la première fixe le statut.
    CliParseResult parse(int argc, char* argv[]) const;
    CliParseResult parse(const std::vector<std::string>& arguments) const;

    std::string generateHelpText() const;
    std::string generateVersionText() const;

    // EN: Copies "section.key" overrides into `config`; returns how many were copied.
    // FR: Copie les surcharges "section.cle" dans `config` ; retourne le nombre copié.
    static size_t applyOverrides(const CliParseResult& result, ConfigManager& config);

private:
    const CliOptionDefinition* lookup(const std::string& arg) const;
    CliParseStatus consume(const std::vector<std::string>& arguments, size_t& index, CliParseResult& result) const;

    std::string program_name_;
    std::vector<CliOptionDefinition> options_;
    std::unordered_map<std::string, size_t> by_long_;
    std::unordered_map<char, size_t> by_short_;
    std::vector<std::pair<std::string, std::string>> commands_;
};

namespace CommandLineUtils {
    std::string cliOptionTypeToString(CliOptionType type);
    std::string cliParseStatusToString(CliParseStatus status);

    // EN: Returns an empty string when `raw_value` satisfies the option, the reason otherwise.
    // FR: Retourne une chaîne vide si `raw_value` satisfait l'option, la raison sinon.
    std::string checkValue(const std::string& raw_value, const CliOptionDefinition& option);
    std::string formatOptionHelp(const CliOptionDefinition& option);

    bool isShortOption(const std::string& arg);
    bool isLongOption(const std::string& arg);
    std::string extractOptionName(const std::string& arg);
} // namespace CommandLineUtils

} // namespace CLI
} // namespace DAO
