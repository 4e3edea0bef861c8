// EN: daoctl argument parsing - option table, parse loop, help rendering
// FR: Analyse des arguments de daoctl - table d'options, boucle d'analyse, rendu de l'aide

#include "infrastructure/cli/command_line_parser.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cctype>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>

#ifndef DAO_VERSION
#define DAO_VERSION "1.0.0"
#endif

namespace DAO {
namespace CLI {

namespace {

CliOptionDefinition flag(std::string name, std::optional<char> letter, std::string path,
                         std::string category, std::string description) {
    CliOptionDefinition option;
    option.long_name = std::move(name);
    option.short_name = letter;
    option.config_path = std::move(path);
    option.category = std::move(category);
    option.description = std::move(description);
    return option;
}

CliOptionDefinition negated(std::string name, std::optional<char> letter, std::string path,
                            std::string category, std::string description) {
    CliOptionDefinition option = flag(std::move(name), letter, std::move(path),
                                      std::move(category), std::move(description));
    option.flag_sets_false = true;
    return option;
}

CliOptionDefinition valued(std::string name, std::optional<char> letter, CliOptionType type, std::string path,
                           std::string category, std::string description, std::string shown_default = "") {
    CliOptionDefinition option = flag(std::move(name), letter, std::move(path),
                                      std::move(category), std::move(description));
    option.type = type;
    option.shown_default = std::move(shown_default);
    return option;
}

} // namespace

CommandLineParser::CommandLineParser(std::string program_name)
    : program_name_(std::move(program_name)) {
}

void CommandLineParser::addOption(const CliOptionDefinition& option) {
    if (option.long_name.empty()) {
        throw std::invalid_argument("option needs a long name");
    }
    if (by_long_.count(option.long_name) > 0) {
        throw std::invalid_argument("--" + option.long_name + " is already defined");
    }
    if (option.short_name && by_short_.count(*option.short_name) > 0) {
        throw std::invalid_argument(std::string("-") + *option.short_name + " is already defined");
    }

    const size_t slot = options_.size();
    options_.push_back(option);
    by_long_.emplace(option.long_name, slot);
    if (option.short_name) {
        by_short_.emplace(*option.short_name, slot);
    }
}

void CommandLineParser::addStandardOptions() {
    auto delay = valued("delay", 'd', CliOptionType::INTEGER, "shutdown.delay_seconds", "Execution",
                        "Emergency shutdown countdown in seconds", "60");
    delay.min_value = 0;
    delay.max_value = 3600;

    auto level = valued("log-level", 'l', CliOptionType::STRING, "logging.level", "Logging",
                        "Logging level (debug, info, warn, error)", "info");
    level.choices = {"debug", "info", "warn", "error"};

    auto format = valued("log-format", std::nullopt, CliOptionType::STRING, "logging.format", "Logging",
                         "Log line format (text, ndjson)", "text");
    format.choices = {"text", "ndjson"};

    auto help = flag("help", 'h', "_help", "General", "Show this help message");
    help.hidden = true;
    auto version = flag("version", 'V', "_version", "General", "Show version information");
    version.hidden = true;

    const std::vector<CliOptionDefinition> table = {
        valued("config", 'c', CliOptionType::STRING, "_config_file", "General", "YAML configuration file"),
        valued("cve", std::nullopt, CliOptionType::STRING, "action.cve", "General",
               "CVE identifier recorded in every log line and report (env: CVE_ID)", "Unknown"),
        valued("base-dir", 'b', CliOptionType::STRING, "paths.base_dir", "General",
               "Directory holding status tokens, logs, reports and snapshots", "/tmp/dao"),
        flag("json", std::nullopt, "_json", "General", "Print the action result as JSON on stdout"),
        delay,
        flag("dry-run", 'n', "execution.dry_run", "Execution", "Log privileged commands instead of executing them"),
        negated("no-sudo", std::nullopt, "execution.use_sudo", "Execution",
                "Run privileged commands directly (process already runs as root)"),
        negated("no-lock", std::nullopt, "execution.exclusive_lock", "Execution",
                "Do not take the per-action exclusive lock"),
        level,
        format,
        negated("quiet", 'q', "logging.console", "Logging",
                "Disable console logging (the per-run log file is still written)"),
        help,
        version,
    };
    for (const auto& option : table) {
        addOption(option);
    }
}

void CommandLineParser::addCommand(const std::string& usage, const std::string& description) {
    commands_.emplace_back(usage, description);
}

CliParseResult CommandLineParser::parse(int argc, char* argv[]) const {
    return parse(std::vector<std::string>(argv + (argc > 0 ? 1 : 0), argv + argc));
}

CliParseResult CommandLineParser::parse(const std::vector<std::string>& arguments) const {
    CliParseResult result;
    bool only_positionals = false;

    for (size_t index = 0; index < arguments.size(); ++index) {
        const std::string& arg = arguments[index];
        if (arg.empty()) {
            continue;
        }
        if (only_positionals) {
            result.positional_arguments.push_back(arg);
            continue;
        }
        if (arg == "--") {
            only_positionals = true;
            continue;
        }

        const bool is_option = CommandLineUtils::isLongOption(arg) || CommandLineUtils::isShortOption(arg);
        if (!is_option) {
            result.positional_arguments.push_back(arg);
            continue;
        }

        const CliOptionDefinition* option = lookup(arg);
        if (option != nullptr && option->config_path == "_help") {
            result.status = CliParseStatus::HELP_REQUESTED;
            result.help_text = generateHelpText();
            return result;
        }
        if (option != nullptr && option->config_path == "_version") {
            result.status = CliParseStatus::VERSION_REQUESTED;
            result.version_text = generateVersionText();
            return result;
        }

        const CliParseStatus outcome = consume(arguments, index, result);
        if (outcome != CliParseStatus::SUCCESS && result.ok()) {
            result.status = outcome;
        }
    }
    return result;
}

const CliOptionDefinition* CommandLineParser::lookup(const std::string& arg) const {
    const std::string name = CommandLineUtils::extractOptionName(arg);
    if (CommandLineUtils::isLongOption(arg)) {
        auto found = by_long_.find(name);
        return found == by_long_.end() ? nullptr : &options_[found->second];
    }
    // EN: Short options are never bundled ("-nq" is rejected)
    // FR: Les options courtes ne sont jamais groupées ("-nq" est rejeté)
    if (arg.size() != 2) {
        return nullptr;
    }
    auto found = by_short_.find(name[0]);
    return found == by_short_.end() ? nullptr : &options_[found->second];
}

// EN: Handles arguments[index]; advances `index` when the value is the next argument.
// FR: Traite arguments[index] ; avance `index` quand la valeur est l'argument suivant.
CliParseStatus CommandLineParser::consume(const std::vector<std::string>& arguments, size_t& index,
                                          CliParseResult& result) const {
    const std::string& arg = arguments[index];
    const CliOptionDefinition* option = lookup(arg);
    if (option == nullptr) {
        result.errors.push_back("Unknown option: " + arg);
        return CliParseStatus::INVALID_OPTION;
    }

    std::optional<std::string> attached;
    const size_t equals = arg.find('=');
    if (CommandLineUtils::isLongOption(arg) && equals != std::string::npos) {
        attached = arg.substr(equals + 1);
    }

    CliOptionValue value;
    value.option_name = option->long_name;
    value.config_path = option->config_path;

    if (option->type == CliOptionType::BOOLEAN) {
        if (attached) {
            result.errors.push_back("--" + option->long_name + " is a flag and takes no value");
            return CliParseStatus::INVALID_VALUE;
        }
        const bool setting = !option->flag_sets_false;
        value.raw_value = setting ? "true" : "false";
        value.config_value = setting;
    } else {
        if (attached) {
            value.raw_value = *attached;
        } else if (index + 1 < arguments.size()) {
            value.raw_value = arguments[++index];
        } else {
            result.errors.push_back("Option " + arg + " requires a value");
            return CliParseStatus::MISSING_VALUE;
        }

        const std::string problem = CommandLineUtils::checkValue(value.raw_value, *option);
        if (!problem.empty()) {
            result.errors.push_back("Invalid value for option " + arg + ": " + problem);
            return CliParseStatus::INVALID_VALUE;
        }
        if (option->type == CliOptionType::INTEGER) {
            value.config_value = std::stoi(value.raw_value);
        } else {
            value.config_value = value.raw_value;
        }
    }

    result.overrides[value.config_path] = value.config_value;
    result.parsed_options.push_back(std::move(value));
    return CliParseStatus::SUCCESS;
}

std::string CommandLineParser::generateHelpText() const {
    std::ostringstream out;
    out << "Defensive Action Orchestrator - automated remediation actions\n\n"
        << "Usage: " << program_name_ << " [OPTIONS] COMMAND [ARGS]\n\n";

    if (!commands_.empty()) {
        out << "Commands:\n";
        for (const auto& [usage, description] : commands_) {
            out << "  " << std::left << std::setw(28) << usage << description << "\n";
        }
        out << "\n";
    }

    std::map<std::string, std::vector<const CliOptionDefinition*>> sections;
    for (const auto& option : options_) {
        if (!option.hidden) {
            sections[option.category].push_back(&option);
        }
    }
    for (const auto& [category, members] : sections) {
        out << category << " Options:\n";
        for (const CliOptionDefinition* option : members) {
            out << CommandLineUtils::formatOptionHelp(*option) << "\n";
        }
        out << "\n";
    }

    out << "Exit codes: 0 completed, 1 failed, 2 usage or configuration error\n";
    return out.str();
}

std::string CommandLineParser::generateVersionText() const {
    return program_name_ + " " DAO_VERSION "\n";
}

size_t CommandLineParser::applyOverrides(const CliParseResult& result, ConfigManager& config) {
    size_t applied = 0;
    for (const auto& [path, value] : result.overrides) {
        if (path.empty() || path.front() == '_') {
            continue;
        }
        const size_t dot = path.find('.');
        if (dot == std::string::npos) {
            LOG_WARN("cli", "Override '" + path + "' has no section, ignored");
            continue;
        }
        config.set(path.substr(0, dot), path.substr(dot + 1), value);
        ++applied;
    }
    return applied;
}

namespace CommandLineUtils {

std::string cliOptionTypeToString(CliOptionType type) {
    switch (type) {
        case CliOptionType::BOOLEAN: return "BOOLEAN";
        case CliOptionType::INTEGER: return "INTEGER";
        case CliOptionType::STRING: return "STRING";
    }
    return "UNKNOWN";
}

std::string cliParseStatusToString(CliParseStatus status) {
    static const std::map<CliParseStatus, std::string> names = {
        {CliParseStatus::SUCCESS, "SUCCESS"},
        {CliParseStatus::HELP_REQUESTED, "HELP_REQUESTED"},
        {CliParseStatus::VERSION_REQUESTED, "VERSION_REQUESTED"},
        {CliParseStatus::INVALID_OPTION, "INVALID_OPTION"},
        {CliParseStatus::MISSING_VALUE, "MISSING_VALUE"},
        {CliParseStatus::INVALID_VALUE, "INVALID_VALUE"},
    };
    auto found = names.find(status);
    return found == names.end() ? "UNKNOWN" : found->second;
}

std::string checkValue(const std::string& raw_value, const CliOptionDefinition& option) {
    if (option.type == CliOptionType::INTEGER) {
        int number = 0;
        try {
            size_t used = 0;
            number = std::stoi(raw_value, &used);
            if (used != raw_value.size()) {
                return "Value must be an integer";
            }
        } catch (const std::logic_error&) {
            // EN: std::stoi throws invalid_argument or out_of_range, both logic_error
            // FR: std::stoi lance invalid_argument ou out_of_range, tous deux logic_error
            return "Value must be an integer";
        }
        if (option.min_value && number < *option.min_value) {
            return "Value must be >= " + std::to_string(*option.min_value);
        }
        if (option.max_value && number > *option.max_value) {
            return "Value must be <= " + std::to_string(*option.max_value);
        }
        return "";
    }

    if (option.type == CliOptionType::STRING) {
        if (raw_value.empty()) {
            return "Value cannot be empty";
        }
        if (!option.choices.empty() && option.choices.count(raw_value) == 0) {
            std::string allowed;
            for (const auto& choice : option.choices) {
                allowed += allowed.empty() ? choice : ", " + choice;
            }
            return "Value must be one of: " + allowed;
        }
    }
    return "";
}

std::string formatOptionHelp(const CliOptionDefinition& option) {
    constexpr size_t kColumn = 32;

    std::string names = option.short_name ? std::string("  -") + *option.short_name + ", " : std::string(6, ' ');
    names += "--" + option.long_name;
    if (option.type != CliOptionType::BOOLEAN) {
        names += " <" + cliOptionTypeToString(option.type) + ">";
    }

    std::string line = names;
    if (names.size() + 2 > kColumn) {
        line += "\n" + std::string(kColumn, ' ');
    } else {
        line.append(kColumn - names.size(), ' ');
    }
    line += option.description;
    if (!option.shown_default.empty()) {
        line += " (default: " + option.shown_default + ")";
    }
    return line;
}

bool isShortOption(const std::string& arg) {
    return arg.size() >= 2 && arg[0] == '-' && std::isalpha(static_cast<unsigned char>(arg[1]));
}

bool isLongOption(const std::string& arg) {
    return arg.size() >= 3 && arg[0] == '-' && arg[1] == '-' && std::isalpha(static_cast<unsigned char>(arg[2]));
}

std::string extractOptionName(const std::string& arg) {
    if (isLongOption(arg)) {
        return arg.substr(2, arg.find('=') == std::string::npos ? std::string::npos : arg.find('=') - 2);
    }
    return isShortOption(arg) ? arg.substr(1, 1) : std::string();
}

} // namespace CommandLineUtils

} // namespace CLI
} // namespace DAO
