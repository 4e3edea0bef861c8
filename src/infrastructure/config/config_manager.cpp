// EN: Settings store implementation. YAML loading, typed environment bindings and rule checks.
// FR: Implémentation du magasin de paramètres. Chargement YAML, liaisons d'environnement typées et contrôle des règles.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace DAO {

namespace {

std::string lowered(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string joined(const std::vector<std::string>& items, const std::string& separator) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += separator;
        out += item;
    }
    return out;
}

// EN: Bounds print without a trailing ".0" when they are whole numbers.
// FR: Les bornes s'affichent sans ".0" final quand elles sont entières.
std::string boundText(double bound) {
    if (std::floor(bound) == bound) {
        return std::to_string(static_cast<long long>(bound));
    }
    std::ostringstream oss;
    oss << bound;
    return oss.str();
}

} // namespace

std::string configTypeName(ConfigType type) {
    switch (type) {
        case ConfigType::BOOL: return "boolean";
        case ConfigType::INT: return "integer";
        case ConfigType::DOUBLE: return "number";
        case ConfigType::STRING: return "string";
        case ConfigType::LIST: return "list";
    }
    return "unknown";
}

ConfigType ConfigValue::type() const {
    static const ConfigType by_index[] = {ConfigType::BOOL, ConfigType::INT, ConfigType::DOUBLE,
                                          ConfigType::STRING, ConfigType::LIST};
    return data_ ? by_index[data_->index()] : ConfigType::STRING;
}

std::string ConfigValue::toString() const {
    if (!data_) {
        return "<empty>";
    }
    switch (type()) {
        case ConfigType::BOOL:
            return std::get<bool>(*data_) ? "true" : "false";
        case ConfigType::INT:
            return std::to_string(std::get<int>(*data_));
        case ConfigType::DOUBLE: {
            std::ostringstream oss;
            oss << std::get<double>(*data_);
            return oss.str();
        }
        case ConfigType::STRING:
            return std::get<std::string>(*data_);
        case ConfigType::LIST:
            return "[" + joined(std::get<std::vector<std::string>>(*data_), ", ") + "]";
    }
    return "<empty>";
}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    if (!std::filesystem::is_regular_file(filename)) {
        LOG_ERROR("config", "Configuration file not found: " + filename);
        return false;
    }
    try {
        return adopt(YAML::LoadFile(filename), filename);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", "Cannot parse " + filename + ": " + e.what());
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    try {
        return adopt(YAML::Load(yaml_content), "inline document");
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", std::string("Cannot parse inline document: ") + e.what());
        return false;
    }
}

bool ConfigManager::adopt(const YAML::Node& document, const std::string& origin) {
    std::map<std::string, Section> parsed;
    try {
        parsed = toSections(document);
    } catch (const std::exception& e) {
        LOG_ERROR("config", "Rejected " + origin + ": " + e.what());
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sections_.swap(parsed);
    }
    LOG_INFO("config", "Configuration loaded from " + origin);
    return true;
}

// EN: Top level must map section names to mappings; a bare scalar becomes the section's "value".
// FR: Le niveau supérieur associe des noms de section à des mappings ; un scalaire seul devient la "value" de la section.
std::map<std::string, ConfigManager::Section> ConfigManager::toSections(const YAML::Node& document) {
    std::map<std::string, Section> sections;
    if (document.IsNull()) {
        return sections;
    }
    if (!document.IsMap()) {
        throw std::runtime_error("expected a mapping of sections at top level");
    }

    for (auto entry = document.begin(); entry != document.end(); ++entry) {
        Section& section = sections[entry->first.as<std::string>()];
        const YAML::Node& body = entry->second;
        if (!body.IsMap()) {
            section["value"] = fromScalar(body);
            continue;
        }
        for (auto field = body.begin(); field != body.end(); ++field) {
            section[field->first.as<std::string>()] = fromScalar(field->second);
        }
    }
    return sections;
}

ConfigValue ConfigManager::fromScalar(const YAML::Node& node) {
    if (node.IsSequence()) {
        std::vector<std::string> items;
        items.reserve(node.size());
        for (const auto& element : node) {
            items.push_back(expandVariables(element.as<std::string>()));
        }
        return items;
    }
    if (!node.IsScalar()) {
        throw std::runtime_error("sections cannot contain nested mappings");
    }

    const std::string text = node.Scalar();
    // EN: A "!" tag marks a quoted scalar, which is never typed.
    // FR: Un tag "!" marque un scalaire entre guillemets, jamais typé.
    if (node.Tag() != "!") {
        if (text == "true" || text == "false") {
            return text == "true";
        }
        const bool dotted = text.find('.') != std::string::npos;
        int whole = 0;
        double real = 0.0;
        if (!dotted && YAML::convert<int>::decode(node, whole)) {
            return whole;
        }
        if (dotted && YAML::convert<double>::decode(node, real)) {
            return real;
        }
    }
    return expandVariables(text);
}

ConfigValue ConfigManager::fromText(const std::string& text, ConfigType type) {
    switch (type) {
        case ConfigType::BOOL: {
            const std::string word = lowered(text);
            if (word == "true" || word == "1" || word == "yes" || word == "on") return true;
            if (word == "false" || word == "0" || word == "no" || word == "off") return false;
            break;
        }
        case ConfigType::INT: {
            size_t used = 0;
            const int number = std::stoi(text, &used);
            if (used == text.size()) return number;
            break;
        }
        case ConfigType::DOUBLE: {
            size_t used = 0;
            const double number = std::stod(text, &used);
            if (used == text.size()) return number;
            break;
        }
        case ConfigType::STRING:
            return text;
        case ConfigType::LIST:
            return std::vector<std::string>{text};
    }
    throw std::invalid_argument("'" + text + "' is not a valid " + configTypeName(type));
}

size_t ConfigManager::loadEnvironmentOverrides(const std::vector<EnvironmentBinding>& bindings) {
    size_t applied = 0;
    for (const auto& binding : bindings) {
        const char* raw = std::getenv(binding.variable.c_str());
        if (raw == nullptr) {
            continue;
        }
        try {
            set(binding.section, binding.key, fromText(raw, binding.type));
        } catch (const std::exception& e) {
            // EN: std::stoi reports bad input as invalid_argument or out_of_range; both are skipped
            // FR: std::stoi signale une entrée invalide par invalid_argument ou out_of_range ; les deux sont ignorées
            LOG_WARN("config", "Ignoring " + binding.variable + ": " + e.what());
            continue;
        }
        ++applied;
        LOG_DEBUG("config", binding.variable + " -> " + binding.section + "." + binding.key);
    }
    return applied;
}

void ConfigManager::addValidationRules(const std::vector<Rule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& rule : rules) {
        auto same_key = [&rule](const Rule& known) { return known.key == rule.key; };
        auto existing = std::find_if(rules_.begin(), rules_.end(), same_key);
        if (existing != rules_.end()) {
            *existing = rule;
        } else {
            rules_.push_back(rule);
        }
    }
}

std::optional<std::string> ConfigManager::checkRule(const Rule& rule, const ConfigValue& value) {
    const std::string prefix = "Configuration " + rule.key + " must be ";

    const bool numeric_ok = rule.type == ConfigType::DOUBLE && value.type() == ConfigType::INT;
    if (value.type() != rule.type && !numeric_ok) {
        const bool vowel = rule.type == ConfigType::INT;
        return prefix + (vowel ? "an " : "a ") + configTypeName(rule.type);
    }

    if (rule.type == ConfigType::INT || rule.type == ConfigType::DOUBLE) {
        const double number = value.type() == ConfigType::INT ? value.as<int>() : value.as<double>();
        if (rule.minimum && number < *rule.minimum) {
            return prefix + ">= " + boundText(*rule.minimum);
        }
        if (rule.maximum && number > *rule.maximum) {
            return prefix + "<= " + boundText(*rule.maximum);
        }
    }

    if (!rule.choices.empty() &&
        std::find(rule.choices.begin(), rule.choices.end(), value.toString()) == rule.choices.end()) {
        return prefix + "one of: " + joined(rule.choices, ", ");
    }
    return std::nullopt;
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    errors.clear();
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& rule : rules_) {
        const auto dot = rule.key.find('.');
        const std::string section = dot == std::string::npos ? "default" : rule.key.substr(0, dot);
        const std::string key = dot == std::string::npos ? rule.key : rule.key.substr(dot + 1);

        auto owner = sections_.find(section);
        const ConfigValue* value = nullptr;
        if (owner != sections_.end()) {
            auto field = owner->second.find(key);
            if (field != owner->second.end() && field->second.isValid()) {
                value = &field->second;
            }
        }

        if (value == nullptr) {
            if (rule.required) {
                errors.push_back("Required configuration missing: " + rule.key);
            }
        } else if (auto problem = checkRule(rule, *value)) {
            errors.push_back(*problem);
        }
    }
    return errors.empty();
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto owner = sections_.find(section);
    if (owner == sections_.end()) {
        return {};
    }
    auto field = owner->second.find(key);
    return field == owner->second.end() ? ConfigValue() : field->second;
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section][key] = value;
}

void ConfigManager::setDefault(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section].emplace(key, value);
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto owner = sections_.find(section);
    return owner != sections_.end() && owner->second.count(key) > 0;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
    rules_.clear();
}

std::string ConfigManager::dump() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    for (const auto& [name, section] : sections_) {
        out << "[" << name << "]\n";
        for (const auto& [key, value] : section) {
            out << "  " << key << " = " << value.toString() << "\n";
        }
        out << "\n";
    }
    return out.str();
}

std::string ConfigManager::expandVariables(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    size_t cursor = 0;

    while (cursor < value.size()) {
        const size_t open = value.find("${", cursor);
        const size_t close = open == std::string::npos ? open : value.find('}', open + 2);
        if (close == std::string::npos) {
            out.append(value, cursor, std::string::npos);
            break;
        }
        out.append(value, cursor, open - cursor);
        const std::string name = value.substr(open + 2, close - open - 2);
        const char* resolved = name.empty() ? nullptr : std::getenv(name.c_str());
        out += resolved ? std::string(resolved) : value.substr(open, close - open + 1);
        cursor = close + 1;
    }
    return out;
}

} // namespace DAO
