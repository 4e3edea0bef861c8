// EN: Process-wide settings store for daoctl - YAML sections, typed values, rules and environment bindings
// FR: Magasin de paramètres global pour daoctl - sections YAML, valeurs typées, règles et liaisons d'environnement

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace YAML { class Node; }

namespace DAO {

// EN: Kinds of value a setting can hold, used by rules and environment bindings.
// FR: Types de valeur qu'un paramètre peut porter, utilisés par les règles et les liaisons d'environnement.
enum class ConfigType {
    BOOL,
    INT,
    DOUBLE,
    STRING,
    LIST
};

std::string configTypeName(ConfigType type);

// EN: One setting. Empty until assigned; reading the wrong alternative is reported, never converted.
// FR: Un paramètre. Vide tant qu'il n'est pas assigné ; lire la mauvaise alternative est signalé, jamais converti.
class ConfigValue {
public:
    using Storage = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T>
    ConfigValue(const T& value) : data_(Storage(value)) {}

    bool isValid() const { return data_.has_value(); }

    template<typename T>
    std::optional<T> tryAs() const {
        if (data_ && std::holds_alternative<T>(*data_)) {
            return std::get<T>(*data_);
        }
        return std::nullopt;
    }

    template<typename T>
    T as() const {
        if (!data_) {
            throw std::runtime_error("setting has no value");
        }
        if (!std::holds_alternative<T>(*data_)) {
            throw std::runtime_error("setting holds a " + configTypeName(type()) + ", not the requested type");
        }
        return std::get<T>(*data_);
    }

    template<typename T>
    T asOrDefault(const T& fallback) const {
        return tryAs<T>().value_or(fallback);
    }

    // EN: Alternative currently held. Only meaningful when isValid().
    // FR: Alternative actuellement portée. N'a de sens que si isValid().
    ConfigType type() const;

    std::string toString() const;

private:
    std::optional<Storage> data_;
};

// EN: Settings grouped as section -> key -> value, loaded from YAML and layered with defaults and environment.
// FR: Paramètres groupés en section -> clé -> valeur, chargés depuis YAML puis complétés par défauts et environnement.
class ConfigManager {
public:
    // EN: Constraint on "section.key". Bounds apply to numbers, choices compare the rendered value.
    // FR: Contrainte sur "section.cle". Les bornes portent sur les nombres, les choix comparent la valeur rendue.
    struct Rule {
        std::string key;
        ConfigType type = ConfigType::STRING;
        bool required = false;
        std::optional<double> minimum;
        std::optional<double> maximum;
        std::vector<std::string> choices;
        std::string description;
    };

    struct EnvironmentBinding {
        std::string variable;
        std::string section;
        std::string key;
        ConfigType type = ConfigType::STRING;
    };

    static ConfigManager& getInstance();

    // EN: Replace every section with the document's content. On failure nothing changes.
    // FR: Remplace toutes les sections par le contenu du document. En cas d'échec rien ne change.
    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& yaml_content);

    // EN: Returns how many bound variables were set and well-formed.
    // FR: Retourne le nombre de variables liées définies et bien formées.
    size_t loadEnvironmentOverrides(const std::vector<EnvironmentBinding>& bindings);

    void addValidationRules(const std::vector<Rule>& rules);
    bool validate(std::vector<std::string>& errors) const;

    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    void setDefault(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& section, const std::string& key) const;

    void reset();

    // EN: "[section]" blocks with "  key = value" lines, both sorted.
    // FR: Blocs "[section]" avec des lignes "  cle = valeur", triés.
    std::string dump() const;

    // EN: ${NAME} is replaced from the environment; unset names stay literal.
    // FR: ${NOM} est remplacé depuis l'environnement ; les noms non définis restent littéraux.
    static std::string expandVariables(const std::string& value);

private:
    using Section = std::map<std::string, ConfigValue>;

    ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    bool adopt(const YAML::Node& document, const std::string& origin);

    static std::map<std::string, Section> toSections(const YAML::Node& document);
    static ConfigValue fromScalar(const YAML::Node& node);
    static ConfigValue fromText(const std::string& text, ConfigType type);
    static std::optional<std::string> checkRule(const Rule& rule, const ConfigValue& value);

    mutable std::mutex mutex_;
    std::map<std::string, Section> sections_;
    std::vector<Rule> rules_;
};

} // namespace DAO
