#pragma once

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

// Forward declaration
namespace YAML { class Node; }

namespace ACE {

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T>
    ConfigValue(const T& value) : value_(ValueType(value)) {}

    ConfigValue(const char* value) : value_(ValueType(std::string(value))) {}

    // EN: Get value as specific type (throws if empty or type mismatch).
    // FR: Obtient la valeur comme type spécifique (lance une exception si vide ou type incorrect).
    template<typename T>
    T as() const {
        if (!value_) {
            throw std::runtime_error("ConfigValue is empty");
        }
        auto result = tryAs<T>();
        if (!result) {
            throw std::runtime_error("ConfigValue type mismatch");
        }
        return *result;
    }

    // EN: Try to get value as specific type. Integers widen to double on request.
    // FR: Tente d'obtenir la valeur comme type spécifique. Les entiers s'élargissent en double.
    template<typename T>
    std::optional<T> tryAs() const {
        if (!value_) {
            return std::nullopt;
        }
        if (const T* direct = std::get_if<T>(&*value_)) {
            return *direct;
        }
        if constexpr (std::is_same_v<T, double>) {
            if (const int* integer = std::get_if<int>(&*value_)) {
                return static_cast<double>(*integer);
            }
        }
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            if (const std::string* single = std::get_if<std::string>(&*value_)) {
                return std::vector<std::string>{*single};
            }
        }
        return std::nullopt;
    }

    template<typename T>
    T asOrDefault(const T& default_value) const {
        auto result = tryAs<T>();
        return result ? *result : default_value;
    }

    // EN: Check if value is valid (not empty).
    // FR: Vérifie si la valeur est valide (non vide).
    bool isValid() const { return value_.has_value(); }

    // EN: Name of the held type: "bool", "int", "double", "string", "array" or "empty".
    // FR: Nom du type contenu.
    std::string typeName() const;

    std::string toString() const;

private:
    std::optional<ValueType> value_;
};

// EN: Configuration section containing key-value pairs. Nested YAML maps are flattened
//     into dotted keys ("person.table").
// FR: Section de configuration contenant des paires clé-valeur. Les maps YAML imbriquées
//     sont aplaties en clés pointées.
class ConfigSection {
public:
    ConfigSection() = default;

    void set(const std::string& key, const ConfigValue& value);
    ConfigValue get(const std::string& key) const;
    bool has(const std::string& key) const;

    // EN: Get all keys in section, sorted.
    // FR: Obtient toutes les clés de la section, triées.
    std::vector<std::string> keys() const;

private:
    std::unordered_map<std::string, ConfigValue> values_;
};

// EN: Main configuration manager with YAML parsing, environment overrides and validation.
// FR: Gestionnaire de configuration principal avec parsing YAML, surcharges d'environnement et validation.
class ConfigManager {
public:
    // EN: Validation rule structure for configuration values. Keys are "section.key".
    // FR: Structure de règle de validation. Les clés sont de la forme "section.clé".
    struct ValidationRule {
        std::string key;
        std::string type; // "bool", "int", "double", "string", "array"
        bool required = false;
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };

    // EN: Environment variable bound to a configuration key.
    // FR: Variable d'environnement liée à une clé de configuration.
    struct EnvironmentBinding {
        std::string variable;   // without prefix, e.g. "DB_PATH"
        std::string section;
        std::string key;
        std::string type;       // "bool", "int", "double", "string"
    };

    static ConfigManager& getInstance();

    // EN: Load configuration from YAML file, replacing the current content.
    // FR: Charge la configuration depuis un fichier YAML, en remplaçant le contenu actuel.
    bool loadFromFile(const std::string& filename);

    // EN: Load configuration from YAML string, replacing the current content.
    // FR: Charge la configuration depuis une chaîne YAML, en remplaçant le contenu actuel.
    bool loadFromString(const std::string& yaml_content);

    // EN: Apply environment overrides for the given bindings. Returns the number applied.
    // FR: Applique les surcharges d'environnement des liaisons données. Retourne le nombre appliqué.
    size_t loadEnvironmentOverrides(const std::vector<EnvironmentBinding>& bindings,
                                    const std::string& prefix = "ACE_");

    void addValidationRules(const std::vector<ValidationRule>& rules);

    // EN: Validate current configuration against rules.
    // FR: Valide la configuration actuelle contre les règles.
    bool validate(std::vector<std::string>& errors) const;

    ConfigValue get(const std::string& key) const;
    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& key, const ConfigValue& value);
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& key) const;
    bool has(const std::string& section, const std::string& key) const;

    ConfigSection getSection(const std::string& section) const;
    std::vector<std::string> getSectionNames() const;

    // EN: Reset all configuration data and rules.
    // FR: Remet à zéro toutes les données de configuration et les règles.
    void reset();

    // EN: Dump current configuration as string for debugging.
    // FR: Vide la configuration actuelle en chaîne pour débogage.
    std::string dump() const;

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    bool loadNode(const YAML::Node& yaml);
    void flattenInto(ConfigSection& section, const std::string& prefix, const YAML::Node& node) const;
    ConfigValue parseYamlValue(const YAML::Node& node) const;
    ConfigValue lookup(const std::string& section, const std::string& key) const;

    bool validateValue(const ConfigValue& value, const ValidationRule& rule,
                       std::string& error) const;

    // EN: Expand ${VAR} references in configuration strings.
    // FR: Étend les références ${VAR} dans les chaînes de configuration.
    std::string expandVariables(const std::string& value) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
    std::vector<ValidationRule> validation_rules_;
};

#define CONFIG_GET(key) ACE::ConfigManager::getInstance().get(key)
#define CONFIG_GET_SECTION(section, key) ACE::ConfigManager::getInstance().get(section, key)
#define CONFIG_SET(key, value) ACE::ConfigManager::getInstance().set(key, ACE::ConfigValue(value))
#define CONFIG_SET_SECTION(section, key, value) ACE::ConfigManager::getInstance().set(section, key, ACE::ConfigValue(value))

} // namespace ACE
