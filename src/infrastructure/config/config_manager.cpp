// EN: Implementation of the ConfigManager class. YAML parsing via yaml-cpp, ${VAR} expansion,
//     environment overrides and rule-based validation.
// FR: Implémentation de la classe ConfigManager. Parsing YAML via yaml-cpp, expansion ${VAR},
//     surcharges d'environnement et validation par règles.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <regex>
#include <sstream>

namespace ACE {

std::string ConfigValue::typeName() const {
    if (!value_) {
        return "empty";
    }
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return "bool";
        } else if constexpr (std::is_same_v<T, int>) {
            return "int";
        } else if constexpr (std::is_same_v<T, double>) {
            return "double";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "string";
        } else {
            return "array";
        }
    }, *value_);
}

std::string ConfigValue::toString() const {
    if (!value_) {
        return "<empty>";
    }

    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::string result = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) result += ", ";
                result += v[i];
            }
            result += "]";
            return result;
        }
    }, *value_);
}

// ConfigSection implementation
void ConfigSection::set(const std::string& key, const ConfigValue& value) {
    values_[key] = value;
}

ConfigValue ConfigSection::get(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : ConfigValue();
}

bool ConfigSection::has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

std::vector<std::string> ConfigSection::keys() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

// ConfigManager implementation
ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

// EN: Load configuration from YAML file with error handling.
// FR: Charge la configuration depuis un fichier YAML avec gestion d'erreur.
bool ConfigManager::loadFromFile(const std::string& filename) {
    if (!std::filesystem::exists(filename)) {
        LOG_ERROR("config", "Configuration file not found: " + filename);
        return false;
    }

    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        if (!loadNode(yaml)) {
            LOG_ERROR("config", "Configuration root must be a map: " + filename);
            return false;
        }
        LOG_INFO("config", "Configuration loaded from: " + filename);
        return true;
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", "Failed to load configuration: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        if (!yaml.IsNull() && !loadNode(yaml)) {
            LOG_ERROR("config", "Configuration root must be a map");
            return false;
        }
        LOG_DEBUG("config", "Configuration loaded from string");
        return true;
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", "Failed to load configuration from string: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::loadNode(const YAML::Node& yaml) {
    if (!yaml.IsMap()) {
        return false;
    }

    // EN: Build the new sections first so a parse error leaves the previous state intact.
    // FR: Construit les nouvelles sections d'abord pour qu'une erreur laisse l'état précédent intact.
    std::unordered_map<std::string, ConfigSection> loaded;
    for (const auto& section : yaml) {
        std::string section_name = section.first.as<std::string>();
        ConfigSection config_section;

        if (section.second.IsMap()) {
            flattenInto(config_section, "", section.second);
        } else {
            config_section.set("value", parseYamlValue(section.second));
        }

        loaded[section_name] = config_section;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    sections_ = std::move(loaded);
    return true;
}

void ConfigManager::flattenInto(ConfigSection& section, const std::string& prefix,
                                const YAML::Node& node) const {
    for (const auto& item : node) {
        std::string key = prefix + item.first.as<std::string>();
        if (item.second.IsMap()) {
            flattenInto(section, key + ".", item.second);
        } else {
            section.set(key, parseYamlValue(item.second));
        }
    }
}

ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) const {
    if (node.IsNull()) {
        return ConfigValue(std::string());
    }

    if (node.IsSequence()) {
        std::vector<std::string> array_value;
        for (const auto& item : node) {
            array_value.push_back(expandVariables(item.as<std::string>()));
        }
        return ConfigValue(array_value);
    }

    std::string str_val = node.as<std::string>();
    if (node.Tag() == "!") {
        // EN: Quoted scalar: always a string.
        // FR: Scalaire entre guillemets : toujours une chaîne.
        return ConfigValue(expandVariables(str_val));
    }

    if (str_val == "true" || str_val == "false") {
        return ConfigValue(str_val == "true");
    }

    static const std::regex int_pattern(R"(^[+-]?\d+$)");
    static const std::regex double_pattern(R"(^[+-]?(\d+\.\d*|\.\d+|\d+)([eE][+-]?\d+)?$)");

    if (std::regex_match(str_val, int_pattern)) {
        int int_val = 0;
        if (YAML::convert<int>::decode(node, int_val)) {
            return ConfigValue(int_val);
        }
    }
    if (std::regex_match(str_val, double_pattern)) {
        double double_val = 0.0;
        if (YAML::convert<double>::decode(node, double_val)) {
            return ConfigValue(double_val);
        }
    }

    return ConfigValue(expandVariables(str_val));
}

// EN: Apply ACE_* environment overrides; unparsable values are logged and skipped.
// FR: Applique les surcharges ACE_* ; les valeurs non analysables sont journalisées et ignorées.
size_t ConfigManager::loadEnvironmentOverrides(const std::vector<EnvironmentBinding>& bindings,
                                               const std::string& prefix) {
    size_t applied = 0;
    for (const auto& binding : bindings) {
        const char* env_value = std::getenv((prefix + binding.variable).c_str());
        if (env_value == nullptr) {
            continue;
        }

        std::string raw(env_value);
        ConfigValue value;
        if (binding.type == "bool") {
            std::string lowered = raw;
            std::transform(lowered.begin(), lowered.end(), lowered.begin(), ::tolower);
            if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
                value = ConfigValue(true);
            } else if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
                value = ConfigValue(false);
            }
        } else if (binding.type == "int") {
            try {
                value = ConfigValue(std::stoi(raw));
            } catch (const std::exception&) {
                value = ConfigValue();
            }
        } else if (binding.type == "double") {
            try {
                value = ConfigValue(std::stod(raw));
            } catch (const std::exception&) {
                value = ConfigValue();
            }
        } else {
            value = ConfigValue(raw);
        }

        if (!value.isValid()) {
            LOG_WARN("config", "Ignoring invalid environment value for " + prefix + binding.variable);
            continue;
        }

        set(binding.section, binding.key, value);
        ++applied;
        LOG_INFO("config", "Environment override applied: " + binding.section + "." + binding.key);
    }
    return applied;
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    validation_rules_.insert(validation_rules_.end(), rules.begin(), rules.end());
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    errors.clear();

    for (const auto& rule : validation_rules_) {
        size_t dot_pos = rule.key.find('.');
        std::string section_name = (dot_pos != std::string::npos) ?
            rule.key.substr(0, dot_pos) : "default";
        std::string key_name = (dot_pos != std::string::npos) ?
            rule.key.substr(dot_pos + 1) : rule.key;

        ConfigValue value = lookup(section_name, key_name);

        if (!value.isValid()) {
            if (rule.required) {
                errors.push_back("Required configuration missing: " + rule.key);
            }
            continue;
        }

        std::string error;
        if (!validateValue(value, rule, error)) {
            errors.push_back(error);
        }
    }

    return errors.empty();
}

bool ConfigManager::validateValue(const ConfigValue& value, const ValidationRule& rule,
                                  std::string& error) const {
    if (rule.type == "bool" && !value.tryAs<bool>()) {
        error = rule.key + ": expected bool, got " + value.typeName();
        return false;
    }
    if (rule.type == "int" && !value.tryAs<int>()) {
        error = rule.key + ": expected int, got " + value.typeName();
        return false;
    }
    if (rule.type == "double" && !value.tryAs<double>()) {
        error = rule.key + ": expected number, got " + value.typeName();
        return false;
    }
    if (rule.type == "string" && !value.tryAs<std::string>()) {
        error = rule.key + ": expected string, got " + value.typeName();
        return false;
    }
    if (rule.type == "array" && !value.tryAs<std::vector<std::string>>()) {
        error = rule.key + ": expected list, got " + value.typeName();
        return false;
    }

    if (auto number = value.tryAs<double>()) {
        if (rule.min_value && *number < *rule.min_value) {
            error = rule.key + ": value " + value.toString() + " below minimum " +
                    ConfigValue(*rule.min_value).toString();
            return false;
        }
        if (rule.max_value && *number > *rule.max_value) {
            error = rule.key + ": value " + value.toString() + " above maximum " +
                    ConfigValue(*rule.max_value).toString();
            return false;
        }
    }

    if (!rule.allowed_values.empty()) {
        std::string text = value.toString();
        if (std::find(rule.allowed_values.begin(), rule.allowed_values.end(), text) ==
            rule.allowed_values.end()) {
            error = rule.key + ": value '" + text + "' not allowed";
            return false;
        }
    }

    return true;
}

ConfigValue ConfigManager::lookup(const std::string& section, const std::string& key) const {
    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        return section_it->second.get(key);
    }
    return ConfigValue();
}

ConfigValue ConfigManager::get(const std::string& key) const {
    return get("default", key);
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(section, key);
}

void ConfigManager::set(const std::string& key, const ConfigValue& value) {
    set("default", key, value);
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section].set(key, value);
}

bool ConfigManager::has(const std::string& key) const {
    return has("default", key);
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto section_it = sections_.find(section);
    return section_it != sections_.end() && section_it->second.has(key);
}

ConfigSection ConfigManager::getSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sections_.find(section);
    return it != sections_.end() ? it->second : ConfigSection();
}

std::vector<std::string> ConfigManager::getSectionNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, _] : sections_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
    validation_rules_.clear();
}

std::string ConfigManager::dump() const {
    std::vector<std::string> names = getSectionNames();

    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;
    for (const auto& section_name : names) {
        const ConfigSection& section = sections_.at(section_name);
        oss << "[" << section_name << "]\n";
        for (const std::string& key : section.keys()) {
            oss << "  " << key << " = " << section.get(key).toString() << "\n";
        }
        oss << "\n";
    }
    return oss.str();
}

std::string ConfigManager::expandVariables(const std::string& value) const {
    static const std::regex var_pattern(R"(\$\{([A-Za-z_][A-Za-z0-9_]*)\})");

    std::string result;
    auto begin = std::sregex_iterator(value.begin(), value.end(), var_pattern);
    auto end = std::sregex_iterator();
    size_t last = 0;
    for (auto it = begin; it != end; ++it) {
        const std::smatch& match = *it;
        result.append(value, last, static_cast<size_t>(match.position(0)) - last);
        const char* env_value = std::getenv(match[1].str().c_str());
        if (env_value != nullptr) {
            result += env_value;
        }
        last = static_cast<size_t>(match.position(0) + match.length(0));
    }
    result.append(value, last, std::string::npos);
    return result;
}

} // namespace ACE
