// EN: Config Override System for acectl - CLI-based configuration parameter overrides
// FR: Système de Surcharge de Configuration pour acectl - Surcharges de paramètres via CLI

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "infrastructure/config/config_manager.hpp"

namespace ACE {
namespace CLI {

// EN: CLI option types and specifications
// FR: Types et spécifications des options CLI
enum class CliOptionType {
    BOOLEAN,        // EN: Boolean flag / FR: Drapeau booléen
    INTEGER,        // EN: Integer value / FR: Valeur entière
    DOUBLE,         // EN: Double precision float / FR: Flottant double précision
    STRING,         // EN: String value / FR: Valeur chaîne
    STRING_LIST     // EN: Comma-separated string list / FR: Liste de chaînes séparées par virgule
};

// EN: CLI option value constraints
// FR: Contraintes de valeur d'option CLI
enum class CliOptionConstraint {
    NONE,           // EN: No constraints / FR: Aucune contrainte
    POSITIVE,       // EN: Must be positive (>0) / FR: Doit être positif (>0)
    NON_NEGATIVE,   // EN: Must be non-negative (>=0) / FR: Doit être non-négatif (>=0)
    RANGE,          // EN: Must be within specified range / FR: Doit être dans la plage spécifiée
    ENUM_VALUES     // EN: Must be one of predefined values / FR: Doit être l'une des valeurs prédéfinies
};

// EN: CLI parsing result status
// FR: Statut de résultat d'analyse CLI
enum class CliParseStatus {
    SUCCESS,                // EN: Parsing completed successfully / FR: Analyse terminée avec succès
    HELP_REQUESTED,         // EN: Help was requested / FR: Aide demandée
    VERSION_REQUESTED,      // EN: Version was requested / FR: Version demandée
    INVALID_OPTION,         // EN: Invalid option provided / FR: Option invalide fournie
    MISSING_VALUE,          // EN: Required value missing / FR: Valeur requise manquante
    INVALID_VALUE,          // EN: Invalid value format / FR: Format de valeur invalide
    CONSTRAINT_VIOLATION    // EN: Value constraint violation / FR: Violation de contrainte de valeur
};

// EN: CLI option definition structure
// FR: Structure de définition d'option CLI
struct CliOptionDefinition {
    std::string long_name;                          // EN: Long option name (--example) / FR: Nom d'option long (--exemple)
    std::optional<char> short_name;                 // EN: Short option name (-e) / FR: Nom d'option court (-e)
    CliOptionType type = CliOptionType::STRING;     // EN: Option value type / FR: Type de valeur d'option
    std::string description;                        // EN: Option description for help / FR: Description d'option pour l'aide
    std::string config_path;                        // EN: "section.key", empty for tool arguments / FR: "section.clé", vide pour les arguments de l'outil
    std::optional<std::string> default_value;       // EN: Default value shown in help / FR: Valeur par défaut affichée dans l'aide
    bool flag_value = true;                         // EN: Value stored when a BOOLEAN flag is present / FR: Valeur stockée quand un drapeau est présent

    CliOptionConstraint constraint = CliOptionConstraint::NONE;
    std::optional<double> min_value;
    std::optional<double> max_value;
    std::set<std::string> enum_values;

    std::string category = "General";              // EN: Help category / FR: Catégorie d'aide
};

// EN: Parsed CLI option value
// FR: Valeur d'option CLI analysée
struct CliOptionValue {
    std::string option_name;
    std::string raw_value;
    ConfigValue config_value;
    std::string config_path;
};

// EN: CLI parsing result containing all parsed options and status
// FR: Résultat d'analyse CLI contenant toutes les options analysées et le statut
struct CliParseResult {
    CliParseStatus status = CliParseStatus::SUCCESS;
    std::vector<CliOptionValue> parsed_options;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::unordered_map<std::string, ConfigValue> overrides;    // EN: config path -> value / FR: chemin -> valeur
    std::map<std::string, std::string> arguments;              // EN: Options without config path / FR: Options sans chemin de configuration

    std::string help_text;
    std::string version_text;

    size_t total_arguments_processed = 0;
};

// EN: Main configuration override parser for handling CLI arguments
// FR: Analyseur principal de surcharge de configuration pour gérer les arguments CLI
class ConfigOverrideParser {
public:
    ConfigOverrideParser();
    ~ConfigOverrideParser();

    ConfigOverrideParser(const ConfigOverrideParser&) = delete;
    ConfigOverrideParser& operator=(const ConfigOverrideParser&) = delete;

    // EN: Option definition management. Throws std::invalid_argument on duplicate or empty names.
    // FR: Gestion des définitions d'options. Lance std::invalid_argument sur nom dupliqué ou vide.
    void addOption(const CliOptionDefinition& option_def);
    void addOptions(const std::vector<CliOptionDefinition>& option_defs);

    // EN: The acectl option set (database, run mode, audit, backup, logging).
    // FR: Ensemble d'options d'acectl.
    void addConsolidationOptions();

    // EN: CLI parsing operations. argv[0] is skipped.
    // FR: Opérations d'analyse CLI. argv[0] est ignoré.
    CliParseResult parse(int argc, char* argv[]) const;
    CliParseResult parse(const std::vector<std::string>& arguments) const;

    std::string generateHelpText(const std::string& program_name = "acectl") const;
    std::string generateVersionText() const;

    void setHelpHeader(const std::string& header);
    void setVersionInfo(const std::string& version, const std::string& build_info = "");

    std::vector<CliOptionDefinition> getOptionDefinitions() const;
    bool hasOption(const std::string& name) const;

    // EN: Write every parsed override into the manager. Returns the number applied.
    // FR: Écrit chaque surcharge analysée dans le gestionnaire. Retourne le nombre appliqué.
    static size_t applyOverrides(const CliParseResult& result, ConfigManager& manager);

private:
    class ConfigOverrideParserImpl;
    std::unique_ptr<ConfigOverrideParserImpl> impl_;
};

// EN: Utility functions for configuration override operations
// FR: Fonctions utilitaires pour les opérations de surcharge de configuration
namespace ConfigOverrideUtils {

    std::string cliOptionTypeToString(CliOptionType type);
    std::string cliParseStatusToString(CliParseStatus status);

    // EN: Value conversion utilities
    // FR: Utilitaires de conversion de valeurs
    ConfigValue parseCliValue(const std::string& raw_value, CliOptionType type);

    // EN: Returns the failing status, or SUCCESS
    // FR: Retourne le statut d'échec, ou SUCCESS
    CliParseStatus validateCliValue(const std::string& raw_value, const CliOptionDefinition& definition,
                                    std::string& error_message);

    std::string formatOptionHelp(const CliOptionDefinition& option);

    bool isShortOption(const std::string& arg);
    bool isLongOption(const std::string& arg);
    std::string extractOptionName(const std::string& arg);

} // namespace ConfigOverrideUtils

} // namespace CLI
} // namespace ACE
