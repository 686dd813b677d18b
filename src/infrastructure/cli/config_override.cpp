// EN: Implementation of the CLI override parser used by acectl.
// FR: Implémentation de l'analyseur de surcharges CLI utilisé par acectl.

#include "infrastructure/cli/config_override.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace ACE {
namespace CLI {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::vector<std::string> splitList(const std::string& raw_value) {
    std::vector<std::string> values;
    std::stringstream ss(raw_value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        // EN: Trim whitespace
        // FR: Supprimer les espaces
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) {
            values.push_back(item);
        }
    }
    return values;
}

} // namespace

class ConfigOverrideParser::ConfigOverrideParserImpl {
public:
    ConfigOverrideParserImpl()
        : help_header_("acectl - entity consolidation for the document archive")
        , version_("1.0.0") {}

    void addOption(const CliOptionDefinition& option_def) {
        std::lock_guard<std::mutex> lock(options_mutex_);

        // EN: Validate option definition before adding
        // FR: Valider la définition d'option avant d'ajouter
        if (option_def.long_name.empty()) {
            throw std::invalid_argument("Option long name cannot be empty");
        }
        if (findLong(option_def.long_name)) {
            throw std::invalid_argument("Option with long name '" + option_def.long_name + "' already exists");
        }
        if (option_def.short_name && findShort(*option_def.short_name)) {
            throw std::invalid_argument("Option with short name '-" + std::string(1, *option_def.short_name) +
                                        "' already exists");
        }

        option_definitions_.push_back(option_def);
    }

    CliParseResult parse(const std::vector<std::string>& arguments) const {
        CliParseResult result;
        result.total_arguments_processed = arguments.size();

        for (size_t i = 0; i < arguments.size(); ++i) {
            const std::string& arg = arguments[i];
            if (arg.empty()) continue;

            // EN: Check for help or version flags first
            // FR: Vérifier d'abord les drapeaux d'aide ou de version
            if (arg == "--help" || arg == "-h") {
                result.status = CliParseStatus::HELP_REQUESTED;
                result.help_text = generateHelpText("acectl");
                return result;
            }
            if (arg == "--version" || arg == "-V") {
                result.status = CliParseStatus::VERSION_REQUESTED;
                result.version_text = generateVersionText();
                return result;
            }

            if (!ConfigOverrideUtils::isLongOption(arg) && !ConfigOverrideUtils::isShortOption(arg)) {
                result.warnings.push_back("Unknown positional argument: " + arg);
                continue;
            }

            std::lock_guard<std::mutex> lock(options_mutex_);
            std::string option_name = ConfigOverrideUtils::extractOptionName(arg);
            const CliOptionDefinition* option_def = ConfigOverrideUtils::isLongOption(arg)
                ? findLong(option_name)
                : (option_name.size() == 1 ? findShort(option_name[0]) : nullptr);

            if (!option_def) {
                fail(result, CliParseStatus::INVALID_OPTION, "Unknown option: " + arg);
                continue;
            }

            CliOptionValue value;
            value.option_name = option_def->long_name;
            value.config_path = option_def->config_path;

            // EN: Handle boolean options (flags)
            // FR: Gérer les options booléennes (drapeaux)
            if (option_def->type == CliOptionType::BOOLEAN) {
                value.raw_value = option_def->flag_value ? "true" : "false";
                value.config_value = ConfigValue(option_def->flag_value);
            } else {
                if (i + 1 >= arguments.size()) {
                    fail(result, CliParseStatus::MISSING_VALUE, "Option " + arg + " requires a value");
                    continue;
                }
                value.raw_value = arguments[++i];

                std::string validation_error;
                CliParseStatus status = ConfigOverrideUtils::validateCliValue(value.raw_value, *option_def,
                                                                               validation_error);
                if (status != CliParseStatus::SUCCESS) {
                    fail(result, status, "Invalid value for option " + arg + ": " + validation_error);
                    continue;
                }
                value.config_value = ConfigOverrideUtils::parseCliValue(value.raw_value, option_def->type);
            }

            if (value.config_path.empty()) {
                result.arguments[value.option_name] = value.raw_value;
            } else {
                result.overrides[value.config_path] = value.config_value;
            }
            result.parsed_options.push_back(std::move(value));
        }

        return result;
    }

    std::string generateHelpText(const std::string& program_name) const {
        std::ostringstream help;
        help << help_header_ << "\n\n";
        help << "Usage: " << program_name << " --db PATH [OPTIONS]\n\n";

        // EN: Group options by category, preserving definition order within each
        // FR: Groupe les options par catégorie en préservant l'ordre de définition
        std::vector<std::string> categories;
        std::map<std::string, std::vector<CliOptionDefinition>> options_by_category;
        {
            std::lock_guard<std::mutex> lock(options_mutex_);
            for (const auto& opt : option_definitions_) {
                if (options_by_category.find(opt.category) == options_by_category.end()) {
                    categories.push_back(opt.category);
                }
                options_by_category[opt.category].push_back(opt);
            }
        }

        for (const auto& category : categories) {
            help << category << " Options:\n";
            for (const auto& opt : options_by_category[category]) {
                help << ConfigOverrideUtils::formatOptionHelp(opt) << "\n";
            }
            help << "\n";
        }

        help << "Exit codes: 0 completed or dry run, 1 startup error, 2 interrupted (checkpoint written)\n";
        return help.str();
    }

    std::string generateVersionText() const {
        std::ostringstream version;
        version << "acectl " << version_;
        if (!build_info_.empty()) {
            version << " (" << build_info_ << ")";
        }
        version << "\n";
        return version.str();
    }

    std::vector<CliOptionDefinition> definitions() const {
        std::lock_guard<std::mutex> lock(options_mutex_);
        return option_definitions_;
    }

    bool hasOption(const std::string& name) const {
        std::lock_guard<std::mutex> lock(options_mutex_);
        return findLong(name) != nullptr;
    }

    std::string help_header_;
    std::string version_;
    std::string build_info_;

private:
    const CliOptionDefinition* findLong(const std::string& name) const {
        for (const auto& opt : option_definitions_) {
            if (opt.long_name == name) return &opt;
        }
        return nullptr;
    }

    const CliOptionDefinition* findShort(char name) const {
        for (const auto& opt : option_definitions_) {
            if (opt.short_name && *opt.short_name == name) return &opt;
        }
        return nullptr;
    }

    static void fail(CliParseResult& result, CliParseStatus status, const std::string& message) {
        result.errors.push_back(message);
        // EN: The first failure decides the status
        // FR: Le premier échec détermine le statut
        if (result.status == CliParseStatus::SUCCESS) {
            result.status = status;
        }
    }

    mutable std::mutex options_mutex_;
    std::vector<CliOptionDefinition> option_definitions_;
};

ConfigOverrideParser::ConfigOverrideParser()
    : impl_(std::make_unique<ConfigOverrideParserImpl>()) {}

ConfigOverrideParser::~ConfigOverrideParser() = default;

void ConfigOverrideParser::addOption(const CliOptionDefinition& option_def) {
    impl_->addOption(option_def);
}

void ConfigOverrideParser::addOptions(const std::vector<CliOptionDefinition>& option_defs) {
    for (const auto& def : option_defs) {
        impl_->addOption(def);
    }
}

void ConfigOverrideParser::addConsolidationOptions() {
    std::vector<CliOptionDefinition> options;

    CliOptionDefinition help;
    help.long_name = "help";
    help.short_name = 'h';
    help.type = CliOptionType::BOOLEAN;
    help.description = "Show this help and exit";
    options.push_back(help);

    CliOptionDefinition version;
    version.long_name = "version";
    version.short_name = 'V';
    version.type = CliOptionType::BOOLEAN;
    version.description = "Show version and exit";
    options.push_back(version);

    CliOptionDefinition config;
    config.long_name = "config";
    config.short_name = 'c';
    config.description = "YAML configuration file (env ACE_CONFIG)";
    options.push_back(config);

    CliOptionDefinition db;
    db.long_name = "db";
    db.short_name = 'd';
    db.description = "SQLite archive to consolidate (env ACE_DB_PATH)";
    db.config_path = "database.path";
    db.category = "Run";
    options.push_back(db);

    CliOptionDefinition dry_run;
    dry_run.long_name = "dry-run";
    dry_run.short_name = 'n';
    dry_run.type = CliOptionType::BOOLEAN;
    dry_run.description = "Plan merges only, open the database read-only";
    dry_run.config_path = "run.dry_run";
    dry_run.category = "Run";
    options.push_back(dry_run);

    CliOptionDefinition entity_type;
    entity_type.long_name = "entity-type";
    entity_type.short_name = 't';
    entity_type.description = "Entity type to consolidate (Person, Organization, Unknown)";
    entity_type.config_path = "run.entity_type";
    entity_type.default_value = "Person";
    entity_type.category = "Run";
    options.push_back(entity_type);

    CliOptionDefinition min_confidence;
    min_confidence.long_name = "min-confidence";
    min_confidence.type = CliOptionType::DOUBLE;
    min_confidence.description = "Discard candidates below this confidence";
    min_confidence.config_path = "scoring.min_confidence";
    min_confidence.default_value = "0";
    min_confidence.constraint = CliOptionConstraint::RANGE;
    min_confidence.min_value = 0.0;
    min_confidence.max_value = 100.0;
    min_confidence.category = "Run";
    options.push_back(min_confidence);

    CliOptionDefinition resume;
    resume.long_name = "resume";
    resume.type = CliOptionType::BOOLEAN;
    resume.description = "Continue an interrupted run from its checkpoint";
    resume.config_path = "checkpoint.resume";
    resume.category = "Run";
    options.push_back(resume);

    CliOptionDefinition recount;
    recount.long_name = "recount-mentions";
    recount.type = CliOptionType::BOOLEAN;
    recount.description = "Recompute mention counts from mention rows after merging";
    recount.config_path = "run.recount_mentions";
    recount.category = "Run";
    options.push_back(recount);

    CliOptionDefinition audit_out;
    audit_out.long_name = "audit-out";
    audit_out.short_name = 'o';
    audit_out.description = "Audit JSON file (env ACE_AUDIT_PATH)";
    audit_out.config_path = "audit.output_path";
    audit_out.default_value = "consolidation_audit.json";
    audit_out.category = "Audit";
    options.push_back(audit_out);

    CliOptionDefinition audit_table;
    audit_table.long_name = "audit-table";
    audit_table.type = CliOptionType::BOOLEAN;
    audit_table.description = "Also append merges to the audit table";
    audit_table.config_path = "audit.write_table";
    audit_table.category = "Audit";
    options.push_back(audit_table);

    CliOptionDefinition backup_dir;
    backup_dir.long_name = "backup-dir";
    backup_dir.description = "Directory for the pre-run database backup";
    backup_dir.config_path = "backup.directory";
    backup_dir.default_value = "backups";
    backup_dir.category = "Audit";
    options.push_back(backup_dir);

    CliOptionDefinition no_backup;
    no_backup.long_name = "no-backup";
    no_backup.type = CliOptionType::BOOLEAN;
    no_backup.flag_value = false;
    no_backup.description = "Skip the pre-run database backup";
    no_backup.config_path = "backup.enabled";
    no_backup.category = "Audit";
    options.push_back(no_backup);

    CliOptionDefinition log_level;
    log_level.long_name = "log-level";
    log_level.description = "Minimum log level (env ACE_LOG_LEVEL)";
    log_level.config_path = "logging.level";
    log_level.default_value = "info";
    log_level.constraint = CliOptionConstraint::ENUM_VALUES;
    log_level.enum_values = {"debug", "info", "warn", "error"};
    log_level.category = "Logging";
    options.push_back(log_level);

    CliOptionDefinition log_file;
    log_file.long_name = "log-file";
    log_file.description = "Append NDJSON logs to this file instead of stdout";
    log_file.config_path = "logging.file";
    log_file.category = "Logging";
    options.push_back(log_file);

    addOptions(options);
}

CliParseResult ConfigOverrideParser::parse(int argc, char* argv[]) const {
    std::vector<std::string> arguments;
    for (int i = 1; i < argc; ++i) {
        arguments.emplace_back(argv[i]);
    }
    return impl_->parse(arguments);
}

CliParseResult ConfigOverrideParser::parse(const std::vector<std::string>& arguments) const {
    return impl_->parse(arguments);
}

std::string ConfigOverrideParser::generateHelpText(const std::string& program_name) const {
    return impl_->generateHelpText(program_name);
}

std::string ConfigOverrideParser::generateVersionText() const {
    return impl_->generateVersionText();
}

void ConfigOverrideParser::setHelpHeader(const std::string& header) {
    impl_->help_header_ = header;
}

void ConfigOverrideParser::setVersionInfo(const std::string& version, const std::string& build_info) {
    impl_->version_ = version;
    impl_->build_info_ = build_info;
}

std::vector<CliOptionDefinition> ConfigOverrideParser::getOptionDefinitions() const {
    return impl_->definitions();
}

bool ConfigOverrideParser::hasOption(const std::string& name) const {
    return impl_->hasOption(name);
}

size_t ConfigOverrideParser::applyOverrides(const CliParseResult& result, ConfigManager& manager) {
    size_t applied = 0;
    for (const auto& [path, value] : result.overrides) {
        size_t dot_pos = path.find('.');
        if (dot_pos == std::string::npos) {
            manager.set(path, value);
        } else {
            manager.set(path.substr(0, dot_pos), path.substr(dot_pos + 1), value);
        }
        LOG_DEBUG("cli", "Override " + path + " = " + value.toString());
        applied++;
    }
    return applied;
}

namespace ConfigOverrideUtils {

std::string cliOptionTypeToString(CliOptionType type) {
    switch (type) {
        case CliOptionType::BOOLEAN: return "BOOLEAN";
        case CliOptionType::INTEGER: return "INTEGER";
        case CliOptionType::DOUBLE: return "DOUBLE";
        case CliOptionType::STRING: return "STRING";
        case CliOptionType::STRING_LIST: return "STRING_LIST";
        default: return "UNKNOWN";
    }
}

std::string cliParseStatusToString(CliParseStatus status) {
    switch (status) {
        case CliParseStatus::SUCCESS: return "SUCCESS";
        case CliParseStatus::HELP_REQUESTED: return "HELP_REQUESTED";
        case CliParseStatus::VERSION_REQUESTED: return "VERSION_REQUESTED";
        case CliParseStatus::INVALID_OPTION: return "INVALID_OPTION";
        case CliParseStatus::MISSING_VALUE: return "MISSING_VALUE";
        case CliParseStatus::INVALID_VALUE: return "INVALID_VALUE";
        case CliParseStatus::CONSTRAINT_VIOLATION: return "CONSTRAINT_VIOLATION";
        default: return "UNKNOWN";
    }
}

ConfigValue parseCliValue(const std::string& raw_value, CliOptionType type) {
    switch (type) {
        case CliOptionType::BOOLEAN: {
            std::string lower = toLower(raw_value);
            return ConfigValue(lower == "true" || lower == "1" || lower == "yes" || lower == "on");
        }
        case CliOptionType::INTEGER:
            return ConfigValue(std::stoi(raw_value));
        case CliOptionType::DOUBLE:
            return ConfigValue(std::stod(raw_value));
        case CliOptionType::STRING:
            return ConfigValue(raw_value);
        case CliOptionType::STRING_LIST:
            return ConfigValue(splitList(raw_value));
        default:
            throw std::invalid_argument("Unknown CliOptionType");
    }
}

CliParseStatus validateCliValue(const std::string& raw_value, const CliOptionDefinition& definition,
                                std::string& error_message) {
    auto check_number = [&](double value) {
        if (definition.constraint == CliOptionConstraint::POSITIVE && value <= 0.0) {
            error_message = "Value must be positive";
            return CliParseStatus::CONSTRAINT_VIOLATION;
        }
        if (definition.constraint == CliOptionConstraint::NON_NEGATIVE && value < 0.0) {
            error_message = "Value must be non-negative";
            return CliParseStatus::CONSTRAINT_VIOLATION;
        }
        if (definition.constraint == CliOptionConstraint::RANGE) {
            if (definition.min_value && value < *definition.min_value) {
                error_message = "Value must be >= " + std::to_string(*definition.min_value);
                return CliParseStatus::CONSTRAINT_VIOLATION;
            }
            if (definition.max_value && value > *definition.max_value) {
                error_message = "Value must be <= " + std::to_string(*definition.max_value);
                return CliParseStatus::CONSTRAINT_VIOLATION;
            }
        }
        return CliParseStatus::SUCCESS;
    };

    try {
        switch (definition.type) {
            case CliOptionType::BOOLEAN: {
                std::string lower = toLower(raw_value);
                if (lower != "true" && lower != "false" && lower != "1" && lower != "0" &&
                    lower != "yes" && lower != "no" && lower != "on" && lower != "off") {
                    error_message = "Boolean value must be true/false, 1/0, yes/no, or on/off";
                    return CliParseStatus::INVALID_VALUE;
                }
                return CliParseStatus::SUCCESS;
            }

            case CliOptionType::INTEGER: {
                size_t consumed = 0;
                int value = std::stoi(raw_value, &consumed);
                if (consumed != raw_value.size()) {
                    error_message = "Not an integer: " + raw_value;
                    return CliParseStatus::INVALID_VALUE;
                }
                return check_number(static_cast<double>(value));
            }

            case CliOptionType::DOUBLE: {
                size_t consumed = 0;
                double value = std::stod(raw_value, &consumed);
                if (consumed != raw_value.size()) {
                    error_message = "Not a number: " + raw_value;
                    return CliParseStatus::INVALID_VALUE;
                }
                return check_number(value);
            }

            case CliOptionType::STRING: {
                if (raw_value.empty()) {
                    error_message = "Value cannot be empty";
                    return CliParseStatus::INVALID_VALUE;
                }
                if (definition.constraint == CliOptionConstraint::ENUM_VALUES &&
                    definition.enum_values.find(raw_value) == definition.enum_values.end()) {
                    error_message = "Value must be one of: ";
                    bool first = true;
                    for (const auto& valid_value : definition.enum_values) {
                        if (!first) error_message += ", ";
                        error_message += valid_value;
                        first = false;
                    }
                    return CliParseStatus::CONSTRAINT_VIOLATION;
                }
                return CliParseStatus::SUCCESS;
            }

            case CliOptionType::STRING_LIST: {
                if (splitList(raw_value).empty()) {
                    error_message = "String list cannot be empty";
                    return CliParseStatus::INVALID_VALUE;
                }
                return CliParseStatus::SUCCESS;
            }
        }
    } catch (const std::invalid_argument& e) {
        error_message = "Invalid format: " + std::string(e.what());
        return CliParseStatus::INVALID_VALUE;
    } catch (const std::out_of_range& e) {
        error_message = "Out of range: " + std::string(e.what());
        return CliParseStatus::INVALID_VALUE;
    }

    return CliParseStatus::SUCCESS;
}

std::string formatOptionHelp(const CliOptionDefinition& option) {
    std::ostringstream help;

    std::string option_names = "  ";
    if (option.short_name) {
        option_names += "-" + std::string(1, *option.short_name) + ", ";
    } else {
        option_names += "    ";
    }
    option_names += "--" + option.long_name;

    // EN: Add value type hint
    // FR: Ajouter l'indication de type de valeur
    if (option.type != CliOptionType::BOOLEAN) {
        option_names += " <" + cliOptionTypeToString(option.type) + ">";
    }

    const size_t name_width = 34;
    if (option_names.length() > name_width - 2) {
        help << option_names << "\n" << std::string(name_width, ' ') << option.description;
    } else {
        help << std::left << std::setw(static_cast<int>(name_width)) << option_names << option.description;
    }

    if (option.default_value && !option.default_value->empty()) {
        help << " (default: " << *option.default_value << ")";
    }

    return help.str();
}

bool isShortOption(const std::string& arg) {
    return arg.length() >= 2 && arg[0] == '-' && arg[1] != '-' &&
           std::isalpha(static_cast<unsigned char>(arg[1]));
}

bool isLongOption(const std::string& arg) {
    return arg.length() >= 3 && arg.compare(0, 2, "--") == 0 &&
           std::isalpha(static_cast<unsigned char>(arg[2]));
}

std::string extractOptionName(const std::string& arg) {
    if (isLongOption(arg)) {
        return arg.substr(2);
    } else if (isShortOption(arg)) {
        return arg.substr(1);
    }
    return "";
}

} // namespace ConfigOverrideUtils

} // namespace CLI
} // namespace ACE
