// EN: acectl entry point. Startup order: CLI, YAML file, environment, CLI overrides, validation,
//     database, backup, then one consolidation run.
// FR: Point d'entrée d'acectl. Ordre de démarrage : CLI, fichier YAML, environnement, surcharges
//     CLI, validation, base, sauvegarde, puis une exécution de consolidation.

#include "consolidation/audit_logger.hpp"
#include "consolidation/consolidation_config.hpp"
#include "consolidation/consolidation_engine.hpp"
#include "infrastructure/cli/config_override.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/signal_handler.hpp"
#include "storage/database.hpp"

#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

constexpr const char* ACECTL_VERSION = "1.0.0";

enum ExitCode {
    EXIT_COMPLETED = 0,
    EXIT_STARTUP_ERROR = 1,
    EXIT_INTERRUPTED = 2
};

// EN: <dir>/<db stem>_<UTC timestamp>.db
// FR: <dir>/<nom de la base>_<horodatage UTC>.db
std::string backupPath(const std::string& directory, const std::string& database_path) {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);

    std::ostringstream name;
    name << std::filesystem::path(database_path).stem().string() << "_"
         << std::put_time(&utc, "%Y%m%dT%H%M%SZ") << ".db";
    return (std::filesystem::path(directory) / name.str()).string();
}

bool configureLogging(const ACE::Consolidation::LoggingSettings& settings) {
    auto level = ACE::parseLogLevel(settings.level);
    if (!level) {
        std::cerr << "Unknown log level: " << settings.level << std::endl;
        return false;
    }
    ACE::Logger::getInstance().setLogLevel(*level);
    if (!settings.file.empty() && !ACE::Logger::getInstance().setOutputFile(settings.file)) {
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace ACE;
    using namespace ACE::Consolidation;

    // EN: Command line
    // FR: Ligne de commande
    CLI::ConfigOverrideParser parser;
    parser.addConsolidationOptions();
    parser.setVersionInfo(ACECTL_VERSION, std::string("built ") + __DATE__);

    CLI::CliParseResult cli = parser.parse(argc, argv);
    if (cli.status == CLI::CliParseStatus::HELP_REQUESTED) {
        std::cout << cli.help_text;
        return EXIT_COMPLETED;
    }
    if (cli.status == CLI::CliParseStatus::VERSION_REQUESTED) {
        std::cout << cli.version_text;
        return EXIT_COMPLETED;
    }
    if (cli.status != CLI::CliParseStatus::SUCCESS) {
        for (const auto& error : cli.errors) {
            std::cerr << "acectl: " << error << std::endl;
        }
        std::cerr << "Try 'acectl --help' for more information." << std::endl;
        return EXIT_STARTUP_ERROR;
    }
    for (const auto& warning : cli.warnings) {
        LOG_WARN("acectl", warning);
    }

    // EN: Configuration layers: YAML file < environment < command line
    // FR: Couches de configuration : fichier YAML < environnement < ligne de commande
    ConfigManager& config = ConfigManager::getInstance();
    config.addValidationRules(ConsolidationConfig::validationRules());

    std::string config_file;
    if (auto it = cli.arguments.find("config"); it != cli.arguments.end()) {
        config_file = it->second;
    } else if (const char* env_config = std::getenv("ACE_CONFIG")) {
        config_file = env_config;
    }
    if (!config_file.empty() && !config.loadFromFile(config_file)) {
        std::cerr << "acectl: cannot load configuration file " << config_file << std::endl;
        return EXIT_STARTUP_ERROR;
    }

    config.loadEnvironmentOverrides(ConsolidationConfig::environmentBindings());
    CLI::ConfigOverrideParser::applyOverrides(cli, config);

    std::vector<std::string> errors;
    if (!config.validate(errors)) {
        for (const auto& error : errors) {
            std::cerr << "acectl: " << error << std::endl;
        }
        return EXIT_STARTUP_ERROR;
    }

    ConsolidationConfig settings;
    try {
        settings = ConsolidationConfig::fromConfigManager(config);
    } catch (const std::invalid_argument& e) {
        std::cerr << "acectl: invalid configuration: " << e.what() << std::endl;
        return EXIT_STARTUP_ERROR;
    }

    if (!configureLogging(settings.logging)) {
        return EXIT_STARTUP_ERROR;
    }
    Logger::getInstance().addGlobalMetadata("entity_type", entityTypeToString(settings.entity_type));

    // EN: Database: read-only in dry-run, never created
    // FR: Base : lecture seule en simulation, jamais créée
    Storage::Database db;
    Storage::Database::Options options;
    options.mode = settings.dry_run ? Storage::Database::OpenMode::READ_ONLY
                                    : Storage::Database::OpenMode::READ_WRITE;
    options.foreign_keys = settings.database.foreign_keys;
    options.busy_timeout_ms = settings.database.busy_timeout_ms;

    auto opened = db.open(settings.database.path, options);
    if (!opened) {
        LOG_ERROR("acectl", "Cannot open database " + settings.database.path + ": " + opened.error().message);
        return EXIT_STARTUP_ERROR;
    }

    AuditLogger audit;
    if (!settings.dry_run) {
        if (settings.backup.enabled) {
            std::string destination = backupPath(settings.backup.directory, settings.database.path);
            auto backed_up = db.backupTo(destination);
            if (!backed_up) {
                LOG_ERROR("acectl", "Backup failed, refusing to run: " + backed_up.error().message);
                return EXIT_STARTUP_ERROR;
            }
        } else {
            LOG_WARN("acectl", "Backup disabled; merges cannot be rolled back from a snapshot");
        }

        if (settings.audit.write_file) {
            audit.addSink(std::make_unique<JsonFileAuditSink>(settings.audit.output_path));
        }
        if (settings.audit.write_table) {
            audit.addSink(std::make_unique<SqliteAuditSink>(db, settings.audit.table, settings.audit.actor));
        }
        if (audit.sinkCount() == 0) {
            LOG_WARN("acectl", "No audit sink configured; merges will only be logged");
        }
    }

    SignalHandler& signals = SignalHandler::getInstance();
    try {
        signals.initialize();
    } catch (const std::runtime_error& e) {
        LOG_ERROR("acectl", std::string("Cannot install signal handlers: ") + e.what());
        return EXIT_STARTUP_ERROR;
    }
    signals.registerCleanupCallback("logger", []() { Logger::getInstance().flush(); });

    ConsolidationEngine engine(db, settings, audit,
                               [&signals]() { return signals.isShutdownRequested(); });
    Logger::getInstance().setCorrelationId(engine.runId());

    RunResult result = engine.run();
    std::cout << engine.statistics().generateReport();

    if (!result.audit_persisted) {
        LOG_ERROR("acectl", "Audit trail could not be fully persisted; checkpoint kept for --resume");
    }

    switch (result.status) {
        case RunStatus::COMPLETED:
        case RunStatus::DRY_RUN:
            Logger::getInstance().flush();
            return EXIT_COMPLETED;
        case RunStatus::INTERRUPTED:
            signals.runCleanup();
            return EXIT_INTERRUPTED;
        case RunStatus::FAILED:
        default:
            LOG_ERROR("acectl", "Run failed: " + result.message);
            Logger::getInstance().flush();
            return EXIT_STARTUP_ERROR;
    }
}
