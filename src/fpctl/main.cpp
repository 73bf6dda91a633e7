// EN: fpctl - command line front end of FileProof. Validates one file and prints the report.
// FR: fpctl - interface ligne de commande de FileProof. Valide un fichier et affiche le rapport.

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "infrastructure/cli/argument_parser.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/signal_handler.hpp"
#include "orchestrator/validation_job.hpp"
#include "validation/validation_settings.hpp"

namespace {

constexpr int kExitPassed = 0;
constexpr int kExitFailed = 1;
constexpr int kExitCancelled = 2;
constexpr int kExitUsage = 64;

constexpr auto kPollInterval = std::chrono::milliseconds(100);

int usageError(const std::string& message) {
    std::cerr << "fpctl: " << message << "\n";
    std::cerr << "Try 'fpctl --help' for more information.\n";
    return kExitUsage;
}

void drawProgress(const FP::Orchestrator::ProgressSnapshot& progress) {
    std::ostringstream line;
    line << "\rValidating: " << std::fixed << std::setprecision(1) << progress.percent << "% | rows "
         << progress.rows_processed << " | errors " << progress.errors_so_far << "   ";
    std::cerr << line.str() << std::flush;
}

// EN: Write the optional report files; returns false if any of them failed
// FR: Écrit les fichiers de rapport optionnels ; retourne false si l'un d'eux a échoué
bool writeOutputs(const FP::Validation::ValidationReport& report, const FP::Validation::ValidationSettings& settings) {
    bool ok = true;
    auto attempt = [&ok](const std::string& path, const std::string& what, auto&& write) {
        if (path.empty()) {
            return;
        }
        try {
            write(path);
            LOG_INFO("fpctl", what + " written to " + path);
        } catch (const std::runtime_error& e) {
            std::cerr << "fpctl: " << e.what() << "\n";
            ok = false;
        }
    };

    attempt(settings.report_path, "Text report", [&report](const std::string& p) { report.saveReport(p); });
    attempt(settings.errors_csv_path, "Error CSV", [&report](const std::string& p) { report.exportErrorsCsv(p); });
    attempt(settings.json_report_path, "JSON report", [&report](const std::string& p) { report.saveJson(p); });
    return ok;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace FP;

    CLI::ArgumentParser parser("fpctl");
    parser.addStandardOptions();
    parser.setVersionInfo("1.0.0", std::string("built ") + __DATE__);

    CLI::CliParseResult cli = parser.parse(argc, argv);
    switch (cli.status) {
        case CLI::CliParseStatus::HELP_REQUESTED:
            std::cout << cli.help_text;
            return kExitPassed;
        case CLI::CliParseStatus::VERSION_REQUESTED:
            std::cout << cli.version_text;
            return kExitPassed;
        case CLI::CliParseStatus::SUCCESS:
            break;
        default:
            return usageError(cli.errors.empty() ? "invalid arguments" : cli.errors.front());
    }

    if (cli.positional.size() != 1) {
        return usageError(cli.positional.empty() ? "missing input file" : "exactly one input file is expected");
    }
    const std::string input_path = cli.positional.front();

    // EN: Precedence: defaults < YAML file < FP_ environment < command line
    // FR: Priorité : défauts < fichier YAML < environnement FP_ < ligne de commande
    ConfigManager config;
    if (cli.has("config")) {
        const std::string config_path = cli.get("config").as<std::string>();
        if (!config.loadFromFile(config_path)) {
            return usageError("cannot load configuration file " + config_path);
        }
    }
    config.loadEnvironmentOverrides("FP_");
    CLI::ArgumentParser::applyOverrides(cli, config);

    config.addValidationRules(Validation::ValidationSettings::configRules());
    std::vector<std::string> config_errors;
    if (!config.validate(config_errors)) {
        for (const auto& error : config_errors) {
            std::cerr << "fpctl: " << error << "\n";
        }
        return kExitUsage;
    }

    Validation::ValidationSettings settings;
    try {
        settings = Validation::ValidationSettings::fromConfig(config);
    } catch (const std::invalid_argument& e) {
        return usageError(e.what());
    }

    Logger& logger = Logger::getInstance();
    if (auto level = Logger::levelFromString(settings.log_level)) {
        logger.setLogLevel(*level);
    }
    if (!settings.log_file.empty()) {
        logger.setOutputFile(settings.log_file);
    }

    const bool quiet = cli.has("quiet");

    Orchestrator::ValidationJob job(input_path, settings);

    SignalHandler& signals = SignalHandler::getInstance();
    try {
        signals.initialize();
    } catch (const std::runtime_error& e) {
        LOG_WARN("fpctl", std::string("Interrupts will not cancel validation: ") + e.what());
    }
    signals.registerCleanupCallback("validation_job", [&job]() { job.cancel(); });

    job.start();
    while (job.isRunning()) {
        signals.dispatchPendingShutdown();
        if (!quiet) {
            auto progress = job.latestProgress();
            if (progress.updates > 0) {
                drawProgress(progress);
            }
        }
        std::this_thread::sleep_for(kPollInterval);
    }
    signals.dispatchPendingShutdown();

    Validation::ValidationReport report;
    try {
        report = job.wait();
    } catch (const std::exception& e) {
        signals.unregisterCleanupCallback("validation_job");
        std::cerr << "\nfpctl: validation aborted: " << e.what() << "\n";
        return kExitFailed;
    }
    signals.unregisterCleanupCallback("validation_job");

    if (!quiet) {
        drawProgress(job.latestProgress());
        std::cerr << "\n";
    }

    std::cout << report.generateText();

    bool outputs_ok = writeOutputs(report, settings);

    if (report.cancelled) {
        return kExitCancelled;
    }
    return report.passed && outputs_ok ? kExitPassed : kExitFailed;
}
