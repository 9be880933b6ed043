#include "backup_cli.hpp"
#include "backup_config.hpp"
#include "backup_manager.hpp"
#include "backup_scheduler.hpp"
#include "logger.hpp"
#include "notification.hpp"
#include <charconv>
#include <chrono>
#include <memory>
#include <csignal>
#include <ostream>
#include <thread>

namespace {

volatile std::sig_atomic_t gShutdownFlag = 0;

void signalHandler(int /*sig*/) {
    gShutdownFlag = 1;
}

void installSignalHandlers() {
    struct sigaction sa {};
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

std::expected<int, std::string> parsePositive(const std::string& value) {
    int parsed = 0;
    auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || end != value.data() + value.size() || parsed <= 0 ||
        parsed > BackupConfig::maxScheduleIntervalHours) {
        return std::unexpected("Invalid interval: " + value);
    }
    return parsed;
}

int reportFailure(std::ostream& err, const BackupError& error) {
    err << "Error: " << toString(error.code) << ": " << error.message << std::endl;
    return 1;
}

int runDaemon(BackupManager& manager, const BackupConfig& config, const CliOptions& options,
              std::shared_ptr<const Logger> logger, std::ostream& out) {
    std::shared_ptr<NotificationStrategy> notifier;
    if (!config.webhookUrl.empty()) {
        notifier = std::make_shared<WebhookNotificationStrategy>(config.webhookUrl, config.notificationTimeoutSeconds);
    }

    installSignalHandlers();
    int intervalHours = options.intervalHours.value_or(config.scheduleIntervalHours);
    out << "Daemon mode started. Check " << config.logFile << " for logs." << std::endl;

    auto scheduler = manager.schedule(intervalHours, notifier);
    while (!gShutdownFlag) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    scheduler->stop();
    logger->info("Daemon shutting down gracefully");
    return 0;
}

} // namespace

std::expected<CliOptions, std::string> parseCliArguments(const std::vector<std::string>& arguments) {
    CliOptions options;
    for (size_t i = 0; i < arguments.size(); ++i) {
        const std::string& arg = arguments[i];
        if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--config") {
            if (i + 1 >= arguments.size()) {
                return std::unexpected("--config requires a path");
            }
            options.configFile = arguments[++i];
        } else if (arg == "--interval-hours") {
            if (i + 1 >= arguments.size()) {
                return std::unexpected("--interval-hours requires a value");
            }
            auto hours = parsePositive(arguments[++i]);
            if (!hours) {
                return std::unexpected(hours.error());
            }
            options.intervalHours = *hours;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return std::unexpected("Unknown option: " + arg);
        } else if (options.command.empty()) {
            options.command = arg;
        } else {
            options.args.push_back(arg);
        }
    }

    if (options.help) {
        return options;
    }
    if (options.command.empty()) {
        return std::unexpected("No command given");
    }

    if (options.command == "backup") {
        if (options.args.size() > 1) {
            return std::unexpected("backup takes at most one argument");
        }
        if (!options.args.empty() && options.args[0] != "full" && options.args[0] != "database" &&
            options.args[0] != "files") {
            return std::unexpected("Unknown backup kind: " + options.args[0]);
        }
    } else if (options.command == "restore-database" || options.command == "restore-files") {
        if (options.args.size() != 1) {
            return std::unexpected(options.command + " requires exactly one backup file");
        }
    } else if (options.command == "list" || options.command == "daemon") {
        if (!options.args.empty()) {
            return std::unexpected(options.command + " takes no arguments");
        }
    } else {
        return std::unexpected("Unknown command: " + options.command);
    }

    if (options.intervalHours && options.command != "daemon") {
        return std::unexpected("--interval-hours only applies to the daemon command");
    }
    return options;
}

std::string cliUsage(const std::string& program) {
    return "Usage: " + program + " [--config <path>] [--interval-hours N] <command>\n"
           "Commands:\n"
           "  backup [full|database|files]   create backup artifacts (default: full)\n"
           "  restore-database <file>        restore the database from a snapshot\n"
           "  restore-files <file>           extract an uploads archive\n"
           "  list                           list backup artifacts\n"
           "  daemon                         back up now and on every interval\n";
}

int runCli(const CliOptions& options, std::ostream& out, std::ostream& err) {
    try {
        BackupConfig config(options.configFile);
        std::shared_ptr<const Logger> logger = std::make_shared<Logger>(config);
        auto manager = BackupManager::create(config, logger);

        if (options.command == "backup") {
            std::string kind = options.args.empty() ? "full" : options.args[0];
            if (kind == "database") {
                auto result = manager->createDatabaseBackup();
                if (!result) {
                    return reportFailure(err, result.error());
                }
                out << *result << std::endl;
            } else if (kind == "files") {
                auto result = manager->createFileBackup();
                if (!result) {
                    return reportFailure(err, result.error());
                }
                out << *result << std::endl;
            } else {
                auto result = manager->createFullBackup();
                if (!result) {
                    return reportFailure(err, result.error());
                }
                out << result->databasePath << '\n' << result->filesPath << std::endl;
            }
            return 0;
        }

        if (options.command == "restore-database" || options.command == "restore-files") {
            auto result = options.command == "restore-database" ? manager->restoreDatabase(options.args[0])
                                                                : manager->restoreFiles(options.args[0]);
            if (!result) {
                return reportFailure(err, result.error());
            }
            return 0;
        }

        if (options.command == "list") {
            for (const auto& name : manager->listBackups()) {
                out << name << '\n';
            }
            out.flush();
            return 0;
        }

        if (options.command == "daemon") {
            return runDaemon(*manager, config, options, logger, out);
        }

        err << "Error: Unknown command: " << options.command << std::endl;
        return 1;
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << std::endl;
        return 1;
    }
}
