#include "updraft/config/supervisor_config.h"
#include "updraft/core/context.h"
#include "updraft/health/health_verifier.h"
#include "updraft/process/process_supervisor.h"
#include "updraft/remote/directory_remote_source.h"
#include "updraft/runtime/instance_guard.h"
#include "updraft/runtime/shutdown_signals.h"
#include "updraft/update/update_controller.h"
#include "updraft/version/version_store.h"

#include <cstring>
#include <iostream>
#include <optional>
#include <string>

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_RUNTIME_ERROR = 1;
constexpr int EXIT_INVALID_CONFIG = 2;
constexpr int EXIT_LOCKED = 3;
constexpr int EXIT_UPDATE_AVAILABLE = 10;

struct Options {
    std::string config_path = "updraft.toml";
    bool config_given = false;
    bool once = false;
    bool check = false;
    bool print_config = false;
    bool help = false;
};

void print_usage(std::ostream& out) {
    out << "Usage: updraftd [--config <path>] [--once] [--check] [--print-config]\n"
        << "\n"
        << "  --config <path>  Configuration file (default: updraft.toml)\n"
        << "  --once           Start the application, run one update cycle, stop and exit\n"
        << "  --check          Only check for an update (exit 10 if one is available)\n"
        << "  --print-config   Print the effective configuration and exit\n"
        << "  -h, --help       Show this help\n";
}

bool parse_args(int argc, char** argv, Options& opts) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--config") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "updraftd: --config needs a path\n";
                return false;
            }
            opts.config_path = argv[++i];
            opts.config_given = true;
        } else if (std::strncmp(arg, "--config=", 9) == 0) {
            opts.config_path = arg + 9;
            opts.config_given = true;
        } else if (std::strcmp(arg, "--once") == 0) {
            opts.once = true;
        } else if (std::strcmp(arg, "--check") == 0) {
            opts.check = true;
        } else if (std::strcmp(arg, "--print-config") == 0) {
            opts.print_config = true;
        } else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            opts.help = true;
        } else {
            std::cerr << "updraftd: unknown argument '" << arg << "'\n";
            return false;
        }
    }
    return true;
}

std::expected<updraft::SupervisorConfig, updraft::ConfigError> load_config(const Options& opts) {
    auto loaded = updraft::SupervisorConfig::from_toml_file(opts.config_path);
    if (!loaded && loaded.error().code == updraft::ConfigErrorCode::FILE_NOT_FOUND && !opts.config_given) {
        loaded = updraft::SupervisorConfig{};
    }
    return loaded.and_then([](const updraft::SupervisorConfig& config) {
        return config.with_environment_overrides();
    });
}

} // namespace

int main(int argc, char** argv) {
    Options opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(std::cerr);
        return EXIT_INVALID_CONFIG;
    }
    if (opts.help) {
        print_usage(std::cout);
        return EXIT_OK;
    }

    // ========================================================================
    // Configuration
    // ========================================================================

    auto config = load_config(opts);
    if (!config) {
        std::cerr << "updraftd: " << config.error().message << "\n";
        return EXIT_INVALID_CONFIG;
    }

    auto validation = config->validate();
    if (validation.has_issues()) {
        std::cerr << validation.report();
    }
    if (!validation.is_valid) {
        return EXIT_INVALID_CONFIG;
    }

    if (opts.print_config) {
        std::cout << config->to_toml();
        return EXIT_OK;
    }

    std::optional<updraft::SupervisorContext> context;
    try {
        context.emplace(updraft::make_logger(config->logging, "updraftd"));
    } catch (const std::exception& e) {
        std::cerr << "updraftd: cannot set up logging: " << e.what() << "\n";
        return EXIT_INVALID_CONFIG;
    }
    auto& logger = context->logger();

    auto guard = updraft::InstanceGuard::acquire(config->lock_file_path());
    if (!guard) {
        logger.error(guard.error().message);
        return EXIT_LOCKED;
    }

    // ========================================================================
    // Components
    // ========================================================================

    updraft::VersionStore store(*context,
                                config->supervisor.versions_dir,
                                config->supervisor.max_versions,
                                config->application.scan_exclude);
    if (auto loaded = store.load(); !loaded) {
        logger.error("Cannot load version history: " + loaded.error().message);
        return EXIT_RUNTIME_ERROR;
    }

    auto remote = updraft::make_remote_source(*context, config->remote);
    updraft::ProcessSupervisor process(*context, config->application);
    updraft::HealthVerifier verifier(*context, config->health, process, updraft::make_health_signal(*config));
    updraft::UpdateController controller(*context, *config, store, process, verifier, *remote);

    if (opts.check) {
        auto release = controller.check_for_update();
        if (!release) {
            std::cout << "up to date (" << store.get_current().value_or("no version") << ")\n";
            return EXIT_OK;
        }
        std::cout << "update available: " << release->identifier << "\n";
        return EXIT_UPDATE_AVAILABLE;
    }

    // ========================================================================
    // Main loop
    // ========================================================================

    // SIGINT/SIGTERM은 대기 스레드에서만 받는다. 스코프를 빠져나가면 항상 join된다
    updraft::ShutdownSignalWaiter shutdown_signals(*context);
    auto& cancellation = context->cancellation();

    int exit_code = EXIT_OK;
    try {
        if (opts.once) {
            controller.bootstrap();
            if (!cancellation.is_cancelled()) {
                auto outcome = controller.run_cycle();
                logger.info("Single cycle finished: " + updraft::to_string(outcome));
                if (outcome == updraft::CycleOutcome::ROLLBACK_FAILED) {
                    exit_code = EXIT_RUNTIME_ERROR;
                }
            }
            process.stop();
        } else {
            controller.run();
        }
    } catch (const std::exception& e) {
        logger.error(std::string("Supervisor stopped on error: ") + e.what());
        process.stop();
        exit_code = EXIT_RUNTIME_ERROR;
    }

    logger.flush();
    return exit_code;
}
