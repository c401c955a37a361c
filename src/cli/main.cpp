/**
 * @file main.cpp
 * @brief media_fetch command-line driver
 *
 * Exit status:
 * - 0: run completed (per-file failures are reported in the log)
 * - 1: configuration, connection or listing failure
 * - 2: another instance is running
 */

#include <kcenon/media_fetch/media_fetch.h>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

using namespace kcenon::media_fetch;

namespace {

constexpr int exit_ok = 0;
constexpr int exit_fatal = 1;
constexpr int exit_locked = 2;

std::atomic<bool> cancel_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        cancel_requested = true;
    }
}

void print_usage(const char* program) {
    std::cout << "media_fetch " << version::to_string() << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -c, --config-dir <dir>      Directory with media_fetch.conf, groups.list" << std::endl;
    std::cout << "                              and series.list (default: executable directory)" << std::endl;
    std::cout << "  --log-level <level>         trace, debug, info, warn, error or fatal" << std::endl;
    std::cout << "  --json-log                  Write log lines as JSON" << std::endl;
    std::cout << "  --lock-file <path>          Single-instance lock file" << std::endl;
    std::cout << "  --help                      Show this help message" << std::endl;
}

auto executable_dir(const char* argv0) -> std::filesystem::path {
    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        return self.parent_path();
    }
    return std::filesystem::absolute(argv0, ec).parent_path();
}

void apply_logging(const logging_settings& settings) {
    auto& logger = get_logger();
    logger.set_level(settings.level);
    logger.set_output_format(settings.format);
    logger.set_masking_config(settings.mask_sensitive ? masking_config::all_masked()
                                                      : masking_config::none());
}

}  // namespace

int main(int argc, char* argv[]) {
    std::filesystem::path config_dir = executable_dir(argv[0]);
    std::optional<log_level> level_override;
    bool json_log = false;
    std::filesystem::path lock_path = instance_lock::default_path();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return exit_ok;
        } else if (arg == "-c" || arg == "--config-dir") {
            if (++i >= argc) {
                std::cerr << "Error: --config-dir requires an argument" << std::endl;
                return exit_fatal;
            }
            config_dir = argv[i];
        } else if (arg == "--log-level") {
            if (++i >= argc) {
                std::cerr << "Error: --log-level requires an argument" << std::endl;
                return exit_fatal;
            }
            level_override = log_level_from_string(argv[i]);
            if (!level_override) {
                std::cerr << "Error: unknown log level '" << argv[i] << "'" << std::endl;
                return exit_fatal;
            }
        } else if (arg == "--json-log") {
            json_log = true;
        } else if (arg == "--lock-file") {
            if (++i >= argc) {
                std::cerr << "Error: --lock-file requires an argument" << std::endl;
                return exit_fatal;
            }
            lock_path = argv[i];
        } else {
            std::cerr << "Error: unknown option '" << arg << "'" << std::endl;
            print_usage(argv[0]);
            return exit_fatal;
        }
    }

    get_logger().initialize();
    if (level_override) {
        get_logger().set_level(*level_override);
    }

    auto lock = instance_lock::acquire(lock_path);
    if (!lock) {
        if (lock.error().code == error_code::instance_locked) {
            std::cerr << "Another instance of media_fetch is already running. Exiting."
                      << std::endl;
            return exit_locked;
        }
        MF_LOG_FATAL(log_category::app, lock.error().message);
        return exit_fatal;
    }

    auto config = app_config::load(config_dir);
    if (!config) {
        MF_LOG_FATAL(log_category::app,
                     std::string(to_string(config.error().code)) + ": " +
                         config.error().message);
        return exit_fatal;
    }

    auto settings = config.value().logging;
    if (level_override) {
        settings.level = *level_override;
    }
    if (json_log) {
        settings.format = log_output_format::json;
    }
    apply_logging(settings);

    std::shared_ptr<remote_store> store;
    if (!config.value().remote.move_local) {
        auto created = media_pipeline::create_remote_store(config.value().remote);
        if (!created) {
            MF_LOG_FATAL(log_category::app, created.error().message);
            return exit_fatal;
        }
        store = std::move(created.value());
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    media_pipeline pipeline(std::move(config.value()), std::move(store),
                            std::make_shared<process_tool_runner>(&cancel_requested),
                            &cancel_requested);

    auto summary = pipeline.run();
    get_logger().flush();
    if (!summary) {
        return exit_fatal;
    }
    return exit_ok;
}
