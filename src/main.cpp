#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "logging/sanitizing_logger.hpp"
#include "logging/stream_sink.hpp"
#include "payload/json_payload.hpp"
#include "redact/sanitizer.hpp"

#include <cstdint>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

using namespace logscrub;

namespace {

struct CliOptions {
    std::string config_file;
    bool json_mode = false;
    bool records_mode = false;
    bool list_detectors = false;
    bool help = false;
};

void print_usage(std::ostream& out) {
    out << "Usage: logscrub [--config FILE] [--json] [--records] [--list-detectors]\n"
           "\n"
           "Reads log lines from stdin and writes them to stdout with credentials redacted.\n"
           "\n"
           "  --config FILE      TOML configuration (detectors, sensitive keys, mask)\n"
           "  --json             treat each line as a JSON payload and sanitize it structurally\n"
           "  --records          emit each line as a log record (format from [logging])\n"
           "  --list-detectors   print the active detectors in priority order and exit\n";
}

/// Returns false on an unknown or incomplete argument
bool parse_args(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                utils::log::error("--config requires a file argument");
                return false;
            }
            opts.config_file = argv[++i];
        } else if (arg == "--json") {
            opts.json_mode = true;
        } else if (arg == "--records") {
            opts.records_mode = true;
        } else if (arg == "--list-detectors") {
            opts.list_detectors = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else {
            utils::log::error(std::format("Unknown argument: {}", arg));
            return false;
        }
    }
    return true;
}

void list_detectors(const PatternRegistry& registry) {
    for (const auto& detector : registry.detectors()) {
        std::cout << std::format("{:<26} {:<15} group={} min_entropy={}\n",
            detector.name, detector_kind_to_string(detector.kind),
            detector.secret_group, detector.min_entropy);
    }
    std::cout << std::format("sensitive keys: {}\n", registry.sensitive_keys().size());
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::ios::sync_with_stdio(false);

    CliOptions opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(std::cerr);
        return 2;
    }
    if (opts.help) {
        print_usage(std::cout);
        return 0;
    }

    try {
        ScrubConfig config;
        if (!opts.config_file.empty()) {
            auto loaded = ConfigLoader::load_from_file(opts.config_file);
            if (!loaded.is_ok()) {
                utils::log::error(loaded.error_message());
                return 1;
            }
            config = std::move(loaded.value());
        }
        utils::log::set_level(config.logging.level);

        const auto registry = ConfigLoader::build_registry(config.redaction);
        utils::log::debug(std::format("{} detectors active", registry->detectors().size()));

        if (opts.list_detectors) {
            list_detectors(*registry);
            return 0;
        }

        const Sanitizer sanitizer(registry);
        SanitizingLogger logger(registry, LogLevel::DEBUG);
        if (opts.records_mode) {
            StreamSink::Config sink_config;
            sink_config.format = config.logging.format;
            sink_config.label = "stdout";
            logger.add_sink(std::make_shared<StreamSink>(std::cout, sink_config));
        }

        StructuredRedactor::Stats stats;
        uint64_t lines = 0;
        uint64_t fallbacks = 0;
        std::string line;

        while (std::getline(std::cin, line)) {
            ++lines;
            if (opts.records_mode) {
                if (opts.json_mode) {
                    (void)logger.log_json_line(LogLevel::INFO, line);
                } else {
                    (void)logger.info(line);
                }
                continue;
            }

            if (opts.json_mode) {
                const auto sanitized = sanitize_json_line(sanitizer, line, stats);
                if (!sanitized.parsed) ++fallbacks;
                std::cout << sanitized.json << '\n';
            } else {
                std::cout << sanitizer.sanitize_message(line) << '\n';
            }
        }

        logger.flush();
        std::cout.flush();

        const auto logger_stats = logger.get_stats();
        utils::log::debug(std::format(
            "Processed {} lines: {} keys masked, {} strings redacted, {} cycles broken, "
            "{} non-JSON fallbacks, {} records written",
            lines, stats.keys_masked, stats.strings_redacted, stats.cycles_broken,
            fallbacks, logger_stats.total_written));

    } catch (const PatternCompilationError& e) {
        utils::log::error(std::format("Detector '{}' failed to compile: {}", e.detector(), e.what()));
        return 1;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
