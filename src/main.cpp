#include "restprobe/Config.hpp"
#include "restprobe/config/ConfigLoader.hpp"
#include "restprobe/core/ProbeCoordinator.hpp"
#include "restprobe/http/HttpClient.hpp"
#include "restprobe/log/StructuredLogger.hpp"
#include "restprobe/probe/EndpointProber.hpp"
#include "restprobe/sink/ResultSink.hpp"
#include "restprobe/targets/TargetExpander.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#ifndef RESTPROBE_VERSION
#define RESTPROBE_VERSION "v0.1.0"
#endif

namespace {

constexpr std::string_view kRestprobeVersion = RESTPROBE_VERSION;

class CliException : public std::exception {
public:
    CliException(std::string code, std::string message, std::string hint = {})
        : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
        formatted_ = code_.empty() ? message_ : ("[" + code_ + "] " + message_);
    }

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    const std::string& hint() const& {
        return hint_;
    }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

[[noreturn]] void throw_cli_error(std::string code, std::string message, std::string hint = {}) {
    throw CliException(std::move(code), std::move(message), std::move(hint));
}

void print_cli_error(const CliException& ex) {
    std::cerr << ex.what() << std::endl;
    if (!ex.hint().empty()) {
        std::cerr << "Hint: " << ex.hint() << std::endl;
    }
}

void print_target_error(const restprobe::targets::TargetError& ex) {
    std::cerr << ex.what() << std::endl;
    if (!ex.hint.empty()) {
        std::cerr << "Hint: " << ex.hint << std::endl;
    }
}

void print_usage() {
    std::cout << "restprobe " << kRestprobeVersion << std::endl;
    std::cout << "Usage: restprobe [options] (--ip_input <addr|cidr> | --ip_file <path>)\n\n";
    std::cout << "Targets:\n"
              << "  --ip_input <addr|cidr>    Single IPv4 address or CIDR block (network and broadcast skipped)\n"
              << "  --ip_file <path>          Newline-delimited host list; blank and repeated lines ignored\n\n";
    std::cout << "Options:\n"
              << "  --timeout <sec>           Per-request timeout in seconds (default 3)\n"
              << "  --output <file|stdout>    Print results or write response_<host>.yaml (default stdout)\n"
              << "  --output-dir <path>       Directory for response files (default .)\n"
              << "  --config <path>           JSON or YAML configuration file\n"
              << "  --log-format <text|json>  Log line format on stderr (default text)\n"
              << "  --quiet                   Only log warnings and errors\n"
              << "  --version                 Print the version and exit\n"
              << "  -h, --help                Show this help\n\n";
    std::cout << "Each host is tried against these endpoints in order; the first HTTP 200\n"
              << "with a JSON body wins:\n";
    for (const auto& endpoint : restprobe::default_endpoints()) {
        std::cout << "  " << endpoint.name << " (port " << endpoint.port << ")\n";
    }
    std::cout.flush();
}

struct CliOptions {
    std::optional<std::string> ip_input;
    std::optional<std::string> ip_file;
    std::optional<std::chrono::seconds> timeout;
    std::optional<restprobe::Config::OutputMode> output_mode;
    std::optional<std::string> output_directory;
    std::optional<std::string> config_path;
    std::optional<restprobe::Config::LogFormat> log_format;
    bool quiet{false};
};

std::chrono::seconds parse_timeout(std::string_view text) {
    std::int64_t value{};
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    const auto result = std::from_chars(begin, end, value);
    if (text.empty() || result.ec != std::errc{} || result.ptr != end || value <= 0 || value > restprobe::kMaxTimeoutSeconds) {
        throw_cli_error("E_INVALID_TIMEOUT",
                        "--timeout must be a positive integer",
                        "Provide the per-request timeout in seconds, between 1 and " + std::to_string(restprobe::kMaxTimeoutSeconds));
    }
    return std::chrono::seconds(value);
}

void set_once(std::optional<std::string>& slot, std::string_view option, std::string value) {
    if (slot.has_value()) {
        throw_cli_error("E_DUPLICATE_OPTION",
                        "Option " + std::string(option) + " specified multiple times",
                        "Provide " + std::string(option) + " only once");
    }
    slot = std::move(value);
}

void configure_logger(const restprobe::Config& config) {
    auto& logger = restprobe::log::StructuredLogger::instance();
    logger.set_format(config.log_format == restprobe::Config::LogFormat::Json
                          ? restprobe::log::StructuredLogger::Format::Json
                          : restprobe::log::StructuredLogger::Format::Text);
    logger.set_minimum_level(config.log_info_enabled ? restprobe::log::StructuredLogger::Level::Info
                                                     : restprobe::log::StructuredLogger::Level::Warning);
}

}  // namespace

int main(int argc, char** argv) {
    try {
        std::vector<std::string_view> args;
        args.reserve(static_cast<std::size_t>(argc));
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }

        if (args.empty()) {
            print_usage();
            return 0;
        }

        CliOptions options{};
        std::size_t index = 0;

        auto require_value = [&](std::string_view option) -> std::string {
            if (index >= args.size()) {
                throw_cli_error("E_MISSING_VALUE",
                                std::string(option) + " requires a value",
                                "Provide an argument immediately after " + std::string(option));
            }
            return std::string(args[index++]);
        };

        while (index < args.size()) {
            const auto opt = args[index++];
            if (opt == "--help" || opt == "-h") {
                print_usage();
                return 0;
            }
            if (opt == "--version") {
                std::cout << "restprobe " << kRestprobeVersion << std::endl;
                return 0;
            }
            if (opt == "--ip_input") {
                set_once(options.ip_input, opt, require_value(opt));
                continue;
            }
            if (opt == "--ip_file") {
                set_once(options.ip_file, opt, require_value(opt));
                continue;
            }
            if (opt == "--timeout") {
                options.timeout = parse_timeout(require_value(opt));
                continue;
            }
            if (opt == "--output") {
                const auto value = require_value(opt);
                const auto mode = restprobe::parse_output_mode(value);
                if (!mode) {
                    throw_cli_error("E_INVALID_OUTPUT",
                                    "Unsupported --output value: " + value,
                                    "Use --output file or --output stdout");
                }
                options.output_mode = *mode;
                continue;
            }
            if (opt == "--output-dir") {
                auto value = require_value(opt);
                if (value.empty()) {
                    throw_cli_error("E_INVALID_OUTPUT_DIR", "--output-dir cannot be empty", "Provide a directory path");
                }
                set_once(options.output_directory, opt, std::move(value));
                continue;
            }
            if (opt == "--config") {
                set_once(options.config_path, opt, require_value(opt));
                continue;
            }
            if (opt == "--log-format") {
                const auto value = require_value(opt);
                const auto format = restprobe::parse_log_format(value);
                if (!format) {
                    throw_cli_error("E_INVALID_LOG_FORMAT",
                                    "Unsupported --log-format value: " + value,
                                    "Use --log-format text or --log-format json");
                }
                options.log_format = *format;
                continue;
            }
            if (opt == "--quiet") {
                options.quiet = true;
                continue;
            }
            throw_cli_error("E_UNKNOWN_OPTION",
                            "Unknown option: " + std::string(opt),
                            "Run 'restprobe --help' to list the supported options");
        }

        restprobe::Config config{};
        if (options.config_path) {
            try {
                restprobe::config::load_config_file(*options.config_path, config);
            } catch (const restprobe::config::ConfigError& ex) {
                throw_cli_error(ex.code, ex.message, ex.hint);
            }
        }
        if (options.timeout) {
            config.timeout = *options.timeout;
        }
        if (options.output_mode) {
            config.output_mode = *options.output_mode;
        }
        if (options.output_directory) {
            config.output_directory = *options.output_directory;
        }
        if (options.log_format) {
            config.log_format = *options.log_format;
        }
        if (options.quiet) {
            config.log_info_enabled = false;
        }

        if (!options.ip_input && !options.ip_file) {
            print_usage();
            return 0;
        }

        configure_logger(config);
        auto& logger = restprobe::log::StructuredLogger::instance();

        restprobe::sink::ResultSink sink(config);
        restprobe::probe::EndpointProber prober(config, restprobe::http::curl_get, [&sink](const std::string& host) {
            return sink.has_record(host);
        });
        restprobe::core::ProbeCoordinator coordinator(config, prober, sink);

        logger.info("run_started",
                    {{"version", std::string(kRestprobeVersion)},
                     {"output", std::string(restprobe::output_mode_to_string(config.output_mode))},
                     {"timeout_seconds", std::to_string(config.timeout.count())},
                     {"endpoints", std::to_string(config.endpoints.size())}});

        int exit_code = 0;
        restprobe::core::RunSummary total{};

        auto run_source = [&](std::string_view source, auto&& load) {
            try {
                auto targets = load();
                logger.info("targets_loaded",
                            {{"source", std::string(source)},
                             {"input", targets.description()},
                             {"count", std::to_string(targets.size())}});
                total += coordinator.run(targets);
            } catch (const restprobe::targets::TargetError& ex) {
                logger.error("input_rejected", {{"source", std::string(source)}, {"code", ex.code}, {"error", ex.message}});
                print_target_error(ex);
                exit_code = 1;
            }
        };

        if (options.ip_input) {
            run_source("ip_input", [&] { return restprobe::targets::expand_input(*options.ip_input); });
        }
        if (options.ip_file) {
            run_source("ip_file", [&] { return restprobe::targets::load_host_file(*options.ip_file); });
        }

        logger.info("run_complete",
                    {{"dispatched", std::to_string(total.dispatched)},
                     {"succeeded", std::to_string(total.succeeded)},
                     {"no_success", std::to_string(total.no_success)},
                     {"errored", std::to_string(total.errored)}});
        return exit_code;
    } catch (const CliException& ex) {
        print_cli_error(ex);
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error [E_UNEXPECTED]: " << ex.what() << std::endl;
        return 1;
    }
}
