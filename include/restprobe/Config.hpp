#pragma once

#include "restprobe/Types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace restprobe {

// Upper bound for the per-request timeout, from the CLI or a config file.
constexpr std::int64_t kMaxTimeoutSeconds = 3600;

struct Config {
    enum class OutputMode {
        Stdout,
        File
    };

    enum class LogFormat {
        Text,
        Json
    };

    std::chrono::seconds timeout{std::chrono::seconds(3)};
    OutputMode output_mode{OutputMode::Stdout};
    std::string output_directory{"."};
    // Fixed low-privilege credential pair and trust-everything TLS. Both are
    // known weaknesses kept as defaults; only a config file overrides them.
    std::string username{"admin"};
    std::string password{"admin"};
    bool verify_tls{false};
    // 0 selects std::thread::hardware_concurrency().
    std::size_t worker_count{0};
    // 0 selects twice the worker count.
    std::size_t queue_capacity{0};
    LogFormat log_format{LogFormat::Text};
    bool log_info_enabled{true};
    std::vector<EndpointDescriptor> endpoints{default_endpoints()};
};

std::string_view output_mode_to_string(Config::OutputMode mode);
std::optional<Config::OutputMode> parse_output_mode(std::string_view text);

std::string_view log_format_to_string(Config::LogFormat format);
std::optional<Config::LogFormat> parse_log_format(std::string_view text);

}  // namespace restprobe
