#include "restprobe/sink/ResultSink.hpp"

#include "restprobe/json/Render.hpp"
#include "restprobe/log/StructuredLogger.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace restprobe::sink {

namespace {

constexpr std::string_view kRecordPrefix = "response_";
constexpr std::string_view kRecordExtension = ".yaml";
constexpr std::size_t kRuleWidth = 60;

// Hosts read from a file are free-form; keep them from escaping the output
// directory.
std::string file_safe_host(const std::string& host) {
    std::string safe = host;
    for (auto& ch : safe) {
        if (ch == '/' || ch == '\\' || static_cast<unsigned char>(ch) < 0x20) {
            ch = '_';
        }
    }
    if (safe == "." || safe == "..") {
        safe.assign(safe.size(), '_');
    }
    return safe;
}

}  // namespace

ResultSink::ResultSink(const Config& config, std::ostream& console)
    : mode_(config.output_mode),
      directory_(config.output_directory.empty() ? std::filesystem::path(".")
                                                 : std::filesystem::path(config.output_directory)),
      console_(console) {}

void ResultSink::emit(const std::string& host, const EndpointDescriptor& endpoint, const json::Value& payload) {
    if (mode_ == Config::OutputMode::File) {
        write_record(host, payload);
        log::StructuredLogger::instance().info("record_written",
                                               {{"host", host},
                                                {"port", std::to_string(endpoint.port)},
                                                {"path", record_path(host).string()}});
        return;
    }
    print_frame(host, endpoint, payload);
}

bool ResultSink::has_record(const std::string& host) const {
    std::error_code ec;
    return std::filesystem::exists(record_path(host), ec);
}

std::filesystem::path ResultSink::record_path(const std::string& host) const {
    std::string name(kRecordPrefix);
    name.append(file_safe_host(host));
    name.append(kRecordExtension);
    return directory_ / name;
}

void ResultSink::write_record(const std::string& host, const json::Value& payload) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw SinkError("E_OUTPUT_WRITE", "Unable to create output directory " + directory_.string() + ": " + ec.message());
    }

    const auto path = record_path(host);
    const auto document = json::to_yaml(payload);
    std::ofstream stream(path, std::ios::binary | std::ios::trunc);
    if (!stream) {
        throw SinkError("E_OUTPUT_WRITE", "Unable to open " + path.string() + " for writing");
    }
    stream.write(document.data(), static_cast<std::streamsize>(document.size()));
    stream.close();
    if (!stream) {
        throw SinkError("E_OUTPUT_WRITE", "Failed to write " + path.string());
    }
}

void ResultSink::print_frame(const std::string& host, const EndpointDescriptor& endpoint, const json::Value& payload) {
    std::ostringstream frame;
    frame << "=== " << host << " (port " << endpoint.port << ", " << endpoint.name << ") ===\n";
    frame << json::to_pretty_json(payload) << '\n';
    frame << std::string(kRuleWidth, '=') << '\n';

    std::scoped_lock lock(console_mutex_);
    console_ << frame.str();
    console_.flush();
    if (!console_) {
        throw SinkError("E_OUTPUT_WRITE", "Unable to write result for " + host + " to the console");
    }
}

}  // namespace restprobe::sink
