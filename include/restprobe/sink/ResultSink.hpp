#pragma once

#include "restprobe/Config.hpp"
#include "restprobe/Types.hpp"
#include "restprobe/json/Json.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>
#include <utility>

namespace restprobe::sink {

struct SinkError : public std::exception {
    std::string code;
    std::string message;
    std::string formatted;

    SinkError(std::string c, std::string m)
        : code(std::move(c)), message(std::move(m)) {
        formatted = "[" + code + "] " + message;
    }

    const char* what() const noexcept override { return formatted.c_str(); }
};

class ResultSink {
public:
    explicit ResultSink(const Config& config, std::ostream& console = std::cout);

    // file mode overwrites <output_directory>/response_<host>.yaml; stdout mode
    // prints one framed block. Throws SinkError when the record cannot be written.
    void emit(const std::string& host, const EndpointDescriptor& endpoint, const json::Value& payload);

    bool has_record(const std::string& host) const;
    std::filesystem::path record_path(const std::string& host) const;

    Config::OutputMode mode() const noexcept { return mode_; }

private:
    Config::OutputMode mode_;
    std::filesystem::path directory_;
    std::ostream& console_;
    std::mutex console_mutex_;

    void write_record(const std::string& host, const json::Value& payload);
    void print_frame(const std::string& host, const EndpointDescriptor& endpoint, const json::Value& payload);
};

}  // namespace restprobe::sink
