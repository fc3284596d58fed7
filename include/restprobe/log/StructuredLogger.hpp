#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace restprobe::log {

class StructuredLogger {
public:
    enum class Level {
        Info,
        Warning,
        Error
    };

    enum class Format {
        Text,
        Json
    };

    using Field = std::pair<std::string, std::string>;
    using FieldList = std::vector<Field>;

    struct Record {
        std::chrono::system_clock::time_point timestamp;
        Level level{Level::Info};
        std::string event;
        FieldList fields;

        // Value of the first field named key, empty when absent.
        std::string field(std::string_view key) const;
    };

    // Receives every record that passes the level filter instead of the
    // console writer.
    using Sink = std::function<void(const Record&)>;

    static StructuredLogger& instance();

    void log(Level level, std::string_view event, FieldList fields = {});

    void info(std::string_view event, FieldList fields = {}) {
        log(Level::Info, event, std::move(fields));
    }
    void warning(std::string_view event, FieldList fields = {}) {
        log(Level::Warning, event, std::move(fields));
    }
    void error(std::string_view event, FieldList fields = {}) {
        log(Level::Error, event, std::move(fields));
    }

    void set_enabled(bool enabled);
    [[nodiscard]] bool enabled() const noexcept;

    void set_minimum_level(Level level);
    void set_format(Format format);

    // Pass an empty function to restore console output.
    void set_sink(Sink sink);

    std::string format(const Record& record) const;

    static std::string level_to_string(Level level);

private:
    StructuredLogger() = default;

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    static std::string escape_json(std::string_view value);
    static std::string format_timestamp(std::chrono::system_clock::time_point when);

    std::string format_text(const Record& record) const;
    std::string format_json(const Record& record) const;

    bool enabled_{true};
    Level minimum_level_{Level::Info};
    Format format_{Format::Text};
    Sink sink_;
    mutable std::mutex mutex_;
};

}  // namespace restprobe::log
