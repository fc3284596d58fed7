#include "restprobe/log/StructuredLogger.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace restprobe::log {

namespace {

std::string escape_control_characters(std::string_view value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (const unsigned char ch : value) {
        switch (ch) {
            case '"':
                escaped.append("\\\"");
                break;
            case '\\':
                escaped.append("\\\\");
                break;
            case '\b':
                escaped.append("\\b");
                break;
            case '\f':
                escaped.append("\\f");
                break;
            case '\n':
                escaped.append("\\n");
                break;
            case '\r':
                escaped.append("\\r");
                break;
            case '\t':
                escaped.append("\\t");
                break;
            default:
                if (ch < 0x20) {
                    std::ostringstream oss;
                    oss << "\\u" << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
                        << static_cast<int>(ch);
                    escaped.append(oss.str());
                } else {
                    escaped.push_back(static_cast<char>(ch));
                }
                break;
        }
    }
    return escaped;
}

int level_rank(StructuredLogger::Level level) {
    switch (level) {
        case StructuredLogger::Level::Info:
            return 0;
        case StructuredLogger::Level::Warning:
            return 1;
        case StructuredLogger::Level::Error:
            return 2;
    }
    return 0;
}

bool needs_text_quoting(std::string_view value) {
    if (value.empty()) {
        return true;
    }
    return value.find_first_of(" \t\r\n\"=") != std::string_view::npos;
}

}  // namespace

std::string StructuredLogger::Record::field(std::string_view key) const {
    for (const auto& [name, value] : fields) {
        if (name == key) {
            return value;
        }
    }
    return {};
}

StructuredLogger& StructuredLogger::instance() {
    static StructuredLogger logger;
    return logger;
}

void StructuredLogger::log(Level level, std::string_view event, FieldList fields) {
    std::scoped_lock lock(mutex_);
    if (!enabled_ || level_rank(level) < level_rank(minimum_level_)) {
        return;
    }

    Record record{};
    record.timestamp = std::chrono::system_clock::now();
    record.level = level;
    record.event = std::string(event);
    record.fields = std::move(fields);

    if (sink_) {
        sink_(record);
        return;
    }

    std::clog << (format_ == Format::Json ? format_json(record) : format_text(record));
    std::clog.flush();
}

void StructuredLogger::set_enabled(bool enabled) {
    std::scoped_lock lock(mutex_);
    enabled_ = enabled;
}

bool StructuredLogger::enabled() const noexcept {
    std::scoped_lock lock(mutex_);
    return enabled_;
}

void StructuredLogger::set_minimum_level(Level level) {
    std::scoped_lock lock(mutex_);
    minimum_level_ = level;
}

void StructuredLogger::set_format(Format format) {
    std::scoped_lock lock(mutex_);
    format_ = format;
}

void StructuredLogger::set_sink(Sink sink) {
    std::scoped_lock lock(mutex_);
    sink_ = std::move(sink);
}

std::string StructuredLogger::format(const Record& record) const {
    std::scoped_lock lock(mutex_);
    return format_ == Format::Json ? format_json(record) : format_text(record);
}

std::string StructuredLogger::format_text(const Record& record) const {
    std::ostringstream oss;
    oss << format_timestamp(record.timestamp) << ' ' << level_to_string(record.level) << ' ' << record.event;
    for (const auto& [key, value] : record.fields) {
        oss << ' ' << key << '=';
        if (needs_text_quoting(value)) {
            oss << '"' << escape_json(value) << '"';
        } else {
            oss << value;
        }
    }
    oss << '\n';
    return oss.str();
}

std::string StructuredLogger::format_json(const Record& record) const {
    std::ostringstream oss;
    oss << '{'
        << "\"ts\":\"" << escape_json(format_timestamp(record.timestamp)) << "\",";
    oss << "\"level\":\"" << escape_json(level_to_string(record.level)) << "\",";
    oss << "\"event\":\"" << escape_json(record.event) << "\"";

    if (!record.fields.empty()) {
        oss << ",\"fields\":{";
        for (std::size_t i = 0; i < record.fields.size(); ++i) {
            const auto& [key, value] = record.fields[i];
            oss << "\"" << escape_json(key) << "\":\"" << escape_json(value) << "\"";
            if (i + 1 < record.fields.size()) {
                oss << ',';
            }
        }
        oss << '}';
    }

    oss << "}\n";
    return oss.str();
}

std::string StructuredLogger::level_to_string(Level level) {
    switch (level) {
        case Level::Info:
            return "info";
        case Level::Warning:
            return "warning";
        case Level::Error:
            return "error";
    }
    return "info";
}

std::string StructuredLogger::escape_json(std::string_view value) {
    return escape_control_characters(value);
}

std::string StructuredLogger::format_timestamp(std::chrono::system_clock::time_point when) {
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(when);
    const auto fractional = std::chrono::duration_cast<std::chrono::milliseconds>(when - seconds).count();
    const std::time_t when_c = std::chrono::system_clock::to_time_t(seconds);

    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &when_c);
#else
    gmtime_r(&when_c, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << fractional << 'Z';
    return oss.str();
}

}  // namespace restprobe::log
