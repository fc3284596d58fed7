#include "restprobe/sink/ResultSink.hpp"

#include "restprobe/Config.hpp"
#include "restprobe/json/Json.hpp"
#include "restprobe/log/StructuredLogger.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace {

using restprobe::Config;
using restprobe::EndpointDescriptor;
using restprobe::default_endpoints;
using restprobe::json::parse;
using restprobe::log::StructuredLogger;
using restprobe::sink::ResultSink;
using restprobe::sink::SinkError;

std::filesystem::path make_temp_dir(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    return dir;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

const EndpointDescriptor& icontrol() {
    return default_endpoints().at(1);
}

void test_file_mode_overwrites() {
    const auto dir = make_temp_dir("restprobe_result_sink_file");
    Config config{};
    config.output_mode = Config::OutputMode::File;
    config.output_directory = (dir / "nested").string();

    std::vector<StructuredLogger::Record> records;
    StructuredLogger::instance().set_sink([&](const StructuredLogger::Record& record) { records.push_back(record); });

    ResultSink sink(config);
    assert(sink.mode() == Config::OutputMode::File);
    assert(!sink.has_record("10.0.0.1"));
    assert(sink.record_path("10.0.0.1") == dir / "nested" / "response_10.0.0.1.yaml");

    sink.emit("10.0.0.1", icontrol(), parse(R"({"hw":"ok","slots":[1,2]})"));
    assert(sink.has_record("10.0.0.1"));
    assert(read_file(sink.record_path("10.0.0.1")) == "hw: ok\nslots:\n- 1\n- 2\n");

    sink.emit("10.0.0.1", icontrol(), parse(R"({"hw":"degraded"})"));
    assert(read_file(sink.record_path("10.0.0.1")) == "hw: degraded\n");

    std::size_t written = 0;
    for (const auto& record : records) {
        if (record.event == "record_written") {
            ++written;
            assert(record.field("host") == "10.0.0.1");
            assert(record.field("port") == "443");
        }
    }
    assert(written == 2);
    StructuredLogger::instance().set_sink({});

    std::filesystem::remove_all(dir);
}

void test_host_names_stay_inside_directory() {
    Config config{};
    config.output_mode = Config::OutputMode::File;
    config.output_directory = "records";
    ResultSink sink(config);
    assert(sink.record_path("../etc/passwd").parent_path() == std::filesystem::path("records"));
    assert(sink.record_path("../etc/passwd").filename() == "response_.._etc_passwd.yaml");
    assert(sink.record_path("..").filename() == "response___.yaml");
}

void test_write_failure_raises() {
    const auto dir = make_temp_dir("restprobe_result_sink_blocked");
    std::filesystem::create_directories(dir);
    const auto blocker = dir / "not_a_directory";
    {
        std::ofstream out(blocker);
        out << "occupied";
    }

    Config config{};
    config.output_mode = Config::OutputMode::File;
    config.output_directory = blocker.string();
    StructuredLogger::instance().set_enabled(false);
    ResultSink sink(config);
    bool threw = false;
    try {
        sink.emit("10.0.0.1", icontrol(), parse(R"({"hw":"ok"})"));
    } catch (const SinkError& ex) {
        threw = true;
        assert(ex.code == "E_OUTPUT_WRITE");
        assert(std::string(ex.what()).starts_with("[E_OUTPUT_WRITE] "));
    }
    assert(threw);
    StructuredLogger::instance().set_enabled(true);
    std::filesystem::remove_all(dir);
}

void test_console_frame() {
    Config config{};
    std::ostringstream console;
    ResultSink sink(config, console);
    assert(sink.mode() == Config::OutputMode::Stdout);

    sink.emit("10.0.0.7", icontrol(), parse(R"({"hw":"ok"})"));
    const std::string expected = "=== 10.0.0.7 (port 443, icontrol-hardware) ===\n"
                                 "{\n"
                                 "  \"hw\": \"ok\"\n"
                                 "}\n" +
                                 std::string(60, '=') + "\n";
    assert(console.str() == expected);
    assert(!std::filesystem::exists(sink.record_path("10.0.0.7")));
}

}  // namespace

int main() {
    test_file_mode_overwrites();
    test_host_names_stay_inside_directory();
    test_write_failure_raises();
    test_console_frame();
    return 0;
}
