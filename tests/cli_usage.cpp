#include <array>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace {

struct CommandResult {
    int exit_code;
    std::string output;
};

CommandResult run_cli(const std::string& executable, const std::string& arguments) {
    const std::string command = "\"" + executable + "\" " + arguments + " 2>&1";
#if defined(_WIN32)
    FILE* pipe = _popen(command.c_str(), "r");
#else
    FILE* pipe = popen(command.c_str(), "r");
#endif
    if (!pipe) {
        throw std::runtime_error("Failed to open a pipe to the CLI");
    }

    std::string output;
    std::array<char, 256> buffer{};
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe)) {
        output.append(buffer.data());
    }

#if defined(_WIN32)
    const int exit_code = _pclose(pipe);
#else
    const int status = pclose(pipe);
    int exit_code = -1;
    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    }
#endif

    return CommandResult{exit_code, output};
}

bool expect_contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

bool check(const CommandResult& result, int expected_exit, const std::string& needle, const std::string& label) {
    if (result.exit_code != expected_exit || !expect_contains(result.output, needle)) {
        std::cerr << "Failure on " << label << ". exit=" << result.exit_code << "\n" << result.output << std::endl;
        return false;
    }
    return true;
}

std::string quoted(const std::filesystem::path& path) {
    return "\"" + path.string() + "\"";
}

}  // namespace

int main() {
    const char* executable_env = std::getenv("RESTPROBE_CLI_EXECUTABLE");
    if (!executable_env) {
        std::cerr << "RESTPROBE_CLI_EXECUTABLE is not defined" << std::endl;
        return 1;
    }
    const std::string executable = std::filesystem::path(executable_env).string();

    const auto workdir = std::filesystem::temp_directory_path() / "restprobe_cli_usage";
    std::filesystem::remove_all(workdir);
    std::filesystem::create_directories(workdir);

    const auto empty_hosts = workdir / "empty_hosts.txt";
    {
        std::ofstream out(empty_hosts);
        out << "\n\n   \n";
    }
    const auto bad_config = workdir / "bad.yaml";
    {
        std::ofstream out(bad_config);
        out << "timeout_seconds: 4\nretries: 2\n";
    }

    try {
        bool ok = true;
        ok &= check(run_cli(executable, ""), 0, "Usage: restprobe", "no arguments");
        ok &= check(run_cli(executable, "--help"), 0, "Usage: restprobe", "--help");
        ok &= check(run_cli(executable, "-h"), 0, "--ip_file <path>", "-h");
        ok &= check(run_cli(executable, "--version"), 0, "restprobe v", "--version");
        ok &= check(run_cli(executable, "--timeout 5"), 0, "Usage: restprobe", "no target source");

        const auto missing = run_cli(executable, "--ip_file " + quoted(workdir / "missing.txt"));
        ok &= check(missing, 1, "[E_FILE_READ]", "--ip_file missing.txt");
        ok &= check(missing, 1, "Unable to read host file", "--ip_file missing.txt message");
        if (expect_contains(missing.output, "targets_loaded")) {
            std::cerr << "Hosts were probed despite a missing host file\n" << missing.output << std::endl;
            ok = false;
        }

        ok &= check(run_cli(executable, "--ip_input 999.1.1.1"), 1, "Invalid IP or IP range provided", "invalid --ip_input");
        ok &= check(run_cli(executable, "--ip_input 10.0.0.0/40"), 1, "[E_INVALID_INPUT]", "invalid prefix");
        ok &= check(run_cli(executable, "--ip_input 999.1.1.1 --ip_file " + quoted(empty_hosts)),
                    1, "source=ip_file", "bad --ip_input still runs --ip_file");

        ok &= check(run_cli(executable, "--ip_input 10.0.0.1 --output xml"), 1, "[E_INVALID_OUTPUT]", "bad --output");
        ok &= check(run_cli(executable, "--ip_input 10.0.0.1 --timeout 0"), 1, "[E_INVALID_TIMEOUT]", "--timeout 0");
        ok &= check(run_cli(executable, "--ip_input 10.0.0.1 --timeout abc"), 1, "[E_INVALID_TIMEOUT]", "--timeout abc");
        ok &= check(run_cli(executable, "--ip_input 10.0.0.1 --log-format xml"), 1, "[E_INVALID_LOG_FORMAT]", "bad --log-format");
        ok &= check(run_cli(executable, "--ip_input 10.0.0.1 --bogus"), 1, "[E_UNKNOWN_OPTION]", "unknown option");
        ok &= check(run_cli(executable, "--ip_input"), 1, "[E_MISSING_VALUE]", "missing value");
        ok &= check(run_cli(executable, "--ip_input 10.0.0.1 --ip_input 10.0.0.2"), 1, "[E_DUPLICATE_OPTION]", "duplicate option");
        ok &= check(run_cli(executable, "--ip_input 10.0.0.1 --config " + quoted(bad_config)),
                    1, "[E_CONFIG_UNKNOWN_KEY]", "unknown config key");
        ok &= check(run_cli(executable, "--ip_input 10.0.0.1 --config " + quoted(workdir / "absent.yaml")),
                    1, "[E_CONFIG_NOT_FOUND]", "missing config file");

        ok &= check(run_cli(executable, "--ip_file " + quoted(empty_hosts)), 0, "run_complete", "empty host file");
        ok &= check(run_cli(executable, "--ip_file " + quoted(empty_hosts) + " --log-format json"),
                    0, "\"event\":\"run_complete\"", "json log format");
        const auto quiet = run_cli(executable, "--ip_file " + quoted(empty_hosts) + " --quiet");
        if (quiet.exit_code != 0 || expect_contains(quiet.output, "run_complete")) {
            std::cerr << "Failure on --quiet. exit=" << quiet.exit_code << "\n" << quiet.output << std::endl;
            ok = false;
        }

        std::filesystem::remove_all(workdir);
        return ok ? 0 : 1;
    } catch (const std::exception& ex) {
        std::cerr << "cli_usage failed: " << ex.what() << std::endl;
        return 1;
    }
}
