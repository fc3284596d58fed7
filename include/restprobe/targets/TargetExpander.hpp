#pragma once

#include <cstdint>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace restprobe::targets {

struct TargetError : public std::exception {
    std::string code;
    std::string message;
    std::string hint;
    std::string formatted;

    TargetError(std::string c, std::string m, std::string h = {})
        : code(std::move(c)), message(std::move(m)), hint(std::move(h)) {
        if (!code.empty()) {
            formatted = "[" + code + "] " + message;
        } else {
            formatted = message;
        }
    }

    const char* what() const noexcept override { return formatted.c_str(); }
};

std::optional<std::uint32_t> parse_ipv4(std::string_view text);
std::string format_ipv4(std::uint32_t address);

struct CidrBlock {
    std::uint32_t network{0};
    std::uint8_t prefix_length{32};

    std::uint32_t netmask() const noexcept;
    std::uint32_t broadcast() const noexcept;

    // Usable host range: network and broadcast are excluded for prefixes up
    // to /30; /31 keeps both addresses and /32 its single address.
    std::uint32_t first_host() const noexcept;
    std::uint32_t last_host() const noexcept;
    std::uint64_t host_count() const noexcept;
};

// Accepts "a.b.c.d/len"; host bits in the address are masked off.
std::optional<CidrBlock> parse_cidr(std::string_view text);

// Ordered, duplicate-free host identifiers from one input source. Ranges are
// walked lazily so large blocks are never materialized.
class TargetSequence {
public:
    static TargetSequence from_hosts(std::string description, std::vector<std::string> hosts);
    static TargetSequence from_block(const CidrBlock& block);

    std::optional<std::string> next();

    std::uint64_t size() const noexcept;
    const std::string& description() const noexcept;

private:
    TargetSequence() = default;

    std::string description_;
    std::vector<std::string> hosts_;
    std::size_t host_index_{0};
    bool ranged_{false};
    std::uint64_t range_cursor_{0};
    std::uint64_t range_end_{0};
};

// Interprets --ip_input: a single IPv4 address, otherwise a CIDR block.
// Throws TargetError(E_INVALID_INPUT) when neither parse succeeds.
TargetSequence expand_input(std::string_view input);

// Reads a newline-delimited host list. Lines are trimmed, blank and repeated
// lines dropped, nothing else is validated. Throws TargetError(E_FILE_READ).
TargetSequence load_host_file(const std::filesystem::path& path);

}  // namespace restprobe::targets
