#include "restprobe/targets/TargetExpander.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <string>
#include <unordered_set>
#include <utility>

namespace restprobe::targets {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

std::optional<std::uint8_t> parse_prefix_length(std::string_view text) {
    if (text.empty() || text.size() > 2) {
        return std::nullopt;
    }
    unsigned int value = 0;
    for (const char ch : text) {
        if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
            return std::nullopt;
        }
        value = value * 10 + static_cast<unsigned int>(ch - '0');
    }
    if (value > 32) {
        return std::nullopt;
    }
    return static_cast<std::uint8_t>(value);
}

}  // namespace

std::optional<std::uint32_t> parse_ipv4(std::string_view host) {
    std::uint32_t address = 0;
    std::size_t start = 0;
    for (int i = 0; i < 4; ++i) {
        if (start >= host.size()) {
            return std::nullopt;
        }
        const std::size_t end = (i == 3) ? host.size() : host.find('.', start);
        if (end == std::string_view::npos || end == start) {
            return std::nullopt;
        }
        // Leading zeros are ambiguous (octal in inet_aton), reject them.
        if (end - start > 1 && host[start] == '0') {
            return std::nullopt;
        }
        std::uint32_t value = 0;
        for (std::size_t pos = start; pos < end; ++pos) {
            const auto ch = static_cast<unsigned char>(host[pos]);
            if (!std::isdigit(ch)) {
                return std::nullopt;
            }
            value = value * 10 + static_cast<std::uint32_t>(ch - '0');
            if (value > 255) {
                return std::nullopt;
            }
        }
        address = (address << 8) | value;
        start = end + 1;
    }
    if (start != host.size() + 1) {
        return std::nullopt;
    }
    return address;
}

std::string format_ipv4(std::uint32_t address) {
    return std::to_string((address >> 24) & 0xFFu) + '.' + std::to_string((address >> 16) & 0xFFu) + '.' +
           std::to_string((address >> 8) & 0xFFu) + '.' + std::to_string(address & 0xFFu);
}

std::uint32_t CidrBlock::netmask() const noexcept {
    if (prefix_length == 0) {
        return 0;
    }
    return 0xFFFFFFFFu << (32u - prefix_length);
}

std::uint32_t CidrBlock::broadcast() const noexcept {
    return network | ~netmask();
}

std::uint32_t CidrBlock::first_host() const noexcept {
    return prefix_length >= 31 ? network : network + 1;
}

std::uint32_t CidrBlock::last_host() const noexcept {
    return prefix_length >= 31 ? broadcast() : broadcast() - 1;
}

std::uint64_t CidrBlock::host_count() const noexcept {
    return static_cast<std::uint64_t>(last_host()) - static_cast<std::uint64_t>(first_host()) + 1;
}

std::optional<CidrBlock> parse_cidr(std::string_view text) {
    const auto slash = text.find('/');
    if (slash == std::string_view::npos) {
        return std::nullopt;
    }
    const auto address = parse_ipv4(text.substr(0, slash));
    const auto prefix = parse_prefix_length(text.substr(slash + 1));
    if (!address || !prefix) {
        return std::nullopt;
    }
    CidrBlock block{};
    block.prefix_length = *prefix;
    block.network = *address & block.netmask();
    return block;
}

TargetSequence TargetSequence::from_hosts(std::string description, std::vector<std::string> hosts) {
    TargetSequence sequence;
    sequence.description_ = std::move(description);
    sequence.hosts_ = std::move(hosts);
    return sequence;
}

TargetSequence TargetSequence::from_block(const CidrBlock& block) {
    TargetSequence sequence;
    sequence.description_ = format_ipv4(block.network) + "/" + std::to_string(block.prefix_length);
    sequence.ranged_ = true;
    sequence.range_cursor_ = block.first_host();
    sequence.range_end_ = static_cast<std::uint64_t>(block.last_host()) + 1;
    return sequence;
}

std::optional<std::string> TargetSequence::next() {
    if (ranged_) {
        if (range_cursor_ >= range_end_) {
            return std::nullopt;
        }
        return format_ipv4(static_cast<std::uint32_t>(range_cursor_++));
    }
    if (host_index_ >= hosts_.size()) {
        return std::nullopt;
    }
    return hosts_[host_index_++];
}

std::uint64_t TargetSequence::size() const noexcept {
    if (ranged_) {
        return range_end_ - std::min(range_cursor_, range_end_);
    }
    return hosts_.size() - host_index_;
}

const std::string& TargetSequence::description() const noexcept {
    return description_;
}

TargetSequence expand_input(std::string_view input) {
    const auto trimmed = trim(input);
    if (const auto address = parse_ipv4(trimmed)) {
        return TargetSequence::from_hosts(std::string(trimmed), {format_ipv4(*address)});
    }
    if (const auto block = parse_cidr(trimmed)) {
        return TargetSequence::from_block(*block);
    }
    throw TargetError("E_INVALID_INPUT",
                      "Invalid IP or IP range provided: " + std::string(input),
                      "Use a dotted-quad IPv4 address (10.0.0.1) or a CIDR block (10.0.0.0/24)");
}

TargetSequence load_host_file(const std::filesystem::path& path) {
    std::ifstream stream(path);
    if (!stream) {
        throw TargetError("E_FILE_READ",
                          "Unable to read host file: " + path.string(),
                          "Check that --ip_file points to a readable newline-delimited list");
    }

    std::vector<std::string> hosts;
    std::unordered_set<std::string> seen;
    std::string line;
    while (std::getline(stream, line)) {
        const auto host = trim(line);
        if (host.empty()) {
            continue;
        }
        std::string entry(host);
        if (seen.insert(entry).second) {
            hosts.push_back(std::move(entry));
        }
    }
    if (stream.bad()) {
        throw TargetError("E_FILE_READ", "I/O error while reading host file: " + path.string());
    }
    return TargetSequence::from_hosts(path.string(), std::move(hosts));
}

}  // namespace restprobe::targets
