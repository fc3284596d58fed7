#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace restprobe {

using Header = std::pair<std::string, std::string>;
using HeaderList = std::vector<Header>;

// One REST path/port/header combination tried against a host. The URL
// template carries a single "{host}" slot.
struct EndpointDescriptor {
    std::string name;
    std::string url_template;
    HeaderList headers;
    std::uint16_t port{0};

    std::string url_for(std::string_view host) const;
};

// Compiled-in endpoint list, in trial order.
const std::vector<EndpointDescriptor>& default_endpoints();

}  // namespace restprobe
