#include "restprobe/Types.hpp"

namespace restprobe {

namespace {
constexpr std::string_view kHostSlot = "{host}";
}

std::string EndpointDescriptor::url_for(std::string_view host) const {
    std::string url = url_template;
    const auto slot = url.find(kHostSlot);
    if (slot == std::string::npos) {
        return url;
    }
    url.replace(slot, kHostSlot.size(), host);
    return url;
}

const std::vector<EndpointDescriptor>& default_endpoints() {
    static const std::vector<EndpointDescriptor> endpoints{
        EndpointDescriptor{
            "restconf-health",
            "https://{host}:8888/restconf/data/openconfig-system:system/f5-system-health:health/"
            "f5-system-health:summary/f5-system-health:components",
            {{"Content-Type", "application/yang-data+json"}},
            8888},
        EndpointDescriptor{
            "icontrol-hardware",
            "https://{host}:443/mgmt/tm/sys/hardware",
            {{"Content-Type", "application/json"}},
            443},
    };
    return endpoints;
}

}  // namespace restprobe
