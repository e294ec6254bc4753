#include "relaysave/network/record_source.hpp"
#include "relaysave/core/config.hpp"

namespace relaysave::network {

const std::vector<std::string> BUILTIN_DEFAULT_ENDPOINTS = {
    "wss://nos.lol",
    "wss://relay.nostr.net",
    "wss://relay.primal.net",
    "wss://relay.snort.social"
};

std::vector<std::string> default_endpoints() {
    auto configured = core::Config::instance().get_list("relays.default");
    if (configured.empty()) {
        return BUILTIN_DEFAULT_ENDPOINTS;
    }
    return configured;
}

}
