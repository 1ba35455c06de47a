#include "protocol.hpp"
#include "constants.hpp"

namespace {

struct ProtocolEntry {
    Protocol protocol;
    const char* name;
    int port;
};

constexpr ProtocolEntry PROTOCOL_TABLE[] = {
    {Protocol::SSH,    "ssh",    SSH_PORT},
    {Protocol::TELNET, "telnet", TELNET_PORT},
    {Protocol::HTTP,   "http",   HTTP_PORT},
    {Protocol::HTTPS,  "https",  HTTPS_PORT},
};

} // namespace

std::optional<Protocol> parse_protocol(const std::string& name) {
    for (const auto& e : PROTOCOL_TABLE) {
        if (name == e.name) return e.protocol;
    }
    return std::nullopt;
}

std::string protocol_name(Protocol p) {
    for (const auto& e : PROTOCOL_TABLE) {
        if (e.protocol == p) return e.name;
    }
    return "?";
}

int internal_port(Protocol p) {
    for (const auto& e : PROTOCOL_TABLE) {
        if (e.protocol == p) return e.port;
    }
    return 0;
}

std::vector<std::string> supported_protocols() {
    std::vector<std::string> names;
    for (const auto& e : PROTOCOL_TABLE) names.emplace_back(e.name);
    return names;
}
