#pragma once

#include <string>
#include <optional>
#include <vector>
#include "types.hpp"

// Parse a protocol name ("ssh", "telnet", "http", "https"). Case-sensitive,
// matching what the intake front end sends. Returns nullopt if unknown.
std::optional<Protocol> parse_protocol(const std::string& name);

std::string protocol_name(Protocol p);

// Remote port the protocol is forwarded to (ssh→22, telnet→23, ...).
int internal_port(Protocol p);

// Names of every supported protocol, in table order.
std::vector<std::string> supported_protocols();
