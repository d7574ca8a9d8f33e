#ifndef FSMCPS_SERVER_CONFIG_HPP
#define FSMCPS_SERVER_CONFIG_HPP

// Process configuration: defaults, then FSMCPS_* environment variables, then
// command-line flags. Only the service shell is configurable; the tools are not.

#include <functional>
#include <string>
#include <vector>

namespace config {

enum class Transport {
    Stdio,
    Sse,
};

struct ServerConfig {
    Transport transport = Transport::Stdio;
    std::string host = "0.0.0.0";
    int port = 8000;
    bool debug = false;
    bool show_help = false;
};

// Result of loading the configuration.
struct ConfigResult {
    bool success = false;
    ServerConfig config;
    std::string error_message;
};

// Reads one environment variable; returns nullptr when unset.
using EnvironmentLookup = std::function<const char *(const char *name)>;

// Load from environment (via lookup) and arguments (argv without the program name).
ConfigResult load(const std::vector<std::string> &arguments, const EnvironmentLookup &lookup);

// Load from the real process environment and argv.
ConfigResult load_from_process(int argc, char *argv[]);

// Parse "stdio" / "sse" (case-insensitive).
bool parse_transport(const std::string &value, Transport &transport);

// Parse a TCP port in 1..65535.
bool parse_port(const std::string &value, int &port);

const char *transport_name(Transport transport);

std::string usage_text(const std::string &program_name);

} // namespace config

#endif // FSMCPS_SERVER_CONFIG_HPP
