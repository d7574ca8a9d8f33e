#include "config/server_config.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <system_error>

namespace config {

static std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

static ConfigResult error_result(const std::string &message) {
    ConfigResult result;
    result.success = false;
    result.error_message = message;
    return result;
}

bool parse_transport(const std::string &value, Transport &transport) {
    std::string normalized = to_lower(value);
    if (normalized == "stdio") {
        transport = Transport::Stdio;
        return true;
    }
    if (normalized == "sse") {
        transport = Transport::Sse;
        return true;
    }
    return false;
}

bool parse_port(const std::string &value, int &port) {
    int parsed = 0;
    const char *begin = value.data();
    const char *end = value.data() + value.size();
    auto [pointer, error] = std::from_chars(begin, end, parsed);
    if (error != std::errc() || pointer != end || value.empty()) {
        return false;
    }
    if (parsed < 1 || parsed > 65535) {
        return false;
    }
    port = parsed;
    return true;
}

const char *transport_name(Transport transport) {
    switch (transport) {
    case Transport::Stdio:
        return "stdio";
    case Transport::Sse:
        return "sse";
    }
    return "stdio";
}

std::string usage_text(const std::string &program_name) {
    return "Usage: " + program_name + " [--stdio | --sse] [--host HOST] [--port PORT] [--debug]\n"
           "\n"
           "  --stdio        Serve MCP over stdin/stdout (default)\n"
           "  --sse          Serve MCP over HTTP + Server-Sent Events\n"
           "  --host HOST    Interface to listen on in SSE mode (default 0.0.0.0)\n"
           "  --port PORT    Port to listen on in SSE mode (default 8000)\n"
           "  --debug        Verbose logging to stderr\n"
           "  --help         Show this text\n"
           "\n"
           "Environment: FSMCPS_TRANSPORT, FSMCPS_HOST, FSMCPS_PORT, FSMCPS_DEBUG\n";
}

ConfigResult load(const std::vector<std::string> &arguments, const EnvironmentLookup &lookup) {
    ServerConfig server_config;

    // Environment.
    if (const char *value = lookup("FSMCPS_TRANSPORT")) {
        if (value[0] != '\0' && !parse_transport(value, server_config.transport)) {
            return error_result("Invalid FSMCPS_TRANSPORT: " + std::string(value) + " (expected stdio or sse)");
        }
    }
    if (const char *value = lookup("FSMCPS_HOST")) {
        if (value[0] != '\0') {
            server_config.host = value;
        }
    }
    if (const char *value = lookup("FSMCPS_PORT")) {
        if (value[0] != '\0' && !parse_port(value, server_config.port)) {
            return error_result("Invalid FSMCPS_PORT: " + std::string(value));
        }
    }
    if (const char *value = lookup("FSMCPS_DEBUG")) {
        server_config.debug = debug_log::parse_flag(value);
    }

    // Command line.
    for (size_t index = 0; index < arguments.size(); ++index) {
        const std::string &argument = arguments[index];
        if (argument == "--stdio") {
            server_config.transport = Transport::Stdio;
        } else if (argument == "--sse") {
            server_config.transport = Transport::Sse;
        } else if (argument == "--host") {
            if (index + 1 >= arguments.size()) {
                return error_result("Missing value for --host");
            }
            server_config.host = arguments[++index];
        } else if (argument == "--port") {
            if (index + 1 >= arguments.size()) {
                return error_result("Missing value for --port");
            }
            const std::string &value = arguments[++index];
            if (!parse_port(value, server_config.port)) {
                return error_result("Invalid value for --port: " + value);
            }
        } else if (argument == "--debug") {
            server_config.debug = true;
        } else if (argument == "--help" || argument == "-h") {
            server_config.show_help = true;
        } else {
            return error_result("Unknown argument: " + argument);
        }
    }

    ConfigResult result;
    result.success = true;
    result.config = server_config;
    return result;
}

ConfigResult load_from_process(int argc, char *argv[]) {
    std::vector<std::string> arguments;
    for (int index = 1; index < argc; ++index) {
        arguments.push_back(argv[index]);
    }
    return load(arguments, [](const char *name) { return static_cast<const char *>(std::getenv(name)); });
}

} // namespace config
