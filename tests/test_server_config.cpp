// Tests for configuration loading: defaults, environment, flags.

#include "config/server_config.hpp"
#include "test_helpers.hpp"

#include <iostream>
#include <map>
#include <string>
#include <vector>

using test_helpers::check;
using test_helpers::check_equal;

namespace test_server_config {

static config::EnvironmentLookup environment(const std::map<std::string, std::string> &variables) {
    return [variables](const char *name) -> const char * {
        auto found = variables.find(name);
        return found == variables.end() ? nullptr : found->second.c_str();
    };
}

static bool test_defaults() {
    config::ConfigResult result = config::load({}, environment({}));
    bool success = check(result.success, "Empty configuration loads");
    success &= check(result.config.transport == config::Transport::Stdio, "Default transport is stdio");
    success &= check_equal(result.config.host, "0.0.0.0", "Default host");
    success &= check(result.config.port == 8000, "Default port");
    success &= check(!result.config.debug && !result.config.show_help, "Debug and help off");
    return success;
}

static bool test_environment() {
    config::ConfigResult result = config::load(
        {}, environment({{"FSMCPS_TRANSPORT", "SSE"}, {"FSMCPS_HOST", "127.0.0.1"},
                         {"FSMCPS_PORT", "9100"}, {"FSMCPS_DEBUG", "1"}}));
    bool success = check(result.success, "Environment loads");
    success &= check(result.config.transport == config::Transport::Sse, "Transport is case-insensitive");
    success &= check_equal(result.config.host, "127.0.0.1", "Host from environment");
    success &= check(result.config.port == 9100, "Port from environment");
    success &= check(result.config.debug, "Debug from environment");
    return success;
}

static bool test_flags_override_environment() {
    config::ConfigResult result =
        config::load({"--stdio", "--host", "localhost", "--port", "8123", "--debug"},
                     environment({{"FSMCPS_TRANSPORT", "sse"}, {"FSMCPS_PORT", "9100"}}));
    bool success = check(result.success, "Flags load");
    success &= check(result.config.transport == config::Transport::Stdio, "--stdio wins over environment");
    success &= check_equal(result.config.host, "localhost", "--host");
    success &= check(result.config.port == 8123, "--port wins over environment");
    success &= check(result.config.debug, "--debug");
    return success;
}

static bool test_errors() {
    config::ConfigResult bad_env_port = config::load({}, environment({{"FSMCPS_PORT", "http"}}));
    config::ConfigResult bad_transport = config::load({}, environment({{"FSMCPS_TRANSPORT", "websocket"}}));
    config::ConfigResult zero_port = config::load({"--port", "0"}, environment({}));
    config::ConfigResult big_port = config::load({"--port", "70000"}, environment({}));
    config::ConfigResult missing_value = config::load({"--host"}, environment({}));
    config::ConfigResult unknown = config::load({"--verbose"}, environment({}));

    bool success = check_equal(bad_env_port.error_message, "Invalid FSMCPS_PORT: http", "Bad port in environment");
    success &= check_equal(bad_transport.error_message,
                           "Invalid FSMCPS_TRANSPORT: websocket (expected stdio or sse)", "Bad transport");
    success &= check_equal(zero_port.error_message, "Invalid value for --port: 0", "Port 0 rejected");
    success &= check(!big_port.success, "Port above 65535 rejected");
    success &= check_equal(missing_value.error_message, "Missing value for --host", "Missing flag value");
    success &= check_equal(unknown.error_message, "Unknown argument: --verbose", "Unknown flag");
    return success;
}

static bool test_help() {
    config::ConfigResult result = config::load({"-h"}, environment({}));
    bool success = check(result.success && result.config.show_help, "-h requests help");
    success &= check(config::usage_text("fsmcps").find("--sse") != std::string::npos, "Usage mentions --sse");
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_defaults();
    all_passed &= test_environment();
    all_passed &= test_flags_override_environment();
    all_passed &= test_errors();
    all_passed &= test_help();
    return all_passed;
}

} // namespace test_server_config
