#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

// Framing uses brace-counting with string/escape awareness,
// so it works both with newline-delimited and streamed JSON.

namespace mcp_stdio {

using json = nlohmann::json;

// Tracks { } depth, respecting strings and escapes.
std::string read_message(std::istream &input) {
    std::string buffer;
    int brace_depth = 0;
    bool inside_string = false;
    bool escape_next = false;
    bool started = false;

    char character;
    while (input.get(character)) {
        if (!started) {
            if (character == '{') {
                started = true;
                brace_depth = 1;
                buffer += character;
            }
            // Ignore anything before the first '{' (whitespace, newlines, etc.)
            continue;
        }

        buffer += character;

        if (escape_next) {
            escape_next = false;
            continue;
        }

        if (character == '\\' && inside_string) {
            escape_next = true;
            continue;
        }

        if (character == '"') {
            inside_string = !inside_string;
            continue;
        }

        if (inside_string) {
            continue;
        }

        if (character == '{') {
            brace_depth++;
        } else if (character == '}') {
            brace_depth--;
            if (brace_depth == 0) {
                return buffer;
            }
        }
    }

    // EOF reached without a complete message.
    return "";
}

void write_message(std::ostream &output, const std::string &json_string) {
    output << json_string << "\n";
    output.flush();
}

int run_loop(std::istream &input, std::ostream &output,
             const volatile std::sig_atomic_t &shutdown_requested) {
    int handled_count = 0;

    while (!shutdown_requested) {
        std::string raw_message = read_message(input);

        if (raw_message.empty()) {
            // EOF on stdin means the client disconnected.
            debug_log::info("EOF on stdin. Shutting down.");
            break;
        }

        json parsed_message;
        try {
            parsed_message = json::parse(raw_message);
        } catch (const json::parse_error &error) {
            debug_log::info("Failed to parse incoming JSON: " + std::string(error.what()));
            write_message(output, json_rpc::serialize(json_rpc::build_parse_error(error.what())));
            ++handled_count;
            continue;
        }

        json response = mcp_dispatch::dispatch_message(parsed_message);
        ++handled_count;

        // Notifications return null (no response needed).
        if (response.is_null()) {
            continue;
        }

        write_message(output, json_rpc::serialize(response));
    }

    return handled_count;
}

} // namespace mcp_stdio
