// Tests for the stdio transport: message framing and the serve loop.

#include "mcp/mcp_stdio.hpp"
#include "protocol/json_rpc.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>
#include <csignal>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;
using test_helpers::check;
using test_helpers::check_equal;

namespace test_stdio_transport {

static std::vector<json> parse_lines(const std::string &output) {
    std::vector<json> messages;
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty()) {
            messages.push_back(json::parse(line));
        }
    }
    return messages;
}

static bool test_framing_newline_delimited() {
    std::istringstream input("{\"a\":1}\n{\"b\":2}\n");
    bool success = check_equal(mcp_stdio::read_message(input), "{\"a\":1}", "First message");
    success &= check_equal(mcp_stdio::read_message(input), "{\"b\":2}", "Second message");
    success &= check_equal(mcp_stdio::read_message(input), "", "EOF yields empty string");
    return success;
}

// Test: braces and escaped quotes inside strings do not end a message.
static bool test_framing_strings() {
    std::string message = "{\"text\":\"a } b { \\\" } c\",\"nested\":{\"x\":[1,{\"y\":2}]}}";
    std::istringstream input("  \n" + message + message);
    bool success = check_equal(mcp_stdio::read_message(input), message, "Braces inside strings are ignored");
    success &= check_equal(mcp_stdio::read_message(input), message, "Back-to-back messages without separator");
    return success;
}

static bool test_framing_incomplete() {
    std::istringstream leading_garbage("xyz {\"ok\":true}");
    std::istringstream truncated("{\"open\":");
    bool success = check_equal(mcp_stdio::read_message(leading_garbage), "{\"ok\":true}",
                               "Bytes before the first brace are skipped");
    success &= check_equal(mcp_stdio::read_message(truncated), "", "Truncated message at EOF");
    return success;
}

// Test: a full exchange; notifications are silent, bad JSON gets -32700 and the loop goes on.
static bool test_run_loop() {
    std::string input_text =
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\",\"params\":{\"protocolVersion\":\"2025-03-26\"}}\n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
        "{not json}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/call\","
        "\"params\":{\"name\":\"read_file\",\"arguments\":{\"path\":\"/nonexistent/fsmcps/file.txt\"}}}\n";
    std::istringstream input(input_text);
    std::ostringstream output;
    volatile std::sig_atomic_t shutdown_requested = 0;

    int handled = mcp_stdio::run_loop(input, output, shutdown_requested);
    std::vector<json> responses = parse_lines(output.str());

    bool success = check(handled == 4, "Four messages handled");
    success &= check(responses.size() == 3, "Three responses written");
    if (responses.size() == 3) {
        success &= check(responses[0]["id"] == 1 && responses[0]["result"]["protocolVersion"] == "2025-03-26",
                         "initialize response");
        success &= check(responses[1]["id"].is_null() &&
                             responses[1]["error"]["code"] == json_rpc::PARSE_ERROR,
                         "Parse error response");
        success &= check(responses[2]["id"] == 2 &&
                             responses[2]["result"]["content"][0]["text"] ==
                                 "Error: File not found: /nonexistent/fsmcps/file.txt",
                         "tools/call response");
    }
    return success;
}

static bool test_run_loop_shutdown() {
    std::istringstream input("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n");
    std::ostringstream output;
    volatile std::sig_atomic_t shutdown_requested = 1;

    int handled = mcp_stdio::run_loop(input, output, shutdown_requested);
    bool success = check(handled == 0, "No messages handled after shutdown request");
    success &= check(output.str().empty(), "Nothing written after shutdown request");
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_framing_newline_delimited();
    all_passed &= test_framing_strings();
    all_passed &= test_framing_incomplete();
    all_passed &= test_run_loop();
    all_passed &= test_run_loop_shutdown();
    return all_passed;
}

} // namespace test_stdio_transport
