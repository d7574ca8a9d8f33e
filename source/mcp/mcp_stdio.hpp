#ifndef FSMCPS_MCP_STDIO_HPP
#define FSMCPS_MCP_STDIO_HPP

// MCP stdio transport: JSON-RPC messages in on stdin, responses out on stdout.

#include <csignal>
#include <iosfwd>
#include <string>

namespace mcp_stdio {

// Read a single complete JSON object from input.
// Returns the raw JSON string, or empty string on EOF.
std::string read_message(std::istream &input);

// Write a JSON message followed by a newline, and flush.
void write_message(std::ostream &output, const std::string &json_string);

// Serve messages from input until EOF or until shutdown_requested is set.
// Returns the number of messages handled.
int run_loop(std::istream &input, std::ostream &output,
             const volatile std::sig_atomic_t &shutdown_requested);

} // namespace mcp_stdio

#endif // FSMCPS_MCP_STDIO_HPP
