#ifndef FSMCPS_MCP_DISPATCH_HPP
#define FSMCPS_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch, shared by the stdio and SSE transports.

#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>

namespace mcp_dispatch {

using json = nlohmann::json;

// Server identity reported by initialize and /health.
extern const char SERVER_NAME[];
extern const char SERVER_VERSION[];

// Protocol revisions we accept, oldest first.
extern const char *const SUPPORTED_PROTOCOL_VERSIONS[];
extern const size_t SUPPORTED_PROTOCOL_VERSION_COUNT;

// The client's requested version when supported, otherwise the newest we know.
std::string negotiate_protocol_version(const std::string &requested_version);

// Dispatch a single JSON-RPC message. Returns the response JSON, or a null
// json value for notifications and peer responses (which require no response).
json dispatch_message(const json &message);

} // namespace mcp_dispatch

#endif // FSMCPS_MCP_DISPATCH_HPP
