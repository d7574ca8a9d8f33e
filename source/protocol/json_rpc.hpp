#ifndef FSMCPS_JSON_RPC_HPP
#define FSMCPS_JSON_RPC_HPP

// JSON-RPC 2.0 envelope helpers for MCP traffic.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response. error_data is attached only when not null.
json build_error_response(const json &request_id, int error_code, const std::string &error_message,
                          const json &error_data = nullptr);

// Error response for input that is not JSON at all (id is null).
json build_parse_error(const std::string &detail);

// Serialize for the wire. Invalid UTF-8 inside strings (e.g. odd file names)
// is replaced with U+FFFD instead of throwing.
std::string serialize(const json &message);

// Extract method name from a JSON-RPC request/notification. Returns empty if missing.
std::string get_method(const json &message);

// Extract the id from a JSON-RPC message. Returns nullptr json if missing (notification).
json get_id(const json &message);

// Extract params from a JSON-RPC message. Returns empty object if missing or not an object.
json get_params(const json &message);

// A message with "jsonrpc": "2.0" and a string "method" (id optional).
bool is_well_formed_request(const json &message);

// A message without an id field.
bool is_notification(const json &message);

// A reply from the peer ("result" or "error", no "method").
bool is_response(const json &message);

} // namespace json_rpc

#endif // FSMCPS_JSON_RPC_HPP
