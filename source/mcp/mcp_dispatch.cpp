#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_tools.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <string>

// MCP JSON-RPC method dispatch.
// Routes incoming MCP messages to the appropriate handler.

namespace mcp_dispatch {

const char SERVER_NAME[] = "mcp-file-server";
const char SERVER_VERSION[] = "1.0.0";

const char *const SUPPORTED_PROTOCOL_VERSIONS[] = {
    "2024-11-05",
    "2025-03-26",
    "2025-06-18",
};
const size_t SUPPORTED_PROTOCOL_VERSION_COUNT =
    sizeof(SUPPORTED_PROTOCOL_VERSIONS) / sizeof(SUPPORTED_PROTOCOL_VERSIONS[0]);

static const char SERVER_INSTRUCTIONS[] =
    "File-system MCP server: reads, writes, lists, creates, deletes and inspects "
    "files and directories on the host. Paths are used as given, relative to the "
    "server's working directory unless absolute.";

std::string negotiate_protocol_version(const std::string &requested_version) {
    for (size_t index = 0; index < SUPPORTED_PROTOCOL_VERSION_COUNT; ++index) {
        if (requested_version == SUPPORTED_PROTOCOL_VERSIONS[index]) {
            return requested_version;
        }
    }
    return SUPPORTED_PROTOCOL_VERSIONS[SUPPORTED_PROTOCOL_VERSION_COUNT - 1];
}

// Handle the "initialize" request.
static json handle_initialize(const json &request_id, const json &params) {
    std::string requested_version;
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        requested_version = params["protocolVersion"].get<std::string>();
    }

    json capabilities;
    capabilities["tools"]["listChanged"] = false;

    json server_info;
    server_info["name"] = SERVER_NAME;
    server_info["version"] = SERVER_VERSION;

    json result;
    result["protocolVersion"] = negotiate_protocol_version(requested_version);
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;
    result["instructions"] = SERVER_INSTRUCTIONS;

    debug_log::log("initialize: client requested protocol '" + requested_version + "', using '" +
                   result["protocolVersion"].get<std::string>() + "'");
    return json_rpc::build_response(request_id, result);
}

// Handle the "tools/list" request.
static json handle_tools_list(const json &request_id) {
    return json_rpc::build_response(request_id, mcp_tools::build_tools_list_response());
}

// Handle the "tools/call" request.
static json handle_tools_call(const json &request_id, const json &params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                               "Missing or invalid 'name' in tools/call");
    }
    std::string tool_name = params["name"].get<std::string>();

    json arguments = json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        if (!params["arguments"].is_object()) {
            return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                                   "'arguments' in tools/call must be an object");
        }
        arguments = params["arguments"];
    }

    return json_rpc::build_response(request_id, mcp_tools::call_tool(tool_name, arguments));
}

json dispatch_message(const json &message) {
    // Replies to requests we never send; nothing to answer.
    if (json_rpc::is_response(message)) {
        debug_log::log("Ignoring JSON-RPC response from client.");
        return nullptr;
    }

    if (!json_rpc::is_well_formed_request(message)) {
        return json_rpc::build_error_response(json_rpc::get_id(message), json_rpc::INVALID_REQUEST,
                                               "Invalid Request");
    }

    std::string method = json_rpc::get_method(message);
    json request_id = json_rpc::get_id(message);
    json params = json_rpc::get_params(message);

    // Handle notifications (no response expected).
    if (json_rpc::is_notification(message)) {
        debug_log::log("Notification: " + method);
        return nullptr;
    }

    if (method == "initialize") {
        return handle_initialize(request_id, params);
    }
    if (method == "ping") {
        return json_rpc::build_response(request_id, json::object());
    }
    if (method == "tools/list") {
        return handle_tools_list(request_id);
    }
    if (method == "tools/call") {
        return handle_tools_call(request_id, params);
    }

    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                           "Method not found: " + method);
}

} // namespace mcp_dispatch
