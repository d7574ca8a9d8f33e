#ifndef FSMCPS_MCP_TOOLS_HPP
#define FSMCPS_MCP_TOOLS_HPP

// MCP tool catalog: the fixed set of file tools, listing, and tools/call rendering.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace mcp_tools {

using json = nlohmann::json;

// Description of a tool, matching the MCP tool schema.
struct ToolDescriptor {
    std::string name;
    std::string description;
    json input_schema; // JSON Schema object
};

// All tools, in the order they are advertised:
// read_file, write_file, list_directory, create_directory, delete_file, file_info.
// Built once on first use and never modified.
const std::vector<ToolDescriptor> &list_tools();

// Build the response payload for tools/list.
json build_tools_list_response();

// Run a tools/call request and build its result payload (content array + isError).
// Never throws; failures are "Error: ..." text blocks.
json call_tool(const std::string &tool_name, const json &arguments);

} // namespace mcp_tools

#endif // FSMCPS_MCP_TOOLS_HPP
