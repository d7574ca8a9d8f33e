#include "mcp/mcp_tools.hpp"
#include "tool_handlers/tool_handlers.hpp"

// Each tool_*.cpp defines its own namespace with a descriptor() function.
namespace tool_read_file { mcp_tools::ToolDescriptor descriptor(); }
namespace tool_write_file { mcp_tools::ToolDescriptor descriptor(); }
namespace tool_list_directory { mcp_tools::ToolDescriptor descriptor(); }
namespace tool_create_directory { mcp_tools::ToolDescriptor descriptor(); }
namespace tool_delete_file { mcp_tools::ToolDescriptor descriptor(); }
namespace tool_file_info { mcp_tools::ToolDescriptor descriptor(); }

namespace mcp_tools {

const std::vector<ToolDescriptor> &list_tools() {
    static const std::vector<ToolDescriptor> catalog = {
        tool_read_file::descriptor(),
        tool_write_file::descriptor(),
        tool_list_directory::descriptor(),
        tool_create_directory::descriptor(),
        tool_delete_file::descriptor(),
        tool_file_info::descriptor(),
    };
    return catalog;
}

json build_tools_list_response() {
    json tools_array = json::array();
    for (const auto &tool : list_tools()) {
        json tool_entry;
        tool_entry["name"] = tool.name;
        tool_entry["description"] = tool.description;
        tool_entry["inputSchema"] = tool.input_schema;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

json call_tool(const std::string &tool_name, const json &arguments) {
    tool_handlers::InvocationResult invocation = tool_handlers::dispatch(tool_name, arguments);

    json content = json::array();
    for (const auto &block : invocation) {
        json text_content;
        text_content["type"] = "text";
        text_content["text"] = block.text;
        content.push_back(text_content);
    }

    // Failures travel as "Error: " text, so isError stays false.
    json result;
    result["content"] = content;
    result["isError"] = false;
    return result;
}

} // namespace mcp_tools
