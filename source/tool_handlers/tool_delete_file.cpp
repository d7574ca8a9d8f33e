#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <system_error>

using json = nlohmann::json;
using tool_handlers::ErrorKind;
using tool_handlers::ToolOutcome;

// Tool handler for "delete_file". Directories are rejected, never removed.

namespace tool_delete_file {

ToolOutcome execute(const tool_handlers::DeleteFileRequest &request) {
    const std::string &path = request.path;

    platform::PathStatus status = platform::stat_path(path);
    if (!status.error_message.empty()) {
        return ToolOutcome::failure(ErrorKind::HostFault, status.error_message);
    }
    if (!status.exists) {
        return ToolOutcome::failure(ErrorKind::NotFound, "File not found: " + path);
    }
    if (!status.is_regular_file) {
        return ToolOutcome::failure(ErrorKind::WrongKind, "Not a file: " + path);
    }

    std::error_code error;
    std::filesystem::remove(path, error);
    if (error) {
        return ToolOutcome::failure(ErrorKind::HostFault, error.message() + ": " + path);
    }

    return ToolOutcome::ok("Successfully deleted: " + path);
}

mcp_tools::ToolDescriptor descriptor() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["path"] = {
        {"type", "string"},
        {"description", "Path to the file to delete"}
    };
    input_schema["required"] = json::array({"path"});

    return {"delete_file", "Delete a file", input_schema};
}

} // namespace tool_delete_file
