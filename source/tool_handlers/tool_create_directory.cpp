#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"

#include <nlohmann/json.hpp>
#include <cerrno>
#include <filesystem>
#include <system_error>

using json = nlohmann::json;
using tool_handlers::ErrorKind;
using tool_handlers::ToolOutcome;

namespace tool_create_directory {

ToolOutcome execute(const tool_handlers::CreateDirectoryRequest &request) {
    const std::string &path = request.path;

    std::error_code error;
    std::filesystem::create_directories(path, error);
    if (error) {
        return ToolOutcome::failure(ErrorKind::HostFault, error.message() + ": " + path);
    }

    // Some standard libraries report success when the path already exists as a file.
    platform::PathStatus status = platform::stat_path(path);
    if (!status.error_message.empty()) {
        return ToolOutcome::failure(ErrorKind::HostFault, status.error_message);
    }
    if (!status.exists) {
        return ToolOutcome::failure(ErrorKind::HostFault, platform::describe_os_error(ENOENT, path));
    }
    if (!status.is_directory) {
        return ToolOutcome::failure(ErrorKind::HostFault, platform::describe_os_error(EEXIST, path));
    }

    return ToolOutcome::ok("Successfully created directory: " + path);
}

mcp_tools::ToolDescriptor descriptor() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["path"] = {
        {"type", "string"},
        {"description", "Path of the directory to create"}
    };
    input_schema["required"] = json::array({"path"});

    return {"create_directory", "Create a new directory", input_schema};
}

} // namespace tool_create_directory
