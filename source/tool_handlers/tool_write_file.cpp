#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <system_error>

using json = nlohmann::json;
using tool_handlers::ErrorKind;
using tool_handlers::ToolOutcome;

namespace tool_write_file {

ToolOutcome execute(const tool_handlers::WriteFileRequest &request) {
    const std::string &path = request.path;

    // Missing parent directories are created; existing ones are fine.
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code error;
        std::filesystem::create_directories(parent, error);
        if (error) {
            return ToolOutcome::failure(ErrorKind::HostFault, error.message() + ": " + parent.string());
        }
    }

    std::string error_message;
    if (!platform::write_file_contents(path, request.content, error_message)) {
        return ToolOutcome::failure(ErrorKind::HostFault, error_message);
    }

    return ToolOutcome::ok("Successfully wrote to " + path);
}

mcp_tools::ToolDescriptor descriptor() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"path", {{"type", "string"}, {"description", "Path to the file to write"}}},
        {"content", {{"type", "string"}, {"description", "Content to write to the file"}}}
    };
    input_schema["required"] = json::array({"path", "content"});

    return {"write_file", "Write content to a file", input_schema};
}

} // namespace tool_write_file
