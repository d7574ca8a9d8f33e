#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"
#include "utils/utf8_validate.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using tool_handlers::ErrorKind;
using tool_handlers::ToolOutcome;

// Tool handler for "read_file".
// Returns the whole file as one text block; the bytes must be valid UTF-8.

namespace tool_read_file {

ToolOutcome execute(const tool_handlers::ReadFileRequest &request) {
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

    std::string contents;
    std::string error_message;
    if (!platform::read_file_contents(path, contents, error_message)) {
        return ToolOutcome::failure(ErrorKind::HostFault, error_message);
    }

    utf8_validate::ValidationResult validation = utf8_validate::validate(contents);
    if (!validation.valid) {
        return ToolOutcome::failure(ErrorKind::HostFault,
                                    "Cannot decode " + path + " as UTF-8: " +
                                        utf8_validate::describe(validation));
    }

    return ToolOutcome::ok(std::move(contents));
}

mcp_tools::ToolDescriptor descriptor() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["path"] = {
        {"type", "string"},
        {"description", "Path to the file to read"}
    };
    input_schema["required"] = json::array({"path"});

    return {"read_file", "Read the contents of a file", input_schema};
}

} // namespace tool_read_file
