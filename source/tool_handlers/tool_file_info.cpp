#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <system_error>

using json = nlohmann::json;
using tool_handlers::ErrorKind;
using tool_handlers::ToolOutcome;

// Tool handler for "file_info".
// Output lines: Path (absolute, not canonicalized), Type, Size (shallow st_size,
// also for directories), Modified (epoch seconds with nanosecond fraction).

namespace tool_file_info {

// Before 1970 st_mtim holds a negative tv_sec and a non-negative tv_nsec, so
// -0.8 s arrives as {-1, 200000000}. Print the signed decimal value.
static std::string format_modified_time(std::int64_t seconds, long nanoseconds) {
    std::string sign;
    if (seconds < 0 && nanoseconds > 0) {
        sign = "-";
        seconds = -(seconds + 1);
        nanoseconds = 1000000000L - nanoseconds;
    } else if (seconds < 0) {
        sign = "-";
        seconds = -seconds;
    }
    char fraction[16];
    std::snprintf(fraction, sizeof(fraction), "%09ld", nanoseconds);
    return sign + std::to_string(seconds) + "." + fraction;
}

ToolOutcome execute(const tool_handlers::FileInfoRequest &request) {
    const std::string &path = request.path;

    platform::PathStatus status = platform::stat_path(path);
    if (!status.error_message.empty()) {
        return ToolOutcome::failure(ErrorKind::HostFault, status.error_message);
    }
    if (!status.exists) {
        return ToolOutcome::failure(ErrorKind::NotFound, "Path not found: " + path);
    }

    std::error_code error;
    std::filesystem::path absolute_path = std::filesystem::absolute(path, error);
    if (error) {
        return ToolOutcome::failure(ErrorKind::HostFault, error.message() + ": " + path);
    }

    std::string info;
    info += "Path: " + absolute_path.string() + "\n";
    info += std::string("Type: ") + (status.is_directory ? "Directory" : "File") + "\n";
    info += "Size: " + std::to_string(status.size_bytes) + " bytes\n";
    info += "Modified: " + format_modified_time(status.modified_seconds, status.modified_nanoseconds);
    return ToolOutcome::ok(info);
}

mcp_tools::ToolDescriptor descriptor() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["path"] = {
        {"type", "string"},
        {"description", "Path to get info about"}
    };
    input_schema["required"] = json::array({"path"});

    return {"file_info", "Get information about a file or directory", input_schema};
}

} // namespace tool_file_info
