#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <system_error>
#include <vector>

using json = nlohmann::json;
using tool_handlers::ErrorKind;
using tool_handlers::ToolOutcome;

// Tool handler for "list_directory".
// One line per immediate child, sorted by name: "[DIR] name" or "[FILE] name".
// Symlinks are classified by their target; anything that is not a directory
// (including a dangling link) counts as a file.

namespace tool_list_directory {

struct DirectoryEntry {
    std::string name;
    bool is_directory = false;
};

ToolOutcome execute(const tool_handlers::ListDirectoryRequest &request) {
    const std::string &path = request.path;

    platform::PathStatus status = platform::stat_path(path);
    if (!status.error_message.empty()) {
        return ToolOutcome::failure(ErrorKind::HostFault, status.error_message);
    }
    if (!status.exists) {
        return ToolOutcome::failure(ErrorKind::NotFound, "Directory not found: " + path);
    }
    if (!status.is_directory) {
        return ToolOutcome::failure(ErrorKind::WrongKind, "Not a directory: " + path);
    }

    std::vector<DirectoryEntry> entries;
    std::error_code error;
    std::filesystem::directory_iterator iterator(path, error);
    const std::filesystem::directory_iterator end_iterator;
    while (!error && iterator != end_iterator) {
        DirectoryEntry entry;
        entry.name = iterator->path().filename().string();
        std::error_code type_error;
        entry.is_directory = iterator->is_directory(type_error);
        entries.push_back(std::move(entry));
        iterator.increment(error);
    }
    if (error) {
        return ToolOutcome::failure(ErrorKind::HostFault, error.message() + ": " + path);
    }

    if (entries.empty()) {
        return ToolOutcome::ok("(empty directory)");
    }

    std::sort(entries.begin(), entries.end(),
              [](const DirectoryEntry &left, const DirectoryEntry &right) { return left.name < right.name; });

    std::string listing;
    for (const auto &entry : entries) {
        if (!listing.empty()) {
            listing += "\n";
        }
        listing += entry.is_directory ? "[DIR] " : "[FILE] ";
        listing += entry.name;
    }
    return ToolOutcome::ok(listing);
}

mcp_tools::ToolDescriptor descriptor() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["path"] = {
        {"type", "string"},
        {"description", "Path to the directory to list"}
    };
    input_schema["required"] = json::array({"path"});

    return {"list_directory", "List files and directories in a path", input_schema};
}

} // namespace tool_list_directory
