#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

#include <exception>
#include <utility>

// Each tool_*.cpp defines its own namespace with an execute() function.
namespace tool_read_file { tool_handlers::ToolOutcome execute(const tool_handlers::ReadFileRequest &request); }
namespace tool_write_file { tool_handlers::ToolOutcome execute(const tool_handlers::WriteFileRequest &request); }
namespace tool_list_directory { tool_handlers::ToolOutcome execute(const tool_handlers::ListDirectoryRequest &request); }
namespace tool_create_directory { tool_handlers::ToolOutcome execute(const tool_handlers::CreateDirectoryRequest &request); }
namespace tool_delete_file { tool_handlers::ToolOutcome execute(const tool_handlers::DeleteFileRequest &request); }
namespace tool_file_info { tool_handlers::ToolOutcome execute(const tool_handlers::FileInfoRequest &request); }

namespace tool_handlers {

namespace {

struct ToolKindEntry {
    const char *name;
    ToolKind kind;
};

const ToolKindEntry kToolKinds[] = {
    {"read_file", ToolKind::ReadFile},
    {"write_file", ToolKind::WriteFile},
    {"list_directory", ToolKind::ListDirectory},
    {"create_directory", ToolKind::CreateDirectory},
    {"delete_file", ToolKind::DeleteFile},
    {"file_info", ToolKind::FileInfo},
};

// Reads a required string argument into value.
bool require_string(const json &arguments, const char *key, std::string &value,
                    std::string &error_message) {
    if (!arguments.is_object() || !arguments.contains(key)) {
        error_message = std::string("Missing required argument: ") + key;
        return false;
    }
    const json &argument = arguments[key];
    if (!argument.is_string()) {
        error_message = std::string("Argument '") + key + "' must be a string";
        return false;
    }
    value = argument.get<std::string>();
    return true;
}

struct ExecuteVisitor {
    ToolOutcome operator()(const ReadFileRequest &request) const {
        return tool_read_file::execute(request);
    }
    ToolOutcome operator()(const WriteFileRequest &request) const {
        return tool_write_file::execute(request);
    }
    ToolOutcome operator()(const ListDirectoryRequest &request) const {
        return tool_list_directory::execute(request);
    }
    ToolOutcome operator()(const CreateDirectoryRequest &request) const {
        return tool_create_directory::execute(request);
    }
    ToolOutcome operator()(const DeleteFileRequest &request) const {
        return tool_delete_file::execute(request);
    }
    ToolOutcome operator()(const FileInfoRequest &request) const {
        return tool_file_info::execute(request);
    }
};

InvocationResult single_block(std::string text) {
    InvocationResult result;
    result.push_back(TextBlock{std::move(text)});
    return result;
}

} // namespace

ToolOutcome ToolOutcome::ok(std::string text) {
    ToolOutcome outcome;
    outcome.success = true;
    outcome.text = std::move(text);
    return outcome;
}

ToolOutcome ToolOutcome::failure(ErrorKind kind, std::string message) {
    ToolOutcome outcome;
    outcome.success = false;
    outcome.error_kind = kind;
    outcome.error_message = std::move(message);
    return outcome;
}

const char *tool_kind_name(ToolKind kind) {
    for (const auto &entry : kToolKinds) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    return "unknown";
}

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound:
        return "NotFound";
    case ErrorKind::WrongKind:
        return "WrongKind";
    case ErrorKind::UnknownTool:
        return "UnknownTool";
    case ErrorKind::InvalidArguments:
        return "InvalidArguments";
    case ErrorKind::HostFault:
        return "HostFault";
    }
    return "HostFault";
}

std::optional<ToolKind> tool_kind_from_name(const std::string &tool_name) {
    for (const auto &entry : kToolKinds) {
        if (tool_name == entry.name) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

std::optional<ToolRequest> parse_request(ToolKind kind, const json &arguments,
                                         std::string &error_message) {
    std::string path;
    if (!require_string(arguments, "path", path, error_message)) {
        return std::nullopt;
    }

    switch (kind) {
    case ToolKind::ReadFile:
        return ToolRequest{ReadFileRequest{path}};
    case ToolKind::WriteFile: {
        std::string content;
        if (!require_string(arguments, "content", content, error_message)) {
            return std::nullopt;
        }
        return ToolRequest{WriteFileRequest{path, std::move(content)}};
    }
    case ToolKind::ListDirectory:
        return ToolRequest{ListDirectoryRequest{path}};
    case ToolKind::CreateDirectory:
        return ToolRequest{CreateDirectoryRequest{path}};
    case ToolKind::DeleteFile:
        return ToolRequest{DeleteFileRequest{path}};
    case ToolKind::FileInfo:
        return ToolRequest{FileInfoRequest{path}};
    }

    error_message = "Unsupported tool kind";
    return std::nullopt;
}

ToolOutcome execute(const ToolRequest &request) {
    return std::visit(ExecuteVisitor{}, request);
}

std::string render_outcome(const ToolOutcome &outcome) {
    if (outcome.success) {
        return outcome.text;
    }
    return "Error: " + outcome.error_message;
}

InvocationResult dispatch(const std::string &tool_name, const json &arguments) {
    debug_log::log("tools/call " + tool_name);

    ToolOutcome outcome;
    try {
        std::optional<ToolKind> kind = tool_kind_from_name(tool_name);
        if (!kind) {
            outcome = ToolOutcome::failure(ErrorKind::UnknownTool, "Unknown tool: " + tool_name);
        } else {
            std::string error_message;
            std::optional<ToolRequest> request = parse_request(*kind, arguments, error_message);
            if (!request) {
                outcome = ToolOutcome::failure(ErrorKind::InvalidArguments, error_message);
            } else {
                outcome = execute(*request);
            }
        }
    } catch (const std::exception &error) {
        // Last resort for failures outside the error_code paths (e.g. std::bad_alloc).
        outcome = ToolOutcome::failure(ErrorKind::HostFault, error.what());
    }

    if (!outcome.success) {
        debug_log::log(tool_name + " failed (" + error_kind_name(outcome.error_kind) +
                       "): " + outcome.error_message);
    }
    return single_block(render_outcome(outcome));
}

} // namespace tool_handlers
