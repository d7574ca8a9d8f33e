#ifndef FSMCPS_TOOL_HANDLERS_HPP
#define FSMCPS_TOOL_HANDLERS_HPP

// File tool dispatch.
// A tool call is mapped to one of a closed set of operations, its arguments are
// checked into a typed request, the request runs, and the outcome is rendered
// to text. Each tool_*.cpp file provides the execute() function for one operation.

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tool_handlers {

using json = nlohmann::json;

enum class ToolKind {
    ReadFile,
    WriteFile,
    ListDirectory,
    CreateDirectory,
    DeleteFile,
    FileInfo,
};

enum class ErrorKind {
    NotFound,         // target path absent
    WrongKind,        // file expected but got a directory, or vice versa
    UnknownTool,      // name not in the catalog
    InvalidArguments, // required key absent or not a string
    HostFault,        // anything the OS or the decoder rejected
};

// Result of running one operation.
struct ToolOutcome {
    bool success = false;
    std::string text;                          // set on success
    ErrorKind error_kind = ErrorKind::HostFault;
    std::string error_message;                 // set on failure, without the "Error: " prefix

    static ToolOutcome ok(std::string text);
    static ToolOutcome failure(ErrorKind kind, std::string message);
};

struct ReadFileRequest {
    std::string path;
};

struct WriteFileRequest {
    std::string path;
    std::string content;
};

struct ListDirectoryRequest {
    std::string path;
};

struct CreateDirectoryRequest {
    std::string path;
};

struct DeleteFileRequest {
    std::string path;
};

struct FileInfoRequest {
    std::string path;
};

using ToolRequest = std::variant<ReadFileRequest, WriteFileRequest, ListDirectoryRequest,
                                 CreateDirectoryRequest, DeleteFileRequest, FileInfoRequest>;

struct TextBlock {
    std::string text;
};

// What a tool call returns to the transport. Always exactly one block;
// a failure is a block starting with "Error: ".
using InvocationResult = std::vector<TextBlock>;

const char *tool_kind_name(ToolKind kind);
const char *error_kind_name(ErrorKind kind);

// Map a tool name to its operation. Returns nullopt for unknown names.
std::optional<ToolKind> tool_kind_from_name(const std::string &tool_name);

// Build the typed request for kind from a tools/call arguments object.
// On a missing or non-string argument returns nullopt and sets error_message.
std::optional<ToolRequest> parse_request(ToolKind kind, const json &arguments,
                                         std::string &error_message);

// Run the operation carried by request.
ToolOutcome execute(const ToolRequest &request);

// Success text as is, failure as "Error: <message>".
std::string render_outcome(const ToolOutcome &outcome);

// Look up, validate, run, render. Never throws.
InvocationResult dispatch(const std::string &tool_name, const json &arguments);

} // namespace tool_handlers

#endif // FSMCPS_TOOL_HANDLERS_HPP
