// Tests for the tool catalog: fixed order, schemas, unknown names, and the
// tools/list payload.

#include "mcp/mcp_tools.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;
using test_helpers::check;
using test_helpers::check_equal;

namespace test_tool_catalog {

static const std::vector<std::string> EXPECTED_ORDER = {
    "read_file", "write_file", "list_directory", "create_directory", "delete_file", "file_info",
};

// Test: six tools, in the advertised order, each name exactly once.
static bool test_catalog_order() {
    const auto &tools = mcp_tools::list_tools();
    bool success = check(tools.size() == EXPECTED_ORDER.size(), "Catalog has six tools");
    for (size_t index = 0; index < tools.size() && index < EXPECTED_ORDER.size(); ++index) {
        success &= check_equal(tools[index].name, EXPECTED_ORDER[index],
                               "Tool at position " + std::to_string(index));
    }
    return success;
}

// Test: every call returns the same table.
static bool test_catalog_is_stable() {
    const auto &first = mcp_tools::list_tools();
    const auto &second = mcp_tools::list_tools();
    return check(&first == &second, "list_tools() returns the same table every time");
}

// Test: schemas are objects whose parameters are all required strings.
static bool test_schemas() {
    bool success = true;
    for (const auto &tool : mcp_tools::list_tools()) {
        const json &schema = tool.input_schema;
        bool well_formed = schema["type"] == "object" && schema["properties"].is_object() &&
                           schema["required"].is_array();
        if (well_formed) {
            for (const auto &property : schema["properties"].items()) {
                well_formed &= property.value()["type"] == "string";
                well_formed &= property.value()["description"].is_string();
            }
            well_formed &= schema["required"].size() == schema["properties"].size();
        }
        success &= check(well_formed, tool.name + " schema declares required string parameters");
        success &= check(!tool.description.empty(), tool.name + " has a description");
    }

    const auto &tools = mcp_tools::list_tools();
    success &= check(tools.size() == 6 && tools[1].name == "write_file" &&
                         tools[1].input_schema["required"] == json::array({"path", "content"}),
                     "write_file requires path and content");
    success &= check(tools.size() == 6 && tools[0].name == "read_file" &&
                         tools[0].input_schema["required"] == json::array({"path"}),
                     "read_file requires only path");
    return success;
}

// Test: names outside the catalog are not tools, and are reported as unknown by tools/call.
static bool test_unknown_name_not_listed() {
    bool listed = false;
    for (const auto &tool : mcp_tools::list_tools()) {
        listed |= tool.name == "unknown_tool_xyz";
    }
    bool success = check(!listed, "Catalog does not list unknown_tool_xyz");
    json result = mcp_tools::call_tool("unknown_tool_xyz", json::object());
    success &= check(result["content"][0]["text"] == "Error: Unknown tool: unknown_tool_xyz" &&
                         result["isError"] == false,
                     "call_tool reports the unknown name as text");
    return success;
}

// Test: catalog names and dispatcher operations line up one to one.
static bool test_catalog_matches_dispatcher() {
    bool success = true;
    for (const auto &tool : mcp_tools::list_tools()) {
        auto kind = tool_handlers::tool_kind_from_name(tool.name);
        success &= check(kind.has_value() && tool.name == tool_handlers::tool_kind_name(*kind),
                         tool.name + " maps to a dispatcher operation");
    }
    success &= check(!tool_handlers::tool_kind_from_name("Read_File").has_value(),
                     "Tool names are case-sensitive");
    return success;
}

// Test: tools/list payload shape.
static bool test_tools_list_response() {
    json response = mcp_tools::build_tools_list_response();
    bool success = check(response.contains("tools") && response["tools"].is_array() &&
                             response["tools"].size() == 6,
                         "tools/list payload holds six entries");
    if (success) {
        const json &first = response["tools"][0];
        success &= check(first["name"] == "read_file" && first.contains("inputSchema") &&
                             first["description"] == "Read the contents of a file",
                         "tools/list entries carry name, description and inputSchema");
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_catalog_order();
    all_passed &= test_catalog_is_stable();
    all_passed &= test_schemas();
    all_passed &= test_unknown_name_not_listed();
    all_passed &= test_catalog_matches_dispatcher();
    all_passed &= test_tools_list_response();
    return all_passed;
}

} // namespace test_tool_catalog
