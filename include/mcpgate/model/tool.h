#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <mcpgate/core/types.h>

namespace mcpgate::model {

struct ToolRecord {
    std::string name;
    std::optional<std::string> description;
    nlohmann::json inputSchema = nlohmann::json::object();
};

// Parses `result.tools[]` of a tools/list response. Fails with InvalidResponse when the
// array is missing or an entry lacks a name or input schema.
Result<std::vector<ToolRecord>> parseToolsList(const nlohmann::json& result);

nlohmann::json toolToJson(const ToolRecord& tool);

} // namespace mcpgate::model
