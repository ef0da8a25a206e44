#include <mcpgate/core/format.h>
#include <mcpgate/model/tool.h>

namespace mcpgate::model {

using nlohmann::json;

Result<std::vector<ToolRecord>> parseToolsList(const json& result) {
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array())
        return Error{ErrorCode::InvalidResponse, "No tools array in response"};

    std::vector<ToolRecord> tools;
    tools.reserve(result["tools"].size());
    for (const auto& t : result["tools"]) {
        if (!t.is_object() || !t.contains("name") || !t["name"].is_string())
            return Error{ErrorCode::InvalidResponse, "Tool entry without a name"};

        ToolRecord rec;
        rec.name = t["name"].get<std::string>();
        if (t.contains("description") && t["description"].is_string())
            rec.description = t["description"].get<std::string>();
        if (!t.contains("inputSchema") || !t["inputSchema"].is_object())
            return Error{ErrorCode::InvalidResponse,
                         format("Tool '{}' has no inputSchema object", rec.name)};
        rec.inputSchema = t["inputSchema"];
        tools.push_back(std::move(rec));
    }
    return tools;
}

json toolToJson(const ToolRecord& tool) {
    json j = {{"name", tool.name}, {"inputSchema", tool.inputSchema}};
    if (tool.description)
        j["description"] = *tool.description;
    return j;
}

} // namespace mcpgate::model
