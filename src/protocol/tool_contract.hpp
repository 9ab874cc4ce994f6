#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace agui::protocol {

    // A call the assistant made, as it appears on an assistant message.
    // On the wire: {id, type: "function", function: {name, arguments}}
    struct ToolCall {
        std::string id;
        std::string name;
        std::string arguments;  // Raw JSON string, accumulated from TOOL_CALL_ARGS deltas
    };

    // A tool the client offers to the agent in RunAgentInput.
    struct Tool {
        std::string name;
        std::string description;
        nlohmann::json parameters = nlohmann::json::object();  // JSON Schema
    };

} // namespace agui::protocol
