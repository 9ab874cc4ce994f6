#include "protocol/run_agent_input.hpp"

#include <utility>

namespace agui::protocol {

using core::errors::ErrorCategory;
using core::errors::ProtocolError;
using nlohmann::json;

namespace {

ProtocolError invalid_input(const std::string& message) {
    return ProtocolError{ErrorCategory::Decode, message, "invalid_field"};
}

bool string_field(const json& wire, const char* key, std::string& out) {
    const auto it = wire.find(key);
    if (it == wire.end() || !it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

}  // namespace

json encode_run_agent_input(const RunAgentInput& input) {
    json wire;
    wire["threadId"] = input.thread_id;
    wire["runId"] = input.run_id;
    if (input.parent_run_id.has_value()) {
        wire["parentRunId"] = input.parent_run_id.value();
    }
    wire["state"] = input.state;
    wire["messages"] = encode_messages(input.messages);

    json tools = json::array();
    for (const auto& tool : input.tools) {
        tools.push_back({{"name", tool.name},
                         {"description", tool.description},
                         {"parameters", tool.parameters}});
    }
    wire["tools"] = std::move(tools);

    json context = json::array();
    for (const auto& item : input.context) {
        context.push_back({{"description", item.description}, {"value", item.value}});
    }
    wire["context"] = std::move(context);
    wire["forwardedProps"] = input.forwarded_props;
    return wire;
}

core::errors::Result<RunAgentInput> decode_run_agent_input(const json& wire) {
    if (!wire.is_object()) {
        return invalid_input("RunAgentInput must be an object");
    }

    RunAgentInput input;
    if (!string_field(wire, "threadId", input.thread_id)) {
        return invalid_input("RunAgentInput.threadId must be a string");
    }
    if (!string_field(wire, "runId", input.run_id)) {
        return invalid_input("RunAgentInput.runId must be a string");
    }

    const auto parent = wire.find("parentRunId");
    if (parent != wire.end() && !parent->is_null()) {
        if (!parent->is_string()) {
            return invalid_input("RunAgentInput.parentRunId must be a string");
        }
        input.parent_run_id = parent->get<std::string>();
    }

    const auto state = wire.find("state");
    if (state != wire.end()) {
        input.state = *state;
    }

    const auto messages = wire.find("messages");
    if (messages != wire.end() && !messages->is_null()) {
        auto decoded = decode_messages(*messages);
        if (core::errors::is_error(decoded)) {
            return core::errors::get_error(decoded);
        }
        input.messages = core::errors::get_value(decoded);
    }

    const auto tools = wire.find("tools");
    if (tools != wire.end() && !tools->is_null()) {
        if (!tools->is_array()) {
            return invalid_input("RunAgentInput.tools must be an array");
        }
        for (const auto& entry : *tools) {
            Tool tool;
            if (!entry.is_object() || !string_field(entry, "name", tool.name)) {
                return invalid_input("RunAgentInput.tools[].name must be a string");
            }
            if (entry.contains("description") &&
                !string_field(entry, "description", tool.description)) {
                return invalid_input("RunAgentInput.tools[].description must be a string");
            }
            const auto parameters = entry.find("parameters");
            if (parameters != entry.end()) {
                tool.parameters = *parameters;
            }
            input.tools.push_back(std::move(tool));
        }
    }

    const auto context = wire.find("context");
    if (context != wire.end() && !context->is_null()) {
        if (!context->is_array()) {
            return invalid_input("RunAgentInput.context must be an array");
        }
        for (const auto& entry : *context) {
            Context item;
            if (!entry.is_object() ||
                !string_field(entry, "description", item.description) ||
                !string_field(entry, "value", item.value)) {
                return invalid_input(
                    "RunAgentInput.context[] needs string description and value");
            }
            input.context.push_back(std::move(item));
        }
    }

    const auto props = wire.find("forwardedProps");
    if (props != wire.end()) {
        input.forwarded_props = *props;
    }
    return input;
}

}  // namespace agui::protocol
