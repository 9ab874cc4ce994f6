#include "protocol/message_contract.hpp"

#include <utility>

namespace agui::protocol {

using core::errors::ErrorCategory;
using core::errors::ProtocolError;
using nlohmann::json;

namespace {

ProtocolError invalid_message(const std::string& message) {
    return ProtocolError{ErrorCategory::Decode, message, "invalid_field"};
}

bool read_optional_string(const json& wire, const char* key,
                          std::optional<std::string>& out) {
    const auto it = wire.find(key);
    if (it == wire.end() || it->is_null()) {
        out.reset();
        return true;
    }
    if (!it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

json encode_tool_call(const ToolCall& call) {
    return json{{"id", call.id},
                {"type", "function"},
                {"function", {{"name", call.name}, {"arguments", call.arguments}}}};
}

core::errors::Result<ToolCall> decode_tool_call(const json& wire) {
    if (!wire.is_object()) {
        return invalid_message("toolCalls entries must be objects");
    }
    const auto id = wire.find("id");
    if (id == wire.end() || !id->is_string()) {
        return invalid_message("toolCalls[].id must be a string");
    }
    const auto function = wire.find("function");
    if (function == wire.end() || !function->is_object()) {
        return invalid_message("toolCalls[].function must be an object");
    }
    const auto name = function->find("name");
    if (name == function->end() || !name->is_string()) {
        return invalid_message("toolCalls[].function.name must be a string");
    }

    ToolCall call;
    call.id = id->get<std::string>();
    call.name = name->get<std::string>();
    const auto arguments = function->find("arguments");
    if (arguments != function->end() && !arguments->is_null()) {
        if (!arguments->is_string()) {
            return invalid_message("toolCalls[].function.arguments must be a string");
        }
        call.arguments = arguments->get<std::string>();
    }
    return call;
}

json encode_content_part(const ContentPart& part) {
    json wire;
    wire["type"] = to_string(part.type);
    if (part.type == ContentPartType::Text) {
        wire["text"] = part.text;
    } else {
        wire["file"] = part.file;
    }
    if (part.metadata.has_value()) {
        wire["metadata"] = part.metadata.value();
    }
    return wire;
}

core::errors::Result<ContentPart> decode_content_part(const json& wire) {
    if (!wire.is_object()) {
        return invalid_message("message.content parts must be objects");
    }
    const auto type_it = wire.find("type");
    if (type_it == wire.end() || !type_it->is_string()) {
        return invalid_message("message.content[].type must be a string");
    }
    const auto type = content_part_type_from_string(type_it->get<std::string>());
    if (!type.has_value()) {
        return invalid_message("message.content[].type is not a known part type: " +
                               type_it->get<std::string>());
    }

    ContentPart part;
    part.type = type.value();
    if (part.type == ContentPartType::Text) {
        const auto text = wire.find("text");
        if (text == wire.end() || !text->is_string()) {
            return invalid_message("message.content[].text must be a string");
        }
        part.text = text->get<std::string>();
    } else {
        const auto file = wire.find("file");
        if (file == wire.end() || !file->is_object()) {
            return invalid_message("message.content[].file must be an object");
        }
        part.file = *file;
    }

    const auto metadata = wire.find("metadata");
    if (metadata != wire.end() && !metadata->is_null()) {
        if (!metadata->is_object()) {
            return invalid_message("message.content[].metadata must be an object");
        }
        part.metadata = *metadata;
    }
    return part;
}

}  // namespace

std::string to_string(const ContentPartType type) {
    switch (type) {
        case ContentPartType::Text:
            return "text";
        case ContentPartType::Image:
            return "image";
        case ContentPartType::Audio:
            return "audio";
        case ContentPartType::File:
            return "file";
        default:
            return "unknown";
    }
}

std::optional<ContentPartType> content_part_type_from_string(const std::string& value) {
    static constexpr std::pair<const char*, ContentPartType> kTypes[] = {
        {"text", ContentPartType::Text},   {"image", ContentPartType::Image},
        {"audio", ContentPartType::Audio}, {"file", ContentPartType::File}};
    for (const auto& entry : kTypes) {
        if (value == entry.first) {
            return entry.second;
        }
    }
    return std::nullopt;
}

std::string to_string(const Role role) {
    switch (role) {
        case Role::Developer:
            return "developer";
        case Role::System:
            return "system";
        case Role::Assistant:
            return "assistant";
        case Role::User:
            return "user";
        case Role::Tool:
            return "tool";
        case Role::Activity:
            return "activity";
        default:
            return "unknown";
    }
}

std::optional<Role> role_from_string(const std::string& value) {
    static constexpr std::pair<const char*, Role> kRoles[] = {
        {"developer", Role::Developer}, {"system", Role::System},
        {"assistant", Role::Assistant}, {"user", Role::User},
        {"tool", Role::Tool},           {"activity", Role::Activity}};
    for (const auto& entry : kRoles) {
        if (value == entry.first) {
            return entry.second;
        }
    }
    return std::nullopt;
}

json encode_message(const Message& message) {
    json wire;
    wire["id"] = message.id;
    wire["role"] = to_string(message.role);

    if (message.role == Role::Activity) {
        if (message.activity_type.has_value()) {
            wire["activityType"] = message.activity_type.value();
        }
        wire["content"] = message.activity_content.is_null()
                              ? json::object()
                              : message.activity_content;
        return wire;
    }

    if (!message.content_parts.empty()) {
        json parts = json::array();
        for (const auto& part : message.content_parts) {
            parts.push_back(encode_content_part(part));
        }
        wire["content"] = std::move(parts);
    } else if (message.content.has_value()) {
        wire["content"] = message.content.value();
    }
    if (message.name.has_value()) {
        wire["name"] = message.name.value();
    }
    if (!message.tool_calls.empty()) {
        json calls = json::array();
        for (const auto& call : message.tool_calls) {
            calls.push_back(encode_tool_call(call));
        }
        wire["toolCalls"] = std::move(calls);
    }
    if (message.tool_call_id.has_value()) {
        wire["toolCallId"] = message.tool_call_id.value();
    }
    return wire;
}

core::errors::Result<Message> decode_message(const json& wire) {
    if (!wire.is_object()) {
        return invalid_message("message must be an object");
    }

    const auto id = wire.find("id");
    if (id == wire.end() || !id->is_string()) {
        return invalid_message("message.id must be a string");
    }
    const auto role_it = wire.find("role");
    if (role_it == wire.end() || !role_it->is_string()) {
        return invalid_message("message.role must be a string");
    }
    const auto role = role_from_string(role_it->get<std::string>());
    if (!role.has_value()) {
        return invalid_message("message.role is not a known role: " +
                               role_it->get<std::string>());
    }

    Message message;
    message.id = id->get<std::string>();
    message.role = role.value();

    if (message.role == Role::Activity) {
        if (!read_optional_string(wire, "activityType", message.activity_type)) {
            return invalid_message("message.activityType must be a string");
        }
        const auto content = wire.find("content");
        message.activity_content =
            content == wire.end() ? json::object() : *content;
        return message;
    }

    const auto content = wire.find("content");
    const bool multimodal = message.role == Role::User || message.role == Role::Assistant;
    if (multimodal && content != wire.end() && content->is_array()) {
        for (const auto& entry : *content) {
            auto part = decode_content_part(entry);
            if (core::errors::is_error(part)) {
                return core::errors::get_error(part);
            }
            message.content_parts.push_back(core::errors::get_value(part));
        }
    } else if (!read_optional_string(wire, "content", message.content)) {
        return invalid_message(multimodal
                                   ? "message.content must be a string or an array of parts"
                                   : "message.content must be a string");
    }
    if (!read_optional_string(wire, "name", message.name)) {
        return invalid_message("message.name must be a string");
    }
    if (!read_optional_string(wire, "toolCallId", message.tool_call_id)) {
        return invalid_message("message.toolCallId must be a string");
    }

    const auto calls = wire.find("toolCalls");
    if (calls != wire.end() && !calls->is_null()) {
        if (!calls->is_array()) {
            return invalid_message("message.toolCalls must be an array");
        }
        for (const auto& entry : *calls) {
            auto call = decode_tool_call(entry);
            if (core::errors::is_error(call)) {
                return core::errors::get_error(call);
            }
            message.tool_calls.push_back(core::errors::get_value(call));
        }
    }
    return message;
}

json encode_messages(const std::vector<Message>& messages) {
    json wire = json::array();
    for (const auto& message : messages) {
        wire.push_back(encode_message(message));
    }
    return wire;
}

core::errors::Result<std::vector<Message>> decode_messages(const json& wire) {
    if (!wire.is_array()) {
        return invalid_message("messages must be an array");
    }
    std::vector<Message> messages;
    messages.reserve(wire.size());
    for (const auto& entry : wire) {
        auto message = decode_message(entry);
        if (core::errors::is_error(message)) {
            return core::errors::get_error(message);
        }
        messages.push_back(core::errors::get_value(message));
    }
    return messages;
}

}  // namespace agui::protocol
