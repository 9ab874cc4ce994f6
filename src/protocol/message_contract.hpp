#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/protocol_errors.hpp"
#include "tool_contract.hpp"

namespace agui::protocol {

    enum class Role {
        Developer,
        System,
        Assistant,
        User,
        Tool,
        Activity
    };

    enum class ContentPartType {
        Text,
        Image,
        Audio,
        File
    };

    // One segment of multimodal user/assistant content. Text parts carry
    // `text`; image, audio and file parts carry `file` ({mimeType, bytes} or
    // {mimeType, uri}).
    struct ContentPart {
        ContentPartType type = ContentPartType::Text;
        std::string text;
        nlohmann::json file;
        std::optional<nlohmann::json> metadata;
    };

    struct Message {
        std::string id;
        Role role = Role::Assistant;
        std::optional<std::string> content;
        std::optional<std::string> name;

        // Set instead of `content` when the wire content is a list of parts.
        std::vector<ContentPart> content_parts;

        // Assistant messages: calls the model asked for, in request order.
        std::vector<ToolCall> tool_calls;

        // Tool messages: the call this message answers.
        std::optional<std::string> tool_call_id;

        // Activity messages: structured content owned by ACTIVITY_* events.
        std::optional<std::string> activity_type;
        nlohmann::json activity_content;
    };

    std::string to_string(Role role);
    std::optional<Role> role_from_string(const std::string& value);

    std::string to_string(ContentPartType type);
    std::optional<ContentPartType> content_part_type_from_string(const std::string& value);

    // Wire form follows the OpenAI-style message shape with camelCase keys.
    nlohmann::json encode_message(const Message& message);
    core::errors::Result<Message> decode_message(const nlohmann::json& wire);

    nlohmann::json encode_messages(const std::vector<Message>& messages);
    core::errors::Result<std::vector<Message>> decode_messages(const nlohmann::json& wire);

} // namespace agui::protocol
