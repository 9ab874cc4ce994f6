#include "protocol/event_codec.hpp"

#include <optional>
#include <utility>

namespace agui::protocol {

using core::errors::ErrorCategory;
using core::errors::ProtocolError;
using nlohmann::json;

namespace {

// Reads typed fields off one wire map. The first failure is recorded and every
// later read returns a default, so a decoder can read all of its fields and
// check error() once at the end.
class FieldReader {
public:
    FieldReader(const json& wire, std::string type_name)
        : wire_(wire), type_name_(std::move(type_name)) {}

    std::string required_string(const char* key) {
        const auto it = wire_.find(key);
        if (it == wire_.end() || it->is_null()) {
            fail(key, "is required");
            return {};
        }
        if (!it->is_string()) {
            fail(key, "must be a string");
            return {};
        }
        return it->get<std::string>();
    }

    std::optional<std::string> optional_string(const char* key) {
        const auto it = wire_.find(key);
        if (it == wire_.end() || it->is_null()) {
            return std::nullopt;
        }
        if (!it->is_string()) {
            fail(key, "must be a string");
            return std::nullopt;
        }
        return it->get<std::string>();
    }

    std::optional<bool> optional_bool(const char* key) {
        const auto it = wire_.find(key);
        if (it == wire_.end() || it->is_null()) {
            return std::nullopt;
        }
        if (!it->is_boolean()) {
            fail(key, "must be a boolean");
            return std::nullopt;
        }
        return it->get<bool>();
    }

    // Any JSON value, null included, as long as the key is present.
    json required_value(const char* key) {
        const auto it = wire_.find(key);
        if (it == wire_.end()) {
            fail(key, "is required");
            return nullptr;
        }
        return *it;
    }

    std::optional<json> optional_value(const char* key) {
        const auto it = wire_.find(key);
        if (it == wire_.end()) {
            return std::nullopt;
        }
        return *it;
    }

    Role role(const char* key, const Role fallback) {
        const auto value = optional_role(key);
        return value.has_value() ? value.value() : fallback;
    }

    std::optional<Role> optional_role(const char* key) {
        const auto text = optional_string(key);
        if (!text.has_value()) {
            return std::nullopt;
        }
        const auto parsed = role_from_string(text.value());
        if (!parsed.has_value()) {
            fail(key, "is not a known role: " + text.value());
        }
        return parsed;
    }

    JsonPatch patch(const char* key) {
        const auto it = wire_.find(key);
        if (it == wire_.end() || it->is_null()) {
            fail(key, "is required");
            return {};
        }
        auto parsed = decode_patch(*it);
        if (core::errors::is_error(parsed)) {
            fail(key, core::errors::get_error(parsed).message);
            return {};
        }
        return core::errors::get_value(parsed);
    }

    std::vector<Message> messages(const char* key) {
        const auto it = wire_.find(key);
        if (it == wire_.end() || it->is_null()) {
            fail(key, "is required");
            return {};
        }
        auto parsed = decode_messages(*it);
        if (core::errors::is_error(parsed)) {
            fail(key, core::errors::get_error(parsed).message);
            return {};
        }
        return core::errors::get_value(parsed);
    }

    EventMeta meta() {
        EventMeta meta;
        const auto ts = wire_.find("timestamp");
        if (ts != wire_.end() && !ts->is_null()) {
            if (ts->is_number_integer()) {
                meta.timestamp = ts->get<std::int64_t>();
            } else {
                fail("timestamp", "must be an integer");
            }
        }
        meta.raw_event = optional_value("rawEvent");
        return meta;
    }

    const std::optional<ProtocolError>& error() const { return error_; }

private:
    void fail(const std::string& key, const std::string& reason) {
        if (error_.has_value()) {
            return;
        }
        error_ = ProtocolError{ErrorCategory::Decode,
                               type_name_ + "." + key + " " + reason,
                               kInvalidField};
    }

    const json& wire_;
    std::string type_name_;
    std::optional<ProtocolError> error_;
};

Event decode_body(const EventType type, FieldReader& r) {
    switch (type) {
        case EventType::RunStarted: {
            RunStartedEvent e;
            e.thread_id = r.required_string("threadId");
            e.run_id = r.required_string("runId");
            e.parent_run_id = r.optional_string("parentRunId");
            e.meta = r.meta();
            return e;
        }
        case EventType::RunFinished: {
            RunFinishedEvent e;
            e.thread_id = r.required_string("threadId");
            e.run_id = r.required_string("runId");
            e.result = r.optional_value("result");
            e.meta = r.meta();
            return e;
        }
        case EventType::RunError: {
            RunErrorEvent e;
            e.message = r.required_string("message");
            e.code = r.optional_string("code");
            e.meta = r.meta();
            return e;
        }
        case EventType::StepStarted:
            return StepStartedEvent{r.required_string("stepName"), r.meta()};
        case EventType::StepFinished:
            return StepFinishedEvent{r.required_string("stepName"), r.meta()};
        case EventType::TextMessageStart: {
            TextMessageStartEvent e;
            e.message_id = r.required_string("messageId");
            e.role = r.role("role", Role::Assistant);
            e.meta = r.meta();
            return e;
        }
        case EventType::TextMessageContent: {
            TextMessageContentEvent e;
            e.message_id = r.required_string("messageId");
            e.delta = r.required_string("delta");
            e.meta = r.meta();
            return e;
        }
        case EventType::TextMessageEnd:
            return TextMessageEndEvent{r.required_string("messageId"), r.meta()};
        case EventType::TextMessageChunk: {
            TextMessageChunkEvent e;
            e.message_id = r.optional_string("messageId");
            e.role = r.optional_role("role");
            e.delta = r.optional_string("delta");
            e.meta = r.meta();
            return e;
        }
        case EventType::ToolCallStart: {
            ToolCallStartEvent e;
            e.tool_call_id = r.required_string("toolCallId");
            e.tool_call_name = r.required_string("toolCallName");
            e.parent_message_id = r.optional_string("parentMessageId");
            e.meta = r.meta();
            return e;
        }
        case EventType::ToolCallArgs: {
            ToolCallArgsEvent e;
            e.tool_call_id = r.required_string("toolCallId");
            e.delta = r.required_string("delta");
            e.meta = r.meta();
            return e;
        }
        case EventType::ToolCallEnd:
            return ToolCallEndEvent{r.required_string("toolCallId"), r.meta()};
        case EventType::ToolCallResult: {
            ToolCallResultEvent e;
            e.message_id = r.required_string("messageId");
            e.tool_call_id = r.required_string("toolCallId");
            e.content = r.required_string("content");
            e.role = r.optional_role("role");
            e.meta = r.meta();
            return e;
        }
        case EventType::ToolCallChunk: {
            ToolCallChunkEvent e;
            e.tool_call_id = r.optional_string("toolCallId");
            e.tool_call_name = r.optional_string("toolCallName");
            e.parent_message_id = r.optional_string("parentMessageId");
            e.delta = r.optional_string("delta");
            e.meta = r.meta();
            return e;
        }
        case EventType::StateSnapshot:
            return StateSnapshotEvent{r.required_value("snapshot"), r.meta()};
        case EventType::StateDelta:
            return StateDeltaEvent{r.patch("delta"), r.meta()};
        case EventType::MessagesSnapshot:
            return MessagesSnapshotEvent{r.messages("messages"), r.meta()};
        case EventType::ActivitySnapshot: {
            ActivitySnapshotEvent e;
            e.message_id = r.required_string("messageId");
            e.activity_type = r.required_string("activityType");
            e.content = r.required_value("content");
            e.replace = r.optional_bool("replace");
            e.meta = r.meta();
            return e;
        }
        case EventType::ActivityDelta: {
            ActivityDeltaEvent e;
            e.message_id = r.required_string("messageId");
            e.activity_type = r.required_string("activityType");
            e.patch = r.patch("patch");
            e.meta = r.meta();
            return e;
        }
        case EventType::ThinkingStart:
            return ThinkingStartEvent{r.optional_string("title"), r.meta()};
        case EventType::ThinkingEnd:
            return ThinkingEndEvent{r.meta()};
        case EventType::ThinkingTextMessageStart:
            return ThinkingTextMessageStartEvent{r.meta()};
        case EventType::ThinkingTextMessageContent:
            return ThinkingTextMessageContentEvent{r.required_string("delta"), r.meta()};
        case EventType::ThinkingTextMessageEnd:
            return ThinkingTextMessageEndEvent{r.meta()};
        case EventType::Raw: {
            RawEvent e;
            e.event = r.required_value("event");
            e.source = r.optional_string("source");
            e.meta = r.meta();
            return e;
        }
        case EventType::Custom: {
            CustomEvent e;
            e.name = r.required_string("name");
            e.value = r.required_value("value");
            e.meta = r.meta();
            return e;
        }
    }
    return RawEvent{};
}

// One overload per alternative; a new Event type without one fails to compile.
struct WireEncoder {
    json& out;

    void put(const char* key, const std::optional<std::string>& value) {
        if (value.has_value()) {
            out[key] = value.value();
        }
    }

    void operator()(const RunStartedEvent& e) {
        out["threadId"] = e.thread_id;
        out["runId"] = e.run_id;
        put("parentRunId", e.parent_run_id);
    }
    void operator()(const RunFinishedEvent& e) {
        out["threadId"] = e.thread_id;
        out["runId"] = e.run_id;
        if (e.result.has_value()) {
            out["result"] = e.result.value();
        }
    }
    void operator()(const RunErrorEvent& e) {
        out["message"] = e.message;
        put("code", e.code);
    }
    void operator()(const StepStartedEvent& e) { out["stepName"] = e.step_name; }
    void operator()(const StepFinishedEvent& e) { out["stepName"] = e.step_name; }
    void operator()(const TextMessageStartEvent& e) {
        out["messageId"] = e.message_id;
        out["role"] = to_string(e.role);
    }
    void operator()(const TextMessageContentEvent& e) {
        out["messageId"] = e.message_id;
        out["delta"] = e.delta;
    }
    void operator()(const TextMessageEndEvent& e) { out["messageId"] = e.message_id; }
    void operator()(const TextMessageChunkEvent& e) {
        put("messageId", e.message_id);
        if (e.role.has_value()) {
            out["role"] = to_string(e.role.value());
        }
        put("delta", e.delta);
    }
    void operator()(const ToolCallStartEvent& e) {
        out["toolCallId"] = e.tool_call_id;
        out["toolCallName"] = e.tool_call_name;
        put("parentMessageId", e.parent_message_id);
    }
    void operator()(const ToolCallArgsEvent& e) {
        out["toolCallId"] = e.tool_call_id;
        out["delta"] = e.delta;
    }
    void operator()(const ToolCallEndEvent& e) { out["toolCallId"] = e.tool_call_id; }
    void operator()(const ToolCallResultEvent& e) {
        out["messageId"] = e.message_id;
        out["toolCallId"] = e.tool_call_id;
        out["content"] = e.content;
        if (e.role.has_value()) {
            out["role"] = to_string(e.role.value());
        }
    }
    void operator()(const ToolCallChunkEvent& e) {
        put("toolCallId", e.tool_call_id);
        put("toolCallName", e.tool_call_name);
        put("parentMessageId", e.parent_message_id);
        put("delta", e.delta);
    }
    void operator()(const StateSnapshotEvent& e) { out["snapshot"] = e.snapshot; }
    void operator()(const StateDeltaEvent& e) { out["delta"] = encode_patch(e.delta); }
    void operator()(const MessagesSnapshotEvent& e) {
        out["messages"] = encode_messages(e.messages);
    }
    void operator()(const ActivitySnapshotEvent& e) {
        out["messageId"] = e.message_id;
        out["activityType"] = e.activity_type;
        out["content"] = e.content;
        if (e.replace.has_value()) {
            out["replace"] = e.replace.value();
        }
    }
    void operator()(const ActivityDeltaEvent& e) {
        out["messageId"] = e.message_id;
        out["activityType"] = e.activity_type;
        out["patch"] = encode_patch(e.patch);
    }
    void operator()(const ThinkingStartEvent& e) { put("title", e.title); }
    void operator()(const ThinkingEndEvent&) {}
    void operator()(const ThinkingTextMessageStartEvent&) {}
    void operator()(const ThinkingTextMessageContentEvent& e) { out["delta"] = e.delta; }
    void operator()(const ThinkingTextMessageEndEvent&) {}
    void operator()(const RawEvent& e) {
        out["event"] = e.event;
        put("source", e.source);
    }
    void operator()(const CustomEvent& e) {
        out["name"] = e.name;
        out["value"] = e.value;
    }
};

}  // namespace

json encode(const Event& event) {
    json wire = json::object();
    wire["type"] = to_string(type_of(event));
    std::visit(WireEncoder{wire}, event);

    const EventMeta& meta = meta_of(event);
    if (meta.timestamp.has_value()) {
        wire["timestamp"] = meta.timestamp.value();
    }
    if (meta.raw_event.has_value()) {
        wire["rawEvent"] = meta.raw_event.value();
    }
    return wire;
}

core::errors::Result<Event> decode(const json& wire) {
    if (!wire.is_object()) {
        return ProtocolError{ErrorCategory::Decode,
                             "Event must be a JSON object", kInvalidField};
    }

    const auto type_it = wire.find("type");
    if (type_it == wire.end() || type_it->is_null()) {
        return ProtocolError{ErrorCategory::Decode, "Event has no 'type' field",
                             kMissingType};
    }
    if (!type_it->is_string()) {
        return ProtocolError{ErrorCategory::Decode,
                             "Event 'type' must be a string", kInvalidField};
    }

    const std::string type_name = type_it->get<std::string>();
    const auto type = event_type_from_string(type_name);
    if (!type.has_value()) {
        return ProtocolError{ErrorCategory::Decode,
                             "Unknown event type: " + type_name,
                             kUnknownEventType,
                             "Event types are SCREAMING_SNAKE_CASE, e.g. RUN_STARTED."};
    }

    FieldReader reader(wire, type_name);
    Event event = decode_body(type.value(), reader);
    if (reader.error().has_value()) {
        return reader.error().value();
    }
    return event;
}

core::errors::Result<Event> decode_text(const std::string& text) {
    json wire = json::parse(text, nullptr, false);
    if (wire.is_discarded()) {
        return ProtocolError{ErrorCategory::Decode,
                             "Event payload is not valid JSON", kMalformedJson};
    }
    return decode(wire);
}

}  // namespace agui::protocol
