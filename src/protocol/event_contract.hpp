#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "json_patch.hpp"
#include "message_contract.hpp"

namespace agui::protocol {

    // Wire discriminators, in the same order as the Event variant below.
    enum class EventType {
        RunStarted,
        RunFinished,
        RunError,
        StepStarted,
        StepFinished,
        TextMessageStart,
        TextMessageContent,
        TextMessageEnd,
        TextMessageChunk,
        ToolCallStart,
        ToolCallArgs,
        ToolCallEnd,
        ToolCallResult,
        ToolCallChunk,
        StateSnapshot,
        StateDelta,
        MessagesSnapshot,
        ActivitySnapshot,
        ActivityDelta,
        ThinkingStart,
        ThinkingEnd,
        ThinkingTextMessageStart,
        ThinkingTextMessageContent,
        ThinkingTextMessageEnd,
        Raw,
        Custom
    };

    inline constexpr std::pair<EventType, std::string_view> kEventTypeNames[] = {
        {EventType::RunStarted, "RUN_STARTED"},
        {EventType::RunFinished, "RUN_FINISHED"},
        {EventType::RunError, "RUN_ERROR"},
        {EventType::StepStarted, "STEP_STARTED"},
        {EventType::StepFinished, "STEP_FINISHED"},
        {EventType::TextMessageStart, "TEXT_MESSAGE_START"},
        {EventType::TextMessageContent, "TEXT_MESSAGE_CONTENT"},
        {EventType::TextMessageEnd, "TEXT_MESSAGE_END"},
        {EventType::TextMessageChunk, "TEXT_MESSAGE_CHUNK"},
        {EventType::ToolCallStart, "TOOL_CALL_START"},
        {EventType::ToolCallArgs, "TOOL_CALL_ARGS"},
        {EventType::ToolCallEnd, "TOOL_CALL_END"},
        {EventType::ToolCallResult, "TOOL_CALL_RESULT"},
        {EventType::ToolCallChunk, "TOOL_CALL_CHUNK"},
        {EventType::StateSnapshot, "STATE_SNAPSHOT"},
        {EventType::StateDelta, "STATE_DELTA"},
        {EventType::MessagesSnapshot, "MESSAGES_SNAPSHOT"},
        {EventType::ActivitySnapshot, "ACTIVITY_SNAPSHOT"},
        {EventType::ActivityDelta, "ACTIVITY_DELTA"},
        {EventType::ThinkingStart, "THINKING_START"},
        {EventType::ThinkingEnd, "THINKING_END"},
        {EventType::ThinkingTextMessageStart, "THINKING_TEXT_MESSAGE_START"},
        {EventType::ThinkingTextMessageContent, "THINKING_TEXT_MESSAGE_CONTENT"},
        {EventType::ThinkingTextMessageEnd, "THINKING_TEXT_MESSAGE_END"},
        {EventType::Raw, "RAW"},
        {EventType::Custom, "CUSTOM"},
    };

    // Fields every event may carry. rawEvent is passed through untouched.
    struct EventMeta {
        std::optional<std::int64_t> timestamp;
        std::optional<nlohmann::json> raw_event;
    };

    // --- Lifecycle ---
    struct RunStartedEvent {
        std::string thread_id;
        std::string run_id;
        std::optional<std::string> parent_run_id;
        EventMeta meta;
    };
    struct RunFinishedEvent {
        std::string thread_id;
        std::string run_id;
        std::optional<nlohmann::json> result;
        EventMeta meta;
    };
    struct RunErrorEvent {
        std::string message;
        std::optional<std::string> code;
        EventMeta meta;
    };
    struct StepStartedEvent { std::string step_name; EventMeta meta; };
    struct StepFinishedEvent { std::string step_name; EventMeta meta; };

    // --- Text messages ---
    struct TextMessageStartEvent {
        std::string message_id;
        Role role = Role::Assistant;
        EventMeta meta;
    };
    struct TextMessageContentEvent {
        std::string message_id;
        std::string delta;
        EventMeta meta;
    };
    struct TextMessageEndEvent { std::string message_id; EventMeta meta; };

    // Convenience form: expanded into Start/Content/End by the canonicalizer.
    struct TextMessageChunkEvent {
        std::optional<std::string> message_id;
        std::optional<Role> role;
        std::optional<std::string> delta;
        EventMeta meta;
    };

    // --- Tool calls ---
    struct ToolCallStartEvent {
        std::string tool_call_id;
        std::string tool_call_name;
        std::optional<std::string> parent_message_id;
        EventMeta meta;
    };
    struct ToolCallArgsEvent {
        std::string tool_call_id;
        std::string delta;
        EventMeta meta;
    };
    struct ToolCallEndEvent { std::string tool_call_id; EventMeta meta; };
    struct ToolCallResultEvent {
        std::string message_id;
        std::string tool_call_id;
        std::string content;
        std::optional<Role> role;
        EventMeta meta;
    };
    struct ToolCallChunkEvent {
        std::optional<std::string> tool_call_id;
        std::optional<std::string> tool_call_name;
        std::optional<std::string> parent_message_id;
        std::optional<std::string> delta;
        EventMeta meta;
    };

    // --- State ---
    struct StateSnapshotEvent { nlohmann::json snapshot; EventMeta meta; };
    struct StateDeltaEvent { JsonPatch delta; EventMeta meta; };
    struct MessagesSnapshotEvent { std::vector<Message> messages; EventMeta meta; };
    struct ActivitySnapshotEvent {
        std::string message_id;
        std::string activity_type;
        nlohmann::json content;
        std::optional<bool> replace;
        EventMeta meta;
    };
    struct ActivityDeltaEvent {
        std::string message_id;
        std::string activity_type;
        JsonPatch patch;
        EventMeta meta;
    };

    // --- Thinking ---
    struct ThinkingStartEvent { std::optional<std::string> title; EventMeta meta; };
    struct ThinkingEndEvent { EventMeta meta; };
    struct ThinkingTextMessageStartEvent { EventMeta meta; };
    struct ThinkingTextMessageContentEvent { std::string delta; EventMeta meta; };
    struct ThinkingTextMessageEndEvent { EventMeta meta; };

    // --- Special ---
    struct RawEvent {
        nlohmann::json event;
        std::optional<std::string> source;
        EventMeta meta;
    };
    struct CustomEvent {
        std::string name;
        nlohmann::json value;
        EventMeta meta;
    };

    using Event = std::variant<
        RunStartedEvent,
        RunFinishedEvent,
        RunErrorEvent,
        StepStartedEvent,
        StepFinishedEvent,
        TextMessageStartEvent,
        TextMessageContentEvent,
        TextMessageEndEvent,
        TextMessageChunkEvent,
        ToolCallStartEvent,
        ToolCallArgsEvent,
        ToolCallEndEvent,
        ToolCallResultEvent,
        ToolCallChunkEvent,
        StateSnapshotEvent,
        StateDeltaEvent,
        MessagesSnapshotEvent,
        ActivitySnapshotEvent,
        ActivityDeltaEvent,
        ThinkingStartEvent,
        ThinkingEndEvent,
        ThinkingTextMessageStartEvent,
        ThinkingTextMessageContentEvent,
        ThinkingTextMessageEndEvent,
        RawEvent,
        CustomEvent
    >;

    using EventStream = std::vector<Event>;

    static_assert(std::variant_size_v<Event> ==
                      sizeof(kEventTypeNames) / sizeof(kEventTypeNames[0]),
                  "every Event alternative needs a wire name");

    constexpr bool event_names_follow_variant_order() {
        for (std::size_t i = 0; i < std::variant_size_v<Event>; ++i) {
            if (static_cast<std::size_t>(kEventTypeNames[i].first) != i) {
                return false;
            }
        }
        return true;
    }
    static_assert(event_names_follow_variant_order(),
                  "kEventTypeNames must list types in EventType order");
    static_assert(std::is_same_v<std::variant_alternative_t<
                      static_cast<std::size_t>(EventType::Custom), Event>, CustomEvent>,
                  "EventType and Event alternatives are out of step");

    inline EventType type_of(const Event& event) {
        return static_cast<EventType>(event.index());
    }

    inline const EventMeta& meta_of(const Event& event) {
        return std::visit([](const auto& e) -> const EventMeta& { return e.meta; }, event);
    }

    inline std::string to_string(const EventType type) {
        for (const auto& entry : kEventTypeNames) {
            if (entry.first == type) {
                return std::string(entry.second);
            }
        }
        return "UNKNOWN";
    }

    inline std::optional<EventType> event_type_from_string(std::string_view name) {
        for (const auto& entry : kEventTypeNames) {
            if (entry.second == name) {
                return entry.first;
            }
        }
        return std::nullopt;
    }

} // namespace agui::protocol
