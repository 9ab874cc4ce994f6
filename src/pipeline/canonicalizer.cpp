#include "pipeline/canonicalizer.hpp"

#include <algorithm>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace agui::pipeline {

using protocol::Event;
using protocol::EventStream;
using protocol::EventType;
using protocol::Role;
using protocol::TextMessageChunkEvent;
using protocol::TextMessageContentEvent;
using protocol::TextMessageEndEvent;
using protocol::TextMessageStartEvent;
using protocol::ToolCallArgsEvent;
using protocol::ToolCallChunkEvent;
using protocol::ToolCallEndEvent;
using protocol::ToolCallStartEvent;

EventStream Canonicalizer::process(const Event& event) {
    EventStream out;
    switch (protocol::type_of(event)) {
        case EventType::TextMessageChunk:
            on_text_chunk(std::get<TextMessageChunkEvent>(event), out);
            return out;
        case EventType::ToolCallChunk:
            on_tool_chunk(std::get<ToolCallChunkEvent>(event), out);
            return out;

        // Passthrough: never closes anything.
        case EventType::Raw:
        case EventType::ActivitySnapshot:
        case EventType::ActivityDelta:
            out.push_back(event);
            return out;

        // Explicit events addressed to a chunk-opened stream continue or close
        // that stream instead of having it closed underneath them.
        case EventType::TextMessageContent:
            if (is_open_text(std::get<TextMessageContentEvent>(event).message_id)) {
                out.push_back(event);
                return out;
            }
            break;
        case EventType::ToolCallArgs:
            if (is_open_tool(std::get<ToolCallArgsEvent>(event).tool_call_id)) {
                out.push_back(event);
                return out;
            }
            break;
        case EventType::TextMessageEnd: {
            const auto& id = std::get<TextMessageEndEvent>(event).message_id;
            forget(open_texts_, id);
            if (current_text_ == id) {
                current_text_.reset();
            }
            break;
        }
        case EventType::ToolCallEnd: {
            const auto& id = std::get<ToolCallEndEvent>(event).tool_call_id;
            forget(open_tools_, id);
            if (current_tool_ == id) {
                current_tool_.reset();
            }
            break;
        }
        default:
            break;
    }

    close_all(out);
    out.push_back(event);
    return out;
}

EventStream Canonicalizer::finalize() {
    EventStream out;
    close_all(out);
    return out;
}

bool Canonicalizer::has_pending() const {
    return !open_texts_.empty() || !open_tools_.empty();
}

void Canonicalizer::on_text_chunk(const TextMessageChunkEvent& chunk,
                                  EventStream& out) {
    std::string message_id;
    if (chunk.message_id.has_value()) {
        message_id = chunk.message_id.value();
    } else if (current_text_.has_value()) {
        message_id = current_text_.value();
    } else {
        message_id = core::config::generate_message_id();
        AGUI_LOG_DEBUG("Canonicalizer: TEXT_MESSAGE_CHUNK without messageId, using " +
                       message_id);
    }

    if (current_tool_.has_value()) {
        close_tool(current_tool_.value(), out);
    }
    if (current_text_.has_value() && current_text_.value() != message_id) {
        close_text(current_text_.value(), out);
    }

    if (!is_open_text(message_id)) {
        out.push_back(TextMessageStartEvent{
            message_id, chunk.role.value_or(Role::Assistant), chunk.meta});
        open_texts_.push_back(message_id);
    }
    current_text_ = message_id;

    if (chunk.delta.has_value() && !chunk.delta->empty()) {
        out.push_back(TextMessageContentEvent{message_id, chunk.delta.value(), chunk.meta});
    }
}

void Canonicalizer::on_tool_chunk(const ToolCallChunkEvent& chunk,
                                  EventStream& out) {
    const std::optional<std::string> tool_call_id =
        chunk.tool_call_id.has_value() ? chunk.tool_call_id : current_tool_;
    if (!tool_call_id.has_value()) {
        AGUI_LOG_WARN("Canonicalizer: dropping TOOL_CALL_CHUNK with no toolCallId "
                      "and no tool call in progress");
        return;
    }

    const bool opening = !is_open_tool(tool_call_id.value());
    if (opening && !chunk.tool_call_name.has_value()) {
        AGUI_LOG_WARN("Canonicalizer: dropping first TOOL_CALL_CHUNK for " +
                      tool_call_id.value() + " because it has no toolCallName");
        return;
    }

    if (current_text_.has_value()) {
        close_text(current_text_.value(), out);
    }
    if (current_tool_.has_value() && current_tool_.value() != tool_call_id.value()) {
        close_tool(current_tool_.value(), out);
    }

    if (opening) {
        out.push_back(ToolCallStartEvent{tool_call_id.value(),
                                         chunk.tool_call_name.value(),
                                         chunk.parent_message_id, chunk.meta});
        open_tools_.push_back(tool_call_id.value());
    }
    current_tool_ = tool_call_id;

    if (chunk.delta.has_value() && !chunk.delta->empty()) {
        out.push_back(ToolCallArgsEvent{tool_call_id.value(), chunk.delta.value(),
                                        chunk.meta});
    }
}

void Canonicalizer::close_text(const std::string& message_id, EventStream& out) {
    const std::string id = message_id;
    AGUI_LOG_DEBUG("Canonicalizer: synthesizing TEXT_MESSAGE_END for " + id);
    out.push_back(TextMessageEndEvent{id});
    forget(open_texts_, id);
    if (current_text_ == id) {
        current_text_.reset();
    }
}

void Canonicalizer::close_tool(const std::string& tool_call_id, EventStream& out) {
    const std::string id = tool_call_id;
    AGUI_LOG_DEBUG("Canonicalizer: synthesizing TOOL_CALL_END for " + id);
    out.push_back(ToolCallEndEvent{id});
    forget(open_tools_, id);
    if (current_tool_ == id) {
        current_tool_.reset();
    }
}

void Canonicalizer::close_all(EventStream& out) {
    for (const auto& id : open_texts_) {
        AGUI_LOG_DEBUG("Canonicalizer: synthesizing TEXT_MESSAGE_END for " + id);
        out.push_back(TextMessageEndEvent{id});
    }
    for (const auto& id : open_tools_) {
        AGUI_LOG_DEBUG("Canonicalizer: synthesizing TOOL_CALL_END for " + id);
        out.push_back(ToolCallEndEvent{id});
    }
    open_texts_.clear();
    open_tools_.clear();
    current_text_.reset();
    current_tool_.reset();
}

bool Canonicalizer::is_open_text(const std::string& message_id) const {
    return std::find(open_texts_.begin(), open_texts_.end(), message_id) !=
           open_texts_.end();
}

bool Canonicalizer::is_open_tool(const std::string& tool_call_id) const {
    return std::find(open_tools_.begin(), open_tools_.end(), tool_call_id) !=
           open_tools_.end();
}

void Canonicalizer::forget(std::vector<std::string>& ids, const std::string& id) {
    ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
}

EventStream canonicalize(const EventStream& events) {
    Canonicalizer canonicalizer;
    EventStream out;
    out.reserve(events.size());
    for (const auto& event : events) {
        auto expanded = canonicalizer.process(event);
        out.insert(out.end(), expanded.begin(), expanded.end());
    }
    auto closing = canonicalizer.finalize();
    out.insert(out.end(), closing.begin(), closing.end());
    return out;
}

}  // namespace agui::pipeline
