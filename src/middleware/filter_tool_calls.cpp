#include "middleware/filter_tool_calls.hpp"

#include <optional>
#include <unordered_set>
#include <utility>
#include "core/logging/logger.hpp"

namespace agui::middleware {

using core::errors::ErrorCategory;
using core::errors::ProtocolError;

core::errors::Result<std::shared_ptr<FilterToolCallsMiddleware>> FilterToolCallsMiddleware::create(
    ToolCallFilter filter) {
    const bool has_allow = filter.allowed_tools.has_value();
    const bool has_block = filter.disallowed_tools.has_value();
    if (has_allow && has_block) {
        return ProtocolError{ErrorCategory::Input,
                             "allowed_tools and disallowed_tools cannot both be set",
                             "invalid_filter",
                             "Pick either an allow list or a block list."};
    }
    if (!has_allow && !has_block) {
        return ProtocolError{ErrorCategory::Input,
                             "one of allowed_tools or disallowed_tools is required",
                             "invalid_filter"};
    }
    return std::make_shared<FilterToolCallsMiddleware>(Validated{}, std::move(filter));
}

FilterToolCallsMiddleware::FilterToolCallsMiddleware(Validated, ToolCallFilter filter)
    : filter_(std::move(filter)) {}

bool FilterToolCallsMiddleware::is_blocked(const std::string& tool_name) const {
    if (filter_.allowed_tools.has_value()) {
        return filter_.allowed_tools->count(tool_name) == 0;
    }
    return filter_.disallowed_tools.has_value() && filter_.disallowed_tools->count(tool_name) > 0;
}

protocol::EventStream FilterToolCallsMiddleware::run(const protocol::RunAgentInput& input,
                                                     const EventProducer& next) {
    return filter(next(input));
}

protocol::EventStream FilterToolCallsMiddleware::filter(const protocol::EventStream& events) const {
    std::unordered_set<std::string> blocked_ids;
    // Chunks may omit the id and continue the previous chunked call.
    std::optional<std::string> chunk_id;
    protocol::EventStream out;
    out.reserve(events.size());

    for (const auto& event : events) {
        bool drop = false;
        if (const auto* start = std::get_if<protocol::ToolCallStartEvent>(&event)) {
            if (is_blocked(start->tool_call_name)) {
                blocked_ids.insert(start->tool_call_id);
                drop = true;
            }
        } else if (const auto* args = std::get_if<protocol::ToolCallArgsEvent>(&event)) {
            drop = blocked_ids.count(args->tool_call_id) > 0;
        } else if (const auto* end = std::get_if<protocol::ToolCallEndEvent>(&event)) {
            drop = blocked_ids.count(end->tool_call_id) > 0;
        } else if (const auto* result = std::get_if<protocol::ToolCallResultEvent>(&event)) {
            drop = blocked_ids.count(result->tool_call_id) > 0;
        } else if (const auto* chunk = std::get_if<protocol::ToolCallChunkEvent>(&event)) {
            if (chunk->tool_call_id.has_value()) {
                chunk_id = chunk->tool_call_id;
            }
            if (chunk_id.has_value()) {
                if (chunk->tool_call_name.has_value() && is_blocked(chunk->tool_call_name.value())) {
                    blocked_ids.insert(chunk_id.value());
                }
                drop = blocked_ids.count(chunk_id.value()) > 0;
            }
        }

        if (drop) {
            AGUI_LOG_DEBUG("FilterToolCalls: dropped " +
                           protocol::to_string(protocol::type_of(event)));
            continue;
        }
        out.push_back(event);
    }
    return out;
}

}  // namespace agui::middleware
