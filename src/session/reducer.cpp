#include "session/reducer.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/json_patch.hpp"

namespace agui::session {

using protocol::Message;
using protocol::Role;

namespace {

Message* find_message(std::vector<Message>& messages, const std::string& id) {
    auto it = std::find_if(messages.begin(), messages.end(),
                           [&id](const Message& m) { return m.id == id; });
    return it == messages.end() ? nullptr : &*it;
}

struct EventReducer {
    Session& s;

    void operator()(const protocol::RunStartedEvent& e) {
        // A new run keeps the conversation (messages, state) but nothing in flight.
        s.thread_id = e.thread_id;
        s.run_id = e.run_id;
        s.status = RunStatus::Running;
        s.error_message.reset();
        s.error_code.reset();
        s.result.reset();
        s.steps.clear();
        s.text_buffers.clear();
        s.tool_buffers.clear();
        s.thinking = ThinkingState{};
    }

    void operator()(const protocol::RunFinishedEvent& e) {
        s.status = RunStatus::Finished;
        s.result = e.result;
    }

    void operator()(const protocol::RunErrorEvent& e) {
        if (!s.text_buffers.empty() || !s.tool_buffers.empty()) {
            AGUI_LOG_DEBUG("Reducer: RUN_ERROR discards " +
                           std::to_string(s.text_buffers.size()) + " text and " +
                           std::to_string(s.tool_buffers.size()) +
                           " tool buffers");
        }
        s.status = RunStatus::Errored;
        s.error_message = e.message;
        s.error_code = e.code;
        s.text_buffers.clear();
        s.tool_buffers.clear();
        s.thinking.active = false;
        s.thinking.message_active = false;
    }

    void operator()(const protocol::StepStartedEvent& e) {
        s.steps.push_back(Step{e.step_name, StepStatus::Active});
    }

    void operator()(const protocol::StepFinishedEvent& e) {
        auto it = std::find_if(s.steps.rbegin(), s.steps.rend(), [&e](const Step& step) {
            return step.name == e.step_name && step.status == StepStatus::Active;
        });
        if (it == s.steps.rend()) {
            AGUI_LOG_DEBUG("Reducer: ignoring STEP_FINISHED for unknown step " + e.step_name);
            return;
        }
        it->status = StepStatus::Finished;
    }

    void operator()(const protocol::TextMessageStartEvent& e) {
        if (!s.text_buffers.emplace(e.message_id, TextBuffer{e.role, ""}).second) {
            AGUI_LOG_DEBUG("Reducer: text message " + e.message_id + " already open");
        }
    }

    void operator()(const protocol::TextMessageContentEvent& e) {
        auto it = s.text_buffers.find(e.message_id);
        if (it == s.text_buffers.end()) {
            AGUI_LOG_DEBUG("Reducer: ignoring content for unopened text message " +
                           e.message_id);
            return;
        }
        it->second.content += e.delta;
    }

    void operator()(const protocol::TextMessageEndEvent& e) {
        auto it = s.text_buffers.find(e.message_id);
        if (it == s.text_buffers.end()) {
            AGUI_LOG_DEBUG("Reducer: ignoring end for unopened text message " + e.message_id);
            return;
        }

        // A tool call may already have created this message as its parent.
        if (Message* existing = find_message(s.messages, e.message_id)) {
            existing->content = it->second.content;
        } else {
            Message message;
            message.id = e.message_id;
            message.role = it->second.role;
            message.content = it->second.content;
            s.messages.push_back(std::move(message));
        }
        ++s.messages_revision;
        s.text_buffers.erase(it);
    }

    void operator()(const protocol::TextMessageChunkEvent&) {
        AGUI_LOG_DEBUG("Reducer: ignoring TEXT_MESSAGE_CHUNK; canonicalize the stream first");
    }

    void operator()(const protocol::ToolCallStartEvent& e) {
        ToolBuffer buffer{e.tool_call_name, "", e.parent_message_id};
        if (!s.tool_buffers.emplace(e.tool_call_id, std::move(buffer)).second) {
            AGUI_LOG_DEBUG("Reducer: tool call " + e.tool_call_id + " already open");
        }
    }

    void operator()(const protocol::ToolCallArgsEvent& e) {
        auto it = s.tool_buffers.find(e.tool_call_id);
        if (it == s.tool_buffers.end()) {
            AGUI_LOG_DEBUG("Reducer: ignoring args for unopened tool call " + e.tool_call_id);
            return;
        }
        it->second.args += e.delta;
    }

    void operator()(const protocol::ToolCallEndEvent& e) {
        auto it = s.tool_buffers.find(e.tool_call_id);
        if (it == s.tool_buffers.end()) {
            AGUI_LOG_DEBUG("Reducer: ignoring end for unopened tool call " + e.tool_call_id);
            return;
        }

        protocol::ToolCall call{e.tool_call_id, it->second.name, it->second.args};
        const std::string owner_id = it->second.parent_message_id.value_or(e.tool_call_id);
        if (Message* owner = find_message(s.messages, owner_id)) {
            owner->tool_calls.push_back(std::move(call));
        } else {
            Message message;
            message.id = owner_id;
            message.role = Role::Assistant;
            message.tool_calls.push_back(std::move(call));
            s.messages.push_back(std::move(message));
        }
        ++s.messages_revision;
        s.tool_buffers.erase(it);
    }

    void operator()(const protocol::ToolCallResultEvent& e) {
        Message message;
        message.id = e.message_id;
        message.role = Role::Tool;
        message.content = e.content;
        message.tool_call_id = e.tool_call_id;
        s.messages.push_back(std::move(message));
        ++s.messages_revision;
    }

    void operator()(const protocol::ToolCallChunkEvent&) {
        AGUI_LOG_DEBUG("Reducer: ignoring TOOL_CALL_CHUNK; canonicalize the stream first");
    }

    void operator()(const protocol::StateSnapshotEvent& e) {
        s.state = e.snapshot;
        ++s.state_revision;
    }

    void operator()(const protocol::StateDeltaEvent& e) {
        protocol::PatchReport report;
        s.state = protocol::apply_patch(s.state, e.delta, &report);
        if (report.applied > 0) {
            ++s.state_revision;
        }
    }

    void operator()(const protocol::MessagesSnapshotEvent& e) {
        s.messages = e.messages;
        ++s.messages_revision;
    }

    void operator()(const protocol::ActivitySnapshotEvent& e) {
        Message* existing = find_message(s.messages, e.message_id);
        if (existing != nullptr && !e.replace.value_or(true)) {
            return;
        }
        if (existing == nullptr) {
            s.messages.push_back(Message{});
            existing = &s.messages.back();
            existing->id = e.message_id;
        }
        existing->role = Role::Activity;
        existing->activity_type = e.activity_type;
        existing->activity_content = e.content;
        ++s.messages_revision;
    }

    void operator()(const protocol::ActivityDeltaEvent& e) {
        Message* existing = find_message(s.messages, e.message_id);
        if (existing == nullptr || existing->role != Role::Activity) {
            AGUI_LOG_DEBUG("Reducer: ignoring ACTIVITY_DELTA for unknown activity " +
                           e.message_id);
            return;
        }
        existing->activity_type = e.activity_type;
        protocol::PatchReport report;
        existing->activity_content =
            protocol::apply_patch(existing->activity_content, e.patch, &report);
        if (report.applied > 0) {
            ++s.messages_revision;
        }
    }

    void operator()(const protocol::ThinkingStartEvent& e) {
        s.thinking = ThinkingState{};
        s.thinking.active = true;
        s.thinking.title = e.title;
    }

    void operator()(const protocol::ThinkingEndEvent&) {
        s.thinking.active = false;
        s.thinking.message_active = false;
    }

    void operator()(const protocol::ThinkingTextMessageStartEvent&) {
        s.thinking.active = true;
        s.thinking.message_active = true;
    }

    void operator()(const protocol::ThinkingTextMessageContentEvent& e) {
        s.thinking.content += e.delta;
    }

    void operator()(const protocol::ThinkingTextMessageEndEvent&) {
        s.thinking.message_active = false;
    }

    void operator()(const protocol::RawEvent&) {}
    void operator()(const protocol::CustomEvent&) {}
};

}  // namespace

Session apply(Session session, const protocol::Event& event) {
    std::visit(EventReducer{session}, event);
    return session;
}

Session apply_all(Session session, const protocol::EventStream& events) {
    for (const auto& event : events) {
        session = apply(std::move(session), event);
    }
    return session;
}

}  // namespace agui::session
