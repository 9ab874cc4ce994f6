#include "session/session.hpp"

#include <utility>

namespace agui::session {

using nlohmann::json;

Session make_session(const protocol::RunAgentInput& input) {
    Session session;
    session.thread_id = input.thread_id;
    session.run_id = input.run_id;
    session.messages = input.messages;
    session.state = input.state;
    return session;
}

std::string to_string(const RunStatus status) {
    switch (status) {
        case RunStatus::Idle:
            return "idle";
        case RunStatus::Running:
            return "running";
        case RunStatus::Finished:
            return "finished";
        case RunStatus::Errored:
            return "errored";
        default:
            return "unknown";
    }
}

std::string to_string(const StepStatus status) {
    switch (status) {
        case StepStatus::Active:
            return "active";
        case StepStatus::Finished:
            return "finished";
        default:
            return "unknown";
    }
}

json to_json(const Session& session) {
    json out;
    out["threadId"] = session.thread_id;
    out["runId"] = session.run_id;
    out["status"] = to_string(session.status);
    if (session.error_message.has_value()) {
        out["error"] = {{"message", session.error_message.value()}};
        if (session.error_code.has_value()) {
            out["error"]["code"] = session.error_code.value();
        }
    }
    if (session.result.has_value()) {
        out["result"] = session.result.value();
    }
    out["messages"] = protocol::encode_messages(session.messages);
    out["state"] = session.state;

    json steps = json::array();
    for (const auto& step : session.steps) {
        steps.push_back({{"name", step.name}, {"status", to_string(step.status)}});
    }
    out["steps"] = std::move(steps);

    json text_buffers = json::object();
    for (const auto& entry : session.text_buffers) {
        text_buffers[entry.first] = {{"role", protocol::to_string(entry.second.role)},
                                     {"content", entry.second.content}};
    }
    out["textBuffers"] = std::move(text_buffers);

    json tool_buffers = json::object();
    for (const auto& entry : session.tool_buffers) {
        json buffer = {{"name", entry.second.name}, {"args", entry.second.args}};
        if (entry.second.parent_message_id.has_value()) {
            buffer["parentMessageId"] = entry.second.parent_message_id.value();
        }
        tool_buffers[entry.first] = std::move(buffer);
    }
    out["toolBuffers"] = std::move(tool_buffers);

    out["thinking"] = {{"active", session.thinking.active},
                       {"content", session.thinking.content}};
    if (session.thinking.title.has_value()) {
        out["thinking"]["title"] = session.thinking.title.value();
    }
    return out;
}

}  // namespace agui::session
