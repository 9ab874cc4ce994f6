#include "verify/event_verifier.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace agui::verify {

using core::errors::ErrorCategory;
using core::errors::ProtocolError;
using protocol::Event;
using protocol::EventType;

namespace {

ProtocolError violation(const VerifyErrorKind kind, const std::string& message) {
    return ProtocolError{ErrorCategory::Verify, message, to_string(kind)};
}

std::string join(const std::set<std::string>& ids) {
    std::string joined;
    for (const auto& id : ids) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += "'" + id + "'";
    }
    return joined;
}

}  // namespace

EventVerifier::EventVerifier(const bool debug) : debug_(debug) {}

void EventVerifier::reset() {
    state_ = VerifierState{};
}

void EventVerifier::begin_run(VerifierState& next) {
    next.status = RunPhase::Running;
    next.first_event_received = true;
    next.open_texts.clear();
    next.open_tools.clear();
    next.active_steps.clear();
    next.thinking_active = false;
    next.thinking_message_active = false;
}

core::errors::Result<RunPhase> EventVerifier::verify(const Event& event) {
    if (debug_) {
        AGUI_LOG_DEBUG("[VERIFY]: " + protocol::to_string(protocol::type_of(event)));
    }

    VerifierState next = state_;
    auto result = check(event, next);
    if (!core::errors::is_error(result)) {
        state_ = std::move(next);
    }
    return result;
}

core::errors::Result<RunPhase> EventVerifier::check(const Event& event,
                                                    VerifierState& next) const {
    const EventType type = protocol::type_of(event);
    const std::string name = protocol::to_string(type);

    switch (next.status) {
        case RunPhase::Errored:
            if (type == EventType::RunStarted) {
                begin_run(next);
                return next.status;
            }
            return violation(VerifyErrorKind::RunAlreadyErrored,
                             "Cannot send '" + name +
                                 "': the run already errored with 'RUN_ERROR'. "
                                 "Start a new run with 'RUN_STARTED'.");
        case RunPhase::Finished:
            if (type == EventType::RunError) {
                next.status = RunPhase::Errored;
                return next.status;
            }
            if (type == EventType::RunStarted) {
                begin_run(next);
                return next.status;
            }
            return violation(VerifyErrorKind::RunAlreadyFinished,
                             "Cannot send '" + name +
                                 "': the run already finished with 'RUN_FINISHED'. "
                                 "Start a new run with 'RUN_STARTED'.");
        case RunPhase::Idle:
            if (type != EventType::RunStarted) {
                return violation(VerifyErrorKind::FirstEventMustBeRunStarted,
                                 "First event must be 'RUN_STARTED', got '" + name + "'");
            }
            begin_run(next);
            return next.status;
        case RunPhase::Running:
            break;
    }

    switch (type) {
        case EventType::RunStarted:
            return violation(VerifyErrorKind::RunAlreadyStarted,
                             "Cannot send 'RUN_STARTED' while a run is still active");

        case EventType::RunFinished:
            if (!next.active_steps.empty()) {
                return violation(VerifyErrorKind::StepNotFinished,
                                 "Cannot send 'RUN_FINISHED' while steps are still active: " +
                                     join(next.active_steps));
            }
            if (!next.open_texts.empty()) {
                return violation(VerifyErrorKind::TextNotEnded,
                                 "Cannot send 'RUN_FINISHED' while text messages are still active: " +
                                     join(next.open_texts));
            }
            if (!next.open_tools.empty()) {
                return violation(VerifyErrorKind::ToolNotEnded,
                                 "Cannot send 'RUN_FINISHED' while tool calls are still active: " +
                                     join(next.open_tools));
            }
            next.status = RunPhase::Finished;
            break;

        case EventType::RunError:
            // Aborts the run; whatever was in flight is abandoned.
            next.status = RunPhase::Errored;
            next.open_texts.clear();
            next.open_tools.clear();
            next.active_steps.clear();
            next.thinking_active = false;
            next.thinking_message_active = false;
            break;

        case EventType::TextMessageStart: {
            const auto& id = std::get<protocol::TextMessageStartEvent>(event).message_id;
            if (next.open_texts.count(id) != 0) {
                return violation(VerifyErrorKind::TextAlreadyStarted,
                                 "Cannot send 'TEXT_MESSAGE_START': text message '" + id +
                                     "' is already in progress");
            }
            next.open_texts.insert(id);
            break;
        }
        case EventType::TextMessageContent: {
            const auto& id = std::get<protocol::TextMessageContentEvent>(event).message_id;
            if (next.open_texts.count(id) == 0) {
                return violation(VerifyErrorKind::TextNotStarted,
                                 "Cannot send 'TEXT_MESSAGE_CONTENT': no active text message '" +
                                     id + "'");
            }
            break;
        }
        case EventType::TextMessageEnd: {
            const auto& id = std::get<protocol::TextMessageEndEvent>(event).message_id;
            if (next.open_texts.erase(id) == 0) {
                return violation(VerifyErrorKind::TextNotStarted,
                                 "Cannot send 'TEXT_MESSAGE_END': no active text message '" +
                                     id + "'");
            }
            break;
        }

        case EventType::ToolCallStart: {
            const auto& id = std::get<protocol::ToolCallStartEvent>(event).tool_call_id;
            if (next.open_tools.count(id) != 0) {
                return violation(VerifyErrorKind::ToolAlreadyStarted,
                                 "Cannot send 'TOOL_CALL_START': tool call '" + id +
                                     "' is already in progress");
            }
            next.open_tools.insert(id);
            break;
        }
        case EventType::ToolCallArgs: {
            const auto& id = std::get<protocol::ToolCallArgsEvent>(event).tool_call_id;
            if (next.open_tools.count(id) == 0) {
                return violation(VerifyErrorKind::ToolNotStarted,
                                 "Cannot send 'TOOL_CALL_ARGS': no active tool call '" + id + "'");
            }
            break;
        }
        case EventType::ToolCallEnd: {
            const auto& id = std::get<protocol::ToolCallEndEvent>(event).tool_call_id;
            if (next.open_tools.erase(id) == 0) {
                return violation(VerifyErrorKind::ToolNotStarted,
                                 "Cannot send 'TOOL_CALL_END': no active tool call '" + id + "'");
            }
            break;
        }

        case EventType::StepStarted: {
            const auto& step = std::get<protocol::StepStartedEvent>(event).step_name;
            if (!next.active_steps.insert(step).second) {
                return violation(VerifyErrorKind::StepAlreadyStarted,
                                 "Step '" + step + "' is already active");
            }
            break;
        }
        case EventType::StepFinished: {
            const auto& step = std::get<protocol::StepFinishedEvent>(event).step_name;
            if (next.active_steps.erase(step) == 0) {
                return violation(VerifyErrorKind::StepNotStarted,
                                 "Cannot send 'STEP_FINISHED' for step '" + step +
                                     "' that was not started");
            }
            break;
        }

        case EventType::ThinkingStart:
            if (next.thinking_active) {
                return violation(VerifyErrorKind::ThinkingAlreadyStarted,
                                 "Cannot send 'THINKING_START': a thinking step is already in progress");
            }
            next.thinking_active = true;
            break;
        case EventType::ThinkingEnd:
            if (!next.thinking_active) {
                return violation(VerifyErrorKind::ThinkingNotStarted,
                                 "Cannot send 'THINKING_END': no active thinking step");
            }
            next.thinking_active = false;
            next.thinking_message_active = false;
            break;
        case EventType::ThinkingTextMessageStart:
            if (!next.thinking_active) {
                return violation(VerifyErrorKind::ThinkingNotStarted,
                                 "Cannot send 'THINKING_TEXT_MESSAGE_START': no active thinking step");
            }
            if (next.thinking_message_active) {
                return violation(VerifyErrorKind::ThinkingMessageAlreadyStarted,
                                 "Cannot send 'THINKING_TEXT_MESSAGE_START': a thinking message is already in progress");
            }
            next.thinking_message_active = true;
            break;
        case EventType::ThinkingTextMessageContent:
            if (!next.thinking_message_active) {
                return violation(VerifyErrorKind::ThinkingMessageNotStarted,
                                 "Cannot send 'THINKING_TEXT_MESSAGE_CONTENT': no active thinking message");
            }
            break;
        case EventType::ThinkingTextMessageEnd:
            if (!next.thinking_message_active) {
                return violation(VerifyErrorKind::ThinkingMessageNotStarted,
                                 "Cannot send 'THINKING_TEXT_MESSAGE_END': no active thinking message");
            }
            next.thinking_message_active = false;
            break;

        default:
            break;
    }
    return next.status;
}

core::errors::Result<RunPhase> EventVerifier::finalize() const {
    if (!state_.open_texts.empty()) {
        return violation(VerifyErrorKind::TextNotEnded,
                         "Stream ended with text messages still active: " +
                             join(state_.open_texts));
    }
    if (!state_.open_tools.empty()) {
        return violation(VerifyErrorKind::ToolNotEnded,
                         "Stream ended with tool calls still active: " +
                             join(state_.open_tools));
    }
    if (!state_.active_steps.empty()) {
        return violation(VerifyErrorKind::StepNotFinished,
                         "Stream ended with steps still active: " +
                             join(state_.active_steps));
    }
    if (state_.status == RunPhase::Running) {
        return violation(VerifyErrorKind::RunNotFinished,
                         "Stream ended before 'RUN_FINISHED' or 'RUN_ERROR'");
    }
    return state_.status;
}

std::string to_string(const RunPhase phase) {
    switch (phase) {
        case RunPhase::Idle:
            return "idle";
        case RunPhase::Running:
            return "running";
        case RunPhase::Finished:
            return "finished";
        case RunPhase::Errored:
            return "errored";
        default:
            return "unknown";
    }
}

std::string to_string(const VerifyErrorKind kind) {
    switch (kind) {
        case VerifyErrorKind::FirstEventMustBeRunStarted:
            return "first_event_must_be_run_started";
        case VerifyErrorKind::RunAlreadyStarted:
            return "run_already_started";
        case VerifyErrorKind::RunAlreadyFinished:
            return "run_already_finished";
        case VerifyErrorKind::RunAlreadyErrored:
            return "run_already_errored";
        case VerifyErrorKind::RunNotFinished:
            return "run_not_finished";
        case VerifyErrorKind::TextAlreadyStarted:
            return "text_already_started";
        case VerifyErrorKind::TextNotStarted:
            return "text_not_started";
        case VerifyErrorKind::TextNotEnded:
            return "text_not_ended";
        case VerifyErrorKind::ToolAlreadyStarted:
            return "tool_already_started";
        case VerifyErrorKind::ToolNotStarted:
            return "tool_not_started";
        case VerifyErrorKind::ToolNotEnded:
            return "tool_not_ended";
        case VerifyErrorKind::StepAlreadyStarted:
            return "step_already_started";
        case VerifyErrorKind::StepNotStarted:
            return "step_not_started";
        case VerifyErrorKind::StepNotFinished:
            return "step_not_finished";
        case VerifyErrorKind::ThinkingAlreadyStarted:
            return "thinking_already_started";
        case VerifyErrorKind::ThinkingNotStarted:
            return "thinking_not_started";
        case VerifyErrorKind::ThinkingMessageAlreadyStarted:
            return "thinking_message_already_started";
        case VerifyErrorKind::ThinkingMessageNotStarted:
            return "thinking_message_not_started";
        default:
            return "unknown_verify_error";
    }
}

core::errors::Result<RunPhase> verify_stream(const protocol::EventStream& events) {
    EventVerifier verifier;
    for (const auto& event : events) {
        auto result = verifier.verify(event);
        if (core::errors::is_error(result)) {
            return result;
        }
    }
    return verifier.finalize();
}

}  // namespace agui::verify
