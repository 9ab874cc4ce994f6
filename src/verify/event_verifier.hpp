#pragma once

#include <set>
#include <string>
#include "core/errors/protocol_errors.hpp"
#include "protocol/event_contract.hpp"

namespace agui::verify {

enum class RunPhase {
    Idle,
    Running,
    Finished,
    Errored
};

// One value per sequencing rule; to_string() gives the ProtocolError code.
enum class VerifyErrorKind {
    FirstEventMustBeRunStarted,
    RunAlreadyStarted,
    RunAlreadyFinished,
    RunAlreadyErrored,
    RunNotFinished,
    TextAlreadyStarted,
    TextNotStarted,
    TextNotEnded,
    ToolAlreadyStarted,
    ToolNotStarted,
    ToolNotEnded,
    StepAlreadyStarted,
    StepNotStarted,
    StepNotFinished,
    ThinkingAlreadyStarted,
    ThinkingNotStarted,
    ThinkingMessageAlreadyStarted,
    ThinkingMessageNotStarted
};

struct VerifierState {
    RunPhase status = RunPhase::Idle;
    bool first_event_received = false;
    std::set<std::string> open_texts;
    std::set<std::string> open_tools;
    std::set<std::string> active_steps;
    bool thinking_active = false;
    bool thinking_message_active = false;
};

// Single-pass sequence checker. verify() either accepts the event and advances
// the state, or rejects it and leaves the state untouched.
class EventVerifier {
public:
    explicit EventVerifier(bool debug = false);

    core::errors::Result<RunPhase> verify(const protocol::Event& event);

    // End-of-stream check. Idle, Finished and Errored streams pass.
    core::errors::Result<RunPhase> finalize() const;

    const VerifierState& state() const { return state_; }
    void reset();

private:
    core::errors::Result<RunPhase> check(const protocol::Event& event,
                                         VerifierState& next) const;
    static void begin_run(VerifierState& next);

    VerifierState state_;
    bool debug_ = false;
};

std::string to_string(RunPhase phase);
std::string to_string(VerifyErrorKind kind);

// Verifies a complete stream, including finalize().
core::errors::Result<RunPhase> verify_stream(const protocol::EventStream& events);

}  // namespace agui::verify
