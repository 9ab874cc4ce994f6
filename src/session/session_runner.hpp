#pragma once

#include <memory>
#include <optional>
#include "core/config/pipeline_options.hpp"
#include "core/errors/protocol_errors.hpp"
#include "middleware/middleware.hpp"
#include "middleware/subscriber.hpp"
#include "pipeline/canonicalizer.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/run_agent_input.hpp"
#include "session/session.hpp"
#include "verify/event_verifier.hpp"

namespace agui::session {

struct RunOutcome {
    Session session;
    // Canonical events that made it past the subscribers, in order.
    protocol::EventStream events;
};

// Drives one session: canonicalize -> verify -> subscribers -> reduce.
class SessionRunner {
public:
    explicit SessionRunner(core::config::PipelineOptions options = {});

    void add_subscriber(std::shared_ptr<middleware::Subscriber> subscriber);
    void use(std::shared_ptr<middleware::Middleware> middleware);

    // Seeds the session from the input and resets the pipeline stages.
    void start(const protocol::RunAgentInput& input);

    // Returns the canonical events that propagated. In strict mode a
    // sequencing violation is returned and the runner refuses further events.
    core::errors::Result<protocol::EventStream> ingest(const protocol::Event& event);

    // Flushes streams the canonicalizer still holds open and runs the
    // end-of-stream checks. Returns the synthesized events that propagated.
    core::errors::Result<protocol::EventStream> finish();

    core::errors::Result<RunOutcome> run(const protocol::RunAgentInput& input,
                                         const middleware::EventProducer& agent);

    const Session& session() const { return session_; }
    const verify::VerifierState& verifier_state() const { return verifier_.state(); }

private:
    core::errors::Result<protocol::EventStream> process(const protocol::EventStream& canonical);
    std::optional<core::errors::ProtocolError> check(const protocol::Event& event);
    void reduce(const protocol::Event& event, protocol::EventStream& propagated);
    std::optional<core::errors::ProtocolError> fail(core::errors::ProtocolError error);

    core::config::PipelineOptions options_;
    Session session_;
    pipeline::Canonicalizer canonicalizer_;
    verify::EventVerifier verifier_;
    middleware::SubscriberChain subscribers_;
    middleware::MiddlewareChain middlewares_;
    std::optional<core::errors::ProtocolError> failure_;
};

}  // namespace agui::session
