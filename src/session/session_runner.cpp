#include "session/session_runner.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/event_codec.hpp"
#include "session/reducer.hpp"

namespace agui::session {

using core::errors::ProtocolError;
using protocol::Event;
using protocol::EventStream;

namespace {

void append(EventStream& out, const EventStream& more) {
    out.insert(out.end(), more.begin(), more.end());
}

}  // namespace

SessionRunner::SessionRunner(core::config::PipelineOptions options)
    : options_(options), verifier_(options.debug) {}

void SessionRunner::add_subscriber(std::shared_ptr<middleware::Subscriber> subscriber) {
    subscribers_.add(std::move(subscriber));
}

void SessionRunner::use(std::shared_ptr<middleware::Middleware> middleware) {
    middlewares_.use(std::move(middleware));
}

void SessionRunner::start(const protocol::RunAgentInput& input) {
    session_ = make_session(input);
    canonicalizer_ = pipeline::Canonicalizer{};
    verifier_.reset();
    failure_.reset();
    core::logging::Logger::get().set_context(input.thread_id, input.run_id);
    AGUI_LOG_INFO("SessionRunner: session seeded with " +
                  std::to_string(session_.messages.size()) + " messages");
}

core::errors::Result<EventStream> SessionRunner::ingest(const Event& event) {
    if (failure_.has_value()) {
        return failure_.value();
    }
    if (!options_.canonicalize) {
        return process(EventStream{event});
    }
    return process(canonicalizer_.process(event));
}

core::errors::Result<EventStream> SessionRunner::finish() {
    if (failure_.has_value()) {
        return failure_.value();
    }

    EventStream propagated;
    if (options_.canonicalize && canonicalizer_.has_pending()) {
        AGUI_LOG_DEBUG("SessionRunner: closing " +
                       std::to_string(canonicalizer_.pending_text_count()) + " text and " +
                       std::to_string(canonicalizer_.pending_tool_count()) +
                       " tool streams left open by chunks");
        auto flushed = process(canonicalizer_.finalize());
        if (core::errors::is_error(flushed)) {
            return core::errors::get_error(flushed);
        }
        propagated = std::move(core::errors::get_value(flushed));
    }

    if (options_.verify) {
        auto verdict = verifier_.finalize();
        if (core::errors::is_error(verdict)) {
            const auto& error = core::errors::get_error(verdict);
            if (options_.strict) {
                AGUI_LOG_ERROR("SessionRunner: stream ended mid-run [" + error.code + "]: " +
                               error.message);
                return fail(error).value();
            }
            AGUI_LOG_WARN("SessionRunner: stream ended mid-run [" + error.code + "]: " +
                          error.message);
        }
    }

    AGUI_LOG_INFO("SessionRunner: session " + to_string(session_.status) + " with " +
                  std::to_string(session_.messages.size()) + " messages");
    subscribers_.notify_finalized(session_);
    return propagated;
}

core::errors::Result<RunOutcome> SessionRunner::run(const protocol::RunAgentInput& input,
                                                    const middleware::EventProducer& agent) {
    start(input);
    const middleware::EventProducer producer = middlewares_.wrap(agent);
    const EventStream produced = producer(input);

    RunOutcome outcome;
    for (const auto& event : produced) {
        auto step = ingest(event);
        if (core::errors::is_error(step)) {
            return core::errors::get_error(step);
        }
        append(outcome.events, core::errors::get_value(step));
    }

    auto closing = finish();
    if (core::errors::is_error(closing)) {
        return core::errors::get_error(closing);
    }
    append(outcome.events, core::errors::get_value(closing));
    outcome.session = session_;
    return outcome;
}

core::errors::Result<EventStream> SessionRunner::process(const EventStream& canonical) {
    EventStream propagated;
    for (const auto& event : canonical) {
        if (auto error = check(event)) {
            return error.value();
        }
        reduce(event, propagated);
    }
    return propagated;
}

std::optional<ProtocolError> SessionRunner::check(const Event& event) {
    if (!options_.verify) {
        return std::nullopt;
    }
    auto verdict = verifier_.verify(event);
    if (!core::errors::is_error(verdict)) {
        return std::nullopt;
    }

    const auto& error = core::errors::get_error(verdict);
    const std::string context = protocol::encode(event).dump();
    if (options_.strict) {
        AGUI_LOG_ERROR("SessionRunner: protocol violation [" + error.code + "]: " +
                       error.message + " event=" + context);
        return fail(error);
    }
    AGUI_LOG_WARN("SessionRunner: protocol violation [" + error.code + "]: " + error.message +
                  " event=" + context);
    return std::nullopt;
}

void SessionRunner::reduce(const Event& event, EventStream& propagated) {
    middleware::DispatchOutcome dispatched = subscribers_.dispatch(event, session_);
    Session next = apply(std::move(dispatched.session), event);
    subscribers_.notify_changes(session_, next);
    session_ = std::move(next);

    if (const auto* started = std::get_if<protocol::RunStartedEvent>(&event)) {
        core::logging::Logger::get().set_context(started->thread_id, started->run_id);
    } else if (const auto* errored = std::get_if<protocol::RunErrorEvent>(&event)) {
        AGUI_LOG_WARN("SessionRunner: agent reported RUN_ERROR: " + errored->message);
    }

    if (dispatched.propagate) {
        propagated.push_back(event);
    }
}

std::optional<ProtocolError> SessionRunner::fail(ProtocolError error) {
    failure_ = error;
    subscribers_.notify_failed(session_, error);
    return failure_;
}

}  // namespace agui::session
