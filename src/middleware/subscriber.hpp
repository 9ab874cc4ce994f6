#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/protocol_errors.hpp"
#include "protocol/event_contract.hpp"
#include "session/session.hpp"

namespace agui::middleware {

// What a subscriber may ask for before the reducer applies an event.
// Unset fields leave the session alone.
struct SubscriberResult {
    std::optional<std::vector<protocol::Message>> messages;
    std::optional<nlohmann::json> state;
    // Keep the event from reaching downstream consumers. The reducer still
    // applies it, and later subscribers in the chain are skipped.
    bool stop_propagation = false;
};

class Subscriber {
public:
    virtual ~Subscriber() = default;

    // Called once per event, before the reducer. Return std::nullopt to continue.
    virtual std::optional<SubscriberResult> on_event(const protocol::Event& event,
                                                     const session::Session& session) = 0;

    virtual void on_messages_changed(const session::Session& /*session*/) {}
    virtual void on_state_changed(const session::Session& /*session*/) {}
    virtual void on_run_finalized(const session::Session& /*session*/) {}
    virtual void on_run_failed(const session::Session& /*session*/,
                               const core::errors::ProtocolError& /*error*/) {}
};

struct DispatchOutcome {
    session::Session session;
    bool propagate = true;
};

// Subscribers run in registration order.
class SubscriberChain {
public:
    void add(std::shared_ptr<Subscriber> subscriber);
    std::size_t size() const { return subscribers_.size(); }

    // Runs on_event down the chain, folding each mutation into the session the
    // next subscriber sees. Stops at the first stop_propagation.
    DispatchOutcome dispatch(const protocol::Event& event, session::Session session) const;

    void notify_changes(const session::Session& before, const session::Session& after) const;
    void notify_finalized(const session::Session& session) const;
    void notify_failed(const session::Session& session,
                       const core::errors::ProtocolError& error) const;

private:
    std::vector<std::shared_ptr<Subscriber>> subscribers_;
};

}  // namespace agui::middleware
