#include "middleware/subscriber.hpp"

#include <utility>

namespace agui::middleware {

void SubscriberChain::add(std::shared_ptr<Subscriber> subscriber) {
    if (subscriber != nullptr) {
        subscribers_.push_back(std::move(subscriber));
    }
}

DispatchOutcome SubscriberChain::dispatch(const protocol::Event& event,
                                          session::Session session) const {
    DispatchOutcome outcome{std::move(session), true};
    for (const auto& subscriber : subscribers_) {
        auto result = subscriber->on_event(event, outcome.session);
        if (!result.has_value()) {
            continue;
        }
        if (result->messages.has_value()) {
            outcome.session.messages = std::move(result->messages.value());
            ++outcome.session.messages_revision;
        }
        if (result->state.has_value()) {
            outcome.session.state = std::move(result->state.value());
            ++outcome.session.state_revision;
        }
        if (result->stop_propagation) {
            outcome.propagate = false;
            break;
        }
    }
    return outcome;
}

void SubscriberChain::notify_changes(const session::Session& before,
                                     const session::Session& after) const {
    if (subscribers_.empty()) {
        return;
    }
    const bool messages_changed = before.messages_revision != after.messages_revision;
    const bool state_changed = before.state_revision != after.state_revision;
    for (const auto& subscriber : subscribers_) {
        if (messages_changed) {
            subscriber->on_messages_changed(after);
        }
        if (state_changed) {
            subscriber->on_state_changed(after);
        }
    }
}

void SubscriberChain::notify_finalized(const session::Session& session) const {
    for (const auto& subscriber : subscribers_) {
        subscriber->on_run_finalized(session);
    }
}

void SubscriberChain::notify_failed(const session::Session& session,
                                    const core::errors::ProtocolError& error) const {
    for (const auto& subscriber : subscribers_) {
        subscriber->on_run_failed(session, error);
    }
}

}  // namespace agui::middleware
