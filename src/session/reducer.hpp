#pragma once

#include "protocol/event_contract.hpp"
#include "session/session.hpp"

namespace agui::session {

// Folds one event into a session and returns the new session. Total: events
// that do not fit the current session (unknown ids, patch paths that do not
// resolve, chunk events that skipped canonicalization) are logged and ignored.
Session apply(Session session, const protocol::Event& event);

Session apply_all(Session session, const protocol::EventStream& events);

}  // namespace agui::session
