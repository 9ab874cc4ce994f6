#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/protocol_errors.hpp"
#include "protocol/event_contract.hpp"

namespace agui::protocol {

// Error codes produced by decode(); all carry ErrorCategory::Decode.
inline constexpr const char* kUnknownEventType = "unknown_event_type";
inline constexpr const char* kMissingType = "missing_type";
inline constexpr const char* kInvalidField = "invalid_field";
inline constexpr const char* kMalformedJson = "malformed_json";

// Event <-> wire map. Wire maps use SCREAMING_SNAKE_CASE `type` values and
// camelCase fields; optional fields that are unset are omitted.
nlohmann::json encode(const Event& event);
core::errors::Result<Event> decode(const nlohmann::json& wire);

// Parses one JSON document (e.g. an SSE data line or a JSONL record) and decodes it.
core::errors::Result<Event> decode_text(const std::string& text);

}  // namespace agui::protocol
