#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/message_contract.hpp"
#include "protocol/run_agent_input.hpp"

namespace agui::session {

enum class RunStatus {
    Idle,
    Running,
    Finished,
    Errored
};

enum class StepStatus {
    Active,
    Finished
};

struct Step {
    std::string name;
    StepStatus status = StepStatus::Active;
};

struct TextBuffer {
    protocol::Role role = protocol::Role::Assistant;
    std::string content;
};

struct ToolBuffer {
    std::string name;
    std::string args;
    std::optional<std::string> parent_message_id;
};

struct ThinkingState {
    bool active = false;
    bool message_active = false;
    std::optional<std::string> title;
    std::string content;
};

// Everything one conversation thread has accumulated. The reducer produces a
// new Session per event; nothing else writes to it.
//
// Invariant: text_buffers / tool_buffers hold an entry for an id exactly while
// its Start has been applied and its End has not.
struct Session {
    std::string thread_id;
    std::string run_id;
    RunStatus status = RunStatus::Idle;
    std::optional<std::string> error_message;
    std::optional<std::string> error_code;
    std::optional<nlohmann::json> result;

    std::vector<protocol::Message> messages;
    nlohmann::json state = nlohmann::json::object();
    std::vector<Step> steps;

    std::unordered_map<std::string, TextBuffer> text_buffers;
    std::unordered_map<std::string, ToolBuffer> tool_buffers;
    ThinkingState thinking;

    // Bumped on every write to `messages` / `state`. Observers compare
    // revisions instead of contents.
    std::uint64_t messages_revision = 0;
    std::uint64_t state_revision = 0;
};

Session make_session(const protocol::RunAgentInput& input);

std::string to_string(RunStatus status);
std::string to_string(StepStatus status);

// Snapshot for logging and for the replay tool's output.
nlohmann::json to_json(const Session& session);

}  // namespace agui::session
