#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/protocol_errors.hpp"
#include "message_contract.hpp"
#include "tool_contract.hpp"

namespace agui::protocol {

    struct Context {
        std::string description;
        std::string value;
    };

    // What a client hands an agent to start a run. It seeds the Session;
    // transports build it, the core only consumes it.
    struct RunAgentInput {
        std::string thread_id;
        std::string run_id;
        std::optional<std::string> parent_run_id;
        nlohmann::json state = nlohmann::json::object();
        std::vector<Message> messages;
        std::vector<Tool> tools;
        std::vector<Context> context;
        nlohmann::json forwarded_props = nlohmann::json::object();
    };

    nlohmann::json encode_run_agent_input(const RunAgentInput& input);
    core::errors::Result<RunAgentInput> decode_run_agent_input(const nlohmann::json& wire);

} // namespace agui::protocol
