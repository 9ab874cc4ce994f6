#pragma once
#include <filesystem>
#include <istream>
#include <optional>
#include "core/errors/protocol_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/run_agent_input.hpp"

namespace agui::app {

    // Reads one JSON event per line; blank lines are skipped. A line that does
    // not decode fails the load when `strict` is set and is skipped otherwise.
    core::errors::Result<protocol::EventStream> read_events(std::istream& in, bool strict);
    core::errors::Result<protocol::EventStream> load_events(const std::filesystem::path& path, bool strict);

    // Without a file the session starts empty under freshly generated ids.
    core::errors::Result<protocol::RunAgentInput> load_input(
        const std::optional<std::filesystem::path>& path);

} // namespace agui::app
