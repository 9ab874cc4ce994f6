#include "app/replay_loader.hpp"

#include <fstream>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"
#include "protocol/event_codec.hpp"

namespace agui::app {

using core::errors::ErrorCategory;
using core::errors::ProtocolError;

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

}  // namespace

core::errors::Result<protocol::EventStream> read_events(std::istream& in, const bool strict) {
    protocol::EventStream events;
    std::string line;
    std::size_t line_number = 0;
    std::size_t skipped = 0;

    while (std::getline(in, line)) {
        ++line_number;
        if (is_blank(line)) {
            continue;
        }
        auto decoded = protocol::decode_text(line);
        if (core::errors::is_error(decoded)) {
            ProtocolError err = core::errors::get_error(decoded);
            err.message = "line " + std::to_string(line_number) + ": " + err.message;
            if (strict) {
                return err;
            }
            AGUI_LOG_WARN("Skipping undecodable event [" + err.code + "]: " + err.message);
            ++skipped;
            continue;
        }
        events.push_back(std::move(core::errors::get_value(decoded)));
    }

    if (in.bad()) {
        return ProtocolError{ErrorCategory::Input,
                             "I/O error after line " + std::to_string(line_number),
                             "read_failed"};
    }

    AGUI_LOG_DEBUG("Loaded " + std::to_string(events.size()) + " events, skipped " +
                   std::to_string(skipped));
    return events;
}

core::errors::Result<protocol::EventStream> load_events(const std::filesystem::path& path,
                                                        const bool strict) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return ProtocolError{ErrorCategory::Input, "Failed to open events file: " + path.string(),
                             "read_failed"};
    }
    return read_events(in, strict);
}

core::errors::Result<protocol::RunAgentInput> load_input(
    const std::optional<std::filesystem::path>& path) {
    if (!path.has_value()) {
        protocol::RunAgentInput input;
        input.thread_id = core::config::generate_thread_id();
        input.run_id = core::config::generate_run_id();
        return input;
    }

    std::ifstream in(path.value());
    if (!in.is_open()) {
        return ProtocolError{ErrorCategory::Input,
                             "Failed to open input file: " + path->string(), "read_failed"};
    }
    nlohmann::json wire = nlohmann::json::parse(in, nullptr, false);
    if (wire.is_discarded()) {
        return ProtocolError{ErrorCategory::Input,
                             "Input file is not valid JSON: " + path->string(),
                             "malformed_json"};
    }
    return protocol::decode_run_agent_input(wire);
}

}  // namespace agui::app
