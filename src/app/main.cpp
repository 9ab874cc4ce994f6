#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "app/replay_loader.hpp"
#include "core/errors/protocol_errors.hpp"
#include "core/logging/logger.hpp"
#include "session/session.hpp"
#include "session/session_runner.hpp"

namespace {

int exit_code_for(const agui::core::errors::ProtocolError& err) {
    switch (err.category) {
        case agui::core::errors::ErrorCategory::Input:
            return 2;
        case agui::core::errors::ErrorCategory::Decode:
            return 3;
        case agui::core::errors::ErrorCategory::Verify:
            return 4;
        default:
            return 1;
    }
}

int report(const std::string& stage, const agui::core::errors::ProtocolError& err) {
    AGUI_LOG_ERROR(stage + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        AGUI_LOG_INFO("Hint: " + err.hint);
    }
    return exit_code_for(err);
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Parse CLI input and return normalized input errors
    auto parsed = agui::app::cli::parse_and_validate(argc, argv);
    if (agui::core::errors::is_error(parsed)) {
        return report("Input error", agui::core::errors::get_error(parsed));
    }
    const auto& req = agui::core::errors::get_value(parsed);
    if (req.verbose) {
        agui::core::logging::Logger::get().set_min_level(agui::core::logging::LogLevel::DEBUG);
    }

    // 2. Load the session seed and the recorded stream
    auto input = agui::app::load_input(req.input_file);
    if (agui::core::errors::is_error(input)) {
        return report("Failed to load run input", agui::core::errors::get_error(input));
    }
    auto events = agui::app::load_events(req.events_file, req.options.strict);
    if (agui::core::errors::is_error(events)) {
        return report("Failed to load events", agui::core::errors::get_error(events));
    }
    const auto& stream = agui::core::errors::get_value(events);
    AGUI_LOG_INFO("Replaying " + std::to_string(stream.size()) + " events from " +
                  req.events_file.string());

    // 3. Replay through the pipeline
    agui::session::SessionRunner runner(req.options);
    auto outcome = runner.run(agui::core::errors::get_value(input),
                              [&stream](const agui::protocol::RunAgentInput&) { return stream; });
    if (agui::core::errors::is_error(outcome)) {
        return report("Replay aborted", agui::core::errors::get_error(outcome));
    }

    const auto& result = agui::core::errors::get_value(outcome);
    std::cout << agui::session::to_json(result.session).dump(2) << std::endl;
    AGUI_LOG_INFO("Final session status: " + agui::session::to_string(result.session.status));
    return 0;
}
