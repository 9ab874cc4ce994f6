#pragma once
#include <filesystem>
#include <optional>
#include "core/config/pipeline_options.hpp"

namespace agui::protocol {

    // Validated command-line input for replaying a recorded event stream
    struct ReplayRequest {
        std::filesystem::path events_file;
        std::optional<std::filesystem::path> input_file; // RunAgentInput seed, JSON
        core::config::PipelineOptions options;
        bool verbose = false;
    };

} // namespace agui::protocol
