#pragma once
#include "protocol/replay_request.hpp"
#include "core/errors/protocol_errors.hpp"

namespace agui::app::cli {
    agui::core::errors::Result<agui::protocol::ReplayRequest> parse_and_validate(int argc, char* argv[]);
}
