#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include "core/errors/protocol_errors.hpp"
#include "middleware/middleware.hpp"

namespace agui::middleware {

// Exactly one of the two lists must be set.
struct ToolCallFilter {
    std::optional<std::set<std::string>> allowed_tools;
    std::optional<std::set<std::string>> disallowed_tools;
};

// Drops every event belonging to a tool call whose name the filter rejects:
// its start, args, end, result and chunk events.
class FilterToolCallsMiddleware : public Middleware {
    // Only create() can construct one, after validating the filter.
    struct Validated {
        explicit Validated() = default;
    };

public:
    static core::errors::Result<std::shared_ptr<FilterToolCallsMiddleware>> create(
        ToolCallFilter filter);

    FilterToolCallsMiddleware(Validated, ToolCallFilter filter);

    protocol::EventStream run(const protocol::RunAgentInput& input,
                              const EventProducer& next) override;

    protocol::EventStream filter(const protocol::EventStream& events) const;

    bool is_blocked(const std::string& tool_name) const;

private:
    ToolCallFilter filter_;
};

}  // namespace agui::middleware
