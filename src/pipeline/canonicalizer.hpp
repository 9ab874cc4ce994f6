#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "protocol/event_contract.hpp"

namespace agui::pipeline {

// Expands TEXT_MESSAGE_CHUNK / TOOL_CALL_CHUNK into Start/Content/End triads
// and closes anything the chunks left open. Only streams opened by chunks are
// tracked; explicit Start/Content/End events pass through untouched.
//
// One instance per event stream:
//   Canonicalizer c;
//   for (const auto& e : input) append(out, c.process(e));
//   append(out, c.finalize());
class Canonicalizer {
public:
    protocol::EventStream process(const protocol::Event& event);

    // Synthesizes End events for every stream still open (text ids first, then
    // tool ids, each in the order they were opened) and resets.
    protocol::EventStream finalize();

    bool has_pending() const;
    std::size_t pending_text_count() const { return open_texts_.size(); }
    std::size_t pending_tool_count() const { return open_tools_.size(); }
    const std::optional<std::string>& current_text() const { return current_text_; }
    const std::optional<std::string>& current_tool() const { return current_tool_; }

private:
    void on_text_chunk(const protocol::TextMessageChunkEvent& chunk,
                       protocol::EventStream& out);
    void on_tool_chunk(const protocol::ToolCallChunkEvent& chunk,
                       protocol::EventStream& out);

    void close_text(const std::string& message_id, protocol::EventStream& out);
    void close_tool(const std::string& tool_call_id, protocol::EventStream& out);
    void close_all(protocol::EventStream& out);

    bool is_open_text(const std::string& message_id) const;
    bool is_open_tool(const std::string& tool_call_id) const;
    static void forget(std::vector<std::string>& ids, const std::string& id);

    std::vector<std::string> open_texts_;
    std::vector<std::string> open_tools_;
    std::optional<std::string> current_text_;
    std::optional<std::string> current_tool_;
};

// Whole-sequence form: process every event, then finalize.
protocol::EventStream canonicalize(const protocol::EventStream& events);

}  // namespace agui::pipeline
