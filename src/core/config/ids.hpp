#pragma once
#include <random>
#include <sstream>
#include <string>

namespace agui::core::config {

    // Generates an 8-character hex ID with the given prefix, e.g. "run-3fa9c01b"
    inline std::string generate_id(const std::string& prefix) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    inline std::string generate_thread_id() { return generate_id("thread"); }
    inline std::string generate_run_id() { return generate_id("run"); }
    inline std::string generate_message_id() { return generate_id("msg"); }

} // namespace agui::core::config
