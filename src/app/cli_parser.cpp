#include "cli_parser.hpp"
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace agui::app::cli {

    using namespace agui::core::errors;
    using agui::protocol::ReplayRequest;

    namespace {

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> events;
            std::optional<std::string> input;
            bool strict = false;
            bool no_canonicalize = false;
            bool no_verify = false;
            bool verbose = false;
        };

        std::optional<ProtocolError> check_readable_file(const std::filesystem::path& path,
                                                         const std::string& flag) {
            std::error_code ec;
            const bool is_file = std::filesystem::is_regular_file(path, ec);
            if (ec || !is_file) {
                return ProtocolError{ErrorCategory::Input,
                                     "File for " + flag + " does not exist or is not a regular file: " + path.string(),
                                     "invalid_path"};
            }
            return std::nullopt;
        }

    } // namespace

    Result<ReplayRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return ProtocolError{ErrorCategory::Input, "No command provided.", "missing_command",
                                 "Usage: agui_replay replay --events <file.jsonl> [--input <input.json>]"};
        }

        std::string command = argv[1];
        if (command != "replay") {
            return ProtocolError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command",
                                 "Currently only the 'replay' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'replay' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--events") {
                if (i + 1 < args.size()) raw.events = args[++i];
                else return ProtocolError{ErrorCategory::Input, "Missing value for --events", "missing_value"};
            } else if (args[i] == "--input") {
                if (i + 1 < args.size()) raw.input = args[++i];
                else return ProtocolError{ErrorCategory::Input, "Missing value for --input", "missing_value"};
            } else if (args[i] == "--strict") {
                raw.strict = true;
            } else if (args[i] == "--no-canonicalize") {
                raw.no_canonicalize = true;
            } else if (args[i] == "--no-verify") {
                raw.no_verify = true;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return ProtocolError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase
        if (!raw.events.has_value()) {
            return ProtocolError{ErrorCategory::Input, "Must provide --events", "missing_required_flag"};
        }
        if (raw.strict && raw.no_verify) {
            return ProtocolError{ErrorCategory::Input, "Cannot combine --strict with --no-verify", "conflicting_flags",
                                 "--strict aborts on verification failures, which --no-verify turns off."};
        }

        ReplayRequest req;
        req.verbose = raw.verbose;
        req.options.strict = raw.strict;
        req.options.canonicalize = !raw.no_canonicalize;
        req.options.verify = !raw.no_verify;
        req.options.debug = raw.verbose;

        req.events_file = std::filesystem::path(raw.events.value());
        if (auto err = check_readable_file(req.events_file, "--events")) {
            return err.value();
        }

        if (raw.input) {
            std::filesystem::path input_path(raw.input.value());
            if (auto err = check_readable_file(input_path, "--input")) {
                return err.value();
            }
            req.input_file = std::move(input_path);
        }

        return req;
    }

} // namespace agui::app::cli
