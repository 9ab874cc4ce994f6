#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/protocol_errors.hpp"

namespace agui::protocol {

enum class PatchOp {
    Add,
    Remove,
    Replace,
    Move,
    Copy,
    Test
};

// One RFC 6902 operation. `path` and `from` are RFC 6901 JSON Pointers.
struct JsonPatchOperation {
    PatchOp op = PatchOp::Add;
    std::string path;
    std::optional<nlohmann::json> value;
    std::optional<std::string> from;
};

using JsonPatch = std::vector<JsonPatchOperation>;

struct PatchReport {
    std::size_t applied = 0;
    std::size_t skipped = 0;
};

std::string to_string(PatchOp op);
std::optional<PatchOp> patch_op_from_string(const std::string& value);

nlohmann::json encode_patch(const JsonPatch& patch);
core::errors::Result<JsonPatch> decode_patch(const nlohmann::json& wire);

// Applies each operation on its own. An operation whose path does not resolve,
// whose parent is a scalar, or whose `test` fails is skipped and the rest
// still apply. Never throws.
nlohmann::json apply_patch(const nlohmann::json& document, const JsonPatch& patch,
                           PatchReport* report = nullptr);

// "~" -> "~0" and "/" -> "~1", for building pointers out of object keys.
std::string escape_pointer_token(const std::string& token);

}  // namespace agui::protocol
