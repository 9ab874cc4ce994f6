#include "protocol/json_patch.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace agui::protocol {

using core::errors::ErrorCategory;
using core::errors::ProtocolError;
using nlohmann::json;

namespace {

ProtocolError invalid_patch(const std::string& message) {
    return ProtocolError{ErrorCategory::Decode, message, "invalid_field"};
}

bool needs_value(const PatchOp op) {
    return op == PatchOp::Add || op == PatchOp::Replace || op == PatchOp::Test;
}

bool needs_from(const PatchOp op) {
    return op == PatchOp::Move || op == PatchOp::Copy;
}

json encode_operation(const JsonPatchOperation& operation) {
    json wire;
    wire["op"] = to_string(operation.op);
    wire["path"] = operation.path;
    if (operation.from.has_value()) {
        wire["from"] = operation.from.value();
    }
    if (operation.value.has_value()) {
        wire["value"] = operation.value.value();
    }
    return wire;
}

// nlohmann's patch asserts, rather than throws, when a write lands under a
// scalar. The parent of every pointer an operation touches must already be
// an object or an array.
bool parent_is_container(const json& document, const std::string& pointer) {
    const json::json_pointer target(pointer);
    if (target.empty()) {
        return true;
    }
    const json::json_pointer parent = target.parent_pointer();
    if (!document.contains(parent)) {
        return false;
    }
    const json& node = document.at(parent);
    return node.is_object() || node.is_array();
}

bool applicable(const json& document, const JsonPatchOperation& operation) {
    if (!parent_is_container(document, operation.path)) {
        return false;
    }
    return !operation.from.has_value() ||
           parent_is_container(document, operation.from.value());
}

}  // namespace

std::string to_string(const PatchOp op) {
    switch (op) {
        case PatchOp::Add:
            return "add";
        case PatchOp::Remove:
            return "remove";
        case PatchOp::Replace:
            return "replace";
        case PatchOp::Move:
            return "move";
        case PatchOp::Copy:
            return "copy";
        case PatchOp::Test:
            return "test";
        default:
            return "unknown";
    }
}

std::optional<PatchOp> patch_op_from_string(const std::string& value) {
    static constexpr std::pair<const char*, PatchOp> kOps[] = {
        {"add", PatchOp::Add},   {"remove", PatchOp::Remove},
        {"replace", PatchOp::Replace}, {"move", PatchOp::Move},
        {"copy", PatchOp::Copy}, {"test", PatchOp::Test}};
    for (const auto& entry : kOps) {
        if (value == entry.first) {
            return entry.second;
        }
    }
    return std::nullopt;
}

json encode_patch(const JsonPatch& patch) {
    json wire = json::array();
    for (const auto& operation : patch) {
        wire.push_back(encode_operation(operation));
    }
    return wire;
}

core::errors::Result<JsonPatch> decode_patch(const json& wire) {
    if (!wire.is_array()) {
        return invalid_patch("JSON Patch must be an array of operations");
    }

    JsonPatch patch;
    patch.reserve(wire.size());
    for (std::size_t i = 0; i < wire.size(); ++i) {
        const json& item = wire[i];
        const std::string where = "patch[" + std::to_string(i) + "]";
        if (!item.is_object()) {
            return invalid_patch(where + " must be an object");
        }

        const auto op_it = item.find("op");
        if (op_it == item.end() || !op_it->is_string()) {
            return invalid_patch(where + ".op must be a string");
        }
        const auto op = patch_op_from_string(op_it->get<std::string>());
        if (!op.has_value()) {
            return invalid_patch(where + ".op is not a JSON Patch operation: " +
                                 op_it->get<std::string>());
        }

        const auto path_it = item.find("path");
        if (path_it == item.end() || !path_it->is_string()) {
            return invalid_patch(where + ".path must be a string");
        }

        JsonPatchOperation operation;
        operation.op = op.value();
        operation.path = path_it->get<std::string>();

        const auto value_it = item.find("value");
        if (value_it != item.end()) {
            operation.value = *value_it;
        } else if (needs_value(operation.op)) {
            return invalid_patch(where + ".value is required for " +
                                 to_string(operation.op));
        }

        const auto from_it = item.find("from");
        if (from_it != item.end()) {
            if (!from_it->is_string()) {
                return invalid_patch(where + ".from must be a string");
            }
            operation.from = from_it->get<std::string>();
        } else if (needs_from(operation.op)) {
            return invalid_patch(where + ".from is required for " +
                                 to_string(operation.op));
        }

        patch.push_back(std::move(operation));
    }
    return patch;
}

json apply_patch(const json& document, const JsonPatch& patch,
                 PatchReport* report) {
    json current = document;
    PatchReport local;
    for (const auto& operation : patch) {
        try {
            if (!applicable(current, operation)) {
                ++local.skipped;
                AGUI_LOG_WARN("Skipping JSON Patch " + to_string(operation.op) +
                              " at '" + operation.path +
                              "': parent is missing or not a container");
                continue;
            }
            current = current.patch(json::array({encode_operation(operation)}));
            ++local.applied;
        } catch (const json::exception& e) {
            ++local.skipped;
            AGUI_LOG_WARN("Skipping JSON Patch " + to_string(operation.op) +
                          " at '" + operation.path + "': " + e.what());
        }
    }
    if (report != nullptr) {
        *report = local;
    }
    return current;
}

std::string escape_pointer_token(const std::string& token) {
    std::string escaped;
    escaped.reserve(token.size());
    for (const char c : token) {
        if (c == '~') {
            escaped += "~0";
        } else if (c == '/') {
            escaped += "~1";
        } else {
            escaped.push_back(c);
        }
    }
    return escaped;
}

}  // namespace agui::protocol
