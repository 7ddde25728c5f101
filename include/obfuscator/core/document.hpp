#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

namespace obfuscator {

/// In-memory document tree shared by the loader, the redactor and the
/// writer. ordered_json keeps mapping keys in source insertion order.
using Document = nlohmann::ordered_json;

enum class NodeKind {
    Mapping,
    Sequence,
    Scalar,
};

/// Classify a node. Every value that is neither an object nor an array
/// (string, number, boolean, null) is a scalar.
inline auto kind_of(const Document& node) noexcept -> NodeKind {
    if (node.is_object()) return NodeKind::Mapping;
    if (node.is_array()) return NodeKind::Sequence;
    return NodeKind::Scalar;
}

inline auto node_kind_to_string(NodeKind kind) -> std::string_view {
    switch (kind) {
        case NodeKind::Mapping: return "mapping";
        case NodeKind::Sequence: return "sequence";
        case NodeKind::Scalar: return "scalar";
        default: return "unknown";
    }
}

/// True when `derived` keeps the skeleton of `original`: every mapping
/// has the same keys in the same order, every sequence the same length,
/// and every container sits where the original had the same kind of
/// container. A scalar in `derived` may stand in for any original node,
/// since a substituted value collapses its whole subtree.
auto preserves_shape(const Document& original, const Document& derived) -> bool;

} // namespace obfuscator
