#pragma once

#include <treepatch/dom/Node.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string_view>

namespace TP::Dom {

struct JsonDumpOptions {
    std::size_t max_depth          = static_cast<std::size_t>(-1);
    bool        include_comments   = true;
    bool        include_namespaces = false;
};

// Structural snapshot: {"kind", "tag", "attributes", "text", "children"}.
[[nodiscard]] auto toJson(Node const& node, JsonDumpOptions const& options = {}) -> nlohmann::json;

[[nodiscard]] auto nodeKindName(NodeKind kind) -> std::string_view;

} // namespace TP::Dom
