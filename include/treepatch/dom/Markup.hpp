#pragma once

#include <treepatch/core/Error.hpp>
#include <treepatch/dom/Node.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace TP::Dom {

// Parses an HTML-like fragment into its top-level nodes.
[[nodiscard]] auto parseMarkup(std::string_view markup) -> Expected<std::vector<Node::Ptr>>;

// Outer markup of a node (element with its subtree, escaped text, or comment).
[[nodiscard]] auto serializeMarkup(Node const& node) -> std::string;

// Markup of the node's children only.
[[nodiscard]] auto innerMarkup(Node const& node) -> std::string;

[[nodiscard]] auto isVoidElement(std::string_view tag) -> bool;

} // namespace TP::Dom
