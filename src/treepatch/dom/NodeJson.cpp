#include <treepatch/dom/NodeJson.hpp>

namespace TP::Dom {

namespace {

[[nodiscard]] auto to_json_impl(Node const& node, JsonDumpOptions const& options, std::size_t depth) -> nlohmann::json {
    nlohmann::json result{
        {"kind", std::string{nodeKindName(node.kind())}},
    };

    if (!node.isElement()) {
        result["text"] = node.data();
        return result;
    }

    result["tag"] = node.tagName();
    if (!node.attributes().empty()) {
        nlohmann::json attrs = nlohmann::json::object();
        for (auto const& attr : node.attributes()) {
            if (options.include_namespaces && !attr.namespaceUri.empty()) {
                attrs[attr.name] = nlohmann::json{{"namespace", attr.namespaceUri}, {"value", attr.value}};
            } else {
                attrs[attr.name] = attr.value;
            }
        }
        result["attributes"] = std::move(attrs);
    }

    if (depth >= options.max_depth) {
        result["child_count"]        = node.childCount();
        result["children_truncated"] = node.childCount() > 0;
        return result;
    }

    nlohmann::json children = nlohmann::json::array();
    for (auto const& child : node.children()) {
        if (child->isComment() && !options.include_comments) {
            continue;
        }
        children.push_back(to_json_impl(*child, options, depth + 1));
    }
    result["children"] = std::move(children);
    return result;
}

} // namespace

auto nodeKindName(NodeKind kind) -> std::string_view {
    switch (kind) {
    case NodeKind::Element:
        return "element";
    case NodeKind::Text:
        return "text";
    case NodeKind::Comment:
        return "comment";
    }
    return "unknown";
}

auto toJson(Node const& node, JsonDumpOptions const& options) -> nlohmann::json {
    return to_json_impl(node, options, 0);
}

} // namespace TP::Dom
