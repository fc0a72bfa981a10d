#include <treepatch/dom/Markup.hpp>

#include <string>

namespace TP::Dom {

namespace {

void append_escaped(std::string& out, std::string_view text, bool attribute) {
    for (char ch : text) {
        switch (ch) {
        case '&':
            out.append("&amp;");
            break;
        case '<':
            out.append("&lt;");
            break;
        case '>':
            out.append("&gt;");
            break;
        case '"':
            if (attribute) {
                out.append("&quot;");
            } else {
                out.push_back(ch);
            }
            break;
        default:
            out.push_back(ch);
        }
    }
}

void serialize_into(std::string& out, Node const& node);

void serialize_children(std::string& out, Node const& node) {
    for (auto const& child : node.children()) {
        serialize_into(out, *child);
    }
}

void serialize_into(std::string& out, Node const& node) {
    switch (node.kind()) {
    case NodeKind::Text:
        append_escaped(out, node.data(), false);
        return;
    case NodeKind::Comment:
        out.append("<!--");
        out.append(node.data());
        out.append("-->");
        return;
    case NodeKind::Element:
        break;
    }

    out.push_back('<');
    out.append(node.tagName());
    for (auto const& attr : node.attributes()) {
        out.push_back(' ');
        out.append(attr.name);
        out.append("=\"");
        append_escaped(out, attr.value, true);
        out.push_back('"');
    }
    out.push_back('>');
    if (isVoidElement(node.tagName()) && node.childCount() == 0) {
        return;
    }
    serialize_children(out, node);
    out.append("</");
    out.append(node.tagName());
    out.push_back('>');
}

} // namespace

auto serializeMarkup(Node const& node) -> std::string {
    std::string out;
    serialize_into(out, node);
    return out;
}

auto innerMarkup(Node const& node) -> std::string {
    std::string out;
    serialize_children(out, node);
    return out;
}

} // namespace TP::Dom
