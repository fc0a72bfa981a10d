#include <treepatch/protocol/MutationJson.hpp>

#include <string>
#include <type_traits>
#include <variant>

namespace TP::Protocol {

namespace {

auto templateNodeJson(TemplateNode const& node) -> nlohmann::json {
    return std::visit(
        [](auto const& n) -> nlohmann::json {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, TemplateElementNode>) {
                return nlohmann::json{{"kind", "element"},
                                      {"tag", n.tag},
                                      {"children", n.children},
                                      {"attr_first", n.attrFirst},
                                      {"attr_count", n.attrCount}};
            } else if constexpr (std::is_same_v<T, TemplateTextNode>) {
                return nlohmann::json{{"kind", "text"}, {"text", n.text}};
            } else if constexpr (std::is_same_v<T, TemplateDynamicNode>) {
                return nlohmann::json{{"kind", "dynamic"}, {"index", n.dynamicIndex}};
            } else {
                return nlohmann::json{{"kind", "dynamic_text"}, {"index", n.dynamicIndex}};
            }
        },
        node);
}

auto templateAttrJson(TemplateAttr const& attr) -> nlohmann::json {
    return std::visit(
        [](auto const& a) -> nlohmann::json {
            using T = std::decay_t<decltype(a)>;
            if constexpr (std::is_same_v<T, TemplateStaticAttr>) {
                return nlohmann::json{{"kind", "static"}, {"name", a.name}, {"value", a.value}};
            } else {
                return nlohmann::json{{"kind", "dynamic"}, {"index", a.dynamicIndex}};
            }
        },
        attr);
}

} // namespace

auto toJson(Mutation const& mutation) -> nlohmann::json {
    nlohmann::json out{{"op", std::string{opcodeName(opcodeOf(mutation))}}};
    std::visit(
        [&out](auto const& m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, AppendChildren> || std::is_same_v<T, ReplaceWith>
                          || std::is_same_v<T, InsertAfter> || std::is_same_v<T, InsertBefore>) {
                out["id"] = m.id;
                out["m"]  = m.m;
            } else if constexpr (std::is_same_v<T, AssignId>) {
                out["path"] = m.path;
                out["id"]   = m.id;
            } else if constexpr (std::is_same_v<T, CreatePlaceholder> || std::is_same_v<T, Remove>
                                 || std::is_same_v<T, PushRoot>) {
                out["id"] = m.id;
            } else if constexpr (std::is_same_v<T, CreateTextNode> || std::is_same_v<T, SetText>) {
                out["id"]   = m.id;
                out["text"] = m.text;
            } else if constexpr (std::is_same_v<T, LoadTemplate>) {
                out["template"] = m.templateId;
                out["index"]    = m.index;
                out["id"]       = m.id;
            } else if constexpr (std::is_same_v<T, ReplacePlaceholder>) {
                out["path"] = m.path;
                out["m"]    = m.m;
            } else if constexpr (std::is_same_v<T, SetAttribute>) {
                out["id"]    = m.id;
                out["ns"]    = m.ns;
                out["name"]  = m.name;
                out["value"] = m.value;
            } else if constexpr (std::is_same_v<T, NewEventListener>) {
                out["id"]      = m.id;
                out["name"]    = m.name;
                out["handler"] = m.handlerId;
            } else if constexpr (std::is_same_v<T, RemoveEventListener>) {
                out["id"]   = m.id;
                out["name"] = m.name;
            } else {
                out["template"] = m.templateId;
                out["name"]     = m.name;
                auto nodes      = nlohmann::json::array();
                for (auto const& node : m.nodes) {
                    nodes.push_back(templateNodeJson(node));
                }
                auto attrs = nlohmann::json::array();
                for (auto const& attr : m.attrs) {
                    attrs.push_back(templateAttrJson(attr));
                }
                out["nodes"] = std::move(nodes);
                out["attrs"] = std::move(attrs);
                out["roots"] = m.rootIndices;
            }
        },
        mutation);
    return out;
}

} // namespace TP::Protocol
