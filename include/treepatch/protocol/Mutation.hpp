#pragma once

#include <treepatch/protocol/Opcode.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace TP::Protocol {

// Child-index steps walked from a stack node.
using NodePath = std::vector<std::uint8_t>;

struct AppendChildren {
    ElementId     id = 0;
    std::uint32_t m  = 0;
    bool operator==(AppendChildren const&) const = default;
};

struct AssignId {
    NodePath  path;
    ElementId id = 0;
    bool operator==(AssignId const&) const = default;
};

struct CreatePlaceholder {
    ElementId id = 0;
    bool operator==(CreatePlaceholder const&) const = default;
};

struct CreateTextNode {
    ElementId   id = 0;
    std::string text;
    bool operator==(CreateTextNode const&) const = default;
};

struct LoadTemplate {
    TemplateId    templateId = 0;
    std::uint32_t index      = 0;
    ElementId     id         = 0;
    bool operator==(LoadTemplate const&) const = default;
};

struct ReplaceWith {
    ElementId     id = 0;
    std::uint32_t m  = 0;
    bool operator==(ReplaceWith const&) const = default;
};

struct ReplacePlaceholder {
    NodePath      path;
    std::uint32_t m = 0;
    bool operator==(ReplacePlaceholder const&) const = default;
};

struct InsertAfter {
    ElementId     id = 0;
    std::uint32_t m  = 0;
    bool operator==(InsertAfter const&) const = default;
};

struct InsertBefore {
    ElementId     id = 0;
    std::uint32_t m  = 0;
    bool operator==(InsertBefore const&) const = default;
};

struct SetAttribute {
    ElementId    id = 0;
    std::uint8_t ns = 0;
    std::string  name;
    std::string  value;
    bool operator==(SetAttribute const&) const = default;
};

struct SetText {
    ElementId   id = 0;
    std::string text;
    bool operator==(SetText const&) const = default;
};

struct NewEventListener {
    ElementId   id = 0;
    std::string name;
    HandlerId   handlerId = 0;
    bool operator==(NewEventListener const&) const = default;
};

struct RemoveEventListener {
    ElementId   id = 0;
    std::string name;
    bool operator==(RemoveEventListener const&) const = default;
};

struct Remove {
    ElementId id = 0;
    bool operator==(Remove const&) const = default;
};

struct PushRoot {
    ElementId id = 0;
    bool operator==(PushRoot const&) const = default;
};

// Blueprint records of a self-describing template.
struct TemplateElementNode {
    std::uint8_t               tag = 0;
    std::vector<std::uint16_t> children;
    std::uint16_t              attrFirst = 0;
    std::uint16_t              attrCount = 0;
    bool operator==(TemplateElementNode const&) const = default;
};

struct TemplateTextNode {
    std::string text;
    bool operator==(TemplateTextNode const&) const = default;
};

struct TemplateDynamicNode {
    std::uint32_t dynamicIndex = 0;
    bool operator==(TemplateDynamicNode const&) const = default;
};

struct TemplateDynamicTextNode {
    std::uint32_t dynamicIndex = 0;
    bool operator==(TemplateDynamicTextNode const&) const = default;
};

using TemplateNode = std::variant<TemplateElementNode, TemplateTextNode, TemplateDynamicNode, TemplateDynamicTextNode>;

struct TemplateStaticAttr {
    std::string name;
    std::string value;
    bool operator==(TemplateStaticAttr const&) const = default;
};

struct TemplateDynamicAttr {
    std::uint32_t dynamicIndex = 0;
    bool operator==(TemplateDynamicAttr const&) const = default;
};

using TemplateAttr = std::variant<TemplateStaticAttr, TemplateDynamicAttr>;

// Counts on the wire are derived from the vector sizes.
struct RegisterTemplate {
    TemplateId                 templateId = 0;
    std::string                name;
    std::vector<TemplateNode>  nodes;
    std::vector<TemplateAttr>  attrs;
    std::vector<std::uint16_t> rootIndices;
    bool operator==(RegisterTemplate const&) const = default;
};

using Mutation = std::variant<AppendChildren,
                              AssignId,
                              CreatePlaceholder,
                              CreateTextNode,
                              LoadTemplate,
                              ReplaceWith,
                              ReplacePlaceholder,
                              InsertAfter,
                              InsertBefore,
                              SetAttribute,
                              SetText,
                              NewEventListener,
                              RemoveEventListener,
                              Remove,
                              PushRoot,
                              RegisterTemplate>;

[[nodiscard]] auto opcodeOf(Mutation const& mutation) -> Opcode;

} // namespace TP::Protocol
