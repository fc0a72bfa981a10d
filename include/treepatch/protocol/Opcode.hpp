#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace TP::Protocol {

using ElementId  = std::uint32_t;
using TemplateId = std::uint32_t;
using HandlerId  = std::uint32_t;

enum class Opcode : std::uint8_t {
    End                 = 0x00,
    AppendChildren      = 0x01,
    AssignId            = 0x02,
    CreatePlaceholder   = 0x03,
    CreateTextNode      = 0x04,
    LoadTemplate        = 0x05,
    ReplaceWith         = 0x06,
    ReplacePlaceholder  = 0x07,
    InsertAfter         = 0x08,
    InsertBefore        = 0x09,
    SetAttribute        = 0x0a,
    SetText             = 0x0b,
    NewEventListener    = 0x0c,
    RemoveEventListener = 0x0d,
    Remove              = 0x0e,
    PushRoot            = 0x0f,
    RegisterTemplate    = 0x10,
};

inline constexpr std::uint8_t kMaxOpcode = static_cast<std::uint8_t>(Opcode::RegisterTemplate);

// Template blueprint node kinds carried by RegisterTemplate.
enum class TemplateNodeKind : std::uint8_t {
    Element     = 0x00,
    Text        = 0x01,
    Dynamic     = 0x02,
    DynamicText = 0x03,
};

enum class TemplateAttrKind : std::uint8_t {
    Static  = 0x00,
    Dynamic = 0x01,
};

// Namespace tags for SetAttribute.
enum class AttributeNamespace : std::uint8_t {
    None  = 0,
    XLink = 1,
    Xml   = 2,
    XmlNs = 3,
};

inline constexpr std::string_view kXLinkNamespace = "http://www.w3.org/1999/xlink";
inline constexpr std::string_view kXmlNamespace   = "http://www.w3.org/XML/1998/namespace";
inline constexpr std::string_view kXmlNsNamespace = "http://www.w3.org/2000/xmlns/";

[[nodiscard]] auto opcodeName(Opcode op) -> std::string_view;
[[nodiscard]] auto opcodeFromByte(std::uint8_t value) -> std::optional<Opcode>;

// Returns the namespace URI for a tag, or nullopt for "none"/unrecognized tags.
[[nodiscard]] auto namespaceUri(std::uint8_t tag) -> std::optional<std::string_view>;

} // namespace TP::Protocol
