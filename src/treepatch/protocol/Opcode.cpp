#include <treepatch/protocol/Opcode.hpp>

namespace TP::Protocol {

auto opcodeName(Opcode op) -> std::string_view {
    switch (op) {
    case Opcode::End:
        return "End";
    case Opcode::AppendChildren:
        return "AppendChildren";
    case Opcode::AssignId:
        return "AssignId";
    case Opcode::CreatePlaceholder:
        return "CreatePlaceholder";
    case Opcode::CreateTextNode:
        return "CreateTextNode";
    case Opcode::LoadTemplate:
        return "LoadTemplate";
    case Opcode::ReplaceWith:
        return "ReplaceWith";
    case Opcode::ReplacePlaceholder:
        return "ReplacePlaceholder";
    case Opcode::InsertAfter:
        return "InsertAfter";
    case Opcode::InsertBefore:
        return "InsertBefore";
    case Opcode::SetAttribute:
        return "SetAttribute";
    case Opcode::SetText:
        return "SetText";
    case Opcode::NewEventListener:
        return "NewEventListener";
    case Opcode::RemoveEventListener:
        return "RemoveEventListener";
    case Opcode::Remove:
        return "Remove";
    case Opcode::PushRoot:
        return "PushRoot";
    case Opcode::RegisterTemplate:
        return "RegisterTemplate";
    }
    return "Unknown";
}

auto opcodeFromByte(std::uint8_t value) -> std::optional<Opcode> {
    if (value > kMaxOpcode) {
        return std::nullopt;
    }
    return static_cast<Opcode>(value);
}

auto namespaceUri(std::uint8_t tag) -> std::optional<std::string_view> {
    switch (static_cast<AttributeNamespace>(tag)) {
    case AttributeNamespace::XLink:
        return kXLinkNamespace;
    case AttributeNamespace::Xml:
        return kXmlNamespace;
    case AttributeNamespace::XmlNs:
        return kXmlNsNamespace;
    case AttributeNamespace::None:
        break;
    }
    return std::nullopt;
}

} // namespace TP::Protocol
