#include <treepatch/protocol/Mutation.hpp>

#include <type_traits>
#include <variant>

namespace TP::Protocol {

auto opcodeOf(Mutation const& mutation) -> Opcode {
    return std::visit(
        [](auto const& m) -> Opcode {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, AppendChildren>) {
                return Opcode::AppendChildren;
            } else if constexpr (std::is_same_v<T, AssignId>) {
                return Opcode::AssignId;
            } else if constexpr (std::is_same_v<T, CreatePlaceholder>) {
                return Opcode::CreatePlaceholder;
            } else if constexpr (std::is_same_v<T, CreateTextNode>) {
                return Opcode::CreateTextNode;
            } else if constexpr (std::is_same_v<T, LoadTemplate>) {
                return Opcode::LoadTemplate;
            } else if constexpr (std::is_same_v<T, ReplaceWith>) {
                return Opcode::ReplaceWith;
            } else if constexpr (std::is_same_v<T, ReplacePlaceholder>) {
                return Opcode::ReplacePlaceholder;
            } else if constexpr (std::is_same_v<T, InsertAfter>) {
                return Opcode::InsertAfter;
            } else if constexpr (std::is_same_v<T, InsertBefore>) {
                return Opcode::InsertBefore;
            } else if constexpr (std::is_same_v<T, SetAttribute>) {
                return Opcode::SetAttribute;
            } else if constexpr (std::is_same_v<T, SetText>) {
                return Opcode::SetText;
            } else if constexpr (std::is_same_v<T, NewEventListener>) {
                return Opcode::NewEventListener;
            } else if constexpr (std::is_same_v<T, RemoveEventListener>) {
                return Opcode::RemoveEventListener;
            } else if constexpr (std::is_same_v<T, Remove>) {
                return Opcode::Remove;
            } else if constexpr (std::is_same_v<T, PushRoot>) {
                return Opcode::PushRoot;
            } else {
                return Opcode::RegisterTemplate;
            }
        },
        mutation);
}

} // namespace TP::Protocol
