#include <treepatch/protocol/MutationReader.hpp>
#include <treepatch/runtime/Interpreter.hpp>

#include "log/TaggedLogger.hpp"

#include <format>
#include <type_traits>
#include <utility>
#include <variant>

namespace TP::Runtime {

using namespace Protocol;

Interpreter::Interpreter(Dom::Node::Ptr root, Templates::TemplateRegistry& templates)
    : rootNode(std::move(root)), templates(templates), handles(this->rootNode) {}

Interpreter::~Interpreter() {
    for (auto const& [handle, byName] : this->listeners) {
        for (auto const& [name, entry] : byName) {
            this->detachNative(entry, name);
        }
    }
}

auto Interpreter::applyMutations(std::span<std::uint8_t const> buffer) -> Expected<ApplyStats> {
    return this->applyMutations(buffer, 0, buffer.size());
}

auto Interpreter::applyMutations(std::span<std::uint8_t const> buffer, std::size_t offset, std::size_t length)
    -> Expected<ApplyStats> {
    MutationReader reader{buffer, offset, length};
    ApplyStats     stats;

    auto fail = [&](Error const& error, std::string context) -> Expected<ApplyStats> {
        this->stack.clear();
        std::string message = std::move(context);
        if (error.message) {
            message.append(": ").append(*error.message);
        }
        tp_log("applyMutations aborted: " + message, LogTag::Runtime, LogTag::Error);
        return std::unexpected(Error{error.code, std::move(message)});
    };

    while (true) {
        auto record = reader.next();
        if (!record) {
            return fail(record.error(), std::format("decode failed after {} instructions", stats.mutations));
        }
        if (!record->has_value()) {
            break;
        }
        auto const& mutation = **record;
        if (auto applied = this->handleMutation(mutation); !applied) {
            return fail(applied.error(),
                        std::format("instruction {} ({}) at offset {}",
                                    stats.mutations,
                                    opcodeName(opcodeOf(mutation)),
                                    reader.lastRecordOffset()));
        }
        tp_log(std::format("#{} {}", stats.mutations, opcodeName(opcodeOf(mutation))), LogTag::Runtime, LogTag::Trace);
        ++stats.mutations;
    }

    stats.bytesConsumed = reader.position() - offset;
    stats.reachedEnd    = reader.reachedEnd();
    tp_log(std::format("applied {} mutations ({} bytes)", stats.mutations, stats.bytesConsumed), LogTag::Runtime);
    return stats;
}

auto Interpreter::handleMutation(Mutation const& mutation) -> Expected<void> {
    return std::visit(
        [this](auto const& m) -> Expected<void> {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, PushRoot>) {
                return this->opPushRoot(m);
            } else if constexpr (std::is_same_v<T, AppendChildren>) {
                return this->opAppendChildren(m);
            } else if constexpr (std::is_same_v<T, CreateTextNode>) {
                return this->opCreateTextNode(m);
            } else if constexpr (std::is_same_v<T, CreatePlaceholder>) {
                return this->opCreatePlaceholder(m);
            } else if constexpr (std::is_same_v<T, LoadTemplate>) {
                return this->opLoadTemplate(m);
            } else if constexpr (std::is_same_v<T, AssignId>) {
                return this->opAssignId(m);
            } else if constexpr (std::is_same_v<T, SetAttribute>) {
                return this->opSetAttribute(m);
            } else if constexpr (std::is_same_v<T, SetText>) {
                return this->opSetText(m);
            } else if constexpr (std::is_same_v<T, NewEventListener>) {
                return this->opNewEventListener(m);
            } else if constexpr (std::is_same_v<T, RemoveEventListener>) {
                return this->opRemoveEventListener(m);
            } else if constexpr (std::is_same_v<T, Remove>) {
                return this->opRemove(m);
            } else if constexpr (std::is_same_v<T, ReplaceWith>) {
                return this->opReplaceWith(m);
            } else if constexpr (std::is_same_v<T, ReplacePlaceholder>) {
                return this->opReplacePlaceholder(m);
            } else if constexpr (std::is_same_v<T, InsertAfter>) {
                return this->opInsertAfter(m);
            } else if constexpr (std::is_same_v<T, InsertBefore>) {
                return this->opInsertBefore(m);
            } else {
                return this->templates.registerFromBlueprint(m);
            }
        },
        mutation);
}

auto Interpreter::stackTop() const -> Dom::Node::Ptr {
    if (this->stack.empty()) {
        return nullptr;
    }
    return this->stack.back();
}

auto Interpreter::listenerCount() const -> std::size_t {
    std::size_t count = 0;
    for (auto const& [handle, byName] : this->listeners) {
        count += byName.size();
    }
    return count;
}

auto Interpreter::listenerCount(ElementId handle) const -> std::size_t {
    auto it = this->listeners.find(handle);
    return it == this->listeners.end() ? 0 : it->second.size();
}

// Pops count operands, returned in their original push order.
auto Interpreter::popMany(std::size_t count) -> Expected<std::vector<Dom::Node::Ptr>> {
    if (count > this->stack.size()) {
        return std::unexpected(Error{Error::Code::StackUnderflow,
                                     std::format("need {} operands, stack holds {}", count, this->stack.size())});
    }
    auto const first = this->stack.end() - static_cast<std::ptrdiff_t>(count);
    std::vector<Dom::Node::Ptr> popped(std::make_move_iterator(first), std::make_move_iterator(this->stack.end()));
    this->stack.erase(first, this->stack.end());
    return popped;
}

auto Interpreter::navigate(Dom::Node::Ptr node, NodePath const& path) const -> Expected<Dom::Node::Ptr> {
    for (std::size_t step = 0; step < path.size(); ++step) {
        auto const index = path[step];
        if (index >= node->childCount()) {
            return std::unexpected(Error{Error::Code::PathOutOfBounds,
                                         std::format("path step {} index {} out of bounds ({} children)",
                                                     step,
                                                     index,
                                                     node->childCount())});
        }
        node = node->childAt(index);
    }
    return node;
}

auto Interpreter::pushAndBind(ElementId handle, Dom::Node::Ptr node) -> Expected<void> {
    if (auto bound = this->bindHandle(handle, node); !bound) {
        return bound;
    }
    this->stack.push_back(std::move(node));
    return {};
}

// Listener entries belong to the node a handle named; a handle moving to a new node starts clean.
auto Interpreter::bindHandle(ElementId handle, Dom::Node::Ptr const& node) -> Expected<void> {
    auto displaced = this->handles.bind(handle, node);
    if (!displaced) {
        return std::unexpected(displaced.error());
    }
    if (*displaced) {
        this->purgeListeners(handle);
    }
    return {};
}

// Unbinds every handle naming a node strictly below node and drops its listener entries.
void Interpreter::releaseDescendants(Dom::Node const& node) {
    std::vector<Dom::Node const*> pending;
    for (auto const& child : node.children()) {
        pending.push_back(child.get());
    }
    std::size_t released = 0;
    while (!pending.empty()) {
        auto const* current = pending.back();
        pending.pop_back();
        auto handle = this->handles.handleOf(current);
        if (handle && this->handles.unbind(*handle).value_or(false)) {
            this->purgeListeners(*handle);
            ++released;
        }
        for (auto const& child : current->children()) {
            pending.push_back(child.get());
        }
    }
    if (released > 0) {
        tp_log(std::format("released {} descendant handles", released), LogTag::Runtime);
    }
}

// Puts replacements where target sits; a detached target just drops them.
auto Interpreter::replaceNode(Dom::Node::Ptr const& target, std::vector<Dom::Node::Ptr> const& replacements)
    -> Expected<void> {
    auto* parent = target->parent();
    if (parent == nullptr) {
        return {};
    }
    if (replacements.size() == 1) {
        auto replaced = parent->replaceChild(replacements.front(), target.get());
        if (!replaced) {
            return std::unexpected(replaced.error());
        }
        return {};
    }
    for (auto const& node : replacements) {
        if (auto inserted = parent->insertBefore(node, target.get()); !inserted) {
            return inserted;
        }
    }
    auto removed = parent->removeChild(target.get());
    if (!removed) {
        return std::unexpected(removed.error());
    }
    return {};
}

void Interpreter::detachNative(ListenerEntry const& entry, std::string const& eventName) {
    if (auto node = entry.node.lock()) {
        node->removeEventListener(eventName, entry.id);
    }
}

void Interpreter::purgeListeners(ElementId handle) {
    auto it = this->listeners.find(handle);
    if (it != this->listeners.end()) {
        for (auto const& [name, entry] : it->second) {
            this->detachNative(entry, name);
        }
        this->listeners.erase(it);
    }
    if (this->sink != nullptr) {
        this->sink->detachAll(handle);
    }
}

auto Interpreter::opPushRoot(PushRoot const& m) -> Expected<void> {
    auto node = this->handles.resolve(m.id);
    if (!node) {
        return std::unexpected(node.error());
    }
    this->stack.push_back(std::move(*node));
    return {};
}

auto Interpreter::opAppendChildren(AppendChildren const& m) -> Expected<void> {
    auto parent = this->handles.resolve(m.id);
    if (!parent) {
        return std::unexpected(parent.error());
    }
    auto children = this->popMany(m.m);
    if (!children) {
        return std::unexpected(children.error());
    }
    for (auto const& child : *children) {
        if (auto appended = (*parent)->appendChild(child); !appended) {
            return appended;
        }
    }
    return {};
}

auto Interpreter::opCreateTextNode(CreateTextNode const& m) -> Expected<void> {
    return this->pushAndBind(m.id, Dom::Node::createText(m.text));
}

auto Interpreter::opCreatePlaceholder(CreatePlaceholder const& m) -> Expected<void> {
    return this->pushAndBind(m.id, Dom::Node::createComment(std::string{Templates::TemplateRegistry::kPlaceholderText}));
}

auto Interpreter::opLoadTemplate(LoadTemplate const& m) -> Expected<void> {
    auto node = this->templates.instantiate(m.templateId, m.index);
    if (!node) {
        return std::unexpected(node.error());
    }
    return this->pushAndBind(m.id, std::move(*node));
}

auto Interpreter::opAssignId(AssignId const& m) -> Expected<void> {
    if (this->stack.empty()) {
        return std::unexpected(Error{Error::Code::StackUnderflow, "AssignId needs a node on the stack"});
    }
    auto target = this->navigate(this->stack.back(), m.path);
    if (!target) {
        return std::unexpected(target.error());
    }
    return this->bindHandle(m.id, *target);
}

auto Interpreter::opSetAttribute(SetAttribute const& m) -> Expected<void> {
    auto node = this->handles.resolve(m.id);
    if (!node) {
        return std::unexpected(node.error());
    }
    if (!(*node)->isElement()) {
        return {};
    }
    if (auto uri = namespaceUri(m.ns)) {
        (*node)->setAttributeNS(*uri, m.name, m.value);
    } else {
        (*node)->setAttribute(m.name, m.value);
    }
    return {};
}

auto Interpreter::opSetText(SetText const& m) -> Expected<void> {
    auto node = this->handles.resolve(m.id);
    if (!node) {
        return std::unexpected(node.error());
    }
    (*node)->setTextContent(m.text);
    return {};
}

auto Interpreter::opNewEventListener(NewEventListener const& m) -> Expected<void> {
    auto node = this->handles.resolve(m.id);
    if (!node) {
        return std::unexpected(node.error());
    }
    if (!(*node)->isElement()) {
        return {};
    }

    auto& byName = this->listeners[m.id];
    if (auto it = byName.find(m.name); it != byName.end()) {
        this->detachNative(it->second, m.name);
        byName.erase(it);
    }

    Dom::EventListener callback = this->sink != nullptr ? this->sink->attachListener(m.id, m.name, m.handlerId)
                                                        : Dom::EventListener{[](Dom::Event&) {}};
    auto const id = (*node)->addEventListener(m.name, std::move(callback));
    byName.insert_or_assign(m.name, ListenerEntry{*node, id});
    tp_log(std::format("listener {} '{}' -> handler {}", m.id, m.name, m.handlerId), LogTag::Runtime);
    return {};
}

auto Interpreter::opRemoveEventListener(RemoveEventListener const& m) -> Expected<void> {
    auto node = this->handles.resolve(m.id);
    if (!node) {
        return std::unexpected(node.error());
    }
    if (!(*node)->isElement()) {
        return {};
    }
    auto it = this->listeners.find(m.id);
    if (it == this->listeners.end()) {
        return {};
    }
    auto& byName = it->second;
    if (auto entry = byName.find(m.name); entry != byName.end()) {
        this->detachNative(entry->second, m.name);
        byName.erase(entry);
        if (this->sink != nullptr) {
            this->sink->detachListener(m.id, m.name);
        }
    }
    if (byName.empty()) {
        this->listeners.erase(it);
    }
    return {};
}

auto Interpreter::opRemove(Remove const& m) -> Expected<void> {
    if (m.id == kRootHandle) {
        return std::unexpected(Error{Error::Code::ReservedHandle, "the mount point cannot be removed"});
    }
    auto node = this->handles.resolve(m.id);
    if (!node) {
        return std::unexpected(node.error());
    }
    (*node)->remove();
    if (auto unbound = this->handles.unbind(m.id); !unbound) {
        return std::unexpected(unbound.error());
    }
    this->purgeListeners(m.id);
    this->releaseDescendants(**node);
    return {};
}

auto Interpreter::opReplaceWith(ReplaceWith const& m) -> Expected<void> {
    if (m.id == kRootHandle) {
        return std::unexpected(Error{Error::Code::ReservedHandle, "the mount point cannot be replaced"});
    }
    auto target = this->handles.resolve(m.id);
    if (!target) {
        return std::unexpected(target.error());
    }
    auto replacements = this->popMany(m.m);
    if (!replacements) {
        return std::unexpected(replacements.error());
    }
    if (auto replaced = this->replaceNode(*target, *replacements); !replaced) {
        return replaced;
    }
    if (auto unbound = this->handles.unbind(m.id); !unbound) {
        return std::unexpected(unbound.error());
    }
    this->purgeListeners(m.id);
    this->releaseDescendants(**target);
    return {};
}

auto Interpreter::opReplacePlaceholder(ReplacePlaceholder const& m) -> Expected<void> {
    // The template root sits beneath the m replacements and stays on the stack.
    if (this->stack.size() < static_cast<std::size_t>(m.m) + 1) {
        return std::unexpected(Error{Error::Code::StackUnderflow,
                                     std::format("need {} operands including the template root, stack holds {}",
                                                 static_cast<std::size_t>(m.m) + 1,
                                                 this->stack.size())});
    }
    auto replacements = this->popMany(m.m);
    if (!replacements) {
        return std::unexpected(replacements.error());
    }
    auto target = this->navigate(this->stack.back(), m.path);
    if (!target) {
        return std::unexpected(target.error());
    }
    return this->replaceNode(*target, *replacements);
}

auto Interpreter::opInsertAfter(InsertAfter const& m) -> Expected<void> {
    auto ref = this->handles.resolve(m.id);
    if (!ref) {
        return std::unexpected(ref.error());
    }
    auto nodes = this->popMany(m.m);
    if (!nodes) {
        return std::unexpected(nodes.error());
    }
    auto* parent = (*ref)->parent();
    if (parent == nullptr) {
        return {};
    }
    auto insertPoint = (*ref)->nextSibling();
    for (auto const& node : *nodes) {
        if (auto inserted = parent->insertBefore(node, insertPoint.get()); !inserted) {
            return inserted;
        }
        insertPoint = node->nextSibling();
    }
    return {};
}

auto Interpreter::opInsertBefore(InsertBefore const& m) -> Expected<void> {
    auto ref = this->handles.resolve(m.id);
    if (!ref) {
        return std::unexpected(ref.error());
    }
    auto nodes = this->popMany(m.m);
    if (!nodes) {
        return std::unexpected(nodes.error());
    }
    auto* parent = (*ref)->parent();
    if (parent == nullptr) {
        return {};
    }
    for (auto const& node : *nodes) {
        if (auto inserted = parent->insertBefore(node, ref->get()); !inserted) {
            return inserted;
        }
    }
    return {};
}

} // namespace TP::Runtime
