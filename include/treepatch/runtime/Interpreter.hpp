#pragma once

#include <treepatch/core/Error.hpp>
#include <treepatch/dom/Node.hpp>
#include <treepatch/protocol/Mutation.hpp>
#include <treepatch/runtime/HandleTable.hpp>
#include <treepatch/runtime/ListenerSink.hpp>
#include <treepatch/templates/TemplateRegistry.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace TP::Runtime {

struct ApplyStats {
    std::size_t mutations     = 0;
    std::size_t bytesConsumed = 0;
    bool        reachedEnd    = false;
};

/**
 * Stack machine that replays mutation records against one mount point.
 *
 * Node-producing records push onto the operand stack and bind a handle;
 * structural records pop a declared number of operands. Any fatal error
 * (stack underflow, unknown handle, unknown template, out of range path)
 * stops the current buffer; mutations applied before it stay in the tree and
 * the operand stack is cleared.
 */
class Interpreter {
public:
    Interpreter(Dom::Node::Ptr root, Templates::TemplateRegistry& templates);
    ~Interpreter();

    Interpreter(Interpreter const&)            = delete;
    Interpreter& operator=(Interpreter const&) = delete;

    // Decodes and applies [offset, offset + length) of buffer.
    auto applyMutations(std::span<std::uint8_t const> buffer, std::size_t offset, std::size_t length)
        -> Expected<ApplyStats>;
    auto applyMutations(std::span<std::uint8_t const> buffer) -> Expected<ApplyStats>;

    auto handleMutation(Protocol::Mutation const& mutation) -> Expected<void>;

    // Non-owning; pass nullptr to fall back to inert listeners.
    void setListenerSink(ListenerSink* sink) { this->sink = sink; }

    [[nodiscard]] auto getNode(ElementId handle) const -> Dom::Node::Ptr { return this->handles.find(handle); }
    [[nodiscard]] auto stackSize() const -> std::size_t { return this->stack.size(); }
    [[nodiscard]] auto stackTop() const -> Dom::Node::Ptr;
    [[nodiscard]] auto root() const -> Dom::Node::Ptr const& { return this->rootNode; }
    [[nodiscard]] auto nodeCount() const -> std::size_t { return this->handles.size(); }
    [[nodiscard]] auto listenerCount(ElementId handle) const -> std::size_t;
    // Listener entries across all handles.
    [[nodiscard]] auto listenerCount() const -> std::size_t;
    [[nodiscard]] auto handleTable() const -> HandleTable const& { return this->handles; }

private:
    struct ListenerEntry {
        std::weak_ptr<Dom::Node> node;
        Dom::ListenerId          id = 0;
    };
    using ListenerMap = phmap::flat_hash_map<std::string, ListenerEntry>;

    auto popMany(std::size_t count) -> Expected<std::vector<Dom::Node::Ptr>>;
    auto navigate(Dom::Node::Ptr node, Protocol::NodePath const& path) const -> Expected<Dom::Node::Ptr>;
    auto pushAndBind(ElementId handle, Dom::Node::Ptr node) -> Expected<void>;
    auto bindHandle(ElementId handle, Dom::Node::Ptr const& node) -> Expected<void>;
    void releaseDescendants(Dom::Node const& node);
    auto replaceNode(Dom::Node::Ptr const& target, std::vector<Dom::Node::Ptr> const& replacements) -> Expected<void>;
    void purgeListeners(ElementId handle);
    void detachNative(ListenerEntry const& entry, std::string const& eventName);

    auto opPushRoot(Protocol::PushRoot const& m) -> Expected<void>;
    auto opAppendChildren(Protocol::AppendChildren const& m) -> Expected<void>;
    auto opCreateTextNode(Protocol::CreateTextNode const& m) -> Expected<void>;
    auto opCreatePlaceholder(Protocol::CreatePlaceholder const& m) -> Expected<void>;
    auto opLoadTemplate(Protocol::LoadTemplate const& m) -> Expected<void>;
    auto opAssignId(Protocol::AssignId const& m) -> Expected<void>;
    auto opSetAttribute(Protocol::SetAttribute const& m) -> Expected<void>;
    auto opSetText(Protocol::SetText const& m) -> Expected<void>;
    auto opNewEventListener(Protocol::NewEventListener const& m) -> Expected<void>;
    auto opRemoveEventListener(Protocol::RemoveEventListener const& m) -> Expected<void>;
    auto opRemove(Protocol::Remove const& m) -> Expected<void>;
    auto opReplaceWith(Protocol::ReplaceWith const& m) -> Expected<void>;
    auto opReplacePlaceholder(Protocol::ReplacePlaceholder const& m) -> Expected<void>;
    auto opInsertAfter(Protocol::InsertAfter const& m) -> Expected<void>;
    auto opInsertBefore(Protocol::InsertBefore const& m) -> Expected<void>;

    Dom::Node::Ptr                                rootNode;
    Templates::TemplateRegistry&                  templates;
    HandleTable                                   handles;
    std::vector<Dom::Node::Ptr>                   stack;
    phmap::flat_hash_map<ElementId, ListenerMap>  listeners;
    ListenerSink*                                 sink = nullptr;
};

} // namespace TP::Runtime
