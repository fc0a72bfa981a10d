#pragma once

#include <treepatch/core/Error.hpp>
#include <treepatch/dom/Node.hpp>
#include <treepatch/protocol/Opcode.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <memory>
#include <optional>

namespace TP::Runtime {

using Protocol::ElementId;

inline constexpr ElementId kRootHandle = 0;

/**
 * Producer-chosen integer handles mapped to live nodes.
 *
 * Entries are weak: the table never keeps a node alive. Handle 0 is seeded
 * with the mount point at construction and can neither be rebound nor
 * unbound. A reverse index answers "which handle names this node".
 */
class HandleTable {
public:
    explicit HandleTable(Dom::Node::Ptr const& root);

    HandleTable(HandleTable const&)            = delete;
    HandleTable& operator=(HandleTable const&) = delete;

    // Fails with UnknownHandle when unbound or when the node has been destroyed.
    [[nodiscard]] auto resolve(ElementId handle) const -> Expected<Dom::Node::Ptr>;
    [[nodiscard]] auto find(ElementId handle) const -> Dom::Node::Ptr;

    // Binding an already-bound handle replaces its node. Yields true when the
    // handle previously named a different node, live or destroyed.
    auto bind(ElementId handle, Dom::Node::Ptr const& node) -> Expected<bool>;
    auto unbind(ElementId handle) -> Expected<bool>;

    // Handle currently naming node, if any.
    [[nodiscard]] auto handleOf(Dom::Node const* node) const -> std::optional<ElementId>;
    [[nodiscard]] auto contains(ElementId handle) const -> bool;
    [[nodiscard]] auto size() const -> std::size_t { return this->forward.size(); }

    [[nodiscard]] auto root() const -> Dom::Node::Ptr const& { return this->rootNode; }

private:
    Dom::Node::Ptr                                          rootNode;
    phmap::flat_hash_map<ElementId, std::weak_ptr<Dom::Node>> forward;
    phmap::flat_hash_map<Dom::Node const*, ElementId>       reverse;
};

} // namespace TP::Runtime
