#pragma once

#include <treepatch/core/Error.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TP::Dom {

enum class NodeKind : std::uint8_t {
    Element,
    Text,
    Comment,
};

struct Attribute {
    std::string namespaceUri;
    std::string name;
    std::string value;

    bool operator==(Attribute const&) const = default;
};

class Node;

struct Event {
    std::string type;
    // Payload for input/change events; empty means "read the target's value attribute".
    std::string value;
    bool        bubbles = true;

    Node* target        = nullptr;
    Node* currentTarget = nullptr;
    bool  propagationStopped = false;

    void stopPropagation() { propagationStopped = true; }
};

using EventListener = std::function<void(Event&)>;
using ListenerId    = std::uint64_t;

/**
 * A node in the live document tree.
 *
 * Ownership runs downwards: a parent holds shared references to its children
 * and each child keeps a raw back-pointer to its parent. Detached nodes are
 * kept alive by whoever holds them (the interpreter stack, the template
 * registry, or the caller).
 *
 * Event listeners are attached per node and are never copied by cloneNode().
 */
class Node final : public std::enable_shared_from_this<Node> {
public:
    using Ptr = std::shared_ptr<Node>;

    static auto createElement(std::string tag) -> Ptr;
    static auto createText(std::string text) -> Ptr;
    static auto createComment(std::string text) -> Ptr;

    ~Node();

    Node(Node const&)            = delete;
    Node& operator=(Node const&) = delete;

    [[nodiscard]] auto kind() const noexcept -> NodeKind { return this->kind_; }
    [[nodiscard]] auto isElement() const noexcept -> bool { return this->kind_ == NodeKind::Element; }
    [[nodiscard]] auto isText() const noexcept -> bool { return this->kind_ == NodeKind::Text; }
    [[nodiscard]] auto isComment() const noexcept -> bool { return this->kind_ == NodeKind::Comment; }

    // Tag name for elements, "#text"/"#comment" otherwise.
    [[nodiscard]] auto nodeName() const -> std::string;
    [[nodiscard]] auto tagName() const -> std::string const& { return this->tag_; }

    // Character data of text and comment nodes.
    [[nodiscard]] auto data() const -> std::string const& { return this->data_; }
    void               setData(std::string data) { this->data_ = std::move(data); }

    // Tree structure
    [[nodiscard]] auto parent() const noexcept -> Node* { return this->parent_; }
    [[nodiscard]] auto children() const noexcept -> std::vector<Ptr> const& { return this->children_; }
    [[nodiscard]] auto childCount() const noexcept -> std::size_t { return this->children_.size(); }
    [[nodiscard]] auto childAt(std::size_t index) const -> Ptr;
    [[nodiscard]] auto indexInParent() const -> std::optional<std::size_t>;
    [[nodiscard]] auto nextSibling() const -> Ptr;
    [[nodiscard]] auto previousSibling() const -> Ptr;
    [[nodiscard]] auto contains(Node const* other) const noexcept -> bool;

    auto appendChild(Ptr const& child) -> Expected<void>;
    // Inserts child before ref; a null ref appends.
    auto insertBefore(Ptr const& child, Node const* ref) -> Expected<void>;
    auto replaceChild(Ptr const& child, Node const* old) -> Expected<Ptr>;
    auto removeChild(Node const* child) -> Expected<Ptr>;
    // Detaches this node from its parent, if any.
    void remove();

    [[nodiscard]] auto textContent() const -> std::string;
    void               setTextContent(std::string text);

    // Attributes (elements only; other kinds ignore writes)
    [[nodiscard]] auto attributes() const noexcept -> std::vector<Attribute> const& { return this->attributes_; }
    [[nodiscard]] auto getAttribute(std::string_view name) const -> std::optional<std::string>;
    [[nodiscard]] auto getAttributeNS(std::string_view namespaceUri, std::string_view name) const -> std::optional<std::string>;
    [[nodiscard]] auto hasAttribute(std::string_view name) const -> bool;
    void               setAttribute(std::string_view name, std::string_view value);
    void               setAttributeNS(std::string_view namespaceUri, std::string_view name, std::string_view value);
    auto               removeAttribute(std::string_view name) -> bool;

    [[nodiscard]] auto cloneNode(bool deep) const -> Ptr;
    [[nodiscard]] auto isEqualNode(Node const& other) const -> bool;

    // Events
    auto addEventListener(std::string type, EventListener listener, bool capture = false) -> ListenerId;
    auto removeEventListener(std::string_view type, ListenerId id) -> bool;
    [[nodiscard]] auto listenerCount(std::string_view type) const -> std::size_t;
    [[nodiscard]] auto listenerCount() const noexcept -> std::size_t { return this->listeners_.size(); }
    // Runs capture, target and bubble phases; returns the number of listeners invoked.
    auto dispatchEvent(Event& event) -> std::size_t;

private:
    struct ListenerEntry {
        ListenerId    id = 0;
        std::string   type;
        bool          capture = false;
        EventListener callback;
    };

    explicit Node(NodeKind kind);

    auto adopt(Ptr const& child) -> Expected<void>;
    auto findAttribute(std::string_view namespaceUri, std::string_view name) -> Attribute*;
    auto invokeListeners(Event& event, bool capturePhase, bool targetPhase) -> std::size_t;

    NodeKind                   kind_;
    std::string                tag_;
    std::string                data_;
    Node*                      parent_ = nullptr;
    std::vector<Ptr>           children_;
    std::vector<Attribute>     attributes_;
    std::vector<ListenerEntry> listeners_;
    ListenerId                 nextListenerId_ = 1;
};

} // namespace TP::Dom
