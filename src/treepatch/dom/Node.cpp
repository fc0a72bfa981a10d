#include <treepatch/dom/Node.hpp>

#include <algorithm>
#include <utility>

namespace TP::Dom {

namespace {

auto hierarchy_error(std::string message) -> Error {
    return Error{Error::Code::HierarchyRequest, std::move(message)};
}

} // namespace

Node::Node(NodeKind kind)
    : kind_(kind) {}

Node::~Node() {
    for (auto& child : this->children_) {
        child->parent_ = nullptr;
    }
}

auto Node::createElement(std::string tag) -> Ptr {
    Ptr node{new Node(NodeKind::Element)};
    node->tag_ = std::move(tag);
    return node;
}

auto Node::createText(std::string text) -> Ptr {
    Ptr node{new Node(NodeKind::Text)};
    node->data_ = std::move(text);
    return node;
}

auto Node::createComment(std::string text) -> Ptr {
    Ptr node{new Node(NodeKind::Comment)};
    node->data_ = std::move(text);
    return node;
}

auto Node::nodeName() const -> std::string {
    switch (this->kind_) {
    case NodeKind::Element:
        return this->tag_;
    case NodeKind::Text:
        return "#text";
    case NodeKind::Comment:
        return "#comment";
    }
    return {};
}

auto Node::childAt(std::size_t index) const -> Ptr {
    if (index >= this->children_.size()) {
        return nullptr;
    }
    return this->children_[index];
}

auto Node::indexInParent() const -> std::optional<std::size_t> {
    if (!this->parent_) {
        return std::nullopt;
    }
    auto const& siblings = this->parent_->children_;
    for (std::size_t i = 0; i < siblings.size(); ++i) {
        if (siblings[i].get() == this) {
            return i;
        }
    }
    return std::nullopt;
}

auto Node::nextSibling() const -> Ptr {
    auto index = this->indexInParent();
    if (!index) {
        return nullptr;
    }
    return this->parent_->childAt(*index + 1);
}

auto Node::previousSibling() const -> Ptr {
    auto index = this->indexInParent();
    if (!index || *index == 0) {
        return nullptr;
    }
    return this->parent_->childAt(*index - 1);
}

auto Node::contains(Node const* other) const noexcept -> bool {
    for (auto const* cursor = other; cursor != nullptr; cursor = cursor->parent_) {
        if (cursor == this) {
            return true;
        }
    }
    return false;
}

auto Node::adopt(Ptr const& child) -> Expected<void> {
    if (!child) {
        return std::unexpected(hierarchy_error("cannot insert a null node"));
    }
    if (!this->isElement()) {
        return std::unexpected(hierarchy_error(this->nodeName() + " nodes cannot have children"));
    }
    if (child->contains(this)) {
        return std::unexpected(hierarchy_error("cannot insert a node into its own subtree"));
    }
    child->remove();
    return {};
}

auto Node::appendChild(Ptr const& child) -> Expected<void> {
    if (auto status = this->adopt(child); !status) {
        return status;
    }
    child->parent_ = this;
    this->children_.push_back(child);
    return {};
}

auto Node::insertBefore(Ptr const& child, Node const* ref) -> Expected<void> {
    if (ref == nullptr) {
        return this->appendChild(child);
    }
    if (ref->parent_ != this) {
        return std::unexpected(Error{Error::Code::NotFound, "reference node is not a child of this node"});
    }
    if (child.get() == ref) {
        return {};
    }
    if (auto status = this->adopt(child); !status) {
        return status;
    }
    auto it = std::find_if(this->children_.begin(), this->children_.end(), [ref](Ptr const& p) { return p.get() == ref; });
    child->parent_ = this;
    this->children_.insert(it, child);
    return {};
}

auto Node::replaceChild(Ptr const& child, Node const* old) -> Expected<Ptr> {
    if (old == nullptr || old->parent_ != this) {
        return std::unexpected(Error{Error::Code::NotFound, "node to replace is not a child of this node"});
    }
    auto keep = this->childAt(*old->indexInParent());
    if (child.get() == old) {
        return keep;
    }
    if (auto status = this->adopt(child); !status) {
        return std::unexpected(status.error());
    }
    auto it = std::find_if(this->children_.begin(), this->children_.end(), [old](Ptr const& p) { return p.get() == old; });
    child->parent_ = this;
    *it            = child;
    keep->parent_  = nullptr;
    return keep;
}

auto Node::removeChild(Node const* child) -> Expected<Ptr> {
    auto it = std::find_if(this->children_.begin(), this->children_.end(), [child](Ptr const& p) { return p.get() == child; });
    if (it == this->children_.end()) {
        return std::unexpected(Error{Error::Code::NotFound, "node is not a child of this node"});
    }
    auto removed     = std::move(*it);
    this->children_.erase(it);
    removed->parent_ = nullptr;
    return removed;
}

void Node::remove() {
    if (!this->parent_) {
        return;
    }
    auto& siblings = this->parent_->children_;
    auto  it       = std::find_if(siblings.begin(), siblings.end(), [this](Ptr const& p) { return p.get() == this; });
    this->parent_  = nullptr;
    if (it != siblings.end()) {
        // Erasing may drop the last owning reference to this node.
        auto self = std::move(*it);
        siblings.erase(it);
    }
}

auto Node::textContent() const -> std::string {
    if (!this->isElement()) {
        return this->data_;
    }
    std::string text;
    for (auto const& child : this->children_) {
        if (child->isComment()) {
            continue;
        }
        text += child->textContent();
    }
    return text;
}

void Node::setTextContent(std::string text) {
    if (!this->isElement()) {
        this->data_ = std::move(text);
        return;
    }
    for (auto& child : this->children_) {
        child->parent_ = nullptr;
    }
    this->children_.clear();
    if (!text.empty()) {
        auto node     = createText(std::move(text));
        node->parent_ = this;
        this->children_.push_back(std::move(node));
    }
}

auto Node::findAttribute(std::string_view namespaceUri, std::string_view name) -> Attribute* {
    for (auto& attr : this->attributes_) {
        if (attr.namespaceUri == namespaceUri && attr.name == name) {
            return &attr;
        }
    }
    return nullptr;
}

auto Node::getAttribute(std::string_view name) const -> std::optional<std::string> {
    for (auto const& attr : this->attributes_) {
        if (attr.name == name) {
            return attr.value;
        }
    }
    return std::nullopt;
}

auto Node::getAttributeNS(std::string_view namespaceUri, std::string_view name) const -> std::optional<std::string> {
    for (auto const& attr : this->attributes_) {
        if (attr.namespaceUri == namespaceUri && attr.name == name) {
            return attr.value;
        }
    }
    return std::nullopt;
}

auto Node::hasAttribute(std::string_view name) const -> bool {
    return this->getAttribute(name).has_value();
}

void Node::setAttribute(std::string_view name, std::string_view value) {
    this->setAttributeNS({}, name, value);
}

void Node::setAttributeNS(std::string_view namespaceUri, std::string_view name, std::string_view value) {
    if (!this->isElement()) {
        return;
    }
    if (auto* existing = this->findAttribute(namespaceUri, name)) {
        existing->value.assign(value.begin(), value.end());
        return;
    }
    this->attributes_.push_back(Attribute{std::string{namespaceUri}, std::string{name}, std::string{value}});
}

auto Node::removeAttribute(std::string_view name) -> bool {
    auto it = std::find_if(this->attributes_.begin(), this->attributes_.end(), [name](Attribute const& a) { return a.name == name; });
    if (it == this->attributes_.end()) {
        return false;
    }
    this->attributes_.erase(it);
    return true;
}

auto Node::cloneNode(bool deep) const -> Ptr {
    Ptr copy{new Node(this->kind_)};
    copy->tag_        = this->tag_;
    copy->data_       = this->data_;
    copy->attributes_ = this->attributes_;
    if (deep) {
        copy->children_.reserve(this->children_.size());
        for (auto const& child : this->children_) {
            auto childCopy     = child->cloneNode(true);
            childCopy->parent_ = copy.get();
            copy->children_.push_back(std::move(childCopy));
        }
    }
    return copy;
}

auto Node::isEqualNode(Node const& other) const -> bool {
    if (this->kind_ != other.kind_ || this->tag_ != other.tag_ || this->data_ != other.data_) {
        return false;
    }
    if (this->attributes_.size() != other.attributes_.size()) {
        return false;
    }
    for (auto const& attr : this->attributes_) {
        if (std::find(other.attributes_.begin(), other.attributes_.end(), attr) == other.attributes_.end()) {
            return false;
        }
    }
    if (this->children_.size() != other.children_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < this->children_.size(); ++i) {
        if (!this->children_[i]->isEqualNode(*other.children_[i])) {
            return false;
        }
    }
    return true;
}

auto Node::addEventListener(std::string type, EventListener listener, bool capture) -> ListenerId {
    auto id = this->nextListenerId_++;
    this->listeners_.push_back(ListenerEntry{.id = id, .type = std::move(type), .capture = capture, .callback = std::move(listener)});
    return id;
}

auto Node::removeEventListener(std::string_view type, ListenerId id) -> bool {
    auto it = std::find_if(this->listeners_.begin(), this->listeners_.end(), [&](ListenerEntry const& entry) {
        return entry.id == id && entry.type == type;
    });
    if (it == this->listeners_.end()) {
        return false;
    }
    this->listeners_.erase(it);
    return true;
}

auto Node::listenerCount(std::string_view type) const -> std::size_t {
    return static_cast<std::size_t>(std::count_if(this->listeners_.begin(), this->listeners_.end(), [type](ListenerEntry const& entry) {
        return entry.type == type;
    }));
}

auto Node::invokeListeners(Event& event, bool capturePhase, bool targetPhase) -> std::size_t {
    std::vector<std::pair<ListenerId, EventListener>> snapshot;
    for (auto const& entry : this->listeners_) {
        if (entry.type != event.type) {
            continue;
        }
        if (!targetPhase && entry.capture != capturePhase) {
            continue;
        }
        snapshot.emplace_back(entry.id, entry.callback);
    }

    std::size_t invoked = 0;
    event.currentTarget = this;
    for (auto& [id, callback] : snapshot) {
        auto stillAttached = std::any_of(this->listeners_.begin(), this->listeners_.end(), [id](ListenerEntry const& entry) {
            return entry.id == id;
        });
        if (!stillAttached || !callback) {
            continue;
        }
        callback(event);
        ++invoked;
    }
    return invoked;
}

auto Node::dispatchEvent(Event& event) -> std::size_t {
    event.target             = this;
    event.propagationStopped = false;

    // Ancestors ordered root first; held so listeners may detach nodes mid-dispatch.
    std::vector<Ptr> ancestors;
    for (auto* cursor = this->parent_; cursor != nullptr; cursor = cursor->parent_) {
        if (auto locked = cursor->weak_from_this().lock()) {
            ancestors.push_back(std::move(locked));
        }
    }
    std::reverse(ancestors.begin(), ancestors.end());
    auto self = this->weak_from_this().lock();

    std::size_t invoked = 0;
    for (auto const& ancestor : ancestors) {
        invoked += ancestor->invokeListeners(event, true, false);
        if (event.propagationStopped) {
            event.currentTarget = nullptr;
            return invoked;
        }
    }

    invoked += this->invokeListeners(event, false, true);

    if (event.bubbles && !event.propagationStopped) {
        for (auto it = ancestors.rbegin(); it != ancestors.rend(); ++it) {
            invoked += (*it)->invokeListeners(event, false, false);
            if (event.propagationStopped) {
                break;
            }
        }
    }
    event.currentTarget = nullptr;
    return invoked;
}

} // namespace TP::Dom
