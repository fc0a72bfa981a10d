#include <treepatch/runtime/HandleTable.hpp>

#include <format>

namespace TP::Runtime {

HandleTable::HandleTable(Dom::Node::Ptr const& root)
    : rootNode(root) {
    this->forward.emplace(kRootHandle, root);
    this->reverse.emplace(root.get(), kRootHandle);
}

auto HandleTable::find(ElementId handle) const -> Dom::Node::Ptr {
    auto it = this->forward.find(handle);
    if (it == this->forward.end()) {
        return nullptr;
    }
    return it->second.lock();
}

auto HandleTable::resolve(ElementId handle) const -> Expected<Dom::Node::Ptr> {
    auto node = this->find(handle);
    if (!node) {
        return std::unexpected(Error{Error::Code::UnknownHandle, std::format("handle {} is not bound", handle)});
    }
    return node;
}

auto HandleTable::bind(ElementId handle, Dom::Node::Ptr const& node) -> Expected<bool> {
    if (handle == kRootHandle) {
        return std::unexpected(Error{Error::Code::ReservedHandle, "handle 0 is reserved for the mount point"});
    }
    if (!node) {
        return std::unexpected(Error{Error::Code::InvalidError, std::format("cannot bind handle {} to a null node", handle)});
    }

    bool displaced = false;
    auto it        = this->forward.find(handle);
    if (it != this->forward.end()) {
        auto previous = it->second.lock();
        if (previous) {
            auto rit = this->reverse.find(previous.get());
            if (rit != this->reverse.end() && rit->second == handle) {
                this->reverse.erase(rit);
            }
        }
        displaced  = previous != node;
        it->second = node;
    } else {
        this->forward.emplace(handle, node);
    }
    this->reverse.insert_or_assign(node.get(), handle);
    return displaced;
}

auto HandleTable::unbind(ElementId handle) -> Expected<bool> {
    if (handle == kRootHandle) {
        return std::unexpected(Error{Error::Code::ReservedHandle, "handle 0 cannot be removed"});
    }
    auto it = this->forward.find(handle);
    if (it == this->forward.end()) {
        return false;
    }
    if (auto node = it->second.lock()) {
        auto rit = this->reverse.find(node.get());
        if (rit != this->reverse.end() && rit->second == handle) {
            this->reverse.erase(rit);
        }
    }
    this->forward.erase(it);
    return true;
}

auto HandleTable::handleOf(Dom::Node const* node) const -> std::optional<ElementId> {
    if (node == nullptr) {
        return std::nullopt;
    }
    auto rit = this->reverse.find(node);
    if (rit == this->reverse.end()) {
        return std::nullopt;
    }
    // A freed node's address can be reused; trust the entry only if the forward side agrees.
    auto fit = this->forward.find(rit->second);
    if (fit == this->forward.end()) {
        return std::nullopt;
    }
    auto bound = fit->second.lock();
    if (bound.get() != node) {
        return std::nullopt;
    }
    return rit->second;
}

auto HandleTable::contains(ElementId handle) const -> bool {
    return this->find(handle) != nullptr;
}

} // namespace TP::Runtime
