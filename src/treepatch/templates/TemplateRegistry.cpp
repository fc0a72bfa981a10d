#include <treepatch/dom/Markup.hpp>
#include <treepatch/templates/Tags.hpp>
#include <treepatch/templates/TemplateRegistry.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <format>
#include <type_traits>
#include <utility>
#include <variant>

namespace TP::Templates {

namespace {

using Protocol::RegisterTemplate;
using Protocol::TemplateDynamicAttr;
using Protocol::TemplateDynamicNode;
using Protocol::TemplateDynamicTextNode;
using Protocol::TemplateElementNode;
using Protocol::TemplateStaticAttr;
using Protocol::TemplateTextNode;

auto invalid(TemplateId id, std::string const& what) -> Error {
    tp_log(std::format("template {} rejected: {}", id, what), LogTag::Templates, LogTag::Error);
    return Error{Error::Code::InvalidTemplate, std::format("template {}: {}", id, what)};
}

enum class Visit : std::uint8_t { Unseen, Active, Done };

// Checks table bounds, rejects cycles reachable from the roots and bounds the
// depth and node count of what each root materializes into. Shared subtrees
// count once per reference.
class BlueprintValidator {
public:
    explicit BlueprintValidator(RegisterTemplate const& blueprint)
        : blueprint(blueprint),
          state(blueprint.nodes.size(), Visit::Unseen),
          height(blueprint.nodes.size(), 0),
          expanded(blueprint.nodes.size(), 0) {}

    auto run() -> Expected<void> {
        for (auto root : this->blueprint.rootIndices) {
            if (root >= this->blueprint.nodes.size()) {
                return std::unexpected(invalid(this->blueprint.templateId,
                                               std::format("root index {} outside node table of {}", root, this->blueprint.nodes.size())));
            }
            if (auto result = this->walk(root); !result) {
                return result;
            }
        }
        return {};
    }

private:
    struct Frame {
        std::uint16_t index;
        std::size_t   next = 0;
    };

    auto childrenOf(std::uint16_t index) const -> std::vector<std::uint16_t> const* {
        if (auto const* element = std::get_if<TemplateElementNode>(&this->blueprint.nodes[index])) {
            return &element->children;
        }
        return nullptr;
    }

    auto enter(std::uint16_t index) -> Expected<void> {
        if (auto const* element = std::get_if<TemplateElementNode>(&this->blueprint.nodes[index])) {
            auto const attrEnd = static_cast<std::size_t>(element->attrFirst) + element->attrCount;
            if (attrEnd > this->blueprint.attrs.size()) {
                return std::unexpected(invalid(this->blueprint.templateId,
                                               std::format("node {} attribute range [{}, {}) outside attribute table of {}",
                                                           index,
                                                           element->attrFirst,
                                                           attrEnd,
                                                           this->blueprint.attrs.size())));
            }
        }
        this->state[index] = Visit::Active;
        return {};
    }

    auto leave(std::uint16_t index) -> Expected<void> {
        std::size_t deepest = 0;
        std::size_t total   = 1;
        if (auto const* children = this->childrenOf(index)) {
            for (auto child : *children) {
                deepest = std::max(deepest, this->height[child]);
                total   = std::min(total + this->expanded[child], TemplateRegistry::kMaxInstanceNodes + 1);
            }
        }
        this->height[index]   = deepest + 1;
        this->expanded[index] = total;
        if (this->height[index] > TemplateRegistry::kMaxDepth) {
            return std::unexpected(invalid(this->blueprint.templateId,
                                           std::format("node {} nests deeper than {} levels", index, TemplateRegistry::kMaxDepth)));
        }
        if (total > TemplateRegistry::kMaxInstanceNodes) {
            return std::unexpected(invalid(this->blueprint.templateId,
                                           std::format("node {} expands to more than {} nodes",
                                                       index,
                                                       TemplateRegistry::kMaxInstanceNodes)));
        }
        this->state[index] = Visit::Done;
        return {};
    }

    // Iterative post-order walk; the explicit stack keeps deep chains off the call stack.
    auto walk(std::uint16_t root) -> Expected<void> {
        if (this->state[root] == Visit::Done) {
            return {};
        }
        if (auto entered = this->enter(root); !entered) {
            return entered;
        }
        std::vector<Frame> pending{Frame{root}};
        while (!pending.empty()) {
            auto const  index    = pending.back().index;
            auto const* children = this->childrenOf(index);
            if (children != nullptr && pending.back().next < children->size()) {
                auto const child = (*children)[pending.back().next++];
                if (child >= this->blueprint.nodes.size()) {
                    return std::unexpected(invalid(this->blueprint.templateId,
                                                   std::format("node {} child index {} outside node table", index, child)));
                }
                if (this->state[child] == Visit::Active) {
                    return std::unexpected(invalid(this->blueprint.templateId, std::format("node {} is part of a cycle", child)));
                }
                if (this->state[child] == Visit::Unseen) {
                    if (auto entered = this->enter(child); !entered) {
                        return entered;
                    }
                    pending.push_back(Frame{child});
                }
                continue;
            }
            if (auto left = this->leave(index); !left) {
                return left;
            }
            pending.pop_back();
        }
        return {};
    }

    RegisterTemplate const&  blueprint;
    std::vector<Visit>       state;
    std::vector<std::size_t> height;
    std::vector<std::size_t> expanded;
};

// One node without its children.
auto createNode(RegisterTemplate const& blueprint, std::uint16_t index) -> Dom::Node::Ptr {
    return std::visit(
        [&blueprint](auto const& node) -> Dom::Node::Ptr {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, TemplateElementNode>) {
                auto element = Dom::Node::createElement(std::string{tagName(node.tag)});
                for (std::size_t i = 0; i < node.attrCount; ++i) {
                    // Dynamic attributes are filled later by SetAttribute.
                    if (auto const* attr = std::get_if<TemplateStaticAttr>(&blueprint.attrs[node.attrFirst + i])) {
                        element->setAttribute(attr->name, attr->value);
                    }
                }
                return element;
            } else if constexpr (std::is_same_v<T, TemplateTextNode>) {
                return Dom::Node::createText(node.text);
            } else if constexpr (std::is_same_v<T, TemplateDynamicNode>) {
                return Dom::Node::createComment(std::string{TemplateRegistry::kPlaceholderText});
            } else {
                return Dom::Node::createText(std::string{});
            }
        },
        blueprint.nodes[index]);
}

// Expects a validated blueprint.
auto materialize(RegisterTemplate const& blueprint, std::uint16_t rootIndex) -> Expected<Dom::Node::Ptr> {
    auto root = createNode(blueprint, rootIndex);
    std::vector<std::pair<Dom::Node::Ptr, std::uint16_t>> pending{{root, rootIndex}};
    while (!pending.empty()) {
        auto [node, index] = std::move(pending.back());
        pending.pop_back();
        auto const* element = std::get_if<TemplateElementNode>(&blueprint.nodes[index]);
        if (element == nullptr) {
            continue;
        }
        for (auto child : element->children) {
            auto built = createNode(blueprint, child);
            if (auto appended = node->appendChild(built); !appended) {
                return std::unexpected(appended.error());
            }
            pending.emplace_back(std::move(built), child);
        }
    }
    return root;
}

} // namespace

void TemplateRegistry::store(TemplateId id, Entry entry) {
    if (this->entries.contains(id)) {
        tp_log(std::format("template {} replaced", id), LogTag::Templates);
    }
    this->entries.insert_or_assign(id, std::move(entry));
}

auto TemplateRegistry::registerNodes(TemplateId id, std::span<Dom::Node::Ptr const> roots, std::string name)
    -> Expected<void> {
    Entry entry{std::move(name), {}};
    entry.roots.reserve(roots.size());
    for (auto const& root : roots) {
        if (!root) {
            return std::unexpected(Error{Error::Code::InvalidTemplate, std::format("template {}: null root node", id)});
        }
        entry.roots.push_back(root->cloneNode(true));
    }
    tp_log(std::format("template {} registered from {} live roots", id, entry.roots.size()), LogTag::Templates);
    this->store(id, std::move(entry));
    return {};
}

auto TemplateRegistry::registerFromMarkup(TemplateId id, std::string_view markup, std::string name) -> Expected<void> {
    auto roots = Dom::parseMarkup(markup);
    if (!roots) {
        return std::unexpected(roots.error());
    }
    // Parsed roots are already detached and unshared.
    Entry entry{std::move(name), std::move(*roots)};
    tp_log(std::format("template {} registered from markup with {} roots", id, entry.roots.size()), LogTag::Templates);
    this->store(id, std::move(entry));
    return {};
}

auto TemplateRegistry::registerFromBlueprint(Protocol::RegisterTemplate const& blueprint) -> Expected<void> {
    if (auto valid = BlueprintValidator{blueprint}.run(); !valid) {
        return valid;
    }

    Entry entry{blueprint.name, {}};
    entry.roots.reserve(blueprint.rootIndices.size());
    for (auto root : blueprint.rootIndices) {
        auto built = materialize(blueprint, root);
        if (!built) {
            return std::unexpected(built.error());
        }
        entry.roots.push_back(std::move(*built));
    }
    tp_log(std::format("template {} '{}' registered from blueprint: {} nodes, {} attrs, {} roots",
                       blueprint.templateId,
                       blueprint.name,
                       blueprint.nodes.size(),
                       blueprint.attrs.size(),
                       blueprint.rootIndices.size()),
           LogTag::Templates);
    this->store(blueprint.templateId, std::move(entry));
    return {};
}

auto TemplateRegistry::instantiate(TemplateId id, std::size_t rootIndex) const -> Expected<Dom::Node::Ptr> {
    auto it = this->entries.find(id);
    if (it == this->entries.end()) {
        return std::unexpected(Error{Error::Code::UnknownTemplate, std::format("template {} is not registered", id)});
    }
    auto const& roots = it->second.roots;
    if (rootIndex >= roots.size()) {
        return std::unexpected(Error{Error::Code::TemplateRootRange,
                                     std::format("template {} root index {} out of range (count {})", id, rootIndex, roots.size())});
    }
    return roots[rootIndex]->cloneNode(true);
}

auto TemplateRegistry::has(TemplateId id) const -> bool {
    return this->entries.contains(id);
}

auto TemplateRegistry::rootCount(TemplateId id) const -> std::optional<std::size_t> {
    auto it = this->entries.find(id);
    if (it == this->entries.end()) {
        return std::nullopt;
    }
    return it->second.roots.size();
}

auto TemplateRegistry::name(TemplateId id) const -> std::optional<std::string> {
    auto it = this->entries.find(id);
    if (it == this->entries.end()) {
        return std::nullopt;
    }
    return it->second.name;
}

auto TemplateRegistry::findByName(std::string_view name) const -> std::optional<TemplateId> {
    if (name.empty()) {
        return std::nullopt;
    }
    for (auto const& [id, entry] : this->entries) {
        if (entry.name == name) {
            return id;
        }
    }
    return std::nullopt;
}

auto TemplateRegistry::ids() const -> std::vector<TemplateId> {
    std::vector<TemplateId> out;
    out.reserve(this->entries.size());
    for (auto const& [id, entry] : this->entries) {
        out.push_back(id);
    }
    std::sort(out.begin(), out.end());
    return out;
}

void TemplateRegistry::clear() {
    this->entries.clear();
}

} // namespace TP::Templates
