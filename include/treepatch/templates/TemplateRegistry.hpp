#pragma once

#include <treepatch/core/Error.hpp>
#include <treepatch/dom/Node.hpp>
#include <treepatch/protocol/Mutation.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace TP::Templates {

using Protocol::TemplateId;

/**
 * Stores reusable subtree blueprints by integer id.
 *
 * Three registration paths are peers: already-built live fragments (deep
 * cloned on the way in), a markup string, and a self-describing blueprint
 * record delivered inside the mutation stream. Stored roots are never handed
 * out; instantiate() always returns a fresh deep clone, so repeated
 * instantiation never aliases document state.
 *
 * Registering an id that already exists replaces the stored entry.
 */
class TemplateRegistry {
public:
    // Marker text of a materialized dynamic node slot.
    static constexpr std::string_view kPlaceholderText = "placeholder";
    // Blueprint records are rejected when a root nests deeper than kMaxDepth
    // levels or materializes into more than kMaxInstanceNodes nodes.
    static constexpr std::size_t kMaxDepth         = 1024;
    static constexpr std::size_t kMaxInstanceNodes = 65536;

    TemplateRegistry() = default;

    TemplateRegistry(TemplateRegistry const&)            = delete;
    TemplateRegistry& operator=(TemplateRegistry const&) = delete;

    auto registerNodes(TemplateId id, std::span<Dom::Node::Ptr const> roots, std::string name = {}) -> Expected<void>;
    auto registerFromMarkup(TemplateId id, std::string_view markup, std::string name = {}) -> Expected<void>;
    // Validates the node/attribute tables first; an invalid blueprint registers nothing.
    auto registerFromBlueprint(Protocol::RegisterTemplate const& blueprint) -> Expected<void>;

    [[nodiscard]] auto instantiate(TemplateId id, std::size_t rootIndex) const -> Expected<Dom::Node::Ptr>;

    [[nodiscard]] auto has(TemplateId id) const -> bool;
    [[nodiscard]] auto rootCount(TemplateId id) const -> std::optional<std::size_t>;
    [[nodiscard]] auto name(TemplateId id) const -> std::optional<std::string>;
    [[nodiscard]] auto findByName(std::string_view name) const -> std::optional<TemplateId>;
    [[nodiscard]] auto size() const -> std::size_t { return this->entries.size(); }
    [[nodiscard]] auto ids() const -> std::vector<TemplateId>;

    void clear();

private:
    struct Entry {
        std::string                name;
        std::vector<Dom::Node::Ptr> roots;
    };

    void store(TemplateId id, Entry entry);

    phmap::flat_hash_map<TemplateId, Entry> entries;
};

} // namespace TP::Templates
