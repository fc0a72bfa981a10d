#pragma once

#include <treepatch/core/Error.hpp>
#include <treepatch/protocol/Mutation.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace TP::Protocol {

/**
 * Appends mutation records into a caller-owned fixed region.
 *
 * Every call writes one whole record or nothing: a record that would run past
 * the region is rolled back and the writer stays in a CapacityExceeded state.
 * Fields that the wire format cannot represent (short string over 65535
 * bytes, path over 255 steps, template table over 65535 entries) put the
 * writer into a MalformedInput state instead. After the first error all
 * further writes are ignored; status() reports it.
 */
class MutationWriter {
public:
    explicit MutationWriter(std::span<std::uint8_t> buffer, std::size_t offset = 0);

    auto end() -> MutationWriter&;
    auto appendChildren(ElementId id, std::uint32_t m) -> MutationWriter&;
    auto assignId(NodePath const& path, ElementId id) -> MutationWriter&;
    auto createPlaceholder(ElementId id) -> MutationWriter&;
    auto createTextNode(ElementId id, std::string_view text) -> MutationWriter&;
    auto loadTemplate(TemplateId templateId, std::uint32_t index, ElementId id) -> MutationWriter&;
    auto replaceWith(ElementId id, std::uint32_t m) -> MutationWriter&;
    auto replacePlaceholder(NodePath const& path, std::uint32_t m) -> MutationWriter&;
    auto insertAfter(ElementId id, std::uint32_t m) -> MutationWriter&;
    auto insertBefore(ElementId id, std::uint32_t m) -> MutationWriter&;
    auto setAttribute(ElementId id, std::uint8_t ns, std::string_view name, std::string_view value) -> MutationWriter&;
    auto setText(ElementId id, std::string_view text) -> MutationWriter&;
    auto newEventListener(ElementId id, std::string_view name, HandlerId handlerId) -> MutationWriter&;
    auto removeEventListener(ElementId id, std::string_view name) -> MutationWriter&;
    auto remove(ElementId id) -> MutationWriter&;
    auto pushRoot(ElementId id) -> MutationWriter&;
    auto registerTemplate(RegisterTemplate const& record) -> MutationWriter&;
    auto write(Mutation const& mutation) -> MutationWriter&;

    // Absolute offset one past the last complete record.
    [[nodiscard]] auto offset() const -> std::size_t { return this->cursor; }
    [[nodiscard]] auto capacity() const -> std::size_t { return this->data.size(); }
    [[nodiscard]] auto remaining() const -> std::size_t;
    // Bytes written since construction.
    [[nodiscard]] auto bytesWritten() const -> std::size_t { return this->cursor - this->start; }
    [[nodiscard]] auto ok() const -> bool { return !this->error.has_value(); }
    // Bytes written, or the first error.
    [[nodiscard]] auto status() const -> Expected<std::size_t>;

private:
    class Record;
    friend class Record;

    std::span<std::uint8_t> data;
    std::size_t             start  = 0;
    std::size_t             cursor = 0;
    std::optional<Error>    error;
};

} // namespace TP::Protocol
