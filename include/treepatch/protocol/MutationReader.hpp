#pragma once

#include <treepatch/core/Error.hpp>
#include <treepatch/protocol/Mutation.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace TP::Protocol {

/**
 * Bounded cursor over one mutation region of a shared buffer.
 *
 * Records are decoded lazily, one per next() call. Decoding stops at an End
 * opcode or when the declared region is exhausted. A region that does not
 * fit inside the buffer, a truncated field or an unknown opcode is a
 * ProtocolViolation naming the byte offset; once an error is reported every
 * later call returns the same error.
 */
class MutationReader {
public:
    MutationReader(std::span<std::uint8_t const> buffer, std::size_t offset, std::size_t length);
    explicit MutationReader(std::span<std::uint8_t const> buffer);

    // nullopt once End was read or the region is exhausted.
    [[nodiscard]] auto next() -> Expected<std::optional<Mutation>>;
    [[nodiscard]] auto readAll() -> Expected<std::vector<Mutation>>;

    // Absolute byte offset of the next opcode.
    [[nodiscard]] auto position() const -> std::size_t { return this->cursor; }
    [[nodiscard]] auto remaining() const -> std::size_t;
    [[nodiscard]] auto finished() const -> bool { return this->done; }
    // True once an End opcode (rather than the region boundary) stopped decoding.
    [[nodiscard]] auto reachedEnd() const -> bool { return this->endMarker; }

    // Byte offset where the most recently returned record started.
    [[nodiscard]] auto lastRecordOffset() const -> std::size_t { return this->recordStart; }

private:
    auto fail(std::string what) -> Error;

    auto readU8(char const* what) -> Expected<std::uint8_t>;
    auto readU16(char const* what) -> Expected<std::uint16_t>;
    auto readU32(char const* what) -> Expected<std::uint32_t>;
    auto readBytes(std::size_t count, char const* what) -> Expected<std::string>;
    auto readShortString(char const* what) -> Expected<std::string>;
    auto readLongString(char const* what) -> Expected<std::string>;
    auto readPath() -> Expected<NodePath>;
    auto readRegisterTemplate() -> Expected<RegisterTemplate>;
    auto readTemplateNode() -> Expected<TemplateNode>;
    auto readTemplateAttr() -> Expected<TemplateAttr>;
    auto readRecord(Opcode op) -> Expected<Mutation>;

    std::span<std::uint8_t const> data;
    std::size_t                   cursor      = 0;
    std::size_t                   end         = 0;
    std::size_t                   recordStart = 0;
    bool                          done        = false;
    bool                          endMarker   = false;
    std::optional<Error>          error;
};

} // namespace TP::Protocol
