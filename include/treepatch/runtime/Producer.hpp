#pragma once

#include <treepatch/protocol/Opcode.hpp>
#include <treepatch/runtime/EventType.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace TP::Runtime {

/**
 * Producer is the external engine that decides content and writes mutation
 * streams. The runtime only calls it through this interface, synchronously,
 * always with the same fixed-capacity buffer.
 */
struct Producer {
    virtual ~Producer() = default;

    // Writes the initial mount stream; returns bytes written.
    virtual auto rebuild(std::span<std::uint8_t> buffer) -> std::size_t = 0;

    // Writes pending updates; 0 means nothing changed.
    virtual auto flush(std::span<std::uint8_t> buffer) -> std::size_t = 0;

    // Returns true when the handler id was known and ran.
    virtual auto dispatch(Protocol::HandlerId handlerId, EventType type, std::optional<std::int32_t> value) -> bool = 0;
};

} // namespace TP::Runtime
