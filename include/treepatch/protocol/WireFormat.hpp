#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>

namespace TP::Protocol::detail {

constexpr auto byteswap16(std::uint16_t value) -> std::uint16_t {
    return static_cast<std::uint16_t>((value >> 8u) | (value << 8u));
}

constexpr auto byteswap32(std::uint32_t value) -> std::uint32_t {
    return ((value & 0x000000FFu) << 24u)
         | ((value & 0x0000FF00u) << 8u)
         | ((value & 0x00FF0000u) >> 8u)
         | ((value & 0xFF000000u) >> 24u);
}

constexpr auto to_le16(std::uint16_t value) -> std::uint16_t {
    if constexpr (std::endian::native == std::endian::little) {
        return value;
    } else {
        return byteswap16(value);
    }
}

constexpr auto to_le32(std::uint32_t value) -> std::uint32_t {
    if constexpr (std::endian::native == std::endian::little) {
        return value;
    } else {
        return byteswap32(value);
    }
}

constexpr auto from_le16(std::uint16_t value) -> std::uint16_t {
    return to_le16(value);
}

constexpr auto from_le32(std::uint32_t value) -> std::uint32_t {
    return to_le32(value);
}

inline auto load_le16(std::uint8_t const* data) -> std::uint16_t {
    std::uint16_t raw = 0;
    std::memcpy(&raw, data, sizeof(raw));
    return from_le16(raw);
}

inline auto load_le32(std::uint8_t const* data) -> std::uint32_t {
    std::uint32_t raw = 0;
    std::memcpy(&raw, data, sizeof(raw));
    return from_le32(raw);
}

inline auto store_le16(std::uint8_t* data, std::uint16_t value) -> void {
    auto const raw = to_le16(value);
    std::memcpy(data, &raw, sizeof(raw));
}

inline auto store_le32(std::uint8_t* data, std::uint32_t value) -> void {
    auto const raw = to_le32(value);
    std::memcpy(data, &raw, sizeof(raw));
}

constexpr std::size_t kMaxShortString = 0xFFFFu;
constexpr std::size_t kMaxPathSteps   = 0xFFu;
constexpr std::size_t kMaxTableSize   = 0xFFFFu;

} // namespace TP::Protocol::detail
