#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace TP::Runtime {

// Numeric event kinds reported to the producer.
enum class EventType : std::uint8_t {
    Click      = 0,
    Input      = 1,
    KeyDown    = 2,
    KeyUp      = 3,
    MouseMove  = 4,
    Focus      = 5,
    Blur       = 6,
    Submit     = 7,
    Change     = 8,
    MouseDown  = 9,
    MouseUp    = 10,
    MouseEnter = 11,
    MouseLeave = 12,
    Custom     = 255,
};

inline constexpr std::array<std::string_view, 13> kDefaultDelegatedEvents{
    "click",  "input",  "keydown",   "keyup",   "mousemove", "focus",      "blur",
    "submit", "change", "mousedown", "mouseup", "mouseenter", "mouseleave",
};

// Unlisted names map to Custom.
[[nodiscard]] auto eventTypeForName(std::string_view name) -> EventType;
[[nodiscard]] auto eventTypeName(EventType type) -> std::string_view;

} // namespace TP::Runtime
