#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace TP::Templates {

// Element tag ids carried by RegisterTemplate element records.
enum class Tag : std::uint8_t {
    Div = 0,
    Span,
    P,
    Section,
    Header,
    Footer,
    Nav,
    Main,
    Article,
    Aside,
    H1,
    H2,
    H3,
    H4,
    H5,
    H6,
    Ul,
    Ol,
    Li,
    Button,
    Input,
    Form,
    Textarea,
    Select,
    Option,
    Label,
    A,
    Img,
    Table,
    Thead,
    Tbody,
    Tr,
    Td,
    Th,
    Strong,
    Em,
    Br,
    Hr,
    Pre,
    Code,
    Unknown = 255,
};

inline constexpr std::uint8_t     kTagCount       = static_cast<std::uint8_t>(Tag::Code) + 1;
inline constexpr std::string_view kUnknownTagName = "unknown";

// Unrecognized ids map to "unknown".
[[nodiscard]] auto tagName(std::uint8_t id) -> std::string_view;
[[nodiscard]] auto tagName(Tag tag) -> std::string_view;
[[nodiscard]] auto tagIdForName(std::string_view name) -> std::optional<std::uint8_t>;

} // namespace TP::Templates
