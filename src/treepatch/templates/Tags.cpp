#include <treepatch/templates/Tags.hpp>

#include <array>

namespace TP::Templates {

namespace {

constexpr std::array<std::string_view, kTagCount> kTagNames{
    "div",   "span",   "p",     "section", "header", "footer",   "nav",    "main",   "article", "aside",
    "h1",    "h2",     "h3",    "h4",      "h5",     "h6",       "ul",     "ol",     "li",      "button",
    "input", "form",   "textarea", "select", "option", "label",  "a",      "img",    "table",   "thead",
    "tbody", "tr",     "td",    "th",      "strong", "em",       "br",     "hr",     "pre",     "code",
};

} // namespace

auto tagName(std::uint8_t id) -> std::string_view {
    if (id < kTagNames.size()) {
        return kTagNames[id];
    }
    return kUnknownTagName;
}

auto tagName(Tag tag) -> std::string_view {
    return tagName(static_cast<std::uint8_t>(tag));
}

auto tagIdForName(std::string_view name) -> std::optional<std::uint8_t> {
    for (std::size_t i = 0; i < kTagNames.size(); ++i) {
        if (kTagNames[i] == name) {
            return static_cast<std::uint8_t>(i);
        }
    }
    return std::nullopt;
}

} // namespace TP::Templates
