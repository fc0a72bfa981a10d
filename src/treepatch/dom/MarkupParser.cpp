#include <treepatch/dom/Markup.hpp>

#include "log/TaggedLogger.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <string>
#include <utility>

namespace TP::Dom {

namespace {

constexpr std::array<std::string_view, 14> kVoidElements{
    "area", "base", "br", "col", "embed", "hr", "img", "input", "link", "meta", "param", "source", "track", "wbr"};

auto make_parse_error(std::string message, std::size_t offset) -> Error {
    return Error{Error::Code::MalformedInput, message + " at offset " + std::to_string(offset)};
}

auto to_lower(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (unsigned char ch : text) {
        out.push_back(static_cast<char>(std::tolower(ch)));
    }
    return out;
}

void append_utf8(std::string& out, std::uint32_t codepoint) {
    if (codepoint < 0x80) {
        out.push_back(static_cast<char>(codepoint));
    } else if (codepoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else if (codepoint < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
}

// Replaces character references; unknown references are kept verbatim.
auto decode_entities(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '&') {
            out.push_back(text[i++]);
            continue;
        }
        auto semi = text.find(';', i);
        if (semi == std::string_view::npos || semi - i > 10) {
            out.push_back(text[i++]);
            continue;
        }
        auto name = text.substr(i + 1, semi - i - 1);
        if (name == "amp") {
            out.push_back('&');
        } else if (name == "lt") {
            out.push_back('<');
        } else if (name == "gt") {
            out.push_back('>');
        } else if (name == "quot") {
            out.push_back('"');
        } else if (name == "apos") {
            out.push_back('\'');
        } else if (name.size() > 1 && name.front() == '#') {
            auto digits = name.substr(1);
            int  base   = 10;
            if (!digits.empty() && (digits.front() == 'x' || digits.front() == 'X')) {
                digits = digits.substr(1);
                base   = 16;
            }
            std::uint32_t codepoint = 0;
            auto          result    = std::from_chars(digits.data(), digits.data() + digits.size(), codepoint, base);
            if (digits.empty() || result.ec != std::errc{} || result.ptr != digits.data() + digits.size() || codepoint > 0x10FFFF) {
                out.append(text.substr(i, semi - i + 1));
            } else {
                append_utf8(out, codepoint);
            }
        } else {
            out.append(text.substr(i, semi - i + 1));
        }
        i = semi + 1;
    }
    return out;
}

class MarkupParser {
public:
    explicit MarkupParser(std::string_view input)
        : input_(input) {}

    auto parse() -> Expected<std::vector<Node::Ptr>> {
        while (!this->atEnd()) {
            if (this->peek() == '<') {
                if (this->startsWith("<!--")) {
                    if (auto status = this->parseComment(); !status) {
                        return std::unexpected(status.error());
                    }
                    continue;
                }
                if (this->startsWith("</")) {
                    if (auto status = this->parseCloseTag(); !status) {
                        return std::unexpected(status.error());
                    }
                    continue;
                }
                if (this->pos_ + 1 < this->input_.size() && std::isalpha(static_cast<unsigned char>(this->input_[this->pos_ + 1]))) {
                    if (auto status = this->parseOpenTag(); !status) {
                        return std::unexpected(status.error());
                    }
                    continue;
                }
            }
            if (auto status = this->parseText(); !status) {
                return std::unexpected(status.error());
            }
        }
        if (!this->open_.empty()) {
            return std::unexpected(make_parse_error("unclosed <" + this->open_.back()->tagName() + ">", this->pos_));
        }
        return std::move(this->roots_);
    }

private:
    [[nodiscard]] auto atEnd() const -> bool { return this->pos_ >= this->input_.size(); }
    [[nodiscard]] auto peek() const -> char { return this->input_[this->pos_]; }
    [[nodiscard]] auto startsWith(std::string_view prefix) const -> bool {
        return this->input_.substr(this->pos_).starts_with(prefix);
    }

    void skipWhitespace() {
        while (!this->atEnd() && std::isspace(static_cast<unsigned char>(this->peek()))) {
            ++this->pos_;
        }
    }

    auto insert(Node::Ptr const& node) -> Expected<void> {
        if (this->open_.empty()) {
            this->roots_.push_back(node);
            return {};
        }
        return this->open_.back()->appendChild(node);
    }

    auto parseComment() -> Expected<void> {
        auto start = this->pos_;
        auto end   = this->input_.find("-->", this->pos_ + 4);
        if (end == std::string_view::npos) {
            return std::unexpected(make_parse_error("unterminated comment", start));
        }
        auto body  = this->input_.substr(this->pos_ + 4, end - this->pos_ - 4);
        this->pos_ = end + 3;
        return this->insert(Node::createComment(std::string{body}));
    }

    auto parseText() -> Expected<void> {
        auto start = this->pos_;
        // A '<' that does not open a tag is literal text.
        ++this->pos_;
        while (!this->atEnd() && this->peek() != '<') {
            ++this->pos_;
        }
        auto raw = this->input_.substr(start, this->pos_ - start);
        return this->insert(Node::createText(decode_entities(raw)));
    }

    auto readName() -> std::string_view {
        auto start = this->pos_;
        while (!this->atEnd()) {
            auto ch = static_cast<unsigned char>(this->peek());
            if (std::isspace(ch) || ch == '/' || ch == '>' || ch == '=') {
                break;
            }
            ++this->pos_;
        }
        return this->input_.substr(start, this->pos_ - start);
    }

    auto parseCloseTag() -> Expected<void> {
        auto start = this->pos_;
        this->pos_ += 2;
        auto name = to_lower(this->readName());
        this->skipWhitespace();
        if (this->atEnd() || this->peek() != '>') {
            return std::unexpected(make_parse_error("unterminated close tag </" + name, start));
        }
        ++this->pos_;
        if (this->open_.empty() || this->open_.back()->tagName() != name) {
            return std::unexpected(make_parse_error("unexpected close tag </" + name + ">", start));
        }
        this->open_.pop_back();
        return {};
    }

    auto parseAttributeValue() -> Expected<std::string> {
        auto start = this->pos_;
        if (this->atEnd()) {
            return std::unexpected(make_parse_error("missing attribute value", start));
        }
        auto quote = this->peek();
        if (quote == '"' || quote == '\'') {
            auto end = this->input_.find(quote, this->pos_ + 1);
            if (end == std::string_view::npos) {
                return std::unexpected(make_parse_error("unterminated attribute value", start));
            }
            auto raw   = this->input_.substr(this->pos_ + 1, end - this->pos_ - 1);
            this->pos_ = end + 1;
            return decode_entities(raw);
        }
        while (!this->atEnd()) {
            auto ch = static_cast<unsigned char>(this->peek());
            if (std::isspace(ch) || ch == '>') {
                break;
            }
            if (ch == '/' && this->startsWith("/>")) {
                break;
            }
            ++this->pos_;
        }
        return decode_entities(this->input_.substr(start, this->pos_ - start));
    }

    auto parseOpenTag() -> Expected<void> {
        auto start = this->pos_;
        ++this->pos_;
        auto element = Node::createElement(to_lower(this->readName()));

        bool selfClosing = false;
        while (true) {
            this->skipWhitespace();
            if (this->atEnd()) {
                return std::unexpected(make_parse_error("unterminated tag <" + element->tagName(), start));
            }
            if (this->peek() == '>') {
                ++this->pos_;
                break;
            }
            if (this->startsWith("/>")) {
                this->pos_ += 2;
                selfClosing = true;
                break;
            }
            auto name = to_lower(this->readName());
            if (name.empty()) {
                return std::unexpected(make_parse_error("invalid attribute in <" + element->tagName() + ">", this->pos_));
            }
            this->skipWhitespace();
            std::string value;
            if (!this->atEnd() && this->peek() == '=') {
                ++this->pos_;
                this->skipWhitespace();
                auto parsed = this->parseAttributeValue();
                if (!parsed) {
                    return std::unexpected(parsed.error());
                }
                value = std::move(*parsed);
            }
            element->setAttribute(name, value);
        }

        if (auto status = this->insert(element); !status) {
            return status;
        }
        if (!selfClosing && !isVoidElement(element->tagName())) {
            this->open_.push_back(element);
        }
        return {};
    }

    std::string_view       input_;
    std::size_t            pos_ = 0;
    std::vector<Node::Ptr> roots_;
    std::vector<Node::Ptr> open_;
};

} // namespace

auto isVoidElement(std::string_view tag) -> bool {
    for (auto candidate : kVoidElements) {
        if (candidate == tag) {
            return true;
        }
    }
    return false;
}

auto parseMarkup(std::string_view markup) -> Expected<std::vector<Node::Ptr>> {
    MarkupParser parser{markup};
    auto         roots = parser.parse();
    if (!roots) {
        tp_log("parseMarkup failed: " + describeError(roots.error()), LogTag::Templates);
    }
    return roots;
}

} // namespace TP::Dom
