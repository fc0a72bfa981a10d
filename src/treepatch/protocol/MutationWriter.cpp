#include <treepatch/protocol/MutationWriter.hpp>
#include <treepatch/protocol/WireFormat.hpp>

#include "log/TaggedLogger.hpp"

#include <cstring>
#include <format>
#include <type_traits>
#include <variant>

namespace TP::Protocol {

// One record in flight. Fields are staged past the writer cursor and only
// become visible when commit() succeeds.
class MutationWriter::Record {
public:
    Record(MutationWriter& writer, Opcode op)
        : writer(writer), pos(writer.cursor), active(writer.ok()) {
        this->u8(static_cast<std::uint8_t>(op));
    }

    auto u8(std::uint8_t value) -> Record& {
        if (this->reserve(1)) {
            this->writer.data[this->pos++] = value;
        }
        return *this;
    }

    auto u16(std::uint16_t value) -> Record& {
        if (this->reserve(sizeof(value))) {
            detail::store_le16(this->writer.data.data() + this->pos, value);
            this->pos += sizeof(value);
        }
        return *this;
    }

    auto u32(std::uint32_t value) -> Record& {
        if (this->reserve(sizeof(value))) {
            detail::store_le32(this->writer.data.data() + this->pos, value);
            this->pos += sizeof(value);
        }
        return *this;
    }

    auto bytes(std::string_view value) -> Record& {
        if (this->reserve(value.size())) {
            if (!value.empty()) {
                std::memcpy(this->writer.data.data() + this->pos, value.data(), value.size());
            }
            this->pos += value.size();
        }
        return *this;
    }

    auto shortString(std::string_view value, char const* what) -> Record& {
        if (value.size() > detail::kMaxShortString) {
            this->malformed(std::format("{} of {} bytes exceeds the short string limit", what, value.size()));
            return *this;
        }
        return this->u16(static_cast<std::uint16_t>(value.size())).bytes(value);
    }

    auto longString(std::string_view value, char const* what) -> Record& {
        if (value.size() > 0xFFFFFFFFull) {
            this->malformed(std::format("{} of {} bytes exceeds the long string limit", what, value.size()));
            return *this;
        }
        return this->u32(static_cast<std::uint32_t>(value.size())).bytes(value);
    }

    auto path(NodePath const& steps) -> Record& {
        if (steps.size() > detail::kMaxPathSteps) {
            this->malformed(std::format("path of {} steps exceeds {}", steps.size(), detail::kMaxPathSteps));
            return *this;
        }
        this->u8(static_cast<std::uint8_t>(steps.size()));
        for (auto step : steps) {
            this->u8(step);
        }
        return *this;
    }

    auto count16(std::size_t value, char const* what) -> Record& {
        if (value > detail::kMaxTableSize) {
            this->malformed(std::format("{} of {} exceeds {}", what, value, detail::kMaxTableSize));
            return *this;
        }
        return this->u16(static_cast<std::uint16_t>(value));
    }

    auto commit() -> void {
        if (this->active) {
            this->writer.cursor = this->pos;
        }
    }

private:
    auto reserve(std::size_t count) -> bool {
        if (!this->active) {
            return false;
        }
        if (count > this->writer.data.size() - this->pos) {
            auto const recordStart = this->writer.cursor;
            this->active           = false;
            this->writer.error     = Error{Error::Code::CapacityExceeded,
                                       std::format("record at offset {} does not fit in {} byte buffer",
                                                   recordStart,
                                                   this->writer.data.size())};
            tp_log("MutationWriter: " + *this->writer.error->message, LogTag::Protocol, LogTag::Error);
            return false;
        }
        return true;
    }

    auto malformed(std::string message) -> void {
        if (!this->active) {
            return;
        }
        this->active       = false;
        this->writer.error = Error{Error::Code::MalformedInput, std::move(message)};
        tp_log("MutationWriter: " + *this->writer.error->message, LogTag::Protocol, LogTag::Error);
    }

    MutationWriter& writer;
    std::size_t     pos;
    bool            active;
};

MutationWriter::MutationWriter(std::span<std::uint8_t> buffer, std::size_t offset)
    : data(buffer), start(offset), cursor(offset) {
    if (offset > buffer.size()) {
        this->start  = buffer.size();
        this->cursor = buffer.size();
        this->error  = Error{Error::Code::CapacityExceeded,
                            std::format("start offset {} is past the {} byte buffer", offset, buffer.size())};
    }
}

auto MutationWriter::remaining() const -> std::size_t {
    return this->data.size() - this->cursor;
}

auto MutationWriter::status() const -> Expected<std::size_t> {
    if (this->error) {
        return std::unexpected(*this->error);
    }
    return this->bytesWritten();
}

auto MutationWriter::end() -> MutationWriter& {
    Record{*this, Opcode::End}.commit();
    return *this;
}

auto MutationWriter::appendChildren(ElementId id, std::uint32_t m) -> MutationWriter& {
    Record rec{*this, Opcode::AppendChildren};
    rec.u32(id).u32(m).commit();
    return *this;
}

auto MutationWriter::assignId(NodePath const& path, ElementId id) -> MutationWriter& {
    Record rec{*this, Opcode::AssignId};
    rec.path(path).u32(id).commit();
    return *this;
}

auto MutationWriter::createPlaceholder(ElementId id) -> MutationWriter& {
    Record rec{*this, Opcode::CreatePlaceholder};
    rec.u32(id).commit();
    return *this;
}

auto MutationWriter::createTextNode(ElementId id, std::string_view text) -> MutationWriter& {
    Record rec{*this, Opcode::CreateTextNode};
    rec.u32(id).longString(text, "text").commit();
    return *this;
}

auto MutationWriter::loadTemplate(TemplateId templateId, std::uint32_t index, ElementId id) -> MutationWriter& {
    Record rec{*this, Opcode::LoadTemplate};
    rec.u32(templateId).u32(index).u32(id).commit();
    return *this;
}

auto MutationWriter::replaceWith(ElementId id, std::uint32_t m) -> MutationWriter& {
    Record rec{*this, Opcode::ReplaceWith};
    rec.u32(id).u32(m).commit();
    return *this;
}

auto MutationWriter::replacePlaceholder(NodePath const& path, std::uint32_t m) -> MutationWriter& {
    Record rec{*this, Opcode::ReplacePlaceholder};
    rec.path(path).u32(m).commit();
    return *this;
}

auto MutationWriter::insertAfter(ElementId id, std::uint32_t m) -> MutationWriter& {
    Record rec{*this, Opcode::InsertAfter};
    rec.u32(id).u32(m).commit();
    return *this;
}

auto MutationWriter::insertBefore(ElementId id, std::uint32_t m) -> MutationWriter& {
    Record rec{*this, Opcode::InsertBefore};
    rec.u32(id).u32(m).commit();
    return *this;
}

auto MutationWriter::setAttribute(ElementId id, std::uint8_t ns, std::string_view name, std::string_view value)
    -> MutationWriter& {
    Record rec{*this, Opcode::SetAttribute};
    rec.u32(id).u8(ns).shortString(name, "attribute name").longString(value, "attribute value").commit();
    return *this;
}

auto MutationWriter::setText(ElementId id, std::string_view text) -> MutationWriter& {
    Record rec{*this, Opcode::SetText};
    rec.u32(id).longString(text, "text").commit();
    return *this;
}

auto MutationWriter::newEventListener(ElementId id, std::string_view name, HandlerId handlerId) -> MutationWriter& {
    Record rec{*this, Opcode::NewEventListener};
    rec.u32(id).u32(handlerId).shortString(name, "event name").commit();
    return *this;
}

auto MutationWriter::removeEventListener(ElementId id, std::string_view name) -> MutationWriter& {
    Record rec{*this, Opcode::RemoveEventListener};
    rec.u32(id).shortString(name, "event name").commit();
    return *this;
}

auto MutationWriter::remove(ElementId id) -> MutationWriter& {
    Record rec{*this, Opcode::Remove};
    rec.u32(id).commit();
    return *this;
}

auto MutationWriter::pushRoot(ElementId id) -> MutationWriter& {
    Record rec{*this, Opcode::PushRoot};
    rec.u32(id).commit();
    return *this;
}

auto MutationWriter::registerTemplate(RegisterTemplate const& record) -> MutationWriter& {
    Record rec{*this, Opcode::RegisterTemplate};
    rec.u32(record.templateId)
        .shortString(record.name, "template name")
        .count16(record.rootIndices.size(), "template root count")
        .count16(record.nodes.size(), "template node count")
        .count16(record.attrs.size(), "template attribute count");

    for (auto const& node : record.nodes) {
        std::visit(
            [&rec](auto const& n) {
                using T = std::decay_t<decltype(n)>;
                if constexpr (std::is_same_v<T, TemplateElementNode>) {
                    rec.u8(static_cast<std::uint8_t>(TemplateNodeKind::Element))
                        .u8(n.tag)
                        .count16(n.children.size(), "element child count");
                    for (auto child : n.children) {
                        rec.u16(child);
                    }
                    rec.u16(n.attrFirst).u16(n.attrCount);
                } else if constexpr (std::is_same_v<T, TemplateTextNode>) {
                    rec.u8(static_cast<std::uint8_t>(TemplateNodeKind::Text)).longString(n.text, "template text");
                } else if constexpr (std::is_same_v<T, TemplateDynamicNode>) {
                    rec.u8(static_cast<std::uint8_t>(TemplateNodeKind::Dynamic)).u32(n.dynamicIndex);
                } else {
                    rec.u8(static_cast<std::uint8_t>(TemplateNodeKind::DynamicText)).u32(n.dynamicIndex);
                }
            },
            node);
    }
    for (auto const& attr : record.attrs) {
        std::visit(
            [&rec](auto const& a) {
                using T = std::decay_t<decltype(a)>;
                if constexpr (std::is_same_v<T, TemplateStaticAttr>) {
                    rec.u8(static_cast<std::uint8_t>(TemplateAttrKind::Static))
                        .shortString(a.name, "attribute name")
                        .longString(a.value, "attribute value");
                } else {
                    rec.u8(static_cast<std::uint8_t>(TemplateAttrKind::Dynamic)).u32(a.dynamicIndex);
                }
            },
            attr);
    }
    for (auto root : record.rootIndices) {
        rec.u16(root);
    }
    rec.commit();
    return *this;
}

auto MutationWriter::write(Mutation const& mutation) -> MutationWriter& {
    std::visit(
        [this](auto const& m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, AppendChildren>) {
                this->appendChildren(m.id, m.m);
            } else if constexpr (std::is_same_v<T, AssignId>) {
                this->assignId(m.path, m.id);
            } else if constexpr (std::is_same_v<T, CreatePlaceholder>) {
                this->createPlaceholder(m.id);
            } else if constexpr (std::is_same_v<T, CreateTextNode>) {
                this->createTextNode(m.id, m.text);
            } else if constexpr (std::is_same_v<T, LoadTemplate>) {
                this->loadTemplate(m.templateId, m.index, m.id);
            } else if constexpr (std::is_same_v<T, ReplaceWith>) {
                this->replaceWith(m.id, m.m);
            } else if constexpr (std::is_same_v<T, ReplacePlaceholder>) {
                this->replacePlaceholder(m.path, m.m);
            } else if constexpr (std::is_same_v<T, InsertAfter>) {
                this->insertAfter(m.id, m.m);
            } else if constexpr (std::is_same_v<T, InsertBefore>) {
                this->insertBefore(m.id, m.m);
            } else if constexpr (std::is_same_v<T, SetAttribute>) {
                this->setAttribute(m.id, m.ns, m.name, m.value);
            } else if constexpr (std::is_same_v<T, SetText>) {
                this->setText(m.id, m.text);
            } else if constexpr (std::is_same_v<T, NewEventListener>) {
                this->newEventListener(m.id, m.name, m.handlerId);
            } else if constexpr (std::is_same_v<T, RemoveEventListener>) {
                this->removeEventListener(m.id, m.name);
            } else if constexpr (std::is_same_v<T, Remove>) {
                this->remove(m.id);
            } else if constexpr (std::is_same_v<T, PushRoot>) {
                this->pushRoot(m.id);
            } else {
                this->registerTemplate(m);
            }
        },
        mutation);
    return *this;
}

} // namespace TP::Protocol
