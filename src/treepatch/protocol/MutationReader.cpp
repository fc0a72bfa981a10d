#include <treepatch/protocol/MutationReader.hpp>
#include <treepatch/protocol/WireFormat.hpp>

#include "log/TaggedLogger.hpp"

#include <format>
#include <utility>

namespace TP::Protocol {

MutationReader::MutationReader(std::span<std::uint8_t const> buffer, std::size_t offset, std::size_t length)
    : data(buffer), cursor(offset), end(offset), recordStart(offset) {
    if (offset > buffer.size() || length > buffer.size() - offset) {
        this->error = Error{Error::Code::ProtocolViolation,
                            std::format("mutation region [{}, +{}) exceeds buffer of {} bytes", offset, length, buffer.size())};
        this->done  = true;
        return;
    }
    this->end = offset + length;
}

MutationReader::MutationReader(std::span<std::uint8_t const> buffer)
    : MutationReader(buffer, 0, buffer.size()) {}

auto MutationReader::remaining() const -> std::size_t {
    return this->cursor < this->end ? this->end - this->cursor : 0;
}

auto MutationReader::fail(std::string what) -> Error {
    Error err{Error::Code::ProtocolViolation, std::move(what)};
    tp_log("MutationReader: " + *err.message, LogTag::Protocol, LogTag::Error);
    this->error = err;
    this->done  = true;
    return err;
}

auto MutationReader::readU8(char const* what) -> Expected<std::uint8_t> {
    if (this->remaining() < 1) {
        return std::unexpected(this->fail(std::format("truncated {} at offset {}", what, this->cursor)));
    }
    return this->data[this->cursor++];
}

auto MutationReader::readU16(char const* what) -> Expected<std::uint16_t> {
    if (this->remaining() < sizeof(std::uint16_t)) {
        return std::unexpected(this->fail(std::format("truncated {} at offset {}", what, this->cursor)));
    }
    auto const value = detail::load_le16(this->data.data() + this->cursor);
    this->cursor += sizeof(std::uint16_t);
    return value;
}

auto MutationReader::readU32(char const* what) -> Expected<std::uint32_t> {
    if (this->remaining() < sizeof(std::uint32_t)) {
        return std::unexpected(this->fail(std::format("truncated {} at offset {}", what, this->cursor)));
    }
    auto const value = detail::load_le32(this->data.data() + this->cursor);
    this->cursor += sizeof(std::uint32_t);
    return value;
}

auto MutationReader::readBytes(std::size_t count, char const* what) -> Expected<std::string> {
    if (this->remaining() < count) {
        return std::unexpected(this->fail(
            std::format("truncated {} at offset {}: need {} bytes, {} remain", what, this->cursor, count, this->remaining())));
    }
    std::string out(reinterpret_cast<char const*>(this->data.data() + this->cursor), count);
    this->cursor += count;
    return out;
}

auto MutationReader::readShortString(char const* what) -> Expected<std::string> {
    auto length = this->readU16(what);
    if (!length) {
        return std::unexpected(length.error());
    }
    return this->readBytes(*length, what);
}

auto MutationReader::readLongString(char const* what) -> Expected<std::string> {
    auto length = this->readU32(what);
    if (!length) {
        return std::unexpected(length.error());
    }
    return this->readBytes(*length, what);
}

auto MutationReader::readPath() -> Expected<NodePath> {
    auto count = this->readU8("path length");
    if (!count) {
        return std::unexpected(count.error());
    }
    if (this->remaining() < *count) {
        return std::unexpected(this->fail(std::format("truncated path at offset {}", this->cursor)));
    }
    NodePath path(this->data.begin() + static_cast<std::ptrdiff_t>(this->cursor),
                  this->data.begin() + static_cast<std::ptrdiff_t>(this->cursor + *count));
    this->cursor += *count;
    return path;
}

auto MutationReader::readTemplateNode() -> Expected<TemplateNode> {
    auto const kindOffset = this->cursor;
    auto       kind       = this->readU8("template node kind");
    if (!kind) {
        return std::unexpected(kind.error());
    }
    switch (static_cast<TemplateNodeKind>(*kind)) {
    case TemplateNodeKind::Element: {
        TemplateElementNode node;
        auto                tag = this->readU8("element tag");
        if (!tag) {
            return std::unexpected(tag.error());
        }
        node.tag        = *tag;
        auto childCount = this->readU16("element child count");
        if (!childCount) {
            return std::unexpected(childCount.error());
        }
        node.children.reserve(*childCount);
        for (std::uint16_t i = 0; i < *childCount; ++i) {
            auto child = this->readU16("element child index");
            if (!child) {
                return std::unexpected(child.error());
            }
            node.children.push_back(*child);
        }
        auto attrFirst = this->readU16("element attribute index");
        if (!attrFirst) {
            return std::unexpected(attrFirst.error());
        }
        auto attrCount = this->readU16("element attribute count");
        if (!attrCount) {
            return std::unexpected(attrCount.error());
        }
        node.attrFirst = *attrFirst;
        node.attrCount = *attrCount;
        return node;
    }
    case TemplateNodeKind::Text: {
        auto text = this->readLongString("template text");
        if (!text) {
            return std::unexpected(text.error());
        }
        return TemplateTextNode{std::move(*text)};
    }
    case TemplateNodeKind::Dynamic: {
        auto slot = this->readU32("dynamic node index");
        if (!slot) {
            return std::unexpected(slot.error());
        }
        return TemplateDynamicNode{*slot};
    }
    case TemplateNodeKind::DynamicText: {
        auto slot = this->readU32("dynamic text index");
        if (!slot) {
            return std::unexpected(slot.error());
        }
        return TemplateDynamicTextNode{*slot};
    }
    }
    return std::unexpected(this->fail(std::format("unknown template node kind 0x{:02x} at offset {}", *kind, kindOffset)));
}

auto MutationReader::readTemplateAttr() -> Expected<TemplateAttr> {
    auto const kindOffset = this->cursor;
    auto       kind       = this->readU8("template attribute kind");
    if (!kind) {
        return std::unexpected(kind.error());
    }
    switch (static_cast<TemplateAttrKind>(*kind)) {
    case TemplateAttrKind::Static: {
        auto name = this->readShortString("attribute name");
        if (!name) {
            return std::unexpected(name.error());
        }
        auto value = this->readLongString("attribute value");
        if (!value) {
            return std::unexpected(value.error());
        }
        return TemplateStaticAttr{std::move(*name), std::move(*value)};
    }
    case TemplateAttrKind::Dynamic: {
        auto slot = this->readU32("dynamic attribute index");
        if (!slot) {
            return std::unexpected(slot.error());
        }
        return TemplateDynamicAttr{*slot};
    }
    }
    return std::unexpected(this->fail(std::format("unknown template attribute kind 0x{:02x} at offset {}", *kind, kindOffset)));
}

auto MutationReader::readRegisterTemplate() -> Expected<RegisterTemplate> {
    RegisterTemplate record;
    auto             id = this->readU32("template id");
    if (!id) {
        return std::unexpected(id.error());
    }
    record.templateId = *id;
    auto name         = this->readShortString("template name");
    if (!name) {
        return std::unexpected(name.error());
    }
    record.name    = std::move(*name);
    auto rootCount = this->readU16("template root count");
    if (!rootCount) {
        return std::unexpected(rootCount.error());
    }
    auto nodeCount = this->readU16("template node count");
    if (!nodeCount) {
        return std::unexpected(nodeCount.error());
    }
    auto attrCount = this->readU16("template attribute count");
    if (!attrCount) {
        return std::unexpected(attrCount.error());
    }

    record.nodes.reserve(*nodeCount);
    for (std::uint16_t i = 0; i < *nodeCount; ++i) {
        auto node = this->readTemplateNode();
        if (!node) {
            return std::unexpected(node.error());
        }
        record.nodes.push_back(std::move(*node));
    }
    record.attrs.reserve(*attrCount);
    for (std::uint16_t i = 0; i < *attrCount; ++i) {
        auto attr = this->readTemplateAttr();
        if (!attr) {
            return std::unexpected(attr.error());
        }
        record.attrs.push_back(std::move(*attr));
    }
    record.rootIndices.reserve(*rootCount);
    for (std::uint16_t i = 0; i < *rootCount; ++i) {
        auto root = this->readU16("template root index");
        if (!root) {
            return std::unexpected(root.error());
        }
        record.rootIndices.push_back(*root);
    }
    return record;
}

namespace {

// Reads the common (u32 id, u32 m) layout.
template <typename Record, typename Reader>
auto readIdCount(Reader&& readU32) -> Expected<Mutation> {
    auto id = readU32("element id");
    if (!id) {
        return std::unexpected(id.error());
    }
    auto m = readU32("node count");
    if (!m) {
        return std::unexpected(m.error());
    }
    return Record{*id, *m};
}

} // namespace

auto MutationReader::readRecord(Opcode op) -> Expected<Mutation> {
    auto u32 = [this](char const* what) { return this->readU32(what); };

    switch (op) {
    case Opcode::AppendChildren:
        return readIdCount<AppendChildren>(u32);
    case Opcode::ReplaceWith:
        return readIdCount<ReplaceWith>(u32);
    case Opcode::InsertAfter:
        return readIdCount<InsertAfter>(u32);
    case Opcode::InsertBefore:
        return readIdCount<InsertBefore>(u32);
    case Opcode::AssignId: {
        auto path = this->readPath();
        if (!path) {
            return std::unexpected(path.error());
        }
        auto id = this->readU32("element id");
        if (!id) {
            return std::unexpected(id.error());
        }
        return AssignId{std::move(*path), *id};
    }
    case Opcode::CreatePlaceholder: {
        auto id = this->readU32("element id");
        if (!id) {
            return std::unexpected(id.error());
        }
        return CreatePlaceholder{*id};
    }
    case Opcode::CreateTextNode: {
        auto id = this->readU32("element id");
        if (!id) {
            return std::unexpected(id.error());
        }
        auto text = this->readLongString("text");
        if (!text) {
            return std::unexpected(text.error());
        }
        return CreateTextNode{*id, std::move(*text)};
    }
    case Opcode::LoadTemplate: {
        auto templateId = this->readU32("template id");
        if (!templateId) {
            return std::unexpected(templateId.error());
        }
        auto index = this->readU32("template root index");
        if (!index) {
            return std::unexpected(index.error());
        }
        auto id = this->readU32("element id");
        if (!id) {
            return std::unexpected(id.error());
        }
        return LoadTemplate{*templateId, *index, *id};
    }
    case Opcode::ReplacePlaceholder: {
        auto path = this->readPath();
        if (!path) {
            return std::unexpected(path.error());
        }
        auto m = this->readU32("node count");
        if (!m) {
            return std::unexpected(m.error());
        }
        return ReplacePlaceholder{std::move(*path), *m};
    }
    case Opcode::SetAttribute: {
        SetAttribute record;
        auto         id = this->readU32("element id");
        if (!id) {
            return std::unexpected(id.error());
        }
        auto ns = this->readU8("attribute namespace");
        if (!ns) {
            return std::unexpected(ns.error());
        }
        auto name = this->readShortString("attribute name");
        if (!name) {
            return std::unexpected(name.error());
        }
        auto value = this->readLongString("attribute value");
        if (!value) {
            return std::unexpected(value.error());
        }
        record.id    = *id;
        record.ns    = *ns;
        record.name  = std::move(*name);
        record.value = std::move(*value);
        return record;
    }
    case Opcode::SetText: {
        auto id = this->readU32("element id");
        if (!id) {
            return std::unexpected(id.error());
        }
        auto text = this->readLongString("text");
        if (!text) {
            return std::unexpected(text.error());
        }
        return SetText{*id, std::move(*text)};
    }
    case Opcode::NewEventListener: {
        auto id = this->readU32("element id");
        if (!id) {
            return std::unexpected(id.error());
        }
        auto handler = this->readU32("handler id");
        if (!handler) {
            return std::unexpected(handler.error());
        }
        auto name = this->readShortString("event name");
        if (!name) {
            return std::unexpected(name.error());
        }
        return NewEventListener{*id, std::move(*name), *handler};
    }
    case Opcode::RemoveEventListener: {
        auto id = this->readU32("element id");
        if (!id) {
            return std::unexpected(id.error());
        }
        auto name = this->readShortString("event name");
        if (!name) {
            return std::unexpected(name.error());
        }
        return RemoveEventListener{*id, std::move(*name)};
    }
    case Opcode::Remove: {
        auto id = this->readU32("element id");
        if (!id) {
            return std::unexpected(id.error());
        }
        return Remove{*id};
    }
    case Opcode::PushRoot: {
        auto id = this->readU32("element id");
        if (!id) {
            return std::unexpected(id.error());
        }
        return PushRoot{*id};
    }
    case Opcode::RegisterTemplate: {
        auto record = this->readRegisterTemplate();
        if (!record) {
            return std::unexpected(record.error());
        }
        return std::move(*record);
    }
    case Opcode::End:
        break;
    }
    return std::unexpected(this->fail(std::format("opcode {} has no record layout", opcodeName(op))));
}

auto MutationReader::next() -> Expected<std::optional<Mutation>> {
    if (this->error) {
        return std::unexpected(*this->error);
    }
    if (this->done || this->remaining() == 0) {
        this->done = true;
        return std::optional<Mutation>{};
    }

    this->recordStart = this->cursor;
    auto const byte   = this->data[this->cursor++];
    auto const op     = opcodeFromByte(byte);
    if (!op) {
        return std::unexpected(this->fail(std::format("unknown opcode 0x{:02x} at offset {}", byte, this->recordStart)));
    }
    if (*op == Opcode::End) {
        this->done      = true;
        this->endMarker = true;
        return std::optional<Mutation>{};
    }

    auto record = this->readRecord(*op);
    if (!record) {
        return std::unexpected(record.error());
    }
    return std::optional<Mutation>{std::move(*record)};
}

auto MutationReader::readAll() -> Expected<std::vector<Mutation>> {
    std::vector<Mutation> out;
    while (true) {
        auto record = this->next();
        if (!record) {
            return std::unexpected(record.error());
        }
        if (!record->has_value()) {
            break;
        }
        out.push_back(std::move(**record));
    }
    return out;
}

} // namespace TP::Protocol
