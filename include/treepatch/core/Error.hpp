#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace TP {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        ProtocolViolation,
        StackUnderflow,
        UnknownHandle,
        UnknownTemplate,
        TemplateRootRange,
        PathOutOfBounds,
        InvalidTemplate,
        ReservedHandle,
        HierarchyRequest,
        MalformedInput,
        CapacityExceeded,
        InvalidConfiguration,
        NotFound
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::ProtocolViolation:
        return "protocol_violation";
    case Error::Code::StackUnderflow:
        return "stack_underflow";
    case Error::Code::UnknownHandle:
        return "unknown_handle";
    case Error::Code::UnknownTemplate:
        return "unknown_template";
    case Error::Code::TemplateRootRange:
        return "template_root_range";
    case Error::Code::PathOutOfBounds:
        return "path_out_of_bounds";
    case Error::Code::InvalidTemplate:
        return "invalid_template";
    case Error::Code::ReservedHandle:
        return "reserved_handle";
    case Error::Code::HierarchyRequest:
        return "hierarchy_request";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::CapacityExceeded:
        return "capacity_exceeded";
    case Error::Code::InvalidConfiguration:
        return "invalid_configuration";
    case Error::Code::NotFound:
        return "not_found";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace TP
