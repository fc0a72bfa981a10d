#pragma once

#include <treepatch/protocol/Mutation.hpp>

#include <nlohmann/json.hpp>

namespace TP::Protocol {

// {"op": "<opcode name>", ...fields}; strings stay strings, paths become arrays.
[[nodiscard]] auto toJson(Mutation const& mutation) -> nlohmann::json;

} // namespace TP::Protocol
