#pragma once

#include <treepatch/core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TP::Runtime {

inline constexpr std::size_t kDefaultBufferCapacity = 16384;
inline constexpr std::size_t kMaxBufferCapacity     = 64u * 1024u * 1024u;

struct RuntimeOptions {
    std::size_t              buffer_capacity{kDefaultBufferCapacity};
    bool                     install_delegation{false};
    std::vector<std::string> delegated_events{"click",     "input",   "keydown",   "keyup",      "mousemove",
                                              "focus",     "blur",    "submit",    "change",     "mousedown",
                                              "mouseup",   "mouseenter", "mouseleave"};
    bool                     logging_enabled{false};
};

// Reads TREEPATCH_* variables; prints the offending variable to stderr and returns false on bad input.
bool ApplyRuntimeEnvOverrides(RuntimeOptions& options);

// Keys missing from json keep the value already in options.
auto ParseRuntimeOptionsJson(nlohmann::json const& json, RuntimeOptions options = {}) -> Expected<RuntimeOptions>;
auto LoadRuntimeOptionsFile(std::string const& path, RuntimeOptions options = {}) -> Expected<RuntimeOptions>;

auto ValidateRuntimeOptions(RuntimeOptions const& options) -> std::optional<std::string>;

auto RuntimeOptionsToJson(RuntimeOptions const& options) -> nlohmann::json;

bool IsValidEventName(std::string_view name);

} // namespace TP::Runtime
