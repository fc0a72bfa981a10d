#include <treepatch/runtime/RuntimeOptions.hpp>

#include <algorithm>
#include <charconv>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

namespace TP::Runtime {

namespace {

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T    value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

std::vector<std::string> split_list(std::string_view text) {
    std::vector<std::string> out;
    std::size_t              start = 0;
    while (start <= text.size()) {
        auto comma = text.find(',', start);
        auto piece = text.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start);
        while (!piece.empty() && std::isspace(static_cast<unsigned char>(piece.front())) != 0) {
            piece.remove_prefix(1);
        }
        while (!piece.empty() && std::isspace(static_cast<unsigned char>(piece.back())) != 0) {
            piece.remove_suffix(1);
        }
        if (!piece.empty()) {
            out.emplace_back(piece);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return out;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

auto config_error(std::string message) -> Error {
    return Error{Error::Code::InvalidConfiguration, std::move(message)};
}

} // namespace

bool IsValidEventName(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](unsigned char ch) {
        return std::isalnum(ch) != 0 || ch == '-' || ch == '_' || ch == ':' || ch == '.';
    });
}

auto ValidateRuntimeOptions(RuntimeOptions const& options) -> std::optional<std::string> {
    if (options.buffer_capacity == 0) {
        return std::string{"buffer capacity must be at least 1 byte"};
    }
    if (options.buffer_capacity > kMaxBufferCapacity) {
        return std::string{"buffer capacity must not exceed 64 MiB"};
    }
    if (options.install_delegation && options.delegated_events.empty()) {
        return std::string{"delegation requires at least one event name"};
    }
    for (auto const& name : options.delegated_events) {
        if (!IsValidEventName(name)) {
            return std::string{"invalid delegated event name: '" + name + "'"};
        }
    }
    return std::nullopt;
}

bool ApplyRuntimeEnvOverrides(RuntimeOptions& options) {
    if (!apply_env("TREEPATCH_BUFFER_CAPACITY", [&](std::string_view value) {
            std::size_t parsed = options.buffer_capacity;
            if (!parse_integer_in_range<std::size_t>(value, 1, kMaxBufferCapacity, parsed)) {
                std::cerr << "TREEPATCH_BUFFER_CAPACITY must be within 1-" << kMaxBufferCapacity << "\n";
                return false;
            }
            options.buffer_capacity = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("TREEPATCH_INSTALL_DELEGATION", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed) {
                std::cerr << "TREEPATCH_INSTALL_DELEGATION must be a boolean\n";
                return false;
            }
            options.install_delegation = *parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("TREEPATCH_DELEGATED_EVENTS", [&](std::string_view value) {
            auto names = split_list(value);
            if (names.empty()) {
                std::cerr << "TREEPATCH_DELEGATED_EVENTS must list at least one event name\n";
                return false;
            }
            for (auto const& name : names) {
                if (!IsValidEventName(name)) {
                    std::cerr << "TREEPATCH_DELEGATED_EVENTS contains invalid name '" << name << "'\n";
                    return false;
                }
            }
            options.delegated_events = std::move(names);
            return true;
        })) {
        return false;
    }

    if (!apply_env("TREEPATCH_LOG", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed) {
                std::cerr << "TREEPATCH_LOG must be a boolean\n";
                return false;
            }
            options.logging_enabled = *parsed;
            return true;
        })) {
        return false;
    }

    return true;
}

auto ParseRuntimeOptionsJson(nlohmann::json const& json, RuntimeOptions options) -> Expected<RuntimeOptions> {
    if (!json.is_object()) {
        return std::unexpected(config_error("runtime options must be a JSON object"));
    }

    if (auto it = json.find("buffer_capacity"); it != json.end()) {
        if (!it->is_number_integer() || (!it->is_number_unsigned() && it->get<std::int64_t>() < 0)) {
            return std::unexpected(config_error("buffer_capacity must be a non-negative integer"));
        }
        options.buffer_capacity = it->get<std::size_t>();
    }
    if (auto it = json.find("install_delegation"); it != json.end()) {
        if (!it->is_boolean()) {
            return std::unexpected(config_error("install_delegation must be a boolean"));
        }
        options.install_delegation = it->get<bool>();
    }
    if (auto it = json.find("delegated_events"); it != json.end()) {
        if (!it->is_array()) {
            return std::unexpected(config_error("delegated_events must be an array of strings"));
        }
        std::vector<std::string> names;
        for (auto const& entry : *it) {
            if (!entry.is_string()) {
                return std::unexpected(config_error("delegated_events must be an array of strings"));
            }
            names.push_back(entry.get<std::string>());
        }
        options.delegated_events = std::move(names);
    }
    if (auto it = json.find("logging_enabled"); it != json.end()) {
        if (!it->is_boolean()) {
            return std::unexpected(config_error("logging_enabled must be a boolean"));
        }
        options.logging_enabled = it->get<bool>();
    }

    if (auto problem = ValidateRuntimeOptions(options)) {
        return std::unexpected(config_error(*problem));
    }
    return options;
}

auto LoadRuntimeOptionsFile(std::string const& path, RuntimeOptions options) -> Expected<RuntimeOptions> {
    std::ifstream input(path);
    if (!input) {
        return std::unexpected(Error{Error::Code::NotFound, "unable to open config file " + path});
    }
    std::stringstream contents;
    contents << input.rdbuf();

    auto json = nlohmann::json::parse(contents.str(), nullptr, false);
    if (json.is_discarded()) {
        return std::unexpected(config_error("config file " + path + " is not valid JSON"));
    }
    return ParseRuntimeOptionsJson(json, std::move(options));
}

auto RuntimeOptionsToJson(RuntimeOptions const& options) -> nlohmann::json {
    return nlohmann::json{
        {"buffer_capacity", options.buffer_capacity},
        {"install_delegation", options.install_delegation},
        {"delegated_events", options.delegated_events},
        {"logging_enabled", options.logging_enabled},
    };
}

} // namespace TP::Runtime
