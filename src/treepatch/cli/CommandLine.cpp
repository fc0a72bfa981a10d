#include "CommandLine.hpp"

#include <charconv>
#include <iostream>
#include <sstream>
#include <string>

namespace TP::Cli {

CommandLine::CommandLine() {
    positional_handler_ = [](std::string_view token) -> ParseError {
        std::string message = "unexpected argument '";
        message.append(token.begin(), token.end());
        message.push_back('\'');
        return message;
    };
}

void CommandLine::set_program_name(std::string_view name) {
    program_name_.assign(name.begin(), name.end());
}

void CommandLine::set_summary(std::string_view summary) {
    summary_.assign(summary.begin(), summary.end());
}

void CommandLine::set_positional_handler(std::function<ParseError(std::string_view)> handler) {
    positional_handler_ = std::move(handler);
}

void CommandLine::set_error_logger(std::function<void(std::string const&)> logger) {
    error_logger_ = std::move(logger);
}

void CommandLine::add_flag(std::string_view name, FlagOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.expects_value = false;
    entry.help          = std::move(option.help);
    entry.flag_handler  = std::move(option.on_set);
    register_option(std::move(entry));
}

void CommandLine::add_value(std::string_view name, ValueOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.expects_value = true;
    entry.metavar       = std::move(option.metavar);
    entry.help          = std::move(option.help);
    entry.value_handler = std::move(option.on_value);
    register_option(std::move(entry));
}

void CommandLine::add_size(std::string_view name, SizeOption option) {
    ValueOption value_opt{};
    value_opt.metavar  = "BYTES";
    value_opt.help     = std::move(option.help);
    value_opt.on_value = [stored = std::string(name), handler = std::move(option.on_value)](std::string_view token) -> ParseError {
        if (token.empty()) {
            return stored + " requires a byte count";
        }
        std::size_t value  = 0;
        auto        result = std::from_chars(token.data(), token.data() + token.size(), value);
        if (result.ec != std::errc{} || result.ptr != token.data() + token.size()) {
            return stored + " expects a non-negative integer";
        }
        handler(value);
        return std::nullopt;
    };
    add_value(name, std::move(value_opt));
}

void CommandLine::add_alias(std::string_view alias, std::string_view target) {
    auto target_it = option_lookup_.find(std::string(target));
    if (target_it == option_lookup_.end()) {
        std::string message = "missing option for alias '";
        message.append(target.begin(), target.end());
        message.push_back('\'');
        log_error(message);
        mark_error();
        return;
    }
    option_lookup_.emplace(std::string(alias), target_it->second);
}

bool CommandLine::parse(int argc, char** argv) {
    had_error_ = false;
    for (int i = 1; i < argc; ++i) {
        std::string_view raw_token{argv[i]};

        if (!raw_token.starts_with("-") || raw_token == "-") {
            if (auto error = positional_handler_(raw_token)) {
                log_error(*error);
                mark_error();
            }
            continue;
        }

        std::optional<std::string_view> attached_value;
        std::string_view                name       = raw_token;
        auto                            equals_pos = raw_token.find('=');
        if (equals_pos != std::string_view::npos) {
            name           = raw_token.substr(0, equals_pos);
            attached_value = raw_token.substr(equals_pos + 1);
        }

        OptionEntry* entry = find_option(name);
        if (entry == nullptr) {
            std::string message = "unknown option '";
            message.append(name.begin(), name.end());
            message.push_back('\'');
            log_error(message);
            mark_error();
            continue;
        }

        if (!entry->expects_value) {
            if (attached_value) {
                log_error(entry->name + " does not accept a value");
                mark_error();
                continue;
            }
            if (entry->flag_handler) {
                entry->flag_handler();
            }
            continue;
        }

        std::string_view value;
        if (attached_value) {
            value = *attached_value;
        } else {
            if ((i + 1) >= argc) {
                log_error(entry->name + " requires a value");
                mark_error();
                continue;
            }
            ++i;
            value = std::string_view{argv[i]};
        }

        if (entry->value_handler) {
            if (auto error = entry->value_handler(value)) {
                log_error(*error);
                mark_error();
            }
        }
    }
    return !had_error_;
}

bool CommandLine::had_errors() const {
    return had_error_;
}

auto CommandLine::usage() const -> std::string {
    std::ostringstream out;
    out << "Usage: " << (program_name_.empty() ? "tool" : program_name_) << " [options]";
    if (!summary_.empty()) {
        out << "\n\n" << summary_;
    }
    out << "\n\nOptions:\n";
    for (auto const& entry : options_) {
        std::string left = "  " + entry.name;
        if (entry.expects_value) {
            left += " <" + entry.metavar + ">";
        }
        out << left;
        if (!entry.help.empty()) {
            if (left.size() < 28) {
                out << std::string(28 - left.size(), ' ');
            } else {
                out << "\n" << std::string(28, ' ');
            }
            out << entry.help;
        }
        out << '\n';
    }
    return out.str();
}

CommandLine::OptionEntry* CommandLine::find_option(std::string_view name) {
    auto it = option_lookup_.find(std::string(name));
    if (it == option_lookup_.end()) {
        return nullptr;
    }
    return &options_[it->second];
}

void CommandLine::register_option(OptionEntry entry) {
    options_.push_back(std::move(entry));
    auto index = options_.size() - 1;
    option_lookup_.emplace(options_.back().name, index);
}

void CommandLine::log_error(std::string_view message) {
    std::string text;
    if (!program_name_.empty()) {
        text = program_name_ + ": ";
    }
    text.append(message.begin(), message.end());
    if (error_logger_) {
        error_logger_(text);
    } else {
        std::cerr << text << '\n';
    }
}

void CommandLine::mark_error() {
    had_error_ = true;
}

} // namespace TP::Cli
