#include "cli/CommandLine.hpp"
#include "log/TaggedLogger.hpp"

#include <treepatch/dom/Markup.hpp>
#include <treepatch/dom/NodeJson.hpp>
#include <treepatch/protocol/MutationJson.hpp>
#include <treepatch/protocol/MutationReader.hpp>
#include <treepatch/runtime/Interpreter.hpp>
#include <treepatch/runtime/RuntimeOptions.hpp>
#include <treepatch/templates/TemplateRegistry.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

enum class OutputFormat { Markup, Json };

struct ReplayOptions {
    std::vector<std::string>   inputs;
    OutputFormat               format     = OutputFormat::Markup;
    bool                       pretty     = false;
    bool                       decodeOnly = false;
    bool                       showHelp   = false;
    std::optional<std::string> configPath;
};

auto parse_cli(int argc, char** argv, TP::Cli::CommandLine& cli) -> std::optional<ReplayOptions> {
    using TP::Cli::CommandLine;
    ReplayOptions options;

    cli.set_program_name("treepatch_replay");
    cli.set_summary("Applies binary mutation buffers, in order, to an empty mount root and prints the result.");
    cli.set_error_logger([](std::string const& message) { std::cerr << message << "\n"; });
    cli.set_positional_handler([&](std::string_view token) -> CommandLine::ParseError {
        options.inputs.emplace_back(token);
        return std::nullopt;
    });

    cli.add_value("--input",
                  {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                       if (value.empty()) {
                           return std::string{"--input requires a file"};
                       }
                       options.inputs.emplace_back(value);
                       return std::nullopt;
                   },
                   .metavar = "FILE",
                   .help    = "Mutation buffer to apply (repeatable; bare arguments work too)"});
    cli.add_value("--format",
                  {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                       if (value == "markup") {
                           options.format = OutputFormat::Markup;
                       } else if (value == "json") {
                           options.format = OutputFormat::Json;
                       } else {
                           return std::string{"--format must be 'markup' or 'json'"};
                       }
                       return std::nullopt;
                   },
                   .metavar = "markup|json",
                   .help    = "Output format (default markup)"});
    cli.add_value("--config",
                  {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                       if (value.empty()) {
                           return std::string{"--config requires a file"};
                       }
                       options.configPath = std::string{value};
                       return std::nullopt;
                   },
                   .metavar = "FILE",
                   .help    = "Runtime options JSON"});
    cli.add_flag("--pretty", {.on_set = [&] { options.pretty = true; }, .help = "Indent JSON output"});
    cli.add_flag("--decode-only",
                 {.on_set = [&] { options.decodeOnly = true; }, .help = "Print decoded records as JSON instead of applying"});
    cli.add_flag("--help", {.on_set = [&] { options.showHelp = true; }, .help = "Show this message"});
    cli.add_alias("-h", "--help");

    if (!cli.parse(argc, argv)) {
        return std::nullopt;
    }
    return options;
}

auto read_file(std::string const& path) -> std::optional<std::vector<std::uint8_t>> {
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        return std::nullopt;
    }
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
}

auto dump(nlohmann::json const& json, bool pretty) -> std::string {
    return json.dump(pretty ? 2 : -1);
}

} // namespace

int main(int argc, char** argv) {
    TP::Cli::CommandLine cli;
    auto                 parsed = parse_cli(argc, argv, cli);
    if (!parsed) {
        std::cerr << cli.usage();
        return 2;
    }
    auto const& options = *parsed;
    if (options.showHelp) {
        std::cout << cli.usage();
        return 0;
    }
    if (options.inputs.empty()) {
        std::cerr << "treepatch_replay: no input buffers given\n" << cli.usage();
        return 2;
    }

    TP::Runtime::RuntimeOptions runtime;
    if (options.configPath) {
        auto loaded = TP::Runtime::LoadRuntimeOptionsFile(*options.configPath);
        if (!loaded) {
            std::cerr << "treepatch_replay: " << TP::describeError(loaded.error()) << "\n";
            return 1;
        }
        runtime = std::move(*loaded);
    }
    if (!TP::Runtime::ApplyRuntimeEnvOverrides(runtime)) {
        return 1;
    }
    if (auto problem = TP::Runtime::ValidateRuntimeOptions(runtime)) {
        std::cerr << "treepatch_replay: " << *problem << "\n";
        return 1;
    }
    TP::set_thread_name("Replay");
    TP::set_logging_enabled(runtime.logging_enabled);

    auto                        root = TP::Dom::Node::createElement("div");
    TP::Templates::TemplateRegistry templates;
    TP::Runtime::Interpreter    interpreter{root, templates};
    auto                        decoded = nlohmann::json::array();

    for (auto const& path : options.inputs) {
        auto bytes = read_file(path);
        if (!bytes) {
            std::cerr << "treepatch_replay: unable to read '" << path << "'\n";
            return 1;
        }
        if (bytes->size() > runtime.buffer_capacity) {
            std::cerr << "treepatch_replay: '" << path << "' holds " << bytes->size()
                      << " bytes, more than the " << runtime.buffer_capacity << " byte buffer\n";
            return 1;
        }

        if (options.decodeOnly) {
            TP::Protocol::MutationReader reader{*bytes};
            auto                         records = reader.readAll();
            if (!records) {
                std::cerr << "treepatch_replay: " << path << ": " << TP::describeError(records.error()) << "\n";
                return 1;
            }
            auto entry = nlohmann::json{{"input", path}, {"records", nlohmann::json::array()}};
            for (auto const& record : *records) {
                entry["records"].push_back(TP::Protocol::toJson(record));
            }
            decoded.push_back(std::move(entry));
            continue;
        }

        auto stats = interpreter.applyMutations(*bytes);
        if (!stats) {
            std::cerr << "treepatch_replay: " << path << ": " << TP::describeError(stats.error()) << "\n";
            return 1;
        }
    }

    if (options.decodeOnly) {
        std::cout << dump(decoded, options.pretty) << "\n";
        return 0;
    }
    if (options.format == OutputFormat::Json) {
        std::cout << dump(TP::Dom::toJson(*root), options.pretty) << "\n";
    } else {
        std::cout << TP::Dom::innerMarkup(*root) << "\n";
    }
    return 0;
}
