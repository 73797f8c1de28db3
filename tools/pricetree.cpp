#include <pricetree/PriceTree.hpp>
#include "cli/ArgumentParser.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace {

struct PriceTreeCliOptions {
    std::optional<std::filesystem::path> inputPath;
    std::optional<std::filesystem::path> configPath;
    std::optional<char>                  delimiter;
    std::vector<PT::WeightEdit>          edits;
    std::vector<std::string>             expanded;
    bool                                 expandAll   = false;
    PT::ReportFormat                     format      = PT::ReportFormat::Table;
    int                                  indent      = 2;
    std::size_t                          maxDepth    = PT::TreeJsonOptions::kUnlimitedDepth;
    bool                                 includeMeta = false;
    std::optional<std::filesystem::path> outputPath;
    bool                                 validate    = false;
    bool                                 report      = false;
    bool                                 showHelp    = false;
};

void print_usage(PT::CLI::ArgumentParser const& cli) {
    std::cout << "Usage: pricetree --input <file.csv> [options]\n"
                 "Options:\n"
              << cli.usage();
}

auto parse_edit(std::string_view text) -> std::optional<PT::WeightEdit> {
    auto const equals = text.rfind('=');
    if (equals == std::string_view::npos || equals == 0) {
        return std::nullopt;
    }
    auto const code   = PT::trim_ascii(text.substr(0, equals));
    auto const number = PT::trim_ascii(text.substr(equals + 1));
    if (code.empty() || number.empty()) {
        return std::nullopt;
    }
    double value  = 0.0;
    auto   result = std::from_chars(number.data(), number.data() + number.size(), value);
    if (result.ec != std::errc{} || result.ptr != number.data() + number.size()) {
        return std::nullopt;
    }
    return PT::WeightEdit{std::string{code}, value};
}

auto parse_size(std::string_view text, std::size_t& target, std::string_view name)
        -> PT::CLI::ArgumentParser::ParseError {
    std::size_t value  = 0;
    auto        result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return std::string{name} + " must be a non-negative integer";
    }
    target = value;
    return std::nullopt;
}

auto build_parser(PT::CLI::ArgumentParser& cli, PriceTreeCliOptions& options) -> void {
    using PT::CLI::ArgumentParser;
    cli.set_program_name("pricetree");
    cli.set_error_logger([](std::string const& message) { std::cerr << message << "\n"; });

    cli.add_value("--input", {.on_value = [&](std::string_view value) -> ArgumentParser::ParseError {
                                  if (value.empty()) {
                                      return std::string{"--input requires a file"};
                                  }
                                  options.inputPath = std::filesystem::path(std::string{value});
                                  return std::nullopt;
                              },
                              .value_name = "file.csv",
                              .help       = "Category table to load (required)"});
    cli.add_alias("-i", "--input");

    cli.add_value("--config", {.on_value = [&](std::string_view value) -> ArgumentParser::ParseError {
                                   if (value.empty()) {
                                       return std::string{"--config requires a file"};
                                   }
                                   options.configPath = std::filesystem::path(std::string{value});
                                   return std::nullopt;
                               },
                               .value_name = "file.json",
                               .help       = "JSON load options (columns, labels, markers)"});

    cli.add_value("--delimiter", {.on_value = [&](std::string_view value) -> ArgumentParser::ParseError {
                                      auto delimiter = PT::ParseDelimiter(value);
                                      if (!delimiter) {
                                          return "unsupported delimiter '" + std::string{value} + "'";
                                      }
                                      options.delimiter = *delimiter;
                                      return std::nullopt;
                                  },
                                  .value_name = "c",
                                  .help       = "Field separator: , ; | tab or auto (default auto)"});

    cli.add_value("--set", {.on_value = [&](std::string_view value) -> ArgumentParser::ParseError {
                                auto edit = parse_edit(value);
                                if (!edit) {
                                    return "--set expects <code>=<weight>, got '" + std::string{value} + "'";
                                }
                                options.edits.push_back(std::move(*edit));
                                return std::nullopt;
                            },
                            .value_name = "code=weight",
                            .help       = "Rebalance a category to a new weight (repeatable, applied in order)"});

    cli.add_value("--expand", {.on_value = [&](std::string_view value) -> ArgumentParser::ParseError {
                                   options.expanded.emplace_back(PT::trim_ascii(value));
                                   return std::nullopt;
                               },
                               .value_name = "code",
                               .help       = "Show the children of a category in the table (repeatable)"});
    cli.add_flag("--expand-all", {.on_set = [&] { options.expandAll = true; }, .help = "Expand every category"});

    cli.add_value("--format", {.on_value = [&](std::string_view value) -> ArgumentParser::ParseError {
                                   if (value == "table") {
                                       options.format = PT::ReportFormat::Table;
                                   } else if (value == "json") {
                                       options.format = PT::ReportFormat::Json;
                                   } else {
                                       return "--format must be 'table' or 'json'";
                                   }
                                   return std::nullopt;
                               },
                               .value_name = "table|json",
                               .help       = "Output format (default table)"});

    cli.add_int("--indent", {.on_value = [&](int value) { options.indent = value; },
                             .help     = "JSON indent (default 2, -1 for compact)"});
    cli.add_value("--max-depth", {.on_value = [&](std::string_view value) -> ArgumentParser::ParseError {
                                      return parse_size(value, options.maxDepth, "--max-depth");
                                  },
                                  .value_name = "n",
                                  .help       = "Deepest JSON level to export (default unlimited)"});
    cli.add_flag("--include-meta",
                 {.on_set = [&] { options.includeMeta = true; }, .help = "Add a _meta block to the JSON output"});

    cli.add_value("--output", {.on_value = [&](std::string_view value) -> ArgumentParser::ParseError {
                                   if (value.empty()) {
                                       return std::string{"--output requires a file"};
                                   }
                                   options.outputPath = std::filesystem::path(std::string{value});
                                   return std::nullopt;
                               },
                               .value_name = "file",
                               .help       = "Write to a file instead of stdout"});
    cli.add_alias("-o", "--output");

    cli.add_flag("--validate",
                 {.on_set = [&] { options.validate = true; }, .help = "Check the tree invariants before output"});
    cli.add_flag("--report",
                 {.on_set = [&] { options.report = true; }, .help = "Print load statistics on stderr"});
    cli.add_flag("--help", {.on_set = [&] { options.showHelp = true; }, .help = "Show this message"});
    cli.add_alias("-h", "--help");
}

auto write_output(std::string const& text, std::optional<std::filesystem::path> const& output) -> bool {
    if (!output) {
        std::cout << text;
        if (!text.empty() && text.back() != '\n') {
            std::cout << '\n';
        }
        std::cout.flush();
        return static_cast<bool>(std::cout);
    }
    std::filesystem::path destination = *output;
    if (auto parent = destination.parent_path(); !parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
    std::ofstream stream(destination, std::ios::binary);
    if (!stream.is_open()) {
        std::cerr << "Failed to open output file '" << destination.string() << "'" << std::endl;
        return false;
    }
    stream << text;
    if (!stream.good()) {
        std::cerr << "Failed to write output" << std::endl;
        return false;
    }
    return true;
}

auto resolve_load_options(PriceTreeCliOptions const& cli) -> std::optional<PT::LoadOptions> {
    PT::LoadOptions options;
    if (cli.configPath) {
        auto loaded = PT::LoadOptionsFromJson(*cli.configPath, options);
        if (!loaded) {
            std::cerr << "pricetree: " << PT::describeError(loaded.error()) << std::endl;
            return std::nullopt;
        }
        options = std::move(*loaded);
    }
    if (!PT::ApplyLoadEnvOverrides(options)) {
        return std::nullopt;
    }
    if (cli.delimiter) {
        options.delimiter = *cli.delimiter;
    }
    if (auto problem = PT::ValidateLoadOptions(options)) {
        std::cerr << "pricetree: " << *problem << std::endl;
        return std::nullopt;
    }
    return options;
}

void print_report(PT::PriceReport const& report) {
    auto const& build = report.build;
    std::cerr << "records: " << build.recordsSeen << "\n"
              << "categories: " << build.categories << "\n"
              << "skipped totals: " << build.skippedTotals << "\n"
              << "duplicate codes: " << build.duplicateCodes << "\n"
              << "attached to root: " << build.attachedToRoot << "\n"
              << "non-numeric codes: " << build.nonNumericCodes << "\n"
              << "edits applied: " << report.editsApplied << "\n"
              << "nodes in tree: " << report.tree.nodeCount() << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    PriceTreeCliOptions     cliOptions;
    PT::CLI::ArgumentParser cli;
    build_parser(cli, cliOptions);
    if (!cli.parse(argc, argv)) {
        print_usage(cli);
        return EXIT_FAILURE;
    }
    if (cliOptions.showHelp) {
        print_usage(cli);
        return EXIT_SUCCESS;
    }
    if (!cliOptions.inputPath) {
        std::cerr << "pricetree: missing --input" << std::endl;
        print_usage(cli);
        return EXIT_FAILURE;
    }

    auto loadOptions = resolve_load_options(cliOptions);
    if (!loadOptions) {
        return EXIT_FAILURE;
    }

    PT::PriceReportRequest request;
    request.input                = *cliOptions.inputPath;
    request.load                 = std::move(*loadOptions);
    request.edits                = std::move(cliOptions.edits);
    request.expanded             = std::move(cliOptions.expanded);
    request.expandAll            = cliOptions.expandAll;
    request.format               = cliOptions.format;
    request.json.dumpIndent      = cliOptions.indent;
    request.json.maxDepth        = cliOptions.maxDepth;
    request.json.includeMetadata = cliOptions.includeMeta;
    request.validate             = cliOptions.validate;

    auto report = PT::runPriceReport(request);
    if (!report) {
        std::cerr << "pricetree: " << PT::describeError(report.error()) << std::endl;
        return EXIT_FAILURE;
    }
    if (cliOptions.report) {
        print_report(*report);
    }

    if (!write_output(report->text, cliOptions.outputPath)) {
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
