/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "CLI11Parser.h"
#include <regex>
#include "VersionInfo.h"

int CLI11Parser::last_exit_code_ = 0;

std::string
CompactFormatter::make_help(const CLI::App* app, std::string name, CLI::AppFormatMode mode) const {
    std::string help = CLI::Formatter::make_help(app, name, mode);

    // Remove the positionals section entirely
    size_t pos = help.find("\nPOSITIONALS:");
    if (pos != std::string::npos) {
        size_t end = help.find("\nOPTIONS:", pos);
        if (end != std::string::npos) {
            help.erase(pos, end - pos);
        }
    }

    help = std::regex_replace(help, std::regex("\n\n\n+"), "\n\n");

    return help;
}

std::optional<Config> CLI11Parser::parse(int argc, char* argv[]) {
    Config config;

    CLI::App app{"stacktk - per-function stack usage report for ELF executables", "stacktk"};
    setupApp(app, config);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Prints help/version/error and yields 0 for help and version
        last_exit_code_ = app.exit(e);
        return std::nullopt;
    }

    last_exit_code_ = 0;
    return config;
}

int CLI11Parser::lastExitCode() {
    return last_exit_code_;
}

void CLI11Parser::setupApp(CLI::App& app, Config& config) {
    auto formatter = std::make_shared<CompactFormatter>();
    formatter->column_width(40);
    formatter->label("REQUIRED", "");
    app.formatter(formatter);

    app.allow_extras(false);

    app.set_version_flag("--version,-v", []() {
        VersionInfo::showVersion();
        return std::string{};
    });
    app.set_help_flag("--help,-h", "Show this help");

    app.add_option("file", config.inputFile, "ELF executable to analyze")
        ->required()
        ->check(CLI::ExistingFile);

    // Report options
    app.add_option("--min-stack",
                   config.minStack,
                   "Only show functions whose stack size is greater or equal to this");
    app.add_flag("--show-addresses", config.showAddresses, "Include function addresses");
    app.add_flag("--undefined", config.showUndefined, "Also list undefined function symbols");
    app.add_flag_function(
        "--no-demangle",
        [&config](int64_t count) { config.enableDemangling = count == 0; },
        "Print raw linker symbol names");

    // Output format options
    auto* format_opt = app.add_option("--format", config.format, "Output format: text, csv, json")
                           ->check(CLI::IsMember({"text", "csv", "json"}));
    auto* json_flag = app.add_flag_function(
           "--json",
           [&config](int64_t count) {
               if (count > 0) config.format = "json";
           },
           "Output in JSON format")
        ->excludes(format_opt);
    auto* csv_flag = app.add_flag_function(
           "--csv",
           [&config](int64_t count) {
               if (count > 0) config.format = "csv";
           },
           "Output in CSV format")
        ->excludes(format_opt);
    json_flag->excludes(csv_flag);
    app.add_flag_function(
           "--verbose",
           [&config](int64_t count) { config.verbosity = static_cast<int>(count); },
           "Show diagnostics on stderr (use twice for more detail)")
        ->multi_option_policy(CLI::MultiOptionPolicy::Sum);

    app.add_option("--mmap-threshold",
                   config.mmapThreshold,
                   "File size in bytes above which the file is memory-mapped")
        ->check(CLI::PositiveNumber);
}
