/**
 * @file main.cpp
 * @brief Command-line entry point for stacktk
 *
 * Loads an ELF executable built with stack size instrumentation
 * (-Z emit-stack-sizes, -fstack-size-section) and prints the stack frame size
 * of every function, largest first.
 *
 * @section usage_examples Usage Examples
 * @code
 * // Full report
 * ./stacktk firmware.elf
 *
 * // Only functions using at least 256 bytes of stack, as JSON
 * ./stacktk --min-stack 256 --json firmware.elf
 *
 * // Raw linker names with addresses
 * ./stacktk --no-demangle --show-addresses firmware.elf
 * @endcode
 *
 * @copyright Mozilla Public License 2.0
 */

/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include <iostream>
#include <stdexcept>
#include "ElfExceptions.h"
#include "FileAccessStrategy.h"
#include "NameDemangler.h"
#include "StackUsageAnalyzer.h"
#include "cli/CLI11Parser.h"
#include "cli/ConfigValidator.h"
#include "output/OutputGenerator.h"
#include "output/ReportBuilder.h"

namespace {
void logSummary(const Functions& functions, const AnalysisStats& stats, int verbosity) {
    size_t with_stack = 0;
    for (const auto& [address, function] : functions.defined) {
        if (function.stack()) {
            ++with_stack;
        }
    }

    std::cerr << "Machine: " << stats.machine << ", "
              << (stats.littleEndian ? "little" : "big") << "-endian, "
              << static_cast<int>(functions.addressWidth) << "-bit addresses\n";
    if (!stats.hasSymbolTable) {
        std::cerr << "Warning: no .symtab section, the executable may be stripped\n";
    } else {
        std::cerr << "Symbols: " << stats.symbolCount << " entries, " << functions.defined.size()
                  << " defined functions, " << functions.undefined.size()
                  << " undefined, " << stats.aliasGroupsAttached << " alias groups attached\n";
    }

    if (!stats.hasStackSizes) {
        std::cerr << "Warning: no .stack_sizes section, build with -Z emit-stack-sizes or "
                     "-fstack-size-section\n";
    } else {
        std::cerr << "Stack sizes: " << stats.stackRecordsDecoded << " records, "
                  << stats.stackRecordsMatched << " matched, " << with_stack << " of "
                  << functions.defined.size() << " functions covered\n";
    }

    if (verbosity > 1) {
        for (const auto& name : functions.undefined) {
            std::cerr << "  undefined: " << name << '\n';
        }
        for (const auto& [address, function] : functions.defined) {
            if (!function.stack() && !function.names().empty()) {
                std::cerr << "  no stack data: " << function.names().front() << '\n';
            }
        }
    }
}
}  // namespace

int main(int argc, char* argv[]) {
    try {
        auto config_result = CLI11Parser::parse(argc, argv);
        if (!config_result) {
            // CLI11 already printed the error/help message
            return CLI11Parser::lastExitCode();
        }
        Config config = *config_result;

        auto validationResult = ConfigValidator::validate(config);
        if (!validationResult.is_valid) {
            std::cerr << "Configuration error: " << validationResult.error_message << '\n';
            return 1;
        }

        for (const auto& warning : validationResult.warnings) {
            std::cerr << "Warning: " << warning << '\n';
        }

        FileAccessConfig access_config;
        access_config.mmap_threshold = config.mmapThreshold;
        auto file = FileAccessStrategy::create(config.inputFile, access_config);

        if (config.verbosity > 0) {
            const auto metrics = file->getMetrics();
            std::cerr << "Loaded " << config.inputFile << " (" << file->size() << " bytes, "
                      << metrics.strategy_used << (metrics.fallback_used ? ", fallback" : "")
                      << ", " << metrics.load_time.count() << " ms)\n";
        }

        AnalysisStats stats;
        Functions functions = StackUsageAnalyzer::analyzeExecutable(file->data(), file->size(), &stats);

        if (config.verbosity > 0) {
            logSummary(functions, stats, config.verbosity);
        }

        NameDemangler demangler(config.enableDemangling);
        auto entries = ReportBuilder::build(
            functions,
            [&demangler](const std::string& name) { return demangler.demangle(name); },
            config.minStack);

        OutputGenerator generator(functions.addressWidth);
        generator.generate(entries, functions.undefined, config, std::cout);

    } catch (const StackTkExceptions::ElfParsingError& e) {
        std::cerr << "ELF Analysis Error: " << e.getDetailedMessage() << '\n';
        return 1;
    } catch (const FileAccessException& e) {
        std::cerr << "File Error: " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
