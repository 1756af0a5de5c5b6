/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file StackUsageAnalyzer.h
 * @brief Executable analysis engine and tool configuration
 *
 * The engine turns the raw bytes of a linked executable into a Functions
 * catalog in four stages:
 *
 * 1. SymbolTableParser - defined functions, undefined references, alias candidates
 * 2. AliasResolver - untyped labels merged into the function at the same address
 * 3. StackSizeDecoder - (address, stack bytes) records from .stack_sizes
 * 4. StackSizeCorrelator - records attached to their functions
 *
 * The analysis is a pure function of the buffer. Reading the file, demangling
 * and rendering belong to the caller.
 *
 * @see ReportBuilder for turning the catalog into report rows
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include "StackStructures.h"

/**
 * @brief Performance-related constants
 */
namespace StackTkOptimization {
/** @brief Files larger than this are memory-mapped instead of read into RAM */
constexpr size_t DEFAULT_MMAP_THRESHOLD = 10 * 1024 * 1024;  // 10MB
}  // namespace StackTkOptimization

/**
 * @brief Command-line configuration for the stacktk tool
 */
struct Config {
    std::string inputFile;
    std::string format = "text";  ///< Output format ("text", "csv", "json")
    uint64_t minStack = 0;        ///< Only report functions with stack >= minStack
    int verbosity = 0;
    bool showAddresses = false;     ///< Prepend function addresses to text/csv output
    bool showUndefined = false;     ///< List undefined function symbols after the report
    bool enableDemangling = true;   ///< Demangle C++ and Rust (legacy and v0) symbol names
    size_t mmapThreshold =
        StackTkOptimization::DEFAULT_MMAP_THRESHOLD;  ///< Memory mapping threshold for large files
};

/**
 * @brief Counters collected while building the catalog
 *
 * Reported on stderr with --verbose; they do not influence the result.
 */
struct AnalysisStats {
    uint16_t machine = 0;             ///< e_machine
    bool littleEndian = true;         ///< ELF data encoding
    bool hasSymbolTable = false;      ///< .symtab present
    bool hasStackSizes = false;       ///< .stack_sizes present
    size_t symbolCount = 0;           ///< Entries in .symtab
    size_t aliasGroupsAttached = 0;   ///< Alias groups merged into functions
    size_t stackRecordsDecoded = 0;   ///< Records read from .stack_sizes
    size_t stackRecordsMatched = 0;   ///< Records attached to a function
};

/**
 * @class StackUsageAnalyzer
 * @brief Entry point of the analysis engine
 *
 * ## Usage Example:
 * ```cpp
 * auto file = FileAccessStrategy::create("firmware.elf");
 * Functions functions = StackUsageAnalyzer::analyzeExecutable(file->data(), file->size());
 * for (const auto& [address, function] : functions.defined) {
 *     if (function.stack()) { ... }
 * }
 * ```
 */
class StackUsageAnalyzer {
public:
    /**
     * @brief Parse an executable and return its functions with their stack usage
     *
     * Missing .symtab or .stack_sizes sections are not errors: the catalog is
     * simply empty, or every stack field stays unset.
     *
     * @param data Executable bytes
     * @param size Number of bytes
     * @param stats Optional counters filled during the analysis
     * @throws ElfFileError if the buffer is not an ELF object
     * @throws MalformedInputError if .symtab or .stack_sizes cannot be decoded
     * @throws UnresolvedNameError if a function symbol has no name
     */
    static Functions
    analyzeExecutable(const uint8_t* data, size_t size, AnalysisStats* stats = nullptr);
};
