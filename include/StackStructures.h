/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file StackStructures.h
 * @brief Core data structures for symbol table and stack usage analysis
 *
 * This file defines the fundamental data structures shared by the analysis engine:
 *
 * ## Structure Categories:
 * 1. **Symbol Structures**: Decoded symbol table entries, independent of ELF class
 * 2. **Catalog Structures**: Functions discovered in the executable and their stack usage
 * 3. **Report Structures**: Flattened rows handed to the output layer
 *
 * ## Usage Context:
 * - ElfImage produces SymbolEntry values from the raw symbol table
 * - SymbolTableParser, AliasResolver and StackSizeCorrelator build the Functions catalog
 * - ReportBuilder converts the catalog into ReportEntry rows
 *
 * @see StackUsageAnalyzer.h for the engine entry point
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

// ============================================================================
// Symbol Enumerations
// ============================================================================

/**
 * @brief Symbol type (lower four bits of st_info)
 *
 * Only Func and NoType are interpreted by the analysis; the remaining values
 * are kept so decoded entries can be inspected in diagnostics and tests.
 */
enum class SymbolType : uint8_t {
    NoType = 0,   ///< STT_NOTYPE - untyped (aliases, mapping tags, linker symbols)
    Object = 1,   ///< STT_OBJECT - data object
    Func = 2,     ///< STT_FUNC - function entry point
    Section = 3,  ///< STT_SECTION - section symbol
    File = 4,     ///< STT_FILE - source file name
    Common = 5,   ///< STT_COMMON - common block
    Tls = 6,      ///< STT_TLS - thread-local storage
    Other = 0xff  ///< Anything else (OS/processor specific)
};

/**
 * @brief Symbol binding (upper four bits of st_info)
 */
enum class SymbolBinding : uint8_t {
    Local = 0,   ///< STB_LOCAL
    Global = 1,  ///< STB_GLOBAL
    Weak = 2,    ///< STB_WEAK
    Other = 0xff ///< OS/processor specific
};

/**
 * @brief Width of the addresses stored in the executable
 *
 * Fixed once per executable. Selects both the symbol table entry encoding and
 * the address field size of each .stack_sizes record.
 */
enum class AddressWidth : uint8_t {
    Bits32 = 32,
    Bits64 = 64
};

/**
 * @brief Number of bytes occupied by an address of the given width
 */
inline size_t addressBytes(AddressWidth width) {
    return width == AddressWidth::Bits32 ? 4 : 8;
}

// ============================================================================
// Symbol Structures
// ============================================================================

/**
 * @brief One symbol table entry, decoded independently of the ELF class
 *
 * The name is resolved through the linked string table. A failed lookup
 * leaves name empty (std::nullopt), which is distinct from a valid empty
 * string produced by st_name == 0.
 */
struct SymbolEntry {
    size_t index = 0;                 ///< Position in the symbol table
    uint64_t value = 0;               ///< st_value (address for executables)
    uint64_t size = 0;                ///< st_size
    SymbolType type = SymbolType::NoType;
    SymbolBinding binding = SymbolBinding::Local;
    uint16_t sectionIndex = 0;        ///< st_shndx
    std::optional<std::string> name;  ///< Resolved name, nullopt if lookup failed
};

// ============================================================================
// Catalog Structures
// ============================================================================

/**
 * @brief A symbol that represents a function (subroutine)
 *
 * A single physical function may carry several linker names (weak aliases,
 * untyped labels at the same address). They are kept in discovery order.
 */
class Function {
public:
    explicit Function(uint64_t size) : size_(size) {}

    /// @brief Raw (mangled) names of the function and its aliases
    const std::vector<std::string>& names() const { return names_; }

    /// @brief Size of the subroutine in bytes
    uint64_t size() const { return size_; }

    /// @brief Stack usage in bytes, nullopt if no stack size record matched
    std::optional<uint64_t> stack() const { return stack_; }

    void addName(const std::string& name) { names_.push_back(name); }

    void addNames(const std::vector<std::string>& names) {
        names_.insert(names_.end(), names.begin(), names.end());
    }

    void setStack(uint64_t stack) { stack_ = stack; }

private:
    std::vector<std::string> names_;
    uint64_t size_;
    std::optional<uint64_t> stack_;
};

/// @brief Defined functions keyed by entry address
using FunctionMap = std::map<uint64_t, Function>;

/// @brief Untyped symbol names waiting to be attached to a function, keyed by address
using AliasCandidateMap = std::map<uint64_t, std::vector<std::string>>;

/**
 * @brief Functions found after analyzing an executable
 */
struct Functions {
    /// Whether addresses of these functions are 32-bit or 64-bit
    AddressWidth addressWidth = AddressWidth::Bits64;

    /// "undefined" symbols: functions resolved at load time (address 0, size 0)
    std::set<std::string> undefined;

    /// "defined" symbols: functions with known locations
    FunctionMap defined;
};

/**
 * @brief One record of the .stack_sizes section
 */
struct StackSizeRecord {
    uint64_t address = 0;  ///< Function address as emitted by the compiler
    uint64_t stack = 0;    ///< Stack frame size in bytes

    StackSizeRecord() = default;
    StackSizeRecord(uint64_t addr, uint64_t bytes) : address(addr), stack(bytes) {}
};

// ============================================================================
// Report Structures
// ============================================================================

/**
 * @brief One row of the stack usage report
 *
 * stackSize is 0 when no record matched; stackKnown keeps that case distinct
 * from a measured zero for the structured output formats.
 */
struct ReportEntry {
    std::string name;        ///< Demangled names joined with a single space
    uint64_t address = 0;    ///< Function entry address
    uint64_t codeSize = 0;   ///< Size of the function's code in bytes
    uint64_t stackSize = 0;  ///< Stack usage in bytes (0 if unknown)
    bool stackKnown = false; ///< Whether a stack size record matched
};
