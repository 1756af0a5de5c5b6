/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <set>
#include <string>
#include <vector>
#include "StackStructures.h"

class ElfImage;

/**
 * @file SymbolTableParser.h
 * @brief Classification of symbol table entries into functions and aliases
 */

/**
 * @brief Result of scanning a symbol table
 */
struct SymbolTableScan {
    AddressWidth addressWidth = AddressWidth::Bits64;  ///< Width implied by the entry encoding
    bool present = false;                               ///< Whether .symtab exists
    size_t entryCount = 0;                              ///< Number of entries scanned
    std::set<std::string> undefined;                    ///< Function names with address 0 and size 0
    FunctionMap defined;                                ///< Functions keyed by address
    AliasCandidateMap aliasCandidates;                  ///< Untyped names keyed by address
};

/**
 * @class SymbolTableParser
 * @brief Builds the function catalog from the executable's .symtab
 *
 * ## Classification rules:
 * - Func entries with address 0 and size 0 are undefined references
 * - Other Func entries create (or extend) the function at their address; the
 *   first entry fixes the size, later ones only contribute names
 * - NoType entries become alias candidates unless they are ARM mapping tags
 * - A Func entry without a resolvable name is fatal; a NoType one is skipped
 */
class SymbolTableParser {
public:
    /// @brief Name of the section holding the static symbol table
    static constexpr const char* SYMTAB_SECTION = ".symtab";

    /**
     * @brief Scan the .symtab section of an image
     *
     * A missing .symtab yields empty results and the address width of the ELF class.
     *
     * @throws MalformedInputError if .symtab is not a symbol table of a recognized encoding
     * @throws UnresolvedNameError if a function entry has no resolvable name
     */
    static SymbolTableScan parse(const ElfImage& image);

    /**
     * @brief Classify already decoded entries
     * @param entries Symbol entries in table order
     * @param width Address width recorded in the result
     * @throws UnresolvedNameError if a function entry has no resolvable name
     */
    static SymbolTableScan classify(const std::vector<SymbolEntry>& entries, AddressWidth width);

    /**
     * @brief Check whether a name is an ARM mapping tag
     *
     * Mapping tags ($a ARM code, $t Thumb code, $d data) mark instruction set
     * boundaries inside a function. They may carry a ".<decimal>" suffix.
     */
    static bool isMappingTag(const std::string& name);
};
