/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "SymbolTableParser.h"
#include <elf.h>
#include <algorithm>
#include <cctype>
#include "../ElfExceptions.h"
#include "../ElfImage.h"

using StackTkExceptions::MalformedInputError;
using StackTkExceptions::UnresolvedNameError;

namespace {
bool isDecimal(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

// Entry size of each known encoding
constexpr uint64_t SYM32_ENTRY_SIZE = sizeof(Elf32_Sym);
constexpr uint64_t SYM64_ENTRY_SIZE = sizeof(Elf64_Sym);
}  // namespace

SymbolTableScan SymbolTableParser::parse(const ElfImage& image) {
    auto symtab = image.findSection(SYMTAB_SECTION);
    if (!symtab) {
        SymbolTableScan empty;
        empty.addressWidth = image.addressWidth();
        return empty;
    }

    if (symtab->type != SHT_SYMTAB) {
        throw MalformedInputError("Section is not a symbol table (sh_type " +
                                      std::to_string(symtab->type) + ")",
                                  SYMTAB_SECTION);
    }

    AddressWidth width;
    if (symtab->entrySize == SYM32_ENTRY_SIZE) {
        width = AddressWidth::Bits32;
    } else if (symtab->entrySize == SYM64_ENTRY_SIZE) {
        width = AddressWidth::Bits64;
    } else {
        throw MalformedInputError("Unrecognized symbol entry size " +
                                      std::to_string(symtab->entrySize),
                                  SYMTAB_SECTION);
    }

    if (symtab->entrySize != image.symbolEntrySize()) {
        throw MalformedInputError("Symbol entry size " + std::to_string(symtab->entrySize) +
                                      " does not match the ELF class",
                                  SYMTAB_SECTION);
    }

    if (symtab->size % symtab->entrySize != 0) {
        throw MalformedInputError("Section size is not a multiple of the entry size",
                                  SYMTAB_SECTION,
                                  symtab->size - symtab->size % symtab->entrySize);
    }

    SymbolTableScan scan = classify(image.readSymbols(*symtab), width);
    scan.present = true;
    return scan;
}

SymbolTableScan SymbolTableParser::classify(const std::vector<SymbolEntry>& entries,
                                            AddressWidth width) {
    SymbolTableScan scan;
    scan.addressWidth = width;
    scan.entryCount = entries.size();

    for (const auto& entry : entries) {
        if (entry.type == SymbolType::Func) {
            if (!entry.name) {
                throw UnresolvedNameError("Cannot resolve name of function symbol", entry.index);
            }

            if (entry.value == 0 && entry.size == 0) {
                scan.undefined.insert(*entry.name);
            } else {
                auto it = scan.defined.try_emplace(entry.value, entry.size).first;
                it->second.addName(*entry.name);
            }
        } else if (entry.type == SymbolType::NoType) {
            if (entry.name && !isMappingTag(*entry.name)) {
                scan.aliasCandidates[entry.value].push_back(*entry.name);
            }
        }
    }

    return scan;
}

bool SymbolTableParser::isMappingTag(const std::string& name) {
    if (name == "$a" || name == "$t" || name == "$d") {
        return true;
    }

    if (name.size() > 3 && name[0] == '$' && (name[1] == 'a' || name[1] == 't' || name[1] == 'd') &&
        name[2] == '.') {
        return isDecimal(name.substr(3));
    }

    return false;
}
