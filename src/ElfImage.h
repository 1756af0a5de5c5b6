/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "StackStructures.h"

// Forward declarations for libelf types (avoiding conflicts)
typedef struct Elf Elf;
typedef struct Elf_Scn Elf_Scn;

/**
 * @file ElfImage.h
 * @brief libelf-backed view over an executable held in memory
 *
 * ElfImage is the only component that talks to libelf. It provides the two
 * lookup services the analysis engine needs: sections by name, and symbol
 * entries with their string-table names. Everything above it works on plain
 * SymbolEntry / SectionView values.
 */

/**
 * @brief Raw view of one section of the image
 *
 * The bytes point into the ElfImage's private copy of the executable and stay
 * valid for the lifetime of the image.
 */
struct SectionView {
    std::string name;             ///< Section name from .shstrtab
    uint32_t type = 0;            ///< sh_type
    uint64_t entrySize = 0;       ///< sh_entsize
    uint32_t link = 0;            ///< sh_link (string table for symbol tables)
    const uint8_t* bytes = nullptr;
    size_t size = 0;              ///< Number of bytes available (0 for SHT_NOBITS)
    Elf_Scn* scn = nullptr;       ///< libelf section handle
};

/**
 * @class ElfImage
 * @brief RAII owner of a libelf descriptor over an in-memory executable
 *
 * ## Usage:
 * ```cpp
 * ElfImage image(data, size);
 * if (auto symtab = image.findSection(".symtab")) {
 *     for (const auto& entry : image.readSymbols(*symtab)) { ... }
 * }
 * ```
 */
class ElfImage {
public:
    /**
     * @brief Copy the buffer and open it with libelf
     * @param data Pointer to the executable bytes
     * @param size Number of bytes
     * @throws ElfFileError if the buffer is not an ELF object
     */
    ElfImage(const uint8_t* data, size_t size);

    ~ElfImage();

    ElfImage(const ElfImage&) = delete;
    ElfImage& operator=(const ElfImage&) = delete;

    ElfImage(ElfImage&& other) noexcept;
    ElfImage& operator=(ElfImage&& other) noexcept;

    bool isLittleEndian() const { return little_endian_; }
    uint16_t machine() const { return machine_; }

    /// @brief Address width implied by the ELF class
    AddressWidth addressWidth() const {
        return is32bit_ ? AddressWidth::Bits32 : AddressWidth::Bits64;
    }

    /// @brief Symbol table entry size required by the ELF class (16 or 24 bytes)
    size_t symbolEntrySize() const;

    /**
     * @brief Find a section by name
     * @param name Section name, e.g. ".symtab"
     * @return The first section with that name, or std::nullopt
     * @throws ElfFileError if the section headers cannot be read
     */
    std::optional<SectionView> findSection(const std::string& name) const;

    /**
     * @brief Decode all entries of a symbol table section
     *
     * Entry names are resolved through the string table named by sh_link;
     * failed lookups are reported as an empty optional, not as an error.
     *
     * @param symtab Section returned by findSection()
     * @throws ElfFileError if libelf cannot translate the section data
     */
    std::vector<SymbolEntry> readSymbols(const SectionView& symtab) const;

private:
    void close() noexcept;

    std::vector<char> image_;  ///< Private copy handed to elf_memory
    Elf* elf_ = nullptr;
    bool is32bit_ = false;
    bool little_endian_ = true;
    uint16_t machine_ = 0;
};
