#pragma once

#include "ElfExceptions.h"
#include "StackStructures.h"
#include "StackUsageAnalyzer.h"

#include <catch2/catch_test_macros.hpp>

#include <elf.h>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stacktk::test {

    /// ULEB128 encoding of a value, as written by the compiler into .stack_sizes
    inline std::vector<uint8_t> encodeUleb128(uint64_t value) {
        std::vector<uint8_t> bytes;
        do {
            uint8_t byte = value & 0x7f;
            value >>= 7;
            if (value != 0) {
                byte |= 0x80;
            }
            bytes.push_back(byte);
        } while (value != 0);
        return bytes;
    }

    /// One .stack_sizes record with a little-endian address of the given width
    inline std::vector<uint8_t> encodeStackRecord(uint64_t address, uint64_t stack, AddressWidth width) {
        std::vector<uint8_t> bytes;
        for (size_t i = 0; i < addressBytes(width); ++i) {
            bytes.push_back(static_cast<uint8_t>(address >> (8 * i)));
        }
        auto leb = encodeUleb128(stack);
        bytes.insert(bytes.end(), leb.begin(), leb.end());
        return bytes;
    }

    inline SymbolEntry makeEntry(
            size_t index, const std::optional<std::string>& name, uint64_t value, uint64_t size, SymbolType type) {
        SymbolEntry entry;
        entry.index = index;
        entry.name = name;
        entry.value = value;
        entry.size = size;
        entry.type = type;
        entry.binding = SymbolBinding::Global;
        entry.sectionIndex = value == 0 ? 0 : 1;
        return entry;
    }

    /**
     * Writes minimal ELF executables in memory: a header, an empty .text,
     * optional .symtab/.strtab, optional .stack_sizes and .shstrtab.
     */
    class ElfImageBuilder {
      public:
        explicit ElfImageBuilder(bool is64, bool littleEndian = true) : is64_(is64), little_(littleEndian) {}

        ElfImageBuilder& function(const std::string& name, uint64_t address, uint64_t size, uint8_t bind = STB_GLOBAL) {
            return symbol(name, address, size, STT_FUNC, bind, 1);
        }

        ElfImageBuilder& label(const std::string& name, uint64_t address) {
            return symbol(name, address, 0, STT_NOTYPE, STB_LOCAL, 1);
        }

        ElfImageBuilder& object(const std::string& name, uint64_t address, uint64_t size) {
            return symbol(name, address, size, STT_OBJECT, STB_GLOBAL, 1);
        }

        ElfImageBuilder& undefinedFunction(const std::string& name) {
            return symbol(name, 0, 0, STT_FUNC, STB_GLOBAL, SHN_UNDEF);
        }

        /// Function whose st_name points past the end of .strtab
        ElfImageBuilder& unnamedFunction(uint64_t address, uint64_t size) {
            symbols_.push_back({"", address, size, STT_FUNC, STB_GLOBAL, 1, true});
            return *this;
        }

        ElfImageBuilder& symbol(
                const std::string& name, uint64_t value, uint64_t size, uint8_t type, uint8_t bind, uint16_t shndx) {
            symbols_.push_back({name, value, size, type, bind, shndx, false});
            return *this;
        }

        ElfImageBuilder& stackRecord(uint64_t address, uint64_t stack) {
            auto bytes = encodeStackRecord(address, stack, is64_ ? AddressWidth::Bits64 : AddressWidth::Bits32);
            return stackBytes(bytes);
        }

        ElfImageBuilder& stackBytes(const std::vector<uint8_t>& bytes) {
            if (!stackSizes_) {
                stackSizes_.emplace();
            }
            stackSizes_->insert(stackSizes_->end(), bytes.begin(), bytes.end());
            return *this;
        }

        /// Emit an empty .stack_sizes section
        ElfImageBuilder& emptyStackSizes() {
            stackSizes_.emplace();
            return *this;
        }

        ElfImageBuilder& withoutSymtab() {
            withSymtab_ = false;
            return *this;
        }

        ElfImageBuilder& symtabEntrySize(uint64_t entsize) {
            symtabEntsize_ = entsize;
            return *this;
        }

        ElfImageBuilder& symtabType(uint32_t type) {
            symtabType_ = type;
            return *this;
        }

        std::vector<uint8_t> build() const {
            // String tables
            std::vector<uint8_t> strtab{0};
            std::vector<uint32_t> nameOffsets;
            for (const auto& sym : symbols_) {
                if (sym.badName) {
                    nameOffsets.push_back(0);
                    continue;
                }
                nameOffsets.push_back(static_cast<uint32_t>(strtab.size()));
                strtab.insert(strtab.end(), sym.name.begin(), sym.name.end());
                strtab.push_back(0);
            }
            for (size_t i = 0; i < symbols_.size(); ++i) {
                if (symbols_[i].badName) {
                    nameOffsets[i] = static_cast<uint32_t>(strtab.size() + 0x100);
                }
            }

            std::vector<Section> sections;
            sections.push_back({"", SHT_NULL, 0, 0, 0, 0, 0, {}});
            sections.push_back({".text", SHT_PROGBITS, SHF_ALLOC | SHF_EXECINSTR, 0, 0, 4, 0, {}});

            size_t strtabIndex = 0;
            if (withSymtab_) {
                const size_t symtabIndex = sections.size();
                strtabIndex = symtabIndex + 1;

                Writer symtab(little_);
                writeSymbol(symtab, 0, 0, 0, 0, 0, 0);
                for (size_t i = 0; i < symbols_.size(); ++i) {
                    const auto& sym = symbols_[i];
                    writeSymbol(symtab, nameOffsets[i], sym.value, sym.size, sym.type, sym.bind, sym.shndx);
                }

                const uint64_t entsize = symtabEntsize_ ? *symtabEntsize_ : (is64_ ? 24 : 16);
                sections.push_back({".symtab",
                                    symtabType_,
                                    0,
                                    static_cast<uint32_t>(strtabIndex),
                                    1,
                                    is64_ ? 8u : 4u,
                                    entsize,
                                    symtab.bytes});
                sections.push_back({".strtab", SHT_STRTAB, 0, 0, 0, 1, 0, strtab});
            }

            if (stackSizes_) {
                sections.push_back({".stack_sizes", SHT_PROGBITS, 0, 1, 0, 1, 0, *stackSizes_});
            }

            std::vector<uint8_t> shstrtab{0};
            std::vector<uint32_t> sectionNames;
            for (const auto& section : sections) {
                if (section.name.empty()) {
                    sectionNames.push_back(0);
                    continue;
                }
                sectionNames.push_back(static_cast<uint32_t>(shstrtab.size()));
                shstrtab.insert(shstrtab.end(), section.name.begin(), section.name.end());
                shstrtab.push_back(0);
            }
            const std::string shstrtabName = ".shstrtab";
            sectionNames.push_back(static_cast<uint32_t>(shstrtab.size()));
            shstrtab.insert(shstrtab.end(), shstrtabName.begin(), shstrtabName.end());
            shstrtab.push_back(0);
            sections.push_back({shstrtabName, SHT_STRTAB, 0, 0, 0, 1, 0, shstrtab});

            // Layout: header, section contents, section header table
            const size_t ehsize = is64_ ? 64 : 52;
            const size_t shentsize = is64_ ? 64 : 40;

            Writer image(little_);
            image.bytes.resize(ehsize, 0);

            std::vector<uint64_t> offsets;
            for (const auto& section : sections) {
                image.align(8);
                offsets.push_back(image.bytes.size());
                image.bytes.insert(image.bytes.end(), section.data.begin(), section.data.end());
            }

            image.align(8);
            const uint64_t shoff = image.bytes.size();
            for (size_t i = 0; i < sections.size(); ++i) {
                const auto& section = sections[i];
                const uint64_t offset = i == 0 ? 0 : offsets[i];
                image.put(sectionNames[i], 4);
                image.put(section.type, 4);
                image.put(section.flags, is64_ ? 8 : 4);
                image.put(section.name == ".text" ? 0x1000 : 0, is64_ ? 8 : 4);
                image.put(offset, is64_ ? 8 : 4);
                image.put(section.data.size(), is64_ ? 8 : 4);
                image.put(section.link, 4);
                image.put(section.info, 4);
                image.put(section.align, is64_ ? 8 : 4);
                image.put(section.entsize, is64_ ? 8 : 4);
            }

            // ELF header
            Writer header(little_);
            const uint8_t ident[EI_NIDENT] = {
                    ELFMAG0,
                    ELFMAG1,
                    ELFMAG2,
                    ELFMAG3,
                    static_cast<uint8_t>(is64_ ? ELFCLASS64 : ELFCLASS32),
                    static_cast<uint8_t>(little_ ? ELFDATA2LSB : ELFDATA2MSB),
                    EV_CURRENT,
                    ELFOSABI_NONE};
            header.bytes.assign(ident, ident + EI_NIDENT);
            header.put(ET_EXEC, 2);
            header.put(is64_ ? (little_ ? EM_X86_64 : EM_PPC64) : (little_ ? EM_ARM : EM_PPC), 2);
            header.put(EV_CURRENT, 4);
            header.put(0, is64_ ? 8 : 4);  // e_entry
            header.put(0, is64_ ? 8 : 4);  // e_phoff
            header.put(shoff, is64_ ? 8 : 4);
            header.put(0, 4);  // e_flags
            header.put(ehsize, 2);
            header.put(0, 2);  // e_phentsize
            header.put(0, 2);  // e_phnum
            header.put(shentsize, 2);
            header.put(sections.size(), 2);
            header.put(sections.size() - 1, 2);  // e_shstrndx

            std::copy(header.bytes.begin(), header.bytes.end(), image.bytes.begin());
            return image.bytes;
        }

      private:
        struct PendingSymbol {
            std::string name;
            uint64_t value;
            uint64_t size;
            uint8_t type;
            uint8_t bind;
            uint16_t shndx;
            bool badName;
        };

        struct Section {
            std::string name;
            uint32_t type;
            uint64_t flags;
            uint32_t link;
            uint32_t info;
            uint64_t align;
            uint64_t entsize;
            std::vector<uint8_t> data;
        };

        struct Writer {
            explicit Writer(bool little) : little(little) {}

            void put(uint64_t value, size_t width) {
                for (size_t i = 0; i < width; ++i) {
                    const size_t shift = little ? i : width - 1 - i;
                    bytes.push_back(static_cast<uint8_t>(value >> (8 * shift)));
                }
            }

            void align(size_t alignment) {
                while (bytes.size() % alignment != 0) {
                    bytes.push_back(0);
                }
            }

            bool little;
            std::vector<uint8_t> bytes;
        };

        void writeSymbol(Writer& out, uint32_t name, uint64_t value, uint64_t size, uint8_t type, uint8_t bind,
                         uint16_t shndx) const {
            const uint8_t info = static_cast<uint8_t>((bind << 4) | (type & 0xf));
            out.put(name, 4);
            if (is64_) {
                out.put(info, 1);
                out.put(0, 1);
                out.put(shndx, 2);
                out.put(value, 8);
                out.put(size, 8);
            } else {
                out.put(value, 4);
                out.put(size, 4);
                out.put(info, 1);
                out.put(0, 1);
                out.put(shndx, 2);
            }
        }

        bool is64_;
        bool little_;
        bool withSymtab_ = true;
        std::optional<uint64_t> symtabEntsize_;
        uint32_t symtabType_ = SHT_SYMTAB;
        std::vector<PendingSymbol> symbols_;
        std::optional<std::vector<uint8_t>> stackSizes_;
    };

    inline Functions analyze(const std::vector<uint8_t>& image, AnalysisStats* stats = nullptr) {
        return StackUsageAnalyzer::analyzeExecutable(image.data(), image.size(), stats);
    }

}  // namespace stacktk::test
