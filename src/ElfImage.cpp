/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "ElfImage.h"
#include <gelf.h>
#include <libelf.h>
#include <utility>
#include "ElfExceptions.h"

using StackTkExceptions::ElfFileError;

namespace {
std::string lastElfError() {
    const char* message = elf_errmsg(-1);
    return message ? message : "unknown libelf error";
}

SymbolType toSymbolType(unsigned char type) {
    switch (type) {
        case STT_NOTYPE:
            return SymbolType::NoType;
        case STT_OBJECT:
            return SymbolType::Object;
        case STT_FUNC:
            return SymbolType::Func;
        case STT_SECTION:
            return SymbolType::Section;
        case STT_FILE:
            return SymbolType::File;
        case STT_COMMON:
            return SymbolType::Common;
        case STT_TLS:
            return SymbolType::Tls;
        default:
            return SymbolType::Other;
    }
}

SymbolBinding toSymbolBinding(unsigned char binding) {
    switch (binding) {
        case STB_LOCAL:
            return SymbolBinding::Local;
        case STB_GLOBAL:
            return SymbolBinding::Global;
        case STB_WEAK:
            return SymbolBinding::Weak;
        default:
            return SymbolBinding::Other;
    }
}
}  // namespace

ElfImage::ElfImage(const uint8_t* data, size_t size) {
    if (elf_version(EV_CURRENT) == EV_NONE) {
        throw ElfFileError::libraryError("initialization", lastElfError());
    }

    if (data == nullptr || size < EI_NIDENT) {
        throw ElfFileError::invalidFormat("buffer too small (" + std::to_string(size) +
                                          " bytes)");
    }

    // libelf may translate section data in place, so it gets its own copy
    image_.assign(reinterpret_cast<const char*>(data), reinterpret_cast<const char*>(data) + size);

    elf_ = elf_memory(image_.data(), image_.size());
    if (!elf_) {
        throw ElfFileError::invalidFormat(lastElfError());
    }

    if (elf_kind(elf_) != ELF_K_ELF) {
        close();
        throw ElfFileError::invalidFormat("not an ELF object");
    }

    GElf_Ehdr ehdr;
    if (!gelf_getehdr(elf_, &ehdr)) {
        std::string reason = lastElfError();
        close();
        throw ElfFileError::libraryError("gelf_getehdr", reason);
    }

    const int elfClass = gelf_getclass(elf_);
    if (elfClass != ELFCLASS32 && elfClass != ELFCLASS64) {
        close();
        throw ElfFileError::invalidFormat("unsupported ELF class " + std::to_string(elfClass));
    }

    is32bit_ = elfClass == ELFCLASS32;
    little_endian_ = ehdr.e_ident[EI_DATA] == ELFDATA2LSB;
    machine_ = ehdr.e_machine;
}

ElfImage::~ElfImage() {
    close();
}

ElfImage::ElfImage(ElfImage&& other) noexcept
    : image_(std::move(other.image_)),
      elf_(other.elf_),
      is32bit_(other.is32bit_),
      little_endian_(other.little_endian_),
      machine_(other.machine_) {
    other.elf_ = nullptr;
}

ElfImage& ElfImage::operator=(ElfImage&& other) noexcept {
    if (this != &other) {
        close();
        image_ = std::move(other.image_);
        elf_ = other.elf_;
        is32bit_ = other.is32bit_;
        little_endian_ = other.little_endian_;
        machine_ = other.machine_;
        other.elf_ = nullptr;
    }
    return *this;
}

void ElfImage::close() noexcept {
    if (elf_) {
        elf_end(elf_);
        elf_ = nullptr;
    }
}

size_t ElfImage::symbolEntrySize() const {
    return is32bit_ ? sizeof(Elf32_Sym) : sizeof(Elf64_Sym);
}

std::optional<SectionView> ElfImage::findSection(const std::string& name) const {
    size_t shstrndx = 0;
    if (elf_getshdrstrndx(elf_, &shstrndx) != 0) {
        throw ElfFileError::libraryError("elf_getshdrstrndx", lastElfError());
    }

    Elf_Scn* scn = nullptr;
    while ((scn = elf_nextscn(elf_, scn)) != nullptr) {
        GElf_Shdr shdr;
        if (!gelf_getshdr(scn, &shdr)) {
            throw ElfFileError::libraryError("gelf_getshdr", lastElfError());
        }

        const char* sectionName = elf_strptr(elf_, shstrndx, shdr.sh_name);
        if (!sectionName || name != sectionName) {
            continue;
        }

        SectionView view;
        view.name = sectionName;
        view.type = shdr.sh_type;
        view.entrySize = shdr.sh_entsize;
        view.link = shdr.sh_link;
        view.scn = scn;

        if (shdr.sh_type != SHT_NOBITS && shdr.sh_size > 0) {
            Elf_Data* raw = elf_rawdata(scn, nullptr);
            if (!raw) {
                throw ElfFileError::libraryError("elf_rawdata(" + name + ")", lastElfError());
            }
            view.bytes = static_cast<const uint8_t*>(raw->d_buf);
            view.size = raw->d_size;
        }

        return view;
    }

    return std::nullopt;
}

std::vector<SymbolEntry> ElfImage::readSymbols(const SectionView& symtab) const {
    std::vector<SymbolEntry> entries;
    if (symtab.entrySize == 0 || symtab.size == 0) {
        return entries;
    }

    Elf_Data* data = elf_getdata(symtab.scn, nullptr);
    if (!data) {
        throw ElfFileError::libraryError("elf_getdata(" + symtab.name + ")", lastElfError());
    }

    const size_t symbolCount = symtab.size / symtab.entrySize;
    entries.reserve(symbolCount);

    for (size_t i = 0; i < symbolCount; ++i) {
        GElf_Sym sym;
        if (!gelf_getsym(data, static_cast<int>(i), &sym)) {
            throw ElfFileError::libraryError("gelf_getsym", lastElfError());
        }

        SymbolEntry entry;
        entry.index = i;
        entry.value = sym.st_value;
        entry.size = sym.st_size;
        entry.type = toSymbolType(GELF_ST_TYPE(sym.st_info));
        entry.binding = toSymbolBinding(GELF_ST_BIND(sym.st_info));
        entry.sectionIndex = sym.st_shndx;

        const char* name = elf_strptr(elf_, symtab.link, sym.st_name);
        if (name) {
            entry.name = std::string(name);
        }

        entries.push_back(std::move(entry));
    }

    return entries;
}
