// Copyright (C) 2026 The lsneeded authors
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#include "elf_image_builder.h"

#include <elf.h>

#include <algorithm>

#include <glog/logging.h>

constexpr uint64_t ElfImageBuilder::kEhdrSize;
constexpr uint64_t ElfImageBuilder::kPhdrSize;
constexpr uint64_t ElfImageBuilder::kDynSize;

void PutLE(std::vector<uint8_t>* image, uint64_t offset, uint64_t value, int size) {
    CHECK_LE(offset + size, image->size());
    for (int i = 0; i < size; ++i) {
        (*image)[offset + i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

uint64_t ElfImageBuilder::AddNeeded(const std::string& name) {
    return AddDynamicString(DT_NEEDED, name);
}

void ElfImageBuilder::AddDynamic(uint64_t tag, uint64_t value) {
    dyns_.emplace_back(tag, value);
}

uint64_t ElfImageBuilder::AddDynamicString(uint64_t tag, const std::string& s) {
    uint64_t pos = strtab_.Add(s);
    AddDynamic(tag, pos);
    return pos;
}

void ElfImageBuilder::AddLeadingPhdr(uint32_t type, uint64_t offset, uint64_t vaddr, uint64_t filesz) {
    leading_phdrs_.push_back(Phdr{type, offset, vaddr, filesz});
}

void ElfImageBuilder::AddTrailingPhdr(uint32_t type, uint64_t offset, uint64_t vaddr, uint64_t filesz) {
    trailing_phdrs_.push_back(Phdr{type, offset, vaddr, filesz});
}

void ElfImageBuilder::EmitPhdr(std::vector<uint8_t>* image, uint64_t at, const Phdr& phdr) {
    PutLE(image, at + 0x00, phdr.type, 4);
    PutLE(image, at + 0x04, PF_R, 4);
    PutLE(image, at + 0x08, phdr.offset, 8);
    PutLE(image, at + 0x10, phdr.vaddr, 8);
    PutLE(image, at + 0x18, phdr.vaddr, 8);
    PutLE(image, at + 0x20, phdr.filesz, 8);
    PutLE(image, at + 0x28, phdr.filesz, 8);
    PutLE(image, at + 0x30, 8, 8);
}

std::vector<uint8_t> ElfImageBuilder::Build() {
    std::vector<std::pair<uint64_t, uint64_t>> dyns = dyns_;
    // DT_STRTAB's value is patched below once the layout is known.
    size_t strtab_index = dyns.size();
    if (emit_strtab_) dyns.emplace_back(DT_STRTAB, 0);
    if (emit_strsz_) dyns.emplace_back(DT_STRSZ, strtab_.size());
    dyns.emplace_back(DT_NULL, 0);

    phnum_ = leading_phdrs_.size() + trailing_phdrs_.size() + (emit_dynamic_ ? 1 : 0) + (vaddr_base_ ? 1 : 0);
    dynamic_offset_ = kEhdrSize + kPhdrSize * phnum_;
    dynamic_size_ = kDynSize * dyns.size();
    strtab_offset_ = dynamic_offset_ + dynamic_size_;
    const uint64_t image_size = strtab_offset_ + strtab_.size();

    std::vector<uint8_t> image(image_size, 0);
    image[EI_MAG0] = ELFMAG0;
    image[EI_MAG1] = ELFMAG1;
    image[EI_MAG2] = ELFMAG2;
    image[EI_MAG3] = ELFMAG3;
    image[EI_CLASS] = ELFCLASS64;
    image[EI_DATA] = ELFDATA2LSB;
    image[EI_VERSION] = EV_CURRENT;
    PutLE(&image, 0x10, ET_DYN, 2);
    PutLE(&image, 0x12, EM_X86_64, 2);
    PutLE(&image, 0x14, EV_CURRENT, 4);
    PutLE(&image, 0x20, kEhdrSize, 8);
    PutLE(&image, 0x34, kEhdrSize, 2);
    PutLE(&image, 0x36, kPhdrSize, 2);
    PutLE(&image, 0x38, phnum_, 2);
    PutLE(&image, 0x3a, sizeof(Elf64_Shdr), 2);

    std::vector<Phdr> phdrs;
    if (vaddr_base_) phdrs.push_back(Phdr{PT_LOAD, 0, vaddr_base_, image_size});
    phdrs.insert(phdrs.end(), leading_phdrs_.begin(), leading_phdrs_.end());
    if (emit_dynamic_) {
        dynamic_phdr_offset_ = kEhdrSize + kPhdrSize * phdrs.size();
        phdrs.push_back(Phdr{PT_DYNAMIC, dynamic_offset_, vaddr_base_ + dynamic_offset_, dynamic_size_});
    }
    phdrs.insert(phdrs.end(), trailing_phdrs_.begin(), trailing_phdrs_.end());
    for (size_t i = 0; i < phdrs.size(); ++i) {
        EmitPhdr(&image, kEhdrSize + kPhdrSize * i, phdrs[i]);
    }

    if (emit_strtab_) dyns[strtab_index].second = vaddr_base_ + strtab_offset_;
    for (size_t i = 0; i < dyns.size(); ++i) {
        PutLE(&image, dynamic_offset_ + kDynSize * i, dyns[i].first, 8);
        PutLE(&image, dynamic_offset_ + kDynSize * i + 8, dyns[i].second, 8);
    }

    std::copy(strtab_.str().begin(), strtab_.str().end(), image.begin() + strtab_offset_);
    return image;
}
