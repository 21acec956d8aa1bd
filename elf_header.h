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

#pragma once

#include <optional>

#include "utils.h"

// Where the program header table lives and how to step through it. Only
// created when e_phoff is non-zero.
struct FileHeaderMeta {
    uint64_t program_header_offset;
    uint16_t program_header_entry_size;
    uint16_t program_header_entry_count;
};

bool IsELF(const ByteView& image);

// Throws NeededError with kNotElf, kTruncatedHeader or kUnsupportedFormat
// unless |image| starts with an ELFCLASS64, ELFDATA2LSB identification.
void ValidateHeader(const ByteView& image);

// Reads e_phoff, e_phentsize and e_phnum. Returns std::nullopt when e_phoff
// is zero, i.e. the object has no program headers. Throws kTruncatedHeader
// when |image| is shorter than Elf64_Ehdr.
std::optional<FileHeaderMeta> LocateProgramHeaders(const ByteView& image);
