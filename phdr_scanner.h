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

#include <string>
#include <vector>

#include "elf_header.h"
#include "utils.h"

enum class SegmentType {
    kDynamic,
    kLoad,
    kOther,
};

SegmentType SegmentTypeFromRaw(uint32_t p_type);

// The fields of Elf64_Phdr we care about. |raw_type| keeps the original
// p_type for diagnostics.
struct ProgramHeaderEntry {
    SegmentType segment_type;
    uint32_t raw_type;
    uint64_t file_offset;
    uint64_t virtual_address;
    uint64_t file_size;
};

// Decodes every entry of the program header table described by |meta|.
// Throws kOutOfBounds when the table or one of its entries does not fit.
std::vector<ProgramHeaderEntry> ReadProgramHeaders(const ByteView& image, const FileHeaderMeta& meta);

const ProgramHeaderEntry* FindPhdr(const std::vector<ProgramHeaderEntry>& phdrs, SegmentType type);

// Returns the first PT_DYNAMIC entry. Throws kMissingDynamicSegment for
// statically linked objects.
const ProgramHeaderEntry& GetDynamicPhdr(const std::vector<ProgramHeaderEntry>& phdrs);

ProgramHeaderEntry FindDynamicSegment(const ByteView& image, const FileHeaderMeta& meta);

// Maps a virtual address to a file offset through the PT_LOAD entries.
// Throws kOutOfBounds when no PT_LOAD has file contents at |addr|.
uint64_t OffsetFromAddr(const std::vector<ProgramHeaderEntry>& phdrs, uint64_t addr);
