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
#include <vector>

#include "phdr_scanner.h"
#include "utils.h"

enum class DynamicTag {
    kNeeded,
    kStringTableOffset,
    kStringTableSize,
    kSoName,
    kRPath,
    kRunPath,
    kOther,
};

DynamicTag DynamicTagFromRaw(uint64_t d_tag);

// One Elf64_Dyn. |value| is d_val or d_ptr depending on |tag|.
struct DynamicEntry {
    DynamicTag tag;
    uint64_t raw_tag;
    uint64_t value;
};

// The entries of PT_DYNAMIC needed to name the dependencies. |neededs| is in
// the order of the dynamic section.
struct DynamicSectionSummary {
    DynamicEntry strtab;
    DynamicEntry strsz;
    std::vector<DynamicEntry> neededs;
    std::optional<DynamicEntry> soname;
    std::optional<DynamicEntry> rpath;
    std::optional<DynamicEntry> runpath;
};

// Decodes all Elf64_Dyn in the file range of |dynamic|. DT_NULL does not
// stop the walk. Throws kOutOfBounds when the range does not fit in |image|
// or does not consist of whole entries.
std::vector<DynamicEntry> ReadDynamicEntries(const ByteView& image, const ProgramHeaderEntry& dynamic);

// Throws kMissingStringTable or kMissingStringTableSize.
DynamicSectionSummary SummarizeDynamic(const std::vector<DynamicEntry>& dyns);

DynamicSectionSummary DecodeDynamicSection(const ByteView& image, const ProgramHeaderEntry& dynamic);
