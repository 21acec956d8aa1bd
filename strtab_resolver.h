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

#include "dynamic_decoder.h"
#include "utils.h"

// The dynamic string table, i.e. the bytes DT_STRTAB and DT_STRSZ point to.
class StringTable {
public:
    // Throws kOutOfBounds unless [offset, offset + size) is inside |image|.
    StringTable(const ByteView& image, uint64_t offset, uint64_t size);

    uint64_t offset() const { return offset_; }
    size_t size() const { return table_.size(); }

    // Returns the NUL-terminated string at |index|. Throws kOutOfBounds when
    // |index| is past the table or the string has no terminator inside it,
    // and kInvalidEncoding when it is not UTF-8.
    std::string Str(uint64_t index) const;

private:
    uint64_t offset_;
    ByteView table_;
};

// Names of the DT_NEEDED entries of |summary|, in the same order. DT_STRTAB is
// taken as a file offset.
std::vector<std::string> ResolveLibraryNames(const ByteView& image, const DynamicSectionSummary& summary);

std::vector<std::string> ResolveLibraryNames(const StringTable& strtab, const std::vector<DynamicEntry>& neededs);
