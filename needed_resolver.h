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

#include "utils.h"

// How the value of DT_STRTAB is interpreted.
enum class StrtabAddressing {
    // A file offset. This is what the resolver assumes by default.
    kFileOffset,
    // A virtual address, mapped to a file offset through PT_LOAD. This is
    // what linkers actually emit, and equals the file offset for most PIE
    // objects whose first PT_LOAD starts at 0.
    kVirtualAddress,
};

struct ResolveOptions {
    StrtabAddressing strtab_addressing{StrtabAddressing::kFileOffset};
};

struct DynamicInfo {
    std::vector<std::string> neededs;
    // Empty when the corresponding entry is absent.
    std::string soname;
    std::string rpath;
    std::string runpath;
};

// Returns DT_NEEDED names of a 64-bit little-endian ELF image in the order
// they appear in the dynamic section. Throws NeededError. Objects without
// program headers fail with kNoProgramHeaders and statically linked objects
// with kMissingDynamicSegment.
std::vector<std::string> ResolveDependencies(const ByteView& image, const ResolveOptions& options = ResolveOptions());

// Same as ResolveDependencies, plus DT_SONAME, DT_RPATH and DT_RUNPATH.
DynamicInfo ReadDynamicInfo(const ByteView& image, const ResolveOptions& options = ResolveOptions());

// One "NEEDED <name>" line per DT_NEEDED, even an empty one, followed by
// "SONAME", "RPATH" and "RUNPATH" lines for the entries that are present.
std::string ShowDynamicInfo(const DynamicInfo& info);

// Dumps the program headers and the dynamic section for debugging.
std::string ShowDynamic(const ByteView& image);
