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

#include "phdr_scanner.h"

#include "needed_error.h"

namespace {

// Field offsets in Elf64_Phdr.
constexpr uint64_t kPhdrType = 0x00;
constexpr uint64_t kPhdrOffset = 0x08;
constexpr uint64_t kPhdrVaddr = 0x10;
constexpr uint64_t kPhdrFilesz = 0x20;

ProgramHeaderEntry DecodePhdr(const ByteView& chunk, int index) {
    ProgramHeaderEntry phdr;
    if (!ReadLE(chunk, kPhdrType, &phdr.raw_type) || !ReadLE(chunk, kPhdrOffset, &phdr.file_offset) ||
        !ReadLE(chunk, kPhdrVaddr, &phdr.virtual_address) || !ReadLE(chunk, kPhdrFilesz, &phdr.file_size)) {
        throw NeededError(NeededErrorKind::kOutOfBounds,
                          ErrorMessage() << "program header entry is too small" << LSNEEDED_LOG_KEY(index) << LSNEEDED_LOG_KEY(chunk.size()));
    }
    phdr.segment_type = SegmentTypeFromRaw(phdr.raw_type);
    return phdr;
}

}  // namespace

SegmentType SegmentTypeFromRaw(uint32_t p_type) {
    switch (p_type) {
        case PT_DYNAMIC:
            return SegmentType::kDynamic;
        case PT_LOAD:
            return SegmentType::kLoad;
        default:
            return SegmentType::kOther;
    }
}

std::vector<ProgramHeaderEntry> ReadProgramHeaders(const ByteView& image, const FileHeaderMeta& meta) {
    const uint64_t entsize = meta.program_header_entry_size;
    const uint64_t table_size = entsize * meta.program_header_entry_count;
    Range table;
    if (!MakeRange(meta.program_header_offset, table_size, &table) || !image.Contains(table)) {
        throw NeededError(NeededErrorKind::kOutOfBounds, ErrorMessage() << "program header table exceeds the image"
                                                                        << LSNEEDED_LOG_BITS(meta.program_header_offset)
                                                                        << LSNEEDED_LOG_BITS(table_size) << LSNEEDED_LOG_BITS(image.size()));
    }

    std::vector<ProgramHeaderEntry> phdrs;
    for (int i = 0; i < meta.program_header_entry_count; ++i) {
        const Range chunk{table.start + entsize * i, table.start + entsize * (i + 1)};
        ProgramHeaderEntry phdr = DecodePhdr(image.Sub(chunk), i);
        LOG(INFO) << "phdr[" << i << "]" << LSNEEDED_LOG_KEY_VALUE("p_type", ShowProgramHeaderType(phdr.raw_type))
                  << LSNEEDED_LOG_BITS(phdr.file_offset) << LSNEEDED_LOG_BITS(phdr.virtual_address) << LSNEEDED_LOG_BITS(phdr.file_size);
        phdrs.push_back(phdr);
    }
    return phdrs;
}

const ProgramHeaderEntry* FindPhdr(const std::vector<ProgramHeaderEntry>& phdrs, SegmentType type) {
    for (const ProgramHeaderEntry& phdr : phdrs) {
        if (phdr.segment_type == type) {
            return &phdr;
        }
    }
    return nullptr;
}

const ProgramHeaderEntry& GetDynamicPhdr(const std::vector<ProgramHeaderEntry>& phdrs) {
    const ProgramHeaderEntry* dynamic = FindPhdr(phdrs, SegmentType::kDynamic);
    if (dynamic == nullptr) {
        throw NeededError(NeededErrorKind::kMissingDynamicSegment,
                          ErrorMessage() << "no PT_DYNAMIC in " << phdrs.size() << " program headers");
    }

    int num_dynamics = 0;
    for (const ProgramHeaderEntry& phdr : phdrs) {
        if (phdr.segment_type == SegmentType::kDynamic) num_dynamics++;
    }
    if (num_dynamics > 1) {
        LOG(WARNING) << "Multiple PT_DYNAMIC found, using the first one" << LSNEEDED_LOG_KEY(num_dynamics);
    }
    return *dynamic;
}

ProgramHeaderEntry FindDynamicSegment(const ByteView& image, const FileHeaderMeta& meta) {
    const std::vector<ProgramHeaderEntry> phdrs = ReadProgramHeaders(image, meta);
    return GetDynamicPhdr(phdrs);
}

uint64_t OffsetFromAddr(const std::vector<ProgramHeaderEntry>& phdrs, uint64_t addr) {
    for (const ProgramHeaderEntry& phdr : phdrs) {
        if (phdr.segment_type != SegmentType::kLoad) continue;
        if (phdr.virtual_address <= addr && addr - phdr.virtual_address < phdr.file_size) {
            Range offset;
            if (MakeRange(phdr.file_offset, addr - phdr.virtual_address, &offset)) {
                return offset.end;
            }
        }
    }
    throw NeededError(NeededErrorKind::kOutOfBounds, ErrorMessage() << "address " << HexString(addr, 16) << " cannot be resolved");
}
