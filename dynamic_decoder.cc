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

#include "dynamic_decoder.h"

#include "needed_error.h"

namespace {

constexpr uint64_t kDynSize = 16;
constexpr uint64_t kDynTag = 0x00;
constexpr uint64_t kDynVal = 0x08;

static_assert(sizeof(Elf64_Dyn) == kDynSize, "unexpected Elf64_Dyn layout");

// Keeps the first entry with |tag|, warns about the rest.
void SetFirst(const DynamicEntry& dyn, std::optional<DynamicEntry>* slot) {
    if (*slot) {
        LOG(WARNING) << "Duplicated " << ShowDynamicEntryType(dyn.raw_tag) << ", ignored" << LSNEEDED_LOG_BITS(dyn.value);
        return;
    }
    *slot = dyn;
}

}  // namespace

DynamicTag DynamicTagFromRaw(uint64_t d_tag) {
    switch (d_tag) {
        case DT_NEEDED:
            return DynamicTag::kNeeded;
        case DT_STRTAB:
            return DynamicTag::kStringTableOffset;
        case DT_STRSZ:
            return DynamicTag::kStringTableSize;
        case DT_SONAME:
            return DynamicTag::kSoName;
        case DT_RPATH:
            return DynamicTag::kRPath;
        case DT_RUNPATH:
            return DynamicTag::kRunPath;
        default:
            return DynamicTag::kOther;
    }
}

std::vector<DynamicEntry> ReadDynamicEntries(const ByteView& image, const ProgramHeaderEntry& dynamic) {
    Range range;
    if (!MakeRange(dynamic.file_offset, dynamic.file_size, &range) || !image.Contains(range)) {
        throw NeededError(NeededErrorKind::kOutOfBounds, ErrorMessage() << "PT_DYNAMIC exceeds the image" << LSNEEDED_LOG_BITS(dynamic.file_offset)
                                                                        << LSNEEDED_LOG_BITS(dynamic.file_size) << LSNEEDED_LOG_BITS(image.size()));
    }
    if (range.size() % kDynSize != 0) {
        throw NeededError(NeededErrorKind::kOutOfBounds,
                          ErrorMessage() << "PT_DYNAMIC ends in a partial Elf64_Dyn" << LSNEEDED_LOG_BITS(dynamic.file_size));
    }

    const ByteView section = image.Sub(range);
    std::vector<DynamicEntry> dyns;
    for (uint64_t off = 0; off < section.size(); off += kDynSize) {
        DynamicEntry dyn;
        CHECK(ReadLE(section, off + kDynTag, &dyn.raw_tag));
        CHECK(ReadLE(section, off + kDynVal, &dyn.value));
        dyn.tag = DynamicTagFromRaw(dyn.raw_tag);
        dyns.push_back(dyn);
    }
    LOG(INFO) << "ReadDynamicEntries" << LSNEEDED_LOG_BITS(dynamic.file_offset) << LSNEEDED_LOG_KEY(dyns.size());
    return dyns;
}

DynamicSectionSummary SummarizeDynamic(const std::vector<DynamicEntry>& dyns) {
    std::optional<DynamicEntry> strtab;
    std::optional<DynamicEntry> strsz;
    DynamicSectionSummary summary;

    for (const DynamicEntry& dyn : dyns) {
        switch (dyn.tag) {
            case DynamicTag::kNeeded:
                summary.neededs.push_back(dyn);
                break;
            case DynamicTag::kStringTableOffset:
                SetFirst(dyn, &strtab);
                break;
            case DynamicTag::kStringTableSize:
                SetFirst(dyn, &strsz);
                break;
            case DynamicTag::kSoName:
                SetFirst(dyn, &summary.soname);
                break;
            case DynamicTag::kRPath:
                SetFirst(dyn, &summary.rpath);
                break;
            case DynamicTag::kRunPath:
                SetFirst(dyn, &summary.runpath);
                break;
            case DynamicTag::kOther:
                LOG(INFO) << "Skip " << ShowDynamicEntryType(dyn.raw_tag) << LSNEEDED_LOG_BITS(dyn.value);
                break;
        }
    }

    if (!strtab) {
        throw NeededError(NeededErrorKind::kMissingStringTable, ErrorMessage() << "no DT_STRTAB in " << dyns.size() << " dynamic entries");
    }
    if (!strsz) {
        throw NeededError(NeededErrorKind::kMissingStringTableSize, ErrorMessage() << "no DT_STRSZ in " << dyns.size() << " dynamic entries");
    }
    summary.strtab = *strtab;
    summary.strsz = *strsz;

    LOG(INFO) << "SummarizeDynamic" << LSNEEDED_LOG_BITS(summary.strtab.value) << LSNEEDED_LOG_BITS(summary.strsz.value)
              << LSNEEDED_LOG_KEY(summary.neededs.size());
    return summary;
}

DynamicSectionSummary DecodeDynamicSection(const ByteView& image, const ProgramHeaderEntry& dynamic) {
    return SummarizeDynamic(ReadDynamicEntries(image, dynamic));
}
