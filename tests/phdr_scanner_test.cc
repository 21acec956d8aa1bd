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

#include <limits>

#include <gtest/gtest.h>

#include "support/elf_image_builder.h"
#include "support/test_util.h"

namespace {

FileHeaderMeta MetaOf(const std::vector<uint8_t>& image) {
    std::optional<FileHeaderMeta> meta = LocateProgramHeaders(ByteView(image));
    CHECK(meta);
    return *meta;
}

TEST(PhdrScannerTest, SegmentTypeFromRaw) {
    EXPECT_EQ(SegmentType::kDynamic, SegmentTypeFromRaw(2));
    EXPECT_EQ(SegmentType::kLoad, SegmentTypeFromRaw(1));
    EXPECT_EQ(SegmentType::kOther, SegmentTypeFromRaw(0));
    EXPECT_EQ(SegmentType::kOther, SegmentTypeFromRaw(PT_INTERP));
    EXPECT_EQ(SegmentType::kOther, SegmentTypeFromRaw(PT_GNU_STACK));
}

TEST(PhdrScannerTest, FindsTheOnlyDynamicSegment) {
    ElfImageBuilder builder;
    builder.AddNeeded("libc.so.6");
    std::vector<uint8_t> image = builder.Build();

    ProgramHeaderEntry dynamic = FindDynamicSegment(ByteView(image), MetaOf(image));
    EXPECT_EQ(SegmentType::kDynamic, dynamic.segment_type);
    EXPECT_EQ(PT_DYNAMIC, dynamic.raw_type);
    EXPECT_EQ(builder.dynamic_offset(), dynamic.file_offset);
    EXPECT_EQ(builder.dynamic_size(), dynamic.file_size);
}

TEST(PhdrScannerTest, ReadsAllEntriesInOrder) {
    ElfImageBuilder builder;
    builder.AddLeadingPhdr(PT_PHDR, 0x40, 0x40, 0xa8);
    builder.AddLeadingPhdr(PT_INTERP, 0x1000, 0x1000, 0x1c);
    builder.AddTrailingPhdr(PT_GNU_STACK);
    builder.set_vaddr_base(0x400000);
    std::vector<uint8_t> image = builder.Build();

    std::vector<ProgramHeaderEntry> phdrs = ReadProgramHeaders(ByteView(image), MetaOf(image));
    ASSERT_EQ(5, phdrs.size());
    EXPECT_EQ(PT_LOAD, phdrs[0].raw_type);
    EXPECT_EQ(SegmentType::kLoad, phdrs[0].segment_type);
    EXPECT_EQ(0x400000, phdrs[0].virtual_address);
    EXPECT_EQ(image.size(), phdrs[0].file_size);
    EXPECT_EQ(PT_PHDR, phdrs[1].raw_type);
    EXPECT_EQ(SegmentType::kOther, phdrs[1].segment_type);
    EXPECT_EQ(PT_INTERP, phdrs[2].raw_type);
    EXPECT_EQ(0x1000, phdrs[2].file_offset);
    EXPECT_EQ(0x1c, phdrs[2].file_size);
    EXPECT_EQ(SegmentType::kDynamic, phdrs[3].segment_type);
    EXPECT_EQ(PT_GNU_STACK, phdrs[4].raw_type);

    const ProgramHeaderEntry& dynamic = GetDynamicPhdr(phdrs);
    EXPECT_EQ(&phdrs[3], &dynamic);
    EXPECT_EQ(&phdrs[0], FindPhdr(phdrs, SegmentType::kLoad));
}

TEST(PhdrScannerTest, PicksTheFirstDynamicSegment) {
    ElfImageBuilder builder;
    builder.AddTrailingPhdr(PT_DYNAMIC, 0x1234, 0x1234, 0x10);
    std::vector<uint8_t> image = builder.Build();

    ProgramHeaderEntry dynamic = FindDynamicSegment(ByteView(image), MetaOf(image));
    EXPECT_EQ(builder.dynamic_offset(), dynamic.file_offset);
}

TEST(PhdrScannerTest, StaticallyLinked) {
    ElfImageBuilder builder;
    builder.set_emit_dynamic(false);
    builder.AddLeadingPhdr(PT_LOAD, 0, 0x400000, 0x100);
    builder.AddLeadingPhdr(PT_GNU_STACK);
    std::vector<uint8_t> image = builder.Build();

    EXPECT_NEEDED_ERROR(NeededErrorKind::kMissingDynamicSegment, FindDynamicSegment(ByteView(image), MetaOf(image)));
}

TEST(PhdrScannerTest, EmptyProgramHeaderTable) {
    ElfImageBuilder builder;
    builder.set_emit_dynamic(false);
    std::vector<uint8_t> image = builder.Build();

    EXPECT_TRUE(ReadProgramHeaders(ByteView(image), MetaOf(image)).empty());
    EXPECT_NEEDED_ERROR(NeededErrorKind::kMissingDynamicSegment, FindDynamicSegment(ByteView(image), MetaOf(image)));
}

TEST(PhdrScannerTest, TableOutOfBounds) {
    ElfImageBuilder builder;
    builder.AddNeeded("libc.so.6");
    const std::vector<uint8_t> image = builder.Build();

    FileHeaderMeta meta = MetaOf(image);
    meta.program_header_offset = image.size();
    EXPECT_NEEDED_ERROR(NeededErrorKind::kOutOfBounds, ReadProgramHeaders(ByteView(image), meta));

    meta = MetaOf(image);
    meta.program_header_entry_count = 1000;
    EXPECT_NEEDED_ERROR(NeededErrorKind::kOutOfBounds, ReadProgramHeaders(ByteView(image), meta));

    meta = MetaOf(image);
    meta.program_header_offset = std::numeric_limits<uint64_t>::max() - 8;
    EXPECT_NEEDED_ERROR(NeededErrorKind::kOutOfBounds, ReadProgramHeaders(ByteView(image), meta));
}

TEST(PhdrScannerTest, EntryTooSmallForItsFields) {
    ElfImageBuilder builder;
    builder.AddNeeded("libc.so.6");
    std::vector<uint8_t> image = builder.Build();
    PutLE(&image, 0x36, 0x20, 2);

    EXPECT_NEEDED_ERROR(NeededErrorKind::kOutOfBounds, ReadProgramHeaders(ByteView(image), MetaOf(image)));
}

TEST(PhdrScannerTest, OffsetFromAddr) {
    const std::vector<ProgramHeaderEntry> phdrs = {
        {SegmentType::kOther, PT_PHDR, 0x40, 0x400040, 0x1000},
        {SegmentType::kLoad, PT_LOAD, 0, 0x400000, 0x1000},
        {SegmentType::kLoad, PT_LOAD, 0x2000, 0x600000, 0x100},
    };
    EXPECT_EQ(0x123, OffsetFromAddr(phdrs, 0x400123));
    EXPECT_EQ(0, OffsetFromAddr(phdrs, 0x400000));
    EXPECT_EQ(0x2010, OffsetFromAddr(phdrs, 0x600010));

    EXPECT_NEEDED_ERROR(NeededErrorKind::kOutOfBounds, OffsetFromAddr(phdrs, 0x401000));
    EXPECT_NEEDED_ERROR(NeededErrorKind::kOutOfBounds, OffsetFromAddr(phdrs, 0x500000));
    EXPECT_NEEDED_ERROR(NeededErrorKind::kOutOfBounds, OffsetFromAddr(phdrs, 0x3fffff));
}

}  // namespace
