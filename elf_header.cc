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

#include "elf_header.h"

#include <cstring>

#include "needed_error.h"

namespace {

// Field offsets in Elf64_Ehdr. We decode them one by one instead of casting
// the image to Elf64_Ehdr, which may be unaligned or truncated.
constexpr uint64_t kEhdrPhoff = 0x20;
constexpr uint64_t kEhdrPhentsize = 0x36;
constexpr uint64_t kEhdrPhnum = 0x38;

static_assert(sizeof(Elf64_Ehdr) == 0x40, "unexpected Elf64_Ehdr layout");

}  // namespace

bool IsELF(const ByteView& image) {
    if (image.size() < SELFMAG) {
        return false;
    }
    return memcmp(image.head(), ELFMAG, SELFMAG) == 0;
}

void ValidateHeader(const ByteView& image) {
    if (!IsELF(image)) {
        throw NeededError(NeededErrorKind::kNotElf, ErrorMessage() << "bad ELF magic" << LSNEEDED_LOG_KEY(image.size()));
    }
    if (image.size() <= EI_DATA) {
        throw NeededError(NeededErrorKind::kTruncatedHeader, ErrorMessage() << "no room for e_ident" << LSNEEDED_LOG_KEY(image.size()));
    }

    const uint8_t ei_class = image[EI_CLASS];
    const uint8_t ei_data = image[EI_DATA];
    LOG(INFO) << "ValidateHeader" << LSNEEDED_LOG_8BITS(ei_class) << LSNEEDED_LOG_8BITS(ei_data);

    if (ei_class != ELFCLASS64) {
        throw NeededError(NeededErrorKind::kUnsupportedFormat, ErrorMessage() << "only ELFCLASS64 is supported" << LSNEEDED_LOG_8BITS(ei_class));
    }
    if (ei_data != ELFDATA2LSB) {
        throw NeededError(NeededErrorKind::kUnsupportedFormat, ErrorMessage() << "only ELFDATA2LSB is supported" << LSNEEDED_LOG_8BITS(ei_data));
    }
}

std::optional<FileHeaderMeta> LocateProgramHeaders(const ByteView& image) {
    if (image.size() < sizeof(Elf64_Ehdr)) {
        throw NeededError(NeededErrorKind::kTruncatedHeader,
                          ErrorMessage() << "shorter than Elf64_Ehdr" << LSNEEDED_LOG_KEY(image.size()));
    }

    FileHeaderMeta meta;
    CHECK(ReadLE(image, kEhdrPhoff, &meta.program_header_offset));
    CHECK(ReadLE(image, kEhdrPhentsize, &meta.program_header_entry_size));
    CHECK(ReadLE(image, kEhdrPhnum, &meta.program_header_entry_count));

    LOG(INFO) << "LocateProgramHeaders" << LSNEEDED_LOG_BITS(meta.program_header_offset)
              << LSNEEDED_LOG_KEY(meta.program_header_entry_size) << LSNEEDED_LOG_KEY(meta.program_header_entry_count);

    if (meta.program_header_offset == 0) {
        return std::nullopt;
    }
    return meta;
}
