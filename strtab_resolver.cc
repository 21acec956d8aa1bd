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

#include "strtab_resolver.h"

#include <cstring>

#include "needed_error.h"

namespace {

ByteView LocateStrtab(const ByteView& image, uint64_t offset, uint64_t size) {
    Range range;
    if (!MakeRange(offset, size, &range) || !image.Contains(range)) {
        throw NeededError(NeededErrorKind::kOutOfBounds, ErrorMessage() << "string table exceeds the image" << LSNEEDED_LOG_BITS(offset)
                                                                        << LSNEEDED_LOG_BITS(size) << LSNEEDED_LOG_BITS(image.size()));
    }
    return image.Sub(range);
}

}  // namespace

StringTable::StringTable(const ByteView& image, uint64_t offset, uint64_t size)
    : offset_(offset), table_(LocateStrtab(image, offset, size)) {
    LOG(INFO) << "StringTable" << LSNEEDED_LOG_BITS(offset_) << LSNEEDED_LOG_BITS(table_.size());
}

std::string StringTable::Str(uint64_t index) const {
    if (index >= table_.size()) {
        throw NeededError(NeededErrorKind::kOutOfBounds,
                          ErrorMessage() << "string index is past the string table" << LSNEEDED_LOG_BITS(index) << LSNEEDED_LOG_BITS(table_.size()));
    }

    const uint8_t* begin = table_.head() + index;
    const size_t rest = table_.size() - index;
    const void* nul = memchr(begin, '\0', rest);
    if (nul == nullptr) {
        throw NeededError(NeededErrorKind::kOutOfBounds,
                          ErrorMessage() << "unterminated string in the string table" << LSNEEDED_LOG_BITS(index) << LSNEEDED_LOG_BITS(table_.size()));
    }

    const size_t len = static_cast<const uint8_t*>(nul) - begin;
    if (!IsValidUTF8(begin, len)) {
        throw NeededError(NeededErrorKind::kInvalidEncoding,
                          ErrorMessage() << "string is not UTF-8" << LSNEEDED_LOG_BITS(index) << LSNEEDED_LOG_BITS(offset_ + index));
    }
    return std::string(reinterpret_cast<const char*>(begin), len);
}

std::vector<std::string> ResolveLibraryNames(const StringTable& strtab, const std::vector<DynamicEntry>& neededs) {
    std::vector<std::string> names;
    for (const DynamicEntry& needed : neededs) {
        CHECK(needed.tag == DynamicTag::kNeeded) << LSNEEDED_LOG_BITS(needed.raw_tag);
        names.push_back(strtab.Str(needed.value));
        LOG(INFO) << "DT_NEEDED" << LSNEEDED_LOG_BITS(needed.value) << LSNEEDED_LOG_KEY_VALUE("name", names.back());
    }
    return names;
}

std::vector<std::string> ResolveLibraryNames(const ByteView& image, const DynamicSectionSummary& summary) {
    const StringTable strtab(image, summary.strtab.value, summary.strsz.value);
    return ResolveLibraryNames(strtab, summary.neededs);
}
