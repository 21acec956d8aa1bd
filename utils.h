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

#include <elf.h>
#include <stddef.h>
#include <stdint.h>

#include <iomanip>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

#include <glog/logging.h>

#define LSNEEDED_LOG_KEY_VALUE(key, value) " " << key << "=" << value
#define LSNEEDED_LOG_KEY(key) LSNEEDED_LOG_KEY_VALUE(#key, key)
#define LSNEEDED_LOG_64BITS(key) LSNEEDED_LOG_KEY_VALUE(#key, HexString(key, 16))
#define LSNEEDED_LOG_32BITS(key) LSNEEDED_LOG_KEY_VALUE(#key, HexString(key, 8))
#define LSNEEDED_LOG_16BITS(key) LSNEEDED_LOG_KEY_VALUE(#key, HexString(key, 4))
#define LSNEEDED_LOG_8BITS(key) LSNEEDED_LOG_KEY_VALUE(#key, HexString(key, 2))
#define LSNEEDED_LOG_BITS(key) LSNEEDED_LOG_KEY_VALUE(#key, HexString(key))

// Old glibc headers lack these.
#ifndef DT_SYMTAB_SHNDX
#define DT_SYMTAB_SHNDX 34
#endif
#ifndef PT_GNU_PROPERTY
#define PT_GNU_PROPERTY 0x6474e553
#endif

template <class T>
inline std::string HexString(T num, int length = -1) {
    if (length == -1) {
        length = sizeof(T) * 2;
    }
    std::stringstream ss;
    ss << "0x" << std::uppercase << std::setfill('0') << std::setw(length) << std::hex << +num;
    return ss.str();
}

// Half-open byte range [start, end) inside an image.
struct Range {
    uint64_t start;
    uint64_t end;
    uint64_t size() const { return end - start; }
};

// Computes [start, start + size). Returns false when the end overflows.
bool MakeRange(uint64_t start, uint64_t size, Range* range);

// A borrowed, read-only view of an in-memory image. The owner of the bytes
// must outlive every view of them.
class ByteView {
public:
    ByteView() {}
    ByteView(const uint8_t* head, size_t size) : head_(head), size_(size) {}
    explicit ByteView(const std::vector<uint8_t>& bytes) : head_(bytes.data()), size_(bytes.size()) {}

    const uint8_t* head() const { return head_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    bool Contains(const Range& range) const { return range.start <= range.end && range.end <= size_; }

    // The caller must check Contains(range) first.
    ByteView Sub(const Range& range) const {
        CHECK(Contains(range)) << LSNEEDED_LOG_BITS(range.start) << LSNEEDED_LOG_BITS(range.end) << LSNEEDED_LOG_BITS(size_);
        return ByteView(head_ + range.start, range.size());
    }

    uint8_t operator[](size_t index) const {
        CHECK_LT(index, size_);
        return head_[index];
    }

private:
    const uint8_t* head_{nullptr};
    size_t size_{0};
};

// Reads a little-endian unsigned integer of sizeof(T) bytes at |offset|.
// Returns false without touching |val| when the field does not fit in |view|.
template <class T>
bool ReadLE(const ByteView& view, uint64_t offset, T* val) {
    static_assert(std::is_unsigned<T>::value, "ReadLE reads unsigned fields");
    Range range;
    if (!MakeRange(offset, sizeof(T), &range) || !view.Contains(range)) {
        return false;
    }
    T v = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        v |= static_cast<T>(static_cast<T>(view.head()[offset + i]) << (8 * i));
    }
    *val = v;
    return true;
}

bool IsValidUTF8(const uint8_t* p, size_t size);

std::string ShowDynamicEntryType(uint64_t type);
std::string ShowProgramHeaderType(uint32_t type);
