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

#include <memory>
#include <string>

#include "utils.h"

// A whole file mapped read-only.
class MappedFile {
public:
    // Throws NeededError with kIoFailure when |filename| cannot be opened,
    // is not a regular file or cannot be mapped. An empty file gives an
    // empty view.
    static std::unique_ptr<MappedFile> Open(const std::string& filename);

    ~MappedFile();

    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    const std::string& filename() const { return filename_; }

    ByteView view() const { return ByteView(head_, size_); }

private:
    MappedFile(const std::string& filename, int fd, const uint8_t* head, size_t size);

    const std::string filename_;
    int fd_;
    const uint8_t* head_;
    size_t size_;
};
