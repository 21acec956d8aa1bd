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

#include "mapped_file.h"

#include <errno.h>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstring>

#include "needed_error.h"

namespace {

[[noreturn]] void ThrowIoFailure(const std::string& what, const std::string& filename, int errnum) {
    throw NeededError(NeededErrorKind::kIoFailure, ErrorMessage() << what << " failed: " << filename << ": " << strerror(errnum));
}

}  // namespace

MappedFile::MappedFile(const std::string& filename, int fd, const uint8_t* head, size_t size)
    : filename_(filename), fd_(fd), head_(head), size_(size) {
    LOG(INFO) << "MappedFile" << LSNEEDED_LOG_KEY(filename_) << LSNEEDED_LOG_KEY(size_);
}

MappedFile::~MappedFile() {
    if (head_ != nullptr) {
        munmap(const_cast<uint8_t*>(head_), size_);
    }
    close(fd_);
}

std::unique_ptr<MappedFile> MappedFile::Open(const std::string& filename) {
    int fd = open(filename.c_str(), O_RDONLY);
    if (fd < 0) ThrowIoFailure("open", filename, errno);

    struct stat st;
    if (fstat(fd, &st) < 0) {
        int errnum = errno;
        close(fd);
        ThrowIoFailure("fstat", filename, errnum);
    }
    if (!S_ISREG(st.st_mode)) {
        close(fd);
        throw NeededError(NeededErrorKind::kIoFailure, ErrorMessage() << "not a regular file: " << filename);
    }

    const size_t size = st.st_size;
    if (size == 0) {
        return std::unique_ptr<MappedFile>(new MappedFile(filename, fd, nullptr, 0));
    }

    void* p = mmap(NULL, size, PROT_READ, MAP_PRIVATE, fd, 0);
    if (p == MAP_FAILED) {
        int errnum = errno;
        close(fd);
        ThrowIoFailure("mmap", filename, errnum);
    }
    return std::unique_ptr<MappedFile>(new MappedFile(filename, fd, static_cast<const uint8_t*>(p), size));
}
