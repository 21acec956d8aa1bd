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

#include <sstream>
#include <stdexcept>
#include <string>

enum class NeededErrorKind {
    kIoFailure,
    kNotElf,
    kUnsupportedFormat,
    kTruncatedHeader,
    kNoProgramHeaders,
    kMissingDynamicSegment,
    kMissingStringTable,
    kMissingStringTableSize,
    kOutOfBounds,
    kInvalidEncoding,
};

std::string ShowNeededErrorKind(NeededErrorKind kind);

// Thrown by every stage of the dependency resolver. The message names the
// offending offsets so that a malformed file can be inspected with
// print_dynamic.
class NeededError : public std::runtime_error {
public:
    NeededError(NeededErrorKind kind, const std::string& message);

    NeededErrorKind kind() const { return kind_; }

private:
    NeededErrorKind kind_;
};

// Builds an error message with stream syntax:
//   throw NeededError(NeededErrorKind::kOutOfBounds, ErrorMessage() << "..." << LSNEEDED_LOG_BITS(off));
class ErrorMessage {
public:
    template <class T>
    ErrorMessage& operator<<(const T& v) {
        ss_ << v;
        return *this;
    }

    operator std::string() const { return ss_.str(); }

private:
    std::stringstream ss_;
};
