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

#include "needed_error.h"

#include "utils.h"

std::string ShowNeededErrorKind(NeededErrorKind kind) {
    switch (kind) {
        case NeededErrorKind::kIoFailure:
            return "IoFailure";
        case NeededErrorKind::kNotElf:
            return "NotElf";
        case NeededErrorKind::kUnsupportedFormat:
            return "UnsupportedFormat";
        case NeededErrorKind::kTruncatedHeader:
            return "TruncatedHeader";
        case NeededErrorKind::kNoProgramHeaders:
            return "NoProgramHeaders";
        case NeededErrorKind::kMissingDynamicSegment:
            return "MissingDynamicSegment";
        case NeededErrorKind::kMissingStringTable:
            return "MissingStringTable";
        case NeededErrorKind::kMissingStringTableSize:
            return "MissingStringTableSize";
        case NeededErrorKind::kOutOfBounds:
            return "OutOfBounds";
        case NeededErrorKind::kInvalidEncoding:
            return "InvalidEncoding";
    }
    LOG(FATAL) << "Unknown NeededErrorKind" << LSNEEDED_LOG_KEY(static_cast<int>(kind));
    return "";
}

NeededError::NeededError(NeededErrorKind kind, const std::string& message)
    : std::runtime_error(ShowNeededErrorKind(kind) + ": " + message), kind_(kind) {}
