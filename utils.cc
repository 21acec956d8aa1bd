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

#include "utils.h"

#include <limits>

bool MakeRange(uint64_t start, uint64_t size, Range* range) {
    if (size > std::numeric_limits<uint64_t>::max() - start) {
        return false;
    }
    range->start = start;
    range->end = start + size;
    return true;
}

// Accepts shortest-form UTF-8 only: no overlong sequences, no surrogates and
// nothing above U+10FFFF.
bool IsValidUTF8(const uint8_t* p, size_t size) {
    size_t i = 0;
    while (i < size) {
        const uint8_t c = p[i];
        if (c < 0x80) {
            i++;
            continue;
        }

        size_t len;
        uint32_t cp;
        uint32_t min;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
            min = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
            min = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
            min = 0x10000;
        } else {
            return false;
        }

        if (size - i < len) return false;
        for (size_t j = 1; j < len; ++j) {
            const uint8_t cc = p[i + j];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (cp < min || cp > 0x10FFFF || (0xD800 <= cp && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

std::string ShowDynamicEntryType(uint64_t type) {
    switch (type) {
        case DT_NULL:
            return "DT_NULL";
        case DT_NEEDED:
            return "DT_NEEDED";
        case DT_PLTRELSZ:
            return "DT_PLTRELSZ";
        case DT_PLTGOT:
            return "DT_PLTGOT";
        case DT_HASH:
            return "DT_HASH";
        case DT_STRTAB:
            return "DT_STRTAB";
        case DT_SYMTAB:
            return "DT_SYMTAB";
        case DT_RELA:
            return "DT_RELA";
        case DT_RELASZ:
            return "DT_RELASZ";
        case DT_RELAENT:
            return "DT_RELAENT";
        case DT_STRSZ:
            return "DT_STRSZ";
        case DT_SYMENT:
            return "DT_SYMENT";
        case DT_INIT:
            return "DT_INIT";
        case DT_FINI:
            return "DT_FINI";
        case DT_SONAME:
            return "DT_SONAME";
        case DT_RPATH:
            return "DT_RPATH";
        case DT_SYMBOLIC:
            return "DT_SYMBOLIC";
        case DT_REL:
            return "DT_REL";
        case DT_RELSZ:
            return "DT_RELSZ";
        case DT_RELENT:
            return "DT_RELENT";
        case DT_PLTREL:
            return "DT_PLTREL";
        case DT_DEBUG:
            return "DT_DEBUG";
        case DT_TEXTREL:
            return "DT_TEXTREL";
        case DT_JMPREL:
            return "DT_JMPREL";
        case DT_BIND_NOW:
            return "DT_BIND_NOW";
        case DT_INIT_ARRAY:
            return "DT_INIT_ARRAY";
        case DT_FINI_ARRAY:
            return "DT_FINI_ARRAY";
        case DT_INIT_ARRAYSZ:
            return "DT_INIT_ARRAYSZ";
        case DT_FINI_ARRAYSZ:
            return "DT_FINI_ARRAYSZ";
        case DT_RUNPATH:
            return "DT_RUNPATH";
        case DT_FLAGS:
            return "DT_FLAGS";
        case DT_PREINIT_ARRAY:
            return "DT_PREINIT_ARRAY";
        case DT_PREINIT_ARRAYSZ:
            return "DT_PREINIT_ARRAYSZ";
        case DT_SYMTAB_SHNDX:
            return "DT_SYMTAB_SHNDX";
        case DT_GNU_HASH:
            return "DT_GNU_HASH";
        case DT_VERSYM:
            return "DT_VERSYM";
        case DT_RELACOUNT:
            return "DT_RELACOUNT";
        case DT_RELCOUNT:
            return "DT_RELCOUNT";
        case DT_FLAGS_1:
            return "DT_FLAGS_1";
        case DT_VERDEF:
            return "DT_VERDEF";
        case DT_VERDEFNUM:
            return "DT_VERDEFNUM";
        case DT_VERNEED:
            return "DT_VERNEED";
        case DT_VERNEEDNUM:
            return "DT_VERNEEDNUM";
        case DT_AUXILIARY:
            return "DT_AUXILIARY";
        default:
            return HexString(type);
    }
}

std::string ShowProgramHeaderType(uint32_t type) {
    switch (type) {
        case PT_NULL:
            return "PT_NULL";
        case PT_LOAD:
            return "PT_LOAD";
        case PT_DYNAMIC:
            return "PT_DYNAMIC";
        case PT_INTERP:
            return "PT_INTERP";
        case PT_NOTE:
            return "PT_NOTE";
        case PT_SHLIB:
            return "PT_SHLIB";
        case PT_PHDR:
            return "PT_PHDR";
        case PT_TLS:
            return "PT_TLS";
        case PT_GNU_EH_FRAME:
            return "PT_GNU_EH_FRAME";
        case PT_GNU_STACK:
            return "PT_GNU_STACK";
        case PT_GNU_RELRO:
            return "PT_GNU_RELRO";
        case PT_GNU_PROPERTY:
            return "PT_GNU_PROPERTY";
        default:
            return HexString(type);
    }
}
