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

#include "needed_resolver.h"

#include <optional>
#include <sstream>

#include "dynamic_decoder.h"
#include "elf_header.h"
#include "needed_error.h"
#include "phdr_scanner.h"
#include "strtab_resolver.h"

namespace {

std::vector<ProgramHeaderEntry> ReadPhdrs(const ByteView& image) {
    ValidateHeader(image);
    std::optional<FileHeaderMeta> meta = LocateProgramHeaders(image);
    if (!meta) {
        throw NeededError(NeededErrorKind::kNoProgramHeaders, "e_phoff is zero");
    }
    return ReadProgramHeaders(image, *meta);
}

StringTable MakeStringTable(const ByteView& image, const std::vector<ProgramHeaderEntry>& phdrs, const DynamicSectionSummary& summary,
                            const ResolveOptions& options) {
    uint64_t offset = summary.strtab.value;
    if (options.strtab_addressing == StrtabAddressing::kVirtualAddress) {
        offset = OffsetFromAddr(phdrs, summary.strtab.value);
        LOG(INFO) << "DT_STRTAB" << LSNEEDED_LOG_64BITS(summary.strtab.value) << " is at" << LSNEEDED_LOG_64BITS(offset);
    }
    return StringTable(image, offset, summary.strsz.value);
}

std::string OptionalStr(const StringTable& strtab, const std::optional<DynamicEntry>& dyn) {
    if (!dyn) return "";
    return strtab.Str(dyn->value);
}

}  // namespace

std::vector<std::string> ResolveDependencies(const ByteView& image, const ResolveOptions& options) {
    const std::vector<ProgramHeaderEntry> phdrs = ReadPhdrs(image);
    const ProgramHeaderEntry& dynamic = GetDynamicPhdr(phdrs);
    const DynamicSectionSummary summary = DecodeDynamicSection(image, dynamic);
    if (options.strtab_addressing == StrtabAddressing::kFileOffset) {
        return ResolveLibraryNames(image, summary);
    }
    return ResolveLibraryNames(MakeStringTable(image, phdrs, summary, options), summary.neededs);
}

DynamicInfo ReadDynamicInfo(const ByteView& image, const ResolveOptions& options) {
    const std::vector<ProgramHeaderEntry> phdrs = ReadPhdrs(image);
    const DynamicSectionSummary summary = DecodeDynamicSection(image, GetDynamicPhdr(phdrs));
    const StringTable strtab = MakeStringTable(image, phdrs, summary, options);

    DynamicInfo info;
    info.neededs = ResolveLibraryNames(strtab, summary.neededs);
    info.soname = OptionalStr(strtab, summary.soname);
    info.rpath = OptionalStr(strtab, summary.rpath);
    info.runpath = OptionalStr(strtab, summary.runpath);
    LOG(INFO) << "ReadDynamicInfo" << LSNEEDED_LOG_KEY(info.neededs.size()) << LSNEEDED_LOG_KEY(info.soname) << LSNEEDED_LOG_KEY(info.rpath)
              << LSNEEDED_LOG_KEY(info.runpath);
    return info;
}

std::string ShowDynamicInfo(const DynamicInfo& info) {
    std::stringstream ss;
    for (const std::string& needed : info.neededs) {
        ss << "NEEDED " << needed << "\n";
    }
    if (!info.soname.empty()) ss << "SONAME " << info.soname << "\n";
    if (!info.rpath.empty()) ss << "RPATH " << info.rpath << "\n";
    if (!info.runpath.empty()) ss << "RUNPATH " << info.runpath << "\n";
    return ss.str();
}

std::string ShowDynamic(const ByteView& image) {
    std::stringstream ss;
    const std::vector<ProgramHeaderEntry> phdrs = ReadPhdrs(image);
    for (size_t i = 0; i < phdrs.size(); i++) {
        const ProgramHeaderEntry& phdr = phdrs[i];
        ss << "phdr[" << i << "]: type=" << ShowProgramHeaderType(phdr.raw_type) << " offset=" << HexString(phdr.file_offset)
           << " vaddr=" << HexString(phdr.virtual_address) << " filesz=" << HexString(phdr.file_size) << "\n";
    }

    const std::vector<DynamicEntry> dyns = ReadDynamicEntries(image, GetDynamicPhdr(phdrs));
    for (size_t i = 0; i < dyns.size(); i++) {
        ss << "dyn[" << i << "]: " << ShowDynamicEntryType(dyns[i].raw_tag) << " tag=" << HexString(dyns[i].raw_tag)
           << " value=" << HexString(dyns[i].value) << "\n";
    }
    return ss.str();
}
