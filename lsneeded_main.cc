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

#include <getopt.h>

#include <iostream>

#include "mapped_file.h"
#include "needed_error.h"
#include "needed_resolver.h"

void print_help(std::ostream& os) {
    os << R"(usage: lsneeded [option] [input]
Options:
-h, --help                      Show this help message and exit
-i, --input-file INPUT_FILE     Specify the ELF file to inspect
-a, --all                       Also print SONAME, RPATH and RUNPATH
-V, --vaddr                     Treat DT_STRTAB as a virtual address

The last argument is interpreted as INPUT_FILE when -i option isn't given.
)" << std::endl;
}

int main(int argc, char* const argv[]) {
    google::InitGoogleLogging(argv[0]);

    static option long_options[] = {
        {"help", no_argument, nullptr, 'h'},
        {"input-file", required_argument, nullptr, 'i'},
        {"all", no_argument, nullptr, 'a'},
        {"vaddr", no_argument, nullptr, 'V'},
        {0, 0, 0, 0},
    };

    std::string input_file;
    bool show_all = false;
    ResolveOptions options;

    int opt;
    while ((opt = getopt_long(argc, argv, "hi:aV", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'i':
                input_file = optarg;
                break;
            case 'a':
                show_all = true;
                break;
            case 'V':
                options.strtab_addressing = StrtabAddressing::kVirtualAddress;
                break;
            case 'h':
                print_help(std::cout);
                return 0;
            case '?':
                print_help(std::cerr);
                return 1;
        }
    }

    if (optind < argc && input_file.empty()) {
        input_file = argv[optind++];
    }

    if (input_file.empty()) {
        std::cerr << "You must specify the input file." << std::endl;
        print_help(std::cerr);
        return 1;
    }

    try {
        std::unique_ptr<MappedFile> file = MappedFile::Open(input_file);
        if (show_all) {
            std::cout << ShowDynamicInfo(ReadDynamicInfo(file->view(), options));
        } else {
            for (const std::string& needed : ResolveDependencies(file->view(), options)) {
                std::cout << needed << "\n";
            }
        }
    } catch (const NeededError& e) {
        LOG(WARNING) << input_file << ": " << e.what();
        if (e.kind() == NeededErrorKind::kNoProgramHeaders || e.kind() == NeededErrorKind::kMissingDynamicSegment) {
            std::cerr << input_file << ": not a dynamic executable" << std::endl;
        } else {
            std::cerr << input_file << ": " << e.what() << std::endl;
        }
        return 1;
    }
    return 0;
}
