// print_dynamic
//
// This program prints the program headers and every entry of PT_DYNAMIC of a
// given ELF file. It is handy to see why lsneeded rejects a file.
//
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

#include <iostream>

#include "mapped_file.h"
#include "needed_error.h"
#include "needed_resolver.h"

int main(int argc, const char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <in-elf>\nThis program shows the program headers and PT_DYNAMIC of the given ELF file."
                  << std::endl;
        return 1;
    }

    try {
        auto file = MappedFile::Open(argv[1]);
        std::cout << ShowDynamic(file->view());
    } catch (const NeededError& e) {
        std::cerr << argv[1] << ": " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
