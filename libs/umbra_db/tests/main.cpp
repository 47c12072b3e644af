/*
 * Umbra Ledger
 * Copyright (C) 2025 Joshua Olson
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */


#include <cstdio>
#include <string>
#include "tests.h"

int main(int argc, char* argv[]) {
    printf("\noptions == {crypto, store, blocks, transfer, mint, otc, stake, dao}\n\n");
    printf("=====================================\n");

    if (argc > 1) {
        std::string a = argv[1];
        if (a == "crypto") {
            main_crypto();

        } else if (a == "store") {
            main_store();

        } else if (a == "blocks") {
            main_blocks();

        } else if (a == "transfer") {
            main_transfer();

        } else if (a == "mint") {
            main_mint();

        } else if (a == "otc") {
            main_otc();

        } else if (a == "stake") {
            main_stake();

        } else if (a == "dao") {
            main_dao();

        } else {
            printf("unknown suite %s\n", a.c_str());
            return 1;
        }
        return 0;
    }

    main_crypto();
    main_store();
    main_blocks();
    main_transfer();
    main_mint();
    main_otc();
    main_stake();
    main_dao();

    return 0;
}
