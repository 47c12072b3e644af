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

#include "mimc.h"
#include "hashing.h"

static std::vector<Fr> build_constants() {
    init_field_params();
    std::vector<Fr> out(MIMC_ROUNDS);
    out[0] = Fr::zero();
    for (size_t i = 1; i < MIMC_ROUNDS; i++)
        out[i] = hash_to_field("umbra:mimc7", i);
    return out;
}

const std::vector<Fr>& mimc_constants() {
    static const auto constants = build_constants();
    return constants;
}

Fr mimc_cipher(const Fr &x, const Fr &key) {
    const auto &c = mimc_constants();
    Fr state = x;
    for (size_t i = 0; i < MIMC_ROUNDS; i++) {
        Fr t = state + key + c[i];
        Fr t2 = t.squared();
        Fr t4 = t2.squared();
        state = t4 * t2 * t;
    }
    return state + key;
}

Fr mimc_hash(const std::vector<Fr> &elements, const Fr &iv) {
    Fr h = iv;
    for (auto &m : elements)
        h = mimc_cipher(m, h) + h + m;
    return h;
}

Fr field_hash(std::initializer_list<Fr> elements) {
    return field_hash(std::vector<Fr>(elements));
}

Fr field_hash(const std::vector<Fr> &elements) {
    return mimc_hash(elements, fr_from_u64(elements.size()));
}
