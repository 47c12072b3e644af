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

#include "utils.h"


// =======================================
// =============== POINTS ================
// =======================================


// -------------------- P1 ---------------------------

std::array<byte, 48> compress_p1(const blst_p1 &pk) {
    std::array<byte, 48> pk_comp;
    blst_p1_compress(pk_comp.data(), &pk);
    return pk_comp;
}

std::optional<blst_p1> p1_from_bytes(const byte* src) {
    blst_p1_affine aff;
    if (blst_p1_uncompress(&aff, src) != BLST_SUCCESS)
        return std::nullopt;
    if (!blst_p1_affine_is_inf(&aff) && !blst_p1_affine_in_g1(&aff))
        return std::nullopt;

    blst_p1 p;
    blst_p1_from_affine(&p, &aff);
    return p;
}

bool p1_equal(const blst_p1 &a, const blst_p1 &b) {
    return blst_p1_is_equal(&a, &b);
}

// -------------------- P2 ---------------------------

std::array<byte, 96> compress_p2(const blst_p2 &sig) {
    std::array<byte, 96> comp;
    blst_p2_compress(comp.data(), &sig);
    return comp;
}

std::optional<blst_p2> p2_from_bytes(const byte* src) {
    blst_p2_affine aff;
    if (blst_p2_uncompress(&aff, src) != BLST_SUCCESS)
        return std::nullopt;
    if (!blst_p2_affine_in_g2(&aff))
        return std::nullopt;

    blst_p2 p;
    blst_p2_from_affine(&p, &aff);
    return p;
}
