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

#include "commit.h"

const EcPoint& value_generator() {
    init_field_params();
    static const EcPoint G = jub_hash_to_point("umbra:value_commit_v");
    return G;
}

const EcPoint& blind_generator() {
    init_field_params();
    static const EcPoint R = jub_hash_to_point("umbra:value_commit_r");
    return R;
}

EcPoint pedersen_commitment_u64(uint64_t value, const Fs &blind) {
    return jub_add(jub_mul_u64(value_generator(), value), jub_mul(blind_generator(), blind));
}

EcPoint sum_commitments(const std::vector<EcPoint> &commits) {
    EcPoint acc = jub_identity();
    for (auto &c : commits) acc = jub_add(acc, c);
    return acc;
}
