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

#include <mutex>
#include <libff/common/profiling.hpp>
#include "utils.h"


// =======================================
// =============== FIELDS ================
// =======================================

libff::bigint<FS_LIMBS> babyjub_order;

static void init_fs_params() {
    using bigint_s = libff::bigint<FS_LIMBS>;

    babyjub_order = bigint_s("2736030358979909402780800718157159386076813972158567259200215660948447373041");
    if (sizeof(mp_limb_t) == 8) {
        Fs::Rsquared = bigint_s("1932414053906531050938999051622903410247027166288844946833223180670942884382");
        Fs::Rcubed = bigint_s("1224176544886159564763585983611734194901200707224654049310667671443304709153");
        Fs::inv = 0x532ce5aebc48f5ef;
    }
    if (sizeof(mp_limb_t) == 4) {
        Fs::Rsquared = bigint_s("1932414053906531050938999051622903410247027166288844946833223180670942884382");
        Fs::Rcubed = bigint_s("1224176544886159564763585983611734194901200707224654049310667671443304709153");
        Fs::inv = 0xbc48f5ef;
    }
    Fs::num_bits = FS_BITS;
    Fs::euler = bigint_s("1368015179489954701390400359078579693038406986079283629600107830474223686520");
}

void init_field_params() {
    static std::once_flag once;
    std::call_once(once, [] {
        libff::inhibit_profiling_info = true;
        libff::inhibit_profiling_counters = true;
        snark_pp::init_public_params();
        init_fs_params();
    });
}

// -------------------- BYTES ---------------------------

template <typename F>
static F field_from_wide(const byte* src) {
    init_field_params();

    mpz_t wide, modulus;
    mpz_init(wide);
    mpz_init(modulus);
    mpz_import(wide, 64, -1, 1, 0, 0, src);
    F::field_char().to_mpz(modulus);
    mpz_mod(wide, wide, modulus);

    libff::bigint<F::num_limbs> big(wide);
    mpz_clear(wide);
    mpz_clear(modulus);
    return F(big);
}

bytes32 fr_to_bytes(const Fr &x) { return field_to_le(x); }
bytes32 fs_to_bytes(const Fs &x) { return field_to_le(x); }

std::optional<Fr> fr_from_bytes(const byte* src) { return field_from_le<Fr>(src); }
std::optional<Fs> fs_from_bytes(const byte* src) { return field_from_le<Fs>(src); }

Fr fr_from_wide(const byte* src) { return field_from_wide<Fr>(src); }
Fs fs_from_wide(const byte* src) { return field_from_wide<Fs>(src); }

// -------------------- VALUES ---------------------------

Fr fr_from_u64(uint64_t v) {
    init_field_params();
    return Fr(static_cast<long>(v), true);
}

std::optional<uint64_t> fr_to_u64(const Fr &x) {
    bytes32 le = fr_to_bytes(x);
    for (size_t i = 8; i < le.size(); i++)
        if (le[i] != 0) return std::nullopt;

    uint64_t v = 0;
    for (size_t i = 0; i < 8; i++)
        v |= static_cast<uint64_t>(le[i]) << (8 * i);
    return v;
}

Fr fs_to_fr(const Fs &x) {
    return Fr(x.as_bigint());
}

// rejection sampling on the top bits keeps these uniform
Fr rand_fr() {
    while (true) {
        bytes32 raw = gen_rand_32();
        raw[31] &= 0x3f;
        auto x = fr_from_bytes(raw.data());
        if (x.has_value()) return x.value();
    }
}

Fs rand_fs() {
    while (true) {
        bytes32 raw = gen_rand_32();
        raw[31] &= 0x07;
        auto x = fs_from_bytes(raw.data());
        if (x.has_value()) return x.value();
    }
}

Fs sum_fs(const std::vector<Fs> &values) {
    Fs acc = Fs::zero();
    for (auto &v : values) acc += v;
    return acc;
}
