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

#pragma once
#include "blst.h"
#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include <algorithm>
#include <array>
#include <optional>
#include <ostream>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

using bytes32 = std::array<byte, 32>;

// =======================================
// ============= KEYS & SIGS =============
// =======================================

struct key_pair {
    blst_p1 pk;
    blst_scalar sk;
};

extern const std::string SIG_DST;

std::tuple<const byte*, size_t> str_to_bytes(const char* str);

bytes32 gen_rand_32();

key_pair gen_key_pair(const bytes32 &seed);
blst_p1 sk_to_pk(const blst_scalar &sk);

blst_p2 sign_msg(
    const blst_scalar &sk,
    const byte* msg,
    size_t msg_len
);

bool verify_sig(
    const blst_p1 &PK,
    const blst_p2 &signature,
    const byte* msg,
    size_t msg_len
);


// =======================================
// =============== POINTS ================
// =======================================

bool p1_equal(const blst_p1 &a, const blst_p1 &b);

std::array<byte, 48> compress_p1(const blst_p1 &pk);
// rejects encodings that are off-curve or outside the prime order subgroup
std::optional<blst_p1> p1_from_bytes(const byte* src);

std::array<byte, 96> compress_p2(const blst_p2 &sig);
std::optional<blst_p2> p2_from_bytes(const byte* src);


// =======================================
// =============== FIELDS ================
// =======================================

/*
 *  Fr is the scalar field of alt_bn128, the curve the proofs live on. It is
 *  also the base field of Baby Jubjub, so every coin, nullifier, root, bulla,
 *  id and commitment coordinate is an Fr.
 *
 *  Fs is the order of Baby Jubjub's prime subgroup. Blinds and spend
 *  secrets live there so commitments stay additive.
 */
using snark_pp = libff::alt_bn128_pp;
using Fr = libff::Fr<snark_pp>;

constexpr mp_size_t FS_LIMBS = (251 + GMP_NUMB_BITS - 1) / GMP_NUMB_BITS;
extern libff::bigint<FS_LIMBS> babyjub_order;
using Fs = libff::Fp_model<FS_LIMBS, babyjub_order>;

constexpr size_t FR_BITS = 254;
constexpr size_t FS_BITS = 251;

// Sets up libff's curve tables and the Fs constants. Safe to call from
// anywhere, any number of times. Field values are garbage before it runs.
void init_field_params();

Fr fr_from_u64(uint64_t v);
// nullopt when x does not fit in 64 bits
std::optional<uint64_t> fr_to_u64(const Fr &x);
Fr fs_to_fr(const Fs &x);

Fr rand_fr();
Fs rand_fs();

bytes32 fr_to_bytes(const Fr &x);
bytes32 fs_to_bytes(const Fs &x);
// little endian, rejects values at or above the modulus
std::optional<Fr> fr_from_bytes(const byte* src);
std::optional<Fs> fs_from_bytes(const byte* src);

// 64 bytes reduced mod the modulus, for unbiased hashing into a field
Fr fr_from_wide(const byte* src);
Fs fs_from_wide(const byte* src);

Fs sum_fs(const std::vector<Fs> &values);

// Little endian bytes of any libff prime field, canonical only.
// Fr, Fs and the alt_bn128 base field all go through these.
template <typename F>
std::array<byte, F::num_limbs * sizeof(mp_limb_t)> field_to_le(const F &x) {
    auto big = x.as_bigint();
    std::array<byte, F::num_limbs * sizeof(mp_limb_t)> out{};
    size_t pos = 0;
    for (mp_size_t i = 0; i < F::num_limbs; i++)
        for (size_t b = 0; b < sizeof(mp_limb_t); b++)
            out[pos++] = static_cast<byte>(big.data[i] >> (8 * b));
    return out;
}

template <typename F>
std::optional<F> field_from_le(const byte* src) {
    init_field_params();

    libff::bigint<F::num_limbs> big;
    size_t pos = 0;
    for (mp_size_t i = 0; i < F::num_limbs; i++) {
        mp_limb_t limb = 0;
        for (size_t b = 0; b < sizeof(mp_limb_t); b++)
            limb |= static_cast<mp_limb_t>(src[pos++]) << (8 * b);
        big.data[i] = limb;
    }

    auto modulus = F::field_char();
    if (mpn_cmp(big.data, modulus.data, F::num_limbs) >= 0) return std::nullopt;
    return F(big);
}


// =======================================
// ============== JUBJUB =================
// =======================================

/*
 *  Baby Jubjub, the twisted Edwards curve a*x^2 + y^2 = 1 + d*x^2*y^2 over Fr.
 *  Its points can be added inside a circuit for a handful of constraints,
 *  which is why commitments and spend keys use it instead of G1.
 */
struct EcPoint {
    Fr x = Fr::zero();
    Fr y = Fr::zero();

    bool operator==(const EcPoint &o) const { return x == o.x && y == o.y; }
    bool operator!=(const EcPoint &o) const { return !(*this == o); }
};

const Fr& jub_a();
const Fr& jub_d();
// generator of the prime order subgroup
const EcPoint& jub_base();

EcPoint jub_identity();
bool jub_is_identity(const EcPoint &p);
bool jub_on_curve(const EcPoint &p);

EcPoint jub_add(const EcPoint &a, const EcPoint &b);
EcPoint jub_neg(const EcPoint &p);
EcPoint jub_sub(const EcPoint &a, const EcPoint &b);
EcPoint jub_mul(const EcPoint &p, const Fs &k);
EcPoint jub_mul_u64(const EcPoint &p, uint64_t k);

// Try and increment onto the curve, then cleared of the cofactor.
// Nobody knows the discrete log of the result against jub_base().
EcPoint jub_hash_to_point(const std::string &tag);

// y little endian with the parity of x in the top bit
bytes32 compress_jub(const EcPoint &p);
// rejects non canonical y and points off the curve
std::optional<EcPoint> jub_from_bytes(const byte* src);
