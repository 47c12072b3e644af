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

#include "hashing.h"
#include "utils.h"


// =======================================
// ============== JUBJUB =================
// =======================================

const Fr& jub_a() {
    init_field_params();
    static const Fr a("168700");
    return a;
}

const Fr& jub_d() {
    init_field_params();
    static const Fr d("168696");
    return d;
}

const EcPoint& jub_base() {
    init_field_params();
    static const EcPoint base{
        Fr("5299619240641551281634865583518297030282874472190772894086521144482721001553"),
        Fr("16950150798460657717958625567821834550301663161624707787222815936182638968203"),
    };
    return base;
}

EcPoint jub_identity() {
    init_field_params();
    return EcPoint{Fr::zero(), Fr::one()};
}

bool jub_is_identity(const EcPoint &p) {
    return p.x.is_zero() && p.y == Fr::one();
}

bool jub_on_curve(const EcPoint &p) {
    Fr xx = p.x.squared();
    Fr yy = p.y.squared();
    return jub_a() * xx + yy == Fr::one() + jub_d() * xx * yy;
}

// -------------------- PROJECTIVE ---------------------------

namespace {

struct Projective {
    Fr X, Y, Z;
};

Projective to_projective(const EcPoint &p) {
    return Projective{p.x, p.y, Fr::one()};
}

EcPoint to_affine(const Projective &p) {
    Fr z_inv = p.Z.inverse();
    return EcPoint{p.X * z_inv, p.Y * z_inv};
}

// complete for a square and d non square, so no special cases
Projective proj_add(const Projective &p, const Projective &q) {
    Fr A = p.Z * q.Z;
    Fr B = A.squared();
    Fr C = p.X * q.X;
    Fr D = p.Y * q.Y;
    Fr E = jub_d() * C * D;
    Fr F = B - E;
    Fr G = B + E;
    Fr X3 = A * F * ((p.X + p.Y) * (q.X + q.Y) - C - D);
    Fr Y3 = A * G * (D - jub_a() * C);
    Fr Z3 = F * G;
    return Projective{X3, Y3, Z3};
}

template <typename Bits>
EcPoint double_and_add(const EcPoint &p, const Bits &bits, size_t nbits) {
    Projective acc{Fr::zero(), Fr::one(), Fr::one()};
    Projective base = to_projective(p);
    for (size_t i = nbits; i-- > 0;) {
        acc = proj_add(acc, acc);
        if (bits(i)) acc = proj_add(acc, base);
    }
    return to_affine(acc);
}

}

EcPoint jub_add(const EcPoint &a, const EcPoint &b) {
    return to_affine(proj_add(to_projective(a), to_projective(b)));
}

EcPoint jub_neg(const EcPoint &p) {
    return EcPoint{-p.x, p.y};
}

EcPoint jub_sub(const EcPoint &a, const EcPoint &b) {
    return jub_add(a, jub_neg(b));
}

EcPoint jub_mul(const EcPoint &p, const Fs &k) {
    auto big = k.as_bigint();
    return double_and_add(p, [&](size_t i) { return big.test_bit(i); }, FS_BITS);
}

EcPoint jub_mul_u64(const EcPoint &p, uint64_t k) {
    return double_and_add(p, [&](size_t i) { return ((k >> i) & 1) == 1; }, 64);
}

// -------------------- ENCODING ---------------------------

static bool is_odd(const Fr &x) {
    return (x.as_bigint().data[0] & 1) == 1;
}

// x for a given y, with the requested parity
static std::optional<Fr> recover_x(const Fr &y, bool odd) {
    Fr yy = y.squared();
    Fr num = Fr::one() - yy;
    Fr den = jub_a() - jub_d() * yy;
    if (den.is_zero()) return std::nullopt;

    Fr xx = num * den.inverse();
    if (xx.is_zero()) {
        if (odd) return std::nullopt;
        return Fr::zero();
    }
    if ((xx ^ Fr::euler) != Fr::one()) return std::nullopt;

    Fr x = xx.sqrt();
    if (is_odd(x) != odd) x = -x;
    return x;
}

EcPoint jub_hash_to_point(const std::string &tag) {
    for (uint64_t ctr = 0;; ctr++) {
        Fr y = hash_to_field(tag, ctr);
        auto x = recover_x(y, false);
        if (!x.has_value()) continue;

        EcPoint p = jub_mul_u64(EcPoint{x.value(), y}, 8);
        if (!jub_is_identity(p)) return p;
    }
}

bytes32 compress_jub(const EcPoint &p) {
    bytes32 out = fr_to_bytes(p.y);
    if (is_odd(p.x)) out[31] |= 0x80;
    return out;
}

std::optional<EcPoint> jub_from_bytes(const byte* src) {
    bytes32 raw;
    std::copy(src, src + raw.size(), raw.begin());
    bool odd = (raw[31] & 0x80) != 0;
    raw[31] &= 0x7f;

    auto y = fr_from_bytes(raw.data());
    if (!y.has_value()) return std::nullopt;

    auto x = recover_x(y.value(), odd);
    if (!x.has_value()) return std::nullopt;
    return EcPoint{x.value(), y.value()};
}
