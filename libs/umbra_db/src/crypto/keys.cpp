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

#include "keys.h"

static const std::string SPEND_KEY_TAG = "umbra:spend_key";

static Fs derive_spend(const blst_scalar &inner) {
    byte le[32];
    blst_lendian_from_scalar(le, &inner);

    BlakeHasher hasher;
    hasher.update(SPEND_KEY_TAG);
    hasher.update(le, sizeof(le));

    byte wide[64];
    hasher.finalize_xof(wide, sizeof(wide));
    return fs_from_wide(wide);
}

SecretKey SecretKey::from_inner(const blst_scalar &inner) {
    return SecretKey{inner, derive_spend(inner)};
}

SecretKey SecretKey::random() {
    return Keypair::random().secret;
}

bool SecretKey::operator==(const SecretKey &o) const {
    return std::equal(std::begin(inner.b), std::end(inner.b), std::begin(o.inner.b)) && spend == o.spend;
}

PublicKey PublicKey::from_secret(const SecretKey &secret) {
    return PublicKey{sk_to_pk(secret.inner), jub_mul(jub_base(), secret.spend)};
}

void PublicKey::encode(Encoder &enc) const {
    enc.p1(inner);
    enc.point(spend);
}

bool PublicKey::decode(Decoder &dec, PublicKey &out) {
    return dec.p1(out.inner) && dec.point(out.spend);
}

Keypair Keypair::random() {
    return from_seed(gen_rand_32());
}

Keypair Keypair::from_secret(const SecretKey &secret) {
    return Keypair{secret, PublicKey::from_secret(secret)};
}

Keypair Keypair::from_seed(const bytes32 &seed) {
    key_pair kp = gen_key_pair(seed);
    return from_secret(SecretKey::from_inner(kp.sk));
}

Signature sign(const SecretKey &secret, const ByteSlice &msg) {
    return sign_msg(secret.inner, msg.data(), msg.size());
}

bool verify(const PublicKey &pubkey, const Signature &sig, const ByteSlice &msg) {
    return verify_sig(pubkey.inner, sig, msg.data(), msg.size());
}
