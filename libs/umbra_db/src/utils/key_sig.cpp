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


#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <sys/random.h>
#include "utils.h"

const std::string SIG_DST = "UMBRA_SIG_V1";
static const char* KEYGEN_INFO = "umbra:keygen";

std::tuple<const byte*, size_t> str_to_bytes(const char* str) {
    const byte* bytes = reinterpret_cast<const byte*>(str);
    return std::make_tuple(bytes, strlen(str));
}

bytes32 gen_rand_32() {
    bytes32 buffer;
    size_t filled = 0;
    while (filled < buffer.size()) {
        ssize_t n = getrandom(buffer.data() + filled, buffer.size() - filled, 0);
        if (n < 0) throw std::runtime_error("getrandom failed");
        filled += static_cast<size_t>(n);
    }
    return buffer;
}

key_pair gen_key_pair(const bytes32 &seed) {
    key_pair keys;
    auto [info, info_len] = str_to_bytes(KEYGEN_INFO);
    blst_keygen(&keys.sk, seed.data(), seed.size(), info, info_len);
    blst_sk_to_pk_in_g1(&keys.pk, &keys.sk);
    return keys;
}

blst_p1 sk_to_pk(const blst_scalar &sk) {
    blst_p1 pk;
    blst_sk_to_pk_in_g1(&pk, &sk);
    return pk;
}

blst_p2 sign_msg(const blst_scalar &sk, const byte* msg, size_t msg_len) {
    blst_p2 hash;
    blst_hash_to_g2(
        &hash, msg, msg_len,
        reinterpret_cast<const byte*>(SIG_DST.data()), SIG_DST.size(),
        nullptr, 0
    );

    blst_p2 sig;
    blst_sign_pk_in_g1(&sig, &hash, &sk);
    return sig;
}

bool verify_sig(
    const blst_p1 &PK,
    const blst_p2 &signature,
    const byte* msg,
    size_t msg_len
) {
    if (blst_p1_is_inf(&PK)) return false;

    blst_p2_affine sig_affine;
    blst_p2_to_affine(&sig_affine, &signature);

    blst_p1_affine pk_affine;
    blst_p1_to_affine(&pk_affine, &PK);

    auto ctx = reinterpret_cast<blst_pairing*>(malloc(blst_pairing_sizeof()));
    if (!ctx) return false;
    blst_pairing_init(
        ctx, true,
        reinterpret_cast<const byte*>(SIG_DST.data()), SIG_DST.size()
    );
    BLST_ERROR err = blst_pairing_aggregate_pk_in_g1(
        ctx, &pk_affine, &sig_affine, msg, msg_len, nullptr, 0
    );
    bool res = false;
    if (err == BLST_SUCCESS) {
        blst_pairing_commit(ctx);
        res = blst_pairing_finalverify(ctx, nullptr);
    }
    free(ctx);

    return res;
}
