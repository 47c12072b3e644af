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
#include "hashing.h"
#include "serialize.h"
#include "utils.h"

using Signature = blst_p2;

/*
 *  A key has two halves. The BLS half signs transactions. The spend half
 *  lives on Baby Jubjub, owns coins and receives encrypted notes, and is
 *  derived from the BLS half so one seed restores both.
 */
struct SecretKey {
    blst_scalar inner;
    Fs spend;

    static SecretKey random();
    static SecretKey from_inner(const blst_scalar &inner);
    bool operator==(const SecretKey &o) const;
};

struct PublicKey {
    blst_p1 inner;
    EcPoint spend;

    static PublicKey from_secret(const SecretKey &secret);
    // coordinates of the spend half, the address coins are locked to
    std::pair<Fr, Fr> xy() const { return {spend.x, spend.y}; }
    bool operator==(const PublicKey &o) const { return p1_equal(inner, o.inner) && spend == o.spend; }

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, PublicKey &out);
};

constexpr size_t PUBLIC_KEY_SIZE = 48 + 32;

struct Keypair {
    SecretKey secret;
    PublicKey pubkey;

    static Keypair random();
    static Keypair from_secret(const SecretKey &secret);
    static Keypair from_seed(const bytes32 &seed);
};

Signature sign(const SecretKey &secret, const ByteSlice &msg);
bool verify(const PublicKey &pubkey, const Signature &sig, const ByteSlice &msg);
