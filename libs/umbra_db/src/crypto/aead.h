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
#include "keys.h"
#include "serialize.h"

constexpr size_t AEAD_NONCE_LEN = 12;
constexpr size_t AEAD_TAG_LEN = 16;

// Sealed to a recipient's spend key through an ephemeral Diffie-Hellman
// on Baby Jubjub. ciphertext is nonce || ct || tag.
struct AeadEncrypted {
    EcPoint ephem_public;
    Bytes ciphertext;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, AeadEncrypted &out);
};

// nullopt for a recipient key of low order, or when OpenSSL could not
// produce a nonce or a ciphertext
std::optional<AeadEncrypted> aead_seal(const PublicKey &recipient, const ByteSlice &plaintext);
// nullopt when the box was not sealed to this key or was altered
std::optional<Bytes> aead_open(const SecretKey &secret, const AeadEncrypted &box);
