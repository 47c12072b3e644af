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
#include "aead.h"
#include "keys.h"
#include "serialize.h"

// Plaintext of an output, sealed to its owner inside the output.
struct Note {
    Fr serial;
    uint64_t value;
    Fr token_id;
    Fr spend_hook;
    Fr user_data;
    Fr coin_blind;
    Fs value_blind;
    Fr token_blind;
    Bytes memo;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, Note &out);

    // nullopt when sealing fails
    std::optional<AeadEncrypted> encrypt(const PublicKey &recipient) const;
    // nullopt is the ordinary "not ours" outcome
    static std::optional<Note> decrypt(const SecretKey &secret, const AeadEncrypted &box);
};

// the coin a note commits to once it belongs to owner
Fr note_coin(const Note &note, const PublicKey &owner);

// A coin this wallet can spend.
struct OwnCoin {
    Fr coin;
    Note note;
    SecretKey secret;
    Fr nullifier;
    uint64_t leaf_position;
};

// Trial decrypts an output's note and keeps it only when it opens to the
// published coin under this key.
std::optional<OwnCoin> try_own_coin(
    const SecretKey &secret,
    const Fr &coin,
    const AeadEncrypted &box,
    uint64_t leaf_position
);
