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
#include "builder.h"
#include "money.h"

struct BurnProof {
    Input input;
    Proof proof;
    // fresh key that signs for this input
    SecretKey signature_secret;
};

struct MintProof {
    Output output;
    Proof proof;
};

// Spends coin with the given commitment blinds.
Result<BurnProof, BuilderError> create_burn_proof(
    const ZkSetup &zk,
    const SpendCoin &spend,
    const Fs &value_blind,
    const Fr &token_blind
);

// Output paying note to recipient, the note is sealed to recipient.
// EncryptionFailed when the note could not be sealed.
Result<MintProof, BuilderError> create_mint_proof(
    const ZkSetup &zk,
    const PublicKey &recipient,
    const Note &note
);

// A note with fresh serial and coin blind.
Note make_note(
    uint64_t value,
    const Fr &token_id,
    const Fr &spend_hook,
    const Fr &user_data,
    const Fs &value_blind,
    const Fr &token_blind
);
