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


#include "money_proofs.h"
#include "circuits.h"
#include "commit.h"
#include "derive.h"

Result<BurnProof, BuilderError> create_burn_proof(
    const ZkSetup &zk,
    const SpendCoin &spend,
    const Fs &value_blind,
    const Fr &token_blind
) {
    const OwnCoin &coin = spend.coin;
    const Note &note = coin.note;
    if (spend.path.position != coin.leaf_position) return BuilderError::MissingMerklePath;

    Fr user_data_blind = rand_fr();
    SecretKey signature_secret = SecretKey::random();
    PublicKey signature_public = PublicKey::from_secret(signature_secret);

    Witness w{
        fs_to_fr(coin.secret.spend),
        note.serial,
        fr_from_u64(note.value),
        note.token_id,
        note.spend_hook,
        note.user_data,
        note.coin_blind,
        fs_to_fr(value_blind),
        token_blind,
        user_data_blind,
    };
    push_path(w, spend.path);
    w.push_back(signature_tag(signature_public));

    auto proof = prove(zk, MONEY_BURN_CIRCUIT, w);
    if (proof.is_err()) return proof.unwrap_err();

    BurnProof out;
    out.input.value_commit = pedersen_commitment_u64(note.value, value_blind);
    out.input.token_commit = derive_token_commit(note.token_id, token_blind);
    out.input.nullifier = coin.nullifier;
    out.input.merkle_root = merkle_root_from_path(coin.coin, spend.path);
    out.input.spend_hook = note.spend_hook;
    out.input.user_data_enc = derive_user_data_enc(note.user_data, user_data_blind);
    out.input.signature_public = signature_public;
    out.proof = proof.unwrap();
    out.signature_secret = signature_secret;
    return out;
}

Result<MintProof, BuilderError> create_mint_proof(
    const ZkSetup &zk,
    const PublicKey &recipient,
    const Note &note
) {
    auto sealed = note.encrypt(recipient);
    if (!sealed.has_value()) return BuilderError::EncryptionFailed;

    auto [pub_x, pub_y] = recipient.xy();
    Witness w{
        pub_x,
        pub_y,
        fr_from_u64(note.value),
        note.token_id,
        note.serial,
        note.spend_hook,
        note.user_data,
        note.coin_blind,
        fs_to_fr(note.value_blind),
        note.token_blind,
    };

    auto proof = prove(zk, MONEY_MINT_CIRCUIT, w);
    if (proof.is_err()) return proof.unwrap_err();

    MintProof out;
    out.output.value_commit = pedersen_commitment_u64(note.value, note.value_blind);
    out.output.token_commit = derive_token_commit(note.token_id, note.token_blind);
    out.output.coin = note_coin(note, recipient);
    out.output.note = std::move(sealed.value());
    out.proof = proof.unwrap();
    return out;
}

Note make_note(
    uint64_t value,
    const Fr &token_id,
    const Fr &spend_hook,
    const Fr &user_data,
    const Fs &value_blind,
    const Fr &token_blind
) {
    Note note;
    note.serial = rand_fr();
    note.value = value;
    note.token_id = token_id;
    note.spend_hook = spend_hook;
    note.user_data = user_data;
    note.coin_blind = rand_fr();
    note.value_blind = value_blind;
    note.token_blind = token_blind;
    return note;
}
