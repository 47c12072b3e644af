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


#include "coin.h"
#include "derive.h"

void Note::encode(Encoder &enc) const {
    enc.scalar(serial);
    enc.u64(value);
    enc.scalar(token_id);
    enc.scalar(spend_hook);
    enc.scalar(user_data);
    enc.scalar(coin_blind);
    enc.scalar(value_blind);
    enc.scalar(token_blind);
    enc.bytes(memo);
}

bool Note::decode(Decoder &dec, Note &out) {
    return dec.scalar(out.serial)
        && dec.u64(out.value)
        && dec.scalar(out.token_id)
        && dec.scalar(out.spend_hook)
        && dec.scalar(out.user_data)
        && dec.scalar(out.coin_blind)
        && dec.scalar(out.value_blind)
        && dec.scalar(out.token_blind)
        && dec.bytes(out.memo);
}

std::optional<AeadEncrypted> Note::encrypt(const PublicKey &recipient) const {
    Bytes plain = to_bytes(*this);
    return aead_seal(recipient, plain);
}

std::optional<Note> Note::decrypt(const SecretKey &secret, const AeadEncrypted &box) {
    auto plain = aead_open(secret, box);
    if (!plain.has_value()) return std::nullopt;
    return from_bytes<Note>(plain.value());
}

Fr note_coin(const Note &note, const PublicKey &owner) {
    auto [x, y] = owner.xy();
    return derive_coin(
        x, y,
        fr_from_u64(note.value),
        note.token_id,
        note.serial,
        note.spend_hook,
        note.user_data,
        note.coin_blind
    );
}

std::optional<OwnCoin> try_own_coin(
    const SecretKey &secret,
    const Fr &coin,
    const AeadEncrypted &box,
    uint64_t leaf_position
) {
    auto note = Note::decrypt(secret, box);
    if (!note.has_value()) return std::nullopt;

    PublicKey owner = PublicKey::from_secret(secret);
    if (note_coin(note.value(), owner) != coin) return std::nullopt;

    OwnCoin own;
    own.coin = coin;
    own.note = std::move(note.value());
    own.secret = secret;
    own.nullifier = derive_nullifier(fs_to_fr(secret.spend), own.note.serial);
    own.leaf_position = leaf_position;
    return own;
}
