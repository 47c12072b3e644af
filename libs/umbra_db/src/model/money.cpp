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


#include "money.h"
#include "derive.h"

void ClearInput::encode(Encoder &enc) const {
    enc.u64(value);
    enc.scalar(token_id);
    enc.scalar(value_blind);
    enc.scalar(token_blind);
    signature_public.encode(enc);
}

bool ClearInput::decode(Decoder &dec, ClearInput &out) {
    return dec.u64(out.value)
        && dec.scalar(out.token_id)
        && dec.scalar(out.value_blind)
        && dec.scalar(out.token_blind)
        && PublicKey::decode(dec, out.signature_public);
}

void Input::encode(Encoder &enc) const {
    enc.point(value_commit);
    enc.scalar(token_commit);
    enc.scalar(nullifier);
    enc.scalar(merkle_root);
    enc.scalar(spend_hook);
    enc.scalar(user_data_enc);
    signature_public.encode(enc);
}

bool Input::decode(Decoder &dec, Input &out) {
    return dec.point(out.value_commit)
        && dec.scalar(out.token_commit)
        && dec.scalar(out.nullifier)
        && dec.scalar(out.merkle_root)
        && dec.scalar(out.spend_hook)
        && dec.scalar(out.user_data_enc)
        && PublicKey::decode(dec, out.signature_public);
}

bool Input::operator==(const Input &o) const {
    return value_commit == o.value_commit
        && token_commit == o.token_commit
        && nullifier == o.nullifier
        && merkle_root == o.merkle_root
        && spend_hook == o.spend_hook
        && user_data_enc == o.user_data_enc
        && signature_public == o.signature_public;
}

void Output::encode(Encoder &enc) const {
    enc.point(value_commit);
    enc.scalar(token_commit);
    enc.scalar(coin);
    note.encode(enc);
}

bool Output::decode(Decoder &dec, Output &out) {
    return dec.point(out.value_commit)
        && dec.scalar(out.token_commit)
        && dec.scalar(out.coin)
        && AeadEncrypted::decode(dec, out.note);
}

void StakeInput::encode(Encoder &enc) const {
    enc.scalar(token_blind);
    enc.point(value_commit);
    enc.scalar(nullifier);
    enc.scalar(merkle_root);
    signature_public.encode(enc);
}

bool StakeInput::decode(Decoder &dec, StakeInput &out) {
    return dec.scalar(out.token_blind)
        && dec.point(out.value_commit)
        && dec.scalar(out.nullifier)
        && dec.scalar(out.merkle_root)
        && PublicKey::decode(dec, out.signature_public);
}

bool StakeInput::operator==(const StakeInput &o) const {
    return token_blind == o.token_blind
        && value_commit == o.value_commit
        && nullifier == o.nullifier
        && merkle_root == o.merkle_root
        && signature_public == o.signature_public;
}

PublicInputs burn_public_inputs(const Input &input) {
    return {
        input.nullifier,
        input.value_commit.x, input.value_commit.y,
        input.token_commit,
        input.merkle_root,
        input.user_data_enc,
        input.spend_hook,
        signature_tag(input.signature_public),
    };
}

PublicInputs mint_public_inputs(const Output &output) {
    return {output.coin, output.value_commit.x, output.value_commit.y, output.token_commit};
}

// ----------------------- CALL PARAMS ------------------------

void MoneyTransferParams::encode(Encoder &enc) const {
    encode_vec(enc, clear_inputs);
    encode_vec(enc, inputs);
    encode_vec(enc, outputs);
}

bool MoneyTransferParams::decode(Decoder &dec, MoneyTransferParams &out) {
    return decode_vec(dec, out.clear_inputs, 8 + 32 * 3 + PUBLIC_KEY_SIZE)
        && decode_vec(dec, out.inputs, 32 * 6 + PUBLIC_KEY_SIZE)
        && decode_vec(dec, out.outputs, 32 * 4 + 4);
}

void MoneyTransferUpdate::encode(Encoder &enc) const {
    encode_scalars(enc, nullifiers);
    encode_scalars(enc, coins);
}

bool MoneyTransferUpdate::decode(Decoder &dec, MoneyTransferUpdate &out) {
    return decode_scalars(dec, out.nullifiers) && decode_scalars(dec, out.coins);
}

void MoneyMintParams::encode(Encoder &enc) const {
    input.encode(enc);
    output.encode(enc);
}

bool MoneyMintParams::decode(Decoder &dec, MoneyMintParams &out) {
    return ClearInput::decode(dec, out.input) && Output::decode(dec, out.output);
}

void MoneyFreezeParams::encode(Encoder &enc) const {
    signature_public.encode(enc);
    enc.scalar(token_id);
}

bool MoneyFreezeParams::decode(Decoder &dec, MoneyFreezeParams &out) {
    return PublicKey::decode(dec, out.signature_public) && dec.scalar(out.token_id);
}

void MoneyStakeParams::encode(Encoder &enc) const {
    enc.scalar(token_blind);
    input.encode(enc);
}

bool MoneyStakeParams::decode(Decoder &dec, MoneyStakeParams &out) {
    return dec.scalar(out.token_blind) && Input::decode(dec, out.input);
}

void MoneyUnstakeParams::encode(Encoder &enc) const {
    enc.scalar(token_blind);
    input.encode(enc);
    output.encode(enc);
    enc.scalar(spend_hook);
}

bool MoneyUnstakeParams::decode(Decoder &dec, MoneyUnstakeParams &out) {
    return dec.scalar(out.token_blind)
        && Input::decode(dec, out.input)
        && Output::decode(dec, out.output)
        && dec.scalar(out.spend_hook);
}
