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


#include "tx.h"

static const std::string TX_SIGN_TAG = "umbra:tx_sign";
static const std::string TX_HASH_TAG = "umbra:tx_hash";

void ContractCall::encode(Encoder &enc) const {
    enc.scalar(contract_id);
    enc.u8(function);
    enc.bytes(params);
}

bool ContractCall::decode(Decoder &dec, ContractCall &out) {
    return dec.scalar(out.contract_id)
        && dec.u8(out.function)
        && dec.bytes(out.params);
}

static void encode_calls_and_proofs(Encoder &enc, const Transaction &tx) {
    encode_vec(enc, tx.calls);
    enc.count(tx.proofs.size());
    for (auto &bundle : tx.proofs) encode_vec(enc, bundle);
}

void Transaction::encode(Encoder &enc) const {
    encode_calls_and_proofs(enc, *this);
    enc.count(signatures.size());
    for (auto &bundle : signatures) {
        enc.count(bundle.size());
        for (auto &sig : bundle) enc.p2(sig);
    }
}

bool Transaction::decode(Decoder &dec, Transaction &out) {
    if (!decode_vec(dec, out.calls, 32 + 1 + 4)) return false;

    size_t n;
    if (!dec.count(n, 4)) return false;
    out.proofs.resize(n);
    for (auto &bundle : out.proofs)
        if (!decode_vec(dec, bundle, PROOF_SIZE)) return false;

    if (!dec.count(n, 4)) return false;
    out.signatures.resize(n);
    for (auto &bundle : out.signatures) {
        size_t m;
        if (!dec.count(m, 96)) return false;
        bundle.resize(m);
        for (auto &sig : bundle)
            if (!dec.p2(sig)) return false;
    }
    return true;
}

Hash Transaction::signing_hash() const {
    Encoder enc;
    encode_calls_and_proofs(enc, *this);

    BlakeHasher hasher;
    hasher.update(TX_SIGN_TAG);
    hasher.update(enc.data().data(), enc.data().size());
    return hasher.finalize();
}

Hash Transaction::hash() const {
    Bytes raw = to_bytes(*this);

    BlakeHasher hasher;
    hasher.update(TX_HASH_TAG);
    hasher.update(raw.data(), raw.size());
    return hasher.finalize();
}

void CallMetadata::encode(Encoder &enc) const {
    enc.count(zk_public_inputs.size());
    for (auto &[circuit, inputs] : zk_public_inputs) {
        enc.bytes(ByteSlice(reinterpret_cast<const byte*>(circuit.data()), circuit.size()));
        encode_scalars(enc, inputs);
    }
    enc.count(signature_pubkeys.size());
    for (auto &pk : signature_pubkeys) pk.encode(enc);
}

bool CallMetadata::decode(Decoder &dec, CallMetadata &out) {
    size_t n;
    if (!dec.count(n, 8)) return false;
    out.zk_public_inputs.resize(n);
    for (auto &[circuit, inputs] : out.zk_public_inputs) {
        Bytes name;
        if (!dec.bytes(name)) return false;
        circuit.assign(name.begin(), name.end());
        if (!decode_scalars(dec, inputs)) return false;
    }

    if (!dec.count(n, PUBLIC_KEY_SIZE)) return false;
    out.signature_pubkeys.resize(n);
    for (auto &pk : out.signature_pubkeys)
        if (!PublicKey::decode(dec, pk)) return false;
    return true;
}
