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
#include "proof.h"
#include "serialize.h"

// Input whose value and token are revealed. Only faucets and token
// authorities may use one.
struct ClearInput {
    uint64_t value;
    Fr token_id;
    Fs value_blind;
    Fr token_blind;
    PublicKey signature_public;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, ClearInput &out);
};

// Anonymous input, the public side of a burn proof.
struct Input {
    EcPoint value_commit;
    Fr token_commit;
    Fr nullifier;
    Fr merkle_root;
    Fr spend_hook;
    Fr user_data_enc;
    PublicKey signature_public;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, Input &out);
    bool operator==(const Input &o) const;
};

// Anonymous output, the public side of a mint proof.
struct Output {
    EcPoint value_commit;
    Fr token_commit;
    Fr coin;
    AeadEncrypted note;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, Output &out);
};

// What Money::StakeV1 hands over to the consensus contract.
struct StakeInput {
    Fr token_blind;
    EcPoint value_commit;
    Fr nullifier;
    Fr merkle_root;
    PublicKey signature_public;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, StakeInput &out);
    bool operator==(const StakeInput &o) const;
};

// public inputs each proof is checked against
PublicInputs burn_public_inputs(const Input &input);
PublicInputs mint_public_inputs(const Output &output);

// ----------------------- CALL PARAMS ------------------------

// Money::TransferV1 and Money::OtcSwapV1
struct MoneyTransferParams {
    std::vector<ClearInput> clear_inputs;
    std::vector<Input> inputs;
    std::vector<Output> outputs;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, MoneyTransferParams &out);
};

struct MoneyTransferUpdate {
    std::vector<Fr> nullifiers;
    std::vector<Fr> coins;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, MoneyTransferUpdate &out);
};

struct MoneyMintParams {
    ClearInput input;
    Output output;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, MoneyMintParams &out);
};

struct MoneyMintUpdate {
    Fr coin;

    void encode(Encoder &enc) const { enc.scalar(coin); }
    static bool decode(Decoder &dec, MoneyMintUpdate &out) { return dec.scalar(out.coin); }
};

struct MoneyFreezeParams {
    PublicKey signature_public;
    Fr token_id;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, MoneyFreezeParams &out);
};

struct MoneyFreezeUpdate {
    Fr token_id;

    void encode(Encoder &enc) const { enc.scalar(token_id); }
    static bool decode(Decoder &dec, MoneyFreezeUpdate &out) { return dec.scalar(out.token_id); }
};

struct MoneyStakeParams {
    Fr token_blind;
    Input input;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, MoneyStakeParams &out);
};

struct MoneyStakeUpdate {
    Fr nullifier;

    void encode(Encoder &enc) const { enc.scalar(nullifier); }
    static bool decode(Decoder &dec, MoneyStakeUpdate &out) { return dec.scalar(out.nullifier); }
};

// spend_hook, when set, names the contract that must be called right after
struct MoneyUnstakeParams {
    Fr token_blind;
    Input input;
    Output output;
    Fr spend_hook;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, MoneyUnstakeParams &out);
};

struct MoneyUnstakeUpdate {
    Fr coin;

    void encode(Encoder &enc) const { enc.scalar(coin); }
    static bool decode(Decoder &dec, MoneyUnstakeUpdate &out) { return dec.scalar(out.coin); }
};
