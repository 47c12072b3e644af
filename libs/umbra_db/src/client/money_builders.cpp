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


#include "money_builders.h"
#include "derive.h"
#include "log.h"
#include "wallet.h"

TransferOutput TransferOutput::to(
    const PublicKey &recipient,
    uint64_t value,
    const Fr &token_id
) {
    TransferOutput out;
    out.recipient = recipient;
    out.value = value;
    out.token_id = token_id;
    out.spend_hook = Fr::zero();
    out.user_data = Fr::zero();
    out.serial = rand_fr();
    out.coin_blind = rand_fr();
    return out;
}

TransferCallBuilder& TransferCallBuilder::add_clear_input(
    uint64_t value,
    const Fr &token_id,
    const SecretKey &signer
) {
    clear_inputs_.push_back(ClearSpend{value, token_id, signer, rand_fs()});
    return *this;
}

TransferCallBuilder& TransferCallBuilder::add_input(const SpendCoin &spend) {
    inputs_.push_back(AnonSpend{spend, rand_fs()});
    return *this;
}

TransferCallBuilder& TransferCallBuilder::add_output(const TransferOutput &output) {
    outputs_.push_back(output);
    return *this;
}

Fs TransferCallBuilder::input_blind_sum() const {
    Fs sum = Fs::zero();
    for (auto &input : clear_inputs_) sum += input.value_blind;
    for (auto &input : inputs_) sum += input.value_blind;
    return sum;
}

Result<CallDebris, BuilderError> TransferCallBuilder::build() const {
    if (clear_inputs_.empty() && inputs_.empty()) return BuilderError::NoInputs;
    if (outputs_.empty()) return BuilderError::NoOutputs;

    const Fr &token_id = inputs_.empty()
        ? clear_inputs_[0].token_id
        : inputs_[0].spend.coin.note.token_id;

    unsigned __int128 in_total = 0;
    unsigned __int128 out_total = 0;
    for (auto &input : clear_inputs_) {
        if (input.token_id != token_id) return BuilderError::TokenMismatch;
        in_total += input.value;
    }
    for (auto &input : inputs_) {
        if (input.spend.coin.note.token_id != token_id) return BuilderError::TokenMismatch;
        in_total += input.spend.coin.note.value;
    }
    for (auto &output : outputs_) {
        if (output.token_id != token_id) return BuilderError::TokenMismatch;
        out_total += output.value;
    }
    if (in_total < out_total) return BuilderError::InsufficientFunds;
    if (in_total > out_total) return BuilderError::ValueMismatch;

    Fr token_blind = rand_fr();
    MoneyTransferParams params;
    CallDebris debris;

    for (auto &input : clear_inputs_) {
        params.clear_inputs.push_back(ClearInput{
            input.value,
            input.token_id,
            input.value_blind,
            token_blind,
            PublicKey::from_secret(input.signer),
        });
        debris.signature_secrets.push_back(input.signer);
    }

    for (auto &input : inputs_) {
        auto burn = create_burn_proof(zk_, input.spend, input.value_blind, token_blind);
        if (burn.is_err()) return burn.unwrap_err();
        params.inputs.push_back(burn.unwrap().input);
        debris.proofs.push_back(burn.unwrap().proof);
        debris.signature_secrets.push_back(burn.unwrap().signature_secret);
    }

    // the last output balances the blinds
    Fs remaining = input_blind_sum();
    for (size_t i = 0; i < outputs_.size(); i++) {
        auto &want = outputs_[i];
        Fs value_blind = (i + 1 == outputs_.size()) ? remaining : rand_fs();
        remaining -= value_blind;

        Note note;
        note.serial = want.serial;
        note.value = want.value;
        note.token_id = want.token_id;
        note.spend_hook = want.spend_hook;
        note.user_data = want.user_data;
        note.coin_blind = want.coin_blind;
        note.value_blind = value_blind;
        note.token_blind = token_blind;
        note.memo = want.memo;

        auto mint = create_mint_proof(zk_, want.recipient, note);
        if (mint.is_err()) return mint.unwrap_err();
        params.outputs.push_back(mint.unwrap().output);
        debris.proofs.push_back(mint.unwrap().proof);
    }

    debris.call = ContractCall{
        money_contract_id(),
        static_cast<uint8_t>(MoneyFunction::TransferV1),
        to_bytes(params),
    };
    return debris;
}

Result<CallDebris, BuilderError> make_transfer(
    const ZkSetup &zk,
    const Wallet &wallet,
    const PublicKey &recipient,
    uint64_t value,
    const Fr &token_id
) {
    TransferCallBuilder builder(zk);

    uint64_t gathered = 0;
    for (auto &coin : wallet.unspent_coins(token_id)) {
        if (gathered >= value && gathered > 0) break;
        // hooked coins can only move alongside their contract
        if (!coin.note.spend_hook.is_zero()) continue;

        auto spend = wallet.money_spend(coin);
        if (!spend.has_value()) return BuilderError::MissingMerklePath;
        builder.add_input(spend.value());
        gathered += coin.note.value;
    }
    if (gathered < value) {
        log_debug("builder", "have %llu, need %llu",
            (unsigned long long)gathered, (unsigned long long)value);
        return BuilderError::InsufficientFunds;
    }

    builder.add_output(TransferOutput::to(recipient, value, token_id));
    if (gathered > value)
        builder.add_output(TransferOutput::to(wallet.pubkey(), gathered - value, token_id));
    return builder.build();
}

// ----------------------- OTC SWAP ------------------------

SwapBlinds SwapBlinds::random() {
    SwapBlinds blinds;
    for (size_t i = 0; i < 2; i++) {
        blinds.value_blinds[i] = rand_fs();
        blinds.token_blinds[i] = rand_fr();
    }
    return blinds;
}

Result<SwapHalf, BuilderError> build_swap_half(
    const ZkSetup &zk,
    size_t party,
    const SwapBlinds &blinds,
    const SpendCoin &send,
    const PublicKey &receive_to,
    uint64_t receive_value,
    const Fr &receive_token
) {
    size_t other = 1 - party;

    auto burn = create_burn_proof(zk, send, blinds.value_blinds[party], blinds.token_blinds[party]);
    if (burn.is_err()) return burn.unwrap_err();

    Note note = make_note(
        receive_value, receive_token, Fr::zero(), Fr::zero(),
        blinds.value_blinds[other], blinds.token_blinds[other]);
    auto mint = create_mint_proof(zk, receive_to, note);
    if (mint.is_err()) return mint.unwrap_err();

    return SwapHalf{burn.unwrap(), mint.unwrap()};
}

CallDebris join_swap(const SwapHalf &first, const SwapHalf &second) {
    MoneyTransferParams params;
    params.inputs = {first.burn.input, second.burn.input};
    params.outputs = {first.mint.output, second.mint.output};

    CallDebris debris;
    debris.call = ContractCall{
        money_contract_id(),
        static_cast<uint8_t>(MoneyFunction::OtcSwapV1),
        to_bytes(params),
    };
    debris.proofs = {first.burn.proof, second.burn.proof, first.mint.proof, second.mint.proof};
    debris.signature_secrets = {first.burn.signature_secret, second.burn.signature_secret};
    return debris;
}

// ----------------------- TOKENS ------------------------

Fr token_id_for(const PublicKey &authority) {
    return derive_token_id(authority);
}

Result<CallDebris, BuilderError> build_token_mint(
    const ZkSetup &zk,
    const SecretKey &authority,
    const PublicKey &recipient,
    uint64_t value
) {
    PublicKey authority_public = PublicKey::from_secret(authority);
    Fr token_id = token_id_for(authority_public);

    ClearInput input{value, token_id, rand_fs(), rand_fr(), authority_public};
    Note note = make_note(value, token_id, Fr::zero(), Fr::zero(), input.value_blind, input.token_blind);

    auto mint = create_mint_proof(zk, recipient, note);
    if (mint.is_err()) return mint.unwrap_err();

    MoneyMintParams params{input, mint.unwrap().output};

    CallDebris debris;
    debris.call = ContractCall{
        money_contract_id(),
        static_cast<uint8_t>(MoneyFunction::MintV1),
        to_bytes(params),
    };
    debris.proofs.push_back(mint.unwrap().proof);
    debris.signature_secrets.push_back(authority);
    return debris;
}

CallDebris build_token_freeze(const SecretKey &authority) {
    PublicKey authority_public = PublicKey::from_secret(authority);
    MoneyFreezeParams params{authority_public, token_id_for(authority_public)};

    CallDebris debris;
    debris.call = ContractCall{
        money_contract_id(),
        static_cast<uint8_t>(MoneyFunction::FreezeV1),
        to_bytes(params),
    };
    debris.signature_secrets.push_back(authority);
    return debris;
}
