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


#include "money_contract.h"
#include "circuits.h"
#include "commit.h"
#include "consensus.h"
#include "consensus_contract.h"
#include "derive.h"
#include <algorithm>
#include <set>

const std::string MONEY_INFO_TABLE = "info";
const std::string MONEY_COINS_TABLE = "coins";
const std::string MONEY_NULLIFIERS_TABLE = "nullifiers";
const std::string MONEY_TOKEN_FREEZES_TABLE = "token_freezes";

const std::string MONEY_COIN_TREE = "coin_tree";
const std::string MONEY_FAUCET_PUBKEYS = "faucet_pubkeys";

static uint8_t fn_byte(MoneyFunction f) {
    return static_cast<uint8_t>(f);
}

static Bytes info_key(const std::string &name) {
    return Bytes(name.begin(), name.end());
}

static void push_burn(CallMetadata &meta, const Input &input) {
    meta.zk_public_inputs.emplace_back(MONEY_BURN_CIRCUIT, burn_public_inputs(input));
}

static void push_mint(CallMetadata &meta, const Output &output) {
    meta.zk_public_inputs.emplace_back(MONEY_MINT_CIRCUIT, mint_public_inputs(output));
}

static Result<std::vector<PublicKey>, ContractError> load_faucets(
    const StoreView &db,
    const char* target
) {
    auto stored = db.get(money_contract_id(), MONEY_INFO_TABLE, info_key(MONEY_FAUCET_PUBKEYS));
    if (stored.is_err()) return store_failure(target, stored.unwrap_err());

    std::vector<PublicKey> keys;
    if (!stored.unwrap().has_value()) return keys;

    Decoder dec(stored.unwrap().value());
    size_t n;
    if (!dec.count(n, PUBLIC_KEY_SIZE)) return ContractError::DecodeFailed;
    keys.resize(n);
    for (auto &pk : keys)
        if (!PublicKey::decode(dec, pk)) return ContractError::DecodeFailed;
    if (!dec.finish()) return ContractError::DecodeFailed;
    return keys;
}

// A non-zero spend hook names the contract that must run right after this call.
static ContractError check_spend_hook(
    const std::vector<ContractCall> &calls,
    size_t call_idx,
    const Fr &spend_hook,
    const char* target
) {
    if (spend_hook.is_zero()) return ContractError::Ok;

    const ContractCall* next = call_at(calls, call_idx + 1);
    if (next == nullptr)
        return reject(target, ContractError::SpendHookOutOfBounds, "spend hook call missing");
    if (next->contract_id != spend_hook)
        return reject(target, ContractError::SpendHookMismatch, "next call is not the spend hook");
    return ContractError::Ok;
}

static ContractError check_inputs(
    const std::vector<ContractCall> &calls,
    size_t call_idx,
    const std::vector<Input> &inputs,
    const StoreView &db,
    const char* target,
    MoneyTransferUpdate &update
) {
    std::set<Hash> seen;
    for (auto &input : inputs) {
        ContractError err = require_root(
            db, target, money_contract_id(), MONEY_COIN_TREE,
            input.merkle_root, ContractError::MerkleRootNotFound);
        if (err != ContractError::Ok) return err;

        err = require_absent(
            db, target, money_contract_id(), MONEY_NULLIFIERS_TABLE,
            input.nullifier, ContractError::DuplicateNullifier);
        if (err != ContractError::Ok) return err;

        if (!seen.insert(scalar_id(input.nullifier)).second)
            return reject(target, ContractError::DuplicateNullifier, "nullifier repeated in call");

        err = check_spend_hook(calls, call_idx, input.spend_hook, target);
        if (err != ContractError::Ok) return err;

        update.nullifiers.push_back(input.nullifier);
    }
    return ContractError::Ok;
}

static ContractError check_outputs(
    const std::vector<Output> &outputs,
    const StoreView &db,
    const char* target,
    MoneyTransferUpdate &update
) {
    std::set<Hash> seen;
    for (auto &output : outputs) {
        ContractError err = require_absent(
            db, target, money_contract_id(), MONEY_COINS_TABLE,
            output.coin, ContractError::DuplicateCoin);
        if (err != ContractError::Ok) return err;

        if (!seen.insert(scalar_id(output.coin)).second)
            return reject(target, ContractError::DuplicateCoin, "coin repeated in call");

        update.coins.push_back(output.coin);
    }
    return ContractError::Ok;
}

// ----------------------- METADATA ------------------------

static Result<CallMetadata, ContractError> transfer_metadata(const ContractCall &call) {
    auto decoded = decode_params<MoneyTransferParams>(call);
    if (decoded.is_err()) return decoded.unwrap_err();
    auto &params = decoded.unwrap();

    CallMetadata meta;
    for (auto &input : params.clear_inputs)
        meta.signature_pubkeys.push_back(input.signature_public);
    for (auto &input : params.inputs) {
        push_burn(meta, input);
        meta.signature_pubkeys.push_back(input.signature_public);
    }
    for (auto &output : params.outputs)
        push_mint(meta, output);
    return meta;
}

static Result<CallMetadata, ContractError> mint_metadata(const ContractCall &call) {
    auto decoded = decode_params<MoneyMintParams>(call);
    if (decoded.is_err()) return decoded.unwrap_err();
    auto &params = decoded.unwrap();

    CallMetadata meta;
    push_mint(meta, params.output);
    meta.signature_pubkeys.push_back(params.input.signature_public);
    return meta;
}

static Result<CallMetadata, ContractError> freeze_metadata(const ContractCall &call) {
    auto decoded = decode_params<MoneyFreezeParams>(call);
    if (decoded.is_err()) return decoded.unwrap_err();

    CallMetadata meta;
    meta.signature_pubkeys.push_back(decoded.unwrap().signature_public);
    return meta;
}

static Result<CallMetadata, ContractError> stake_metadata(const ContractCall &call) {
    auto decoded = decode_params<MoneyStakeParams>(call);
    if (decoded.is_err()) return decoded.unwrap_err();
    auto &params = decoded.unwrap();

    CallMetadata meta;
    push_burn(meta, params.input);
    meta.signature_pubkeys.push_back(params.input.signature_public);
    return meta;
}

static Result<CallMetadata, ContractError> unstake_metadata(const ContractCall &call) {
    auto decoded = decode_params<MoneyUnstakeParams>(call);
    if (decoded.is_err()) return decoded.unwrap_err();
    auto &params = decoded.unwrap();

    CallMetadata meta;
    push_mint(meta, params.output);
    meta.signature_pubkeys.push_back(params.input.signature_public);
    return meta;
}

Result<CallMetadata, ContractError> MoneyContract::get_metadata(
    const std::vector<ContractCall> &calls,
    size_t call_idx
) const {
    const ContractCall* call = call_at(calls, call_idx);
    if (call == nullptr) return ContractError::CallIdxOutOfBounds;

    auto func = money_function_from_byte(call->function);
    if (!func.has_value()) return ContractError::InvalidFunction;

    switch (func.value()) {
        case MoneyFunction::TransferV1:
        case MoneyFunction::OtcSwapV1: return transfer_metadata(*call);
        case MoneyFunction::MintV1:    return mint_metadata(*call);
        case MoneyFunction::FreezeV1:  return freeze_metadata(*call);
        case MoneyFunction::StakeV1:   return stake_metadata(*call);
        case MoneyFunction::UnstakeV1: return unstake_metadata(*call);
    }
    return ContractError::InvalidFunction;
}

// ----------------------- INSTRUCTIONS ------------------------

static Result<Bytes, ContractError> transfer_instruction(
    const ContractCall &call,
    const std::vector<ContractCall> &calls,
    size_t call_idx,
    const StoreView &db
) {
    const char* target = "Money::TransferV1";
    auto decoded = decode_params<MoneyTransferParams>(call);
    if (decoded.is_err()) return decoded.unwrap_err();
    auto &params = decoded.unwrap();

    if (params.clear_inputs.empty() && params.inputs.empty())
        return reject(target, ContractError::MissingInputs, "no inputs");
    if (params.outputs.empty())
        return reject(target, ContractError::MissingOutputs, "no outputs");

    if (!params.clear_inputs.empty()) {
        auto faucets = load_faucets(db, target);
        if (faucets.is_err()) return faucets.unwrap_err();
        auto &keys = faucets.unwrap();
        for (auto &input : params.clear_inputs) {
            if (std::find(keys.begin(), keys.end(), input.signature_public) == keys.end())
                return reject(target, ContractError::ClearInputUnauthorised, "clear input signer is not a faucet");
        }
    }

    // every commitment in a transfer carries the same token
    Fr token_commit = params.inputs.empty()
        ? derive_token_commit(params.clear_inputs[0].token_id, params.clear_inputs[0].token_blind)
        : params.inputs[0].token_commit;

    std::vector<EcPoint> in_commits;
    for (auto &input : params.clear_inputs) {
        Fr tc = derive_token_commit(input.token_id, input.token_blind);
        if (tc != token_commit)
            return reject(target, ContractError::TokenMismatch, "clear input token");
        in_commits.push_back(pedersen_commitment_u64(input.value, input.value_blind));
    }
    for (auto &input : params.inputs) {
        if (input.token_commit != token_commit)
            return reject(target, ContractError::TokenMismatch, "input token");
        in_commits.push_back(input.value_commit);
    }

    std::vector<EcPoint> out_commits;
    for (auto &output : params.outputs) {
        if (output.token_commit != token_commit)
            return reject(target, ContractError::TokenMismatch, "output token");
        out_commits.push_back(output.value_commit);
    }

    MoneyTransferUpdate update;
    ContractError err = check_inputs(calls, call_idx, params.inputs, db, target, update);
    if (err != ContractError::Ok) return err;
    err = check_outputs(params.outputs, db, target, update);
    if (err != ContractError::Ok) return err;

    EcPoint balance = jub_sub(sum_commitments(in_commits), sum_commitments(out_commits));
    if (!jub_is_identity(balance))
        return reject(target, ContractError::ValueMismatch, "inputs and outputs do not balance");

    log_debug(target, "%zu nullifiers, %zu coins", update.nullifiers.size(), update.coins.size());
    return encode_update(fn_byte(MoneyFunction::TransferV1), update);
}

static Result<Bytes, ContractError> otc_swap_instruction(
    const ContractCall &call,
    const std::vector<ContractCall> &calls,
    size_t call_idx,
    const StoreView &db
) {
    const char* target = "Money::OtcSwapV1";
    auto decoded = decode_params<MoneyTransferParams>(call);
    if (decoded.is_err()) return decoded.unwrap_err();
    auto &params = decoded.unwrap();

    if (!params.clear_inputs.empty() || params.inputs.size() != 2 || params.outputs.size() != 2)
        return reject(target, ContractError::InvalidOtcSwap, "swap needs two inputs and two outputs");

    // each party receives exactly what the other put in
    auto &in = params.inputs;
    auto &out = params.outputs;
    if (in[0].value_commit != out[1].value_commit || in[1].value_commit != out[0].value_commit)
        return reject(target, ContractError::ValueMismatch, "swapped values differ");
    if (in[0].token_commit != out[1].token_commit || in[1].token_commit != out[0].token_commit)
        return reject(target, ContractError::TokenMismatch, "swapped tokens differ");

    MoneyTransferUpdate update;
    ContractError err = check_inputs(calls, call_idx, params.inputs, db, target, update);
    if (err != ContractError::Ok) return err;
    err = check_outputs(params.outputs, db, target, update);
    if (err != ContractError::Ok) return err;

    return encode_update(fn_byte(MoneyFunction::OtcSwapV1), update);
}

static Result<Bytes, ContractError> mint_instruction(const ContractCall &call, const StoreView &db) {
    const char* target = "Money::MintV1";
    auto decoded = decode_params<MoneyMintParams>(call);
    if (decoded.is_err()) return decoded.unwrap_err();
    auto &params = decoded.unwrap();
    auto &input = params.input;

    if (derive_token_id(input.signature_public) != input.token_id)
        return reject(target, ContractError::TokenIdDerivationMismatch, "token id not derived from signer");

    auto frozen = db.contains_key(money_contract_id(), MONEY_TOKEN_FREEZES_TABLE, scalar_key(input.token_id));
    if (frozen.is_err()) return store_failure(target, frozen.unwrap_err());
    if (frozen.unwrap())
        return reject(target, ContractError::TokenFrozen, "token is frozen");

    if (params.output.value_commit != pedersen_commitment_u64(input.value, input.value_blind))
        return reject(target, ContractError::ValueMismatch, "output value does not open to the clear value");
    if (params.output.token_commit != derive_token_commit(input.token_id, input.token_blind))
        return reject(target, ContractError::TokenMismatch, "output token does not open to the clear token");

    ContractError err = require_absent(
        db, target, money_contract_id(), MONEY_COINS_TABLE,
        params.output.coin, ContractError::DuplicateCoin);
    if (err != ContractError::Ok) return err;

    return encode_update(fn_byte(MoneyFunction::MintV1), MoneyMintUpdate{params.output.coin});
}

static Result<Bytes, ContractError> freeze_instruction(const ContractCall &call, const StoreView &db) {
    const char* target = "Money::FreezeV1";
    auto decoded = decode_params<MoneyFreezeParams>(call);
    if (decoded.is_err()) return decoded.unwrap_err();
    auto &params = decoded.unwrap();

    if (derive_token_id(params.signature_public) != params.token_id)
        return reject(target, ContractError::TokenIdDerivationMismatch, "token id not derived from signer");

    ContractError err = require_absent(
        db, target, money_contract_id(), MONEY_TOKEN_FREEZES_TABLE,
        params.token_id, ContractError::TokenAlreadyFrozen);
    if (err != ContractError::Ok) return err;

    return encode_update(fn_byte(MoneyFunction::FreezeV1), MoneyFreezeUpdate{params.token_id});
}

static Result<Bytes, ContractError> stake_instruction(
    const ContractCall &call,
    const std::vector<ContractCall> &calls,
    size_t call_idx,
    const StoreView &db
) {
    const char* target = "Money::StakeV1";
    auto decoded = decode_params<MoneyStakeParams>(call);
    if (decoded.is_err()) return decoded.unwrap_err();
    auto &params = decoded.unwrap();
    auto &input = params.input;

    if (input.token_commit != derive_token_commit(native_token_id(), params.token_blind))
        return reject(target, ContractError::NonNativeToken, "only the native token can be staked");

    // a hooked coin belongs to the contract that hooks it
    if (!input.spend_hook.is_zero())
        return reject(target, ContractError::SpendHookMismatch, "staked coin carries a spend hook");

    ContractError err = require_root(
        db, target, money_contract_id(), MONEY_COIN_TREE,
        input.merkle_root, ContractError::MerkleRootNotFound);
    if (err != ContractError::Ok) return err;

    err = require_absent(
        db, target, money_contract_id(), MONEY_NULLIFIERS_TABLE,
        input.nullifier, ContractError::DuplicateNullifier);
    if (err != ContractError::Ok) return err;

    const ContractCall* next = call_at(calls, call_idx + 1);
    if (next == nullptr)
        return reject(target, ContractError::SpendHookOutOfBounds, "stake without a consensus call");
    if (next->contract_id != consensus_contract_id())
        return reject(target, ContractError::NextCallContractMismatch, "next call is not consensus");
    if (next->function != static_cast<uint8_t>(ConsensusFunction::StakeV1))
        return reject(target, ContractError::NextCallFunctionMismatch, "next call is not Consensus::StakeV1");

    auto next_params = decode_params<ConsensusStakeParams>(*next);
    if (next_params.is_err()) return next_params.unwrap_err();

    StakeInput mirror{
        params.token_blind,
        input.value_commit,
        input.nullifier,
        input.merkle_root,
        input.signature_public,
    };
    if (!(next_params.unwrap().input == mirror))
        return reject(target, ContractError::NextCallInputMismatch, "consensus call stakes a different input");

    return encode_update(fn_byte(MoneyFunction::StakeV1), MoneyStakeUpdate{input.nullifier});
}

/*
 *  Unstaking returns a consensus coin to the money tree. The coin is burned
 *  by Consensus::UnstakeV1 in the previous call, so everything here is about
 *  matching that call and minting the same value again.
 */
static Result<Bytes, ContractError> unstake_instruction(
    const ContractCall &call,
    const std::vector<ContractCall> &calls,
    size_t call_idx,
    const StoreView &db
) {
    const char* target = "Money::UnstakeV1";
    auto decoded = decode_params<MoneyUnstakeParams>(call);
    if (decoded.is_err()) return decoded.unwrap_err();
    auto &params = decoded.unwrap();
    auto &input = params.input;
    auto &output = params.output;

    if (output.token_commit != derive_token_commit(native_token_id(), params.token_blind))
        return reject(target, ContractError::NonNativeToken, "unstaked output is not native");
    if (output.value_commit != input.value_commit)
        return reject(target, ContractError::ValueMismatch, "unstaked value differs from the staked value");

    ContractError err = require_root(
        db, target, consensus_contract_id(), CONSENSUS_COIN_TREE,
        input.merkle_root, ContractError::MerkleRootNotFound);
    if (err != ContractError::Ok) return err;

    err = require_absent(
        db, target, consensus_contract_id(), CONSENSUS_NULLIFIERS_TABLE,
        input.nullifier, ContractError::DuplicateNullifier);
    if (err != ContractError::Ok) return err;

    const ContractCall* prev = call_idx == 0 ? nullptr : call_at(calls, call_idx - 1);
    if (prev == nullptr)
        return reject(target, ContractError::SpendHookOutOfBounds, "unstake without a previous call");
    if (prev->contract_id != consensus_contract_id())
        return reject(target, ContractError::PreviousCallContractMismatch, "previous call is not consensus");
    if (prev->function != static_cast<uint8_t>(ConsensusFunction::UnstakeV1))
        return reject(target, ContractError::PreviousCallFunctionMismatch, "previous call is not Consensus::UnstakeV1");

    auto prev_params = decode_params<ConsensusUnstakeParams>(*prev);
    if (prev_params.is_err()) return prev_params.unwrap_err();
    if (!(prev_params.unwrap().input == input))
        return reject(target, ContractError::PreviousCallInputMismatch, "previous call burns a different input");

    if (input.spend_hook != consensus_contract_id())
        return reject(target, ContractError::SpendHookMismatch, "staked coin is not hooked to consensus");

    err = check_spend_hook(calls, call_idx, params.spend_hook, target);
    if (err != ContractError::Ok) return err;

    err = require_absent(
        db, target, money_contract_id(), MONEY_COINS_TABLE,
        output.coin, ContractError::DuplicateCoin);
    if (err != ContractError::Ok) return err;

    return encode_update(fn_byte(MoneyFunction::UnstakeV1), MoneyUnstakeUpdate{output.coin});
}

Result<Bytes, ContractError> MoneyContract::process_instruction(
    const std::vector<ContractCall> &calls,
    size_t call_idx,
    const StoreView &db
) const {
    const ContractCall* call = call_at(calls, call_idx);
    if (call == nullptr) return ContractError::CallIdxOutOfBounds;

    auto func = money_function_from_byte(call->function);
    if (!func.has_value()) return ContractError::InvalidFunction;

    switch (func.value()) {
        case MoneyFunction::TransferV1: return transfer_instruction(*call, calls, call_idx, db);
        case MoneyFunction::OtcSwapV1:  return otc_swap_instruction(*call, calls, call_idx, db);
        case MoneyFunction::MintV1:     return mint_instruction(*call, db);
        case MoneyFunction::FreezeV1:   return freeze_instruction(*call, db);
        case MoneyFunction::StakeV1:    return stake_instruction(*call, calls, call_idx, db);
        case MoneyFunction::UnstakeV1:  return unstake_instruction(*call, calls, call_idx, db);
    }
    return ContractError::InvalidFunction;
}

// ----------------------- UPDATES ------------------------

static ContractError add_coins(StoreWriter &db, const char* target, const std::vector<Fr> &coins) {
    for (auto &coin : coins) {
        ContractError err = unique_insert(
            db, target, money_contract_id(), MONEY_COINS_TABLE,
            scalar_key(coin), ByteSlice(), ContractError::DuplicateCoin);
        if (err != ContractError::Ok) return err;
    }
    int rc = db.merkle_append(money_contract_id(), MONEY_INFO_TABLE, MONEY_COIN_TREE, coins);
    if (rc != OK) return store_failure(target, rc);
    return ContractError::Ok;
}

static ContractError add_nullifier(StoreWriter &db, const char* target, const Fr &nullifier) {
    return unique_insert(
        db, target, money_contract_id(), MONEY_NULLIFIERS_TABLE,
        scalar_key(nullifier), ByteSlice(), ContractError::DuplicateNullifier);
}

static ContractError transfer_update(StoreWriter &db, const ByteSlice &body) {
    const char* target = "Money::TransferV1";
    auto update = from_bytes<MoneyTransferUpdate>(body);
    if (!update.has_value()) return ContractError::DecodeFailed;

    for (auto &nullifier : update->nullifiers) {
        ContractError err = add_nullifier(db, target, nullifier);
        if (err != ContractError::Ok) return err;
    }
    return add_coins(db, target, update->coins);
}

static ContractError mint_update(StoreWriter &db, const ByteSlice &body) {
    auto update = from_bytes<MoneyMintUpdate>(body);
    if (!update.has_value()) return ContractError::DecodeFailed;
    return add_coins(db, "Money::MintV1", {update->coin});
}

static ContractError freeze_update(StoreWriter &db, const ByteSlice &body) {
    auto update = from_bytes<MoneyFreezeUpdate>(body);
    if (!update.has_value()) return ContractError::DecodeFailed;
    return unique_insert(
        db, "Money::FreezeV1", money_contract_id(), MONEY_TOKEN_FREEZES_TABLE,
        scalar_key(update->token_id), ByteSlice(), ContractError::TokenAlreadyFrozen);
}

static ContractError stake_update(StoreWriter &db, const ByteSlice &body) {
    auto update = from_bytes<MoneyStakeUpdate>(body);
    if (!update.has_value()) return ContractError::DecodeFailed;
    return add_nullifier(db, "Money::StakeV1", update->nullifier);
}

static ContractError unstake_update(StoreWriter &db, const ByteSlice &body) {
    auto update = from_bytes<MoneyUnstakeUpdate>(body);
    if (!update.has_value()) return ContractError::DecodeFailed;
    return add_coins(db, "Money::UnstakeV1", {update->coin});
}

ContractError MoneyContract::process_update(StoreWriter &db, const ByteSlice &update) const {
    auto split = split_update(update);
    if (!split.has_value()) return ContractError::DecodeFailed;

    auto func = money_function_from_byte(split->first);
    if (!func.has_value()) return ContractError::InvalidFunction;

    switch (func.value()) {
        case MoneyFunction::TransferV1:
        case MoneyFunction::OtcSwapV1: return transfer_update(db, split->second);
        case MoneyFunction::MintV1:    return mint_update(db, split->second);
        case MoneyFunction::FreezeV1:  return freeze_update(db, split->second);
        case MoneyFunction::StakeV1:   return stake_update(db, split->second);
        case MoneyFunction::UnstakeV1: return unstake_update(db, split->second);
    }
    return ContractError::InvalidFunction;
}

// ----------------------- DEPLOY ------------------------

int MoneyContract::deploy(StoreWriter &db) const {
    auto &faucets = db.config().faucet_pubkeys;

    Encoder enc;
    enc.count(faucets.size());
    for (auto &pk : faucets) pk.encode(enc);

    int rc = db.set(id(), MONEY_INFO_TABLE, info_key(MONEY_FAUCET_PUBKEYS), enc.data());
    if (rc != OK) return rc;
    log_debug("Money", "deployed with %zu faucet keys", faucets.size());
    return OK;
}
