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


#include "consensus_contract.h"
#include "circuits.h"
#include "commit.h"
#include "derive.h"

const std::string CONSENSUS_INFO_TABLE = "consensus_info";
const std::string CONSENSUS_COINS_TABLE = "consensus_coins";
const std::string CONSENSUS_NULLIFIERS_TABLE = "consensus_nullifiers";

const std::string CONSENSUS_COIN_TREE = "coin_tree";

static uint8_t fn_byte(ConsensusFunction f) {
    return static_cast<uint8_t>(f);
}

// ----------------------- METADATA ------------------------

static Result<CallMetadata, ContractError> stake_metadata(const ContractCall &call) {
    auto decoded = decode_params<ConsensusStakeParams>(call);
    if (decoded.is_err()) return decoded.unwrap_err();
    auto &params = decoded.unwrap();

    CallMetadata meta;
    meta.zk_public_inputs.emplace_back(MONEY_MINT_CIRCUIT, mint_public_inputs(params.output));
    meta.signature_pubkeys.push_back(params.input.signature_public);
    return meta;
}

static Result<CallMetadata, ContractError> unstake_metadata(const ContractCall &call) {
    auto decoded = decode_params<ConsensusUnstakeParams>(call);
    if (decoded.is_err()) return decoded.unwrap_err();
    auto &params = decoded.unwrap();

    CallMetadata meta;
    meta.zk_public_inputs.emplace_back(MONEY_BURN_CIRCUIT, burn_public_inputs(params.input));
    meta.signature_pubkeys.push_back(params.input.signature_public);
    return meta;
}

static Result<CallMetadata, ContractError> proposal_metadata(const ContractCall &call) {
    auto decoded = decode_params<ConsensusProposalParams>(call);
    if (decoded.is_err()) return decoded.unwrap_err();
    auto &params = decoded.unwrap();

    CallMetadata meta;
    meta.zk_public_inputs.emplace_back(MONEY_BURN_CIRCUIT, burn_public_inputs(params.input));
    meta.zk_public_inputs.emplace_back(MONEY_MINT_CIRCUIT, mint_public_inputs(params.output));
    meta.zk_public_inputs.emplace_back(
        CONSENSUS_REWARD_CIRCUIT,
        reward_public_inputs(params.input.value_commit, params.output.value_commit));
    meta.signature_pubkeys.push_back(params.input.signature_public);
    return meta;
}

Result<CallMetadata, ContractError> ConsensusContract::get_metadata(
    const std::vector<ContractCall> &calls,
    size_t call_idx
) const {
    const ContractCall* call = call_at(calls, call_idx);
    if (call == nullptr) return ContractError::CallIdxOutOfBounds;

    auto func = consensus_function_from_byte(call->function);
    if (!func.has_value()) return ContractError::InvalidFunction;

    switch (func.value()) {
        case ConsensusFunction::StakeV1:    return stake_metadata(*call);
        case ConsensusFunction::ProposalV1: return proposal_metadata(*call);
        case ConsensusFunction::UnstakeV1:  return unstake_metadata(*call);
    }
    return ContractError::InvalidFunction;
}

// ----------------------- INSTRUCTIONS ------------------------

// spending a staked coin: native token, known root, fresh nullifier, hooked to us
static ContractError check_staked_input(
    const StoreView &db,
    const char* target,
    const Input &input,
    const Fr &token_blind
) {
    if (input.token_commit != derive_token_commit(native_token_id(), token_blind))
        return reject(target, ContractError::NonNativeToken, "staked coin is not native");

    ContractError err = require_root(
        db, target, consensus_contract_id(), CONSENSUS_COIN_TREE,
        input.merkle_root, ContractError::MerkleRootNotFound);
    if (err != ContractError::Ok) return err;

    err = require_absent(
        db, target, consensus_contract_id(), CONSENSUS_NULLIFIERS_TABLE,
        input.nullifier, ContractError::DuplicateNullifier);
    if (err != ContractError::Ok) return err;

    if (input.spend_hook != consensus_contract_id())
        return reject(target, ContractError::SpendHookMismatch, "staked coin is not hooked to consensus");
    return ContractError::Ok;
}

static Result<Bytes, ContractError> stake_instruction(
    const ContractCall &call,
    const std::vector<ContractCall> &calls,
    size_t call_idx,
    const StoreView &db
) {
    const char* target = "Consensus::StakeV1";
    auto decoded = decode_params<ConsensusStakeParams>(call);
    if (decoded.is_err()) return decoded.unwrap_err();
    auto &params = decoded.unwrap();

    const ContractCall* prev = call_idx == 0 ? nullptr : call_at(calls, call_idx - 1);
    if (prev == nullptr)
        return reject(target, ContractError::SpendHookOutOfBounds, "stake without a previous money call");
    if (prev->contract_id != money_contract_id())
        return reject(target, ContractError::PreviousCallContractMismatch, "previous call is not money");
    if (prev->function != static_cast<uint8_t>(MoneyFunction::StakeV1))
        return reject(target, ContractError::PreviousCallFunctionMismatch, "previous call is not Money::StakeV1");

    auto prev_params = decode_params<MoneyStakeParams>(*prev);
    if (prev_params.is_err()) return prev_params.unwrap_err();
    auto &prev_input = prev_params.unwrap().input;

    StakeInput expected{
        prev_params.unwrap().token_blind,
        prev_input.value_commit,
        prev_input.nullifier,
        prev_input.merkle_root,
        prev_input.signature_public,
    };
    if (!(params.input == expected))
        return reject(target, ContractError::PreviousCallInputMismatch, "money call burns a different input");

    if (params.output.token_commit != derive_token_commit(native_token_id(), params.input.token_blind))
        return reject(target, ContractError::NonNativeToken, "staked output is not native");
    if (params.output.value_commit != params.input.value_commit)
        return reject(target, ContractError::ValueMismatch, "staked value differs from the burned value");

    ContractError err = require_absent(
        db, target, consensus_contract_id(), CONSENSUS_COINS_TABLE,
        params.output.coin, ContractError::DuplicateCoin);
    if (err != ContractError::Ok) return err;

    return encode_update(fn_byte(ConsensusFunction::StakeV1), ConsensusStakeUpdate{params.output.coin});
}

static Result<Bytes, ContractError> unstake_instruction(
    const ContractCall &call,
    const std::vector<ContractCall> &calls,
    size_t call_idx,
    const StoreView &db
) {
    const char* target = "Consensus::UnstakeV1";
    auto decoded = decode_params<ConsensusUnstakeParams>(call);
    if (decoded.is_err()) return decoded.unwrap_err();
    auto &params = decoded.unwrap();

    ContractError err = check_staked_input(db, target, params.input, params.token_blind);
    if (err != ContractError::Ok) return err;

    const ContractCall* next = call_at(calls, call_idx + 1);
    if (next == nullptr)
        return reject(target, ContractError::SpendHookOutOfBounds, "unstake without a money call");
    if (next->contract_id != money_contract_id())
        return reject(target, ContractError::NextCallContractMismatch, "next call is not money");
    if (next->function != static_cast<uint8_t>(MoneyFunction::UnstakeV1))
        return reject(target, ContractError::NextCallFunctionMismatch, "next call is not Money::UnstakeV1");

    return encode_update(fn_byte(ConsensusFunction::UnstakeV1), ConsensusUnstakeUpdate{params.input.nullifier});
}

// Burns a staked coin and stakes it again carrying the block reward.
static Result<Bytes, ContractError> proposal_instruction(
    const ContractCall &call,
    const std::vector<ContractCall> &calls,
    size_t call_idx,
    const StoreView &db
) {
    const char* target = "Consensus::ProposalV1";
    auto decoded = decode_params<ConsensusProposalParams>(call);
    if (decoded.is_err()) return decoded.unwrap_err();
    auto &params = decoded.unwrap();

    ContractError err = check_staked_input(db, target, params.input, params.token_blind);
    if (err != ContractError::Ok) return err;

    if (params.output.token_commit != derive_token_commit(native_token_id(), params.token_blind))
        return reject(target, ContractError::NonNativeToken, "rewarded output is not native");

    err = require_absent(
        db, target, consensus_contract_id(), CONSENSUS_COINS_TABLE,
        params.output.coin, ContractError::DuplicateCoin);
    if (err != ContractError::Ok) return err;

    ConsensusProposalUpdate update{params.input.nullifier, params.output.coin};
    return encode_update(fn_byte(ConsensusFunction::ProposalV1), update);
}

Result<Bytes, ContractError> ConsensusContract::process_instruction(
    const std::vector<ContractCall> &calls,
    size_t call_idx,
    const StoreView &db
) const {
    const ContractCall* call = call_at(calls, call_idx);
    if (call == nullptr) return ContractError::CallIdxOutOfBounds;

    auto func = consensus_function_from_byte(call->function);
    if (!func.has_value()) return ContractError::InvalidFunction;

    switch (func.value()) {
        case ConsensusFunction::StakeV1:    return stake_instruction(*call, calls, call_idx, db);
        case ConsensusFunction::ProposalV1: return proposal_instruction(*call, calls, call_idx, db);
        case ConsensusFunction::UnstakeV1:  return unstake_instruction(*call, calls, call_idx, db);
    }
    return ContractError::InvalidFunction;
}

// ----------------------- UPDATES ------------------------

static ContractError add_coin(StoreWriter &db, const char* target, const Fr &coin) {
    ContractError err = unique_insert(
        db, target, consensus_contract_id(), CONSENSUS_COINS_TABLE,
        scalar_key(coin), ByteSlice(), ContractError::DuplicateCoin);
    if (err != ContractError::Ok) return err;

    int rc = db.merkle_append(consensus_contract_id(), CONSENSUS_INFO_TABLE, CONSENSUS_COIN_TREE, {coin});
    if (rc != OK) return store_failure(target, rc);
    return ContractError::Ok;
}

static ContractError add_nullifier(StoreWriter &db, const char* target, const Fr &nullifier) {
    return unique_insert(
        db, target, consensus_contract_id(), CONSENSUS_NULLIFIERS_TABLE,
        scalar_key(nullifier), ByteSlice(), ContractError::DuplicateNullifier);
}

ContractError ConsensusContract::process_update(StoreWriter &db, const ByteSlice &update) const {
    auto split = split_update(update);
    if (!split.has_value()) return ContractError::DecodeFailed;

    auto func = consensus_function_from_byte(split->first);
    if (!func.has_value()) return ContractError::InvalidFunction;

    switch (func.value()) {
        case ConsensusFunction::StakeV1: {
            auto u = from_bytes<ConsensusStakeUpdate>(split->second);
            if (!u.has_value()) return ContractError::DecodeFailed;
            return add_coin(db, "Consensus::StakeV1", u->coin);
        }
        case ConsensusFunction::ProposalV1: {
            auto u = from_bytes<ConsensusProposalUpdate>(split->second);
            if (!u.has_value()) return ContractError::DecodeFailed;
            ContractError err = add_nullifier(db, "Consensus::ProposalV1", u->nullifier);
            if (err != ContractError::Ok) return err;
            return add_coin(db, "Consensus::ProposalV1", u->coin);
        }
        case ConsensusFunction::UnstakeV1: {
            auto u = from_bytes<ConsensusUnstakeUpdate>(split->second);
            if (!u.has_value()) return ContractError::DecodeFailed;
            return add_nullifier(db, "Consensus::UnstakeV1", u->nullifier);
        }
    }
    return ContractError::InvalidFunction;
}

int ConsensusContract::deploy(StoreWriter &) const {
    log_debug("Consensus", "deployed");
    return OK;
}
