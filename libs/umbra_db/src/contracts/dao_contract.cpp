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


#include "dao_contract.h"
#include "circuits.h"
#include "commit.h"
#include "money_contract.h"
#include <set>

const std::string DAO_INFO_TABLE = "dao_info";
const std::string DAO_BULLAS_TABLE = "dao_bullas";
const std::string DAO_PROPOSALS_TABLE = "proposals";
const std::string DAO_VOTE_NULLIFIERS_TABLE = "vote_nullifiers";

const std::string DAO_TREE = "dao_tree";

static uint8_t fn_byte(DaoFunction f) {
    return static_cast<uint8_t>(f);
}

Bytes vote_nullifier_key(const Fr &proposal_bulla, const Fr &nullifier) {
    Bytes key = scalar_key(proposal_bulla);
    Bytes n = scalar_key(nullifier);
    key.insert(key.end(), n.begin(), n.end());
    return key;
}

Result<std::optional<ProposalRecord>, int> load_proposal(
    const StoreView &db,
    const Fr &proposal_bulla
) {
    auto stored = db.get(dao_contract_id(), DAO_PROPOSALS_TABLE, scalar_key(proposal_bulla));
    if (stored.is_err()) return stored.unwrap_err();
    if (!stored.unwrap().has_value()) return std::optional<ProposalRecord>();

    auto record = from_bytes<ProposalRecord>(stored.unwrap().value());
    if (!record.has_value()) return static_cast<int>(DECODE_ERR);
    return record;
}

// open proposal or the reason it can't take votes or execution
static ContractError require_open_proposal(
    const StoreView &db,
    const char* target,
    const Fr &proposal_bulla,
    ProposalRecord &out
) {
    auto loaded = load_proposal(db, proposal_bulla);
    if (loaded.is_err()) return store_failure(target, loaded.unwrap_err());
    if (!loaded.unwrap().has_value())
        return reject(target, ContractError::ProposalNotFound, "unknown proposal");
    out = loaded.unwrap().value();
    if (out.executed)
        return reject(target, ContractError::ProposalExecuted, "proposal already executed");
    return ContractError::Ok;
}

// ----------------------- METADATA ------------------------

Result<CallMetadata, ContractError> DaoContract::get_metadata(
    const std::vector<ContractCall> &calls,
    size_t call_idx
) const {
    const ContractCall* call = call_at(calls, call_idx);
    if (call == nullptr) return ContractError::CallIdxOutOfBounds;

    auto func = dao_function_from_byte(call->function);
    if (!func.has_value()) return ContractError::InvalidFunction;

    CallMetadata meta;
    switch (func.value()) {
        case DaoFunction::MintV1: {
            auto params = decode_params<DaoMintParams>(*call);
            if (params.is_err()) return params.unwrap_err();
            meta.zk_public_inputs.emplace_back(DAO_MINT_CIRCUIT, dao_mint_public_inputs(params.unwrap()));
            meta.signature_pubkeys.push_back(params.unwrap().dao_pubkey);
            return meta;
        }
        case DaoFunction::ProposeV1: {
            auto params = decode_params<DaoProposeParams>(*call);
            if (params.is_err()) return params.unwrap_err();
            auto &p = params.unwrap();
            for (auto &input : p.inputs) {
                meta.zk_public_inputs.emplace_back(
                    DAO_PROPOSE_BURN_CIRCUIT, propose_burn_public_inputs(input, p.token_commit));
                meta.signature_pubkeys.push_back(input.signature_public);
            }
            meta.zk_public_inputs.emplace_back(DAO_PROPOSE_MAIN_CIRCUIT, propose_main_public_inputs(p));
            return meta;
        }
        case DaoFunction::VoteV1: {
            auto params = decode_params<DaoVoteParams>(*call);
            if (params.is_err()) return params.unwrap_err();
            auto &p = params.unwrap();
            for (auto &input : p.inputs) {
                meta.zk_public_inputs.emplace_back(
                    DAO_VOTE_BURN_CIRCUIT, vote_burn_public_inputs(input, p.token_commit));
                meta.signature_pubkeys.push_back(input.signature_public);
            }
            meta.zk_public_inputs.emplace_back(DAO_VOTE_MAIN_CIRCUIT, vote_main_public_inputs(p));
            return meta;
        }
        case DaoFunction::ExecV1: {
            auto params = decode_params<DaoExecParams>(*call);
            if (params.is_err()) return params.unwrap_err();
            meta.zk_public_inputs.emplace_back(
                DAO_EXEC_CIRCUIT, exec_public_inputs(params.unwrap(), dao_contract_id()));
            return meta;
        }
    }
    return ContractError::InvalidFunction;
}

// ----------------------- INSTRUCTIONS ------------------------

static Result<Bytes, ContractError> mint_instruction(const ContractCall &call) {
    auto decoded = decode_params<DaoMintParams>(call);
    if (decoded.is_err()) return decoded.unwrap_err();
    return encode_update(fn_byte(DaoFunction::MintV1), DaoMintUpdate{decoded.unwrap().dao_bulla});
}

static Result<Bytes, ContractError> propose_instruction(const ContractCall &call, const StoreView &db) {
    const char* target = "Dao::ProposeV1";
    auto decoded = decode_params<DaoProposeParams>(call);
    if (decoded.is_err()) return decoded.unwrap_err();
    auto &params = decoded.unwrap();

    if (params.inputs.empty())
        return reject(target, ContractError::MissingInputs, "proposal backed by no coins");

    for (auto &input : params.inputs) {
        ContractError err = require_root(
            db, target, money_contract_id(), MONEY_COIN_TREE,
            input.merkle_root, ContractError::MerkleRootNotFound);
        if (err != ContractError::Ok) return err;
    }

    ContractError err = require_root(
        db, target, dao_contract_id(), DAO_TREE,
        params.dao_merkle_root, ContractError::DaoMerkleRootNotFound);
    if (err != ContractError::Ok) return err;

    err = require_absent(
        db, target, dao_contract_id(), DAO_PROPOSALS_TABLE,
        params.proposal_bulla, ContractError::ProposalExists);
    if (err != ContractError::Ok) return err;

    return encode_update(fn_byte(DaoFunction::ProposeV1), DaoProposeUpdate{params.proposal_bulla});
}

static Result<Bytes, ContractError> vote_instruction(const ContractCall &call, const StoreView &db) {
    const char* target = "Dao::VoteV1";
    auto decoded = decode_params<DaoVoteParams>(call);
    if (decoded.is_err()) return decoded.unwrap_err();
    auto &params = decoded.unwrap();

    if (params.inputs.empty())
        return reject(target, ContractError::MissingInputs, "vote backed by no coins");

    ProposalRecord record;
    ContractError err = require_open_proposal(db, target, params.proposal_bulla, record);
    if (err != ContractError::Ok) return err;

    DaoVoteUpdate update;
    update.proposal_bulla = params.proposal_bulla;
    update.yes_vote_commit = params.yes_vote_commit;

    std::set<Hash> seen;
    std::vector<EcPoint> commits;
    for (auto &input : params.inputs) {
        err = require_root(
            db, target, money_contract_id(), MONEY_COIN_TREE,
            input.merkle_root, ContractError::MerkleRootNotFound);
        if (err != ContractError::Ok) return err;

        // voting does not spend the coin, but a spent coin can't vote
        err = require_absent(
            db, target, money_contract_id(), MONEY_NULLIFIERS_TABLE,
            input.nullifier, ContractError::CoinAlreadySpent);
        if (err != ContractError::Ok) return err;

        auto used = db.contains_key(
            dao_contract_id(), DAO_VOTE_NULLIFIERS_TABLE,
            vote_nullifier_key(params.proposal_bulla, input.nullifier));
        if (used.is_err()) return store_failure(target, used.unwrap_err());
        if (used.unwrap() || !seen.insert(scalar_id(input.nullifier)).second)
            return reject(target, ContractError::DoubleVote, "coin already voted on this proposal");

        update.vote_nullifiers.push_back(input.nullifier);
        commits.push_back(input.vote_commit);
    }
    update.all_vote_commit = sum_commitments(commits);

    return encode_update(fn_byte(DaoFunction::VoteV1), update);
}

/*
 *  Exec authorizes the Money::TransferV1 right before it. That transfer must
 *  pay the proposal amount to the recipient (coin_0) and return the change
 *  to the treasury (coin_1), spending exactly the inputs the proof talks about.
 */
static Result<Bytes, ContractError> exec_instruction(
    const ContractCall &call,
    const std::vector<ContractCall> &calls,
    size_t call_idx,
    const StoreView &db
) {
    const char* target = "Dao::ExecV1";
    auto decoded = decode_params<DaoExecParams>(call);
    if (decoded.is_err()) return decoded.unwrap_err();
    auto &params = decoded.unwrap();

    const ContractCall* prev = call_idx == 0 ? nullptr : call_at(calls, call_idx - 1);
    if (prev == nullptr)
        return reject(target, ContractError::CallIdxOutOfBounds, "exec without a transfer before it");
    if (prev->contract_id != money_contract_id())
        return reject(target, ContractError::PreviousCallContractMismatch, "previous call is not money");
    if (prev->function != static_cast<uint8_t>(MoneyFunction::TransferV1))
        return reject(target, ContractError::PreviousCallFunctionMismatch, "previous call is not Money::TransferV1");

    auto transfer = decode_params<MoneyTransferParams>(*prev);
    if (transfer.is_err()) return transfer.unwrap_err();
    auto &xfer = transfer.unwrap();

    if (!xfer.clear_inputs.empty() || xfer.outputs.size() != 2)
        return reject(target, ContractError::ExecOutputMismatch, "transfer must have two outputs and no clear inputs");
    if (xfer.outputs[0].coin != params.coin_0 || xfer.outputs[1].coin != params.coin_1)
        return reject(target, ContractError::ExecOutputMismatch, "transfer outputs are not the proposal coins");

    std::vector<EcPoint> commits;
    for (auto &input : xfer.inputs) commits.push_back(input.value_commit);
    if (sum_commitments(commits) != params.input_value_commit)
        return reject(target, ContractError::ExecInputValueMismatch, "transfer inputs do not sum to the exec input");

    ProposalRecord record;
    ContractError err = require_open_proposal(db, target, params.proposal_bulla, record);
    if (err != ContractError::Ok) return err;

    if (record.yes_vote_commit != params.yes_vote_commit ||
        record.all_vote_commit != params.all_vote_commit)
        return reject(target, ContractError::VoteCommitMismatch, "tallies differ from the stored votes");

    return encode_update(fn_byte(DaoFunction::ExecV1), DaoExecUpdate{params.proposal_bulla});
}

Result<Bytes, ContractError> DaoContract::process_instruction(
    const std::vector<ContractCall> &calls,
    size_t call_idx,
    const StoreView &db
) const {
    const ContractCall* call = call_at(calls, call_idx);
    if (call == nullptr) return ContractError::CallIdxOutOfBounds;

    auto func = dao_function_from_byte(call->function);
    if (!func.has_value()) return ContractError::InvalidFunction;

    switch (func.value()) {
        case DaoFunction::MintV1:    return mint_instruction(*call);
        case DaoFunction::ProposeV1: return propose_instruction(*call, db);
        case DaoFunction::VoteV1:    return vote_instruction(*call, db);
        case DaoFunction::ExecV1:    return exec_instruction(*call, calls, call_idx, db);
    }
    return ContractError::InvalidFunction;
}

// ----------------------- UPDATES ------------------------

static ContractError store_proposal(
    StoreWriter &db,
    const char* target,
    const Fr &proposal_bulla,
    const ProposalRecord &record
) {
    int rc = db.set(dao_contract_id(), DAO_PROPOSALS_TABLE, scalar_key(proposal_bulla), to_bytes(record));
    if (rc != OK) return store_failure(target, rc);
    return ContractError::Ok;
}

static ContractError mint_update(StoreWriter &db, const ByteSlice &body) {
    const char* target = "Dao::MintV1";
    auto update = from_bytes<DaoMintUpdate>(body);
    if (!update.has_value()) return ContractError::DecodeFailed;

    int rc = db.set(dao_contract_id(), DAO_BULLAS_TABLE, scalar_key(update->dao_bulla), ByteSlice());
    if (rc != OK) return store_failure(target, rc);
    rc = db.merkle_append(dao_contract_id(), DAO_INFO_TABLE, DAO_TREE, {update->dao_bulla});
    if (rc != OK) return store_failure(target, rc);
    return ContractError::Ok;
}

static ContractError propose_update(StoreWriter &db, const ByteSlice &body) {
    auto update = from_bytes<DaoProposeUpdate>(body);
    if (!update.has_value()) return ContractError::DecodeFailed;

    EcPoint identity = jub_identity();
    ProposalRecord record{identity, identity, false};
    return unique_insert(
        db, "Dao::ProposeV1", dao_contract_id(), DAO_PROPOSALS_TABLE,
        scalar_key(update->proposal_bulla), to_bytes(record), ContractError::ProposalExists);
}

static ContractError vote_update(StoreWriter &db, const ByteSlice &body) {
    const char* target = "Dao::VoteV1";
    auto update = from_bytes<DaoVoteUpdate>(body);
    if (!update.has_value()) return ContractError::DecodeFailed;

    auto loaded = load_proposal(db, update->proposal_bulla);
    if (loaded.is_err()) return store_failure(target, loaded.unwrap_err());
    if (!loaded.unwrap().has_value()) return ContractError::ProposalNotFound;
    ProposalRecord record = loaded.unwrap().value();

    for (auto &nullifier : update->vote_nullifiers) {
        ContractError err = unique_insert(
            db, target, dao_contract_id(), DAO_VOTE_NULLIFIERS_TABLE,
            vote_nullifier_key(update->proposal_bulla, nullifier), ByteSlice(),
            ContractError::DoubleVote);
        if (err != ContractError::Ok) return err;
    }

    record.yes_vote_commit = jub_add(record.yes_vote_commit, update->yes_vote_commit);
    record.all_vote_commit = jub_add(record.all_vote_commit, update->all_vote_commit);
    return store_proposal(db, target, update->proposal_bulla, record);
}

static ContractError exec_update(StoreWriter &db, const ByteSlice &body) {
    const char* target = "Dao::ExecV1";
    auto update = from_bytes<DaoExecUpdate>(body);
    if (!update.has_value()) return ContractError::DecodeFailed;

    auto loaded = load_proposal(db, update->proposal_bulla);
    if (loaded.is_err()) return store_failure(target, loaded.unwrap_err());
    if (!loaded.unwrap().has_value()) return ContractError::ProposalNotFound;
    ProposalRecord record = loaded.unwrap().value();
    if (record.executed) return ContractError::ProposalExecuted;

    record.executed = true;
    return store_proposal(db, target, update->proposal_bulla, record);
}

ContractError DaoContract::process_update(StoreWriter &db, const ByteSlice &update) const {
    auto split = split_update(update);
    if (!split.has_value()) return ContractError::DecodeFailed;

    auto func = dao_function_from_byte(split->first);
    if (!func.has_value()) return ContractError::InvalidFunction;

    switch (func.value()) {
        case DaoFunction::MintV1:    return mint_update(db, split->second);
        case DaoFunction::ProposeV1: return propose_update(db, split->second);
        case DaoFunction::VoteV1:    return vote_update(db, split->second);
        case DaoFunction::ExecV1:    return exec_update(db, split->second);
    }
    return ContractError::InvalidFunction;
}

int DaoContract::deploy(StoreWriter &) const {
    log_debug("Dao", "deployed");
    return OK;
}
