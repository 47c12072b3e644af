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
#include "ledger_store.h"
#include "log.h"
#include "tx.h"

enum class ContractError : int {
    Ok = 0,

    // decode
    DecodeFailed,
    InvalidFunction,
    UnknownContract,
    ProofCountMismatch,
    SignatureCountMismatch,

    // call list shape
    CallIdxOutOfBounds,
    MissingInputs,
    MissingOutputs,
    SpendHookMismatch,
    SpendHookOutOfBounds,
    PreviousCallContractMismatch,
    PreviousCallFunctionMismatch,
    PreviousCallInputMismatch,
    NextCallContractMismatch,
    NextCallFunctionMismatch,
    NextCallInputMismatch,

    // money
    DuplicateNullifier,
    DuplicateCoin,
    ValueMismatch,
    TokenMismatch,
    MerkleRootNotFound,
    NonNativeToken,
    ClearInputUnauthorised,
    TokenIdDerivationMismatch,
    TokenFrozen,
    TokenAlreadyFrozen,
    InvalidOtcSwap,

    // dao
    DaoMerkleRootNotFound,
    ProposalExists,
    ProposalNotFound,
    ProposalExecuted,
    CoinAlreadySpent,
    DoubleVote,
    VoteCommitMismatch,
    ExecOutputMismatch,
    ExecInputValueMismatch,

    // crypto
    MissingVerifyingKey,
    ProofVerifyFailed,
    SignatureVerifyFailed,

    StoreFailure,
};

const char* contract_error_str(ContractError err);

/*
 *  A contract runs every call in three phases, always in this order:
 *
 *    get_metadata          call data only. Proofs and signatures to check.
 *    process_instruction   read only state plus sibling calls. Returns an
 *                          update payload, the function byte first.
 *    process_update        applies a payload produced by this contract.
 *
 *  Sibling calls are reached through call_at(), never by raw indexing.
 */
class Contract {
public:
    virtual ~Contract() = default;

    virtual const ContractId& id() const = 0;
    virtual const char* name() const = 0;

    // creates the contract's info tables on a fresh store
    virtual int deploy(StoreWriter &db) const = 0;

    virtual Result<CallMetadata, ContractError> get_metadata(
        const std::vector<ContractCall> &calls,
        size_t call_idx
    ) const = 0;

    virtual Result<Bytes, ContractError> process_instruction(
        const std::vector<ContractCall> &calls,
        size_t call_idx,
        const StoreView &db
    ) const = 0;

    virtual ContractError process_update(StoreWriter &db, const ByteSlice &update) const = 0;
};

// ----------------------- HELPERS ------------------------

// nullptr when idx is outside the call list
inline const ContractCall* call_at(const std::vector<ContractCall> &calls, size_t idx) {
    return idx < calls.size() ? &calls[idx] : nullptr;
}

template <typename T>
Result<T, ContractError> decode_params(const ContractCall &call) {
    auto params = from_bytes<T>(call.params);
    if (!params.has_value()) return ContractError::DecodeFailed;
    return std::move(params.value());
}

template <typename T>
Bytes encode_update(uint8_t function, const T &update) {
    Encoder enc;
    enc.u8(function);
    update.encode(enc);
    return enc.take();
}

// splits an update payload into its function byte and body
inline std::optional<std::pair<uint8_t, ByteSlice>> split_update(const ByteSlice &update) {
    if (update.empty()) return std::nullopt;
    return std::make_pair(update[0], update.subspan(1));
}

// scalar bytes as an ordered key, for duplicate checks inside one call
inline Hash scalar_id(const Fr &s) {
    bytes32 le = fr_to_bytes(s);
    Hash h;
    std::memcpy(h.data(), le.data(), h.size());
    return h;
}

inline ContractError reject(const char* target, ContractError err, const char* why) {
    log_info(target, "rejected: %s (%s)", why, contract_error_str(err));
    return err;
}

inline ContractError store_failure(const char* target, int rc) {
    log_error(target, "store error %d", rc);
    return ContractError::StoreFailure;
}

// MerkleRootNotFound style error unless root is in the tree's history
ContractError require_root(
    const StoreView &db, const char* target,
    const ContractId &cid, const std::string &tree,
    const Fr &root, ContractError missing
);

// err when key is already in the table
ContractError require_absent(
    const StoreView &db, const char* target,
    const ContractId &cid, const std::string &table,
    const Fr &key, ContractError err
);

// maps an insert_unique result onto err for a duplicate key
ContractError unique_insert(
    StoreWriter &db, const char* target,
    const ContractId &cid, const std::string &table,
    const ByteSlice &key, const ByteSlice &value, ContractError duplicate
);
