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


#include "contract.h"

const char* contract_error_str(ContractError err) {
    switch (err) {
        case ContractError::Ok:                           return "ok";
        case ContractError::DecodeFailed:                 return "decode failed";
        case ContractError::InvalidFunction:              return "invalid function";
        case ContractError::UnknownContract:              return "unknown contract";
        case ContractError::ProofCountMismatch:           return "proof count mismatch";
        case ContractError::SignatureCountMismatch:       return "signature count mismatch";
        case ContractError::CallIdxOutOfBounds:           return "call index out of bounds";
        case ContractError::MissingInputs:                return "missing inputs";
        case ContractError::MissingOutputs:               return "missing outputs";
        case ContractError::SpendHookMismatch:            return "spend hook mismatch";
        case ContractError::SpendHookOutOfBounds:         return "spend hook out of bounds";
        case ContractError::PreviousCallContractMismatch: return "previous call contract mismatch";
        case ContractError::PreviousCallFunctionMismatch: return "previous call function mismatch";
        case ContractError::PreviousCallInputMismatch:    return "previous call input mismatch";
        case ContractError::NextCallContractMismatch:     return "next call contract mismatch";
        case ContractError::NextCallFunctionMismatch:     return "next call function mismatch";
        case ContractError::NextCallInputMismatch:        return "next call input mismatch";
        case ContractError::DuplicateNullifier:           return "duplicate nullifier";
        case ContractError::DuplicateCoin:                return "duplicate coin";
        case ContractError::ValueMismatch:                return "value mismatch";
        case ContractError::TokenMismatch:                return "token mismatch";
        case ContractError::MerkleRootNotFound:           return "merkle root not found";
        case ContractError::NonNativeToken:               return "non native token";
        case ContractError::ClearInputUnauthorised:       return "clear input unauthorised";
        case ContractError::TokenIdDerivationMismatch:    return "token id derivation mismatch";
        case ContractError::TokenFrozen:                  return "token frozen";
        case ContractError::TokenAlreadyFrozen:           return "token already frozen";
        case ContractError::InvalidOtcSwap:               return "invalid otc swap";
        case ContractError::DaoMerkleRootNotFound:        return "dao merkle root not found";
        case ContractError::ProposalExists:               return "proposal exists";
        case ContractError::ProposalNotFound:             return "proposal not found";
        case ContractError::ProposalExecuted:             return "proposal executed";
        case ContractError::CoinAlreadySpent:             return "coin already spent";
        case ContractError::DoubleVote:                   return "double vote";
        case ContractError::VoteCommitMismatch:           return "vote commit mismatch";
        case ContractError::ExecOutputMismatch:           return "exec output mismatch";
        case ContractError::ExecInputValueMismatch:       return "exec input value mismatch";
        case ContractError::MissingVerifyingKey:          return "missing verifying key";
        case ContractError::ProofVerifyFailed:            return "proof verify failed";
        case ContractError::SignatureVerifyFailed:        return "signature verify failed";
        case ContractError::StoreFailure:                 return "store failure";
    }
    return "unknown";
}

ContractError require_root(
    const StoreView &db,
    const char* target,
    const ContractId &cid,
    const std::string &tree,
    const Fr &root,
    ContractError missing
) {
    auto r = db.has_merkle_root(cid, tree, root);
    if (r.is_err()) return store_failure(target, r.unwrap_err());
    if (!r.unwrap()) return reject(target, missing, "merkle root not in history");
    return ContractError::Ok;
}

ContractError require_absent(
    const StoreView &db,
    const char* target,
    const ContractId &cid,
    const std::string &table,
    const Fr &key,
    ContractError err
) {
    auto r = db.contains_key(cid, table, scalar_key(key));
    if (r.is_err()) return store_failure(target, r.unwrap_err());
    if (r.unwrap()) return reject(target, err, table.c_str());
    return ContractError::Ok;
}

ContractError unique_insert(
    StoreWriter &db,
    const char* target,
    const ContractId &cid,
    const std::string &table,
    const ByteSlice &key,
    const ByteSlice &value,
    ContractError duplicate
) {
    int rc = db.insert_unique(cid, table, key, value);
    if (rc == ALREADY_EXISTS) return reject(target, duplicate, table.c_str());
    if (rc != OK) return store_failure(target, rc);
    return ContractError::Ok;
}
