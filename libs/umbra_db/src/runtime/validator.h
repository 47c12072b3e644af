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
#include "arena.h"
#include "block.h"
#include "contract.h"
#include <memory>

enum class ErrorKind {
    Decode,
    Validation,
    Crypto,
    Store,
};

const char* error_kind_str(ErrorKind kind);

// Why a transaction was rejected, and at which call.
struct TxError {
    ErrorKind kind;
    ContractError code;
    size_t call_idx;
    // LedgerCodes or LMDB code, only meaningful for ErrorKind::Store
    int store_rc;
};

struct BlockError {
    int code;
    size_t block_idx;
    // set when code is INVALID_TX
    size_t tx_idx;
    std::optional<TxError> tx;
};

/*
 *  Runs transactions through the three call phases against a LedgerStore.
 *
 *  Per transaction, in its own child LMDB transaction:
 *    1. get_metadata for every call, staged in an ObjectArena
 *    2. every proof and signature, one async task per call
 *    3. process_instruction for every call, against the state as the
 *       transaction found it
 *    4. process_update for every call, in order
 *  Any failure aborts the child and nothing of the transaction remains.
 *
 *  The ZkSetup must outlive the validator.
 */
class Validator {
private:
    LedgerStore &store_;
    const ZkSetup &zk_;
    std::vector<std::unique_ptr<Contract>> contracts_;

    Validator(LedgerStore &store, const ZkSetup &zk);

    std::optional<TxError> verify_crypto(
        const Transaction &tx,
        const ObjectArena &arena,
        const std::vector<ArenaHandle> &meta_handles
    ) const;

public:
    // deploys the built-in contracts into the store
    static Result<std::unique_ptr<Validator>, int> create(LedgerStore &store, const ZkSetup &zk);

    // nullptr for ids no contract is deployed under
    const Contract* contract(const ContractId &cid) const;

    // Validates tx and applies it inside a child of parent.
    std::optional<TxError> apply_transaction(DbTxn &parent, const Transaction &tx);

    // Outcome per transaction, in order. Valid transactions see the effects
    // of the valid ones before them. Nothing is committed unless write is set.
    std::vector<std::optional<TxError>> verify_transactions(const std::vector<Transaction> &txs, bool write);
    std::vector<std::optional<TxError>> verify_raw_transactions(const std::vector<Bytes> &txs, bool write);

    // Appends blocks on top of last() in one atomic batch. Every transaction
    // of every new block must be valid. Known blocks are skipped.
    Result<std::vector<Hash>, BlockError> add_blocks(const std::vector<BlockInfo> &blocks);
};
