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
#include "hashing.h"
#include "result.h"
#include <array>
#include <functional>
#include <lmdb.h>
#include <memory>
#include <string>

enum LedgerCodes {
    OK = 0,
    EXISTS = 0,

    NOT_EXIST = 1,
    DB_ERR = 2,
    ALREADY_EXISTS = 3,
    POISONED = 4,
    DECODE_ERR = 5,
    BLOCK_NOT_EXIST = 6,
    SLOT_ORDER = 7,
    MERKLE_FULL = 8,
    TXN_INACTIVE = 9,

    // block validation
    INVALID_TX = 10,
    PREVIOUS_MISMATCH = 11,
    TX_ROOT_MISMATCH = 12,
};

enum class Table : size_t {
    Headers = 0,
    Blocks,
    Order,
    Transactions,
    MerkleRoots,
    Contracts,
};
constexpr size_t TABLE_COUNT = 6;

const char* table_name(Table t);

/*
 *  Scoped LMDB transaction. Aborted on destruction unless commit() ran,
 *  so every early return rolls back. A child transaction (parent != null)
 *  folds into its parent on commit and leaves the parent untouched on abort.
 */
class DbTxn {
private:
    MDB_txn* txn_;
    bool done_;

public:
    explicit DbTxn(MDB_txn* txn) : txn_(txn), done_(false) {}
    ~DbTxn() { abort(); }

    DbTxn(const DbTxn&) = delete;
    DbTxn& operator=(const DbTxn&) = delete;
    DbTxn(DbTxn &&o) noexcept : txn_(o.txn_), done_(o.done_) {
        o.txn_ = nullptr;
        o.done_ = true;
    }

    int commit();
    void abort();
    bool active() const { return !done_ && txn_ != nullptr; }
    MDB_txn* raw() const { return txn_; }
};

class LedgerDB {
private:
    MDB_env* env_;
    std::array<MDB_dbi, TABLE_COUNT> dbis_;

    LedgerDB() : env_(nullptr), dbis_{} {}
    MDB_dbi dbi(Table t) const { return dbis_[static_cast<size_t>(t)]; }

public:
    ~LedgerDB();
    LedgerDB(const LedgerDB&) = delete;
    LedgerDB& operator=(const LedgerDB&) = delete;

    static Result<std::unique_ptr<LedgerDB>, int> open(const std::string &path, size_t map_size);

    Result<DbTxn, int> begin(DbTxn* parent = nullptr, bool read_only = false);

    int put(DbTxn &txn, Table t, const ByteSlice &key, const ByteSlice &value, unsigned flags = 0);
    // copies the value out, returns MDB_NOTFOUND when absent
    int get(DbTxn &txn, Table t, const ByteSlice &key, Bytes &out);
    int exists(DbTxn &txn, Table t, const ByteSlice &key);

    // visits keys >= start in order until fn returns false
    int scan_from(
        DbTxn &txn,
        Table t,
        const ByteSlice &start,
        const std::function<bool(const ByteSlice&, const ByteSlice&)> &fn
    );
    int last(DbTxn &txn, Table t, Bytes &key, Bytes &value);
};
