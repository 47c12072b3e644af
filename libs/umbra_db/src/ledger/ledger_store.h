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
#include "block.h"
#include "db.h"
#include "ids.h"
#include "merkle.h"
#include <optional>

struct LedgerConfig {
    std::string path;
    size_t map_size = size_t(1) << 30;
    uint64_t genesis_timestamp = 0;
    // keys allowed to sign clear inputs of Money::TransferV1
    std::vector<PublicKey> faucet_pubkeys;
    std::string log_level = "info";
};

/*
 *  Durable ledger state. Global tables for headers, blocks, the slot index,
 *  transactions and merkle root history, plus one namespace per
 *  (contract id, table name) pair inside the contracts table.
 *
 *  Every write happens inside a DbTxn handed out by begin_write(). A failed
 *  commit poisons the store and it refuses all further writes.
 */
class LedgerStore {
private:
    std::unique_ptr<LedgerDB> db_;
    LedgerConfig config_;
    bool poisoned_;

    explicit LedgerStore(std::unique_ptr<LedgerDB> db, LedgerConfig config)
        : db_(std::move(db)), config_(std::move(config)), poisoned_(false) {}

    int insert_genesis();

public:
    static Result<std::unique_ptr<LedgerStore>, int> open(const LedgerConfig &config);

    const LedgerConfig& config() const { return config_; }
    bool poisoned() const { return poisoned_; }

    Result<DbTxn, int> begin_write(DbTxn* parent = nullptr);
    Result<DbTxn, int> begin_read();
    // commits and poisons the store on failure
    int commit(DbTxn &txn);

    // ----------------------- BLOCKS ------------------------

    // Inserts header, body, slot index and transactions of every block.
    // Blocks already known are skipped.
    Result<std::vector<Hash>, int> insert_blocks(DbTxn &txn, const std::vector<BlockInfo> &blocks);
    // same, in its own atomic batch
    Result<std::vector<Hash>, int> insert_blocks(const std::vector<BlockInfo> &blocks);

    Result<bool, int> has_block(DbTxn &txn, const Hash &hash);
    Result<bool, int> has_block(const Hash &hash);

    // fails with BLOCK_NOT_EXIST if any hash is unknown
    Result<std::vector<BlockInfo>, int> get_blocks_by_hash(const std::vector<Hash> &hashes);
    // unknown slots are skipped
    Result<std::vector<BlockInfo>, int> get_blocks_by_slot(const std::vector<uint64_t> &slots);
    // up to n blocks with slot strictly greater than slot
    Result<std::vector<BlockInfo>, int> get_blocks_after(uint64_t slot, size_t n);
    // highest slot and its block hash
    Result<std::pair<uint64_t, Hash>, int> last();
    Result<std::pair<uint64_t, Hash>, int> last(DbTxn &txn);

    Result<std::vector<Transaction>, int> get_transactions_by_hash(const std::vector<Hash> &hashes);

    // ----------------------- CONTRACT TABLES ------------------------

    Result<bool, int> contains_key(
        DbTxn &txn, const ContractId &cid, const std::string &table, const ByteSlice &key);
    Result<std::optional<Bytes>, int> get(
        DbTxn &txn, const ContractId &cid, const std::string &table, const ByteSlice &key);
    int set(
        DbTxn &txn, const ContractId &cid, const std::string &table,
        const ByteSlice &key, const ByteSlice &value);
    // ALREADY_EXISTS when the key is present
    int insert_unique(
        DbTxn &txn, const ContractId &cid, const std::string &table,
        const ByteSlice &key, const ByteSlice &value);

    // Appends leaves to the tree whose frontier is stored under
    // (cid, info_table, tree) and records the new root once.
    int merkle_append(
        DbTxn &txn, const ContractId &cid, const std::string &info_table,
        const std::string &tree, const std::vector<Fr> &leaves);
    Result<bool, int> has_merkle_root(
        DbTxn &txn, const ContractId &cid, const std::string &tree, const Fr &root);
};

// Read only state handed to process_instruction.
class StoreView {
protected:
    LedgerStore &store_;
    DbTxn &txn_;

public:
    StoreView(LedgerStore &store, DbTxn &txn) : store_(store), txn_(txn) {}

    Result<bool, int> contains_key(
        const ContractId &cid, const std::string &table, const ByteSlice &key) const {
        return store_.contains_key(txn_, cid, table, key);
    }
    Result<std::optional<Bytes>, int> get(
        const ContractId &cid, const std::string &table, const ByteSlice &key) const {
        return store_.get(txn_, cid, table, key);
    }
    Result<bool, int> has_merkle_root(
        const ContractId &cid, const std::string &tree, const Fr &root) const {
        return store_.has_merkle_root(txn_, cid, tree, root);
    }
    const LedgerConfig& config() const { return store_.config(); }
};

// Write access handed to process_update and contract deployment.
class StoreWriter : public StoreView {
public:
    StoreWriter(LedgerStore &store, DbTxn &txn) : StoreView(store, txn) {}

    int set(const ContractId &cid, const std::string &table,
            const ByteSlice &key, const ByteSlice &value) {
        return store_.set(txn_, cid, table, key, value);
    }
    int insert_unique(const ContractId &cid, const std::string &table,
                      const ByteSlice &key, const ByteSlice &value) {
        return store_.insert_unique(txn_, cid, table, key, value);
    }
    int merkle_append(const ContractId &cid, const std::string &info_table,
                      const std::string &tree, const std::vector<Fr> &leaves) {
        return store_.merkle_append(txn_, cid, info_table, tree, leaves);
    }
};

Bytes scalar_key(const Fr &s);
