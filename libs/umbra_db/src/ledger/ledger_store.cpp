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


#include "ledger_store.h"
#include "log.h"
#include <cstdint>
#include <cstring>

// -------------------- KEYS ---------------------------

Bytes scalar_key(const Fr &s) {
    bytes32 le = fr_to_bytes(s);
    return Bytes(le.begin(), le.end());
}

static Bytes namespaced_key(
    const ContractId &cid,
    const std::string &name,
    const ByteSlice &key
) {
    Bytes out = scalar_key(cid);
    out.push_back(static_cast<byte>(name.size()));
    out.insert(out.end(), name.begin(), name.end());
    out.insert(out.end(), key.begin(), key.end());
    return out;
}

// big endian so the cursor walks slots in numeric order
static Bytes slot_key(uint64_t slot) {
    Bytes out(8);
    for (size_t i = 0; i < 8; i++)
        out[i] = static_cast<byte>(slot >> (8 * (7 - i)));
    return out;
}

static uint64_t slot_from_key(const ByteSlice &key) {
    uint64_t slot = 0;
    for (size_t i = 0; i < 8 && i < key.size(); i++)
        slot = (slot << 8) | key[i];
    return slot;
}

static ByteSlice hash_slice(const Hash &h) {
    return ByteSlice(h.data(), h.size());
}

// -------------------- LIFECYCLE ---------------------------

Result<std::unique_ptr<LedgerStore>, int> LedgerStore::open(const LedgerConfig &config) {
    set_log_level(config.log_level);

    auto db = LedgerDB::open(config.path, config.map_size);
    if (db.is_err()) return db.unwrap_err();

    std::unique_ptr<LedgerStore> store(new LedgerStore(db.take(), config));
    int rc = store->insert_genesis();
    if (rc != OK) return rc;

    log_info("ledger", "opened %s", config.path.c_str());
    return std::move(store);
}

int LedgerStore::insert_genesis() {
    auto r = begin_write();
    if (r.is_err()) return r.unwrap_err();
    DbTxn txn = r.take();

    auto tip = last(txn);
    if (tip.is_ok()) return OK;
    if (tip.unwrap_err() != MDB_NOTFOUND) return tip.unwrap_err();

    BlockInfo genesis = genesis_block(config_.genesis_timestamp);
    auto inserted = insert_blocks(txn, {genesis});
    if (inserted.is_err()) return inserted.unwrap_err();

    log_info("ledger", "inserted genesis block %s", hash_to_hex(genesis.hash()).c_str());
    return commit(txn);
}

Result<DbTxn, int> LedgerStore::begin_write(DbTxn* parent) {
    if (poisoned_) return static_cast<int>(POISONED);
    return db_->begin(parent, false);
}

Result<DbTxn, int> LedgerStore::begin_read() {
    return db_->begin(nullptr, true);
}

int LedgerStore::commit(DbTxn &txn) {
    if (poisoned_) {
        txn.abort();
        return POISONED;
    }
    int rc = txn.commit();
    if (rc != 0) {
        poisoned_ = true;
        log_error("ledger", "commit failed, store is now read only: %s", mdb_strerror(rc));
    }
    return rc;
}

// -------------------- BLOCKS ---------------------------

Result<std::vector<Hash>, int> LedgerStore::insert_blocks(
    DbTxn &txn,
    const std::vector<BlockInfo> &blocks
) {
    std::vector<Hash> hashes;
    hashes.reserve(blocks.size());

    for (auto &block : blocks) {
        Hash hash = block.hash();
        hashes.push_back(hash);

        int rc = db_->exists(txn, Table::Headers, hash_slice(hash));
        if (rc == OK) continue;
        if (rc != MDB_NOTFOUND) return rc;

        Bytes header = to_bytes(block.header);
        if ((rc = db_->put(txn, Table::Headers, hash_slice(hash), header)) != 0) return rc;

        Bytes record = to_bytes(block.to_record());
        if ((rc = db_->put(txn, Table::Blocks, hash_slice(hash), record)) != 0) return rc;

        if ((rc = db_->put(txn, Table::Order, slot_key(block.header.slot), hash_slice(hash))) != 0)
            return rc;

        for (auto &tx : block.txs) {
            Hash tx_hash = tx.hash();
            Bytes raw = to_bytes(tx);
            if ((rc = db_->put(txn, Table::Transactions, hash_slice(tx_hash), raw)) != 0)
                return rc;
        }
    }
    return hashes;
}

Result<std::vector<Hash>, int> LedgerStore::insert_blocks(const std::vector<BlockInfo> &blocks) {
    auto r = begin_write();
    if (r.is_err()) return r.unwrap_err();
    DbTxn txn = r.take();

    auto hashes = insert_blocks(txn, blocks);
    if (hashes.is_err()) return hashes.unwrap_err();

    int rc = commit(txn);
    if (rc != OK) return rc;
    return hashes;
}

Result<bool, int> LedgerStore::has_block(DbTxn &txn, const Hash &hash) {
    int rc = db_->exists(txn, Table::Headers, hash_slice(hash));
    if (rc == OK) return true;
    if (rc == MDB_NOTFOUND) return false;
    return rc;
}

Result<bool, int> LedgerStore::has_block(const Hash &hash) {
    auto r = begin_read();
    if (r.is_err()) return r.unwrap_err();
    DbTxn txn = r.take();
    return has_block(txn, hash);
}

static Result<BlockInfo, int> load_block(LedgerDB &db, DbTxn &txn, const Hash &hash) {
    Bytes raw;
    int rc = db.get(txn, Table::Headers, hash_slice(hash), raw);
    if (rc == MDB_NOTFOUND) return static_cast<int>(BLOCK_NOT_EXIST);
    if (rc != 0) return rc;

    auto header = from_bytes<Header>(raw);
    if (!header.has_value()) return static_cast<int>(DECODE_ERR);

    if ((rc = db.get(txn, Table::Blocks, hash_slice(hash), raw)) != 0)
        return rc == MDB_NOTFOUND ? static_cast<int>(BLOCK_NOT_EXIST) : rc;
    auto record = from_bytes<BlockRecord>(raw);
    if (!record.has_value()) return static_cast<int>(DECODE_ERR);

    BlockInfo block;
    block.header = header.value();
    for (auto &tx_hash : record->txs) {
        if ((rc = db.get(txn, Table::Transactions, hash_slice(tx_hash), raw)) != 0)
            return rc == MDB_NOTFOUND ? static_cast<int>(BLOCK_NOT_EXIST) : rc;
        auto tx = from_bytes<Transaction>(raw);
        if (!tx.has_value()) return static_cast<int>(DECODE_ERR);
        block.txs.push_back(std::move(tx.value()));
    }
    return block;
}

Result<std::vector<BlockInfo>, int> LedgerStore::get_blocks_by_hash(const std::vector<Hash> &hashes) {
    auto r = begin_read();
    if (r.is_err()) return r.unwrap_err();
    DbTxn txn = r.take();

    std::vector<BlockInfo> out;
    for (auto &hash : hashes) {
        auto block = load_block(*db_, txn, hash);
        if (block.is_err()) return block.unwrap_err();
        out.push_back(block.take());
    }
    return out;
}

Result<std::vector<BlockInfo>, int> LedgerStore::get_blocks_by_slot(const std::vector<uint64_t> &slots) {
    auto r = begin_read();
    if (r.is_err()) return r.unwrap_err();
    DbTxn txn = r.take();

    std::vector<BlockInfo> out;
    for (uint64_t slot : slots) {
        Bytes raw;
        int rc = db_->get(txn, Table::Order, slot_key(slot), raw);
        if (rc == MDB_NOTFOUND) continue;
        if (rc != 0) return rc;
        if (raw.size() != 32) return static_cast<int>(DECODE_ERR);

        Hash hash;
        std::memcpy(hash.data(), raw.data(), 32);
        auto block = load_block(*db_, txn, hash);
        if (block.is_err()) return block.unwrap_err();
        out.push_back(block.take());
    }
    return out;
}

Result<std::vector<BlockInfo>, int> LedgerStore::get_blocks_after(uint64_t slot, size_t n) {
    std::vector<BlockInfo> out;
    if (slot == UINT64_MAX || n == 0) return out;

    auto r = begin_read();
    if (r.is_err()) return r.unwrap_err();
    DbTxn txn = r.take();

    std::vector<Hash> hashes;
    bool bad_value = false;
    int rc = db_->scan_from(txn, Table::Order, slot_key(slot + 1),
        [&](const ByteSlice&, const ByteSlice &value) {
            if (value.size() != 32) {
                bad_value = true;
                return false;
            }
            Hash h;
            std::memcpy(h.data(), value.data(), 32);
            hashes.push_back(h);
            return hashes.size() < n;
        });
    if (rc != OK) return rc;
    if (bad_value) return static_cast<int>(DECODE_ERR);

    for (auto &hash : hashes) {
        auto block = load_block(*db_, txn, hash);
        if (block.is_err()) return block.unwrap_err();
        out.push_back(block.take());
    }
    return out;
}

Result<std::pair<uint64_t, Hash>, int> LedgerStore::last(DbTxn &txn) {
    Bytes key, value;
    int rc = db_->last(txn, Table::Order, key, value);
    if (rc != 0) return rc;
    if (key.size() != 8 || value.size() != 32) return static_cast<int>(DECODE_ERR);

    Hash hash;
    std::memcpy(hash.data(), value.data(), 32);
    return std::make_pair(slot_from_key(key), hash);
}

Result<std::pair<uint64_t, Hash>, int> LedgerStore::last() {
    auto r = begin_read();
    if (r.is_err()) return r.unwrap_err();
    DbTxn txn = r.take();
    return last(txn);
}

Result<std::vector<Transaction>, int> LedgerStore::get_transactions_by_hash(
    const std::vector<Hash> &hashes
) {
    auto r = begin_read();
    if (r.is_err()) return r.unwrap_err();
    DbTxn txn = r.take();

    std::vector<Transaction> out;
    for (auto &hash : hashes) {
        Bytes raw;
        int rc = db_->get(txn, Table::Transactions, hash_slice(hash), raw);
        if (rc == MDB_NOTFOUND) return static_cast<int>(NOT_EXIST);
        if (rc != 0) return rc;

        auto tx = from_bytes<Transaction>(raw);
        if (!tx.has_value()) return static_cast<int>(DECODE_ERR);
        out.push_back(std::move(tx.value()));
    }
    return out;
}

// -------------------- CONTRACT TABLES ---------------------------

Result<bool, int> LedgerStore::contains_key(
    DbTxn &txn,
    const ContractId &cid,
    const std::string &table,
    const ByteSlice &key
) {
    int rc = db_->exists(txn, Table::Contracts, namespaced_key(cid, table, key));
    if (rc == OK) return true;
    if (rc == MDB_NOTFOUND) return false;
    return rc;
}

Result<std::optional<Bytes>, int> LedgerStore::get(
    DbTxn &txn,
    const ContractId &cid,
    const std::string &table,
    const ByteSlice &key
) {
    Bytes out;
    int rc = db_->get(txn, Table::Contracts, namespaced_key(cid, table, key), out);
    if (rc == MDB_NOTFOUND) return std::optional<Bytes>();
    if (rc != 0) return rc;
    return std::optional<Bytes>(std::move(out));
}

int LedgerStore::set(
    DbTxn &txn,
    const ContractId &cid,
    const std::string &table,
    const ByteSlice &key,
    const ByteSlice &value
) {
    return db_->put(txn, Table::Contracts, namespaced_key(cid, table, key), value);
}

int LedgerStore::insert_unique(
    DbTxn &txn,
    const ContractId &cid,
    const std::string &table,
    const ByteSlice &key,
    const ByteSlice &value
) {
    int rc = db_->put(txn, Table::Contracts, namespaced_key(cid, table, key), value, MDB_NOOVERWRITE);
    return rc == MDB_KEYEXIST ? ALREADY_EXISTS : rc;
}

int LedgerStore::merkle_append(
    DbTxn &txn,
    const ContractId &cid,
    const std::string &info_table,
    const std::string &tree,
    const std::vector<Fr> &leaves
) {
    if (leaves.empty()) return OK;

    const byte* tree_name = reinterpret_cast<const byte*>(tree.data());
    ByteSlice tree_key(tree_name, tree.size());

    auto stored = get(txn, cid, info_table, tree_key);
    if (stored.is_err()) return stored.unwrap_err();

    MerkleFrontier frontier;
    if (stored.unwrap().has_value()) {
        auto decoded = from_bytes<MerkleFrontier>(stored.unwrap().value());
        if (!decoded.has_value()) return DECODE_ERR;
        frontier = decoded.value();
    }

    for (auto &leaf : leaves)
        if (!frontier.append(leaf)) return MERKLE_FULL;

    int rc = set(txn, cid, info_table, tree_key, to_bytes(frontier));
    if (rc != OK) return rc;

    Bytes root_key = namespaced_key(cid, tree, scalar_key(frontier.root()));
    return db_->put(txn, Table::MerkleRoots, root_key, ByteSlice());
}

Result<bool, int> LedgerStore::has_merkle_root(
    DbTxn &txn,
    const ContractId &cid,
    const std::string &tree,
    const Fr &root
) {
    Bytes root_key = namespaced_key(cid, tree, scalar_key(root));
    int rc = db_->exists(txn, Table::MerkleRoots, root_key);
    if (rc == OK) return true;
    if (rc == MDB_NOTFOUND) return false;
    return rc;
}
