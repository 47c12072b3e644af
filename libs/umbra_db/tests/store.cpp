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


#include <cassert>
#include <cstdio>
#include <filesystem>
#include "harness.h"
#include "ledger_store.h"
#include "tests.h"

static const std::string TABLE = "test_table";

static ByteSlice str_slice(const std::string &s) {
    return ByteSlice(reinterpret_cast<const byte*>(s.data()), s.size());
}

static std::unique_ptr<LedgerStore> open_store(const char* path) {
    LedgerConfig config;
    config.path = path;
    config.map_size = size_t(64) * 1024 * 1024;
    config.log_level = "warn";

    auto opened = LedgerStore::open(config);
    assert(opened.is_ok());
    return opened.take();
}

static void test_genesis(LedgerStore &store) {
    auto last = store.last();
    assert(last.is_ok());
    assert(last.unwrap().first == 0);
    assert(last.unwrap().second == genesis_block(0).hash());

    auto by_slot = store.get_blocks_by_slot({0, 5});
    assert(by_slot.is_ok() && by_slot.unwrap().size() == 1);
    assert(by_slot.unwrap()[0].txs.empty());

    auto unknown = store.get_blocks_by_hash({derive_hash(str_slice("nope"))});
    assert(unknown.is_err() && unknown.unwrap_err() == BLOCK_NOT_EXIST);
    printf("GENESIS OK.\n");
}

static void test_contract_tables(LedgerStore &store) {
    const ContractId &cid = money_contract_id();
    Bytes key = scalar_key(fr_from_u64(77));

    {
        auto begun = store.begin_write();
        assert(begun.is_ok());
        DbTxn txn = begun.take();

        assert(store.insert_unique(txn, cid, TABLE, key, str_slice("first")) == OK);
        assert(store.insert_unique(txn, cid, TABLE, key, str_slice("second")) == ALREADY_EXISTS);

        auto got = store.get(txn, cid, TABLE, key);
        assert(got.is_ok() && got.unwrap().has_value());
        assert(got.unwrap().value() == Bytes({'f', 'i', 'r', 's', 't'}));

        // the same key under another contract is a different row
        auto other = store.contains_key(txn, dao_contract_id(), TABLE, key);
        assert(other.is_ok() && !other.unwrap());

        assert(store.set(txn, cid, TABLE, key, str_slice("third")) == OK);
        assert(store.commit(txn) == OK);
    }

    {
        // dropped without commit
        auto begun = store.begin_write();
        DbTxn txn = begun.take();
        assert(store.set(txn, cid, TABLE, scalar_key(fr_from_u64(78)), str_slice("gone")) == OK);
    }

    auto begun = store.begin_read();
    assert(begun.is_ok());
    DbTxn txn = begun.take();
    auto kept = store.get(txn, cid, TABLE, key);
    assert(kept.is_ok() && kept.unwrap().value() == Bytes({'t', 'h', 'i', 'r', 'd'}));
    auto dropped = store.contains_key(txn, cid, TABLE, scalar_key(fr_from_u64(78)));
    assert(dropped.is_ok() && !dropped.unwrap());
    printf("CONTRACT TABLES OK.\n");
}

static void test_child_txn(LedgerStore &store) {
    const ContractId &cid = consensus_contract_id();
    Bytes kept_key = scalar_key(fr_from_u64(1));
    Bytes lost_key = scalar_key(fr_from_u64(2));

    auto begun = store.begin_write();
    DbTxn parent = begun.take();
    {
        auto child = store.begin_write(&parent);
        assert(child.is_ok());
        DbTxn txn = child.take();
        assert(store.set(txn, cid, TABLE, kept_key, str_slice("a")) == OK);
        assert(txn.commit() == OK);
    }
    {
        auto child = store.begin_write(&parent);
        DbTxn txn = child.take();
        assert(store.set(txn, cid, TABLE, lost_key, str_slice("b")) == OK);
        txn.abort();
    }

    auto kept = store.contains_key(parent, cid, TABLE, kept_key);
    assert(kept.is_ok() && kept.unwrap());
    auto lost = store.contains_key(parent, cid, TABLE, lost_key);
    assert(lost.is_ok() && !lost.unwrap());
    assert(store.commit(parent) == OK);
    printf("CHILD TXN OK.\n");
}

static void test_merkle_history(LedgerStore &store) {
    const ContractId &cid = money_contract_id();
    const std::string tree = "test_tree";

    MerkleTree local;
    std::vector<Fr> roots;

    auto begun = store.begin_write();
    DbTxn txn = begun.take();
    for (uint64_t batch = 0; batch < 3; batch++) {
        std::vector<Fr> leaves{fr_from_u64(batch * 10), fr_from_u64(batch * 10 + 1)};
        for (auto &leaf : leaves) local.append(leaf);
        roots.push_back(local.root());
        assert(store.merkle_append(txn, cid, TABLE, tree, leaves) == OK);
    }
    assert(store.merkle_append(txn, cid, TABLE, tree, {}) == OK);

    // every root the tree passed through stays valid
    for (auto &root : roots) {
        auto has = store.has_merkle_root(txn, cid, tree, root);
        assert(has.is_ok() && has.unwrap());
    }
    auto other = store.has_merkle_root(txn, cid, "other_tree", roots.back());
    assert(other.is_ok() && !other.unwrap());
    auto never = store.has_merkle_root(txn, cid, tree, fr_from_u64(12345));
    assert(never.is_ok() && !never.unwrap());

    assert(store.commit(txn) == OK);
    printf("MERKLE HISTORY OK.\n");
}

void main_store() {
    namespace fs = std::filesystem;
    const char* path = "./test_db_store";
    if (fs::exists(path)) fs::remove_all(path);
    fs::create_directory(path);

    Hash genesis;
    {
        auto store = open_store(path);
        test_genesis(*store);
        test_contract_tables(*store);
        test_child_txn(*store);
        test_merkle_history(*store);
        genesis = store->last().unwrap().second;
    }

    // reopening keeps the chain and does not insert a second genesis
    auto store = open_store(path);
    auto last = store->last();
    assert(last.is_ok());
    assert(last.unwrap().first == 0 && last.unwrap().second == genesis);
    printf("REOPEN OK.\n");
    printf("\n");
}
