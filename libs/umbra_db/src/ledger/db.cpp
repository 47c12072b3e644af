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


#include "db.h"
#include "log.h"
#include <filesystem>

const char* table_name(Table t) {
    switch (t) {
        case Table::Headers:      return "headers";
        case Table::Blocks:       return "blocks";
        case Table::Order:        return "order";
        case Table::Transactions: return "transactions";
        case Table::MerkleRoots:  return "merkle_roots";
        case Table::Contracts:    return "contracts";
    }
    return "";
}

int DbTxn::commit() {
    if (!active()) return TXN_INACTIVE;
    done_ = true;
    return mdb_txn_commit(txn_);
}

void DbTxn::abort() {
    if (!active()) return;
    done_ = true;
    mdb_txn_abort(txn_);
}

LedgerDB::~LedgerDB() {
    if (env_) {
        for (auto dbi : dbis_) mdb_dbi_close(env_, dbi);
        mdb_env_close(env_);
    }
}

Result<std::unique_ptr<LedgerDB>, int> LedgerDB::open(const std::string &path, size_t map_size) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        log_error("ledger", "cannot create %s: %s", path.c_str(), ec.message().c_str());
        return DB_ERR;
    }

    std::unique_ptr<LedgerDB> db(new LedgerDB());

    int rc = mdb_env_create(&db->env_);
    if (rc != 0) return rc;
    if ((rc = mdb_env_set_maxdbs(db->env_, TABLE_COUNT)) != 0) return rc;
    if ((rc = mdb_env_set_mapsize(db->env_, map_size)) != 0) return rc;
    if ((rc = mdb_env_open(db->env_, path.c_str(), 0, 0600)) != 0) {
        log_error("ledger", "mdb_env_open %s: %s", path.c_str(), mdb_strerror(rc));
        return rc;
    }

    MDB_txn* raw;
    if ((rc = mdb_txn_begin(db->env_, nullptr, 0, &raw)) != 0) return rc;
    DbTxn txn(raw);

    for (size_t i = 0; i < TABLE_COUNT; i++) {
        const char* name = table_name(static_cast<Table>(i));
        if ((rc = mdb_dbi_open(txn.raw(), name, MDB_CREATE, &db->dbis_[i])) != 0) {
            log_error("ledger", "mdb_dbi_open %s: %s", name, mdb_strerror(rc));
            return rc;
        }
    }
    if ((rc = txn.commit()) != 0) return rc;

    return std::move(db);
}

Result<DbTxn, int> LedgerDB::begin(DbTxn* parent, bool read_only) {
    MDB_txn* raw;
    MDB_txn* parent_raw = parent ? parent->raw() : nullptr;
    int rc = mdb_txn_begin(env_, parent_raw, read_only ? MDB_RDONLY : 0, &raw);
    if (rc != 0) return rc;
    return DbTxn(raw);
}

int LedgerDB::put(
    DbTxn &txn,
    Table t,
    const ByteSlice &key,
    const ByteSlice &value,
    unsigned flags
) {
    if (!txn.active()) return TXN_INACTIVE;
    MDB_val k{ key.size(), const_cast<byte*>(key.data()) };
    MDB_val v{ value.size(), const_cast<byte*>(value.data()) };
    return mdb_put(txn.raw(), dbi(t), &k, &v, flags);
}

int LedgerDB::get(DbTxn &txn, Table t, const ByteSlice &key, Bytes &out) {
    if (!txn.active()) return TXN_INACTIVE;
    MDB_val k{ key.size(), const_cast<byte*>(key.data()) };
    MDB_val v;

    int rc = mdb_get(txn.raw(), dbi(t), &k, &v);
    if (rc == 0) {
        const byte* data = static_cast<const byte*>(v.mv_data);
        out.assign(data, data + v.mv_size);
    }
    return rc;
}

int LedgerDB::exists(DbTxn &txn, Table t, const ByteSlice &key) {
    if (!txn.active()) return TXN_INACTIVE;
    MDB_val k{ key.size(), const_cast<byte*>(key.data()) };
    MDB_val v;
    return mdb_get(txn.raw(), dbi(t), &k, &v);
}

int LedgerDB::scan_from(
    DbTxn &txn,
    Table t,
    const ByteSlice &start,
    const std::function<bool(const ByteSlice&, const ByteSlice&)> &fn
) {
    if (!txn.active()) return TXN_INACTIVE;

    MDB_cursor* cur;
    int rc = mdb_cursor_open(txn.raw(), dbi(t), &cur);
    if (rc != 0) return rc;

    MDB_val k{ start.size(), const_cast<byte*>(start.data()) };
    MDB_val v;
    rc = mdb_cursor_get(cur, &k, &v, MDB_SET_RANGE);
    while (rc == 0) {
        ByteSlice key(static_cast<const byte*>(k.mv_data), k.mv_size);
        ByteSlice value(static_cast<const byte*>(v.mv_data), v.mv_size);
        if (!fn(key, value)) break;
        rc = mdb_cursor_get(cur, &k, &v, MDB_NEXT);
    }
    mdb_cursor_close(cur);

    return (rc == 0 || rc == MDB_NOTFOUND) ? OK : rc;
}

int LedgerDB::last(DbTxn &txn, Table t, Bytes &key, Bytes &value) {
    if (!txn.active()) return TXN_INACTIVE;

    MDB_cursor* cur;
    int rc = mdb_cursor_open(txn.raw(), dbi(t), &cur);
    if (rc != 0) return rc;

    MDB_val k, v;
    rc = mdb_cursor_get(cur, &k, &v, MDB_LAST);
    if (rc == 0) {
        const byte* kd = static_cast<const byte*>(k.mv_data);
        const byte* vd = static_cast<const byte*>(v.mv_data);
        key.assign(kd, kd + k.mv_size);
        value.assign(vd, vd + v.mv_size);
    }
    mdb_cursor_close(cur);
    return rc;
}
