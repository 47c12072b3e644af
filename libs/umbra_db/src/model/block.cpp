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


#include "block.h"

static const std::string HEADER_TAG = "umbra:header";
static const std::string TX_ROOT_TAG = "umbra:tx_root";

void Header::encode(Encoder &enc) const {
    enc.u8(version);
    enc.hash(previous);
    enc.u64(slot);
    enc.u64(timestamp);
    enc.hash(tx_root);
}

bool Header::decode(Decoder &dec, Header &out) {
    return dec.u8(out.version)
        && dec.hash(out.previous)
        && dec.u64(out.slot)
        && dec.u64(out.timestamp)
        && dec.hash(out.tx_root);
}

Hash Header::hash() const {
    Bytes raw = to_bytes(*this);

    BlakeHasher hasher;
    hasher.update(HEADER_TAG);
    hasher.update(raw.data(), raw.size());
    return hasher.finalize();
}

void BlockRecord::encode(Encoder &enc) const {
    enc.hash(header);
    enc.count(txs.size());
    for (auto &h : txs) enc.hash(h);
}

bool BlockRecord::decode(Decoder &dec, BlockRecord &out) {
    if (!dec.hash(out.header)) return false;
    size_t n;
    if (!dec.count(n, 32)) return false;
    out.txs.resize(n);
    for (auto &h : out.txs)
        if (!dec.hash(h)) return false;
    return true;
}

BlockRecord BlockInfo::to_record() const {
    BlockRecord record;
    record.header = header.hash();
    for (auto &tx : txs) record.txs.push_back(tx.hash());
    return record;
}

Hash compute_tx_root(const std::vector<Transaction> &txs) {
    BlakeHasher hasher;
    hasher.update(TX_ROOT_TAG);
    for (auto &tx : txs) {
        Hash h = tx.hash();
        hasher.update(h.data(), h.size());
    }
    return hasher.finalize();
}

BlockInfo make_block(
    const Hash &previous,
    uint64_t slot,
    uint64_t timestamp,
    std::vector<Transaction> txs
) {
    BlockInfo block;
    block.header.version = BLOCK_VERSION;
    block.header.previous = previous;
    block.header.slot = slot;
    block.header.timestamp = timestamp;
    block.header.tx_root = compute_tx_root(txs);
    block.txs = std::move(txs);
    return block;
}

BlockInfo genesis_block(uint64_t timestamp) {
    Hash zero{};
    return make_block(zero, 0, timestamp, {});
}
