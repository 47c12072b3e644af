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
#include "tx.h"

constexpr uint8_t BLOCK_VERSION = 1;

struct Header {
    uint8_t version;
    Hash previous;
    uint64_t slot;
    uint64_t timestamp;
    // hash over the block's transaction hashes, in order
    Hash tx_root;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, Header &out);
    Hash hash() const;
};

// What the blocks table stores, transactions live in their own table.
struct BlockRecord {
    Hash header;
    std::vector<Hash> txs;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, BlockRecord &out);
};

struct BlockInfo {
    Header header;
    std::vector<Transaction> txs;

    Hash hash() const { return header.hash(); }
    BlockRecord to_record() const;
};

Hash compute_tx_root(const std::vector<Transaction> &txs);

// Builds a block on top of previous with a matching tx_root.
BlockInfo make_block(
    const Hash &previous,
    uint64_t slot,
    uint64_t timestamp,
    std::vector<Transaction> txs
);

BlockInfo genesis_block(uint64_t timestamp);
