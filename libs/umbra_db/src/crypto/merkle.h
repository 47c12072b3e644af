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
#include "serialize.h"
#include "utils.h"

constexpr size_t MERKLE_DEPTH = 32;
constexpr uint64_t MERKLE_CAPACITY = (uint64_t(1) << MERKLE_DEPTH) - 1;

// initial value of the hash at each height, so no node can pass for another level
const Fr& merkle_level_iv(size_t height);
// parent of (left, right) at the given height, leaves are height 0
Fr merkle_combine(size_t height, const Fr &left, const Fr &right);
// root of an empty subtree of each height, [0] is the empty leaf
const std::array<Fr, MERKLE_DEPTH + 1>& merkle_empty_roots();

struct MerklePath {
    uint64_t position;
    std::array<Fr, MERKLE_DEPTH> siblings;
};

Fr merkle_root_from_path(const Fr &leaf, const MerklePath &path);

/*
 * Incremental tree that only remembers the left siblings still needed
 * to extend it. This is what the ledger persists per tree.
 */
class MerkleFrontier {
private:
    std::array<Fr, MERKLE_DEPTH> branch_;
    uint64_t count_;

public:
    MerkleFrontier();

    // false once the tree is full
    bool append(const Fr &leaf);
    Fr root() const;
    uint64_t count() const { return count_; }

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, MerkleFrontier &out);
};

/*
 * Full tree kept by clients. Positions are stable once appended, and an
 * authentication path can be taken for any of them.
 */
class MerkleTree {
private:
    // levels_[h] holds every materialized node of height h
    std::vector<std::vector<Fr>> levels_;

public:
    MerkleTree();

    // returns the leaf position
    std::optional<uint64_t> append(const Fr &leaf);
    Fr root() const;
    uint64_t count() const { return levels_[0].size(); }
    std::optional<MerklePath> witness(uint64_t position) const;
};
