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


#include "merkle.h"
#include "hashing.h"
#include "mimc.h"

static std::vector<Fr> build_level_ivs() {
    init_field_params();
    std::vector<Fr> ivs(MERKLE_DEPTH);
    for (size_t h = 0; h < MERKLE_DEPTH; h++)
        ivs[h] = hash_to_field("umbra:merkle", h);
    return ivs;
}

const Fr& merkle_level_iv(size_t height) {
    static const auto ivs = build_level_ivs();
    return ivs.at(height);
}

Fr merkle_combine(
    size_t height,
    const Fr &left,
    const Fr &right
) {
    return mimc_hash({left, right}, merkle_level_iv(height));
}

static std::array<Fr, MERKLE_DEPTH + 1> build_empty_roots() {
    init_field_params();
    std::array<Fr, MERKLE_DEPTH + 1> roots;
    roots[0] = Fr::zero();
    for (size_t h = 0; h < MERKLE_DEPTH; h++)
        roots[h + 1] = merkle_combine(h, roots[h], roots[h]);
    return roots;
}

const std::array<Fr, MERKLE_DEPTH + 1>& merkle_empty_roots() {
    static const auto roots = build_empty_roots();
    return roots;
}

Fr merkle_root_from_path(const Fr &leaf, const MerklePath &path) {
    Fr node = leaf;
    for (size_t h = 0; h < MERKLE_DEPTH; h++) {
        if ((path.position >> h) & 1)
            node = merkle_combine(h, path.siblings[h], node);
        else
            node = merkle_combine(h, node, path.siblings[h]);
    }
    return node;
}

// -------------------- FRONTIER ---------------------------

MerkleFrontier::MerkleFrontier() : count_(0) {
    branch_.fill(Fr::zero());
}

bool MerkleFrontier::append(const Fr &leaf) {
    if (count_ >= MERKLE_CAPACITY) return false;

    count_++;
    uint64_t size = count_;
    Fr node = leaf;
    for (size_t h = 0; h < MERKLE_DEPTH; h++) {
        if (size & 1) {
            branch_[h] = node;
            return true;
        }
        node = merkle_combine(h, branch_[h], node);
        size >>= 1;
    }
    return true;
}

Fr MerkleFrontier::root() const {
    const auto &empty = merkle_empty_roots();

    Fr node = empty[0];
    uint64_t size = count_;
    for (size_t h = 0; h < MERKLE_DEPTH; h++) {
        if (size & 1)
            node = merkle_combine(h, branch_[h], node);
        else
            node = merkle_combine(h, node, empty[h]);
        size >>= 1;
    }
    return node;
}

void MerkleFrontier::encode(Encoder &enc) const {
    enc.u64(count_);
    for (auto &b : branch_) enc.scalar(b);
}

bool MerkleFrontier::decode(Decoder &dec, MerkleFrontier &out) {
    if (!dec.u64(out.count_)) return false;
    if (out.count_ > MERKLE_CAPACITY) return false;
    for (auto &b : out.branch_)
        if (!dec.scalar(b)) return false;
    return true;
}

// -------------------- FULL TREE ---------------------------

MerkleTree::MerkleTree() : levels_(MERKLE_DEPTH + 1) {}

std::optional<uint64_t> MerkleTree::append(const Fr &leaf) {
    if (count() >= MERKLE_CAPACITY) return std::nullopt;

    const auto &empty = merkle_empty_roots();
    uint64_t position = count();
    levels_[0].push_back(leaf);

    uint64_t idx = position;
    for (size_t h = 0; h < MERKLE_DEPTH; h++) {
        const auto &level = levels_[h];
        uint64_t left_idx = idx & ~uint64_t(1);
        uint64_t right_idx = idx | 1;

        const Fr &left = level[left_idx];
        const Fr &right = right_idx < level.size() ? level[right_idx] : empty[h];
        Fr parent = merkle_combine(h, left, right);

        auto &up = levels_[h + 1];
        idx >>= 1;
        if (idx < up.size()) up[idx] = parent;
        else up.push_back(parent);
    }
    return position;
}

Fr MerkleTree::root() const {
    if (levels_[MERKLE_DEPTH].empty()) return merkle_empty_roots()[MERKLE_DEPTH];
    return levels_[MERKLE_DEPTH][0];
}

std::optional<MerklePath> MerkleTree::witness(uint64_t position) const {
    if (position >= count()) return std::nullopt;

    const auto &empty = merkle_empty_roots();
    MerklePath path;
    path.position = position;
    for (size_t h = 0; h < MERKLE_DEPTH; h++) {
        uint64_t sibling = (position >> h) ^ 1;
        const auto &level = levels_[h];
        path.siblings[h] = sibling < level.size() ? level[sibling] : empty[h];
    }
    return path;
}
