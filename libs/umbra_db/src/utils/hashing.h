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
#include "blake3.h"
#include "utils.h"
#include <array>
#include <cstdlib>
#include <cstring>
#include <span>
#include <string>
#include <vector>

using Hash = std::array<byte, 32>;
using Bytes = std::vector<byte>;
using ByteSlice = std::span<const byte>;

class BlakeHasher {
private: blake3_hasher h_;
public:
    BlakeHasher() { blake3_hasher_init(&h_); }
    ~BlakeHasher() = default;

    void update(const byte* data, const size_t size) {
        blake3_hasher_update(&h_, data, size);
    }
    void update(const std::string& s) {
        blake3_hasher_update(&h_, s.data(), s.size());
    }
    Hash finalize() {
        Hash out;
        blake3_hasher_finalize(&h_, out.data(), out.size());
        return out;
    }
    // extendable output, used to reduce into a field without bias
    void finalize_xof(byte* out, size_t len) {
        blake3_hasher_finalize(&h_, out, len);
    }
};

Hash derive_hash(const ByteSlice &value);
Hash derive_kv_hash(const Hash &key_hash, const Hash &val_hash);

// Domain separated string -> field element, used for fixed ids and
// circuit constants. The counter picks the i-th element of a family.
Fr hash_to_field(const std::string &tag, uint64_t counter = 0);
// Domain separated bytes -> field element
Fr hash_bytes_to_field(const std::string &tag, const ByteSlice &data);

std::string hash_to_hex(const Hash &hash);
void print_hash(const Hash &hash);
