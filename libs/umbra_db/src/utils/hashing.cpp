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

#include "hashing.h"
#include <iomanip>
#include <iostream>
#include <sstream>

static const std::string STR_FIELD_TAG = "umbra:str_to_field";
static const std::string BYTES_FIELD_TAG = "umbra:bytes_to_field";

Hash derive_kv_hash(const Hash &key_hash, const Hash &val_hash) {
    BlakeHasher hasher;
    hasher.update(key_hash.data(), key_hash.size());
    hasher.update(val_hash.data(), val_hash.size());
    return hasher.finalize();
}

Hash derive_hash(const ByteSlice &value) {
    BlakeHasher hasher;
    hasher.update(value.data(), value.size());
    return hasher.finalize();
}

Fr hash_to_field(const std::string &tag, uint64_t counter) {
    BlakeHasher hasher;
    hasher.update(STR_FIELD_TAG);
    hasher.update(tag);

    byte ctr[8];
    for (size_t i = 0; i < 8; i++) ctr[i] = static_cast<byte>(counter >> (8 * i));
    hasher.update(ctr, sizeof(ctr));

    byte wide[64];
    hasher.finalize_xof(wide, sizeof(wide));
    return fr_from_wide(wide);
}

Fr hash_bytes_to_field(const std::string &tag, const ByteSlice &data) {
    BlakeHasher hasher;
    hasher.update(BYTES_FIELD_TAG);
    hasher.update(tag);
    hasher.update(data.data(), data.size());

    byte wide[64];
    hasher.finalize_xof(wide, sizeof(wide));
    return fr_from_wide(wide);
}

std::string hash_to_hex(const Hash &hash) {
    std::ostringstream os;
    for (byte b : hash) {
        os << std::hex
           << std::setw(2)
           << std::setfill('0')
           << static_cast<unsigned>(b);
    }
    return os.str();
}

void print_hash(const Hash &hash) {
    std::cout << hash_to_hex(hash) << std::endl;
}
