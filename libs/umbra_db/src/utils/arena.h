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
#include "hashing.h"
#include "result.h"
#include <cstdint>

enum ArenaCodes {
    ARENA_OK = 0,
    ARENA_BAD_HANDLE = 1,
    ARENA_OUT_OF_RANGE = 2,
    ARENA_FULL = 3,
};

using ArenaHandle = uint32_t;

// Handle indexed byte buffers passed between the phases of a contract call.
// Handles stay valid until clear(). Every read is bounds checked.
class ObjectArena {
private:
    std::vector<Bytes> objects_;
    size_t max_objects_;

public:
    explicit ObjectArena(size_t max_objects = 1 << 16)
        : max_objects_(max_objects) {}

    Result<ArenaHandle, int> put(Bytes &&data);
    Result<size_t, int> size(ArenaHandle handle) const;
    Result<ByteSlice, int> get(ArenaHandle handle) const;
    // copies len bytes starting at offset into out
    int read(ArenaHandle handle, size_t offset, byte* out, size_t len) const;
    Result<Bytes, int> take(ArenaHandle handle);

    size_t count() const { return objects_.size(); }
    void clear() { objects_.clear(); }
};
