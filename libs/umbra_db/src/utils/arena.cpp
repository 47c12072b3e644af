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


#include "arena.h"

Result<ArenaHandle, int> ObjectArena::put(Bytes &&data) {
    if (objects_.size() >= max_objects_) return ARENA_FULL;
    objects_.push_back(std::move(data));
    return static_cast<ArenaHandle>(objects_.size() - 1);
}

Result<size_t, int> ObjectArena::size(ArenaHandle handle) const {
    if (handle >= objects_.size()) return ARENA_BAD_HANDLE;
    return objects_[handle].size();
}

Result<ByteSlice, int> ObjectArena::get(ArenaHandle handle) const {
    if (handle >= objects_.size()) return ARENA_BAD_HANDLE;
    const Bytes &obj = objects_[handle];
    return ByteSlice(obj.data(), obj.size());
}

int ObjectArena::read(
    ArenaHandle handle,
    size_t offset,
    byte* out,
    size_t len
) const {
    if (handle >= objects_.size()) return ARENA_BAD_HANDLE;
    const Bytes &obj = objects_[handle];
    if (offset > obj.size() || len > obj.size() - offset)
        return ARENA_OUT_OF_RANGE;
    std::memcpy(out, obj.data() + offset, len);
    return ARENA_OK;
}

Result<Bytes, int> ObjectArena::take(ArenaHandle handle) {
    if (handle >= objects_.size()) return ARENA_BAD_HANDLE;
    return std::move(objects_[handle]);
}
