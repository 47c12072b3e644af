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


#include "serialize.h"
#include "utils.h"

// -------------------- ENCODER ---------------------------

void Encoder::u8(uint8_t v) {
    buf_.push_back(v);
}

void Encoder::u32(uint32_t v) {
    for (size_t i = 0; i < 4; i++)
        buf_.push_back(static_cast<byte>(v >> (8 * i)));
}

void Encoder::u64(uint64_t v) {
    for (size_t i = 0; i < 8; i++)
        buf_.push_back(static_cast<byte>(v >> (8 * i)));
}

void Encoder::scalar(const Fr &s) {
    auto le = fr_to_bytes(s);
    raw(le.data(), le.size());
}

void Encoder::scalar(const Fs &s) {
    auto le = fs_to_bytes(s);
    raw(le.data(), le.size());
}

void Encoder::point(const EcPoint &p) {
    auto comp = compress_jub(p);
    raw(comp.data(), comp.size());
}

void Encoder::p1(const blst_p1 &p) {
    auto comp = compress_p1(p);
    raw(comp.data(), comp.size());
}

void Encoder::p2(const blst_p2 &p) {
    auto comp = compress_p2(p);
    raw(comp.data(), comp.size());
}

void Encoder::hash(const Hash &h) {
    raw(h.data(), h.size());
}

void Encoder::raw(const byte* data, size_t len) {
    buf_.insert(buf_.end(), data, data + len);
}

void Encoder::bytes(const ByteSlice &data) {
    count(data.size());
    raw(data.data(), data.size());
}

// -------------------- DECODER ---------------------------

bool Decoder::need(size_t n) {
    if (failed_ || remaining_ < n) {
        failed_ = true;
        return false;
    }
    return true;
}

bool Decoder::u8(uint8_t &out) {
    if (!need(1)) return false;
    out = *cursor_;
    cursor_++; remaining_--;
    return true;
}

bool Decoder::u32(uint32_t &out) {
    if (!need(4)) return false;
    out = 0;
    for (size_t i = 0; i < 4; i++)
        out |= static_cast<uint32_t>(cursor_[i]) << (8 * i);
    cursor_ += 4; remaining_ -= 4;
    return true;
}

bool Decoder::u64(uint64_t &out) {
    if (!need(8)) return false;
    out = 0;
    for (size_t i = 0; i < 8; i++)
        out |= static_cast<uint64_t>(cursor_[i]) << (8 * i);
    cursor_ += 8; remaining_ -= 8;
    return true;
}

bool Decoder::boolean(bool &out) {
    uint8_t v;
    if (!u8(v)) return false;
    if (v > 1) {
        failed_ = true;
        return false;
    }
    out = v == 1;
    return true;
}

template <typename T, typename F>
static bool read_fixed(const byte* &cursor, size_t &remaining, bool &failed, T &out, F&& parse) {
    auto v = parse(cursor);
    if (!v.has_value()) {
        failed = true;
        return false;
    }
    out = v.value();
    cursor += 32; remaining -= 32;
    return true;
}

bool Decoder::scalar(Fr &out) {
    if (!need(32)) return false;
    return read_fixed(cursor_, remaining_, failed_, out, fr_from_bytes);
}

bool Decoder::scalar(Fs &out) {
    if (!need(32)) return false;
    return read_fixed(cursor_, remaining_, failed_, out, fs_from_bytes);
}

bool Decoder::point(EcPoint &out) {
    if (!need(32)) return false;
    return read_fixed(cursor_, remaining_, failed_, out, jub_from_bytes);
}

bool Decoder::p1(blst_p1 &out) {
    if (!need(48)) return false;
    auto p = p1_from_bytes(cursor_);
    if (!p.has_value()) {
        failed_ = true;
        return false;
    }
    out = p.value();
    cursor_ += 48; remaining_ -= 48;
    return true;
}

bool Decoder::p2(blst_p2 &out) {
    if (!need(96)) return false;
    auto p = p2_from_bytes(cursor_);
    if (!p.has_value()) {
        failed_ = true;
        return false;
    }
    out = p.value();
    cursor_ += 96; remaining_ -= 96;
    return true;
}

bool Decoder::hash(Hash &out) {
    return raw(out.data(), out.size());
}

bool Decoder::raw(byte* out, size_t len) {
    if (!need(len)) return false;
    std::memcpy(out, cursor_, len);
    cursor_ += len; remaining_ -= len;
    return true;
}

bool Decoder::bytes(Bytes &out) {
    uint32_t len;
    if (!u32(len)) return false;
    if (!need(len)) return false;
    out.assign(cursor_, cursor_ + len);
    cursor_ += len; remaining_ -= len;
    return true;
}

bool Decoder::count(size_t &out, size_t min_elem_size) {
    uint32_t n;
    if (!u32(n)) return false;
    if (min_elem_size && static_cast<uint64_t>(n) * min_elem_size > remaining_) {
        failed_ = true;
        return false;
    }
    out = n;
    return true;
}
