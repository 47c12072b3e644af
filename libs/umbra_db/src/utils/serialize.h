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
#include <cstdint>
#include <optional>

// Little endian, length prefixed wire encoding shared by calls,
// transactions, blocks and contract table values.
class Encoder {
private:
    Bytes buf_;

public:
    Encoder() = default;

    void u8(uint8_t v);
    void u32(uint32_t v);
    void u64(uint64_t v);
    void boolean(bool v) { u8(v ? 1 : 0); }
    void scalar(const Fr &s);
    void scalar(const Fs &s);
    void point(const EcPoint &p);
    void p1(const blst_p1 &p);
    void p2(const blst_p2 &p);
    void hash(const Hash &h);
    void raw(const byte* data, size_t len);
    // u32 length then the bytes
    void bytes(const ByteSlice &data);
    void count(size_t n) { u32(static_cast<uint32_t>(n)); }

    const Bytes& data() const { return buf_; }
    Bytes take() { return std::move(buf_); }
};

// Every read checks the remaining length first. Once a read fails the
// decoder stays failed and all later reads fail too.
class Decoder {
private:
    const byte* cursor_;
    size_t remaining_;
    bool failed_ = false;

    bool need(size_t n);

public:
    explicit Decoder(const ByteSlice &src)
        : cursor_(src.data()), remaining_(src.size()) {}

    bool u8(uint8_t &out);
    bool u32(uint32_t &out);
    bool u64(uint64_t &out);
    bool boolean(bool &out);
    // rejects non canonical scalars
    bool scalar(Fr &out);
    bool scalar(Fs &out);
    bool point(EcPoint &out);
    bool p1(blst_p1 &out);
    bool p2(blst_p2 &out);
    bool hash(Hash &out);
    bool raw(byte* out, size_t len);
    bool bytes(Bytes &out);
    // a list length, bounded by what could possibly remain
    bool count(size_t &out, size_t min_elem_size = 1);

    size_t remaining() const { return remaining_; }
    bool failed() const { return failed_; }
    // true when nothing failed and every byte was consumed
    bool finish() const { return !failed_ && remaining_ == 0; }
};

// Decoded value or nullopt when the bytes are short, trailing, or malformed.
template <typename T, typename F>
std::optional<T> decode_exact(const ByteSlice &src, F&& read) {
    Decoder d(src);
    T out{};
    if (!read(d, out)) return std::nullopt;
    if (!d.finish()) return std::nullopt;
    return out;
}

template <typename T>
Bytes to_bytes(const T &value) {
    Encoder enc;
    value.encode(enc);
    return enc.take();
}

template <typename T>
std::optional<T> from_bytes(const ByteSlice &src) {
    return decode_exact<T>(src, [](Decoder &d, T &out) { return T::decode(d, out); });
}

template <typename T>
void encode_vec(Encoder &enc, const std::vector<T> &items) {
    enc.count(items.size());
    for (auto &item : items) item.encode(enc);
}

template <typename T>
bool decode_vec(Decoder &dec, std::vector<T> &out, size_t min_elem_size = 1) {
    size_t n;
    if (!dec.count(n, min_elem_size)) return false;
    out.clear();
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        T item{};
        if (!T::decode(dec, item)) return false;
        out.push_back(std::move(item));
    }
    return true;
}

inline void encode_scalars(Encoder &enc, const std::vector<Fr> &items) {
    enc.count(items.size());
    for (auto &s : items) enc.scalar(s);
}

inline bool decode_scalars(Decoder &dec, std::vector<Fr> &out) {
    size_t n;
    if (!dec.count(n, 32)) return false;
    out.resize(n);
    for (auto &s : out)
        if (!dec.scalar(s)) return false;
    return true;
}
