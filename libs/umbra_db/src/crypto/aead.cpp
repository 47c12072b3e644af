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


#include "aead.h"
#include <openssl/evp.h>
#include <openssl/rand.h>

static const std::string NOTE_KDF_TAG = "umbra:note_kdf";

static Hash derive_note_key(const EcPoint &shared, const EcPoint &ephem_public) {
    auto shared_comp = compress_jub(shared);
    auto ephem_comp = compress_jub(ephem_public);

    BlakeHasher hasher;
    hasher.update(NOTE_KDF_TAG);
    hasher.update(shared_comp.data(), shared_comp.size());
    hasher.update(ephem_comp.data(), ephem_comp.size());
    return hasher.finalize();
}

void AeadEncrypted::encode(Encoder &enc) const {
    enc.point(ephem_public);
    enc.bytes(ciphertext);
}

bool AeadEncrypted::decode(Decoder &dec, AeadEncrypted &out) {
    if (!dec.point(out.ephem_public)) return false;
    if (!dec.bytes(out.ciphertext)) return false;
    return true;
}

std::optional<AeadEncrypted> aead_seal(const PublicKey &recipient, const ByteSlice &plaintext) {
    // a key of order dividing the cofactor leaves a shared point anyone can guess
    if (!jub_on_curve(recipient.spend) || jub_is_identity(jub_mul_u64(recipient.spend, 8)))
        return std::nullopt;

    Fs ephem = rand_fs();
    EcPoint ephem_public = jub_mul(jub_base(), ephem);
    EcPoint shared = jub_mul(recipient.spend, ephem);
    Hash key = derive_note_key(shared, ephem_public);

    Bytes out(AEAD_NONCE_LEN + plaintext.size() + AEAD_TAG_LEN);
    byte* nonce = out.data();
    byte* ct = nonce + AEAD_NONCE_LEN;
    byte* tag = ct + plaintext.size();

    if (RAND_bytes(nonce, AEAD_NONCE_LEN) != 1) return std::nullopt;

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) return std::nullopt;

    int outlen = 0, finlen = 0;
    bool ok =
        EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, AEAD_NONCE_LEN, nullptr) == 1 &&
        EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce) == 1 &&
        EVP_EncryptUpdate(ctx, ct, &outlen, plaintext.data(), static_cast<int>(plaintext.size())) == 1 &&
        EVP_EncryptFinal_ex(ctx, ct + outlen, &finlen) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, AEAD_TAG_LEN, tag) == 1;
    EVP_CIPHER_CTX_free(ctx);

    if (!ok) return std::nullopt;
    return AeadEncrypted{ephem_public, std::move(out)};
}

std::optional<Bytes> aead_open(const SecretKey &secret, const AeadEncrypted &box) {
    if (box.ciphertext.size() < AEAD_NONCE_LEN + AEAD_TAG_LEN) return std::nullopt;

    EcPoint shared = jub_mul(box.ephem_public, secret.spend);
    Hash key = derive_note_key(shared, box.ephem_public);

    size_t ct_len = box.ciphertext.size() - AEAD_NONCE_LEN - AEAD_TAG_LEN;
    const byte* nonce = box.ciphertext.data();
    const byte* ct = nonce + AEAD_NONCE_LEN;
    const byte* tag = ct + ct_len;

    // one spare byte so data() is never null for an empty plaintext
    Bytes plain(ct_len + 1);

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) return std::nullopt;

    int outlen = 0, finlen = 0;
    bool ok =
        EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, AEAD_NONCE_LEN, nullptr) == 1 &&
        EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce) == 1 &&
        EVP_DecryptUpdate(ctx, plain.data(), &outlen, ct, static_cast<int>(ct_len)) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, AEAD_TAG_LEN, const_cast<byte*>(tag)) == 1 &&
        EVP_DecryptFinal_ex(ctx, plain.data() + outlen, &finlen) == 1;
    EVP_CIPHER_CTX_free(ctx);

    if (!ok) return std::nullopt;
    plain.resize(ct_len);
    return plain;
}
