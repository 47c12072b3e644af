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
#include "ids.h"
#include "keys.h"
#include "proof.h"
#include "serialize.h"

struct ContractCall {
    ContractId contract_id;
    uint8_t function;
    Bytes params;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, ContractCall &out);
};

/*
 *  Ordered calls, with one proof bundle and one signature bundle per call.
 *  Signatures cover signing_hash(), which commits to every call and proof
 *  but to no signature.
 */
struct Transaction {
    std::vector<ContractCall> calls;
    std::vector<std::vector<Proof>> proofs;
    std::vector<std::vector<Signature>> signatures;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, Transaction &out);

    Hash signing_hash() const;
    Hash hash() const;
};

// What a call needs verified before it may touch state.
struct CallMetadata {
    std::vector<std::pair<std::string, PublicInputs>> zk_public_inputs;
    std::vector<PublicKey> signature_pubkeys;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, CallMetadata &out);
};
