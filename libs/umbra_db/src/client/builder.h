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
#include "coin.h"
#include "merkle.h"
#include "result.h"
#include "tx.h"

enum class BuilderError {
    NoInputs,
    NoOutputs,
    InsufficientFunds,
    ValueMismatch,
    TokenMismatch,
    MissingMerklePath,
    MissingProvingKey,
    NonNativeToken,
    UnsatisfiedCircuit,
    EncryptionFailed,
};

const char* builder_error_str(BuilderError err);

// One built call: the call itself, its proofs in metadata order and the
// secrets whose signatures its metadata asks for, also in order.
struct CallDebris {
    ContractCall call;
    std::vector<Proof> proofs;
    std::vector<SecretKey> signature_secrets;
};

// Calls that only validate next to each other, first then second.
struct CallPair {
    CallDebris first;
    CallDebris second;
};

// A coin to spend together with its authentication path.
struct SpendCoin {
    OwnCoin coin;
    MerklePath path;
};

// Collects built calls and signs the finished transaction.
class TransactionBuilder {
private:
    std::vector<CallDebris> calls_;

public:
    TransactionBuilder& append(CallDebris debris);
    size_t size() const { return calls_.size(); }

    // every secret of every call signs the transaction's signing hash
    Transaction build() const;
};

// Proves a witness against the named circuit. A witness that breaks one of
// its constraints is refused before the prover runs.
Result<Proof, BuilderError> prove(const ZkSetup &zk, const std::string &circuit, const Witness &witness);

// leaf_pos then the 32 siblings, as every circuit lays out a merkle path
void push_path(Witness &w, const MerklePath &path);
