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


#include "builder.h"
#include "log.h"

const char* builder_error_str(BuilderError err) {
    switch (err) {
        case BuilderError::NoInputs:          return "no inputs";
        case BuilderError::NoOutputs:         return "no outputs";
        case BuilderError::InsufficientFunds: return "insufficient funds";
        case BuilderError::ValueMismatch:     return "value mismatch";
        case BuilderError::TokenMismatch:     return "token mismatch";
        case BuilderError::MissingMerklePath: return "missing merkle path";
        case BuilderError::MissingProvingKey: return "missing proving key";
        case BuilderError::NonNativeToken:    return "non native token";
        case BuilderError::UnsatisfiedCircuit: return "witness does not satisfy circuit";
        case BuilderError::EncryptionFailed:  return "note encryption failed";
    }
    return "unknown";
}

TransactionBuilder& TransactionBuilder::append(CallDebris debris) {
    calls_.push_back(std::move(debris));
    return *this;
}

Transaction TransactionBuilder::build() const {
    Transaction tx;
    for (auto &debris : calls_) {
        tx.calls.push_back(debris.call);
        tx.proofs.push_back(debris.proofs);
    }

    Hash sighash = tx.signing_hash();
    for (auto &debris : calls_) {
        std::vector<Signature> sigs;
        for (auto &secret : debris.signature_secrets)
            sigs.push_back(sign(secret, sighash));
        tx.signatures.push_back(std::move(sigs));
    }

    log_debug("builder", "built tx with %zu calls", tx.calls.size());
    return tx;
}

Result<Proof, BuilderError> prove(const ZkSetup &zk, const std::string &circuit, const Witness &witness) {
    const ProvingKey* pk = zk.proving_key(circuit);
    if (pk == nullptr) return BuilderError::MissingProvingKey;
    if (!evaluate_circuit(*pk, witness).has_value()) {
        log_debug("builder", "witness for %s does not satisfy the circuit", circuit.c_str());
        return BuilderError::UnsatisfiedCircuit;
    }
    return create_proof(*pk, witness);
}

void push_path(Witness &w, const MerklePath &path) {
    w.push_back(fr_from_u64(path.position));
    for (auto &sibling : path.siblings) w.push_back(sibling);
}
