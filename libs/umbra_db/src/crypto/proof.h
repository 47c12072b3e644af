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
#include "gadgets.h"
#include "keys.h"
#include "serialize.h"
#include <libsnark/zk_proof_systems/ppzksnark/r1cs_ppzksnark/r1cs_ppzksnark.hpp>
#include <functional>
#include <map>
#include <memory>

using PublicInputs = std::vector<Fr>;
using Witness = std::vector<Fr>;

/*
 *  Base of every circuit. The public inputs are allocated first so they
 *  form the primary input, then one variable per positional witness
 *  element. A subclass builds its gadgets through add() and leaves one
 *  value per public input in outputs_, and the base pins each public
 *  input to its value.
 */
class circuit_gadget : public libsnark::gadget<Fr> {
private:
    std::vector<std::shared_ptr<void>> owned_;
    std::vector<std::function<void()>> constraint_steps_;
    std::vector<std::function<void()>> witness_steps_;

protected:
    VarArray inputs_;
    VarArray witness_;
    std::vector<LC> outputs_;

    LC w(size_t i) const { return LC(witness_[i]); }

    // gadgets run their witness in the order they were added
    template <typename G, typename... Args>
    G& add(Args&&... args) {
        auto g = std::make_shared<G>(pb, std::forward<Args>(args)...);
        G* raw = g.get();
        owned_.push_back(g);
        constraint_steps_.push_back([raw] { raw->generate_r1cs_constraints(); });
        witness_steps_.push_back([raw] { raw->generate_r1cs_witness(); });
        return *raw;
    }

    Var hash(const std::vector<LC> &elements, const std::string &annotation);
    // fresh variable constrained to a * b
    Var product(const LC &a, const LC &b, const std::string &annotation);
    void enforce_equal(const LC &a, const LC &b, const std::string &annotation);
    void enforce_boolean(const LC &a, const std::string &annotation);

public:
    circuit_gadget(Protoboard &pb, size_t public_len, size_t witness_len, const std::string &annotation);
    virtual ~circuit_gadget() = default;

    void generate_r1cs_constraints();
    // elements past the end of w read as zero
    void generate_r1cs_witness(const Witness &w);
};

using CircuitFactory = std::function<std::unique_ptr<circuit_gadget>(Protoboard&)>;

struct Circuit {
    std::string name;
    size_t witness_len;
    size_t public_len;
    CircuitFactory build;
};

struct CircuitAssignment {
    PublicInputs primary;
    std::vector<Fr> auxiliary;
    bool satisfied;
};

// Runs a circuit over a witness. The public inputs are whatever the
// witness computes, satisfied says whether every constraint held.
CircuitAssignment assign_circuit(const Circuit &circuit, const Witness &witness);

struct ProvingKey {
    std::shared_ptr<const Circuit> circuit;
    libsnark::r1cs_ppzksnark_proving_key<snark_pp> inner;
};

struct VerifyingKey {
    std::string name;
    size_t public_len;
    libsnark::r1cs_ppzksnark_processed_verification_key<snark_pp> inner;
};

// seven G1 points and one G2 point, affine, 576 bytes on the wire
struct Proof {
    libsnark::r1cs_ppzksnark_proof<snark_pp> inner;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, Proof &out);
};

constexpr size_t PROOF_SIZE = 7 * 64 + 128;

/*
 * One r1cs_ppzksnark keypair per circuit, generated from fresh randomness
 * that is dropped once the keys exist. Read only after construction, so
 * it can be shared by any number of concurrent provers and verifiers.
 */
class ZkSetup {
private:
    std::map<std::string, ProvingKey> pks_;
    std::map<std::string, VerifyingKey> vks_;

public:
    ZkSetup();

    const ProvingKey* proving_key(const std::string &circuit) const;
    const VerifyingKey* verifying_key(const std::string &circuit) const;
};

// Always returns a proof. A witness that is short, transposed, or fails a
// constraint produces one that will not verify against the intended inputs.
Proof create_proof(const ProvingKey &pk, const Witness &witness);
bool verify_proof(const VerifyingKey &vk, const Proof &proof, const PublicInputs &public_inputs);

// public inputs the witness evaluates to, used by builders to fill calls.
// nullopt when the witness has the wrong length or breaks a constraint.
std::optional<PublicInputs> evaluate_circuit(const ProvingKey &pk, const Witness &witness);
