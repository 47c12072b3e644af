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

#include "proof.h"
#include "circuits.h"
#include "log.h"

using libsnark::r1cs_constraint;
using G1 = libff::alt_bn128_G1;
using G2 = libff::alt_bn128_G2;
using Fq = libff::alt_bn128_Fq;
using Fq2 = libff::alt_bn128_Fq2;


// =======================================
// =============== CIRCUIT ===============
// =======================================

circuit_gadget::circuit_gadget(
    Protoboard &pb,
    size_t public_len,
    size_t witness_len,
    const std::string &annotation
) : libsnark::gadget<Fr>(pb, annotation) {
    inputs_.allocate(pb, public_len, FMT(annotation, " inputs"));
    pb.set_input_sizes(public_len);
    witness_.allocate(pb, witness_len, FMT(annotation, " witness"));
}

Var circuit_gadget::hash(const std::vector<LC> &elements, const std::string &annotation) {
    return add<mimc_hash_gadget>(elements, LC(fr_from_u64(elements.size())), annotation).result();
}

Var circuit_gadget::product(const LC &a, const LC &b, const std::string &annotation) {
    Var c;
    c.allocate(pb, annotation);
    constraint_steps_.push_back([this, a, b, c, annotation] {
        pb.add_r1cs_constraint(r1cs_constraint<Fr>(a, b, c), annotation);
    });
    witness_steps_.push_back([this, a, b, c] {
        pb.val(c) = lc_value(pb, a) * lc_value(pb, b);
    });
    return c;
}

void circuit_gadget::enforce_equal(const LC &a, const LC &b, const std::string &annotation) {
    constraint_steps_.push_back([this, a, b, annotation] {
        pb.add_r1cs_constraint(r1cs_constraint<Fr>(1, a, b), annotation);
    });
}

void circuit_gadget::enforce_boolean(const LC &a, const std::string &annotation) {
    constraint_steps_.push_back([this, a, annotation] {
        pb.add_r1cs_constraint(r1cs_constraint<Fr>(a, LC(Fr::one()) - a, 0), annotation);
    });
}

void circuit_gadget::generate_r1cs_constraints() {
    for (auto &step : constraint_steps_) step();
    for (size_t i = 0; i < outputs_.size(); i++)
        pb.add_r1cs_constraint(
            r1cs_constraint<Fr>(1, inputs_[i], outputs_[i]),
            FMT(annotation_prefix, " output_%zu", i)
        );
}

void circuit_gadget::generate_r1cs_witness(const Witness &w) {
    for (size_t i = 0; i < witness_.size(); i++)
        pb.val(witness_[i]) = i < w.size() ? w[i] : Fr::zero();

    for (auto &step : witness_steps_) step();
    for (size_t i = 0; i < outputs_.size(); i++)
        pb.val(inputs_[i]) = lc_value(pb, outputs_[i]);
}

CircuitAssignment assign_circuit(const Circuit &circuit, const Witness &witness) {
    init_field_params();

    Protoboard pb;
    auto gadget = circuit.build(pb);
    gadget->generate_r1cs_constraints();
    gadget->generate_r1cs_witness(witness);

    return CircuitAssignment{pb.primary_input(), pb.auxiliary_input(), pb.is_satisfied()};
}


// =======================================
// ================ PROOF ================
// =======================================

// (0, 0) stands for the point at infinity, it is on neither curve
static void encode_g1(Encoder &enc, G1 p) {
    p.to_affine_coordinates();
    bool zero = p.is_zero();
    auto x = field_to_le(zero ? Fq::zero() : p.X);
    auto y = field_to_le(zero ? Fq::zero() : p.Y);
    enc.raw(x.data(), x.size());
    enc.raw(y.data(), y.size());
}

static void encode_g2(Encoder &enc, G2 p) {
    p.to_affine_coordinates();
    bool zero = p.is_zero();
    for (const Fq &c : {p.X.c0, p.X.c1, p.Y.c0, p.Y.c1}) {
        auto le = field_to_le(zero ? Fq::zero() : c);
        enc.raw(le.data(), le.size());
    }
}

static bool decode_fq(Decoder &dec, Fq &out) {
    bytes32 le;
    if (!dec.raw(le.data(), le.size())) return false;
    auto v = field_from_le<Fq>(le.data());
    if (!v.has_value()) return false;
    out = v.value();
    return true;
}

static bool decode_g1(Decoder &dec, G1 &out) {
    Fq x, y;
    if (!decode_fq(dec, x) || !decode_fq(dec, y)) return false;

    out = x.is_zero() && y.is_zero() ? G1::zero() : G1(x, y, Fq::one());
    return out.is_well_formed();
}

// G2 has a cofactor, so a point on the twist still has to be checked
// against the order of the group the keys live in
static bool decode_g2(Decoder &dec, G2 &out) {
    Fq x0, x1, y0, y1;
    if (!decode_fq(dec, x0) || !decode_fq(dec, x1)) return false;
    if (!decode_fq(dec, y0) || !decode_fq(dec, y1)) return false;

    Fq2 x(x0, x1), y(y0, y1);
    out = x.is_zero() && y.is_zero() ? G2::zero() : G2(x, y, Fq2::one());
    if (!out.is_well_formed()) return false;
    return (Fr::field_char() * out).is_zero();
}

void Proof::encode(Encoder &enc) const {
    encode_g1(enc, inner.g_A.g);
    encode_g1(enc, inner.g_A.h);
    encode_g2(enc, inner.g_B.g);
    encode_g1(enc, inner.g_B.h);
    encode_g1(enc, inner.g_C.g);
    encode_g1(enc, inner.g_C.h);
    encode_g1(enc, inner.g_H);
    encode_g1(enc, inner.g_K);
}

bool Proof::decode(Decoder &dec, Proof &out) {
    init_field_params();
    return decode_g1(dec, out.inner.g_A.g)
        && decode_g1(dec, out.inner.g_A.h)
        && decode_g2(dec, out.inner.g_B.g)
        && decode_g1(dec, out.inner.g_B.h)
        && decode_g1(dec, out.inner.g_C.g)
        && decode_g1(dec, out.inner.g_C.h)
        && decode_g1(dec, out.inner.g_H)
        && decode_g1(dec, out.inner.g_K);
}


// =======================================
// ================ SETUP ================
// =======================================

ZkSetup::ZkSetup() {
    init_field_params();

    for (auto &circuit : all_circuits()) {
        Protoboard pb;
        auto gadget = circuit->build(pb);
        gadget->generate_r1cs_constraints();

        auto keypair = libsnark::r1cs_ppzksnark_generator<snark_pp>(pb.get_constraint_system());
        log_debug(
            "zk", "circuit %s: %zu constraints, %zu public inputs",
            circuit->name.c_str(), pb.num_constraints(), circuit->public_len
        );

        vks_.emplace(circuit->name, VerifyingKey{
            circuit->name,
            circuit->public_len,
            libsnark::r1cs_ppzksnark_verifier_process_vk<snark_pp>(keypair.vk),
        });
        pks_.emplace(circuit->name, ProvingKey{circuit, std::move(keypair.pk)});
    }
}

const ProvingKey* ZkSetup::proving_key(const std::string &circuit) const {
    auto it = pks_.find(circuit);
    return it == pks_.end() ? nullptr : &it->second;
}

const VerifyingKey* ZkSetup::verifying_key(const std::string &circuit) const {
    auto it = vks_.find(circuit);
    return it == vks_.end() ? nullptr : &it->second;
}

std::optional<PublicInputs> evaluate_circuit(const ProvingKey &pk, const Witness &witness) {
    if (witness.size() != pk.circuit->witness_len) return std::nullopt;
    auto assignment = assign_circuit(*pk.circuit, witness);
    if (!assignment.satisfied) return std::nullopt;
    return assignment.primary;
}

Proof create_proof(const ProvingKey &pk, const Witness &witness) {
    auto assignment = assign_circuit(*pk.circuit, witness);
    return Proof{libsnark::r1cs_ppzksnark_prover<snark_pp>(pk.inner, assignment.primary, assignment.auxiliary)};
}

bool verify_proof(
    const VerifyingKey &vk,
    const Proof &proof,
    const PublicInputs &public_inputs
) {
    if (public_inputs.size() != vk.public_len) return false;
    return libsnark::r1cs_ppzksnark_online_verifier_strong_IC<snark_pp>(vk.inner, public_inputs, proof.inner);
}
