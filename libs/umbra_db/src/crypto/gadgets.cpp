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

#include "gadgets.h"
#include "merkle.h"
#include "mimc.h"

using libsnark::r1cs_constraint;

Fr lc_value(const Protoboard &pb, const LC &lc) {
    Fr acc = Fr::zero();
    for (auto &term : lc.terms)
        acc += term.coeff * pb.val(Var(term.index));
    return acc;
}

static Fr div_or_zero(const Fr &num, const Fr &den) {
    if (den.is_zero()) return Fr::zero();
    return num * den.inverse();
}


// =======================================
// ================ HASH =================
// =======================================

mimc_cipher_gadget::mimc_cipher_gadget(
    Protoboard &pb,
    const LC &x,
    const LC &key,
    const std::string &annotation
) : libsnark::gadget<Fr>(pb, annotation), x_(x), key_(key) {
    t2_.resize(MIMC_ROUNDS);
    t4_.resize(MIMC_ROUNDS);
    t6_.resize(MIMC_ROUNDS);
    out_.resize(MIMC_ROUNDS);
    for (size_t i = 0; i < MIMC_ROUNDS; i++) {
        t2_[i].allocate(pb, FMT(annotation, " t2_%zu", i));
        t4_[i].allocate(pb, FMT(annotation, " t4_%zu", i));
        t6_[i].allocate(pb, FMT(annotation, " t6_%zu", i));
        out_[i].allocate(pb, FMT(annotation, " out_%zu", i));
    }
}

LC mimc_cipher_gadget::round_input(size_t i) const {
    LC state = i == 0 ? x_ : LC(out_[i - 1]);
    return state + key_ + LC(mimc_constants()[i]);
}

void mimc_cipher_gadget::generate_r1cs_constraints() {
    for (size_t i = 0; i < MIMC_ROUNDS; i++) {
        LC t = round_input(i);
        pb.add_r1cs_constraint(r1cs_constraint<Fr>(t, t, t2_[i]), FMT(annotation_prefix, " t2_%zu", i));
        pb.add_r1cs_constraint(r1cs_constraint<Fr>(t2_[i], t2_[i], t4_[i]), FMT(annotation_prefix, " t4_%zu", i));
        pb.add_r1cs_constraint(r1cs_constraint<Fr>(t4_[i], t2_[i], t6_[i]), FMT(annotation_prefix, " t6_%zu", i));
        pb.add_r1cs_constraint(r1cs_constraint<Fr>(t6_[i], t, out_[i]), FMT(annotation_prefix, " out_%zu", i));
    }
}

void mimc_cipher_gadget::generate_r1cs_witness() {
    for (size_t i = 0; i < MIMC_ROUNDS; i++) {
        Fr t = lc_value(pb, round_input(i));
        Fr t2 = t.squared();
        Fr t4 = t2.squared();
        Fr t6 = t4 * t2;
        pb.val(t2_[i]) = t2;
        pb.val(t4_[i]) = t4;
        pb.val(t6_[i]) = t6;
        pb.val(out_[i]) = t6 * t;
    }
}

LC mimc_cipher_gadget::result() const {
    return LC(out_.back()) + key_;
}

mimc_hash_gadget::mimc_hash_gadget(
    Protoboard &pb,
    const std::vector<LC> &elements,
    const LC &iv,
    const std::string &annotation
) : libsnark::gadget<Fr>(pb, annotation), elements_(elements), iv_(iv) {
    LC h = iv_;
    for (size_t i = 0; i < elements_.size(); i++) {
        ciphers_.emplace_back(new mimc_cipher_gadget(pb, elements_[i], h, FMT(annotation, " cipher_%zu", i)));
        chain_.emplace_back();
        chain_.back().allocate(pb, FMT(annotation, " h_%zu", i));
        h = LC(chain_.back());
    }
}

void mimc_hash_gadget::generate_r1cs_constraints() {
    for (size_t i = 0; i < ciphers_.size(); i++) {
        ciphers_[i]->generate_r1cs_constraints();
        LC prev = i == 0 ? iv_ : LC(chain_[i - 1]);
        pb.add_r1cs_constraint(
            r1cs_constraint<Fr>(1, ciphers_[i]->result() + prev + elements_[i], chain_[i]),
            FMT(annotation_prefix, " chain_%zu", i)
        );
    }
}

void mimc_hash_gadget::generate_r1cs_witness() {
    for (size_t i = 0; i < ciphers_.size(); i++) {
        ciphers_[i]->generate_r1cs_witness();
        LC prev = i == 0 ? iv_ : LC(chain_[i - 1]);
        pb.val(chain_[i]) = lc_value(pb, ciphers_[i]->result() + prev + elements_[i]);
    }
}

std::unique_ptr<mimc_hash_gadget> make_field_hash(
    Protoboard &pb,
    const std::vector<LC> &elements,
    const std::string &annotation
) {
    LC iv(fr_from_u64(elements.size()));
    return std::make_unique<mimc_hash_gadget>(pb, elements, iv, annotation);
}


// =======================================
// ================ BITS =================
// =======================================

range_check_gadget::range_check_gadget(
    Protoboard &pb,
    const LC &value,
    size_t n,
    const std::string &annotation
) : libsnark::gadget<Fr>(pb, annotation), value_(value) {
    bits_.allocate(pb, n, FMT(annotation, " bits"));

    libsnark::pb_linear_combination<Fr> packed;
    packed.assign(pb, value_);
    packer_ = std::make_unique<libsnark::packing_gadget<Fr>>(pb, bits_, packed, FMT(annotation, " pack"));
}

void range_check_gadget::generate_r1cs_constraints() {
    packer_->generate_r1cs_constraints(true);
}

void range_check_gadget::generate_r1cs_witness() {
    bits_.fill_with_bits_of_field_element(pb, lc_value(pb, value_));
}

nonzero_gadget::nonzero_gadget(
    Protoboard &pb,
    const LC &value,
    const std::string &annotation
) : libsnark::gadget<Fr>(pb, annotation), value_(value) {
    inverse_.allocate(pb, FMT(annotation, " inverse"));
}

void nonzero_gadget::generate_r1cs_constraints() {
    pb.add_r1cs_constraint(r1cs_constraint<Fr>(value_, inverse_, 1), FMT(annotation_prefix, " nonzero"));
}

void nonzero_gadget::generate_r1cs_witness() {
    pb.val(inverse_) = div_or_zero(Fr::one(), lc_value(pb, value_));
}


// =======================================
// =============== JUBJUB ================
// =======================================

point_add_gadget::point_add_gadget(
    Protoboard &pb,
    const LC &x1, const LC &y1,
    const LC &x2, const LC &y2,
    const std::string &annotation
) : libsnark::gadget<Fr>(pb, annotation), x1_(x1), y1_(y1), x2_(x2), y2_(y2) {
    beta_.allocate(pb, FMT(annotation, " beta"));
    gamma_.allocate(pb, FMT(annotation, " gamma"));
    delta_.allocate(pb, FMT(annotation, " delta"));
    tau_.allocate(pb, FMT(annotation, " tau"));
    x3_.allocate(pb, FMT(annotation, " x3"));
    y3_.allocate(pb, FMT(annotation, " y3"));
}

// delta + a*beta - gamma = y1*y2 - a*x1*x2
void point_add_gadget::generate_r1cs_constraints() {
    const Fr &a = jub_a();
    const Fr &d = jub_d();

    pb.add_r1cs_constraint(r1cs_constraint<Fr>(x1_, y2_, beta_), FMT(annotation_prefix, " beta"));
    pb.add_r1cs_constraint(r1cs_constraint<Fr>(y1_, x2_, gamma_), FMT(annotation_prefix, " gamma"));
    pb.add_r1cs_constraint(
        r1cs_constraint<Fr>(y1_ - x1_ * a, x2_ + y2_, delta_),
        FMT(annotation_prefix, " delta")
    );
    pb.add_r1cs_constraint(r1cs_constraint<Fr>(beta_, gamma_, tau_), FMT(annotation_prefix, " tau"));
    pb.add_r1cs_constraint(
        r1cs_constraint<Fr>(LC(Fr::one()) + LC(tau_) * d, x3_, LC(beta_) + LC(gamma_)),
        FMT(annotation_prefix, " x3")
    );
    pb.add_r1cs_constraint(
        r1cs_constraint<Fr>(LC(Fr::one()) - LC(tau_) * d, y3_, LC(delta_) + LC(beta_) * a - LC(gamma_)),
        FMT(annotation_prefix, " y3")
    );
}

void point_add_gadget::generate_r1cs_witness() {
    const Fr &a = jub_a();
    const Fr &d = jub_d();

    Fr x1 = lc_value(pb, x1_), y1 = lc_value(pb, y1_);
    Fr x2 = lc_value(pb, x2_), y2 = lc_value(pb, y2_);

    Fr beta = x1 * y2;
    Fr gamma = y1 * x2;
    Fr delta = (y1 - a * x1) * (x2 + y2);
    Fr tau = beta * gamma;

    pb.val(beta_) = beta;
    pb.val(gamma_) = gamma;
    pb.val(delta_) = delta;
    pb.val(tau_) = tau;
    pb.val(x3_) = div_or_zero(beta + gamma, Fr::one() + d * tau);
    pb.val(y3_) = div_or_zero(delta + a * beta - gamma, Fr::one() - d * tau);
}

fixed_base_sum_gadget::fixed_base_sum_gadget(
    Protoboard &pb,
    const std::vector<Segment> &segments,
    const std::string &annotation
) : libsnark::gadget<Fr>(pb, annotation) {
    for (auto &seg : segments) {
        EcPoint p = seg.base;
        for (auto &bit : seg.bits) {
            bits_.push_back(bit);
            points_.push_back(p);
            p = jub_add(p, p);
        }
    }

    LC acc_x = select_x(0);
    LC acc_y = select_y(0);
    for (size_t i = 1; i < bits_.size(); i++) {
        adds_.emplace_back(new point_add_gadget(
            pb, acc_x, acc_y, select_x(i), select_y(i), FMT(annotation, " add_%zu", i)
        ));
        acc_x = adds_.back()->x();
        acc_y = adds_.back()->y();
    }
}

LC fixed_base_sum_gadget::select_x(size_t i) const {
    return LC(bits_[i]) * points_[i].x;
}

LC fixed_base_sum_gadget::select_y(size_t i) const {
    return LC(Fr::one()) + LC(bits_[i]) * (points_[i].y - Fr::one());
}

// bits are constrained boolean by whoever allocated them
void fixed_base_sum_gadget::generate_r1cs_constraints() {
    for (auto &add : adds_) add->generate_r1cs_constraints();
}

void fixed_base_sum_gadget::generate_r1cs_witness() {
    for (auto &add : adds_) add->generate_r1cs_witness();
}

LC fixed_base_sum_gadget::x() const {
    return adds_.empty() ? select_x(0) : adds_.back()->x();
}

LC fixed_base_sum_gadget::y() const {
    return adds_.empty() ? select_y(0) : adds_.back()->y();
}


// =======================================
// =============== MERKLE ================
// =======================================

merkle_path_gadget::merkle_path_gadget(
    Protoboard &pb,
    const LC &leaf,
    const VarArray &position_bits,
    const std::vector<Var> &siblings,
    const std::string &annotation
) : libsnark::gadget<Fr>(pb, annotation), position_bits_(position_bits), siblings_(siblings) {
    deltas_.resize(MERKLE_DEPTH);

    LC node = leaf;
    for (size_t h = 0; h < MERKLE_DEPTH; h++) {
        deltas_[h].allocate(pb, FMT(annotation, " delta_%zu", h));

        // bit set swaps (node, sibling) into (sibling, node)
        LC left = node + LC(deltas_[h]);
        LC right = LC(siblings_[h]) - LC(deltas_[h]);
        hashers_.emplace_back(new mimc_hash_gadget(
            pb, {left, right}, LC(merkle_level_iv(h)), FMT(annotation, " level_%zu", h)
        ));

        nodes_.push_back(node);
        node = LC(hashers_.back()->result());
    }
}

void merkle_path_gadget::generate_r1cs_constraints() {
    for (size_t h = 0; h < MERKLE_DEPTH; h++) {
        pb.add_r1cs_constraint(
            r1cs_constraint<Fr>(position_bits_[h], LC(siblings_[h]) - nodes_[h], deltas_[h]),
            FMT(annotation_prefix, " delta_%zu", h)
        );
        hashers_[h]->generate_r1cs_constraints();
    }
}

void merkle_path_gadget::generate_r1cs_witness() {
    for (size_t h = 0; h < MERKLE_DEPTH; h++) {
        Fr bit = pb.val(position_bits_[h]);
        pb.val(deltas_[h]) = bit * (pb.val(siblings_[h]) - lc_value(pb, nodes_[h]));
        hashers_[h]->generate_r1cs_witness();
    }
}
