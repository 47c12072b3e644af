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
#include "utils.h"
#include <libff/common/utils.hpp>
#include <libsnark/gadgetlib1/gadget.hpp>
#include <libsnark/gadgetlib1/gadgets/basic_gadgets.hpp>
#include <libsnark/gadgetlib1/pb_variable.hpp>
#include <libsnark/gadgetlib1/protoboard.hpp>
#include <memory>

using Protoboard = libsnark::protoboard<Fr>;
using Var = libsnark::pb_variable<Fr>;
using VarArray = libsnark::pb_variable_array<Fr>;
using LC = libsnark::linear_combination<Fr>;

// value of a linear combination under the current assignment
Fr lc_value(const Protoboard &pb, const LC &lc);


// =======================================
// ================ HASH =================
// =======================================

// MiMC-7 round function, four constraints per round
class mimc_cipher_gadget : public libsnark::gadget<Fr> {
private:
    LC x_;
    LC key_;
    std::vector<Var> t2_, t4_, t6_, out_;

    LC round_input(size_t i) const;

public:
    mimc_cipher_gadget(Protoboard &pb, const LC &x, const LC &key, const std::string &annotation);

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
    LC result() const;
};

// Miyaguchi-Preneel over the cipher, matches mimc_hash()
class mimc_hash_gadget : public libsnark::gadget<Fr> {
private:
    std::vector<LC> elements_;
    LC iv_;
    std::vector<std::unique_ptr<mimc_cipher_gadget>> ciphers_;
    std::vector<Var> chain_;

public:
    mimc_hash_gadget(
        Protoboard &pb,
        const std::vector<LC> &elements,
        const LC &iv,
        const std::string &annotation
    );

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
    Var result() const { return chain_.back(); }
};

// field_hash() in circuit form, the arity is the initial value
std::unique_ptr<mimc_hash_gadget> make_field_hash(
    Protoboard &pb,
    const std::vector<LC> &elements,
    const std::string &annotation
);


// =======================================
// ================ BITS =================
// =======================================

/*
 *  Decomposes a value into n little endian bits, which proves it lies in
 *  [0, 2^n). The witness takes the low n bits, so a value that does not
 *  fit leaves the packing constraint unsatisfied.
 */
class range_check_gadget : public libsnark::gadget<Fr> {
private:
    LC value_;
    VarArray bits_;
    std::unique_ptr<libsnark::packing_gadget<Fr>> packer_;

public:
    range_check_gadget(Protoboard &pb, const LC &value, size_t n, const std::string &annotation);

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
    const VarArray& bits() const { return bits_; }
};

// value * inverse = 1
class nonzero_gadget : public libsnark::gadget<Fr> {
private:
    LC value_;
    Var inverse_;

public:
    nonzero_gadget(Protoboard &pb, const LC &value, const std::string &annotation);

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};


// =======================================
// =============== JUBJUB ================
// =======================================

// complete twisted Edwards addition, six constraints
class point_add_gadget : public libsnark::gadget<Fr> {
private:
    LC x1_, y1_, x2_, y2_;
    Var beta_, gamma_, delta_, tau_, x3_, y3_;

public:
    point_add_gadget(
        Protoboard &pb,
        const LC &x1, const LC &y1,
        const LC &x2, const LC &y2,
        const std::string &annotation
    );

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
    LC x() const { return LC(x3_); }
    LC y() const { return LC(y3_); }
};

/*
 *  sum_j bits_j * 2^i * base_j over several fixed bases. Each bit selects
 *  its point linearly, (b * Px, 1 + b * (Py - 1)), so only the chained
 *  additions cost constraints.
 */
class fixed_base_sum_gadget : public libsnark::gadget<Fr> {
private:
    std::vector<Var> bits_;
    std::vector<EcPoint> points_;
    std::vector<std::unique_ptr<point_add_gadget>> adds_;

    LC select_x(size_t i) const;
    LC select_y(size_t i) const;

public:
    struct Segment {
        VarArray bits;
        EcPoint base;
    };

    fixed_base_sum_gadget(Protoboard &pb, const std::vector<Segment> &segments, const std::string &annotation);

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
    LC x() const;
    LC y() const;
};


// =======================================
// =============== MERKLE ================
// =======================================

// root above a leaf, matches merkle_root_from_path()
class merkle_path_gadget : public libsnark::gadget<Fr> {
private:
    VarArray position_bits_;
    std::vector<Var> siblings_;
    std::vector<Var> deltas_;
    std::vector<LC> nodes_;
    std::vector<std::unique_ptr<mimc_hash_gadget>> hashers_;

public:
    merkle_path_gadget(
        Protoboard &pb,
        const LC &leaf,
        const VarArray &position_bits,
        const std::vector<Var> &siblings,
        const std::string &annotation
    );

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
    Var root() const { return hashers_.back()->result(); }
};
