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

#include "circuits.h"
#include "commit.h"
#include "merkle.h"

const std::string MONEY_MINT_CIRCUIT        = "Money::Mint_V1";
const std::string MONEY_BURN_CIRCUIT        = "Money::Burn_V1";
const std::string CONSENSUS_REWARD_CIRCUIT  = "Consensus::Reward_V1";
const std::string DAO_MINT_CIRCUIT          = "Dao::Mint";
const std::string DAO_PROPOSE_BURN_CIRCUIT  = "Dao::ProposeBurn";
const std::string DAO_PROPOSE_MAIN_CIRCUIT  = "Dao::ProposeMain";
const std::string DAO_VOTE_BURN_CIRCUIT     = "Dao::VoteBurn";
const std::string DAO_VOTE_MAIN_CIRCUIT     = "Dao::VoteMain";
const std::string DAO_EXEC_CIRCUIT          = "Dao::Exec";

constexpr size_t PATH_LEN = 1 + MERKLE_DEPTH;
constexpr size_t DAO_PARAMS_LEN = 8;
constexpr size_t VALUE_BITS = 64;

namespace {

// -------------------- PIECES ---------------------------

// v*G_V + r*G_R with v below 2^64
class value_commit_gadget : public libsnark::gadget<Fr> {
private:
    range_check_gadget value_bits_;
    range_check_gadget blind_bits_;
    fixed_base_sum_gadget sum_;

public:
    value_commit_gadget(Protoboard &pb, const LC &value, const LC &blind, const std::string &annotation)
        : libsnark::gadget<Fr>(pb, annotation),
          value_bits_(pb, value, VALUE_BITS, FMT(annotation, " value")),
          blind_bits_(pb, blind, FS_BITS, FMT(annotation, " blind")),
          sum_(pb, {
              {value_bits_.bits(), value_generator()},
              {blind_bits_.bits(), blind_generator()},
          }, FMT(annotation, " sum")) {}

    void generate_r1cs_constraints() {
        value_bits_.generate_r1cs_constraints();
        blind_bits_.generate_r1cs_constraints();
        sum_.generate_r1cs_constraints();
    }

    void generate_r1cs_witness() {
        value_bits_.generate_r1cs_witness();
        blind_bits_.generate_r1cs_witness();
        sum_.generate_r1cs_witness();
    }

    LC x() const { return sum_.x(); }
    LC y() const { return sum_.y(); }
};

// s*B for a secret s below the subgroup order, so each key has one secret
class spend_key_gadget : public libsnark::gadget<Fr> {
private:
    range_check_gadget secret_bits_;
    range_check_gadget below_order_;
    fixed_base_sum_gadget public_;

    static Fr max_secret() {
        return Fr(babyjub_order) - Fr::one();
    }

public:
    spend_key_gadget(Protoboard &pb, const LC &secret, const std::string &annotation)
        : libsnark::gadget<Fr>(pb, annotation),
          secret_bits_(pb, secret, FS_BITS, FMT(annotation, " secret")),
          below_order_(pb, LC(max_secret()) - secret, FS_BITS, FMT(annotation, " below_order")),
          public_(pb, {{secret_bits_.bits(), jub_base()}}, FMT(annotation, " public")) {}

    void generate_r1cs_constraints() {
        secret_bits_.generate_r1cs_constraints();
        below_order_.generate_r1cs_constraints();
        public_.generate_r1cs_constraints();
    }

    void generate_r1cs_witness() {
        secret_bits_.generate_r1cs_witness();
        below_order_.generate_r1cs_witness();
        public_.generate_r1cs_witness();
    }

    LC x() const { return public_.x(); }
    LC y() const { return public_.y(); }
};

// leaf position in 32 bits, then the path above it
class merkle_root_gadget : public libsnark::gadget<Fr> {
private:
    range_check_gadget position_;
    merkle_path_gadget path_;

    static std::vector<Var> siblings(const VarArray &witness, size_t at) {
        return std::vector<Var>(witness.begin() + at + 1, witness.begin() + at + PATH_LEN);
    }

public:
    merkle_root_gadget(
        Protoboard &pb,
        const LC &leaf,
        const VarArray &witness,
        size_t at,
        const std::string &annotation
    ) : libsnark::gadget<Fr>(pb, annotation),
        position_(pb, LC(witness[at]), MERKLE_DEPTH, FMT(annotation, " position")),
        path_(pb, leaf, position_.bits(), siblings(witness, at), FMT(annotation, " path")) {}

    void generate_r1cs_constraints() {
        position_.generate_r1cs_constraints();
        path_.generate_r1cs_constraints();
    }

    void generate_r1cs_witness() {
        position_.generate_r1cs_witness();
        path_.generate_r1cs_witness();
    }

    Var root() const { return path_.root(); }
};

// -------------------- BASE ---------------------------

class umbra_circuit : public circuit_gadget {
protected:
    using circuit_gadget::circuit_gadget;

    LC hash_lc(const std::vector<LC> &elements, const std::string &annotation) {
        return LC(hash(elements, annotation));
    }

    void push_point(const LC &x, const LC &y) {
        outputs_.push_back(x);
        outputs_.push_back(y);
    }

    // value >= 0 as an n bit number
    void enforce_range(const LC &value, size_t bits, const std::string &annotation) {
        add<range_check_gadget>(value, bits, annotation);
    }

    // the four numeric params below 2^64, a non zero ratio base, and the
    // bulla over all eight
    Var dao_bulla(size_t at) {
        for (size_t i = 0; i < 4; i++)
            enforce_range(w(at + i), VALUE_BITS, FMT(annotation_prefix, " dao_param_%zu", i));
        add<nonzero_gadget>(w(at + 3), FMT(annotation_prefix, " ratio_base"));

        std::vector<LC> params;
        for (size_t i = 0; i < DAO_PARAMS_LEN; i++) params.push_back(w(at + i));
        return hash(params, FMT(annotation_prefix, " dao_bulla"));
    }

    // proposal fields: dest_x, dest_y, amount, serial, token_id, blind
    Var proposal_bulla(size_t at, const LC &dao_bulla) {
        return hash(
            {w(at), w(at + 1), w(at + 2), w(at + 3), w(at + 4), dao_bulla, w(at + 5)},
            FMT(annotation_prefix, " proposal_bulla")
        );
    }
};

// -------------------- MONEY ---------------------------

class money_mint_circuit : public umbra_circuit {
public:
    explicit money_mint_circuit(Protoboard &pb)
        : umbra_circuit(pb, 4, 10, MONEY_MINT_CIRCUIT) {
        Var coin = hash({w(0), w(1), w(2), w(3), w(4), w(5), w(6), w(7)}, "coin");
        auto &vc = add<value_commit_gadget>(w(2), w(8), "value_commit");
        Var tc = hash({w(3), w(9)}, "token_commit");

        outputs_.push_back(coin);
        push_point(vc.x(), vc.y());
        outputs_.push_back(tc);
    }
};

class money_burn_circuit : public umbra_circuit {
public:
    explicit money_burn_circuit(Protoboard &pb)
        : umbra_circuit(pb, 8, 10 + PATH_LEN + 1, MONEY_BURN_CIRCUIT) {
        auto &owner = add<spend_key_gadget>(w(0), "owner");
        Var coin = hash(
            {owner.x(), owner.y(), w(2), w(3), w(1), w(4), w(5), w(6)},
            "coin"
        );
        auto &tree = add<merkle_root_gadget>(LC(coin), witness_, 10, "tree");
        auto &vc = add<value_commit_gadget>(w(2), w(7), "value_commit");

        outputs_.push_back(hash_lc({w(0), w(1)}, "nullifier"));
        push_point(vc.x(), vc.y());
        outputs_.push_back(hash_lc({w(3), w(8)}, "token_commit"));
        outputs_.push_back(tree.root());
        outputs_.push_back(hash_lc({w(5), w(9)}, "user_data_enc"));
        outputs_.push_back(w(4));
        outputs_.push_back(w(10 + PATH_LEN));
    }
};

// -------------------- CONSENSUS ---------------------------

class consensus_reward_circuit : public umbra_circuit {
public:
    explicit consensus_reward_circuit(Protoboard &pb)
        : umbra_circuit(pb, 4, 3, CONSENSUS_REWARD_CIRCUIT) {
        enforce_equal(w(1), LC(fr_from_u64(CONSENSUS_REWARD)), "reward");
        enforce_range(w(0) + w(1), VALUE_BITS, "no_overflow");

        auto &vc = add<value_commit_gadget>(w(0), w(2), "value_commit");
        EcPoint reward = jub_mul_u64(value_generator(), CONSENSUS_REWARD);
        auto &next = add<point_add_gadget>(vc.x(), vc.y(), LC(reward.x), LC(reward.y), "new_value_commit");

        push_point(vc.x(), vc.y());
        push_point(next.x(), next.y());
    }
};

// -------------------- DAO ---------------------------

class dao_mint_circuit : public umbra_circuit {
public:
    explicit dao_mint_circuit(Protoboard &pb)
        : umbra_circuit(pb, 1, DAO_PARAMS_LEN, DAO_MINT_CIRCUIT) {
        outputs_.push_back(dao_bulla(0));
    }
};

// governance coins carry no spend hook and no user data
class dao_gov_burn_circuit : public umbra_circuit {
public:
    dao_gov_burn_circuit(Protoboard &pb, bool reveal_nullifier, const std::string &name)
        : umbra_circuit(pb, reveal_nullifier ? 6 : 5, 7 + PATH_LEN + 1, name) {
        auto &owner = add<spend_key_gadget>(w(0), "owner");
        LC zero(Fr::zero());
        Var coin = hash({owner.x(), owner.y(), w(2), w(3), w(1), zero, zero, w(4)}, "coin");
        auto &tree = add<merkle_root_gadget>(LC(coin), witness_, 7, "tree");
        auto &vc = add<value_commit_gadget>(w(2), w(5), "value_commit");

        if (reveal_nullifier) outputs_.push_back(hash_lc({w(0), w(1)}, "nullifier"));
        push_point(vc.x(), vc.y());
        outputs_.push_back(hash_lc({w(3), w(6)}, "token_commit"));
        outputs_.push_back(tree.root());
        outputs_.push_back(w(7 + PATH_LEN));
    }
};

class dao_propose_main_circuit : public umbra_circuit {
public:
    explicit dao_propose_main_circuit(Protoboard &pb)
        : umbra_circuit(pb, 5, 9 + DAO_PARAMS_LEN + PATH_LEN, DAO_PROPOSE_MAIN_CIRCUIT) {
        const size_t dao = 9;
        Var bulla = dao_bulla(dao);

        enforce_range(w(5), VALUE_BITS, "amount");
        // total_funds >= proposer_limit
        enforce_range(w(0) - w(dao), VALUE_BITS, "proposer_limit");

        auto &tree = add<merkle_root_gadget>(LC(bulla), witness_, dao + DAO_PARAMS_LEN, "dao_tree");
        auto &total = add<value_commit_gadget>(w(0), w(1), "total_funds");

        outputs_.push_back(hash_lc({w(dao + 4), w(2)}, "token_commit"));
        outputs_.push_back(tree.root());
        outputs_.push_back(proposal_bulla(3, bulla));
        push_point(total.x(), total.y());
    }
};

class dao_vote_main_circuit : public umbra_circuit {
public:
    explicit dao_vote_main_circuit(Protoboard &pb)
        : umbra_circuit(pb, 6, DAO_PARAMS_LEN + 11, DAO_VOTE_MAIN_CIRCUIT) {
        Var bulla = dao_bulla(0);

        enforce_boolean(w(14), "vote_option");
        Var yes_value = product(w(14), w(16), "yes_value");

        auto &yes = add<value_commit_gadget>(LC(yes_value), w(15), "yes_vote");
        auto &all = add<value_commit_gadget>(w(16), w(17), "all_vote");

        outputs_.push_back(hash_lc({w(4), w(18)}, "token_commit"));
        outputs_.push_back(proposal_bulla(8, bulla));
        push_point(yes.x(), yes.y());
        push_point(all.x(), all.y());
    }
};

class dao_exec_circuit : public umbra_circuit {
public:
    explicit dao_exec_circuit(Protoboard &pb)
        : umbra_circuit(pb, 10, 6 + DAO_PARAMS_LEN + 11, DAO_EXEC_CIRCUIT) {
        const size_t dao = 6;
        const size_t v = dao + DAO_PARAMS_LEN;
        Var bulla = dao_bulla(dao);

        LC amount = w(2);
        LC token = w(4);
        LC yes_value = w(v), all_value = w(v + 1), input_value = w(v + 8);
        LC dao_spend_hook = w(v + 10);

        enforce_range(amount, VALUE_BITS, "amount");
        enforce_range(all_value - w(dao + 1), VALUE_BITS, "quorum");
        enforce_range(all_value - yes_value, VALUE_BITS, "yes_below_all");
        // yes * base >= all * quot, both products below 2^128
        Var weighted_yes = product(yes_value, w(dao + 3), "weighted_yes");
        Var weighted_all = product(all_value, w(dao + 2), "weighted_all");
        enforce_range(LC(weighted_yes) - LC(weighted_all), 2 * VALUE_BITS, "approval_ratio");
        enforce_range(input_value - amount, VALUE_BITS, "input_covers_amount");

        LC zero(Fr::zero());
        Var coin_0 = hash({w(0), w(1), amount, token, w(v + 4), zero, zero, w(v + 5)}, "user_coin");
        Var coin_1 = hash(
            {w(dao + 5), w(dao + 6), input_value - amount, token, w(v + 6), dao_spend_hook, LC(bulla), w(v + 7)},
            "dao_coin"
        );

        auto &yes = add<value_commit_gadget>(yes_value, w(v + 2), "yes_vote");
        auto &all = add<value_commit_gadget>(all_value, w(v + 3), "all_vote");
        auto &input = add<value_commit_gadget>(input_value, w(v + 9), "input_value");

        outputs_.push_back(proposal_bulla(0, bulla));
        outputs_.push_back(coin_0);
        outputs_.push_back(coin_1);
        push_point(yes.x(), yes.y());
        push_point(all.x(), all.y());
        push_point(input.x(), input.y());
        outputs_.push_back(dao_spend_hook);
    }
};

}

// -------------------- REGISTRY ---------------------------

template <typename C, typename... Args>
static CircuitFactory factory(Args... args) {
    return [args...](Protoboard &pb) -> std::unique_ptr<circuit_gadget> {
        return std::make_unique<C>(pb, args...);
    };
}

static std::vector<std::shared_ptr<const Circuit>> build_circuits() {
    auto make = [](const std::string &name, size_t witness_len, size_t public_len, CircuitFactory build) {
        return std::make_shared<const Circuit>(Circuit{name, witness_len, public_len, std::move(build)});
    };

    return {
        make(MONEY_MINT_CIRCUIT,        10,                            4,  factory<money_mint_circuit>()),
        make(MONEY_BURN_CIRCUIT,        10 + PATH_LEN + 1,             8,  factory<money_burn_circuit>()),
        make(CONSENSUS_REWARD_CIRCUIT,  3,                             4,  factory<consensus_reward_circuit>()),
        make(DAO_MINT_CIRCUIT,          DAO_PARAMS_LEN,                1,  factory<dao_mint_circuit>()),
        make(DAO_PROPOSE_BURN_CIRCUIT,  7 + PATH_LEN + 1,              5,
             factory<dao_gov_burn_circuit>(false, DAO_PROPOSE_BURN_CIRCUIT)),
        make(DAO_PROPOSE_MAIN_CIRCUIT,  9 + DAO_PARAMS_LEN + PATH_LEN, 5,  factory<dao_propose_main_circuit>()),
        make(DAO_VOTE_BURN_CIRCUIT,     7 + PATH_LEN + 1,              6,
             factory<dao_gov_burn_circuit>(true, DAO_VOTE_BURN_CIRCUIT)),
        make(DAO_VOTE_MAIN_CIRCUIT,     DAO_PARAMS_LEN + 11,           6,  factory<dao_vote_main_circuit>()),
        make(DAO_EXEC_CIRCUIT,          6 + DAO_PARAMS_LEN + 11,       10, factory<dao_exec_circuit>()),
    };
}

const std::vector<std::shared_ptr<const Circuit>>& all_circuits() {
    init_field_params();
    static const auto circuits = build_circuits();
    return circuits;
}

const Circuit* find_circuit(const std::string &name) {
    for (auto &circuit : all_circuits())
        if (circuit->name == name) return circuit.get();
    return nullptr;
}
