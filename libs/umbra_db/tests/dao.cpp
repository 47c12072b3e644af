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


#include <cassert>
#include <cstdio>
#include "circuits.h"
#include "commit.h"
#include "dao_builders.h"
#include "derive.h"
#include "harness.h"
#include "money_builders.h"
#include "tests.h"

struct DaoFixture {
    Keypair gov_authority;
    Fr gov_token;
    Keypair dao_keys;
    DaoParams dao;
    Fr bulla;
};

static std::vector<SpendCoin> gov_coins(const Wallet &w, const Fr &gov_token) {
    std::vector<SpendCoin> out;
    for (auto &coin : w.unspent_coins(gov_token)) out.push_back(w.money_spend(coin).value());
    return out;
}

static std::vector<SpendCoin> treasury(const Wallet &dao_wallet) {
    return gov_coins(dao_wallet, native_token_id());
}

static void test_create(TestLedger &l, DaoFixture &f, Wallet &dao_wallet) {
    auto to_alice = expect_ok(build_token_mint(l.zk, f.gov_authority.secret, l.alice.pubkey(), 60));
    auto to_bob = expect_ok(build_token_mint(l.zk, f.gov_authority.secret, l.bob.pubkey(), 40));
    assert(!l.submit(single_call(std::move(to_alice))).has_value());
    assert(!l.submit(single_call(std::move(to_bob))).has_value());

    CallDebris mint = expect_ok(build_dao_mint(l.zk, f.dao, f.dao_keys.secret));

    // the bulla hashes the parameters in order and is the mint proof's only public input
    auto [dao_x, dao_y] = f.dao.public_key.xy();
    assert(f.bulla == derive_dao_bulla(
        fr_from_u64(50), fr_from_u64(70), fr_from_u64(1), fr_from_u64(2),
        f.gov_token, dao_x, dao_y, f.dao.bulla_blind));
    PublicInputs mint_inputs = dao_mint_public_inputs(DaoMintParams{f.bulla, f.dao.public_key});
    assert(mint_inputs.size() == 1 && mint_inputs[0] == f.bulla);
    assert(verify_proof(*l.zk.verifying_key(DAO_MINT_CIRCUIT), mint.proofs[0], mint_inputs));
    CallDebris unsigned_mint = mint;
    unsigned_mint.signature_secrets[0] = l.alice.keypair().secret;
    expect_rejected(l.submit(single_call(unsigned_mint)), ContractError::SignatureVerifyFailed, 0);

    assert(!l.submit(single_call(mint)).has_value());
    assert(l.alice.dao_path(f.bulla).has_value());
    assert(l.alice.dao_root() == dao_wallet.dao_root());

    // fund the treasury, its coins can only move through Dao::ExecV1
    TransferOutput fund = TransferOutput::to(f.dao.public_key, 1000, native_token_id());
    fund.spend_hook = dao_contract_id();
    fund.user_data = f.bulla;
    TransferCallBuilder builder(l.zk);
    builder.add_clear_input(1000, native_token_id(), l.faucet_keys.secret);
    builder.add_output(fund);
    assert(!l.submit(single_call(expect_ok(builder.build()))).has_value());
    assert(dao_wallet.balance(native_token_id()) == 1000);

    TransferCallBuilder raid(l.zk);
    raid.add_input(treasury(dao_wallet)[0]);
    raid.add_output(TransferOutput::to(l.bob.pubkey(), 1000, native_token_id()));
    expect_rejected(l.submit(single_call(expect_ok(raid.build()))), ContractError::SpendHookOutOfBounds, 0);
    printf("DAO CREATE OK.\n");
}

static DaoProposal propose(TestLedger &l, DaoFixture &f, const PublicKey &dest, uint64_t amount) {
    DaoProposal proposal = make_proposal(f.dao, dest, amount, native_token_id());
    auto debris = expect_ok(build_dao_propose(
        l.zk, f.dao, l.alice.dao_path(f.bulla).value(),
        gov_coins(l.alice, f.gov_token), proposal));
    assert(!l.submit(single_call(std::move(debris))).has_value());
    return proposal;
}

static std::optional<TxError> vote(TestLedger &l, DaoFixture &f, Wallet &voter, const DaoProposal &p, bool yes) {
    auto debris = expect_ok(build_dao_vote(l.zk, f.dao, gov_coins(voter, f.gov_token), p, yes));
    return l.submit(single_call(std::move(debris)));
}

static Transaction exec_tx(TestLedger &l, DaoFixture &f, Wallet &dao_wallet, const DaoProposal &p, const DaoTally &tally) {
    return call_pair(expect_ok(build_dao_exec(l.zk, f.dao, p, treasury(dao_wallet), tally)));
}

static void test_propose(TestLedger &l, DaoFixture &f, Wallet &dao_wallet) {
    DaoProposal p = make_proposal(f.dao, l.bob.pubkey(), 300, native_token_id());
    auto debris = expect_ok(build_dao_propose(
        l.zk, f.dao, l.alice.dao_path(f.bulla).value(),
        gov_coins(l.alice, f.gov_token), p));
    Transaction tx = single_call(std::move(debris));
    assert(!l.submit(tx).has_value());
    expect_rejected(l.submit(tx), ContractError::ProposalExists, 0);

    // the proposal is sealed to the DAO, outsiders only see its bulla
    assert(dao_wallet.proposals().size() == 1);
    assert(dao_wallet.proposals()[0].to_bulla() == p.to_bulla());
    assert(l.alice.proposals().empty());

    // bob holds less than the proposer limit
    auto small = build_dao_propose(
        l.zk, f.dao, l.bob.dao_path(f.bulla).value(),
        gov_coins(l.bob, f.gov_token), make_proposal(f.dao, l.bob.pubkey(), 1, native_token_id()));
    assert(small.is_err() && small.unwrap_err() == BuilderError::InsufficientFunds);

    // a DAO the ledger never saw
    DaoParams ghost = f.dao;
    ghost.bulla_blind = rand_fr();
    MerkleTree fake;
    fake.append(ghost.to_bulla());
    auto stray = expect_ok(build_dao_propose(
        l.zk, ghost, fake.witness(0).value(),
        gov_coins(l.alice, f.gov_token), make_proposal(ghost, l.alice.pubkey(), 1, native_token_id())));
    expect_rejected(l.submit(single_call(std::move(stray))), ContractError::DaoMerkleRootNotFound, 0);
    printf("DAO PROPOSE OK.\n");
}

static void test_vote_and_exec(TestLedger &l, DaoFixture &f, Wallet &dao_wallet) {
    const DaoProposal p = dao_wallet.proposals()[0];
    Fr p_bulla = p.to_bulla();

    assert(!vote(l, f, l.alice, p, true).has_value());
    assert(!vote(l, f, l.bob, p, false).has_value());
    expect_rejected(vote(l, f, l.alice, p, false), ContractError::DoubleVote, 0);

    DaoProposal unknown = make_proposal(f.dao, l.bob.pubkey(), 5, native_token_id());
    expect_rejected(vote(l, f, l.bob, unknown, true), ContractError::ProposalNotFound, 0);

    auto votes = dao_wallet.votes(p_bulla);
    assert(votes.size() == 2);
    DaoTally tally = DaoTally::from_votes(votes);
    assert(tally.yes_value == 60);
    assert(tally.all_value == 100);

    uint64_t bob_before = l.bob.balance(native_token_id());
    Transaction tx = exec_tx(l, f, dao_wallet, p, tally);
    assert(!l.submit(tx).has_value());
    assert(l.bob.balance(native_token_id()) == bob_before + 300);
    assert(dao_wallet.balance(native_token_id()) == 700);

    // the change went back under the DAO's hook
    auto left = dao_wallet.unspent_coins(native_token_id());
    assert(left.size() == 1);
    assert(left[0].note.spend_hook == dao_contract_id());
    assert(left[0].note.user_data == f.bulla);

    expect_rejected(l.submit(exec_tx(l, f, dao_wallet, p, tally)), ContractError::ProposalExecuted, 1);
    expect_rejected(vote(l, f, l.bob, p, true), ContractError::ProposalExecuted, 0);
    printf("DAO VOTE AND EXEC OK.\n");
}

static void test_exec_rules(TestLedger &l, DaoFixture &f, Wallet &dao_wallet) {
    // the same coins vote again on a new proposal
    DaoProposal p = propose(l, f, l.alice.pubkey(), 200);
    assert(!vote(l, f, l.alice, p, true).has_value());
    assert(!vote(l, f, l.bob, p, true).has_value());

    DaoTally real = DaoTally::from_votes(dao_wallet.votes(p.to_bulla()));
    assert(real.yes_value == 100);

    DaoTally made_up = real;
    made_up.yes_blind = rand_fs();
    made_up.all_blind = rand_fs();
    expect_rejected(l.submit(exec_tx(l, f, dao_wallet, p, made_up)), ContractError::VoteCommitMismatch, 1);

    // treasury coins only move with an exec after them
    CallPair pair = expect_ok(build_dao_exec(l.zk, f.dao, p, treasury(dao_wallet), real));
    expect_rejected(l.check(single_call(pair.first)), ContractError::SpendHookOutOfBounds, 0);
    expect_rejected(l.check(single_call(pair.second)), ContractError::CallIdxOutOfBounds, 0);

    uint64_t alice_before = l.alice.balance(native_token_id());
    assert(!l.submit(call_pair(pair)).has_value());
    assert(l.alice.balance(native_token_id()) == alice_before + 200);
    assert(dao_wallet.balance(native_token_id()) == 500);

    // 40 votes miss the quorum of 70, no satisfying exec witness exists
    DaoProposal weak = propose(l, f, l.bob.pubkey(), 50);
    assert(!vote(l, f, l.bob, weak, true).has_value());
    DaoTally short_tally = DaoTally::from_votes(dao_wallet.votes(weak.to_bulla()));
    auto refused = build_dao_exec(l.zk, f.dao, weak, treasury(dao_wallet), short_tally);
    assert(refused.is_err() && refused.unwrap_err() == BuilderError::UnsatisfiedCircuit);

    // proven over an inflated tally, then dressed in the recorded commitments
    DaoTally inflated = short_tally;
    inflated.yes_value = 100;
    inflated.all_value = 100;
    CallPair forged = expect_ok(build_dao_exec(l.zk, f.dao, weak, treasury(dao_wallet), inflated));
    auto exec = from_bytes<DaoExecParams>(forged.second.call.params);
    assert(exec.has_value());
    exec->yes_vote_commit = pedersen_commitment_u64(short_tally.yes_value, short_tally.yes_blind);
    exec->all_vote_commit = pedersen_commitment_u64(short_tally.all_value, short_tally.all_blind);
    forged.second.call.params = to_bytes(exec.value());
    auto outcome = l.submit(call_pair(forged));
    expect_rejected(outcome, ContractError::ProofVerifyFailed, 1);
    assert(outcome->kind == ErrorKind::Crypto);

    // once alice's coin moves it can no longer vote
    std::vector<SpendCoin> old_coins = gov_coins(l.alice, f.gov_token);
    auto give = expect_ok(make_transfer(l.zk, l.alice, l.bob.pubkey(), 60, f.gov_token));
    assert(!l.submit(single_call(std::move(give))).has_value());
    auto stale = expect_ok(build_dao_vote(l.zk, f.dao, old_coins, weak, true));
    expect_rejected(l.submit(single_call(std::move(stale))), ContractError::CoinAlreadySpent, 0);

    assert(dao_wallet.proposals().size() == 3);
    printf("DAO EXEC RULES OK.\n");
}

void main_dao() {
    TestLedger l("dao");

    DaoFixture f{
        Keypair::from_seed(test_seed(60)),
        Fr::zero(),
        Keypair::from_seed(test_seed(61)),
        DaoParams{},
        Fr::zero(),
    };
    f.gov_token = token_id_for(f.gov_authority.pubkey);
    f.dao = DaoParams{50, 70, 1, 2, f.gov_token, f.dao_keys.pubkey, rand_fr()};
    f.bulla = f.dao.to_bulla();

    // tracked from the start so its trees match the ledger
    Wallet dao_wallet(f.dao_keys);
    l.track(dao_wallet);

    test_create(l, f, dao_wallet);
    test_propose(l, f, dao_wallet);
    test_vote_and_exec(l, f, dao_wallet);
    test_exec_rules(l, f, dao_wallet);
    printf("\n");
}
