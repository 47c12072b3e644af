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
#include "consensus_builders.h"
#include "harness.h"
#include "money_builders.h"
#include "tests.h"

static SpendCoin native_coin(const Wallet &w, uint64_t value) {
    for (auto &coin : w.unspent_coins(native_token_id()))
        if (coin.note.value == value) return w.money_spend(coin).value();
    assert(false && "no coin of that value");
    return SpendCoin{};
}

static void test_stake(TestLedger &l) {
    l.airdrop(l.alice.pubkey(), 100);
    SpendCoin coin = native_coin(l.alice, 100);

    CallPair pair = expect_ok(build_stake(l.zk, coin));
    assert(!l.submit(call_pair(pair)).has_value());

    assert(l.alice.balance(native_token_id()) == 0);
    auto staked = l.alice.staked_coins();
    assert(staked.size() == 1);
    assert(staked[0].note.value == 100);
    assert(staked[0].note.spend_hook == consensus_contract_id());
    assert(l.bob.staked_coins().empty());

    // the money coin is gone
    CallPair again = expect_ok(build_stake(l.zk, coin));
    expect_rejected(l.submit(call_pair(again)), ContractError::DuplicateNullifier, 0);
    printf("STAKE OK.\n");
}

static void test_stake_pairing(TestLedger &l) {
    l.airdrop(l.bob.pubkey(), 30);
    l.airdrop(l.bob.pubkey(), 40);
    SpendCoin a = native_coin(l.bob, 30);
    SpendCoin b = native_coin(l.bob, 40);

    CallPair pa = expect_ok(build_stake(l.zk, a));
    CallPair pb = expect_ok(build_stake(l.zk, b));

    expect_rejected(l.check(single_call(pa.first)), ContractError::SpendHookOutOfBounds, 0);
    expect_rejected(l.check(single_call(pa.second)), ContractError::SpendHookOutOfBounds, 0);

    TransactionBuilder reversed;
    reversed.append(pa.second);
    reversed.append(pa.first);
    expect_rejected(l.check(reversed.build()), ContractError::SpendHookOutOfBounds, 0);

    TransactionBuilder crossed;
    crossed.append(pa.first);
    crossed.append(pb.second);
    expect_rejected(l.check(crossed.build()), ContractError::NextCallInputMismatch, 0);

    TransactionBuilder wrong_next;
    wrong_next.append(pa.first);
    wrong_next.append(expect_ok(make_transfer(l.zk, l.bob, l.alice.pubkey(), 40, native_token_id())));
    expect_rejected(l.check(wrong_next.build()), ContractError::NextCallContractMismatch, 0);

    assert(!l.submit(call_pair(pb)).has_value());
    assert(l.bob.balance(native_token_id()) == 30);
    assert(l.bob.staked_coins().size() == 1);

    // only native coins can be staked
    Keypair authority = Keypair::from_seed(test_seed(50));
    auto mint = expect_ok(build_token_mint(l.zk, authority.secret, l.bob.pubkey(), 9));
    assert(!l.submit(single_call(std::move(mint))).has_value());
    auto token_coin = l.bob.unspent_coins(token_id_for(authority.pubkey));
    auto res = build_stake(l.zk, l.bob.money_spend(token_coin[0]).value());
    assert(res.is_err() && res.unwrap_err() == BuilderError::NonNativeToken);
    printf("STAKE PAIRING OK.\n");
}

static void test_proposal(TestLedger &l) {
    OwnCoin staked = l.alice.staked_coins()[0];
    SpendCoin spend = l.alice.consensus_spend(staked).value();

    // staked coins live in the consensus tree, money cannot spend them
    TransferCallBuilder transfer(l.zk);
    transfer.add_input(spend);
    transfer.add_output(TransferOutput::to(l.alice.pubkey(), 100, native_token_id()));
    TransactionBuilder misuse;
    misuse.append(expect_ok(transfer.build()));
    expect_rejected(l.check(misuse.build()), ContractError::MerkleRootNotFound, 0);

    CallDebris proposal = expect_ok(build_proposal(l.zk, spend));
    Transaction tx = single_call(proposal);
    assert(!l.submit(tx).has_value());

    auto now = l.alice.staked_coins();
    assert(now.size() == 1);
    assert(now[0].note.value == 100 + CONSENSUS_REWARD);
    expect_rejected(l.submit(tx), ContractError::DuplicateNullifier, 0);

    // a reward proof is bound to the commitments it was made for
    CallDebris greedy = expect_ok(build_proposal(l.zk, l.alice.consensus_spend(now[0]).value()));
    greedy.proofs[2] = proposal.proofs[2];
    auto outcome = l.check(single_call(greedy));
    expect_rejected(outcome, ContractError::ProofVerifyFailed, 0);
    printf("PROPOSAL OK.\n");
}

static void test_unstake(TestLedger &l) {
    OwnCoin staked = l.alice.staked_coins()[0];
    SpendCoin spend = l.alice.consensus_spend(staked).value();

    CallPair pair = expect_ok(build_unstake(l.zk, spend));
    expect_rejected(l.check(single_call(pair.first)), ContractError::SpendHookOutOfBounds, 0);
    expect_rejected(l.check(single_call(pair.second)), ContractError::SpendHookOutOfBounds, 0);

    Transaction tx = call_pair(pair);
    assert(!l.submit(tx).has_value());
    assert(l.alice.staked_coins().empty());
    assert(l.alice.balance(native_token_id()) == 100 + CONSENSUS_REWARD);
    expect_rejected(l.submit(tx), ContractError::DuplicateNullifier, 0);

    // the unstaked coin is an ordinary coin again
    auto pay = expect_ok(make_transfer(l.zk, l.alice, l.bob.pubkey(), 101, native_token_id()));
    assert(!l.submit(single_call(std::move(pay))).has_value());
    assert(l.bob.balance(native_token_id()) == 131);
    printf("UNSTAKE OK.\n");
}

// A DAO treasury coin is hooked to the DAO, staking must not unhook it.
static void test_hooked_stake(TestLedger &l, Wallet &treasury) {
    TransferOutput fund = TransferOutput::to(treasury.pubkey(), 80, native_token_id());
    fund.spend_hook = dao_contract_id();
    fund.user_data = rand_fr();
    TransferCallBuilder builder(l.zk);
    builder.add_clear_input(80, native_token_id(), l.faucet_keys.secret);
    builder.add_output(fund);
    assert(!l.submit(single_call(expect_ok(builder.build()))).has_value());

    SpendCoin coin = native_coin(treasury, 80);
    assert(coin.coin.note.spend_hook == dao_contract_id());

    CallPair pair = expect_ok(build_stake(l.zk, coin));
    expect_rejected(l.submit(call_pair(pair)), ContractError::SpendHookMismatch, 0);
    assert(treasury.balance(native_token_id()) == 80);
    assert(treasury.staked_coins().empty());
    printf("HOOKED STAKE OK.\n");
}

void main_stake() {
    TestLedger l("stake");
    // tracked from the start so its trees match the ledger
    Wallet treasury(Keypair::from_seed(test_seed(62)));
    l.track(treasury);

    test_stake(l);
    test_stake_pairing(l);
    test_proposal(l);
    test_unstake(l);
    test_hooked_stake(l, treasury);
    printf("\n");
}
