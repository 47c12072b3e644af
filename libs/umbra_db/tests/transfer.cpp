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
#include "harness.h"
#include "money_builders.h"
#include "tests.h"

static const Fr& native() { return native_token_id(); }

static CallDebris airdrop_call(TestLedger &l, const TransferOutput &output) {
    TransferCallBuilder builder(l.zk);
    builder.add_clear_input(output.value, output.token_id, l.faucet_keys.secret);
    builder.add_output(output);
    return expect_ok(builder.build());
}

static void test_payment(TestLedger &l) {
    l.airdrop(l.alice.pubkey(), 100);
    assert(l.alice.balance(native()) == 100);
    assert(l.bob.balance(native()) == 0);

    auto debris = expect_ok(make_transfer(l.zk, l.alice, l.bob.pubkey(), 30, native()));
    auto outcome = l.submit(single_call(std::move(debris)));
    assert(!outcome.has_value());

    assert(l.alice.balance(native()) == 70);
    assert(l.bob.balance(native()) == 30);

    // every wallet tracks the same tree the ledger does
    assert(l.alice.money_root() == l.bob.money_root());

    auto broke = make_transfer(l.zk, l.bob, l.alice.pubkey(), 31, native());
    assert(broke.is_err() && broke.unwrap_err() == BuilderError::InsufficientFunds);

    TransferCallBuilder empty(l.zk);
    assert(empty.build().unwrap_err() == BuilderError::NoInputs);
    printf("PAYMENT OK.\n");
}

static void test_double_spend(TestLedger &l) {
    Transaction first = single_call(expect_ok(make_transfer(l.zk, l.alice, l.bob.pubkey(), 10, native())));
    Transaction second = single_call(expect_ok(make_transfer(l.zk, l.alice, l.bob.pubkey(), 20, native())));

    // checked together, the second sees the first's nullifier
    auto outcomes = l.validator->verify_transactions({first, second}, false);
    assert(!outcomes[0].has_value());
    expect_rejected(outcomes[1], ContractError::DuplicateNullifier, 0);
    assert(outcomes[1]->kind == ErrorKind::Validation);

    // nothing was written
    assert(!l.check(second).has_value());

    assert(!l.submit(first).has_value());
    expect_rejected(l.submit(second), ContractError::DuplicateNullifier, 0);
    expect_rejected(l.submit(first), ContractError::DuplicateNullifier, 0);

    assert(l.alice.balance(native()) == 60);
    assert(l.bob.balance(native()) == 40);
    printf("DOUBLE SPEND OK.\n");
}

static void test_unknown_root(TestLedger &l) {
    auto coins = l.alice.unspent_coins(native());
    assert(!coins.empty());
    auto spend = l.alice.money_spend(coins[0]);
    assert(spend.has_value());

    // the proof holds for the forged root, the ledger has just never seen it
    spend->path.siblings[4] = rand_fr();
    TransferCallBuilder builder(l.zk);
    builder.add_input(spend.value());
    builder.add_output(TransferOutput::to(l.bob.pubkey(), coins[0].note.value, native()));

    auto outcome = l.submit(single_call(expect_ok(builder.build())));
    expect_rejected(outcome, ContractError::MerkleRootNotFound, 0);
    printf("UNKNOWN ROOT OK.\n");
}

static void test_faucet_auth(TestLedger &l) {
    TransferCallBuilder builder(l.zk);
    builder.add_clear_input(500, native(), l.alice.keypair().secret);
    builder.add_output(TransferOutput::to(l.alice.pubkey(), 500, native()));

    auto outcome = l.submit(single_call(expect_ok(builder.build())));
    expect_rejected(outcome, ContractError::ClearInputUnauthorised, 0);
    assert(l.alice.balance(native()) == 60);
    printf("FAUCET AUTH OK.\n");
}

// Swaps the first output of a faucet call for one minting value with the
// given token blind. The clear input publishes its blinds, so a matching
// value blind can be picked.
static CallDebris replace_output(TestLedger &l, uint64_t value, bool same_token_blind) {
    CallDebris debris = airdrop_call(l, TransferOutput::to(l.alice.pubkey(), 50, native()));
    auto params = from_bytes<MoneyTransferParams>(debris.call.params);
    assert(params.has_value());

    const ClearInput &input = params->clear_inputs[0];
    Fr token_blind = same_token_blind ? input.token_blind : rand_fr();
    Note note = make_note(value, native(), Fr::zero(), Fr::zero(), input.value_blind, token_blind);
    MintProof mint = expect_ok(create_mint_proof(l.zk, l.alice.pubkey(), note));

    params->outputs[0] = mint.output;
    debris.call.params = to_bytes(params.value());
    debris.proofs[0] = mint.proof;
    return debris;
}

static void test_balance(TestLedger &l) {
    // control: the same value still balances
    assert(!l.check(single_call(replace_output(l, 50, true))).has_value());

    expect_rejected(l.submit(single_call(replace_output(l, 60, true))), ContractError::ValueMismatch, 0);
    expect_rejected(l.submit(single_call(replace_output(l, 50, false))), ContractError::TokenMismatch, 0);
    printf("BALANCE OK.\n");
}

static void test_spend_hook(TestLedger &l) {
    TransferOutput hooked = TransferOutput::to(l.alice.pubkey(), 25, native());
    hooked.spend_hook = dao_contract_id();
    assert(!l.submit(single_call(airdrop_call(l, hooked))).has_value());

    std::optional<OwnCoin> coin;
    for (auto &c : l.alice.unspent_coins(native()))
        if (!c.note.spend_hook.is_zero()) coin = c;
    assert(coin.has_value());

    auto build = [&]() {
        TransferCallBuilder builder(l.zk);
        builder.add_input(l.alice.money_spend(coin.value()).value());
        builder.add_output(TransferOutput::to(l.bob.pubkey(), 25, native()));
        return expect_ok(builder.build());
    };

    expect_rejected(l.submit(single_call(build())), ContractError::SpendHookOutOfBounds, 0);

    TransactionBuilder tx;
    tx.append(build());
    tx.append(airdrop_call(l, TransferOutput::to(l.bob.pubkey(), 1, native())));
    expect_rejected(l.submit(tx.build()), ContractError::SpendHookMismatch, 0);

    // make_transfer leaves hooked coins alone
    uint64_t spendable = l.alice.balance(native()) - 25;
    auto all = make_transfer(l.zk, l.alice, l.bob.pubkey(), spendable + 1, native());
    assert(all.is_err() && all.unwrap_err() == BuilderError::InsufficientFunds);
    printf("SPEND HOOK OK.\n");
}

static void test_malformed(TestLedger &l) {
    CallDebris valid = airdrop_call(l, TransferOutput::to(l.bob.pubkey(), 3, native()));

    Transaction empty;
    auto outcome = l.check(empty);
    assert(outcome.has_value() && outcome->kind == ErrorKind::Decode);

    Transaction short_proofs = single_call(valid);
    short_proofs.proofs.clear();
    outcome = l.check(short_proofs);
    expect_rejected(outcome, ContractError::ProofCountMismatch, 0);
    assert(outcome->kind == ErrorKind::Decode);

    CallDebris missing = valid;
    missing.proofs.clear();
    outcome = l.check(single_call(missing));
    expect_rejected(outcome, ContractError::ProofCountMismatch, 0);
    assert(outcome->kind == ErrorKind::Crypto);

    CallDebris stranger = valid;
    stranger.call.contract_id = fr_from_u64(999);
    TransactionBuilder tx;
    tx.append(valid);
    tx.append(stranger);
    outcome = l.check(tx.build());
    expect_rejected(outcome, ContractError::UnknownContract, 1);
    assert(outcome->kind == ErrorKind::Decode);

    CallDebris bad_fn = valid;
    bad_fn.call.function = 0x04;
    outcome = l.check(single_call(bad_fn));
    expect_rejected(outcome, ContractError::InvalidFunction, 0);
    assert(outcome->kind == ErrorKind::Decode);

    CallDebris garbage = valid;
    garbage.call.params.resize(garbage.call.params.size() / 2);
    outcome = l.check(single_call(garbage));
    expect_rejected(outcome, ContractError::DecodeFailed, 0);

    auto raw = l.validator->verify_raw_transactions({Bytes{1, 2, 3}, to_bytes(single_call(valid))}, false);
    assert(raw.size() == 2);
    assert(raw[0].has_value() && raw[0]->kind == ErrorKind::Decode);
    assert(!raw[1].has_value());
    printf("MALFORMED OK.\n");
}

static void test_crypto_failures(TestLedger &l) {
    CallDebris first = airdrop_call(l, TransferOutput::to(l.bob.pubkey(), 4, native()));
    CallDebris second = airdrop_call(l, TransferOutput::to(l.bob.pubkey(), 5, native()));

    TransactionBuilder builder;
    builder.append(first);
    builder.append(second);
    Transaction tx = builder.build();

    Transaction bad_sig = tx;
    bad_sig.signatures[1][0] = sign(l.faucet_keys.secret, derive_hash(ByteSlice(tx.signing_hash())));
    auto outcome = l.check(bad_sig);
    expect_rejected(outcome, ContractError::SignatureVerifyFailed, 1);
    assert(outcome->kind == ErrorKind::Crypto);

    // both calls broken, the lower one is reported
    Transaction bad_proofs = tx;
    std::swap(bad_proofs.proofs[0], bad_proofs.proofs[1]);
    outcome = l.check(bad_proofs);
    expect_rejected(outcome, ContractError::ProofVerifyFailed, 0);

    // a proof swap changes the signing hash too, so re-sign to isolate it
    TransactionBuilder swapped;
    CallDebris crossed = first;
    crossed.proofs = second.proofs;
    swapped.append(crossed);
    outcome = l.check(swapped.build());
    expect_rejected(outcome, ContractError::ProofVerifyFailed, 0);

    assert(!l.check(tx).has_value());
    printf("CRYPTO FAILURES OK.\n");
}

static void test_pipeline(TestLedger &l) {
    CallDebris debris = airdrop_call(l, TransferOutput::to(l.bob.pubkey(), 8, native()));
    auto params = from_bytes<MoneyTransferParams>(debris.call.params);
    assert(params->clear_inputs.size() == 1);
    assert(params->inputs.empty());
    assert(params->outputs.size() == 1);

    const Contract* money = l.validator->contract(money_contract_id());
    assert(money != nullptr);
    assert(l.validator->contract(fr_from_u64(999)) == nullptr);

    std::vector<ContractCall> calls{debris.call};
    auto meta = money->get_metadata(calls, 0);
    assert(meta.is_ok());
    assert(meta.unwrap().zk_public_inputs.size() == 1);
    assert(meta.unwrap().signature_pubkeys.size() == 1);
    assert(money->get_metadata(calls, 1).unwrap_err() == ContractError::CallIdxOutOfBounds);

    auto begun = l.store->begin_read();
    assert(begun.is_ok());
    DbTxn txn = begun.take();
    StoreView view(*l.store, txn);

    // same snapshot, same answer
    auto first = money->process_instruction(calls, 0, view);
    auto second = money->process_instruction(calls, 0, view);
    assert(first.is_ok() && second.is_ok());
    assert(first.unwrap() == second.unwrap());

    auto split = split_update(first.unwrap());
    assert(split.has_value());
    assert(split->first == static_cast<uint8_t>(MoneyFunction::TransferV1));
    auto update = from_bytes<MoneyTransferUpdate>(split->second);
    assert(update.has_value());
    assert(update->coins.size() == 1);
    assert(update->nullifiers.empty());
    assert(update->coins[0] == params->outputs[0].coin);
    printf("PIPELINE OK.\n");
}

void main_transfer() {
    TestLedger l("transfer");
    test_payment(l);
    test_double_spend(l);
    test_unknown_root(l);
    test_faucet_auth(l);
    test_balance(l);
    test_spend_hook(l);
    test_malformed(l);
    test_crypto_failures(l);
    test_pipeline(l);
    printf("\n");
}
