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

static void test_mint(TestLedger &l, const Keypair &authority) {
    Fr token = token_id_for(authority.pubkey);
    assert(token != native_token_id());

    auto mint = expect_ok(build_token_mint(l.zk, authority.secret, l.alice.pubkey(), 500));
    assert(!l.submit(single_call(std::move(mint))).has_value());
    assert(l.alice.balance(token) == 500);
    assert(l.alice.balance(native_token_id()) == 0);

    auto pay = expect_ok(make_transfer(l.zk, l.alice, l.bob.pubkey(), 120, token));
    assert(!l.submit(single_call(std::move(pay))).has_value());
    assert(l.alice.balance(token) == 380);
    assert(l.bob.balance(token) == 120);

    // a transfer cannot mix tokens
    l.airdrop(l.alice.pubkey(), 10);
    TransferCallBuilder mixed(l.zk);
    mixed.add_input(l.alice.money_spend(l.alice.unspent_coins(token)[0]).value());
    mixed.add_input(l.alice.money_spend(l.alice.unspent_coins(native_token_id())[0]).value());
    mixed.add_output(TransferOutput::to(l.bob.pubkey(), 390, token));
    assert(mixed.build().unwrap_err() == BuilderError::TokenMismatch);
    printf("TOKEN MINT OK.\n");
}

static void test_mint_auth(TestLedger &l, const Keypair &authority) {
    // bob claims the token id of someone else's key
    auto debris = expect_ok(build_token_mint(l.zk, l.bob.keypair().secret, l.bob.pubkey(), 1));
    auto params = from_bytes<MoneyMintParams>(debris.call.params);
    assert(params.has_value());
    params->input.token_id = token_id_for(authority.pubkey);
    debris.call.params = to_bytes(params.value());

    auto outcome = l.submit(single_call(debris));
    expect_rejected(outcome, ContractError::TokenIdDerivationMismatch, 0);

    // the signature has to come from the authority itself
    auto forged = expect_ok(build_token_mint(l.zk, authority.secret, l.bob.pubkey(), 1));
    forged.signature_secrets[0] = l.bob.keypair().secret;
    outcome = l.submit(single_call(forged));
    expect_rejected(outcome, ContractError::SignatureVerifyFailed, 0);
    assert(outcome->kind == ErrorKind::Crypto);
    printf("MINT AUTH OK.\n");
}

static void test_freeze(TestLedger &l, const Keypair &authority) {
    Fr token = token_id_for(authority.pubkey);

    CallDebris stolen = build_token_freeze(authority.secret);
    stolen.signature_secrets[0] = l.alice.keypair().secret;
    expect_rejected(l.submit(single_call(stolen)), ContractError::SignatureVerifyFailed, 0);

    assert(!l.submit(single_call(build_token_freeze(authority.secret))).has_value());
    expect_rejected(
        l.submit(single_call(build_token_freeze(authority.secret))),
        ContractError::TokenAlreadyFrozen, 0);

    auto mint = expect_ok(build_token_mint(l.zk, authority.secret, l.alice.pubkey(), 5));
    expect_rejected(l.submit(single_call(std::move(mint))), ContractError::TokenFrozen, 0);
    assert(l.alice.balance(token) == 380);

    // freezing stops minting, coins already out still move
    auto pay = expect_ok(make_transfer(l.zk, l.bob, l.alice.pubkey(), 20, token));
    assert(!l.submit(single_call(std::move(pay))).has_value());
    assert(l.alice.balance(token) == 400);

    // other authorities are unaffected
    Keypair other = Keypair::from_seed(test_seed(41));
    auto other_mint = expect_ok(build_token_mint(l.zk, other.secret, l.bob.pubkey(), 7));
    assert(!l.submit(single_call(std::move(other_mint))).has_value());
    assert(l.bob.balance(token_id_for(other.pubkey)) == 7);
    printf("FREEZE OK.\n");
}

void main_mint() {
    TestLedger l("mint");
    Keypair authority = Keypair::from_seed(test_seed(40));
    test_mint(l, authority);
    test_mint_auth(l, authority);
    test_freeze(l, authority);
    printf("\n");
}
