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

struct SwapSetup {
    Fr token;
    SpendCoin alice_coin;
    SpendCoin bob_coin;
};

// alice holds 100 native, bob holds 50 of his own token
static SwapSetup setup(TestLedger &l) {
    l.airdrop(l.alice.pubkey(), 100);
    auto mint = expect_ok(build_token_mint(l.zk, l.bob.keypair().secret, l.bob.pubkey(), 50));
    assert(!l.submit(single_call(std::move(mint))).has_value());

    SwapSetup s;
    s.token = token_id_for(l.bob.pubkey());
    s.alice_coin = l.alice.money_spend(l.alice.unspent_coins(native_token_id())[0]).value();
    s.bob_coin = l.bob.money_spend(l.bob.unspent_coins(s.token)[0]).value();
    return s;
}

static Transaction swap_tx(TestLedger &l, const SwapSetup &s, uint64_t alice_asks, uint64_t bob_asks) {
    SwapBlinds blinds = SwapBlinds::random();
    auto first = expect_ok(build_swap_half(
        l.zk, 0, blinds, s.alice_coin, l.alice.pubkey(), alice_asks, s.token));
    auto second = expect_ok(build_swap_half(
        l.zk, 1, blinds, s.bob_coin, l.bob.pubkey(), bob_asks, native_token_id()));
    return single_call(join_swap(first, second));
}

static void test_swap(TestLedger &l, const SwapSetup &s) {
    expect_rejected(l.check(swap_tx(l, s, 60, 100)), ContractError::ValueMismatch, 0);
    expect_rejected(l.check(swap_tx(l, s, 50, 99)), ContractError::ValueMismatch, 0);

    Transaction tx = swap_tx(l, s, 50, 100);
    assert(!l.submit(tx).has_value());

    assert(l.alice.balance(native_token_id()) == 0);
    assert(l.alice.balance(s.token) == 50);
    assert(l.bob.balance(native_token_id()) == 100);
    assert(l.bob.balance(s.token) == 0);

    // both coins are spent now
    expect_rejected(l.submit(swap_tx(l, s, 50, 100)), ContractError::DuplicateNullifier, 0);
    printf("OTC SWAP OK.\n");
}

static void test_shape(TestLedger &l) {
    l.airdrop(l.alice.pubkey(), 10);

    // a plain transfer is not a swap
    auto debris = expect_ok(make_transfer(l.zk, l.alice, l.bob.pubkey(), 4, native_token_id()));
    debris.call.function = static_cast<uint8_t>(MoneyFunction::OtcSwapV1);
    expect_rejected(l.check(single_call(debris)), ContractError::InvalidOtcSwap, 0);
    printf("OTC SHAPE OK.\n");
}

void main_otc() {
    TestLedger l("otc");
    SwapSetup s = setup(l);
    test_swap(l, s);
    test_shape(l);
    printf("\n");
}
