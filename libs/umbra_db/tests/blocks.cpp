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
#include "tests.h"

static void expect_block_error(const Result<std::vector<Hash>, BlockError> &res, int code, size_t block_idx) {
    assert(res.is_err());
    if (res.unwrap_err().code != code)
        printf("expected block error %d, got %d\n", code, res.unwrap_err().code);
    assert(res.unwrap_err().code == code);
    assert(res.unwrap_err().block_idx == block_idx);
}

static void test_append(TestLedger &l) {
    auto [slot, prev] = l.tip();
    assert(slot == 0);

    BlockInfo b1 = make_block(prev, 1, 1000, {l.airdrop_tx(l.alice.pubkey(), 50)});
    BlockInfo b2 = make_block(b1.hash(), 3, 1010, {
        l.airdrop_tx(l.bob.pubkey(), 20),
        l.airdrop_tx(l.bob.pubkey(), 5),
    });

    auto added = l.validator->add_blocks({b1, b2});
    assert(added.is_ok());
    assert(added.unwrap().size() == 2);
    assert(added.unwrap()[1] == b2.hash());
    l.alice.scan_block(b1);
    l.bob.scan_block(b1);
    l.alice.scan_block(b2);
    l.bob.scan_block(b2);

    assert(l.alice.balance(native_token_id()) == 50);
    assert(l.bob.balance(native_token_id()) == 25);
    assert(l.tip().first == 3);
    assert(l.tip().second == b2.hash());

    // known blocks are skipped
    auto again = l.validator->add_blocks({b1, b2});
    assert(again.is_ok() && again.unwrap().size() == 2);
    assert(l.tip().first == 3);

    auto stored = l.store->get_blocks_by_hash({b1.hash(), b2.hash()});
    assert(stored.is_ok());
    assert(stored.unwrap()[1].txs.size() == 2);
    assert(stored.unwrap()[1].txs[1].hash() == b2.txs[1].hash());

    auto after = l.store->get_blocks_after(0, 10);
    assert(after.is_ok() && after.unwrap().size() == 2);
    auto one = l.store->get_blocks_after(0, 1);
    assert(one.is_ok() && one.unwrap().size() == 1);
    assert(one.unwrap()[0].hash() == b1.hash());

    auto txs = l.store->get_transactions_by_hash({b1.txs[0].hash()});
    assert(txs.is_ok() && txs.unwrap().size() == 1);
    printf("BLOCK APPEND OK.\n");
}

static void test_rejections(TestLedger &l) {
    auto [slot, prev] = l.tip();

    BlockInfo stale = make_block(prev, slot, 2000, {});
    expect_block_error(l.validator->add_blocks({stale}), SLOT_ORDER, 0);

    BlockInfo orphan = make_block(derive_hash(ByteSlice(prev.data(), prev.size())), slot + 1, 2000, {});
    expect_block_error(l.validator->add_blocks({orphan}), PREVIOUS_MISMATCH, 0);

    BlockInfo forged = make_block(prev, slot + 1, 2000, {l.airdrop_tx(l.alice.pubkey(), 1)});
    forged.txs.push_back(l.airdrop_tx(l.alice.pubkey(), 2));
    expect_block_error(l.validator->add_blocks({forged}), TX_ROOT_MISMATCH, 0);

    // a replayed transaction mints a coin that already exists
    Transaction fresh = l.airdrop_tx(l.bob.pubkey(), 9);
    BlockInfo good = make_block(prev, slot + 1, 2000, {fresh});
    BlockInfo bad = make_block(good.hash(), slot + 2, 2001, {l.airdrop_tx(l.bob.pubkey(), 3), fresh});

    auto res = l.validator->add_blocks({good, bad});
    expect_block_error(res, INVALID_TX, 1);
    assert(res.unwrap_err().tx_idx == 1);
    assert(res.unwrap_err().tx.has_value());
    assert(res.unwrap_err().tx->code == ContractError::DuplicateCoin);

    // the batch is atomic, the good block went with the bad one
    assert(l.tip().first == slot);
    auto has = l.store->has_block(good.hash());
    assert(has.is_ok() && !has.unwrap());
    auto outcome = l.check(fresh);
    assert(!outcome.has_value());
    printf("BLOCK REJECTIONS OK.\n");
}

void main_blocks() {
    TestLedger l("blocks");
    test_append(l);
    test_rejections(l);
    printf("\n");
}
