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
#include "builder.h"
#include "ledger_store.h"
#include "validator.h"
#include "wallet.h"
#include <cassert>
#include <cstdio>

bytes32 test_seed(uint8_t n);

// generated on first use and shared by every ledger in the process
const ZkSetup& test_zk();

/*
 *  A fresh ledger in its own directory with the built-in contracts
 *  deployed, one faucet key and two users. Every transaction submit()
 *  accepts is scanned by every tracked wallet, in order.
 */
class TestLedger {
private:
    std::string path_;
    std::vector<Wallet*> tracked_;

public:
    const ZkSetup &zk;
    Keypair faucet_keys;
    std::unique_ptr<LedgerStore> store;
    std::unique_ptr<Validator> validator;

    Wallet faucet;
    Wallet alice;
    Wallet bob;

    explicit TestLedger(const std::string &name);
    TestLedger(const TestLedger&) = delete;
    TestLedger& operator=(const TestLedger&) = delete;

    // wallet must outlive the ledger
    void track(Wallet &wallet);

    std::optional<TxError> submit(const Transaction &tx);
    // validates without committing anything
    std::optional<TxError> check(const Transaction &tx);

    // faucet pays value of the native token to pubkey
    Transaction airdrop_tx(const PublicKey &to, uint64_t value);
    void airdrop(const PublicKey &to, uint64_t value);

    std::pair<uint64_t, Hash> tip();
};

Transaction single_call(CallDebris debris);
Transaction call_pair(CallPair pair);

template <typename T>
T expect_ok(Result<T, BuilderError> res) {
    if (res.is_err()) printf("builder error: %s\n", builder_error_str(res.unwrap_err()));
    assert(res.is_ok());
    return res.take();
}

// asserts the outcome is a rejection of the given code at call_idx
void expect_rejected(
    const std::optional<TxError> &outcome,
    ContractError code,
    size_t call_idx
);
