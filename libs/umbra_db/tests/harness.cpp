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


#include "harness.h"
#include "money_builders.h"
#include <filesystem>

bytes32 test_seed(uint8_t n) {
    bytes32 seed{};
    seed.fill(n);
    return seed;
}

const ZkSetup& test_zk() {
    static const ZkSetup zk;
    return zk;
}

static LedgerConfig test_config(const std::string &path, const PublicKey &faucet) {
    LedgerConfig config;
    config.path = path;
    config.map_size = size_t(256) * 1024 * 1024;
    config.genesis_timestamp = 0;
    config.faucet_pubkeys = {faucet};
    config.log_level = "warn";
    return config;
}

static std::string fresh_dir(const std::string &name) {
    namespace fs = std::filesystem;
    std::string path = "./test_db_" + name;
    if (fs::exists(path)) fs::remove_all(path);
    fs::create_directory(path);
    return path;
}

TestLedger::TestLedger(const std::string &name)
    : path_(fresh_dir(name)),
      zk(test_zk()),
      faucet_keys(Keypair::from_seed(test_seed(1))),
      faucet(faucet_keys),
      alice(Keypair::from_seed(test_seed(2))),
      bob(Keypair::from_seed(test_seed(3))) {

    auto opened = LedgerStore::open(test_config(path_, faucet_keys.pubkey));
    assert(opened.is_ok());
    store = opened.take();

    auto created = Validator::create(*store, zk);
    assert(created.is_ok());
    validator = created.take();

    tracked_ = {&faucet, &alice, &bob};
}

void TestLedger::track(Wallet &wallet) {
    tracked_.push_back(&wallet);
}

std::optional<TxError> TestLedger::submit(const Transaction &tx) {
    auto outcomes = validator->verify_transactions({tx}, true);
    assert(outcomes.size() == 1);
    if (!outcomes[0].has_value())
        for (Wallet* w : tracked_) w->scan_transaction(tx);
    return outcomes[0];
}

std::optional<TxError> TestLedger::check(const Transaction &tx) {
    auto outcomes = validator->verify_transactions({tx}, false);
    assert(outcomes.size() == 1);
    return outcomes[0];
}

Transaction TestLedger::airdrop_tx(const PublicKey &to, uint64_t value) {
    TransferCallBuilder builder(zk);
    builder.add_clear_input(value, native_token_id(), faucet_keys.secret);
    builder.add_output(TransferOutput::to(to, value, native_token_id()));
    return single_call(expect_ok(builder.build()));
}

void TestLedger::airdrop(const PublicKey &to, uint64_t value) {
    auto outcome = submit(airdrop_tx(to, value));
    assert(!outcome.has_value());
}

std::pair<uint64_t, Hash> TestLedger::tip() {
    auto last = store->last();
    assert(last.is_ok());
    return last.unwrap();
}

Transaction single_call(CallDebris debris) {
    TransactionBuilder builder;
    builder.append(std::move(debris));
    return builder.build();
}

Transaction call_pair(CallPair pair) {
    TransactionBuilder builder;
    builder.append(std::move(pair.first));
    builder.append(std::move(pair.second));
    return builder.build();
}

void expect_rejected(
    const std::optional<TxError> &outcome,
    ContractError code,
    size_t call_idx
) {
    assert(outcome.has_value());
    if (outcome->code != code || outcome->call_idx != call_idx) {
        printf("expected %s at call %zu, got %s at call %zu\n",
            contract_error_str(code), call_idx,
            contract_error_str(outcome->code), outcome->call_idx);
    }
    assert(outcome->code == code);
    assert(outcome->call_idx == call_idx);
}
