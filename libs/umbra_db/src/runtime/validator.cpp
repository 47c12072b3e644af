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


#include "validator.h"
#include "consensus_contract.h"
#include "dao_contract.h"
#include "money_contract.h"
#include <atomic>
#include <future>

const char* error_kind_str(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Decode:     return "decode";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Crypto:     return "crypto";
        case ErrorKind::Store:      return "store";
    }
    return "unknown";
}

static TxError tx_error(ErrorKind kind, ContractError code, size_t call_idx, int store_rc = OK) {
    return TxError{kind, code, call_idx, store_rc};
}

// store failures surface as their own category, the rest are validation
static TxError contract_failure(ContractError code, size_t call_idx) {
    if (code == ContractError::StoreFailure)
        return tx_error(ErrorKind::Store, code, call_idx, DB_ERR);
    if (code == ContractError::DecodeFailed || code == ContractError::InvalidFunction)
        return tx_error(ErrorKind::Decode, code, call_idx);
    return tx_error(ErrorKind::Validation, code, call_idx);
}

Validator::Validator(LedgerStore &store, const ZkSetup &zk)
    : store_(store), zk_(zk) {
    contracts_.push_back(std::make_unique<MoneyContract>());
    contracts_.push_back(std::make_unique<ConsensusContract>());
    contracts_.push_back(std::make_unique<DaoContract>());
}

Result<std::unique_ptr<Validator>, int> Validator::create(LedgerStore &store, const ZkSetup &zk) {
    std::unique_ptr<Validator> validator(new Validator(store, zk));

    auto begun = store.begin_write();
    if (begun.is_err()) return begun.unwrap_err();
    DbTxn txn = begun.take();

    StoreWriter writer(store, txn);
    for (auto &contract : validator->contracts_) {
        int rc = contract->deploy(writer);
        if (rc != OK) {
            log_error("validator", "deploying %s failed: %d", contract->name(), rc);
            return rc;
        }
    }

    int rc = store.commit(txn);
    if (rc != OK) return rc;
    return std::move(validator);
}

const Contract* Validator::contract(const ContractId &cid) const {
    for (auto &c : contracts_)
        if (c->id() == cid) return c.get();
    return nullptr;
}

// ----------------------- CRYPTO ------------------------

std::optional<TxError> Validator::verify_crypto(
    const Transaction &tx,
    const ObjectArena &arena,
    const std::vector<ArenaHandle> &meta_handles
) const {
    size_t n = tx.calls.size();

    std::vector<CallMetadata> metas(n);
    for (size_t i = 0; i < n; i++) {
        auto bytes = arena.get(meta_handles[i]);
        if (bytes.is_err()) return tx_error(ErrorKind::Decode, ContractError::DecodeFailed, i);
        auto meta = from_bytes<CallMetadata>(bytes.unwrap());
        if (!meta.has_value()) return tx_error(ErrorKind::Decode, ContractError::DecodeFailed, i);

        if (meta->zk_public_inputs.size() != tx.proofs[i].size())
            return tx_error(ErrorKind::Crypto, ContractError::ProofCountMismatch, i);
        if (meta->signature_pubkeys.size() != tx.signatures[i].size())
            return tx_error(ErrorKind::Crypto, ContractError::SignatureCountMismatch, i);
        metas[i] = std::move(meta.value());
    }

    Hash sighash = tx.signing_hash();

    // every call is checked in full so the reported call does not depend
    // on which task finished first
    std::vector<ContractError> results(n, ContractError::Ok);
    std::atomic<size_t> failures(0);
    std::vector<std::future<void>> futures;
    futures.reserve(n);
    for (size_t i = 0; i < n; i++) {
        futures.push_back(std::async(std::launch::async, [&, i] {
            auto &meta = metas[i];
            for (size_t j = 0; j < meta.zk_public_inputs.size(); j++) {
                auto &[circuit, inputs] = meta.zk_public_inputs[j];
                const VerifyingKey* vk = zk_.verifying_key(circuit);
                if (vk == nullptr) {
                    results[i] = ContractError::MissingVerifyingKey;
                    failures.fetch_add(1);
                    return;
                }
                if (!verify_proof(*vk, tx.proofs[i][j], inputs)) {
                    results[i] = ContractError::ProofVerifyFailed;
                    failures.fetch_add(1);
                    return;
                }
            }
            for (size_t j = 0; j < meta.signature_pubkeys.size(); j++) {
                if (!verify(meta.signature_pubkeys[j], tx.signatures[i][j], sighash)) {
                    results[i] = ContractError::SignatureVerifyFailed;
                    failures.fetch_add(1);
                    return;
                }
            }
        }));
    }
    for (auto &f : futures) f.get();

    if (failures.load() == 0) return std::nullopt;
    for (size_t i = 0; i < n; i++) {
        if (results[i] != ContractError::Ok) {
            log_info("validator", "call %zu: %s", i, contract_error_str(results[i]));
            return tx_error(ErrorKind::Crypto, results[i], i);
        }
    }
    return std::nullopt;
}

// ----------------------- TRANSACTIONS ------------------------

std::optional<TxError> Validator::apply_transaction(DbTxn &parent, const Transaction &tx) {
    size_t n = tx.calls.size();
    if (n == 0)
        return tx_error(ErrorKind::Decode, ContractError::DecodeFailed, 0);
    if (tx.proofs.size() != n)
        return tx_error(ErrorKind::Decode, ContractError::ProofCountMismatch, 0);
    if (tx.signatures.size() != n)
        return tx_error(ErrorKind::Decode, ContractError::SignatureCountMismatch, 0);

    std::vector<const Contract*> targets(n);
    for (size_t i = 0; i < n; i++) {
        targets[i] = contract(tx.calls[i].contract_id);
        if (targets[i] == nullptr)
            return tx_error(ErrorKind::Decode, ContractError::UnknownContract, i);
    }

    // 1. metadata
    ObjectArena arena;
    std::vector<ArenaHandle> meta_handles(n);
    for (size_t i = 0; i < n; i++) {
        auto meta = targets[i]->get_metadata(tx.calls, i);
        if (meta.is_err()) return contract_failure(meta.unwrap_err(), i);

        auto handle = arena.put(to_bytes(meta.unwrap()));
        if (handle.is_err()) return tx_error(ErrorKind::Decode, ContractError::DecodeFailed, i);
        meta_handles[i] = handle.unwrap();
    }

    // 2. proofs and signatures
    auto crypto = verify_crypto(tx, arena, meta_handles);
    if (crypto.has_value()) return crypto;

    auto child = store_.begin_write(&parent);
    if (child.is_err())
        return tx_error(ErrorKind::Store, ContractError::StoreFailure, 0, child.unwrap_err());
    DbTxn txn = child.take();

    // 3. instructions, all against the same state
    StoreView view(store_, txn);
    std::vector<ArenaHandle> update_handles(n);
    for (size_t i = 0; i < n; i++) {
        auto update = targets[i]->process_instruction(tx.calls, i, view);
        if (update.is_err()) return contract_failure(update.unwrap_err(), i);

        auto handle = arena.put(update.take());
        if (handle.is_err()) return tx_error(ErrorKind::Decode, ContractError::DecodeFailed, i);
        update_handles[i] = handle.unwrap();
    }

    // 4. updates
    StoreWriter writer(store_, txn);
    for (size_t i = 0; i < n; i++) {
        auto update = arena.get(update_handles[i]);
        if (update.is_err()) return tx_error(ErrorKind::Decode, ContractError::DecodeFailed, i);

        ContractError err = targets[i]->process_update(writer, update.unwrap());
        if (err != ContractError::Ok) return contract_failure(err, i);
    }

    int rc = txn.commit();
    if (rc != OK) return tx_error(ErrorKind::Store, ContractError::StoreFailure, 0, rc);
    return std::nullopt;
}

std::vector<std::optional<TxError>> Validator::verify_transactions(
    const std::vector<Transaction> &txs,
    bool write
) {
    std::vector<std::optional<TxError>> outcomes;
    outcomes.reserve(txs.size());

    auto begun = store_.begin_write();
    if (begun.is_err()) {
        for (size_t i = 0; i < txs.size(); i++)
            outcomes.push_back(tx_error(ErrorKind::Store, ContractError::StoreFailure, 0, begun.unwrap_err()));
        return outcomes;
    }
    DbTxn txn = begun.take();

    size_t accepted = 0;
    for (size_t i = 0; i < txs.size(); i++) {
        auto outcome = apply_transaction(txn, txs[i]);
        if (outcome.has_value()) {
            log_info("validator", "tx %zu rejected: %s error at call %zu (%s)",
                i, error_kind_str(outcome->kind), outcome->call_idx,
                contract_error_str(outcome->code));
        } else {
            accepted++;
        }
        outcomes.push_back(outcome);
    }
    log_debug("validator", "%zu of %zu transactions valid", accepted, txs.size());

    if (!write) return outcomes;

    int rc = store_.commit(txn);
    if (rc != OK) {
        for (auto &outcome : outcomes)
            if (!outcome.has_value())
                outcome = tx_error(ErrorKind::Store, ContractError::StoreFailure, 0, rc);
    }
    return outcomes;
}

std::vector<std::optional<TxError>> Validator::verify_raw_transactions(
    const std::vector<Bytes> &txs,
    bool write
) {
    // undecodable entries keep their slot so outcomes line up with the input
    std::vector<Transaction> decoded;
    std::vector<std::optional<size_t>> index(txs.size());
    for (size_t i = 0; i < txs.size(); i++) {
        auto tx = from_bytes<Transaction>(txs[i]);
        if (!tx.has_value()) continue;
        index[i] = decoded.size();
        decoded.push_back(std::move(tx.value()));
    }

    auto results = verify_transactions(decoded, write);

    std::vector<std::optional<TxError>> outcomes;
    outcomes.reserve(txs.size());
    for (size_t i = 0; i < txs.size(); i++) {
        if (index[i].has_value())
            outcomes.push_back(results[index[i].value()]);
        else
            outcomes.push_back(tx_error(ErrorKind::Decode, ContractError::DecodeFailed, 0));
    }
    return outcomes;
}

// ----------------------- BLOCKS ------------------------

static BlockError block_error(int code, size_t block_idx) {
    return BlockError{code, block_idx, 0, std::nullopt};
}

Result<std::vector<Hash>, BlockError> Validator::add_blocks(const std::vector<BlockInfo> &blocks) {
    auto begun = store_.begin_write();
    if (begun.is_err()) return block_error(begun.unwrap_err(), 0);
    DbTxn txn = begun.take();

    auto last = store_.last(txn);
    if (last.is_err()) return block_error(last.unwrap_err(), 0);
    auto [slot, prev_hash] = last.unwrap();

    std::vector<Hash> hashes;
    for (size_t b = 0; b < blocks.size(); b++) {
        const BlockInfo &block = blocks[b];
        Hash hash = block.hash();

        auto known = store_.has_block(txn, hash);
        if (known.is_err()) return block_error(known.unwrap_err(), b);
        if (known.unwrap()) {
            hashes.push_back(hash);
            continue;
        }

        if (block.header.slot <= slot) {
            log_warn("validator", "block slot %llu not after %llu",
                (unsigned long long)block.header.slot, (unsigned long long)slot);
            return block_error(SLOT_ORDER, b);
        }
        if (block.header.previous != prev_hash)
            return block_error(PREVIOUS_MISMATCH, b);
        if (compute_tx_root(block.txs) != block.header.tx_root)
            return block_error(TX_ROOT_MISMATCH, b);

        for (size_t t = 0; t < block.txs.size(); t++) {
            auto err = apply_transaction(txn, block.txs[t]);
            if (err.has_value()) {
                log_warn("validator", "block %zu tx %zu invalid: %s",
                    b, t, contract_error_str(err->code));
                return BlockError{INVALID_TX, b, t, err};
            }
        }

        auto inserted = store_.insert_blocks(txn, {block});
        if (inserted.is_err()) return block_error(inserted.unwrap_err(), b);

        hashes.push_back(hash);
        slot = block.header.slot;
        prev_hash = hash;
    }

    int rc = store_.commit(txn);
    if (rc != OK) return block_error(rc, 0);

    log_info("validator", "chain at slot %llu", (unsigned long long)slot);
    return hashes;
}
