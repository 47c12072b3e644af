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
#include "block.h"
#include "builder.h"
#include "dao.h"
#include <map>
#include <set>

/*
 *  Client side view of the ledger for one key. Keeps full copies of the
 *  money, consensus and DAO trees so it can hand out authentication paths,
 *  and trial decrypts every output to find the coins it owns.
 *
 *  Only scan transactions the ledger accepted, in ledger order, or the
 *  local trees drift from the ledger's roots.
 */
class Wallet {
private:
    Keypair keypair_;

    MerkleTree money_tree_;
    MerkleTree consensus_tree_;
    MerkleTree dao_tree_;

    std::vector<OwnCoin> money_coins_;
    std::vector<OwnCoin> staked_coins_;
    std::set<Hash> money_nullifiers_;
    std::set<Hash> consensus_nullifiers_;

    // dao bulla -> leaf position in the dao tree
    std::map<Hash, uint64_t> dao_positions_;
    std::vector<DaoProposal> proposals_;
    std::map<Hash, std::vector<DaoVoteNote>> votes_;

    void scan_money(const ContractCall &call);
    void scan_consensus(const ContractCall &call);
    void scan_dao(const ContractCall &call);

    void add_money_output(const Output &output);
    void add_consensus_output(const Output &output);

public:
    explicit Wallet(const Keypair &keypair) : keypair_(keypair) {}

    const Keypair& keypair() const { return keypair_; }
    const PublicKey& pubkey() const { return keypair_.pubkey; }

    void scan_transaction(const Transaction &tx);
    void scan_block(const BlockInfo &block);

    // owned money coins of token_id whose nullifier is not on chain yet
    std::vector<OwnCoin> unspent_coins(const Fr &token_id) const;
    uint64_t balance(const Fr &token_id) const;
    // owned consensus coins not yet unstaked or re-staked
    std::vector<OwnCoin> staked_coins() const;

    std::optional<SpendCoin> money_spend(const OwnCoin &coin) const;
    std::optional<SpendCoin> consensus_spend(const OwnCoin &coin) const;
    std::optional<MerklePath> dao_path(const Fr &dao_bulla) const;

    Fr money_root() const { return money_tree_.root(); }
    Fr consensus_root() const { return consensus_tree_.root(); }
    Fr dao_root() const { return dao_tree_.root(); }

    // proposals and votes sealed to this key
    const std::vector<DaoProposal>& proposals() const { return proposals_; }
    std::vector<DaoVoteNote> votes(const Fr &proposal_bulla) const;
};
