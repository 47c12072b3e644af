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


#include "wallet.h"
#include "consensus.h"
#include "contract.h"
#include "log.h"

void Wallet::add_money_output(const Output &output) {
    auto pos = money_tree_.append(output.coin);
    if (!pos.has_value()) {
        log_error("wallet", "money tree is full");
        return;
    }
    auto own = try_own_coin(keypair_.secret, output.coin, output.note, pos.value());
    if (own.has_value()) {
        log_debug("wallet", "received %llu at %llu",
            (unsigned long long)own->note.value, (unsigned long long)pos.value());
        money_coins_.push_back(std::move(own.value()));
    }
}

void Wallet::add_consensus_output(const Output &output) {
    auto pos = consensus_tree_.append(output.coin);
    if (!pos.has_value()) {
        log_error("wallet", "consensus tree is full");
        return;
    }
    auto own = try_own_coin(keypair_.secret, output.coin, output.note, pos.value());
    if (own.has_value()) staked_coins_.push_back(std::move(own.value()));
}

void Wallet::scan_money(const ContractCall &call) {
    auto func = money_function_from_byte(call.function);
    if (!func.has_value()) return;

    switch (func.value()) {
        case MoneyFunction::TransferV1:
        case MoneyFunction::OtcSwapV1: {
            auto params = from_bytes<MoneyTransferParams>(call.params);
            if (!params.has_value()) return;
            for (auto &input : params->inputs) money_nullifiers_.insert(scalar_id(input.nullifier));
            for (auto &output : params->outputs) add_money_output(output);
            return;
        }
        case MoneyFunction::MintV1: {
            auto params = from_bytes<MoneyMintParams>(call.params);
            if (params.has_value()) add_money_output(params->output);
            return;
        }
        case MoneyFunction::FreezeV1:
            return;
        case MoneyFunction::StakeV1: {
            auto params = from_bytes<MoneyStakeParams>(call.params);
            if (params.has_value()) money_nullifiers_.insert(scalar_id(params->input.nullifier));
            return;
        }
        case MoneyFunction::UnstakeV1: {
            auto params = from_bytes<MoneyUnstakeParams>(call.params);
            if (params.has_value()) add_money_output(params->output);
            return;
        }
    }
}

void Wallet::scan_consensus(const ContractCall &call) {
    auto func = consensus_function_from_byte(call.function);
    if (!func.has_value()) return;

    switch (func.value()) {
        case ConsensusFunction::StakeV1: {
            auto params = from_bytes<ConsensusStakeParams>(call.params);
            if (params.has_value()) add_consensus_output(params->output);
            return;
        }
        case ConsensusFunction::ProposalV1: {
            auto params = from_bytes<ConsensusProposalParams>(call.params);
            if (!params.has_value()) return;
            consensus_nullifiers_.insert(scalar_id(params->input.nullifier));
            add_consensus_output(params->output);
            return;
        }
        case ConsensusFunction::UnstakeV1: {
            auto params = from_bytes<ConsensusUnstakeParams>(call.params);
            if (params.has_value()) consensus_nullifiers_.insert(scalar_id(params->input.nullifier));
            return;
        }
    }
}

void Wallet::scan_dao(const ContractCall &call) {
    auto func = dao_function_from_byte(call.function);
    if (!func.has_value()) return;

    switch (func.value()) {
        case DaoFunction::MintV1: {
            auto params = from_bytes<DaoMintParams>(call.params);
            if (!params.has_value()) return;
            auto pos = dao_tree_.append(params->dao_bulla);
            if (pos.has_value()) dao_positions_[scalar_id(params->dao_bulla)] = pos.value();
            return;
        }
        case DaoFunction::ProposeV1: {
            auto params = from_bytes<DaoProposeParams>(call.params);
            if (!params.has_value()) return;
            auto plain = aead_open(keypair_.secret, params->note);
            if (!plain.has_value()) return;
            auto proposal = from_bytes<DaoProposal>(plain.value());
            if (proposal.has_value() && proposal->to_bulla() == params->proposal_bulla)
                proposals_.push_back(proposal.value());
            return;
        }
        case DaoFunction::VoteV1: {
            auto params = from_bytes<DaoVoteParams>(call.params);
            if (!params.has_value()) return;
            auto plain = aead_open(keypair_.secret, params->note);
            if (!plain.has_value()) return;
            auto note = from_bytes<DaoVoteNote>(plain.value());
            if (note.has_value()) votes_[scalar_id(params->proposal_bulla)].push_back(note.value());
            return;
        }
        case DaoFunction::ExecV1:
            return;
    }
}

void Wallet::scan_transaction(const Transaction &tx) {
    for (auto &call : tx.calls) {
        if (call.contract_id == money_contract_id())
            scan_money(call);
        else if (call.contract_id == consensus_contract_id())
            scan_consensus(call);
        else if (call.contract_id == dao_contract_id())
            scan_dao(call);
    }
}

void Wallet::scan_block(const BlockInfo &block) {
    for (auto &tx : block.txs) scan_transaction(tx);
}

std::vector<OwnCoin> Wallet::unspent_coins(const Fr &token_id) const {
    std::vector<OwnCoin> out;
    for (auto &coin : money_coins_) {
        if (coin.note.token_id != token_id) continue;
        if (money_nullifiers_.count(scalar_id(coin.nullifier))) continue;
        out.push_back(coin);
    }
    return out;
}

uint64_t Wallet::balance(const Fr &token_id) const {
    uint64_t total = 0;
    for (auto &coin : unspent_coins(token_id)) total += coin.note.value;
    return total;
}

std::vector<OwnCoin> Wallet::staked_coins() const {
    std::vector<OwnCoin> out;
    for (auto &coin : staked_coins_)
        if (!consensus_nullifiers_.count(scalar_id(coin.nullifier))) out.push_back(coin);
    return out;
}

std::optional<SpendCoin> Wallet::money_spend(const OwnCoin &coin) const {
    auto path = money_tree_.witness(coin.leaf_position);
    if (!path.has_value()) return std::nullopt;
    return SpendCoin{coin, path.value()};
}

std::optional<SpendCoin> Wallet::consensus_spend(const OwnCoin &coin) const {
    auto path = consensus_tree_.witness(coin.leaf_position);
    if (!path.has_value()) return std::nullopt;
    return SpendCoin{coin, path.value()};
}

std::optional<MerklePath> Wallet::dao_path(const Fr &dao_bulla) const {
    auto it = dao_positions_.find(scalar_id(dao_bulla));
    if (it == dao_positions_.end()) return std::nullopt;
    return dao_tree_.witness(it->second);
}

std::vector<DaoVoteNote> Wallet::votes(const Fr &proposal_bulla) const {
    auto it = votes_.find(scalar_id(proposal_bulla));
    if (it == votes_.end()) return {};
    return it->second;
}
