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
#include "contract.h"
#include "consensus.h"

extern const std::string CONSENSUS_INFO_TABLE;
extern const std::string CONSENSUS_COINS_TABLE;
extern const std::string CONSENSUS_NULLIFIERS_TABLE;

// key inside CONSENSUS_INFO_TABLE
extern const std::string CONSENSUS_COIN_TREE;

/*
 *  Holds staked coins in a tree of its own. Staking and unstaking always pair
 *  with a money call: Money::StakeV1 right before Consensus::StakeV1, and
 *  Consensus::UnstakeV1 right before Money::UnstakeV1.
 */
class ConsensusContract : public Contract {
public:
    const ContractId& id() const override { return consensus_contract_id(); }
    const char* name() const override { return "Consensus"; }

    int deploy(StoreWriter &db) const override;

    Result<CallMetadata, ContractError> get_metadata(
        const std::vector<ContractCall> &calls,
        size_t call_idx
    ) const override;

    Result<Bytes, ContractError> process_instruction(
        const std::vector<ContractCall> &calls,
        size_t call_idx,
        const StoreView &db
    ) const override;

    ContractError process_update(StoreWriter &db, const ByteSlice &update) const override;
};
