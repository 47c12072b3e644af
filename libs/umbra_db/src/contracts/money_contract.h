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
#include "money.h"

// table names inside the money contract namespace
extern const std::string MONEY_INFO_TABLE;
extern const std::string MONEY_COINS_TABLE;
extern const std::string MONEY_NULLIFIERS_TABLE;
extern const std::string MONEY_TOKEN_FREEZES_TABLE;

// keys inside MONEY_INFO_TABLE
extern const std::string MONEY_COIN_TREE;
extern const std::string MONEY_FAUCET_PUBKEYS;

class MoneyContract : public Contract {
public:
    const ContractId& id() const override { return money_contract_id(); }
    const char* name() const override { return "Money"; }

    // stores the configured faucet keys
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
