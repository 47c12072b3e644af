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
#include "utils.h"
#include <optional>

using ContractId = Fr;

const ContractId& money_contract_id();
const ContractId& consensus_contract_id();
const ContractId& dao_contract_id();

// token id of the native coin, the only one that can be staked
const Fr& native_token_id();

enum class MoneyFunction : uint8_t {
    TransferV1 = 0x00,
    OtcSwapV1  = 0x01,
    MintV1     = 0x02,
    FreezeV1   = 0x03,
    StakeV1    = 0x05,
    UnstakeV1  = 0x06,
};

enum class ConsensusFunction : uint8_t {
    StakeV1    = 0x00,
    ProposalV1 = 0x01,
    UnstakeV1  = 0x02,
};

enum class DaoFunction : uint8_t {
    MintV1    = 0x00,
    ProposeV1 = 0x01,
    VoteV1    = 0x02,
    ExecV1    = 0x03,
};

// nullopt for bytes that name no function
std::optional<MoneyFunction> money_function_from_byte(uint8_t b);
std::optional<ConsensusFunction> consensus_function_from_byte(uint8_t b);
std::optional<DaoFunction> dao_function_from_byte(uint8_t b);

const char* money_function_name(MoneyFunction f);
const char* consensus_function_name(ConsensusFunction f);
const char* dao_function_name(DaoFunction f);
