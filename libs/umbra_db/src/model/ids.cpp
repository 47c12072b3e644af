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


#include "ids.h"
#include "hashing.h"

const ContractId& money_contract_id() {
    static const ContractId id = hash_to_field("umbra:contract:money");
    return id;
}

const ContractId& consensus_contract_id() {
    static const ContractId id = hash_to_field("umbra:contract:consensus");
    return id;
}

const ContractId& dao_contract_id() {
    static const ContractId id = hash_to_field("umbra:contract:dao");
    return id;
}

const Fr& native_token_id() {
    static const Fr id = hash_to_field("umbra:token:native");
    return id;
}

std::optional<MoneyFunction> money_function_from_byte(uint8_t b) {
    switch (b) {
        case 0x00: return MoneyFunction::TransferV1;
        case 0x01: return MoneyFunction::OtcSwapV1;
        case 0x02: return MoneyFunction::MintV1;
        case 0x03: return MoneyFunction::FreezeV1;
        case 0x05: return MoneyFunction::StakeV1;
        case 0x06: return MoneyFunction::UnstakeV1;
        default:   return std::nullopt;
    }
}

std::optional<ConsensusFunction> consensus_function_from_byte(uint8_t b) {
    switch (b) {
        case 0x00: return ConsensusFunction::StakeV1;
        case 0x01: return ConsensusFunction::ProposalV1;
        case 0x02: return ConsensusFunction::UnstakeV1;
        default:   return std::nullopt;
    }
}

std::optional<DaoFunction> dao_function_from_byte(uint8_t b) {
    switch (b) {
        case 0x00: return DaoFunction::MintV1;
        case 0x01: return DaoFunction::ProposeV1;
        case 0x02: return DaoFunction::VoteV1;
        case 0x03: return DaoFunction::ExecV1;
        default:   return std::nullopt;
    }
}

const char* money_function_name(MoneyFunction f) {
    switch (f) {
        case MoneyFunction::TransferV1: return "Money::TransferV1";
        case MoneyFunction::OtcSwapV1:  return "Money::OtcSwapV1";
        case MoneyFunction::MintV1:     return "Money::MintV1";
        case MoneyFunction::FreezeV1:   return "Money::FreezeV1";
        case MoneyFunction::StakeV1:    return "Money::StakeV1";
        case MoneyFunction::UnstakeV1:  return "Money::UnstakeV1";
    }
    return "Money::?";
}

const char* consensus_function_name(ConsensusFunction f) {
    switch (f) {
        case ConsensusFunction::StakeV1:    return "Consensus::StakeV1";
        case ConsensusFunction::ProposalV1: return "Consensus::ProposalV1";
        case ConsensusFunction::UnstakeV1:  return "Consensus::UnstakeV1";
    }
    return "Consensus::?";
}

const char* dao_function_name(DaoFunction f) {
    switch (f) {
        case DaoFunction::MintV1:    return "Dao::MintV1";
        case DaoFunction::ProposeV1: return "Dao::ProposeV1";
        case DaoFunction::VoteV1:    return "Dao::VoteV1";
        case DaoFunction::ExecV1:    return "Dao::ExecV1";
    }
    return "Dao::?";
}
