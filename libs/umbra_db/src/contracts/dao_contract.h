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
#include "dao.h"

extern const std::string DAO_INFO_TABLE;
extern const std::string DAO_BULLAS_TABLE;
extern const std::string DAO_PROPOSALS_TABLE;
extern const std::string DAO_VOTE_NULLIFIERS_TABLE;

// key inside DAO_INFO_TABLE
extern const std::string DAO_TREE;

// key of a vote nullifier, scoped to the proposal it was cast on
Bytes vote_nullifier_key(const Fr &proposal_bulla, const Fr &nullifier);

/*
 *  On chain governance. A DAO holds treasury coins whose spend hook is this
 *  contract, so they can only move inside a Money::TransferV1 that is
 *  followed by Dao::ExecV1 for a proposal that passed.
 *
 *  Proposal lifecycle: ProposeV1 stores empty tallies, each VoteV1 adds its
 *  commitments homomorphically, ExecV1 checks the tallies and closes it.
 */
class DaoContract : public Contract {
public:
    const ContractId& id() const override { return dao_contract_id(); }
    const char* name() const override { return "Dao"; }

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

// Tallies of a stored proposal, nullopt when it was never proposed.
Result<std::optional<ProposalRecord>, int> load_proposal(const StoreView &db, const Fr &proposal_bulla);
