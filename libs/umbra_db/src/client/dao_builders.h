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
#include "dao.h"

// Sums of the vote notes a DAO decrypted for one proposal.
struct DaoTally {
    uint64_t yes_value = 0;
    uint64_t all_value = 0;
    Fs yes_blind = Fs::zero();
    Fs all_blind = Fs::zero();

    static DaoTally from_votes(const std::vector<DaoVoteNote> &votes);
};

// A proposal paying amount of token_id to dest out of the DAO treasury.
DaoProposal make_proposal(
    const DaoParams &dao,
    const PublicKey &dest,
    uint64_t amount,
    const Fr &token_id
);

Result<CallDebris, BuilderError> build_dao_mint(
    const ZkSetup &zk,
    const DaoParams &dao,
    const SecretKey &dao_secret
);

// gov_coins prove the proposer holds at least the proposer limit
Result<CallDebris, BuilderError> build_dao_propose(
    const ZkSetup &zk,
    const DaoParams &dao,
    const MerklePath &dao_path,
    const std::vector<SpendCoin> &gov_coins,
    const DaoProposal &proposal
);

Result<CallDebris, BuilderError> build_dao_vote(
    const ZkSetup &zk,
    const DaoParams &dao,
    const std::vector<SpendCoin> &gov_coins,
    const DaoProposal &proposal,
    bool vote_yes
);

// Money::TransferV1 out of the treasury followed by Dao::ExecV1. The
// treasury coins are owned by the DAO key, so only its holder can build this.
Result<CallPair, BuilderError> build_dao_exec(
    const ZkSetup &zk,
    const DaoParams &dao,
    const DaoProposal &proposal,
    const std::vector<SpendCoin> &treasury,
    const DaoTally &tally
);
