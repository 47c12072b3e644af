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
#include "money_proofs.h"

// Money::StakeV1 then Consensus::StakeV1, moving a native coin into the
// consensus tree under the same owner.
Result<CallPair, BuilderError> build_stake(const ZkSetup &zk, const SpendCoin &coin);

// Consensus::UnstakeV1 then Money::UnstakeV1, taking a staked coin back.
Result<CallPair, BuilderError> build_unstake(const ZkSetup &zk, const SpendCoin &staked);

// Consensus::ProposalV1, re-staking a staked coin with the block reward added.
Result<CallDebris, BuilderError> build_proposal(const ZkSetup &zk, const SpendCoin &staked);
