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
#include "money.h"

struct ConsensusStakeParams {
    StakeInput input;
    Output output;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, ConsensusStakeParams &out);
};

struct ConsensusStakeUpdate {
    Fr coin;

    void encode(Encoder &enc) const { enc.scalar(coin); }
    static bool decode(Decoder &dec, ConsensusStakeUpdate &out) { return dec.scalar(out.coin); }
};

struct ConsensusUnstakeParams {
    Fr token_blind;
    Input input;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, ConsensusUnstakeParams &out);
};

struct ConsensusUnstakeUpdate {
    Fr nullifier;

    void encode(Encoder &enc) const { enc.scalar(nullifier); }
    static bool decode(Decoder &dec, ConsensusUnstakeUpdate &out) { return dec.scalar(out.nullifier); }
};

// Spends a staked coin and stakes it again with the block reward added.
struct ConsensusProposalParams {
    Fr token_blind;
    Input input;
    Output output;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, ConsensusProposalParams &out);
};

struct ConsensusProposalUpdate {
    Fr nullifier;
    Fr coin;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, ConsensusProposalUpdate &out);
};

PublicInputs reward_public_inputs(const EcPoint &value_commit, const EcPoint &new_value_commit);
