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


#include "consensus.h"

void ConsensusStakeParams::encode(Encoder &enc) const {
    input.encode(enc);
    output.encode(enc);
}

bool ConsensusStakeParams::decode(Decoder &dec, ConsensusStakeParams &out) {
    return StakeInput::decode(dec, out.input) && Output::decode(dec, out.output);
}

void ConsensusUnstakeParams::encode(Encoder &enc) const {
    enc.scalar(token_blind);
    input.encode(enc);
}

bool ConsensusUnstakeParams::decode(Decoder &dec, ConsensusUnstakeParams &out) {
    return dec.scalar(out.token_blind) && Input::decode(dec, out.input);
}

void ConsensusProposalParams::encode(Encoder &enc) const {
    enc.scalar(token_blind);
    input.encode(enc);
    output.encode(enc);
}

bool ConsensusProposalParams::decode(Decoder &dec, ConsensusProposalParams &out) {
    return dec.scalar(out.token_blind)
        && Input::decode(dec, out.input)
        && Output::decode(dec, out.output);
}

void ConsensusProposalUpdate::encode(Encoder &enc) const {
    enc.scalar(nullifier);
    enc.scalar(coin);
}

bool ConsensusProposalUpdate::decode(Decoder &dec, ConsensusProposalUpdate &out) {
    return dec.scalar(out.nullifier) && dec.scalar(out.coin);
}

PublicInputs reward_public_inputs(const EcPoint &value_commit, const EcPoint &new_value_commit) {
    return {value_commit.x, value_commit.y, new_value_commit.x, new_value_commit.y};
}
