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


#include "dao.h"
#include "commit.h"
#include "derive.h"

Fr DaoParams::to_bulla() const {
    Witness w = to_witness();
    return derive_dao_bulla(w[0], w[1], w[2], w[3], w[4], w[5], w[6], w[7]);
}

Witness DaoParams::to_witness() const {
    auto [x, y] = public_key.xy();
    return {
        fr_from_u64(proposer_limit),
        fr_from_u64(quorum),
        fr_from_u64(approval_ratio_quot),
        fr_from_u64(approval_ratio_base),
        gov_token_id,
        x, y,
        bulla_blind,
    };
}

Fr DaoProposal::to_bulla() const {
    auto [x, y] = dest.xy();
    return derive_proposal_bulla(x, y, fr_from_u64(amount), serial, token_id, dao_bulla, blind);
}

Witness DaoProposal::to_witness() const {
    auto [x, y] = dest.xy();
    return {x, y, fr_from_u64(amount), serial, token_id, blind};
}

void DaoProposal::encode(Encoder &enc) const {
    dest.encode(enc);
    enc.u64(amount);
    enc.scalar(serial);
    enc.scalar(token_id);
    enc.scalar(dao_bulla);
    enc.scalar(blind);
}

bool DaoProposal::decode(Decoder &dec, DaoProposal &out) {
    return PublicKey::decode(dec, out.dest)
        && dec.u64(out.amount)
        && dec.scalar(out.serial)
        && dec.scalar(out.token_id)
        && dec.scalar(out.dao_bulla)
        && dec.scalar(out.blind);
}

void DaoVoteNote::encode(Encoder &enc) const {
    enc.u64(vote_option);
    enc.scalar(yes_vote_blind);
    enc.u64(all_vote_value);
    enc.scalar(all_vote_blind);
}

bool DaoVoteNote::decode(Decoder &dec, DaoVoteNote &out) {
    return dec.u64(out.vote_option)
        && dec.scalar(out.yes_vote_blind)
        && dec.u64(out.all_vote_value)
        && dec.scalar(out.all_vote_blind);
}

void ProposalRecord::encode(Encoder &enc) const {
    enc.point(yes_vote_commit);
    enc.point(all_vote_commit);
    enc.boolean(executed);
}

bool ProposalRecord::decode(Decoder &dec, ProposalRecord &out) {
    return dec.point(out.yes_vote_commit)
        && dec.point(out.all_vote_commit)
        && dec.boolean(out.executed);
}

// ----------------------- CALL PARAMS ------------------------

void DaoMintParams::encode(Encoder &enc) const {
    enc.scalar(dao_bulla);
    dao_pubkey.encode(enc);
}

bool DaoMintParams::decode(Decoder &dec, DaoMintParams &out) {
    return dec.scalar(out.dao_bulla) && PublicKey::decode(dec, out.dao_pubkey);
}

void DaoProposeInput::encode(Encoder &enc) const {
    enc.point(value_commit);
    enc.scalar(merkle_root);
    signature_public.encode(enc);
}

bool DaoProposeInput::decode(Decoder &dec, DaoProposeInput &out) {
    return dec.point(out.value_commit)
        && dec.scalar(out.merkle_root)
        && PublicKey::decode(dec, out.signature_public);
}

void DaoProposeParams::encode(Encoder &enc) const {
    enc.scalar(dao_merkle_root);
    enc.scalar(token_commit);
    enc.scalar(proposal_bulla);
    note.encode(enc);
    encode_vec(enc, inputs);
}

bool DaoProposeParams::decode(Decoder &dec, DaoProposeParams &out) {
    return dec.scalar(out.dao_merkle_root)
        && dec.scalar(out.token_commit)
        && dec.scalar(out.proposal_bulla)
        && AeadEncrypted::decode(dec, out.note)
        && decode_vec(dec, out.inputs, 32 * 2 + PUBLIC_KEY_SIZE);
}

void DaoVoteInput::encode(Encoder &enc) const {
    enc.scalar(nullifier);
    enc.point(vote_commit);
    enc.scalar(merkle_root);
    signature_public.encode(enc);
}

bool DaoVoteInput::decode(Decoder &dec, DaoVoteInput &out) {
    return dec.scalar(out.nullifier)
        && dec.point(out.vote_commit)
        && dec.scalar(out.merkle_root)
        && PublicKey::decode(dec, out.signature_public);
}

void DaoVoteParams::encode(Encoder &enc) const {
    enc.scalar(token_commit);
    enc.scalar(proposal_bulla);
    enc.point(yes_vote_commit);
    note.encode(enc);
    encode_vec(enc, inputs);
}

bool DaoVoteParams::decode(Decoder &dec, DaoVoteParams &out) {
    return dec.scalar(out.token_commit)
        && dec.scalar(out.proposal_bulla)
        && dec.point(out.yes_vote_commit)
        && AeadEncrypted::decode(dec, out.note)
        && decode_vec(dec, out.inputs, 32 * 3 + PUBLIC_KEY_SIZE);
}

void DaoVoteUpdate::encode(Encoder &enc) const {
    enc.scalar(proposal_bulla);
    encode_scalars(enc, vote_nullifiers);
    enc.point(yes_vote_commit);
    enc.point(all_vote_commit);
}

bool DaoVoteUpdate::decode(Decoder &dec, DaoVoteUpdate &out) {
    return dec.scalar(out.proposal_bulla)
        && decode_scalars(dec, out.vote_nullifiers)
        && dec.point(out.yes_vote_commit)
        && dec.point(out.all_vote_commit);
}

void DaoExecParams::encode(Encoder &enc) const {
    enc.scalar(proposal_bulla);
    enc.scalar(coin_0);
    enc.scalar(coin_1);
    enc.point(yes_vote_commit);
    enc.point(all_vote_commit);
    enc.point(input_value_commit);
}

bool DaoExecParams::decode(Decoder &dec, DaoExecParams &out) {
    return dec.scalar(out.proposal_bulla)
        && dec.scalar(out.coin_0)
        && dec.scalar(out.coin_1)
        && dec.point(out.yes_vote_commit)
        && dec.point(out.all_vote_commit)
        && dec.point(out.input_value_commit);
}

// ----------------------- PUBLIC INPUTS ------------------------

PublicInputs dao_mint_public_inputs(const DaoMintParams &params) {
    return {params.dao_bulla};
}

PublicInputs propose_burn_public_inputs(
    const DaoProposeInput &input,
    const Fr &token_commit
) {
    const EcPoint &vc = input.value_commit;
    return {vc.x, vc.y, token_commit, input.merkle_root, signature_tag(input.signature_public)};
}

PublicInputs propose_main_public_inputs(const DaoProposeParams &params) {
    std::vector<EcPoint> commits;
    for (auto &input : params.inputs) commits.push_back(input.value_commit);
    EcPoint total = sum_commitments(commits);
    return {params.token_commit, params.dao_merkle_root, params.proposal_bulla, total.x, total.y};
}

PublicInputs vote_burn_public_inputs(
    const DaoVoteInput &input,
    const Fr &token_commit
) {
    const EcPoint &vc = input.vote_commit;
    return {
        input.nullifier, vc.x, vc.y, token_commit, input.merkle_root,
        signature_tag(input.signature_public),
    };
}

PublicInputs vote_main_public_inputs(const DaoVoteParams &params) {
    std::vector<EcPoint> commits;
    for (auto &input : params.inputs) commits.push_back(input.vote_commit);
    const EcPoint &yes = params.yes_vote_commit;
    EcPoint all = sum_commitments(commits);
    return {params.token_commit, params.proposal_bulla, yes.x, yes.y, all.x, all.y};
}

PublicInputs exec_public_inputs(const DaoExecParams &params, const Fr &dao_spend_hook) {
    const EcPoint &yes = params.yes_vote_commit;
    const EcPoint &all = params.all_vote_commit;
    const EcPoint &in = params.input_value_commit;
    return {
        params.proposal_bulla, params.coin_0, params.coin_1,
        yes.x, yes.y, all.x, all.y,
        in.x, in.y,
        dao_spend_hook,
    };
}
