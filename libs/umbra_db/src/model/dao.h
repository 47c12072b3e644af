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
#include "aead.h"
#include "keys.h"
#include "proof.h"
#include "serialize.h"

/*
 *  A DAO is only ever seen on chain as its bulla:
 *      Hash(proposer_limit, quorum, ratio_quot, ratio_base,
 *           gov_token_id, pub.x, pub.y, bulla_blind)
 *  A proposal passes when all votes >= quorum and
 *      yes / all >= ratio_quot / ratio_base
 */
struct DaoParams {
    uint64_t proposer_limit;
    uint64_t quorum;
    uint64_t approval_ratio_quot;
    uint64_t approval_ratio_base;
    Fr gov_token_id;
    PublicKey public_key;
    Fr bulla_blind;

    Fr to_bulla() const;
    // the eight scalars hashed into the bulla, in order
    Witness to_witness() const;
};

struct DaoProposal {
    PublicKey dest;
    uint64_t amount;
    Fr serial;
    Fr token_id;
    Fr dao_bulla;
    Fr blind;

    Fr to_bulla() const;
    // dest.x, dest.y, amount, serial, token_id, blind
    Witness to_witness() const;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, DaoProposal &out);
};

// Sealed to the DAO key so members can audit each vote.
struct DaoVoteNote {
    uint64_t vote_option;
    Fs yes_vote_blind;
    uint64_t all_vote_value;
    Fs all_vote_blind;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, DaoVoteNote &out);
};

// Stored per proposal bulla.
struct ProposalRecord {
    EcPoint yes_vote_commit;
    EcPoint all_vote_commit;
    bool executed;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, ProposalRecord &out);
};

// ----------------------- CALL PARAMS ------------------------

struct DaoMintParams {
    Fr dao_bulla;
    PublicKey dao_pubkey;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, DaoMintParams &out);
};

struct DaoMintUpdate {
    Fr dao_bulla;

    void encode(Encoder &enc) const { enc.scalar(dao_bulla); }
    static bool decode(Decoder &dec, DaoMintUpdate &out) { return dec.scalar(out.dao_bulla); }
};

struct DaoProposeInput {
    EcPoint value_commit;
    Fr merkle_root;
    PublicKey signature_public;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, DaoProposeInput &out);
};

struct DaoProposeParams {
    Fr dao_merkle_root;
    Fr token_commit;
    Fr proposal_bulla;
    AeadEncrypted note;
    std::vector<DaoProposeInput> inputs;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, DaoProposeParams &out);
};

struct DaoProposeUpdate {
    Fr proposal_bulla;

    void encode(Encoder &enc) const { enc.scalar(proposal_bulla); }
    static bool decode(Decoder &dec, DaoProposeUpdate &out) { return dec.scalar(out.proposal_bulla); }
};

struct DaoVoteInput {
    Fr nullifier;
    EcPoint vote_commit;
    Fr merkle_root;
    PublicKey signature_public;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, DaoVoteInput &out);
};

struct DaoVoteParams {
    Fr token_commit;
    Fr proposal_bulla;
    EcPoint yes_vote_commit;
    AeadEncrypted note;
    std::vector<DaoVoteInput> inputs;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, DaoVoteParams &out);
};

struct DaoVoteUpdate {
    Fr proposal_bulla;
    std::vector<Fr> vote_nullifiers;
    EcPoint yes_vote_commit;
    EcPoint all_vote_commit;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, DaoVoteUpdate &out);
};

struct DaoExecParams {
    Fr proposal_bulla;
    Fr coin_0;
    Fr coin_1;
    EcPoint yes_vote_commit;
    EcPoint all_vote_commit;
    EcPoint input_value_commit;

    void encode(Encoder &enc) const;
    static bool decode(Decoder &dec, DaoExecParams &out);
};

struct DaoExecUpdate {
    Fr proposal_bulla;

    void encode(Encoder &enc) const { enc.scalar(proposal_bulla); }
    static bool decode(Decoder &dec, DaoExecUpdate &out) { return dec.scalar(out.proposal_bulla); }
};

// ----------------------- PUBLIC INPUTS ------------------------

PublicInputs dao_mint_public_inputs(const DaoMintParams &params);
PublicInputs propose_burn_public_inputs(const DaoProposeInput &input, const Fr &token_commit);
PublicInputs propose_main_public_inputs(const DaoProposeParams &params);
PublicInputs vote_burn_public_inputs(const DaoVoteInput &input, const Fr &token_commit);
PublicInputs vote_main_public_inputs(const DaoVoteParams &params);
PublicInputs exec_public_inputs(const DaoExecParams &params, const Fr &dao_spend_hook);
