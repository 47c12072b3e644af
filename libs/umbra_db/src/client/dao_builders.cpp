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


#include "dao_builders.h"
#include "circuits.h"
#include "commit.h"
#include "derive.h"
#include "money_builders.h"

DaoTally DaoTally::from_votes(const std::vector<DaoVoteNote> &votes) {
    DaoTally tally;
    for (auto &vote : votes) {
        tally.yes_value += vote.vote_option * vote.all_vote_value;
        tally.all_value += vote.all_vote_value;
        tally.yes_blind += vote.yes_vote_blind;
        tally.all_blind += vote.all_vote_blind;
    }
    return tally;
}

DaoProposal make_proposal(
    const DaoParams &dao,
    const PublicKey &dest,
    uint64_t amount,
    const Fr &token_id
) {
    DaoProposal proposal;
    proposal.dest = dest;
    proposal.amount = amount;
    proposal.serial = rand_fr();
    proposal.token_id = token_id;
    proposal.dao_bulla = dao.to_bulla();
    proposal.blind = rand_fr();
    return proposal;
}

Result<CallDebris, BuilderError> build_dao_mint(
    const ZkSetup &zk,
    const DaoParams &dao,
    const SecretKey &dao_secret
) {
    auto proof = prove(zk, DAO_MINT_CIRCUIT, dao.to_witness());
    if (proof.is_err()) return proof.unwrap_err();

    DaoMintParams params{dao.to_bulla(), dao.public_key};

    CallDebris debris;
    debris.call = ContractCall{
        dao_contract_id(),
        static_cast<uint8_t>(DaoFunction::MintV1),
        to_bytes(params),
    };
    debris.proofs.push_back(proof.unwrap());
    debris.signature_secrets.push_back(dao_secret);
    return debris;
}

// Governance coin burn shared by proposing and voting. Nothing is spent,
// the proof only shows the coin exists and who holds it.
struct GovInput {
    Proof proof;
    SecretKey signature_secret;
    EcPoint value_commit;
    Fr merkle_root;
    Fs value_blind;
};

static Result<GovInput, BuilderError> gov_input(
    const ZkSetup &zk,
    const std::string &circuit,
    const SpendCoin &spend,
    const Fr &gov_token_id,
    const Fr &gov_token_blind
) {
    const OwnCoin &coin = spend.coin;
    if (coin.note.token_id != gov_token_id) return BuilderError::TokenMismatch;
    if (spend.path.position != coin.leaf_position) return BuilderError::MissingMerklePath;

    GovInput out;
    out.signature_secret = SecretKey::random();
    out.value_blind = rand_fs();
    out.value_commit = pedersen_commitment_u64(coin.note.value, out.value_blind);
    out.merkle_root = merkle_root_from_path(coin.coin, spend.path);

    Witness w{
        fs_to_fr(coin.secret.spend),
        coin.note.serial,
        fr_from_u64(coin.note.value),
        gov_token_id,
        coin.note.coin_blind,
        fs_to_fr(out.value_blind),
        gov_token_blind,
    };
    push_path(w, spend.path);
    w.push_back(signature_tag(PublicKey::from_secret(out.signature_secret)));

    auto proof = prove(zk, circuit, w);
    if (proof.is_err()) return proof.unwrap_err();
    out.proof = proof.unwrap();
    return out;
}

static void append(Witness &w, const Witness &more) {
    w.insert(w.end(), more.begin(), more.end());
}

Result<CallDebris, BuilderError> build_dao_propose(
    const ZkSetup &zk,
    const DaoParams &dao,
    const MerklePath &dao_path,
    const std::vector<SpendCoin> &gov_coins,
    const DaoProposal &proposal
) {
    if (gov_coins.empty()) return BuilderError::NoInputs;

    Fr gov_token_blind = rand_fr();
    DaoProposeParams params;
    CallDebris debris;

    uint64_t total_funds = 0;
    std::vector<Fs> blinds;
    for (auto &spend : gov_coins) {
        auto input = gov_input(zk, DAO_PROPOSE_BURN_CIRCUIT, spend, dao.gov_token_id, gov_token_blind);
        if (input.is_err()) return input.unwrap_err();
        auto &in = input.unwrap();

        params.inputs.push_back(DaoProposeInput{
            in.value_commit,
            in.merkle_root,
            PublicKey::from_secret(in.signature_secret),
        });
        debris.proofs.push_back(in.proof);
        debris.signature_secrets.push_back(in.signature_secret);

        total_funds += spend.coin.note.value;
        blinds.push_back(in.value_blind);
    }
    if (total_funds < dao.proposer_limit) return BuilderError::InsufficientFunds;

    Witness w{fr_from_u64(total_funds), fs_to_fr(sum_fs(blinds)), gov_token_blind};
    append(w, proposal.to_witness());
    append(w, dao.to_witness());
    push_path(w, dao_path);

    auto main = prove(zk, DAO_PROPOSE_MAIN_CIRCUIT, w);
    if (main.is_err()) return main.unwrap_err();
    debris.proofs.push_back(main.unwrap());

    params.dao_merkle_root = merkle_root_from_path(dao.to_bulla(), dao_path);
    params.token_commit = derive_token_commit(dao.gov_token_id, gov_token_blind);
    params.proposal_bulla = proposal.to_bulla();
    auto sealed = aead_seal(dao.public_key, to_bytes(proposal));
    if (!sealed.has_value()) return BuilderError::EncryptionFailed;
    params.note = std::move(sealed.value());

    debris.call = ContractCall{
        dao_contract_id(),
        static_cast<uint8_t>(DaoFunction::ProposeV1),
        to_bytes(params),
    };
    return debris;
}

Result<CallDebris, BuilderError> build_dao_vote(
    const ZkSetup &zk,
    const DaoParams &dao,
    const std::vector<SpendCoin> &gov_coins,
    const DaoProposal &proposal,
    bool vote_yes
) {
    if (gov_coins.empty()) return BuilderError::NoInputs;

    Fr gov_token_blind = rand_fr();
    DaoVoteParams params;
    CallDebris debris;

    DaoVoteNote note;
    note.vote_option = vote_yes ? 1 : 0;
    note.yes_vote_blind = rand_fs();
    note.all_vote_value = 0;
    note.all_vote_blind = Fs::zero();

    for (auto &spend : gov_coins) {
        auto input = gov_input(zk, DAO_VOTE_BURN_CIRCUIT, spend, dao.gov_token_id, gov_token_blind);
        if (input.is_err()) return input.unwrap_err();
        auto &in = input.unwrap();

        params.inputs.push_back(DaoVoteInput{
            spend.coin.nullifier,
            in.value_commit,
            in.merkle_root,
            PublicKey::from_secret(in.signature_secret),
        });
        debris.proofs.push_back(in.proof);
        debris.signature_secrets.push_back(in.signature_secret);

        note.all_vote_value += spend.coin.note.value;
        note.all_vote_blind += in.value_blind;
    }

    Witness w = dao.to_witness();
    append(w, proposal.to_witness());
    append(w, {
        fr_from_u64(note.vote_option),
        fs_to_fr(note.yes_vote_blind),
        fr_from_u64(note.all_vote_value),
        fs_to_fr(note.all_vote_blind),
        gov_token_blind,
    });

    auto main = prove(zk, DAO_VOTE_MAIN_CIRCUIT, w);
    if (main.is_err()) return main.unwrap_err();
    debris.proofs.push_back(main.unwrap());

    params.token_commit = derive_token_commit(dao.gov_token_id, gov_token_blind);
    params.proposal_bulla = proposal.to_bulla();
    params.yes_vote_commit = pedersen_commitment_u64(
        note.vote_option * note.all_vote_value, note.yes_vote_blind);
    auto sealed = aead_seal(dao.public_key, to_bytes(note));
    if (!sealed.has_value()) return BuilderError::EncryptionFailed;
    params.note = std::move(sealed.value());

    debris.call = ContractCall{
        dao_contract_id(),
        static_cast<uint8_t>(DaoFunction::VoteV1),
        to_bytes(params),
    };
    return debris;
}

Result<CallPair, BuilderError> build_dao_exec(
    const ZkSetup &zk,
    const DaoParams &dao,
    const DaoProposal &proposal,
    const std::vector<SpendCoin> &treasury,
    const DaoTally &tally
) {
    if (treasury.empty()) return BuilderError::NoInputs;

    uint64_t input_value = 0;
    for (auto &spend : treasury) {
        if (spend.coin.note.token_id != proposal.token_id) return BuilderError::TokenMismatch;
        input_value += spend.coin.note.value;
    }
    if (input_value < proposal.amount) return BuilderError::InsufficientFunds;

    Fr dao_bulla = dao.to_bulla();
    const Fr &dao_spend_hook = dao_contract_id();
    Fr zero = Fr::zero();

    TransferOutput pay = TransferOutput::to(proposal.dest, proposal.amount, proposal.token_id);
    TransferOutput change = TransferOutput::to(dao.public_key, input_value - proposal.amount, proposal.token_id);
    change.spend_hook = dao_spend_hook;
    change.user_data = dao_bulla;

    TransferCallBuilder transfer(zk);
    for (auto &spend : treasury) transfer.add_input(spend);
    transfer.add_output(pay);
    transfer.add_output(change);
    Fs input_blind = transfer.input_blind_sum();

    auto transfer_debris = transfer.build();
    if (transfer_debris.is_err()) return transfer_debris.unwrap_err();

    Witness w = proposal.to_witness();
    append(w, dao.to_witness());
    append(w, {
        fr_from_u64(tally.yes_value),
        fr_from_u64(tally.all_value),
        fs_to_fr(tally.yes_blind),
        fs_to_fr(tally.all_blind),
        pay.serial,
        pay.coin_blind,
        change.serial,
        change.coin_blind,
        fr_from_u64(input_value),
        fs_to_fr(input_blind),
        dao_spend_hook,
    });

    auto proof = prove(zk, DAO_EXEC_CIRCUIT, w);
    if (proof.is_err()) return proof.unwrap_err();

    auto [dest_x, dest_y] = proposal.dest.xy();
    auto [dao_x, dao_y] = dao.public_key.xy();

    DaoExecParams params;
    params.proposal_bulla = proposal.to_bulla();
    params.coin_0 = derive_coin(
        dest_x, dest_y, fr_from_u64(proposal.amount), proposal.token_id,
        pay.serial, zero, zero, pay.coin_blind);
    params.coin_1 = derive_coin(
        dao_x, dao_y, fr_from_u64(input_value - proposal.amount), proposal.token_id,
        change.serial, dao_spend_hook, dao_bulla, change.coin_blind);
    params.yes_vote_commit = pedersen_commitment_u64(tally.yes_value, tally.yes_blind);
    params.all_vote_commit = pedersen_commitment_u64(tally.all_value, tally.all_blind);
    params.input_value_commit = pedersen_commitment_u64(input_value, input_blind);

    CallPair pair;
    pair.first = transfer_debris.take();
    pair.second.call = ContractCall{
        dao_contract_id(),
        static_cast<uint8_t>(DaoFunction::ExecV1),
        to_bytes(params),
    };
    pair.second.proofs.push_back(proof.unwrap());
    return pair;
}
