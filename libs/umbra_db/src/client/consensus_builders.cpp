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


#include "consensus_builders.h"
#include "circuits.h"
#include "consensus.h"

static bool is_native(const OwnCoin &coin) {
    return coin.note.token_id == native_token_id();
}

Result<CallPair, BuilderError> build_stake(const ZkSetup &zk, const SpendCoin &coin) {
    if (!is_native(coin.coin)) return BuilderError::NonNativeToken;

    Fs value_blind = rand_fs();
    Fr token_blind = rand_fr();

    auto burn = create_burn_proof(zk, coin, value_blind, token_blind);
    if (burn.is_err()) return burn.unwrap_err();
    const Input &input = burn.unwrap().input;

    Note note = make_note(
        coin.coin.note.value, native_token_id(),
        consensus_contract_id(), Fr::zero(),
        value_blind, token_blind);
    auto mint = create_mint_proof(zk, PublicKey::from_secret(coin.coin.secret), note);
    if (mint.is_err()) return mint.unwrap_err();

    MoneyStakeParams money_params{token_blind, input};
    ConsensusStakeParams consensus_params{
        StakeInput{token_blind, input.value_commit, input.nullifier, input.merkle_root, input.signature_public},
        mint.unwrap().output,
    };

    CallPair pair;
    pair.first.call = ContractCall{
        money_contract_id(),
        static_cast<uint8_t>(MoneyFunction::StakeV1),
        to_bytes(money_params),
    };
    pair.first.proofs.push_back(burn.unwrap().proof);
    pair.first.signature_secrets.push_back(burn.unwrap().signature_secret);

    pair.second.call = ContractCall{
        consensus_contract_id(),
        static_cast<uint8_t>(ConsensusFunction::StakeV1),
        to_bytes(consensus_params),
    };
    pair.second.proofs.push_back(mint.unwrap().proof);
    pair.second.signature_secrets.push_back(burn.unwrap().signature_secret);
    return pair;
}

Result<CallPair, BuilderError> build_unstake(const ZkSetup &zk, const SpendCoin &staked) {
    if (!is_native(staked.coin)) return BuilderError::NonNativeToken;

    Fs value_blind = rand_fs();
    Fr token_blind = rand_fr();

    auto burn = create_burn_proof(zk, staked, value_blind, token_blind);
    if (burn.is_err()) return burn.unwrap_err();
    const Input &input = burn.unwrap().input;

    Note note = make_note(
        staked.coin.note.value, native_token_id(),
        Fr::zero(), Fr::zero(),
        value_blind, token_blind);
    auto mint = create_mint_proof(zk, PublicKey::from_secret(staked.coin.secret), note);
    if (mint.is_err()) return mint.unwrap_err();

    ConsensusUnstakeParams consensus_params{token_blind, input};
    MoneyUnstakeParams money_params{token_blind, input, mint.unwrap().output, Fr::zero()};

    CallPair pair;
    pair.first.call = ContractCall{
        consensus_contract_id(),
        static_cast<uint8_t>(ConsensusFunction::UnstakeV1),
        to_bytes(consensus_params),
    };
    pair.first.proofs.push_back(burn.unwrap().proof);
    pair.first.signature_secrets.push_back(burn.unwrap().signature_secret);

    pair.second.call = ContractCall{
        money_contract_id(),
        static_cast<uint8_t>(MoneyFunction::UnstakeV1),
        to_bytes(money_params),
    };
    pair.second.proofs.push_back(mint.unwrap().proof);
    pair.second.signature_secrets.push_back(burn.unwrap().signature_secret);
    return pair;
}

Result<CallDebris, BuilderError> build_proposal(const ZkSetup &zk, const SpendCoin &staked) {
    if (!is_native(staked.coin)) return BuilderError::NonNativeToken;
    uint64_t value = staked.coin.note.value;
    if (value > UINT64_MAX - CONSENSUS_REWARD) return BuilderError::ValueMismatch;

    // the reward proof ties both commitments to one blind
    Fs value_blind = rand_fs();
    Fr token_blind = rand_fr();

    auto burn = create_burn_proof(zk, staked, value_blind, token_blind);
    if (burn.is_err()) return burn.unwrap_err();

    Note note = make_note(
        value + CONSENSUS_REWARD, native_token_id(),
        consensus_contract_id(), Fr::zero(),
        value_blind, token_blind);
    auto mint = create_mint_proof(zk, PublicKey::from_secret(staked.coin.secret), note);
    if (mint.is_err()) return mint.unwrap_err();

    auto reward = prove(zk, CONSENSUS_REWARD_CIRCUIT, {
        fr_from_u64(value),
        fr_from_u64(CONSENSUS_REWARD),
        fs_to_fr(value_blind),
    });
    if (reward.is_err()) return reward.unwrap_err();

    ConsensusProposalParams params{token_blind, burn.unwrap().input, mint.unwrap().output};

    CallDebris debris;
    debris.call = ContractCall{
        consensus_contract_id(),
        static_cast<uint8_t>(ConsensusFunction::ProposalV1),
        to_bytes(params),
    };
    debris.proofs = {burn.unwrap().proof, mint.unwrap().proof, reward.unwrap()};
    debris.signature_secrets.push_back(burn.unwrap().signature_secret);
    return debris;
}
