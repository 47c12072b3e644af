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
#include "proof.h"

/*
 *  Witness layouts. Order is positional, the verifier never sees a witness.
 *  Secrets and value blinds are Fs values carried as Fr.
 *
 *  Money::Mint_V1      pub_x, pub_y, value, token_id, serial, spend_hook,
 *                      user_data, coin_blind, value_blind, token_blind
 *      -> coin, vc.x, vc.y, token_commit
 *
 *  Money::Burn_V1      secret, serial, value, token_id, spend_hook, user_data,
 *                      coin_blind, value_blind, token_blind, user_data_blind,
 *                      leaf_pos, path[32], signature_tag
 *      -> nullifier, vc.x, vc.y, token_commit, merkle_root, user_data_enc,
 *         spend_hook, signature_tag
 *
 *  Consensus::Reward_V1    value, reward, value_blind
 *      -> vc.x, vc.y, new_vc.x, new_vc.y
 *
 *  Dao::Mint           proposer_limit, quorum, ratio_quot, ratio_base,
 *                      gov_token_id, dao_x, dao_y, dao_blind
 *      -> dao_bulla
 *
 *  Dao::ProposeBurn / Dao::VoteBurn
 *                      secret, serial, value, gov_token_id, coin_blind,
 *                      value_blind, gov_token_blind, leaf_pos, path[32],
 *                      signature_tag
 *      ProposeBurn -> vc.x, vc.y, token_commit, merkle_root, signature_tag
 *      VoteBurn    -> nullifier, vc.x, vc.y, token_commit, merkle_root,
 *                     signature_tag
 *
 *  Dao::ProposeMain    total_funds, total_funds_blind, gov_token_blind,
 *                      dest_x, dest_y, amount, serial, token_id, proposal_blind,
 *                      <dao params as in Dao::Mint>, dao_leaf_pos, dao_path[32]
 *      -> token_commit, dao_merkle_root, proposal_bulla,
 *         total_funds.x, total_funds.y
 *
 *  Dao::VoteMain       <dao params as in Dao::Mint>,
 *                      dest_x, dest_y, amount, serial, token_id, proposal_blind,
 *                      vote_option, yes_vote_blind, all_vote_value,
 *                      all_vote_blind, gov_token_blind
 *      -> token_commit, proposal_bulla, yes.x, yes.y, all.x, all.y
 *
 *  Dao::Exec           dest_x, dest_y, amount, serial, token_id, proposal_blind,
 *                      <dao params as in Dao::Mint>,
 *                      yes_vote_value, all_vote_value, yes_vote_blind,
 *                      all_vote_blind, user_serial, user_coin_blind,
 *                      dao_serial, dao_coin_blind, input_value,
 *                      input_value_blind, dao_spend_hook
 *      -> proposal_bulla, coin_0, coin_1, yes.x, yes.y, all.x, all.y,
 *         input_vc.x, input_vc.y, dao_spend_hook
 */

extern const std::string MONEY_MINT_CIRCUIT;
extern const std::string MONEY_BURN_CIRCUIT;
extern const std::string CONSENSUS_REWARD_CIRCUIT;
extern const std::string DAO_MINT_CIRCUIT;
extern const std::string DAO_PROPOSE_BURN_CIRCUIT;
extern const std::string DAO_PROPOSE_MAIN_CIRCUIT;
extern const std::string DAO_VOTE_BURN_CIRCUIT;
extern const std::string DAO_VOTE_MAIN_CIRCUIT;
extern const std::string DAO_EXEC_CIRCUIT;

constexpr uint64_t CONSENSUS_REWARD = 1;

const std::vector<std::shared_ptr<const Circuit>>& all_circuits();
const Circuit* find_circuit(const std::string &name);
