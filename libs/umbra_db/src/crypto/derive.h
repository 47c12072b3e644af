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
#include "keys.h"
#include "utils.h"

// Hash derivations shared by circuits, contracts and clients.
// Argument order is the hash input order.

Fr derive_coin(
    const Fr &pub_x,
    const Fr &pub_y,
    const Fr &value,
    const Fr &token_id,
    const Fr &serial,
    const Fr &spend_hook,
    const Fr &user_data,
    const Fr &coin_blind
);

Fr derive_nullifier(const Fr &secret, const Fr &serial);
Fr derive_user_data_enc(const Fr &user_data, const Fr &blind);

// token ids are bound to the signing key allowed to mint them
Fr derive_token_id(const PublicKey &authority);

// stands in for a signing key inside a circuit, binding a proof to it
Fr signature_tag(const PublicKey &signer);

Fr derive_dao_bulla(
    const Fr &proposer_limit,
    const Fr &quorum,
    const Fr &approval_ratio_quot,
    const Fr &approval_ratio_base,
    const Fr &gov_token_id,
    const Fr &pub_x,
    const Fr &pub_y,
    const Fr &bulla_blind
);

Fr derive_proposal_bulla(
    const Fr &dest_x,
    const Fr &dest_y,
    const Fr &amount,
    const Fr &serial,
    const Fr &token_id,
    const Fr &dao_bulla,
    const Fr &blind
);

// hides which token a coin or a governance vote is in
Fr derive_token_commit(const Fr &token_id, const Fr &blind);
