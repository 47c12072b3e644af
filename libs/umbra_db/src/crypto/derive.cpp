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


#include "derive.h"
#include "hashing.h"
#include "mimc.h"

Fr derive_coin(
    const Fr &pub_x,
    const Fr &pub_y,
    const Fr &value,
    const Fr &token_id,
    const Fr &serial,
    const Fr &spend_hook,
    const Fr &user_data,
    const Fr &coin_blind
) {
    return field_hash({
        pub_x, pub_y, value, token_id, serial, spend_hook, user_data, coin_blind
    });
}

Fr derive_nullifier(const Fr &secret, const Fr &serial) {
    return field_hash({secret, serial});
}

Fr derive_user_data_enc(const Fr &user_data, const Fr &blind) {
    return field_hash({user_data, blind});
}

Fr derive_token_id(const PublicKey &authority) {
    auto comp = compress_p1(authority.inner);
    return hash_bytes_to_field("umbra:token_id", ByteSlice(comp.data(), comp.size()));
}

Fr signature_tag(const PublicKey &signer) {
    auto comp = compress_p1(signer.inner);
    return hash_bytes_to_field("umbra:sig_tag", ByteSlice(comp.data(), comp.size()));
}

Fr derive_dao_bulla(
    const Fr &proposer_limit,
    const Fr &quorum,
    const Fr &approval_ratio_quot,
    const Fr &approval_ratio_base,
    const Fr &gov_token_id,
    const Fr &pub_x,
    const Fr &pub_y,
    const Fr &bulla_blind
) {
    return field_hash({
        proposer_limit, quorum, approval_ratio_quot, approval_ratio_base,
        gov_token_id, pub_x, pub_y, bulla_blind
    });
}

Fr derive_proposal_bulla(
    const Fr &dest_x,
    const Fr &dest_y,
    const Fr &amount,
    const Fr &serial,
    const Fr &token_id,
    const Fr &dao_bulla,
    const Fr &blind
) {
    return field_hash({dest_x, dest_y, amount, serial, token_id, dao_bulla, blind});
}

Fr derive_token_commit(const Fr &token_id, const Fr &blind) {
    return field_hash({token_id, blind});
}
