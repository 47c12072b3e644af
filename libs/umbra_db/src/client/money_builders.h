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

class Wallet;

struct TransferOutput {
    PublicKey recipient;
    uint64_t value;
    Fr token_id;
    Fr spend_hook;
    Fr user_data;
    Fr serial;
    Fr coin_blind;
    Bytes memo;

    // plain payment with fresh serial and coin blind
    static TransferOutput to(const PublicKey &recipient, uint64_t value, const Fr &token_id);
};

/*
 *  Builds Money::TransferV1. Every value commitment gets its own blind except
 *  the last output's, which takes whatever makes the commitments sum to zero.
 *  One token blind is shared by the whole call so all token commitments match.
 */
class TransferCallBuilder {
private:
    struct ClearSpend {
        uint64_t value;
        Fr token_id;
        SecretKey signer;
        Fs value_blind;
    };
    struct AnonSpend {
        SpendCoin spend;
        Fs value_blind;
    };

    const ZkSetup &zk_;
    std::vector<ClearSpend> clear_inputs_;
    std::vector<AnonSpend> inputs_;
    std::vector<TransferOutput> outputs_;

public:
    explicit TransferCallBuilder(const ZkSetup &zk) : zk_(zk) {}

    // signer must be a faucet key for the call to validate
    TransferCallBuilder& add_clear_input(uint64_t value, const Fr &token_id, const SecretKey &signer);
    TransferCallBuilder& add_input(const SpendCoin &spend);
    TransferCallBuilder& add_output(const TransferOutput &output);

    // sum of the value blinds picked for the inputs added so far
    Fs input_blind_sum() const;

    Result<CallDebris, BuilderError> build() const;
};

// Pays value of token_id to recipient from the wallet's coins, change goes
// back to the wallet.
Result<CallDebris, BuilderError> make_transfer(
    const ZkSetup &zk,
    const Wallet &wallet,
    const PublicKey &recipient,
    uint64_t value,
    const Fr &token_id
);

// ----------------------- OTC SWAP ------------------------

// Agreed on by both parties up front. Slot p holds the blinds of party p's
// input, which are also the blinds of the other party's output.
struct SwapBlinds {
    std::array<Fs, 2> value_blinds;
    std::array<Fr, 2> token_blinds;

    static SwapBlinds random();
};

struct SwapHalf {
    BurnProof burn;
    MintProof mint;
};

// party is 0 or 1 and decides which slot of the swap this half fills
Result<SwapHalf, BuilderError> build_swap_half(
    const ZkSetup &zk,
    size_t party,
    const SwapBlinds &blinds,
    const SpendCoin &send,
    const PublicKey &receive_to,
    uint64_t receive_value,
    const Fr &receive_token
);

CallDebris join_swap(const SwapHalf &first, const SwapHalf &second);

// ----------------------- TOKENS ------------------------

Fr token_id_for(const PublicKey &authority);

Result<CallDebris, BuilderError> build_token_mint(
    const ZkSetup &zk,
    const SecretKey &authority,
    const PublicKey &recipient,
    uint64_t value
);

CallDebris build_token_freeze(const SecretKey &authority);
