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


#include <cassert>
#include <cstdio>
#include "aead.h"
#include "circuits.h"
#include "coin.h"
#include "commit.h"
#include "derive.h"
#include "harness.h"
#include "merkle.h"
#include "money_proofs.h"
#include "tests.h"

static void test_signatures() {
    Keypair keys = Keypair::from_seed(test_seed(11));
    Keypair other = Keypair::from_seed(test_seed(12));

    Hash msg = derive_hash(ByteSlice(test_seed(5).data(), 32));
    Signature sig = sign(keys.secret, msg);

    assert(verify(keys.pubkey, sig, msg));
    assert(!verify(other.pubkey, sig, msg));

    Hash tampered = msg;
    tampered[0] ^= 1;
    assert(!verify(keys.pubkey, sig, tampered));

    // seeds are deterministic
    assert(Keypair::from_seed(test_seed(11)).pubkey == keys.pubkey);
    printf("SIGNATURES OK.\n");
}

static void test_commitments() {
    Fs b1 = rand_fs();
    Fs b2 = rand_fs();

    EcPoint sum = jub_add(pedersen_commitment_u64(3, b1), pedersen_commitment_u64(4, b2));
    assert(sum == pedersen_commitment_u64(7, b1 + b2));
    assert(sum != pedersen_commitment_u64(8, b1 + b2));

    // balanced inputs minus outputs leave the identity
    EcPoint in = pedersen_commitment_u64(10, b1);
    EcPoint out_a = pedersen_commitment_u64(6, b2);
    EcPoint out_b = pedersen_commitment_u64(4, b1 - b2);
    assert(jub_is_identity(jub_sub(in, sum_commitments({out_a, out_b}))));

    Fr token = rand_fr();
    Fr t1 = rand_fr();
    assert(derive_token_commit(token, t1) == derive_token_commit(token, t1));
    assert(derive_token_commit(token, t1) != derive_token_commit(token, rand_fr()));
    printf("COMMITMENTS OK.\n");
}

static void test_curve() {
    const EcPoint &base = jub_base();
    assert(jub_on_curve(base));
    assert(jub_on_curve(value_generator()) && jub_on_curve(blind_generator()));
    assert(value_generator() != blind_generator());

    // the base point generates the subgroup of order l
    assert(jub_is_identity(jub_mul(base, Fs::zero())));
    assert(jub_mul(base, -Fs::one()) == jub_neg(base));
    assert(jub_is_identity(jub_add(base, jub_neg(base))));
    assert(jub_mul_u64(base, 5) == jub_mul(base, Fs(5)));

    EcPoint p = jub_mul(base, rand_fs());
    auto packed = compress_jub(p);
    auto back = jub_from_bytes(packed.data());
    assert(back.has_value() && back.value() == p);

    // y above the field modulus is not an encoding
    bytes32 junk;
    junk.fill(0xff);
    assert(!jub_from_bytes(junk.data()).has_value());
    printf("CURVE OK.\n");
}

static void test_merkle() {
    MerkleFrontier frontier;
    MerkleTree tree;
    assert(frontier.root() == tree.root());
    assert(tree.root() == merkle_empty_roots()[MERKLE_DEPTH]);

    std::vector<Fr> leaves;
    for (uint64_t i = 0; i < 19; i++) {
        leaves.push_back(fr_from_u64(1000 + i));
        assert(frontier.append(leaves.back()));
        auto pos = tree.append(leaves.back());
        assert(pos.has_value() && pos.value() == i);
        assert(frontier.root() == tree.root());
    }

    for (uint64_t i = 0; i < leaves.size(); i++) {
        auto path = tree.witness(i);
        assert(path.has_value());
        assert(merkle_root_from_path(leaves[i], path.value()) == tree.root());
        // a path only opens the leaf it was taken for
        assert(merkle_root_from_path(fr_from_u64(7), path.value()) != tree.root());
    }
    assert(!tree.witness(leaves.size()).has_value());

    Encoder enc;
    frontier.encode(enc);
    MerkleFrontier decoded;
    Decoder dec(enc.data());
    assert(MerkleFrontier::decode(dec, decoded) && dec.finish());
    assert(decoded.count() == frontier.count());
    assert(decoded.root() == frontier.root());
    printf("MERKLE OK.\n");
}

static void test_aead() {
    Keypair alice = Keypair::from_seed(test_seed(21));
    Keypair bob = Keypair::from_seed(test_seed(22));

    Bytes plain{'n', 'o', 't', 'e'};
    auto sealed_plain = aead_seal(alice.pubkey, plain);
    assert(sealed_plain.has_value());
    AeadEncrypted box = sealed_plain.value();

    auto opened = aead_open(alice.secret, box);
    assert(opened.has_value() && opened.value() == plain);
    assert(!aead_open(bob.secret, box).has_value());

    box.ciphertext[AEAD_NONCE_LEN] ^= 1;
    assert(!aead_open(alice.secret, box).has_value());

    Note note = make_note(42, native_token_id(), Fr::zero(), Fr::zero(), rand_fs(), rand_fr());
    auto sealed = note.encrypt(alice.pubkey);
    assert(sealed.has_value());
    auto mine = Note::decrypt(alice.secret, sealed.value());
    assert(mine.has_value() && mine->value == 42);
    assert(!Note::decrypt(bob.secret, sealed.value()).has_value());

    Fr coin = note_coin(note, alice.pubkey);
    assert(try_own_coin(alice.secret, coin, sealed.value(), 3).has_value());
    assert(!try_own_coin(alice.secret, fr_from_u64(9), sealed.value(), 3).has_value());
    printf("AEAD OK.\n");
}

// Keys whose spend half has low order cannot be sealed to, and the builders
// report it instead of throwing.
static void test_seal_failure() {
    PublicKey identity = Keypair::from_seed(test_seed(23)).pubkey;
    identity.spend = jub_identity();
    PublicKey order_two = identity;
    order_two.spend = EcPoint{Fr::zero(), -Fr::one()};
    assert(jub_on_curve(order_two.spend));

    Bytes plain{'n', 'o', 't', 'e'};
    assert(!aead_seal(identity, plain).has_value());
    assert(!aead_seal(order_two, plain).has_value());

    Note note = make_note(5, native_token_id(), Fr::zero(), Fr::zero(), rand_fs(), rand_fr());
    assert(!note.encrypt(order_two).has_value());

    auto mint = create_mint_proof(test_zk(), order_two, note);
    assert(mint.is_err() && mint.unwrap_err() == BuilderError::EncryptionFailed);
    printf("SEAL FAILURE OK.\n");
}

static void test_proofs() {
    const ZkSetup &zk = test_zk();
    Keypair alice = Keypair::from_seed(test_seed(21));

    for (auto &circuit : all_circuits()) {
        assert(zk.proving_key(circuit->name) != nullptr);
        assert(zk.verifying_key(circuit->name) != nullptr);
        assert(find_circuit(circuit->name) == circuit.get());
    }
    assert(zk.verifying_key("Money::Nope") == nullptr);

    Note note = make_note(5, native_token_id(), Fr::zero(), Fr::zero(), rand_fs(), rand_fr());
    MintProof mint = expect_ok(create_mint_proof(zk, alice.pubkey, note));

    const VerifyingKey* vk = zk.verifying_key(MONEY_MINT_CIRCUIT);
    PublicInputs inputs = mint_public_inputs(mint.output);
    assert(verify_proof(*vk, mint.proof, inputs));

    PublicInputs altered = inputs;
    altered[0] = rand_fr();
    assert(!verify_proof(*vk, mint.proof, altered));
    assert(!verify_proof(*vk, mint.proof, PublicInputs(inputs.begin(), inputs.end() - 1)));

    // the proof is bound to its circuit
    const VerifyingKey* burn_vk = zk.verifying_key(MONEY_BURN_CIRCUIT);
    assert(!verify_proof(*burn_vk, mint.proof, inputs));

    // a witness that fails the circuit still yields a proof, just not a valid one
    const ProvingKey* pk = zk.proving_key(MONEY_MINT_CIRCUIT);
    Witness junk_witness{fr_from_u64(1), fr_from_u64(2)};
    Proof junk = create_proof(*pk, junk_witness);
    assert(!evaluate_circuit(*pk, junk_witness).has_value());
    assert(!verify_proof(*vk, junk, inputs));

    auto refused = prove(zk, MONEY_MINT_CIRCUIT, junk_witness);
    assert(refused.is_err() && refused.unwrap_err() == BuilderError::UnsatisfiedCircuit);

    // the wire form verifies the same
    Bytes raw = to_bytes(mint.proof);
    assert(raw.size() == PROOF_SIZE);
    auto decoded = from_bytes<Proof>(raw);
    assert(decoded.has_value());
    assert(verify_proof(*vk, decoded.value(), inputs));
    Bytes garbage(PROOF_SIZE, 0xff);
    assert(!from_bytes<Proof>(garbage).has_value());
    printf("PROOFS OK.\n");
}

/*
 *  Holding a proving key must not let anyone vouch for public inputs that
 *  no witness satisfies. The prover is driven directly over an assignment
 *  whose public side was edited afterwards.
 */
static void test_forgery() {
    const ZkSetup &zk = test_zk();
    Keypair alice = Keypair::from_seed(test_seed(21));
    const ProvingKey* mint_pk = zk.proving_key(MONEY_MINT_CIRCUIT);
    const VerifyingKey* mint_vk = zk.verifying_key(MONEY_MINT_CIRCUIT);

    Note note = make_note(5, native_token_id(), Fr::zero(), Fr::zero(), rand_fs(), rand_fr());
    auto [pub_x, pub_y] = alice.pubkey.xy();
    Witness w{
        pub_x, pub_y, fr_from_u64(note.value), note.token_id, note.serial,
        note.spend_hook, note.user_data, note.coin_blind,
        fs_to_fr(note.value_blind), note.token_blind,
    };
    CircuitAssignment honest = assign_circuit(*mint_pk->circuit, w);
    assert(honest.satisfied);
    assert(honest.primary[0] == note_coin(note, alice.pubkey));

    Proof control{libsnark::r1cs_ppzksnark_prover<snark_pp>(mint_pk->inner, honest.primary, honest.auxiliary)};
    assert(verify_proof(*mint_vk, control, honest.primary));

    // a coin of 5 whose output commitment claims 1000
    PublicInputs inflated = honest.primary;
    EcPoint big = pedersen_commitment_u64(1000, note.value_blind);
    inflated[1] = big.x;
    inflated[2] = big.y;
    Proof forged{libsnark::r1cs_ppzksnark_prover<snark_pp>(mint_pk->inner, inflated, honest.auxiliary)};
    assert(!verify_proof(*mint_vk, forged, inflated));
    assert(!verify_proof(*mint_vk, control, inflated));

    // burn: a real coin under a real root, spent with its secret and with
    // the secret plus the subgroup order, which maps to the same key
    MerkleTree tree;
    Fr coin = note_coin(note, alice.pubkey);
    tree.append(coin);
    MerklePath path = tree.witness(0).value();
    Fr sig_tag = signature_tag(PublicKey::from_secret(SecretKey::random()));

    auto burn_witness = [&](const Fr &secret) {
        Witness bw{
            secret, note.serial, fr_from_u64(note.value), note.token_id,
            note.spend_hook, note.user_data, note.coin_blind,
            fs_to_fr(note.value_blind), note.token_blind, rand_fr(),
        };
        push_path(bw, path);
        bw.push_back(sig_tag);
        return bw;
    };

    const ProvingKey* burn_pk = zk.proving_key(MONEY_BURN_CIRCUIT);
    const VerifyingKey* burn_vk = zk.verifying_key(MONEY_BURN_CIRCUIT);
    Fr secret = fs_to_fr(alice.secret.spend);
    auto spent = evaluate_circuit(*burn_pk, burn_witness(secret));
    assert(spent.has_value());
    assert((*spent)[0] == derive_nullifier(secret, note.serial));
    assert((*spent)[4] == tree.root());
    assert((*spent)[7] == sig_tag);

    Fr order = fs_to_fr(-Fs::one()) + Fr::one();
    assert(!evaluate_circuit(*burn_pk, burn_witness(secret + order)).has_value());

    // a nullifier nobody can link to the coin
    CircuitAssignment burn = assign_circuit(*burn_pk->circuit, burn_witness(secret));
    PublicInputs fresh = burn.primary;
    fresh[0] = rand_fr();
    Proof unlinked{libsnark::r1cs_ppzksnark_prover<snark_pp>(burn_pk->inner, fresh, burn.auxiliary)};
    assert(!verify_proof(*burn_vk, unlinked, fresh));

    // a root that no tree holds
    PublicInputs rootless = burn.primary;
    rootless[4] = rand_fr();
    Proof floating{libsnark::r1cs_ppzksnark_prover<snark_pp>(burn_pk->inner, rootless, burn.auxiliary)};
    assert(!verify_proof(*burn_vk, floating, rootless));
    printf("FORGERY OK.\n");
}

static void test_wire() {
    Keypair alice = Keypair::from_seed(test_seed(21));
    const ZkSetup &zk = test_zk();

    Note note = make_note(5, native_token_id(), Fr::zero(), Fr::zero(), rand_fs(), rand_fr());
    MintProof mint = expect_ok(create_mint_proof(zk, alice.pubkey, note));

    MoneyTransferParams params;
    params.outputs.push_back(mint.output);

    Transaction tx;
    tx.calls.push_back(ContractCall{
        money_contract_id(),
        static_cast<uint8_t>(MoneyFunction::TransferV1),
        to_bytes(params),
    });
    tx.proofs.push_back({mint.proof});
    tx.signatures.push_back({});

    Bytes raw = to_bytes(tx);
    auto decoded = from_bytes<Transaction>(raw);
    assert(decoded.has_value());
    assert(decoded->hash() == tx.hash());
    assert(decoded->signing_hash() == tx.signing_hash());

    // signatures are outside the signing hash
    tx.signatures[0].push_back(sign(alice.secret, tx.signing_hash()));
    assert(decoded->signing_hash() == tx.signing_hash());
    assert(decoded->hash() != tx.hash());

    Bytes truncated(raw.begin(), raw.end() - 1);
    assert(!from_bytes<Transaction>(truncated).has_value());

    Bytes trailing = raw;
    trailing.push_back(0);
    assert(!from_bytes<Transaction>(trailing).has_value());

    // a scalar at or above the group order is not canonical
    Bytes big(32, 0xff);
    Decoder dec(big);
    Fr s;
    assert(!dec.scalar(s));
    assert(dec.failed());

    ObjectArena arena(2);
    auto h = arena.put(Bytes{1, 2, 3});
    assert(h.is_ok());
    byte out[2];
    assert(arena.read(h.unwrap(), 1, out, 2) == ARENA_OK && out[0] == 2 && out[1] == 3);
    assert(arena.read(h.unwrap(), 2, out, 2) == ARENA_OUT_OF_RANGE);
    assert(arena.read(h.unwrap() + 5, 0, out, 1) == ARENA_BAD_HANDLE);
    assert(arena.put(Bytes{}).is_ok());
    assert(arena.put(Bytes{}).unwrap_err() == ARENA_FULL);
    printf("WIRE OK.\n");
}

void main_crypto() {
    test_signatures();
    test_commitments();
    test_curve();
    test_merkle();
    test_aead();
    test_seal_failure();
    test_proofs();
    test_forgery();
    test_wire();
    printf("\n");
}
