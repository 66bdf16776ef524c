#include <credo/crypto/verify.hpp>
#include <credo/execution/engine.hpp>
#include <credo/schema/query_error_code.hpp>
#include <credo/testing/execution_fixture.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace {

using credo::schema::transaction_error_code;
using credo::testing::encode_transaction;
using credo::testing::event_types;
using credo::testing::find_attribute;
using credo::testing::kGenesisTime;
using credo::testing::make_principal;
using credo::testing::make_transaction;
using credo::testing::memory_fixture;
using credo::testing::rocksdb_fixture;

uint32_t code_of(const transaction_error_code code) {
  return static_cast<uint32_t>(code);
}

credo::schema::create_identity_t make_create(const std::string& name) {
  return credo::schema::create_identity_t{
      .name = name, .email = name + "@example.com", .profile_hash = "bafy"};
}

credo::schema::bytes_view_t view(const credo::schema::bytes_t& bytes) {
  return credo::schema::bytes_view_t{bytes.data(), bytes.size()};
}

constexpr auto kT1 = kGenesisTime + 1'000;
constexpr auto kT2 = kGenesisTime + 2'000;
constexpr auto kT3 = kGenesisTime + 3'000;
constexpr auto kT4 = kGenesisTime + 4'000;

}  // namespace

TEST(engine_integration, genesis_seeds_owner_and_changes_root) {
  auto fixture = memory_fixture{"credo_engine_genesis", false};
  auto& engine = fixture.engine();
  EXPECT_FALSE(engine.genesis().has_value());
  auto empty_root = engine.info().last_block_state_root;

  auto first = engine.initialize(credo::testing::make_genesis(fixture.owner()));
  EXPECT_EQ(first.code, 0u);
  EXPECT_TRUE(engine.is_trusted_issuer(fixture.owner()));
  EXPECT_EQ(engine.owner(), std::optional{fixture.owner()});
  EXPECT_NE(engine.info().last_block_state_root, empty_root);
  EXPECT_EQ(engine.info().last_block_time, kGenesisTime);
  EXPECT_EQ(credo::testing::chain_id_from_engine(engine), fixture.chain_id());

  auto second =
      engine.initialize(credo::testing::make_genesis(make_principal(9)));
  EXPECT_EQ(second.code, code_of(transaction_error_code::already_exists));
  EXPECT_EQ(engine.owner(), std::optional{fixture.owner()});
}

TEST(engine_integration, fresh_store_gets_an_initial_checkpoint) {
  auto fixture = memory_fixture{"credo_engine_checkpoint", false};
  auto committed = fixture.storage().load_committed_state();
  ASSERT_TRUE(committed.has_value());
  EXPECT_EQ(committed->height, 0);
  EXPECT_EQ(committed->block_time, 0u);
  EXPECT_EQ(committed->state_root, credo::schema::make_zero_hash());

  ASSERT_EQ(fixture.engine()
                .initialize(credo::testing::make_genesis(fixture.owner()))
                .code,
            0u);
  committed = fixture.storage().load_committed_state();
  ASSERT_TRUE(committed.has_value());
  EXPECT_EQ(committed->block_time, kGenesisTime);
  EXPECT_EQ(committed->state_root,
            fixture.engine().info().last_block_state_root);
}

TEST(engine_integration, transactions_before_genesis_are_rejected) {
  auto fixture = memory_fixture{"credo_engine_uninitialized", false};
  auto alice = make_principal(2);
  auto result = fixture.run(alice, make_create("alice"), kT1);
  EXPECT_EQ(result.code, code_of(transaction_error_code::registry_uninitialized));
  EXPECT_FALSE(fixture.engine().get_identity(alice).has_value());

  auto raw = encode_transaction(
      make_transaction(fixture.chain_id(), 1, alice, make_create("alice")));
  auto checked = fixture.engine().check_transaction(view(raw));
  EXPECT_EQ(checked.code,
            code_of(transaction_error_code::registry_uninitialized));
  EXPECT_EQ(checked.codespace, "credo.checktx");
}

TEST(engine_integration, reputation_scenario_through_transactions) {
  auto fixture = memory_fixture{"credo_engine_scenario"};
  auto alice = make_principal(2);
  auto& engine = fixture.engine();

  auto created = fixture.run(alice, make_create("alice"), kT1);
  ASSERT_EQ(created.code, 0u);
  EXPECT_EQ(event_types(created), std::vector<std::string>{"IdentityCreated"});
  EXPECT_EQ(engine.get_identity(alice)->reputation_score, 100u);

  auto verified = fixture.run(
      fixture.owner(),
      credo::schema::verify_identity_t{.subject = alice, .verified = true},
      kT2);
  ASSERT_EQ(verified.code, 0u);
  EXPECT_EQ(event_types(verified),
            (std::vector<std::string>{"ReputationUpdated", "IdentityUpdated"}));
  EXPECT_EQ(engine.get_identity(alice)->reputation_score, 200u);

  auto added = fixture.run(
      fixture.owner(),
      credo::schema::add_credential_t{.subject = alice,
                                      .credential_type = "degree",
                                      .credential_hash = "bafy-degree",
                                      .expires_at = 0},
      kT3);
  ASSERT_EQ(added.code, 0u);
  EXPECT_EQ(engine.get_identity(alice)->reputation_score, 250u);
  EXPECT_EQ(engine.get_credentials_count(alice), 1u);
  EXPECT_TRUE(engine.is_credential_valid(alice, 0));

  auto revoke = credo::schema::revoke_credential_t{.subject = alice, .index = 0};
  ASSERT_EQ(fixture.run(fixture.owner(), revoke, kT4).code, 0u);
  EXPECT_EQ(engine.get_identity(alice)->reputation_score, 220u);
  EXPECT_FALSE(engine.is_credential_valid(alice, 0));

  ASSERT_EQ(fixture.run(fixture.owner(), revoke, kT4).code, 0u);
  EXPECT_EQ(engine.get_identity(alice)->reputation_score, 190u);
  EXPECT_EQ(engine.get_contract_stats().total_identities, 1u);
  EXPECT_EQ(engine.get_identity(alice)->last_updated, kT4);
}

TEST(engine_integration, domain_failures_report_codes_and_leave_state) {
  auto fixture = memory_fixture{"credo_engine_failures"};
  auto alice = make_principal(2);
  auto bob = make_principal(3);
  auto& engine = fixture.engine();
  ASSERT_EQ(fixture.run(alice, make_create("alice"), kT1).code, 0u);

  auto duplicate = fixture.run(alice, make_create("alice"), kT2);
  EXPECT_EQ(duplicate.code, code_of(transaction_error_code::already_exists));
  EXPECT_EQ(duplicate.codespace, "credo.execute");
  EXPECT_EQ(duplicate.info, "create_identity");
  EXPECT_TRUE(duplicate.events.empty());

  auto missing = fixture.run(
      fixture.owner(),
      credo::schema::verify_identity_t{.subject = bob, .verified = false}, kT2);
  EXPECT_EQ(missing.code, code_of(transaction_error_code::not_found));
  EXPECT_TRUE(missing.events.empty());
  EXPECT_FALSE(engine.get_identity(bob).has_value());

  auto not_issuer = fixture.run(
      bob, credo::schema::verify_identity_t{.subject = alice, .verified = true},
      kT2);
  EXPECT_EQ(not_issuer.code, code_of(transaction_error_code::forbidden));

  auto expired = fixture.run(
      fixture.owner(),
      credo::schema::add_credential_t{.subject = alice,
                                      .credential_type = "degree",
                                      .credential_hash = "h",
                                      .expires_at = kT3},
      kT3);
  EXPECT_EQ(expired.code, code_of(transaction_error_code::invalid_input));
  EXPECT_EQ(engine.get_credentials_count(alice), 0u);

  auto out_of_range = fixture.run(
      fixture.owner(),
      credo::schema::revoke_credential_t{.subject = alice, .index = 3}, kT3);
  EXPECT_EQ(out_of_range.code,
            code_of(transaction_error_code::index_out_of_range));

  auto remove_owner = fixture.run(
      fixture.owner(),
      credo::schema::remove_trusted_issuer_t{.issuer = fixture.owner()}, kT3);
  EXPECT_EQ(remove_owner.code, code_of(transaction_error_code::forbidden));
  EXPECT_TRUE(engine.is_trusted_issuer(fixture.owner()));

  auto profile_missing = fixture.run(
      bob, credo::schema::update_profile_t{.name = "bob", .email = "b@x.io"},
      kT3);
  EXPECT_EQ(profile_missing.code, code_of(transaction_error_code::not_found));

  EXPECT_EQ(engine.get_identity(alice)->reputation_score, 100u);
}

TEST(engine_integration, issuer_lifecycle_controls_credential_issuance) {
  auto fixture = memory_fixture{"credo_engine_issuers"};
  auto alice = make_principal(2);
  auto issuer = make_principal(4);
  auto& engine = fixture.engine();
  ASSERT_EQ(fixture.run(alice, make_create("alice"), kT1).code, 0u);
  ASSERT_EQ(fixture.run(issuer, make_create("university"), kT1).code, 0u);

  auto credential = credo::schema::add_credential_t{
      .subject = alice, .credential_type = "degree", .credential_hash = "h"};
  EXPECT_EQ(fixture.run(issuer, credential, kT2).code,
            code_of(transaction_error_code::forbidden));

  auto by_alice = fixture.run(
      alice, credo::schema::add_trusted_issuer_t{.issuer = issuer}, kT2);
  EXPECT_EQ(by_alice.code, code_of(transaction_error_code::forbidden));

  auto added = fixture.run(
      fixture.owner(), credo::schema::add_trusted_issuer_t{.issuer = issuer},
      kT2);
  ASSERT_EQ(added.code, 0u);
  EXPECT_EQ(event_types(added),
            std::vector<std::string>{"TrustedIssuerAdded"});

  auto issued = fixture.run(issuer, credential, kT3);
  ASSERT_EQ(issued.code, 0u);
  ASSERT_EQ(issued.events.size(), 2u);
  EXPECT_EQ(find_attribute(issued.events[1], "issuer"),
            std::optional<std::string>{"university"});
  EXPECT_EQ(engine.get_credential(alice, 0)->issuer_principal, issuer);

  ASSERT_EQ(fixture
                .run(fixture.owner(),
                     credo::schema::remove_trusted_issuer_t{.issuer = issuer},
                     kT4)
                .code,
            0u);
  EXPECT_FALSE(engine.is_trusted_issuer(issuer));
  EXPECT_TRUE(engine.is_credential_valid(alice, 0));
  EXPECT_EQ(fixture.run(issuer, credential, kT4).code,
            code_of(transaction_error_code::forbidden));
}

TEST(engine_integration, events_get_sequential_ids_and_are_queryable) {
  auto fixture = memory_fixture{"credo_engine_events"};
  auto alice = make_principal(2);
  auto& engine = fixture.engine();

  auto created = fixture.run(alice, make_create("alice"), kT1);
  ASSERT_EQ(created.events.size(), 1u);
  ASSERT_FALSE(created.events[0].attributes.empty());
  EXPECT_EQ(created.events[0].attributes[0].key, "event_id");
  EXPECT_EQ(created.events[0].attributes[0].value, "1");
  EXPECT_EQ(find_attribute(created.events[0], "principal"),
            std::optional<std::string>{credo::schema::to_hex(alice)});

  // Failed transactions consume no event ids.
  ASSERT_NE(fixture.run(alice, make_create("alice"), kT2).code, 0u);

  auto verified = fixture.run(
      fixture.owner(),
      credo::schema::verify_identity_t{.subject = alice, .verified = true},
      kT2);
  ASSERT_EQ(verified.events.size(), 2u);
  EXPECT_EQ(find_attribute(verified.events[0], "event_id"),
            std::optional<std::string>{"2"});
  EXPECT_EQ(find_attribute(verified.events[1], "event_id"),
            std::optional<std::string>{"3"});

  auto all = engine.events(1, 100);
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].type, credo::schema::event_type_t::identity_created);
  EXPECT_EQ(all[1].type, credo::schema::event_type_t::reputation_updated);
  EXPECT_EQ(all[2].type, credo::schema::event_type_t::identity_updated);
  EXPECT_EQ(all[2].recorded_at, kT2);
  EXPECT_EQ(all[2].principal, alice);
  EXPECT_EQ(all[0].height + 2, all[2].height);

  auto window = credo::testing::query_events(engine, 2, 2);
  ASSERT_EQ(window.size(), 1u);
  EXPECT_EQ(window[0].event_id, 2u);
}

TEST(engine_integration, envelope_validation_rejects_bad_transactions) {
  auto fixture = memory_fixture{"credo_engine_envelope"};
  auto alice = make_principal(2);
  auto& engine = fixture.engine();

  auto garbage = credo::schema::bytes_t{0x01, 0x02, 0x03};
  auto empty = credo::schema::bytes_t{};

  auto wrong_version =
      make_transaction(fixture.chain_id(), 1, alice, make_create("alice"));
  wrong_version.version = 2;
  auto wrong_chain = make_transaction(credo::testing::make_hash(0x55), 1,
                                      alice, make_create("alice"));
  auto wrong_nonce =
      make_transaction(fixture.chain_id(), 5, alice, make_create("alice"));

  auto block = engine.finalize_block(
      1, kT1,
      {garbage, empty, encode_transaction(wrong_version),
       encode_transaction(wrong_chain), encode_transaction(wrong_nonce)});
  ASSERT_EQ(block.tx_results.size(), 5u);
  EXPECT_EQ(block.tx_results[0].code,
            code_of(transaction_error_code::invalid_transaction));
  EXPECT_EQ(block.tx_results[1].code,
            code_of(transaction_error_code::invalid_transaction));
  EXPECT_EQ(block.tx_results[2].code,
            code_of(transaction_error_code::unsupported_transaction_version));
  EXPECT_EQ(block.tx_results[3].code,
            code_of(transaction_error_code::invalid_chain_id));
  EXPECT_EQ(block.tx_results[4].code,
            code_of(transaction_error_code::invalid_nonce));
  EXPECT_EQ(block.tx_results[4].codespace, "credo.finalize");

  auto before = engine.info().last_block_state_root;
  EXPECT_EQ(block.state_root, before);
  engine.commit();
  EXPECT_EQ(engine.info().last_block_state_root, before);
  EXPECT_EQ(engine.info().last_block_height, 1);
  EXPECT_EQ(engine.nonce(alice), 0u);
  EXPECT_EQ(engine.history(1, 1).size(), 5u);
}

TEST(engine_integration, nonce_advances_only_on_success) {
  auto fixture = memory_fixture{"credo_engine_nonce"};
  auto alice = make_principal(2);
  auto& engine = fixture.engine();

  auto first = make_transaction(fixture.chain_id(), 1, alice,
                                credo::schema::update_profile_t{
                                    .name = "alice", .email = "a@example.com"});
  auto create = make_transaction(fixture.chain_id(), 1, alice,
                                 make_create("alice"));
  auto replayed = create;
  auto next = make_transaction(fixture.chain_id(), 2, alice,
                               credo::schema::update_profile_t{
                                   .name = "alice2", .email = "a@example.com"});

  auto block = engine.finalize_block(
      1, kT1,
      {encode_transaction(first), encode_transaction(create),
       encode_transaction(replayed), encode_transaction(next)});
  ASSERT_EQ(block.tx_results.size(), 4u);
  EXPECT_EQ(block.tx_results[0].code,
            code_of(transaction_error_code::not_found));
  EXPECT_EQ(block.tx_results[1].code, 0u);
  EXPECT_EQ(block.tx_results[2].code,
            code_of(transaction_error_code::invalid_nonce));
  EXPECT_EQ(block.tx_results[3].code, 0u);
  engine.commit();

  EXPECT_EQ(engine.nonce(alice), 2u);
  EXPECT_EQ(engine.get_identity(alice)->name, "alice2");

  auto stale = encode_transaction(create);
  EXPECT_EQ(engine.check_transaction(view(stale)).code,
            code_of(transaction_error_code::invalid_nonce));
  auto fresh = encode_transaction(make_transaction(
      fixture.chain_id(), 3, alice,
      credo::schema::update_profile_t{.name = "a", .email = "b"}));
  EXPECT_EQ(engine.check_transaction(view(fresh)).code, 0u);
}

TEST(engine_integration, block_ordering_is_enforced) {
  auto fixture = memory_fixture{"credo_engine_ordering"};
  auto alice = make_principal(2);
  auto& engine = fixture.engine();
  ASSERT_EQ(fixture.run(alice, make_create("alice"), kT2).code, 0u);
  auto committed = engine.info();

  auto tx = encode_transaction(make_transaction(
      fixture.chain_id(), 2, alice,
      credo::schema::update_profile_t{.name = "x", .email = "y"}));

  auto same_height = engine.finalize_block(1, kT3, {tx});
  EXPECT_TRUE(same_height.rejected);
  ASSERT_EQ(same_height.tx_results.size(), 1u);
  EXPECT_EQ(same_height.tx_results[0].code,
            code_of(transaction_error_code::invalid_block));

  auto earlier_time = engine.finalize_block(2, kT1, {tx});
  EXPECT_TRUE(earlier_time.rejected);
  EXPECT_EQ(earlier_time.state_root, committed.last_block_state_root);
  EXPECT_EQ(earlier_time.tx_results[0].code,
            code_of(transaction_error_code::invalid_block));
  engine.commit();
  EXPECT_EQ(engine.info().last_block_height, committed.last_block_height);
  EXPECT_EQ(engine.history(2, 2).size(), 0u);

  auto same_time = engine.finalize_block(5, kT2, {tx});
  EXPECT_FALSE(same_time.rejected);
  EXPECT_EQ(same_time.tx_results[0].code, 0u);
  engine.commit();
  EXPECT_EQ(engine.info().last_block_height, 5);
}

TEST(engine_integration, failed_transaction_in_block_is_isolated) {
  auto fixture = memory_fixture{"credo_engine_isolation"};
  auto alice = make_principal(2);
  auto bob = make_principal(3);
  auto& engine = fixture.engine();

  auto alice_create =
      make_transaction(fixture.chain_id(), 1, alice, make_create("alice"));
  auto bob_bad = make_transaction(fixture.chain_id(), 1, bob,
                                  credo::schema::create_identity_t{
                                      .name = "", .email = "bob@example.com"});
  auto bob_ok =
      make_transaction(fixture.chain_id(), 1, bob, make_create("bob"));
  auto block = engine.finalize_block(
      1, kT1,
      {encode_transaction(alice_create), encode_transaction(bob_bad),
       encode_transaction(bob_ok)});
  EXPECT_EQ(block.tx_results[0].code, 0u);
  EXPECT_EQ(block.tx_results[1].code,
            code_of(transaction_error_code::invalid_input));
  EXPECT_EQ(block.tx_results[2].code, 0u);

  // Uncommitted blocks are invisible to readers.
  EXPECT_FALSE(engine.get_identity(alice).has_value());
  engine.commit();
  EXPECT_EQ(engine.get_identity(bob)->email, "bob@example.com");
  EXPECT_EQ(engine.get_contract_stats().total_identities, 2u);
  EXPECT_EQ(engine.info().last_block_state_root, block.state_root);

  auto history = engine.history(1, 1);
  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history[1].index, 1u);
  EXPECT_EQ(history[1].code, code_of(transaction_error_code::invalid_input));
  EXPECT_EQ(history[1].block_time, kT1);
}

TEST(engine_integration, identical_logs_produce_identical_roots) {
  auto first = memory_fixture{"credo_engine_determinism_a"};
  auto second = memory_fixture{"credo_engine_determinism_b"};
  auto alice = make_principal(2);
  for (auto* fixture : {&first, &second}) {
    ASSERT_EQ(fixture->run(alice, make_create("alice"), kT1).code, 0u);
    ASSERT_EQ(fixture
                  ->run(fixture->owner(),
                        credo::schema::verify_identity_t{.subject = alice,
                                                         .verified = true},
                        kT2)
                  .code,
              0u);
  }
  EXPECT_EQ(first.engine().info().last_block_state_root,
            second.engine().info().last_block_state_root);

  ASSERT_EQ(first.run(alice, make_create("again"), kT3).code,
            code_of(transaction_error_code::already_exists));
  EXPECT_EQ(first.engine().info().last_block_state_root,
            second.engine().info().last_block_state_root);

  ASSERT_EQ(first
                .run(alice,
                     credo::schema::update_profile_t{.name = "a",
                                                     .email = "b"},
                     kT3)
                .code,
            0u);
  EXPECT_NE(first.engine().info().last_block_state_root,
            second.engine().info().last_block_state_root);
}

TEST(engine_integration, strict_crypto_verifies_signatures) {
  if (!credo::crypto::available()) {
    GTEST_SKIP() << "OpenSSL build lacks Ed25519";
  }
  auto fixture = memory_fixture{"credo_engine_strict", true, true};
  auto private_key = credo::testing::make_private_key(7);
  auto signer = credo::crypto::derive_public_key(private_key);
  ASSERT_TRUE(signer.has_value());
  auto& engine = fixture.engine();

  auto unsigned_tx =
      make_transaction(fixture.chain_id(), 1, *signer, make_create("signed"));
  auto rejected = engine.check_transaction(view(encode_transaction(unsigned_tx)));
  EXPECT_EQ(rejected.code,
            code_of(transaction_error_code::signature_verification_failed));

  auto signed_tx = unsigned_tx;
  credo::testing::sign_transaction(signed_tx, private_key);
  auto raw = encode_transaction(signed_tx);
  EXPECT_EQ(engine.check_transaction(view(raw)).code, 0u);

  auto forged = signed_tx;
  forged.payload = make_create("forged");
  auto block =
      engine.finalize_block(1, kT1, {encode_transaction(forged), raw});
  EXPECT_EQ(block.tx_results[0].code,
            code_of(transaction_error_code::signature_verification_failed));
  EXPECT_EQ(block.tx_results[1].code, 0u);
  engine.commit();
  EXPECT_EQ(engine.get_identity(*signer)->name, "signed");
}

TEST(engine_integration, custom_verifier_is_honoured_in_strict_mode) {
  auto fixture = memory_fixture{"credo_engine_verifier", true, true};
  auto alice = make_principal(2);
  fixture.engine().set_signature_verifier(credo::testing::allow_all_verifier());
  EXPECT_EQ(fixture.run(alice, make_create("alice"), kT1).code, 0u);

  fixture.engine().set_signature_verifier(
      [](const credo::schema::bytes_view_t&, const credo::schema::principal_t&,
         const credo::schema::ed25519_signature_t&) { return false; });
  EXPECT_EQ(fixture
                .run(alice,
                     credo::schema::update_profile_t{.name = "a", .email = "b"},
                     kT2)
                .code,
            code_of(transaction_error_code::signature_verification_failed));
}

TEST(engine_integration, query_routes_serve_committed_state) {
  auto fixture = memory_fixture{"credo_engine_query"};
  auto alice = make_principal(2);
  auto& engine = fixture.engine();
  auto& encoder = fixture.encoder();
  ASSERT_EQ(fixture.run(alice, make_create("alice"), kT1).code, 0u);
  ASSERT_EQ(fixture
                .run(fixture.owner(),
                     credo::schema::add_credential_t{
                         .subject = alice,
                         .credential_type = "license",
                         .credential_hash = "h",
                         .expires_at = kT2 + 500},
                     kT2)
                .code,
            0u);

  auto principal_key = encoder.encode(alice);
  auto identity = engine.query("/state/identity", view(principal_key));
  ASSERT_EQ(identity.code, 0u);
  EXPECT_EQ(identity.key, principal_key);
  EXPECT_EQ(identity.height, engine.info().last_block_height);
  EXPECT_EQ(encoder.decode<credo::schema::identity_record_t>(view(identity.value))
                .reputation_score,
            150u);

  auto count = engine.query("/state/credentials_count", view(principal_key));
  EXPECT_EQ(encoder.decode<uint64_t>(view(count.value)), 1u);

  auto trusted = engine.query("/state/trusted_issuer",
                              view(encoder.encode(fixture.owner())));
  EXPECT_TRUE(encoder.decode<bool>(view(trusted.value)));

  auto owner = engine.query("/registry/owner", {});
  EXPECT_EQ(encoder.decode<credo::schema::principal_t>(view(owner.value)),
            fixture.owner());

  auto stats = engine.query("/registry/stats", {});
  EXPECT_EQ(encoder.decode<credo::schema::registry_stats_t>(view(stats.value))
                .total_identities,
            1u);

  auto credential_key = encoder.encode(std::tuple{alice, uint64_t{0}});
  auto credential = engine.query("/state/credential", view(credential_key));
  ASSERT_EQ(credential.code, 0u);
  EXPECT_EQ(encoder.decode<credo::schema::credential_record_t>(
                view(credential.value))
                .credential_type,
            "license");

  auto valid = engine.query("/state/credential_valid", view(credential_key));
  EXPECT_TRUE(encoder.decode<bool>(view(valid.value)));

  // An empty block moves the committed time past expiry.
  engine.finalize_block(engine.info().last_block_height + 1, kT3, {});
  engine.commit();
  valid = engine.query("/state/credential_valid", view(credential_key));
  EXPECT_FALSE(encoder.decode<bool>(view(valid.value)));
  EXPECT_FALSE(engine.is_credential_valid(alice, 0));

  auto history_key = encoder.encode(std::tuple{uint64_t{0}, uint64_t{100}});
  auto history = engine.query("/history/range", view(history_key));
  EXPECT_EQ(encoder.decode<std::vector<credo::schema::history_entry_t>>(
                view(history.value))
                .size(),
            2u);
}

TEST(engine_integration, query_errors_are_reported) {
  auto fixture = memory_fixture{"credo_engine_query_errors"};
  auto& engine = fixture.engine();
  auto& encoder = fixture.encoder();
  auto stranger = encoder.encode(make_principal(9));

  auto missing = engine.query("/state/identity", view(stranger));
  EXPECT_EQ(missing.code,
            static_cast<uint32_t>(credo::schema::query_error_code::not_found));
  EXPECT_EQ(missing.codespace, "credo.query");

  auto bad_key = engine.query("/state/identity", view(credo::schema::bytes_t{1}));
  EXPECT_EQ(bad_key.code,
            static_cast<uint32_t>(credo::schema::query_error_code::invalid_key));

  auto out_of_range = engine.query(
      "/state/credential",
      view(encoder.encode(std::tuple{make_principal(9), uint64_t{0}})));
  EXPECT_EQ(out_of_range.code, static_cast<uint32_t>(
                                   credo::schema::query_error_code::
                                       index_out_of_range));

  auto never_valid = engine.query(
      "/state/credential_valid",
      view(encoder.encode(std::tuple{make_principal(9), uint64_t{0}})));
  ASSERT_EQ(never_valid.code, 0u);
  EXPECT_FALSE(encoder.decode<bool>(view(never_valid.value)));

  auto unknown = engine.query("/state/unknown", {});
  EXPECT_EQ(unknown.code, static_cast<uint32_t>(
                              credo::schema::query_error_code::unsupported_path));
}

TEST(engine_integration, replay_history_matches_committed_root) {
  auto fixture = rocksdb_fixture{"credo_engine_replay"};
  auto alice = make_principal(2);
  auto bob = make_principal(3);
  auto& engine = fixture.engine();

  ASSERT_EQ(fixture.run(alice, make_create("alice"), kT1).code, 0u);
  ASSERT_NE(fixture.run(alice, make_create("alice"), kT1).code, 0u);
  ASSERT_EQ(fixture.run(bob, make_create("bob"), kT2).code, 0u);
  ASSERT_EQ(fixture
                .run(fixture.owner(),
                     credo::schema::add_credential_t{.subject = bob,
                                                     .credential_type = "t",
                                                     .credential_hash = "h"},
                     kT3)
                .code,
            0u);
  ASSERT_EQ(fixture
                .run(fixture.owner(),
                     credo::schema::revoke_credential_t{.subject = bob,
                                                        .index = 0},
                     kT4)
                .code,
            0u);

  auto replay = engine.replay_history();
  EXPECT_TRUE(replay.ok) << replay.error;
  EXPECT_EQ(replay.tx_count, 5u);
  EXPECT_EQ(replay.applied_count, 4u);
  EXPECT_EQ(replay.state_root, engine.info().last_block_state_root);
  EXPECT_EQ(replay.last_height, engine.info().last_block_height);
}

TEST(engine_integration, replay_skips_blocks_rejected_before_genesis) {
  auto fixture = memory_fixture{"credo_engine_replay_pre", false};
  auto alice = make_principal(2);
  auto& engine = fixture.engine();
  ASSERT_EQ(fixture.run(alice, make_create("alice"), kT1).code,
            code_of(transaction_error_code::registry_uninitialized));

  ASSERT_EQ(engine.initialize(credo::testing::make_genesis(fixture.owner()))
                .code,
            0u);
  ASSERT_EQ(fixture.run(alice, make_create("alice"), kT2).code, 0u);

  auto replay = engine.replay_history();
  EXPECT_TRUE(replay.ok) << replay.error;
  EXPECT_EQ(replay.tx_count, 2u);
  EXPECT_EQ(replay.applied_count, 1u);
}

TEST(engine_integration, rocksdb_state_survives_restart) {
  auto db = credo::testing::make_db_path("credo_engine_restart");
  auto alice = make_principal(2);
  auto owner = make_principal(1);
  auto root = credo::schema::hash32_t{};
  {
    auto encoder = credo::execution::scale_encoder_t{};
    auto storage =
        credo::storage::make_storage<credo::storage::rocksdb_storage_tag>(db);
    auto engine = credo::execution::engine<credo::storage::rocksdb_storage_tag>{
        encoder, storage, false};
    ASSERT_EQ(engine.initialize(credo::testing::make_genesis(owner)).code, 0u);
    auto tx = make_transaction(credo::testing::make_hash(0xC0), 1, alice,
                               make_create("alice"));
    auto block = engine.finalize_block(1, kT1, {encode_transaction(tx)});
    ASSERT_EQ(block.tx_results[0].code, 0u);
    engine.commit();
    root = engine.info().last_block_state_root;
  }
  {
    auto encoder = credo::execution::scale_encoder_t{};
    auto storage =
        credo::storage::make_storage<credo::storage::rocksdb_storage_tag>(db);
    auto engine = credo::execution::engine<credo::storage::rocksdb_storage_tag>{
        encoder, storage, false};
    EXPECT_EQ(engine.info().last_block_height, 1);
    EXPECT_EQ(engine.info().last_block_state_root, root);
    EXPECT_EQ(engine.get_identity(alice)->name, "alice");
    EXPECT_EQ(engine.nonce(alice), 1u);
    EXPECT_EQ(engine.initialize(credo::testing::make_genesis(owner)).code,
              code_of(transaction_error_code::already_exists));
    EXPECT_TRUE(engine.replay_history().ok);
  }
  credo::testing::remove_path(db);
}
