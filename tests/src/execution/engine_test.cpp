#include <atelier/ledger/storage_ledger.hpp>
#include <atelier/schema/key/engine_keys.hpp>
#include <atelier/testing/engine_fixture.hpp>
#include <gtest/gtest.h>

#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace atelier::schema;
using namespace atelier::testing;

namespace {

const auto kClient = make_hash(1);
const auto kArtisan = make_hash(2);
const auto kAsset = make_hash(3);
const auto kOtherAsset = make_hash(9);
constexpr auto kAmount = 500;
constexpr auto kStartingBalance = 1000;

initialize_escrow_t make_request(
    const timestamp_seconds_t deadline = kStartTime + kOneDay,
    const amount_t amount = kAmount) {
  auto request = initialize_escrow_t{};
  request.client = kClient;
  request.artisan = kArtisan;
  request.asset = kAsset;
  request.amount = amount;
  request.deadline = deadline;
  return request;
}

/// Initialize and fund one escrow; returns its id.
escrow_id_t make_funded_escrow(engine_fixture& fixture,
                               const timestamp_seconds_t deadline =
                                   kStartTime + kOneDay) {
  fixture.ledger().credit(kAsset, kClient, kStartingBalance);
  auto created = fixture.engine().initialize(make_request(deadline));
  EXPECT_TRUE(created.ok());
  auto id = created.escrow_id.value_or(0);
  auto funded =
      fixture.engine().deposit(allow_only_gate(kClient), id, kAsset);
  EXPECT_TRUE(funded.ok()) << funded.log;
  return id;
}

amount_t total_held(engine_fixture& fixture) {
  auto& ledger = fixture.ledger();
  return ledger.balance(kAsset, kClient) +
         ledger.balance(kAsset, custody_principal()) +
         ledger.balance(kAsset, kArtisan);
}

escrow_status_t status_of(engine_fixture& fixture, const escrow_id_t id) {
  auto found = fixture.engine().get(id);
  EXPECT_TRUE(found.ok()) << found.log;
  return found.escrow ? found.escrow->status : escrow_status_t::disputed;
}

}  // namespace

TEST(engine, initialize_assigns_first_id_and_stores_pending_escrow) {
  auto fixture = engine_fixture{"atelier_engine_initialize"};
  auto result = fixture.engine().initialize(make_request());
  ASSERT_TRUE(result.ok()) << result.log;
  ASSERT_TRUE(result.escrow_id.has_value());
  EXPECT_EQ(*result.escrow_id, 1u);
  EXPECT_EQ(result.codespace, "atelier.initialize");

  auto found = fixture.engine().get(1);
  ASSERT_TRUE(found.ok());
  EXPECT_EQ(found.codespace, "atelier.get");
  const auto& escrow = found.escrow;
  ASSERT_TRUE(escrow.has_value());
  EXPECT_EQ(escrow->version, 1u);
  EXPECT_EQ(escrow->id, 1u);
  EXPECT_EQ(escrow->client, kClient);
  EXPECT_EQ(escrow->artisan, kArtisan);
  EXPECT_EQ(escrow->asset, kAsset);
  EXPECT_EQ(escrow->amount, amount_t{kAmount});
  EXPECT_EQ(escrow->deadline, kStartTime + kOneDay);
  EXPECT_EQ(escrow->status, escrow_status_t::pending);
  EXPECT_EQ(fixture.engine().next_id(), 2u);
  EXPECT_EQ(fixture.ledger().calls(), 0u);
}

TEST(engine, release_scenario_moves_amount_to_artisan) {
  auto fixture = engine_fixture{"atelier_engine_release_scenario"};
  fixture.ledger().credit(kAsset, kClient, kStartingBalance);
  auto client_gate = allow_only_gate(kClient);

  auto created = fixture.engine().initialize(make_request());
  ASSERT_TRUE(created.ok());
  EXPECT_EQ(created.escrow_id, escrow_id_t{1});
  EXPECT_EQ(status_of(fixture, 1), escrow_status_t::pending);

  auto funded = fixture.engine().deposit(client_gate, 1, kAsset);
  ASSERT_TRUE(funded.ok()) << funded.log;
  EXPECT_EQ(fixture.ledger().balance(kAsset, custody_principal()), 500);
  EXPECT_EQ(fixture.ledger().balance(kAsset, kClient), 500);
  EXPECT_EQ(status_of(fixture, 1), escrow_status_t::funded);

  fixture.clock().set(kStartTime + 100);
  auto released = fixture.engine().release(client_gate, 1, kAsset);
  ASSERT_TRUE(released.ok()) << released.log;
  EXPECT_EQ(fixture.ledger().balance(kAsset, kArtisan), 500);
  EXPECT_EQ(fixture.ledger().balance(kAsset, custody_principal()), 0);
  EXPECT_EQ(status_of(fixture, 1), escrow_status_t::released);

  auto again = fixture.engine().release(client_gate, 1, kAsset);
  EXPECT_EQ(again.code, escrow_error_code::state);
  EXPECT_EQ(fixture.ledger().balance(kAsset, kArtisan), 500);
}

TEST(engine, reclaim_scenario_returns_amount_after_deadline) {
  auto fixture = engine_fixture{"atelier_engine_reclaim_scenario"};
  auto id = make_funded_escrow(fixture);
  auto client_gate = allow_only_gate(kClient);

  fixture.clock().set(kStartTime + kOneDay - 1);
  auto early = fixture.engine().reclaim(client_gate, id, kAsset);
  EXPECT_EQ(early.code, escrow_error_code::deadline);
  EXPECT_EQ(status_of(fixture, id), escrow_status_t::funded);

  fixture.clock().set(kStartTime + kOneDay);
  auto at_deadline = fixture.engine().reclaim(client_gate, id, kAsset);
  EXPECT_EQ(at_deadline.code, escrow_error_code::deadline);

  fixture.clock().set(kStartTime + kOneDay + 1);
  auto reclaimed = fixture.engine().reclaim(client_gate, id, kAsset);
  ASSERT_TRUE(reclaimed.ok()) << reclaimed.log;
  EXPECT_EQ(fixture.ledger().balance(kAsset, kClient), kStartingBalance);
  EXPECT_EQ(fixture.ledger().balance(kAsset, custody_principal()), 0);
  EXPECT_EQ(status_of(fixture, id), escrow_status_t::refunded);

  ASSERT_EQ(reclaimed.events.size(), 1u);
  EXPECT_EQ(reclaimed.events.front(),
            escrow_event_t{escrow_reclaimed_t{.id = id,
                                              .client = kClient,
                                              .amount = kAmount,
                                              .timestamp = kStartTime +
                                                           kOneDay + 1}});

  auto again = fixture.engine().reclaim(client_gate, id, kAsset);
  EXPECT_EQ(again.code, escrow_error_code::state);
}

TEST(engine, initialize_rejects_same_client_and_artisan_without_writes) {
  auto fixture = engine_fixture{"atelier_engine_same_party"};
  auto request = make_request();
  request.artisan = request.client;

  auto result = fixture.engine().initialize(request);
  EXPECT_EQ(result.code, escrow_error_code::validation);
  EXPECT_FALSE(result.escrow_id.has_value());
  EXPECT_EQ(fixture.engine().next_id(), 1u);
  EXPECT_EQ(fixture.engine().get(1).code, escrow_error_code::not_found);
  EXPECT_TRUE(fixture.sink().events().empty());
  EXPECT_TRUE(fixture.engine().events(1, 100).empty());

  auto next_id_key = atelier::schema::key::make_next_id_key(fixture.encoder());
  EXPECT_FALSE(fixture.storage()
                   .get<escrow_id_t>(fixture.encoder(),
                                     bytes_view_t{next_id_key.data(),
                                                  next_id_key.size()})
                   .has_value());
}

TEST(engine, initialize_rejects_non_positive_amounts) {
  auto fixture = engine_fixture{"atelier_engine_amounts"};
  EXPECT_EQ(
      fixture.engine().initialize(make_request(kStartTime + kOneDay, 0)).code,
      escrow_error_code::validation);
  EXPECT_EQ(
      fixture.engine().initialize(make_request(kStartTime + kOneDay, -5)).code,
      escrow_error_code::validation);
  EXPECT_EQ(fixture.engine().next_id(), 1u);

  auto ok = fixture.engine().initialize(make_request(kStartTime + kOneDay, 1));
  EXPECT_TRUE(ok.ok());
  EXPECT_EQ(ok.escrow_id, escrow_id_t{1});
}

TEST(engine, initialize_accepts_amounts_up_to_the_image_limit) {
  auto fixture = engine_fixture{"atelier_engine_amount_limit"};
  auto largest = fixture.engine().initialize(
      make_request(kStartTime + kOneDay, kMaxAmount));
  ASSERT_TRUE(largest.ok()) << largest.log;
  EXPECT_EQ(fixture.engine().get(1).escrow->amount, kMaxAmount);

  auto beyond = fixture.engine().initialize(
      make_request(kStartTime + kOneDay, amount_t{kMaxAmount + 1}));
  EXPECT_EQ(beyond.code, escrow_error_code::validation);
  EXPECT_EQ(fixture.engine().next_id(), 2u);
}

TEST(engine, ids_strictly_increase_across_failures) {
  auto fixture = engine_fixture{"atelier_engine_ids"};
  auto previous = escrow_id_t{0};
  for (auto i = 0; i < 5; ++i) {
    auto result = fixture.engine().initialize(make_request());
    ASSERT_TRUE(result.ok());
    EXPECT_GT(*result.escrow_id, previous);
    previous = *result.escrow_id;

    auto invalid = make_request();
    invalid.artisan = invalid.client;
    EXPECT_FALSE(fixture.engine().initialize(invalid).ok());
  }
  EXPECT_EQ(previous, 5u);
  EXPECT_EQ(fixture.engine().next_id(), 6u);
}

TEST(engine, concurrent_initialize_never_repeats_an_id) {
  auto fixture = engine_fixture{"atelier_engine_concurrent_ids"};
  constexpr auto kThreads = 4;
  constexpr auto kPerThread = 10;

  auto ids = std::vector<escrow_id_t>{};
  auto ids_mutex = std::mutex{};
  auto threads = std::vector<std::thread>{};
  for (auto t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (auto i = 0; i < kPerThread; ++i) {
        auto result = fixture.engine().initialize(make_request());
        auto lock = std::scoped_lock{ids_mutex};
        ids.push_back(result.escrow_id.value_or(0));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  auto unique = std::set<escrow_id_t>{std::begin(ids), std::end(ids)};
  EXPECT_EQ(unique.size(), static_cast<std::size_t>(kThreads * kPerThread));
  EXPECT_EQ(unique.count(0), 0u);
  EXPECT_EQ(*unique.begin(), 1u);
  EXPECT_EQ(*unique.rbegin(), static_cast<escrow_id_t>(kThreads * kPerThread));
}

TEST(engine, unknown_ids_are_not_found) {
  auto fixture = engine_fixture{"atelier_engine_not_found"};
  auto gate = allow_all_gate();
  EXPECT_EQ(fixture.engine().deposit(gate, 42, kAsset).code,
            escrow_error_code::not_found);
  EXPECT_EQ(fixture.engine().release(gate, 42, kAsset).code,
            escrow_error_code::not_found);
  EXPECT_EQ(fixture.engine().reclaim(gate, 42, kAsset).code,
            escrow_error_code::not_found);
  auto missing = fixture.engine().get(42);
  EXPECT_EQ(missing.code, escrow_error_code::not_found);
  EXPECT_FALSE(missing.escrow.has_value());
  EXPECT_EQ(fixture.ledger().calls(), 0u);
}

TEST(engine, deposit_after_deadline_fails_before_state_check) {
  auto fixture = engine_fixture{"atelier_engine_deposit_deadline"};
  auto id = make_funded_escrow(fixture);
  auto calls = fixture.ledger().calls();

  fixture.clock().set(kStartTime + kOneDay + 1);
  // Funded and past deadline: the deadline check comes first.
  EXPECT_EQ(fixture.engine().deposit(allow_only_gate(kClient), id, kAsset).code,
            escrow_error_code::deadline);
  EXPECT_EQ(fixture.ledger().calls(), calls);
}

TEST(engine, deposit_at_deadline_is_allowed) {
  auto fixture = engine_fixture{"atelier_engine_deposit_at_deadline"};
  fixture.ledger().credit(kAsset, kClient, kStartingBalance);
  ASSERT_TRUE(fixture.engine().initialize(make_request()).ok());
  fixture.clock().set(kStartTime + kOneDay);
  EXPECT_TRUE(
      fixture.engine().deposit(allow_only_gate(kClient), 1, kAsset).ok());
}

TEST(engine, second_deposit_is_a_state_error) {
  auto fixture = engine_fixture{"atelier_engine_double_deposit"};
  auto id = make_funded_escrow(fixture);
  auto second = fixture.engine().deposit(allow_only_gate(kClient), id, kAsset);
  EXPECT_EQ(second.code, escrow_error_code::state);
  EXPECT_EQ(fixture.ledger().balance(kAsset, custody_principal()), kAmount);
}

TEST(engine, deposit_without_client_authorization_changes_nothing) {
  auto fixture = engine_fixture{"atelier_engine_deposit_unauthorized"};
  fixture.ledger().credit(kAsset, kClient, kStartingBalance);
  ASSERT_TRUE(fixture.engine().initialize(make_request()).ok());

  auto result = fixture.engine().deposit(deny_all_gate(), 1, kAsset);
  EXPECT_EQ(result.code, escrow_error_code::transfer);
  EXPECT_NE(result.info.find("unauthorized"), std::string::npos);
  EXPECT_EQ(status_of(fixture, 1), escrow_status_t::pending);
  EXPECT_EQ(fixture.ledger().balance(kAsset, kClient), kStartingBalance);
  EXPECT_EQ(fixture.sink().events().size(), 1u);
}

TEST(engine, transfer_failure_carries_ledger_reason_and_leaves_no_mutation) {
  auto fixture = engine_fixture{"atelier_engine_transfer_failure"};
  fixture.ledger().credit(kAsset, kClient, kStartingBalance);
  ASSERT_TRUE(fixture.engine().initialize(make_request()).ok());
  fixture.ledger().fail_next(transfer_result_t{
      transfer_error_code::insufficient_balance, "client is short"});

  auto result = fixture.engine().deposit(allow_only_gate(kClient), 1, kAsset);
  EXPECT_EQ(result.code, escrow_error_code::transfer);
  EXPECT_EQ(result.info, "insufficient_balance: client is short");
  EXPECT_EQ(status_of(fixture, 1), escrow_status_t::pending);
  EXPECT_EQ(fixture.engine().events(1, 100).size(), 1u);

  auto retry = fixture.engine().deposit(allow_only_gate(kClient), 1, kAsset);
  EXPECT_TRUE(retry.ok());
}

TEST(engine, deposit_commits_escrow_and_event_log_with_the_transfer) {
  auto fixture = engine_fixture{"atelier_engine_single_batch"};
  fixture.ledger().credit(kAsset, kClient, kStartingBalance);
  ASSERT_TRUE(fixture.engine().initialize(make_request()).ok());
  ASSERT_TRUE(
      fixture.engine().deposit(allow_only_gate(kClient), 1, kAsset).ok());

  auto escrow_key = atelier::schema::key::make_escrow_key(fixture.encoder(), 1);
  auto event_key = atelier::schema::key::make_event_key(fixture.encoder(), 2);
  auto staged_keys = std::set<bytes_t>{};
  for (const auto& [key, value] : fixture.ledger().last_writes().entries) {
    staged_keys.insert(key);
  }
  EXPECT_TRUE(staged_keys.contains(escrow_key));
  EXPECT_TRUE(staged_keys.contains(event_key));
  EXPECT_EQ(status_of(fixture, 1), escrow_status_t::funded);
}

TEST(engine, refused_ledger_transfer_leaves_store_untouched) {
  auto db_path = make_db_path("atelier_engine_refused_batch");
  auto encoder = scale_encoder_t{};
  auto clock = manual_clock{kStartTime};
  {
    auto storage = atelier::storage::make_storage<
        atelier::storage::rocksdb_storage_tag>(db_path);
    auto ledger = atelier::ledger::storage_ledger{encoder, storage};
    auto engine = atelier::execution::engine{
        encoder, storage, ledger, clock.function(), {},
        make_test_options(false)};
    ASSERT_TRUE(ledger.mint(kAsset, kClient, kAmount - 1).ok());
    ASSERT_TRUE(
        engine.initialize(make_request(kStartTime + 40 * kOneDay)).ok());

    auto escrow_key = atelier::schema::key::make_escrow_key(encoder, 1);
    auto escrow_view = bytes_view_t{escrow_key.data(), escrow_key.size()};
    auto hint = storage.load_retention(escrow_view);
    // Late enough that a committed deposit would renew the hint.
    auto& options = engine.options();
    clock.set(kStartTime + options.target_retention -
              options.renewal_threshold + 1);

    auto result = engine.deposit(allow_only_gate(kClient), 1, kAsset);
    EXPECT_EQ(result.code, escrow_error_code::transfer);
    EXPECT_EQ(engine.get(1).escrow->status, escrow_status_t::pending);
    EXPECT_EQ(engine.events(1, 100).size(), 1u);
    EXPECT_EQ(storage.load_retention(escrow_view), hint);
    EXPECT_EQ(ledger.balance(kAsset, kClient), kAmount - 1);
    EXPECT_EQ(ledger.balance(kAsset, custody_principal()), 0);
  }
  remove_path(db_path);
}

TEST(engine, release_requires_client_authorization) {
  auto fixture = engine_fixture{"atelier_engine_release_auth"};
  auto id = make_funded_escrow(fixture);

  EXPECT_EQ(fixture.engine().release(deny_all_gate(), id, kAsset).code,
            escrow_error_code::authorization);
  EXPECT_EQ(
      fixture.engine().release(allow_only_gate(kArtisan), id, kAsset).code,
      escrow_error_code::authorization);
  EXPECT_EQ(status_of(fixture, id), escrow_status_t::funded);
  EXPECT_EQ(fixture.ledger().balance(kAsset, kArtisan), 0);
}

TEST(engine, release_checks_authorization_before_deadline) {
  auto fixture = engine_fixture{"atelier_engine_release_order"};
  auto id = make_funded_escrow(fixture);
  fixture.clock().set(kStartTime + kOneDay + 1);

  EXPECT_EQ(fixture.engine().release(deny_all_gate(), id, kAsset).code,
            escrow_error_code::authorization);
  EXPECT_EQ(fixture.engine().release(allow_only_gate(kClient), id, kAsset).code,
            escrow_error_code::deadline);
}

TEST(engine, release_of_pending_escrow_is_a_state_error) {
  auto fixture = engine_fixture{"atelier_engine_release_pending"};
  ASSERT_TRUE(fixture.engine().initialize(make_request()).ok());
  EXPECT_EQ(fixture.engine().release(allow_only_gate(kClient), 1, kAsset).code,
            escrow_error_code::state);
  EXPECT_EQ(fixture.ledger().calls(), 0u);
}

TEST(engine, reclaim_checks_state_before_deadline) {
  auto fixture = engine_fixture{"atelier_engine_reclaim_order"};
  ASSERT_TRUE(fixture.engine().initialize(make_request()).ok());

  // Pending and before deadline: state is checked first.
  EXPECT_EQ(fixture.engine().reclaim(allow_only_gate(kClient), 1, kAsset).code,
            escrow_error_code::state);
  fixture.clock().set(kStartTime + kOneDay + 1);
  EXPECT_EQ(fixture.engine().reclaim(deny_all_gate(), 1, kAsset).code,
            escrow_error_code::authorization);
  EXPECT_EQ(fixture.engine().reclaim(allow_only_gate(kClient), 1, kAsset).code,
            escrow_error_code::state);
}

TEST(engine, reclaim_after_release_is_a_state_error) {
  auto fixture = engine_fixture{"atelier_engine_reclaim_released"};
  auto id = make_funded_escrow(fixture);
  ASSERT_TRUE(
      fixture.engine().release(allow_only_gate(kClient), id, kAsset).ok());

  fixture.clock().set(kStartTime + kOneDay + 1);
  EXPECT_EQ(fixture.engine().reclaim(allow_only_gate(kClient), id, kAsset).code,
            escrow_error_code::state);
  EXPECT_EQ(status_of(fixture, id), escrow_status_t::released);
}

TEST(engine, mismatched_asset_is_rejected_before_transfer) {
  auto fixture = engine_fixture{"atelier_engine_asset_mismatch"};
  fixture.ledger().credit(kAsset, kClient, kStartingBalance);
  fixture.ledger().credit(kOtherAsset, kClient, kStartingBalance);
  ASSERT_TRUE(fixture.engine().initialize(make_request()).ok());

  auto client_gate = allow_only_gate(kClient);
  EXPECT_EQ(fixture.engine().deposit(client_gate, 1, kOtherAsset).code,
            escrow_error_code::validation);
  EXPECT_EQ(fixture.ledger().calls(), 0u);
  ASSERT_TRUE(fixture.engine().deposit(client_gate, 1, kAsset).ok());

  EXPECT_EQ(fixture.engine().release(client_gate, 1, kOtherAsset).code,
            escrow_error_code::validation);
  fixture.clock().set(kStartTime + kOneDay + 1);
  EXPECT_EQ(fixture.engine().reclaim(client_gate, 1, kOtherAsset).code,
            escrow_error_code::validation);
  EXPECT_EQ(status_of(fixture, 1), escrow_status_t::funded);
  EXPECT_EQ(fixture.ledger().calls(), 1u);
}

TEST(engine, value_is_conserved_and_moves_in_fixed_amounts) {
  auto fixture = engine_fixture{"atelier_engine_conservation"};
  fixture.ledger().credit(kAsset, kClient, kStartingBalance);
  auto client_gate = allow_only_gate(kClient);
  auto before = total_held(fixture);

  ASSERT_TRUE(fixture.engine().initialize(make_request()).ok());
  ASSERT_TRUE(fixture.engine().initialize(make_request()).ok());
  ASSERT_TRUE(fixture.engine().deposit(client_gate, 1, kAsset).ok());
  EXPECT_EQ(total_held(fixture), before);
  ASSERT_TRUE(fixture.engine().deposit(client_gate, 2, kAsset).ok());
  EXPECT_EQ(total_held(fixture), before);
  ASSERT_TRUE(fixture.engine().release(client_gate, 1, kAsset).ok());
  EXPECT_EQ(total_held(fixture), before);
  fixture.clock().set(kStartTime + kOneDay + 1);
  ASSERT_TRUE(fixture.engine().reclaim(client_gate, 2, kAsset).ok());
  EXPECT_EQ(total_held(fixture), before);

  ASSERT_EQ(fixture.ledger().transfers().size(), 4u);
  for (const auto& transfer : fixture.ledger().transfers()) {
    EXPECT_EQ(transfer.amount, amount_t{kAmount});
    EXPECT_EQ(transfer.asset, kAsset);
  }
  EXPECT_EQ(fixture.ledger().balance(kAsset, kArtisan), kAmount);
  EXPECT_EQ(fixture.ledger().balance(kAsset, kClient),
            kStartingBalance - kAmount);
}

TEST(engine, events_are_published_and_logged_in_order) {
  auto fixture = engine_fixture{"atelier_engine_events"};
  auto id = make_funded_escrow(fixture);
  fixture.clock().set(kStartTime + 100);
  ASSERT_TRUE(
      fixture.engine().release(allow_only_gate(kClient), id, kAsset).ok());
  EXPECT_FALSE(
      fixture.engine().release(allow_only_gate(kClient), id, kAsset).ok());

  auto expected = std::vector<escrow_event_t>{
      escrow_initialized_t{.id = id, .client = kClient, .artisan = kArtisan},
      escrow_funded_t{.id = id,
                      .client = kClient,
                      .amount = kAmount,
                      .timestamp = kStartTime},
      escrow_released_t{.id = id,
                        .artisan = kArtisan,
                        .amount = kAmount,
                        .timestamp = kStartTime + 100}};
  EXPECT_EQ(fixture.sink().events(), expected);

  auto records = fixture.engine().events(1, 100);
  ASSERT_EQ(records.size(), expected.size());
  for (std::size_t i = 0; i < records.size(); ++i) {
    EXPECT_EQ(records[i].sequence, i + 1);
    EXPECT_EQ(records[i].event, expected[i]);
  }

  auto middle = fixture.engine().events(2, 2);
  ASSERT_EQ(middle.size(), 1u);
  EXPECT_EQ(event_name(middle.front().event), "funded");
  EXPECT_TRUE(fixture.engine().events(4, 10).empty());
  EXPECT_TRUE(fixture.engine().events(3, 2).empty());
  EXPECT_EQ(fixture.engine().events(0, 1).size(), 1u);
}

TEST(engine, writes_set_retention_hints_for_escrow_and_counter) {
  auto fixture = engine_fixture{"atelier_engine_retention"};
  auto& options = fixture.engine().options();
  ASSERT_TRUE(fixture.engine()
                  .initialize(make_request(kStartTime + 40 * kOneDay))
                  .ok());

  auto escrow_key = atelier::schema::key::make_escrow_key(fixture.encoder(), 1);
  auto counter_key = atelier::schema::key::make_next_id_key(fixture.encoder());
  auto escrow_view = bytes_view_t{escrow_key.data(), escrow_key.size()};
  auto counter_view = bytes_view_t{counter_key.data(), counter_key.size()};

  EXPECT_EQ(fixture.storage().load_retention(escrow_view),
            kStartTime + options.target_retention);
  EXPECT_EQ(fixture.storage().load_retention(counter_view),
            kStartTime + options.target_retention);

  // Plenty of retention left: the hint stays where it is.
  fixture.ledger().credit(kAsset, kClient, kStartingBalance);
  fixture.clock().set(kStartTime + kOneDay);
  ASSERT_TRUE(fixture.engine()
                  .initialize(make_request(kStartTime + 40 * kOneDay))
                  .ok());
  EXPECT_EQ(fixture.storage().load_retention(counter_view),
            kStartTime + options.target_retention);

  // Less than the renewal threshold left: renewed to now + target.
  auto later = kStartTime + options.target_retention -
               options.renewal_threshold + 1;
  fixture.clock().set(later);
  ASSERT_TRUE(
      fixture.engine().deposit(allow_only_gate(kClient), 1, kAsset).ok());
  EXPECT_EQ(fixture.storage().load_retention(escrow_view),
            later + options.target_retention);
  EXPECT_EQ(status_of(fixture, 1), escrow_status_t::funded);
}

TEST(engine, state_survives_reopening_the_store) {
  auto db_path = make_db_path("atelier_engine_reopen");
  auto encoder = scale_encoder_t{};
  auto clock = manual_clock{kStartTime};
  {
    auto storage = atelier::storage::make_storage<
        atelier::storage::rocksdb_storage_tag>(db_path);
    auto ledger = memory_ledger{storage};
    auto engine = atelier::execution::engine{
        encoder, storage, ledger, clock.function(), {},
        make_test_options(false)};
    ASSERT_TRUE(engine.initialize(make_request()).ok());
    ASSERT_TRUE(engine.initialize(make_request()).ok());
  }
  {
    auto storage = atelier::storage::make_storage<
        atelier::storage::rocksdb_storage_tag>(db_path);
    auto ledger = memory_ledger{storage};
    auto engine = atelier::execution::engine{
        encoder, storage, ledger, clock.function(), {},
        make_test_options(false)};
    EXPECT_TRUE(engine.get(2).ok());
    EXPECT_EQ(engine.next_id(), 3u);
    auto third = engine.initialize(make_request());
    EXPECT_EQ(third.escrow_id, escrow_id_t{3});
    EXPECT_EQ(engine.events(1, 100).size(), 3u);
  }
  remove_path(db_path);
}

TEST(engine, runs_against_the_storage_ledger) {
  auto fixture_path = make_db_path("atelier_engine_storage_ledger");
  auto encoder = scale_encoder_t{};
  auto clock = manual_clock{kStartTime};
  {
    auto storage = atelier::storage::make_storage<
        atelier::storage::rocksdb_storage_tag>(fixture_path);
    auto ledger = atelier::ledger::storage_ledger{encoder, storage};
    auto engine = atelier::execution::engine{
        encoder, storage, ledger, clock.function(), {},
        make_test_options(false)};
    ASSERT_TRUE(ledger.mint(kAsset, kClient, kStartingBalance).ok());
    ASSERT_TRUE(engine.initialize(make_request()).ok());
    ASSERT_TRUE(engine.deposit(allow_only_gate(kClient), 1, kAsset).ok());
    EXPECT_EQ(ledger.balance(kAsset, custody_principal()), kAmount);
    ASSERT_TRUE(engine.release(allow_only_gate(kClient), 1, kAsset).ok());
    EXPECT_EQ(ledger.balance(kAsset, kArtisan), kAmount);
    EXPECT_EQ(ledger.balance(kAsset, custody_principal()), 0);
    EXPECT_EQ(ledger.balance(kAsset, kClient), kStartingBalance - kAmount);
  }
  remove_path(fixture_path);
}

TEST(engine, sink_may_read_back_through_the_engine) {
  auto observed = std::vector<escrow_status_t>{};
  engine_fixture* self = nullptr;
  auto fixture = engine_fixture{
      "atelier_engine_reentrant_sink", false,
      [&](const escrow_event_t& event) {
        auto found = self->engine().get(event_escrow_id(event));
        observed.push_back(found.escrow ? found.escrow->status
                                        : escrow_status_t::disputed);
      }};
  self = &fixture;
  fixture.ledger().credit(kAsset, kClient, kStartingBalance);

  ASSERT_TRUE(fixture.engine().initialize(make_request()).ok());
  ASSERT_TRUE(
      fixture.engine().deposit(allow_only_gate(kClient), 1, kAsset).ok());
  auto expected = std::vector<escrow_status_t>{escrow_status_t::pending,
                                               escrow_status_t::funded};
  EXPECT_EQ(observed, expected);
}

TEST(engine, throwing_sink_does_not_fail_a_committed_operation) {
  auto fixture = engine_fixture{
      "atelier_engine_throwing_sink", false,
      [](const escrow_event_t&) { throw std::runtime_error{"sink down"}; }};
  fixture.ledger().credit(kAsset, kClient, kStartingBalance);

  auto created = fixture.engine().initialize(make_request());
  EXPECT_TRUE(created.ok());
  EXPECT_EQ(created.escrow_id, escrow_id_t{1});
  EXPECT_EQ(fixture.engine().next_id(), 2u);
  EXPECT_TRUE(
      fixture.engine().deposit(allow_only_gate(kClient), 1, kAsset).ok());
  EXPECT_EQ(status_of(fixture, 1), escrow_status_t::funded);
  EXPECT_EQ(fixture.engine().events(1, 100).size(), 2u);
}
