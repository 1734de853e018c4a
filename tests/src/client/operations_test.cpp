#include <gtest/gtest.h>
#include <bailment/client/operations.hpp>
#include <bailment/codec/instruction_codec.hpp>
#include <bailment/codec/token_instructions.hpp>
#include <bailment/testing/execution_fixture.hpp>
#include <bailment/testing/scenario.hpp>

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>

using namespace bailment::schema;
using bailment::client::idempotent_status_t;
using bailment::testing::execution_fixture;
using bailment::testing::kEscrowAmount;
using bailment::testing::kInitialSupply;
using bailment::testing::kLockAmount;

namespace {

constexpr auto kDeadlineOffset = int64_t{3600};

/// Session that fails the first `failures` submissions with a transport
/// error. With `apply_before_failing` the failed attempt still reaches the
/// engine, as when a reply is lost.
struct flaky_session final {
  flaky_session(bailment::client::session& inner,
                const std::size_t failures,
                const bool apply_before_failing)
      : session{inner} {
    session.submit = [this, &inner, failures,
                      apply_before_failing](const bytes_view_t& raw) {
      ++calls;
      if (calls <= failures) {
        if (apply_before_failing) {
          static_cast<void>(inner.submit(raw));
        }
        auto result = transaction_result_t{};
        result.code = static_cast<uint32_t>(
            transaction_error_code::submission_timeout);
        result.log = "submission_timeout";
        return result;
      }
      return inner.submit(raw);
    };
  }

  bailment::client::session session;
  std::size_t calls{};
};

}  // namespace

class client_operations : public ::testing::Test {
 protected:
  bailment::client::context context() {
    auto ctx = fixture_.make_context(buyer_);
    ctx.retry.backoff = std::chrono::milliseconds{0};
    return ctx;
  }

  amount_t balance(const pubkey_t& owner, const pubkey_t& mint) {
    auto ctx = context();
    return bailment::client::holding_balance(ctx, owner, mint).value_or(0);
  }

  execution_fixture fixture_{"bailment_client_operations"};
  bailment::crypto::keypair buyer_{bailment::testing::make_keypair(1)};
  bailment::crypto::keypair mint_{bailment::testing::make_keypair(2)};
  bailment::crypto::keypair seller_{bailment::testing::make_keypair(3)};
};

TEST_F(client_operations, lock_escrow_and_release_end_to_end) {
  auto ctx = context();
  auto funded = bailment::testing::make_funded_vault(ctx, mint_);
  const auto& seller = seller_.public_key();

  EXPECT_EQ(balance(buyer_.public_key(), funded.mint),
            kInitialSupply - kLockAmount);
  EXPECT_EQ(balance(funded.addresses.vault.address, funded.mint), kLockAmount);

  auto vault = bailment::client::fetch_vault(ctx, funded.addresses.vault.address);
  ASSERT_TRUE(vault.has_value());
  EXPECT_EQ(vault->authority, buyer_.public_key());
  EXPECT_EQ(vault->mint, funded.mint);
  EXPECT_EQ(vault->bump, funded.addresses.vault.bump);

  auto deadline = fixture_.now() + kDeadlineOffset;
  auto escrow = bailment::client::init_escrow(ctx, funded.mint, seller,
                                              kEscrowAmount, deadline);
  ASSERT_TRUE(escrow.ok()) << escrow.message;
  auto agreement_address =
      bailment::client::derive_agreement_address(ctx, funded.mint, seller);
  EXPECT_EQ(escrow.address, agreement_address.address);
  // The seller's holding account is created in the same transaction.
  EXPECT_EQ(balance(seller, funded.mint), 0u);
  EXPECT_TRUE(bailment::client::holding_balance(ctx, seller, funded.mint)
                  .has_value());
  // Creating the agreement moves nothing.
  EXPECT_EQ(balance(funded.addresses.vault.address, funded.mint), kLockAmount);

  auto agreement =
      bailment::client::fetch_agreement(ctx, agreement_address.address);
  ASSERT_TRUE(agreement.has_value());
  EXPECT_EQ(agreement->status, agreement_status_t::active);
  EXPECT_EQ(agreement->amount_locked, kEscrowAmount);
  EXPECT_EQ(agreement->deadline_unix_ts, deadline);
  EXPECT_EQ(agreement->buyer, buyer_.public_key());
  EXPECT_EQ(agreement->seller, seller);
  EXPECT_EQ(agreement->vault, funded.addresses.vault.address);
  EXPECT_EQ(agreement->bump, agreement_address.bump);

  fixture_.advance(60);
  auto release = bailment::client::release_to_seller(ctx, funded.mint, seller);
  ASSERT_TRUE(release.ok()) << release.message;

  EXPECT_EQ(balance(funded.addresses.vault.address, funded.mint),
            kLockAmount - kEscrowAmount);
  EXPECT_EQ(balance(seller, funded.mint), kEscrowAmount);
  agreement = bailment::client::fetch_agreement(ctx, agreement_address.address);
  ASSERT_TRUE(agreement.has_value());
  EXPECT_EQ(agreement->status, agreement_status_t::released);
  EXPECT_EQ(agreement->amount_locked, kEscrowAmount);

  auto again = bailment::client::release_to_seller(ctx, funded.mint, seller);
  EXPECT_EQ(again.code, transaction_error_code::already_released);
  EXPECT_EQ(balance(seller, funded.mint), kEscrowAmount);
}

TEST_F(client_operations, repeated_setup_reports_existing_state) {
  auto ctx = context();
  auto funded = bailment::testing::make_funded_vault(ctx, mint_, 0);

  auto vault = bailment::client::init_vault(ctx, funded.mint);
  EXPECT_EQ(vault.status, idempotent_status_t::already_exists);
  EXPECT_TRUE(vault.ok());
  EXPECT_EQ(vault.detail.code, transaction_error_code::account_already_in_use);
  EXPECT_EQ(vault.detail.address, funded.addresses.vault.address);

  auto holding = bailment::client::ensure_holding_account(
      ctx, funded.addresses.vault.address, funded.mint);
  EXPECT_EQ(holding.status, idempotent_status_t::already_exists);

  auto asset = bailment::client::create_asset(
      ctx, mint_, bailment::testing::kDecimals, 1);
  EXPECT_EQ(asset.code, transaction_error_code::account_already_in_use);
  EXPECT_EQ(balance(buyer_.public_key(), funded.mint), kInitialSupply);
}

TEST_F(client_operations, lock_checks_preconditions_locally) {
  auto ctx = context();
  ASSERT_TRUE(bailment::client::create_asset(
                  ctx, mint_, bailment::testing::kDecimals, 10)
                  .ok());
  const auto& mint = mint_.public_key();

  auto no_vault = bailment::client::lock_tokens(ctx, mint, 1);
  EXPECT_EQ(no_vault.code, transaction_error_code::account_not_initialized);
  EXPECT_EQ(no_vault.operation, "lock_tokens");

  ASSERT_TRUE(bailment::client::init_vault(ctx, mint).ok());
  auto no_holding = bailment::client::lock_tokens(ctx, mint, 1);
  EXPECT_EQ(no_holding.code, transaction_error_code::account_not_initialized);

  auto addresses = bailment::client::derive_vault_addresses(ctx, mint);
  ASSERT_TRUE(bailment::client::ensure_holding_account(
                  ctx, addresses.vault.address, mint)
                  .ok());
  auto too_much = bailment::client::lock_tokens(ctx, mint, 11);
  EXPECT_EQ(too_much.code, transaction_error_code::insufficient_funds);
  EXPECT_EQ(too_much.category(), error_category_t::precondition_violation);
  EXPECT_EQ(fixture_.engine().next_nonce(buyer_.public_key()), 3u);

  EXPECT_TRUE(bailment::client::lock_tokens(ctx, mint, 10).ok());
  EXPECT_EQ(balance(addresses.vault.address, mint), 10u);
}

TEST_F(client_operations, escrow_checks_preconditions_locally) {
  auto ctx = context();
  auto funded = bailment::testing::make_funded_vault(ctx, mint_);
  const auto& seller = seller_.public_key();
  auto deadline = fixture_.now() + kDeadlineOffset;

  EXPECT_EQ(
      bailment::client::init_escrow(ctx, funded.mint, seller, 0, deadline)
          .code,
      transaction_error_code::zero_amount);
  EXPECT_EQ(bailment::client::init_escrow(ctx, funded.mint, seller,
                                          kEscrowAmount, fixture_.now())
                .code,
            transaction_error_code::deadline_not_in_future);
  EXPECT_EQ(bailment::client::init_escrow(ctx, funded.mint, seller,
                                          kLockAmount + 1, deadline)
                .code,
            transaction_error_code::amount_exceeds_vault_balance);
  EXPECT_EQ(
      bailment::client::release_to_seller(ctx, funded.mint, seller).code,
      transaction_error_code::account_not_initialized);

  ASSERT_TRUE(bailment::client::init_escrow(ctx, funded.mint, seller,
                                            kEscrowAmount, deadline)
                  .ok());
  auto duplicate = bailment::client::init_escrow(ctx, funded.mint, seller,
                                                 kEscrowAmount, deadline);
  EXPECT_EQ(duplicate.category(), error_category_t::duplicate_initialization);
}

TEST_F(client_operations, escrow_covering_the_whole_vault_is_allowed) {
  auto ctx = context();
  auto funded = bailment::testing::make_funded_vault(ctx, mint_);
  auto result = bailment::client::init_escrow(
      ctx, funded.mint, seller_.public_key(), kLockAmount,
      fixture_.now() + kDeadlineOffset);
  EXPECT_TRUE(result.ok()) << result.message;
}

TEST_F(client_operations, release_after_deadline_is_refused) {
  auto ctx = context();
  auto funded = bailment::testing::make_funded_vault(ctx, mint_);
  const auto& seller = seller_.public_key();
  ASSERT_TRUE(bailment::client::init_escrow(ctx, funded.mint, seller,
                                            kEscrowAmount,
                                            fixture_.now() + kDeadlineOffset)
                  .ok());

  fixture_.advance(kDeadlineOffset + 1);
  auto release = bailment::client::release_to_seller(ctx, funded.mint, seller);
  EXPECT_EQ(release.code, transaction_error_code::deadline_passed);
  EXPECT_EQ(balance(funded.addresses.vault.address, funded.mint), kLockAmount);
  EXPECT_EQ(balance(seller, funded.mint), 0u);
}

TEST_F(client_operations, release_requires_the_seller_holding_account) {
  auto ctx = context();
  auto funded = bailment::testing::make_funded_vault(ctx, mint_);
  const auto& seller = seller_.public_key();
  ASSERT_TRUE(bailment::client::init_escrow(ctx, funded.mint, seller,
                                            kEscrowAmount,
                                            fixture_.now() + kDeadlineOffset,
                                            false)
                  .ok());
  auto release = bailment::client::release_to_seller(ctx, funded.mint, seller);
  EXPECT_EQ(release.code, transaction_error_code::account_not_initialized);

  ASSERT_TRUE(
      bailment::client::ensure_holding_account(ctx, seller, funded.mint).ok());
  EXPECT_TRUE(
      bailment::client::release_to_seller(ctx, funded.mint, seller).ok());
}

TEST_F(client_operations, another_signer_sees_no_agreement) {
  auto ctx = context();
  auto funded = bailment::testing::make_funded_vault(ctx, mint_);
  const auto& seller = seller_.public_key();
  ASSERT_TRUE(bailment::client::init_escrow(ctx, funded.mint, seller,
                                            kEscrowAmount,
                                            fixture_.now() + kDeadlineOffset)
                  .ok());

  auto other = bailment::testing::make_keypair(4);
  auto other_ctx = fixture_.make_context(other);
  auto release =
      bailment::client::release_to_seller(other_ctx, funded.mint, seller);
  EXPECT_EQ(release.code, transaction_error_code::account_not_initialized);
  EXPECT_EQ(balance(seller, funded.mint), 0u);
}

TEST_F(client_operations, mismatched_seed_namespace_is_rejected_on_ledger) {
  auto ctx = context();
  ASSERT_TRUE(bailment::client::create_asset(
                  ctx, mint_, bailment::testing::kDecimals, 10)
                  .ok());
  ctx.seeds.vault = "custody";
  auto result = bailment::client::init_vault(ctx, mint_.public_key());
  EXPECT_EQ(result.status, idempotent_status_t::failed);
  EXPECT_EQ(result.detail.code, transaction_error_code::constraint_seeds);
}

TEST_F(client_operations, transient_failures_are_resubmitted) {
  auto flaky = flaky_session{fixture_.session(), 2, false};
  auto ctx = bailment::client::context{.signer = buyer_,
                                       .ledger = flaky.session,
                                       .program_id =
                                           fixture_.engine().program_id()};
  ctx.retry.backoff = std::chrono::milliseconds{0};

  auto result = bailment::client::create_asset(
      ctx, mint_, bailment::testing::kDecimals, 10);
  EXPECT_TRUE(result.ok()) << result.message;
  EXPECT_EQ(flaky.calls, 3u);
  EXPECT_EQ(balance(buyer_.public_key(), mint_.public_key()), 10u);
}

TEST_F(client_operations, lost_reply_counts_as_applied) {
  auto flaky = flaky_session{fixture_.session(), 1, true};
  auto ctx = bailment::client::context{.signer = buyer_,
                                       .ledger = flaky.session,
                                       .program_id =
                                           fixture_.engine().program_id()};
  ctx.retry.backoff = std::chrono::milliseconds{0};

  auto result = bailment::client::create_asset(
      ctx, mint_, bailment::testing::kDecimals, 10);
  EXPECT_TRUE(result.ok()) << result.message;
  EXPECT_EQ(flaky.calls, 2u);
  EXPECT_EQ(fixture_.engine().next_nonce(buyer_.public_key()), 1u);
  EXPECT_EQ(balance(buyer_.public_key(), mint_.public_key()), 10u);
}

TEST_F(client_operations, retry_after_unrelated_commit_applies_once) {
  auto ctx = context();
  auto funded = bailment::testing::make_funded_vault(ctx, mint_);
  const auto& vault = funded.addresses.vault.address;

  // The first attempt never reaches the executor; meanwhile another
  // transaction from the same payer moves the nonce on.
  auto calls = std::size_t{0};
  auto interleaved = fixture_.session();
  interleaved.submit = [&calls, &funded, this](const bytes_view_t& raw) {
    ++calls;
    if (calls == 1) {
      auto other = context();
      EXPECT_TRUE(bailment::client::ensure_holding_account(
                      other, seller_.public_key(), funded.mint)
                      .ok());
      auto result = transaction_result_t{};
      result.code = static_cast<uint32_t>(
          transaction_error_code::submission_timeout);
      result.log = "submission_timeout";
      return result;
    }
    return fixture_.session().submit(raw);
  };
  auto retrying = bailment::client::context{.signer = buyer_,
                                            .ledger = interleaved,
                                            .program_id =
                                                fixture_.engine().program_id()};
  retrying.retry.backoff = std::chrono::milliseconds{0};

  auto result = bailment::client::lock_tokens(retrying, funded.mint, 7);
  EXPECT_TRUE(result.ok()) << result.message;
  EXPECT_EQ(calls, 3u);
  EXPECT_EQ(balance(vault, funded.mint), kLockAmount + 7);
  EXPECT_EQ(balance(buyer_.public_key(), funded.mint),
            kInitialSupply - kLockAmount - 7);
}

TEST_F(client_operations, stale_nonce_without_receipt_is_not_success) {
  auto ctx = context();
  auto funded = bailment::testing::make_funded_vault(ctx, mint_);
  const auto& vault = funded.addresses.vault.address;

  auto calls = std::size_t{0};
  auto interleaved = fixture_.session();
  interleaved.submit = [&calls, &funded, this](const bytes_view_t& raw) {
    ++calls;
    if (calls == 1) {
      auto other = context();
      EXPECT_TRUE(bailment::client::ensure_holding_account(
                      other, seller_.public_key(), funded.mint)
                      .ok());
      auto result = transaction_result_t{};
      result.code = static_cast<uint32_t>(
          transaction_error_code::submission_timeout);
      return result;
    }
    return fixture_.session().submit(raw);
  };
  auto retrying = bailment::client::context{.signer = buyer_,
                                            .ledger = interleaved,
                                            .program_id =
                                                fixture_.engine().program_id()};
  retrying.retry.backoff = std::chrono::milliseconds{0};
  retrying.retry.max_nonce_refreshes = 0;

  auto result = bailment::client::lock_tokens(retrying, funded.mint, 7);
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.code, transaction_error_code::invalid_nonce);
  EXPECT_EQ(calls, 2u);
  EXPECT_EQ(balance(vault, funded.mint), kLockAmount);
}

TEST_F(client_operations, concurrent_vault_setup_is_a_duplicate) {
  auto ctx = context();
  ASSERT_TRUE(bailment::client::create_asset(
                  ctx, mint_, bailment::testing::kDecimals, 10)
                  .ok());
  const auto& mint = mint_.public_key();
  auto addresses = bailment::client::derive_vault_addresses(ctx, mint);

  // Another caller sets the vault up in a transaction of its own after this
  // one read its nonce.
  auto raced = false;
  auto racing = fixture_.session();
  racing.next_nonce = [&raced, &addresses, &mint, this](const pubkey_t& payer) {
    auto nonce = fixture_.session().next_nonce(payer);
    if (!raced) {
      raced = true;
      auto setup = init_vault_t{.authority = buyer_.public_key(),
                                .mint = mint,
                                .vault = addresses.vault.address};
      auto result = fixture_.submit(
          buyer_,
          {bailment::codec::encode(fixture_.engine().program_id(), setup),
           bailment::codec::make_create_holding_account(
               buyer_.public_key(), addresses.vault.address, mint, true)});
      EXPECT_EQ(result.code, 0u) << result.log;
    }
    return nonce;
  };
  auto racing_ctx = bailment::client::context{.signer = buyer_,
                                              .ledger = racing,
                                              .program_id =
                                                  fixture_.engine().program_id()};

  auto result = bailment::client::init_vault(racing_ctx, mint);
  EXPECT_EQ(result.status, idempotent_status_t::already_exists);
  EXPECT_EQ(result.detail.code, transaction_error_code::account_already_in_use);
  EXPECT_TRUE(bailment::client::fetch_vault(ctx, addresses.vault.address)
                  .has_value());
  EXPECT_EQ(fixture_.engine().next_nonce(buyer_.public_key()), 2u);
}

TEST_F(client_operations, identical_concurrent_initialization_applies_once) {
  auto ctx = context();
  ASSERT_TRUE(bailment::client::create_asset(
                  ctx, mint_, bailment::testing::kDecimals, 10)
                  .ok());
  const auto& mint = mint_.public_key();

  // Same signer, nonce and instruction: both callers build one transaction.
  auto raced = false;
  auto racing = fixture_.session();
  racing.next_nonce = [&raced, &mint, this](const pubkey_t& payer) {
    auto nonce = fixture_.session().next_nonce(payer);
    if (!raced) {
      raced = true;
      auto other = context();
      EXPECT_EQ(bailment::client::init_vault(other, mint).status,
                idempotent_status_t::created);
    }
    return nonce;
  };
  auto racing_ctx = bailment::client::context{.signer = buyer_,
                                              .ledger = racing,
                                              .program_id =
                                                  fixture_.engine().program_id()};

  auto result = bailment::client::init_vault(racing_ctx, mint);
  EXPECT_TRUE(result.ok()) << result.detail.message;
  auto vault = bailment::client::derive_vault_addresses(ctx, mint).vault;
  EXPECT_TRUE(bailment::client::fetch_vault(ctx, vault.address).has_value());
  EXPECT_EQ(fixture_.engine().next_nonce(buyer_.public_key()), 2u);
}

TEST_F(client_operations, duplicate_setup_is_not_logged_as_an_error) {
  auto ctx = context();
  ASSERT_TRUE(bailment::client::create_asset(
                  ctx, mint_, bailment::testing::kDecimals, 10)
                  .ok());
  ASSERT_TRUE(bailment::client::init_vault(ctx, mint_.public_key()).ok());

  auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(64);
  auto previous = spdlog::default_logger();
  spdlog::set_default_logger(
      std::make_shared<spdlog::logger>("bailment_capture", sink));
  auto again = bailment::client::init_vault(ctx, mint_.public_key());
  spdlog::set_default_logger(previous);

  EXPECT_EQ(again.status, idempotent_status_t::already_exists);
  auto messages = sink->last_raw();
  EXPECT_FALSE(messages.empty());
  for (const auto& message : messages) {
    EXPECT_LT(message.level, spdlog::level::err)
        << std::string_view{message.payload.data(), message.payload.size()};
  }
}

TEST_F(client_operations, locking_nothing_changes_nothing) {
  auto ctx = context();
  auto funded = bailment::testing::make_funded_vault(ctx, mint_);
  const auto& vault = funded.addresses.vault.address;
  auto supply_before = bailment::client::fetch_mint(ctx, funded.mint)->supply;

  auto result = bailment::client::lock_tokens(ctx, funded.mint, 0);
  EXPECT_TRUE(result.ok()) << result.message;
  EXPECT_EQ(balance(vault, funded.mint), kLockAmount);
  EXPECT_EQ(balance(buyer_.public_key(), funded.mint),
            kInitialSupply - kLockAmount);
  EXPECT_EQ(bailment::client::fetch_mint(ctx, funded.mint)->supply,
            supply_before);
}

TEST_F(client_operations, retries_stop_at_the_attempt_limit) {
  auto flaky = flaky_session{fixture_.session(), 10, false};
  auto ctx = bailment::client::context{.signer = buyer_,
                                       .ledger = flaky.session,
                                       .program_id =
                                           fixture_.engine().program_id()};
  ctx.retry.backoff = std::chrono::milliseconds{0};
  ctx.retry.max_attempts = 2;

  auto result = bailment::client::create_asset(
      ctx, mint_, bailment::testing::kDecimals, 10);
  EXPECT_EQ(result.code, transaction_error_code::submission_timeout);
  EXPECT_EQ(result.category(), error_category_t::transient);
  EXPECT_EQ(flaky.calls, 2u);
  EXPECT_FALSE(fixture_.engine().get_account(mint_.public_key()).has_value());
}

TEST_F(client_operations, authorization_failures_are_not_retried) {
  auto calls = std::size_t{0};
  auto counting = fixture_.session();
  counting.submit = [&calls, this](const bytes_view_t& raw) {
    ++calls;
    return fixture_.session().submit(raw);
  };
  auto ctx = bailment::client::context{.signer = buyer_,
                                       .ledger = counting,
                                       .program_id =
                                           fixture_.engine().program_id()};
  ASSERT_TRUE(bailment::client::create_asset(
                  ctx, mint_, bailment::testing::kDecimals, 10)
                  .ok());
  calls = 0;

  auto stranger = bailment::testing::make_keypair(8);
  auto result = bailment::client::submit(
      ctx, "mint_to", mint_.public_key(),
      {bailment::codec::make_mint_to(
          mint_.public_key(),
          bailment::address::derive_holding_account(buyer_.public_key(),
                                                    mint_.public_key())
              .address,
          stranger.public_key(), 1)},
      {std::cref(stranger)});
  EXPECT_EQ(result.code, transaction_error_code::owner_mismatch);
  EXPECT_EQ(result.category(), error_category_t::authorization);
  EXPECT_EQ(calls, 1u);
}
