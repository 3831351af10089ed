#include "account.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace txledger;

namespace {

Decimal d(const char* text) {
  return Decimal::parse(text);
}

}  // namespace

TEST(AccountTest, StartsEmptyAndUnlocked) {
  Account account(42);
  AccountSummary summary = account.summary();
  EXPECT_EQ(summary.client, 42);
  EXPECT_EQ(summary.available, Decimal::zero());
  EXPECT_EQ(summary.held, Decimal::zero());
  EXPECT_EQ(summary.total, Decimal::zero());
  EXPECT_FALSE(summary.locked);
}

TEST(AccountTest, TotalIsAvailablePlusHeld) {
  Account account(1);
  account.credit(d("10.5"));
  account.hold(d("4.25"));

  AccountSummary summary = account.summary();
  EXPECT_EQ(summary.available, d("6.25"));
  EXPECT_EQ(summary.held, d("4.25"));
  EXPECT_EQ(summary.total, d("10.5"));
}

TEST(AccountTest, RequireAvailableDoesNotMutate) {
  Account account(1);
  account.credit(d("5.12345"));

  EXPECT_FALSE(account.requireAvailable(d("5.12345")).has_value());

  auto error = account.requireAvailable(d("6"));
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(*error, LedgerError::insufficientFunds(d("5.12345"), d("6")));
  EXPECT_EQ(account.available(), d("5.12345"));
}

TEST(AccountTest, ReleaseAndChargeBackGuardHeldFunds) {
  Account account(1);
  account.credit(d("3"));
  account.hold(d("2"));

  EXPECT_THROW(account.release(d("2.01")), std::logic_error);
  EXPECT_THROW(account.chargeBack(d("5")), std::logic_error);
  EXPECT_EQ(account.held(), d("2"));
  EXPECT_FALSE(account.locked());

  account.chargeBack(d("2"));
  EXPECT_EQ(account.held(), Decimal::zero());
  EXPECT_EQ(account.available(), d("1"));
  EXPECT_TRUE(account.locked());
}
