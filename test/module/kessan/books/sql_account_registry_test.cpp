/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>

#include <gmock/gmock.h>

#include "books/impl/sql_journal_store.hpp"
#include "module/kessan/books/books_fixture.hpp"

using namespace kessan::books;
using namespace kessan::model;
using kessan::expected::resultToOptionalValue;

class SqlAccountRegistryTest : public BooksTest {};

/**
 * @given storage seeded with the default chart of accounts
 * @when accounts are listed
 * @then every default account is present, ordered by display order
 * @and seeding again inserts nothing
 */
TEST_F(SqlAccountRegistryTest, SeedsDefaultChartOnce) {
  auto accounts = accounts_->listAccounts(true);
  KESSAN_ASSERT_RESULT_VALUE(accounts);
  const auto &list = accounts.assumeValue();
  ASSERT_EQ(list.size(), 35u);
  EXPECT_EQ(list.front().code, "100");
  EXPECT_EQ(list.front().name, "現金");
  EXPECT_EQ(list.back().name, "雑費");
  EXPECT_TRUE(std::is_sorted(
      list.begin(), list.end(), [](const auto &a, const auto &b) {
        return a.display_order < b.display_order;
      }));

  auto reseeded = accounts_->seedDefaultAccounts();
  KESSAN_ASSERT_RESULT_VALUE(reseeded);
  EXPECT_EQ(reseeded.assumeValue(), 0u);
}

/**
 * @given seeded storage
 * @when an account with a fresh code and name is created
 * @then it can be found by id with the given attributes
 */
TEST_F(SqlAccountRegistryTest, CreateAccount) {
  auto id = accounts_->createAccount(
      "640", "研修費", AccountCategory::kExpense, TaxClassification::kStandard10);
  KESSAN_ASSERT_RESULT_VALUE(id);

  auto found = accounts_->findById(id.assumeValue());
  KESSAN_ASSERT_RESULT_VALUE(found);
  ASSERT_TRUE(found.assumeValue());
  const auto &account = *found.assumeValue();
  EXPECT_EQ(account.code, "640");
  EXPECT_EQ(account.name, "研修費");
  EXPECT_EQ(account.category, AccountCategory::kExpense);
  EXPECT_EQ(account.display_order, 640);
  EXPECT_TRUE(account.is_active);
}

/**
 * @given seeded storage
 * @when an account reusing an existing code or name is created
 * @then DuplicateAccount is reported
 */
TEST_F(SqlAccountRegistryTest, CreateDuplicateAccount) {
  KESSAN_ASSERT_LEDGER_ERROR(
      accounts_->createAccount(
          "100", "別の現金", AccountCategory::kAsset, TaxClassification::kOutOfScope),
      kDuplicateAccount);
  KESSAN_ASSERT_LEDGER_ERROR(
      accounts_->createAccount(
          "999", "現金", AccountCategory::kAsset, TaxClassification::kOutOfScope),
      kDuplicateAccount);
}

/**
 * @given seeded storage
 * @when an account with an empty name is created
 * @then Validation is reported
 */
TEST_F(SqlAccountRegistryTest, CreateAccountWithEmptyName) {
  KESSAN_ASSERT_LEDGER_ERROR(
      accounts_->createAccount(
          "999", "", AccountCategory::kAsset, TaxClassification::kOutOfScope),
      kValidation);
}

/**
 * @given an account referenced by a live journal entry
 * @when the account is deactivated
 * @then AccountInUse is reported until the entry is deleted
 * @and afterwards the account disappears from the active list
 */
TEST_F(SqlAccountRegistryTest, DeactivateAccountInUse) {
  SqlJournalStore journal(sql(), boost::none, getTestLogger("JournalStore"));
  auto fee_id = accountId("支払手数料");

  JournalEntryDraft draft;
  draft.entry_date = "2024-05-01";
  draft.debit_account = fee_id;
  draft.credit_account = std::string{"普通預金"};
  draft.amount = 330;
  auto entry = journal.createEntry(draft);
  KESSAN_ASSERT_RESULT_VALUE(entry);

  KESSAN_ASSERT_LEDGER_ERROR(accounts_->deactivateAccount(fee_id),
                             kAccountInUse);

  KESSAN_ASSERT_RESULT_VALUE(journal.deleteEntry(entry.assumeValue()));
  KESSAN_ASSERT_RESULT_VALUE(accounts_->deactivateAccount(fee_id));

  auto active = accounts_->findActiveByName("支払手数料");
  KESSAN_ASSERT_RESULT_VALUE(active);
  EXPECT_FALSE(active.assumeValue());

  auto all = accounts_->listAccounts(false);
  KESSAN_ASSERT_RESULT_VALUE(all);
  EXPECT_EQ(all.assumeValue().size(), 35u);
  auto listed = accounts_->listAccounts(true);
  KESSAN_ASSERT_RESULT_VALUE(listed);
  EXPECT_EQ(listed.assumeValue().size(), 34u);
}

/**
 * @given an account referenced only as the credit leg of a live entry
 * @when the account is deactivated
 * @then AccountInUse is reported and the account stays active
 */
TEST_F(SqlAccountRegistryTest, DeactivateAccountUsedAsCreditLeg) {
  SqlJournalStore journal(sql(), boost::none, getTestLogger("JournalStore"));
  auto deposit_id = accountId("普通預金");

  JournalEntryDraft draft;
  draft.entry_date = "2024-05-02";
  draft.debit_account = std::string{"通信費"};
  draft.credit_account = deposit_id;
  draft.amount = 5500;
  KESSAN_ASSERT_RESULT_VALUE(journal.createEntry(draft));

  KESSAN_ASSERT_LEDGER_ERROR(accounts_->deactivateAccount(deposit_id),
                             kAccountInUse);
  auto active = accounts_->findActiveByName("普通預金");
  KESSAN_ASSERT_RESULT_VALUE(active);
  ASSERT_TRUE(active.assumeValue());
  EXPECT_EQ(active.assumeValue()->id, deposit_id);
}

/**
 * @given seeded storage
 * @when a nonexistent account is deactivated or looked up
 * @then NotFound is reported and the lookup is empty
 */
TEST_F(SqlAccountRegistryTest, UnknownAccount) {
  KESSAN_ASSERT_LEDGER_ERROR(accounts_->deactivateAccount(100500), kNotFound);
  auto found = resultToOptionalValue(accounts_->findById(100500));
  ASSERT_TRUE(found);
  EXPECT_FALSE(*found);
}
