/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gmock/gmock.h>

#include "books/impl/sql_counterparty_registry.hpp"
#include "books/impl/sql_journal_store.hpp"
#include "module/kessan/books/books_fixture.hpp"

using namespace kessan::books;
using namespace kessan::model;
using testing::ElementsAre;

namespace {
  Counterparty makeCounterparty(std::string name, std::string code = "") {
    Counterparty counterparty;
    counterparty.name = std::move(name);
    counterparty.code = std::move(code);
    return counterparty;
  }
}  // namespace

class SqlCounterpartyRegistryTest : public BooksTest {
 public:
  void SetUp() override {
    BooksTest::SetUp();
    registry_ = std::make_unique<SqlCounterpartyRegistry>(
        sql(), getTestLogger("CounterpartyRegistry"));
  }

  std::unique_ptr<SqlCounterpartyRegistry> registry_;
};

/**
 * @given empty registry
 * @when counterparties are created, renamed and deleted
 * @then the list reflects each change, ordered by name
 */
TEST_F(SqlCounterpartyRegistryTest, Lifecycle) {
  auto beta = registry_->createCounterparty(makeCounterparty(" Beta ", "B01"));
  KESSAN_ASSERT_RESULT_VALUE(beta);
  auto alpha = registry_->createCounterparty(makeCounterparty("Alpha"));
  KESSAN_ASSERT_RESULT_VALUE(alpha);

  auto listed = registry_->listCounterparties();
  KESSAN_ASSERT_RESULT_VALUE(listed);
  ASSERT_EQ(listed.assumeValue().size(), 2u);
  EXPECT_EQ(listed.assumeValue()[0].name, "Alpha");
  EXPECT_EQ(listed.assumeValue()[1].name, "Beta");
  EXPECT_EQ(listed.assumeValue()[1].code, "B01");
  EXPECT_EQ(listed.assumeValue()[1].id, beta.assumeValue());

  KESSAN_ASSERT_RESULT_VALUE(registry_->updateCounterparty(
      alpha.assumeValue(), makeCounterparty("Gamma")));
  KESSAN_ASSERT_RESULT_VALUE(
      registry_->deleteCounterparty(beta.assumeValue()));

  auto remaining = registry_->listCounterparties();
  KESSAN_ASSERT_RESULT_VALUE(remaining);
  ASSERT_EQ(remaining.assumeValue().size(), 1u);
  EXPECT_EQ(remaining.assumeValue()[0].name, "Gamma");
}

/**
 * @given empty registry
 * @when a counterparty without a name is created or stored
 * @then Validation is reported
 */
TEST_F(SqlCounterpartyRegistryTest, EmptyNameRejected) {
  KESSAN_ASSERT_LEDGER_ERROR(
      registry_->createCounterparty(makeCounterparty("  ")), kValidation);

  auto id = registry_->createCounterparty(makeCounterparty("Alpha"));
  KESSAN_ASSERT_RESULT_VALUE(id);
  KESSAN_ASSERT_LEDGER_ERROR(
      registry_->updateCounterparty(id.assumeValue(), makeCounterparty("")),
      kValidation);
}

/**
 * @given a deleted counterparty
 * @when it is updated or deleted again
 * @then NotFound is reported
 */
TEST_F(SqlCounterpartyRegistryTest, DeletedCounterpartyNotFound) {
  auto id = registry_->createCounterparty(makeCounterparty("Alpha"));
  KESSAN_ASSERT_RESULT_VALUE(id);
  KESSAN_ASSERT_RESULT_VALUE(registry_->deleteCounterparty(id.assumeValue()));

  KESSAN_ASSERT_LEDGER_ERROR(registry_->deleteCounterparty(id.assumeValue()),
                             kNotFound);
  KESSAN_ASSERT_LEDGER_ERROR(
      registry_->updateCounterparty(id.assumeValue(), makeCounterparty("Beta")),
      kNotFound);
}

/**
 * @given registered counterparties and journal entries naming others
 * @when suggestion names are read
 * @then both sources are merged without duplicates, sorted
 */
TEST_F(SqlCounterpartyRegistryTest, NamesMergeJournalCounterparties) {
  KESSAN_ASSERT_RESULT_VALUE(
      registry_->createCounterparty(makeCounterparty("Amazon")));
  KESSAN_ASSERT_RESULT_VALUE(
      registry_->createCounterparty(makeCounterparty("Zeta")));

  SqlJournalStore journal(sql(), boost::none, getTestLogger("JournalStore"));
  JournalEntryDraft draft;
  draft.entry_date = "2024-01-05";
  draft.debit_account = std::string{"消耗品費"};
  draft.credit_account = std::string{"現金"};
  draft.amount = 1100;
  draft.counterparty = "Amazon";
  KESSAN_ASSERT_RESULT_VALUE(journal.createEntry(draft));
  draft.counterparty = "Mono";
  KESSAN_ASSERT_RESULT_VALUE(journal.createEntry(draft));
  draft.counterparty = "";
  KESSAN_ASSERT_RESULT_VALUE(journal.createEntry(draft));

  auto names = registry_->counterpartyNames();
  KESSAN_ASSERT_RESULT_VALUE(names);
  EXPECT_THAT(names.assumeValue(), ElementsAre("Amazon", "Mono", "Zeta"));
}
