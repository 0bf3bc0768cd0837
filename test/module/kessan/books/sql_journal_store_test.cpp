/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gmock/gmock.h>

#include "books/impl/sql_journal_store.hpp"
#include "module/kessan/books/books_fixture.hpp"

using namespace kessan::books;
using namespace kessan::model;
using kessan::expected::hasValue;
using testing::ElementsAre;
using testing::UnorderedElementsAre;

namespace {
  JournalEntryDraft makeDraft(std::string date,
                              AccountRef debit,
                              AccountRef credit,
                              AmountType amount,
                              std::string counterparty = "",
                              std::string memo = "") {
    JournalEntryDraft draft;
    draft.entry_date = std::move(date);
    draft.debit_account = std::move(debit);
    draft.credit_account = std::move(credit);
    draft.amount = amount;
    draft.counterparty = std::move(counterparty);
    draft.memo = std::move(memo);
    return draft;
  }

  std::vector<AmountType> amountsOf(const std::vector<JournalEntryView> &views) {
    std::vector<AmountType> amounts;
    for (const auto &view : views) {
      amounts.push_back(view.entry.amount);
    }
    return amounts;
  }
}  // namespace

class SqlJournalStoreTest : public BooksTest {
 public:
  void SetUp() override {
    BooksTest::SetUp();
    journal_ = std::make_unique<SqlJournalStore>(
        sql(), boost::none, getTestLogger("JournalStore"));
  }

  /// Books five entries over the first quarter of 2024
  void bookQuarter() {
    std::vector<JournalEntryDraft> drafts{
        makeDraft("2024-01-05", "消耗品費", "現金", 1100, "Amazon", "USBケーブル"),
        makeDraft("2024-01-20", "売掛金", "売上高", 55000, "株式会社A", "1月分"),
        makeDraft("2024-02-10", "普通預金", "売掛金", 55000, "株式会社A"),
        makeDraft("2024-02-28", "通信費", "普通預金", 5500, "回線業者", "2月分"),
        makeDraft("2024-03-15", "消耗品費", "現金", 2200, "Amazon", "トナー"),
    };
    for (const auto &result : journal_->createEntries(drafts)) {
      ASSERT_TRUE(hasValue(result));
    }
  }

  std::unique_ptr<SqlJournalStore> journal_;
};

/**
 * @given seeded storage
 * @when an entry is created with accounts given by name
 * @then it is stored with resolved ids and the tax amount derived from the
 * gross amount
 */
TEST_F(SqlJournalStoreTest, CreateEntryDerivesTax) {
  auto draft = makeDraft("2024-04-01", " 消耗品費 ", "現金", 11000, "文具店");
  draft.tax_classification = "10%";
  auto id = journal_->createEntry(draft);
  KESSAN_ASSERT_RESULT_VALUE(id);

  auto entry = journal_->getEntry(id.assumeValue());
  KESSAN_ASSERT_RESULT_VALUE(entry);
  ASSERT_TRUE(entry.assumeValue());
  const auto &stored = *entry.assumeValue();
  EXPECT_EQ(toIsoString(stored.entry_date), "2024-04-01");
  EXPECT_EQ(stored.debit_account_id, accountId("消耗品費"));
  EXPECT_EQ(stored.credit_account_id, accountId("現金"));
  EXPECT_EQ(stored.amount, 11000);
  EXPECT_EQ(stored.tax_classification, TaxClassification::kStandard10);
  EXPECT_EQ(stored.tax_amount, 1000);
  EXPECT_EQ(stored.counterparty, "文具店");
  EXPECT_EQ(stored.source, kManualSource);

  draft.tax_classification = "8%";
  draft.amount = 10800;
  auto reduced = journal_->createEntry(draft);
  KESSAN_ASSERT_RESULT_VALUE(reduced);
  auto reduced_entry = journal_->getEntry(reduced.assumeValue());
  KESSAN_ASSERT_RESULT_VALUE(reduced_entry);
  ASSERT_TRUE(reduced_entry.assumeValue());
  EXPECT_EQ(reduced_entry.assumeValue()->tax_amount, 800);
}

/**
 * @given a store without fallback account
 * @when a batch of four drafts with one unknown account name is created
 * @then three entries are stored and the fourth is rejected on its own
 */
TEST_F(SqlJournalStoreTest, BatchRejectsUnknownAccountWithoutFallback) {
  std::vector<JournalEntryDraft> drafts{
      makeDraft("2024-01-05", "消耗品費", "現金", 1100),
      makeDraft("2024-01-06", "旅費交通費", "現金", 420),
      makeDraft("2024-01-07", "存在しない科目", "現金", 999),
      makeDraft("2024-01-08", "通信費", "普通預金", 5500),
  };
  auto results = journal_->createEntries(drafts);
  ASSERT_EQ(results.size(), 4u);
  EXPECT_TRUE(hasValue(results[0]));
  EXPECT_TRUE(hasValue(results[1]));
  KESSAN_ASSERT_LEDGER_ERROR(results[2], kValidation);
  EXPECT_TRUE(hasValue(results[3]));

  auto page = journal_->listEntries(JournalFilter{});
  KESSAN_ASSERT_RESULT_VALUE(page);
  EXPECT_EQ(page.assumeValue().total, 3u);
}

/**
 * @given a store with fallback account 雑費
 * @when an entry names an unknown account
 * @then it is booked to the fallback account
 */
TEST_F(SqlJournalStoreTest, UnknownAccountNameBookedToFallback) {
  SqlJournalStore journal(
      sql(), std::string{"雑費"}, getTestLogger("JournalStore"));
  auto id = journal.createEntry(
      makeDraft("2024-01-07", "存在しない科目", "現金", 999));
  KESSAN_ASSERT_RESULT_VALUE(id);

  auto entry = journal.getEntry(id.assumeValue());
  KESSAN_ASSERT_RESULT_VALUE(entry);
  ASSERT_TRUE(entry.assumeValue());
  EXPECT_EQ(entry.assumeValue()->debit_account_id, accountId("雑費"));

  // ids never fall back
  KESSAN_ASSERT_LEDGER_ERROR(
      journal.createEntry(makeDraft(
          "2024-01-07", AccountIdType{100500}, std::string{"現金"}, 999)),
      kValidation);
}

/**
 * @given seeded storage
 * @when malformed drafts are created
 * @then each is rejected with Validation and nothing is stored
 */
TEST_F(SqlJournalStoreTest, RejectsMalformedDrafts) {
  KESSAN_ASSERT_LEDGER_ERROR(
      journal_->createEntry(makeDraft("2024/01/05", "消耗品費", "現金", 1100)),
      kValidation);
  KESSAN_ASSERT_LEDGER_ERROR(
      journal_->createEntry(makeDraft("2024-01-05", "消耗品費", "現金", 0)),
      kValidation);
  KESSAN_ASSERT_LEDGER_ERROR(
      journal_->createEntry(makeDraft("2024-01-05", "現金", "現金", 100)),
      kValidation);

  auto draft = makeDraft("2024-01-05", "消耗品費", "現金", 1100);
  draft.tax_classification = "5%";
  KESSAN_ASSERT_LEDGER_ERROR(journal_->createEntry(draft), kValidation);

  auto page = journal_->listEntries(JournalFilter{});
  KESSAN_ASSERT_RESULT_VALUE(page);
  EXPECT_EQ(page.assumeValue().total, 0u);
}

/**
 * @given a quarter of booked entries
 * @when entries are listed with filters
 * @then only matching entries are returned, newest first
 */
TEST_F(SqlJournalStoreTest, ListEntriesFilters) {
  bookQuarter();

  JournalFilter by_counterparty;
  by_counterparty.counterparty = std::string{"Amaz"};
  auto amazon = journal_->listEntries(by_counterparty);
  KESSAN_ASSERT_RESULT_VALUE(amazon);
  EXPECT_EQ(amazon.assumeValue().total, 2u);
  EXPECT_THAT(amountsOf(amazon.assumeValue().entries), ElementsAre(2200, 1100));

  JournalFilter by_account;
  by_account.account_id = accountId("売掛金");
  auto receivable = journal_->listEntries(by_account);
  KESSAN_ASSERT_RESULT_VALUE(receivable);
  EXPECT_EQ(receivable.assumeValue().total, 2u);

  JournalFilter february;
  february.range.start = Date(2024, 2, 1);
  february.range.end = Date(2024, 2, 29);
  auto in_february = journal_->listEntries(february);
  KESSAN_ASSERT_RESULT_VALUE(in_february);
  EXPECT_THAT(amountsOf(in_february.assumeValue().entries),
              ElementsAre(5500, 55000));
  const auto &view = in_february.assumeValue().entries.front();
  EXPECT_EQ(view.debit_account_name, "通信費");
  EXPECT_EQ(view.credit_account_code, "110");

  JournalFilter by_memo;
  by_memo.memo = std::string{"月分"};
  auto memo = journal_->listEntries(by_memo);
  KESSAN_ASSERT_RESULT_VALUE(memo);
  EXPECT_EQ(memo.assumeValue().total, 2u);
}

/**
 * @given a quarter of booked entries
 * @when entries are listed page by page
 * @then the total stays the same and pages split the newest-first order
 * @and page size is clamped to a sane range
 */
TEST_F(SqlJournalStoreTest, ListEntriesPagination) {
  bookQuarter();

  JournalFilter filter;
  filter.per_page = 2;
  filter.page = 3;
  auto last = journal_->listEntries(filter);
  KESSAN_ASSERT_RESULT_VALUE(last);
  EXPECT_EQ(last.assumeValue().total, 5u);
  EXPECT_THAT(amountsOf(last.assumeValue().entries), ElementsAre(1100));

  filter.page = 0;
  filter.per_page = 0;
  auto clamped = journal_->listEntries(filter);
  KESSAN_ASSERT_RESULT_VALUE(clamped);
  EXPECT_EQ(clamped.assumeValue().page, 1u);
  EXPECT_EQ(clamped.assumeValue().per_page, 1u);
  EXPECT_THAT(amountsOf(clamped.assumeValue().entries), ElementsAre(2200));

  filter.per_page = 1000;
  auto capped = journal_->listEntries(filter);
  KESSAN_ASSERT_RESULT_VALUE(capped);
  EXPECT_EQ(capped.assumeValue().per_page, 100u);
  EXPECT_EQ(capped.assumeValue().entries.size(), 5u);
}

/**
 * @given an inverted date range
 * @when entries are listed or exported
 * @then Validation is reported
 */
TEST_F(SqlJournalStoreTest, InvertedRangeRejected) {
  DateRange range{Date(2024, 3, 1), Date(2024, 2, 1)};
  JournalFilter filter;
  filter.range = range;
  KESSAN_ASSERT_LEDGER_ERROR(journal_->listEntries(filter), kValidation);
  KESSAN_ASSERT_LEDGER_ERROR(journal_->exportEntries(range), kValidation);
  KESSAN_ASSERT_LEDGER_ERROR(journal_->movementTotals(range), kValidation);
}

/**
 * @given a stored entry
 * @when it is updated and then deleted
 * @then the update is visible, the deleted entry is gone
 * @and touching it again reports NotFound
 */
TEST_F(SqlJournalStoreTest, UpdateAndDeleteEntry) {
  auto id = journal_->createEntry(makeDraft("2024-01-05", "消耗品費", "現金", 1100));
  KESSAN_ASSERT_RESULT_VALUE(id);
  auto entry_id = id.assumeValue();

  auto update = makeDraft("2024-01-06", "消耗品費", "普通預金", 2200, "Amazon");
  KESSAN_ASSERT_RESULT_VALUE(journal_->updateEntry(entry_id, update));
  auto updated = journal_->getEntry(entry_id);
  KESSAN_ASSERT_RESULT_VALUE(updated);
  ASSERT_TRUE(updated.assumeValue());
  EXPECT_EQ(updated.assumeValue()->amount, 2200);
  EXPECT_EQ(updated.assumeValue()->tax_amount, 200);
  EXPECT_EQ(updated.assumeValue()->credit_account_id, accountId("普通預金"));

  KESSAN_ASSERT_RESULT_VALUE(journal_->deleteEntry(entry_id));
  auto deleted = journal_->getEntry(entry_id);
  KESSAN_ASSERT_RESULT_VALUE(deleted);
  EXPECT_FALSE(deleted.assumeValue());

  KESSAN_ASSERT_LEDGER_ERROR(journal_->deleteEntry(entry_id), kNotFound);
  KESSAN_ASSERT_LEDGER_ERROR(journal_->updateEntry(entry_id, update),
                             kNotFound);
}

/**
 * @given a stored entry
 * @when it is updated with an invalid draft
 * @then the update is rejected and the entry keeps its values
 */
TEST_F(SqlJournalStoreTest, InvalidUpdateKeepsEntry) {
  auto id = journal_->createEntry(makeDraft("2024-01-05", "消耗品費", "現金", 1100));
  KESSAN_ASSERT_RESULT_VALUE(id);

  KESSAN_ASSERT_LEDGER_ERROR(
      journal_->updateEntry(id.assumeValue(),
                            makeDraft("2024-01-05", "消耗品費", "現金", -5)),
      kValidation);
  auto entry = journal_->getEntry(id.assumeValue());
  KESSAN_ASSERT_RESULT_VALUE(entry);
  ASSERT_TRUE(entry.assumeValue());
  EXPECT_EQ(entry.assumeValue()->amount, 1100);
}

/**
 * @given a quarter of booked entries with one deleted
 * @when the duplicate detection keys are read
 * @then there is a key per live entry
 */
TEST_F(SqlJournalStoreTest, ExistingEntryKeys) {
  auto id = journal_->createEntry(makeDraft("2024-04-01", "雑費", "現金", 100, "X"));
  KESSAN_ASSERT_RESULT_VALUE(id);
  KESSAN_ASSERT_RESULT_VALUE(journal_->deleteEntry(id.assumeValue()));
  bookQuarter();

  auto keys = journal_->existingEntryKeys();
  KESSAN_ASSERT_RESULT_VALUE(keys);
  EXPECT_THAT(keys.assumeValue(),
              UnorderedElementsAre("2024-01-05_1100_Amazon",
                                   "2024-01-20_55000_株式会社A",
                                   "2024-02-10_55000_株式会社A",
                                   "2024-02-28_5500_回線業者",
                                   "2024-03-15_2200_Amazon"));
  EXPECT_EQ(entryKey("2024-01-05", 1100, "Amazon"), "2024-01-05_1100_Amazon");
}

/**
 * @given a quarter of booked entries and one entry without counterparty
 * @when the counterparty history is read
 * @then entries with a counterparty are returned newest first with their
 * debit account
 */
TEST_F(SqlJournalStoreTest, CounterpartyHistory) {
  bookQuarter();
  KESSAN_ASSERT_RESULT_VALUE(
      journal_->createEntry(makeDraft("2024-03-20", "雑費", "現金", 100)));

  auto history = journal_->counterpartyHistory(2);
  KESSAN_ASSERT_RESULT_VALUE(history);
  const auto &items = history.assumeValue();
  ASSERT_EQ(items.size(), 2u);
  EXPECT_EQ(items[0].counterparty, "Amazon");
  EXPECT_EQ(items[0].memo, "トナー");
  EXPECT_EQ(items[0].account_name, "消耗品費");
  EXPECT_EQ(items[1].counterparty, "回線業者");
}

/**
 * @given a quarter of booked entries
 * @when movement totals are read for February
 * @then each account carries its debit and credit sums of that month only
 */
TEST_F(SqlJournalStoreTest, MovementTotals) {
  bookQuarter();

  auto totals = journal_->movementTotals(
      DateRange{Date(2024, 2, 1), Date(2024, 2, 29)});
  KESSAN_ASSERT_RESULT_VALUE(totals);
  const auto &map = totals.assumeValue();
  ASSERT_EQ(map.count(accountId("普通預金")), 1u);
  EXPECT_EQ(map.at(accountId("普通預金")).debit, 55000);
  EXPECT_EQ(map.at(accountId("普通預金")).credit, 5500);
  EXPECT_EQ(map.at(accountId("売掛金")).debit, 0);
  EXPECT_EQ(map.at(accountId("売掛金")).credit, 55000);
  EXPECT_EQ(map.count(accountId("消耗品費")), 0u);

  auto all = journal_->movementTotals(DateRange{});
  KESSAN_ASSERT_RESULT_VALUE(all);
  EXPECT_EQ(all.assumeValue().at(accountId("消耗品費")).debit, 3300);
  EXPECT_EQ(all.assumeValue().at(accountId("現金")).credit, 3300);
}

/**
 * @given a quarter of booked entries
 * @when the entries of an account are read, or all entries exported
 * @then they come in chronological order
 */
TEST_F(SqlJournalStoreTest, AccountEntriesAndExport) {
  bookQuarter();

  auto cash = journal_->accountEntries(accountId("現金"), DateRange{});
  KESSAN_ASSERT_RESULT_VALUE(cash);
  EXPECT_THAT(amountsOf(cash.assumeValue()), ElementsAre(1100, 2200));

  auto exported =
      journal_->exportEntries(DateRange{Date(2024, 1, 15), boost::none});
  KESSAN_ASSERT_RESULT_VALUE(exported);
  EXPECT_THAT(amountsOf(exported.assumeValue()),
              ElementsAre(55000, 55000, 5500, 2200));

  auto recent = journal_->recentEntries(1);
  KESSAN_ASSERT_RESULT_VALUE(recent);
  EXPECT_THAT(amountsOf(recent.assumeValue()), ElementsAre(2200));
}

/**
 * @given entries of one account booked out of date order, two on one day
 * @when the entries of the account are read
 * @then they are ordered by date, and by id within a day
 */
TEST_F(SqlJournalStoreTest, AccountEntriesOfOneDayInIdOrder) {
  auto first = journal_->createEntry(
      makeDraft("2024-04-10", "消耗品費", "現金", 3000));
  auto earlier_day = journal_->createEntry(
      makeDraft("2024-04-09", "現金", "売上高", 500));
  auto second = journal_->createEntry(
      makeDraft("2024-04-10", "現金", "売上高", 700));
  KESSAN_ASSERT_RESULT_VALUE(first);
  KESSAN_ASSERT_RESULT_VALUE(earlier_day);
  KESSAN_ASSERT_RESULT_VALUE(second);
  ASSERT_LT(first.assumeValue(), second.assumeValue());

  auto cash = journal_->accountEntries(accountId("現金"), DateRange{});
  KESSAN_ASSERT_RESULT_VALUE(cash);
  const auto &views = cash.assumeValue();
  EXPECT_THAT(amountsOf(views), ElementsAre(500, 3000, 700));
  ASSERT_EQ(views.size(), 3u);
  EXPECT_EQ(views[1].entry.id, first.assumeValue());
  EXPECT_EQ(views[2].entry.id, second.assumeValue());
}
