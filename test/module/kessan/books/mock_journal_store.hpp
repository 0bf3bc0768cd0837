/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_MOCK_JOURNAL_STORE_HPP
#define KESSAN_MOCK_JOURNAL_STORE_HPP

#include <gmock/gmock.h>

#include "books/journal_store.hpp"

namespace kessan {
  namespace books {

    class MockJournalStore : public JournalStore {
     public:
      MOCK_METHOD1(createEntry,
                   model::LedgerResult<model::EntryIdType>(
                       const model::JournalEntryDraft &));
      MOCK_METHOD1(createEntries,
                   BatchResult(const std::vector<model::JournalEntryDraft> &));
      MOCK_METHOD2(updateEntry,
                   model::LedgerResult<void>(model::EntryIdType,
                                             const model::JournalEntryDraft &));
      MOCK_METHOD1(deleteEntry, model::LedgerResult<void>(model::EntryIdType));
      MOCK_METHOD1(getEntry,
                   model::LedgerResult<boost::optional<model::JournalEntry>>(
                       model::EntryIdType));
      MOCK_METHOD1(listEntries,
                   model::LedgerResult<model::JournalPage>(
                       const model::JournalFilter &));
      MOCK_METHOD1(
          recentEntries,
          model::LedgerResult<std::vector<model::JournalEntryView>>(size_t));
      MOCK_METHOD1(exportEntries,
                   model::LedgerResult<std::vector<model::JournalEntryView>>(
                       const model::DateRange &));
      MOCK_METHOD0(existingEntryKeys,
                   model::LedgerResult<std::unordered_set<std::string>>());
      MOCK_METHOD1(
          counterpartyHistory,
          model::LedgerResult<std::vector<model::CounterpartyHistoryItem>>(
              size_t));
      MOCK_METHOD1(movementTotals,
                   model::LedgerResult<MovementTotalsMap>(
                       const model::DateRange &));
      MOCK_METHOD2(accountEntries,
                   model::LedgerResult<std::vector<model::JournalEntryView>>(
                       model::AccountIdType, const model::DateRange &));
    };

  }  // namespace books
}  // namespace kessan

#endif  // KESSAN_MOCK_JOURNAL_STORE_HPP
