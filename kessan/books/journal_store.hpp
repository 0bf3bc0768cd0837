/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_JOURNAL_STORE_HPP
#define KESSAN_JOURNAL_STORE_HPP

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <boost/optional.hpp>
#include "model/date.hpp"
#include "model/journal_entry.hpp"
#include "model/ledger_error.hpp"

namespace kessan {
  namespace books {

    /// One result per submitted draft, in submission order
    using BatchResult = std::vector<model::LedgerResult<model::EntryIdType>>;

    /// Sums of non-deleted amounts per account
    using MovementTotalsMap =
        std::unordered_map<model::AccountIdType, model::MovementTotals>;

    /**
     * Storage of journal entries. Tax amounts are always derived from the
     * amount and the classification; entries are only soft-deleted.
     */
    class JournalStore {
     public:
      virtual ~JournalStore() = default;

      /**
       * Validate and store one entry.
       * @return id of the new entry
       */
      virtual model::LedgerResult<model::EntryIdType> createEntry(
          const model::JournalEntryDraft &draft) = 0;

      /**
       * Store each draft in its own transaction. A failing draft does not
       * affect the others.
       */
      virtual BatchResult createEntries(
          const std::vector<model::JournalEntryDraft> &drafts) = 0;

      virtual model::LedgerResult<void> updateEntry(
          model::EntryIdType id, const model::JournalEntryDraft &draft) = 0;

      virtual model::LedgerResult<void> deleteEntry(model::EntryIdType id) = 0;

      /// @return non-deleted entry with the id, none otherwise
      virtual model::LedgerResult<boost::optional<model::JournalEntry>>
      getEntry(model::EntryIdType id) = 0;

      /// Newest first, paginated
      virtual model::LedgerResult<model::JournalPage> listEntries(
          const model::JournalFilter &filter) = 0;

      virtual model::LedgerResult<std::vector<model::JournalEntryView>>
      recentEntries(size_t limit) = 0;

      /// Entries of the range in chronological order
      virtual model::LedgerResult<std::vector<model::JournalEntryView>>
      exportEntries(const model::DateRange &range) = 0;

      /**
       * @return keys `date_amount_counterparty` of every non-deleted entry,
       * used by importers to skip rows already booked
       */
      virtual model::LedgerResult<std::unordered_set<std::string>>
      existingEntryKeys() = 0;

      /// Most recent counterparty, memo and debit account triples
      virtual model::LedgerResult<std::vector<model::CounterpartyHistoryItem>>
      counterpartyHistory(size_t limit) = 0;

      /// Debit and credit sums per account over the range
      virtual model::LedgerResult<MovementTotalsMap> movementTotals(
          const model::DateRange &range) = 0;

      /**
       * Entries touching the account on either leg, ordered by date, then
       * id.
       */
      virtual model::LedgerResult<std::vector<model::JournalEntryView>>
      accountEntries(model::AccountIdType account_id,
                     const model::DateRange &range) = 0;
    };

    /// Key used for duplicate detection of imported rows
    std::string entryKey(const std::string &date,
                         model::AmountType amount,
                         const std::string &counterparty);

  }  // namespace books
}  // namespace kessan

#endif  // KESSAN_JOURNAL_STORE_HPP
