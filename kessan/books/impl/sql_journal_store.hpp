/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_SQL_JOURNAL_STORE_HPP
#define KESSAN_SQL_JOURNAL_STORE_HPP

#include "books/journal_store.hpp"

#include <soci/soci.h>
#include "books/impl/sql_db_transaction.hpp"
#include "logger/logger_fwd.hpp"

namespace kessan {
  namespace books {

    class SqlParameters;

    class SqlJournalStore : public JournalStore {
     public:
      /**
       * @param sql - session shared with the other stores
       * @param fallback_account - name of the account that receives legs
       * given by an unknown account name, none to reject such drafts
       * @param log - logger
       */
      SqlJournalStore(soci::session &sql,
                      boost::optional<std::string> fallback_account,
                      logger::LoggerPtr log);

      model::LedgerResult<model::EntryIdType> createEntry(
          const model::JournalEntryDraft &draft) override;

      BatchResult createEntries(
          const std::vector<model::JournalEntryDraft> &drafts) override;

      model::LedgerResult<void> updateEntry(
          model::EntryIdType id,
          const model::JournalEntryDraft &draft) override;

      model::LedgerResult<void> deleteEntry(model::EntryIdType id) override;

      model::LedgerResult<boost::optional<model::JournalEntry>> getEntry(
          model::EntryIdType id) override;

      model::LedgerResult<model::JournalPage> listEntries(
          const model::JournalFilter &filter) override;

      model::LedgerResult<std::vector<model::JournalEntryView>> recentEntries(
          size_t limit) override;

      model::LedgerResult<std::vector<model::JournalEntryView>> exportEntries(
          const model::DateRange &range) override;

      model::LedgerResult<std::unordered_set<std::string>> existingEntryKeys()
          override;

      model::LedgerResult<std::vector<model::CounterpartyHistoryItem>>
      counterpartyHistory(size_t limit) override;

      model::LedgerResult<MovementTotalsMap> movementTotals(
          const model::DateRange &range) override;

      model::LedgerResult<std::vector<model::JournalEntryView>> accountEntries(
          model::AccountIdType account_id,
          const model::DateRange &range) override;

     private:
      /// Validate the draft, resolve both legs and derive the tax amount
      model::LedgerResult<model::JournalEntry> prepareEntry(
          const model::JournalEntryDraft &draft);

      model::LedgerResult<model::AccountIdType> resolveAccount(
          const model::AccountRef &account, const char *leg);

      boost::optional<model::AccountIdType> activeAccountByName(
          const std::string &name);

      std::vector<model::JournalEntryView> fetchViews(
          const std::string &query, SqlParameters &params);

      soci::session &sql_;
      SqlDbTransaction tx_;
      boost::optional<std::string> fallback_account_;
      logger::LoggerPtr log_;
    };

  }  // namespace books
}  // namespace kessan

#endif  // KESSAN_SQL_JOURNAL_STORE_HPP
