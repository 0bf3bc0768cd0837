/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_MODEL_JOURNAL_ENTRY_HPP
#define KESSAN_MODEL_JOURNAL_ENTRY_HPP

#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include "model/date.hpp"
#include "model/tax_classification.hpp"
#include "model/types.hpp"

namespace kessan {
  namespace model {

    /// Provenance tag of entries typed in by the user
    extern const char *kManualSource;

    /// A stored double-entry transaction, one debit leg and one credit leg
    struct JournalEntry {
      EntryIdType id{};
      Date entry_date;
      AccountIdType debit_account_id{};
      AccountIdType credit_account_id{};
      /// tax-inclusive
      AmountType amount{};
      TaxClassification tax_classification{TaxClassification::kStandard10};
      /// always derived from amount and tax_classification
      AmountType tax_amount{};
      std::string counterparty;
      std::string memo;
      std::string evidence_url;
      std::string source;
      bool is_deleted{false};
    };

    /// Account given either by id or by name
    using AccountRef = boost::variant<AccountIdType, std::string>;

    /**
     * Entry as supplied by a caller or by a document/statement importer.
     * Fields are not validated yet; tax amount is never accepted from the
     * outside.
     */
    struct JournalEntryDraft {
      std::string entry_date;
      AccountRef debit_account;
      AccountRef credit_account;
      AmountType amount{};
      std::string tax_classification{"10%"};
      std::string counterparty;
      std::string memo;
      std::string evidence_url;
      std::string source{kManualSource};
    };

    /// Entry joined with the names and codes of both legs
    struct JournalEntryView {
      JournalEntry entry;
      std::string debit_account_name;
      std::string debit_account_code;
      std::string credit_account_name;
      std::string credit_account_code;
    };

    struct JournalFilter {
      DateRange range;
      /// matches either leg
      boost::optional<AccountIdType> account_id;
      /// substring match
      boost::optional<std::string> counterparty;
      /// substring match
      boost::optional<std::string> memo;
      size_t page{1};
      size_t per_page{20};
    };

    struct JournalPage {
      std::vector<JournalEntryView> entries;
      size_t total{};
      size_t page{};
      size_t per_page{};
    };

    /// Sums of amounts posted to one account
    struct MovementTotals {
      AmountType debit{};
      AmountType credit{};
    };

    /// Recent classification decision, context for the recognition service
    struct CounterpartyHistoryItem {
      std::string counterparty;
      std::string memo;
      std::string account_name;
    };

  }  // namespace model
}  // namespace kessan

#endif  // KESSAN_MODEL_JOURNAL_ENTRY_HPP
