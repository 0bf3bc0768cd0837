/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "books/impl/sql_journal_store.hpp"

#include <algorithm>

#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>
#include "books/impl/sql_utils.hpp"
#include "books/impl/transaction_scope.hpp"
#include "common/result_try.hpp"
#include "common/visitor.hpp"
#include "logger/logger.hpp"
#include "tax/tax_calculator.hpp"

namespace {
  using kessan::books::SqlBigint;

  const std::string kSelectViews = R"(
SELECT je.id, je.entry_date, je.debit_account_id, je.credit_account_id,
       je.amount, je.tax_classification, je.tax_amount, je.counterparty,
       je.memo, je.evidence_url, je.source,
       da.name, da.code, ca.name, ca.code
FROM journal_entries je
JOIN accounts_master da ON da.id = je.debit_account_id
JOIN accounts_master ca ON ca.id = je.credit_account_id
)";

  /// Output buffer of kSelectViews
  struct EntryViewRow {
    SqlBigint id{};
    std::string entry_date;
    SqlBigint debit_account_id{};
    SqlBigint credit_account_id{};
    SqlBigint amount{};
    std::string tax_classification;
    SqlBigint tax_amount{};
    std::string counterparty;
    std::string memo;
    std::string evidence_url;
    std::string source;
    std::string debit_name;
    std::string debit_code;
    std::string credit_name;
    std::string credit_code;

    void exchangeInto(soci::statement &statement) {
      statement.exchange(soci::into(id));
      statement.exchange(soci::into(entry_date));
      statement.exchange(soci::into(debit_account_id));
      statement.exchange(soci::into(credit_account_id));
      statement.exchange(soci::into(amount));
      statement.exchange(soci::into(tax_classification));
      statement.exchange(soci::into(tax_amount));
      statement.exchange(soci::into(counterparty));
      statement.exchange(soci::into(memo));
      statement.exchange(soci::into(evidence_url));
      statement.exchange(soci::into(source));
      statement.exchange(soci::into(debit_name));
      statement.exchange(soci::into(debit_code));
      statement.exchange(soci::into(credit_name));
      statement.exchange(soci::into(credit_code));
    }

    kessan::model::JournalEntryView toView() const {
      kessan::model::JournalEntryView view;
      auto &entry = view.entry;
      entry.id = id;
      entry.entry_date = kessan::books::storedDate(entry_date);
      entry.debit_account_id = debit_account_id;
      entry.credit_account_id = credit_account_id;
      entry.amount = amount;
      entry.tax_classification =
          kessan::books::storedClassification(tax_classification);
      entry.tax_amount = tax_amount;
      entry.counterparty = counterparty;
      entry.memo = memo;
      entry.evidence_url = evidence_url;
      entry.source = source;
      view.debit_account_name = debit_name;
      view.debit_account_code = debit_code;
      view.credit_account_name = credit_name;
      view.credit_account_code = credit_code;
      return view;
    }
  };

  void addRangeConditions(const kessan::model::DateRange &range,
                          const std::string &column,
                          std::vector<std::string> &conditions,
                          kessan::books::SqlParameters &params) {
    if (range.start) {
      conditions.push_back(column + " >= :start_date");
      params.text("start_date", kessan::model::toIsoString(*range.start));
    }
    if (range.end) {
      conditions.push_back(column + " <= :end_date");
      params.text("end_date", kessan::model::toIsoString(*range.end));
    }
  }

  constexpr size_t kMaxPerPage = 100;
}  // namespace

namespace kessan {
  namespace books {

    using model::LedgerError;
    using model::makeLedgerError;

    std::string entryKey(const std::string &date,
                         model::AmountType amount,
                         const std::string &counterparty) {
      return fmt::format("{}_{}_{}", date, amount, counterparty);
    }

    SqlJournalStore::SqlJournalStore(
        soci::session &sql,
        boost::optional<std::string> fallback_account,
        logger::LoggerPtr log)
        : sql_(sql),
          tx_(sql),
          fallback_account_(std::move(fallback_account)),
          log_(std::move(log)) {}

    boost::optional<model::AccountIdType> SqlJournalStore::activeAccountByName(
        const std::string &name) {
      SqlBigint id = 0;
      soci::indicator ind = soci::i_null;
      sql_ << "SELECT id FROM accounts_master "
              "WHERE name = :name AND is_active = 1",
          soci::use(name, "name"), soci::into(id, ind);
      if (not sql_.got_data() or ind != soci::i_ok) {
        return boost::none;
      }
      return model::AccountIdType{id};
    }

    model::LedgerResult<model::AccountIdType> SqlJournalStore::resolveAccount(
        const model::AccountRef &account, const char *leg) {
      return visit_in_place(
          account,
          [&](model::AccountIdType id)
              -> model::LedgerResult<model::AccountIdType> {
            SqlBigint account_id = id;
            int found = 0;
            sql_ << "SELECT COUNT(*) FROM accounts_master "
                    "WHERE id = :id AND is_active = 1",
                soci::use(account_id, "id"), soci::into(found);
            if (found == 0) {
              return makeLedgerError(
                  LedgerError::Kind::kValidation,
                  fmt::format("{} account id {} is unknown", leg, id));
            }
            return expected::makeValue(id);
          },
          [&](const std::string &name)
              -> model::LedgerResult<model::AccountIdType> {
            auto trimmed = boost::algorithm::trim_copy(name);
            if (auto id = activeAccountByName(trimmed)) {
              return expected::makeValue(*id);
            }
            if (fallback_account_) {
              if (auto id = activeAccountByName(*fallback_account_)) {
                log_->debug("{} account '{}' is unknown, booking to {}",
                            leg,
                            trimmed,
                            *fallback_account_);
                return expected::makeValue(*id);
              }
            }
            return makeLedgerError(
                LedgerError::Kind::kValidation,
                fmt::format("{} account '{}' is unknown", leg, trimmed));
          });
    }

    model::LedgerResult<model::JournalEntry> SqlJournalStore::prepareEntry(
        const model::JournalEntryDraft &draft) {
      KESSAN_EXPECTED_TRY_GET_VALUE(date, model::parseDate(draft.entry_date));
      if (draft.amount <= 0) {
        return makeLedgerError(
            LedgerError::Kind::kValidation,
            fmt::format("amount must be positive, got {}", draft.amount));
      }
      auto classification =
          model::classificationFromString(draft.tax_classification);
      if (not classification) {
        return makeLedgerError(LedgerError::Kind::kValidation,
                               fmt::format("unknown tax classification '{}'",
                                           draft.tax_classification));
      }
      KESSAN_EXPECTED_TRY_GET_VALUE(
          debit_id, resolveAccount(draft.debit_account, "debit"));
      KESSAN_EXPECTED_TRY_GET_VALUE(
          credit_id, resolveAccount(draft.credit_account, "credit"));
      if (debit_id == credit_id) {
        return makeLedgerError(
            LedgerError::Kind::kValidation,
            fmt::format("debit and credit are the same account {}", debit_id));
      }

      model::JournalEntry entry;
      entry.entry_date = date;
      entry.debit_account_id = debit_id;
      entry.credit_account_id = credit_id;
      entry.amount = draft.amount;
      entry.tax_classification = *classification;
      entry.tax_amount = tax::calculateTaxAmount(draft.amount, *classification);
      entry.counterparty = draft.counterparty;
      entry.memo = draft.memo;
      entry.evidence_url = draft.evidence_url;
      entry.source = draft.source;
      return expected::makeValue(std::move(entry));
    }

    model::LedgerResult<model::EntryIdType> SqlJournalStore::createEntry(
        const model::JournalEntryDraft &draft) {
      return inTransaction(
          tx_,
          log_,
          "createEntry",
          [&]() -> model::LedgerResult<model::EntryIdType> {
            KESSAN_EXPECTED_TRY_GET_VALUE(entry, prepareEntry(draft));
            auto entry_date = model::toIsoString(entry.entry_date);
            SqlBigint debit_id = entry.debit_account_id;
            SqlBigint credit_id = entry.credit_account_id;
            SqlBigint amount = entry.amount;
            std::string tax_label{
                model::classificationLabel(entry.tax_classification)};
            SqlBigint tax_amount = entry.tax_amount;
            SqlBigint id = 0;
            sql_ << "INSERT INTO journal_entries (entry_date, "
                    "debit_account_id, credit_account_id, amount, "
                    "tax_classification, tax_amount, counterparty, memo, "
                    "evidence_url, source) VALUES (:entry_date, :debit, "
                    ":credit, :amount, :tax_classification, :tax_amount, "
                    ":counterparty, :memo, :evidence_url, :source) "
                    "RETURNING id",
                soci::use(entry_date, "entry_date"),
                soci::use(debit_id, "debit"), soci::use(credit_id, "credit"),
                soci::use(amount, "amount"),
                soci::use(tax_label, "tax_classification"),
                soci::use(tax_amount, "tax_amount"),
                soci::use(entry.counterparty, "counterparty"),
                soci::use(entry.memo, "memo"),
                soci::use(entry.evidence_url, "evidence_url"),
                soci::use(entry.source, "source"), soci::into(id);
            log_->debug("created journal entry {} on {} for {}",
                        id,
                        entry_date,
                        entry.amount);
            return expected::makeValue(model::EntryIdType{id});
          });
    }

    BatchResult SqlJournalStore::createEntries(
        const std::vector<model::JournalEntryDraft> &drafts) {
      BatchResult results;
      results.reserve(drafts.size());
      for (size_t i = 0; i < drafts.size(); ++i) {
        auto result = createEntry(drafts[i]);
        if (auto error = expected::resultToOptionalError(result)) {
          log_->warn("batch item {} rejected: {}", i, *error);
        }
        results.push_back(std::move(result));
      }
      return results;
    }

    model::LedgerResult<void> SqlJournalStore::updateEntry(
        model::EntryIdType id, const model::JournalEntryDraft &draft) {
      return inTransaction(
          tx_, log_, "updateEntry", [&]() -> model::LedgerResult<void> {
            SqlBigint entry_id = id;
            int found = 0;
            sql_ << "SELECT COUNT(*) FROM journal_entries "
                    "WHERE id = :id AND is_deleted = 0",
                soci::use(entry_id, "id"), soci::into(found);
            if (found == 0) {
              return makeLedgerError(
                  LedgerError::Kind::kNotFound,
                  fmt::format("journal entry {} not found", id));
            }

            KESSAN_EXPECTED_TRY_GET_VALUE(entry, prepareEntry(draft));
            auto entry_date = model::toIsoString(entry.entry_date);
            SqlBigint debit_id = entry.debit_account_id;
            SqlBigint credit_id = entry.credit_account_id;
            SqlBigint amount = entry.amount;
            std::string tax_label{
                model::classificationLabel(entry.tax_classification)};
            SqlBigint tax_amount = entry.tax_amount;
            sql_ << "UPDATE journal_entries SET entry_date = :entry_date, "
                    "debit_account_id = :debit, credit_account_id = :credit, "
                    "amount = :amount, tax_classification = "
                    ":tax_classification, tax_amount = :tax_amount, "
                    "counterparty = :counterparty, memo = :memo, "
                    "evidence_url = :evidence_url, source = :source "
                    "WHERE id = :id",
                soci::use(entry_date, "entry_date"),
                soci::use(debit_id, "debit"), soci::use(credit_id, "credit"),
                soci::use(amount, "amount"),
                soci::use(tax_label, "tax_classification"),
                soci::use(tax_amount, "tax_amount"),
                soci::use(entry.counterparty, "counterparty"),
                soci::use(entry.memo, "memo"),
                soci::use(entry.evidence_url, "evidence_url"),
                soci::use(entry.source, "source"), soci::use(entry_id, "id");
            log_->debug("updated journal entry {}", id);
            return expected::makeValue();
          });
    }

    model::LedgerResult<void> SqlJournalStore::deleteEntry(
        model::EntryIdType id) {
      return inTransaction(
          tx_, log_, "deleteEntry", [&]() -> model::LedgerResult<void> {
            SqlBigint entry_id = id;
            int found = 0;
            sql_ << "SELECT COUNT(*) FROM journal_entries "
                    "WHERE id = :id AND is_deleted = 0",
                soci::use(entry_id, "id"), soci::into(found);
            if (found == 0) {
              return makeLedgerError(
                  LedgerError::Kind::kNotFound,
                  fmt::format("journal entry {} not found", id));
            }
            sql_ << "UPDATE journal_entries SET is_deleted = 1 WHERE id = :id",
                soci::use(entry_id, "id");
            log_->debug("deleted journal entry {}", id);
            return expected::makeValue();
          });
    }

    std::vector<model::JournalEntryView> SqlJournalStore::fetchViews(
        const std::string &query, SqlParameters &params) {
      EntryViewRow row;
      soci::statement statement(sql_);
      row.exchangeInto(statement);
      params.exchangeInto(statement);
      executeStatement(statement, query);

      std::vector<model::JournalEntryView> views;
      while (statement.fetch()) {
        views.push_back(row.toView());
      }
      return views;
    }

    model::LedgerResult<boost::optional<model::JournalEntry>>
    SqlJournalStore::getEntry(model::EntryIdType id) {
      return guardedQuery(
          log_,
          "getEntry",
          [&]() -> model::LedgerResult<boost::optional<model::JournalEntry>> {
            SqlParameters params;
            params.number("id", id);
            auto views = fetchViews(
                kSelectViews + "WHERE je.id = :id AND je.is_deleted = 0",
                params);
            if (views.empty()) {
              return expected::makeValue(
                  boost::optional<model::JournalEntry>{});
            }
            return expected::makeValue(
                boost::make_optional(std::move(views.front().entry)));
          });
    }

    model::LedgerResult<model::JournalPage> SqlJournalStore::listEntries(
        const model::JournalFilter &filter) {
      KESSAN_EXPECTED_ERROR_CHECK(model::validateRange(filter.range));
      return guardedQuery(
          log_, "listEntries", [&]() -> model::LedgerResult<model::JournalPage> {
            std::vector<std::string> conditions{"je.is_deleted = 0"};
            SqlParameters params;
            addRangeConditions(filter.range, "je.entry_date", conditions, params);
            if (filter.account_id) {
              conditions.emplace_back(
                  "(je.debit_account_id = :account_id "
                  "OR je.credit_account_id = :account_id)");
              params.number("account_id", *filter.account_id);
            }
            if (filter.counterparty and not filter.counterparty->empty()) {
              conditions.emplace_back("je.counterparty LIKE :counterparty");
              params.text("counterparty", "%" + *filter.counterparty + "%");
            }
            if (filter.memo and not filter.memo->empty()) {
              conditions.emplace_back("je.memo LIKE :memo");
              params.text("memo", "%" + *filter.memo + "%");
            }
            auto where = whereClause(conditions);

            model::JournalPage page;
            page.page = std::max<size_t>(filter.page, 1);
            page.per_page = std::clamp<size_t>(filter.per_page, 1, kMaxPerPage);

            SqlBigint total = 0;
            {
              soci::statement statement(sql_);
              statement.exchange(soci::into(total));
              params.exchangeInto(statement);
              executeStatement(statement,
                               "SELECT COUNT(*) FROM journal_entries je "
                                   + where);
              statement.fetch();
            }
            page.total = static_cast<size_t>(total);

            page.entries = fetchViews(
                fmt::format("{}{} ORDER BY je.entry_date DESC, je.id DESC "
                            "LIMIT {} OFFSET {}",
                            kSelectViews,
                            where,
                            page.per_page,
                            (page.page - 1) * page.per_page),
                params);
            return expected::makeValue(std::move(page));
          });
    }

    model::LedgerResult<std::vector<model::JournalEntryView>>
    SqlJournalStore::recentEntries(size_t limit) {
      return guardedQuery(
          log_,
          "recentEntries",
          [&]() -> model::LedgerResult<std::vector<model::JournalEntryView>> {
            SqlParameters params;
            return expected::makeValue(fetchViews(
                fmt::format("{}WHERE je.is_deleted = 0 "
                            "ORDER BY je.id DESC LIMIT {}",
                            kSelectViews,
                            limit),
                params));
          });
    }

    model::LedgerResult<std::vector<model::JournalEntryView>>
    SqlJournalStore::exportEntries(const model::DateRange &range) {
      KESSAN_EXPECTED_ERROR_CHECK(model::validateRange(range));
      return guardedQuery(
          log_,
          "exportEntries",
          [&]() -> model::LedgerResult<std::vector<model::JournalEntryView>> {
            std::vector<std::string> conditions{"je.is_deleted = 0"};
            SqlParameters params;
            addRangeConditions(range, "je.entry_date", conditions, params);
            return expected::makeValue(
                fetchViews(kSelectViews + whereClause(conditions)
                               + " ORDER BY je.entry_date, je.id",
                           params));
          });
    }

    model::LedgerResult<std::unordered_set<std::string>>
    SqlJournalStore::existingEntryKeys() {
      return guardedQuery(
          log_,
          "existingEntryKeys",
          [&]() -> model::LedgerResult<std::unordered_set<std::string>> {
            std::string date;
            SqlBigint amount = 0;
            std::string counterparty;
            soci::statement statement =
                (sql_.prepare << "SELECT entry_date, amount, counterparty "
                                 "FROM journal_entries WHERE is_deleted = 0",
                 soci::into(date),
                 soci::into(amount),
                 soci::into(counterparty));
            statement.execute();

            std::unordered_set<std::string> keys;
            while (statement.fetch()) {
              keys.insert(entryKey(date, amount, counterparty));
            }
            return expected::makeValue(std::move(keys));
          });
    }

    model::LedgerResult<std::vector<model::CounterpartyHistoryItem>>
    SqlJournalStore::counterpartyHistory(size_t limit) {
      return guardedQuery(
          log_,
          "counterpartyHistory",
          [&]()
              -> model::LedgerResult<std::vector<model::CounterpartyHistoryItem>> {
            model::CounterpartyHistoryItem item;
            soci::statement statement =
                (sql_.prepare << fmt::format(
                     "SELECT je.counterparty, je.memo, da.name "
                     "FROM journal_entries je "
                     "JOIN accounts_master da ON da.id = je.debit_account_id "
                     "WHERE je.is_deleted = 0 AND je.counterparty <> '' "
                     "ORDER BY je.id DESC LIMIT {}",
                     limit),
                 soci::into(item.counterparty),
                 soci::into(item.memo),
                 soci::into(item.account_name));
            statement.execute();

            std::vector<model::CounterpartyHistoryItem> history;
            while (statement.fetch()) {
              history.push_back(item);
            }
            return expected::makeValue(std::move(history));
          });
    }

    model::LedgerResult<MovementTotalsMap> SqlJournalStore::movementTotals(
        const model::DateRange &range) {
      KESSAN_EXPECTED_ERROR_CHECK(model::validateRange(range));
      return guardedQuery(
          log_, "movementTotals", [&]() -> model::LedgerResult<MovementTotalsMap> {
            std::vector<std::string> conditions{"is_deleted = 0"};
            SqlParameters params;
            addRangeConditions(range, "entry_date", conditions, params);
            auto where = whereClause(conditions);

            MovementTotalsMap totals;
            auto sum_by = [&](const char *column, auto &&accumulate) {
              SqlBigint account_id = 0;
              SqlBigint sum = 0;
              soci::statement statement(sql_);
              statement.exchange(soci::into(account_id));
              statement.exchange(soci::into(sum));
              params.exchangeInto(statement);
              executeStatement(
                  statement,
                  fmt::format("SELECT {0}, COALESCE(SUM(amount), 0) "
                              "FROM journal_entries {1} GROUP BY {0}",
                              column,
                              where));
              while (statement.fetch()) {
                accumulate(totals[account_id], sum);
              }
            };
            sum_by("debit_account_id",
                   [](model::MovementTotals &t, SqlBigint sum) { t.debit = sum; });
            sum_by("credit_account_id", [](model::MovementTotals &t, SqlBigint sum) {
              t.credit = sum;
            });
            return expected::makeValue(std::move(totals));
          });
    }

    model::LedgerResult<std::vector<model::JournalEntryView>>
    SqlJournalStore::accountEntries(model::AccountIdType account_id,
                                    const model::DateRange &range) {
      KESSAN_EXPECTED_ERROR_CHECK(model::validateRange(range));
      return guardedQuery(
          log_,
          "accountEntries",
          [&]() -> model::LedgerResult<std::vector<model::JournalEntryView>> {
            std::vector<std::string> conditions{
                "je.is_deleted = 0",
                "(je.debit_account_id = :account_id "
                "OR je.credit_account_id = :account_id)"};
            SqlParameters params;
            params.number("account_id", account_id);
            addRangeConditions(range, "je.entry_date", conditions, params);
            return expected::makeValue(
                fetchViews(kSelectViews + whereClause(conditions)
                               + " ORDER BY je.entry_date, je.id",
                           params));
          });
    }

  }  // namespace books
}  // namespace kessan
