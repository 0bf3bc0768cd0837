/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "main/backup_json.hpp"

#include <cstdint>
#include <string_view>

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include "model/date.hpp"
#include "model/tax_classification.hpp"

namespace {
  using Writer = rapidjson::PrettyWriter<rapidjson::StringBuffer>;

  void writeString(Writer &writer, const char *key, std::string_view value) {
    writer.Key(key);
    writer.String(value.data(),
                  static_cast<rapidjson::SizeType>(value.size()));
  }

  void writeInt(Writer &writer, const char *key, int64_t value) {
    writer.Key(key);
    writer.Int64(value);
  }

  void writeAccounts(Writer &writer,
                     const std::vector<kessan::model::Account> &accounts) {
    writer.Key("accounts_master");
    writer.StartArray();
    for (const auto &account : accounts) {
      writer.StartObject();
      writeInt(writer, "id", account.id);
      writeString(writer, "code", account.code);
      writeString(writer, "name", account.name);
      writeString(writer,
                  "account_type",
                  kessan::model::categoryName(account.category));
      writeString(writer,
                  "tax_default",
                  kessan::model::classificationLabel(account.tax_default));
      writeInt(writer, "is_active", account.is_active ? 1 : 0);
      writeInt(writer, "display_order", account.display_order);
      writer.EndObject();
    }
    writer.EndArray();
  }

  void writeEntries(Writer &writer,
                    const std::vector<kessan::model::JournalEntry> &entries) {
    writer.Key("journal_entries");
    writer.StartArray();
    for (const auto &entry : entries) {
      writer.StartObject();
      writeInt(writer, "id", entry.id);
      writeString(
          writer, "entry_date", kessan::model::toIsoString(entry.entry_date));
      writeInt(writer, "debit_account_id", entry.debit_account_id);
      writeInt(writer, "credit_account_id", entry.credit_account_id);
      writeInt(writer, "amount", entry.amount);
      writeString(
          writer,
          "tax_classification",
          kessan::model::classificationLabel(entry.tax_classification));
      writeInt(writer, "tax_amount", entry.tax_amount);
      writeString(writer, "counterparty", entry.counterparty);
      writeString(writer, "memo", entry.memo);
      writeString(writer, "evidence_url", entry.evidence_url);
      writeString(writer, "source", entry.source);
      writeInt(writer, "is_deleted", entry.is_deleted ? 1 : 0);
      writer.EndObject();
    }
    writer.EndArray();
  }

  void writeOpeningBalances(
      Writer &writer,
      const std::vector<kessan::model::YearOpeningBalance> &balances) {
    writer.Key("opening_balances");
    writer.StartArray();
    for (const auto &balance : balances) {
      writer.StartObject();
      writeInt(writer, "fiscal_year", balance.fiscal_year);
      writeInt(writer, "account_id", balance.balance.account_id);
      writeInt(writer, "amount", balance.balance.amount);
      writeString(writer, "note", balance.balance.note);
      writer.EndObject();
    }
    writer.EndArray();
  }

  void writeCounterparties(
      Writer &writer,
      const std::vector<kessan::model::Counterparty> &counterparties) {
    writer.Key("counterparties");
    writer.StartArray();
    for (const auto &counterparty : counterparties) {
      writer.StartObject();
      writeInt(writer, "id", counterparty.id);
      writeString(writer, "name", counterparty.name);
      writeString(writer, "code", counterparty.code);
      writeString(writer, "contact_info", counterparty.contact_info);
      writeString(writer, "notes", counterparty.notes);
      writeInt(writer, "is_active", counterparty.is_active ? 1 : 0);
      writer.EndObject();
    }
    writer.EndArray();
  }
}  // namespace

namespace kessan {
  namespace main {

    std::string backupToJson(const model::BooksBackup &backup) {
      rapidjson::StringBuffer buffer;
      Writer writer(buffer);
      writer.StartObject();
      writeAccounts(writer, backup.accounts);
      writeEntries(writer, backup.journal_entries);
      writeOpeningBalances(writer, backup.opening_balances);
      writeCounterparties(writer, backup.counterparties);
      writer.EndObject();
      return buffer.GetString();
    }

  }  // namespace main
}  // namespace kessan
