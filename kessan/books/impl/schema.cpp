/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "books/impl/schema.hpp"

#include <string>

#include <soci/soci.h>

namespace {
  // The two dialects differ only in the surrogate key declaration.
  std::string tablesSql(const std::string &serial_key) {
    return R"(
CREATE TABLE IF NOT EXISTS accounts_master (
    id              )"
        + serial_key + R"(,
    code            TEXT NOT NULL UNIQUE,
    name            TEXT NOT NULL UNIQUE,
    account_type    TEXT NOT NULL,
    tax_default     TEXT NOT NULL DEFAULT '10%',
    is_active       INTEGER NOT NULL DEFAULT 1,
    display_order   INTEGER NOT NULL DEFAULT 0
);
CREATE TABLE IF NOT EXISTS journal_entries (
    id                  )"
        + serial_key + R"(,
    entry_date          TEXT NOT NULL,
    debit_account_id    BIGINT NOT NULL REFERENCES accounts_master(id),
    credit_account_id   BIGINT NOT NULL REFERENCES accounts_master(id),
    amount              BIGINT NOT NULL,
    tax_classification  TEXT NOT NULL DEFAULT '10%',
    tax_amount          BIGINT NOT NULL DEFAULT 0,
    counterparty        TEXT NOT NULL DEFAULT '',
    memo                TEXT NOT NULL DEFAULT '',
    evidence_url        TEXT NOT NULL DEFAULT '',
    source              TEXT NOT NULL DEFAULT 'manual',
    is_deleted          INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_journal_entry_date ON journal_entries(entry_date);
CREATE INDEX IF NOT EXISTS idx_journal_debit ON journal_entries(debit_account_id);
CREATE INDEX IF NOT EXISTS idx_journal_credit ON journal_entries(credit_account_id);
CREATE TABLE IF NOT EXISTS opening_balances (
    id          )"
        + serial_key + R"(,
    fiscal_year INTEGER NOT NULL,
    account_id  BIGINT NOT NULL REFERENCES accounts_master(id),
    amount      BIGINT NOT NULL DEFAULT 0,
    note        TEXT NOT NULL DEFAULT '',
    UNIQUE (fiscal_year, account_id)
);
CREATE TABLE IF NOT EXISTS counterparties (
    id              )"
        + serial_key + R"(,
    name            TEXT NOT NULL,
    code            TEXT NOT NULL DEFAULT '',
    contact_info    TEXT NOT NULL DEFAULT '',
    notes           TEXT NOT NULL DEFAULT '',
    is_active       INTEGER NOT NULL DEFAULT 1
);
CREATE INDEX IF NOT EXISTS idx_counterparties_name ON counterparties(name);
CREATE TABLE IF NOT EXISTS fixed_assets (
    id                  )"
        + serial_key + R"(,
    name                TEXT NOT NULL,
    acquisition_date    TEXT NOT NULL,
    useful_life         INTEGER NOT NULL,
    acquisition_cost    BIGINT NOT NULL,
    method              TEXT NOT NULL DEFAULT 'straight_line',
    notes               TEXT NOT NULL DEFAULT '',
    disposal_type       TEXT,
    disposal_date       TEXT,
    disposal_price      BIGINT,
    is_deleted          INTEGER NOT NULL DEFAULT 0
);
)";
  }
}  // namespace

namespace kessan {
  namespace books {

    bool isPostgres(soci::session &sql) {
      return sql.get_backend_name() == "postgresql";
    }

    void prepareTables(soci::session &sql) {
      if (isPostgres(sql)) {
        sql << tablesSql("BIGSERIAL PRIMARY KEY");
        return;
      }
      // sqlite3_prepare compiles only the first statement of a batch
      const auto script = tablesSql("INTEGER PRIMARY KEY AUTOINCREMENT");
      std::string::size_type begin = 0;
      while (true) {
        auto end = script.find(';', begin);
        if (end == std::string::npos) {
          break;
        }
        sql << script.substr(begin, end - begin);
        begin = end + 1;
      }
    }

  }  // namespace books
}  // namespace kessan
