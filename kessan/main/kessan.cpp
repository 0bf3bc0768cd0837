/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gflags/gflags.h>

#include <cstdlib>
#include <iostream>

#include <fmt/format.h>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "books/impl/sql_account_registry.hpp"
#include "books/impl/sql_backup_exporter.hpp"
#include "books/impl/sql_db_transaction.hpp"
#include "books/impl/sql_fixed_asset_register.hpp"
#include "books/impl/sql_journal_store.hpp"
#include "books/impl/sql_opening_balance_store.hpp"
#include "common/result.hpp"
#include "depreciation/depreciation_scheduler.hpp"
#include "logger/logger.hpp"
#include "logger/logger_manager.hpp"
#include "main/backup_json.hpp"
#include "main/impl/db_connection_init.hpp"
#include "main/kessan_conf_literals.hpp"
#include "main/kessan_conf_loader.hpp"
#include "model/account.hpp"
#include "model/fixed_asset.hpp"
#include "model/tax_classification.hpp"
#include "reports/balance_calculator.hpp"

static const std::string kLogSettingsFromConfigFile = "config_file";

static const std::string kReportTrialBalance = "trial_balance";
static const std::string kReportLedger = "ledger";
static const std::string kReportDepreciation = "depreciation";
static const std::string kReportSchedule = "schedule";
static const std::string kReportAccounts = "accounts";
static const std::string kReportBackup = "backup";

/**
 * Creating input argument for the configuration file location.
 */
DEFINE_string(config,
              "",
              "Specify the configuration file path. Without it the settings "
              "are read from KESSAN_* environment variables.");

static bool validateReport(const char *flagname, const std::string &val) {
  for (const auto &report : {kReportTrialBalance,
                             kReportLedger,
                             kReportDepreciation,
                             kReportSchedule,
                             kReportAccounts,
                             kReportBackup}) {
    if (val == report) {
      return true;
    }
  }
  std::cerr << "Invalid value for " << flagname << ": should be one of '"
            << kReportTrialBalance << "', '" << kReportLedger << "', '"
            << kReportDepreciation << "', '" << kReportSchedule << "', '"
            << kReportAccounts << "', '" << kReportBackup << "'."
            << std::endl;
  return false;
}

DEFINE_string(report, kReportTrialBalance, "Report to print");
DEFINE_validator(report, &validateReport);

DEFINE_int32(fiscal_year,
             0,
             "Fiscal year of the trial balance or the depreciation report, "
             "the current year by default");
DEFINE_string(start_date, "", "First day of the reporting window, YYYY-MM-DD");
DEFINE_string(end_date, "", "Last day of the reporting window, YYYY-MM-DD");
DEFINE_int64(account_id, 0, "Account of the general ledger");
DEFINE_int64(asset_id, 0, "Fixed asset of the whole-life schedule");

static bool validateVerbosity(const char *flagname, const std::string &val) {
  if (val == kLogSettingsFromConfigFile) {
    return true;
  }
  const auto it = config_members::LogLevels.find(val);
  if (it == config_members::LogLevels.end()) {
    std::cerr << "Invalid value for " << flagname << ": should be one of '"
              << kLogSettingsFromConfigFile;
    for (const auto &level : config_members::LogLevels) {
      std::cerr << "', '" << level.first;
    }
    std::cerr << "'." << std::endl;
    return false;
  }
  return true;
}

/// Verbosity flag for spdlog configuration
DEFINE_string(verbosity, kLogSettingsFromConfigFile, "Log verbosity");
DEFINE_validator(verbosity, &validateVerbosity);

logger::LoggerManagerTreePtr getDefaultLogManager() {
  return std::make_shared<logger::LoggerManagerTree>(
      logger::LoggerConfig{logger::LogLevel::kInfo, logger::LogPatterns{}});
}

namespace {
  using kessan::model::LedgerResult;

  LedgerResult<kessan::model::DateRange> windowFromFlags() {
    kessan::model::DateRange window;
    if (not FLAGS_start_date.empty()) {
      auto start = kessan::model::parseDate(FLAGS_start_date);
      if (auto e = kessan::expected::resultToOptionalError(start)) {
        return kessan::expected::makeError(std::move(e).value());
      }
      window.start = std::move(start).assumeValue();
    }
    if (not FLAGS_end_date.empty()) {
      auto end = kessan::model::parseDate(FLAGS_end_date);
      if (auto e = kessan::expected::resultToOptionalError(end)) {
        return kessan::expected::makeError(std::move(e).value());
      }
      window.end = std::move(end).assumeValue();
    }
    return kessan::expected::makeValue(window);
  }

  kessan::model::FiscalYearType fiscalYearFromFlags() {
    if (FLAGS_fiscal_year != 0) {
      return FLAGS_fiscal_year;
    }
    return boost::gregorian::day_clock::local_day().year();
  }

  void printTrialBalance(
      const std::vector<kessan::reports::TrialBalanceRow> &rows) {
    fmt::print("code\tname\tcategory\topening\tcarry_forward\tdebit\tcredit\t"
               "closing\n");
    for (const auto &row : rows) {
      fmt::print("{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\n",
                 row.code,
                 row.name,
                 kessan::model::categoryName(row.category),
                 row.opening,
                 row.carry_forward,
                 row.debit_total,
                 row.credit_total,
                 row.closing);
    }
  }

  void printLedger(const kessan::reports::GeneralLedger &ledger) {
    fmt::print("{} {} ({}) fiscal year {}, opening {}\n",
               ledger.account.code,
               ledger.account.name,
               kessan::model::categoryName(ledger.account.category),
               ledger.fiscal_year,
               ledger.opening_balance);
    fmt::print("id\tdate\tcounter_account\tdebit\tcredit\ttax\tcounterparty\t"
               "memo\tbalance\n");
    for (const auto &row : ledger.rows) {
      fmt::print("{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\n",
                 row.entry_id,
                 kessan::model::toIsoString(row.date),
                 row.counter_account,
                 row.debit_amount,
                 row.credit_amount,
                 kessan::model::classificationLabel(row.tax_classification),
                 row.counterparty,
                 row.memo,
                 row.balance);
    }
  }

  void printDepreciation(
      const std::vector<kessan::depreciation::DepreciationRow> &rows) {
    fmt::print("id\tname\tacquired\tcost\tlife\tyear\topening\tdepreciation\t"
               "closing\tdisposal\tgain_or_loss\tremark\n");
    for (const auto &row : rows) {
      fmt::print(
          "{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\n",
          row.asset_id,
          row.name,
          kessan::model::toIsoString(row.acquisition_date),
          row.acquisition_cost,
          row.useful_life,
          row.fiscal_year,
          row.opening_book_value,
          row.depreciation,
          row.closing_book_value,
          row.disposal_kind
              ? kessan::model::disposalKindName(*row.disposal_kind)
              : std::string_view{},
          row.gain_or_loss,
          row.remark);
    }
  }

  void printAccounts(const std::vector<kessan::model::Account> &accounts) {
    fmt::print("id\tcode\tname\tcategory\ttax_default\n");
    for (const auto &account : accounts) {
      fmt::print("{}\t{}\t{}\t{}\t{}\n",
                 account.id,
                 account.code,
                 account.name,
                 kessan::model::categoryName(account.category),
                 kessan::model::classificationLabel(account.tax_default));
    }
  }

  /// Print the value, or log the error and report failure
  template <typename T, typename Printer>
  bool report(LedgerResult<T> result,
              Printer &&print,
              const logger::LoggerPtr &log) {
    return std::move(result).match(
        [&](auto &&value) {
          print(value.value);
          return true;
        },
        [&](const auto &e) {
          log->error("Report failed: {}", e.error);
          return false;
        });
  }

  bool runReport(soci::session &sql,
                 const KessanConfig &config,
                 logger::LoggerManagerTreePtr log_manager,
                 const logger::LoggerPtr &log) {
    auto books_log_manager = log_manager->getChild("Books");
    kessan::books::SqlDbTransaction tx(sql);
    kessan::books::SqlAccountRegistry accounts(
        sql, books_log_manager->getChild("AccountRegistry")->getLogger());
    kessan::books::SqlJournalStore journal(
        sql,
        config.getFallbackAccount(),
        books_log_manager->getChild("JournalStore")->getLogger());
    kessan::books::SqlOpeningBalanceStore openings(
        sql, books_log_manager->getChild("OpeningBalanceStore")->getLogger());
    kessan::books::SqlFixedAssetRegister assets(
        sql, books_log_manager->getChild("FixedAssetRegister")->getLogger());

    if (FLAGS_report == kReportAccounts) {
      return report(accounts.listAccounts(true), printAccounts, log);
    }

    if (FLAGS_report == kReportBackup) {
      kessan::books::SqlBackupExporter exporter(
          sql, accounts, books_log_manager->getChild("Backup")->getLogger());
      return report(
          exporter.exportBackup(),
          [](const kessan::model::BooksBackup &backup) {
            fmt::print("{}\n", kessan::main::backupToJson(backup));
          },
          log);
    }

    if (FLAGS_report == kReportDepreciation
        or FLAGS_report == kReportSchedule) {
      kessan::depreciation::DepreciationScheduler scheduler(
          assets, tx, log_manager->getChild("Depreciation")->getLogger());
      if (FLAGS_report == kReportDepreciation) {
        return report(
            scheduler.compute(fiscalYearFromFlags()), printDepreciation, log);
      }
      if (FLAGS_asset_id == 0) {
        log->error("--asset_id is required for the {} report", FLAGS_report);
        return false;
      }
      return report(scheduler.schedule(FLAGS_asset_id), printDepreciation, log);
    }

    auto window = windowFromFlags();
    if (auto e = kessan::expected::resultToOptionalError(window)) {
      log->error("Bad reporting window: {}", e.value());
      return false;
    }
    kessan::reports::BalanceCalculator calculator(
        accounts,
        journal,
        openings,
        tx,
        log_manager->getChild("BalanceCalculator")->getLogger());
    if (FLAGS_report == kReportTrialBalance) {
      auto fiscal_year = fiscalYearFromFlags();
      if (FLAGS_fiscal_year == 0 and window.assumeValue().start) {
        fiscal_year = window.assumeValue().start->year();
      }
      return report(
          calculator.trialBalance(fiscal_year, window.assumeValue()),
          printTrialBalance,
          log);
    }
    if (FLAGS_account_id == 0) {
      log->error("--account_id is required for the {} report", FLAGS_report);
      return false;
    }
    return report(
        calculator.generalLedger(FLAGS_account_id, window.assumeValue()),
        printLedger,
        log);
  }
}  // namespace

int main(int argc, char *argv[]) {
  gflags::SetUsageMessage(
      "Print bookkeeping reports: trial balance, general ledger, "
      "depreciation");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  logger::LoggerManagerTreePtr log_manager = getDefaultLogManager();
  logger::LoggerPtr log = log_manager->getChild("Init")->getLogger();

  try {
    // If the global log level override was set in the command line arguments,
    // create a logger manager with the given log level for all subsystems:
    if (FLAGS_verbosity != kLogSettingsFromConfigFile) {
      logger::LoggerConfig cfg{config_members::LogLevels.at(FLAGS_verbosity),
                               logger::LogPatterns{}};
      log_manager = std::make_shared<logger::LoggerManagerTree>(std::move(cfg));
      log = log_manager->getChild("Init")->getLogger();
    }

    auto config_result = parse_kessan_config(FLAGS_config, {log});
    if (auto e = kessan::expected::resultToOptionalError(config_result)) {
      log->error("Failed reading the configuration: {}", e.value());
      return EXIT_FAILURE;
    }
    auto config = std::move(config_result).assumeValue();

    if (FLAGS_verbosity == kLogSettingsFromConfigFile) {
      log_manager = config.logger_manager.value_or(getDefaultLogManager());
      log = log_manager->getChild("Init")->getLogger();
    }
    log->info("config initialized");
    log->info("database type: {}, seed default accounts: {}",
              config.database_config.type,
              logger::boolRepr(config.getSeedDefaultAccounts()));
    log->info("fallback account: {}", config.getFallbackAccount());

    auto pool_result =
        kessan::main::DbConnectionInit::init(config.database_config,
                                             config.getSeedDefaultAccounts(),
                                             log_manager->getChild("Storage"));
    if (auto e = kessan::expected::resultToOptionalError(pool_result)) {
      log->error("Failed to initialize the database: {}", e.value());
      return EXIT_FAILURE;
    }
    auto pool = std::move(pool_result).assumeValue();
    soci::session sql(*pool);

    auto succeeded =
        runReport(sql, config, log_manager->getChild("Kessan"), log);

    gflags::ShutDownCommandLineFlags();

    return succeeded ? EXIT_SUCCESS : EXIT_FAILURE;
  } catch (std::exception const &e) {
    log->critical("unhandled exception: {}", e.what());
    return EXIT_FAILURE;
  }
}
