/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "books/impl/sql_account_registry.hpp"

#include <iterator>

#include <fmt/format.h>
#include "books/impl/sql_utils.hpp"
#include "books/impl/transaction_scope.hpp"
#include "logger/logger.hpp"

namespace {
  using kessan::model::AccountCategory;
  using kessan::model::TaxClassification;

  struct DefaultAccount {
    const char *code;
    const char *name;
    AccountCategory category;
    TaxClassification tax_default;
  };

  // Chart of accounts of a sole proprietor filing a blue return
  const DefaultAccount kDefaultAccounts[] = {
      {"100", "現金", AccountCategory::kAsset, TaxClassification::kOutOfScope},
      {"101", "小口現金", AccountCategory::kAsset, TaxClassification::kOutOfScope},
      {"110", "普通預金", AccountCategory::kAsset, TaxClassification::kOutOfScope},
      {"120", "売掛金", AccountCategory::kAsset, TaxClassification::kOutOfScope},
      {"121", "未収入金", AccountCategory::kAsset, TaxClassification::kOutOfScope},
      {"130", "棚卸資産", AccountCategory::kAsset, TaxClassification::kOutOfScope},
      {"190", "事業主貸", AccountCategory::kAsset, TaxClassification::kOutOfScope},
      {"200", "買掛金", AccountCategory::kLiability, TaxClassification::kOutOfScope},
      {"201", "未払金", AccountCategory::kLiability, TaxClassification::kOutOfScope},
      {"210", "借入金", AccountCategory::kLiability, TaxClassification::kOutOfScope},
      {"220", "預り金", AccountCategory::kLiability, TaxClassification::kOutOfScope},
      {"290", "事業主借", AccountCategory::kLiability, TaxClassification::kOutOfScope},
      {"300", "資本金", AccountCategory::kEquity, TaxClassification::kOutOfScope},
      {"301", "元入金", AccountCategory::kEquity, TaxClassification::kOutOfScope},
      {"400", "売上高", AccountCategory::kRevenue, TaxClassification::kStandard10},
      {"410", "雑収入", AccountCategory::kRevenue, TaxClassification::kStandard10},
      {"500", "仕入高", AccountCategory::kExpense, TaxClassification::kStandard10},
      {"510", "役員報酬", AccountCategory::kExpense, TaxClassification::kOutOfScope},
      {"511", "給料手当", AccountCategory::kExpense, TaxClassification::kOutOfScope},
      {"520", "外注工賃", AccountCategory::kExpense, TaxClassification::kStandard10},
      {"530", "旅費交通費", AccountCategory::kExpense, TaxClassification::kStandard10},
      {"531", "通信費", AccountCategory::kExpense, TaxClassification::kStandard10},
      {"540", "広告宣伝費", AccountCategory::kExpense, TaxClassification::kStandard10},
      {"541", "接待交際費", AccountCategory::kExpense, TaxClassification::kStandard10},
      {"550", "消耗品費", AccountCategory::kExpense, TaxClassification::kStandard10},
      {"551", "会議費", AccountCategory::kExpense, TaxClassification::kStandard10},
      {"560", "水道光熱費", AccountCategory::kExpense, TaxClassification::kStandard10},
      {"570", "地代家賃", AccountCategory::kExpense, TaxClassification::kNonTaxable},
      {"580", "修繕費", AccountCategory::kExpense, TaxClassification::kStandard10},
      {"590", "支払手数料", AccountCategory::kExpense, TaxClassification::kStandard10},
      {"600", "租税公課", AccountCategory::kExpense, TaxClassification::kOutOfScope},
      {"610", "新聞図書費", AccountCategory::kExpense, TaxClassification::kStandard10},
      {"620", "保険料", AccountCategory::kExpense, TaxClassification::kNonTaxable},
      {"630", "減価償却費", AccountCategory::kExpense, TaxClassification::kOutOfScope},
      {"900", "雑費", AccountCategory::kExpense, TaxClassification::kStandard10},
  };

  const std::string kSelectAccounts =
      "SELECT id, code, name, account_type, tax_default, display_order, "
      "is_active FROM accounts_master ";

  /// Output buffer of kSelectAccounts
  struct AccountRow {
    kessan::books::SqlBigint id{};
    std::string code;
    std::string name;
    std::string category;
    std::string tax_default;
    int display_order{};
    int is_active{};

    void exchangeInto(soci::statement &statement) {
      statement.exchange(soci::into(id));
      statement.exchange(soci::into(code));
      statement.exchange(soci::into(name));
      statement.exchange(soci::into(category));
      statement.exchange(soci::into(tax_default));
      statement.exchange(soci::into(display_order));
      statement.exchange(soci::into(is_active));
    }

    kessan::model::Account toAccount() const {
      kessan::model::Account account;
      account.id = id;
      account.code = code;
      account.name = name;
      account.category = kessan::books::storedCategory(category);
      account.tax_default = kessan::books::storedClassification(tax_default);
      account.display_order = display_order;
      account.is_active = is_active != 0;
      return account;
    }
  };

  std::vector<kessan::model::Account> fetchAccounts(
      soci::session &sql,
      const std::string &query,
      kessan::books::SqlParameters params) {
    AccountRow row;
    soci::statement statement(sql);
    row.exchangeInto(statement);
    params.exchangeInto(statement);
    kessan::books::executeStatement(statement, query);

    std::vector<kessan::model::Account> accounts;
    while (statement.fetch()) {
      accounts.push_back(row.toAccount());
    }
    return accounts;
  }
}  // namespace

namespace kessan {
  namespace books {

    using model::LedgerError;
    using model::makeLedgerError;

    SqlAccountRegistry::SqlAccountRegistry(soci::session &sql,
                                           logger::LoggerPtr log)
        : sql_(sql), tx_(sql), log_(std::move(log)) {}

    model::LedgerResult<std::vector<model::Account>>
    SqlAccountRegistry::listAccounts(bool active_only) {
      return guardedQuery(
          log_,
          "listAccounts",
          [&]() -> model::LedgerResult<std::vector<model::Account>> {
            return expected::makeValue(fetchAccounts(
                sql_,
                kSelectAccounts + (active_only ? "WHERE is_active = 1 " : "")
                    + "ORDER BY display_order, code",
                {}));
          });
    }

    model::AccountIdType SqlAccountRegistry::insertAccount(
        const std::string &code,
        const std::string &name,
        model::AccountCategory category,
        model::TaxClassification tax_default) {
      std::string category_name{model::categoryName(category)};
      std::string tax_label{model::classificationLabel(tax_default)};
      int display_order = model::displayOrderFromCode(code);
      SqlBigint id = 0;
      sql_ << "INSERT INTO accounts_master "
              "(code, name, account_type, tax_default, display_order) "
              "VALUES (:code, :name, :account_type, :tax_default, "
              ":display_order) RETURNING id",
          soci::use(code, "code"), soci::use(name, "name"),
          soci::use(category_name, "account_type"),
          soci::use(tax_label, "tax_default"),
          soci::use(display_order, "display_order"), soci::into(id);
      return id;
    }

    model::LedgerResult<model::AccountIdType> SqlAccountRegistry::createAccount(
        const std::string &code,
        const std::string &name,
        model::AccountCategory category,
        model::TaxClassification tax_default) {
      if (code.empty() or name.empty()) {
        return makeLedgerError(LedgerError::Kind::kValidation,
                               "account code and name must not be empty");
      }
      return inTransaction(
          tx_,
          log_,
          "createAccount",
          [&]() -> model::LedgerResult<model::AccountIdType> {
            int taken = 0;
            sql_ << "SELECT COUNT(*) FROM accounts_master "
                    "WHERE code = :code OR name = :name",
                soci::use(code, "code"), soci::use(name, "name"),
                soci::into(taken);
            if (taken != 0) {
              return makeLedgerError(
                  LedgerError::Kind::kDuplicateAccount,
                  fmt::format("account code {} or name {} already exists",
                              code,
                              name));
            }
            auto id = insertAccount(code, name, category, tax_default);
            log_->debug("created account {} {} with id {}", code, name, id);
            return expected::makeValue(id);
          });
    }

    model::LedgerResult<void> SqlAccountRegistry::deactivateAccount(
        model::AccountIdType id) {
      return inTransaction(
          tx_, log_, "deactivateAccount", [&]() -> model::LedgerResult<void> {
            SqlBigint account_id = id;
            int exists = 0;
            sql_ << "SELECT COUNT(*) FROM accounts_master WHERE id = :id",
                soci::use(account_id, "id"), soci::into(exists);
            if (exists == 0) {
              return makeLedgerError(LedgerError::Kind::kNotFound,
                                     fmt::format("account {} not found", id));
            }

            int references = 0;
            sql_ << "SELECT COUNT(*) FROM journal_entries WHERE is_deleted = 0 "
                    "AND (debit_account_id = :id OR credit_account_id = :id)",
                soci::use(account_id, "id"), soci::into(references);
            if (references != 0) {
              return makeLedgerError(
                  LedgerError::Kind::kAccountInUse,
                  fmt::format("account {} is used by {} journal entries",
                              id,
                              references));
            }

            sql_ << "UPDATE accounts_master SET is_active = 0 WHERE id = :id",
                soci::use(account_id, "id");
            log_->debug("deactivated account {}", id);
            return expected::makeValue();
          });
    }

    model::LedgerResult<boost::optional<model::Account>>
    SqlAccountRegistry::findById(model::AccountIdType id) {
      return guardedQuery(
          log_,
          "findById",
          [&]() -> model::LedgerResult<boost::optional<model::Account>> {
            SqlParameters params;
            params.number("id", id);
            auto accounts = fetchAccounts(
                sql_, kSelectAccounts + "WHERE id = :id", std::move(params));
            if (accounts.empty()) {
              return expected::makeValue(boost::optional<model::Account>{});
            }
            return expected::makeValue(
                boost::make_optional(std::move(accounts.front())));
          });
    }

    model::LedgerResult<boost::optional<model::Account>>
    SqlAccountRegistry::findActiveByName(const std::string &name) {
      return guardedQuery(
          log_,
          "findActiveByName",
          [&]() -> model::LedgerResult<boost::optional<model::Account>> {
            SqlParameters params;
            params.text("name", name);
            auto accounts =
                fetchAccounts(sql_,
                              kSelectAccounts
                                  + "WHERE name = :name AND is_active = 1",
                              std::move(params));
            if (accounts.empty()) {
              return expected::makeValue(boost::optional<model::Account>{});
            }
            return expected::makeValue(
                boost::make_optional(std::move(accounts.front())));
          });
    }

    model::LedgerResult<size_t> SqlAccountRegistry::seedDefaultAccounts() {
      return inTransaction(
          tx_, log_, "seedDefaultAccounts", [&]() -> model::LedgerResult<size_t> {
            int count = 0;
            sql_ << "SELECT COUNT(*) FROM accounts_master", soci::into(count);
            if (count != 0) {
              return expected::makeValue(size_t{0});
            }
            for (const auto &account : kDefaultAccounts) {
              insertAccount(account.code,
                            account.name,
                            account.category,
                            account.tax_default);
            }
            size_t seeded = std::size(kDefaultAccounts);
            log_->info("seeded {} default accounts", seeded);
            return expected::makeValue(seeded);
          });
    }

  }  // namespace books
}  // namespace kessan
