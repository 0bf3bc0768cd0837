/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "model/account.hpp"

#include <algorithm>
#include <cctype>
#include <tuple>

#include <fmt/core.h>

namespace kessan {
  namespace model {

    BalanceSide normalSide(AccountCategory category) {
      switch (category) {
        case AccountCategory::kAsset:
        case AccountCategory::kExpense:
          return BalanceSide::kDebit;
        case AccountCategory::kLiability:
        case AccountCategory::kEquity:
        case AccountCategory::kRevenue:
          return BalanceSide::kCredit;
      }
      return BalanceSide::kDebit;
    }

    AmountType applyMovement(BalanceSide side,
                             AmountType balance,
                             AmountType debit,
                             AmountType credit) {
      return side == BalanceSide::kDebit ? balance + debit - credit
                                         : balance + credit - debit;
    }

    std::string_view categoryName(AccountCategory category) {
      switch (category) {
        case AccountCategory::kAsset:
          return "asset";
        case AccountCategory::kLiability:
          return "liability";
        case AccountCategory::kEquity:
          return "equity";
        case AccountCategory::kRevenue:
          return "revenue";
        case AccountCategory::kExpense:
          return "expense";
      }
      return "asset";
    }

    boost::optional<AccountCategory> categoryFromString(std::string_view text) {
      static const std::pair<std::string_view, AccountCategory> kNames[] = {
          {"asset", AccountCategory::kAsset},
          {"資産", AccountCategory::kAsset},
          {"liability", AccountCategory::kLiability},
          {"負債", AccountCategory::kLiability},
          {"equity", AccountCategory::kEquity},
          {"純資産", AccountCategory::kEquity},
          {"revenue", AccountCategory::kRevenue},
          {"収益", AccountCategory::kRevenue},
          {"expense", AccountCategory::kExpense},
          {"費用", AccountCategory::kExpense},
      };
      for (const auto &name : kNames) {
        if (name.first == text) {
          return name.second;
        }
      }
      return boost::none;
    }

    std::string Account::toString() const {
      return fmt::format("Account[id={}, code={}, name={}, category={}]",
                         id,
                         code,
                         name,
                         categoryName(category));
    }

    bool Account::operator==(const Account &other) const {
      return std::tie(id,
                      code,
                      name,
                      category,
                      tax_default,
                      display_order,
                      is_active)
          == std::tie(other.id,
                      other.code,
                      other.name,
                      other.category,
                      other.tax_default,
                      other.display_order,
                      other.is_active);
    }

    int displayOrderFromCode(std::string_view code) {
      if (code.empty() or code.size() > 9
          or not std::all_of(code.begin(), code.end(), [](char c) {
               return std::isdigit(static_cast<unsigned char>(c));
             })) {
        return 0;
      }
      int order = 0;
      for (auto c : code) {
        order = order * 10 + (c - '0');
      }
      return order;
    }

  }  // namespace model
}  // namespace kessan
