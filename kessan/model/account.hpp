/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_MODEL_ACCOUNT_HPP
#define KESSAN_MODEL_ACCOUNT_HPP

#include <string>
#include <string_view>

#include <boost/optional.hpp>

#include "model/tax_classification.hpp"
#include "model/types.hpp"

namespace kessan {
  namespace model {

    enum class AccountCategory {
      kAsset,
      kLiability,
      kEquity,
      kRevenue,
      kExpense,
    };

    enum class BalanceSide {
      kDebit,
      kCredit,
    };

    /**
     * The side on which the balance of an account of the given category
     * increases. Asset and Expense are debit-normal, the others are
     * credit-normal.
     */
    BalanceSide normalSide(AccountCategory category);

    /**
     * Advance a balance by a movement, respecting the normal side.
     * @param side - normal side of the account
     * @param balance - balance before the movement
     * @param debit - amount moved on the debit side
     * @param credit - amount moved on the credit side
     * @return balance after the movement
     */
    AmountType applyMovement(BalanceSide side,
                             AmountType balance,
                             AmountType debit,
                             AmountType credit);

    /// Storage name of the category: asset, liability, equity, revenue,
    /// expense
    std::string_view categoryName(AccountCategory category);

    /**
     * Parse a category from its storage name or its Japanese bookkeeping
     * label (資産, 負債, 純資産, 収益, 費用).
     */
    boost::optional<AccountCategory> categoryFromString(std::string_view text);

    /// Entry of the chart of accounts
    struct Account {
      AccountIdType id{};
      std::string code;
      std::string name;
      AccountCategory category{AccountCategory::kAsset};
      TaxClassification tax_default{TaxClassification::kStandard10};
      int display_order{};
      bool is_active{true};

      std::string toString() const;

      bool operator==(const Account &other) const;
    };

    /// Sort key derived from the code: the code itself if numeric, otherwise 0
    int displayOrderFromCode(std::string_view code);

  }  // namespace model
}  // namespace kessan

#endif  // KESSAN_MODEL_ACCOUNT_HPP
