/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_MODEL_OPENING_BALANCE_HPP
#define KESSAN_MODEL_OPENING_BALANCE_HPP

#include <string>

#include "model/account.hpp"
#include "model/types.hpp"

namespace kessan {
  namespace model {

    /// Balance of an account at the start of a fiscal year
    struct OpeningBalance {
      AccountIdType account_id{};
      AmountType amount{};
      std::string note;
    };

    /// Opening balance joined with the account it belongs to
    struct OpeningBalanceView {
      AccountIdType account_id{};
      std::string code;
      std::string name;
      AccountCategory category{AccountCategory::kAsset};
      AmountType amount{};
      std::string note;
    };

  }  // namespace model
}  // namespace kessan

#endif  // KESSAN_MODEL_OPENING_BALANCE_HPP
