/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_MOCK_OPENING_BALANCE_STORE_HPP
#define KESSAN_MOCK_OPENING_BALANCE_STORE_HPP

#include <gmock/gmock.h>

#include "books/opening_balance_store.hpp"

namespace kessan {
  namespace books {

    class MockOpeningBalanceStore : public OpeningBalanceStore {
     public:
      MOCK_METHOD2(openingBalance,
                   model::LedgerResult<model::AmountType>(
                       model::FiscalYearType, model::AccountIdType));
      MOCK_METHOD1(openingBalances,
                   model::LedgerResult<OpeningBalanceMap>(
                       model::FiscalYearType));
      MOCK_METHOD1(listOpeningBalances,
                   model::LedgerResult<std::vector<model::OpeningBalanceView>>(
                       model::FiscalYearType));
      MOCK_METHOD2(saveOpeningBalances,
                   model::LedgerResult<void>(
                       model::FiscalYearType,
                       const std::vector<model::OpeningBalance> &));
    };

  }  // namespace books
}  // namespace kessan

#endif  // KESSAN_MOCK_OPENING_BALANCE_STORE_HPP
