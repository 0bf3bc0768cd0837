/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_MOCK_ACCOUNT_REGISTRY_HPP
#define KESSAN_MOCK_ACCOUNT_REGISTRY_HPP

#include <gmock/gmock.h>

#include "books/account_registry.hpp"

namespace kessan {
  namespace books {

    class MockAccountRegistry : public AccountRegistry {
     public:
      MOCK_METHOD1(listAccounts,
                   model::LedgerResult<std::vector<model::Account>>(bool));
      MOCK_METHOD4(createAccount,
                   model::LedgerResult<model::AccountIdType>(
                       const std::string &,
                       const std::string &,
                       model::AccountCategory,
                       model::TaxClassification));
      MOCK_METHOD1(deactivateAccount,
                   model::LedgerResult<void>(model::AccountIdType));
      MOCK_METHOD1(findById,
                   model::LedgerResult<boost::optional<model::Account>>(
                       model::AccountIdType));
      MOCK_METHOD1(findActiveByName,
                   model::LedgerResult<boost::optional<model::Account>>(
                       const std::string &));
      MOCK_METHOD0(seedDefaultAccounts, model::LedgerResult<size_t>());
    };

  }  // namespace books
}  // namespace kessan

#endif  // KESSAN_MOCK_ACCOUNT_REGISTRY_HPP
