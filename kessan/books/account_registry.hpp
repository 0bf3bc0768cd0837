/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_ACCOUNT_REGISTRY_HPP
#define KESSAN_ACCOUNT_REGISTRY_HPP

#include <string>
#include <vector>

#include <boost/optional.hpp>
#include "model/account.hpp"
#include "model/ledger_error.hpp"

namespace kessan {
  namespace books {

    /**
     * Chart of accounts. Accounts are never hard-deleted, and their category
     * cannot be changed once created.
     */
    class AccountRegistry {
     public:
      virtual ~AccountRegistry() = default;

      /**
       * @param active_only - skip deactivated accounts
       * @return accounts ordered by display order, then code
       */
      virtual model::LedgerResult<std::vector<model::Account>> listAccounts(
          bool active_only) = 0;

      /**
       * Add an account. Display order is derived from the code.
       * @return id of the new account, DuplicateAccount if the code or the
       * name is taken, ValidationError if either is empty
       */
      virtual model::LedgerResult<model::AccountIdType> createAccount(
          const std::string &code,
          const std::string &name,
          model::AccountCategory category,
          model::TaxClassification tax_default) = 0;

      /**
       * Soft-deactivate an account. Fails with AccountInUse while any
       * non-deleted journal entry references it on either leg.
       */
      virtual model::LedgerResult<void> deactivateAccount(
          model::AccountIdType id) = 0;

      /// @return the account with the id, active or not, none if unknown
      virtual model::LedgerResult<boost::optional<model::Account>> findById(
          model::AccountIdType id) = 0;

      /// @return the active account with exactly this name
      virtual model::LedgerResult<boost::optional<model::Account>>
      findActiveByName(const std::string &name) = 0;

      /**
       * Insert the default sole-proprietor chart of accounts if the registry
       * is empty.
       * @return number of inserted accounts
       */
      virtual model::LedgerResult<size_t> seedDefaultAccounts() = 0;
    };

  }  // namespace books
}  // namespace kessan

#endif  // KESSAN_ACCOUNT_REGISTRY_HPP
