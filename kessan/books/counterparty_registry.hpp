/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_COUNTERPARTY_REGISTRY_HPP
#define KESSAN_COUNTERPARTY_REGISTRY_HPP

#include <string>
#include <vector>

#include "model/counterparty.hpp"
#include "model/ledger_error.hpp"

namespace kessan {
  namespace books {

    class CounterpartyRegistry {
     public:
      virtual ~CounterpartyRegistry() = default;

      /// Active counterparties ordered by name
      virtual model::LedgerResult<std::vector<model::Counterparty>>
      listCounterparties() = 0;

      /**
       * Sorted, distinct names of registered counterparties and of
       * counterparties used in journal entries, for autocompletion
       */
      virtual model::LedgerResult<std::vector<std::string>>
      counterpartyNames() = 0;

      virtual model::LedgerResult<model::CounterpartyIdType> createCounterparty(
          const model::Counterparty &counterparty) = 0;

      virtual model::LedgerResult<void> updateCounterparty(
          model::CounterpartyIdType id,
          const model::Counterparty &counterparty) = 0;

      virtual model::LedgerResult<void> deleteCounterparty(
          model::CounterpartyIdType id) = 0;
    };

  }  // namespace books
}  // namespace kessan

#endif  // KESSAN_COUNTERPARTY_REGISTRY_HPP
