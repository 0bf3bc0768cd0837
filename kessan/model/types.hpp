/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_MODEL_TYPES_HPP
#define KESSAN_MODEL_TYPES_HPP

#include <cstdint>

namespace kessan {
  namespace model {
    /// Surrogate key of accounts_master
    using AccountIdType = int64_t;
    /// Surrogate key of journal_entries
    using EntryIdType = int64_t;
    /// Surrogate key of fixed_assets
    using AssetIdType = int64_t;
    /// Surrogate key of counterparties
    using CounterpartyIdType = int64_t;
    /// Money in the smallest currency unit (yen), tax-inclusive where noted
    using AmountType = int64_t;
    /// Calendar year; fiscal years run from January 1 to December 31
    using FiscalYearType = int;
  }  // namespace model
}  // namespace kessan

#endif  // KESSAN_MODEL_TYPES_HPP
