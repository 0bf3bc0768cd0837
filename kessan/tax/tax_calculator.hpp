/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_TAX_CALCULATOR_HPP
#define KESSAN_TAX_CALCULATOR_HPP

#include "model/tax_classification.hpp"
#include "model/types.hpp"

namespace kessan {
  namespace tax {

    /// Statutory rate in percent: 10, 8, or 0 for non-taxable/out-of-scope
    int taxRate(model::TaxClassification classification);

    /**
     * Extract the consumption tax contained in a tax-inclusive amount:
     * amount * rate / (100 + rate), rounded down.
     * @param amount - tax-inclusive amount, non-negative
     * @param classification - tax treatment of the amount
     * @return tax component, 0 <= result <= amount
     */
    model::AmountType calculateTaxAmount(
        model::AmountType amount, model::TaxClassification classification);

  }  // namespace tax
}  // namespace kessan

#endif  // KESSAN_TAX_CALCULATOR_HPP
