/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "tax/tax_calculator.hpp"

namespace kessan {
  namespace tax {

    int taxRate(model::TaxClassification classification) {
      switch (classification) {
        case model::TaxClassification::kStandard10:
          return 10;
        case model::TaxClassification::kReduced8:
          return 8;
        case model::TaxClassification::kNonTaxable:
        case model::TaxClassification::kOutOfScope:
          return 0;
      }
      return 0;
    }

    model::AmountType calculateTaxAmount(
        model::AmountType amount, model::TaxClassification classification) {
      const model::AmountType rate = taxRate(classification);
      if (rate == 0 or amount <= 0) {
        return 0;
      }
      // amounts are positive here, so truncation is floor division
      return amount * rate / (100 + rate);
    }

  }  // namespace tax
}  // namespace kessan
