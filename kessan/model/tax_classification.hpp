/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_MODEL_TAX_CLASSIFICATION_HPP
#define KESSAN_MODEL_TAX_CLASSIFICATION_HPP

#include <string_view>

#include <boost/optional.hpp>

namespace kessan {
  namespace model {

    /// Consumption tax treatment of a transaction
    enum class TaxClassification {
      /// standard rate, 10%
      kStandard10,
      /// reduced rate, 8%
      kReduced8,
      /// exempt supply (非課税)
      kNonTaxable,
      /// outside the scope of consumption tax (不課税)
      kOutOfScope,
    };

    /// Label stored in the database: 10%, 8%, 非課税, 不課税
    std::string_view classificationLabel(TaxClassification classification);

    /**
     * Parse a classification from the stored label or from its ascii alias
     * (non_taxable, out_of_scope).
     */
    boost::optional<TaxClassification> classificationFromString(
        std::string_view text);

  }  // namespace model
}  // namespace kessan

#endif  // KESSAN_MODEL_TAX_CLASSIFICATION_HPP
