/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "model/tax_classification.hpp"

#include <utility>

namespace kessan {
  namespace model {

    std::string_view classificationLabel(TaxClassification classification) {
      switch (classification) {
        case TaxClassification::kStandard10:
          return "10%";
        case TaxClassification::kReduced8:
          return "8%";
        case TaxClassification::kNonTaxable:
          return "非課税";
        case TaxClassification::kOutOfScope:
          return "不課税";
      }
      return "10%";
    }

    boost::optional<TaxClassification> classificationFromString(
        std::string_view text) {
      static const std::pair<std::string_view, TaxClassification> kLabels[] = {
          {"10%", TaxClassification::kStandard10},
          {"8%", TaxClassification::kReduced8},
          {"非課税", TaxClassification::kNonTaxable},
          {"non_taxable", TaxClassification::kNonTaxable},
          {"不課税", TaxClassification::kOutOfScope},
          {"out_of_scope", TaxClassification::kOutOfScope},
      };
      for (const auto &label : kLabels) {
        if (label.first == text) {
          return label.second;
        }
      }
      return boost::none;
    }

  }  // namespace model
}  // namespace kessan
