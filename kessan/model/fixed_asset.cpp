/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "model/fixed_asset.hpp"

#include <fmt/core.h>

namespace kessan {
  namespace model {

    const char *kStraightLineMethod = "straight_line";

    std::string_view disposalKindName(DisposalKind kind) {
      switch (kind) {
        case DisposalKind::kRetirement:
          return "retirement";
        case DisposalKind::kSale:
          return "sale";
      }
      return "retirement";
    }

    boost::optional<DisposalKind> disposalKindFromString(
        std::string_view text) {
      if (text == "retirement" or text == "除却") {
        return DisposalKind::kRetirement;
      }
      if (text == "sale" or text == "売却") {
        return DisposalKind::kSale;
      }
      return boost::none;
    }

    std::string FixedAsset::toString() const {
      return fmt::format(
          "FixedAsset[id={}, name={}, acquired={}, life={}, cost={}{}]",
          id,
          name,
          toIsoString(acquisition_date),
          useful_life,
          acquisition_cost,
          disposal ? fmt::format(", disposal={} on {}",
                                 disposalKindName(disposal->kind),
                                 toIsoString(disposal->date))
                   : std::string{});
    }

  }  // namespace model
}  // namespace kessan
