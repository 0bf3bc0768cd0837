/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_MODEL_FIXED_ASSET_HPP
#define KESSAN_MODEL_FIXED_ASSET_HPP

#include <string>
#include <string_view>

#include <boost/optional.hpp>

#include "model/date.hpp"
#include "model/types.hpp"

namespace kessan {
  namespace model {

    /// The only depreciation method supported
    extern const char *kStraightLineMethod;

    enum class DisposalKind {
      /// no proceeds, remaining book value is a loss
      kRetirement,
      /// proceeds received, difference to book value is a gain or loss
      kSale,
    };

    /// Storage name: retirement, sale
    std::string_view disposalKindName(DisposalKind kind);

    boost::optional<DisposalKind> disposalKindFromString(std::string_view text);

    struct Disposal {
      DisposalKind kind{DisposalKind::kRetirement};
      Date date;
      /// only meaningful for a sale
      AmountType proceeds{};
    };

    struct FixedAsset {
      AssetIdType id{};
      std::string name;
      Date acquisition_date;
      /// whole years, at least 1
      int useful_life{};
      /// at least 1
      AmountType acquisition_cost{};
      std::string method{kStraightLineMethod};
      std::string notes;
      boost::optional<Disposal> disposal;

      std::string toString() const;
    };

    /// Asset attributes as supplied by a caller, not validated yet
    struct FixedAssetDraft {
      std::string name;
      std::string acquisition_date;
      int useful_life{};
      AmountType acquisition_cost{};
      std::string notes;
    };

  }  // namespace model
}  // namespace kessan

#endif  // KESSAN_MODEL_FIXED_ASSET_HPP
