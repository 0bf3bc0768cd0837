/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_FIXED_ASSET_REGISTER_HPP
#define KESSAN_FIXED_ASSET_REGISTER_HPP

#include <string>
#include <vector>

#include "model/fixed_asset.hpp"
#include "model/ledger_error.hpp"

namespace kessan {
  namespace books {

    /**
     * Register of depreciable assets. Unknown or deleted ids yield
     * NotFoundError.
     */
    class FixedAssetRegister {
     public:
      virtual ~FixedAssetRegister() = default;

      virtual model::LedgerResult<model::AssetIdType> createAsset(
          const model::FixedAssetDraft &draft) = 0;

      /// Non-deleted assets ordered by acquisition date, then id
      virtual model::LedgerResult<std::vector<model::FixedAsset>>
      listAssets() = 0;

      virtual model::LedgerResult<model::FixedAsset> getAsset(
          model::AssetIdType id) = 0;

      virtual model::LedgerResult<void> updateAsset(
          model::AssetIdType id, const model::FixedAssetDraft &draft) = 0;

      virtual model::LedgerResult<void> deleteAsset(model::AssetIdType id) = 0;

      /**
       * Record a retirement or a sale.
       * @param date - ISO date, not before the acquisition date
       * @param proceeds - sale price, ignored for a retirement
       */
      virtual model::LedgerResult<void> setDisposal(model::AssetIdType id,
                                                    model::DisposalKind kind,
                                                    const std::string &date,
                                                    model::AmountType proceeds) = 0;

      virtual model::LedgerResult<void> cancelDisposal(model::AssetIdType id) = 0;
    };

  }  // namespace books
}  // namespace kessan

#endif  // KESSAN_FIXED_ASSET_REGISTER_HPP
