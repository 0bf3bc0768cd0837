/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_SQL_FIXED_ASSET_REGISTER_HPP
#define KESSAN_SQL_FIXED_ASSET_REGISTER_HPP

#include "books/fixed_asset_register.hpp"

#include <soci/soci.h>
#include "books/impl/sql_db_transaction.hpp"
#include "logger/logger_fwd.hpp"

namespace kessan {
  namespace books {

    class SqlParameters;

    class SqlFixedAssetRegister : public FixedAssetRegister {
     public:
      SqlFixedAssetRegister(soci::session &sql, logger::LoggerPtr log);

      model::LedgerResult<model::AssetIdType> createAsset(
          const model::FixedAssetDraft &draft) override;

      model::LedgerResult<std::vector<model::FixedAsset>> listAssets() override;

      model::LedgerResult<model::FixedAsset> getAsset(
          model::AssetIdType id) override;

      model::LedgerResult<void> updateAsset(
          model::AssetIdType id, const model::FixedAssetDraft &draft) override;

      model::LedgerResult<void> deleteAsset(model::AssetIdType id) override;

      model::LedgerResult<void> setDisposal(model::AssetIdType id,
                                            model::DisposalKind kind,
                                            const std::string &date,
                                            model::AmountType proceeds) override;

      model::LedgerResult<void> cancelDisposal(model::AssetIdType id) override;

     private:
      std::vector<model::FixedAsset> fetchAssets(const std::string &query,
                                                 SqlParameters &params);

      /// Read a non-deleted asset inside the current transaction
      model::LedgerResult<model::FixedAsset> loadAsset(model::AssetIdType id);

      soci::session &sql_;
      SqlDbTransaction tx_;
      logger::LoggerPtr log_;
    };

  }  // namespace books
}  // namespace kessan

#endif  // KESSAN_SQL_FIXED_ASSET_REGISTER_HPP
