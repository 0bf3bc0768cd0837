/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "books/impl/sql_fixed_asset_register.hpp"

#include <stdexcept>

#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>
#include "books/impl/sql_utils.hpp"
#include "books/impl/transaction_scope.hpp"
#include "common/result_try.hpp"
#include "logger/logger.hpp"

namespace {
  using kessan::books::SqlBigint;
  using kessan::model::LedgerError;
  using kessan::model::makeLedgerError;

  const std::string kSelectAssets =
      "SELECT id, name, acquisition_date, useful_life, acquisition_cost, "
      "method, notes, disposal_type, disposal_date, disposal_price "
      "FROM fixed_assets ";

  /// Output buffer of kSelectAssets
  struct AssetRow {
    SqlBigint id{};
    std::string name;
    std::string acquisition_date;
    int useful_life{};
    SqlBigint acquisition_cost{};
    std::string method;
    std::string notes;
    std::string disposal_type;
    soci::indicator disposal_type_ind{soci::i_null};
    std::string disposal_date;
    soci::indicator disposal_date_ind{soci::i_null};
    SqlBigint disposal_price{};
    soci::indicator disposal_price_ind{soci::i_null};

    void exchangeInto(soci::statement &statement) {
      statement.exchange(soci::into(id));
      statement.exchange(soci::into(name));
      statement.exchange(soci::into(acquisition_date));
      statement.exchange(soci::into(useful_life));
      statement.exchange(soci::into(acquisition_cost));
      statement.exchange(soci::into(method));
      statement.exchange(soci::into(notes));
      statement.exchange(soci::into(disposal_type, disposal_type_ind));
      statement.exchange(soci::into(disposal_date, disposal_date_ind));
      statement.exchange(soci::into(disposal_price, disposal_price_ind));
    }

    kessan::model::FixedAsset toAsset() const {
      kessan::model::FixedAsset asset;
      asset.id = id;
      asset.name = name;
      asset.acquisition_date = kessan::books::storedDate(acquisition_date);
      asset.useful_life = useful_life;
      asset.acquisition_cost = acquisition_cost;
      asset.method = method;
      asset.notes = notes;
      if (disposal_type_ind == soci::i_ok and disposal_date_ind == soci::i_ok) {
        auto kind = kessan::model::disposalKindFromString(disposal_type);
        if (not kind) {
          throw std::runtime_error(fmt::format(
              "unknown stored disposal type '{}'", disposal_type));
        }
        kessan::model::Disposal disposal;
        disposal.kind = *kind;
        disposal.date = kessan::books::storedDate(disposal_date);
        disposal.proceeds =
            disposal_price_ind == soci::i_ok ? disposal_price : 0;
        asset.disposal = disposal;
      }
      return asset;
    }
  };

  /// Validated attributes of a draft
  struct AssetAttributes {
    std::string name;
    kessan::model::Date acquisition_date;
  };

  kessan::model::LedgerResult<AssetAttributes> validateDraft(
      const kessan::model::FixedAssetDraft &draft) {
    AssetAttributes attributes;
    attributes.name = boost::algorithm::trim_copy(draft.name);
    if (attributes.name.empty()) {
      return makeLedgerError(LedgerError::Kind::kValidation,
                             "asset name must not be empty");
    }
    KESSAN_EXPECTED_TRY_GET_VALUE(date,
                                  kessan::model::parseDate(draft.acquisition_date));
    attributes.acquisition_date = date;
    if (draft.useful_life < 1) {
      return makeLedgerError(
          LedgerError::Kind::kValidation,
          fmt::format("useful life must be at least 1 year, got {}",
                      draft.useful_life));
    }
    if (draft.acquisition_cost < 1) {
      return makeLedgerError(
          LedgerError::Kind::kValidation,
          fmt::format("acquisition cost must be at least 1, got {}",
                      draft.acquisition_cost));
    }
    return kessan::expected::makeValue(std::move(attributes));
  }
}  // namespace

namespace kessan {
  namespace books {

    SqlFixedAssetRegister::SqlFixedAssetRegister(soci::session &sql,
                                                 logger::LoggerPtr log)
        : sql_(sql), tx_(sql), log_(std::move(log)) {}

    std::vector<model::FixedAsset> SqlFixedAssetRegister::fetchAssets(
        const std::string &query, SqlParameters &params) {
      AssetRow row;
      soci::statement statement(sql_);
      row.exchangeInto(statement);
      params.exchangeInto(statement);
      executeStatement(statement, query);

      std::vector<model::FixedAsset> assets;
      while (statement.fetch()) {
        assets.push_back(row.toAsset());
      }
      return assets;
    }

    model::LedgerResult<model::FixedAsset> SqlFixedAssetRegister::loadAsset(
        model::AssetIdType id) {
      SqlParameters params;
      params.number("id", id);
      auto assets = fetchAssets(
          kSelectAssets + "WHERE id = :id AND is_deleted = 0", params);
      if (assets.empty()) {
        return makeLedgerError(LedgerError::Kind::kNotFound,
                               fmt::format("fixed asset {} not found", id));
      }
      return expected::makeValue(std::move(assets.front()));
    }

    model::LedgerResult<model::AssetIdType> SqlFixedAssetRegister::createAsset(
        const model::FixedAssetDraft &draft) {
      KESSAN_EXPECTED_TRY_GET_VALUE(attributes, validateDraft(draft));
      return inTransaction(
          tx_,
          log_,
          "createAsset",
          [&]() -> model::LedgerResult<model::AssetIdType> {
            auto acquisition_date = model::toIsoString(attributes.acquisition_date);
            int useful_life = draft.useful_life;
            SqlBigint cost = draft.acquisition_cost;
            std::string method{model::kStraightLineMethod};
            SqlBigint id = 0;
            sql_ << "INSERT INTO fixed_assets (name, acquisition_date, "
                    "useful_life, acquisition_cost, method, notes) VALUES "
                    "(:name, :acquisition_date, :useful_life, :cost, :method, "
                    ":notes) RETURNING id",
                soci::use(attributes.name, "name"),
                soci::use(acquisition_date, "acquisition_date"),
                soci::use(useful_life, "useful_life"), soci::use(cost, "cost"),
                soci::use(method, "method"), soci::use(draft.notes, "notes"),
                soci::into(id);
            log_->debug("created fixed asset {} with id {}", attributes.name, id);
            return expected::makeValue(model::AssetIdType{id});
          });
    }

    model::LedgerResult<std::vector<model::FixedAsset>>
    SqlFixedAssetRegister::listAssets() {
      return guardedQuery(
          log_,
          "listAssets",
          [&]() -> model::LedgerResult<std::vector<model::FixedAsset>> {
            SqlParameters params;
            return expected::makeValue(
                fetchAssets(kSelectAssets
                                + "WHERE is_deleted = 0 "
                                  "ORDER BY acquisition_date, id",
                            params));
          });
    }

    model::LedgerResult<model::FixedAsset> SqlFixedAssetRegister::getAsset(
        model::AssetIdType id) {
      return guardedQuery(
          log_, "getAsset", [&]() -> model::LedgerResult<model::FixedAsset> {
            return loadAsset(id);
          });
    }

    model::LedgerResult<void> SqlFixedAssetRegister::updateAsset(
        model::AssetIdType id, const model::FixedAssetDraft &draft) {
      KESSAN_EXPECTED_TRY_GET_VALUE(attributes, validateDraft(draft));
      return inTransaction(
          tx_, log_, "updateAsset", [&]() -> model::LedgerResult<void> {
            KESSAN_EXPECTED_TRY_GET_VALUE(asset, loadAsset(id));
            if (asset.disposal
                and asset.disposal->date < attributes.acquisition_date) {
              return makeLedgerError(
                  LedgerError::Kind::kValidation,
                  fmt::format("asset {} was disposed on {}, before {}",
                              id,
                              model::toIsoString(asset.disposal->date),
                              draft.acquisition_date));
            }
            auto acquisition_date = model::toIsoString(attributes.acquisition_date);
            int useful_life = draft.useful_life;
            SqlBigint cost = draft.acquisition_cost;
            SqlBigint asset_id = id;
            sql_ << "UPDATE fixed_assets SET name = :name, acquisition_date = "
                    ":acquisition_date, useful_life = :useful_life, "
                    "acquisition_cost = :cost, notes = :notes WHERE id = :id",
                soci::use(attributes.name, "name"),
                soci::use(acquisition_date, "acquisition_date"),
                soci::use(useful_life, "useful_life"), soci::use(cost, "cost"),
                soci::use(draft.notes, "notes"), soci::use(asset_id, "id");
            log_->debug("updated fixed asset {}", id);
            return expected::makeValue();
          });
    }

    model::LedgerResult<void> SqlFixedAssetRegister::deleteAsset(
        model::AssetIdType id) {
      return inTransaction(
          tx_, log_, "deleteAsset", [&]() -> model::LedgerResult<void> {
            KESSAN_EXPECTED_ERROR_CHECK(loadAsset(id));
            SqlBigint asset_id = id;
            sql_ << "UPDATE fixed_assets SET is_deleted = 1 WHERE id = :id",
                soci::use(asset_id, "id");
            log_->debug("deleted fixed asset {}", id);
            return expected::makeValue();
          });
    }

    model::LedgerResult<void> SqlFixedAssetRegister::setDisposal(
        model::AssetIdType id,
        model::DisposalKind kind,
        const std::string &date,
        model::AmountType proceeds) {
      KESSAN_EXPECTED_TRY_GET_VALUE(disposal_date, model::parseDate(date));
      if (kind == model::DisposalKind::kSale and proceeds < 0) {
        return makeLedgerError(
            LedgerError::Kind::kValidation,
            fmt::format("sale proceeds must not be negative, got {}", proceeds));
      }
      return inTransaction(
          tx_, log_, "setDisposal", [&]() -> model::LedgerResult<void> {
            KESSAN_EXPECTED_TRY_GET_VALUE(asset, loadAsset(id));
            if (disposal_date < asset.acquisition_date) {
              return makeLedgerError(
                  LedgerError::Kind::kValidation,
                  fmt::format("disposal date {} precedes acquisition date {}",
                              date,
                              model::toIsoString(asset.acquisition_date)));
            }
            std::string kind_name{model::disposalKindName(kind)};
            auto iso_date = model::toIsoString(disposal_date);
            SqlBigint price =
                kind == model::DisposalKind::kSale ? proceeds : 0;
            SqlBigint asset_id = id;
            sql_ << "UPDATE fixed_assets SET disposal_type = :kind, "
                    "disposal_date = :date, disposal_price = :price "
                    "WHERE id = :id",
                soci::use(kind_name, "kind"), soci::use(iso_date, "date"),
                soci::use(price, "price"), soci::use(asset_id, "id");
            log_->debug("asset {} disposed by {} on {}", id, kind_name, iso_date);
            return expected::makeValue();
          });
    }

    model::LedgerResult<void> SqlFixedAssetRegister::cancelDisposal(
        model::AssetIdType id) {
      return inTransaction(
          tx_, log_, "cancelDisposal", [&]() -> model::LedgerResult<void> {
            KESSAN_EXPECTED_ERROR_CHECK(loadAsset(id));
            SqlBigint asset_id = id;
            sql_ << "UPDATE fixed_assets SET disposal_type = NULL, "
                    "disposal_date = NULL, disposal_price = NULL "
                    "WHERE id = :id",
                soci::use(asset_id, "id");
            log_->debug("cancelled disposal of asset {}", id);
            return expected::makeValue();
          });
    }

  }  // namespace books
}  // namespace kessan
