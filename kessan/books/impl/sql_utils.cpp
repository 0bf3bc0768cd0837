/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "books/impl/sql_utils.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace kessan {
  namespace books {

    void SqlParameters::text(std::string name, std::string value) {
      texts_.emplace_front(std::move(name), std::move(value));
    }

    void SqlParameters::number(std::string name, SqlBigint value) {
      numbers_.emplace_front(std::move(name), value);
    }

    void SqlParameters::exchangeInto(soci::statement &statement) {
      for (auto &text : texts_) {
        statement.exchange(soci::use(text.second, text.first));
      }
      for (auto &number : numbers_) {
        statement.exchange(soci::use(number.second, number.first));
      }
    }

    std::string whereClause(const std::vector<std::string> &conditions) {
      if (conditions.empty()) {
        return {};
      }
      std::string clause = "WHERE ";
      for (size_t i = 0; i < conditions.size(); ++i) {
        if (i != 0) {
          clause += " AND ";
        }
        clause += conditions[i];
      }
      return clause;
    }

    void executeStatement(soci::statement &statement,
                          const std::string &query) {
      statement.alloc();
      statement.prepare(query);
      statement.define_and_bind();
      statement.execute(false);
    }

    model::Date storedDate(const std::string &text) {
      return model::parseDate(text).match(
          [](auto &&date) { return date.value; },
          [&text](auto &&) -> model::Date {
            throw std::runtime_error(
                fmt::format("malformed stored date '{}'", text));
          });
    }

    model::AccountCategory storedCategory(const std::string &text) {
      if (auto category = model::categoryFromString(text)) {
        return *category;
      }
      throw std::runtime_error(
          fmt::format("unknown stored account type '{}'", text));
    }

    model::TaxClassification storedClassification(const std::string &text) {
      if (auto classification = model::classificationFromString(text)) {
        return *classification;
      }
      throw std::runtime_error(
          fmt::format("unknown stored tax classification '{}'", text));
    }

  }  // namespace books
}  // namespace kessan
