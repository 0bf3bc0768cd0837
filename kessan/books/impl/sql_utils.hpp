/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_BOOKS_SQL_UTILS_HPP
#define KESSAN_BOOKS_SQL_UTILS_HPP

#include <forward_list>
#include <string>
#include <utility>
#include <vector>

#include <soci/soci.h>
#include "model/account.hpp"
#include "model/date.hpp"
#include "model/tax_classification.hpp"

namespace kessan {
  namespace books {

    /// Integer type exchanged with soci for BIGINT columns
    using SqlBigint = long long;

    /**
     * Values bound by name to a statement assembled at run time. The values
     * are owned here and must outlive the statement execution.
     */
    class SqlParameters {
     public:
      void text(std::string name, std::string value);
      void number(std::string name, SqlBigint value);

      /// Bind every stored value to the statement
      void exchangeInto(soci::statement &statement);

     private:
      std::forward_list<std::pair<std::string, std::string>> texts_;
      std::forward_list<std::pair<std::string, SqlBigint>> numbers_;
    };

    /// @return "WHERE c1 AND c2 ..." or an empty string
    std::string whereClause(const std::vector<std::string> &conditions);

    /**
     * Prepare and execute a statement whose output variables and parameters
     * are already exchanged. Rows are then read with statement.fetch().
     */
    void executeStatement(soci::statement &statement, const std::string &query);

    /**
     * Conversions of stored column values. Stored data is written through
     * validated paths only, so a malformed value throws std::runtime_error,
     * which callers report as StorageError.
     */
    model::Date storedDate(const std::string &text);
    model::AccountCategory storedCategory(const std::string &text);
    model::TaxClassification storedClassification(const std::string &text);

  }  // namespace books
}  // namespace kessan

#endif  // KESSAN_BOOKS_SQL_UTILS_HPP
