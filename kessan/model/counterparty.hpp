/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_MODEL_COUNTERPARTY_HPP
#define KESSAN_MODEL_COUNTERPARTY_HPP

#include <string>

#include "model/types.hpp"

namespace kessan {
  namespace model {

    struct Counterparty {
      CounterpartyIdType id{};
      std::string name;
      std::string code;
      std::string contact_info;
      std::string notes;
      bool is_active{true};
    };

  }  // namespace model
}  // namespace kessan

#endif  // KESSAN_MODEL_COUNTERPARTY_HPP
