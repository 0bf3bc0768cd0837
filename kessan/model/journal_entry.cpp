/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "model/journal_entry.hpp"

namespace kessan {
  namespace model {

    const char *kManualSource = "manual";

  }  // namespace model
}  // namespace kessan
