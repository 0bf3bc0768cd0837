/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/files.hpp"

#include <ciso646>
#include <fstream>
#include <iterator>

#include <fmt/core.h>
#include <boost/filesystem.hpp>
#include "common/result.hpp"

kessan::expected::Result<std::string, std::string> kessan::readTextFile(
    const boost::filesystem::path &path) {
  std::ifstream file(path.string(), std::ios_base::in);
  if (not file) {
    return kessan::expected::makeError(
        fmt::format("File '{}' could not be read.", path.string()));
  }

  std::string contents((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
  return kessan::expected::makeValue(std::move(contents));
}
