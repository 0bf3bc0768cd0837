/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_FILES_HPP
#define KESSAN_FILES_HPP

#include <string>

#include <boost/filesystem/path.hpp>
#include "common/result_fwd.hpp"

/**
 * This source file contains common methods related to files
 */
namespace kessan {

  /**
   * Read file in text mode, and either return its contents as a string
   * or return the error as a string
   * @param path - path to the file
   */
  kessan::expected::Result<std::string, std::string> readTextFile(
      const boost::filesystem::path &path);

}  // namespace kessan
#endif  // KESSAN_FILES_HPP
