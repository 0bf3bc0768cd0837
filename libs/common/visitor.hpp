/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_VISITOR_HPP
#define KESSAN_VISITOR_HPP

#include <type_traits>
#include <utility>

#include <boost/variant/apply_visitor.hpp>

namespace kessan {

  /// Combines several lambdas into one overloaded callable
  template <typename... Lambdas>
  struct LambdaVisitor : Lambdas... {
    using Lambdas::operator()...;
  };

  template <typename... Lambdas>
  LambdaVisitor(Lambdas...) -> LambdaVisitor<Lambdas...>;

  template <typename... Lambdas>
  constexpr auto makeVisitor(Lambdas &&... lambdas) {
    return LambdaVisitor<std::decay_t<Lambdas>...>{
        std::forward<Lambdas>(lambdas)...};
  }

  /**
   * Apply a set of lambdas to a boost::variant in place, e.g.
   * @code
   * visit_in_place(variant,
   *                [](const int &i) { ... },
   *                [](const std::string &s) { ... });
   * @nocode
   */
  template <typename TVariant, typename... TVisitors>
  constexpr decltype(auto) visit_in_place(TVariant &&variant,
                                          TVisitors &&... visitors) {
    return boost::apply_visitor(
        makeVisitor(std::forward<TVisitors>(visitors)...),
        std::forward<TVariant>(variant));
  }

}  // namespace kessan

#endif  // KESSAN_VISITOR_HPP
