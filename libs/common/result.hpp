/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KESSAN_RESULT_HPP
#define KESSAN_RESULT_HPP

#include "common/result_fwd.hpp"

#include <ciso646>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include "common/visitor.hpp"

/*
 * Result is a type which represents value or an error, and values and errors
 * are template parametrized. Working with value wrapped in result is done using
 * match() function, which accepts 2 functions: for value and error cases.
 */

namespace kessan {
  namespace expected {

    struct ValueBase {};

    template <typename T>
    struct Value : ValueBase {
      using type = T;
      template <
          typename... Args,
          typename = std::enable_if_t<std::is_constructible<T, Args...>::value>>
      Value(Args &&... args) : value(std::forward<Args>(args)...) {}
      T value;
      template <typename V>
      operator Value<V>() {
        return {value};
      }
    };

    template <>
    struct Value<void> : ValueBase {
      using type = void;
    };

    struct ErrorBase {};

    template <typename E>
    struct Error : ErrorBase {
      using type = E;
      template <
          typename... Args,
          typename = std::enable_if_t<std::is_constructible<E, Args...>::value>>
      Error(Args &&... args) : error(std::forward<Args>(args)...) {}
      E error;
      template <typename V>
      operator Error<V>() {
        return {error};
      }
    };

    template <>
    struct Error<void> : ErrorBase {
      using type = void;
    };

    class ResultException : public std::runtime_error {
      using std::runtime_error::runtime_error;
    };

    struct ResultBase {};

    /**
     * Result is a specialization of a variant type with value or error
     * semantics.
     * @tparam V type of value
     * @tparam E error type
     */
    template <typename V, typename E = std::string>
    class Result : ResultBase, public boost::variant<Value<V>, Error<E>> {
      using variant_type = boost::variant<Value<V>, Error<E>>;

     public:
      using variant_type::variant_type;  // inherit constructors

      using ValueType = Value<V>;
      using ErrorType = Error<E>;

      using ValueInnerType = V;
      using ErrorInnerType = E;

      Result() = default;

      /**
       * match is a function which allows working with result's underlying
       * types, you must provide 2 functions to cover success and failure cases.
       * Return type of both functions must be the same. Example usage:
       * @code
       * result.match([](Value<int> v) { std::cout << v.value; },
       *              [](Error<std::string> e) { std::cout << e.error; });
       * @nocode
       */
      template <typename ValueMatch, typename ErrorMatch>
      constexpr auto match(ValueMatch &&value_func, ErrorMatch &&error_func) & {
        return visit_in_place(static_cast<variant_type &>(*this),
                              [&value_func](ValueType &v) {
                                return value_func(v);
                              },
                              [&error_func](ErrorType &e) {
                                return error_func(e);
                              });
      }

      /**
       * Move alternative for match function
       */
      template <typename ValueMatch, typename ErrorMatch>
      constexpr auto match(ValueMatch &&value_func,
                           ErrorMatch &&error_func) && {
        return visit_in_place(static_cast<variant_type &>(*this),
                              [&value_func](ValueType &v) {
                                return value_func(std::move(v));
                              },
                              [&error_func](ErrorType &e) {
                                return error_func(std::move(e));
                              });
      }

      /**
       * Const alternative for match function
       */
      template <typename ValueMatch, typename ErrorMatch>
      constexpr auto match(ValueMatch &&value_func,
                           ErrorMatch &&error_func) const & {
        return visit_in_place(static_cast<const variant_type &>(*this),
                              [&value_func](const ValueType &v) {
                                return value_func(v);
                              },
                              [&error_func](const ErrorType &e) {
                                return error_func(e);
                              });
      }

      using AssumeValueHelper =
          std::conditional_t<std::is_void<ValueInnerType>::value,
                             void *,
                             ValueInnerType>;

      /// @return value if present, otherwise throw ResultException
      template <typename ReturnType = const AssumeValueHelper &>
      std::enable_if_t<not std::is_void<ValueInnerType>::value, ReturnType>
      assumeValue() const & {
        const auto *val = boost::get<ValueType>(this);
        if (val != nullptr) {
          return val->value;
        }
        throw ResultException("Value expected, but got an Error.");
      }

      /// @return value if present, otherwise throw ResultException
      template <typename ReturnType = AssumeValueHelper &>
      std::enable_if_t<not std::is_void<ValueInnerType>::value, ReturnType>
      assumeValue() & {
        auto *val = boost::get<ValueType>(this);
        if (val != nullptr) {
          return val->value;
        }
        throw ResultException("Value expected, but got an Error.");
      }

      /// @return value if present, otherwise throw ResultException
      template <typename ReturnType = AssumeValueHelper &&>
      std::enable_if_t<not std::is_void<ValueInnerType>::value, ReturnType>
      assumeValue() && {
        auto *val = boost::get<ValueType>(this);
        if (val != nullptr) {
          return std::move(val->value);
        }
        throw ResultException("Value expected, but got an Error.");
      }

      using AssumeErrorHelper =
          std::conditional_t<std::is_void<ErrorInnerType>::value,
                             void *,
                             ErrorInnerType>;

      /// @return error if present, otherwise throw ResultException
      template <typename ReturnType = const AssumeErrorHelper &>
      std::enable_if_t<not std::is_void<ErrorInnerType>::value, ReturnType>
      assumeError() const & {
        const auto *err = boost::get<ErrorType>(this);
        if (err != nullptr) {
          return err->error;
        }
        throw ResultException("Error expected, but got a Value.");
      }

      /// @return error if present, otherwise throw ResultException
      template <typename ReturnType = AssumeErrorHelper &>
      std::enable_if_t<not std::is_void<ErrorInnerType>::value, ReturnType>
      assumeError() & {
        auto *err = boost::get<ErrorType>(this);
        if (err != nullptr) {
          return err->error;
        }
        throw ResultException("Error expected, but got a Value.");
      }

      /// @return error if present, otherwise throw ResultException
      template <typename ReturnType = AssumeErrorHelper &&>
      std::enable_if_t<not std::is_void<ErrorInnerType>::value, ReturnType>
      assumeError() && {
        auto *err = boost::get<ErrorType>(this);
        if (err != nullptr) {
          return std::move(err->error);
        }
        throw ResultException("Error expected, but got a Value.");
      }
    };

    template <typename ResultType>
    using ValueOf = typename std::decay_t<ResultType>::ValueType;
    template <typename ResultType>
    using ErrorOf = typename std::decay_t<ResultType>::ErrorType;

    template <typename ResultType>
    using InnerValueOf = typename std::decay_t<ResultType>::ValueInnerType;
    template <typename ResultType>
    using InnerErrorOf = typename std::decay_t<ResultType>::ErrorInnerType;

    // Factories deducing the wrapped type
    inline Value<void> makeValue() {
      return Value<void>{};
    }

    template <typename T>
    Value<std::decay_t<T>> makeValue(T &&value) {
      return Value<std::decay_t<T>>{std::forward<T>(value)};
    }

    inline Error<void> makeError() {
      return Error<void>{};
    }

    template <typename E>
    Error<std::decay_t<E>> makeError(E &&error) {
      return Error<std::decay_t<E>>{std::forward<E>(error)};
    }

    template <typename T>
    constexpr bool isResult =
        std::is_base_of<ResultBase, std::decay_t<T>>::value;
    template <typename T>
    constexpr bool isValue = std::is_base_of<ValueBase, std::decay_t<T>>::value;

    /**
     * A struct that provides the result type conversion for bind operator.
     * @tparam Transformed The type returned by value transformation function.
     * @tparam ErrorType The type of former result's error
     */
    template <typename Transformed, typename ErrorType, typename = void>
    struct BindReturnType;

    /// Case when transformation function returns unwrapped value.
    template <typename Transformed, typename ErrorType>
    struct BindReturnType<
        Transformed,
        ErrorType,
        typename std::enable_if_t<not isResult<Transformed>
                                  and not isValue<Transformed>
                                  and not std::is_void<Transformed>::value>> {
      using ReturnType = Result<Transformed, ErrorType>;
      static ReturnType makeValue(Transformed &&result) {
        return kessan::expected::makeValue(std::move(result));
      }
    };

    /// Case when transformation function returns Result.
    template <typename Transformed, typename ErrorType>
    struct BindReturnType<Transformed,
                          ErrorType,
                          std::enable_if_t<isResult<Transformed>>> {
      using ReturnType = Transformed;
      static ReturnType makeValue(Transformed &&result) {
        return std::move(result);
      }
    };

    /**
     * Bind operator allows chaining several functions which return result. If
     * result contains error, it returns this error, if it contains value,
     * function f is called.
     */
    template <typename V,
              typename E,
              typename Transform,
              typename TypeHelper = BindReturnType<
                  decltype(std::declval<Transform>()(std::declval<V>())),
                  E>,
              typename ReturnType = typename TypeHelper::ReturnType>
    auto operator|(Result<V, E> &&r, Transform &&f) -> ReturnType {
      return std::move(r).match(
          [&f](auto &&v) {
            return ReturnType(TypeHelper::makeValue(f(std::move(v.value))));
          },
          [](auto &&e) { return ReturnType(makeError(std::move(e.error))); });
    }

    /// Bind operator overload for a procedure which accepts no parameters
    template <typename E,
              typename Procedure,
              typename TypeHelper =
                  BindReturnType<decltype(std::declval<Procedure>()()), E>,
              typename ReturnType = typename TypeHelper::ReturnType>
    auto operator|(Result<void, E> &&r, Procedure &&f) -> ReturnType {
      return std::move(r).match(
          [&f](auto &&) { return ReturnType(TypeHelper::makeValue(f())); },
          [](auto &&e) { return ReturnType(makeError(std::move(e.error))); });
    }

    /**
     * Checkers of the Result type.
     */

    template <typename ResultType,
              typename = std::enable_if_t<isResult<ResultType>>>
    bool hasValue(const ResultType &result) {
      return boost::get<ValueOf<ResultType>>(&result) != nullptr;
    }

    template <typename ResultType,
              typename = std::enable_if_t<isResult<ResultType>>>
    bool hasError(const ResultType &result) {
      return boost::get<ErrorOf<ResultType>>(&result) != nullptr;
    }

    /// @return optional with value if present, otherwise none
    template <typename ResultType,
              typename = std::enable_if_t<isResult<ResultType>>>
    boost::optional<InnerValueOf<ResultType>> resultToOptionalValue(
        ResultType &&res) noexcept {
      if (hasValue(res)) {
        return boost::get<ValueOf<ResultType>>(std::forward<ResultType>(res))
            .value;
      }
      return {};
    }

    /// @return optional with error if present, otherwise none
    template <typename ResultType,
              typename = std::enable_if_t<isResult<ResultType>>>
    boost::optional<InnerErrorOf<ResultType>> resultToOptionalError(
        ResultType &&res) noexcept {
      if (hasError(res)) {
        return boost::get<ErrorOf<ResultType>>(std::forward<ResultType>(res))
            .error;
      }
      return {};
    }
  }  // namespace expected
}  // namespace kessan
#endif  // KESSAN_RESULT_HPP
