// ouro/basic/result.hpp - Value-or-error result type (C++17 compatible)
#pragma once

#include <utility>
#include <variant>

namespace ouro
{

/**
 * Holds either a success value T or a single error E.
 *
 * Used by the lexer and parser, which stop at their first error. T and E
 * must be distinct types.
 */
template <typename T, typename E>
class Result
{
  static_assert(!std::is_same_v<T, E>, "Result<T, E> requires distinct value and error types");

public:
  using ValueType = T;
  using ErrorType = E;

  Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
  Result(E error) : data_(std::in_place_index<1>, std::move(error)) {}

  [[nodiscard]] bool has_value() const noexcept { return data_.index() == 0; }
  [[nodiscard]] bool has_error() const noexcept { return data_.index() == 1; }

  explicit operator bool() const noexcept { return has_value(); }

  T & value() & { return std::get<0>(data_); }
  [[nodiscard]] const T & value() const & { return std::get<0>(data_); }
  T && value() && { return std::get<0>(std::move(data_)); }

  E & error() & { return std::get<1>(data_); }
  [[nodiscard]] const E & error() const & { return std::get<1>(data_); }
  E && error() && { return std::get<1>(std::move(data_)); }

  T * operator->() { return &value(); }
  const T * operator->() const { return &value(); }
  T & operator*() & { return value(); }
  const T & operator*() const & { return value(); }

private:
  std::variant<T, E> data_;
};

}  // namespace ouro
