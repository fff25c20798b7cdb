/**
 * @file expected.h
 * @brief Expected<T, E>: value-or-error return type (C++17)
 *
 * Subset of std::expected (C++23) sufficient for mvdispatch:
 * - Expected<T, E> and Expected<void, E>
 * - MakeUnexpected() to build the error alternative
 * - value_or, transform, and_then, or_else, transform_error
 *
 * value() on an error throws BadExpectedAccess<E>; callers are expected
 * to check has_value() / operator bool first.
 */

#pragma once

#include <exception>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace mvdispatch::utils {

/**
 * @brief Wrapper marking a value as the error alternative
 */
template <typename E>
class Unexpected {
 public:
  explicit Unexpected(E error) : error_(std::move(error)) {}

  const E& error() const& { return error_; }
  E& error() & { return error_; }
  E&& error() && { return std::move(error_); }

 private:
  E error_;
};

/**
 * @brief Create an Unexpected from an error value
 */
template <typename E>
Unexpected<std::decay_t<E>> MakeUnexpected(E&& error) {
  return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

/**
 * @brief Thrown by value() when the Expected holds an error
 */
template <typename E>
class BadExpectedAccess : public std::exception {
 public:
  explicit BadExpectedAccess(E error) : error_(std::move(error)) {}

  const char* what() const noexcept override { return "Bad Expected access: contains error"; }

  const E& error() const { return error_; }

 private:
  E error_;
};

namespace detail {

template <typename T>
struct IsUnexpected : std::false_type {};

template <typename E>
struct IsUnexpected<Unexpected<E>> : std::true_type {};

}  // namespace detail

template <typename T, typename E>
class Expected;

template <typename T>
struct IsExpected : std::false_type {};

template <typename T, typename E>
struct IsExpected<Expected<T, E>> : std::true_type {};

/**
 * @brief Holds either a value of type T or an error of type E
 */
template <typename T, typename E>
class Expected {
 public:
  using value_type = T;
  using error_type = E;

  Expected() : storage_(std::in_place_index<0>) {}

  template <typename U = T,
            typename = std::enable_if_t<std::is_constructible_v<T, U&&> &&
                                        !std::is_same_v<std::decay_t<U>, Expected> &&
                                        !detail::IsUnexpected<std::decay_t<U>>::value>>
  Expected(U&& value)  // NOLINT(google-explicit-constructor)
      : storage_(std::in_place_index<0>, std::forward<U>(value)) {}

  template <typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
  Expected(const Unexpected<G>& unexpected)  // NOLINT(google-explicit-constructor)
      : storage_(std::in_place_index<1>, unexpected.error()) {}

  template <typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
  Expected(Unexpected<G>&& unexpected)  // NOLINT(google-explicit-constructor)
      : storage_(std::in_place_index<1>, std::move(unexpected).error()) {}

  bool has_value() const { return storage_.index() == 0; }
  explicit operator bool() const { return has_value(); }

  T& value() & {
    ThrowIfError();
    return std::get<0>(storage_);
  }
  const T& value() const& {
    ThrowIfError();
    return std::get<0>(storage_);
  }
  T&& value() && {
    ThrowIfError();
    return std::get<0>(std::move(storage_));
  }

  T& operator*() & { return std::get<0>(storage_); }
  const T& operator*() const& { return std::get<0>(storage_); }
  T&& operator*() && { return std::get<0>(std::move(storage_)); }

  T* operator->() { return &std::get<0>(storage_); }
  const T* operator->() const { return &std::get<0>(storage_); }

  E& error() & { return std::get<1>(storage_); }
  const E& error() const& { return std::get<1>(storage_); }
  E&& error() && { return std::get<1>(std::move(storage_)); }

  template <typename U>
  T value_or(U&& default_value) const& {
    return has_value() ? **this : static_cast<T>(std::forward<U>(default_value));
  }

  template <typename U>
  T value_or(U&& default_value) && {
    return has_value() ? std::move(**this) : static_cast<T>(std::forward<U>(default_value));
  }

  /**
   * @brief Map the value, propagate the error
   */
  template <typename F>
  auto transform(F&& func) const& {
    using U = std::remove_cv_t<std::invoke_result_t<F, const T&>>;
    if constexpr (std::is_void_v<U>) {
      if (!has_value()) {
        return Expected<void, E>(MakeUnexpected(error()));
      }
      std::invoke(std::forward<F>(func), **this);
      return Expected<void, E>();
    } else {
      if (!has_value()) {
        return Expected<U, E>(MakeUnexpected(error()));
      }
      return Expected<U, E>(std::invoke(std::forward<F>(func), **this));
    }
  }

  /**
   * @brief Chain an operation returning Expected<U, E>
   */
  template <typename F>
  auto and_then(F&& func) const& {
    using Result = std::remove_cv_t<std::invoke_result_t<F, const T&>>;
    static_assert(IsExpected<Result>::value, "and_then callback must return Expected");
    if (!has_value()) {
      return Result(MakeUnexpected(error()));
    }
    return std::invoke(std::forward<F>(func), **this);
  }

  /**
   * @brief Recover from an error with an operation returning Expected<T, E>
   */
  template <typename F>
  Expected or_else(F&& func) const& {
    if (has_value()) {
      return *this;
    }
    return std::invoke(std::forward<F>(func), error());
  }

  /**
   * @brief Map the error, keep the value
   */
  template <typename F>
  auto transform_error(F&& func) const& {
    using G = std::remove_cv_t<std::invoke_result_t<F, const E&>>;
    if (has_value()) {
      return Expected<T, G>(**this);
    }
    return Expected<T, G>(MakeUnexpected(std::invoke(std::forward<F>(func), error())));
  }

 private:
  void ThrowIfError() const {
    if (!has_value()) {
      throw BadExpectedAccess<E>(std::get<1>(storage_));
    }
  }

  std::variant<T, E> storage_;
};

/**
 * @brief Specialization for operations that return no value
 */
template <typename E>
class Expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  Expected() = default;

  template <typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
  Expected(const Unexpected<G>& unexpected)  // NOLINT(google-explicit-constructor)
      : error_(unexpected.error()) {}

  template <typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
  Expected(Unexpected<G>&& unexpected)  // NOLINT(google-explicit-constructor)
      : error_(std::move(unexpected).error()) {}

  bool has_value() const { return !error_.has_value(); }
  explicit operator bool() const { return has_value(); }

  void value() const {
    if (error_.has_value()) {
      throw BadExpectedAccess<E>(*error_);
    }
  }

  E& error() & { return *error_; }
  const E& error() const& { return *error_; }
  E&& error() && { return std::move(*error_); }

  template <typename F>
  auto transform(F&& func) const& {
    using U = std::remove_cv_t<std::invoke_result_t<F>>;
    if constexpr (std::is_void_v<U>) {
      if (!has_value()) {
        return Expected<void, E>(MakeUnexpected(error()));
      }
      std::invoke(std::forward<F>(func));
      return Expected<void, E>();
    } else {
      if (!has_value()) {
        return Expected<U, E>(MakeUnexpected(error()));
      }
      return Expected<U, E>(std::invoke(std::forward<F>(func)));
    }
  }

  template <typename F>
  auto and_then(F&& func) const& {
    using Result = std::remove_cv_t<std::invoke_result_t<F>>;
    static_assert(IsExpected<Result>::value, "and_then callback must return Expected");
    if (!has_value()) {
      return Result(MakeUnexpected(error()));
    }
    return std::invoke(std::forward<F>(func));
  }

  template <typename F>
  Expected or_else(F&& func) const& {
    if (has_value()) {
      return *this;
    }
    return std::invoke(std::forward<F>(func), error());
  }

  template <typename F>
  auto transform_error(F&& func) const& {
    using G = std::remove_cv_t<std::invoke_result_t<F, const E&>>;
    if (has_value()) {
      return Expected<void, G>();
    }
    return Expected<void, G>(MakeUnexpected(std::invoke(std::forward<F>(func), error())));
  }

 private:
  std::optional<E> error_;
};

}  // namespace mvdispatch::utils
