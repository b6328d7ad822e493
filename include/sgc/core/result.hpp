#pragma once

/// @file result.hpp
/// @brief Value-or-error carrier used by the loading and parsing layers.
///
/// Rules files, replay scripts and command-line arguments come from
/// outside the process and may be wrong.  Those paths return a Result
/// so the caller decides whether to report and exit or fall back to
/// the shipped defaults.  The turn engine itself never produces one:
/// a refused action is an ActionStatus, not an error.

#include <type_traits>
#include <utility>
#include <variant>

namespace sgc {

template <typename T, typename E>
class Result;

namespace detail {

template <typename R>
struct IsResult : std::false_type {};

template <typename T, typename E>
struct IsResult<Result<T, E>> : std::true_type {};

} // namespace detail

/// Holds either a T or an E.  The error type is always spelled out;
/// within this project it is foundation::GameError (see GameResult).
///
/// @code
///   auto rules = config.load(path).andThen([&] { return loadRulesConfig(config); });
///   if (!rules) {
///       std::cerr << rules.error().message() << "\n";
///   }
/// @endcode
template <typename T, typename E>
class Result {
public:
    using ValueType = T;
    using ErrorType = E;

    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }
    explicit operator bool() const noexcept { return hasValue(); }

    /// Precondition: hasValue().
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    /// Precondition: hasError().
    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }
    [[nodiscard]] E& error() & { return std::get<1>(data_); }

    [[nodiscard]] T valueOr(T fallback) const& {
        return hasValue() ? value() : std::move(fallback);
    }

    /// Apply @p fn to the value; an error passes through untouched.
    template <typename F>
    [[nodiscard]] auto transform(F&& fn) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using Out = Result<std::invoke_result_t<F, const T&>, E>;
        if (hasError()) {
            return Out::err(error());
        }
        return Out::ok(std::forward<F>(fn)(value()));
    }

    /// Chain a step that can itself fail.  @p fn must return a Result
    /// with the same error type.
    template <typename F>
    [[nodiscard]] auto andThen(F&& fn) const& -> std::invoke_result_t<F, const T&> {
        using Out = std::invoke_result_t<F, const T&>;
        static_assert(detail::IsResult<Out>::value, "andThen step must return a Result");
        if (hasError()) {
            return Out::err(error());
        }
        return std::forward<F>(fn)(value());
    }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

    std::variant<T, E> data_;
};

/// Outcome of an operation that only reports success or failure.
template <typename E>
class Result<void, E> {
public:
    using ValueType = void;
    using ErrorType = E;

    static Result ok() { return Result(); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return !failed_; }
    [[nodiscard]] bool hasError() const noexcept { return failed_; }
    explicit operator bool() const noexcept { return !failed_; }

    /// Precondition: hasError().
    [[nodiscard]] const E& error() const& { return error_; }

    /// Run @p fn only when this step succeeded.
    template <typename F>
    [[nodiscard]] auto andThen(F&& fn) const& -> std::invoke_result_t<F> {
        using Out = std::invoke_result_t<F>;
        static_assert(detail::IsResult<Out>::value, "andThen step must return a Result");
        if (failed_) {
            return Out::err(error_);
        }
        return std::forward<F>(fn)();
    }

private:
    Result() = default;
    explicit Result(E error) : failed_(true), error_(std::move(error)) {}

    bool failed_ = false;
    E error_{};
};

} // namespace sgc
