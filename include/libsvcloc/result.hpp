#pragma once

#include "export.hpp"

#include <any>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace libsvcloc {

// ---------------------------------------------------------------
// error: message plus optional cause, payload and inner errors
// ---------------------------------------------------------------

class LIBSVCLOC_EXPORT error {
public:
    explicit error(std::string message,
                   std::exception_ptr exception = nullptr,
                   std::any payload = {});

    /// Build an error from a captured exception; the message is taken
    /// from what() when the exception derives from std::exception.
    static error from_exception(std::exception_ptr exception, std::any payload = {});

    /// Batch several errors into one, preserving each inner error.
    static error aggregate(std::vector<error> errors);

    const std::string& message() const noexcept { return message_; }
    std::exception_ptr exception() const noexcept { return exception_; }
    const std::any& payload() const noexcept { return payload_; }

    bool is_aggregate() const noexcept { return aggregate_; }
    const std::vector<error>& errors() const noexcept { return errors_; }

    /// Case-insensitive message comparison.
    bool is_similar_to(const error& other) const;

    /// Rethrow the original exception, or a std::runtime_error carrying
    /// message() when there is none.
    [[noreturn]] void raise() const;

    /// Call f(const E&) when exception() holds an E.  Returns whether it did.
    template <typename E, typename F>
    bool handle(F&& f) const {
        if (!exception_) return false;
        try {
            std::rethrow_exception(exception_);
        } catch (const E& e) {
            std::forward<F>(f)(e);
            return true;
        } catch (...) {
            // holds some other exception type
            return false;
        }
    }

private:
    std::string message_;
    std::exception_ptr exception_;
    std::any payload_;
    std::vector<error> errors_;
    bool aggregate_ = false;
};

// ---------------------------------------------------------------
// result<T>: success holding T, or failure holding an error
// ---------------------------------------------------------------

template <typename T>
class result {
public:
    using value_type = T;
    using error_type = libsvcloc::error;

    result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    result(error_type err) : state_(std::in_place_index<1>, std::move(err)) {}

    bool has_value() const noexcept { return state_.index() == 0; }
    bool is_error() const noexcept { return state_.index() == 1; }
    explicit operator bool() const noexcept { return has_value(); }

    /// Access the value; rethrows the error when this is a failure.
    T& value() & {
        if (is_error()) std::get<1>(state_).raise();
        return std::get<0>(state_);
    }
    const T& value() const& {
        if (is_error()) std::get<1>(state_).raise();
        return std::get<0>(state_);
    }

    /// Precondition: is_error().
    const error_type& error() const { return std::get<1>(state_); }

    T value_or(T fallback) const {
        return has_value() ? std::get<0>(state_) : std::move(fallback);
    }

    /// Invoke f(value) on success.
    template <typename F>
    result& then(F&& f) {
        if (has_value()) std::forward<F>(f)(std::get<0>(state_));
        return *this;
    }

    /// Invoke f(error) on failure.
    template <typename F>
    result& on_error(F&& f) {
        if (is_error()) std::forward<F>(f)(std::get<1>(state_));
        return *this;
    }

    /// Invoke f(const E&) when the failure was caused by an E.
    template <typename E, typename F>
    result& on_error(F&& f) {
        if (is_error()) std::get<1>(state_).template handle<E>(std::forward<F>(f));
        return *this;
    }

    result& throw_if_error() {
        if (is_error()) std::get<1>(state_).raise();
        return *this;
    }

    /// Rethrow only when the failure was caused by an E.
    template <typename E>
    result& throw_if_error() {
        if (is_error()) std::get<1>(state_).template handle<E>([](const E&) { throw; });
        return *this;
    }

    template <typename F>
    auto map(F&& f) const -> std::invoke_result_t<F, const result&> {
        return std::forward<F>(f)(*this);
    }

private:
    std::variant<T, error_type> state_;
};

template <>
class result<void> {
public:
    using value_type = void;
    using error_type = libsvcloc::error;

    result() = default;
    result(error_type err) : error_(std::move(err)) {}

    static result success() { return result(); }

    bool has_value() const noexcept { return !error_.has_value(); }
    bool is_error() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return has_value(); }

    /// Precondition: is_error().
    const error_type& error() const { return error_.value(); }

    template <typename F>
    result& then(F&& f) {
        if (has_value()) std::forward<F>(f)();
        return *this;
    }

    template <typename F>
    result& on_error(F&& f) {
        if (is_error()) std::forward<F>(f)(*error_);
        return *this;
    }

    template <typename E, typename F>
    result& on_error(F&& f) {
        if (is_error()) error_->handle<E>(std::forward<F>(f));
        return *this;
    }

    result& throw_if_error() {
        if (is_error()) error_->raise();
        return *this;
    }

    template <typename E>
    result& throw_if_error() {
        if (is_error()) error_->handle<E>([](const E&) { throw; });
        return *this;
    }

    template <typename F>
    auto map(F&& f) const -> std::invoke_result_t<F, const result&> {
        return std::forward<F>(f)(*this);
    }

private:
    std::optional<error_type> error_;
};

} // namespace libsvcloc
