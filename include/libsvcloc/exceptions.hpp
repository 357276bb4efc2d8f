#pragma once

#include "export.hpp"

#include <exception>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeindex>

namespace libsvcloc {

namespace internal {
/// Demangle a type_index to human-readable name (GCC/Clang ABI-based).
LIBSVCLOC_EXPORT std::string demangle(std::type_index type);
} // namespace internal

/// Failure categories raised by registration and resolution.
enum class error_kind {
    not_registered,
    invalid_registration,
    invalid_registration_shape,
    no_valid_constructor,
    type_mismatch,
    construction_failure,
    duplicate_registration
};

constexpr std::string_view to_string(error_kind kind) noexcept {
    constexpr std::string_view names[] = {
        "not_registered",
        "invalid_registration",
        "invalid_registration_shape",
        "no_valid_constructor",
        "type_mismatch",
        "construction_failure",
        "duplicate_registration"
    };
    return names[static_cast<int>(kind)];
}

class LIBSVCLOC_EXPORT di_error : public std::runtime_error {
public:
    explicit di_error(const std::string& message,
                      error_kind kind = error_kind::construction_failure,
                      std::source_location loc = std::source_location::current());

    error_kind kind() const noexcept { return kind_; }

    const std::source_location& location() const noexcept { return location_; }

    /// Set extended diagnostic detail (e.g. registration stacktrace).
    void set_diagnostic_detail(std::string detail);

    /// Get extended diagnostic detail (empty if none).
    const std::string& diagnostic_detail() const noexcept { return diagnostic_detail_; }

    /// Return what() plus diagnostic detail (if present), separated by newline.
    std::string full_diagnostic() const;

    /// Append resolution context to this exception.  When a factory resolves
    /// other services and one of them fails, each enclosing resolution
    /// appends its service so that what() shows the full chain, e.g.:
    ///   "... (while resolving B [impl: BImpl] -> A)"
    void append_resolution_context(const std::string& service_info);

    const char* what() const noexcept override;

private:
    error_kind kind_;
    std::source_location location_;
    std::string diagnostic_detail_;
    std::string resolution_context_;
    mutable std::string cached_what_;

    static std::string format_message(const std::string& msg,
                                      const std::source_location& loc);
};

/// Common base for failures tied to one service identifier.
class LIBSVCLOC_EXPORT service_error : public di_error {
public:
    service_error(std::type_index type, const std::string& message, error_kind kind,
                  std::source_location loc = std::source_location::current());

    std::type_index service_type() const noexcept { return service_type_; }

private:
    std::type_index service_type_;
};

class LIBSVCLOC_EXPORT not_registered : public service_error {
public:
    explicit not_registered(std::type_index type,
                            std::source_location loc = std::source_location::current());
};

class LIBSVCLOC_EXPORT invalid_registration : public service_error {
public:
    invalid_registration(std::type_index type, std::string_view reason,
                         std::source_location loc = std::source_location::current());
};

class LIBSVCLOC_EXPORT invalid_registration_shape : public service_error {
public:
    explicit invalid_registration_shape(std::type_index type,
                                        std::source_location loc = std::source_location::current());
};

class LIBSVCLOC_EXPORT no_valid_constructor : public service_error {
public:
    no_valid_constructor(std::type_index type, std::type_index impl_type,
                         std::source_location loc = std::source_location::current());

    std::type_index impl_type() const noexcept { return impl_type_; }

private:
    std::type_index impl_type_;
};

class LIBSVCLOC_EXPORT type_mismatch : public service_error {
public:
    type_mismatch(std::type_index type, std::type_index provided_type,
                  std::source_location loc = std::source_location::current());

    std::type_index provided_type() const noexcept { return provided_type_; }

private:
    std::type_index provided_type_;
};

class LIBSVCLOC_EXPORT construction_failure : public service_error {
public:
    /// Wraps an exception that escaped a factory or constructor.
    construction_failure(std::type_index type, const std::exception& inner,
                         std::source_location registration_loc,
                         std::exception_ptr inner_ptr = nullptr);

    /// A factory produced no object, or threw something that is not a
    /// std::exception (kept as inner()).
    construction_failure(std::type_index type, std::string_view reason,
                         std::source_location loc = std::source_location::current(),
                         std::exception_ptr inner_ptr = nullptr);

    /// The original exception, when one was thrown.
    std::exception_ptr inner() const noexcept { return inner_; }

private:
    std::exception_ptr inner_;
};

class LIBSVCLOC_EXPORT duplicate_registration : public service_error {
public:
    explicit duplicate_registration(std::type_index type,
                                    std::source_location loc = std::source_location::current());
};

} // namespace libsvcloc
