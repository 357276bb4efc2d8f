#include "libsvcloc/exceptions.hpp"

#include <cstdlib>
#include <memory>
#include <new>
#include <string>
#include <typeindex>

#if defined(__GNUC__)
#include <cxxabi.h>
#endif

namespace libsvcloc {

namespace internal {

std::string demangle(std::type_index type) {
#if defined(__GNUC__)
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status),
        &std::free);
    if (status == 0 && demangled) {
        return std::string(demangled.get());
    }
#endif
    return std::string(type.name());
}

} // namespace internal

// ---------------------------------------------------------------
// di_error
// ---------------------------------------------------------------

std::string di_error::format_message(const std::string& msg,
                                     const std::source_location& loc) {
    if (!loc.file_name()[0]) {
        return msg;
    }
    return msg + " [at " + loc.file_name() + ":"
           + std::to_string(loc.line()) + "]";
}

di_error::di_error(const std::string& message, error_kind kind,
                   std::source_location loc)
    : std::runtime_error(format_message(message, loc))
    , kind_(kind)
    , location_(loc)
{}

void di_error::set_diagnostic_detail(std::string detail) {
    diagnostic_detail_ = std::move(detail);
}

void di_error::append_resolution_context(const std::string& service_info) {
    if (!resolution_context_.empty()) {
        resolution_context_ += " -> ";
    }
    resolution_context_ += service_info;
    cached_what_.clear();
}

const char* di_error::what() const noexcept {
    if (resolution_context_.empty()) {
        return std::runtime_error::what();
    }
    if (cached_what_.empty()) {
        try {
            cached_what_ = std::string(std::runtime_error::what())
                           + " (while resolving " + resolution_context_ + ")";
        } catch (const std::bad_alloc&) {
            return std::runtime_error::what();
        }
    }
    return cached_what_.c_str();
}

std::string di_error::full_diagnostic() const {
    if (diagnostic_detail_.empty()) {
        return what();
    }
    return std::string(what()) + "\n" + diagnostic_detail_;
}

// ---------------------------------------------------------------
// Typed failures
// ---------------------------------------------------------------

service_error::service_error(std::type_index type, const std::string& message,
                             error_kind kind, std::source_location loc)
    : di_error(message, kind, loc)
    , service_type_(type)
{}

not_registered::not_registered(std::type_index type, std::source_location loc)
    : service_error(type, "Service not registered: " + internal::demangle(type),
                    error_kind::not_registered, loc)
{}

invalid_registration::invalid_registration(std::type_index type,
                                           std::string_view reason,
                                           std::source_location loc)
    : service_error(type, "Invalid registration for " + internal::demangle(type)
                          + ": " + std::string(reason),
                    error_kind::invalid_registration, loc)
{}

invalid_registration_shape::invalid_registration_shape(std::type_index type,
                                                       std::source_location loc)
    : service_error(type, "Invalid registration for " + internal::demangle(type)
                          + ": stored value is neither an instance, a factory nor a type",
                    error_kind::invalid_registration_shape, loc)
{}

no_valid_constructor::no_valid_constructor(std::type_index type,
                                           std::type_index impl_type,
                                           std::source_location loc)
    : service_error(type, "Invalid registration for " + internal::demangle(type)
                          + ": " + internal::demangle(impl_type)
                          + " has no public parameterless constructor",
                    error_kind::no_valid_constructor, loc)
    , impl_type_(impl_type)
{}

type_mismatch::type_mismatch(std::type_index type, std::type_index provided_type,
                             std::source_location loc)
    : service_error(type, "Invalid registration for " + internal::demangle(type)
                          + ": provided object is "
                          + internal::demangle(provided_type),
                    error_kind::type_mismatch, loc)
    , provided_type_(provided_type)
{}

construction_failure::construction_failure(std::type_index type,
                                           const std::exception& inner,
                                           std::source_location registration_loc,
                                           std::exception_ptr inner_ptr)
    : service_error(type, "Failed to construct " + internal::demangle(type)
                          + ": " + inner.what(),
                    error_kind::construction_failure, registration_loc)
    , inner_(std::move(inner_ptr))
{}

construction_failure::construction_failure(std::type_index type,
                                           std::string_view reason,
                                           std::source_location loc,
                                           std::exception_ptr inner_ptr)
    : service_error(type, "Failed to construct " + internal::demangle(type)
                          + ": " + std::string(reason),
                    error_kind::construction_failure, loc)
    , inner_(std::move(inner_ptr))
{}

duplicate_registration::duplicate_registration(std::type_index type,
                                               std::source_location loc)
    : service_error(type, "Duplicate registration for: " + internal::demangle(type),
                    error_kind::duplicate_registration, loc)
{}

} // namespace libsvcloc
