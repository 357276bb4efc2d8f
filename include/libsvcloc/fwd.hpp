#pragma once

/// @file fwd.hpp
/// Forward declarations for all public libsvcloc symbols.
/// Include this header when you only need to name a type (pointers,
/// references, function parameters) without requiring its full definition.

#include "export.hpp"

namespace libsvcloc {

// result.hpp
class error;
template <typename T>
class result;

// exceptions.hpp
enum class error_kind;
class di_error;
class service_error;
class not_registered;
class invalid_registration;
class invalid_registration_shape;
class no_valid_constructor;
class type_mismatch;
class construction_failure;
class duplicate_registration;

// descriptor.hpp
enum class registration_kind;
struct instance_registration;
struct factory_registration;
struct type_registration;
struct descriptor;

// registry.hpp
enum class duplicate_policy;
struct registry_options;
class registry;

// resolver.hpp
class resolver;

// locator.hpp
class locator;

} // namespace libsvcloc
