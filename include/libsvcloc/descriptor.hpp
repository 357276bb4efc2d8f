#pragma once

#include "export.hpp"

#include <any>
#include <functional>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <typeindex>
#include <variant>

namespace libsvcloc {

/// Produces one type-erased object.  The pointer is always erased from a
/// `shared_ptr<S>` where S is the registration's `provided_type`, so a
/// `static_pointer_cast<S>` round-trips exactly.
using factory_fn = std::function<std::shared_ptr<void>()>;

enum class registration_kind {
    instance,
    factory,
    type,
    invalid
};

constexpr std::string_view to_string(registration_kind kind) noexcept {
    constexpr std::string_view names[] = {"instance", "factory", "type", "invalid"};
    return names[static_cast<int>(kind)];
}

// ---------------------------------------------------------------
// Registration shapes
// ---------------------------------------------------------------

/// Pre-built object, shared by the registry and every resolver returning it.
struct instance_registration {
    std::shared_ptr<void> instance;
    std::type_index provided_type;
};

/// Zero-argument producer, invoked once per create().
struct factory_registration {
    factory_fn factory;
    std::type_index provided_type;
};

/// Concrete type constructed through its parameterless constructor.
/// `construct` is empty when `impl_type` has no accessible one.
struct type_registration {
    std::type_index impl_type;
    factory_fn construct;
    std::type_index provided_type;
};

using registration_value = std::variant<std::monostate,
                                        instance_registration,
                                        factory_registration,
                                        type_registration>;

// ---------------------------------------------------------------
// descriptor: one service registration record
// ---------------------------------------------------------------

struct descriptor {
    std::type_index    service_type = std::type_index(typeid(void));
    registration_value value;
    std::optional<std::type_index> impl_type;

    // Diagnostic metadata
    std::source_location registration_location;
    std::string          api_name;               // e.g. "add_type"
    std::any             registration_stacktrace; // boost::stacktrace when enabled

    registration_kind kind() const noexcept {
        switch (value.index()) {
            case 1: return registration_kind::instance;
            case 2: return registration_kind::factory;
            case 3: return registration_kind::type;
            default: return registration_kind::invalid;
        }
    }
};

} // namespace libsvcloc
