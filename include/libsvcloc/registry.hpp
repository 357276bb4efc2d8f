#pragma once

#include "export.hpp"
#include "descriptor.hpp"
#include "exceptions.hpp"
#include "type_traits.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <source_location>
#include <typeindex>
#include <type_traits>
#include <utility>
#include <vector>

namespace libsvcloc {

/// What add*() does when the service type already has a registration.
enum class duplicate_policy {
    replace,    // last write wins
    reject,     // throw duplicate_registration
    skip        // first write wins, later adds are ignored
};

struct registry_options {
    duplicate_policy on_duplicate = duplicate_policy::replace;

    /// Capture a stacktrace at every registration and attach it to
    /// resolution failures.  Requires LIBSVCLOC_HAS_STACKTRACE.
    bool capture_stacktrace = false;
};

namespace detail {

/// Construction closure for a type registration; empty when TImpl has no
/// accessible parameterless constructor.
template <typename TService, typename TImpl>
factory_fn make_constructor() {
    if constexpr (parameterless_constructible_v<TImpl>) {
        return []() -> std::shared_ptr<void> {
            return erase_as<TService>(std::make_shared<TImpl>());
        };
    } else {
        return {};
    }
}

} // namespace detail

// ---------------------------------------------------------------
// registry
// ---------------------------------------------------------------

/// Insertion-ordered store of at most one registration per service type.
///
/// Not thread-safe: concurrent writers must synchronize externally, and a
/// write racing a resolution through any resolver bound to this registry is
/// undefined behaviour.
class LIBSVCLOC_EXPORT registry {
public:
    explicit registry(registry_options options = {});
    ~registry();

    registry(const registry&) = delete;
    registry& operator=(const registry&) = delete;
    registry(registry&&) noexcept;
    registry& operator=(registry&&) noexcept;

    // ===============================================================
    // Type registration
    // ===============================================================

    /// Register TService as its own concrete type.
    template <typename TService>
    registry& add_type(std::source_location loc = std::source_location::current()) {
        return add_type<TService, TService>(loc);
    }

    /// Register TImpl as the concrete type behind TService.  TImpl's
    /// parameterless constructor is looked up here but only required when
    /// the service is resolved.
    template <typename TService, typename TImpl>
        requires derived_from_base<TImpl, TService>
    registry& add_type(std::source_location loc = std::source_location::current()) {
        descriptor desc;
        desc.service_type = typeid(TService);
        desc.impl_type = std::type_index(typeid(TImpl));
        desc.value = type_registration{
            typeid(TImpl),
            detail::make_constructor<TService, TImpl>(),
            typeid(TService)
        };
        desc.registration_location = loc;
        desc.api_name = "add_type";
        return add(std::move(desc));
    }

    // ===============================================================
    // Instance registration
    // ===============================================================

    /// Register a ready-made object.  Every resolution of TService returns
    /// this exact object.
    template <typename TService, typename TImpl = TService>
        requires derived_from_base<TImpl, TService>
    registry& add_instance(std::shared_ptr<TImpl> instance,
                           std::source_location loc = std::source_location::current()) {
        if (!instance) {
            throw invalid_registration(typeid(TService), "instance is null", loc);
        }
        descriptor desc;
        desc.service_type = typeid(TService);
        desc.impl_type = std::type_index(typeid(TImpl));
        desc.value = instance_registration{
            detail::erase_as<TService>(std::move(instance)),
            typeid(TService)
        };
        desc.registration_location = loc;
        desc.api_name = "add_instance";
        return add(std::move(desc));
    }

    // ===============================================================
    // Factory registration
    // ===============================================================

    /// Register a zero-argument producer.  create() invokes it on every
    /// call; singleton() invokes it at most once per resolver.
    template <typename TService, typename TImpl = TService, typename F>
        requires derived_from_base<TImpl, TService> && factory_of<F, TImpl>
    registry& add_factory(F&& factory,
                          std::source_location loc = std::source_location::current()) {
        std::function<std::shared_ptr<TImpl>()> typed(std::forward<F>(factory));
        if (!typed) {
            throw invalid_registration(typeid(TService), "factory is empty", loc);
        }
        descriptor desc;
        desc.service_type = typeid(TService);
        if constexpr (!std::is_same_v<TService, TImpl>) {
            desc.impl_type = std::type_index(typeid(TImpl));
        }
        desc.value = factory_registration{
            [typed = std::move(typed)]() -> std::shared_ptr<void> {
                return detail::erase_as<TService>(typed());
            },
            typeid(TService)
        };
        desc.registration_location = loc;
        desc.api_name = "add_factory";
        return add(std::move(desc));
    }

    // ===============================================================
    // Non-template core
    // ===============================================================

    /// Store a pre-built descriptor under desc.service_type, applying the
    /// duplicate policy.  Throws invalid_registration for an empty shape,
    /// a null instance or an empty factory/constructor slot.
    registry& add(descriptor desc);

    template <typename T>
    bool contains() const { return contains(typeid(T)); }

    bool contains(std::type_index type) const;

    /// The registration for `type`, or nullptr.  The pointer is invalidated
    /// by any later add()/clear().
    const descriptor* find(std::type_index type) const;

    /// Point-in-time copy of every registration, in insertion order.  An
    /// overwritten registration keeps its original position.
    std::vector<descriptor> snapshot() const;

    std::size_t size() const noexcept;
    bool empty() const noexcept;
    void clear();

    const registry_options& options() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace libsvcloc
