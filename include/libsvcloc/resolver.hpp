#pragma once

#include "export.hpp"
#include "exceptions.hpp"
#include "result.hpp"

#include <cstddef>
#include <memory>
#include <typeindex>

namespace libsvcloc {

class registry;

/// Turns the registrations of one registry into objects.
///
/// A resolver is bound to its registry for life and never mutates it; the
/// registry must outlive the resolver.  Each resolver owns a singleton
/// cache that only grows.  No internal locking: see registry.
class LIBSVCLOC_EXPORT resolver {
public:
    explicit resolver(const registry& reg);
    ~resolver();

    resolver(const resolver&) = delete;
    resolver& operator=(const resolver&) = delete;

    // ---------------------------------------------------------------
    // Fresh resolution
    // ---------------------------------------------------------------

    /// Resolve T without consulting the singleton cache.  Instance
    /// registrations return the registered object; factories and types
    /// produce a new one on every call.
    template <typename T>
    std::shared_ptr<T> create() {
        return std::static_pointer_cast<T>(create_impl(typeid(T)));
    }

    /// Like create(), but returns nullptr when T is not registered.
    template <typename T>
    std::shared_ptr<T> try_create() {
        if (!is_registered(typeid(T))) return nullptr;
        return create<T>();
    }

    // ---------------------------------------------------------------
    // Cached resolution
    // ---------------------------------------------------------------

    /// Resolve T once per resolver.  Instance registrations are returned
    /// directly; anything else is created on first request and cached.
    template <typename T>
    std::shared_ptr<T> singleton() {
        return std::static_pointer_cast<T>(singleton_impl(typeid(T)));
    }

    /// Like singleton(), but returns nullptr when T is neither registered
    /// nor already cached.
    template <typename T>
    std::shared_ptr<T> try_singleton() {
        if (!is_registered(typeid(T)) && !is_cached(typeid(T))) return nullptr;
        return singleton<T>();
    }

    // ---------------------------------------------------------------
    // Validation
    // ---------------------------------------------------------------

    /// Try create() for every registered service and collect each failure.
    /// Never throws for a failing registration; factories and constructors
    /// do run.  The singleton cache is left untouched.
    result<void> validate() const;

    // ---------------------------------------------------------------
    // Introspection
    // ---------------------------------------------------------------

    const registry& get_registry() const noexcept;

    bool is_registered(std::type_index type) const;
    bool is_cached(std::type_index type) const;
    std::size_t cached_count() const noexcept;

private:
    struct impl;

    // Non-template core implementations
    std::shared_ptr<void> create_impl(std::type_index type) const;
    std::shared_ptr<void> singleton_impl(std::type_index type);

    std::unique_ptr<impl> impl_;
};

} // namespace libsvcloc
