#pragma once

#include "export.hpp"
#include "registry.hpp"
#include "resolver.hpp"
#include "result.hpp"

#include <memory>

namespace libsvcloc {

/// Process-wide default registry and resolver.
///
/// Both are created together on first access and live until the process
/// exits.  Populate default_registry() at startup, before the first
/// resolution; the same thread-safety rules as registry apply afterwards.
class LIBSVCLOC_EXPORT locator {
public:
    locator() = delete;

    static registry& default_registry();
    static resolver& default_resolver();

    /// A new resolver over the default registry, with its own singleton cache.
    static std::shared_ptr<resolver> create_resolver();

    template <typename T>
    static std::shared_ptr<T> create() {
        return default_resolver().create<T>();
    }

    template <typename T>
    static std::shared_ptr<T> singleton() {
        return default_resolver().singleton<T>();
    }

    static result<void> validate();
};

} // namespace libsvcloc
