#include "libsvcloc/resolver.hpp"
#include "libsvcloc/registry.hpp"
#include "libsvcloc/exceptions.hpp"
#include "stacktrace_utils.hpp"

#include <exception>
#include <memory>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <variant>

namespace libsvcloc {

namespace {

template <typename... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

/// Run a factory or constructor, turning escaping exceptions into
/// construction_failure.  A di_error thrown by a nested resolution keeps
/// its type and gets this service appended to its resolution context.
std::shared_ptr<void> invoke_producer(const descriptor& desc, const factory_fn& produce) {
    try {
        return produce();
    } catch (di_error& e) {
        e.append_resolution_context(internal::describe(desc));
        if (e.diagnostic_detail().empty()) {
            auto trace = internal::format_registration_trace(desc);
            if (!trace.empty()) e.set_diagnostic_detail(trace);
        }
        throw;
    } catch (const std::exception& e) {
        construction_failure ex(desc.service_type, e,
                                desc.registration_location,
                                std::current_exception());
        ex.set_diagnostic_detail(internal::format_registration_trace(desc));
        throw ex;
    } catch (...) {
        construction_failure ex(desc.service_type, "non-standard exception",
                                desc.registration_location,
                                std::current_exception());
        ex.set_diagnostic_detail(internal::format_registration_trace(desc));
        throw ex;
    }
}

/// Attach the registration trace (if any) and throw.
template <typename E>
[[noreturn]] void fail(E ex, const descriptor& desc) {
    ex.set_diagnostic_detail(internal::format_registration_trace(desc));
    throw ex;
}

/// Steps 2-5 of resolution for one descriptor.
std::shared_ptr<void> resolve_descriptor(std::type_index type, const descriptor& desc) {
    if (desc.value.valueless_by_exception()) {
        fail(invalid_registration_shape(type), desc);
    }

    return std::visit(overloaded{
        [&](const instance_registration& reg) -> std::shared_ptr<void> {
            if (reg.provided_type != type) {
                fail(type_mismatch(type, reg.provided_type), desc);
            }
            return reg.instance;
        },
        [&](const factory_registration& reg) -> std::shared_ptr<void> {
            auto produced = invoke_producer(desc, reg.factory);
            if (!produced) {
                fail(construction_failure(type, "factory returned null"), desc);
            }
            if (reg.provided_type != type) {
                fail(type_mismatch(type, reg.provided_type), desc);
            }
            return produced;
        },
        [&](const type_registration& reg) -> std::shared_ptr<void> {
            if (!reg.construct) {
                fail(no_valid_constructor(type, reg.impl_type), desc);
            }
            auto produced = invoke_producer(desc, reg.construct);
            if (!produced || reg.provided_type != type) {
                fail(type_mismatch(type, reg.provided_type), desc);
            }
            return produced;
        },
        [&](const std::monostate&) -> std::shared_ptr<void> {
            fail(invalid_registration_shape(type), desc);
        }
    }, desc.value);
}

} // namespace

// ---------------------------------------------------------------
// Impl: per-resolver state
// ---------------------------------------------------------------

struct resolver::impl {
    const registry* reg;

    // Singleton cache: service type → instance.  Never evicted.
    std::unordered_map<std::type_index, std::shared_ptr<void>> singletons;

    explicit impl(const registry& r) : reg(&r) {}
};

// ---------------------------------------------------------------
// Constructors / Destructor
// ---------------------------------------------------------------

resolver::resolver(const registry& reg)
    : impl_(std::make_unique<impl>(reg))
{}

resolver::~resolver() = default;

// ---------------------------------------------------------------
// Non-template core: fresh resolution
// ---------------------------------------------------------------

std::shared_ptr<void> resolver::create_impl(std::type_index type) const {
    const descriptor* found = impl_->reg->find(type);
    if (!found) {
        throw not_registered(type);
    }
    // Resolve from a copy: a producer may add to or clear the registry
    // while it runs, which invalidates `found`.
    const descriptor desc = *found;
    return resolve_descriptor(type, desc);
}

// ---------------------------------------------------------------
// Non-template core: cached resolution
// ---------------------------------------------------------------

std::shared_ptr<void> resolver::singleton_impl(std::type_index type) {
    // A registered instance is already a singleton; no cache entry needed.
    if (const descriptor* desc = impl_->reg->find(type)) {
        if (const auto* inst = std::get_if<instance_registration>(&desc->value);
            inst && inst->provided_type == type) {
            return inst->instance;
        }
    }

    auto it = impl_->singletons.find(type);
    if (it != impl_->singletons.end()) {
        return it->second;
    }

    auto instance = create_impl(type);
    impl_->singletons.emplace(type, instance);
    return instance;
}

// ---------------------------------------------------------------
// Introspection
// ---------------------------------------------------------------

const registry& resolver::get_registry() const noexcept {
    return *impl_->reg;
}

bool resolver::is_registered(std::type_index type) const {
    return impl_->reg->contains(type);
}

bool resolver::is_cached(std::type_index type) const {
    return impl_->singletons.contains(type);
}

std::size_t resolver::cached_count() const noexcept {
    return impl_->singletons.size();
}

} // namespace libsvcloc
