#include "libsvcloc/registry.hpp"
#include "libsvcloc/exceptions.hpp"
#include "libsvcloc/logging.hpp"
#include "stacktrace_utils.hpp"

#include <cstddef>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace libsvcloc {

namespace {

/// Reject values that can never be resolved: the empty shape, null
/// instances and empty producers.  Missing constructors are not rejected
/// here; they surface at resolution time as no_valid_constructor.
void check_registration_value(const descriptor& desc) {
    const auto& loc = desc.registration_location;
    if (desc.value.valueless_by_exception()
        || std::holds_alternative<std::monostate>(desc.value)) {
        throw invalid_registration(desc.service_type, "registration value is empty", loc);
    }
    if (const auto* inst = std::get_if<instance_registration>(&desc.value)) {
        if (!inst->instance) {
            throw invalid_registration(desc.service_type, "instance is null", loc);
        }
    } else if (const auto* fac = std::get_if<factory_registration>(&desc.value)) {
        if (!fac->factory) {
            throw invalid_registration(desc.service_type, "factory is empty", loc);
        }
    }
}

} // namespace

// ---------------------------------------------------------------
// Impl
// ---------------------------------------------------------------

struct registry::Impl {
    registry_options options;

    // Registrations in first-insertion order; `index` maps each service
    // type to its position.
    std::vector<descriptor> descriptors;
    std::unordered_map<std::type_index, std::size_t> index;

    explicit Impl(registry_options opts) : options(opts) {}
};

// ---------------------------------------------------------------
// Constructors / Destructor / Move
// ---------------------------------------------------------------

registry::registry(registry_options options)
    : impl_(std::make_unique<Impl>(options))
{}

registry::~registry() = default;

registry::registry(registry&&) noexcept = default;
registry& registry::operator=(registry&&) noexcept = default;

// ---------------------------------------------------------------
// Non-template registration core
// ---------------------------------------------------------------

registry& registry::add(descriptor desc) {
    check_registration_value(desc);

    if (impl_->options.capture_stacktrace && !desc.registration_stacktrace.has_value()) {
        desc.registration_stacktrace = internal::capture_registration_trace();
    }

    auto it = impl_->index.find(desc.service_type);
    if (it == impl_->index.end()) {
        logger()->trace("Registered {} ({})",
                        internal::demangle(desc.service_type), to_string(desc.kind()));
        impl_->index.emplace(desc.service_type, impl_->descriptors.size());
        impl_->descriptors.push_back(std::move(desc));
        return *this;
    }

    switch (impl_->options.on_duplicate) {
        case duplicate_policy::reject:
            throw duplicate_registration(desc.service_type, desc.registration_location);

        case duplicate_policy::skip:
            logger()->debug("Skipped duplicate registration for {}",
                            internal::demangle(desc.service_type));
            return *this;

        case duplicate_policy::replace: {
            auto& slot = impl_->descriptors[it->second];
            logger()->debug("Replaced registration for {} ({} -> {})",
                            internal::demangle(desc.service_type),
                            to_string(slot.kind()), to_string(desc.kind()));
            slot = std::move(desc);
            return *this;
        }
    }

    throw di_error("Invalid duplicate_policy", error_kind::invalid_registration);
}

// ---------------------------------------------------------------
// Queries
// ---------------------------------------------------------------

bool registry::contains(std::type_index type) const {
    return impl_->index.contains(type);
}

const descriptor* registry::find(std::type_index type) const {
    auto it = impl_->index.find(type);
    if (it == impl_->index.end()) return nullptr;
    return &impl_->descriptors[it->second];
}

std::vector<descriptor> registry::snapshot() const {
    return impl_->descriptors;
}

std::size_t registry::size() const noexcept {
    return impl_->descriptors.size();
}

bool registry::empty() const noexcept {
    return impl_->descriptors.empty();
}

void registry::clear() {
    impl_->descriptors.clear();
    impl_->index.clear();
}

const registry_options& registry::options() const noexcept {
    return impl_->options;
}

} // namespace libsvcloc
