#include "libsvcloc/locator.hpp"
#include "libsvcloc/logging.hpp"

#include <memory>

namespace libsvcloc {

namespace {

/// The default pair.  The resolver is declared after the registry so it is
/// constructed bound to an already-live registry.
struct default_instance {
    registry reg;
    resolver res{reg};

    default_instance() {
        logger()->debug("Initialized default service locator");
    }
};

// Function-local static: initialized exactly once, on first use.
default_instance& instance() {
    static default_instance inst;
    return inst;
}

} // namespace

registry& locator::default_registry() {
    return instance().reg;
}

resolver& locator::default_resolver() {
    return instance().res;
}

std::shared_ptr<resolver> locator::create_resolver() {
    return std::make_shared<resolver>(instance().reg);
}

result<void> locator::validate() {
    return instance().res.validate();
}

} // namespace libsvcloc
