#include "libsvcloc/resolver.hpp"
#include "libsvcloc/registry.hpp"
#include "libsvcloc/exceptions.hpp"
#include "libsvcloc/logging.hpp"
#include "libsvcloc/result.hpp"

#include <any>
#include <exception>
#include <typeindex>
#include <vector>

namespace libsvcloc {

// ---------------------------------------------------------------
// validate: resolve every registration, collect every failure
// ---------------------------------------------------------------

result<void> resolver::validate() const {
    const auto snapshot = get_registry().snapshot();
    auto log = logger();

    std::vector<error> failures;
    for (const auto& desc : snapshot) {
        try {
            // Only whether construction succeeds matters; the object is
            // released right away.
            (void)create_impl(desc.service_type);
        } catch (const di_error& e) {
            log->warn("Validation failed for {}: {}",
                      internal::demangle(desc.service_type), e.full_diagnostic());
            failures.push_back(error(e.what(), std::current_exception(),
                                     std::any(desc.service_type)));
        } catch (const std::exception& e) {
            // Thrown outside any producer (e.g. bad_alloc during lookup).
            log->warn("Validation failed for {}: {}",
                      internal::demangle(desc.service_type), e.what());
            failures.push_back(error::from_exception(std::current_exception(),
                                                     std::any(desc.service_type)));
        } catch (...) {
            log->warn("Validation failed for {}: non-standard exception",
                      internal::demangle(desc.service_type));
            failures.push_back(error::from_exception(std::current_exception(),
                                                     std::any(desc.service_type)));
        }
    }

    log->debug("Validated {} registration(s), {} failure(s)",
               snapshot.size(), failures.size());

    if (failures.empty()) {
        return result<void>::success();
    }
    return error::aggregate(std::move(failures));
}

} // namespace libsvcloc
