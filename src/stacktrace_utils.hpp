#pragma once

// Internal helpers for registration stacktraces: capture and formatting.
// This header is NOT installed; only the library's .cpp files use it.

#include "libsvcloc/descriptor.hpp"
#include "libsvcloc/exceptions.hpp"

#include <any>
#include <cstddef>
#include <sstream>
#include <string>

#ifdef LIBSVCLOC_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace libsvcloc::internal {

/// Deepest registration stack kept per descriptor.
inline constexpr std::size_t max_registration_frames = 64;

/// Record the caller's stack for a descriptor being registered.  Returns an
/// empty std::any when the library is built without stacktrace support.
inline std::any capture_registration_trace() {
#ifdef LIBSVCLOC_HAS_STACKTRACE
    return std::any(boost::stacktrace::stacktrace(0, max_registration_frames));
#else
    return {};
#endif
}

/// Format a stacktrace stored in a std::any into a human-readable string.
/// Returns an empty string if the any is empty or stacktrace support is
/// disabled.
inline std::string format_stacktrace(const std::any& st) {
#ifdef LIBSVCLOC_HAS_STACKTRACE
    if (const auto* trace = std::any_cast<boost::stacktrace::stacktrace>(&st)) {
        if (trace->size() > 0) {
            std::ostringstream oss;
            oss << *trace;
            return oss.str();
        }
    }
#else
    (void)st;
#endif
    return {};
}

/// Format one descriptor's registration trace for diagnostic output:
///   "Registration stacktrace for IRepo [impl: SqlRepo] (called via add_type):\n ..."
/// or an empty string if no stacktrace is available.
inline std::string format_registration_trace(const descriptor& desc) {
    std::string trace = format_stacktrace(desc.registration_stacktrace);
    if (trace.empty()) return {};

    std::string header = "Registration stacktrace for "
                         + demangle(desc.service_type);
    if (desc.impl_type.has_value()) {
        header += " [impl: " + demangle(desc.impl_type.value()) + "]";
    }
    if (!desc.api_name.empty()) {
        header += " (called via " + desc.api_name + ")";
    }
    return header + ":\n" + trace;
}

/// "IRepo [impl: SqlRepo]": used for resolution context chains.
inline std::string describe(const descriptor& desc) {
    std::string info = demangle(desc.service_type);
    if (desc.impl_type.has_value() && desc.impl_type.value() != desc.service_type) {
        info += " [impl: " + demangle(desc.impl_type.value()) + "]";
    }
    return info;
}

} // namespace libsvcloc::internal
