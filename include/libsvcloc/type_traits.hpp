#pragma once

#include <functional>
#include <memory>
#include <type_traits>

namespace libsvcloc {

// ---------------------------------------------------------------
// Core concepts
// ---------------------------------------------------------------

/// TDerived derives from TBase (or TDerived == TBase for self-registration).
template <typename TDerived, typename TBase>
concept derived_from_base =
    std::is_base_of_v<TBase, TDerived> || std::is_same_v<TBase, TDerived>;

/// F is a zero-argument callable producing something convertible to
/// `std::shared_ptr<T>`.
template <typename F, typename T>
concept factory_of = std::is_invocable_r_v<std::shared_ptr<T>, F&>;

/// T can be built by the parameterless constructor of a type registration.
/// Not a registration constraint: checked when the construction closure is
/// generated, and reported lazily as no_valid_constructor.
template <typename T>
inline constexpr bool parameterless_constructible_v =
    std::is_default_constructible_v<T> && !std::is_abstract_v<T>;

namespace detail {

/// Erase `shared_ptr<TImpl>` as `shared_ptr<void>` via `shared_ptr<TService>`
/// so that `static_pointer_cast<TService>` recovers the right subobject.
template <typename TService, typename TImpl>
std::shared_ptr<void> erase_as(std::shared_ptr<TImpl> impl) {
    std::shared_ptr<TService> service = std::move(impl);
    return std::static_pointer_cast<void>(std::move(service));
}

} // namespace detail

} // namespace libsvcloc
