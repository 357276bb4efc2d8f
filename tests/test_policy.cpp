#include <catch2/catch_test_macros.hpp>
#include <libsvcloc.hpp>
#include <memory>
#include <string>

using namespace libsvcloc;

// ---------------------------------------------------------------
// Test interfaces
// ---------------------------------------------------------------

namespace {

struct IPolicy {
    virtual ~IPolicy() = default;
    virtual std::string Name() const = 0;
};

struct PolicyA : IPolicy {
    std::string Name() const override { return "A"; }
};

struct PolicyB : IPolicy {
    std::string Name() const override { return "B"; }
};

struct IOther {
    virtual ~IOther() = default;
};

struct OtherImpl : IOther {};

} // namespace

// ---------------------------------------------------------------
// Replace (default)
// ---------------------------------------------------------------

TEST_CASE("Policy: Replace is the default", "[policy]") {
    registry registry;
    REQUIRE(registry.options().on_duplicate == duplicate_policy::replace);

    registry.add_type<IPolicy, PolicyA>();
    registry.add_type<IPolicy, PolicyB>();
    resolver resolver(registry);

    REQUIRE(resolver.create<IPolicy>()->Name() == "B");
    REQUIRE(registry.size() == 1);
}

TEST_CASE("Policy: Replace works across registration kinds", "[policy]") {
    registry registry;
    auto instance = std::make_shared<PolicyA>();
    registry.add_instance<IPolicy>(instance);
    registry.add_factory<IPolicy>([] { return std::make_shared<PolicyB>(); });
    resolver resolver(registry);

    auto resolved = resolver.create<IPolicy>();
    REQUIRE(resolved.get() != instance.get());
    REQUIRE(resolved->Name() == "B");
    REQUIRE(registry.find(typeid(IPolicy))->kind() == registration_kind::factory);
}

TEST_CASE("Policy: Replace keeps the original snapshot position", "[policy]") {
    registry registry;
    registry.add_type<IPolicy, PolicyA>();
    registry.add_type<IOther, OtherImpl>();
    registry.add_type<IPolicy, PolicyB>();

    auto snap = registry.snapshot();
    REQUIRE(snap.size() == 2);
    REQUIRE(snap[0].service_type == std::type_index(typeid(IPolicy)));
    REQUIRE(snap[0].impl_type.value() == std::type_index(typeid(PolicyB)));
}

// ---------------------------------------------------------------
// Reject
// ---------------------------------------------------------------

TEST_CASE("Policy: Reject: first registration succeeds", "[policy]") {
    registry registry({.on_duplicate = duplicate_policy::reject});
    registry.add_type<IPolicy, PolicyA>();
    resolver resolver(registry);

    REQUIRE(resolver.create<IPolicy>()->Name() == "A");
}

TEST_CASE("Policy: Reject: duplicate throws", "[policy]") {
    registry registry({.on_duplicate = duplicate_policy::reject});
    registry.add_type<IPolicy, PolicyA>();

    auto fn = [&] { registry.add_type<IPolicy, PolicyB>(); };
    REQUIRE_THROWS_AS(fn(), duplicate_registration);

    // The original registration is untouched
    REQUIRE(registry.find(typeid(IPolicy))->impl_type.value()
            == std::type_index(typeid(PolicyA)));
}

TEST_CASE("Policy: Reject: other service types are unaffected", "[policy]") {
    registry registry({.on_duplicate = duplicate_policy::reject});
    registry.add_type<IPolicy, PolicyA>();
    REQUIRE_NOTHROW(registry.add_type<IOther, OtherImpl>());
}

TEST_CASE("Policy: Reject: clear allows registering again", "[policy]") {
    registry registry({.on_duplicate = duplicate_policy::reject});
    registry.add_type<IPolicy, PolicyA>();
    registry.clear();
    REQUIRE_NOTHROW(registry.add_type<IPolicy, PolicyB>());
}

// ---------------------------------------------------------------
// Skip
// ---------------------------------------------------------------

TEST_CASE("Policy: Skip: first registration wins", "[policy]") {
    registry registry({.on_duplicate = duplicate_policy::skip});
    registry.add_type<IPolicy, PolicyA>();
    registry.add_type<IPolicy, PolicyB>();
    resolver resolver(registry);

    REQUIRE(resolver.create<IPolicy>()->Name() == "A");
    REQUIRE(registry.size() == 1);
}

TEST_CASE("Policy: Skip: null values are still rejected", "[policy]") {
    registry registry({.on_duplicate = duplicate_policy::skip});
    registry.add_type<IPolicy, PolicyA>();
    REQUIRE_THROWS_AS(registry.add_instance<IPolicy>(std::shared_ptr<IPolicy>{}),
                      invalid_registration);
}
