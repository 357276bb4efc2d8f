#include <catch2/catch_test_macros.hpp>
#include <libsvcloc.hpp>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

struct ICounter {
    virtual ~ICounter() = default;
    virtual int next() = 0;
};

struct Counter : ICounter {
    int n = 0;
    int next() override { return ++n; }
};

struct OtherCounter : ICounter {
    int n = 100;
    int next() override { return ++n; }
};

struct IClock {
    virtual ~IClock() = default;
    virtual long now() const = 0;
};

struct SystemClock : IClock {
    long now() const override { return 1; }
};

struct ILogger {
    virtual ~ILogger() = default;
    virtual void log(const std::string& msg) = 0;
};

struct StubLogger : ILogger {
    void log(const std::string&) override {}
};

} // namespace

TEST_CASE("singleton returns same instance", "[singleton]") {
    libsvcloc::registry reg;
    reg.add_type<ICounter, Counter>();
    libsvcloc::resolver r(reg);

    auto a = r.singleton<ICounter>();
    auto b = r.singleton<ICounter>();
    REQUIRE(a.get() == b.get());
    REQUIRE(a->next() == 1);
    REQUIRE(b->next() == 2); // same instance
}

TEST_CASE("create returns new instance each time", "[singleton]") {
    libsvcloc::registry reg;
    reg.add_type<ICounter, Counter>();
    libsvcloc::resolver r(reg);

    auto a = r.create<ICounter>();
    auto b = r.create<ICounter>();
    REQUIRE(a.get() != b.get());
    REQUIRE(a->next() == 1);
    REQUIRE(b->next() == 1); // independent instances
}

TEST_CASE("create never touches the singleton cache", "[singleton]") {
    libsvcloc::registry reg;
    reg.add_type<ICounter, Counter>();
    libsvcloc::resolver r(reg);

    auto single = r.singleton<ICounter>();
    auto fresh = r.create<ICounter>();
    REQUIRE(single.get() != fresh.get());
    REQUIRE(r.cached_count() == 1);
    REQUIRE(r.singleton<ICounter>().get() == single.get());
}

TEST_CASE("singleton invokes a factory at most once", "[singleton]") {
    int calls = 0;

    libsvcloc::registry reg;
    reg.add_factory<ICounter>([&] {
        ++calls;
        return std::make_shared<Counter>();
    });
    libsvcloc::resolver r(reg);

    auto a = r.singleton<ICounter>();
    auto b = r.singleton<ICounter>();
    REQUIRE(calls == 1);
    REQUIRE(a.get() == b.get());
}

TEST_CASE("instance registration is returned without caching", "[singleton]") {
    auto instance = std::make_shared<Counter>();

    libsvcloc::registry reg;
    reg.add_instance<ICounter>(instance);
    libsvcloc::resolver r(reg);

    REQUIRE(r.singleton<ICounter>().get() == instance.get());
    REQUIRE(r.create<ICounter>().get() == instance.get());
    REQUIRE(r.cached_count() == 0);
    REQUIRE_FALSE(r.is_cached(typeid(ICounter)));
}

TEST_CASE("each resolver owns its singleton cache", "[singleton]") {
    libsvcloc::registry reg;
    reg.add_type<ICounter, Counter>();
    libsvcloc::resolver r1(reg);
    libsvcloc::resolver r2(reg);

    auto a = r1.singleton<ICounter>();
    auto b = r2.singleton<ICounter>();
    REQUIRE(a.get() != b.get());
    REQUIRE(r1.singleton<ICounter>().get() == a.get());
    REQUIRE(r2.singleton<ICounter>().get() == b.get());
}

TEST_CASE("cached singleton survives re-registration", "[singleton]") {
    libsvcloc::registry reg;
    reg.add_type<ICounter, Counter>();
    libsvcloc::resolver r(reg);

    auto first = r.singleton<ICounter>();
    reg.add_type<ICounter, OtherCounter>();

    // The cache is never refreshed; fresh resolution sees the new type.
    REQUIRE(r.singleton<ICounter>().get() == first.get());
    REQUIRE(r.create<ICounter>()->next() == 101);
}

TEST_CASE("re-registered instance wins over cached singleton", "[singleton]") {
    libsvcloc::registry reg;
    reg.add_type<ICounter, Counter>();
    libsvcloc::resolver r(reg);

    auto cached = r.singleton<ICounter>();
    auto instance = std::make_shared<OtherCounter>();
    reg.add_instance<ICounter>(instance);

    REQUIRE(r.singleton<ICounter>().get() == instance.get());
}

TEST_CASE("failed singleton resolution caches nothing", "[singleton]") {
    int calls = 0;

    libsvcloc::registry reg;
    reg.add_factory<ICounter>([&]() -> std::shared_ptr<ICounter> {
        if (++calls == 1) throw std::runtime_error("first call fails");
        return std::make_shared<Counter>();
    });
    libsvcloc::resolver r(reg);

    REQUIRE_THROWS_AS(r.singleton<ICounter>(), libsvcloc::construction_failure);
    REQUIRE(r.cached_count() == 0);

    auto a = r.singleton<ICounter>();
    auto b = r.singleton<ICounter>();
    REQUIRE(a.get() == b.get());
    REQUIRE(calls == 2);
}

TEST_CASE("try_singleton returns nullptr when not registered", "[singleton]") {
    libsvcloc::registry reg;
    libsvcloc::resolver r(reg);
    REQUIRE(r.try_singleton<ICounter>() == nullptr);
}

TEST_CASE("try_singleton returns the cached object after the registry is cleared", "[singleton]") {
    libsvcloc::registry reg;
    reg.add_type<ICounter, Counter>();
    libsvcloc::resolver r(reg);

    auto cached = r.singleton<ICounter>();
    reg.clear();

    REQUIRE(r.try_singleton<ICounter>().get() == cached.get());
    REQUIRE(r.try_create<ICounter>() == nullptr);
}

TEST_CASE("clock and logger scenario", "[singleton]") {
    libsvcloc::registry reg;
    reg.add_type<IClock, SystemClock>();
    reg.add_factory<ILogger>([] { return std::make_shared<StubLogger>(); });
    libsvcloc::resolver r(reg);

    auto c1 = r.singleton<IClock>();
    auto c2 = r.singleton<IClock>();
    REQUIRE(c1.get() == c2.get());

    auto l1 = r.create<ILogger>();
    auto l2 = r.create<ILogger>();
    REQUIRE(l1.get() != l2.get());

    REQUIRE(r.validate().has_value());
}
